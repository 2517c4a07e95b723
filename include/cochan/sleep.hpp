#ifndef COCHAN_SLEEP_HPP
#define COCHAN_SLEEP_HPP

#include <chrono>
#include <coroutine>

#include "scheduler.hpp"
#include "shared_state/channel.hpp"
#include "shared_state/crtp_base.hpp"

namespace cochan {

class sleep_awaiter : public awaitable_base<sleep_awaiter, void> {
public:
  explicit sleep_awaiter(std::chrono::steady_clock::time_point deadline)
      : deadline_(deadline) {}

  bool ready_impl() {
    detail::require_task("sleep");
    return std::chrono::steady_clock::now() >= deadline_;
  }

  bool suspend_impl(std::coroutine_handle<> h) {
    auto &ctx = detail::prepare_suspend(h, "sleep");
    ctx.sched->add_timer(deadline_,
                         [sched = ctx.sched, id = ctx.id] { sched->wake(id); });
    return true;
  }

  void resume_impl() {}

private:
  std::chrono::steady_clock::time_point deadline_;
};

// Sleep for a duration
template <typename Rep, typename Period>
sleep_awaiter sleep_for(std::chrono::duration<Rep, Period> duration) {
  return sleep_awaiter(std::chrono::steady_clock::now() +
                       std::chrono::duration_cast<std::chrono::steady_clock::duration>(duration));
}

// Sleep until a time point
inline sleep_awaiter
sleep_until(std::chrono::steady_clock::time_point deadline) {
  return sleep_awaiter(deadline);
}

// Channel that receives the firing time once `duration` has elapsed. Timed
// by the calling task's scheduler, or the default one outside of a task.
channel<std::chrono::steady_clock::time_point>
after(std::chrono::steady_clock::duration duration);

} // namespace cochan

#endif // COCHAN_SLEEP_HPP
