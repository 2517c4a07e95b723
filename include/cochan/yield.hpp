#ifndef COCHAN_YIELD_HPP
#define COCHAN_YIELD_HPP

#include <coroutine>

#include "shared_state/crtp_base.hpp"

namespace cochan {

// Awaitable that yields execution back to the scheduler
// Requeues the calling task behind every task that is already runnable
struct yield_awaiter {
  bool await_ready() {
    detail::require_task("yield");
    return false;
  }

  void await_suspend(std::coroutine_handle<> h) {
    auto &ctx = detail::prepare_suspend(h, "yield");
    // The task is still running, so this only marks it for requeueing.
    detail::wake_task(ctx.sched, ctx.id);
  }

  void await_resume() noexcept {}
};

// Create a yield awaiter - use with co_await
inline yield_awaiter yield() { return {}; }

} // namespace cochan

#endif // COCHAN_YIELD_HPP
