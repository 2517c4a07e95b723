#include "cochan/sleep.hpp"

#include "cochan/log.hpp"

namespace cochan {

channel<std::chrono::steady_clock::time_point>
after(std::chrono::steady_clock::duration duration) {
  auto ch = make_channel<std::chrono::steady_clock::time_point>(1);

  scheduler *sched = scheduler::current();
  if (sched == nullptr) {
    sched = &default_scheduler();
  }
  sched->add_timer(std::chrono::steady_clock::now() + duration, [ch] {
    // Capacity 1 and a single send: only a caller closing it can refuse.
    if (ch.try_send(std::chrono::steady_clock::now()) !=
        channel_op_status::success) {
      log(log_level::debug, "after: timer channel no longer accepts values");
    }
  });
  return ch;
}

} // namespace cochan
