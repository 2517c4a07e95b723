#ifndef COCHAN_SCHEDULER_HPP
#define COCHAN_SCHEDULER_HPP

#include <chrono>
#include <condition_variable>
#include <coroutine>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <memory_resource>
#include <mutex>
#include <utility>
#include <vector>

#include "allocator.hpp"
#include "errors.hpp"
#include "shared_state/crtp_base.hpp"
#include "task.hpp"
#include "task_id.hpp"
#include "timer_service.hpp"

/*
  Tasks are stackless coroutines multiplexed onto a few worker threads. A
  task that cannot make progress records where it stopped, links itself into
  the wait queue of whatever it waits on and returns to the worker; the
  resource owner calls wake() once the operation completed on the task's
  behalf. When every remaining task is blocked and no timer is pending,
  nothing can ever wake them again and run() reports a deadlock.
*/

namespace cochan {

struct scheduler_options {
  // Worker threads used by run(); the calling thread is one of them.
  std::size_t workers = default_workers();
  bool detect_deadlock = true;

  static std::size_t default_workers() noexcept;

  // Defaults overridden by COCHAN_WORKERS and COCHAN_DETECT_DEADLOCK.
  static scheduler_options from_env();
};

namespace detail {

struct task_record {
  task_id id{};
  task_state state{task_state::completed};
  // Set when a wake arrives while the task is still running its step.
  bool wake_pending{false};
  root_task::handle_type frame{};
  // Innermost suspended coroutine of the task.
  std::coroutine_handle<> resume_point{};
  const char *wait_reason{nullptr};
  // Queued operation the task is blocked on; null for park, sleep and yield.
  blocking_wait *waiting{nullptr};
  std::shared_ptr<task_status> status;

  // A wake only counts once the operation it waits for has completed.
  bool wakeable() const noexcept {
    return waiting == nullptr || waiting->completed();
  }
};

} // namespace detail

class scheduler {
public:
  explicit scheduler(scheduler_options options = {});
  ~scheduler();

  scheduler(const scheduler &) = delete;
  scheduler &operator=(const scheduler &) = delete;

  // Registers a new task; it starts running once run() is (or already is)
  // driving this scheduler.
  template <typename F, typename... Args>
    requires TaskBody<F, Args...>
  task_handle spawn(F body, Args... args) {
    return submit(detail::launch<F, Args...>(std::move(body), std::move(args)...));
  }

  // Runs until every task completed. Throws deadlock_error when the
  // remaining tasks can never be woken.
  void run();

  // Makes a blocked task runnable. Stale ids and tasks that are already
  // runnable or completed are ignored; a task woken while running is
  // requeued as soon as it next suspends. A task blocked on a channel,
  // select or mutex stays blocked until that operation completed.
  void wake(task_id id);

  struct park_awaiter {
    bool await_ready() {
      detail::require_task("park");
      return false;
    }

    void await_suspend(std::coroutine_handle<> h) {
      detail::prepare_suspend(h, "park");
    }

    void await_resume() noexcept {}
  };

  // Suspends the calling task until wake() is called with its id.
  static park_awaiter park() { return {}; }

  // Runs callback on a worker once deadline has passed.
  void add_timer(std::chrono::steady_clock::time_point deadline,
                 std::function<void()> callback);

  std::size_t live_tasks() const;

  const scheduler_options &options() const noexcept { return options_; }

  // Scheduler of the calling task, or nullptr outside of a task.
  static scheduler *current() noexcept;

  // Id of the calling task, or an empty id outside of a task.
  static task_id current_task_id() noexcept;

private:
  task_handle submit(detail::root_task body);

  void worker_loop();

  // Resumes one task popped from the run queue; called with lock held.
  void run_step(std::unique_lock<std::mutex> &lock, detail::task_record &rec);

  void release_slot(detail::task_record &rec);

  std::vector<blocked_task>
  abandon_blocked(std::vector<detail::root_task::handle_type> &frames,
                  std::vector<detail::blocking_wait *> &waits);

  scheduler_options options_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;

  // Arena of task records; deque keeps references stable while it grows.
  std::pmr::deque<detail::task_record> slots_{mi_resource()};
  std::pmr::vector<std::uint32_t> free_slots_{mi_resource()};
  std::pmr::deque<task_id> run_queue_{mi_resource()};
  timer_service timers_;

  std::size_t live_{0};
  // Workers currently resuming a task or firing timers.
  std::size_t active_{0};
  std::uint64_t next_serial_{0};
  bool running_{false};
  bool stopping_{false};
  bool deadlocked_{false};
};

// Process-wide scheduler built from scheduler_options::from_env().
scheduler &default_scheduler();

// Spawns on the calling task's scheduler, or on the default one.
template <typename F, typename... Args>
  requires TaskBody<F, Args...>
task_handle spawn(F body, Args... args) {
  scheduler *sched = scheduler::current();
  if (sched == nullptr) {
    sched = &default_scheduler();
  }
  return sched->spawn(std::move(body), std::move(args)...);
}

// Runs the default scheduler.
void run();

} // namespace cochan

#endif // COCHAN_SCHEDULER_HPP
