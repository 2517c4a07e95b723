#include "cochan/scheduler.hpp"

#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <stdexcept>
#include <string>
#include <thread>

#include "cochan/log.hpp"

namespace cochan {

namespace {

// Task the calling worker thread is currently resuming
thread_local detail::current_task tls_current;

} // namespace

// =============================================================================
// Scheduler Hooks
// =============================================================================

namespace detail {

current_task &this_task() noexcept { return tls_current; }

current_task &require_task(const char *operation) {
  if (tls_current.sched == nullptr) {
    throw std::logic_error(std::string(operation) +
                           " must be awaited from inside a task");
  }
  return tls_current;
}

current_task &prepare_suspend(std::coroutine_handle<> h, const char *reason,
                              blocking_wait *wait) {
  auto &ctx = require_task(reason);
  ctx.record->resume_point = h;
  ctx.record->wait_reason = reason;
  ctx.record->waiting = wait;
  return ctx;
}

void wake_task(scheduler *sched, task_id id) {
  if (sched != nullptr) {
    sched->wake(id);
  }
}

void root_task::promise_type::final_awaiter::await_suspend(
    std::coroutine_handle<promise_type>) noexcept {
  tls_current.completed = true;
}

} // namespace detail

const char *to_string(task_state state) noexcept {
  switch (state) {
  case task_state::runnable:
    return "runnable";
  case task_state::running:
    return "running";
  case task_state::blocked:
    return "blocked";
  case task_state::completed:
    return "completed";
  }
  return "unknown";
}

// =============================================================================
// Options
// =============================================================================

std::size_t scheduler_options::default_workers() noexcept {
  return std::max(1u, std::thread::hardware_concurrency());
}

scheduler_options scheduler_options::from_env() {
  scheduler_options options;
  if (const char *workers = std::getenv("COCHAN_WORKERS")) {
    char *end = nullptr;
    unsigned long n = std::strtoul(workers, &end, 10);
    if (end != workers && *end == '\0' && n > 0) {
      options.workers = n;
    } else {
      log(log_level::warn, "ignoring COCHAN_WORKERS=%s", workers);
    }
  }
  if (const char *detect = std::getenv("COCHAN_DETECT_DEADLOCK")) {
    if (std::strcmp(detect, "0") == 0 || std::strcmp(detect, "false") == 0 ||
        std::strcmp(detect, "off") == 0) {
      options.detect_deadlock = false;
    } else if (std::strcmp(detect, "1") == 0 ||
               std::strcmp(detect, "true") == 0 ||
               std::strcmp(detect, "on") == 0) {
      options.detect_deadlock = true;
    } else {
      log(log_level::warn, "ignoring COCHAN_DETECT_DEADLOCK=%s", detect);
    }
  }
  return options;
}

// =============================================================================
// Scheduler
// =============================================================================

scheduler::scheduler(scheduler_options options) : options_(options) {
  if (options_.workers == 0) {
    options_.workers = 1;
  }
}

scheduler::~scheduler() {
  // Tasks spawned but never run still own their frames.
  for (auto &rec : slots_) {
    if (rec.frame) {
      rec.frame.destroy();
      rec.frame = nullptr;
    }
  }
}

scheduler *scheduler::current() noexcept { return tls_current.sched; }

task_id scheduler::current_task_id() noexcept { return tls_current.id; }

task_handle scheduler::submit(detail::root_task body) {
  auto frame = body.release();
  auto status = std::make_shared<detail::task_status>();

  std::lock_guard<std::mutex> lock(mutex_);
  std::uint32_t index;
  if (!free_slots_.empty()) {
    index = free_slots_.back();
    free_slots_.pop_back();
  } else {
    index = static_cast<std::uint32_t>(slots_.size());
    slots_.emplace_back();
  }

  auto &rec = slots_[index];
  rec.id = task_id{index, ++next_serial_};
  rec.state = task_state::runnable;
  rec.wake_pending = false;
  rec.frame = frame;
  rec.resume_point = frame;
  rec.wait_reason = nullptr;
  rec.waiting = nullptr;
  status->id = rec.id;
  rec.status = status;

  run_queue_.push_back(rec.id);
  ++live_;
  cv_.notify_one();

  if (log_enabled(log_level::debug)) {
    log(log_level::debug, "spawned %s", to_string(rec.id).c_str());
  }
  return task_handle(std::move(status));
}

void scheduler::wake(task_id id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (id.index >= slots_.size()) {
    return;
  }
  auto &rec = slots_[id.index];
  if (rec.id != id) {
    return;
  }
  switch (rec.state) {
  case task_state::blocked:
    if (!rec.wakeable()) {
      if (log_enabled(log_level::debug)) {
        log(log_level::debug, "ignoring wake of %s: %s has not completed",
            to_string(id).c_str(), rec.wait_reason);
      }
      break;
    }
    rec.state = task_state::runnable;
    rec.status->state.store(task_state::runnable, std::memory_order_release);
    run_queue_.push_back(id);
    cv_.notify_one();
    break;
  case task_state::running:
    rec.wake_pending = true;
    break;
  case task_state::runnable:
  case task_state::completed:
    break;
  }
}

void scheduler::add_timer(std::chrono::steady_clock::time_point deadline,
                          std::function<void()> callback) {
  std::lock_guard<std::mutex> lock(mutex_);
  timers_.add_timer(deadline, std::move(callback));
  // A waiting worker may need to shorten its sleep.
  cv_.notify_one();
}

std::size_t scheduler::live_tasks() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return live_;
}

void scheduler::run() {
  if (tls_current.sched != nullptr) {
    throw std::logic_error("scheduler::run called from inside a task");
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) {
      throw std::logic_error("scheduler is already running");
    }
    running_ = true;
    stopping_ = false;
    deadlocked_ = false;
  }
  log(log_level::debug, "run started with %zu workers", options_.workers);

  std::vector<std::thread> helpers;
  helpers.reserve(options_.workers - 1);
  for (std::size_t i = 1; i < options_.workers; ++i) {
    helpers.emplace_back([this] { worker_loop(); });
  }
  worker_loop();
  for (auto &t : helpers) {
    t.join();
  }

  std::vector<detail::root_task::handle_type> frames;
  std::vector<detail::blocking_wait *> waits;
  std::vector<blocked_task> blocked;
  std::vector<std::function<void()>> dropped_timers;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    running_ = false;
    if (deadlocked_) {
      blocked = abandon_blocked(frames, waits);
    }
    if (live_ == 0) {
      // Nobody is left to observe them; callbacks may own channels.
      dropped_timers = timers_.take_due(std::chrono::steady_clock::time_point::max());
    }
  }
  dropped_timers.clear();

  if (blocked.empty()) {
    log(log_level::debug, "run finished");
    return;
  }

  // A queue can live in another abandoned frame, so every waiter leaves its
  // queues before the first frame goes away.
  for (auto *wait : waits) {
    wait->withdraw();
  }
  for (auto frame : frames) {
    frame.destroy();
  }

  deadlock_error error(std::move(blocked));
  log(log_level::error, "%s", error.what());
  throw error;
}

std::vector<blocked_task>
scheduler::abandon_blocked(std::vector<detail::root_task::handle_type> &frames,
                           std::vector<detail::blocking_wait *> &waits) {
  std::vector<blocked_task> blocked;
  std::vector<detail::task_record *> records;
  for (auto &rec : slots_) {
    if (rec.state == task_state::blocked) {
      blocked.push_back(blocked_task{
          rec.id, rec.wait_reason != nullptr ? rec.wait_reason : "unknown"});
      records.push_back(&rec);
    }
  }

  auto reason = std::make_exception_ptr(deadlock_error(blocked));
  for (auto *rec : records) {
    frames.push_back(rec->frame);
    if (rec->waiting != nullptr) {
      waits.push_back(rec->waiting);
    }
    rec->status->error = reason;
    release_slot(*rec);
  }
  return blocked;
}

void scheduler::release_slot(detail::task_record &rec) {
  rec.status->state.store(task_state::completed, std::memory_order_release);
  rec.state = task_state::completed;
  rec.frame = nullptr;
  rec.resume_point = nullptr;
  rec.wait_reason = nullptr;
  rec.waiting = nullptr;
  rec.wake_pending = false;
  rec.status.reset();
  free_slots_.push_back(rec.id.index);
  --live_;
}

void scheduler::worker_loop() {
  std::unique_lock<std::mutex> lock(mutex_);

  while (!stopping_) {
    auto due = timers_.take_due(std::chrono::steady_clock::now());
    if (!due.empty()) {
      // Callbacks wake tasks, which takes the lock again.
      ++active_;
      lock.unlock();
      for (auto &callback : due) {
        callback();
      }
      due.clear();
      lock.lock();
      --active_;
      continue;
    }

    if (!run_queue_.empty()) {
      task_id id = run_queue_.front();
      run_queue_.pop_front();
      auto &rec = slots_[id.index];
      if (rec.id == id && rec.state == task_state::runnable) {
        run_step(lock, rec);
      }
      continue;
    }

    if (live_ == 0) {
      stopping_ = true;
      cv_.notify_all();
      break;
    }

    if (active_ == 0 && timers_.empty() && options_.detect_deadlock) {
      deadlocked_ = true;
      stopping_ = true;
      cv_.notify_all();
      break;
    }

    if (auto deadline = timers_.next_deadline()) {
      cv_.wait_until(lock, *deadline);
    } else {
      cv_.wait(lock);
    }
  }
}

void scheduler::run_step(std::unique_lock<std::mutex> &lock,
                         detail::task_record &rec) {
  const task_id id = rec.id;
  rec.state = task_state::running;
  rec.status->state.store(task_state::running, std::memory_order_release);
  rec.wake_pending = false;
  rec.wait_reason = nullptr;
  rec.waiting = nullptr;
  auto point = rec.resume_point;
  ++active_;
  lock.unlock();

  tls_current = detail::current_task{this, &rec, id, false};
  point.resume();
  const bool completed = tls_current.completed;
  tls_current = detail::current_task{};

  if (completed) {
    auto error = rec.frame.promise().error;
    // Locals of the task body are destroyed here, outside the lock.
    rec.frame.destroy();
    rec.frame = nullptr;

    if (error) {
      try {
        std::rethrow_exception(error);
      } catch (const std::exception &e) {
        log(log_level::warn, "%s failed: %s", to_string(id).c_str(), e.what());
      } catch (...) {
        log(log_level::warn, "%s failed with a non-standard exception",
            to_string(id).c_str());
      }
    }

    lock.lock();
    rec.status->error = error;
    release_slot(rec);
    if (log_enabled(log_level::debug)) {
      log(log_level::debug, "%s completed", to_string(id).c_str());
    }
  } else {
    lock.lock();
    if (rec.wake_pending && rec.wakeable()) {
      rec.wake_pending = false;
      rec.state = task_state::runnable;
      rec.status->state.store(task_state::runnable, std::memory_order_release);
      run_queue_.push_back(id);
    } else {
      rec.wake_pending = false;
      rec.state = task_state::blocked;
      rec.status->state.store(task_state::blocked, std::memory_order_release);
    }
  }
  --active_;
}

// =============================================================================
// Default Scheduler
// =============================================================================

scheduler &default_scheduler() {
  static scheduler instance(scheduler_options::from_env());
  return instance;
}

void run() { default_scheduler().run(); }

} // namespace cochan
