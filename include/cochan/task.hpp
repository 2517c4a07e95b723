#ifndef COCHAN_TASK_HPP
#define COCHAN_TASK_HPP

#include <atomic>
#include <concepts>
#include <coroutine>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>

#include "allocator.hpp"
#include "task_id.hpp"

namespace cochan {

enum class task_state : std::uint8_t { runnable, running, blocked, completed };

const char *to_string(task_state state) noexcept;

namespace detail {

// Frames of every coroutine the runtime creates come from mimalloc.
struct frame_allocation {
  static void *operator new(std::size_t size) { return allocate_frame(size); }

  static void operator delete(void *p, std::size_t size) noexcept {
    deallocate_frame(p, size);
  }
};

struct task_promise_base : frame_allocation {
  std::coroutine_handle<> continuation{std::noop_coroutine()};
  std::exception_ptr error;

  std::suspend_always initial_suspend() noexcept { return {}; }

  // Hands control back to whoever awaited us (symmetric transfer).
  struct final_awaiter {
    bool await_ready() noexcept { return false; }

    template <typename Promise>
    std::coroutine_handle<>
    await_suspend(std::coroutine_handle<Promise> h) noexcept {
      return h.promise().continuation;
    }

    void await_resume() noexcept {}
  };

  final_awaiter final_suspend() noexcept { return {}; }

  void unhandled_exception() noexcept { error = std::current_exception(); }
};

} // namespace detail

// =============================================================================
// Task - Lazily started coroutine, awaited from a task body
// =============================================================================
//
// Task bodies and everything they call that may block return task<T>. A
// task<T> does not run until it is co_awaited; it then runs on the awaiting
// task and may itself suspend on channels, select or mutexes.

template <typename T = void> class task {
public:
  struct promise_type : detail::task_promise_base {
    std::optional<T> value;

    task get_return_object() {
      return task{std::coroutine_handle<promise_type>::from_promise(*this)};
    }

    template <typename U> void return_value(U &&v) {
      value.emplace(std::forward<U>(v));
    }
  };

  using handle_type = std::coroutine_handle<promise_type>;

  task(const task &) = delete;
  task &operator=(const task &) = delete;

  task(task &&other) noexcept : handle_(std::exchange(other.handle_, nullptr)) {}

  task &operator=(task &&other) noexcept {
    if (this != &other) {
      if (handle_)
        handle_.destroy();
      handle_ = std::exchange(other.handle_, nullptr);
    }
    return *this;
  }

  ~task() {
    if (handle_)
      handle_.destroy();
  }

  bool await_ready() const noexcept { return !handle_ || handle_.done(); }

  std::coroutine_handle<> await_suspend(std::coroutine_handle<> awaiting) noexcept {
    handle_.promise().continuation = awaiting;
    return handle_;
  }

  T await_resume() {
    auto &promise = handle_.promise();
    if (promise.error) {
      std::rethrow_exception(promise.error);
    }
    return std::move(*promise.value);
  }

private:
  explicit task(handle_type h) : handle_(h) {}

  handle_type handle_;
};

// Specialization for void
template <> class task<void> {
public:
  struct promise_type : detail::task_promise_base {
    task get_return_object() {
      return task{std::coroutine_handle<promise_type>::from_promise(*this)};
    }

    void return_void() noexcept {}
  };

  using handle_type = std::coroutine_handle<promise_type>;

  task(const task &) = delete;
  task &operator=(const task &) = delete;

  task(task &&other) noexcept : handle_(std::exchange(other.handle_, nullptr)) {}

  task &operator=(task &&other) noexcept {
    if (this != &other) {
      if (handle_)
        handle_.destroy();
      handle_ = std::exchange(other.handle_, nullptr);
    }
    return *this;
  }

  ~task() {
    if (handle_)
      handle_.destroy();
  }

  bool await_ready() const noexcept { return !handle_ || handle_.done(); }

  std::coroutine_handle<> await_suspend(std::coroutine_handle<> awaiting) noexcept {
    handle_.promise().continuation = awaiting;
    return handle_;
  }

  void await_resume() {
    auto &promise = handle_.promise();
    if (promise.error) {
      std::rethrow_exception(promise.error);
    }
  }

private:
  explicit task(handle_type h) : handle_(h) {}

  handle_type handle_;
};

// Type trait for detecting task
template <typename T> struct is_task : std::false_type {};

template <typename T> struct is_task<task<T>> : std::true_type {};

template <typename T>
inline constexpr bool is_task_v = is_task<T>::value;

// What spawn accepts: a callable returning task<U>, or a plain callable
// returning void that runs to completion without suspending.
template <typename F, typename... Args>
concept TaskBody = std::invocable<F &, Args &...> &&
                   (is_task_v<std::invoke_result_t<F &, Args &...>> ||
                    std::is_void_v<std::invoke_result_t<F &, Args &...>>);

namespace detail {

// Status shared between the scheduler and every task_handle of one task.
struct task_status {
  task_id id;
  std::atomic<task_state> state{task_state::runnable};
  // Written before state becomes completed.
  std::exception_ptr error;
};

// =============================================================================
// Root Task - The outermost frame of a spawned task, owned by the scheduler
// =============================================================================

class root_task {
public:
  struct promise_type : frame_allocation {
    std::exception_ptr error;

    root_task get_return_object() {
      return root_task{std::coroutine_handle<promise_type>::from_promise(*this)};
    }

    std::suspend_always initial_suspend() noexcept { return {}; }

    // Tells the worker that resumed us that the body is done. The frame
    // stays alive until the worker destroys it.
    struct final_awaiter {
      bool await_ready() noexcept { return false; }
      void await_suspend(std::coroutine_handle<promise_type> h) noexcept;
      void await_resume() noexcept {}
    };

    final_awaiter final_suspend() noexcept { return {}; }

    void return_void() noexcept {}

    void unhandled_exception() noexcept { error = std::current_exception(); }
  };

  using handle_type = std::coroutine_handle<promise_type>;

  root_task(const root_task &) = delete;
  root_task &operator=(const root_task &) = delete;

  root_task(root_task &&other) noexcept
      : handle_(std::exchange(other.handle_, nullptr)) {}

  root_task &operator=(root_task &&) = delete;

  ~root_task() {
    if (handle_)
      handle_.destroy();
  }

  handle_type release() noexcept { return std::exchange(handle_, nullptr); }

private:
  explicit root_task(handle_type h) : handle_(h) {}

  handle_type handle_;
};

// Moves the callable and its arguments into the root frame, so lambda
// captures live exactly as long as the task.
template <typename F, typename... Args>
root_task launch(F fn, Args... args) {
  if constexpr (std::is_void_v<std::invoke_result_t<F &, Args &...>>) {
    std::invoke(fn, args...);
  } else {
    (void)co_await std::invoke(fn, args...);
  }
  co_return;
}

} // namespace detail

// =============================================================================
// Task Handle - Caller-side view of a spawned task
// =============================================================================

class task_handle {
public:
  task_handle() = default;

  task_id id() const noexcept { return status_ ? status_->id : task_id{}; }

  task_state state() const noexcept {
    return status_ ? status_->state.load(std::memory_order_acquire)
                   : task_state::completed;
  }

  bool done() const noexcept { return state() == task_state::completed; }

  // The exception that terminated the task, once it is done.
  std::exception_ptr error() const noexcept {
    if (!status_ || !done()) {
      return nullptr;
    }
    return status_->error;
  }

  void rethrow_if_failed() const {
    if (auto e = error()) {
      std::rethrow_exception(e);
    }
  }

  explicit operator bool() const noexcept { return status_ != nullptr; }

private:
  friend class scheduler;

  explicit task_handle(std::shared_ptr<detail::task_status> status)
      : status_(std::move(status)) {}

  std::shared_ptr<detail::task_status> status_;
};

} // namespace cochan

#endif // COCHAN_TASK_HPP
