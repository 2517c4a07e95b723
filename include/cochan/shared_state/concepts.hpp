#ifndef COCHAN_SHARED_STATE_CONCEPTS_HPP
#define COCHAN_SHARED_STATE_CONCEPTS_HPP

#include <concepts>
#include <coroutine>
#include <type_traits>

namespace cochan {

// =============================================================================
// Core Type Concepts
// =============================================================================

// A receive on a closed, drained channel yields T{}, so elements must be
// default constructible as well as movable.
template <typename T>
concept ChannelElement = std::movable<T> && std::default_initializable<T>;

// =============================================================================
// Coroutine Awaitable Concepts
// =============================================================================

template <typename T>
concept Awaiter = requires(T a, std::coroutine_handle<> h) {
  { a.await_ready() } -> std::convertible_to<bool>;
  { a.await_suspend(h) };
  { a.await_resume() };
};

// =============================================================================
// Lockable Concepts (std::mutex-like)
// =============================================================================

template <typename T>
concept BasicLockable = requires(T m) {
  { m.lock() } -> std::same_as<void>;
  { m.unlock() } -> std::same_as<void>;
};

template <typename T>
concept Lockable = BasicLockable<T> && requires(T m) {
  { m.try_lock() } -> std::convertible_to<bool>;
};

// =============================================================================
// Policy Concepts
// =============================================================================

template <typename P>
concept LockPolicy = Lockable<typename P::mutex_type> && requires {
  typename P::lock_type;
};

} // namespace cochan

#endif // COCHAN_SHARED_STATE_CONCEPTS_HPP
