#ifndef COCHAN_SHARED_STATE_CHANNEL_HPP
#define COCHAN_SHARED_STATE_CHANNEL_HPP

#include <cstddef>
#include <deque>
#include <memory>
#include <optional>
#include <stdexcept>
#include <utility>

#include "../errors.hpp"
#include "concepts.hpp"
#include "crtp_base.hpp"
#include "policies.hpp"

namespace cochan {

// =============================================================================
// Channel Results
// =============================================================================

enum class channel_op_status {
  success,
  closed,
  would_block
};

// Outcome of a non-blocking operation.
template <typename T>
struct channel_result {
  std::optional<T> value;
  channel_op_status status;

  explicit operator bool() const { return status == channel_op_status::success; }

  T &operator*() { return *value; }
  const T &operator*() const { return *value; }
};

// Outcome of a blocking receive: open is false (and value is T{}) once the
// channel is closed and drained.
template <typename T>
struct receive_result {
  T value{};
  bool open{false};

  explicit operator bool() const { return open; }
};

template <ChannelElement T> class channel;

template <typename T, typename F> class send_case;
template <typename T, typename F> class receive_case;

namespace detail {

// =============================================================================
// Channel Core - Untyped state shared by every channel<T>
// =============================================================================
//
// The buffer and both wait queues are only touched with the channel's own
// lock held. Blocked senders park in sendq_, blocked receivers in recvq_;
// receivers only ever wait while the buffer is empty and senders only while
// it is full, so a send always serves a waiting receiver first.

class channel_core : public sync_primitive_base<channel_core, mutex_lock_policy> {
public:
  explicit channel_core(std::size_t capacity) : capacity_(capacity) {}

  std::size_t capacity() const noexcept { return capacity_; }

  waiter_list &senders() noexcept { return sendq_; }
  waiter_list &receivers() noexcept { return recvq_; }

protected:
  const std::size_t capacity_;
  bool closed_{false};
  waiter_list sendq_;
  waiter_list recvq_;
};

template <ChannelElement T>
class channel_state : public channel_core {
  std::deque<T> buffer_;

public:
  explicit channel_state(std::size_t capacity) : channel_core(capacity) {}

  // The *_locked operations must be called with the channel locked. They
  // only move from `value` when they return success.

  channel_op_status try_send_locked(T &value, pending_wakes &wakes) {
    if (closed_) {
      return channel_op_status::closed;
    }
    if (waiter_node *receiver = recvq_.dequeue_winner()) {
      *static_cast<T *>(receiver->slot) = std::move(value);
      receiver->ok = true;
      wakes.add(*receiver->group);
      return channel_op_status::success;
    }
    if (buffer_.size() < capacity_) {
      buffer_.push_back(std::move(value));
      return channel_op_status::success;
    }
    return channel_op_status::would_block;
  }

  // Returns closed (with out = T{}) once the channel is closed and drained.
  channel_op_status try_receive_locked(T &out, pending_wakes &wakes) {
    if (!buffer_.empty()) {
      out = std::move(buffer_.front());
      buffer_.pop_front();
      // Room just freed up: the oldest blocked sender moves into the buffer.
      if (waiter_node *sender = sendq_.dequeue_winner()) {
        buffer_.push_back(std::move(*static_cast<T *>(sender->slot)));
        sender->ok = true;
        wakes.add(*sender->group);
      }
      return channel_op_status::success;
    }
    if (waiter_node *sender = sendq_.dequeue_winner()) {
      out = std::move(*static_cast<T *>(sender->slot));
      sender->ok = true;
      wakes.add(*sender->group);
      return channel_op_status::success;
    }
    if (closed_) {
      out = T{};
      return channel_op_status::closed;
    }
    return channel_op_status::would_block;
  }

  void close_locked(pending_wakes &wakes) {
    if (closed_) {
      throw double_close_error();
    }
    closed_ = true;
    while (waiter_node *receiver = recvq_.dequeue_winner()) {
      *static_cast<T *>(receiver->slot) = T{};
      receiver->ok = false;
      wakes.add(*receiver->group);
    }
    while (waiter_node *sender = sendq_.dequeue_winner()) {
      sender->ok = false;
      wakes.add(*sender->group);
    }
  }

  bool closed_locked() const noexcept { return closed_; }
  std::size_t size_locked() const noexcept { return buffer_.size(); }
};

} // namespace detail

// =============================================================================
// Channel Awaiters
// =============================================================================

template <ChannelElement T>
class channel_send_awaiter
    : public awaitable_base<channel_send_awaiter<T>, void>,
      public detail::blocking_wait {
  std::shared_ptr<detail::channel_state<T>> state_;
  T value_;
  detail::waiter_node node_;
  channel_op_status status_{channel_op_status::would_block};

public:
  channel_send_awaiter(std::shared_ptr<detail::channel_state<T>> state, T value)
      : state_(std::move(state)), value_(std::move(value)) {}

  channel_send_awaiter(const channel_send_awaiter &) = delete;
  channel_send_awaiter &operator=(const channel_send_awaiter &) = delete;

  ~channel_send_awaiter() { withdraw(); }

  void withdraw() noexcept override {
    if (node_.linked) {
      auto lock = state_->acquire();
      state_->senders().erase(&node_);
    }
  }

  bool ready_impl() {
    detail::require_task("chan send");
    // Try to send immediately
    detail::pending_wakes wakes;
    {
      auto lock = state_->acquire();
      status_ = state_->try_send_locked(value_, wakes);
    }
    wakes.flush();
    return status_ != channel_op_status::would_block;
  }

  bool suspend_impl(std::coroutine_handle<> h) {
    auto &ctx = detail::prepare_suspend(h, "chan send", this);
    auto lock = state_->acquire();
    // A receiver may have arrived since ready_impl dropped the lock.
    detail::pending_wakes wakes;
    status_ = state_->try_send_locked(value_, wakes);
    if (status_ != channel_op_status::would_block) {
      lock.unlock();
      wakes.flush();
      return false;
    }
    group_.bind(ctx);
    node_.group = &group_;
    node_.slot = &value_;
    state_->senders().push_back(&node_);
    return true;
  }

  void resume_impl() {
    if (status_ == channel_op_status::would_block) {
      // We were woken: either a receiver took the value or close failed us.
      status_ = node_.ok ? channel_op_status::success : channel_op_status::closed;
    }
    if (status_ == channel_op_status::closed) {
      throw send_on_closed_error<T>(std::move(value_));
    }
  }
};

template <ChannelElement T>
class channel_receive_awaiter
    : public awaitable_base<channel_receive_awaiter<T>, receive_result<T>>,
      public detail::blocking_wait {
  std::shared_ptr<detail::channel_state<T>> state_;
  T value_{};
  detail::waiter_node node_;
  channel_op_status status_{channel_op_status::would_block};

public:
  explicit channel_receive_awaiter(std::shared_ptr<detail::channel_state<T>> state)
      : state_(std::move(state)) {}

  channel_receive_awaiter(const channel_receive_awaiter &) = delete;
  channel_receive_awaiter &operator=(const channel_receive_awaiter &) = delete;

  ~channel_receive_awaiter() { withdraw(); }

  void withdraw() noexcept override {
    if (node_.linked) {
      auto lock = state_->acquire();
      state_->receivers().erase(&node_);
    }
  }

  bool ready_impl() {
    detail::require_task("chan receive");
    // Try to receive immediately
    detail::pending_wakes wakes;
    {
      auto lock = state_->acquire();
      status_ = state_->try_receive_locked(value_, wakes);
    }
    wakes.flush();
    return status_ != channel_op_status::would_block;
  }

  bool suspend_impl(std::coroutine_handle<> h) {
    auto &ctx = detail::prepare_suspend(h, "chan receive", this);
    auto lock = state_->acquire();
    detail::pending_wakes wakes;
    status_ = state_->try_receive_locked(value_, wakes);
    if (status_ != channel_op_status::would_block) {
      lock.unlock();
      wakes.flush();
      return false;
    }
    group_.bind(ctx);
    node_.group = &group_;
    node_.slot = &value_;
    state_->receivers().push_back(&node_);
    return true;
  }

  receive_result<T> resume_impl() {
    if (status_ == channel_op_status::would_block) {
      status_ = node_.ok ? channel_op_status::success : channel_op_status::closed;
    }
    return {std::move(value_), status_ == channel_op_status::success};
  }
};

// =============================================================================
// Channel Range - Drains a channel until it is closed
// =============================================================================
//
//   auto values = ch.range();
//   while (auto v = co_await values.next()) { ... }

template <ChannelElement T>
class channel_range {
  std::shared_ptr<detail::channel_state<T>> state_;
  bool finished_{false};

  class next_awaiter {
    channel_range &range_;
    channel_receive_awaiter<T> receive_;

  public:
    explicit next_awaiter(channel_range &range)
        : range_(range), receive_(range.state_) {}

    bool await_ready() { return range_.finished_ || receive_.await_ready(); }

    bool await_suspend(std::coroutine_handle<> h) { return receive_.await_suspend(h); }

    std::optional<T> await_resume() {
      if (range_.finished_) {
        return std::nullopt;
      }
      auto result = receive_.await_resume();
      if (!result.open) {
        range_.finished_ = true;
        return std::nullopt;
      }
      return std::move(result.value);
    }
  };

public:
  explicit channel_range(std::shared_ptr<detail::channel_state<T>> state)
      : state_(std::move(state)) {}

  next_awaiter next() { return next_awaiter(*this); }

  bool finished() const noexcept { return finished_; }
};

// =============================================================================
// Channel - Shared handle to a typed, capacity-bounded conduit
// =============================================================================
//
// Copies refer to the same channel; the channel goes away with its last
// handle. Capacity 0 makes sends and receives rendezvous.

template <ChannelElement T>
class channel {
  std::shared_ptr<detail::channel_state<T>> state_;

  template <typename U, typename F> friend class send_case;
  template <typename U, typename F> friend class receive_case;

  detail::channel_state<T> &state() const {
    if (!state_) {
      throw std::logic_error("operation on nil channel");
    }
    return *state_;
  }

public:
  using value_type = T;

  // A nil channel: every operation on it throws std::logic_error.
  channel() = default;

  explicit channel(std::size_t capacity)
      : state_(std::make_shared<detail::channel_state<T>>(capacity)) {}

  // co_await ch.send(v); throws send_on_closed_error<T>.
  channel_send_awaiter<T> send(T value) const {
    state();
    return channel_send_awaiter<T>(state_, std::move(value));
  }

  // auto [value, open] = co_await ch.receive();
  channel_receive_awaiter<T> receive() const {
    state();
    return channel_receive_awaiter<T>(state_);
  }

  // Never blocks; callable from any thread.
  void close() const {
    auto &st = state();
    detail::pending_wakes wakes;
    {
      auto lock = st.acquire();
      st.close_locked(wakes);
    }
    wakes.flush();
  }

  // Non-blocking send; value is moved from only on success.
  channel_op_status try_send(T &&value) const {
    auto &st = state();
    detail::pending_wakes wakes;
    channel_op_status status;
    {
      auto lock = st.acquire();
      status = st.try_send_locked(value, wakes);
    }
    wakes.flush();
    return status;
  }

  channel_op_status try_send(const T &value) const {
    T copy = value;
    return try_send(std::move(copy));
  }

  channel_result<T> try_receive() const {
    auto &st = state();
    detail::pending_wakes wakes;
    T value{};
    channel_op_status status;
    {
      auto lock = st.acquire();
      status = st.try_receive_locked(value, wakes);
    }
    wakes.flush();
    if (status == channel_op_status::success) {
      return {std::move(value), status};
    }
    return {std::nullopt, status};
  }

  channel_range<T> range() const {
    state();
    return channel_range<T>(state_);
  }

  std::size_t capacity() const { return state().capacity(); }

  std::size_t size() const {
    auto &st = state();
    auto lock = st.acquire();
    return st.size_locked();
  }

  bool is_closed() const {
    auto &st = state();
    auto lock = st.acquire();
    return st.closed_locked();
  }

  std::size_t waiting_senders() const {
    auto &st = state();
    auto lock = st.acquire();
    return st.senders().size();
  }

  std::size_t waiting_receivers() const {
    auto &st = state();
    auto lock = st.acquire();
    return st.receivers().size();
  }

  explicit operator bool() const noexcept { return state_ != nullptr; }

  friend bool operator==(const channel &a, const channel &b) noexcept {
    return a.state_ == b.state_;
  }
};

template <ChannelElement T>
channel<T> make_channel(std::size_t capacity = 0) {
  return channel<T>(capacity);
}

} // namespace cochan

#endif // COCHAN_SHARED_STATE_CHANNEL_HPP
