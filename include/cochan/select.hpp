#ifndef COCHAN_SELECT_HPP
#define COCHAN_SELECT_HPP

#include <array>
#include <coroutine>
#include <cstddef>
#include <functional>
#include <memory>
#include <numeric>
#include <random>
#include <stdexcept>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

#include "shared_state/channel.hpp"
#include "shared_state/crtp_base.hpp"

namespace cochan {

// Returned by select when its default case ran.
inline constexpr std::size_t select_default = static_cast<std::size_t>(-1);

namespace detail {

struct no_action {
  template <typename... Args> void operator()(Args &&...) const noexcept {}
};

// =============================================================================
// Select Case - Type-erased channel operation taking part in a select
// =============================================================================

class select_case {
public:
  virtual ~select_case() = default;

  virtual channel_core &core() const noexcept = 0;

  // poll, enqueue and dequeue run with the channel locked.
  virtual channel_op_status poll(pending_wakes &wakes) = 0;
  virtual void enqueue(waiter_node &node) = 0;
  virtual void dequeue(waiter_node &node) = 0;

  // Runs the case's action once the select committed to it, after every
  // channel lock is released. ok is false when the channel was closed.
  virtual void commit(bool ok) = 0;
};

// Locks a set of channels in address order, each one once.
class multi_lock {
  std::vector<channel_core *> cores_;
  bool locked_{false};

public:
  explicit multi_lock(std::vector<channel_core *> cores);
  ~multi_lock();

  multi_lock(const multi_lock &) = delete;
  multi_lock &operator=(const multi_lock &) = delete;

  void lock();
  void unlock() noexcept;
};

// Per-thread generator behind the poll order.
std::mt19937 &select_rng();

} // namespace detail

// =============================================================================
// Select Cases
// =============================================================================

template <typename T, typename F>
class send_case final : public detail::select_case {
  std::shared_ptr<detail::channel_state<T>> state_;
  T value_;
  F action_;

public:
  send_case(const channel<T> &ch, T value, F action)
      : state_((ch.state(), ch.state_)), value_(std::move(value)),
        action_(std::move(action)) {}

  detail::channel_core &core() const noexcept override { return *state_; }

  channel_op_status poll(detail::pending_wakes &wakes) override {
    return state_->try_send_locked(value_, wakes);
  }

  void enqueue(detail::waiter_node &node) override {
    node.slot = &value_;
    state_->senders().push_back(&node);
  }

  void dequeue(detail::waiter_node &node) override {
    state_->senders().erase(&node);
  }

  void commit(bool ok) override {
    if (!ok) {
      throw send_on_closed_error<T>(std::move(value_));
    }
    std::invoke(action_);
  }
};

template <typename T, typename F>
class receive_case final : public detail::select_case {
  std::shared_ptr<detail::channel_state<T>> state_;
  T received_{};
  F action_;

public:
  receive_case(const channel<T> &ch, F action)
      : state_((ch.state(), ch.state_)), action_(std::move(action)) {}

  detail::channel_core &core() const noexcept override { return *state_; }

  channel_op_status poll(detail::pending_wakes &wakes) override {
    return state_->try_receive_locked(received_, wakes);
  }

  void enqueue(detail::waiter_node &node) override {
    node.slot = &received_;
    state_->receivers().push_back(&node);
  }

  void dequeue(detail::waiter_node &node) override {
    state_->receivers().erase(&node);
  }

  // The action may take (value, open), (value) or nothing.
  void commit(bool ok) override {
    if constexpr (std::is_invocable_v<F &, T &&, bool>) {
      std::invoke(action_, std::move(received_), ok);
    } else if constexpr (std::is_invocable_v<F &, T &&>) {
      std::invoke(action_, std::move(received_));
    } else {
      std::invoke(action_);
    }
  }
};

template <typename F> struct default_case {
  F action;
};

template <typename C> struct is_default_case : std::false_type {};

template <typename F>
struct is_default_case<default_case<F>> : std::true_type {};

template <typename C>
inline constexpr bool is_default_case_v = is_default_case<C>::value;

template <typename T, typename F = detail::no_action>
send_case<T, F> on_send(const channel<T> &ch, std::type_identity_t<T> value,
                        F action = {}) {
  return send_case<T, F>(ch, std::move(value), std::move(action));
}

template <typename T, typename F = detail::no_action>
receive_case<T, F> on_receive(const channel<T> &ch, F action = {}) {
  return receive_case<T, F>(ch, std::move(action));
}

template <typename F = detail::no_action>
default_case<F> otherwise(F action = {}) {
  return default_case<F>{std::move(action)};
}

// =============================================================================
// Select Awaiter
// =============================================================================
//
// Commits to exactly one ready case, picked uniformly among the ready ones.
// With nothing ready the default case runs, or the task blocks with one
// waiter per case; the first counterpart to win the wait group completes
// that case and the other waiters are withdrawn before select returns.

template <typename... Cases>
class select_awaiter
    : public awaitable_base<select_awaiter<Cases...>, std::size_t>,
      public detail::blocking_wait {
  static constexpr std::size_t N =
      ((is_default_case_v<Cases> ? 0 : 1) + ... + 0);
  static constexpr std::size_t defaults =
      ((is_default_case_v<Cases> ? 1 : 0) + ... + 0);
  static_assert(defaults <= 1, "select takes at most one default case");

  std::tuple<Cases...> cases_;
  std::array<detail::select_case *, N> ops_{};
  // Position of each channel case in the argument list.
  std::array<std::size_t, N> positions_{};
  std::array<detail::waiter_node, N> nodes_{};
  std::size_t chosen_{select_default};
  bool chosen_ok_{false};
  bool decided_{false};

  template <std::size_t I> void bind_case(std::size_t &n) {
    using case_type = std::tuple_element_t<I, std::tuple<Cases...>>;
    if constexpr (!is_default_case_v<case_type>) {
      ops_[n] = &std::get<I>(cases_);
      positions_[n] = I;
      ++n;
    }
  }

  template <std::size_t... Is> void bind_cases(std::index_sequence<Is...>) {
    std::size_t n = 0;
    (bind_case<Is>(n), ...);
  }

  template <std::size_t I = 0> void run_default() {
    if constexpr (I < sizeof...(Cases)) {
      using case_type = std::tuple_element_t<I, std::tuple<Cases...>>;
      if constexpr (is_default_case_v<case_type>) {
        std::invoke(std::get<I>(cases_).action);
      } else {
        run_default<I + 1>();
      }
    }
  }

  std::vector<detail::channel_core *> cores() const {
    std::vector<detail::channel_core *> result;
    result.reserve(N);
    for (auto *op : ops_) {
      result.push_back(&op->core());
    }
    return result;
  }

  bool any_linked() const noexcept {
    for (const auto &node : nodes_) {
      if (node.linked) {
        return true;
      }
    }
    return false;
  }

public:
  explicit select_awaiter(Cases... cases) : cases_(std::move(cases)...) {
    bind_cases(std::index_sequence_for<Cases...>{});
  }

  select_awaiter(const select_awaiter &) = delete;
  select_awaiter &operator=(const select_awaiter &) = delete;

  ~select_awaiter() {
    if (any_linked()) {
      withdraw();
    }
  }

  // Losing waiters may still be popped by other channels, so this always
  // takes every channel lock.
  void withdraw() noexcept override {
    detail::multi_lock locks(cores());
    for (std::size_t i = 0; i < N; ++i) {
      ops_[i]->dequeue(nodes_[i]);
    }
  }

  bool ready_impl() {
    detail::require_task("select");
    return false;
  }

  bool suspend_impl(std::coroutine_handle<> h) {
    auto &ctx = detail::prepare_suspend(h, "select", this);

    std::array<std::size_t, N> order;
    std::iota(order.begin(), order.end(), std::size_t{0});
    std::shuffle(order.begin(), order.end(), detail::select_rng());

    detail::pending_wakes wakes;
    detail::multi_lock locks(cores());

    for (std::size_t i : order) {
      auto status = ops_[i]->poll(wakes);
      if (status != channel_op_status::would_block) {
        chosen_ = i;
        chosen_ok_ = status == channel_op_status::success;
        decided_ = true;
        locks.unlock();
        wakes.flush();
        return false;
      }
    }

    if constexpr (defaults > 0) {
      chosen_ = select_default;
      decided_ = true;
      return false;
    }

    group_.bind(ctx);
    for (std::size_t i = 0; i < N; ++i) {
      nodes_[i].group = &group_;
      nodes_[i].case_index = i;
      ops_[i]->enqueue(nodes_[i]);
    }
    return true;
  }

  std::size_t resume_impl() {
    if (!decided_) {
      detail::waiter_node *won = group_.which.load(std::memory_order_acquire);
      if (won == nullptr) {
        throw std::logic_error("select resumed without a completed case");
      }
      withdraw();
      chosen_ = won->case_index;
      chosen_ok_ = won->ok;
      decided_ = true;
    }

    if (chosen_ == select_default) {
      run_default();
      return select_default;
    }
    ops_[chosen_]->commit(chosen_ok_);
    return positions_[chosen_];
  }
};

// std::size_t i = co_await select(on_receive(a), on_send(b, v), otherwise());
// Yields the position of the committed case, or select_default.
template <typename... Cases> select_awaiter<Cases...> select(Cases... cases) {
  return select_awaiter<Cases...>(std::move(cases)...);
}

} // namespace cochan

#endif // COCHAN_SELECT_HPP
