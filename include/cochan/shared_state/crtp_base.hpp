#ifndef COCHAN_SHARED_STATE_CRTP_BASE_HPP
#define COCHAN_SHARED_STATE_CRTP_BASE_HPP

#include <atomic>
#include <coroutine>
#include <cstddef>
#include <utility>
#include <vector>

#include "../task_id.hpp"
#include "concepts.hpp"
#include "policies.hpp"

namespace cochan {

class scheduler;

namespace detail {

struct task_record;
class blocking_wait;

// =============================================================================
// Scheduler Hooks
// =============================================================================
//
// Primitives only need three things from the scheduler: who is running, how
// to record where a task stopped, and how to make it runnable again. These
// are defined in scheduler.cpp so that primitives do not depend on
// scheduler.hpp.

// Thread-local view of the task a worker is currently resuming.
struct current_task {
  scheduler *sched{nullptr};
  task_record *record{nullptr};
  task_id id{};
  bool completed{false};
};

current_task &this_task() noexcept;

// Throws std::logic_error when called outside of a task.
current_task &require_task(const char *operation);

// Records h as the point to resume and why the task is about to block.
// Must run before the task becomes visible to any waker. `wait` is the queued
// operation the task blocks on, if any; wakes are ignored until it completed.
current_task &prepare_suspend(std::coroutine_handle<> h, const char *reason,
                              blocking_wait *wait = nullptr);

void wake_task(scheduler *sched, task_id id);

// =============================================================================
// Waiter Node (Intrusive Doubly Linked List)
// =============================================================================

struct wait_group;

// One blocked operation queued on one resource. Lives inside an awaiter, that
// is inside the suspended coroutine frame, so it stays put while queued.
struct waiter_node {
  waiter_node *prev{nullptr};
  waiter_node *next{nullptr};
  bool linked{false};

  wait_group *group{nullptr};
  // Channel element to read from (sender) or write to (receiver).
  void *slot{nullptr};
  // Set by the waker: false means the channel was closed underneath.
  bool ok{false};
  // Position of this node's case inside a select.
  std::size_t case_index{0};
};

// A set of waiters belonging to one blocked task. Exactly one of them can be
// won; the winner is completed by whoever won it and the task is woken once.
struct wait_group {
  std::atomic<waiter_node *> which{nullptr};
  scheduler *sched{nullptr};
  task_id task{};

  void bind(const current_task &ctx) noexcept {
    sched = ctx.sched;
    task = ctx.id;
  }

  bool try_to_win(waiter_node *w) noexcept {
    waiter_node *expected = nullptr;
    return which.compare_exchange_strong(expected, w, std::memory_order_acq_rel,
                                         std::memory_order_acquire);
  }
};

// An operation whose waiters are queued on one or more primitives while its
// task is blocked. The scheduler reads it only while the task is suspended.
class blocking_wait {
public:
  // True once a waker won the group and completed the operation.
  bool completed() const noexcept {
    return group_.which.load(std::memory_order_acquire) != nullptr;
  }

  // Unlinks every still-queued waiter. Called before abandoned frames are
  // destroyed, because a queue may live in another abandoned frame.
  virtual void withdraw() noexcept = 0;

protected:
  blocking_wait() = default;
  ~blocking_wait() = default;

  wait_group group_;
};

// FIFO queue of waiter nodes. Not synchronized: the owning primitive's lock
// must be held for every call.
class waiter_list {
  waiter_node *head_{nullptr};
  waiter_node *tail_{nullptr};
  std::size_t size_{0};

public:
  void push_back(waiter_node *node) noexcept {
    node->prev = tail_;
    node->next = nullptr;
    if (tail_ != nullptr) {
      tail_->next = node;
    } else {
      head_ = node;
    }
    tail_ = node;
    node->linked = true;
    ++size_;
  }

  waiter_node *pop_front() noexcept {
    waiter_node *node = head_;
    if (node != nullptr) {
      erase(node);
    }
    return node;
  }

  // Removing a node twice is fine; the second call does nothing.
  void erase(waiter_node *node) noexcept {
    if (!node->linked) {
      return;
    }
    if (node->prev != nullptr) {
      node->prev->next = node->next;
    } else {
      head_ = node->next;
    }
    if (node->next != nullptr) {
      node->next->prev = node->prev;
    } else {
      tail_ = node->prev;
    }
    node->prev = node->next = nullptr;
    node->linked = false;
    --size_;
  }

  // Pops nodes until one whose group can still be won. Nodes whose group was
  // already won elsewhere are dropped from the queue on the way.
  waiter_node *dequeue_winner() noexcept {
    while (waiter_node *node = pop_front()) {
      if (node->group->try_to_win(node)) {
        return node;
      }
    }
    return nullptr;
  }

  bool empty() const noexcept { return head_ == nullptr; }
  std::size_t size() const noexcept { return size_; }
};

// Wakeups collected while a primitive's lock is held and issued after it is
// released.
class pending_wakes {
  std::vector<std::pair<scheduler *, task_id>> targets_;

public:
  void add(const wait_group &group) { targets_.emplace_back(group.sched, group.task); }

  void flush() {
    for (auto &[sched, id] : targets_) {
      wake_task(sched, id);
    }
    targets_.clear();
  }
};

} // namespace detail

// =============================================================================
// Sync Primitive Base - Owns the lock guarding a primitive's internal state
// =============================================================================

template <typename Derived, LockPolicy Policy = mutex_lock_policy>
class sync_primitive_base {
public:
  using mutex_type = typename Policy::mutex_type;
  using lock_type = typename Policy::lock_type;

  // Exclusive access to the internal state.
  lock_type acquire() const { return lock_type(mutex_); }

  mutex_type &native_mutex() const noexcept { return mutex_; }

protected:
  mutable mutex_type mutex_;

public:
  sync_primitive_base() = default;
  ~sync_primitive_base() = default;

  sync_primitive_base(const sync_primitive_base &) = delete;
  sync_primitive_base &operator=(const sync_primitive_base &) = delete;
  sync_primitive_base(sync_primitive_base &&) = delete;
  sync_primitive_base &operator=(sync_primitive_base &&) = delete;
};

// =============================================================================
// Awaitable Base - Provides standard coroutine awaiter interface via CRTP
// =============================================================================

template <typename Derived, typename T> class awaitable_base {
protected:
  // Derived class must implement:
  // - bool ready_impl()
  // - bool suspend_impl(std::coroutine_handle<> h)  (false resumes at once)
  // - T resume_impl()

  Derived &derived() { return static_cast<Derived &>(*this); }

public:
  bool await_ready() { return derived().ready_impl(); }

  bool await_suspend(std::coroutine_handle<> h) { return derived().suspend_impl(h); }

  T await_resume() { return derived().resume_impl(); }
};

// Specialization for void
template <typename Derived> class awaitable_base<Derived, void> {
protected:
  Derived &derived() { return static_cast<Derived &>(*this); }

public:
  bool await_ready() { return derived().ready_impl(); }

  bool await_suspend(std::coroutine_handle<> h) { return derived().suspend_impl(h); }

  void await_resume() { derived().resume_impl(); }
};

} // namespace cochan

#endif // COCHAN_SHARED_STATE_CRTP_BASE_HPP
