#ifndef COCHAN_SHARED_STATE_MUTEX_HPP
#define COCHAN_SHARED_STATE_MUTEX_HPP

#include <coroutine>

#include "../errors.hpp"
#include "../task_id.hpp"
#include "crtp_base.hpp"
#include "policies.hpp"

namespace cochan {

// =============================================================================
// Mutex - Task-aware lock; waiting tasks suspend instead of blocking a worker
// =============================================================================
//
//   co_await mu.lock();
//   ... critical section ...
//   mu.unlock();
//
// Ownership belongs to a task, not a thread. unlock() hands the lock straight
// to the oldest waiter, so a waiter can never be overtaken once queued.

class mutex : public sync_primitive_base<mutex, spinlock_policy> {
  task_id owner_{};
  detail::waiter_list waiters_;

public:
  class lock_awaiter : public awaitable_base<lock_awaiter, void>,
                       public detail::blocking_wait {
    mutex &mutex_;
    detail::waiter_node node_;

  public:
    explicit lock_awaiter(mutex &m) : mutex_(m) {}

    lock_awaiter(const lock_awaiter &) = delete;
    lock_awaiter &operator=(const lock_awaiter &) = delete;

    ~lock_awaiter();

    void withdraw() noexcept override;

    bool ready_impl();
    bool suspend_impl(std::coroutine_handle<> h);
    void resume_impl() noexcept {}
  };

  mutex() = default;

  lock_awaiter lock() { return lock_awaiter(*this); }

  // Never blocks; must be called from inside a task.
  bool try_lock();

  // Throws not_owner_error unless the calling task owns the lock.
  void unlock();

  bool is_locked() const;

  // Owning task, or an empty id while unlocked.
  task_id owner() const;
};

} // namespace cochan

#endif // COCHAN_SHARED_STATE_MUTEX_HPP
