#include "cochan/shared_state/mutex.hpp"

namespace cochan {

mutex::lock_awaiter::~lock_awaiter() { withdraw(); }

void mutex::lock_awaiter::withdraw() noexcept {
  if (node_.linked) {
    auto lock = mutex_.acquire();
    mutex_.waiters_.erase(&node_);
  }
}

bool mutex::lock_awaiter::ready_impl() {
  auto &ctx = detail::require_task("mutex lock");
  auto lock = mutex_.acquire();
  if (!mutex_.owner_) {
    mutex_.owner_ = ctx.id;
    return true;
  }
  return false;
}

bool mutex::lock_awaiter::suspend_impl(std::coroutine_handle<> h) {
  auto &ctx = detail::prepare_suspend(h, "mutex lock", this);
  auto lock = mutex_.acquire();
  // Released since ready_impl looked.
  if (!mutex_.owner_) {
    mutex_.owner_ = ctx.id;
    return false;
  }
  group_.bind(ctx);
  node_.group = &group_;
  mutex_.waiters_.push_back(&node_);
  return true;
}

bool mutex::try_lock() {
  auto &ctx = detail::require_task("mutex try_lock");
  auto lock = acquire();
  if (owner_) {
    return false;
  }
  owner_ = ctx.id;
  return true;
}

void mutex::unlock() {
  const task_id caller = detail::this_task().id;
  detail::pending_wakes wakes;
  {
    auto lock = acquire();
    if (!owner_ || owner_ != caller) {
      throw not_owner_error();
    }
    if (detail::waiter_node *next = waiters_.dequeue_winner()) {
      // Ownership passes directly; the waiter resumes holding the lock.
      owner_ = next->group->task;
      wakes.add(*next->group);
    } else {
      owner_ = task_id{};
    }
  }
  wakes.flush();
}

bool mutex::is_locked() const {
  auto lock = acquire();
  return static_cast<bool>(owner_);
}

task_id mutex::owner() const {
  auto lock = acquire();
  return owner_;
}

} // namespace cochan
