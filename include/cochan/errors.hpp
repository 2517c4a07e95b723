#ifndef COCHAN_ERRORS_HPP
#define COCHAN_ERRORS_HPP

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "task_id.hpp"

namespace cochan {

// =============================================================================
// Channel Errors
// =============================================================================

class channel_error : public std::logic_error {
public:
  using std::logic_error::logic_error;
};

// Send on a closed channel. Thrown by plain sends and by select send cases.
class closed_channel_error : public channel_error {
public:
  closed_channel_error() : channel_error("send on closed channel") {}
};

// Carries the value that could not be delivered back to the sender.
template <typename T>
class send_on_closed_error : public closed_channel_error {
  std::shared_ptr<T> value_;

public:
  explicit send_on_closed_error(T value)
      : value_(std::make_shared<T>(std::move(value))) {}

  T &value() const noexcept { return *value_; }
};

class double_close_error : public channel_error {
public:
  double_close_error() : channel_error("close of closed channel") {}
};

// =============================================================================
// Mutex Errors
// =============================================================================

class not_owner_error : public std::logic_error {
public:
  not_owner_error()
      : std::logic_error("unlock of mutex not owned by the calling task") {}
};

// =============================================================================
// Scheduler Errors
// =============================================================================

struct blocked_task {
  task_id id;
  std::string reason;
};

// Every remaining task was blocked with nothing left that could wake it.
class deadlock_error : public std::runtime_error {
  std::vector<blocked_task> blocked_;

public:
  explicit deadlock_error(std::vector<blocked_task> blocked);

  const std::vector<blocked_task> &blocked() const noexcept { return blocked_; }
};

} // namespace cochan

#endif // COCHAN_ERRORS_HPP
