#include "cochan/errors.hpp"

namespace cochan {

namespace {

std::string describe(const std::vector<blocked_task> &blocked) {
  std::string message = "all tasks are asleep - deadlock!";
  for (const auto &task : blocked) {
    message += "\n  ";
    message += to_string(task.id);
    message += " [";
    message += task.reason;
    message += "]";
  }
  return message;
}

} // namespace

deadlock_error::deadlock_error(std::vector<blocked_task> blocked)
    : std::runtime_error(describe(blocked)), blocked_(std::move(blocked)) {}

} // namespace cochan
