#ifndef COCHAN_TASK_ID_HPP
#define COCHAN_TASK_ID_HPP

#include <cstdint>
#include <string>

namespace cochan {

// Identifies one task for its whole life. The index addresses the
// scheduler's arena slot, the serial tells apart successive occupants of
// the same slot so a stale id never wakes the wrong task.
struct task_id {
  std::uint32_t index{0};
  std::uint64_t serial{0};

  explicit operator bool() const noexcept { return serial != 0; }

  friend bool operator==(const task_id &, const task_id &) = default;
};

inline std::string to_string(task_id id) {
  return "task " + std::to_string(id.serial);
}

} // namespace cochan

#endif // COCHAN_TASK_ID_HPP
