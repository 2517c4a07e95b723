#ifndef COCHAN_TIMER_SERVICE_HPP
#define COCHAN_TIMER_SERVICE_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory_resource>
#include <optional>
#include <tuple>
#include <vector>

#include "allocator.hpp"

namespace cochan {

struct timer_entry {
  std::chrono::steady_clock::time_point deadline;
  // Orders timers with equal deadlines by registration.
  std::uint64_t seq;
  std::function<void()> callback;

  // Min-heap: earliest deadline has highest priority
  bool operator>(const timer_entry &other) const {
    return std::tie(deadline, seq) > std::tie(other.deadline, other.seq);
  }
};

// Deadline heap owned by a scheduler. It has no thread of its own: the
// scheduler's workers poll it and run the due callbacks, and the scheduler
// lock guards every call.
class timer_service {
public:
  timer_service() = default;

  timer_service(const timer_service &) = delete;
  timer_service &operator=(const timer_service &) = delete;

  void add_timer(std::chrono::steady_clock::time_point deadline,
                 std::function<void()> callback);

  // Removes and returns the callbacks of every timer due at `now`, earliest
  // first.
  std::vector<std::function<void()>>
  take_due(std::chrono::steady_clock::time_point now);

  std::optional<std::chrono::steady_clock::time_point> next_deadline() const;

  bool empty() const noexcept { return heap_.empty(); }
  std::size_t size() const noexcept { return heap_.size(); }

private:
  std::pmr::vector<timer_entry> heap_{mi_resource()};
  std::uint64_t next_seq_{0};
};

} // namespace cochan

#endif // COCHAN_TIMER_SERVICE_HPP
