#include "cochan/timer_service.hpp"

#include <algorithm>

namespace cochan {

void timer_service::add_timer(std::chrono::steady_clock::time_point deadline,
                              std::function<void()> callback) {
  heap_.push_back(timer_entry{deadline, next_seq_++, std::move(callback)});
  std::push_heap(heap_.begin(), heap_.end(), std::greater<>{});
}

std::vector<std::function<void()>>
timer_service::take_due(std::chrono::steady_clock::time_point now) {
  std::vector<std::function<void()>> due;
  while (!heap_.empty() && heap_.front().deadline <= now) {
    // Pop the entry
    std::pop_heap(heap_.begin(), heap_.end(), std::greater<>{});
    due.push_back(std::move(heap_.back().callback));
    heap_.pop_back();
  }
  return due;
}

std::optional<std::chrono::steady_clock::time_point>
timer_service::next_deadline() const {
  if (heap_.empty()) {
    return std::nullopt;
  }
  return heap_.front().deadline;
}

} // namespace cochan
