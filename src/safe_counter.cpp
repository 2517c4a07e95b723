#include "cochan/shared_state/safe_counter.hpp"

namespace cochan {

task<> safe_counter::increment(std::string key) {
  co_await mu_.lock();
  int current = counts_[key];
  counts_[key] = current + 1;
  mu_.unlock();
}

task<int> safe_counter::value(std::string key) {
  co_await mu_.lock();
  int result = 0;
  if (auto it = counts_.find(key); it != counts_.end()) {
    result = it->second;
  }
  mu_.unlock();
  co_return result;
}

// Read, then write back: another worker can interleave in between.
void unsafe_counter::increment() noexcept {
  int current = value_.load(std::memory_order_relaxed);
  value_.store(current + 1, std::memory_order_relaxed);
}

} // namespace cochan
