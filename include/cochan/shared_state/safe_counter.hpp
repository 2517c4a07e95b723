#ifndef COCHAN_SHARED_STATE_SAFE_COUNTER_HPP
#define COCHAN_SHARED_STATE_SAFE_COUNTER_HPP

#include <atomic>
#include <string>
#include <unordered_map>

#include "../task.hpp"
#include "mutex.hpp"

namespace cochan {

// Per-key counts guarded by a task-aware mutex.
class safe_counter {
public:
  task<> increment(std::string key);

  // 0 for keys never incremented.
  task<int> value(std::string key);

private:
  mutex mu_;
  std::unordered_map<std::string, int> counts_;
};

// Counter whose increment is a separate load and store with no lock around
// them: concurrent increments race and can be lost. Only meant to be compared
// against safe_counter.
class unsafe_counter {
public:
  void increment() noexcept;
  int value() const noexcept { return value_.load(std::memory_order_relaxed); }

private:
  std::atomic<int> value_{0};
};

} // namespace cochan

#endif // COCHAN_SHARED_STATE_SAFE_COUNTER_HPP
