#include "cochan/select.hpp"

#include <algorithm>

namespace cochan::detail {

multi_lock::multi_lock(std::vector<channel_core *> cores)
    : cores_(std::move(cores)) {
  std::sort(cores_.begin(), cores_.end(), std::less<>{});
  cores_.erase(std::unique(cores_.begin(), cores_.end()), cores_.end());
  lock();
}

multi_lock::~multi_lock() { unlock(); }

void multi_lock::lock() {
  for (auto *core : cores_) {
    core->native_mutex().lock();
  }
  locked_ = true;
}

void multi_lock::unlock() noexcept {
  if (!locked_) {
    return;
  }
  for (auto it = cores_.rbegin(); it != cores_.rend(); ++it) {
    (*it)->native_mutex().unlock();
  }
  locked_ = false;
}

std::mt19937 &select_rng() {
  thread_local std::mt19937 rng(std::random_device{}());
  return rng;
}

} // namespace cochan::detail
