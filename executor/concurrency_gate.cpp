#include "executor/concurrency_gate.hpp"

#include <algorithm>

#include "glog/logging.h"

namespace executor {

ConcurrencyGate::ConcurrencyGate(size_t capacity) : capacity_(capacity) {
  CHECK_GT(capacity_, 0u);
}

void ConcurrencyGate::Acquire() {
  std::unique_lock<std::mutex> lck(mutex_);
  if (in_use_ == capacity_) {
    VLOG(1) << "All " << capacity_ << " slots busy, waiting";
  }
  slot_freed_.wait(lck, [this]() { return in_use_ < capacity_; });
  in_use_++;
  peak_in_use_ = std::max(peak_in_use_, in_use_);
}

void ConcurrencyGate::Release() {
  {
    std::lock_guard<std::mutex> lck(mutex_);
    CHECK_GT(in_use_, 0u) << "Release without Acquire";
    in_use_--;
  }
  slot_freed_.notify_one();
}

size_t ConcurrencyGate::InUse() const {
  std::lock_guard<std::mutex> lck(mutex_);
  return in_use_;
}

size_t ConcurrencyGate::PeakInUse() const {
  std::lock_guard<std::mutex> lck(mutex_);
  return peak_in_use_;
}

}  // namespace executor
