#include "runner/limiter.hpp"

#include <kj/debug.h>

namespace runner {

kj::Maybe<ExecutionLimiter::Slot> ExecutionLimiter::TryAcquire() {
  std::lock_guard<std::mutex> lck(mutex_);
  if (running_ >= capacity_) return nullptr;
  running_++;
  return Slot(this);
}

size_t ExecutionLimiter::Running() const {
  std::lock_guard<std::mutex> lck(mutex_);
  return running_;
}

void ExecutionLimiter::Release() {
  std::lock_guard<std::mutex> lck(mutex_);
  KJ_ASSERT(running_ > 0);
  running_--;
}

}  // namespace runner
