#ifndef RUNNER_LIMITER_HPP
#define RUNNER_LIMITER_HPP

#include <cstddef>
#include <mutex>

#include <kj/common.h>

namespace runner {

// Bounds the number of executions that run at the same time. Requests over
// the bound are refused immediately, never queued.
class ExecutionLimiter {
 public:
  // A reserved execution slot, given back on destruction.
  class Slot {
   public:
    explicit Slot(ExecutionLimiter* limiter) : limiter_(limiter) {}
    Slot(Slot&& other) noexcept : limiter_(other.limiter_) {
      other.limiter_ = nullptr;
    }
    Slot& operator=(Slot&& other) noexcept {
      if (this != &other) {
        Reset();
        limiter_ = other.limiter_;
        other.limiter_ = nullptr;
      }
      return *this;
    }
    ~Slot() { Reset(); }
    KJ_DISALLOW_COPY(Slot);

   private:
    void Reset() {
      if (limiter_ != nullptr) limiter_->Release();
      limiter_ = nullptr;
    }
    ExecutionLimiter* limiter_;
  };

  explicit ExecutionLimiter(size_t capacity) : capacity_(capacity) {}

  // Reserves a slot, or returns nullptr if all the slots are taken.
  kj::Maybe<Slot> TryAcquire();

  size_t Capacity() const { return capacity_; }
  size_t Running() const;

  KJ_DISALLOW_COPY(ExecutionLimiter);

 private:
  void Release();

  const size_t capacity_;
  mutable std::mutex mutex_;
  size_t running_ = 0;
};

}  // namespace runner

#endif
