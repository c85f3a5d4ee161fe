#ifndef EXECUTOR_CONCURRENCY_GATE_HPP
#define EXECUTOR_CONCURRENCY_GATE_HPP

#include <condition_variable>
#include <cstddef>
#include <mutex>

namespace executor {

// Counting semaphore that bounds the number of runs executing at the same
// time. Callers that find no free slot wait until one is released; there is
// no limit on the number of waiting callers.
class ConcurrencyGate {
 public:
  explicit ConcurrencyGate(size_t capacity);

  // Blocks the calling thread until a slot is available, then takes it.
  void Acquire();
  // Returns a slot taken by Acquire.
  void Release();

  size_t Capacity() const { return capacity_; }
  size_t InUse() const;
  // Highest number of slots that were ever taken at the same time.
  size_t PeakInUse() const;

  // Holds a slot for its lifetime.
  class Slot {
   public:
    explicit Slot(ConcurrencyGate* gate) : gate_(gate) { gate_->Acquire(); }
    ~Slot() { gate_->Release(); }
    Slot(const Slot&) = delete;
    Slot& operator=(const Slot&) = delete;
    Slot(Slot&&) = delete;
    Slot& operator=(Slot&&) = delete;

   private:
    ConcurrencyGate* gate_;
  };

  ConcurrencyGate(const ConcurrencyGate&) = delete;
  ConcurrencyGate& operator=(const ConcurrencyGate&) = delete;
  ConcurrencyGate(ConcurrencyGate&&) = delete;
  ConcurrencyGate& operator=(ConcurrencyGate&&) = delete;

 private:
  const size_t capacity_;
  size_t in_use_ = 0;
  size_t peak_in_use_ = 0;
  mutable std::mutex mutex_;
  std::condition_variable slot_freed_;
};

}  // namespace executor

#endif
