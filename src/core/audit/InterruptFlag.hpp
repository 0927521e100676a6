#pragma once
#include <atomic>

namespace fixity {

// Set once when the operator asks the run to stop. Written from a signal
// handler, so it must stay a lock-free atomic.
class InterruptFlag {
public:
  void set() noexcept { set_.store(true, std::memory_order_relaxed); }
  bool isSet() const noexcept { return set_.load(std::memory_order_relaxed); }

private:
  std::atomic<bool> set_{false};
};

} // namespace fixity
