#pragma once

#include <atomic>
#include <cstdint>
#include <thread>

#include "absl/status/status.h"

#include "src/wait_group.h"
#include "src/wake_channel.h"

namespace waitgroup {

// A futex wake channel which counts how many times it was acquired and
// released.
class CountingWakeChannel {
 public:
  absl::Status Acquire();
  absl::Status Release();

  uint64_t Acquires() const {
    return acquires_.load(std::memory_order_relaxed);
  }
  uint64_t Releases() const {
    return releases_.load(std::memory_order_relaxed);
  }
  uint32_t Permits() const {
    return inner_.Permits();
  }

 private:
  FutexWakeChannel inner_;
  std::atomic<uint64_t> acquires_ = 0;
  std::atomic<uint64_t> releases_ = 0;
};

// A wake channel whose operations always fail without blocking.
class FailingWakeChannel {
 public:
  absl::Status Acquire();
  absl::Status Release();
};

// A futex wake channel which, after acquiring a permit, holds the acquirer
// until `OpenGate()` is called.
class GatedWakeChannel {
 public:
  absl::Status Acquire();
  absl::Status Release();

  absl::Status OpenGate();

  // Returns the number of acquirers which have taken a permit, whether or not
  // they have passed the gate.
  uint32_t Acquired() const {
    return acquired_.load(std::memory_order_acquire);
  }

 private:
  FutexWakeChannel inner_;
  FutexWakeChannel gate_;
  std::atomic<uint32_t> acquired_ = 0;
};

using CountingWaitGroup = WaitGroupImpl<CountingWakeChannel>;

// Spins until at least `n_waiters` threads have registered in `wait_group`.
template <WakeChannelInterface WakeChannel>
void AwaitWaiters(const WaitGroupImpl<WakeChannel>& wait_group,
                  uint32_t n_waiters) {
  while (wait_group.Waiters() < n_waiters) {
    std::this_thread::yield();
  }
}

}  // namespace waitgroup
