#pragma once

#include <atomic>
#include <concepts>
#include <cstdint>

#include "absl/status/status.h"

namespace waitgroup {

// A counting semaphore used to park and wake threads blocked in a wait group.
// `Acquire()` blocks until a permit is available and takes it, and `Release()`
// adds one permit, waking at most one blocked acquirer.
template <typename T>
concept WakeChannelInterface = requires(T channel) {
  { channel.Acquire() } -> std::convertible_to<absl::Status>;
  { channel.Release() } -> std::convertible_to<absl::Status>;
};

// A counting semaphore backed by a Linux futex on the permit count.
//
// Releasers only enter the kernel if some acquirer may be sleeping, so
// releasing an uncontended channel is a single atomic increment.
class FutexWakeChannel {
 public:
  FutexWakeChannel() = default;

  FutexWakeChannel(const FutexWakeChannel&) = delete;
  FutexWakeChannel& operator=(const FutexWakeChannel&) = delete;

  // Blocks until a permit is available, then takes it. Only fails if the futex
  // syscall reports an error other than a spurious wakeup.
  absl::Status Acquire();

  absl::Status Release();

  // Returns the number of permits which have been released but not yet
  // acquired.
  uint32_t Permits() const {
    return permits_.load(std::memory_order_relaxed);
  }

 private:
  // Takes a permit if one is available without blocking.
  bool TryAcquire();

  static_assert(sizeof(std::atomic<uint32_t>) == sizeof(uint32_t));
  static_assert(std::atomic<uint32_t>::is_always_lock_free);

  // The futex word.
  std::atomic<uint32_t> permits_ = 0;
  // The number of acquirers which are asleep or about to go to sleep on
  // `permits_`.
  std::atomic<uint32_t> sleepers_ = 0;
};

}  // namespace waitgroup
