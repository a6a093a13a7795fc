#pragma once

#include <atomic>
#include <cstdint>

#include "absl/status/status.h"
#include "absl/strings/str_format.h"

#include "src/util.h"
#include "src/wait_group_state.h"
#include "src/wake_channel.h"

namespace waitgroup {

// A wait group lets any number of threads block until a dynamically sized set
// of workers have all finished.
//
// A producer calls `Increment(n)` before starting `n` workers, each worker
// calls `Decrement()` when it finishes, and any number of observers call
// `Wait()`, which returns once the count of outstanding workers reaches zero.
//
// The wait group takes no locks. All of its state is packed into one atomic
// word (see `State`), and `WakeChannel` is only used to put waiters to sleep
// and to wake them up again.
//
// A wait group may be reused for another round of work, but only after every
// `Wait()` of the previous round has returned. `Wait()` with no prior
// `Increment()` returns immediately, and a count that never reaches zero
// leaves its waiters blocked forever.
template <WakeChannelInterface WakeChannel>
class WaitGroupImpl {
  friend class WaitGroupTest;

 public:
  WaitGroupImpl() = default;

  WaitGroupImpl(const WaitGroupImpl&) = delete;
  WaitGroupImpl& operator=(const WaitGroupImpl&) = delete;

  // Adds `delta` to the count of outstanding workers. `delta` may be negative.
  // If this brings the count to zero, every thread blocked in `Wait()` is
  // released.
  //
  // Returns a `FailedPreconditionError` if the count goes negative, or if this
  // call started a new round of work while waiters from the previous round
  // were still being released. Either is a programming error, and the wait
  // group should not be used afterwards. In both cases `delta` stays applied
  // to the count. The waiters of the previous round are still released.
  absl::Status Increment(int32_t delta);

  // Marks one worker as finished.
  WG_ALWAYS_INLINE absl::Status Decrement() {
    return Increment(-1);
  }

  // Blocks until the count of outstanding workers reaches zero. Returns
  // immediately if it is already zero.
  //
  // If the wake channel fails, the error is returned and this thread stays
  // counted as a waiter. The next zero crossing then releases a permit nobody
  // takes, so the wait group must not be used after `Wait()` fails.
  absl::Status Wait();

  // The following are relaxed snapshots, only useful for diagnostics.
  int32_t Counter() const {
    return LoadState(std::memory_order_relaxed).Counter();
  }
  uint32_t Waiters() const {
    return LoadState(std::memory_order_relaxed).Waiters();
  }

  WakeChannel& Channel() {
    return channel_;
  }

 private:
  State LoadState(std::memory_order order) const {
    return State::FromEncoding(state_.load(order));
  }

  // Removes the waiters counted in `observed` from the state word and releases
  // each of them once. Must only be called by the thread which brought the
  // counter to zero.
  absl::Status ReleaseWaiters(State observed);

  std::atomic<uint64_t> state_ = State().Encoding();
  WakeChannel channel_;
};

template <WakeChannelInterface WakeChannel>
absl::Status WaitGroupImpl<WakeChannel>::Increment(int32_t delta) {
  const uint64_t encoded_delta = State::CounterDelta(delta);
  const State state = State::FromEncoding(
      state_.fetch_add(encoded_delta, std::memory_order_acq_rel) +
      encoded_delta);

  if (WG_EXPECT_FALSE(state.Counter() < 0)) {
    return absl::FailedPreconditionError(absl::StrFormat(
        "Negative wait group counter %d after increment by %d",
        state.Counter(), delta));
  }
  // Waiters can only register while the counter is nonzero, so if this call
  // moved the counter off of zero while waiters are registered, the previous
  // round is still releasing its waiters.
  if (delta > 0 && state.Counter() == delta && state.Waiters() != 0) {
    return absl::FailedPreconditionError(absl::StrFormat(
        "Wait group increment by %d raced with the release of %u waiters",
        delta, state.Waiters()));
  }
  if (state.Counter() > 0 || state.Waiters() == 0) {
    return absl::OkStatus();
  }

  return ReleaseWaiters(state);
}

template <WakeChannelInterface WakeChannel>
absl::Status WaitGroupImpl<WakeChannel>::ReleaseWaiters(State observed) {
  // The counter is zero, so no new waiters can register. The only way for the
  // state to change now is a concurrent `Increment()` starting the next round,
  // which reports the misuse itself. Its delta must survive the reset, so only
  // the waiters we are about to release are taken out of the word.
  uint64_t expected = observed.Encoding();
  if (!state_.compare_exchange_strong(expected, State().Encoding(),
                                      std::memory_order_acq_rel,
                                      std::memory_order_relaxed)) {
    state_.fetch_sub(observed.Waiters(), std::memory_order_acq_rel);
  }

  for (uint32_t i = 0; i < observed.Waiters(); i++) {
    absl::Status status = channel_.Release();
    if (!status.ok()) {
      return status;
    }
  }
  return absl::OkStatus();
}

template <WakeChannelInterface WakeChannel>
absl::Status WaitGroupImpl<WakeChannel>::Wait() {
  uint64_t encoding = state_.load(std::memory_order_acquire);
  while (true) {
    const State state = State::FromEncoding(encoding);
    if (state.Counter() == 0) {
      return absl::OkStatus();
    }

    // On failure, `encoding` is reloaded with the current state and we try
    // again.
    if (state_.compare_exchange_weak(encoding, state.WithWaiter().Encoding(),
                                     std::memory_order_acq_rel,
                                     std::memory_order_acquire)) {
      break;
    }
  }

  absl::Status status = channel_.Acquire();
  if (!status.ok()) {
    return status;
  }

  // The releaser took us out of the state before waking us, so a non-idle
  // state means someone started the next round before we returned.
  if (!LoadState(std::memory_order_acquire).Idle()) {
    return absl::FailedPreconditionError(
        "Wait group was reused before a previous Wait() returned");
  }
  return absl::OkStatus();
}

using WaitGroup = WaitGroupImpl<FutexWakeChannel>;

extern template class WaitGroupImpl<FutexWakeChannel>;

}  // namespace waitgroup
