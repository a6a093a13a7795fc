#pragma once

#include <cstdint>
#include <limits>
#include <ostream>

#include "src/util.h"

namespace waitgroup {

// A decoded snapshot of a wait group's state word. The whole state of a wait
// group lives in a single 64-bit atomic so that the counter and the waiter
// count can be read and modified together:
//
//   63                32 31                 0
//  +--------------------+--------------------+
//  |  counter (int32)   |  waiters (uint32)  |
//  +--------------------+--------------------+
//
// Adding to the counter is a plain `fetch_add` of `CounterDelta(delta)`, which
// never carries into or out of the waiter bits.
class State {
 public:
  static constexpr uint32_t kCounterShift = 32;
  static constexpr uint64_t kWaiterMask = (UINT64_C(1) << kCounterShift) - 1;

  // Constructs the idle state, with no outstanding work and no waiters.
  constexpr State() : State(0, 0) {}
  constexpr State(int32_t counter, uint32_t waiters)
      : counter_(counter), waiters_(waiters) {}

  State(const State&) = default;
  State& operator=(const State&) = default;

  static constexpr State FromEncoding(uint64_t encoding) {
    return State(static_cast<int32_t>(static_cast<uint32_t>(
                     encoding >> kCounterShift)),
                 static_cast<uint32_t>(encoding & kWaiterMask));
  }

  // Returns the value to atomically add to an encoded state word to change its
  // counter by `delta`. Negative deltas wrap around in the unsigned word, which
  // leaves the low waiter bits untouched.
  static constexpr uint64_t CounterDelta(int32_t delta) {
    return static_cast<uint64_t>(static_cast<int64_t>(delta)) << kCounterShift;
  }

  constexpr uint64_t Encoding() const {
    return (static_cast<uint64_t>(static_cast<uint32_t>(counter_))
            << kCounterShift) |
           static_cast<uint64_t>(waiters_);
  }

  constexpr int32_t Counter() const {
    return counter_;
  }

  constexpr uint32_t Waiters() const {
    return waiters_;
  }

  constexpr bool Idle() const {
    return counter_ == 0 && waiters_ == 0;
  }

  // Returns this state with one more registered waiter.
  State WithWaiter() const {
    WG_ASSERT_LT(waiters_, std::numeric_limits<uint32_t>::max());
    return State(counter_, waiters_ + 1);
  }

  bool operator==(const State& state) const {
    return counter_ == state.counter_ && waiters_ == state.waiters_;
  }
  bool operator!=(const State& state) const {
    return !(*this == state);
  }

 private:
  // The number of workers which have not yet finished.
  int32_t counter_;
  // The number of threads blocked in `Wait()`.
  uint32_t waiters_;
};

inline std::ostream& operator<<(std::ostream& ostr, const State& state) {
  return ostr << "[counter=" << state.Counter()
              << ", waiters=" << state.Waiters() << "]";
}

}  // namespace waitgroup
