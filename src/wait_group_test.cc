#include "src/wait_group.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>
#include <thread>
#include <vector>

#include "absl/status/status.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include "src/testlib.h"
#include "src/wait_group_state.h"

namespace waitgroup {

using ::testing::HasSubstr;

class WaitGroupTest : public ::testing::Test {
 public:
  CountingWaitGroup& WaitGroup() {
    return wait_group_;
  }

  uint64_t Releases() {
    return wait_group_.Channel().Releases();
  }

  // Releases the waiters counted in `observed` as the thread which brought
  // the counter to zero would.
  absl::Status ReleaseWaiters(State observed) {
    return wait_group_.ReleaseWaiters(observed);
  }

  // Starts `n_waiters` threads which each call `Wait()` once and then
  // increment `n_returned`. Does not return until all of them have registered
  // as waiters.
  void StartWaiters(uint32_t n_waiters, std::atomic<uint32_t>& n_returned) {
    for (uint32_t i = 0; i < n_waiters; i++) {
      threads_.emplace_back([this, &n_returned]() {
        EXPECT_TRUE(wait_group_.Wait().ok());
        n_returned.fetch_add(1, std::memory_order_acq_rel);
      });
    }
    AwaitWaiters(wait_group_, n_waiters);
  }

  void JoinAll() {
    for (std::thread& thread : threads_) {
      thread.join();
    }
    threads_.clear();
  }

  void TearDown() override {
    JoinAll();
  }

 private:
  CountingWaitGroup wait_group_;
  std::vector<std::thread> threads_;
};

TEST_F(WaitGroupTest, TestEmpty) {
  EXPECT_EQ(WaitGroup().Counter(), 0);
  EXPECT_EQ(WaitGroup().Waiters(), 0);
  EXPECT_TRUE(WaitGroup().Wait().ok());
  EXPECT_EQ(Releases(), 0);
}

TEST_F(WaitGroupTest, TestIncrementDecrement) {
  EXPECT_TRUE(WaitGroup().Increment(3).ok());
  EXPECT_EQ(WaitGroup().Counter(), 3);
  EXPECT_TRUE(WaitGroup().Decrement().ok());
  EXPECT_TRUE(WaitGroup().Increment(-2).ok());
  EXPECT_EQ(WaitGroup().Counter(), 0);
  EXPECT_EQ(Releases(), 0);
}

TEST_F(WaitGroupTest, TestWaitAfterDone) {
  ASSERT_TRUE(WaitGroup().Increment(1).ok());
  ASSERT_TRUE(WaitGroup().Decrement().ok());

  EXPECT_TRUE(WaitGroup().Wait().ok());
  EXPECT_EQ(WaitGroup().Waiters(), 0);
  EXPECT_EQ(WaitGroup().Channel().Acquires(), 0);
}

TEST_F(WaitGroupTest, TestDecrementWithoutIncrement) {
  absl::Status status = WaitGroup().Decrement();
  EXPECT_EQ(status.code(), absl::StatusCode::kFailedPrecondition);
  EXPECT_THAT(std::string(status.message()), HasSubstr("Negative"));
}

TEST_F(WaitGroupTest, TestTooManyDecrements) {
  ASSERT_TRUE(WaitGroup().Increment(2).ok());
  EXPECT_TRUE(WaitGroup().Decrement().ok());
  EXPECT_TRUE(WaitGroup().Decrement().ok());
  EXPECT_EQ(WaitGroup().Decrement().code(),
            absl::StatusCode::kFailedPrecondition);
}

TEST_F(WaitGroupTest, TestNegativeIncrement) {
  ASSERT_TRUE(WaitGroup().Increment(4).ok());
  EXPECT_EQ(WaitGroup().Increment(-5).code(),
            absl::StatusCode::kFailedPrecondition);
}

TEST_F(WaitGroupTest, TestWaitBlocksUntilAllDone) {
  ASSERT_TRUE(WaitGroup().Increment(2).ok());

  std::atomic<uint32_t> n_returned = 0;
  StartWaiters(1, n_returned);

  std::vector<std::thread> workers;
  for (uint32_t i = 0; i < 2; i++) {
    workers.emplace_back([this, i]() {
      std::this_thread::sleep_for(std::chrono::milliseconds(10 * (i + 1)));
      EXPECT_TRUE(WaitGroup().Decrement().ok());
    });
  }

  workers[0].join();
  EXPECT_EQ(n_returned.load(std::memory_order_acquire), 0);
  workers[1].join();

  JoinAll();
  EXPECT_EQ(n_returned.load(std::memory_order_acquire), 1);
  EXPECT_EQ(Releases(), 1);
  EXPECT_EQ(WaitGroup().Channel().Acquires(), 1);
}

TEST_F(WaitGroupTest, TestReleaseEveryWaiterOnce) {
  ASSERT_TRUE(WaitGroup().Increment(1).ok());

  std::atomic<uint32_t> n_returned = 0;
  StartWaiters(3, n_returned);
  EXPECT_EQ(WaitGroup().Waiters(), 3);
  EXPECT_EQ(n_returned.load(std::memory_order_acquire), 0);

  ASSERT_TRUE(WaitGroup().Decrement().ok());
  JoinAll();

  EXPECT_EQ(n_returned.load(std::memory_order_acquire), 3);
  EXPECT_EQ(Releases(), 3);
  EXPECT_EQ(WaitGroup().Channel().Acquires(), 3);
  EXPECT_EQ(WaitGroup().Channel().Permits(), 0);
  EXPECT_EQ(WaitGroup().Counter(), 0);
  EXPECT_EQ(WaitGroup().Waiters(), 0);
}

TEST_F(WaitGroupTest, TestNoneReturnBeforeLastWorker) {
  constexpr uint32_t kWorkers = 16;
  constexpr uint32_t kWaiters = 8;

  ASSERT_TRUE(WaitGroup().Increment(kWorkers).ok());
  std::atomic<uint32_t> n_finished = 0;
  std::atomic<uint32_t> n_early = 0;

  std::vector<std::thread> threads;
  for (uint32_t i = 0; i < kWaiters; i++) {
    threads.emplace_back([this, &n_finished, &n_early]() {
      EXPECT_TRUE(WaitGroup().Wait().ok());
      if (n_finished.load(std::memory_order_relaxed) != kWorkers) {
        n_early.fetch_add(1, std::memory_order_relaxed);
      }
    });
  }
  for (uint32_t i = 0; i < kWorkers; i++) {
    threads.emplace_back([this, &n_finished]() {
      n_finished.fetch_add(1, std::memory_order_relaxed);
      EXPECT_TRUE(WaitGroup().Decrement().ok());
    });
  }

  for (std::thread& thread : threads) {
    thread.join();
  }
  EXPECT_EQ(n_early.load(), 0);
  EXPECT_EQ(WaitGroup().Counter(), 0);
  EXPECT_EQ(WaitGroup().Waiters(), 0);
  EXPECT_EQ(Releases(), WaitGroup().Channel().Acquires());
}

TEST_F(WaitGroupTest, TestReuse) {
  for (uint32_t round = 0; round < 10; round++) {
    ASSERT_TRUE(WaitGroup().Increment(2).ok());

    std::atomic<uint32_t> n_returned = 0;
    StartWaiters(2, n_returned);

    ASSERT_TRUE(WaitGroup().Decrement().ok());
    ASSERT_TRUE(WaitGroup().Decrement().ok());
    JoinAll();

    EXPECT_EQ(n_returned.load(std::memory_order_acquire), 2);
    EXPECT_EQ(Releases(), 2 * (round + 1));
    EXPECT_EQ(WaitGroup().Counter(), 0);
    EXPECT_EQ(WaitGroup().Waiters(), 0);
  }
}

TEST_F(WaitGroupTest, TestConcurrentIncrements) {
  constexpr uint32_t kThreads = 8;
  constexpr uint32_t kOpsPerThread = 1000;

  // Hold the count above zero so no increment is ever the last.
  ASSERT_TRUE(WaitGroup().Increment(1).ok());

  std::vector<std::thread> threads;
  for (uint32_t i = 0; i < kThreads; i++) {
    threads.emplace_back([this]() {
      for (uint32_t j = 0; j < kOpsPerThread; j++) {
        ASSERT_TRUE(WaitGroup().Increment(1).ok());
        ASSERT_TRUE(WaitGroup().Decrement().ok());
      }
    });
  }
  for (std::thread& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(WaitGroup().Counter(), 1);
  ASSERT_TRUE(WaitGroup().Decrement().ok());
  EXPECT_TRUE(WaitGroup().Wait().ok());
}

TEST_F(WaitGroupTest, TestNextRoundStartedBeforeReset) {
  ASSERT_TRUE(WaitGroup().Increment(1).ok());

  absl::Status wait_status;
  std::thread waiter(
      [this, &wait_status]() { wait_status = WaitGroup().Wait(); });
  AwaitWaiters(WaitGroup(), 1);

  // The last worker observed [counter=0, waiters=1], but before it could reset
  // the state word another thread already incremented the counter for the
  // next round.
  EXPECT_TRUE(ReleaseWaiters(State(0, 1)).ok());
  waiter.join();

  EXPECT_EQ(Releases(), 1);
  EXPECT_EQ(WaitGroup().Counter(), 1);
  EXPECT_EQ(WaitGroup().Waiters(), 0);
  // The waiter was released into a round which had already started.
  EXPECT_EQ(wait_status.code(), absl::StatusCode::kFailedPrecondition);

  EXPECT_TRUE(WaitGroup().Decrement().ok());
  EXPECT_EQ(WaitGroup().Counter(), 0);
  EXPECT_EQ(Releases(), 1);
}

TEST(RacingWaitGroupTest, TestIncrementRacingLastDecrement) {
  constexpr uint32_t kIterations = 2000;

  for (uint32_t i = 0; i < kIterations; i++) {
    CountingWaitGroup wait_group;
    ASSERT_TRUE(wait_group.Increment(1).ok());

    absl::Status wait_status;
    std::thread waiter(
        [&wait_group, &wait_status]() { wait_status = wait_group.Wait(); });
    AwaitWaiters(wait_group, 1);

    std::atomic<bool> decremented = false;
    absl::Status decrement_status;
    absl::Status increment_status;
    std::thread last_worker([&]() {
      decrement_status = wait_group.Decrement();
      decremented.store(true, std::memory_order_release);
    });
    std::thread next_round([&]() {
      // Start the next round as soon as the counter reaches zero, possibly
      // before the last worker has released the waiter.
      while (wait_group.Counter() != 0 &&
             !decremented.load(std::memory_order_acquire)) {
        std::this_thread::yield();
      }
      increment_status = wait_group.Increment(1);
    });

    last_worker.join();
    next_round.join();
    waiter.join();

    EXPECT_TRUE(decrement_status.ok()) << decrement_status;
    EXPECT_TRUE(increment_status.ok() ||
                increment_status.code() ==
                    absl::StatusCode::kFailedPrecondition)
        << increment_status;
    EXPECT_TRUE(wait_status.ok() ||
                wait_status.code() == absl::StatusCode::kFailedPrecondition)
        << wait_status;
    EXPECT_EQ(wait_group.Channel().Releases(), 1);
    EXPECT_EQ(wait_group.Counter(), 1);
    EXPECT_EQ(wait_group.Waiters(), 0);
    ASSERT_TRUE(wait_group.Decrement().ok());
  }
}

TEST(GatedWaitGroupTest, TestReuseBeforeWaitReturns) {
  WaitGroupImpl<GatedWakeChannel> wait_group;
  ASSERT_TRUE(wait_group.Increment(1).ok());

  absl::Status wait_status;
  std::thread waiter(
      [&wait_group, &wait_status]() { wait_status = wait_group.Wait(); });
  AwaitWaiters(wait_group, 1);

  ASSERT_TRUE(wait_group.Decrement().ok());
  // The waiter has been woken up, but is held inside `Wait()`.
  while (wait_group.Channel().Acquired() == 0) {
    std::this_thread::yield();
  }

  // Starting the next round now is a misuse which the waiter reports.
  EXPECT_TRUE(wait_group.Increment(1).ok());
  EXPECT_TRUE(wait_group.Channel().OpenGate().ok());
  waiter.join();

  EXPECT_EQ(wait_status.code(), absl::StatusCode::kFailedPrecondition);
  EXPECT_THAT(std::string(wait_status.message()), HasSubstr("reused"));
  EXPECT_TRUE(wait_group.Decrement().ok());
}

class FailingWaitGroupTest : public ::testing::Test {
 public:
  WaitGroupImpl<FailingWakeChannel>& WaitGroup() {
    return wait_group_;
  }

 private:
  WaitGroupImpl<FailingWakeChannel> wait_group_;
};

TEST_F(FailingWaitGroupTest, TestAcquireErrorPropagates) {
  ASSERT_TRUE(WaitGroup().Increment(1).ok());
  absl::Status status = WaitGroup().Wait();
  EXPECT_EQ(status.code(), absl::StatusCode::kInternal);
  // The failed waiter is never taken back out of the state word.
  EXPECT_EQ(WaitGroup().Waiters(), 1);
  EXPECT_EQ(WaitGroup().Counter(), 1);
}

TEST_F(FailingWaitGroupTest, TestReleaseErrorPropagates) {
  ASSERT_TRUE(WaitGroup().Increment(1).ok());
  // Registers a waiter, whose acquire then fails.
  ASSERT_EQ(WaitGroup().Wait().code(), absl::StatusCode::kInternal);

  absl::Status status = WaitGroup().Decrement();
  EXPECT_EQ(status.code(), absl::StatusCode::kInternal);
  EXPECT_EQ(WaitGroup().Counter(), 0);
  EXPECT_EQ(WaitGroup().Waiters(), 0);
}

TEST_F(FailingWaitGroupTest, TestNoReleaseWithoutWaiters) {
  ASSERT_TRUE(WaitGroup().Increment(1).ok());
  EXPECT_TRUE(WaitGroup().Decrement().ok());
}

}  // namespace waitgroup
