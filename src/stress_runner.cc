#include "src/stress_runner.h"

#include <atomic>
#include <barrier>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <random>
#include <thread>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_format.h"
#include "absl/synchronization/mutex.h"
#include "absl/time/clock.h"
#include "absl/time/time.h"

#include "src/tracing.h"
#include "src/wait_group.h"

namespace waitgroup {

StressRunner::StressRunner(const StressOptions& options) : options_(options) {}

/* static */
absl::Status StressRunner::ValidateOptions(const StressOptions& options) {
  if (options.n_workers == 0) {
    return absl::InvalidArgumentError("Stress test needs at least one worker");
  }
  if (options.n_workers >
      static_cast<uint32_t>(std::numeric_limits<int32_t>::max())) {
    return absl::InvalidArgumentError(
        absl::StrFormat("Too many workers: %u", options.n_workers));
  }
  // Every worker and waiter of a round gets its own thread.
  const uint64_t n_threads =
      static_cast<uint64_t>(options.n_workers) + options.n_waiters;
  if (n_threads >
      static_cast<uint64_t>(std::numeric_limits<int32_t>::max())) {
    return absl::InvalidArgumentError(absl::StrFormat(
        "Too many threads per round: %u workers and %u waiters",
        options.n_workers, options.n_waiters));
  }
  return absl::OkStatus();
}

absl::StatusOr<StressResult> StressRunner::Run() {
  absl::Status status = ValidateOptions(options_);
  if (!status.ok()) {
    return status;
  }

  std::unique_ptr<TraceSession> trace_session;
  if (!options_.trace_path.empty()) {
    absl::StatusOr<std::unique_ptr<TraceSession>> session =
        TraceSession::Start(options_.trace_path);
    if (!session.ok()) {
      return session.status();
    }
    trace_session = std::move(session.value());
  }

  absl::Time start = absl::Now();
  for (uint64_t round = 0; round < options_.n_rounds; round++) {
    status = RunRound(round);
    if (!status.ok()) {
      return absl::Status(
          status.code(),
          absl::StrFormat("Round %d: %s", round, status.message()));
    }
  }

  return StressResult{
    .rounds = options_.n_rounds,
    .total_time = absl::Now() - start,
  };
}

absl::Status StressRunner::RunRound(uint64_t round) {
  TRACE_EVENT("waitgroup.round", "StressRunner::RunRound", "round", round);
  {
    absl::MutexLock lock(&status_lock_);
    status_ = absl::OkStatus();
  }
  n_finished_.store(0, std::memory_order_relaxed);

  // The count must be established before any worker or waiter starts.
  absl::Status status;
  {
    TRACE_EVENT("waitgroup.sync", "WaitGroup::Increment", "delta",
                options_.n_workers);
    status = wait_group_.Increment(static_cast<int32_t>(options_.n_workers));
  }
  if (!status.ok()) {
    return status;
  }

  const size_t n_threads =
      static_cast<size_t>(options_.n_workers) + options_.n_waiters;
  std::barrier start_barrier(static_cast<ptrdiff_t>(n_threads));
  std::vector<std::thread> threads;
  threads.reserve(n_threads);

  for (uint32_t i = 0; i < options_.n_waiters; i++) {
    threads.emplace_back([this, &start_barrier]() {
      start_barrier.arrive_and_wait();

      absl::Status wait_status;
      {
        TRACE_EVENT("waitgroup.sync", "WaitGroup::Wait");
        wait_status = wait_group_.Wait();
      }
      if (!wait_status.ok()) {
        RecordStatus(std::move(wait_status));
        return;
      }

      uint32_t n_finished = n_finished_.load(std::memory_order_relaxed);
      if (n_finished != options_.n_workers) {
        RecordStatus(absl::InternalError(absl::StrFormat(
            "Waiter released after only %u of %u workers finished", n_finished,
            options_.n_workers)));
      }
    });
  }

  for (uint32_t i = 0; i < options_.n_workers; i++) {
    threads.emplace_back([this, &start_barrier, round, i]() {
      start_barrier.arrive_and_wait();
      DoWork(round, i);
      n_finished_.fetch_add(1, std::memory_order_relaxed);

      TRACE_EVENT("waitgroup.sync", "WaitGroup::Decrement");
      RecordStatus(wait_group_.Decrement());
      TRACE_COUNTER("waitgroup.sync", "Outstanding workers",
                    wait_group_.Counter());
    });
  }

  // Every waiter must have returned before the wait group is reused for the
  // next round.
  for (std::thread& thread : threads) {
    thread.join();
  }

  absl::MutexLock lock(&status_lock_);
  return status_;
}

void StressRunner::DoWork(uint64_t round, uint32_t worker_idx) {
  if (options_.work_iters == 0) {
    return;
  }

  TRACE_EVENT("waitgroup.round", "StressRunner::DoWork");
  std::mt19937_64 rng = WorkerRng(options_.seed, round, worker_idx);
  std::uniform_int_distribution<uint64_t> iters_dist(0,
                                                     options_.work_iters - 1);
  uint64_t iters = iters_dist(rng);
  uint64_t acc = 0;
  for (uint64_t i = 0; i < iters; i++) {
    acc += rng();
  }
  work_sink_.fetch_add(acc, std::memory_order_relaxed);
}

/* static */
std::mt19937_64 StressRunner::WorkerRng(uint64_t seed, uint64_t round,
                                        uint32_t worker_idx) {
  std::seed_seq seq{
    static_cast<uint32_t>(seed),  static_cast<uint32_t>(seed >> 32),
    static_cast<uint32_t>(round), static_cast<uint32_t>(round >> 32),
    worker_idx,
  };
  return std::mt19937_64(seq);
}

void StressRunner::RecordStatus(absl::Status status) {
  if (status.ok()) {
    return;
  }

  absl::MutexLock lock(&status_lock_);
  if (status_.ok()) {
    status_ = std::move(status);
  }
}

}  // namespace waitgroup
