#pragma once

#include <atomic>
#include <cstdint>
#include <random>
#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/synchronization/mutex.h"
#include "absl/time/time.h"

#include "src/tracing.h"
#include "src/util.h"
#include "src/wait_group.h"

namespace waitgroup {

struct StressOptions {
  // Number of workers started in each round, each of which decrements the wait
  // group once.
  uint32_t n_workers = 8;
  // Number of threads calling `Wait()` in each round.
  uint32_t n_waiters = 4;
  uint64_t n_rounds = 100;
  // Upper bound on the number of busy-loop iterations a worker performs before
  // finishing. Each worker picks a random amount in [0, work_iters).
  uint64_t work_iters = 1000;
  uint64_t seed = 0;
  // If set, a Perfetto trace of the run is written to this file.
  std::string trace_path;
};

struct StressResult {
  uint64_t rounds;
  absl::Duration total_time;

  absl::Duration MeanRoundTime() const {
    return rounds == 0 ? absl::ZeroDuration() : total_time / rounds;
  }
};

// Repeatedly fans out a set of workers and fans them back in on a single wait
// group, checking that no waiter is ever released before every worker of its
// round has finished.
class StressRunner {
 public:
  explicit StressRunner(const StressOptions& options);

  StressRunner(const StressRunner&) = delete;
  StressRunner& operator=(const StressRunner&) = delete;

  // Runs all rounds, stopping at the first round which fails.
  absl::StatusOr<StressResult> Run();

  // Returns the generator which decides how much work worker `worker_idx` of
  // `round` does. Equal arguments always give the same sequence.
  static std::mt19937_64 WorkerRng(uint64_t seed, uint64_t round,
                                   uint32_t worker_idx);

 private:
  static absl::Status ValidateOptions(const StressOptions& options);

  absl::Status RunRound(uint64_t round);

  // Performs a random amount of busy work for worker `worker_idx` of `round`.
  void DoWork(uint64_t round, uint32_t worker_idx);

  // Records `status` if it is the first failure of the current round.
  void RecordStatus(absl::Status status) WG_LOCKS_EXCLUDED(status_lock_);

  const StressOptions options_;
  WaitGroupImpl<TracedWakeChannel> wait_group_;
  // The number of workers in the current round which have finished their work.
  std::atomic<uint32_t> n_finished_ = 0;
  // Sink for the results of `DoWork()` so it isn't optimized out.
  std::atomic<uint64_t> work_sink_ = 0;

  absl::Mutex status_lock_;
  absl::Status status_ WG_GUARDED_BY(status_lock_);
};

}  // namespace waitgroup
