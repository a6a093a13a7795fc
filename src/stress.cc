#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <random>
#include <string>

#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "absl/status/statusor.h"
#include "absl/time/time.h"

#include "src/stress_runner.h"

ABSL_FLAG(uint32_t, workers, 8,
          "The number of workers to fan out to in each round.");

ABSL_FLAG(uint32_t, waiters, 4,
          "The number of threads waiting on the wait group in each round.");

ABSL_FLAG(uint64_t, rounds, 1000, "The number of rounds to run.");

ABSL_FLAG(uint64_t, work_iters, 10000,
          "The maximum number of busy-loop iterations each worker performs "
          "before finishing.");

ABSL_FLAG(uint64_t, seed, 0,
          "Seed for the amount of work each worker does. If 0, a seed is taken "
          "from std::random_device.");

ABSL_FLAG(std::string, perfetto_out, "",
          "If set, the file to write a Perfetto trace of the run to, which can "
          "be read at https://ui.perfetto.dev. Requires a build with "
          "WAITGROUP_ENABLE_PERFETTO.");

namespace waitgroup {

StressOptions OptionsFromFlags() {
  StressOptions options{
    .n_workers = absl::GetFlag(FLAGS_workers),
    .n_waiters = absl::GetFlag(FLAGS_waiters),
    .n_rounds = absl::GetFlag(FLAGS_rounds),
    .work_iters = absl::GetFlag(FLAGS_work_iters),
    .seed = absl::GetFlag(FLAGS_seed),
    .trace_path = absl::GetFlag(FLAGS_perfetto_out),
  };

  if (options.seed == 0) {
    std::random_device rd;
    options.seed = (static_cast<uint64_t>(rd()) << 32) | rd();
  }
  return options;
}

}  // namespace waitgroup

int main(int argc, char* argv[]) {
  absl::ParseCommandLine(argc, argv);

  const waitgroup::StressOptions options = waitgroup::OptionsFromFlags();

  waitgroup::StressRunner runner(options);
  absl::StatusOr<waitgroup::StressResult> result = runner.Run();
  if (!result.ok()) {
    std::cerr << "Stress test failed (seed " << options.seed
              << "): " << result.status() << std::endl;
    return -1;
  }

  std::cout << "workers:         " << options.n_workers << std::endl;
  std::cout << "waiters:         " << options.n_waiters << std::endl;
  std::cout << "seed:            " << options.seed << std::endl;
  std::cout << "rounds:          " << result->rounds << std::endl;
  std::cout << "total time:      " << result->total_time << std::endl;
  std::cout << "mean round time: " << result->MeanRoundTime() << std::endl;

  return 0;
}
