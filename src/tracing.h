#pragma once

#include <memory>
#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"

#include "src/wake_channel.h"

#ifdef PERFETTO_ENABLED

#include "perfetto/tracing/tracing.h"
#include "perfetto/tracing/track_event.h"

PERFETTO_DEFINE_CATEGORIES(
    perfetto::Category("waitgroup.round")
        .SetDescription("Stress rounds, from fan-out to the final join"),
    perfetto::Category("waitgroup.sync")
        .SetDescription("Wait group updates and wake channel traffic"));

#else

#define TRACE_EVENT(category, name, ...)
#define TRACE_COUNTER(category, track, ...)

#endif

namespace waitgroup {

// Records a Perfetto trace of every round the stress driver runs, written to
// a file when the session is destroyed.
class TraceSession {
 public:
  // Starts recording to `trace_path`. Fails if the file cannot be created, or
  // if tracing was not compiled in with `PERFETTO_ENABLED`.
  static absl::StatusOr<std::unique_ptr<TraceSession>> Start(
      const std::string& trace_path);

  ~TraceSession();

  TraceSession(const TraceSession&) = delete;
  TraceSession& operator=(const TraceSession&) = delete;

 private:
#ifdef PERFETTO_ENABLED
  TraceSession(std::unique_ptr<perfetto::TracingSession> session, int fd);

  std::unique_ptr<perfetto::TracingSession> session_;
  int fd_;
#endif
};

// A futex wake channel which emits a trace slice around every acquire and
// release, so that parked waiters and their wakeups show up in the trace.
class TracedWakeChannel {
 public:
  absl::Status Acquire();
  absl::Status Release();

 private:
  FutexWakeChannel inner_;
};

}  // namespace waitgroup
