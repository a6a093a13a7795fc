#include "src/tracing.h"

#include <memory>
#include <string>
#include <utility>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_format.h"

#ifdef PERFETTO_ENABLED

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

#include "perfetto/tracing/core/trace_config.h"  // IWYU pragma: keep
#include "perfetto/tracing/tracing.h"

PERFETTO_TRACK_EVENT_STATIC_STORAGE();

#endif /* PERFETTO_ENABLED */

namespace waitgroup {

#ifdef PERFETTO_ENABLED

TraceSession::TraceSession(std::unique_ptr<perfetto::TracingSession> session,
                           int fd)
    : session_(std::move(session)), fd_(fd) {}

/* static */
absl::StatusOr<std::unique_ptr<TraceSession>> TraceSession::Start(
    const std::string& trace_path) {
  int fd = open(trace_path.c_str(), O_RDWR | O_CREAT | O_TRUNC, 0600);
  if (fd < 0) {
    return absl::InternalError(absl::StrFormat(
        "Failed to open %s for writing: %s", trace_path, strerror(errno)));
  }

  perfetto::TracingInitArgs args;
  args.backends |= perfetto::kInProcessBackend;
  args.use_monotonic_clock = true;
  perfetto::Tracing::Initialize(args);
  perfetto::TrackEvent::Register();

  perfetto::protos::gen::TrackEventConfig track_event_cfg;
  track_event_cfg.add_disabled_categories("*");
  track_event_cfg.add_enabled_categories("waitgroup.*");

  perfetto::TraceConfig cfg;
  // Every worker of every round emits events, so the buffer is sized for long
  // runs rather than for a single round.
  cfg.add_buffers()->set_size_kb(256 * 1024);
  auto* ds_cfg = cfg.add_data_sources()->mutable_config();
  ds_cfg->set_name("track_event");
  ds_cfg->set_track_event_config_raw(track_event_cfg.SerializeAsString());

  std::unique_ptr<perfetto::TracingSession> session =
      perfetto::Tracing::NewTrace();
  session->Setup(cfg, fd);
  session->StartBlocking();

  return std::unique_ptr<TraceSession>(new TraceSession(std::move(session), fd));
}

TraceSession::~TraceSession() {
  perfetto::TrackEvent::Flush();
  session_->StopBlocking();
  close(fd_);
}

#else

/* static */
absl::StatusOr<std::unique_ptr<TraceSession>> TraceSession::Start(
    const std::string& trace_path) {
  return absl::FailedPreconditionError(absl::StrFormat(
      "Cannot trace to %s: built without Perfetto support", trace_path));
}

TraceSession::~TraceSession() = default;

#endif /* PERFETTO_ENABLED */

absl::Status TracedWakeChannel::Acquire() {
  TRACE_EVENT("waitgroup.sync", "WakeChannel::Acquire");
  return inner_.Acquire();
}

absl::Status TracedWakeChannel::Release() {
  TRACE_EVENT("waitgroup.sync", "WakeChannel::Release");
  return inner_.Release();
}

}  // namespace waitgroup
