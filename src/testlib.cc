#include "src/testlib.h"

#include "absl/status/status.h"

namespace waitgroup {

absl::Status CountingWakeChannel::Acquire() {
  absl::Status status = inner_.Acquire();
  if (status.ok()) {
    acquires_.fetch_add(1, std::memory_order_relaxed);
  }
  return status;
}

absl::Status CountingWakeChannel::Release() {
  releases_.fetch_add(1, std::memory_order_relaxed);
  return inner_.Release();
}

absl::Status GatedWakeChannel::Acquire() {
  absl::Status status = inner_.Acquire();
  if (!status.ok()) {
    return status;
  }
  acquired_.fetch_add(1, std::memory_order_release);
  return gate_.Acquire();
}

absl::Status GatedWakeChannel::Release() {
  return inner_.Release();
}

absl::Status GatedWakeChannel::OpenGate() {
  return gate_.Release();
}

absl::Status FailingWakeChannel::Acquire() {
  return absl::InternalError("FailingWakeChannel::Acquire");
}

absl::Status FailingWakeChannel::Release() {
  return absl::InternalError("FailingWakeChannel::Release");
}

}  // namespace waitgroup
