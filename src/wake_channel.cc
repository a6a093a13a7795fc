#include "src/wake_channel.h"

#include <atomic>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <limits>
#include <linux/futex.h>
#include <sys/syscall.h>
#include <unistd.h>

#include "absl/status/status.h"
#include "absl/strings/str_format.h"

#include "src/util.h"

namespace waitgroup {

namespace {

long Futex(std::atomic<uint32_t>* word, int op, uint32_t val) {
  return syscall(SYS_futex, reinterpret_cast<uint32_t*>(word),
                 op | FUTEX_PRIVATE_FLAG, val, nullptr, nullptr, 0);
}

}  // namespace

bool FutexWakeChannel::TryAcquire() {
  uint32_t permits = permits_.load(std::memory_order_relaxed);
  while (permits != 0) {
    if (permits_.compare_exchange_weak(permits, permits - 1,
                                       std::memory_order_acquire,
                                       std::memory_order_relaxed)) {
      return true;
    }
  }
  return false;
}

absl::Status FutexWakeChannel::Acquire() {
  while (!TryAcquire()) {
    // Announce ourselves before sleeping. A releaser which increments
    // `permits_` after this point will see us and issue a wake, and one which
    // incremented it before will make the futex wait fail with EAGAIN.
    sleepers_.fetch_add(1, std::memory_order_seq_cst);
    long result = Futex(&permits_, FUTEX_WAIT, /*val=*/0);
    int err = errno;
    sleepers_.fetch_sub(1, std::memory_order_relaxed);

    if (result != 0 && err != EAGAIN && err != EINTR) {
      return absl::InternalError(
          absl::StrFormat("futex wait failed: %s", strerror(err)));
    }
  }

  return absl::OkStatus();
}

absl::Status FutexWakeChannel::Release() {
  uint32_t prev_permits = permits_.fetch_add(1, std::memory_order_seq_cst);
  WG_ASSERT_LT(prev_permits, std::numeric_limits<uint32_t>::max());

  if (sleepers_.load(std::memory_order_seq_cst) == 0) {
    return absl::OkStatus();
  }

  if (Futex(&permits_, FUTEX_WAKE, /*val=*/1) < 0) {
    return absl::InternalError(
        absl::StrFormat("futex wake failed: %s", strerror(errno)));
  }
  return absl::OkStatus();
}

}  // namespace waitgroup
