#include "backoff.hpp"

namespace millsync::sync {

std::chrono::minutes BackoffDelay(uint32_t retry_count) {
  // 2^6 already exceeds the cap; avoids shifting past the width of the type
  if (retry_count >= 6) {
    return kMaxBackoff;
  }

  const std::chrono::minutes delay{int64_t{1} << retry_count};
  if (delay < kMinBackoff) return kMinBackoff;
  if (delay > kMaxBackoff) return kMaxBackoff;
  return delay;
}

} // namespace millsync::sync
