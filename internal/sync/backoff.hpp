#pragma once

#include <chrono>
#include <cstdint>

namespace millsync::sync {

constexpr std::chrono::minutes kMinBackoff{1};
constexpr std::chrono::minutes kMaxBackoff{60};

// clamp(2^retry_count, 1, 60) minutes; non-decreasing in retry_count.
std::chrono::minutes BackoffDelay(uint32_t retry_count);

} // namespace millsync::sync
