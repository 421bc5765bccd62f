// Tally Clock - monotonic nanosecond timestamps

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

namespace tally::core {

/// Source of monotonic timestamps in nanoseconds (injectable for tests)
using NanoClock = std::function<int64_t()>;

/// steady_clock now, in nanoseconds since an unspecified epoch
[[nodiscard]] inline int64_t monotonic_nanos() noexcept {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(
               std::chrono::steady_clock::now().time_since_epoch())
        .count();
}

}  // namespace tally::core
