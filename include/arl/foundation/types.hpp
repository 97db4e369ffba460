#pragma once

/// @file types.hpp
/// @brief Clock aliases and identifiers shared by the routing layer.

#include <chrono>
#include <string>

namespace arl::foundation {

/// Monotonic clock for breaker timeouts, token refill and cooldowns.
using SteadyClock = std::chrono::steady_clock;
using SteadyTime = SteadyClock::time_point;

/// Wall clock for values shared across processes (sliding-window entries,
/// rate-limit reset headers).
using WallClock = std::chrono::system_clock;
using WallTime = WallClock::time_point;

/// Unique identifier of a registered backend instance. Also names the
/// upstream target guarded by the instance's circuit breaker.
using InstanceId = std::string;

/// Fractional seconds, the unit of response times across the layer.
using Seconds = std::chrono::duration<double>;

/// Convert a steady duration to fractional seconds.
template <typename Rep, typename Period>
[[nodiscard]] constexpr double toSeconds(std::chrono::duration<Rep, Period> d) {
    return std::chrono::duration_cast<Seconds>(d).count();
}

} // namespace arl::foundation
