// === Core Types ==============================================================
//
// Collects shared clock and duration aliases used throughout the execution
// core (pool bookkeeping, deadlines, result timestamps).

#pragma once

#include <chrono>
#include <cmath>

namespace remote_fleet {

/**
 * @brief Alias for the monotonic clock used for deadlines and session ages.
 */
using SteadyClock = std::chrono::steady_clock;

/**
 * @brief Alias for timestamps captured from the steady clock.
 */
using TimePoint = std::chrono::time_point<SteadyClock>;

/**
 * @brief Alias for the wall clock used to stamp results and reports.
 */
using SystemClock = std::chrono::system_clock;

/**
 * @brief Alias for wall-clock timestamps.
 */
using WallTime = std::chrono::time_point<SystemClock>;

/**
 * @brief Alias for durations measured in seconds with double precision.
 */
using Duration = std::chrono::duration<double>;

/**
 * @brief Upper bound for every configured timeout, delay or interval (one year).
 */
inline constexpr Duration k_max_duration{Duration{365.0 * 24.0 * 3600.0}};

/**
 * @brief True for a finite duration in (0, k_max_duration].
 */
inline bool is_valid_duration(Duration duration) {
    return std::isfinite(duration.count()) && duration.count() > 0.0 && duration <= k_max_duration;
}

/**
 * @brief Convert a double-precision duration into the steady clock's tick type.
 *
 * NaN and non-positive values map to zero; anything above k_max_duration,
 * infinity included, is clamped to it.
 */
inline SteadyClock::duration to_steady_duration(Duration duration) {
    const double seconds = duration.count();
    if (std::isnan(seconds) || seconds <= 0.0) {
        return SteadyClock::duration::zero();
    }
    if (seconds >= k_max_duration.count()) {
        return std::chrono::duration_cast<SteadyClock::duration>(k_max_duration);
    }
    return std::chrono::duration_cast<SteadyClock::duration>(duration);
}

}  // namespace remote_fleet
