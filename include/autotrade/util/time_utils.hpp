#pragma once

/**
 * Time utilities for the trading engine
 *
 * Monotonic timestamps for latency measurement and wall-clock
 * timestamps for anything exchanged with the outside world.
 */

#include <chrono>
#include <cstdint>

namespace autotrade {
namespace util {

/**
 * Returns current time in nanoseconds since steady_clock epoch.
 * Monotonic; use for measuring elapsed time only.
 */
inline uint64_t now_ns() {
    auto now = std::chrono::steady_clock::now();
    return std::chrono::duration_cast<std::chrono::nanoseconds>(now.time_since_epoch()).count();
}

/**
 * Returns current wall-clock time in nanoseconds since Unix epoch.
 */
inline uint64_t wall_clock_ns() {
    auto now = std::chrono::system_clock::now();
    return std::chrono::duration_cast<std::chrono::nanoseconds>(now.time_since_epoch()).count();
}

// Wall-clock milliseconds, the unit the exchange uses
inline uint64_t wall_clock_ms() {
    return wall_clock_ns() / 1000000ULL;
}

// Days since Unix epoch (UTC) for a wall-clock millisecond timestamp
inline int64_t utc_day_index(uint64_t wall_ms) {
    return static_cast<int64_t>(wall_ms / 86400000ULL);
}

/**
 * Minutes past midnight for a wall-clock timestamp shifted by a UTC offset.
 *
 * @param wall_ms        Wall-clock milliseconds since epoch
 * @param offset_minutes Offset from UTC in minutes (e.g. -300 for UTC-5)
 * @return Minute of the local day in [0, 1440)
 */
inline int minute_of_day(uint64_t wall_ms, int offset_minutes) {
    int64_t minutes = static_cast<int64_t>(wall_ms / 60000ULL) + offset_minutes;
    int64_t m = minutes % 1440;
    if (m < 0)
        m += 1440;
    return static_cast<int>(m);
}

}  // namespace util
}  // namespace autotrade
