#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace autotrade {
namespace strategy {

enum class BreakoutDirection : uint8_t { None, Long, Short, Conflict };

inline const char* breakout_to_string(BreakoutDirection dir) {
    switch (dir) {
    case BreakoutDirection::Long:
        return "LONG";
    case BreakoutDirection::Short:
        return "SHORT";
    case BreakoutDirection::Conflict:
        return "CONFLICT";
    default:
        return "NONE";
    }
}

/**
 * Pick one direction when breakout conditions fire.
 *
 * With both sides active the side that is further past its level wins
 * (price - long_level vs short_level - price). An exact tie is CONFLICT,
 * which callers must treat as no trade.
 */
inline BreakoutDirection resolve_breakout(double price, double long_level, double short_level, bool long_active,
                                          bool short_active) {
    if (long_active && !short_active)
        return BreakoutDirection::Long;
    if (short_active && !long_active)
        return BreakoutDirection::Short;
    if (!long_active && !short_active)
        return BreakoutDirection::None;

    double long_distance = price - long_level;
    double short_distance = short_level - price;
    if (long_distance > short_distance)
        return BreakoutDirection::Long;
    if (short_distance > long_distance)
        return BreakoutDirection::Short;
    return BreakoutDirection::Conflict;
}

struct BreakoutLevels {
    double long_level = 0.0;  // previous high + margin
    double short_level = 0.0; // previous low - margin
};

/**
 * Levels from the range of the `lookback` closes before the current one.
 * margin 0.01 puts the levels 1% beyond the previous high and low.
 */
inline BreakoutLevels breakout_levels(const std::vector<double>& closes, size_t lookback = 20, double margin = 0.01) {
    BreakoutLevels levels;
    if (closes.size() < 2)
        return levels;

    size_t end = closes.size() - 1; // exclude the current close
    size_t begin = end > lookback ? end - lookback : 0;
    auto [lo, hi] = std::minmax_element(closes.begin() + begin, closes.begin() + end);
    levels.long_level = *hi * (1.0 + margin);
    levels.short_level = *lo * (1.0 - margin);
    return levels;
}

}  // namespace strategy
}  // namespace autotrade
