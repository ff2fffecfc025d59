#pragma once

#include "../config/trading_config.hpp"
#include "../util/time_utils.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace autotrade {
namespace execution {

/**
 * Daily trading window in a fixed UTC offset.
 *
 *   start "19:30", end "01:30", timezone "UTC-5"
 *
 * A window whose start is after its end wraps past midnight. Both ends are
 * inclusive.
 */
struct TradingWindow {
    int start_minute = 0; // minutes past local midnight
    int end_minute = 0;
    int offset_minutes = 0; // local = UTC + offset

    bool contains(uint64_t wall_ms) const {
        int now = util::minute_of_day(wall_ms, offset_minutes);
        if (start_minute > end_minute) {
            return now >= start_minute || now <= end_minute;
        }
        return now >= start_minute && now <= end_minute;
    }
};

/// "HH:MM" -> minutes past midnight
inline std::optional<int> parse_hhmm(const std::string& s) {
    auto colon = s.find(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 >= s.size())
        return std::nullopt;
    try {
        size_t used_h = 0;
        size_t used_m = 0;
        int h = std::stoi(s.substr(0, colon), &used_h);
        int m = std::stoi(s.substr(colon + 1), &used_m);
        if (used_h != colon || used_m != s.size() - colon - 1)
            return std::nullopt;
        if (h < 0 || h > 23 || m < 0 || m > 59)
            return std::nullopt;
        return h * 60 + m;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

/// "UTC", "UTC+8", "UTC-5", "UTC+5:30" -> offset in minutes
inline std::optional<int> parse_utc_offset(const std::string& tz) {
    if (tz == "UTC" || tz == "utc")
        return 0;
    if (tz.size() < 5 || (tz.compare(0, 3, "UTC") != 0 && tz.compare(0, 3, "utc") != 0))
        return std::nullopt;

    char sign = tz[3];
    if (sign != '+' && sign != '-')
        return std::nullopt;

    std::string rest = tz.substr(4);
    int hours = 0;
    int minutes = 0;
    auto colon = rest.find(':');
    try {
        size_t used = 0;
        if (colon == std::string::npos) {
            hours = std::stoi(rest, &used);
            if (used != rest.size())
                return std::nullopt;
        } else {
            auto hm = parse_hhmm(rest);
            if (!hm)
                return std::nullopt;
            hours = *hm / 60;
            minutes = *hm % 60;
        }
    } catch (const std::exception&) {
        return std::nullopt;
    }
    if (hours > 14)
        return std::nullopt;

    int offset = hours * 60 + minutes;
    return sign == '-' ? -offset : offset;
}

/**
 * Build the window from config.
 * @return nullopt with `error` set when any field does not parse
 */
inline std::optional<TradingWindow> parse_trading_window(const config::TradingHoursConfig& cfg, std::string& error) {
    auto start = parse_hhmm(cfg.start);
    auto end = parse_hhmm(cfg.end);
    auto offset = parse_utc_offset(cfg.timezone);
    if (!start || !end) {
        error = "Invalid trading hours '" + cfg.start + "'-'" + cfg.end + "'";
        return std::nullopt;
    }
    if (!offset) {
        error = "Invalid timezone '" + cfg.timezone + "'";
        return std::nullopt;
    }
    return TradingWindow{*start, *end, *offset};
}

}  // namespace execution
}  // namespace autotrade
