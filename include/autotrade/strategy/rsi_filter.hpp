#pragma once

#include "../config/trading_config.hpp"
#include "../types.hpp"
#include "technical_indicators.hpp"

#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>

namespace autotrade {
namespace strategy {

enum class RsiFilterMode : uint8_t {
    Normal, // both timeframes must pass
    Reduced // only the 5m threshold is checked
};

inline RsiFilterMode rsi_filter_mode_from_string(const std::string& s) {
    return (s == "reduced" || s == "REDUCED") ? RsiFilterMode::Reduced : RsiFilterMode::Normal;
}

struct RsiFilterResult {
    bool valid = true;
    double rsi_5m = 0.0;
    double rsi_1h = 0.0;
    std::string message;
};

/**
 * RsiFilter - entry confirmation on two timeframes.
 *
 * LONG  passes when RSI 5m < long_5m  (and RSI 1h < long_1h in normal mode)
 * SHORT passes when RSI 5m > short_5m (and RSI 1h > short_1h in normal mode)
 *
 * A disabled filter always passes.
 */
class RsiFilter {
public:
    explicit RsiFilter(config::RsiFilterConfig config = {})
        : config_(std::move(config))
        , mode_(rsi_filter_mode_from_string(config_.mode)) {}

    bool enabled() const { return config_.enabled; }
    RsiFilterMode mode() const { return mode_; }

    RsiFilterResult check(Side direction, const std::vector<double>& closes_5m, const std::vector<double>& closes_1h,
                          int period = config::strategy::RSI_PERIOD) const {
        if (!config_.enabled) {
            return RsiFilterResult{true, 0.0, 0.0, "RSI Filter disabled"};
        }
        size_t needed = static_cast<size_t>(period);
        if (closes_5m.size() < needed || (mode_ == RsiFilterMode::Normal && closes_1h.size() < needed)) {
            return RsiFilterResult{false, 0.0, 0.0, "Unable to calculate RSI values"};
        }
        double r5 = rsi(closes_5m, period);
        double r1h = closes_1h.size() >= needed ? rsi(closes_1h, period) : 0.0;
        return check_values(direction, r5, r1h);
    }

    RsiFilterResult check_values(Side direction, double rsi_5m, double rsi_1h) const {
        RsiFilterResult result;
        result.rsi_5m = rsi_5m;
        result.rsi_1h = rsi_1h;
        if (!config_.enabled) {
            result.message = "RSI Filter disabled";
            return result;
        }

        char buffer[160];
        bool is_long = direction == Side::Buy;
        double t5 = is_long ? config_.long_5m : config_.short_5m;
        double t1h = is_long ? config_.long_1h : config_.short_1h;

        if (mode_ == RsiFilterMode::Reduced) {
            result.valid = is_long ? rsi_5m < t5 : rsi_5m > t5;
            std::snprintf(buffer, sizeof(buffer), "Reduced mode %s: RSI 5m (%.2f) %s %.0f", is_long ? "LONG" : "SHORT",
                          rsi_5m, is_long ? "<" : ">", t5);
        } else {
            result.valid = is_long ? (rsi_5m < t5 && rsi_1h < t1h) : (rsi_5m > t5 && rsi_1h > t1h);
            std::snprintf(buffer, sizeof(buffer), "Normal mode %s: RSI 5m (%.2f) %s %.0f AND RSI 1h (%.2f) %s %.0f",
                          is_long ? "LONG" : "SHORT", rsi_5m, is_long ? "<" : ">", t5, rsi_1h, is_long ? "<" : ">",
                          t1h);
        }
        result.message = buffer;
        return result;
    }

private:
    config::RsiFilterConfig config_;
    RsiFilterMode mode_;
};

}  // namespace strategy
}  // namespace autotrade
