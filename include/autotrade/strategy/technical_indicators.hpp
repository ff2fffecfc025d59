#pragma once

#include <vector>

namespace autotrade {
namespace strategy {

/**
 * Technical indicators over a closed price/volume series.
 *
 * Pure functions: identical input always yields identical output, so the
 * same code serves live evaluation and backtests. Series are ordered oldest
 * first; the "current" value is the last element.
 *
 * Short-series conventions:
 * - RSI with fewer than period+1 prices is neutral (50)
 * - EMA with fewer than `period` values returns the input unchanged
 * - MACD with fewer than `slow` prices is all zeros
 * - Bollinger with fewer than `period` prices collapses onto the last price
 */

struct MacdResult {
    double macd = 0.0;
    double signal = 0.0;
    double histogram = 0.0;
};

struct BollingerBands {
    double upper = 0.0;
    double middle = 0.0;
    double lower = 0.0;

    double bandwidth() const { return upper - lower; }

    // 0 at the lower band, 1 at the upper band
    double position(double price) const {
        double width = bandwidth();
        return width > 0 ? (price - lower) / width : 0.5;
    }
};

/// RSI with Wilder smoothing (J. Welles Wilder, 1978)
double rsi(const std::vector<double>& prices, int period = 14);

/// EMA series seeded with the SMA of the first `period` values
std::vector<double> ema_series(const std::vector<double>& values, int period);

/// Last EMA value (0 for an empty series)
double ema(const std::vector<double>& values, int period);

/// Mean of the last `period` values (all values if fewer)
double sma(const std::vector<double>& values, int period);

/// MACD line (EMA fast - EMA slow), its EMA signal line and the histogram
MacdResult macd(const std::vector<double>& prices, int fast = 12, int slow = 26, int signal = 9);

/// Bollinger Bands with population standard deviation
BollingerBands bollinger(const std::vector<double>& prices, int period = 20, double num_std = 2.0);

}  // namespace strategy
}  // namespace autotrade
