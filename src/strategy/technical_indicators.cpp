#include "../../include/autotrade/strategy/technical_indicators.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace autotrade::strategy {

double rsi(const std::vector<double>& prices, int period) {
    if (period <= 0 || prices.size() < static_cast<size_t>(period) + 1)
        return 50.0;

    // Seed with simple averages over the first `period` changes
    double gain = 0.0;
    double loss = 0.0;
    for (int i = 1; i <= period; ++i) {
        double change = prices[i] - prices[i - 1];
        if (change > 0)
            gain += change;
        else
            loss -= change;
    }
    double avg_gain = gain / period;
    double avg_loss = loss / period;

    // Wilder smoothing for the rest
    for (size_t i = static_cast<size_t>(period) + 1; i < prices.size(); ++i) {
        double change = prices[i] - prices[i - 1];
        double g = change > 0 ? change : 0.0;
        double l = change < 0 ? -change : 0.0;
        avg_gain = (avg_gain * (period - 1) + g) / period;
        avg_loss = (avg_loss * (period - 1) + l) / period;
    }

    if (avg_loss == 0.0)
        return avg_gain == 0.0 ? 50.0 : 100.0;

    double rs = avg_gain / avg_loss;
    return 100.0 - 100.0 / (1.0 + rs);
}

std::vector<double> ema_series(const std::vector<double>& values, int period) {
    if (period <= 0 || values.size() < static_cast<size_t>(period))
        return values;

    std::vector<double> out(values.begin(), values.end());
    double alpha = 2.0 / (period + 1);

    double seed = std::accumulate(values.begin(), values.begin() + period, 0.0) / period;
    out[period - 1] = seed;

    double prev = seed;
    for (size_t i = static_cast<size_t>(period); i < values.size(); ++i) {
        prev = alpha * values[i] + (1.0 - alpha) * prev;
        out[i] = prev;
    }
    return out;
}

double ema(const std::vector<double>& values, int period) {
    if (values.empty())
        return 0.0;
    return ema_series(values, period).back();
}

double sma(const std::vector<double>& values, int period) {
    if (values.empty() || period <= 0)
        return 0.0;
    size_t n = std::min(values.size(), static_cast<size_t>(period));
    return std::accumulate(values.end() - n, values.end(), 0.0) / static_cast<double>(n);
}

MacdResult macd(const std::vector<double>& prices, int fast, int slow, int signal) {
    MacdResult result;
    if (slow <= 0 || prices.size() < static_cast<size_t>(slow))
        return result;

    auto fast_ema = ema_series(prices, fast);
    auto slow_ema = ema_series(prices, slow);

    // The line is defined once the slow EMA is seeded
    std::vector<double> line;
    line.reserve(prices.size() - slow + 1);
    for (size_t i = static_cast<size_t>(slow) - 1; i < prices.size(); ++i) {
        line.push_back(fast_ema[i] - slow_ema[i]);
    }

    result.macd = line.back();
    result.signal = ema(line, signal);
    result.histogram = result.macd - result.signal;
    return result;
}

BollingerBands bollinger(const std::vector<double>& prices, int period, double num_std) {
    BollingerBands bands;
    if (prices.empty())
        return bands;

    if (period <= 0 || prices.size() < static_cast<size_t>(period)) {
        bands.upper = bands.middle = bands.lower = prices.back();
        return bands;
    }

    auto begin = prices.end() - period;
    double mean = std::accumulate(begin, prices.end(), 0.0) / period;

    double sq = 0.0;
    for (auto it = begin; it != prices.end(); ++it) {
        double d = *it - mean;
        sq += d * d;
    }
    double stddev = std::sqrt(sq / period);

    bands.middle = mean;
    bands.upper = mean + num_std * stddev;
    bands.lower = mean - num_std * stddev;
    return bands;
}

} // namespace autotrade::strategy
