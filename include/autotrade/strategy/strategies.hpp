#pragma once

#include "istrategy.hpp"

namespace autotrade {
namespace strategy {

/**
 * Strategy variants
 *
 * RSI            BUY below oversold, SELL above overbought
 * RSI_MULTI_TF   RSI on the primary and trend interval must agree
 * VOLUME_FILTER  BUY when the last volume exceeds EMA(volume) * multiplier
 * ADVANCED       majority vote of RSI, price vs EMA and MACD vs signal
 * GRID           levels spaced around the mean close; trade toward the nearest
 * DCA            always BUY a fixed quote amount
 *
 * Every directional signal carries stop-loss / take-profit prices derived
 * from the configured percentages (mirrored for SELL) and a confidence.
 */

class RsiStrategy : public IStrategy {
public:
    Signal evaluate(const MarketContext& ctx, const StrategyParams& params,
                    const util::CancellationToken& token) const override;
    StrategyKind kind() const override { return StrategyKind::Rsi; }
};

class RsiMultiTimeframeStrategy : public IStrategy {
public:
    Signal evaluate(const MarketContext& ctx, const StrategyParams& params,
                    const util::CancellationToken& token) const override;
    StrategyKind kind() const override { return StrategyKind::RsiMultiTf; }
    bool needs_trend_series() const override { return true; }
};

class VolumeFilterStrategy : public IStrategy {
public:
    Signal evaluate(const MarketContext& ctx, const StrategyParams& params,
                    const util::CancellationToken& token) const override;
    StrategyKind kind() const override { return StrategyKind::VolumeFilter; }
};

class AdvancedStrategy : public IStrategy {
public:
    Signal evaluate(const MarketContext& ctx, const StrategyParams& params,
                    const util::CancellationToken& token) const override;
    StrategyKind kind() const override { return StrategyKind::Advanced; }
};

class GridStrategy : public IStrategy {
public:
    Signal evaluate(const MarketContext& ctx, const StrategyParams& params,
                    const util::CancellationToken& token) const override;
    StrategyKind kind() const override { return StrategyKind::Grid; }

    /// Grid prices: `levels` steps of `spacing` centered on `center`
    static std::vector<double> grid_levels(double center, int levels, double spacing);
};

class DcaStrategy : public IStrategy {
public:
    Signal evaluate(const MarketContext& ctx, const StrategyParams& params,
                    const util::CancellationToken& token) const override;
    StrategyKind kind() const override { return StrategyKind::Dca; }
};

// Confidence for an RSI reading past its threshold (0 when not past it)
double rsi_confidence(double rsi_value, const config::RsiParams& params, Action action);

}  // namespace strategy
}  // namespace autotrade
