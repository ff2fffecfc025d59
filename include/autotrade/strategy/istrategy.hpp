#pragma once

#include "../config/trading_config.hpp"
#include "../errors.hpp"
#include "../types.hpp"
#include "../util/cancellation.hpp"
#include "signal.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace autotrade {
namespace strategy {

// =============================================================================
// Strategy Variants
// =============================================================================

enum class StrategyKind : uint8_t { Rsi, RsiMultiTf, VolumeFilter, Advanced, Grid, Dca };

inline const char* strategy_kind_to_string(StrategyKind kind) {
    switch (kind) {
    case StrategyKind::Rsi:
        return "RSI_STRATEGY";
    case StrategyKind::RsiMultiTf:
        return "RSI_MULTI_TF";
    case StrategyKind::VolumeFilter:
        return "VOLUME_FILTER";
    case StrategyKind::Advanced:
        return "ADVANCED_STRATEGY";
    case StrategyKind::Grid:
        return "GRID_TRADING";
    case StrategyKind::Dca:
        return "DCA";
    }
    return "UNKNOWN";
}

/// @throws ConfigError for an unknown name
inline StrategyKind strategy_kind_from_string(const std::string& name) {
    if (name == "RSI_STRATEGY") return StrategyKind::Rsi;
    if (name == "RSI_MULTI_TF") return StrategyKind::RsiMultiTf;
    if (name == "VOLUME_FILTER") return StrategyKind::VolumeFilter;
    if (name == "ADVANCED_STRATEGY") return StrategyKind::Advanced;
    if (name == "GRID_TRADING") return StrategyKind::Grid;
    if (name == "DCA") return StrategyKind::Dca;
    throw ConfigError("Unknown strategy: " + name);
}

// =============================================================================
// Parameters
// =============================================================================

/**
 * The slice of TradingConfig a strategy reads. Percentages are in percent
 * (1.5 means 1.5%).
 */
struct StrategyParams {
    config::RsiParams rsi;
    config::MacdParams macd;
    config::BollingerParams bollinger;
    config::VolumeFilterParams volume;
    config::GridParams grid;
    config::DcaParams dca;
    int ema_trend_period = config::strategy::EMA_TREND_PERIOD;
    double position_size = config::strategy::POSITION_SIZE; // fraction of balance
    double stop_loss_percentage = config::strategy::STOP_LOSS_PCT;
    double take_profit_percentage = config::strategy::TAKE_PROFIT_PCT;
    OrderType order_type = OrderType::Market;

    static StrategyParams from_config(const config::TradingConfig& cfg) {
        StrategyParams p;
        p.rsi = cfg.rsi;
        p.macd = cfg.macd;
        p.bollinger = cfg.bollinger;
        p.volume = cfg.volume_filter;
        p.grid = cfg.grid;
        p.dca = cfg.dca;
        p.position_size = cfg.position_size;
        p.stop_loss_percentage = cfg.stop_loss_percentage;
        p.take_profit_percentage = cfg.take_profit_percentage;
        p.order_type = order_type_from_string(cfg.order_type);
        return p;
    }
};

// =============================================================================
// Market Data Snapshot
// =============================================================================

struct MarketContext {
    std::string symbol;
    double price = 0.0;   // current price (ticker or last close)
    double balance = 0.0; // available quote balance
    std::vector<double> closes;       // primary interval (5m), oldest first
    std::vector<double> volumes;      // primary interval volumes
    std::vector<double> trend_closes; // trend interval (1h), oldest first
    TimestampMs timestamp_ms = 0;
};

// =============================================================================
// Strategy Interface
// =============================================================================

/**
 * Stateless strategy. evaluate() depends only on its arguments, so the same
 * object serves several instances and backtests. Implementations check the
 * token between computation steps and throw CancelledError once cancelled.
 */
class IStrategy {
public:
    virtual ~IStrategy() = default;

    virtual Signal evaluate(const MarketContext& ctx, const StrategyParams& params,
                            const util::CancellationToken& token) const = 0;

    virtual StrategyKind kind() const = 0;

    /// Whether evaluate() reads MarketContext::trend_closes
    virtual bool needs_trend_series() const { return false; }

    const char* name() const { return strategy_kind_to_string(kind()); }
};

std::unique_ptr<IStrategy> make_strategy(StrategyKind kind);

}  // namespace strategy
}  // namespace autotrade
