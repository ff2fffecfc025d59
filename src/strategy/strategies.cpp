#include "../../include/autotrade/strategy/strategies.hpp"
#include "../../include/autotrade/strategy/breakout.hpp"
#include "../../include/autotrade/strategy/technical_indicators.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <limits>

namespace autotrade::strategy {

namespace {

template <typename... Args>
std::string reason(const char* fmt, Args... args) {
    char buffer[256];
    std::snprintf(buffer, sizeof(buffer), fmt, args...);
    return buffer;
}

// Current price, falling back to the last close
double resolve_price(const MarketContext& ctx) {
    if (ctx.price > 0.0)
        return ctx.price;
    return ctx.closes.empty() ? 0.0 : ctx.closes.back();
}

Signal hold(const MarketContext& ctx, const IStrategy& strategy, std::string why) {
    Signal s = Signal::hold(std::move(why), ctx.symbol);
    s.strategy_name = strategy.name();
    s.timestamp_ms = ctx.timestamp_ms;
    s.price = resolve_price(ctx);
    return s;
}

/**
 * BUY/SELL signal with protective levels.
 * BUY:  SL below, TP above. SELL: mirrored.
 */
Signal directional(const MarketContext& ctx, const StrategyParams& params, const IStrategy& strategy,
                   Action action, double price, double quantity, double confidence, std::string why) {
    Signal s;
    s.symbol = ctx.symbol;
    s.action = action;
    s.price = price;
    s.quantity = quantity;
    s.order_type = params.order_type;
    s.strategy_name = strategy.name();
    s.confidence = std::clamp(confidence, 0.0, 1.0);
    s.timestamp_ms = ctx.timestamp_ms;
    s.reason = std::move(why);

    double sl = params.stop_loss_percentage / 100.0;
    double tp = params.take_profit_percentage / 100.0;
    if (action == Action::Buy) {
        s.stop_loss = price * (1.0 - sl);
        s.take_profit = price * (1.0 + tp);
    } else {
        s.stop_loss = price * (1.0 + sl);
        s.take_profit = price * (1.0 - tp);
    }
    return s;
}

double position_quantity(const MarketContext& ctx, double fraction, double price) {
    return price > 0.0 ? ctx.balance * fraction / price : 0.0;
}

} // namespace

double rsi_confidence(double rsi_value, const config::RsiParams& params, Action action) {
    double distance = 0.0;
    if (action == Action::Buy && rsi_value < params.oversold && params.oversold > 0.0) {
        distance = (params.oversold - rsi_value) / params.oversold;
    } else if (action == Action::Sell && rsi_value > params.overbought && params.overbought < 100.0) {
        distance = (rsi_value - params.overbought) / (100.0 - params.overbought);
    } else {
        return 0.0;
    }
    return std::min(1.0, config::strategy::BASE_CONFIDENCE + 0.4 * std::clamp(distance, 0.0, 1.0));
}

// =============================================================================
// RSI
// =============================================================================

Signal RsiStrategy::evaluate(const MarketContext& ctx, const StrategyParams& params,
                             const util::CancellationToken& token) const {
    token.throw_if_cancelled();
    if (ctx.closes.empty())
        return hold(ctx, *this, "No market data available");

    double price = resolve_price(ctx);
    if (price <= 0.0)
        return hold(ctx, *this, "Unable to get current price");

    double value = rsi(ctx.closes, params.rsi.period);
    token.throw_if_cancelled();

    double qty = position_quantity(ctx, params.position_size, price);
    if (value < params.rsi.oversold) {
        return directional(ctx, params, *this, Action::Buy, price, qty, rsi_confidence(value, params.rsi, Action::Buy),
                           reason("RSI oversold (%.2f)", value));
    }
    if (value > params.rsi.overbought) {
        return directional(ctx, params, *this, Action::Sell, price, qty,
                           rsi_confidence(value, params.rsi, Action::Sell), reason("RSI overbought (%.2f)", value));
    }
    return hold(ctx, *this, reason("RSI neutral (%.2f)", value));
}

// =============================================================================
// RSI multi-timeframe
// =============================================================================

Signal RsiMultiTimeframeStrategy::evaluate(const MarketContext& ctx, const StrategyParams& params,
                                           const util::CancellationToken& token) const {
    token.throw_if_cancelled();
    if (ctx.closes.empty() || ctx.trend_closes.empty())
        return hold(ctx, *this, "No market data available");

    double price = resolve_price(ctx);
    if (price <= 0.0)
        return hold(ctx, *this, "Unable to get current price");

    double fast = rsi(ctx.closes, params.rsi.period);
    token.throw_if_cancelled();
    double slow = rsi(ctx.trend_closes, params.rsi.period);
    token.throw_if_cancelled();

    int buy_votes = (fast < params.rsi.oversold ? 1 : 0) + (slow < params.rsi.oversold ? 1 : 0);
    int sell_votes = (fast > params.rsi.overbought ? 1 : 0) + (slow > params.rsi.overbought ? 1 : 0);

    double qty = position_quantity(ctx, params.position_size, price);
    if (buy_votes == 2) {
        // The weaker of the two readings bounds the confidence
        double conf = std::min(rsi_confidence(fast, params.rsi, Action::Buy), rsi_confidence(slow, params.rsi, Action::Buy));
        return directional(ctx, params, *this, Action::Buy, price, qty, conf,
                           reason("Multi-TF RSI: 2/2 buy signals (5M:%.2f, 1H:%.2f)", fast, slow));
    }
    if (sell_votes == 2) {
        double conf =
            std::min(rsi_confidence(fast, params.rsi, Action::Sell), rsi_confidence(slow, params.rsi, Action::Sell));
        return directional(ctx, params, *this, Action::Sell, price, qty, conf,
                           reason("Multi-TF RSI: 2/2 sell signals (5M:%.2f, 1H:%.2f)", fast, slow));
    }
    return hold(ctx, *this, reason("Multi-TF RSI: Mixed signals - %d buy, %d sell", buy_votes, sell_votes));
}

// =============================================================================
// Volume filter
// =============================================================================

Signal VolumeFilterStrategy::evaluate(const MarketContext& ctx, const StrategyParams& params,
                                      const util::CancellationToken& token) const {
    token.throw_if_cancelled();
    if (ctx.volumes.empty())
        return hold(ctx, *this, "No market data available");

    double price = resolve_price(ctx);
    if (price <= 0.0)
        return hold(ctx, *this, "Unable to get current price");

    double volume = ctx.volumes.back();
    double average = ema(ctx.volumes, params.volume.ema_period);
    token.throw_if_cancelled();

    double threshold = average * params.volume.multiplier;
    if (threshold > 0.0 && volume > threshold) {
        double ratio = volume / threshold;
        double conf = std::min(1.0, config::strategy::BASE_CONFIDENCE + (ratio - 1.0));
        return directional(ctx, params, *this, Action::Buy, price, position_quantity(ctx, params.position_size, price),
                           conf, reason("Volume Filter: High volume (%.2f > %.2f)", volume, threshold));
    }
    return hold(ctx, *this, reason("Volume Filter: Low volume (%.2f <= %.2f)", volume, threshold));
}

// =============================================================================
// Advanced
// =============================================================================

Signal AdvancedStrategy::evaluate(const MarketContext& ctx, const StrategyParams& params,
                                  const util::CancellationToken& token) const {
    token.throw_if_cancelled();
    if (ctx.closes.empty())
        return hold(ctx, *this, "No market data available");

    double price = resolve_price(ctx);
    if (price <= 0.0)
        return hold(ctx, *this, "Unable to get current price");

    double rsi_value = rsi(ctx.closes, params.rsi.period);
    token.throw_if_cancelled();
    double trend = ema(ctx.closes, params.ema_trend_period);
    token.throw_if_cancelled();
    MacdResult m = macd(ctx.closes, params.macd.fast, params.macd.slow, params.macd.signal);
    token.throw_if_cancelled();
    BollingerBands bands = bollinger(ctx.closes, params.bollinger.period, params.bollinger.stddev);
    token.throw_if_cancelled();

    // Breakout context: one direction or none, never both
    BreakoutLevels levels = breakout_levels(ctx.closes);
    BreakoutDirection breakout = BreakoutDirection::None;
    if (levels.long_level > 0.0) {
        breakout = resolve_breakout(price, levels.long_level, levels.short_level, price > levels.long_level,
                                    price < levels.short_level);
    }
    if (breakout == BreakoutDirection::Conflict) {
        return hold(ctx, *this, reason("Advanced: conflicting breakout at %.2f", price));
    }

    int buy_votes = 0;
    int sell_votes = 0;

    if (rsi_value < params.rsi.oversold)
        ++buy_votes;
    else if (rsi_value > params.rsi.overbought)
        ++sell_votes;

    if (price > trend)
        ++buy_votes;
    else
        ++sell_votes;

    if (m.macd > m.signal)
        ++buy_votes;
    else
        ++sell_votes;

    double volume_ratio = 0.0;
    if (!ctx.volumes.empty()) {
        double avg = ema(ctx.volumes, params.volume.ema_period);
        volume_ratio = avg > 0.0 ? ctx.volumes.back() / avg : 0.0;
    }

    double qty = position_quantity(ctx, params.position_size, price);
    if (buy_votes >= 2) {
        return directional(ctx, params, *this, Action::Buy, price, qty, buy_votes / 3.0,
                           reason("Advanced: %d/3 buy signals (RSI:%.2f, EMA:%.2f, MACD:%.4f, BB:%.2f, Vol:%.2fx, "
                                  "Breakout:%s)",
                                  buy_votes, rsi_value, trend, m.macd, bands.position(price), volume_ratio,
                                  breakout_to_string(breakout)));
    }
    if (sell_votes >= 2) {
        return directional(ctx, params, *this, Action::Sell, price, qty, sell_votes / 3.0,
                           reason("Advanced: %d/3 sell signals (RSI:%.2f, EMA:%.2f, MACD:%.4f, BB:%.2f, Vol:%.2fx, "
                                  "Breakout:%s)",
                                  sell_votes, rsi_value, trend, m.macd, bands.position(price), volume_ratio,
                                  breakout_to_string(breakout)));
    }
    return hold(ctx, *this, reason("Advanced: Mixed signals - %d buy, %d sell", buy_votes, sell_votes));
}

// =============================================================================
// Grid
// =============================================================================

std::vector<double> GridStrategy::grid_levels(double center, int levels, double spacing) {
    std::vector<double> out;
    out.reserve(levels > 0 ? static_cast<size_t>(levels) : 0);
    for (int i = 0; i < levels; ++i) {
        out.push_back(center * (1.0 + (i - levels / 2) * spacing));
    }
    return out;
}

Signal GridStrategy::evaluate(const MarketContext& ctx, const StrategyParams& params,
                              const util::CancellationToken& token) const {
    token.throw_if_cancelled();
    double price = resolve_price(ctx);
    if (price <= 0.0)
        return hold(ctx, *this, "Unable to get current price");
    if (params.grid.levels <= 0 || params.grid.spacing <= 0.0)
        return hold(ctx, *this, "Grid not configured");

    double center = ctx.closes.empty() ? price : sma(ctx.closes, static_cast<int>(ctx.closes.size()));
    std::vector<double> grid = grid_levels(center, params.grid.levels, params.grid.spacing);
    token.throw_if_cancelled();

    double closest = grid.front();
    for (double level : grid) {
        if (std::abs(level - price) < std::abs(closest - price))
            closest = level;
    }

    // Within a tenth of one grid step counts as sitting on the level
    double tolerance = center * params.grid.spacing * 0.1;
    double qty = position_quantity(ctx, params.grid.position_size, price);

    if (price < closest - tolerance) {
        return directional(ctx, params, *this, Action::Buy, price, qty, config::strategy::FLAT_CONFIDENCE,
                           reason("Grid buy at %.2f (level %.2f)", price, closest));
    }
    if (price > closest + tolerance) {
        return directional(ctx, params, *this, Action::Sell, price, qty, config::strategy::FLAT_CONFIDENCE,
                           reason("Grid sell at %.2f (level %.2f)", price, closest));
    }
    return hold(ctx, *this, reason("At grid level %.2f", closest));
}

// =============================================================================
// DCA
// =============================================================================

Signal DcaStrategy::evaluate(const MarketContext& ctx, const StrategyParams& params,
                             const util::CancellationToken& token) const {
    token.throw_if_cancelled();
    double price = resolve_price(ctx);
    if (price <= 0.0)
        return hold(ctx, *this, "Unable to get current price");
    if (params.dca.amount <= 0.0)
        return hold(ctx, *this, "DCA amount not configured");

    return directional(ctx, params, *this, Action::Buy, price, params.dca.amount / price,
                       config::strategy::FLAT_CONFIDENCE, reason("DCA buy $%.2f", params.dca.amount));
}

// =============================================================================
// Factory
// =============================================================================

std::unique_ptr<IStrategy> make_strategy(StrategyKind kind) {
    switch (kind) {
    case StrategyKind::Rsi:
        return std::make_unique<RsiStrategy>();
    case StrategyKind::RsiMultiTf:
        return std::make_unique<RsiMultiTimeframeStrategy>();
    case StrategyKind::VolumeFilter:
        return std::make_unique<VolumeFilterStrategy>();
    case StrategyKind::Advanced:
        return std::make_unique<AdvancedStrategy>();
    case StrategyKind::Grid:
        return std::make_unique<GridStrategy>();
    case StrategyKind::Dca:
        return std::make_unique<DcaStrategy>();
    }
    throw ConfigError("Unknown strategy kind");
}

} // namespace autotrade::strategy
