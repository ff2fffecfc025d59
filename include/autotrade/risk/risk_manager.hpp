#pragma once

#include "../config/trading_config.hpp"
#include "../logging/async_logger.hpp"
#include "../strategy/signal.hpp"
#include "../types.hpp"

#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace autotrade {
namespace risk {

struct RiskDecision {
    bool allowed = true;
    std::string reason;

    static RiskDecision allow() { return RiskDecision{true, "OK"}; }
    static RiskDecision reject(std::string why) { return RiskDecision{false, std::move(why)}; }
};

enum class LiquidationRisk : uint8_t { Low, Medium, High };

inline const char* liquidation_risk_to_string(LiquidationRisk level) {
    switch (level) {
    case LiquidationRisk::Low:
        return "LOW";
    case LiquidationRisk::Medium:
        return "MEDIUM";
    case LiquidationRisk::High:
        return "HIGH";
    }
    return "UNKNOWN";
}

// Open exposure as seen by the periodic check
struct Exposure {
    PositionKey key;
    double size = 0.0;
    double entry_price = 0.0;
    double mark_price = 0.0;
    int leverage = 1;

    double notional() const { return size * (mark_price > 0.0 ? mark_price : entry_price); }
};

struct LiquidationCheck {
    PositionKey key;
    double liquidation_price = 0.0;
    double distance = 0.0; // fraction of mark price
    LiquidationRisk level = LiquidationRisk::Low;

    bool reduce_recommended() const { return level == LiquidationRisk::High; }
};

/**
 * Advisory output of the periodic check. Nothing here is executed by the
 * risk manager itself; the trading loop acts on `reduce`.
 */
struct RiskAdvice {
    double concentration = 0.0; // largest notional / total balance
    bool concentration_exceeded = false;
    std::vector<LiquidationCheck> liquidation;
    std::vector<PositionKey> reduce; // highest leverage first
    bool daily_loss_breached = false;

    bool has_action() const { return !reduce.empty(); }
};

/**
 * RiskManager - pre-trade gate and periodic exposure checks.
 *
 * Pre-trade rejects (first failing rule wins):
 *   1. entries disabled for the day (daily loss cap breached)
 *   2. daily realized loss at or above max_daily_loss
 *   3. daily trade count at or above max_daily_trades
 *   4. signal confidence below min_confidence
 *   5. a position already open for (symbol, side)
 *   6. available margin < quantity * price / leverage * margin_buffer
 *
 * Daily counters roll over at the UTC day boundary.
 * Thread-safe.
 */
class RiskManager {
public:
    using WallClockMs = std::function<uint64_t()>;

    RiskManager(config::RiskParams params, int leverage, logging::AsyncLogger& logger,
                WallClockMs clock = nullptr);

    RiskDecision pre_trade(const strategy::Signal& signal, double available_balance, bool position_exists);

    /// Count one filled entry toward the daily cap
    void record_trade();

    /// Add realized PnL of a closed position (negative = loss)
    void record_realized_pnl(double pnl);

    RiskAdvice periodic_check(const std::vector<Exposure>& exposures, double total_balance);

    LiquidationCheck check_liquidation(const Exposure& exposure) const;

    /**
     * Liquidation price for isolated margin.
     *   long:  entry * (1 - 1/leverage + mm)
     *   short: entry * (1 + 1/leverage - mm)
     */
    static double liquidation_price(Side side, double entry_price, int leverage, double maintenance_margin);

    double daily_pnl() const;
    int daily_trades() const;
    bool entries_disabled() const;

    void set_leverage(int leverage);
    int leverage() const;
    const config::RiskParams& params() const { return params_; }

private:
    config::RiskParams params_;
    int leverage_;
    logging::AsyncLogger& logger_;
    WallClockMs clock_;

    mutable std::mutex mutex_;
    int64_t day_ = -1;
    double daily_pnl_ = 0.0;
    int daily_trades_ = 0;
    bool entries_disabled_ = false;

    // Caller holds mutex_
    void roll_day_locked();
    bool loss_cap_breached_locked() const { return -daily_pnl_ >= params_.max_daily_loss; }
};

}  // namespace risk
}  // namespace autotrade
