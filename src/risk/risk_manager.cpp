#include "../../include/autotrade/risk/risk_manager.hpp"
#include "../../include/autotrade/util/time_utils.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace autotrade::risk {

RiskManager::RiskManager(config::RiskParams params, int leverage, logging::AsyncLogger& logger, WallClockMs clock)
    : params_(std::move(params))
    , leverage_(leverage > 0 ? leverage : 1)
    , logger_(logger)
    , clock_(clock ? std::move(clock) : WallClockMs(util::wall_clock_ms)) {}

void RiskManager::roll_day_locked() {
    int64_t today = util::utc_day_index(clock_());
    if (today == day_)
        return;
    if (day_ >= 0) {
        AUTOTRADE_LOGF_INFO(logger_, Risk, "New trading day: resetting daily PnL %.2f and %d trades", daily_pnl_,
                            daily_trades_);
    }
    day_ = today;
    daily_pnl_ = 0.0;
    daily_trades_ = 0;
    entries_disabled_ = false;
}

// =============================================================================
// Pre-trade
// =============================================================================

RiskDecision RiskManager::pre_trade(const strategy::Signal& signal, double available_balance, bool position_exists) {
    std::lock_guard<std::mutex> lock(mutex_);
    roll_day_locked();
    char buf[160];

    if (entries_disabled_) {
        return RiskDecision::reject("New entries disabled for today (daily loss cap)");
    }
    if (loss_cap_breached_locked()) {
        std::snprintf(buf, sizeof(buf), "Daily loss limit reached: $%.2f (max: $%.2f)", -daily_pnl_,
                      params_.max_daily_loss);
        return RiskDecision::reject(buf);
    }
    if (daily_trades_ >= params_.max_daily_trades) {
        std::snprintf(buf, sizeof(buf), "Daily trade limit reached: %d (max: %d)", daily_trades_,
                      params_.max_daily_trades);
        return RiskDecision::reject(buf);
    }
    if (signal.confidence < params_.min_confidence) {
        std::snprintf(buf, sizeof(buf), "Confidence too low: %.2f (min: %.2f)", signal.confidence,
                      params_.min_confidence);
        return RiskDecision::reject(buf);
    }
    if (position_exists) {
        return RiskDecision::reject("Position already open for " +
                                    PositionKey{signal.symbol, signal.side()}.to_string());
    }

    double required = signal.quantity * signal.price / static_cast<double>(leverage_) * params_.margin_buffer;
    if (available_balance < required) {
        std::snprintf(buf, sizeof(buf), "Insufficient margin: required $%.2f, available $%.2f", required,
                      available_balance);
        return RiskDecision::reject(buf);
    }
    return RiskDecision::allow();
}

void RiskManager::record_trade() {
    std::lock_guard<std::mutex> lock(mutex_);
    roll_day_locked();
    ++daily_trades_;
}

void RiskManager::record_realized_pnl(double pnl) {
    std::lock_guard<std::mutex> lock(mutex_);
    roll_day_locked();
    daily_pnl_ += pnl;
}

// =============================================================================
// Periodic
// =============================================================================

double RiskManager::liquidation_price(Side side, double entry_price, int leverage, double maintenance_margin) {
    double inv = 1.0 / static_cast<double>(leverage > 0 ? leverage : 1);
    if (side == Side::Buy) {
        return entry_price * (1.0 - inv + maintenance_margin);
    }
    return entry_price * (1.0 + inv - maintenance_margin);
}

LiquidationCheck RiskManager::check_liquidation(const Exposure& exposure) const {
    LiquidationCheck check;
    check.key = exposure.key;
    check.liquidation_price = liquidation_price(exposure.key.side, exposure.entry_price, exposure.leverage,
                                                params_.maintenance_margin);

    double mark = exposure.mark_price > 0.0 ? exposure.mark_price : exposure.entry_price;
    check.distance = mark > 0.0 ? std::abs(mark - check.liquidation_price) / mark : 0.0;

    if (check.distance > config::risk::LIQ_DISTANCE_LOW)
        check.level = LiquidationRisk::Low;
    else if (check.distance > config::risk::LIQ_DISTANCE_MEDIUM)
        check.level = LiquidationRisk::Medium;
    else
        check.level = LiquidationRisk::High;
    return check;
}

RiskAdvice RiskManager::periodic_check(const std::vector<Exposure>& exposures, double total_balance) {
    RiskAdvice advice;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        roll_day_locked();
        if (loss_cap_breached_locked()) {
            advice.daily_loss_breached = true;
            if (!entries_disabled_) {
                entries_disabled_ = true;
                AUTOTRADE_LOGF_WARN(logger_, Risk, "Daily loss cap breached ($%.2f), new entries disabled for today",
                                    -daily_pnl_);
            }
        }
    }

    if (exposures.empty())
        return advice;

    double largest = 0.0;
    for (const auto& e : exposures) {
        largest = std::max(largest, e.notional());
    }
    advice.concentration = total_balance > 0.0 ? largest / total_balance : 0.0;
    advice.concentration_exceeded = advice.concentration > params_.max_concentration;

    bool any_high = false;
    for (const auto& e : exposures) {
        LiquidationCheck check = check_liquidation(e);
        if (check.reduce_recommended()) {
            any_high = true;
            AUTOTRADE_LOGF_WARN(logger_, Risk, "%s liquidation risk %s: liq %.2f, distance %.1f%%",
                                e.key.to_string().c_str(), liquidation_risk_to_string(check.level),
                                check.liquidation_price, check.distance * 100.0);
        }
        advice.liquidation.push_back(check);
    }

    if (advice.concentration_exceeded) {
        AUTOTRADE_LOGF_WARN(logger_, Risk, "Concentration %.2f exceeds %.2f", advice.concentration,
                            params_.max_concentration);
    }

    if (advice.concentration_exceeded || any_high) {
        std::vector<Exposure> ranked = exposures;
        std::stable_sort(ranked.begin(), ranked.end(),
                         [](const Exposure& a, const Exposure& b) { return a.leverage > b.leverage; });
        size_t n = std::min(ranked.size(), static_cast<size_t>(std::max(0, params_.max_positions_to_reduce)));
        for (size_t i = 0; i < n; ++i) {
            advice.reduce.push_back(ranked[i].key);
        }
    }
    return advice;
}

double RiskManager::daily_pnl() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return daily_pnl_;
}

int RiskManager::daily_trades() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return daily_trades_;
}

bool RiskManager::entries_disabled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_disabled_;
}

void RiskManager::set_leverage(int leverage) {
    std::lock_guard<std::mutex> lock(mutex_);
    leverage_ = leverage > 0 ? leverage : 1;
}

int RiskManager::leverage() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return leverage_;
}

} // namespace autotrade::risk
