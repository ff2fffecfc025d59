#include "../include/autotrade/risk/risk_manager.hpp"

#include <atomic>
#include <cassert>
#include <cmath>
#include <iostream>

using namespace autotrade;
using namespace autotrade::risk;

#define TEST(name) void name()
#define RUN_TEST(name)                                                                                                 \
    do {                                                                                                               \
        std::cout << "  " << #name << "... ";                                                                          \
        name();                                                                                                        \
        std::cout << "PASSED\n";                                                                                       \
    } while (0)

#define ASSERT_EQ(a, b) assert((a) == (b))
#define ASSERT_TRUE(x) assert(x)
#define ASSERT_FALSE(x) assert(!(x))
#define ASSERT_NEAR(a, b, eps) assert(std::abs((a) - (b)) < (eps))

namespace {

constexpr uint64_t DAY_MS = 86400000ULL;
constexpr uint64_t T0 = 1700000000000ULL; // 2023-11-14 22:13 UTC

struct Fixture {
    logging::AsyncLogger logger;
    std::atomic<uint64_t> now{T0};
    RiskManager risk;

    explicit Fixture(config::RiskParams params = {}, int leverage = 10)
        : risk(params, leverage, logger, [this] { return now.load(); }) {
        logger.set_min_level(logging::LogLevel::Fatal);
    }
};

strategy::Signal buy_signal(double qty = 0.1, double price = 100.0, double confidence = 0.8) {
    strategy::Signal s;
    s.symbol = "BTC_USDT";
    s.action = Action::Buy;
    s.quantity = qty;
    s.price = price;
    s.confidence = confidence;
    return s;
}

Exposure exposure(const std::string& symbol, int leverage, double size = 1.0, double entry = 100.0) {
    Exposure e;
    e.key = PositionKey{symbol, Side::Buy};
    e.size = size;
    e.entry_price = entry;
    e.mark_price = entry;
    e.leverage = leverage;
    return e;
}

} // namespace

// =============================================================================
// Pre-trade gate
// =============================================================================

TEST(allows_valid_signal) {
    Fixture f;
    RiskDecision d = f.risk.pre_trade(buy_signal(), 1000.0, false);
    ASSERT_TRUE(d.allowed);
    ASSERT_EQ(d.reason, "OK");
}

TEST(rejects_low_confidence) {
    Fixture f;
    RiskDecision d = f.risk.pre_trade(buy_signal(0.1, 100.0, 0.4), 1000.0, false);
    ASSERT_FALSE(d.allowed);
    ASSERT_TRUE(d.reason.find("Confidence too low") != std::string::npos);
}

TEST(rejects_existing_position) {
    Fixture f;
    RiskDecision d = f.risk.pre_trade(buy_signal(), 1000.0, true);
    ASSERT_FALSE(d.allowed);
    ASSERT_TRUE(d.reason.find("BTC_USDT:BUY") != std::string::npos);
}

TEST(margin_includes_leverage_and_buffer) {
    Fixture f; // leverage 10, buffer 1.2
    // 10 * 100 / 10 * 1.2 = 120
    ASSERT_TRUE(f.risk.pre_trade(buy_signal(10.0, 100.0), 121.0, false).allowed);
    RiskDecision d = f.risk.pre_trade(buy_signal(10.0, 100.0), 119.0, false);
    ASSERT_FALSE(d.allowed);
    ASSERT_TRUE(d.reason.find("Insufficient margin") != std::string::npos);
}

TEST(trade_cap_blocks_entries) {
    config::RiskParams params;
    params.max_daily_trades = 2;
    Fixture f(params);
    f.risk.record_trade();
    f.risk.record_trade();
    RiskDecision d = f.risk.pre_trade(buy_signal(), 1000.0, false);
    ASSERT_FALSE(d.allowed);
    ASSERT_TRUE(d.reason.find("Daily trade limit") != std::string::npos);
}

TEST(first_failing_rule_wins) {
    config::RiskParams params;
    params.max_daily_trades = 1;
    Fixture f(params);
    f.risk.record_trade();
    // Low confidence and an open position too, but the trade cap is checked first
    RiskDecision d = f.risk.pre_trade(buy_signal(0.1, 100.0, 0.1), 0.0, true);
    ASSERT_TRUE(d.reason.find("Daily trade limit") != std::string::npos);
}

// =============================================================================
// Daily loss
// =============================================================================

TEST(daily_loss_cap_blocks_and_disables) {
    config::RiskParams params;
    params.max_daily_loss = 100.0;
    Fixture f(params);

    f.risk.record_realized_pnl(-60.0);
    ASSERT_TRUE(f.risk.pre_trade(buy_signal(), 1000.0, false).allowed);

    f.risk.record_realized_pnl(-40.0);
    RiskDecision d = f.risk.pre_trade(buy_signal(), 1000.0, false);
    ASSERT_FALSE(d.allowed);
    ASSERT_TRUE(d.reason.find("Daily loss limit") != std::string::npos);

    RiskAdvice advice = f.risk.periodic_check({}, 1000.0);
    ASSERT_TRUE(advice.daily_loss_breached);
    ASSERT_TRUE(f.risk.entries_disabled());

    // A later profit does not re-enable entries today
    f.risk.record_realized_pnl(80.0);
    RiskDecision still = f.risk.pre_trade(buy_signal(), 1000.0, false);
    ASSERT_FALSE(still.allowed);
    ASSERT_TRUE(still.reason.find("disabled") != std::string::npos);
}

TEST(counters_roll_over_at_utc_midnight) {
    config::RiskParams params;
    params.max_daily_loss = 100.0;
    params.max_daily_trades = 1;
    Fixture f(params);

    f.risk.record_trade();
    f.risk.record_realized_pnl(-150.0);
    f.risk.periodic_check({}, 1000.0);
    ASSERT_TRUE(f.risk.entries_disabled());

    f.now.store(T0 + DAY_MS);
    ASSERT_TRUE(f.risk.pre_trade(buy_signal(), 1000.0, false).allowed);
    ASSERT_EQ(f.risk.daily_trades(), 0);
    ASSERT_NEAR(f.risk.daily_pnl(), 0.0, 1e-12);
    ASSERT_FALSE(f.risk.entries_disabled());
}

// =============================================================================
// Periodic checks
// =============================================================================

TEST(liquidation_price_formula) {
    ASSERT_NEAR(RiskManager::liquidation_price(Side::Buy, 100.0, 10, 0.05), 95.0, 1e-9);
    ASSERT_NEAR(RiskManager::liquidation_price(Side::Sell, 100.0, 10, 0.05), 105.0, 1e-9);
}

TEST(liquidation_levels) {
    Fixture f;
    ASSERT_EQ(f.risk.check_liquidation(exposure("A", 2)).level, LiquidationRisk::Low);
    ASSERT_EQ(f.risk.check_liquidation(exposure("B", 5)).level, LiquidationRisk::Medium);
    LiquidationCheck high = f.risk.check_liquidation(exposure("C", 10));
    ASSERT_EQ(high.level, LiquidationRisk::High);
    ASSERT_TRUE(high.reduce_recommended());
}

TEST(concentration_triggers_reductions_by_leverage) {
    Fixture f; // max concentration 0.8, reduce at most 2
    std::vector<Exposure> exposures = {exposure("A", 2, 9.0), exposure("B", 4, 1.0), exposure("C", 3, 1.0)};
    RiskAdvice advice = f.risk.periodic_check(exposures, 1000.0);

    ASSERT_NEAR(advice.concentration, 0.9, 1e-9);
    ASSERT_TRUE(advice.concentration_exceeded);
    ASSERT_TRUE(advice.has_action());
    ASSERT_EQ(advice.reduce.size(), 2u);
    ASSERT_EQ(advice.reduce[0].symbol, "B");
    ASSERT_EQ(advice.reduce[1].symbol, "C");
    ASSERT_EQ(advice.liquidation.size(), 3u);
}

TEST(healthy_book_needs_no_action) {
    Fixture f;
    RiskAdvice advice = f.risk.periodic_check({exposure("A", 2, 1.0), exposure("B", 3, 1.0)}, 1000.0);
    ASSERT_FALSE(advice.concentration_exceeded);
    ASSERT_FALSE(advice.has_action());
}

int main() {
    std::cout << "\n=== Risk Manager Tests ===\n\n";

    std::cout << "Pre-trade Tests:\n";
    RUN_TEST(allows_valid_signal);
    RUN_TEST(rejects_low_confidence);
    RUN_TEST(rejects_existing_position);
    RUN_TEST(margin_includes_leverage_and_buffer);
    RUN_TEST(trade_cap_blocks_entries);
    RUN_TEST(first_failing_rule_wins);

    std::cout << "\nDaily Loss Tests:\n";
    RUN_TEST(daily_loss_cap_blocks_and_disables);
    RUN_TEST(counters_roll_over_at_utc_midnight);

    std::cout << "\nPeriodic Check Tests:\n";
    RUN_TEST(liquidation_price_formula);
    RUN_TEST(liquidation_levels);
    RUN_TEST(concentration_triggers_reductions_by_leverage);
    RUN_TEST(healthy_book_needs_no_action);

    std::cout << "\n=== All Risk Manager Tests Passed! ===\n";
    return 0;
}
