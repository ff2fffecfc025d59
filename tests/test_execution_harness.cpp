#include "../include/autotrade/execution/execution_harness.hpp"
#include "../include/autotrade/strategy/breakout.hpp"
#include "mock_exchange_client.hpp"

#include <cassert>
#include <chrono>
#include <cmath>
#include <iostream>
#include <thread>

using namespace autotrade;
using namespace autotrade::execution;
using autotrade::testing::falling_closes;
using autotrade::testing::flat_closes;
using autotrade::testing::MockExchangeClient;
using autotrade::testing::rising_closes;
using strategy::StrategyKind;

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

constexpr uint64_t NOW = 1700000000000ULL; // 22:13 UTC
const PositionKey BTC_LONG{"BTC_USDT", Side::Buy};

bool contains(const std::string& s, const std::string& part) {
    return s.find(part) != std::string::npos;
}

class RecordingStore : public engine::PersistenceStore {
public:
    std::vector<nlohmann::json> trades;
    std::vector<nlohmann::json> logs;

    void append_trade(const nlohmann::json& record) override { trades.push_back(record); }
    void append_log(const nlohmann::json& record) override { logs.push_back(record); }
    engine::UserSettings get_user_settings(const std::string&) override { return {}; }
};

class RecordingNotifier : public engine::NotificationSink {
public:
    std::vector<std::string> titles;

    void notify(const std::string& title, const std::string&) override { titles.push_back(title); }

    bool received(const std::string& title) const {
        for (const auto& t : titles) {
            if (t == title)
                return true;
        }
        return false;
    }
};

// Strategy that always throws
class FailingStrategy : public strategy::IStrategy {
public:
    strategy::Signal evaluate(const strategy::MarketContext&, const strategy::StrategyParams&,
                              const util::CancellationToken&) const override {
        throw std::runtime_error("indicator blew up");
    }
    StrategyKind kind() const override { return StrategyKind::Advanced; }
};

// BUY with a zero quantity
class ZeroQuantityStrategy : public strategy::IStrategy {
public:
    strategy::Signal evaluate(const strategy::MarketContext& ctx, const strategy::StrategyParams&,
                              const util::CancellationToken&) const override {
        strategy::Signal s;
        s.symbol = ctx.symbol;
        s.action = Action::Buy;
        s.price = ctx.price;
        s.confidence = 0.9;
        return s;
    }
    StrategyKind kind() const override { return StrategyKind::Grid; }
};

// Both breakout sides active around the current price; `long_offset` below
// and `short_offset` above. Equal offsets resolve to CONFLICT.
class BothSidesBreakoutStrategy : public strategy::IStrategy {
public:
    BothSidesBreakoutStrategy(double long_offset, double short_offset)
        : long_offset_(long_offset)
        , short_offset_(short_offset) {}

    strategy::Signal evaluate(const strategy::MarketContext& ctx, const strategy::StrategyParams&,
                              const util::CancellationToken&) const override {
        auto dir = strategy::resolve_breakout(ctx.price, ctx.price - long_offset_, ctx.price + short_offset_, true,
                                              true);
        if (dir == strategy::BreakoutDirection::Conflict || dir == strategy::BreakoutDirection::None)
            return strategy::Signal::hold("conflicting breakout", ctx.symbol);

        strategy::Signal s;
        s.symbol = ctx.symbol;
        s.action = dir == strategy::BreakoutDirection::Long ? Action::Buy : Action::Sell;
        s.price = ctx.price;
        s.quantity = 1.0;
        s.confidence = 0.9;
        s.reason = strategy::breakout_to_string(dir);
        return s;
    }
    StrategyKind kind() const override { return StrategyKind::Advanced; }

private:
    double long_offset_;
    double short_offset_;
};

struct Fixture {
    MockExchangeClient client;
    logging::AsyncLogger logger;
    risk::RiskManager risk;
    position::PositionStateMachine positions;
    OrderTracker orders;
    ExecutionStats stats;
    RecordingStore store;
    RecordingNotifier notifier;
    ExecutionHarness harness;

    explicit Fixture(config::TradingConfig cfg = {})
        : risk(cfg.risk, cfg.leverage, logger, [] { return NOW; })
        , positions(cfg.exits, cfg.stop_loss_percentage, client, logger, [] { return NOW; })
        , harness(cfg, client, risk, positions, orders, stats, logger, &store, &notifier, nullptr, [] { return NOW; }) {
        logger.set_min_level(logging::LogLevel::Fatal);
        client.set_closes(flat_closes());
    }
};

} // namespace

// =============================================================================
// Preconditions
// =============================================================================

TEST(outside_trading_hours_holds) {
    config::TradingConfig cfg;
    cfg.trading_hours.enabled = true;
    cfg.trading_hours.start = "00:00";
    cfg.trading_hours.end = "01:00";
    cfg.trading_hours.timezone = "UTC";
    Fixture f(cfg);

    CycleResult r = f.harness.run_cycle(StrategyKind::Rsi, "BTC_USDT");
    ASSERT_TRUE(r.signal.is_hold());
    ASSERT_EQ(r.signal.reason, "Outside trading hours");
    ASSERT_EQ(f.client.kline_calls(), 0);
}

TEST(window_wrapping_midnight_allows) {
    config::TradingConfig cfg;
    cfg.trading_hours.enabled = true;
    cfg.trading_hours.start = "22:00";
    cfg.trading_hours.end = "02:00";
    cfg.trading_hours.timezone = "UTC";
    Fixture f(cfg);
    ASSERT_TRUE(f.harness.within_trading_hours());

    // 22:13 UTC is 17:13 in UTC-5, outside 19:30-01:30
    cfg.trading_hours.start = "19:30";
    cfg.trading_hours.end = "01:30";
    cfg.trading_hours.timezone = "UTC-5";
    f.harness.update_config(cfg);
    ASSERT_FALSE(f.harness.within_trading_hours());
}

TEST(insufficient_balance_holds) {
    Fixture f;
    f.client.set_balance(5.0);
    CycleResult r = f.harness.run_cycle(StrategyKind::Rsi, "BTC_USDT");
    ASSERT_TRUE(r.signal.is_hold());
    ASSERT_EQ(r.signal.reason, "Insufficient balance: $5.00 (minimum: $10.00)");
    ASSERT_EQ(f.client.kline_calls(), 0);
}

TEST(balance_failure_holds) {
    Fixture f;
    f.client.fail_balance(true);
    CycleResult r = f.harness.run_cycle(StrategyKind::Rsi, "BTC_USDT");
    ASSERT_TRUE(r.signal.is_hold());
    ASSERT_TRUE(contains(r.signal.reason, "Failed to get balance"));
}

// =============================================================================
// Health
// =============================================================================

TEST(healthy_when_everything_is_up) {
    Fixture f;
    HealthReport h = f.harness.health_check();
    ASSERT_TRUE(h.api_connection);
    ASSERT_TRUE(h.balance_available);
    ASSERT_TRUE(h.config_valid);
    ASSERT_TRUE(h.strategies_ready);
    ASSERT_EQ(h.overall, HealthStatus::Healthy);
}

TEST(unhealthy_without_api_or_balance) {
    Fixture f;
    f.client.set_connection_ok(false);
    f.client.fail_balance(true);
    HealthReport h = f.harness.health_check();
    ASSERT_FALSE(h.api_connection);
    ASSERT_FALSE(h.balance_available);
    ASSERT_EQ(h.overall, HealthStatus::Unhealthy);
}

TEST(degraded_when_one_side_is_up) {
    Fixture f;
    f.client.fail_balance(true);
    ASSERT_EQ(f.harness.health_check().overall, HealthStatus::Degraded);

    f.client.fail_balance(false);
    f.client.set_connection_ok(false);
    ASSERT_EQ(f.harness.health_check().overall, HealthStatus::Degraded);
}

TEST(invalid_config_is_not_healthy) {
    config::TradingConfig cfg;
    cfg.leverage = 0;
    Fixture f(cfg);
    HealthReport h = f.harness.health_check();
    ASSERT_FALSE(h.config_valid);
    ASSERT_EQ(h.overall, HealthStatus::Degraded);
}

TEST(degraded_cycle_still_evaluates) {
    Fixture f;
    f.client.set_connection_ok(false);
    f.client.set_closes(falling_closes());

    CycleResult r = f.harness.run_cycle(StrategyKind::Rsi, "BTC_USDT");
    ASSERT_EQ(r.health, HealthStatus::Degraded);
    ASSERT_EQ(r.signal.action, Action::Buy);
    ASSERT_TRUE(r.submitted);
}

// =============================================================================
// Evaluation
// =============================================================================

TEST(neutral_market_holds_with_strategy_reason) {
    Fixture f;
    CycleResult r = f.harness.run_cycle(StrategyKind::Rsi, "BTC_USDT");
    ASSERT_TRUE(r.signal.is_hold());
    ASSERT_TRUE(contains(r.signal.reason, "RSI neutral"));
    ASSERT_EQ(r.signal.strategy_name, "RSI_STRATEGY");
    ASSERT_FALSE(r.submitted);
    ASSERT_EQ(f.stats.get("RSI_STRATEGY").success_count, 1u);
}

TEST(evaluation_timeout_holds_without_fallback) {
    config::TradingConfig cfg;
    cfg.evaluation_timeout_s = 0.05;
    Fixture f(cfg);
    f.client.set_closes(falling_closes());
    f.client.set_kline_delay_ms(300);

    auto start = std::chrono::steady_clock::now();
    CycleResult r = f.harness.run_cycle(StrategyKind::Advanced, "BTC_USDT");
    double waited = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

    ASSERT_TRUE(r.signal.is_hold());
    ASSERT_EQ(r.signal.reason, "Strategy evaluation timed out");
    ASSERT_TRUE(waited < 0.3);
    ASSERT_EQ(f.stats.get("ADVANCED_STRATEGY").failure_count, 1u);
    ASSERT_EQ(f.stats.get("RSI_STRATEGY").total(), 0u);
    ASSERT_EQ(f.client.place_count(), 0u);

    // The abandoned worker finishes once its fetch returns
    for (int i = 0; i < 100 && f.harness.abandoned_workers() > 0; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    ASSERT_EQ(f.harness.abandoned_workers(), 0u);
}

TEST(failure_falls_back_to_rsi) {
    Fixture f;
    f.client.set_closes(falling_closes());
    f.harness.set_strategy(StrategyKind::Advanced, std::make_shared<FailingStrategy>());

    CycleResult r = f.harness.run_cycle(StrategyKind::Advanced, "BTC_USDT");
    ASSERT_EQ(r.signal.action, Action::Buy);
    ASSERT_EQ(r.signal.strategy_name, "RSI_STRATEGY");
    ASSERT_TRUE(r.submitted);

    ASSERT_EQ(f.stats.get("ADVANCED_STRATEGY").failure_count, 1u);
    ASSERT_EQ(f.stats.get("RSI_STRATEGY").success_count, 1u);
}

TEST(failure_with_neutral_fallback_reports_error) {
    Fixture f;
    f.harness.set_strategy(StrategyKind::Advanced, std::make_shared<FailingStrategy>());

    CycleResult r = f.harness.run_cycle(StrategyKind::Advanced, "BTC_USDT");
    ASSERT_TRUE(r.signal.is_hold());
    ASSERT_EQ(r.signal.reason, "Strategy execution error: indicator blew up");
}

TEST(network_failure_is_classified) {
    Fixture f;
    f.client.fail_klines("connection reset");
    CycleResult r = f.harness.run_cycle(StrategyKind::Rsi, "BTC_USDT");
    ASSERT_TRUE(r.signal.is_hold());
    ASSERT_TRUE(contains(r.signal.reason, "Network connection error"));
    ASSERT_EQ(f.stats.get("RSI_STRATEGY").failure_count, 1u);
}

TEST(ticker_price_preferred_over_last_close) {
    Fixture f;
    f.client.set_closes(falling_closes()); // last close 61
    f.client.set_ticker(60.0);
    CycleResult r = f.harness.run_cycle(StrategyKind::Rsi, "BTC_USDT");
    ASSERT_NEAR(r.signal.price, 60.0, 1e-9);
    ASSERT_NEAR(f.harness.current_price("BTC_USDT"), 60.0, 1e-9);
}

// =============================================================================
// Submission
// =============================================================================

TEST(buy_signal_places_order) {
    Fixture f;
    f.client.set_closes(falling_closes());

    CycleResult r = f.harness.run_cycle(StrategyKind::Rsi, "BTC_USDT");
    ASSERT_TRUE(r.submitted);
    ASSERT_EQ(r.order_id, "ord-1");
    ASSERT_EQ(r.health, HealthStatus::Healthy);

    auto order = f.client.last_order();
    ASSERT_EQ(order.symbol, "BTC_USDT");
    ASSERT_EQ(order.side, Side::Buy);
    ASSERT_EQ(order.type, OrderType::Market);
    ASSERT_NEAR(order.quantity, 1000.0 * 0.5 / 61.0, 1e-9);

    ASSERT_TRUE(f.orders.has_open(BTC_LONG));
    ASSERT_EQ(f.store.trades.size(), 1u);
    ASSERT_EQ(f.store.trades[0]["event"], "order_placed");
    ASSERT_TRUE(f.notifier.received("Order Placed"));
}

TEST(one_open_order_per_symbol_side) {
    Fixture f;
    f.client.set_closes(falling_closes());
    ASSERT_TRUE(f.harness.run_cycle(StrategyKind::Rsi, "BTC_USDT").submitted);

    CycleResult second = f.harness.run_cycle(StrategyKind::Rsi, "BTC_USDT");
    ASSERT_FALSE(second.submitted);
    ASSERT_EQ(second.signal.reason, "Open order already pending for BTC_USDT:BUY");
    ASSERT_EQ(f.client.place_count(), 1u);
}

TEST(ack_without_order_id_is_not_tracked) {
    Fixture f;
    f.client.set_closes(falling_closes());
    f.client.ack_without_id(true);

    CycleResult r = f.harness.run_cycle(StrategyKind::Rsi, "BTC_USDT");
    ASSERT_FALSE(r.submitted);
    ASSERT_TRUE(contains(r.signal.reason, "Order failed: Exchange error MISSING_ORDER_ID"));
    ASSERT_FALSE(f.orders.has_open(BTC_LONG));
    ASSERT_TRUE(f.notifier.received("Order Failed"));

    // The key is free for the next cycle
    f.client.ack_without_id(false);
    CycleResult next = f.harness.run_cycle(StrategyKind::Rsi, "BTC_USDT");
    ASSERT_TRUE(next.submitted);
    ASSERT_EQ(next.order_id, "ord-2");
    ASSERT_TRUE(f.orders.has_open(BTC_LONG));
}

TEST(conflicting_breakout_submits_nothing) {
    Fixture f;
    f.harness.set_strategy(StrategyKind::Advanced, std::make_shared<BothSidesBreakoutStrategy>(2.0, 2.0));

    CycleResult r = f.harness.run_cycle(StrategyKind::Advanced, "BTC_USDT");
    ASSERT_FALSE(r.submitted);
    ASSERT_TRUE(r.signal.is_hold());
    ASSERT_EQ(r.signal.reason, "conflicting breakout");
    ASSERT_EQ(f.client.place_count(), 0u);
    ASSERT_TRUE(f.orders.open_orders().empty());

    // Same pipeline with a clear winner does trade
    f.harness.set_strategy(StrategyKind::Advanced, std::make_shared<BothSidesBreakoutStrategy>(3.0, 2.0));
    CycleResult won = f.harness.run_cycle(StrategyKind::Advanced, "BTC_USDT");
    ASSERT_TRUE(won.submitted);
    ASSERT_EQ(f.client.last_order().side, Side::Buy);
}

TEST(risk_rejection_holds) {
    config::TradingConfig cfg;
    cfg.risk.min_confidence = 0.8;
    Fixture f(cfg);

    CycleResult r = f.harness.run_cycle(StrategyKind::Dca, "BTC_USDT"); // confidence 0.7
    ASSERT_FALSE(r.submitted);
    ASSERT_TRUE(contains(r.signal.reason, "Risk check failed: Confidence too low"));
    ASSERT_EQ(f.client.place_count(), 0u);
}

TEST(invalid_signal_is_rejected) {
    Fixture f;
    f.harness.set_strategy(StrategyKind::Grid, std::make_shared<ZeroQuantityStrategy>());
    CycleResult r = f.harness.run_cycle(StrategyKind::Grid, "BTC_USDT");
    ASSERT_FALSE(r.submitted);
    ASSERT_TRUE(contains(r.signal.reason, "Invalid signal: Invalid quantity"));
}

TEST(rsi_filter_blocks_against_trend) {
    config::TradingConfig cfg;
    cfg.rsi_filter.enabled = true;
    Fixture f(cfg);
    f.client.set_closes(falling_closes());
    f.client.set_trend_closes(rising_closes());

    CycleResult r = f.harness.run_cycle(StrategyKind::Rsi, "BTC_USDT");
    ASSERT_FALSE(r.submitted);
    ASSERT_TRUE(contains(r.signal.reason, "RSI filter: Normal mode LONG"));
    ASSERT_EQ(f.client.kline_calls(), 2); // primary and trend
}

TEST(order_failure_notifies) {
    Fixture f;
    f.client.set_closes(falling_closes());
    f.client.fail_next_place(1);

    CycleResult r = f.harness.run_cycle(StrategyKind::Rsi, "BTC_USDT");
    ASSERT_FALSE(r.submitted);
    ASSERT_TRUE(contains(r.signal.reason, "Order failed"));
    ASSERT_TRUE(f.notifier.received("Order Failed"));
    ASSERT_FALSE(f.orders.has_open(BTC_LONG));
}

// =============================================================================
// Order monitor
// =============================================================================

TEST(fill_opens_position_and_counts_trade) {
    Fixture f;
    f.client.set_closes(falling_closes());
    CycleResult r = f.harness.run_cycle(StrategyKind::Rsi, "BTC_USDT");
    ASSERT_TRUE(r.submitted);

    ASSERT_EQ(f.harness.poll_orders(), 0u); // still pending

    f.client.set_order_status(r.order_id, OrderStatus::Filled, 8.0, 61.5);
    ASSERT_EQ(f.harness.poll_orders(), 1u);

    auto pos = f.positions.get(BTC_LONG);
    ASSERT_TRUE(pos.has_value());
    ASSERT_NEAR(pos->size, 8.0, 1e-12);
    ASSERT_NEAR(pos->entry_price, 61.5, 1e-12);
    ASSERT_NEAR(pos->stop_loss_price, r.signal.stop_loss, 1e-9);
    ASSERT_EQ(f.risk.daily_trades(), 1);
    ASSERT_FALSE(f.orders.has_open(BTC_LONG));
    ASSERT_EQ(f.orders.size(), 0u);
    ASSERT_TRUE(f.notifier.received("Order Filled"));
    ASSERT_EQ(f.store.trades.back()["event"], "order_update");

    // An open position now blocks a new entry on the same side
    CycleResult again = f.harness.run_cycle(StrategyKind::Rsi, "BTC_USDT");
    ASSERT_FALSE(again.submitted);
    ASSERT_TRUE(contains(again.signal.reason, "Position already open"));
}

TEST(partial_cancel_opens_filled_part) {
    Fixture f;
    f.client.set_closes(falling_closes());
    CycleResult r = f.harness.run_cycle(StrategyKind::Rsi, "BTC_USDT");

    f.client.set_order_status(r.order_id, OrderStatus::Canceled, 2.0, 61.0);
    ASSERT_EQ(f.harness.poll_orders(), 1u);
    ASSERT_NEAR(f.positions.get(BTC_LONG)->size, 2.0, 1e-12);
    ASSERT_TRUE(f.notifier.received("Order Canceled"));
}

TEST(rejected_order_opens_nothing) {
    Fixture f;
    f.client.set_closes(falling_closes());
    CycleResult r = f.harness.run_cycle(StrategyKind::Rsi, "BTC_USDT");

    f.client.set_order_status(r.order_id, OrderStatus::Rejected);
    ASSERT_EQ(f.harness.poll_orders(), 1u);
    ASSERT_FALSE(f.positions.has_position(BTC_LONG));
    ASSERT_EQ(f.risk.daily_trades(), 0);
}

int main() {
    std::cout << "\n=== Execution Harness Tests ===\n\n";

    std::cout << "Precondition Tests:\n";
    RUN_TEST(outside_trading_hours_holds);
    RUN_TEST(window_wrapping_midnight_allows);
    RUN_TEST(insufficient_balance_holds);
    RUN_TEST(balance_failure_holds);

    std::cout << "\nHealth Tests:\n";
    RUN_TEST(healthy_when_everything_is_up);
    RUN_TEST(unhealthy_without_api_or_balance);
    RUN_TEST(degraded_when_one_side_is_up);
    RUN_TEST(invalid_config_is_not_healthy);
    RUN_TEST(degraded_cycle_still_evaluates);

    std::cout << "\nEvaluation Tests:\n";
    RUN_TEST(neutral_market_holds_with_strategy_reason);
    RUN_TEST(evaluation_timeout_holds_without_fallback);
    RUN_TEST(failure_falls_back_to_rsi);
    RUN_TEST(failure_with_neutral_fallback_reports_error);
    RUN_TEST(network_failure_is_classified);
    RUN_TEST(ticker_price_preferred_over_last_close);

    std::cout << "\nSubmission Tests:\n";
    RUN_TEST(buy_signal_places_order);
    RUN_TEST(one_open_order_per_symbol_side);
    RUN_TEST(ack_without_order_id_is_not_tracked);
    RUN_TEST(conflicting_breakout_submits_nothing);
    RUN_TEST(risk_rejection_holds);
    RUN_TEST(invalid_signal_is_rejected);
    RUN_TEST(rsi_filter_blocks_against_trend);
    RUN_TEST(order_failure_notifies);

    std::cout << "\nOrder Monitor Tests:\n";
    RUN_TEST(fill_opens_position_and_counts_trade);
    RUN_TEST(partial_cancel_opens_filled_part);
    RUN_TEST(rejected_order_opens_nothing);

    std::cout << "\n=== All Execution Harness Tests Passed! ===\n";
    return 0;
}
