#include "../include/autotrade/position/position_state_machine.hpp"
#include "mock_exchange_client.hpp"

#include <cassert>
#include <cmath>
#include <condition_variable>
#include <iostream>
#include <mutex>
#include <thread>

using namespace autotrade;
using namespace autotrade::position;
using autotrade::testing::MockExchangeClient;

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

const PositionKey LONG_KEY{"BTC_USDT", Side::Buy};
const PositionKey SHORT_KEY{"BTC_USDT", Side::Sell};
const PositionKey ETH_KEY{"ETH_USDT", Side::Buy};

// close_position parks until release()
class GatedCloseClient : public MockExchangeClient {
public:
    exchange::OrderAck close_position(const std::string& symbol, Side side, double size) override {
        {
            std::unique_lock<std::mutex> lock(gate_mutex_);
            entered_ = true;
            gate_cv_.notify_all();
            gate_cv_.wait(lock, [this] { return released_; });
        }
        return MockExchangeClient::close_position(symbol, side, size);
    }

    void wait_entered() {
        std::unique_lock<std::mutex> lock(gate_mutex_);
        gate_cv_.wait(lock, [this] { return entered_; });
    }

    void release() {
        std::lock_guard<std::mutex> lock(gate_mutex_);
        released_ = true;
        gate_cv_.notify_all();
    }

private:
    std::mutex gate_mutex_;
    std::condition_variable gate_cv_;
    bool entered_ = false;
    bool released_ = false;
};

struct Fixture {
    MockExchangeClient client;
    logging::AsyncLogger logger;
    PositionStateMachine psm;
    std::vector<ClosedPosition> closed;

    Fixture()
        : psm(config::ExitParams{}, 1.5, client, logger, [] { return uint64_t{1700000000000ULL}; }) {
        logger.set_min_level(logging::LogLevel::Fatal);
        psm.set_closed_callback([this](const ClosedPosition& c) { closed.push_back(c); });
    }
};

} // namespace

// =============================================================================
// Opening
// =============================================================================

TEST(open_derives_stop_from_percentage) {
    Fixture f;
    Position pos = f.psm.open_position("BTC_USDT", Side::Buy, 2.0, 100.0, 10);
    ASSERT_NEAR(pos.stop_loss_price, 98.5, 1e-9);
    ASSERT_FALSE(pos.tp1_hit);
    ASSERT_TRUE(f.psm.has_position(LONG_KEY));
    ASSERT_FALSE(f.psm.has_position(SHORT_KEY));

    Position s = f.psm.open_position("BTC_USDT", Side::Sell, 1.0, 100.0, 10);
    ASSERT_NEAR(s.stop_loss_price, 101.5, 1e-9);
    ASSERT_EQ(f.psm.size(), 2u);
    ASSERT_EQ(f.psm.symbols().size(), 1u);
}

TEST(second_fill_averages_entry) {
    Fixture f;
    f.psm.open_position("BTC_USDT", Side::Buy, 1.0, 100.0, 10);
    Position pos = f.psm.open_position("BTC_USDT", Side::Buy, 1.0, 110.0, 10);
    ASSERT_NEAR(pos.size, 2.0, 1e-12);
    ASSERT_NEAR(pos.entry_price, 105.0, 1e-9);
    ASSERT_EQ(f.psm.size(), 1u);
}

// =============================================================================
// Take profit and trailing
// =============================================================================

TEST(tp1_arms_trailing_and_stays_open) {
    Fixture f;
    f.psm.open_position("BTC_USDT", Side::Buy, 1.0, 100.0, 10);

    TickResult r = f.psm.on_price(LONG_KEY, 103.0);
    ASSERT_TRUE(r.has(PositionEvent::Tp1Hit));
    ASSERT_TRUE(r.has(PositionEvent::BreakevenMoved));
    ASSERT_TRUE(r.has(PositionEvent::TrailingUpdated));
    ASSERT_FALSE(r.closed);

    auto pos = f.psm.get(LONG_KEY);
    ASSERT_TRUE(pos.has_value());
    ASSERT_TRUE(pos->tp1_hit);
    ASSERT_TRUE(pos->trailing_enabled);
    ASSERT_TRUE(pos->breakeven_moved);
    ASSERT_NEAR(pos->stop_loss_price, 101.97, 1e-9);
    ASSERT_EQ(f.client.place_count(), 0u);
}

TEST(breakeven_moves_stop_to_entry) {
    Fixture f;
    f.psm.open_position("BTC_USDT", Side::Buy, 1.0, 100.0, 10);
    TickResult r = f.psm.on_price(LONG_KEY, 101.2);
    ASSERT_TRUE(r.has(PositionEvent::BreakevenMoved));
    ASSERT_FALSE(r.has(PositionEvent::Tp1Hit));
    ASSERT_NEAR(f.psm.get(LONG_KEY)->stop_loss_price, 100.0, 1e-12);

    // Falling back to entry exits at breakeven
    f.client.set_default_status(OrderStatus::Filled);
    TickResult back = f.psm.on_price(LONG_KEY, 100.0);
    ASSERT_TRUE(back.closed);
    ASSERT_EQ(f.closed.size(), 1u);
    ASSERT_EQ(f.closed[0].position.exit_reason, "BREAKEVEN_STOP");
}

TEST(trailing_stop_never_loosens) {
    Fixture f;
    f.psm.open_position("BTC_USDT", Side::Buy, 1.0, 100.0, 10);
    f.psm.on_price(LONG_KEY, 103.0); // stop 101.97

    // Below the step: unchanged
    f.psm.on_price(LONG_KEY, 102.5);
    ASSERT_NEAR(f.psm.get(LONG_KEY)->stop_loss_price, 101.97, 1e-9);

    // New high past the step: tightened
    TickResult up = f.psm.on_price(LONG_KEY, 104.0);
    ASSERT_TRUE(up.has(PositionEvent::TrailingUpdated));
    ASSERT_NEAR(f.psm.get(LONG_KEY)->stop_loss_price, 104.0 * 0.99, 1e-9);

    // Pullback: a lower candidate is ignored
    double before = f.psm.get(LONG_KEY)->stop_loss_price;
    TickResult down = f.psm.on_price(LONG_KEY, 103.4);
    ASSERT_FALSE(down.has(PositionEvent::TrailingUpdated));
    ASSERT_TRUE(f.psm.get(LONG_KEY)->stop_loss_price >= before);
}

TEST(tp2_closes_after_confirmation) {
    Fixture f;
    f.client.set_default_status(OrderStatus::Filled);
    f.psm.open_position("BTC_USDT", Side::Buy, 2.0, 100.0, 10);
    f.psm.on_price(LONG_KEY, 103.0);

    TickResult r = f.psm.on_price(LONG_KEY, 105.0);
    ASSERT_TRUE(r.has(PositionEvent::Tp2Hit));
    ASSERT_TRUE(r.has(PositionEvent::ExitSubmitted));
    ASSERT_TRUE(r.has(PositionEvent::Closed));
    ASSERT_TRUE(r.closed);
    ASSERT_FALSE(f.psm.has_position(LONG_KEY));

    auto order = f.client.last_order();
    ASSERT_EQ(order.side, Side::Sell);
    ASSERT_EQ(order.type, OrderType::Market);
    ASSERT_NEAR(order.quantity, 2.0, 1e-12);

    ASSERT_EQ(f.closed.size(), 1u);
    ASSERT_EQ(f.closed[0].position.exit_reason, "TP2");
    ASSERT_NEAR(f.closed[0].position.realized_pnl, 10.0, 1e-9);
}

// =============================================================================
// Stop loss and close confirmation
// =============================================================================

TEST(stop_loss_waits_for_fill) {
    Fixture f;
    f.psm.open_position("BTC_USDT", Side::Buy, 1.0, 100.0, 10);

    TickResult r = f.psm.on_price(LONG_KEY, 98.0);
    ASSERT_TRUE(r.has(PositionEvent::StopLossHit));
    ASSERT_TRUE(r.has(PositionEvent::ExitSubmitted));
    ASSERT_FALSE(r.closed);
    ASSERT_TRUE(f.psm.has_position(LONG_KEY)); // close still pending
    ASSERT_EQ(f.psm.get(LONG_KEY)->close_order_id, "ord-1");

    // Still pending: nothing resubmitted
    f.psm.on_price(LONG_KEY, 97.9);
    ASSERT_EQ(f.client.place_count(), 1u);

    f.client.set_order_status("ord-1", OrderStatus::Filled, 1.0, 98.2);
    TickResult done = f.psm.on_price(LONG_KEY, 97.8);
    ASSERT_TRUE(done.closed);
    ASSERT_FALSE(f.psm.has_position(LONG_KEY));
    ASSERT_EQ(f.closed.size(), 1u);
    ASSERT_EQ(f.closed[0].position.exit_reason, "STOP_LOSS");
    ASSERT_NEAR(f.closed[0].exit_price, 98.2, 1e-9);
    ASSERT_NEAR(f.closed[0].position.realized_pnl, -1.8, 1e-9);
}

TEST(failed_close_is_retried_next_tick) {
    Fixture f;
    f.client.set_default_status(OrderStatus::Filled);
    f.client.fail_next_place(1);
    f.psm.open_position("BTC_USDT", Side::Buy, 1.0, 100.0, 10);

    TickResult r = f.psm.on_price(LONG_KEY, 98.0);
    ASSERT_TRUE(r.has(PositionEvent::ExitFailed));
    ASSERT_FALSE(r.closed);
    ASSERT_TRUE(f.psm.has_position(LONG_KEY));
    ASSERT_TRUE(f.psm.get(LONG_KEY)->exit_triggered);

    // Retried even though the price recovered above the stop
    TickResult retry = f.psm.on_price(LONG_KEY, 99.0);
    ASSERT_TRUE(retry.closed);
    ASSERT_FALSE(f.psm.has_position(LONG_KEY));
}

TEST(cancelled_close_is_resubmitted) {
    Fixture f;
    f.psm.open_position("BTC_USDT", Side::Buy, 1.0, 100.0, 10);
    f.psm.on_price(LONG_KEY, 98.0);

    f.client.set_order_status("ord-1", OrderStatus::Canceled);
    TickResult r = f.psm.on_price(LONG_KEY, 98.0);
    ASSERT_TRUE(r.has(PositionEvent::ExitFailed));
    ASSERT_TRUE(f.psm.get(LONG_KEY)->close_order_id.empty());

    f.client.set_default_status(OrderStatus::Filled);
    TickResult again = f.psm.on_price(LONG_KEY, 98.0);
    ASSERT_TRUE(again.closed);
    ASSERT_EQ(f.client.place_count(), 2u);
}

// =============================================================================
// Short side
// =============================================================================

TEST(short_mirrors_levels) {
    Fixture f;
    f.client.set_default_status(OrderStatus::Filled);
    f.psm.open_position("BTC_USDT", Side::Sell, 1.0, 100.0, 10);

    TickResult r = f.psm.on_price(SHORT_KEY, 97.0);
    ASSERT_TRUE(r.has(PositionEvent::Tp1Hit));
    ASSERT_NEAR(f.psm.get(SHORT_KEY)->stop_loss_price, 97.0 * 1.01, 1e-9);

    TickResult stop = f.psm.on_price(SHORT_KEY, 98.0);
    ASSERT_TRUE(stop.has(PositionEvent::StopLossHit));
    ASSERT_TRUE(stop.closed);
    ASSERT_EQ(f.closed[0].position.exit_reason, "TRAILING_STOP");
    ASSERT_EQ(f.client.last_order().side, Side::Buy);
    ASSERT_NEAR(f.closed[0].position.realized_pnl, 2.0, 1e-9);
}

TEST(force_exit_closes_regardless_of_levels) {
    Fixture f;
    f.client.set_default_status(OrderStatus::Filled);
    f.psm.open_position("BTC_USDT", Side::Buy, 1.0, 100.0, 10);

    ASSERT_TRUE(f.psm.force_exit(LONG_KEY, "RISK_REDUCTION"));
    ASSERT_FALSE(f.psm.has_position(LONG_KEY));
    ASSERT_EQ(f.closed.size(), 1u);
    ASSERT_EQ(f.closed[0].position.exit_reason, "RISK_REDUCTION");
    ASSERT_FALSE(f.psm.force_exit(LONG_KEY, "RISK_REDUCTION"));
}

// =============================================================================
// Concurrency
// =============================================================================

TEST(queries_do_not_wait_on_close_calls) {
    GatedCloseClient client;
    client.set_default_status(OrderStatus::Filled);
    logging::AsyncLogger logger;
    logger.set_min_level(logging::LogLevel::Fatal);
    PositionStateMachine psm(config::ExitParams{}, 1.5, client, logger, [] { return uint64_t{1700000000000ULL}; });
    psm.open_position("BTC_USDT", Side::Buy, 1.0, 100.0, 10);
    psm.open_position("ETH_USDT", Side::Buy, 1.0, 50.0, 10);

    TickResult stopped;
    std::thread ticker([&] { stopped = psm.on_price(LONG_KEY, 98.0); });
    client.wait_entered();

    // Close call parked on the exchange; everything else proceeds
    ASSERT_EQ(psm.size(), 2u);
    ASSERT_TRUE(psm.has_position(LONG_KEY));
    ASSERT_TRUE(psm.get(LONG_KEY)->closing);
    ASSERT_EQ(psm.positions().size(), 2u);
    ASSERT_TRUE(psm.on_price(LONG_KEY, 97.0).events.empty());
    ASSERT_TRUE(psm.force_exit(LONG_KEY, "RISK_REDUCTION"));
    ASSERT_TRUE(psm.on_price(ETH_KEY, 50.2).events.empty());

    client.release();
    ticker.join();
    ASSERT_TRUE(stopped.closed);
    ASSERT_TRUE(stopped.has(PositionEvent::StopLossHit));
    ASSERT_FALSE(psm.has_position(LONG_KEY));
    ASSERT_EQ(psm.size(), 1u);
    ASSERT_EQ(client.place_count(), 1u);
}

int main() {
    std::cout << "\n=== Position State Machine Tests ===\n\n";

    std::cout << "Opening Tests:\n";
    RUN_TEST(open_derives_stop_from_percentage);
    RUN_TEST(second_fill_averages_entry);

    std::cout << "\nTake Profit Tests:\n";
    RUN_TEST(tp1_arms_trailing_and_stays_open);
    RUN_TEST(breakeven_moves_stop_to_entry);
    RUN_TEST(trailing_stop_never_loosens);
    RUN_TEST(tp2_closes_after_confirmation);

    std::cout << "\nStop Loss Tests:\n";
    RUN_TEST(stop_loss_waits_for_fill);
    RUN_TEST(failed_close_is_retried_next_tick);
    RUN_TEST(cancelled_close_is_resubmitted);

    std::cout << "\nShort Side Tests:\n";
    RUN_TEST(short_mirrors_levels);
    RUN_TEST(force_exit_closes_regardless_of_levels);

    std::cout << "\nConcurrency Tests:\n";
    RUN_TEST(queries_do_not_wait_on_close_calls);

    std::cout << "\n=== All Position State Machine Tests Passed! ===\n";
    return 0;
}
