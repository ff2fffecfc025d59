#pragma once

#include "../config/trading_config.hpp"
#include "../exchange/iexchange_client.hpp"
#include "../logging/async_logger.hpp"
#include "../types.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace autotrade {
namespace position {

/**
 * Position - one open exposure, keyed by (symbol, side).
 *
 * Lifecycle:
 *   OPENED -> (tick)* -> TP1_HIT -> (tick)* -> TP2_HIT / CLOSED
 * breakeven_moved and trailing_enabled are flags on top of that.
 *
 * Once tp1_hit is set, stop_loss_price only moves in the profit direction:
 * non-decreasing for a long, non-increasing for a short.
 */
struct Position {
    std::string symbol;
    Side side = Side::Buy;
    double size = 0.0;
    double entry_price = 0.0;
    double mark_price = 0.0;
    int leverage = 1;
    double unrealized_pnl = 0.0;
    double realized_pnl = 0.0;

    bool tp1_hit = false;
    bool tp2_hit = false;
    bool breakeven_moved = false;
    bool trailing_enabled = false;
    double trailing_stop_price = 0.0;
    double trailing_reference_price = 0.0; // price at the last trailing update
    double stop_loss_price = 0.0;

    bool exit_triggered = false;
    std::string exit_reason;
    std::string close_order_id; // pending close, polled on later ticks
    bool closing = false;       // close call in flight, other ticks skip the position

    std::string strategy_name;
    TimestampMs opened_at = 0;

    PositionKey key() const { return PositionKey{symbol, side}; }
    bool is_long() const { return side == Side::Buy; }

    // Percent move in the position's favor
    double profit_pct(double price) const {
        if (entry_price <= 0.0)
            return 0.0;
        double move = (price - entry_price) / entry_price * 100.0;
        return is_long() ? move : -move;
    }

    double pnl_at(double price) const { return (is_long() ? price - entry_price : entry_price - price) * size; }

    // True if `candidate` is a tighter (more protective) stop than the current one
    bool improves_stop(double candidate) const {
        if (stop_loss_price <= 0.0)
            return true;
        return is_long() ? candidate > stop_loss_price : candidate < stop_loss_price;
    }

    bool stop_crossed(double price) const {
        if (stop_loss_price <= 0.0)
            return false;
        return is_long() ? price <= stop_loss_price : price >= stop_loss_price;
    }
};

enum class PositionEvent : uint8_t {
    Tp1Hit,
    BreakevenMoved,
    TrailingUpdated,
    Tp2Hit,
    StopLossHit,
    ExitSubmitted,
    ExitFailed,
    Closed
};

inline const char* position_event_to_string(PositionEvent event) {
    switch (event) {
    case PositionEvent::Tp1Hit:
        return "TP1_HIT";
    case PositionEvent::BreakevenMoved:
        return "BREAKEVEN_MOVED";
    case PositionEvent::TrailingUpdated:
        return "TRAILING_UPDATED";
    case PositionEvent::Tp2Hit:
        return "TP2_HIT";
    case PositionEvent::StopLossHit:
        return "STOP_LOSS_HIT";
    case PositionEvent::ExitSubmitted:
        return "EXIT_SUBMITTED";
    case PositionEvent::ExitFailed:
        return "EXIT_FAILED";
    case PositionEvent::Closed:
        return "CLOSED";
    }
    return "UNKNOWN";
}

struct TickResult {
    std::vector<PositionEvent> events;
    bool closed = false;

    bool has(PositionEvent e) const {
        for (auto ev : events) {
            if (ev == e)
                return true;
        }
        return false;
    }
};

struct ClosedPosition {
    Position position; // final state, realized_pnl filled in
    double exit_price = 0.0;
};

/**
 * PositionStateMachine - exit management for every open position of one
 * instance.
 *
 * Per tick, in order:
 *   1. pending close order: poll it; filled -> remove, otherwise wait
 *   2. hard stop: price crossed stop_loss_price (initial, breakeven or
 *      trailing) -> close
 *   3. breakeven: profit >= breakeven_percentage -> stop to entry, once
 *   4. TP1: profit >= tp1_percentage -> tp1_hit, trailing on; stays open
 *   5. trailing (after TP1): price moved >= step since the last update ->
 *      candidate stop `distance` behind price, adopted only if tighter
 *   6. TP2 (after TP1): profit >= tp2_percentage -> close
 *
 * A position is removed only after the exchange confirms the close. Close
 * failures are logged and retried on the next tick. Thread-safe; exchange
 * calls run without mutex_ held, so queries never wait on the network.
 */
class PositionStateMachine {
public:
    using ClosedCallback = std::function<void(const ClosedPosition&)>;
    using WallClockMs = std::function<uint64_t()>;

    PositionStateMachine(config::ExitParams exits, double stop_loss_percentage, exchange::IExchangeClient& client,
                         logging::AsyncLogger& logger, WallClockMs clock = nullptr);

    // Non-copyable
    PositionStateMachine(const PositionStateMachine&) = delete;
    PositionStateMachine& operator=(const PositionStateMachine&) = delete;

    /**
     * Track a new position from a filled entry.
     * stop_loss 0 derives it from stop_loss_percentage.
     * A second fill on an existing key averages into it.
     */
    Position open_position(const std::string& symbol, Side side, double size, double entry_price, int leverage,
                           double stop_loss = 0.0, const std::string& strategy_name = {});

    /// Apply one price tick to the position for `key`
    TickResult on_price(const PositionKey& key, double price);

    /// Apply a price to both sides of a symbol
    std::vector<TickResult> on_symbol_price(const std::string& symbol, double price);

    /// Close a position regardless of its exit levels (risk reductions)
    bool force_exit(const PositionKey& key, const std::string& reason);

    bool has_position(const PositionKey& key) const;
    std::optional<Position> get(const PositionKey& key) const;
    std::vector<Position> positions() const;
    std::vector<std::string> symbols() const;
    size_t size() const;

    void set_closed_callback(ClosedCallback cb);
    void update_exits(config::ExitParams exits, double stop_loss_percentage);
    config::ExitParams exits() const;

private:
    config::ExitParams exits_;
    double stop_loss_percentage_;
    exchange::IExchangeClient& client_;
    logging::AsyncLogger& logger_;
    WallClockMs clock_;

    mutable std::mutex mutex_;
    std::map<PositionKey, Position> positions_;
    ClosedCallback closed_callback_;

    // Exchange side of one close step, copied out of the position under mutex_
    struct CloseAttempt {
        bool submit = false; // place the close order before polling
        std::string symbol;
        Side side = Side::Buy;
        double size = 0.0;
        std::string order_id;
    };

    struct CloseOutcome {
        bool submitted = false;
        bool submit_failed = false;
        bool confirmed = false; // acknowledged without an id to poll
        std::string order_id;
        std::optional<exchange::OrderInfo> info;
        std::string error;
    };

    // Caller holds mutex_; marks the position closing
    CloseAttempt begin_close(Position& pos, bool submit);

    // Caller must not hold mutex_
    CloseOutcome run_close(const CloseAttempt& attempt);
    TickResult finish_close(const PositionKey& key, const CloseAttempt& attempt, double price, TickResult result);

    // Caller holds mutex_. Returns a closed record when the exit completed.
    std::optional<ClosedPosition> apply_close(Position& pos, const CloseOutcome& outcome, double price,
                                              TickResult& result);
    ClosedPosition finalize(Position& pos, double exit_price, TickResult& result);
    void apply_levels(Position& pos, double price, TickResult& result);

    void emit_closed(const std::vector<ClosedPosition>& closed);
};

}  // namespace position
}  // namespace autotrade
