#include "../../include/autotrade/position/position_state_machine.hpp"
#include "../../include/autotrade/util/time_utils.hpp"

#include <cmath>

namespace autotrade::position {

PositionStateMachine::PositionStateMachine(config::ExitParams exits, double stop_loss_percentage,
                                           exchange::IExchangeClient& client, logging::AsyncLogger& logger,
                                           WallClockMs clock)
    : exits_(std::move(exits))
    , stop_loss_percentage_(stop_loss_percentage)
    , client_(client)
    , logger_(logger)
    , clock_(clock ? std::move(clock) : WallClockMs(util::wall_clock_ms)) {}

// =============================================================================
// Opening
// =============================================================================

Position PositionStateMachine::open_position(const std::string& symbol, Side side, double size, double entry_price,
                                             int leverage, double stop_loss, const std::string& strategy_name) {
    std::lock_guard<std::mutex> lock(mutex_);
    PositionKey key{symbol, side};

    auto it = positions_.find(key);
    if (it != positions_.end()) {
        // Average a further fill into the existing exposure
        Position& pos = it->second;
        double total = pos.size + size;
        if (total > 0.0) {
            pos.entry_price = (pos.entry_price * pos.size + entry_price * size) / total;
        }
        pos.size = total;
        AUTOTRADE_LOGF_INFO(logger_, Position, "%s increased to %.6f @ avg %.4f", key.to_string().c_str(), pos.size,
                            pos.entry_price);
        return pos;
    }

    Position pos;
    pos.symbol = symbol;
    pos.side = side;
    pos.size = size;
    pos.entry_price = entry_price;
    pos.mark_price = entry_price;
    pos.leverage = leverage > 0 ? leverage : 1;
    pos.strategy_name = strategy_name;
    pos.opened_at = clock_();

    double sl = stop_loss_percentage_ / 100.0;
    if (stop_loss > 0.0) {
        pos.stop_loss_price = stop_loss;
    } else {
        pos.stop_loss_price = side == Side::Buy ? entry_price * (1.0 - sl) : entry_price * (1.0 + sl);
    }

    AUTOTRADE_LOGF_INFO(logger_, Position, "Opened %s size %.6f @ %.4f, SL %.4f", key.to_string().c_str(), size,
                        entry_price, pos.stop_loss_price);
    positions_[key] = pos;
    return pos;
}

// =============================================================================
// Ticks
// =============================================================================

TickResult PositionStateMachine::on_price(const PositionKey& key, double price) {
    TickResult result;
    std::optional<CloseAttempt> attempt;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = positions_.find(key);
        if (it == positions_.end() || price <= 0.0)
            return result;

        Position& pos = it->second;
        if (pos.closing)
            return result;
        pos.mark_price = price;
        pos.unrealized_pnl = pos.pnl_at(price);

        if (!pos.close_order_id.empty()) {
            attempt = begin_close(pos, false);
        } else if (pos.exit_triggered) {
            // Previous close attempt failed
            attempt = begin_close(pos, true);
        } else if (pos.stop_crossed(price)) {
            result.events.push_back(PositionEvent::StopLossHit);
            pos.exit_triggered = true;
            if (pos.trailing_stop_price > 0.0 && pos.stop_loss_price == pos.trailing_stop_price)
                pos.exit_reason = "TRAILING_STOP";
            else if (pos.breakeven_moved && pos.stop_loss_price == pos.entry_price)
                pos.exit_reason = "BREAKEVEN_STOP";
            else
                pos.exit_reason = "STOP_LOSS";
            AUTOTRADE_LOGF_INFO(logger_, Position, "%s %s at %.4f (stop %.4f)", key.to_string().c_str(),
                                pos.exit_reason.c_str(), price, pos.stop_loss_price);
            attempt = begin_close(pos, true);
        } else {
            apply_levels(pos, price, result);

            if (pos.tp1_hit && !pos.tp2_hit && pos.profit_pct(price) >= exits_.tp2_percentage) {
                pos.tp2_hit = true;
                pos.exit_triggered = true;
                pos.exit_reason = "TP2";
                result.events.push_back(PositionEvent::Tp2Hit);
                AUTOTRADE_LOGF_INFO(logger_, Position, "%s TP2 hit at %.4f (%.2f%%)", key.to_string().c_str(), price,
                                    pos.profit_pct(price));
                attempt = begin_close(pos, true);
            }
        }
    }

    if (!attempt)
        return result;
    return finish_close(key, *attempt, price, std::move(result));
}

std::vector<TickResult> PositionStateMachine::on_symbol_price(const std::string& symbol, double price) {
    std::vector<TickResult> results;
    for (Side side : {Side::Buy, Side::Sell}) {
        PositionKey key{symbol, side};
        if (has_position(key)) {
            results.push_back(on_price(key, price));
        }
    }
    return results;
}

void PositionStateMachine::apply_levels(Position& pos, double price, TickResult& result) {
    double profit = pos.profit_pct(price);
    std::string key = pos.key().to_string();

    if (!pos.breakeven_moved && profit >= exits_.breakeven_percentage) {
        pos.breakeven_moved = true;
        if (pos.improves_stop(pos.entry_price)) {
            pos.stop_loss_price = pos.entry_price;
            result.events.push_back(PositionEvent::BreakevenMoved);
            AUTOTRADE_LOGF_INFO(logger_, Position, "%s stop moved to breakeven %.4f", key.c_str(), pos.entry_price);
        }
    }

    double distance = exits_.trailing_distance_percentage / 100.0;
    auto trail_candidate = [&pos, distance](double p) {
        return pos.is_long() ? p * (1.0 - distance) : p * (1.0 + distance);
    };

    if (!pos.tp1_hit) {
        if (profit >= exits_.tp1_percentage) {
            // TP1 arms the trailing stop; the position stays open
            pos.tp1_hit = true;
            result.events.push_back(PositionEvent::Tp1Hit);
            AUTOTRADE_LOGF_INFO(logger_, Position, "%s TP1 hit at %.4f (%.2f%%)", key.c_str(), price, profit);

            if (exits_.trailing_enabled) {
                pos.trailing_enabled = true;
                pos.trailing_reference_price = price;
                double candidate = trail_candidate(price);
                if (pos.improves_stop(candidate)) {
                    pos.stop_loss_price = candidate;
                    pos.trailing_stop_price = candidate;
                    result.events.push_back(PositionEvent::TrailingUpdated);
                }
            }
        }
        return;
    }

    if (!pos.trailing_enabled || pos.trailing_reference_price <= 0.0)
        return;

    double moved = std::abs(price - pos.trailing_reference_price) / pos.trailing_reference_price * 100.0;
    if (moved < exits_.trailing_step_percentage)
        return;

    double candidate = trail_candidate(price);
    if (pos.improves_stop(candidate)) {
        pos.stop_loss_price = candidate;
        pos.trailing_stop_price = candidate;
        pos.trailing_reference_price = price;
        result.events.push_back(PositionEvent::TrailingUpdated);
        AUTOTRADE_LOGF_DEBUG(logger_, Position, "%s trailing stop -> %.4f", key.c_str(), candidate);
    }
}

// =============================================================================
// Exits
// =============================================================================

PositionStateMachine::CloseAttempt PositionStateMachine::begin_close(Position& pos, bool submit) {
    pos.closing = true;
    CloseAttempt attempt;
    attempt.submit = submit;
    attempt.symbol = pos.symbol;
    attempt.side = pos.side;
    attempt.size = pos.size;
    attempt.order_id = pos.close_order_id;
    return attempt;
}

PositionStateMachine::CloseOutcome PositionStateMachine::run_close(const CloseAttempt& attempt) {
    CloseOutcome outcome;
    outcome.order_id = attempt.order_id;

    if (attempt.submit) {
        exchange::OrderAck ack;
        try {
            ack = client_.close_position(attempt.symbol, attempt.side, attempt.size);
        } catch (const std::exception& e) {
            outcome.submit_failed = true;
            outcome.error = e.what();
            return outcome;
        }
        outcome.submitted = true;
        if (ack.order_id.empty()) {
            outcome.confirmed = true;
            return outcome;
        }
        outcome.order_id = ack.order_id;
    }

    try {
        outcome.info = client_.get_order(attempt.symbol, outcome.order_id);
    } catch (const std::exception& e) {
        outcome.error = e.what();
    }
    return outcome;
}

TickResult PositionStateMachine::finish_close(const PositionKey& key, const CloseAttempt& attempt, double price,
                                              TickResult result) {
    CloseOutcome outcome = run_close(attempt);
    std::vector<ClosedPosition> closed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = positions_.find(key);
        if (it == positions_.end())
            return result;

        auto done = apply_close(it->second, outcome, price, result);
        if (done) {
            closed.push_back(*done);
            positions_.erase(it);
            result.closed = true;
        }
    }
    emit_closed(closed);
    return result;
}

std::optional<ClosedPosition> PositionStateMachine::apply_close(Position& pos, const CloseOutcome& outcome,
                                                                double price, TickResult& result) {
    std::string key = pos.key().to_string();
    pos.closing = false;

    if (outcome.submit_failed) {
        result.events.push_back(PositionEvent::ExitFailed);
        AUTOTRADE_LOGF_ERROR(logger_, Position, "Close of %s failed, retrying next tick: %s", key.c_str(),
                             outcome.error.c_str());
        return std::nullopt;
    }
    if (outcome.submitted)
        result.events.push_back(PositionEvent::ExitSubmitted);

    if (outcome.confirmed) {
        // Accepted without an id to poll: the acknowledgement is the confirmation
        return finalize(pos, price, result);
    }

    pos.close_order_id = outcome.order_id;
    if (!outcome.info) {
        AUTOTRADE_LOGF_WARN(logger_, Position, "Close order %s for %s not confirmed yet: %s",
                            pos.close_order_id.c_str(), key.c_str(), outcome.error.c_str());
        return std::nullopt;
    }

    const exchange::OrderInfo& info = *outcome.info;
    switch (info.status) {
    case OrderStatus::Filled:
        return finalize(pos, info.avg_price > 0.0 ? info.avg_price : price, result);
    case OrderStatus::Canceled:
    case OrderStatus::Rejected:
        AUTOTRADE_LOGF_WARN(logger_, Position, "Close order %s for %s %s, resubmitting", pos.close_order_id.c_str(),
                            key.c_str(), order_status_to_string(info.status));
        pos.close_order_id.clear();
        result.events.push_back(PositionEvent::ExitFailed);
        return std::nullopt; // retried on the next tick
    default:
        return std::nullopt;
    }
}

ClosedPosition PositionStateMachine::finalize(Position& pos, double exit_price, TickResult& result) {
    pos.realized_pnl = pos.pnl_at(exit_price);
    pos.unrealized_pnl = 0.0;
    pos.mark_price = exit_price;
    result.events.push_back(PositionEvent::Closed);
    AUTOTRADE_LOGF_INFO(logger_, Position, "Closed %s @ %.4f (%s), PnL %.2f", pos.key().to_string().c_str(),
                        exit_price, pos.exit_reason.c_str(), pos.realized_pnl);
    return ClosedPosition{pos, exit_price};
}

bool PositionStateMachine::force_exit(const PositionKey& key, const std::string& reason) {
    CloseAttempt attempt;
    double price;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = positions_.find(key);
        if (it == positions_.end())
            return false;

        Position& pos = it->second;
        if (pos.closing || !pos.close_order_id.empty())
            return true; // already closing

        pos.exit_triggered = true;
        pos.exit_reason = reason;
        AUTOTRADE_LOGF_WARN(logger_, Position, "Forced exit of %s: %s", key.to_string().c_str(), reason.c_str());

        price = pos.mark_price > 0.0 ? pos.mark_price : pos.entry_price;
        attempt = begin_close(pos, true);
    }
    TickResult result = finish_close(key, attempt, price, TickResult{});
    return !result.has(PositionEvent::ExitFailed);
}

void PositionStateMachine::emit_closed(const std::vector<ClosedPosition>& closed) {
    if (closed.empty())
        return;
    ClosedCallback cb;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cb = closed_callback_;
    }
    if (!cb)
        return;
    for (const auto& c : closed) {
        cb(c);
    }
}

// =============================================================================
// Queries
// =============================================================================

bool PositionStateMachine::has_position(const PositionKey& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return positions_.count(key) > 0;
}

std::optional<Position> PositionStateMachine::get(const PositionKey& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = positions_.find(key);
    if (it == positions_.end())
        return std::nullopt;
    return it->second;
}

std::vector<Position> PositionStateMachine::positions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Position> out;
    out.reserve(positions_.size());
    for (const auto& [key, pos] : positions_) {
        out.push_back(pos);
    }
    return out;
}

std::vector<std::string> PositionStateMachine::symbols() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> out;
    for (const auto& [key, pos] : positions_) {
        if (out.empty() || out.back() != key.symbol)
            out.push_back(key.symbol);
    }
    return out;
}

size_t PositionStateMachine::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return positions_.size();
}

void PositionStateMachine::set_closed_callback(ClosedCallback cb) {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_callback_ = std::move(cb);
}

void PositionStateMachine::update_exits(config::ExitParams exits, double stop_loss_percentage) {
    std::lock_guard<std::mutex> lock(mutex_);
    exits_ = std::move(exits);
    stop_loss_percentage_ = stop_loss_percentage;
}

config::ExitParams PositionStateMachine::exits() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return exits_;
}

} // namespace autotrade::position
