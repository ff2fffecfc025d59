#pragma once

#include "../types.hpp"

#include <string>

namespace autotrade {
namespace strategy {

// =============================================================================
// Strategy Signal Output
// =============================================================================

/**
 * One decision per trading cycle. Treated as immutable once produced and
 * consumed at most once by the harness.
 */
struct Signal {
    std::string symbol;
    Action action = Action::Hold;
    double quantity = 0.0;
    double price = 0.0;
    double stop_loss = 0.0;
    double take_profit = 0.0;
    OrderType order_type = OrderType::Market;
    std::string strategy_name;
    double confidence = 0.0; // 0..1
    TimestampMs timestamp_ms = 0;
    std::string reason; // Human-readable, always set for HOLD

    bool is_hold() const { return action == Action::Hold; }

    // Only BUY/SELL with a positive size and price may become an order
    bool is_actionable() const { return action != Action::Hold && quantity > 0.0 && price > 0.0; }

    Side side() const { return action == Action::Sell ? Side::Sell : Side::Buy; }

    // Factory methods
    static Signal hold(std::string reason, std::string symbol = {}) {
        Signal s;
        s.symbol = std::move(symbol);
        s.reason = std::move(reason);
        return s;
    }
};

}  // namespace strategy
}  // namespace autotrade
