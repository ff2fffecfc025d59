#pragma once

#include "../exchange/exchange_types.hpp"
#include "../types.hpp"

#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace autotrade {
namespace execution {

/**
 * Order as submitted by this instance.
 * Status is mutated only by the order monitor; FILLED / CANCELED /
 * REJECTED are terminal.
 */
struct TrackedOrder {
    std::string id;
    std::string symbol;
    Side side = Side::Buy;
    OrderType type = OrderType::Market;
    double quantity = 0.0;
    double price = 0.0;
    double stop_loss = 0.0;
    double take_profit = 0.0;
    OrderStatus status = OrderStatus::Pending;
    double filled_quantity = 0.0;
    double avg_price = 0.0;
    std::string strategy_name;
    TimestampMs created_at = 0;

    PositionKey key() const { return PositionKey{symbol, side}; }
    bool is_open() const { return !is_terminal(status); }
};

struct OrderTransition {
    TrackedOrder order; // after the update
    OrderStatus previous = OrderStatus::Pending;

    bool changed() const { return previous != order.status; }
};

/**
 * OrderTracker - open orders of one instance, keyed by exchange order id.
 *
 * Enforces at most one open order per (symbol, side) before submission.
 * Thread-safe.
 */
class OrderTracker {
public:
    /// True if a non-terminal order exists for the key
    bool has_open(const PositionKey& key) const;

    /// @return false if an open order for the same key already exists
    bool add(TrackedOrder order);

    /**
     * Apply an exchange order snapshot.
     * @return the transition, or nullopt for an unknown id
     */
    std::optional<OrderTransition> apply(const exchange::OrderInfo& info);

    std::optional<TrackedOrder> get(const std::string& id) const;
    std::vector<TrackedOrder> open_orders() const;

    /// Drop terminal orders. Returns the number removed.
    size_t prune();

    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::vector<TrackedOrder> orders_;
};

}  // namespace execution
}  // namespace autotrade
