#include "../../include/autotrade/execution/order_tracker.hpp"

#include <algorithm>

namespace autotrade::execution {

bool OrderTracker::has_open(const PositionKey& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::any_of(orders_.begin(), orders_.end(),
                       [&key](const TrackedOrder& o) { return o.is_open() && o.key() == key; });
}

bool OrderTracker::add(TrackedOrder order) {
    std::lock_guard<std::mutex> lock(mutex_);
    PositionKey key = order.key();
    for (const auto& o : orders_) {
        if (o.is_open() && o.key() == key)
            return false;
    }
    orders_.push_back(std::move(order));
    return true;
}

std::optional<OrderTransition> OrderTracker::apply(const exchange::OrderInfo& info) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& o : orders_) {
        if (o.id != info.order_id)
            continue;

        OrderTransition t;
        t.previous = o.status;
        // Terminal states are final
        if (!is_terminal(o.status)) {
            o.status = info.status;
            if (info.filled_quantity > 0.0)
                o.filled_quantity = info.filled_quantity;
            if (info.avg_price > 0.0)
                o.avg_price = info.avg_price;
        }
        t.order = o;
        return t;
    }
    return std::nullopt;
}

std::optional<TrackedOrder> OrderTracker::get(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& o : orders_) {
        if (o.id == id)
            return o;
    }
    return std::nullopt;
}

std::vector<TrackedOrder> OrderTracker::open_orders() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<TrackedOrder> out;
    for (const auto& o : orders_) {
        if (o.is_open())
            out.push_back(o);
    }
    return out;
}

size_t OrderTracker::prune() {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t before = orders_.size();
    orders_.erase(std::remove_if(orders_.begin(), orders_.end(), [](const TrackedOrder& o) { return !o.is_open(); }),
                  orders_.end());
    return before - orders_.size();
}

size_t OrderTracker::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return orders_.size();
}

} // namespace autotrade::execution
