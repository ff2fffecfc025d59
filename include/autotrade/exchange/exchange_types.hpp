#pragma once

#include "../types.hpp"

#include <string>
#include <vector>

namespace autotrade {
namespace exchange {

/**
 * Normalized exchange data.
 *
 * Every API dialect is mapped into these structs by a ResponseAdapter,
 * so nothing above the client ever sees raw field names.
 */

struct Balance {
    std::string asset;
    double free = 0.0;
    double frozen = 0.0;

    double total() const { return free + frozen; }
};

struct AccountBalance {
    std::vector<Balance> balances;

    // Asset entry, or a zero balance if absent
    Balance find(const std::string& asset) const {
        for (const auto& b : balances) {
            if (b.asset == asset)
                return b;
        }
        Balance empty;
        empty.asset = asset;
        return empty;
    }
};

struct OrderRequest {
    std::string symbol;
    Side side = Side::Buy;
    OrderType type = OrderType::Market;
    double quantity = 0.0;
    double price = 0.0;            // LIMIT only
    double activation_price = 0.0; // stop-loss / take-profit trigger
    double callback_rate = 0.0;    // trailing stop, percent
    std::string client_order_id;   // optional
};

struct OrderAck {
    std::string order_id;
    std::string client_order_id;
};

struct OrderInfo {
    std::string order_id;
    std::string client_order_id;
    std::string symbol;
    Side side = Side::Buy;
    std::string type;
    double price = 0.0;
    double quantity = 0.0;
    double filled_quantity = 0.0;
    double avg_price = 0.0;
    OrderStatus status = OrderStatus::Pending;
    TimestampMs created_at = 0;
};

struct Kline {
    TimestampMs open_time = 0;
    double open = 0.0;
    double high = 0.0;
    double low = 0.0;
    double close = 0.0;
    double volume = 0.0;
};

struct Ticker {
    std::string symbol;
    double open = 0.0;
    double high = 0.0;
    double low = 0.0;
    double close = 0.0; // last price
    double volume = 0.0;
    double amount = 0.0; // quote volume
    TimestampMs time = 0;
};

struct DepthLevel {
    double price = 0.0;
    double size = 0.0;
};

struct DepthBook {
    std::vector<DepthLevel> bids; // best first
    std::vector<DepthLevel> asks; // best first
    TimestampMs updated_at = 0;
};

struct PublicTrade {
    std::string trade_id;
    std::string symbol;
    Side side = Side::Buy;
    double price = 0.0;
    double size = 0.0;
    TimestampMs timestamp = 0;
};

struct Fill {
    std::string fill_id;
    std::string order_id;
    std::string symbol;
    Side side = Side::Buy;
    double price = 0.0;
    double size = 0.0;
    double fee = 0.0;
    std::string fee_asset;
    TimestampMs timestamp = 0;
};

}  // namespace exchange
}  // namespace autotrade
