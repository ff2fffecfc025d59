#pragma once

#include <cstdint>
#include <string>
#include <tuple>

namespace autotrade {

// Millisecond wall-clock timestamps, as used on the exchange wire
using TimestampMs = uint64_t;

enum class Side : uint8_t { Buy = 0, Sell = 1 };

// Strategy decision. Hold is never submitted.
enum class Action : uint8_t { Hold = 0, Buy, Sell };

enum class OrderType : uint8_t {
    Market,      // Sent with IOC
    Limit,       // Sent with GTC
    StopLoss,    // Stop-market, triggered at activation price
    TakeProfit,  // Take-profit-market, triggered at activation price
    TrailingStop // Trailing stop-market with callback rate
};

enum class OrderStatus : uint8_t { Pending, PartiallyFilled, Filled, Canceled, Rejected };

inline const char* side_to_string(Side side) {
    return side == Side::Buy ? "BUY" : "SELL";
}

inline Side opposite(Side side) {
    return side == Side::Buy ? Side::Sell : Side::Buy;
}

inline const char* action_to_string(Action action) {
    switch (action) {
    case Action::Buy:
        return "BUY";
    case Action::Sell:
        return "SELL";
    default:
        return "HOLD";
    }
}

inline const char* order_type_to_string(OrderType type) {
    switch (type) {
    case OrderType::Market:
        return "MARKET";
    case OrderType::Limit:
        return "LIMIT";
    case OrderType::StopLoss:
        return "STOP_LOSS";
    case OrderType::TakeProfit:
        return "TAKE_PROFIT";
    case OrderType::TrailingStop:
        return "TRAILING_STOP";
    }
    return "MARKET";
}

inline OrderType order_type_from_string(const std::string& s) {
    if (s == "LIMIT") return OrderType::Limit;
    if (s == "STOP_LOSS") return OrderType::StopLoss;
    if (s == "TAKE_PROFIT") return OrderType::TakeProfit;
    if (s == "TRAILING_STOP") return OrderType::TrailingStop;
    return OrderType::Market;
}

inline const char* order_status_to_string(OrderStatus status) {
    switch (status) {
    case OrderStatus::Pending:
        return "PENDING";
    case OrderStatus::PartiallyFilled:
        return "PARTIALLY_FILLED";
    case OrderStatus::Filled:
        return "FILLED";
    case OrderStatus::Canceled:
        return "CANCELED";
    case OrderStatus::Rejected:
        return "REJECTED";
    }
    return "PENDING";
}

inline bool is_terminal(OrderStatus status) {
    return status == OrderStatus::Filled || status == OrderStatus::Canceled ||
           status == OrderStatus::Rejected;
}

/**
 * Composite (symbol, side) key for positions and open orders.
 * Allows a long and a short on the same symbol (hedge mode).
 */
struct PositionKey {
    std::string symbol;
    Side side = Side::Buy;

    bool operator<(const PositionKey& other) const {
        return std::tie(symbol, side) < std::tie(other.symbol, other.side);
    }
    bool operator==(const PositionKey& other) const {
        return symbol == other.symbol && side == other.side;
    }

    std::string to_string() const { return symbol + ":" + side_to_string(side); }
};

}  // namespace autotrade
