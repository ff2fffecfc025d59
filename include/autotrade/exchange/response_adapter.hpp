#pragma once

#include "exchange_types.hpp"

#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace autotrade {
namespace exchange {

using json = nlohmann::json;

/**
 * ResponseAdapter - maps one API dialect onto the normalized structs.
 *
 * Input is the `data` member of a successful response. Numeric fields may
 * arrive as strings or numbers; both are accepted. Missing fields keep
 * their defaults.
 *
 * The base class handles the shapes both dialects share (market data,
 * fills); subclasses override where field names diverge.
 */
class ResponseAdapter {
public:
    virtual ~ResponseAdapter() = default;

    virtual const char* name() const = 0;

    virtual AccountBalance parse_balances(const json& data) const = 0;
    virtual OrderInfo parse_order(const json& data) const = 0;

    virtual std::vector<OrderInfo> parse_orders(const json& data) const;
    virtual OrderAck parse_order_ack(const json& data) const;
    virtual std::vector<Kline> parse_klines(const json& data) const;
    virtual std::vector<Ticker> parse_tickers(const json& data) const;
    virtual DepthBook parse_depth(const json& data) const;
    virtual std::vector<PublicTrade> parse_trades(const json& data) const;
    virtual std::vector<Fill> parse_fills(const json& data) const;

    // Exchange status string -> normalized status
    static OrderStatus map_status(const std::string& status, double filled, double size);

    // Accepts "1.5", 1.5 or missing (fallback)
    static double number(const json& obj, const char* key, double fallback = 0.0);
    static std::string text(const json& obj, const char* key, const std::string& fallback = "");
    static TimestampMs timestamp(const json& obj, const char* key);
    static Side side(const json& obj, const char* key);
};

/**
 * Spot dialect: balances use coin/free/frozen, orders use size/filledSize.
 */
class SpotResponseAdapter : public ResponseAdapter {
public:
    const char* name() const override { return "spot"; }
    AccountBalance parse_balances(const json& data) const override;
    OrderInfo parse_order(const json& data) const override;
};

/**
 * Futures dialect: balances use currency/available/frozen/total,
 * orders use executedQty/avgPrice.
 */
class FuturesResponseAdapter : public ResponseAdapter {
public:
    const char* name() const override { return "futures"; }
    AccountBalance parse_balances(const json& data) const override;
    OrderInfo parse_order(const json& data) const override;
};

std::unique_ptr<ResponseAdapter> make_response_adapter(bool futures);

}  // namespace exchange
}  // namespace autotrade
