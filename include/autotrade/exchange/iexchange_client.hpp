#pragma once

#include "exchange_types.hpp"

#include <string>
#include <vector>

namespace autotrade {
namespace exchange {

/**
 * IExchangeClient - normalized exchange operations
 *
 * Every call returns a normalized result or throws one of the errors in
 * errors.hpp (NetworkError, ExchangeError, RateLimited, Exhausted).
 * The client does not dedupe: idempotency is the caller's responsibility.
 *
 * The trading core only talks to this interface, so tests substitute a
 * scripted fake.
 */
class IExchangeClient {
public:
    virtual ~IExchangeClient() = default;

    // =========================================================================
    // Account (signed)
    // =========================================================================

    virtual AccountBalance get_balances() = 0;

    /// Free balance of the quote asset (e.g. "USDT")
    virtual double get_quote_balance(const std::string& asset = "USDT") {
        return get_balances().find(asset).free;
    }

    // =========================================================================
    // Orders (signed)
    // =========================================================================

    virtual OrderAck place_order(const OrderRequest& request) = 0;
    virtual OrderInfo get_order(const std::string& symbol, const std::string& order_id) = 0;
    virtual bool cancel_order(const std::string& symbol, const std::string& order_id) = 0;
    virtual std::vector<OrderInfo> get_open_orders(const std::string& symbol) = 0;
    virtual std::vector<OrderInfo> get_all_orders(const std::string& symbol, int limit = 100) = 0;
    virtual std::vector<Fill> get_fills(const std::string& symbol) = 0;

    /// Opposite-side market IOC order for `size`
    virtual OrderAck close_position(const std::string& symbol, Side position_side, double size) {
        OrderRequest req;
        req.symbol = symbol;
        req.side = opposite(position_side);
        req.type = OrderType::Market;
        req.quantity = size;
        return place_order(req);
    }

    // =========================================================================
    // Market data (public)
    // =========================================================================

    virtual std::vector<Kline> get_klines(const std::string& symbol, const std::string& interval,
                                          int limit = 100) = 0;
    virtual Ticker get_ticker(const std::string& symbol) = 0;
    virtual DepthBook get_depth(const std::string& symbol, int limit = 20) = 0;
    virtual std::vector<PublicTrade> get_trades(const std::string& symbol, int limit = 100) = 0;

    /// Exchange clock in milliseconds; falls back to local time, never throws
    virtual TimestampMs get_server_time() = 0;

    /// True when a signed call succeeds
    virtual bool test_connection() = 0;
};

}  // namespace exchange
}  // namespace autotrade
