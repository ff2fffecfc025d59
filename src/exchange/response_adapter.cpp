#include "../../include/autotrade/exchange/response_adapter.hpp"
#include "../../include/autotrade/util/string_utils.hpp"

#include <algorithm>

namespace autotrade::exchange {

namespace {

// Resolve {"<key>": [...]} or a bare array
const json& list_of(const json& data, const char* key) {
    static const json empty = json::array();
    if (data.is_array())
        return data;
    if (data.is_object()) {
        auto it = data.find(key);
        if (it != data.end() && it->is_array())
            return *it;
    }
    return empty;
}

double element(const json& arr, size_t i) {
    if (i >= arr.size())
        return 0.0;
    const auto& v = arr[i];
    if (v.is_number())
        return v.get<double>();
    if (v.is_string()) {
        try {
            return std::stod(v.get<std::string>());
        } catch (const std::exception&) {
            return 0.0;
        }
    }
    return 0.0;
}

std::vector<DepthLevel> parse_levels(const json& levels) {
    std::vector<DepthLevel> out;
    if (!levels.is_array())
        return out;
    out.reserve(levels.size());
    for (const auto& lvl : levels) {
        DepthLevel d;
        if (lvl.is_array()) {
            d.price = element(lvl, 0);
            d.size = element(lvl, 1);
        } else if (lvl.is_object()) {
            d.price = ResponseAdapter::number(lvl, "price");
            d.size = ResponseAdapter::number(lvl, "size");
        }
        out.push_back(d);
    }
    return out;
}

} // namespace

// =============================================================================
// Field helpers
// =============================================================================

double ResponseAdapter::number(const json& obj, const char* key, double fallback) {
    if (!obj.is_object())
        return fallback;
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null())
        return fallback;
    if (it->is_number())
        return it->get<double>();
    if (it->is_string()) {
        const auto& s = it->get_ref<const std::string&>();
        if (s.empty())
            return fallback;
        try {
            return std::stod(s);
        } catch (const std::exception&) {
            return fallback;
        }
    }
    return fallback;
}

std::string ResponseAdapter::text(const json& obj, const char* key, const std::string& fallback) {
    if (!obj.is_object())
        return fallback;
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null())
        return fallback;
    if (it->is_string())
        return it->get<std::string>();
    return it->dump();
}

TimestampMs ResponseAdapter::timestamp(const json& obj, const char* key) {
    return static_cast<TimestampMs>(number(obj, key, 0.0));
}

Side ResponseAdapter::side(const json& obj, const char* key) {
    return util::to_upper(text(obj, key, "BUY")) == "SELL" ? Side::Sell : Side::Buy;
}

OrderStatus ResponseAdapter::map_status(const std::string& raw, double filled, double size) {
    std::string status = util::to_upper(raw);

    if (status == "FILLED")
        return OrderStatus::Filled;
    if (status == "PARTIALLY_FILLED")
        return OrderStatus::PartiallyFilled;
    if (status == "CANCELED" || status == "CANCELLED" || status == "EXPIRED")
        return OrderStatus::Canceled;
    if (status == "REJECTED")
        return OrderStatus::Rejected;
    if (status == "CLOSED") {
        // Closed means done; whether it filled depends on the executed size
        if (size > 0.0 && filled >= size)
            return OrderStatus::Filled;
        return filled > 0.0 ? OrderStatus::PartiallyFilled : OrderStatus::Canceled;
    }
    // NEW, OPEN, PENDING and unknown values
    return filled > 0.0 ? OrderStatus::PartiallyFilled : OrderStatus::Pending;
}

// =============================================================================
// Shared shapes
// =============================================================================

std::vector<OrderInfo> ResponseAdapter::parse_orders(const json& data) const {
    std::vector<OrderInfo> out;
    for (const auto& item : list_of(data, "orders")) {
        out.push_back(parse_order(item));
    }
    return out;
}

OrderAck ResponseAdapter::parse_order_ack(const json& data) const {
    OrderAck ack;
    ack.order_id = text(data, "orderId");
    ack.client_order_id = text(data, "clientOrderId");
    return ack;
}

std::vector<Kline> ResponseAdapter::parse_klines(const json& data) const {
    std::vector<Kline> out;
    for (const auto& item : list_of(data, "klines")) {
        Kline k;
        if (item.is_array()) {
            // [time, open, high, low, close, volume]
            k.open_time = static_cast<TimestampMs>(element(item, 0));
            k.open = element(item, 1);
            k.high = element(item, 2);
            k.low = element(item, 3);
            k.close = element(item, 4);
            k.volume = element(item, 5);
        } else {
            k.open_time = timestamp(item, "time");
            k.open = number(item, "open");
            k.high = number(item, "high");
            k.low = number(item, "low");
            k.close = number(item, "close");
            k.volume = number(item, "volume");
        }
        out.push_back(k);
    }
    // Oldest first, as the indicators expect
    std::sort(out.begin(), out.end(), [](const Kline& a, const Kline& b) { return a.open_time < b.open_time; });
    return out;
}

std::vector<Ticker> ResponseAdapter::parse_tickers(const json& data) const {
    std::vector<Ticker> out;
    const json& list = list_of(data, "tickers");
    if (list.empty() && data.is_object() && data.contains("symbol")) {
        // Single ticker object
        json wrapped = json::array({data});
        return parse_tickers(wrapped);
    }
    for (const auto& item : list) {
        Ticker t;
        t.symbol = text(item, "symbol");
        t.open = number(item, "open");
        t.high = number(item, "high");
        t.low = number(item, "low");
        t.close = number(item, "close", number(item, "price"));
        t.volume = number(item, "volume");
        t.amount = number(item, "amount");
        t.time = timestamp(item, "time");
        out.push_back(t);
    }
    return out;
}

DepthBook ResponseAdapter::parse_depth(const json& data) const {
    DepthBook book;
    if (!data.is_object())
        return book;
    if (data.contains("bids"))
        book.bids = parse_levels(data["bids"]);
    if (data.contains("asks"))
        book.asks = parse_levels(data["asks"]);
    book.updated_at = timestamp(data, "updateTime");
    return book;
}

std::vector<PublicTrade> ResponseAdapter::parse_trades(const json& data) const {
    std::vector<PublicTrade> out;
    for (const auto& item : list_of(data, "trades")) {
        PublicTrade t;
        t.trade_id = text(item, "tradeId");
        t.symbol = text(item, "symbol");
        t.side = side(item, "side");
        t.price = number(item, "price");
        t.size = number(item, "size");
        t.timestamp = timestamp(item, "timestamp");
        out.push_back(t);
    }
    return out;
}

std::vector<Fill> ResponseAdapter::parse_fills(const json& data) const {
    std::vector<Fill> out;
    for (const auto& item : list_of(data, "fills")) {
        Fill f;
        f.fill_id = text(item, "id");
        f.order_id = text(item, "orderId");
        f.symbol = text(item, "symbol");
        f.side = side(item, "side");
        f.price = number(item, "price");
        f.size = number(item, "size");
        f.fee = number(item, "fee");
        f.fee_asset = text(item, "feeCoin");
        f.timestamp = timestamp(item, "timestamp");
        out.push_back(f);
    }
    return out;
}

// =============================================================================
// Spot dialect
// =============================================================================

AccountBalance SpotResponseAdapter::parse_balances(const json& data) const {
    AccountBalance account;
    for (const auto& item : list_of(data, "balances")) {
        Balance b;
        b.asset = text(item, "coin");
        b.free = number(item, "free");
        b.frozen = number(item, "frozen");
        account.balances.push_back(b);
    }
    return account;
}

OrderInfo SpotResponseAdapter::parse_order(const json& data) const {
    OrderInfo o;
    o.order_id = text(data, "orderId");
    o.client_order_id = text(data, "clientOrderId");
    o.symbol = text(data, "symbol");
    o.side = side(data, "side");
    o.type = text(data, "type");
    o.price = number(data, "price");
    o.quantity = number(data, "size");
    o.filled_quantity = number(data, "filledSize");
    double filled_amount = number(data, "filledAmount");
    o.avg_price = o.filled_quantity > 0.0 && filled_amount > 0.0 ? filled_amount / o.filled_quantity
                                                                 : number(data, "avgPrice", o.price);
    o.created_at = timestamp(data, "createTime");
    o.status = map_status(text(data, "status"), o.filled_quantity, o.quantity);
    return o;
}

// =============================================================================
// Futures dialect
// =============================================================================

AccountBalance FuturesResponseAdapter::parse_balances(const json& data) const {
    AccountBalance account;
    for (const auto& item : list_of(data, "balances")) {
        Balance b;
        b.asset = text(item, "currency");
        b.free = number(item, "available");
        b.frozen = number(item, "frozen");
        // Some responses only carry total
        double total = number(item, "total", b.free + b.frozen);
        if (b.free == 0.0 && total > b.frozen)
            b.free = total - b.frozen;
        account.balances.push_back(b);
    }
    return account;
}

OrderInfo FuturesResponseAdapter::parse_order(const json& data) const {
    OrderInfo o;
    o.order_id = text(data, "orderId");
    o.client_order_id = text(data, "clientOrderId");
    o.symbol = text(data, "symbol");
    o.side = side(data, "side");
    o.type = text(data, "type");
    o.price = number(data, "price");
    o.quantity = number(data, "origQty", number(data, "size"));
    o.filled_quantity = number(data, "executedQty");
    o.avg_price = number(data, "avgPrice", o.price);
    o.created_at = timestamp(data, "time");
    o.status = map_status(text(data, "status"), o.filled_quantity, o.quantity);
    return o;
}

std::unique_ptr<ResponseAdapter> make_response_adapter(bool futures) {
    if (futures)
        return std::make_unique<FuturesResponseAdapter>();
    return std::make_unique<SpotResponseAdapter>();
}

} // namespace autotrade::exchange
