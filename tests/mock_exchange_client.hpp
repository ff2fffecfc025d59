#pragma once

#include "../include/autotrade/errors.hpp"
#include "../include/autotrade/exchange/iexchange_client.hpp"

#include <chrono>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace autotrade {
namespace testing {

/**
 * MockExchangeClient - Test implementation
 *
 * Serves scripted balances, klines and tickers, records every order and
 * reports per-order statuses set by the test. Orders without a scripted
 * status report default_status (Pending unless changed).
 *
 * Thread-safe: the harness fetches market data from its evaluation worker.
 */
class MockExchangeClient : public exchange::IExchangeClient {
public:
    // =========================================================================
    // Scripting
    // =========================================================================

    void set_balance(double usdt) {
        std::lock_guard<std::mutex> lock(mutex_);
        balance_ = usdt;
    }

    void fail_balance(bool fail) {
        std::lock_guard<std::mutex> lock(mutex_);
        fail_balance_ = fail;
    }

    void set_connection_ok(bool ok) {
        std::lock_guard<std::mutex> lock(mutex_);
        connection_ok_ = ok;
    }

    // Primary-interval candles with constant volume
    void set_closes(const std::vector<double>& closes, double volume = 100.0) {
        std::lock_guard<std::mutex> lock(mutex_);
        klines_ = make_klines(closes, volume);
    }

    void set_volumes(const std::vector<double>& closes, const std::vector<double>& volumes) {
        std::lock_guard<std::mutex> lock(mutex_);
        klines_ = make_klines(closes, 0.0);
        for (size_t i = 0; i < klines_.size() && i < volumes.size(); ++i) {
            klines_[i].volume = volumes[i];
        }
    }

    // Served for the "1h" interval; empty = primary candles
    void set_trend_closes(const std::vector<double>& closes) {
        std::lock_guard<std::mutex> lock(mutex_);
        trend_klines_ = make_klines(closes, 100.0);
    }

    // 0 = no ticker (get_ticker throws)
    void set_ticker(double price) {
        std::lock_guard<std::mutex> lock(mutex_);
        ticker_ = price;
    }

    void set_kline_delay_ms(int ms) {
        std::lock_guard<std::mutex> lock(mutex_);
        kline_delay_ms_ = ms;
    }

    // Non-empty = get_klines throws NetworkError with this message
    void fail_klines(const std::string& error) {
        std::lock_guard<std::mutex> lock(mutex_);
        kline_error_ = error;
    }

    void fail_next_place(int count = 1) {
        std::lock_guard<std::mutex> lock(mutex_);
        fail_places_ = count;
    }

    // Acknowledge orders with an empty order id
    void ack_without_id(bool on) {
        std::lock_guard<std::mutex> lock(mutex_);
        ack_without_id_ = on;
    }

    void set_order_status(const std::string& id, OrderStatus status, double filled = 0.0, double avg_price = 0.0) {
        std::lock_guard<std::mutex> lock(mutex_);
        exchange::OrderInfo info;
        info.order_id = id;
        info.status = status;
        info.filled_quantity = filled;
        info.avg_price = avg_price;
        statuses_[id] = info;
    }

    void set_default_status(OrderStatus status) {
        std::lock_guard<std::mutex> lock(mutex_);
        default_status_ = status;
    }

    // =========================================================================
    // Inspection
    // =========================================================================

    std::vector<exchange::OrderRequest> placed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return placed_;
    }

    size_t place_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return placed_.size();
    }

    exchange::OrderRequest last_order() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return placed_.back();
    }

    int kline_calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return kline_calls_;
    }

    // =========================================================================
    // IExchangeClient
    // =========================================================================

    exchange::AccountBalance get_balances() override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fail_balance_)
            throw NetworkError(NetworkError::Kind::Connection, "balance unavailable");
        exchange::AccountBalance account;
        exchange::Balance usdt;
        usdt.asset = "USDT";
        usdt.free = balance_;
        account.balances.push_back(usdt);
        return account;
    }

    exchange::OrderAck place_order(const exchange::OrderRequest& request) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fail_places_ > 0) {
            --fail_places_;
            throw ExchangeError("TRADE_REJECTED", "order rejected");
        }
        placed_.push_back(request);
        exchange::OrderAck ack;
        if (!ack_without_id_)
            ack.order_id = "ord-" + std::to_string(placed_.size());
        ack.client_order_id = request.client_order_id;
        return ack;
    }

    exchange::OrderInfo get_order(const std::string& symbol, const std::string& order_id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        exchange::OrderInfo info;
        auto it = statuses_.find(order_id);
        if (it != statuses_.end()) {
            info = it->second;
        } else {
            info.order_id = order_id;
            info.status = default_status_;
        }
        info.symbol = symbol;
        return info;
    }

    bool cancel_order(const std::string&, const std::string&) override { return true; }
    std::vector<exchange::OrderInfo> get_open_orders(const std::string&) override { return {}; }
    std::vector<exchange::OrderInfo> get_all_orders(const std::string&, int) override { return {}; }
    std::vector<exchange::Fill> get_fills(const std::string&) override { return {}; }

    std::vector<exchange::Kline> get_klines(const std::string&, const std::string& interval, int) override {
        std::vector<exchange::Kline> out;
        std::string error;
        int delay_ms;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++kline_calls_;
            out = (interval == "1h" && !trend_klines_.empty()) ? trend_klines_ : klines_;
            error = kline_error_;
            delay_ms = kline_delay_ms_;
        }
        if (delay_ms > 0)
            std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
        if (!error.empty())
            throw NetworkError(NetworkError::Kind::Connection, error);
        return out;
    }

    exchange::Ticker get_ticker(const std::string& symbol) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (ticker_ <= 0.0)
            throw ExchangeError("SYMBOL_NOT_FOUND", "no ticker for " + symbol);
        exchange::Ticker t;
        t.symbol = symbol;
        t.close = ticker_;
        return t;
    }

    exchange::DepthBook get_depth(const std::string&, int) override { return {}; }
    std::vector<exchange::PublicTrade> get_trades(const std::string&, int) override { return {}; }
    TimestampMs get_server_time() override { return 1700000000000ULL; }

    bool test_connection() override {
        std::lock_guard<std::mutex> lock(mutex_);
        return connection_ok_;
    }

private:
    mutable std::mutex mutex_;
    double balance_ = 1000.0;
    bool fail_balance_ = false;
    bool connection_ok_ = true;
    std::vector<exchange::Kline> klines_;
    std::vector<exchange::Kline> trend_klines_;
    double ticker_ = 0.0;
    int kline_delay_ms_ = 0;
    std::string kline_error_;
    int kline_calls_ = 0;
    int fail_places_ = 0;
    bool ack_without_id_ = false;
    OrderStatus default_status_ = OrderStatus::Pending;
    std::map<std::string, exchange::OrderInfo> statuses_;
    std::vector<exchange::OrderRequest> placed_;

    static std::vector<exchange::Kline> make_klines(const std::vector<double>& closes, double volume) {
        std::vector<exchange::Kline> out;
        TimestampMs t = 1700000000000ULL;
        for (double c : closes) {
            exchange::Kline k;
            k.open_time = t;
            k.open = c;
            k.high = c;
            k.low = c;
            k.close = c;
            k.volume = volume;
            out.push_back(k);
            t += 300000;
        }
        return out;
    }
};

// Falling series: RSI well below 30 at the end
inline std::vector<double> falling_closes(size_t n = 40, double start = 100.0, double step = 1.0) {
    std::vector<double> out;
    for (size_t i = 0; i < n; ++i) {
        out.push_back(start - step * static_cast<double>(i));
    }
    return out;
}

// Rising series: RSI well above 70 at the end
inline std::vector<double> rising_closes(size_t n = 40, double start = 100.0, double step = 1.0) {
    std::vector<double> out;
    for (size_t i = 0; i < n; ++i) {
        out.push_back(start + step * static_cast<double>(i));
    }
    return out;
}

// Alternating up/down moves of equal size: RSI 50
inline std::vector<double> flat_closes(size_t n = 40, double center = 100.0) {
    std::vector<double> out;
    for (size_t i = 0; i < n; ++i) {
        out.push_back(i % 2 == 0 ? center : center + 1.0);
    }
    return out;
}

}  // namespace testing
}  // namespace autotrade
