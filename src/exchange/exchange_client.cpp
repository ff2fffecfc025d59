#include "../../include/autotrade/exchange/exchange_client.hpp"
#include "../../include/autotrade/errors.hpp"
#include "../../include/autotrade/util/string_utils.hpp"
#include "../../include/autotrade/util/time_utils.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <map>

namespace autotrade::exchange {

namespace {

constexpr const char* PATH_BALANCES = "/api/v1/account/balances";
constexpr const char* PATH_ORDER = "/api/v1/trade/order";
constexpr const char* PATH_OPEN_ORDERS = "/api/v1/trade/openOrders";
constexpr const char* PATH_ALL_ORDERS = "/api/v1/trade/allOrders";
constexpr const char* PATH_FILLS = "/api/v1/trade/fills";
constexpr const char* PATH_KLINES = "/api/v1/market/klines";
constexpr const char* PATH_TICKERS = "/api/v1/market/tickers";
constexpr const char* PATH_DEPTH = "/api/v1/market/depth";
constexpr const char* PATH_TRADES = "/api/v1/market/trades";

// Plain decimal without exponent or trailing zeros: 0.00012300 -> "0.000123"
std::string decimal_string(double value) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.8f", value);
    std::string s(buf);
    auto dot = s.find('.');
    if (dot != std::string::npos) {
        s.erase(s.find_last_not_of('0') + 1);
        if (s.back() == '.')
            s.pop_back();
    }
    return s;
}

bool is_error_code(const json& code) {
    if (code.is_null())
        return false;
    if (code.is_number())
        return code.get<double>() != 0.0;
    if (code.is_string()) {
        const auto& s = code.get_ref<const std::string&>();
        return !s.empty() && s != "0";
    }
    return false;
}

} // namespace

ExchangeProtocolClient::ExchangeProtocolClient(ClientConfig config, std::shared_ptr<HttpTransport> transport,
                                               logging::AsyncLogger& logger, Sleeper sleeper,
                                               WallClockMs wall_clock)
    : config_(std::move(config))
    , transport_(std::move(transport))
    , logger_(logger)
    , sleeper_(std::move(sleeper))
    , wall_clock_(wall_clock ? std::move(wall_clock) : WallClockMs([] { return util::wall_clock_ms(); }))
    , signer_(config_.api_key, config_.secret_key)
    , throttle_([this] {
        RequestThrottle::Config tc;
        tc.min_interval_s = config_.rate_limit_delay_s;
        tc.enabled = config_.rate_limit_delay_s > 0.0;
        return tc;
    }(), sleeper_)
    , adapter_(make_response_adapter(config_.futures)) {
    if (!transport_) {
        throw std::invalid_argument("ExchangeProtocolClient requires a transport");
    }
    if (config_.retry_attempts < 1) {
        config_.retry_attempts = 1;
    }
}

// =============================================================================
// Helpers
// =============================================================================

std::string ExchangeProtocolClient::normalize_interval(const std::string& interval) {
    static const std::map<std::string, std::string> interval_map = {
        {"1m", "1M"},   {"5m", "5M"},   {"15m", "15M"}, {"30m", "30M"}, {"1h", "1H"},
        {"4h", "4H"},   {"8h", "8H"},   {"12h", "12H"}, {"1d", "1D"},
    };
    std::string lower = interval;
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return std::tolower(c); });
    auto it = interval_map.find(lower);
    return it != interval_map.end() ? it->second : util::to_upper(interval);
}

std::string ExchangeProtocolClient::normalize_symbol(const std::string& symbol) {
    std::string s = util::to_upper(symbol);
    if (s.find('_') != std::string::npos)
        return s;

    static const char* quotes[] = {"USDT", "USDC", "BUSD", "BTC", "ETH"};
    for (const char* q : quotes) {
        std::string quote(q);
        if (s.size() > quote.size() && s.compare(s.size() - quote.size(), quote.size(), quote) == 0) {
            return s.substr(0, s.size() - quote.size()) + "_" + quote;
        }
    }
    return s;
}

json ExchangeProtocolClient::build_order_params(const OrderRequest& request) {
    json params = {
        {"symbol", request.symbol},
        {"side", side_to_string(request.side)},
        {"size", decimal_string(request.quantity)},
    };
    if (!request.client_order_id.empty()) {
        params["clientOrderId"] = request.client_order_id;
    }

    switch (request.type) {
    case OrderType::Market:
        params["type"] = "MARKET";
        params["IOC"] = true;
        break;
    case OrderType::Limit:
        params["type"] = "LIMIT";
        params["price"] = decimal_string(request.price);
        break;
    case OrderType::StopLoss:
        params["type"] = "STOP_MARKET";
        params["activationPrice"] = decimal_string(request.activation_price);
        params["workingType"] = "MARK_PRICE";
        break;
    case OrderType::TakeProfit:
        params["type"] = "TAKE_PROFIT_MARKET";
        params["activationPrice"] = decimal_string(request.activation_price);
        params["workingType"] = "MARK_PRICE";
        break;
    case OrderType::TrailingStop:
        params["type"] = "TRAILING_STOP_MARKET";
        params["callbackRate"] = decimal_string(request.callback_rate);
        params["workingType"] = "MARK_PRICE";
        break;
    }
    return params;
}

// =============================================================================
// Request pipeline
// =============================================================================

HttpRequest ExchangeProtocolClient::build_request(const std::string& method, const std::string& path,
                                                  const json& params, bool is_signed) {
    HttpRequest req;
    req.method = method;
    req.timeout_s = config_.timeout_s;
    req.headers["Content-Type"] = "application/json";
    req.headers["User-Agent"] = "autotrade/1.0";

    if (is_signed) {
        if (!signer_.has_credentials()) {
            throw ConfigError("API credentials are not configured");
        }
        SignedRequest signed_req = signer_.sign(method, path, params, get_server_time());
        req.url = config_.base_url + signed_req.path_url;
        req.body = signed_req.body;
        req.headers["PIONEX-KEY"] = signer_.api_key();
        req.headers["PIONEX-SIGNATURE"] = signed_req.signature;
        req.headers["PIONEX-TIMESTAMP"] = signed_req.timestamp;
        return req;
    }

    std::string query = RequestSigner::build_query(params.is_null() ? json::object() : params);
    req.url = config_.base_url + path + (query.empty() ? "" : "?" + query);
    if (method != "GET" && !params.empty()) {
        req.body = params.dump();
    }
    return req;
}

json ExchangeProtocolClient::handle_success(const HttpResponse& response) {
    json body;
    try {
        body = json::parse(response.body);
    } catch (const json::parse_error& e) {
        throw ExchangeError("PARSE_ERROR", std::string("Invalid JSON response: ") + e.what());
    }

    if (body.is_object()) {
        bool failed = body.contains("result") && body["result"].is_boolean() && !body["result"].get<bool>();
        if (failed || (body.contains("code") && is_error_code(body["code"]))) {
            std::string code = body.contains("code") ? ResponseAdapter::text(body, "code") : "UNKNOWN";
            std::string message = ResponseAdapter::text(body, "message", ResponseAdapter::text(body, "msg", "Unknown API error"));
            AUTOTRADE_LOGF_ERROR(logger_, Exchange, "API error: %s (code: %s)", message.c_str(), code.c_str());
            throw ExchangeError(code, message);
        }
        if (body.contains("data")) {
            return body["data"];
        }
    }
    return body;
}

json ExchangeProtocolClient::request(const std::string& method, const std::string& path, json params,
                                     bool is_signed) {
    const int max_attempts = config_.retry_attempts;
    HttpRequest req = build_request(method, path, params, is_signed);

    int attempt = 0;
    int rate_limit_waits = 0;
    std::string last_error = "no attempt made";

    while (attempt < max_attempts) {
        throttle_.acquire();

        HttpResponse response;
        try {
            response = transport_->send(req);
        } catch (const NetworkError& e) {
            last_error = e.what();
            AUTOTRADE_LOGF_WARN(logger_, Exchange, "%s %s failed: %s (attempt %d/%d)", method.c_str(), path.c_str(),
                                e.what(), attempt + 1, max_attempts);
            if (attempt < max_attempts - 1) {
                sleeper_(std::pow(config_.backoff_factor, attempt));
            }
            ++attempt;
            continue;
        }

        if (response.status == 200) {
            return handle_success(response);
        }

        if (response.status == 429) {
            double retry_after = config_.default_retry_after_s;
            std::string header = response.header("retry-after");
            if (!header.empty()) {
                try {
                    retry_after = std::stod(header);
                } catch (const std::exception&) {
                    retry_after = config_.default_retry_after_s;
                }
            }
            if (rate_limit_waits >= config_.max_rate_limit_waits) {
                throw RateLimited(retry_after);
            }
            ++rate_limit_waits;
            AUTOTRADE_LOGF_WARN(logger_, Exchange, "Rate limited, waiting %.0fs", retry_after);
            sleeper_(retry_after);
            continue; // not counted as an attempt
        }

        if (response.status >= 500) {
            last_error = "HTTP " + std::to_string(response.status);
            AUTOTRADE_LOGF_WARN(logger_, Exchange, "Server error %ld, attempt %d/%d", response.status, attempt + 1,
                                max_attempts);
            if (attempt < max_attempts - 1) {
                sleeper_(std::pow(config_.backoff_factor, attempt));
            }
            ++attempt;
            continue;
        }

        AUTOTRADE_LOGF_ERROR(logger_, Exchange, "HTTP %ld: %s", response.status, response.body.c_str());
        throw ExchangeError(std::to_string(response.status), response.body);
    }

    throw Exhausted(max_attempts, last_error);
}

// =============================================================================
// Clock
// =============================================================================

TimestampMs ExchangeProtocolClient::get_server_time() {
    HttpRequest req;
    req.method = "GET";
    req.url = config_.base_url + PATH_TICKERS;
    req.timeout_s = 5.0;

    try {
        HttpResponse response = transport_->send(req);
        if (response.status == 200) {
            json body = json::parse(response.body);
            if (body.contains("data") && body["data"].is_object() && body["data"].contains("timestamp")) {
                return body["data"]["timestamp"].get<TimestampMs>();
            }
            if (body.contains("timestamp")) {
                return body["timestamp"].get<TimestampMs>();
            }
        }
    } catch (const std::exception& e) {
        AUTOTRADE_LOGF_WARN(logger_, Exchange, "Failed to get server time: %s", e.what());
    }

    // Fallback to local time
    return wall_clock_();
}

// =============================================================================
// Account
// =============================================================================

AccountBalance ExchangeProtocolClient::get_balances() {
    return adapter_->parse_balances(request("GET", PATH_BALANCES, json::object(), true));
}

bool ExchangeProtocolClient::test_connection() {
    try {
        get_balances();
        return true;
    } catch (const std::exception& e) {
        AUTOTRADE_LOGF_WARN(logger_, Exchange, "Connection test failed: %s", e.what());
        return false;
    }
}

// =============================================================================
// Orders
// =============================================================================

OrderAck ExchangeProtocolClient::place_order(const OrderRequest& request_in) {
    json params = build_order_params(request_in);
    AUTOTRADE_LOGF_INFO(logger_, Exchange, "Placing %s %s %s size=%s", params["type"].get<std::string>().c_str(),
                        side_to_string(request_in.side), request_in.symbol.c_str(),
                        params["size"].get<std::string>().c_str());
    return adapter_->parse_order_ack(request("POST", PATH_ORDER, params, true));
}

OrderInfo ExchangeProtocolClient::get_order(const std::string& symbol, const std::string& order_id) {
    json params = {{"symbol", symbol}, {"orderId", order_id}};
    return adapter_->parse_order(request("GET", PATH_ORDER, params, true));
}

bool ExchangeProtocolClient::cancel_order(const std::string& symbol, const std::string& order_id) {
    json params = {{"symbol", symbol}, {"orderId", order_id}};
    request("DELETE", PATH_ORDER, params, true);
    return true;
}

std::vector<OrderInfo> ExchangeProtocolClient::get_open_orders(const std::string& symbol) {
    json params = json::object();
    if (!symbol.empty())
        params["symbol"] = symbol;
    return adapter_->parse_orders(request("GET", PATH_OPEN_ORDERS, params, true));
}

std::vector<OrderInfo> ExchangeProtocolClient::get_all_orders(const std::string& symbol, int limit) {
    json params = {{"limit", limit}};
    if (!symbol.empty())
        params["symbol"] = symbol;
    return adapter_->parse_orders(request("GET", PATH_ALL_ORDERS, params, true));
}

std::vector<Fill> ExchangeProtocolClient::get_fills(const std::string& symbol) {
    json params = json::object();
    if (!symbol.empty())
        params["symbol"] = symbol;
    return adapter_->parse_fills(request("GET", PATH_FILLS, params, true));
}

// =============================================================================
// Market data
// =============================================================================

std::vector<Kline> ExchangeProtocolClient::get_klines(const std::string& symbol, const std::string& interval,
                                                      int limit) {
    json params = {
        {"symbol", symbol},
        {"interval", normalize_interval(interval)},
        {"limit", std::min(limit, config::client::KLINE_LIMIT_MAX)},
    };
    return adapter_->parse_klines(request("GET", PATH_KLINES, params));
}

Ticker ExchangeProtocolClient::get_ticker(const std::string& symbol) {
    json params = {{"symbol", symbol}};
    auto tickers = adapter_->parse_tickers(request("GET", PATH_TICKERS, params));
    for (const auto& t : tickers) {
        if (t.symbol == symbol)
            return t;
    }
    throw ExchangeError("SYMBOL_NOT_FOUND", "Symbol " + symbol + " not found in ticker data");
}

DepthBook ExchangeProtocolClient::get_depth(const std::string& symbol, int limit) {
    json params = {{"symbol", symbol}, {"limit", limit}};
    return adapter_->parse_depth(request("GET", PATH_DEPTH, params));
}

std::vector<PublicTrade> ExchangeProtocolClient::get_trades(const std::string& symbol, int limit) {
    json params = {{"symbol", symbol}, {"limit", limit}};
    return adapter_->parse_trades(request("GET", PATH_TRADES, params));
}

} // namespace autotrade::exchange
