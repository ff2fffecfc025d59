#pragma once

#include "../config/defaults.hpp"
#include "../logging/async_logger.hpp"
#include "http_transport.hpp"
#include "iexchange_client.hpp"
#include "rate_limiter.hpp"
#include "request_signer.hpp"
#include "response_adapter.hpp"

#include <functional>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>

namespace autotrade {
namespace exchange {

using json = nlohmann::json;

struct ClientConfig {
    std::string base_url = config::client::BASE_URL;
    std::string api_key;
    std::string secret_key;
    bool futures = false;
    int retry_attempts = config::client::RETRY_ATTEMPTS;
    double backoff_factor = config::client::BACKOFF_FACTOR;
    double timeout_s = config::client::TIMEOUT_S;
    double rate_limit_delay_s = config::client::RATE_LIMIT_DELAY_S;
    double default_retry_after_s = config::client::DEFAULT_RETRY_AFTER_S;
    int max_rate_limit_waits = config::client::MAX_RATE_LIMIT_WAITS;
};

/**
 * ExchangeProtocolClient - signed, throttled, retrying REST client.
 *
 * Retry policy per request:
 *   - NetworkError and 5xx: retried up to retry_attempts times in total,
 *     sleeping backoff^attempt seconds between attempts (none after the last).
 *   - 429: sleeps Retry-After (default 60s) and retries without consuming an
 *     attempt; more than max_rate_limit_waits waits raises RateLimited.
 *   - other non-200: ExchangeError with the HTTP status as code.
 *   - 200 with result:false or code != 0: ExchangeError, not retried.
 *   - all attempts failed: Exhausted.
 *
 * Usage:
 *   ClientConfig cfg;
 *   cfg.api_key = ...;
 *   ExchangeProtocolClient client(cfg, std::make_shared<CurlTransport>(), logger);
 *   auto klines = client.get_klines("BTC_USDT", "5m", 100);
 */
class ExchangeProtocolClient : public IExchangeClient {
public:
    using WallClockMs = std::function<TimestampMs()>;

    ExchangeProtocolClient(ClientConfig config, std::shared_ptr<HttpTransport> transport,
                           logging::AsyncLogger& logger, Sleeper sleeper = real_sleep,
                           WallClockMs wall_clock = nullptr);

    // Non-copyable
    ExchangeProtocolClient(const ExchangeProtocolClient&) = delete;
    ExchangeProtocolClient& operator=(const ExchangeProtocolClient&) = delete;

    // Account
    AccountBalance get_balances() override;

    // Orders
    OrderAck place_order(const OrderRequest& request) override;
    OrderInfo get_order(const std::string& symbol, const std::string& order_id) override;
    bool cancel_order(const std::string& symbol, const std::string& order_id) override;
    std::vector<OrderInfo> get_open_orders(const std::string& symbol) override;
    std::vector<OrderInfo> get_all_orders(const std::string& symbol, int limit = 100) override;
    std::vector<Fill> get_fills(const std::string& symbol) override;

    // Market data
    std::vector<Kline> get_klines(const std::string& symbol, const std::string& interval,
                                  int limit = 100) override;
    Ticker get_ticker(const std::string& symbol) override;
    DepthBook get_depth(const std::string& symbol, int limit = 20) override;
    std::vector<PublicTrade> get_trades(const std::string& symbol, int limit = 100) override;

    TimestampMs get_server_time() override;
    bool test_connection() override;

    /**
     * Send one request through throttle, signing and the retry loop.
     * Returns the `data` member (or the whole body if there is none).
     */
    json request(const std::string& method, const std::string& path, json params = json::object(),
                 bool is_signed = false);

    /// Build the order body for a request (exposed for tests)
    static json build_order_params(const OrderRequest& request);

    /// "5m" -> "5M", "1h" -> "1H"; unknown values are uppercased
    static std::string normalize_interval(const std::string& interval);

    /// "BTCUSDT" -> "BTC_USDT"; already-separated symbols are unchanged
    static std::string normalize_symbol(const std::string& symbol);

private:
    ClientConfig config_;
    std::shared_ptr<HttpTransport> transport_;
    logging::AsyncLogger& logger_;
    Sleeper sleeper_;
    WallClockMs wall_clock_;
    RequestSigner signer_;
    RequestThrottle throttle_;
    std::unique_ptr<ResponseAdapter> adapter_;

    HttpRequest build_request(const std::string& method, const std::string& path, const json& params,
                              bool is_signed);
    json handle_success(const HttpResponse& response);
};

}  // namespace exchange
}  // namespace autotrade
