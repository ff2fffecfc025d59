#pragma once

#include "../config/defaults.hpp"
#include "../logging/async_logger.hpp"
#include "ws_transport.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace autotrade {
namespace feed {

using json = nlohmann::json;

enum class FeedState : uint8_t { Disconnected, Connecting, Connected, Degraded };

inline const char* feed_state_to_string(FeedState state) {
    switch (state) {
    case FeedState::Disconnected:
        return "DISCONNECTED";
    case FeedState::Connecting:
        return "CONNECTING";
    case FeedState::Connected:
        return "CONNECTED";
    case FeedState::Degraded:
        return "DEGRADED";
    }
    return "UNKNOWN";
}

struct FeedConfig {
    std::vector<std::string> urls = {"wss://ws.pionex.com/ws", "wss://api.pionex.com/ws",
                                     "wss://api.pionex.com/stream", "wss://ws.pionex.com"};
    double reconnect_delay_s = config::feed::RECONNECT_DELAY_S;
    int max_reconnect_attempts = config::feed::MAX_RECONNECT_ATTEMPTS;
    int poll_timeout_ms = config::feed::POLL_TIMEOUT_MS;
    std::string ticker_channel = "ticker";
};

/**
 * MarketDataFeed - streaming market data with endpoint failover.
 *
 *   DISCONNECTED -> CONNECTING -> CONNECTED -> (error) CONNECTING -> ... -> DEGRADED
 *
 * A failed connect (or a dropped connection) rotates to the next candidate
 * URL and retries after reconnect_delay_s. After max_reconnect_attempts
 * consecutive failures the feed enters DEGRADED and the worker exits;
 * callers then poll REST instead. A successful connect resets the counter
 * and replays every active subscription.
 *
 * Subscriptions are a set keyed by the serialized subscribe message, so
 * subscribe/unsubscribe are idempotent. Inbound messages are routed by their
 * `channel` field; unroutable or unparsable messages are logged and dropped.
 *
 * Threading: one worker thread owns the transport. Public methods are
 * thread-safe.
 */
class MarketDataFeed {
public:
    using Handler = std::function<void(const json&)>;
    using StateCallback = std::function<void(FeedState from, FeedState to)>;

    MarketDataFeed(FeedConfig config, std::unique_ptr<WsTransport> transport, logging::AsyncLogger& logger);
    ~MarketDataFeed();

    // Non-copyable
    MarketDataFeed(const MarketDataFeed&) = delete;
    MarketDataFeed& operator=(const MarketDataFeed&) = delete;

    /// Start the worker. Also restarts a feed that went DEGRADED.
    void start();

    /// Stop the worker and close the connection
    void stop();

    /**
     * Add a subscription: {"event":"subscribe","channel":channel, ...params}.
     * Sent immediately when connected, otherwise on the next connect.
     * @return false if it was already active
     */
    bool subscribe(const std::string& channel, const json& params = json::object());

    /// Remove a subscription and send the unsubscribe message when connected
    bool unsubscribe(const std::string& channel, const json& params = json::object());

    /// Route inbound messages whose `channel` equals `channel`
    void on_channel(const std::string& channel, Handler handler);

    void set_state_callback(StateCallback cb);

    /**
     * Latest streamed price for a symbol.
     * Empty when degraded, unknown or older than max_age_ms.
     */
    std::optional<double> last_price(const std::string& symbol,
                                     uint64_t max_age_ms = config::feed::PRICE_MAX_AGE_MS) const;

    FeedState state() const { return state_.load(); }
    bool is_degraded() const { return state_.load() == FeedState::Degraded; }
    size_t subscription_count() const;
    std::string current_url() const;
    int reconnect_attempts() const { return reconnect_attempts_.load(); }

    /// Handle one raw inbound message (worker thread; public for tests)
    void dispatch(const std::string& raw);

    static json subscribe_message(const std::string& channel, const json& params);
    static json unsubscribe_message(const std::string& channel, const json& params);

private:
    struct CachedPrice {
        double price = 0.0;
        uint64_t wall_ms = 0;
    };

    FeedConfig config_;
    std::unique_ptr<WsTransport> transport_;
    logging::AsyncLogger& logger_;

    std::atomic<FeedState> state_{FeedState::Disconnected};
    std::atomic<bool> running_{false};
    std::atomic<int> reconnect_attempts_{0};
    size_t url_index_ = 0;
    std::thread worker_;

    mutable std::mutex mutex_; // subscriptions, handlers, callbacks, url index
    std::set<std::string> subscriptions_;
    std::map<std::string, Handler> handlers_;
    StateCallback state_callback_;

    mutable std::mutex price_mutex_;
    std::map<std::string, CachedPrice> prices_;

    std::mutex wait_mutex_;
    std::condition_variable wait_cv_;

    void run();
    void replay_subscriptions();
    void set_state(FeedState next);
    void on_ticker(const json& msg);

    // Sleep that returns early (false) when stop() is called
    bool wait_for(double seconds);
};

}  // namespace feed
}  // namespace autotrade
