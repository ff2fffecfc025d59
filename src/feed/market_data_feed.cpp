#include "../../include/autotrade/feed/market_data_feed.hpp"
#include "../../include/autotrade/util/time_utils.hpp"

#include <chrono>

namespace autotrade::feed {

MarketDataFeed::MarketDataFeed(FeedConfig config, std::unique_ptr<WsTransport> transport,
                               logging::AsyncLogger& logger)
    : config_(std::move(config))
    , transport_(std::move(transport))
    , logger_(logger) {
    if (config_.urls.empty()) {
        throw std::invalid_argument("MarketDataFeed needs at least one URL");
    }
    // Built-in price cache
    handlers_[config_.ticker_channel] = [this](const json& msg) { on_ticker(msg); };
}

MarketDataFeed::~MarketDataFeed() {
    stop();
}

// =============================================================================
// Lifecycle
// =============================================================================

void MarketDataFeed::start() {
    if (running_.exchange(true))
        return; // Already running

    if (worker_.joinable()) {
        worker_.join(); // previous worker ended in DEGRADED
    }
    reconnect_attempts_ = 0;
    worker_ = std::thread(&MarketDataFeed::run, this);
}

void MarketDataFeed::stop() {
    running_ = false;
    wait_cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
    if (state_.load() != FeedState::Degraded) {
        set_state(FeedState::Disconnected);
    }
}

bool MarketDataFeed::wait_for(double seconds) {
    std::unique_lock<std::mutex> lock(wait_mutex_);
    wait_cv_.wait_for(lock, std::chrono::duration<double>(seconds), [this] { return !running_.load(); });
    return running_.load();
}

void MarketDataFeed::set_state(FeedState next) {
    FeedState prev = state_.exchange(next);
    if (prev == next)
        return;

    if (next == FeedState::Degraded) {
        AUTOTRADE_LOGF_WARN(logger_, Feed, "Feed DEGRADED after %d reconnect attempts, falling back to REST",
                            reconnect_attempts_.load());
    } else {
        AUTOTRADE_LOGF_INFO(logger_, Feed, "Feed %s -> %s", feed_state_to_string(prev), feed_state_to_string(next));
    }

    StateCallback cb;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cb = state_callback_;
    }
    if (cb) {
        cb(prev, next);
    }
}

void MarketDataFeed::run() {
    while (running_) {
        set_state(FeedState::Connecting);

        std::string url;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            url = config_.urls[url_index_];
        }

        std::string error;
        if (transport_->open(url, error)) {
            reconnect_attempts_ = 0;
            set_state(FeedState::Connected);
            AUTOTRADE_LOGF_INFO(logger_, Feed, "Connected to %s", url.c_str());
            replay_subscriptions();

            while (running_ && transport_->poll(config_.poll_timeout_ms, [this](const std::string& m) { dispatch(m); })) {
            }
            transport_->close();

            if (!running_)
                break;
            error = "connection lost";
        }

        AUTOTRADE_LOGF_WARN(logger_, Feed, "WebSocket %s failed: %s", url.c_str(), error.c_str());

        // Rotate to the next candidate endpoint
        {
            std::lock_guard<std::mutex> lock(mutex_);
            url_index_ = (url_index_ + 1) % config_.urls.size();
        }

        if (reconnect_attempts_.load() < config_.max_reconnect_attempts) {
            ++reconnect_attempts_;
            AUTOTRADE_LOGF_INFO(logger_, Feed, "Reconnecting in %.1fs (attempt %d/%d)", config_.reconnect_delay_s,
                                reconnect_attempts_.load(), config_.max_reconnect_attempts);
            if (!wait_for(config_.reconnect_delay_s))
                break;
        } else {
            set_state(FeedState::Degraded);
            running_ = false;
            return;
        }
    }
}

// =============================================================================
// Subscriptions
// =============================================================================

json MarketDataFeed::subscribe_message(const std::string& channel, const json& params) {
    json msg = params.is_object() ? params : json::object();
    msg["event"] = "subscribe";
    msg["channel"] = channel;
    return msg;
}

json MarketDataFeed::unsubscribe_message(const std::string& channel, const json& params) {
    json msg = params.is_object() ? params : json::object();
    msg["event"] = "unsubscribe";
    msg["channel"] = channel;
    return msg;
}

bool MarketDataFeed::subscribe(const std::string& channel, const json& params) {
    std::string key = subscribe_message(channel, params).dump();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!subscriptions_.insert(key).second)
            return false;
    }
    if (state_.load() == FeedState::Connected) {
        transport_->send(key);
    }
    AUTOTRADE_LOGF_DEBUG(logger_, Feed, "Subscribed: %s", key.c_str());
    return true;
}

bool MarketDataFeed::unsubscribe(const std::string& channel, const json& params) {
    std::string key = subscribe_message(channel, params).dump();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (subscriptions_.erase(key) == 0)
            return false;
    }
    if (state_.load() == FeedState::Connected) {
        transport_->send(unsubscribe_message(channel, params).dump());
    }
    return true;
}

void MarketDataFeed::replay_subscriptions() {
    std::vector<std::string> active;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        active.assign(subscriptions_.begin(), subscriptions_.end());
    }
    for (const auto& msg : active) {
        if (!transport_->send(msg)) {
            AUTOTRADE_LOGF_WARN(logger_, Feed, "Failed to replay subscription %s", msg.c_str());
        }
    }
    if (!active.empty()) {
        AUTOTRADE_LOGF_INFO(logger_, Feed, "Replayed %zu subscriptions", active.size());
    }
}

void MarketDataFeed::on_channel(const std::string& channel, Handler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    handlers_[channel] = std::move(handler);
}

void MarketDataFeed::set_state_callback(StateCallback cb) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_callback_ = std::move(cb);
}

size_t MarketDataFeed::subscription_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscriptions_.size();
}

std::string MarketDataFeed::current_url() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_.urls[url_index_];
}

// =============================================================================
// Inbound
// =============================================================================

void MarketDataFeed::dispatch(const std::string& raw) {
    json msg;
    try {
        msg = json::parse(raw);
    } catch (const json::parse_error& e) {
        AUTOTRADE_LOGF_WARN(logger_, Feed, "Dropping unparsable message: %s", e.what());
        return;
    }

    std::string channel;
    if (msg.is_object() && msg.contains("channel") && msg["channel"].is_string()) {
        channel = msg["channel"].get<std::string>();
    }

    Handler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = handlers_.find(channel);
        if (it != handlers_.end())
            handler = it->second;
    }

    if (!handler) {
        AUTOTRADE_LOGF_DEBUG(logger_, Feed, "Unroutable message (channel '%s') dropped", channel.c_str());
        return;
    }

    try {
        handler(msg);
    } catch (const std::exception& e) {
        AUTOTRADE_LOGF_ERROR(logger_, Feed, "Handler for '%s' failed: %s", channel.c_str(), e.what());
    }
}

void MarketDataFeed::on_ticker(const json& msg) {
    const json& data = msg.contains("data") && msg["data"].is_object() ? msg["data"] : msg;

    std::string symbol;
    if (data.contains("symbol") && data["symbol"].is_string())
        symbol = data["symbol"].get<std::string>();
    if (symbol.empty())
        return;

    double price = 0.0;
    for (const char* key : {"close", "price", "last"}) {
        if (!data.contains(key))
            continue;
        const auto& v = data[key];
        if (v.is_number()) {
            price = v.get<double>();
        } else if (v.is_string()) {
            price = std::stod(v.get<std::string>());
        }
        if (price > 0.0)
            break;
    }
    if (price <= 0.0)
        return;

    std::lock_guard<std::mutex> lock(price_mutex_);
    prices_[symbol] = CachedPrice{price, util::wall_clock_ms()};
}

std::optional<double> MarketDataFeed::last_price(const std::string& symbol, uint64_t max_age_ms) const {
    if (state_.load() == FeedState::Degraded)
        return std::nullopt;

    std::lock_guard<std::mutex> lock(price_mutex_);
    auto it = prices_.find(symbol);
    if (it == prices_.end())
        return std::nullopt;

    uint64_t now = util::wall_clock_ms();
    if (now > it->second.wall_ms && now - it->second.wall_ms > max_age_ms)
        return std::nullopt;
    return it->second.price;
}

} // namespace autotrade::feed
