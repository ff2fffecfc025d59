#pragma once

#include "../config/trading_config.hpp"
#include "../logging/async_logger.hpp"

#include <mutex>
#include <nlohmann/json.hpp>
#include <shared_mutex>
#include <string>

namespace autotrade {
namespace engine {

using json = nlohmann::json;

// =============================================================================
// Configuration
// =============================================================================

/**
 * Source of trading parameters. get() returns a copy so a concurrent
 * reload never produces a torn read.
 */
class ConfigProvider {
public:
    virtual ~ConfigProvider() = default;

    virtual config::TradingConfig get() const = 0;

    /// Re-read the source. On failure the previous config stays active.
    virtual bool reload() = 0;
};

class StaticConfigProvider : public ConfigProvider {
public:
    explicit StaticConfigProvider(config::TradingConfig cfg = {})
        : config_(std::move(cfg)) {}

    config::TradingConfig get() const override {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return config_;
    }

    bool reload() override { return true; }

    void set(config::TradingConfig cfg) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        config_ = std::move(cfg);
    }

private:
    mutable std::shared_mutex mutex_;
    config::TradingConfig config_;
};

/**
 * JSON file backed provider.
 * @throws ConfigError from the constructor if the first load fails
 */
class JsonFileConfigProvider : public ConfigProvider {
public:
    JsonFileConfigProvider(std::string path, logging::AsyncLogger& logger);

    config::TradingConfig get() const override;
    bool reload() override;

    const std::string& path() const { return path_; }

private:
    std::string path_;
    logging::AsyncLogger& logger_;
    mutable std::shared_mutex mutex_;
    config::TradingConfig config_;
};

// =============================================================================
// Persistence
// =============================================================================

struct UserSettings {
    std::string default_strategy; // empty = use the config default
    bool auto_trading = false;
    json extra = json::object();
};

class PersistenceStore {
public:
    virtual ~PersistenceStore() = default;

    virtual void append_trade(const json& record) = 0;
    virtual void append_log(const json& record) = 0;
    virtual UserSettings get_user_settings(const std::string& user_id) = 0;
};

/**
 * JSON-lines files: one compact object per line, appended.
 *
 * User settings file layout:
 *   { "<user_id>": { "default_strategy": "RSI_STRATEGY", "auto_trading": true } }
 *
 * Write failures are logged, never thrown.
 */
class JsonlPersistenceStore : public PersistenceStore {
public:
    JsonlPersistenceStore(config::StorageConfig storage, logging::AsyncLogger& logger);

    void append_trade(const json& record) override;
    void append_log(const json& record) override;
    UserSettings get_user_settings(const std::string& user_id) override;

private:
    config::StorageConfig storage_;
    logging::AsyncLogger& logger_;
    std::mutex mutex_;

    void append_line(const std::string& path, const json& record);
};

// =============================================================================
// Notifications
// =============================================================================

class NotificationSink {
public:
    virtual ~NotificationSink() = default;
    virtual void notify(const std::string& title, const std::string& message) = 0;
};

// Operator notifications routed through the logger
class LogNotificationSink : public NotificationSink {
public:
    explicit LogNotificationSink(logging::AsyncLogger& logger)
        : logger_(logger) {}

    void notify(const std::string& title, const std::string& message) override {
        AUTOTRADE_LOGF_INFO(logger_, System, "Notification: %s - %s", title.c_str(), message.c_str());
    }

private:
    logging::AsyncLogger& logger_;
};

}  // namespace engine
}  // namespace autotrade
