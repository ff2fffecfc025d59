#include "../../include/autotrade/engine/collaborators.hpp"
#include "../../include/autotrade/errors.hpp"

#include <fstream>

namespace autotrade::engine {

// =============================================================================
// JsonFileConfigProvider
// =============================================================================

JsonFileConfigProvider::JsonFileConfigProvider(std::string path, logging::AsyncLogger& logger)
    : path_(std::move(path))
    , logger_(logger)
    , config_(config::load_config_file(path_)) {}

config::TradingConfig JsonFileConfigProvider::get() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return config_;
}

bool JsonFileConfigProvider::reload() {
    config::TradingConfig fresh;
    try {
        fresh = config::load_config_file(path_);
    } catch (const ConfigError& e) {
        AUTOTRADE_LOGF_ERROR(logger_, System, "Config reload failed, keeping previous: %s", e.what());
        return false;
    }

    auto problems = fresh.validate();
    if (!problems.empty()) {
        AUTOTRADE_LOGF_ERROR(logger_, System, "Reloaded config invalid (%s), keeping previous",
                             problems.front().c_str());
        return false;
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    config_ = std::move(fresh);
    AUTOTRADE_LOGF_INFO(logger_, System, "Config reloaded from %s", path_.c_str());
    return true;
}

// =============================================================================
// JsonlPersistenceStore
// =============================================================================

JsonlPersistenceStore::JsonlPersistenceStore(config::StorageConfig storage, logging::AsyncLogger& logger)
    : storage_(std::move(storage))
    , logger_(logger) {}

void JsonlPersistenceStore::append_trade(const json& record) {
    append_line(storage_.trades_file, record);
}

void JsonlPersistenceStore::append_log(const json& record) {
    append_line(storage_.logs_file, record);
}

void JsonlPersistenceStore::append_line(const std::string& path, const json& record) {
    if (path.empty())
        return;

    std::lock_guard<std::mutex> lock(mutex_);
    std::ofstream out(path, std::ios::app);
    if (!out.is_open()) {
        AUTOTRADE_LOGF_ERROR(logger_, System, "Cannot open %s for append", path.c_str());
        return;
    }
    out << record.dump() << '\n';
    if (!out) {
        AUTOTRADE_LOGF_ERROR(logger_, System, "Write to %s failed", path.c_str());
    }
}

UserSettings JsonlPersistenceStore::get_user_settings(const std::string& user_id) {
    UserSettings settings;
    if (storage_.settings_file.empty())
        return settings;

    std::ifstream in(storage_.settings_file);
    if (!in.is_open())
        return settings; // no settings saved yet

    json doc;
    try {
        doc = json::parse(in);
    } catch (const json::parse_error& e) {
        AUTOTRADE_LOGF_WARN(logger_, System, "Ignoring unreadable settings file %s: %s",
                            storage_.settings_file.c_str(), e.what());
        return settings;
    }

    if (!doc.is_object() || !doc.contains(user_id) || !doc[user_id].is_object())
        return settings;

    const json& entry = doc[user_id];
    if (entry.contains("default_strategy") && entry["default_strategy"].is_string())
        settings.default_strategy = entry["default_strategy"].get<std::string>();
    if (entry.contains("auto_trading") && entry["auto_trading"].is_boolean())
        settings.auto_trading = entry["auto_trading"].get<bool>();
    settings.extra = entry;
    return settings;
}

} // namespace autotrade::engine
