#include "../../include/autotrade/config/trading_config.hpp"
#include "../../include/autotrade/errors.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>

namespace autotrade::config {

namespace {

// Assign only when the key is present and has a compatible type
template <typename T>
void read(const json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null())
        return;
    try {
        out = it->get<T>();
    } catch (const json::exception&) {
        throw ConfigError(std::string("Invalid value for '") + key + "'");
    }
}

const json* section(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_object())
        return nullptr;
    return &*it;
}

} // namespace

// =============================================================================
// Validation
// =============================================================================

std::vector<std::string> TradingConfig::validate() const {
    std::vector<std::string> problems;

    if (leverage <= 0)
        problems.push_back("leverage");
    if (position_size <= 0.0 || position_size > 1.0)
        problems.push_back("position_size");
    if (trading_amount <= 0.0)
        problems.push_back("trading_amount");
    if (trading_pair.empty())
        problems.push_back("trading_pair");
    if (exits.tp1_percentage <= 0.0 || exits.tp2_percentage <= exits.tp1_percentage)
        problems.push_back("exits.tp1_percentage < exits.tp2_percentage");
    if (evaluation_timeout_s <= 0.0)
        problems.push_back("evaluation_timeout_s");

    return problems;
}

// =============================================================================
// JSON mapping
// =============================================================================

void from_json(const json& j, TradingConfig& cfg) {
    read(j, "trading_pair", cfg.trading_pair);
    read(j, "default_strategy", cfg.default_strategy);
    read(j, "position_size", cfg.position_size);
    read(j, "trading_amount", cfg.trading_amount);
    read(j, "leverage", cfg.leverage);
    read(j, "stop_loss_percentage", cfg.stop_loss_percentage);
    read(j, "take_profit_percentage", cfg.take_profit_percentage);
    read(j, "order_type", cfg.order_type);
    read(j, "min_balance", cfg.min_balance);
    read(j, "evaluation_timeout_s", cfg.evaluation_timeout_s);
    read(j, "cycle_interval_s", cfg.cycle_interval_s);
    read(j, "kline_interval", cfg.kline_interval);
    read(j, "trend_interval", cfg.trend_interval);
    read(j, "kline_limit", cfg.kline_limit);

    if (auto s = section(j, "api")) {
        read(*s, "base_url", cfg.api.base_url);
        read(*s, "api_key", cfg.api.api_key);
        read(*s, "secret_key", cfg.api.secret_key);
        read(*s, "futures", cfg.api.futures);
        read(*s, "retry_attempts", cfg.api.retry_attempts);
        read(*s, "backoff_factor", cfg.api.backoff_factor);
        read(*s, "timeout_s", cfg.api.timeout_s);
        read(*s, "rate_limit_delay_s", cfg.api.rate_limit_delay_s);
        read(*s, "max_rate_limit_waits", cfg.api.max_rate_limit_waits);
    }
    if (auto s = section(j, "feed")) {
        read(*s, "enabled", cfg.feed.enabled);
        read(*s, "urls", cfg.feed.urls);
        read(*s, "reconnect_delay_s", cfg.feed.reconnect_delay_s);
        read(*s, "max_reconnect_attempts", cfg.feed.max_reconnect_attempts);
    }
    if (auto s = section(j, "rsi")) {
        read(*s, "period", cfg.rsi.period);
        read(*s, "oversold", cfg.rsi.oversold);
        read(*s, "overbought", cfg.rsi.overbought);
    }
    if (auto s = section(j, "macd")) {
        read(*s, "fast", cfg.macd.fast);
        read(*s, "slow", cfg.macd.slow);
        read(*s, "signal", cfg.macd.signal);
    }
    if (auto s = section(j, "bollinger")) {
        read(*s, "period", cfg.bollinger.period);
        read(*s, "stddev", cfg.bollinger.stddev);
    }
    if (auto s = section(j, "volume_filter")) {
        read(*s, "ema_period", cfg.volume_filter.ema_period);
        read(*s, "multiplier", cfg.volume_filter.multiplier);
    }
    if (auto s = section(j, "grid")) {
        read(*s, "levels", cfg.grid.levels);
        read(*s, "spacing", cfg.grid.spacing);
        read(*s, "position_size", cfg.grid.position_size);
    }
    if (auto s = section(j, "dca")) {
        read(*s, "amount", cfg.dca.amount);
    }
    if (auto s = section(j, "exits")) {
        read(*s, "tp1_percentage", cfg.exits.tp1_percentage);
        read(*s, "tp2_percentage", cfg.exits.tp2_percentage);
        read(*s, "breakeven_percentage", cfg.exits.breakeven_percentage);
        read(*s, "trailing_enabled", cfg.exits.trailing_enabled);
        read(*s, "trailing_step_percentage", cfg.exits.trailing_step_percentage);
        read(*s, "trailing_distance_percentage", cfg.exits.trailing_distance_percentage);
    }
    if (auto s = section(j, "risk")) {
        read(*s, "max_daily_loss", cfg.risk.max_daily_loss);
        read(*s, "max_daily_trades", cfg.risk.max_daily_trades);
        read(*s, "min_confidence", cfg.risk.min_confidence);
        read(*s, "margin_buffer", cfg.risk.margin_buffer);
        read(*s, "max_concentration", cfg.risk.max_concentration);
        read(*s, "maintenance_margin", cfg.risk.maintenance_margin);
        read(*s, "max_positions_to_reduce", cfg.risk.max_positions_to_reduce);
        read(*s, "auto_reduce", cfg.risk.auto_reduce);
    }
    if (auto s = section(j, "trading_hours")) {
        read(*s, "enabled", cfg.trading_hours.enabled);
        read(*s, "start", cfg.trading_hours.start);
        read(*s, "end", cfg.trading_hours.end);
        read(*s, "timezone", cfg.trading_hours.timezone);
    }
    if (auto s = section(j, "rsi_filter")) {
        read(*s, "enabled", cfg.rsi_filter.enabled);
        read(*s, "mode", cfg.rsi_filter.mode);
        read(*s, "long_5m", cfg.rsi_filter.long_5m);
        read(*s, "long_1h", cfg.rsi_filter.long_1h);
        read(*s, "short_5m", cfg.rsi_filter.short_5m);
        read(*s, "short_1h", cfg.rsi_filter.short_1h);
    }
    if (auto s = section(j, "watchdog")) {
        read(*s, "heartbeat_interval_s", cfg.watchdog.heartbeat_interval_s);
        read(*s, "max_failures", cfg.watchdog.max_failures);
        read(*s, "auto_restart", cfg.watchdog.auto_restart);
        read(*s, "memory_threshold_mb", cfg.watchdog.memory_threshold_mb);
        read(*s, "cpu_threshold_pct", cfg.watchdog.cpu_threshold_pct);
        read(*s, "restart_sanity_threshold", cfg.watchdog.restart_sanity_threshold);
        read(*s, "max_restart_cycles", cfg.watchdog.max_restart_cycles);
        read(*s, "heartbeat_file", cfg.watchdog.heartbeat_file);
    }
    if (auto s = section(j, "logging")) {
        read(*s, "level", cfg.logging.level);
        read(*s, "file", cfg.logging.file);
    }
    if (auto s = section(j, "storage")) {
        read(*s, "trades_file", cfg.storage.trades_file);
        read(*s, "logs_file", cfg.storage.logs_file);
        read(*s, "settings_file", cfg.storage.settings_file);
    }
}

void to_json(json& j, const TradingConfig& cfg) {
    // Credentials are never serialized
    j = json{
        {"trading_pair", cfg.trading_pair},
        {"default_strategy", cfg.default_strategy},
        {"position_size", cfg.position_size},
        {"trading_amount", cfg.trading_amount},
        {"leverage", cfg.leverage},
        {"stop_loss_percentage", cfg.stop_loss_percentage},
        {"take_profit_percentage", cfg.take_profit_percentage},
        {"order_type", cfg.order_type},
        {"min_balance", cfg.min_balance},
        {"evaluation_timeout_s", cfg.evaluation_timeout_s},
        {"cycle_interval_s", cfg.cycle_interval_s},
        {"kline_interval", cfg.kline_interval},
        {"trend_interval", cfg.trend_interval},
        {"kline_limit", cfg.kline_limit},
        {"api",
         {{"base_url", cfg.api.base_url},
          {"futures", cfg.api.futures},
          {"retry_attempts", cfg.api.retry_attempts},
          {"backoff_factor", cfg.api.backoff_factor},
          {"timeout_s", cfg.api.timeout_s},
          {"rate_limit_delay_s", cfg.api.rate_limit_delay_s},
          {"max_rate_limit_waits", cfg.api.max_rate_limit_waits}}},
        {"feed",
         {{"enabled", cfg.feed.enabled},
          {"urls", cfg.feed.urls},
          {"reconnect_delay_s", cfg.feed.reconnect_delay_s},
          {"max_reconnect_attempts", cfg.feed.max_reconnect_attempts}}},
        {"rsi", {{"period", cfg.rsi.period}, {"oversold", cfg.rsi.oversold}, {"overbought", cfg.rsi.overbought}}},
        {"macd", {{"fast", cfg.macd.fast}, {"slow", cfg.macd.slow}, {"signal", cfg.macd.signal}}},
        {"bollinger", {{"period", cfg.bollinger.period}, {"stddev", cfg.bollinger.stddev}}},
        {"volume_filter",
         {{"ema_period", cfg.volume_filter.ema_period}, {"multiplier", cfg.volume_filter.multiplier}}},
        {"grid",
         {{"levels", cfg.grid.levels}, {"spacing", cfg.grid.spacing}, {"position_size", cfg.grid.position_size}}},
        {"dca", {{"amount", cfg.dca.amount}}},
        {"exits",
         {{"tp1_percentage", cfg.exits.tp1_percentage},
          {"tp2_percentage", cfg.exits.tp2_percentage},
          {"breakeven_percentage", cfg.exits.breakeven_percentage},
          {"trailing_enabled", cfg.exits.trailing_enabled},
          {"trailing_step_percentage", cfg.exits.trailing_step_percentage},
          {"trailing_distance_percentage", cfg.exits.trailing_distance_percentage}}},
        {"risk",
         {{"max_daily_loss", cfg.risk.max_daily_loss},
          {"max_daily_trades", cfg.risk.max_daily_trades},
          {"min_confidence", cfg.risk.min_confidence},
          {"margin_buffer", cfg.risk.margin_buffer},
          {"max_concentration", cfg.risk.max_concentration},
          {"maintenance_margin", cfg.risk.maintenance_margin},
          {"max_positions_to_reduce", cfg.risk.max_positions_to_reduce},
          {"auto_reduce", cfg.risk.auto_reduce}}},
        {"trading_hours",
         {{"enabled", cfg.trading_hours.enabled},
          {"start", cfg.trading_hours.start},
          {"end", cfg.trading_hours.end},
          {"timezone", cfg.trading_hours.timezone}}},
        {"rsi_filter",
         {{"enabled", cfg.rsi_filter.enabled},
          {"mode", cfg.rsi_filter.mode},
          {"long_5m", cfg.rsi_filter.long_5m},
          {"long_1h", cfg.rsi_filter.long_1h},
          {"short_5m", cfg.rsi_filter.short_5m},
          {"short_1h", cfg.rsi_filter.short_1h}}},
        {"watchdog",
         {{"heartbeat_interval_s", cfg.watchdog.heartbeat_interval_s},
          {"max_failures", cfg.watchdog.max_failures},
          {"auto_restart", cfg.watchdog.auto_restart},
          {"memory_threshold_mb", cfg.watchdog.memory_threshold_mb},
          {"cpu_threshold_pct", cfg.watchdog.cpu_threshold_pct},
          {"restart_sanity_threshold", cfg.watchdog.restart_sanity_threshold},
          {"max_restart_cycles", cfg.watchdog.max_restart_cycles},
          {"heartbeat_file", cfg.watchdog.heartbeat_file}}},
        {"logging", {{"level", cfg.logging.level}, {"file", cfg.logging.file}}},
        {"storage",
         {{"trades_file", cfg.storage.trades_file},
          {"logs_file", cfg.storage.logs_file},
          {"settings_file", cfg.storage.settings_file}}},
    };
}

// =============================================================================
// Loading
// =============================================================================

TradingConfig parse_config(const std::string& text) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& e) {
        throw ConfigError(std::string("Config is not valid JSON: ") + e.what());
    }
    if (!j.is_object()) {
        throw ConfigError("Config root must be a JSON object");
    }

    TradingConfig cfg;
    from_json(j, cfg);
    return cfg;
}

TradingConfig load_config_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigError("Cannot open config file: " + path);
    }
    std::stringstream ss;
    ss << in.rdbuf();

    TradingConfig cfg = parse_config(ss.str());
    apply_env_credentials(cfg);
    return cfg;
}

void apply_env_credentials(TradingConfig& cfg) {
    if (cfg.api.api_key.empty()) {
        if (const char* key = std::getenv("PIONEX_API_KEY"))
            cfg.api.api_key = key;
    }
    if (cfg.api.secret_key.empty()) {
        if (const char* secret = std::getenv("PIONEX_SECRET_KEY"))
            cfg.api.secret_key = secret;
    }
}

} // namespace autotrade::config
