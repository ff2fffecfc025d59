#pragma once

/**
 * TradingConfig - all parameters of one trading instance.
 *
 * Plain struct with defaults from defaults.hpp. Loaded from JSON with
 * nlohmann (unknown keys ignored, missing keys keep defaults); credentials
 * fall back to the PIONEX_API_KEY / PIONEX_SECRET_KEY environment variables.
 *
 * Example file:
 *   {
 *     "trading_pair": "BTC_USDT",
 *     "default_strategy": "ADVANCED_STRATEGY",
 *     "leverage": 10,
 *     "exits": { "tp1_percentage": 2.5, "tp2_percentage": 5.0 },
 *     "trading_hours": { "enabled": true, "start": "19:30", "end": "01:30", "timezone": "UTC-5" }
 *   }
 */

#include "defaults.hpp"

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace autotrade {
namespace config {

using json = nlohmann::json;

struct ApiConfig {
    std::string base_url = client::BASE_URL;
    std::string api_key;
    std::string secret_key;
    bool futures = false; // selects the futures response dialect
    int retry_attempts = client::RETRY_ATTEMPTS;
    double backoff_factor = client::BACKOFF_FACTOR;
    double timeout_s = client::TIMEOUT_S;
    double rate_limit_delay_s = client::RATE_LIMIT_DELAY_S;
    int max_rate_limit_waits = client::MAX_RATE_LIMIT_WAITS;
};

struct FeedSection {
    bool enabled = true;
    std::vector<std::string> urls = {"wss://ws.pionex.com/ws", "wss://api.pionex.com/ws",
                                     "wss://api.pionex.com/stream", "wss://ws.pionex.com"};
    double reconnect_delay_s = feed::RECONNECT_DELAY_S;
    int max_reconnect_attempts = feed::MAX_RECONNECT_ATTEMPTS;
};

struct RsiParams {
    int period = strategy::RSI_PERIOD;
    double oversold = strategy::RSI_OVERSOLD;
    double overbought = strategy::RSI_OVERBOUGHT;
};

struct MacdParams {
    int fast = strategy::MACD_FAST;
    int slow = strategy::MACD_SLOW;
    int signal = strategy::MACD_SIGNAL;
};

struct BollingerParams {
    int period = strategy::BOLLINGER_PERIOD;
    double stddev = strategy::BOLLINGER_STDDEV;
};

struct VolumeFilterParams {
    int ema_period = strategy::VOLUME_EMA_PERIOD;
    double multiplier = strategy::VOLUME_MULTIPLIER;
};

struct GridParams {
    int levels = strategy::GRID_LEVELS;
    double spacing = strategy::GRID_SPACING;
    double position_size = strategy::GRID_POSITION_SIZE;
};

struct DcaParams {
    double amount = strategy::DCA_AMOUNT;
};

struct ExitParams {
    double tp1_percentage = exits::TP1_PCT;
    double tp2_percentage = exits::TP2_PCT;
    double breakeven_percentage = exits::BREAKEVEN_PCT;
    bool trailing_enabled = exits::TRAILING_ENABLED;
    double trailing_step_percentage = exits::TRAILING_STEP_PCT;
    double trailing_distance_percentage = exits::TRAILING_DISTANCE_PCT;
};

struct RiskParams {
    double max_daily_loss = risk::MAX_DAILY_LOSS;
    int max_daily_trades = risk::MAX_DAILY_TRADES;
    double min_confidence = risk::MIN_CONFIDENCE;
    double margin_buffer = risk::MARGIN_BUFFER;
    double max_concentration = risk::MAX_CONCENTRATION;
    double maintenance_margin = risk::MAINTENANCE_MARGIN;
    int max_positions_to_reduce = risk::MAX_POSITIONS_TO_REDUCE;
    bool auto_reduce = risk::AUTO_REDUCE;
};

struct TradingHoursConfig {
    bool enabled = false;
    std::string start = execution::HOURS_START;
    std::string end = execution::HOURS_END;
    std::string timezone = execution::HOURS_TIMEZONE;
};

struct RsiFilterConfig {
    bool enabled = false;
    std::string mode = "normal"; // "normal" or "reduced"
    double long_5m = rsi_filter::LONG_5M;
    double long_1h = rsi_filter::LONG_1H;
    double short_5m = rsi_filter::SHORT_5M;
    double short_1h = rsi_filter::SHORT_1H;
};

struct WatchdogParams {
    double heartbeat_interval_s = watchdog::HEARTBEAT_INTERVAL_S;
    int max_failures = watchdog::MAX_FAILURES;
    bool auto_restart = watchdog::AUTO_RESTART;
    double memory_threshold_mb = watchdog::MEMORY_THRESHOLD_MB;
    double cpu_threshold_pct = watchdog::CPU_THRESHOLD_PCT;
    int restart_sanity_threshold = watchdog::RESTART_SANITY_THRESHOLD;
    int max_restart_cycles = watchdog::MAX_RESTART_CYCLES;
    std::string heartbeat_file; // empty = no file
};

struct LoggingConfig {
    std::string level = "info";
    std::string file; // empty = stderr only
};

struct StorageConfig {
    std::string trades_file = "trades.jsonl";
    std::string logs_file = "engine_log.jsonl";
    std::string settings_file = "user_settings.json";
};

struct TradingConfig {
    std::string trading_pair = "BTC_USDT";
    std::string default_strategy = "ADVANCED_STRATEGY";
    double position_size = strategy::POSITION_SIZE;
    double trading_amount = strategy::TRADING_AMOUNT;
    int leverage = strategy::LEVERAGE;
    double stop_loss_percentage = strategy::STOP_LOSS_PCT;
    double take_profit_percentage = strategy::TAKE_PROFIT_PCT;
    std::string order_type = "MARKET";
    double min_balance = execution::MIN_BALANCE;
    double evaluation_timeout_s = execution::EVALUATION_TIMEOUT_S;
    double cycle_interval_s = execution::CYCLE_INTERVAL_S;
    std::string kline_interval = strategy::KLINE_INTERVAL;
    std::string trend_interval = strategy::TREND_INTERVAL;
    int kline_limit = strategy::KLINE_LIMIT;

    ApiConfig api;
    FeedSection feed;
    RsiParams rsi;
    MacdParams macd;
    BollingerParams bollinger;
    VolumeFilterParams volume_filter;
    GridParams grid;
    DcaParams dca;
    ExitParams exits;
    RiskParams risk;
    TradingHoursConfig trading_hours;
    RsiFilterConfig rsi_filter;
    WatchdogParams watchdog;
    LoggingConfig logging;
    StorageConfig storage;

    /**
     * Names of missing or invalid required parameters.
     * Empty means the config is complete enough to trade.
     */
    std::vector<std::string> validate() const;

    bool is_complete() const { return validate().empty(); }
};

void from_json(const json& j, TradingConfig& cfg);
void to_json(json& j, const TradingConfig& cfg);

/**
 * Parse a JSON document into a config, starting from defaults.
 * @throws ConfigError if the text is not valid JSON
 */
TradingConfig parse_config(const std::string& text);

/**
 * Load a config file and fill credentials from the environment.
 * @throws ConfigError if the file cannot be read or parsed
 */
TradingConfig load_config_file(const std::string& path);

// Fill api_key / secret_key from PIONEX_API_KEY / PIONEX_SECRET_KEY when empty
void apply_env_credentials(TradingConfig& cfg);

}  // namespace config
}  // namespace autotrade
