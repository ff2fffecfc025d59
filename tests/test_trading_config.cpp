#include "../include/autotrade/config/trading_config.hpp"
#include "../include/autotrade/engine/collaborators.hpp"
#include "../include/autotrade/errors.hpp"

#include <cassert>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>

using namespace autotrade;
using namespace autotrade::config;

#define TEST(name) void name()
#define RUN_TEST(name)                                                                                                 \
    do {                                                                                                               \
        std::cout << "  " << #name << "... ";                                                                          \
        name();                                                                                                        \
        std::cout << "PASSED\n";                                                                                       \
    } while (0)

#define ASSERT_EQ(a, b) assert((a) == (b))
#define ASSERT_TRUE(x) assert(x)
#define ASSERT_FALSE(x) assert(!(x))
#define ASSERT_NEAR(a, b, eps) assert(std::abs((a) - (b)) < (eps))

namespace {

std::string config_error_of(const std::string& text) {
    try {
        parse_config(text);
    } catch (const ConfigError& e) {
        return e.what();
    }
    return {};
}

void write_file(const std::string& path, const std::string& text) {
    std::ofstream out(path);
    out << text;
}

size_t line_count(const std::string& path) {
    std::ifstream in(path);
    size_t n = 0;
    std::string line;
    while (std::getline(in, line)) {
        ++n;
    }
    return n;
}

} // namespace

// =============================================================================
// Parsing
// =============================================================================

TEST(defaults_are_valid) {
    TradingConfig cfg;
    ASSERT_TRUE(cfg.validate().empty());
    ASSERT_TRUE(cfg.is_complete());
    ASSERT_EQ(cfg.trading_pair, "BTC_USDT");
    ASSERT_EQ(cfg.leverage, 10);
    ASSERT_NEAR(cfg.exits.tp1_percentage, 2.5, 1e-12);
    ASSERT_NEAR(cfg.exits.tp2_percentage, 5.0, 1e-12);
    ASSERT_NEAR(cfg.exits.breakeven_percentage, 1.0, 1e-12);
}

TEST(parse_overrides_and_keeps_defaults) {
    TradingConfig cfg = parse_config(R"({
        "trading_pair": "ETH_USDT",
        "leverage": 5,
        "unknown_key": [1, 2, 3],
        "exits": { "tp1_percentage": 3.0 },
        "trading_hours": { "enabled": true, "start": "08:00", "end": "16:00", "timezone": "UTC+2" },
        "watchdog": { "max_failures": 5, "heartbeat_file": "hb.json" }
    })");

    ASSERT_EQ(cfg.trading_pair, "ETH_USDT");
    ASSERT_EQ(cfg.leverage, 5);
    ASSERT_NEAR(cfg.exits.tp1_percentage, 3.0, 1e-12);
    ASSERT_NEAR(cfg.exits.tp2_percentage, 5.0, 1e-12); // untouched
    ASSERT_TRUE(cfg.trading_hours.enabled);
    ASSERT_EQ(cfg.trading_hours.timezone, "UTC+2");
    ASSERT_EQ(cfg.watchdog.max_failures, 5);
    ASSERT_EQ(cfg.watchdog.heartbeat_file, "hb.json");
    ASSERT_EQ(cfg.default_strategy, "ADVANCED_STRATEGY");
}

TEST(malformed_input_is_config_error) {
    ASSERT_TRUE(config_error_of("{ not json").find("not valid JSON") != std::string::npos);
    ASSERT_EQ(config_error_of("[1, 2]"), "Config root must be a JSON object");
    ASSERT_EQ(config_error_of(R"({"leverage": "ten"})"), "Invalid value for 'leverage'");
    ASSERT_EQ(config_error_of(R"({"risk": {"max_daily_trades": "many"}})"), "Invalid value for 'max_daily_trades'");
    ASSERT_TRUE(config_error_of(R"({"leverage": null})").empty()); // null keeps the default
}

TEST(validate_names_each_problem) {
    TradingConfig cfg;
    cfg.leverage = 0;
    cfg.position_size = 1.5;
    cfg.trading_pair.clear();
    cfg.exits.tp2_percentage = 2.0; // below tp1
    cfg.evaluation_timeout_s = 0.0;

    auto problems = cfg.validate();
    ASSERT_EQ(problems.size(), 5u);
    ASSERT_EQ(problems[0], "leverage");
    ASSERT_EQ(problems[1], "position_size");
    ASSERT_EQ(problems[2], "trading_pair");
    ASSERT_EQ(problems[3], "exits.tp1_percentage < exits.tp2_percentage");
    ASSERT_EQ(problems[4], "evaluation_timeout_s");
    ASSERT_FALSE(cfg.is_complete());
}

TEST(serialization_omits_credentials) {
    TradingConfig cfg;
    cfg.api.api_key = "key-123";
    cfg.api.secret_key = "secret-456";
    cfg.trading_pair = "SOL_USDT";

    json j = cfg;
    std::string text = j.dump();
    ASSERT_TRUE(text.find("key-123") == std::string::npos);
    ASSERT_TRUE(text.find("secret-456") == std::string::npos);
    ASSERT_FALSE(j["api"].contains("api_key"));

    // What was written reads back the same
    TradingConfig back = parse_config(text);
    ASSERT_EQ(back.trading_pair, "SOL_USDT");
    ASSERT_TRUE(back.api.api_key.empty());
}

TEST(env_credentials_fill_only_blanks) {
    setenv("PIONEX_API_KEY", "env-key", 1);
    setenv("PIONEX_SECRET_KEY", "env-secret", 1);

    TradingConfig blank;
    apply_env_credentials(blank);
    ASSERT_EQ(blank.api.api_key, "env-key");
    ASSERT_EQ(blank.api.secret_key, "env-secret");

    TradingConfig explicit_keys;
    explicit_keys.api.api_key = "file-key";
    apply_env_credentials(explicit_keys);
    ASSERT_EQ(explicit_keys.api.api_key, "file-key");
    ASSERT_EQ(explicit_keys.api.secret_key, "env-secret");

    unsetenv("PIONEX_API_KEY");
    unsetenv("PIONEX_SECRET_KEY");
}

TEST(missing_file_is_config_error) {
    bool thrown = false;
    try {
        load_config_file("/nonexistent/autotrade/config.json");
    } catch (const ConfigError& e) {
        thrown = true;
        ASSERT_TRUE(std::string(e.what()).find("Cannot open config file") != std::string::npos);
    }
    ASSERT_TRUE(thrown);
}

// =============================================================================
// Providers and storage
// =============================================================================

TEST(file_provider_keeps_previous_on_bad_reload) {
    logging::AsyncLogger logger;
    logger.set_min_level(logging::LogLevel::Fatal);
    const std::string path = "autotrade_config_test.json";
    write_file(path, R"({"trading_pair": "ETH_USDT"})");

    engine::JsonFileConfigProvider provider(path, logger);
    ASSERT_EQ(provider.get().trading_pair, "ETH_USDT");

    write_file(path, R"({"trading_pair": "SOL_USDT"})");
    ASSERT_TRUE(provider.reload());
    ASSERT_EQ(provider.get().trading_pair, "SOL_USDT");

    write_file(path, "{ broken");
    ASSERT_FALSE(provider.reload());
    ASSERT_EQ(provider.get().trading_pair, "SOL_USDT");

    write_file(path, R"({"leverage": 0})");
    ASSERT_FALSE(provider.reload());
    ASSERT_EQ(provider.get().leverage, 10);

    std::remove(path.c_str());
}

TEST(jsonl_store_appends_and_reads_settings) {
    logging::AsyncLogger logger;
    logger.set_min_level(logging::LogLevel::Fatal);
    StorageConfig storage;
    storage.trades_file = "autotrade_test_trades.jsonl";
    storage.logs_file = "autotrade_test_logs.jsonl";
    storage.settings_file = "autotrade_test_settings.json";
    std::remove(storage.trades_file.c_str());
    std::remove(storage.logs_file.c_str());

    engine::JsonlPersistenceStore store(storage, logger);
    store.append_trade(json{{"event", "order_placed"}});
    store.append_trade(json{{"event", "position_closed"}});
    store.append_log(json{{"type", "fatal"}});
    ASSERT_EQ(line_count(storage.trades_file), 2u);
    ASSERT_EQ(line_count(storage.logs_file), 1u);

    // No settings file yet
    ASSERT_TRUE(store.get_user_settings("u1").default_strategy.empty());

    write_file(storage.settings_file, R"({"u1": {"default_strategy": "GRID_TRADING", "auto_trading": true}})");
    engine::UserSettings s = store.get_user_settings("u1");
    ASSERT_EQ(s.default_strategy, "GRID_TRADING");
    ASSERT_TRUE(s.auto_trading);
    ASSERT_FALSE(store.get_user_settings("u2").auto_trading);

    std::remove(storage.trades_file.c_str());
    std::remove(storage.logs_file.c_str());
    std::remove(storage.settings_file.c_str());
}

int main() {
    std::cout << "\n=== Trading Config Tests ===\n\n";

    std::cout << "Parsing Tests:\n";
    RUN_TEST(defaults_are_valid);
    RUN_TEST(parse_overrides_and_keeps_defaults);
    RUN_TEST(malformed_input_is_config_error);
    RUN_TEST(validate_names_each_problem);
    RUN_TEST(serialization_omits_credentials);
    RUN_TEST(env_credentials_fill_only_blanks);
    RUN_TEST(missing_file_is_config_error);

    std::cout << "\nProvider / Storage Tests:\n";
    RUN_TEST(file_provider_keeps_previous_on_bad_reload);
    RUN_TEST(jsonl_store_appends_and_reads_settings);

    std::cout << "\n=== All Trading Config Tests Passed! ===\n";
    return 0;
}
