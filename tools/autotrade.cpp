/**
 * Autotrade engine
 *
 * Runs one or more trading instances against the exchange, supervised by
 * the watchdog, until SIGINT/SIGTERM or --duration.
 *
 * Usage:
 *   autotrade --config trading.json
 *   autotrade -c trading.json -n 2 -p BTC_USDT,ETH_USDT
 *   autotrade --dry-run -v
 */

#include "../include/autotrade/config/trading_config.hpp"
#include "../include/autotrade/engine/collaborators.hpp"
#include "../include/autotrade/engine/instance_registry.hpp"
#include "../include/autotrade/engine/trading_instance.hpp"
#include "../include/autotrade/errors.hpp"
#include "../include/autotrade/exchange/exchange_client.hpp"
#include "../include/autotrade/exchange/http_transport.hpp"
#include "../include/autotrade/feed/market_data_feed.hpp"
#include "../include/autotrade/feed/ws_transport.hpp"
#include "../include/autotrade/logging/async_logger.hpp"
#include "../include/autotrade/supervisor/watchdog.hpp"
#include "../include/autotrade/util/cli.hpp"
#include "../include/autotrade/util/system.hpp"

#include <atomic>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <memory>
#include <thread>

using namespace autotrade;
using namespace autotrade::util;

namespace {

std::atomic<bool> g_running{true};

constexpr int STATUS_INTERVAL_S = 60;
constexpr int CONFIG_RELOAD_INTERVAL_S = 300;

/**
 * Applies command-line overrides on top of another provider, so a file
 * reload keeps the per-instance pair and strategy.
 */
class OverrideConfigProvider : public engine::ConfigProvider {
public:
    OverrideConfigProvider(std::shared_ptr<engine::ConfigProvider> base, std::string pair, std::string strategy)
        : base_(std::move(base))
        , pair_(std::move(pair))
        , strategy_(std::move(strategy)) {}

    config::TradingConfig get() const override {
        config::TradingConfig cfg = base_->get();
        if (!pair_.empty())
            cfg.trading_pair = pair_;
        if (!strategy_.empty())
            cfg.default_strategy = strategy_;
        return cfg;
    }

    bool reload() override { return base_->reload(); }

private:
    std::shared_ptr<engine::ConfigProvider> base_;
    std::string pair_;
    std::string strategy_;
};

exchange::ClientConfig client_config(const config::TradingConfig& cfg) {
    exchange::ClientConfig cc;
    cc.base_url = cfg.api.base_url;
    cc.api_key = cfg.api.api_key;
    cc.secret_key = cfg.api.secret_key;
    cc.futures = cfg.api.futures;
    cc.retry_attempts = cfg.api.retry_attempts;
    cc.backoff_factor = cfg.api.backoff_factor;
    cc.timeout_s = cfg.api.timeout_s;
    cc.rate_limit_delay_s = cfg.api.rate_limit_delay_s;
    cc.max_rate_limit_waits = cfg.api.max_rate_limit_waits;
    return cc;
}

feed::FeedConfig feed_config(const config::TradingConfig& cfg) {
    feed::FeedConfig fc;
    fc.urls = cfg.feed.urls;
    fc.reconnect_delay_s = cfg.feed.reconnect_delay_s;
    fc.max_reconnect_attempts = cfg.feed.max_reconnect_attempts;
    return fc;
}

void print_status(engine::InstanceRegistry& registry, const supervisor::Watchdog& watchdog) {
    auto wd = watchdog.status();
    std::cout << "[STATUS] uptime " << std::fixed << std::setprecision(0) << wd.uptime_s << "s | active "
              << wd.active_instances << "/" << wd.monitored_instances << " | restarts " << wd.restart_history_size;
    if (wd.resources.memory_mb >= 0)
        std::cout << " | mem " << std::setprecision(1) << wd.resources.memory_mb << " MB";
    std::cout << "\n";

    for (const auto& id : registry.ids()) {
        auto status = registry.get_status(id);
        if (!status)
            continue;
        std::cout << "  " << status->id << " " << status->pair << (status->running ? " running" : " stopped")
                  << (status->enabled ? "" : " (disabled: " + status->disabled_reason + ")") << " | cycles "
                  << status->cycles << " | positions " << status->open_positions << " | orders "
                  << status->open_orders << (status->trading_hours_active ? "" : " | outside hours") << "\n";
    }
}

int run(const CLIArgs& args) {
    logging::AsyncLogger logger;

    // Configuration
    std::shared_ptr<engine::ConfigProvider> base;
    try {
        if (args.config_path.empty()) {
            config::TradingConfig defaults;
            config::apply_env_credentials(defaults);
            base = std::make_shared<engine::StaticConfigProvider>(defaults);
        } else {
            base = std::make_shared<engine::JsonFileConfigProvider>(args.config_path, logger);
        }
    } catch (const ConfigError& e) {
        std::cerr << "Config error: " << e.what() << "\n";
        return 1;
    }

    config::TradingConfig cfg = base->get();
    if (!args.strategy.empty()) {
        try {
            strategy::strategy_kind_from_string(args.strategy);
        } catch (const ConfigError& e) {
            std::cerr << e.what() << "\n";
            return 1;
        }
    }

    logger.set_min_level(args.verbose ? logging::LogLevel::Debug : logging::level_from_string(cfg.logging.level));
    if (!cfg.logging.file.empty() && !logger.open_file(cfg.logging.file)) {
        std::cerr << "Cannot open log file " << cfg.logging.file << "\n";
        return 1;
    }
    logger.start();

    // Shared services
    auto client = std::make_shared<exchange::ExchangeProtocolClient>(
        client_config(cfg), std::make_shared<exchange::CurlTransport>(), logger);
    engine::JsonlPersistenceStore store(cfg.storage, logger);
    engine::LogNotificationSink notifier(logger);

    std::unique_ptr<feed::MarketDataFeed> market_feed;
    if (!args.dry_run && cfg.feed.enabled) {
        market_feed =
            std::make_unique<feed::MarketDataFeed>(feed_config(cfg), std::make_unique<feed::LwsTransport>(), logger);
    }

    // Instances
    engine::InstanceRegistry registry;
    std::vector<std::shared_ptr<engine::TradingInstance>> instances;
    for (int i = 0; i < args.instances; ++i) {
        std::string pair = args.pairs.empty() ? std::string() : args.pairs[i % args.pairs.size()];
        auto provider = std::make_shared<OverrideConfigProvider>(base, pair, args.strategy);
        std::string id = "instance-" + std::to_string(i + 1);

        auto instance = std::make_shared<engine::TradingInstance>(id, provider, client, logger, &store, &notifier,
                                                                  market_feed.get(), id);
        registry.add(instance);
        instances.push_back(instance);

        if (market_feed)
            market_feed->subscribe("ticker", {{"symbol", provider->get().trading_pair}});
    }

    std::cout << "Autotrade engine: " << instances.size() << " instance(s)"
              << (args.dry_run ? " [dry run]" : "") << "\n";

    if (args.dry_run) {
        for (auto& instance : instances) {
            try {
                auto result = instance->run_once();
                const auto& s = result.signal;
                std::cout << "  " << instance->id() << " " << s.symbol << " " << s.strategy_name << ": "
                          << action_to_string(s.action);
                if (s.is_hold())
                    std::cout << " (" << s.reason << ")";
                else
                    std::cout << " " << s.quantity << " @ " << s.price << (result.submitted ? " submitted" : "");
                std::cout << " [" << execution::health_status_to_string(result.health) << "]\n";
            } catch (const ConfigError& e) {
                std::cerr << "  " << instance->id() << ": " << e.what() << "\n";
            }
        }
        logger.stop();
        return 0;
    }

    if (market_feed)
        market_feed->start();

    for (auto& instance : instances) {
        registry.enable(instance->id());
    }

    supervisor::Watchdog watchdog(cfg.watchdog, registry, logger, &notifier);
    watchdog.start();

    auto start = std::chrono::steady_clock::now();
    auto last_status = start;
    auto last_reload = start;

    while (g_running) {
        auto now = std::chrono::steady_clock::now();
        auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(now - start).count();
        if (args.duration > 0 && elapsed >= args.duration)
            break;

        if (std::chrono::duration_cast<std::chrono::seconds>(now - last_status).count() >= STATUS_INTERVAL_S) {
            print_status(registry, watchdog);
            last_status = now;
        }
        if (std::chrono::duration_cast<std::chrono::seconds>(now - last_reload).count() >= CONFIG_RELOAD_INTERVAL_S) {
            base->reload();
            last_reload = now;
        }

        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    std::cout << "\nShutting down...\n";
    watchdog.stop();
    registry.disable_all("Shutdown");
    if (market_feed)
        market_feed->stop();

    for (const auto& id : registry.ids()) {
        if (auto snapshot = registry.get_portfolio_snapshot(id)) {
            std::cout << "[DONE] " << id << " | balance $" << std::fixed << std::setprecision(2)
                      << snapshot->quote_balance << " | open positions " << snapshot->position_count
                      << " | unrealized PnL $" << snapshot->total_unrealized_pnl << "\n";
        }
    }
    std::cout << "[DONE] log entries " << logger.total_logged() << ", dropped " << logger.dropped_count() << "\n";

    logger.stop();
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    install_shutdown_handler(g_running);

    CLIArgs args;
    if (!parse_args(argc, argv, args))
        return 1;

    if (args.help) {
        print_help();
        return 0;
    }

    try {
        return run(args);
    } catch (const std::exception& e) {
        std::cerr << "Fatal: " << e.what() << "\n";
        return 1;
    }
}
