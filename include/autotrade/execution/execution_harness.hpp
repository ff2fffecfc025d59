#pragma once

#include "../config/trading_config.hpp"
#include "../engine/collaborators.hpp"
#include "../exchange/iexchange_client.hpp"
#include "../feed/market_data_feed.hpp"
#include "../logging/async_logger.hpp"
#include "../position/position_state_machine.hpp"
#include "../risk/risk_manager.hpp"
#include "../strategy/istrategy.hpp"
#include "../strategy/rsi_filter.hpp"
#include "execution_stats.hpp"
#include "order_tracker.hpp"
#include "timed_evaluation.hpp"

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace autotrade {
namespace execution {

enum class HealthStatus : uint8_t { Healthy, Degraded, Unhealthy };

inline const char* health_status_to_string(HealthStatus status) {
    switch (status) {
    case HealthStatus::Healthy:
        return "HEALTHY";
    case HealthStatus::Degraded:
        return "DEGRADED";
    case HealthStatus::Unhealthy:
        return "UNHEALTHY";
    }
    return "UNKNOWN";
}

struct HealthReport {
    bool api_connection = false;
    bool balance_available = false;
    bool config_valid = false;
    bool strategies_ready = false;
    HealthStatus overall = HealthStatus::Unhealthy;
};

// Evaluation output: the signal plus the data it was computed from
struct Evaluation {
    strategy::MarketContext context;
    strategy::Signal signal;
};

struct CycleResult {
    strategy::Signal signal; // HOLD carries the reason
    bool submitted = false;
    std::string order_id;
    HealthStatus health = HealthStatus::Healthy;
};

/**
 * ExecutionHarness - one trading cycle for one instance.
 *
 *   1. outside trading hours          -> HOLD
 *   2. quote balance < min_balance    -> HOLD "Insufficient balance"
 *   3. health precheck UNHEALTHY      -> HOLD; DEGRADED logs and continues
 *   4. evaluate the strategy on a helper thread under evaluation_timeout_s;
 *      on deadline the worker is cancelled and HOLD "timed out" returned
 *   5. on error, one fallback evaluation with the RSI variant
 *   6. record success / failure / latency per strategy
 *   7. actionable signal -> validation, RSI filter, one open order per
 *      (symbol, side), RiskManager -> place order
 *
 * Every failure ends as a HOLD signal with a reason; run_cycle never throws.
 * The harness is driven by its instance's loop thread only.
 */
class ExecutionHarness {
public:
    using WallClockMs = std::function<uint64_t()>;

    ExecutionHarness(config::TradingConfig cfg, exchange::IExchangeClient& client, risk::RiskManager& risk,
                     position::PositionStateMachine& positions, OrderTracker& orders, ExecutionStats& stats,
                     logging::AsyncLogger& logger, engine::PersistenceStore* store = nullptr,
                     engine::NotificationSink* notifier = nullptr, feed::MarketDataFeed* feed = nullptr,
                     WallClockMs clock = nullptr);

    // Non-copyable
    ExecutionHarness(const ExecutionHarness&) = delete;
    ExecutionHarness& operator=(const ExecutionHarness&) = delete;

    CycleResult run_cycle(strategy::StrategyKind kind, const std::string& symbol,
                          const strategy::StrategyParams& params);

    /// Same, with parameters from the current config
    CycleResult run_cycle(strategy::StrategyKind kind, const std::string& symbol);

    HealthReport health_check();

    bool within_trading_hours() const;

    /**
     * Query every open order and react to transitions.
     * Fills open positions and count toward the daily trade cap.
     * @return number of orders whose status changed
     */
    size_t poll_orders();

    /// Current price: streamed when fresh, otherwise the REST ticker
    double current_price(const std::string& symbol);

    /// Replace the implementation behind a kind (tests, custom variants)
    void set_strategy(strategy::StrategyKind kind, std::shared_ptr<const strategy::IStrategy> impl);

    void update_config(const config::TradingConfig& cfg);
    config::TradingConfig config() const;

    size_t abandoned_workers() { return evaluator_.reap(); }

private:
    config::TradingConfig config_;
    mutable std::mutex config_mutex_;

    exchange::IExchangeClient& client_;
    risk::RiskManager& risk_;
    position::PositionStateMachine& positions_;
    OrderTracker& orders_;
    ExecutionStats& stats_;
    logging::AsyncLogger& logger_;
    engine::PersistenceStore* store_;
    engine::NotificationSink* notifier_;
    feed::MarketDataFeed* feed_;
    WallClockMs clock_;

    std::map<strategy::StrategyKind, std::shared_ptr<const strategy::IStrategy>> strategies_;
    TimedEvaluator<Evaluation> evaluator_;

    HealthReport health_check(std::optional<double> known_balance, const config::TradingConfig& cfg);

    strategy::Signal evaluate(strategy::StrategyKind kind, const std::string& symbol, double balance,
                              const strategy::StrategyParams& params, const config::TradingConfig& cfg,
                              strategy::MarketContext& context_out);

    TimedResult<Evaluation> run_timed(std::shared_ptr<const strategy::IStrategy> impl, const std::string& symbol,
                                      double balance, const strategy::StrategyParams& params,
                                      const config::TradingConfig& cfg);

    CycleResult submit(const strategy::Signal& signal, const strategy::MarketContext& context, double balance,
                       const config::TradingConfig& cfg);

    void notify(const std::string& title, const std::string& message);
    static std::string describe_error(const std::exception_ptr& error);
};

}  // namespace execution
}  // namespace autotrade
