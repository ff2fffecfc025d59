#pragma once

#include "../config/trading_config.hpp"
#include "../exchange/iexchange_client.hpp"
#include "../execution/execution_harness.hpp"
#include "../execution/execution_stats.hpp"
#include "../execution/order_tracker.hpp"
#include "../feed/market_data_feed.hpp"
#include "../logging/async_logger.hpp"
#include "../position/position_state_machine.hpp"
#include "../risk/risk_manager.hpp"
#include "../strategy/istrategy.hpp"
#include "collaborators.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace autotrade {
namespace engine {

// =============================================================================
// Control-surface types
// =============================================================================

// One (symbol, strategy) pair evaluated in rotation by an instance
struct StrategyAssignment {
    std::string id;
    std::string symbol;
    strategy::StrategyKind kind = strategy::StrategyKind::Rsi;
    strategy::StrategyParams params;
};

struct InstanceStatus {
    std::string id;
    bool running = false;
    bool enabled = false;
    std::string pair;
    int restart_count = 0;
    TimestampMs last_restart_ms = 0;
    bool trading_hours_active = true;
    uint64_t cycles = 0;
    size_t open_positions = 0;
    size_t open_orders = 0;
    size_t assignments = 0;
    std::string disabled_reason;
    std::vector<std::string> reduce_advised; // latest periodic risk advice


    json to_json() const {
        return json{{"id", id},
                    {"running", running},
                    {"enabled", enabled},
                    {"pair", pair},
                    {"restart_count", restart_count},
                    {"last_restart", last_restart_ms},
                    {"trading_hours_active", trading_hours_active},
                    {"cycles", cycles},
                    {"open_positions", open_positions},
                    {"open_orders", open_orders},
                    {"assignments", assignments},
                    {"disabled_reason", disabled_reason},
                    {"reduce_advised", reduce_advised}};
    }
};

struct PortfolioSnapshot {
    std::string instance_id;
    double quote_balance = 0.0;
    std::vector<position::Position> positions;
    double total_unrealized_pnl = 0.0;
    size_t position_count = 0;
    TimestampMs timestamp_ms = 0;

    json to_json() const {
        json rows = json::array();
        for (const auto& p : positions) {
            rows.push_back(json{{"symbol", p.symbol},
                                {"side", side_to_string(p.side)},
                                {"size", p.size},
                                {"entry_price", p.entry_price},
                                {"mark_price", p.mark_price},
                                {"leverage", p.leverage},
                                {"unrealized_pnl", p.unrealized_pnl},
                                {"stop_loss", p.stop_loss_price},
                                {"tp1_hit", p.tp1_hit},
                                {"trailing", p.trailing_enabled}});
        }
        return json{{"type", "portfolio_snapshot"},
                    {"instance_id", instance_id},
                    {"quote_balance", quote_balance},
                    {"positions", rows},
                    {"total_unrealized_pnl", total_unrealized_pnl},
                    {"position_count", position_count},
                    {"timestamp", timestamp_ms}};
    }
};

/**
 * What the registry and the watchdog see of an instance.
 * Every method is callable from any thread.
 */
class ITradingInstance {
public:
    virtual ~ITradingInstance() = default;

    virtual const std::string& id() const = 0;
    virtual bool is_enabled() const = 0;
    virtual bool is_running() const = 0;
    virtual int restart_count() const = 0;

    /// Turn auto-trading on and start the loop
    virtual bool enable() = 0;

    /// Turn auto-trading off and stop the loop. Stays off until enable().
    virtual bool disable(const std::string& reason) = 0;

    /// Stop and start the loop; counts toward restart_count
    virtual bool restart() = 0;

    virtual InstanceStatus get_status() const = 0;
    virtual std::optional<PortfolioSnapshot> get_portfolio_snapshot() = 0;

    /// @return assignment id
    virtual std::string add_strategy(const std::string& symbol, strategy::StrategyKind kind,
                                     const strategy::StrategyParams& params) = 0;
    virtual bool remove_strategy(const std::string& assignment_id) = 0;
};

// =============================================================================
// TradingInstance
// =============================================================================

/**
 * TradingInstance - one independent trading loop with its own orders,
 * positions, risk counters and statistics.
 *
 * Loop, every cycle_interval_s:
 *   1. skip unless enabled
 *   2. one harness cycle (next assignment, else user default, else config)
 *   3. tick open positions (streamed price, else REST ticker)
 *   4. poll open orders
 *   5. periodic risk check; advised reductions are reported, and
 *      force-closed only with risk.auto_reduce
 *   6. interruptible sleep
 *
 * A ConfigError in any step disables the instance and notifies the
 * operator. Other exceptions are logged and the loop continues.
 */
class TradingInstance : public ITradingInstance {
public:
    using WallClockMs = std::function<uint64_t()>;

    TradingInstance(std::string id, std::shared_ptr<ConfigProvider> config,
                    std::shared_ptr<exchange::IExchangeClient> client, logging::AsyncLogger& logger,
                    PersistenceStore* store = nullptr, NotificationSink* notifier = nullptr,
                    feed::MarketDataFeed* feed = nullptr, std::string user_id = {}, WallClockMs clock = nullptr);

    ~TradingInstance() override;

    // Non-copyable
    TradingInstance(const TradingInstance&) = delete;
    TradingInstance& operator=(const TradingInstance&) = delete;

    const std::string& id() const override { return id_; }
    bool is_enabled() const override { return enabled_.load(); }
    bool is_running() const override { return running_.load(); }
    int restart_count() const override { return restart_count_.load(); }

    bool enable() override;
    bool disable(const std::string& reason) override;
    bool restart() override;

    InstanceStatus get_status() const override;
    std::optional<PortfolioSnapshot> get_portfolio_snapshot() override;

    std::string add_strategy(const std::string& symbol, strategy::StrategyKind kind,
                             const strategy::StrategyParams& params) override;
    bool remove_strategy(const std::string& assignment_id) override;

    /// Start the loop thread without touching the enabled flag
    bool start();

    /**
     * Signal the loop and wait up to the stop timeout for it to exit.
     * A loop that misses the deadline stays owned by the instance and no
     * new loop starts until it has exited; the destructor joins it.
     */
    void stop();

    void set_stop_timeout(double seconds) { stop_timeout_s_.store(seconds); }

    /**
     * One full cycle on the calling thread (steps 2-5).
     * Throws ConfigError when the configuration is unusable.
     */
    execution::CycleResult run_once();

    std::vector<StrategyAssignment> assignments() const;

    execution::ExecutionHarness& harness() { return harness_; }
    position::PositionStateMachine& positions() { return positions_; }
    risk::RiskManager& risk() { return risk_; }
    execution::OrderTracker& orders() { return orders_; }
    const execution::ExecutionStats& stats() const { return stats_; }

    static constexpr double STOP_JOIN_TIMEOUT_S = 5.0;

private:
    struct Selection {
        strategy::StrategyKind kind;
        std::string symbol;
        strategy::StrategyParams params;
    };

    std::string id_;
    std::string user_id_;
    std::shared_ptr<ConfigProvider> config_;
    std::shared_ptr<exchange::IExchangeClient> client_;
    logging::AsyncLogger& logger_;
    PersistenceStore* store_;
    NotificationSink* notifier_;
    feed::MarketDataFeed* feed_;
    WallClockMs clock_;

    execution::ExecutionStats stats_;
    execution::OrderTracker orders_;
    risk::RiskManager risk_;
    position::PositionStateMachine positions_;
    execution::ExecutionHarness harness_;

    mutable std::mutex assignments_mutex_;
    std::vector<StrategyAssignment> assignments_;
    size_t next_assignment_ = 0;
    uint64_t next_assignment_id_ = 1;

    std::atomic<bool> enabled_{false};
    std::atomic<bool> running_{false};
    std::atomic<int> restart_count_{0};
    std::atomic<TimestampMs> last_restart_ms_{0};
    std::atomic<uint64_t> cycles_{0};
    mutable std::mutex reason_mutex_;
    std::string disabled_reason_;
    std::vector<PositionKey> reduce_advised_; // guarded by reason_mutex_

    // Per-loop flags, guarded by loop_mutex_. Never reset once set.
    struct LoopControl {
        bool stop = false;
        bool exited = false;
    };

    struct StalledLoop {
        std::thread thread;
        std::shared_ptr<LoopControl> control;
    };

    // Loop thread control
    std::mutex control_mutex_; // serializes start / stop / restart
    std::mutex loop_mutex_;
    std::condition_variable loop_cv_;
    std::shared_ptr<LoopControl> loop_; // current loop
    std::thread thread_;
    std::vector<StalledLoop> stalled_; // missed the stop deadline, still running
    std::atomic<std::thread::id> loop_thread_id_{};
    std::atomic<double> stop_timeout_s_{STOP_JOIN_TIMEOUT_S};

    void run_loop(std::shared_ptr<LoopControl> control);
    bool sleep_interval(const LoopControl& control, double seconds);
    bool start_locked();
    void stop_locked();
    bool reap_stalled_locked();
    void fatal(const std::string& reason);

    void apply_config(const config::TradingConfig& cfg);
    Selection next_selection(const config::TradingConfig& cfg);
    void tick_positions();
    void periodic_risk(bool auto_reduce);
    void on_position_closed(const position::ClosedPosition& closed);
    void notify(const std::string& title, const std::string& message);
};

}  // namespace engine
}  // namespace autotrade
