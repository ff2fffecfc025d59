#include "../../include/autotrade/engine/trading_instance.hpp"
#include "../../include/autotrade/errors.hpp"
#include "../../include/autotrade/util/time_utils.hpp"

#include <algorithm>
#include <chrono>
#include <cstdio>

namespace autotrade::engine {

namespace {

template <typename T>
std::shared_ptr<T> require(std::shared_ptr<T> ptr, const char* what) {
    if (!ptr)
        throw ConfigError(std::string("TradingInstance requires a ") + what);
    return ptr;
}

} // namespace

TradingInstance::TradingInstance(std::string id, std::shared_ptr<ConfigProvider> config,
                                 std::shared_ptr<exchange::IExchangeClient> client, logging::AsyncLogger& logger,
                                 PersistenceStore* store, NotificationSink* notifier, feed::MarketDataFeed* feed,
                                 std::string user_id, WallClockMs clock)
    : id_(std::move(id))
    , user_id_(std::move(user_id))
    , config_(require(std::move(config), "config provider"))
    , client_(require(std::move(client), "exchange client"))
    , logger_(logger)
    , store_(store)
    , notifier_(notifier)
    , feed_(feed)
    , clock_(clock ? std::move(clock) : WallClockMs(util::wall_clock_ms))
    , risk_(config_->get().risk, config_->get().leverage, logger, clock_)
    , positions_(config_->get().exits, config_->get().stop_loss_percentage, *client_, logger, clock_)
    , harness_(config_->get(), *client_, risk_, positions_, orders_, stats_, logger, store, notifier, feed, clock_) {
    positions_.set_closed_callback([this](const position::ClosedPosition& closed) { on_position_closed(closed); });
}

TradingInstance::~TradingInstance() {
    std::lock_guard<std::mutex> lock(control_mutex_);
    stop_locked();
    for (auto& stalled : stalled_) {
        // Waits out the blocking call; members outlive the loop
        stalled.thread.join();
    }
}

// =============================================================================
// Lifecycle
// =============================================================================

bool TradingInstance::enable() {
    enabled_.store(true);
    {
        std::lock_guard<std::mutex> lock(reason_mutex_);
        disabled_reason_.clear();
    }
    AUTOTRADE_LOGF_INFO(logger_, System, "Instance %s: auto-trading enabled", id_.c_str());
    notify("Auto-Trading Enabled", "Instance " + id_);
    return start();
}

bool TradingInstance::disable(const std::string& reason) {
    enabled_.store(false);
    {
        std::lock_guard<std::mutex> lock(reason_mutex_);
        disabled_reason_ = reason;
    }
    AUTOTRADE_LOGF_WARN(logger_, System, "Instance %s: auto-trading disabled (%s)", id_.c_str(), reason.c_str());
    notify("Auto-Trading Disabled", "Instance " + id_ + ": " + reason);
    stop();
    return true;
}

bool TradingInstance::restart() {
    std::lock_guard<std::mutex> lock(control_mutex_);
    stop_locked();
    ++restart_count_;
    last_restart_ms_.store(clock_());
    AUTOTRADE_LOGF_WARN(logger_, System, "Instance %s restarting (restart #%d)", id_.c_str(), restart_count_.load());

    if (!enabled_.load())
        return false;
    return start_locked();
}

bool TradingInstance::start() {
    std::lock_guard<std::mutex> lock(control_mutex_);
    if (running_.load())
        return true;
    if (thread_.joinable())
        stop_locked();
    return start_locked();
}

bool TradingInstance::start_locked() {
    if (!reap_stalled_locked()) {
        AUTOTRADE_LOGF_ERROR(logger_, System, "Instance %s: previous loop still running, not starting another",
                             id_.c_str());
        return false;
    }

    auto control = std::make_shared<LoopControl>();
    {
        std::lock_guard<std::mutex> loop_lock(loop_mutex_);
        loop_ = control;
    }
    running_.store(true);
    thread_ = std::thread(&TradingInstance::run_loop, this, control);
    AUTOTRADE_LOGF_INFO(logger_, System, "Instance %s loop started", id_.c_str());
    return true;
}

void TradingInstance::stop() {
    if (loop_thread_id_.load() == std::this_thread::get_id()) {
        // Called from the loop itself: it exits at its next check
        std::lock_guard<std::mutex> loop_lock(loop_mutex_);
        if (loop_)
            loop_->stop = true;
        return;
    }
    std::lock_guard<std::mutex> lock(control_mutex_);
    stop_locked();
}

void TradingInstance::stop_locked() {
    std::shared_ptr<LoopControl> control;
    {
        std::lock_guard<std::mutex> loop_lock(loop_mutex_);
        control = loop_;
        if (control)
            control->stop = true;
    }
    loop_cv_.notify_all();

    if (!thread_.joinable() || !control) {
        running_.store(false);
        return;
    }

    bool exited;
    {
        std::unique_lock<std::mutex> loop_lock(loop_mutex_);
        exited = loop_cv_.wait_for(loop_lock, std::chrono::duration<double>(stop_timeout_s_.load()),
                                   [&control] { return control->exited; });
    }

    if (exited) {
        thread_.join();
    } else {
        AUTOTRADE_LOGF_ERROR(logger_, System, "Instance %s loop did not stop within %.1fs, parked until it exits",
                             id_.c_str(), stop_timeout_s_.load());
        stalled_.push_back(StalledLoop{std::move(thread_), control});
    }
    running_.store(false);
}

// Joins stalled loops that have exited. False while any is still running.
bool TradingInstance::reap_stalled_locked() {
    std::lock_guard<std::mutex> loop_lock(loop_mutex_);
    auto alive = std::partition(stalled_.begin(), stalled_.end(),
                                [](const StalledLoop& stalled) { return !stalled.control->exited; });
    for (auto it = alive; it != stalled_.end(); ++it) {
        it->thread.join();
    }
    stalled_.erase(alive, stalled_.end());
    return stalled_.empty();
}

void TradingInstance::fatal(const std::string& reason) {
    enabled_.store(false);
    {
        std::lock_guard<std::mutex> lock(reason_mutex_);
        disabled_reason_ = reason;
    }
    AUTOTRADE_LOGF_ERROR(logger_, System, "Instance %s disabled: %s", id_.c_str(), reason.c_str());
    notify("Auto-Trading Disabled", "Instance " + id_ + " stopped on a fatal error: " + reason +
                                        "\nRe-enable after fixing the configuration.");
    if (store_) {
        store_->append_log(json{{"type", "fatal"}, {"instance_id", id_}, {"reason", reason}, {"timestamp", clock_()}});
    }
}

// =============================================================================
// Loop
// =============================================================================

void TradingInstance::run_loop(std::shared_ptr<LoopControl> control) {
    loop_thread_id_.store(std::this_thread::get_id());
    while (true) {
        {
            std::lock_guard<std::mutex> loop_lock(loop_mutex_);
            if (control->stop)
                break;
        }

        double interval = config::execution::CYCLE_INTERVAL_S;
        if (enabled_.load()) {
            try {
                interval = config_->get().cycle_interval_s;
                run_once();
            } catch (const ConfigError& e) {
                fatal(e.what());
                break;
            } catch (const std::exception& e) {
                AUTOTRADE_LOGF_ERROR(logger_, System, "Instance %s cycle failed: %s", id_.c_str(), e.what());
            }
        }

        if (!sleep_interval(*control, interval))
            break;
    }

    AUTOTRADE_LOGF_INFO(logger_, System, "Instance %s loop exited", id_.c_str());
    {
        std::lock_guard<std::mutex> loop_lock(loop_mutex_);
        if (loop_ == control) {
            running_.store(false);
            loop_thread_id_.store(std::thread::id());
        }
        control->exited = true;
    }
    loop_cv_.notify_all();
}

// False when a stop was requested during the wait
bool TradingInstance::sleep_interval(const LoopControl& control, double seconds) {
    std::unique_lock<std::mutex> loop_lock(loop_mutex_);
    return !loop_cv_.wait_for(loop_lock, std::chrono::duration<double>(std::max(seconds, 0.0)),
                              [&control] { return control.stop; });
}

execution::CycleResult TradingInstance::run_once() {
    config::TradingConfig cfg = config_->get();
    auto problems = cfg.validate();
    if (!problems.empty()) {
        throw ConfigError("Invalid configuration: " + problems.front());
    }
    apply_config(cfg);

    Selection selection = next_selection(cfg);
    execution::CycleResult result = harness_.run_cycle(selection.kind, selection.symbol, selection.params);

    tick_positions();
    harness_.poll_orders();
    periodic_risk(cfg.risk.auto_reduce);

    size_t stuck = harness_.abandoned_workers();
    if (stuck > 0) {
        AUTOTRADE_LOGF_WARN(logger_, Strategy, "Instance %s: %zu cancelled evaluations still unwinding", id_.c_str(),
                            stuck);
    }

    ++cycles_;
    return result;
}

void TradingInstance::apply_config(const config::TradingConfig& cfg) {
    harness_.update_config(cfg);
    positions_.update_exits(cfg.exits, cfg.stop_loss_percentage);
    risk_.set_leverage(cfg.leverage);
}

TradingInstance::Selection TradingInstance::next_selection(const config::TradingConfig& cfg) {
    {
        std::lock_guard<std::mutex> lock(assignments_mutex_);
        if (!assignments_.empty()) {
            const StrategyAssignment& a = assignments_[next_assignment_ % assignments_.size()];
            ++next_assignment_;
            return Selection{a.kind, a.symbol, a.params};
        }
    }

    auto params = strategy::StrategyParams::from_config(cfg);
    if (store_ && !user_id_.empty()) {
        UserSettings settings = store_->get_user_settings(user_id_);
        if (!settings.default_strategy.empty()) {
            try {
                return Selection{strategy::strategy_kind_from_string(settings.default_strategy), cfg.trading_pair,
                                 params};
            } catch (const ConfigError& e) {
                AUTOTRADE_LOGF_WARN(logger_, Strategy, "User %s default strategy ignored: %s", user_id_.c_str(),
                                    e.what());
            }
        }
    }
    return Selection{strategy::strategy_kind_from_string(cfg.default_strategy), cfg.trading_pair, params};
}

void TradingInstance::tick_positions() {
    for (const auto& symbol : positions_.symbols()) {
        double price;
        try {
            price = harness_.current_price(symbol);
        } catch (const std::exception& e) {
            AUTOTRADE_LOGF_WARN(logger_, Position, "No price for %s, positions not ticked: %s", symbol.c_str(),
                                e.what());
            continue;
        }
        for (const auto& tick : positions_.on_symbol_price(symbol, price)) {
            for (auto event : tick.events) {
                if (event == position::PositionEvent::Tp1Hit || event == position::PositionEvent::ExitFailed) {
                    notify(position::position_event_to_string(event), symbol + " @ " + std::to_string(price));
                }
            }
        }
    }
}

void TradingInstance::periodic_risk(bool auto_reduce) {
    std::vector<risk::Exposure> exposures;
    for (const auto& p : positions_.positions()) {
        exposures.push_back(risk::Exposure{p.key(), p.size, p.entry_price, p.mark_price, p.leverage});
    }

    double total_balance = 0.0;
    if (!exposures.empty()) {
        try {
            total_balance = client_->get_balances().find("USDT").total();
        } catch (const std::exception& e) {
            AUTOTRADE_LOGF_WARN(logger_, Risk, "Balance unavailable for risk check: %s", e.what());
        }
    }

    risk::RiskAdvice advice = risk_.periodic_check(exposures, total_balance);
    bool changed;
    {
        std::lock_guard<std::mutex> lock(reason_mutex_);
        changed = advice.reduce != reduce_advised_;
        reduce_advised_ = advice.reduce;
    }

    if (auto_reduce) {
        for (const auto& key : advice.reduce) {
            if (positions_.force_exit(key, "RISK_REDUCTION")) {
                AUTOTRADE_LOGF_WARN(logger_, Risk, "Instance %s reduced %s", id_.c_str(), key.to_string().c_str());
                notify("Risk Reduction", "Closing " + key.to_string());
            }
        }
        return;
    }

    if (!changed || advice.reduce.empty())
        return;
    std::string keys;
    for (const auto& key : advice.reduce) {
        keys += (keys.empty() ? "" : ", ") + key.to_string();
    }
    AUTOTRADE_LOGF_WARN(logger_, Risk, "Instance %s: reduction advised for %s", id_.c_str(), keys.c_str());
    notify("Risk Advice", "Consider reducing " + keys);
}

void TradingInstance::on_position_closed(const position::ClosedPosition& closed) {
    const position::Position& p = closed.position;
    risk_.record_realized_pnl(p.realized_pnl);

    char buf[192];
    std::snprintf(buf, sizeof(buf), "%s %s closed @ %.2f (%s), PnL $%.2f", p.symbol.c_str(), side_to_string(p.side),
                  closed.exit_price, p.exit_reason.c_str(), p.realized_pnl);
    AUTOTRADE_LOGF_INFO(logger_, Position, "%s", buf);
    notify("Position Closed", buf);

    if (store_) {
        store_->append_trade(json{{"event", "position_closed"},
                                  {"instance_id", id_},
                                  {"symbol", p.symbol},
                                  {"side", side_to_string(p.side)},
                                  {"size", p.size},
                                  {"entry_price", p.entry_price},
                                  {"exit_price", closed.exit_price},
                                  {"realized_pnl", p.realized_pnl},
                                  {"exit_reason", p.exit_reason},
                                  {"strategy", p.strategy_name},
                                  {"timestamp", clock_()}});
    }
}

// =============================================================================
// Control surface
// =============================================================================

InstanceStatus TradingInstance::get_status() const {
    InstanceStatus status;
    status.id = id_;
    status.running = running_.load();
    status.enabled = enabled_.load();
    status.pair = config_->get().trading_pair;
    status.restart_count = restart_count_.load();
    status.last_restart_ms = last_restart_ms_.load();
    status.trading_hours_active = harness_.within_trading_hours();
    status.cycles = cycles_.load();
    status.open_positions = positions_.size();
    status.open_orders = orders_.open_orders().size();
    {
        std::lock_guard<std::mutex> lock(assignments_mutex_);
        status.assignments = assignments_.size();
    }
    {
        std::lock_guard<std::mutex> lock(reason_mutex_);
        status.disabled_reason = disabled_reason_;
        for (const auto& key : reduce_advised_) {
            status.reduce_advised.push_back(key.to_string());
        }
    }
    return status;
}

std::optional<PortfolioSnapshot> TradingInstance::get_portfolio_snapshot() {
    PortfolioSnapshot snapshot;
    snapshot.instance_id = id_;
    try {
        snapshot.quote_balance = client_->get_quote_balance("USDT");
    } catch (const std::exception& e) {
        AUTOTRADE_LOGF_WARN(logger_, Position, "Instance %s snapshot failed: %s", id_.c_str(), e.what());
        return std::nullopt;
    }

    snapshot.positions = positions_.positions();
    for (const auto& p : snapshot.positions) {
        snapshot.total_unrealized_pnl += p.unrealized_pnl;
    }
    snapshot.position_count = snapshot.positions.size();
    snapshot.timestamp_ms = clock_();

    if (store_)
        store_->append_log(snapshot.to_json());
    return snapshot;
}

std::string TradingInstance::add_strategy(const std::string& symbol, strategy::StrategyKind kind,
                                          const strategy::StrategyParams& params) {
    std::lock_guard<std::mutex> lock(assignments_mutex_);
    StrategyAssignment assignment;
    assignment.id = id_ + "-s" + std::to_string(next_assignment_id_++);
    assignment.symbol = symbol;
    assignment.kind = kind;
    assignment.params = params;
    assignments_.push_back(assignment);
    AUTOTRADE_LOGF_INFO(logger_, Strategy, "Instance %s: added %s on %s (%s)", id_.c_str(),
                        strategy::strategy_kind_to_string(kind), symbol.c_str(), assignment.id.c_str());
    return assignment.id;
}

bool TradingInstance::remove_strategy(const std::string& assignment_id) {
    std::lock_guard<std::mutex> lock(assignments_mutex_);
    auto it = std::find_if(assignments_.begin(), assignments_.end(),
                           [&](const StrategyAssignment& a) { return a.id == assignment_id; });
    if (it == assignments_.end())
        return false;
    assignments_.erase(it);
    AUTOTRADE_LOGF_INFO(logger_, Strategy, "Instance %s: removed %s", id_.c_str(), assignment_id.c_str());
    return true;
}

std::vector<StrategyAssignment> TradingInstance::assignments() const {
    std::lock_guard<std::mutex> lock(assignments_mutex_);
    return assignments_;
}

void TradingInstance::notify(const std::string& title, const std::string& message) {
    if (notifier_)
        notifier_->notify(title, message);
}

} // namespace autotrade::engine
