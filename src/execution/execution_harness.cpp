#include "../../include/autotrade/execution/execution_harness.hpp"
#include "../../include/autotrade/errors.hpp"
#include "../../include/autotrade/execution/trading_hours.hpp"
#include "../../include/autotrade/util/time_utils.hpp"

#include <cstdio>

namespace autotrade::execution {

using strategy::Signal;
using strategy::StrategyKind;

namespace {

// Signals that cannot become a well-formed order
void validate_signal(const Signal& signal) {
    if (signal.symbol.empty())
        throw ValidationError("Signal has no symbol");
    if (signal.quantity <= 0.0)
        throw ValidationError("Invalid quantity: " + std::to_string(signal.quantity));
    if (signal.price <= 0.0)
        throw ValidationError("Invalid price: " + std::to_string(signal.price));
    if (signal.confidence < 0.0 || signal.confidence > 1.0)
        throw ValidationError("Confidence out of range: " + std::to_string(signal.confidence));
}

std::string format_money(double value) {
    char buf[48];
    std::snprintf(buf, sizeof(buf), "$%.2f", value);
    return buf;
}

} // namespace

ExecutionHarness::ExecutionHarness(config::TradingConfig cfg, exchange::IExchangeClient& client,
                                   risk::RiskManager& risk, position::PositionStateMachine& positions,
                                   OrderTracker& orders, ExecutionStats& stats, logging::AsyncLogger& logger,
                                   engine::PersistenceStore* store, engine::NotificationSink* notifier,
                                   feed::MarketDataFeed* feed, WallClockMs clock)
    : config_(std::move(cfg))
    , client_(client)
    , risk_(risk)
    , positions_(positions)
    , orders_(orders)
    , stats_(stats)
    , logger_(logger)
    , store_(store)
    , notifier_(notifier)
    , feed_(feed)
    , clock_(clock ? std::move(clock) : WallClockMs(util::wall_clock_ms)) {
    for (auto kind : {StrategyKind::Rsi, StrategyKind::RsiMultiTf, StrategyKind::VolumeFilter,
                      StrategyKind::Advanced, StrategyKind::Grid, StrategyKind::Dca}) {
        strategies_[kind] = strategy::make_strategy(kind);
    }
}

// =============================================================================
// Cycle
// =============================================================================

CycleResult ExecutionHarness::run_cycle(StrategyKind kind, const std::string& symbol) {
    return run_cycle(kind, symbol, strategy::StrategyParams::from_config(config()));
}

CycleResult ExecutionHarness::run_cycle(StrategyKind kind, const std::string& symbol,
                                        const strategy::StrategyParams& params) {
    const config::TradingConfig cfg = config();
    const char* name = strategy::strategy_kind_to_string(kind);
    CycleResult result;

    auto hold = [&](std::string why) {
        result.signal = Signal::hold(std::move(why), symbol);
        result.signal.strategy_name = name;
        result.signal.timestamp_ms = clock_();
        return result;
    };

    if (!within_trading_hours()) {
        AUTOTRADE_LOGF_DEBUG(logger_, Execution, "%s %s: outside trading hours", name, symbol.c_str());
        return hold("Outside trading hours");
    }

    double balance = 0.0;
    try {
        balance = client_.get_quote_balance("USDT");
    } catch (const std::exception& e) {
        AUTOTRADE_LOGF_WARN(logger_, Execution, "Balance query failed: %s", e.what());
        return hold(std::string("Failed to get balance: ") + e.what());
    }

    if (balance < cfg.min_balance) {
        char buf[128];
        std::snprintf(buf, sizeof(buf), "Insufficient balance: $%.2f (minimum: $%.2f)", balance, cfg.min_balance);
        AUTOTRADE_LOGF_WARN(logger_, Execution, "%s", buf);
        return hold(buf);
    }

    HealthReport health = health_check(balance, cfg);
    result.health = health.overall;
    if (health.overall == HealthStatus::Unhealthy) {
        AUTOTRADE_LOGF_ERROR(logger_, Execution, "Health check UNHEALTHY (api=%d balance=%d config=%d strategies=%d)",
                             health.api_connection, health.balance_available, health.config_valid,
                             health.strategies_ready);
        return hold(std::string("System unhealthy: ") + health_status_to_string(health.overall));
    }
    if (health.overall == HealthStatus::Degraded) {
        AUTOTRADE_LOGF_WARN(logger_, Execution, "Health check DEGRADED, continuing (api=%d balance=%d)",
                            health.api_connection, health.balance_available);
    }

    strategy::MarketContext context;
    Signal signal = evaluate(kind, symbol, balance, params, cfg, context);
    if (signal.timestamp_ms == 0)
        signal.timestamp_ms = clock_();
    if (signal.strategy_name.empty())
        signal.strategy_name = name;

    if (signal.is_hold()) {
        AUTOTRADE_LOGF_INFO(logger_, Strategy, "%s %s: HOLD (%s)", name, symbol.c_str(), signal.reason.c_str());
        result.signal = std::move(signal);
        return result;
    }

    CycleResult submitted = submit(signal, context, balance, cfg);
    submitted.health = result.health;
    return submitted;
}

// =============================================================================
// Evaluation
// =============================================================================

TimedResult<Evaluation> ExecutionHarness::run_timed(std::shared_ptr<const strategy::IStrategy> impl,
                                                    const std::string& symbol, double balance,
                                                    const strategy::StrategyParams& params,
                                                    const config::TradingConfig& cfg) {
    bool want_trend = impl->needs_trend_series() || cfg.rsi_filter.enabled;
    std::string interval = cfg.kline_interval;
    std::string trend_interval = cfg.trend_interval;
    int limit = cfg.kline_limit;
    uint64_t now = clock_();

    auto work = [this, impl, symbol, balance, params, interval, trend_interval, limit, want_trend,
                 now](const util::CancellationToken& token) {
        Evaluation out;
        strategy::MarketContext& ctx = out.context;
        ctx.symbol = symbol;
        ctx.balance = balance;
        ctx.timestamp_ms = now;

        auto klines = client_.get_klines(symbol, interval, limit);
        token.throw_if_cancelled();
        ctx.closes.reserve(klines.size());
        ctx.volumes.reserve(klines.size());
        for (const auto& k : klines) {
            ctx.closes.push_back(k.close);
            ctx.volumes.push_back(k.volume);
        }

        if (want_trend) {
            auto trend = client_.get_klines(symbol, trend_interval, limit);
            token.throw_if_cancelled();
            ctx.trend_closes.reserve(trend.size());
            for (const auto& k : trend) {
                ctx.trend_closes.push_back(k.close);
            }
        }

        try {
            ctx.price = current_price(symbol);
        } catch (const std::exception& e) {
            AUTOTRADE_LOGF_DEBUG(logger_, Exchange, "Ticker for %s unavailable (%s), using last close",
                                 symbol.c_str(), e.what());
            ctx.price = ctx.closes.empty() ? 0.0 : ctx.closes.back();
        }
        token.throw_if_cancelled();

        out.signal = impl->evaluate(ctx, params, token);
        return out;
    };

    return evaluator_.run(work, cfg.evaluation_timeout_s);
}

Signal ExecutionHarness::evaluate(StrategyKind kind, const std::string& symbol, double balance,
                                  const strategy::StrategyParams& params, const config::TradingConfig& cfg,
                                  strategy::MarketContext& context_out) {
    auto it = strategies_.find(kind);
    if (it == strategies_.end() || !it->second) {
        return Signal::hold(std::string("Strategy not available: ") + strategy::strategy_kind_to_string(kind),
                            symbol);
    }
    const char* name = strategy::strategy_kind_to_string(kind);

    auto log_stats = [&](const ExecutionRecord& rec) {
        AUTOTRADE_LOGF_INFO(logger_, Strategy, "%s stats - Success rate: %.1f%%, Avg time: %.3fs", rec.strategy_name.c_str(),
                            rec.success_rate(), rec.average_time_s());
    };

    auto primary = run_timed(it->second, symbol, balance, params, cfg);

    if (primary.status == EvalStatus::Completed) {
        log_stats(stats_.record(name, true, primary.elapsed_s));
        context_out = primary.value->context;
        Signal signal = primary.value->signal;
        signal.symbol = symbol;
        return signal;
    }

    if (primary.status == EvalStatus::TimedOut) {
        log_stats(stats_.record(name, false, primary.elapsed_s));
        AUTOTRADE_LOGF_ERROR(logger_, Strategy, "%s evaluation timed out after %.1fs", name, primary.elapsed_s);
        return Signal::hold(describe_error(primary.error), symbol);
    }

    log_stats(stats_.record(name, false, primary.elapsed_s));
    std::string error = describe_error(primary.error);
    AUTOTRADE_LOGF_WARN(logger_, Strategy, "%s failed: %s", name, error.c_str());

    auto fallback_it = strategies_.find(StrategyKind::Rsi);
    if (kind != StrategyKind::Rsi && fallback_it != strategies_.end() && fallback_it->second) {
        auto fallback = run_timed(fallback_it->second, symbol, balance, params, cfg);
        const char* fallback_name = strategy::strategy_kind_to_string(StrategyKind::Rsi);
        log_stats(stats_.record(fallback_name, fallback.status == EvalStatus::Completed, fallback.elapsed_s));

        if (fallback.status == EvalStatus::Completed && !fallback.value->signal.is_hold()) {
            AUTOTRADE_LOGF_INFO(logger_, Strategy, "Fallback %s used after %s failure", fallback_name, name);
            context_out = fallback.value->context;
            Signal signal = fallback.value->signal;
            signal.symbol = symbol;
            return signal;
        }
        if (fallback.status == EvalStatus::Failed) {
            AUTOTRADE_LOGF_ERROR(logger_, Strategy, "Fallback %s failed: %s", fallback_name,
                                 describe_error(fallback.error).c_str());
        }
    }

    return Signal::hold(error, symbol);
}

std::string ExecutionHarness::describe_error(const std::exception_ptr& error) {
    if (!error)
        return "Strategy execution error: unknown";
    try {
        std::rethrow_exception(error);
    } catch (const TimeoutError&) {
        return "Strategy evaluation timed out";
    } catch (const CancelledError&) {
        return "Strategy evaluation cancelled";
    } catch (const NetworkError& e) {
        return std::string(e.is_timeout() ? "Network timeout: " : "Network connection error: ") + e.what();
    } catch (const Exhausted& e) {
        return std::string("Network connection error: ") + e.what();
    } catch (const RateLimited& e) {
        return std::string("API service error: ") + e.what();
    } catch (const ExchangeError& e) {
        return std::string("API service error: ") + e.what();
    } catch (const std::exception& e) {
        return std::string("Strategy execution error: ") + e.what();
    } catch (...) {
        return "Strategy execution error: non-standard exception";
    }
}

// =============================================================================
// Submission
// =============================================================================

CycleResult ExecutionHarness::submit(const Signal& signal, const strategy::MarketContext& context, double balance,
                                     const config::TradingConfig& cfg) {
    CycleResult result;
    const PositionKey key{signal.symbol, signal.side()};

    auto hold = [&](std::string why) {
        result.signal = Signal::hold(std::move(why), signal.symbol);
        result.signal.strategy_name = signal.strategy_name;
        result.signal.timestamp_ms = signal.timestamp_ms;
        AUTOTRADE_LOGF_INFO(logger_, Execution, "%s %s not submitted: %s", action_to_string(signal.action),
                            key.to_string().c_str(), result.signal.reason.c_str());
        return result;
    };

    try {
        validate_signal(signal);
    } catch (const ValidationError& e) {
        return hold(std::string("Invalid signal: ") + e.what());
    }

    strategy::RsiFilter filter(cfg.rsi_filter);
    if (filter.enabled()) {
        auto check = filter.check(signal.side(), context.closes, context.trend_closes, cfg.rsi.period);
        if (!check.valid)
            return hold("RSI filter: " + check.message);
        AUTOTRADE_LOGF_DEBUG(logger_, Strategy, "RSI filter passed: %s", check.message.c_str());
    }

    if (orders_.has_open(key))
        return hold("Open order already pending for " + key.to_string());

    auto decision = risk_.pre_trade(signal, balance, positions_.has_position(key));
    if (!decision.allowed)
        return hold("Risk check failed: " + decision.reason);

    exchange::OrderRequest request;
    request.symbol = signal.symbol;
    request.side = signal.side();
    request.type = signal.order_type;
    request.quantity = signal.quantity;
    switch (signal.order_type) {
    case OrderType::Limit:
        request.price = signal.price;
        break;
    case OrderType::StopLoss:
        request.activation_price = signal.stop_loss;
        break;
    case OrderType::TakeProfit:
        request.activation_price = signal.take_profit;
        break;
    case OrderType::TrailingStop:
        request.callback_rate = cfg.exits.trailing_distance_percentage;
        break;
    case OrderType::Market:
        break;
    }
    request.client_order_id = "at-" + std::to_string(clock_());

    exchange::OrderAck ack;
    try {
        ack = client_.place_order(request);
        // An untracked id could never be polled out of the open set
        if (ack.order_id.empty())
            throw ExchangeError("MISSING_ORDER_ID", "acknowledgement carried no order id");
    } catch (const std::exception& e) {
        AUTOTRADE_LOGF_ERROR(logger_, Execution, "Order placement failed for %s: %s", key.to_string().c_str(),
                             e.what());
        notify("Order Failed", key.to_string() + ": " + e.what());
        return hold(std::string("Order failed: ") + e.what());
    }

    TrackedOrder tracked;
    tracked.id = ack.order_id;
    tracked.symbol = signal.symbol;
    tracked.side = signal.side();
    tracked.type = signal.order_type;
    tracked.quantity = signal.quantity;
    tracked.price = signal.price;
    tracked.stop_loss = signal.stop_loss;
    tracked.take_profit = signal.take_profit;
    tracked.strategy_name = signal.strategy_name;
    tracked.created_at = clock_();
    if (!orders_.add(tracked)) {
        AUTOTRADE_LOGF_WARN(logger_, Execution, "Order %s placed while another is open for %s", ack.order_id.c_str(),
                            key.to_string().c_str());
    }

    AUTOTRADE_LOGF_INFO(logger_, Execution, "Order placed: %s %.6f %s @ %.2f (id %s, %s, conf %.2f)",
                        action_to_string(signal.action), signal.quantity, signal.symbol.c_str(), signal.price,
                        ack.order_id.c_str(), order_type_to_string(signal.order_type), signal.confidence);

    if (store_) {
        store_->append_trade(nlohmann::json{{"event", "order_placed"},
                                            {"order_id", ack.order_id},
                                            {"symbol", signal.symbol},
                                            {"side", side_to_string(signal.side())},
                                            {"type", order_type_to_string(signal.order_type)},
                                            {"quantity", signal.quantity},
                                            {"price", signal.price},
                                            {"stop_loss", signal.stop_loss},
                                            {"take_profit", signal.take_profit},
                                            {"strategy", signal.strategy_name},
                                            {"confidence", signal.confidence},
                                            {"reason", signal.reason},
                                            {"status", "PENDING"},
                                            {"timestamp", clock_()}});
    }
    notify("Order Placed", std::string(action_to_string(signal.action)) + " " + std::to_string(signal.quantity) +
                               " " + signal.symbol + " @ " + format_money(signal.price) + "\nOrder ID: " +
                               ack.order_id);

    result.signal = signal;
    result.submitted = true;
    result.order_id = ack.order_id;
    return result;
}

// =============================================================================
// Order monitor
// =============================================================================

size_t ExecutionHarness::poll_orders() {
    const int leverage = config().leverage;
    size_t changed = 0;

    for (const auto& open : orders_.open_orders()) {
        exchange::OrderInfo info;
        try {
            info = client_.get_order(open.symbol, open.id);
        } catch (const std::exception& e) {
            AUTOTRADE_LOGF_WARN(logger_, Execution, "Order %s status query failed: %s", open.id.c_str(), e.what());
            continue;
        }

        auto transition = orders_.apply(info);
        if (!transition || !transition->changed())
            continue;
        ++changed;

        const TrackedOrder& order = transition->order;
        const char* status = order_status_to_string(order.status);
        double filled = order.filled_quantity > 0.0 ? order.filled_quantity : 0.0;
        double fill_price = order.avg_price > 0.0 ? order.avg_price : order.price;

        switch (order.status) {
        case OrderStatus::Filled:
            if (filled <= 0.0)
                filled = order.quantity;
            positions_.open_position(order.symbol, order.side, filled, fill_price, leverage, order.stop_loss,
                                     order.strategy_name);
            risk_.record_trade();
            AUTOTRADE_LOGF_INFO(logger_, Execution, "Order %s filled: %.6f %s @ %.2f", order.id.c_str(), filled,
                                order.symbol.c_str(), fill_price);
            notify("Order Filled", order.key().to_string() + " " + std::to_string(filled) + " @ " +
                                       format_money(fill_price));
            break;
        case OrderStatus::Canceled:
        case OrderStatus::Rejected:
            if (filled > 0.0) {
                // Partial fill before cancellation is still live exposure
                positions_.open_position(order.symbol, order.side, filled, fill_price, leverage, order.stop_loss,
                                         order.strategy_name);
                risk_.record_trade();
            }
            AUTOTRADE_LOGF_WARN(logger_, Execution, "Order %s %s (filled %.6f of %.6f)", order.id.c_str(), status,
                                filled, order.quantity);
            notify(order.status == OrderStatus::Canceled ? "Order Canceled" : "Order Rejected",
                   order.key().to_string() + " order " + order.id);
            break;
        case OrderStatus::PartiallyFilled:
            AUTOTRADE_LOGF_INFO(logger_, Execution, "Order %s partially filled: %.6f of %.6f", order.id.c_str(),
                                filled, order.quantity);
            break;
        case OrderStatus::Pending:
            break;
        }

        if (store_ && is_terminal(order.status)) {
            store_->append_trade(nlohmann::json{{"event", "order_update"},
                                                {"order_id", order.id},
                                                {"symbol", order.symbol},
                                                {"side", side_to_string(order.side)},
                                                {"status", status},
                                                {"filled_quantity", filled},
                                                {"avg_price", fill_price},
                                                {"strategy", order.strategy_name},
                                                {"timestamp", clock_()}});
        }
    }

    orders_.prune();
    return changed;
}

// =============================================================================
// Health / hours / price
// =============================================================================

HealthReport ExecutionHarness::health_check() {
    return health_check(std::nullopt, config());
}

HealthReport ExecutionHarness::health_check(std::optional<double> known_balance, const config::TradingConfig& cfg) {
    HealthReport report;
    report.api_connection = client_.test_connection();

    if (known_balance) {
        report.balance_available = *known_balance > 0.0;
    } else {
        try {
            report.balance_available = client_.get_quote_balance("USDT") > 0.0;
        } catch (const std::exception& e) {
            AUTOTRADE_LOGF_WARN(logger_, Execution, "Health balance query failed: %s", e.what());
            report.balance_available = false;
        }
    }

    auto problems = cfg.validate();
    report.config_valid = problems.empty();
    if (!report.config_valid) {
        AUTOTRADE_LOGF_WARN(logger_, Execution, "Config invalid: %s", problems.front().c_str());
    }
    report.strategies_ready = !strategies_.empty();

    if (report.api_connection && report.balance_available && report.config_valid && report.strategies_ready) {
        report.overall = HealthStatus::Healthy;
    } else if (report.api_connection || report.balance_available) {
        report.overall = HealthStatus::Degraded;
    } else {
        report.overall = HealthStatus::Unhealthy;
    }
    return report;
}

bool ExecutionHarness::within_trading_hours() const {
    const config::TradingConfig cfg = config();
    if (!cfg.trading_hours.enabled)
        return true;

    std::string error;
    auto window = parse_trading_window(cfg.trading_hours, error);
    if (!window) {
        AUTOTRADE_LOGF_ERROR(logger_, Execution, "%s, trading hours not enforced", error.c_str());
        return true;
    }
    return window->contains(clock_());
}

double ExecutionHarness::current_price(const std::string& symbol) {
    if (feed_) {
        if (auto streamed = feed_->last_price(symbol))
            return *streamed;
    }
    return client_.get_ticker(symbol).close;
}

// =============================================================================
// Configuration
// =============================================================================

void ExecutionHarness::set_strategy(StrategyKind kind, std::shared_ptr<const strategy::IStrategy> impl) {
    strategies_[kind] = std::move(impl);
}

void ExecutionHarness::update_config(const config::TradingConfig& cfg) {
    std::lock_guard<std::mutex> lock(config_mutex_);
    config_ = cfg;
}

config::TradingConfig ExecutionHarness::config() const {
    std::lock_guard<std::mutex> lock(config_mutex_);
    return config_;
}

void ExecutionHarness::notify(const std::string& title, const std::string& message) {
    if (notifier_)
        notifier_->notify(title, message);
}

} // namespace autotrade::execution
