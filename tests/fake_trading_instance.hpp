#pragma once

#include "../include/autotrade/engine/trading_instance.hpp"

#include <atomic>
#include <map>
#include <mutex>
#include <string>

namespace autotrade {
namespace testing {

/**
 * FakeTradingInstance - scripted instance for supervisor tests
 *
 * Starts enabled and running. restart() counts the call and leaves the
 * instance in whatever running state `restart_heals` selects.
 */
class FakeTradingInstance : public engine::ITradingInstance {
public:
    explicit FakeTradingInstance(std::string id)
        : id_(std::move(id)) {}

    // =========================================================================
    // Scripting
    // =========================================================================

    void crash() { running_ = false; }
    void set_running(bool running) { running_ = running; }
    void set_restart_count(int n) { restart_count_ = n; }
    void set_restart_heals(bool heals) { restart_heals_ = heals; }

    int restart_calls() const { return restart_calls_.load(); }
    int disable_calls() const { return disable_calls_.load(); }

    std::string disabled_reason() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return disabled_reason_;
    }

    // =========================================================================
    // ITradingInstance
    // =========================================================================

    const std::string& id() const override { return id_; }
    bool is_enabled() const override { return enabled_.load(); }
    bool is_running() const override { return running_.load(); }
    int restart_count() const override { return restart_count_.load(); }

    bool enable() override {
        enabled_ = true;
        running_ = true;
        return true;
    }

    bool disable(const std::string& reason) override {
        ++disable_calls_;
        enabled_ = false;
        running_ = false;
        std::lock_guard<std::mutex> lock(mutex_);
        disabled_reason_ = reason;
        return true;
    }

    bool restart() override {
        if (!enabled_)
            return false;
        ++restart_calls_;
        ++restart_count_;
        running_ = restart_heals_.load();
        return true;
    }

    engine::InstanceStatus get_status() const override {
        engine::InstanceStatus st;
        st.id = id_;
        st.enabled = enabled_;
        st.running = running_;
        st.restart_count = restart_count_;
        std::lock_guard<std::mutex> lock(mutex_);
        st.assignments = assignments_.size();
        st.disabled_reason = disabled_reason_;
        return st;
    }

    std::optional<engine::PortfolioSnapshot> get_portfolio_snapshot() override {
        engine::PortfolioSnapshot snap;
        snap.instance_id = id_;
        snap.quote_balance = 1000.0;
        return snap;
    }

    std::string add_strategy(const std::string& symbol, strategy::StrategyKind, const strategy::StrategyParams&) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::string assignment_id = id_ + "-s" + std::to_string(++next_assignment_);
        assignments_[assignment_id] = symbol;
        return assignment_id;
    }

    bool remove_strategy(const std::string& assignment_id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        return assignments_.erase(assignment_id) > 0;
    }

private:
    std::string id_;
    std::atomic<bool> enabled_{true};
    std::atomic<bool> running_{true};
    std::atomic<int> restart_count_{0};
    std::atomic<bool> restart_heals_{false};
    std::atomic<int> restart_calls_{0};
    std::atomic<int> disable_calls_{0};

    mutable std::mutex mutex_;
    std::string disabled_reason_;
    std::map<std::string, std::string> assignments_;
    int next_assignment_ = 0;
};

}  // namespace testing
}  // namespace autotrade
