#pragma once

#include "../config/trading_config.hpp"
#include "../engine/collaborators.hpp"
#include "../engine/instance_registry.hpp"
#include "../logging/async_logger.hpp"
#include "../types.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace autotrade {
namespace supervisor {

using json = nlohmann::json;

// =============================================================================
// Resource sampling
// =============================================================================

struct ResourceSample {
    double memory_mb = -1.0; // negative = unavailable
    double cpu_pct = -1.0;   // negative = no previous sample yet
};

class ResourceSampler {
public:
    virtual ~ResourceSampler() = default;
    virtual ResourceSample sample() = 0;
};

/**
 * RSS from /proc/self/status, CPU percent from /proc/self/stat tick deltas
 * between consecutive samples (100 = one core fully busy).
 */
class ProcResourceSampler : public ResourceSampler {
public:
    ResourceSample sample() override;

private:
    bool has_previous_ = false;
    uint64_t previous_ticks_ = 0;
    std::chrono::steady_clock::time_point previous_time_;
};

// =============================================================================
// Heartbeats
// =============================================================================

struct HeartbeatRecord {
    std::string instance_id;
    TimestampMs last_seen = 0;
    int failure_count = 0;  // consecutive failed checks
    int restart_count = 0;  // as reported by the instance
    int restart_cycles = 0; // watchdog restarts since the last healthy check
};

struct RestartEvent {
    std::string instance_id;
    TimestampMs timestamp_ms = 0;
    std::string reason;
    bool success = false;
};

struct WatchdogStatus {
    double uptime_s = 0.0;
    size_t monitored_instances = 0;
    size_t active_instances = 0;
    std::map<std::string, int> failure_counts;
    size_t restart_history_size = 0;
    ResourceSample resources;

    json to_json() const {
        return json{{"uptime_s", uptime_s},
                    {"monitored_instances", monitored_instances},
                    {"active_instances", active_instances},
                    {"failure_counts", failure_counts},
                    {"restart_history", restart_history_size},
                    {"memory_mb", resources.memory_mb},
                    {"cpu_pct", resources.cpu_pct}};
    }
};

// =============================================================================
// Watchdog
// =============================================================================

/**
 * Watchdog - supervises every registered instance on its own thread.
 *
 * Per check and instance:
 *   - enabled but not running            -> failure
 *   - restart_count > sanity threshold   -> failure
 *   - otherwise                          -> healthy, counters reset
 * At max_failures consecutive failures exactly one restart is issued and
 * the failure count returns to 0. An instance that needs more than
 * max_restart_cycles restarts without a healthy check in between is
 * disabled and the operator notified.
 *
 * Memory / CPU thresholds only warn. A failing check is logged and the
 * loop carries on.
 */
class Watchdog {
public:
    using WallClockMs = std::function<uint64_t()>;

    Watchdog(config::WatchdogParams params, engine::InstanceRegistry& registry, logging::AsyncLogger& logger,
             engine::NotificationSink* notifier = nullptr, std::unique_ptr<ResourceSampler> sampler = nullptr,
             WallClockMs clock = nullptr);
    ~Watchdog();

    // Non-copyable
    Watchdog(const Watchdog&) = delete;
    Watchdog& operator=(const Watchdog&) = delete;

    void start();
    void stop();
    bool is_running() const;

    /**
     * One monitoring pass over resources and all instances.
     * @return number of restarts issued
     */
    size_t check_once();

    WatchdogStatus status() const;
    std::optional<HeartbeatRecord> heartbeat(const std::string& instance_id) const;
    std::vector<RestartEvent> restart_history() const;

    static constexpr size_t MAX_RESTART_HISTORY = 100;

private:
    config::WatchdogParams params_;
    engine::InstanceRegistry& registry_;
    logging::AsyncLogger& logger_;
    engine::NotificationSink* notifier_;
    std::unique_ptr<ResourceSampler> sampler_;
    WallClockMs clock_;
    TimestampMs started_at_;

    mutable std::mutex mutex_;
    std::map<std::string, HeartbeatRecord> records_;
    std::deque<RestartEvent> history_;
    ResourceSample last_sample_;

    std::mutex loop_mutex_;
    std::condition_variable loop_cv_;
    bool stop_requested_ = false;
    std::atomic<bool> running_{false};
    std::thread thread_;

    void run();
    void check_resources();
    bool check_instance(engine::ITradingInstance& instance);
    void write_heartbeat_file();
    void notify(const std::string& title, const std::string& message);
};

}  // namespace supervisor
}  // namespace autotrade
