#include "../../include/autotrade/supervisor/watchdog.hpp"
#include "../../include/autotrade/util/system.hpp"
#include "../../include/autotrade/util/time_utils.hpp"

#include <cstdio>
#include <fstream>

namespace autotrade::supervisor {

// =============================================================================
// ProcResourceSampler
// =============================================================================

ResourceSample ProcResourceSampler::sample() {
    ResourceSample s;
    s.memory_mb = util::process_rss_mb();

    uint64_t ticks = util::process_cpu_ticks();
    auto now = std::chrono::steady_clock::now();
    if (has_previous_ && ticks >= previous_ticks_) {
        double wall_s = std::chrono::duration<double>(now - previous_time_).count();
        if (wall_s > 0.0) {
            double cpu_s = static_cast<double>(ticks - previous_ticks_) /
                           static_cast<double>(util::clock_ticks_per_second());
            s.cpu_pct = cpu_s / wall_s * 100.0;
        }
    }
    has_previous_ = true;
    previous_ticks_ = ticks;
    previous_time_ = now;
    return s;
}

// =============================================================================
// Watchdog
// =============================================================================

Watchdog::Watchdog(config::WatchdogParams params, engine::InstanceRegistry& registry, logging::AsyncLogger& logger,
                   engine::NotificationSink* notifier, std::unique_ptr<ResourceSampler> sampler, WallClockMs clock)
    : params_(std::move(params))
    , registry_(registry)
    , logger_(logger)
    , notifier_(notifier)
    , sampler_(sampler ? std::move(sampler) : std::make_unique<ProcResourceSampler>())
    , clock_(clock ? std::move(clock) : WallClockMs(util::wall_clock_ms))
    , started_at_(clock_()) {}

Watchdog::~Watchdog() {
    stop();
}

void Watchdog::start() {
    if (thread_.joinable())
        return;
    {
        std::lock_guard<std::mutex> lock(loop_mutex_);
        stop_requested_ = false;
    }
    running_.store(true);
    thread_ = std::thread(&Watchdog::run, this);
    AUTOTRADE_LOGF_INFO(logger_, Watchdog, "Watchdog started (interval %.0fs, max failures %d, auto restart %s)",
                        params_.heartbeat_interval_s, params_.max_failures, params_.auto_restart ? "on" : "off");
}

void Watchdog::stop() {
    {
        std::lock_guard<std::mutex> lock(loop_mutex_);
        stop_requested_ = true;
    }
    loop_cv_.notify_all();
    if (thread_.joinable())
        thread_.join();
    running_.store(false);
}

bool Watchdog::is_running() const {
    return running_.load();
}

void Watchdog::run() {
    while (true) {
        check_once();

        std::unique_lock<std::mutex> lock(loop_mutex_);
        if (loop_cv_.wait_for(lock, std::chrono::duration<double>(params_.heartbeat_interval_s),
                              [this] { return stop_requested_; })) {
            break;
        }
    }
    AUTOTRADE_LOG_INFO(logger_, Watchdog, "Watchdog stopped");
}

size_t Watchdog::check_once() {
    size_t restarts = 0;

    try {
        check_resources();
    } catch (const std::exception& e) {
        AUTOTRADE_LOGF_ERROR(logger_, Watchdog, "Resource check failed: %s", e.what());
    }

    for (const auto& instance : registry_.list()) {
        try {
            if (check_instance(*instance))
                ++restarts;
        } catch (const std::exception& e) {
            AUTOTRADE_LOGF_ERROR(logger_, Watchdog, "Check of instance %s failed: %s", instance->id().c_str(),
                                 e.what());
        }
    }

    if (!params_.heartbeat_file.empty()) {
        try {
            write_heartbeat_file();
        } catch (const std::exception& e) {
            AUTOTRADE_LOGF_WARN(logger_, Watchdog, "Heartbeat file not written: %s", e.what());
        }
    }
    return restarts;
}

void Watchdog::check_resources() {
    ResourceSample s = sampler_->sample();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        last_sample_ = s;
    }

    if (s.memory_mb > params_.memory_threshold_mb) {
        AUTOTRADE_LOGF_WARN(logger_, Watchdog, "High memory usage: %.1f MB (threshold %.0f MB)", s.memory_mb,
                            params_.memory_threshold_mb);
    }
    if (s.cpu_pct > params_.cpu_threshold_pct) {
        AUTOTRADE_LOGF_WARN(logger_, Watchdog, "High CPU usage: %.1f%% (threshold %.0f%%)", s.cpu_pct,
                            params_.cpu_threshold_pct);
    }
}

bool Watchdog::check_instance(engine::ITradingInstance& instance) {
    enum class Decision { None, Restart, ManualIntervention, Escalate };

    const std::string id = instance.id();
    const bool enabled = instance.is_enabled();
    const bool running = instance.is_running();
    const int restarts = instance.restart_count();

    std::string problem;
    if (enabled && !running)
        problem = "auto-trading enabled but not running";
    if (enabled && restarts > params_.restart_sanity_threshold) {
        if (!problem.empty())
            problem += ", ";
        problem += "restart count " + std::to_string(restarts) + " above " +
                   std::to_string(params_.restart_sanity_threshold);
    }

    Decision decision = Decision::None;
    int failures = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        HeartbeatRecord& rec = records_[id];
        rec.instance_id = id;
        rec.last_seen = clock_();
        rec.restart_count = restarts;

        if (problem.empty()) {
            rec.failure_count = 0;
            rec.restart_cycles = 0;
            return false;
        }

        failures = ++rec.failure_count;
        if (rec.failure_count >= params_.max_failures) {
            rec.failure_count = 0;
            if (!params_.auto_restart) {
                decision = Decision::ManualIntervention;
            } else if (rec.restart_cycles >= params_.max_restart_cycles) {
                rec.restart_cycles = 0;
                decision = Decision::Escalate;
            } else {
                ++rec.restart_cycles;
                decision = Decision::Restart;
            }
        }
    }

    AUTOTRADE_LOGF_WARN(logger_, Watchdog, "Instance %s failure %d/%d: %s", id.c_str(), failures,
                        params_.max_failures, problem.c_str());

    switch (decision) {
    case Decision::None:
        return false;

    case Decision::ManualIntervention:
        AUTOTRADE_LOGF_ERROR(logger_, Watchdog, "Instance %s: auto restart disabled, manual intervention required",
                             id.c_str());
        notify("Watchdog Alert", "Instance " + id + " is failing (" + problem + "). Manual intervention required.");
        return false;

    case Decision::Escalate:
        AUTOTRADE_LOGF_ERROR(logger_, Watchdog, "Instance %s still failing after %d restarts, disabling", id.c_str(),
                             params_.max_restart_cycles);
        instance.disable("Watchdog: repeated failures after " + std::to_string(params_.max_restart_cycles) +
                         " restarts");
        notify("Instance Disabled", "Instance " + id + " was disabled after repeated restarts (" + problem +
                                        "). Re-enable it once the cause is fixed.");
        return false;

    case Decision::Restart:
        break;
    }

    AUTOTRADE_LOGF_WARN(logger_, Watchdog, "Restarting instance %s", id.c_str());
    bool ok = instance.restart();

    RestartEvent event{id, clock_(), problem, ok};
    {
        std::lock_guard<std::mutex> lock(mutex_);
        history_.push_back(event);
        while (history_.size() > MAX_RESTART_HISTORY) {
            history_.pop_front();
        }
        records_[id].restart_count = instance.restart_count();
    }

    if (ok) {
        AUTOTRADE_LOGF_INFO(logger_, Watchdog, "Instance %s restarted", id.c_str());
    } else {
        AUTOTRADE_LOGF_ERROR(logger_, Watchdog, "Instance %s restart failed", id.c_str());
    }
    notify("Instance Restarted", "Instance " + id + (ok ? " restarted: " : " restart failed: ") + problem);
    return true;
}

// Written to a temporary file first, then renamed over the target
void Watchdog::write_heartbeat_file() {
    json doc;
    doc["timestamp"] = clock_();
    json instances = json::array();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        doc["uptime_s"] = static_cast<double>(clock_() - started_at_) / 1000.0;
        doc["memory_mb"] = last_sample_.memory_mb;
        doc["cpu_pct"] = last_sample_.cpu_pct;
        for (const auto& [id, rec] : records_) {
            instances.push_back(json{{"instance_id", rec.instance_id},
                                     {"last_seen", rec.last_seen},
                                     {"failure_count", rec.failure_count},
                                     {"restart_count", rec.restart_count},
                                     {"restart_cycles", rec.restart_cycles}});
        }
        doc["restarts"] = history_.size();
    }
    doc["instances"] = instances;

    std::string temp_path = params_.heartbeat_file + ".tmp";
    {
        std::ofstream out(temp_path);
        if (!out.is_open()) {
            AUTOTRADE_LOGF_WARN(logger_, Watchdog, "Cannot open %s", temp_path.c_str());
            return;
        }
        out << doc.dump(2) << '\n';
        if (!out) {
            AUTOTRADE_LOGF_WARN(logger_, Watchdog, "Write to %s failed", temp_path.c_str());
            return;
        }
    }

    if (std::rename(temp_path.c_str(), params_.heartbeat_file.c_str()) != 0) {
        std::remove(temp_path.c_str());
        AUTOTRADE_LOGF_WARN(logger_, Watchdog, "Cannot replace %s", params_.heartbeat_file.c_str());
    }
}

// =============================================================================
// Queries
// =============================================================================

WatchdogStatus Watchdog::status() const {
    WatchdogStatus st;
    auto instances = registry_.list();
    st.monitored_instances = instances.size();
    for (const auto& instance : instances) {
        if (instance->is_running())
            ++st.active_instances;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    st.uptime_s = static_cast<double>(clock_() - started_at_) / 1000.0;
    for (const auto& [id, rec] : records_) {
        st.failure_counts[id] = rec.failure_count;
    }
    st.restart_history_size = history_.size();
    st.resources = last_sample_;
    return st;
}

std::optional<HeartbeatRecord> Watchdog::heartbeat(const std::string& instance_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(instance_id);
    if (it == records_.end())
        return std::nullopt;
    return it->second;
}

std::vector<RestartEvent> Watchdog::restart_history() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<RestartEvent>(history_.begin(), history_.end());
}

void Watchdog::notify(const std::string& title, const std::string& message) {
    if (notifier_)
        notifier_->notify(title, message);
}

} // namespace autotrade::supervisor
