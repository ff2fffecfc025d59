#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace autotrade {
namespace execution {

/**
 * Running aggregate of strategy evaluations. Lives as long as the instance.
 */
struct ExecutionRecord {
    std::string strategy_name;
    uint64_t success_count = 0;
    uint64_t failure_count = 0;
    double total_time_s = 0.0;

    uint64_t total() const { return success_count + failure_count; }

    // Percent
    double success_rate() const {
        return total() > 0 ? 100.0 * static_cast<double>(success_count) / static_cast<double>(total()) : 0.0;
    }

    double average_time_s() const { return total() > 0 ? total_time_s / static_cast<double>(total()) : 0.0; }
};

class ExecutionStats {
public:
    /// Record one evaluation and return the updated aggregate
    ExecutionRecord record(const std::string& strategy_name, bool success, double elapsed_s) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& rec = records_[strategy_name];
        rec.strategy_name = strategy_name;
        if (success)
            ++rec.success_count;
        else
            ++rec.failure_count;
        rec.total_time_s += elapsed_s;
        return rec;
    }

    ExecutionRecord get(const std::string& strategy_name) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = records_.find(strategy_name);
        if (it == records_.end()) {
            ExecutionRecord empty;
            empty.strategy_name = strategy_name;
            return empty;
        }
        return it->second;
    }

    std::vector<ExecutionRecord> snapshot() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<ExecutionRecord> out;
        out.reserve(records_.size());
        for (const auto& [name, rec] : records_) {
            out.push_back(rec);
        }
        return out;
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, ExecutionRecord> records_;
};

}  // namespace execution
}  // namespace autotrade
