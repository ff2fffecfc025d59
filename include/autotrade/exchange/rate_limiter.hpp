#pragma once

#include "../util/time_utils.hpp"

#include <chrono>
#include <functional>
#include <mutex>
#include <thread>

namespace autotrade {
namespace exchange {

// Injectable time seams, in seconds
using Sleeper = std::function<void(double)>;
using MonotonicClock = std::function<double()>;

inline void real_sleep(double seconds) {
    if (seconds > 0)
        std::this_thread::sleep_for(std::chrono::duration<double>(seconds));
}

inline double real_monotonic_seconds() {
    return static_cast<double>(util::now_ns()) / 1e9;
}

/**
 * RequestThrottle - client-side minimum spacing between REST requests.
 *
 * Applied to every request, including retries. Thread-safe: concurrent
 * callers are spaced relative to each other.
 */
class RequestThrottle {
public:
    struct Config {
        double min_interval_s;
        bool enabled;

        Config()
            : min_interval_s(0.1)
            , enabled(true) {}
    };

    explicit RequestThrottle(const Config& config = Config{}, Sleeper sleeper = real_sleep,
                             MonotonicClock clock = real_monotonic_seconds)
        : config_(config)
        , sleeper_(std::move(sleeper))
        , clock_(std::move(clock))
        , last_request_s_(-1.0) {}

    /**
     * Block until the minimum interval since the previous request has elapsed,
     * then record this request.
     */
    void acquire() {
        if (!config_.enabled)
            return;

        std::lock_guard<std::mutex> lock(mutex_);
        double now = clock_();
        if (last_request_s_ >= 0.0) {
            double elapsed = now - last_request_s_;
            if (elapsed < config_.min_interval_s) {
                sleeper_(config_.min_interval_s - elapsed);
                now = clock_();
            }
        }
        last_request_s_ = now;
    }

private:
    Config config_;
    Sleeper sleeper_;
    MonotonicClock clock_;
    double last_request_s_;
    std::mutex mutex_;
};

}  // namespace exchange
}  // namespace autotrade
