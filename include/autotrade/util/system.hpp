#pragma once

/**
 * System utilities for the trading engine
 *
 * Signal handling and process resource sampling.
 * Linux-specific implementations (procfs).
 */

#include <atomic>
#include <csignal>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <unistd.h>

namespace autotrade {
namespace util {

// ============================================================================
// Signal Handler
// ============================================================================

namespace detail {
inline std::atomic<bool>* g_running_flag = nullptr;
inline void (*g_pre_shutdown_callback)() = nullptr;
} // namespace detail

/**
 * Graceful shutdown signal handler.
 *
 * Sets running flag to false and optionally calls pre-shutdown callback.
 * Installed via install_shutdown_handler().
 */
inline void graceful_shutdown_handler(int sig) {
    if (detail::g_pre_shutdown_callback) {
        detail::g_pre_shutdown_callback();
    }
    std::cout << "\n\n[SHUTDOWN] Received signal " << sig << ", stopping gracefully...\n";
    if (detail::g_running_flag) {
        detail::g_running_flag->store(false);
    }
}

/**
 * Install graceful shutdown handler for SIGINT and SIGTERM.
 *
 * @param running Atomic flag to set to false on signal
 * @param pre_shutdown Optional callback to invoke before setting flag
 */
inline void install_shutdown_handler(std::atomic<bool>& running, void (*pre_shutdown)() = nullptr) {
    detail::g_running_flag = &running;
    detail::g_pre_shutdown_callback = pre_shutdown;
    std::signal(SIGINT, graceful_shutdown_handler);
    std::signal(SIGTERM, graceful_shutdown_handler);
}

// ============================================================================
// Process resources
// ============================================================================

/**
 * Resident set size of this process in megabytes, from /proc/self/status.
 * Returns a negative value when procfs is unavailable.
 */
inline double process_rss_mb() {
    std::ifstream in("/proc/self/status");
    if (!in)
        return -1.0;

    std::string line;
    while (std::getline(in, line)) {
        if (line.rfind("VmRSS:", 0) == 0) {
            std::istringstream iss(line.substr(6));
            double kb = 0.0;
            iss >> kb;
            return kb / 1024.0;
        }
    }
    return -1.0;
}

/**
 * Total user+system CPU ticks consumed by this process, from /proc/self/stat.
 * Returns 0 when procfs is unavailable.
 */
inline uint64_t process_cpu_ticks() {
    std::ifstream in("/proc/self/stat");
    if (!in)
        return 0;

    std::string content;
    std::getline(in, content);

    // Field 2 (comm) may contain spaces; skip past its closing paren
    auto pos = content.rfind(')');
    if (pos == std::string::npos)
        return 0;

    std::istringstream iss(content.substr(pos + 2));
    std::string field;
    uint64_t utime = 0, stime = 0;
    // After comm: state is field 3, utime is field 14, stime is field 15
    for (int i = 3; i <= 15 && iss >> field; ++i) {
        if (i == 14)
            utime = std::stoull(field);
        if (i == 15)
            stime = std::stoull(field);
    }
    return utime + stime;
}

inline long clock_ticks_per_second() {
    long hz = sysconf(_SC_CLK_TCK);
    return hz > 0 ? hz : 100;
}

} // namespace util
} // namespace autotrade
