#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace autotrade {
namespace logging {

/**
 * Log Level
 */
enum class LogLevel : uint8_t { Trace = 0, Debug = 1, Info = 2, Warn = 3, Error = 4, Fatal = 5 };

inline const char* level_to_string(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return "TRACE";
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO ";
    case LogLevel::Warn:
        return "WARN ";
    case LogLevel::Error:
        return "ERROR";
    case LogLevel::Fatal:
        return "FATAL";
    default:
        return "?????";
    }
}

inline LogLevel level_from_string(const std::string& s) {
    if (s == "trace" || s == "TRACE") return LogLevel::Trace;
    if (s == "debug" || s == "DEBUG") return LogLevel::Debug;
    if (s == "warn" || s == "WARN" || s == "warning") return LogLevel::Warn;
    if (s == "error" || s == "ERROR") return LogLevel::Error;
    if (s == "fatal" || s == "FATAL") return LogLevel::Fatal;
    return LogLevel::Info;
}

// Category constants for the engine
namespace LogCategory {
constexpr uint8_t System = 0;
constexpr uint8_t Exchange = 1;
constexpr uint8_t Feed = 2;
constexpr uint8_t Strategy = 3;
constexpr uint8_t Execution = 4;
constexpr uint8_t Position = 5;
constexpr uint8_t Risk = 6;
constexpr uint8_t Watchdog = 7;
} // namespace LogCategory

inline const char* category_to_string(uint8_t category) {
    switch (category) {
    case LogCategory::System:
        return "system";
    case LogCategory::Exchange:
        return "exchange";
    case LogCategory::Feed:
        return "feed";
    case LogCategory::Strategy:
        return "strategy";
    case LogCategory::Execution:
        return "execution";
    case LogCategory::Position:
        return "position";
    case LogCategory::Risk:
        return "risk";
    case LogCategory::Watchdog:
        return "watchdog";
    default:
        return "misc";
    }
}

/**
 * Log Entry - fixed size so the ring buffer never allocates.
 * Messages longer than the buffer are truncated.
 */
struct alignas(64) LogEntry {
    uint64_t timestamp_ns; // wall clock
    LogLevel level;
    uint8_t category;
    uint16_t reserved;
    uint32_t thread_id;
    char message[240];

    void set_message(const char* msg) {
        size_t len = std::strlen(msg);
        if (len >= sizeof(message))
            len = sizeof(message) - 1;
        std::memcpy(message, msg, len);
        message[len] = '\0';
    }
};
static_assert(sizeof(LogEntry) % 64 == 0, "LogEntry must fill whole cache lines");

/**
 * Ring buffer with a single consumer.
 *
 * Trading loops, the feed worker and the watchdog all log, so pushes are
 * serialized by a producer mutex. The consumer side stays lock-free.
 */
template <size_t Capacity = 4096>
class alignas(64) LogRingBuffer {
public:
    static_assert((Capacity & (Capacity - 1)) == 0, "Capacity must be power of 2");

    LogRingBuffer() : head_(0), tail_(0) {}

    /**
     * Try to push a log entry (producer side)
     * Returns false if the buffer is full.
     */
    bool try_push(const LogEntry& entry) {
        std::lock_guard<std::mutex> lock(push_mutex_);
        size_t head = head_.load(std::memory_order_relaxed);
        size_t next_head = (head + 1) & (Capacity - 1);

        if (next_head == tail_.load(std::memory_order_acquire)) {
            return false; // Buffer full
        }

        buffer_[head] = entry;
        head_.store(next_head, std::memory_order_release);
        return true;
    }

    /**
     * Try to pop a log entry (consumer side)
     */
    bool try_pop(LogEntry& entry) {
        size_t tail = tail_.load(std::memory_order_relaxed);

        if (tail == head_.load(std::memory_order_acquire)) {
            return false; // Buffer empty
        }

        entry = buffer_[tail];
        tail_.store((tail + 1) & (Capacity - 1), std::memory_order_release);
        return true;
    }

    size_t size() const {
        size_t head = head_.load(std::memory_order_acquire);
        size_t tail = tail_.load(std::memory_order_acquire);
        return (head - tail + Capacity) & (Capacity - 1);
    }

    bool empty() const { return head_.load(std::memory_order_acquire) == tail_.load(std::memory_order_acquire); }

private:
    alignas(64) std::atomic<size_t> head_;
    alignas(64) std::atomic<size_t> tail_;
    std::mutex push_mutex_;
    std::array<LogEntry, Capacity> buffer_;
};

/**
 * Async Logger
 *
 * Callers format and enqueue; a background thread does the I/O.
 * Without start() entries stay queued until stop() flushes them.
 *
 * Usage:
 *   AsyncLogger logger;
 *   logger.start();
 *   AUTOTRADE_LOGF_INFO(logger, Execution, "Order filled: %.4f @ %.2f", qty, price);
 *   logger.stop();
 */
class AsyncLogger {
public:
    using OutputCallback = std::function<void(const LogEntry&)>;

    AsyncLogger()
        : buffer_(std::make_unique<LogRingBuffer<>>())
        , running_(false)
        , min_level_(LogLevel::Info)
        , file_(nullptr)
        , dropped_count_(0)
        , total_logged_(0) {}

    ~AsyncLogger() {
        stop();
        if (file_) {
            std::fclose(file_);
        }
    }

    // Non-copyable
    AsyncLogger(const AsyncLogger&) = delete;
    AsyncLogger& operator=(const AsyncLogger&) = delete;

    /**
     * Start the background consumer thread
     */
    void start() {
        if (running_.exchange(true))
            return; // Already running

        consumer_thread_ = std::thread([this]() { consume_loop(); });
    }

    /**
     * Stop the logger and flush remaining entries
     */
    void stop() {
        if (running_.exchange(false)) {
            if (consumer_thread_.joinable()) {
                consumer_thread_.join();
            }
        }

        LogEntry entry;
        while (buffer_->try_pop(entry)) {
            output_entry(entry);
        }
    }

    void log(LogLevel level, uint8_t category, const char* message) {
        if (level < min_level_.load(std::memory_order_relaxed))
            return;

        LogEntry entry;
        entry.timestamp_ns = get_timestamp_ns();
        entry.level = level;
        entry.category = category;
        entry.reserved = 0;
        entry.thread_id = get_thread_id();
        entry.set_message(message);

        if (!buffer_->try_push(entry)) {
            dropped_count_.fetch_add(1, std::memory_order_relaxed);
        } else {
            total_logged_.fetch_add(1, std::memory_order_relaxed);
        }
    }

    /**
     * Log with printf-style formatting. Pass std::string arguments as c_str().
     */
    template <typename... Args>
    void logf(LogLevel level, uint8_t category, const char* fmt, Args... args) {
        if (level < min_level_.load(std::memory_order_relaxed))
            return;

        char buffer[sizeof(LogEntry::message)];
        std::snprintf(buffer, sizeof(buffer), fmt, args...);
        log(level, category, buffer);
    }

    void set_min_level(LogLevel level) { min_level_.store(level, std::memory_order_relaxed); }
    LogLevel min_level() const { return min_level_.load(std::memory_order_relaxed); }

    // Must be called before start()
    void set_output_callback(OutputCallback cb) { output_callback_ = std::move(cb); }

    /**
     * Also append every entry to a file. Must be called before start().
     * Returns false if the file cannot be opened.
     */
    bool open_file(const std::string& path) {
        FILE* f = std::fopen(path.c_str(), "a");
        if (!f) {
            return false;
        }
        if (file_) {
            std::fclose(file_);
        }
        file_ = f;
        return true;
    }

    // Statistics
    uint64_t dropped_count() const { return dropped_count_.load(); }
    uint64_t total_logged() const { return total_logged_.load(); }

private:
    std::unique_ptr<LogRingBuffer<>> buffer_;
    std::atomic<bool> running_;
    std::thread consumer_thread_;
    std::atomic<LogLevel> min_level_;
    OutputCallback output_callback_;
    FILE* file_;

    std::atomic<uint64_t> dropped_count_;
    std::atomic<uint64_t> total_logged_;

    void consume_loop() {
        LogEntry entry;
        while (running_.load(std::memory_order_relaxed)) {
            while (buffer_->try_pop(entry)) {
                output_entry(entry);
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    }

    void output_entry(const LogEntry& entry) {
        if (output_callback_) {
            output_callback_(entry);
            return;
        }

        auto ts_ms = static_cast<unsigned long long>(entry.timestamp_ns / 1000000);
        std::fprintf(stderr, "[%llu.%03llu] [%s] [%s] %s\n", ts_ms / 1000, ts_ms % 1000,
                     level_to_string(entry.level), category_to_string(entry.category), entry.message);
        if (file_) {
            std::fprintf(file_, "[%llu.%03llu] [%s] [%s] %s\n", ts_ms / 1000, ts_ms % 1000,
                         level_to_string(entry.level), category_to_string(entry.category), entry.message);
            std::fflush(file_);
        }
    }

    static uint64_t get_timestamp_ns() {
        auto now = std::chrono::system_clock::now();
        return std::chrono::duration_cast<std::chrono::nanoseconds>(now.time_since_epoch()).count();
    }

    static uint32_t get_thread_id() {
        static thread_local uint32_t id = 0;
        if (id == 0) {
            std::hash<std::thread::id> hasher;
            id = static_cast<uint32_t>(hasher(std::this_thread::get_id()));
        }
        return id;
    }
};

// Convenience macros
#define AUTOTRADE_LOG_DEBUG(logger, cat, msg) \
    (logger).log(autotrade::logging::LogLevel::Debug, autotrade::logging::LogCategory::cat, msg)
#define AUTOTRADE_LOG_INFO(logger, cat, msg) \
    (logger).log(autotrade::logging::LogLevel::Info, autotrade::logging::LogCategory::cat, msg)
#define AUTOTRADE_LOG_WARN(logger, cat, msg) \
    (logger).log(autotrade::logging::LogLevel::Warn, autotrade::logging::LogCategory::cat, msg)
#define AUTOTRADE_LOG_ERROR(logger, cat, msg) \
    (logger).log(autotrade::logging::LogLevel::Error, autotrade::logging::LogCategory::cat, msg)

// Printf-style variants
#define AUTOTRADE_LOGF_DEBUG(logger, cat, fmt, ...) \
    (logger).logf(autotrade::logging::LogLevel::Debug, autotrade::logging::LogCategory::cat, fmt, ##__VA_ARGS__)
#define AUTOTRADE_LOGF_INFO(logger, cat, fmt, ...) \
    (logger).logf(autotrade::logging::LogLevel::Info, autotrade::logging::LogCategory::cat, fmt, ##__VA_ARGS__)
#define AUTOTRADE_LOGF_WARN(logger, cat, fmt, ...) \
    (logger).logf(autotrade::logging::LogLevel::Warn, autotrade::logging::LogCategory::cat, fmt, ##__VA_ARGS__)
#define AUTOTRADE_LOGF_ERROR(logger, cat, fmt, ...) \
    (logger).logf(autotrade::logging::LogLevel::Error, autotrade::logging::LogCategory::cat, fmt, ##__VA_ARGS__)

} // namespace logging
} // namespace autotrade
