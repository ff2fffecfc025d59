#pragma once

#include <stdexcept>
#include <string>

namespace autotrade {

/**
 * Error taxonomy
 *
 * Transport problems surface as NetworkError and are retried inside the
 * exchange client. Once every attempt fails the caller sees Exhausted.
 * ExchangeError carries the exchange's own code and is never retried.
 * Everything above the client turns these into a HOLD decision with a reason.
 */

class NetworkError : public std::runtime_error {
public:
    enum class Kind { Timeout, Connection };

    NetworkError(Kind kind, const std::string& what)
        : std::runtime_error(what)
        , kind_(kind) {}

    Kind kind() const { return kind_; }
    bool is_timeout() const { return kind_ == Kind::Timeout; }

private:
    Kind kind_;
};

class ExchangeError : public std::runtime_error {
public:
    ExchangeError(std::string code, const std::string& message)
        : std::runtime_error("Exchange error " + code + ": " + message)
        , code_(std::move(code))
        , message_(message) {}

    const std::string& code() const { return code_; }
    const std::string& message() const { return message_; }

private:
    std::string code_;
    std::string message_;
};

// Raised when the server keeps answering 429 beyond the wait budget
class RateLimited : public std::runtime_error {
public:
    explicit RateLimited(double retry_after_s)
        : std::runtime_error("Rate limited by exchange (retry after " +
                             std::to_string(static_cast<int>(retry_after_s)) + "s)")
        , retry_after_s_(retry_after_s) {}

    double retry_after() const { return retry_after_s_; }

private:
    double retry_after_s_;
};

class Exhausted : public std::runtime_error {
public:
    Exhausted(int attempts, const std::string& last_error)
        : std::runtime_error("All retry attempts failed (" + std::to_string(attempts) +
                             "). Last error: " + last_error)
        , attempts_(attempts) {}

    int attempts() const { return attempts_; }

private:
    int attempts_;
};

class ValidationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class TimeoutError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class CancelledError : public std::runtime_error {
public:
    CancelledError()
        : std::runtime_error("Operation cancelled") {}
};

// Missing or unusable configuration. Disables the affected instance.
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

}  // namespace autotrade
