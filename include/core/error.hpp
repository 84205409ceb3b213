#pragma once

#include "core/types.hpp"

#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>

namespace sqlgate {

/**
 * @brief Error categories surfaced to callers
 */
enum class ErrorCategory {
    NONE,
    VALIDATION,       // never retried, security event
    RATE_LIMIT,       // retry after blocked_until
    POOL_EXHAUSTED,   // retry with backoff
    QUERY_TIMEOUT,    // retry a narrower statement
    EXECUTION,        // database rejected or failed the statement
    CONFIGURATION     // fatal at startup
};

inline const char* error_category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE:           return "NONE";
        case ErrorCategory::VALIDATION:     return "VALIDATION";
        case ErrorCategory::RATE_LIMIT:     return "RATE_LIMIT";
        case ErrorCategory::POOL_EXHAUSTED: return "POOL_EXHAUSTED";
        case ErrorCategory::QUERY_TIMEOUT:  return "QUERY_TIMEOUT";
        case ErrorCategory::EXECUTION:      return "EXECUTION";
        case ErrorCategory::CONFIGURATION:  return "CONFIGURATION";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Error value carried by Result<T>
 */
struct GatekeeperError {
    ErrorCategory category = ErrorCategory::NONE;
    ReasonCode reason = ReasonCode::OK;          // VALIDATION only
    std::string message;
    std::optional<std::chrono::system_clock::time_point> blocked_until;  // RATE_LIMIT only
    std::chrono::milliseconds retry_after{0};

    /// Stable code matching the audit outcome ("REJECTED:NOT_SELECT", "QUERY_TIMEOUT", ...)
    [[nodiscard]] std::string code() const {
        switch (category) {
            case ErrorCategory::VALIDATION:     return outcome_code(Outcome::REJECTED, reason);
            case ErrorCategory::RATE_LIMIT:     return outcome_to_string(Outcome::RATE_LIMITED);
            case ErrorCategory::POOL_EXHAUSTED: return outcome_to_string(Outcome::POOL_EXHAUSTED);
            case ErrorCategory::QUERY_TIMEOUT:  return outcome_to_string(Outcome::QUERY_TIMEOUT);
            case ErrorCategory::EXECUTION:      return outcome_to_string(Outcome::EXECUTION_ERROR);
            case ErrorCategory::CONFIGURATION:  return "CONFIGURATION_ERROR";
            default: return "UNKNOWN";
        }
    }
};

/**
 * @brief Result type for operations that can fail
 */
template<typename T>
class Result {
public:
    static Result ok(T value) {
        Result r;
        r.success_ = true;
        r.value_ = std::move(value);
        return r;
    }

    static Result error(GatekeeperError err) {
        Result r;
        r.success_ = false;
        r.error_ = std::move(err);
        return r;
    }

    static Result error(ErrorCategory category, std::string message) {
        return error(GatekeeperError{category, ReasonCode::OK, std::move(message), std::nullopt, {}});
    }

    bool is_ok() const { return success_; }
    bool is_error() const { return !success_; }

    const T& value() const { return *value_; }
    T& value() { return *value_; }

    const GatekeeperError& error() const { return error_; }
    ErrorCategory error_category() const { return error_.category; }
    const std::string& error_message() const { return error_.message; }

private:
    bool success_ = false;
    std::optional<T> value_;
    GatekeeperError error_;
};

/**
 * @brief Thrown for invalid configuration (startup only)
 */
class ConfigurationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace sqlgate
