#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace shiplog {

/**
 * @brief Error categories for the shipper
 */
enum class ErrorCategory {
    NONE,
    PARSE_ERROR,
    STORAGE_ERROR,
    REMOTE_TRANSIENT,   // network failure, timeout, 5xx: retry with backoff
    REMOTE_REJECTED,    // auth or validation failure: needs manual intervention
    CONFIG_ERROR,
    INTERNAL_ERROR
};

[[nodiscard]] inline const char* error_category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE:             return "none";
        case ErrorCategory::PARSE_ERROR:      return "parse_error";
        case ErrorCategory::STORAGE_ERROR:    return "storage_error";
        case ErrorCategory::REMOTE_TRANSIENT: return "remote_transient";
        case ErrorCategory::REMOTE_REJECTED:  return "remote_rejected";
        case ErrorCategory::CONFIG_ERROR:     return "config_error";
        case ErrorCategory::INTERNAL_ERROR:   return "internal_error";
        default:                              return "unknown";
    }
}

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

    static Result error(ErrorCategory category, std::string message) {
        Result r;
        r.success_ = false;
        r.error_category_ = category;
        r.error_message_ = std::move(message);
        return r;
    }

    bool is_ok() const { return success_; }
    bool is_error() const { return !success_; }

    const T& value() const { return *value_; }
    T& value() { return *value_; }

    ErrorCategory error_category() const { return error_category_; }
    const std::string& error_message() const { return error_message_; }

private:
    bool success_ = false;
    std::optional<T> value_;
    ErrorCategory error_category_ = ErrorCategory::NONE;
    std::string error_message_;
};

/**
 * @brief Thrown by the SQLite layer when the engine reports a failure.
 * Callers of the store catch it at their boundary.
 */
class StorageError : public std::runtime_error {
public:
    explicit StorageError(const std::string& message, int code = 0)
        : std::runtime_error(message), code_(code) {}

    [[nodiscard]] int code() const { return code_; }

private:
    int code_;
};

} // namespace shiplog
