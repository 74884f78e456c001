#pragma once

#include <optional>
#include <string>
#include <utility>

namespace graceful {

/**
 * @brief Error categories for the server wrapper
 */
enum class ErrorCategory {
    NONE,
    CONFIG_ERROR,
    BIND_ERROR,
    LISTEN_ERROR,
    SIGNAL_ERROR,
    INTERNAL_ERROR
};

inline constexpr const char* error_category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE:           return "none";
        case ErrorCategory::CONFIG_ERROR:   return "config error";
        case ErrorCategory::BIND_ERROR:     return "bind error";
        case ErrorCategory::LISTEN_ERROR:   return "listen error";
        case ErrorCategory::SIGNAL_ERROR:   return "signal error";
        case ErrorCategory::INTERNAL_ERROR: return "internal error";
    }
    return "unknown";
}

/**
 * @brief Outcome of an operation that produces no value
 */
class Status {
public:
    static Status ok() { return Status{}; }

    static Status error(ErrorCategory category, std::string message) {
        Status s;
        s.error_category_ = category;
        s.error_message_ = std::move(message);
        return s;
    }

    bool is_ok() const { return error_category_ == ErrorCategory::NONE; }
    bool is_error() const { return !is_ok(); }

    ErrorCategory error_category() const { return error_category_; }
    const std::string& error_message() const { return error_message_; }

    // "server closed" for the normal path, "<category>: <message>" otherwise
    std::string to_string() const {
        if (is_ok()) return "server closed";
        return std::string(error_category_to_string(error_category_)) + ": " + error_message_;
    }

private:
    ErrorCategory error_category_ = ErrorCategory::NONE;
    std::string error_message_;
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

    Status status() const {
        return success_ ? Status::ok() : Status::error(error_category_, error_message_);
    }

private:
    bool success_ = false;
    std::optional<T> value_;
    ErrorCategory error_category_ = ErrorCategory::NONE;
    std::string error_message_;
};

} // namespace graceful
