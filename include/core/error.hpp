#pragma once

#include <optional>
#include <string>
#include <utility>

namespace promptguard {

/**
 * @brief Failure classes surfaced outside the (total) detection core
 */
enum class ErrorCategory {
    NONE,
    INPUT_ERROR,        // caller-supplied document is malformed
    INTERNAL_ERROR
};

[[nodiscard]] inline const char* error_category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE:           return "NONE";
        case ErrorCategory::INPUT_ERROR:    return "INPUT_ERROR";
        case ErrorCategory::INTERNAL_ERROR: return "INTERNAL_ERROR";
    }
    return "UNKNOWN";
}

struct Error {
    ErrorCategory category = ErrorCategory::NONE;
    std::string message;
};

/**
 * @brief Value or Error; exactly one is present
 */
template<typename T>
class Result {
public:
    static Result ok(T value) {
        Result r;
        r.value_.emplace(std::move(value));
        return r;
    }

    static Result error(ErrorCategory category, std::string message) {
        Result r;
        r.error_ = Error{category, std::move(message)};
        return r;
    }

    bool is_ok() const { return value_.has_value(); }
    bool is_error() const { return !value_.has_value(); }

    const T& value() const { return *value_; }
    T& value() { return *value_; }

    const Error& error() const { return error_; }
    ErrorCategory error_category() const { return error_.category; }
    const std::string& error_message() const { return error_.message; }

private:
    std::optional<T> value_;
    Error error_;
};

} // namespace promptguard
