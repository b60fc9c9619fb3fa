#pragma once

#include <string>
#include <optional>

namespace shelter {

/**
 * @brief Error categories for the library
 */
enum class ErrorCategory {
    NONE,
    EMPTY_OR_NULL_INPUT,
    INVALID_ENCODING,
    INTERNAL_ERROR
};

[[nodiscard]] inline constexpr const char* error_category_name(ErrorCategory category) noexcept {
    switch (category) {
        case ErrorCategory::NONE:                return "None";
        case ErrorCategory::EMPTY_OR_NULL_INPUT: return "EmptyOrNullInput";
        case ErrorCategory::INVALID_ENCODING:    return "InvalidEncoding";
        case ErrorCategory::INTERNAL_ERROR:      return "InternalError";
    }
    return "Unknown";
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

} // namespace shelter
