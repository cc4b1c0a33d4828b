#pragma once

#include <string>
#include <optional>

namespace biip {

/**
 * @brief Error categories for the I/O layer around the engine
 *
 * The redaction engine itself has no failing operations; these cover
 * file access, clipboard access, configuration and argument handling.
 */
enum class ErrorCategory {
    NONE,
    IO_ERROR,
    CONFIG_ERROR,
    CLIPBOARD_ERROR,
    USAGE_ERROR,
    INTERNAL_ERROR
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

private:
    bool success_ = false;
    std::optional<T> value_;
    ErrorCategory error_category_ = ErrorCategory::NONE;
    std::string error_message_;
};

} // namespace biip
