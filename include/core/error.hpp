#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace tracectx {

/**
 * @brief Error categories for recoverable failures
 */
enum class ErrorCategory {
    NONE,
    INVALID_LENGTH,
    INVALID_CHARACTER
};

/**
 * @brief Result type for operations that can fail
 *
 * Text decoders attach the offset of the offending input character
 * when one exists.
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

    static Result error(ErrorCategory category, std::string message,
                        std::optional<std::size_t> offset = std::nullopt) {
        Result r;
        r.success_ = false;
        r.error_category_ = category;
        r.error_message_ = std::move(message);
        r.error_offset_ = offset;
        return r;
    }

    bool is_ok() const { return success_; }
    bool is_error() const { return !success_; }

    const T& value() const { return *value_; }
    T& value() { return *value_; }

    ErrorCategory error_category() const { return error_category_; }
    const std::string& error_message() const { return error_message_; }
    std::optional<std::size_t> error_offset() const { return error_offset_; }

private:
    bool success_ = false;
    std::optional<T> value_;
    ErrorCategory error_category_ = ErrorCategory::NONE;
    std::string error_message_;
    std::optional<std::size_t> error_offset_;
};

} // namespace tracectx
