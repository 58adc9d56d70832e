#pragma once

#include "core/types.hpp"

#include <optional>
#include <string>
#include <utility>

namespace sqlgate {

/**
 * @brief Result type for operations that can fail
 *
 * Carries either a value or an error kind with a message. Errors tied to a
 * particular statement of a batch also carry that statement's index.
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

    static Result error(ErrorCode code, std::string message,
                        std::optional<size_t> statement_index = std::nullopt) {
        Result r;
        r.success_ = false;
        r.error_code_ = code;
        r.error_message_ = std::move(message);
        r.statement_index_ = statement_index;
        return r;
    }

    // Re-wrap another Result's error under this value type
    template<typename U>
    static Result from_error(const Result<U>& other) {
        return error(other.error_code(), other.error_message(), other.statement_index());
    }

    bool is_ok() const { return success_; }
    bool is_error() const { return !success_; }

    const T& value() const { return *value_; }
    T& value() { return *value_; }

    ErrorCode error_code() const { return error_code_; }
    const std::string& error_message() const { return error_message_; }
    std::optional<size_t> statement_index() const { return statement_index_; }

private:
    bool success_ = false;
    std::optional<T> value_;
    ErrorCode error_code_ = ErrorCode::NONE;
    std::string error_message_;
    std::optional<size_t> statement_index_;
};

} // namespace sqlgate
