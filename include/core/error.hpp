#pragma once

#include <optional>
#include <string>
#include <utility>

namespace wpdb {

/**
 * @brief Stable, machine-readable failure codes surfaced to callers
 */
enum class ErrorCode {
    NONE,
    VALIDATION_REJECTED,
    NOT_INITIALIZED,
    POOL_EXHAUSTED,
    CONNECTION_ERROR,
    TIMEOUT,
    QUERY_ERROR,
    TABLE_NOT_FOUND,
    INTERNAL_ERROR
};

[[nodiscard]] const char* error_code_to_string(ErrorCode code);

/**
 * @brief Tagged failure
 *
 * `detail` is the internal diagnostic (driver text, SQL state). It is logged,
 * never returned to callers. Callers see public_message() instead.
 */
struct Error {
    ErrorCode code = ErrorCode::NONE;
    std::string detail;

    /**
     * @brief Short sanitized message for the caller
     */
    [[nodiscard]] std::string public_message() const;
};

/**
 * @brief Result type for operations that can fail
 */
template<typename T>
class Result {
public:
    static Result ok(T value) {
        Result r;
        r.value_ = std::move(value);
        return r;
    }

    static Result error(ErrorCode code, std::string detail) {
        Result r;
        r.error_.code = code;
        r.error_.detail = std::move(detail);
        return r;
    }

    static Result error(Error err) {
        Result r;
        r.error_ = std::move(err);
        return r;
    }

    bool is_ok() const { return value_.has_value(); }
    bool is_error() const { return !value_.has_value(); }

    const T& value() const { return *value_; }
    T& value() { return *value_; }

    const Error& error() const { return error_; }
    ErrorCode error_code() const { return error_.code; }
    const std::string& error_message() const { return error_.detail; }

private:
    std::optional<T> value_;
    Error error_;
};

} // namespace wpdb
