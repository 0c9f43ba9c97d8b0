#pragma once

#include <optional>
#include <string>
#include <utility>

namespace sqlgate {

/**
 * @brief Error kinds surfaced by the registry, gate and executors
 */
enum class ErrorCode {
    NONE,
    INVALID_ARGUMENT,
    UNKNOWN_HANDLE,
    CONNECTION_UNAVAILABLE,
    STATEMENT_NOT_ALLOWED,
    WRITES_DISABLED,
    EXECUTION_FAILED,
    INTERNAL_ERROR
};

[[nodiscard]] inline const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE: return "NONE";
        case ErrorCode::INVALID_ARGUMENT: return "InvalidArgument";
        case ErrorCode::UNKNOWN_HANDLE: return "UnknownHandle";
        case ErrorCode::CONNECTION_UNAVAILABLE: return "ConnectionUnavailable";
        case ErrorCode::STATEMENT_NOT_ALLOWED: return "StatementNotAllowed";
        case ErrorCode::WRITES_DISABLED: return "WritesDisabled";
        case ErrorCode::EXECUTION_FAILED: return "ExecutionFailed";
        case ErrorCode::INTERNAL_ERROR: return "InternalError";
        default: return "Unknown";
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

    static Result error(ErrorCode code, std::string message) {
        Result r;
        r.success_ = false;
        r.error_code_ = code;
        r.error_message_ = std::move(message);
        return r;
    }

    /**
     * @brief Re-wrap the error of another Result (value type may differ)
     */
    template<typename U>
    static Result propagate(const Result<U>& other) {
        return error(other.error_code(), other.error_message());
    }

    bool is_ok() const { return success_; }
    bool is_error() const { return !success_; }

    const T& value() const { return *value_; }
    T& value() { return *value_; }

    ErrorCode error_code() const { return error_code_; }
    const std::string& error_message() const { return error_message_; }

private:
    bool success_ = false;
    std::optional<T> value_;
    ErrorCode error_code_ = ErrorCode::NONE;
    std::string error_message_;
};

} // namespace sqlgate
