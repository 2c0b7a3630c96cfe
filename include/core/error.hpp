#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace unidb {

/**
 * @brief Error taxonomy shared by every layer of the data-access core
 *
 * Capability and contract violations (VALIDATION_ERROR, UNSUPPORTED_OPERATION)
 * are detected locally before any backend I/O. Backend failures and timeouts
 * are surfaced verbatim and counted by the circuit breaker.
 */
enum class ErrorCode {
    NONE,
    CONNECTION_FAILED,
    QUERY_FAILED,
    OPERATION_FAILED,
    TRANSACTION_FAILED,
    VALIDATION_ERROR,
    UNSUPPORTED_OPERATION,
    CONVERSION_ERROR,
    POOL_ERROR,
    TIMEOUT,
    RESOURCE_LIMIT_EXCEEDED,
    CIRCUIT_OPEN,
    EMERGENCY_SHUTDOWN,
    CONFIGURATION_ERROR,
    SECURITY_VIOLATION
};

[[nodiscard]] inline std::string_view error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE:                    return "None";
        case ErrorCode::CONNECTION_FAILED:       return "ConnectionFailed";
        case ErrorCode::QUERY_FAILED:            return "QueryFailed";
        case ErrorCode::OPERATION_FAILED:        return "OperationFailed";
        case ErrorCode::TRANSACTION_FAILED:      return "TransactionFailed";
        case ErrorCode::VALIDATION_ERROR:        return "ValidationError";
        case ErrorCode::UNSUPPORTED_OPERATION:   return "UnsupportedOperation";
        case ErrorCode::CONVERSION_ERROR:        return "ConversionError";
        case ErrorCode::POOL_ERROR:              return "PoolError";
        case ErrorCode::TIMEOUT:                 return "Timeout";
        case ErrorCode::RESOURCE_LIMIT_EXCEEDED: return "ResourceLimitExceeded";
        case ErrorCode::CIRCUIT_OPEN:            return "CircuitOpen";
        case ErrorCode::EMERGENCY_SHUTDOWN:      return "EmergencyShutdown";
        case ErrorCode::CONFIGURATION_ERROR:     return "ConfigurationError";
        case ErrorCode::SECURITY_VIOLATION:      return "SecurityViolation";
        default:                                 return "Unknown";
    }
}

template<typename T> class Result;

namespace detail {

class ErrorState {
public:
    [[nodiscard]] bool is_ok() const { return code_ == ErrorCode::NONE; }
    [[nodiscard]] bool is_error() const { return code_ != ErrorCode::NONE; }
    explicit operator bool() const { return is_ok(); }

    [[nodiscard]] ErrorCode error_code() const { return code_; }
    [[nodiscard]] const std::string& error_message() const { return message_; }

    /**
     * @brief Re-wrap this error as a Result of another type (propagation)
     */
    template<typename U>
    [[nodiscard]] Result<U> as_error() const {
        return Result<U>::error(code_, message_);
    }

protected:
    void set_error(ErrorCode code, std::string message) {
        code_ = code;
        message_ = std::move(message);
    }

private:
    ErrorCode code_ = ErrorCode::NONE;
    std::string message_;
};

} // namespace detail

/**
 * @brief Result type for operations that can fail
 *
 * Either holds a value (is_ok) or an ErrorCode plus message. No exceptions
 * cross the data-access API; everything is reported through Result.
 */
template<typename T>
class Result : public detail::ErrorState {
public:
    static Result ok(T value) {
        Result r;
        r.value_ = std::move(value);
        return r;
    }

    static Result error(ErrorCode code, std::string message) {
        Result r;
        r.set_error(code == ErrorCode::NONE ? ErrorCode::OPERATION_FAILED : code,
                    std::move(message));
        return r;
    }

    const T& value() const { return *value_; }
    T& value() { return *value_; }

    const T* operator->() const { return &*value_; }
    T* operator->() { return &*value_; }

private:
    std::optional<T> value_;
};

template<>
class Result<void> : public detail::ErrorState {
public:
    static Result ok() { return Result{}; }

    static Result error(ErrorCode code, std::string message) {
        Result r;
        r.set_error(code == ErrorCode::NONE ? ErrorCode::OPERATION_FAILED : code,
                    std::move(message));
        return r;
    }
};

} // namespace unidb
