// include/trade_guard/core/error.hpp

#pragma once

#include <exception>
#include <memory>
#include <stdexcept>
#include <string>

namespace trade_guard {

/**
 * @brief Error codes for the risk gatekeeper
 * Guardrail rejections are not errors; they travel as SubmitResponse values
 */
enum class ErrorCode {
    NONE = 0,
    UNKNOWN_ERROR = 1,
    INVALID_ARGUMENT = 2,
    NOT_INITIALIZED = 3,
    NOT_READY = 4,

    // Data errors
    DATABASE_ERROR = 5,
    DATA_NOT_FOUND = 6,
    INVALID_DATA = 7,

    // Order errors
    ORDER_REJECTED = 8,
    INVALID_ORDER = 9,
    DUPLICATE_ORDER = 10,

    // Risk errors
    RISK_LIMIT_EXCEEDED = 11,
    GUARDRAIL_REJECTED = 12,
    KILL_SWITCH_ACTIVE = 13,

    // Dependency errors
    CONNECTION_ERROR = 14,
    TIMEOUT_ERROR = 15,
    API_ERROR = 16,
    SERVICE_DEGRADED = 17,
    MARKET_DATA_ERROR = 18,

    // File and I/O errors
    FILE_NOT_FOUND = 19,
    FILE_IO_ERROR = 20,

    // Parsing errors
    JSON_PARSE_ERROR = 21,

    // Coordination errors
    CONSENSUS_ERROR = 22,
    SESSION_NOT_FOUND = 23,

    // Venue throttling (HTTP 429)
    RATE_LIMITED = 24,

    CUSTOM_ERROR_START = 1000
};

/**
 * @brief Short machine name for an error code
 */
inline const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE:
            return "none";
        case ErrorCode::RATE_LIMITED:
            return "rate_limited";
        case ErrorCode::INVALID_ARGUMENT:
            return "invalid_argument";
        case ErrorCode::NOT_INITIALIZED:
            return "not_initialized";
        case ErrorCode::NOT_READY:
            return "portfolio_not_ready";
        case ErrorCode::DATABASE_ERROR:
            return "database_error";
        case ErrorCode::DATA_NOT_FOUND:
            return "not_found";
        case ErrorCode::INVALID_DATA:
            return "invalid_data";
        case ErrorCode::ORDER_REJECTED:
            return "order_rejected";
        case ErrorCode::INVALID_ORDER:
            return "invalid_order";
        case ErrorCode::DUPLICATE_ORDER:
            return "duplicate";
        case ErrorCode::RISK_LIMIT_EXCEEDED:
            return "risk_limit_exceeded";
        case ErrorCode::GUARDRAIL_REJECTED:
            return "guardrail_rejected";
        case ErrorCode::KILL_SWITCH_ACTIVE:
            return "kill_switch_active";
        case ErrorCode::CONNECTION_ERROR:
            return "connection_error";
        case ErrorCode::TIMEOUT_ERROR:
            return "timeout";
        case ErrorCode::API_ERROR:
            return "api_error";
        case ErrorCode::SERVICE_DEGRADED:
            return "service_degraded";
        case ErrorCode::MARKET_DATA_ERROR:
            return "market_data_error";
        case ErrorCode::FILE_NOT_FOUND:
            return "file_not_found";
        case ErrorCode::FILE_IO_ERROR:
            return "file_io_error";
        case ErrorCode::JSON_PARSE_ERROR:
            return "json_parse_error";
        case ErrorCode::CONSENSUS_ERROR:
            return "consensus_error";
        case ErrorCode::SESSION_NOT_FOUND:
            return "session_not_found";
        default:
            return "unknown_error";
    }
}

/**
 * @brief Exception type carried inside every failed Result
 */
class TradeError : public std::runtime_error {
public:
    /**
     * @brief Constructor for TradeError
     * @param code The error code
     * @param message Detailed error message
     * @param component Component where error occurred
     */
    TradeError(ErrorCode code, const std::string& message, const std::string& component = "")
        : std::runtime_error(message), code_(code), component_(component) {}

    ErrorCode code() const noexcept {
        return code_;
    }

    const std::string& component() const noexcept {
        return component_;
    }

    /**
     * @brief Convert error to string representation
     * @return Formatted error string
     */
    std::string to_string() const {
        return "Error in " + component_ + ": " + what() + " (" + error_code_name(code_) + ")";
    }

private:
    ErrorCode code_;
    std::string component_;
};

/**
 * @brief Result type for operations that can fail
 * @tparam T The type of the successful result
 */
template <typename T>
class Result {
public:
    template <typename U = T>
    Result(U&& value) : value_(std::forward<U>(value)), error_(nullptr) {}

    Result(std::unique_ptr<TradeError> error) : error_(std::move(error)) {}

    Result(Result&& other) noexcept
        : value_(std::move(other.value_)), error_(std::move(other.error_)) {}

    Result& operator=(Result&& other) noexcept {
        if (this != &other) {
            value_ = std::move(other.value_);
            error_ = std::move(other.error_);
        }
        return *this;
    }

    Result(const Result&) = delete;
    Result& operator=(const Result&) = delete;

    bool is_ok() const {
        return error_ == nullptr;
    }

    bool is_error() const {
        return error_ != nullptr;
    }

    /**
     * @brief Get the success value
     * @throws TradeError if result represents an error
     */
    const T& value() const {
        if (error_)
            throw *error_;
        return value_;
    }

    /**
     * @brief Get the error if present
     * @return Pointer to the error, or nullptr if success
     */
    const TradeError* error() const {
        return error_.get();
    }

private:
    T value_;
    std::unique_ptr<TradeError> error_;
};

// Specialization for void
template <>
class Result<void> {
public:
    Result() : error_(nullptr) {}
    Result(std::unique_ptr<TradeError> error) : error_(std::move(error)) {}

    bool is_ok() const {
        return error_ == nullptr;
    }
    bool is_error() const {
        return error_ != nullptr;
    }

    void value() const {
        if (error_)
            throw *error_;
    }

    const TradeError* error() const {
        return error_.get();
    }

private:
    std::unique_ptr<TradeError> error_;
};

/**
 * @brief Helper for creating error results
 * @param code The error code
 * @param message The error message
 * @param component The component where error occurred
 */
template <typename T>
Result<T> make_error(ErrorCode code, const std::string& message,
                     const std::string& component = "") {
    return Result<T>(std::make_unique<TradeError>(code, message, component));
}

/**
 * @brief Re-wrap the error of one Result into a Result of another type
 */
template <typename T, typename U>
Result<T> forward_error(const Result<U>& failed) {
    return make_error<T>(failed.error()->code(), failed.error()->what(),
                         failed.error()->component());
}

}  // namespace trade_guard
