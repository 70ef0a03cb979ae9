#pragma once

/**
 * @file result.hpp
 * @brief Error handling types shared by the sweep library
 *
 * Fallible operations that a caller must act on return Result<T>.
 * Conditions that only degrade a run (unavailable source, corrupt snapshot)
 * are reported through WarningCollector instead.
 */

#include <optional>
#include <string>
#include <utility>

namespace sweep {

/**
 * @brief Error codes for sweep operations
 */
enum class ErrorCode {
    // System / IO
    FILE_NOT_FOUND,
    PERMISSION_DENIED,
    IO_ERROR,

    // Configuration
    CONFIG_PARSE_ERROR,
    CONFIG_INVALID,

    // Snapshot persistence
    SNAPSHOT_WRITE_FAILED,

    // Run-level
    NO_INVENTORY_SOURCE,
    CANCELLED,
};

inline const char* error_code_to_string(ErrorCode c) {
    switch (c) {
        case ErrorCode::FILE_NOT_FOUND: return "FILE_NOT_FOUND";
        case ErrorCode::PERMISSION_DENIED: return "PERMISSION_DENIED";
        case ErrorCode::IO_ERROR: return "IO_ERROR";
        case ErrorCode::CONFIG_PARSE_ERROR: return "CONFIG_PARSE_ERROR";
        case ErrorCode::CONFIG_INVALID: return "CONFIG_INVALID";
        case ErrorCode::SNAPSHOT_WRITE_FAILED: return "SNAPSHOT_WRITE_FAILED";
        case ErrorCode::NO_INVENTORY_SOURCE: return "NO_INVENTORY_SOURCE";
        case ErrorCode::CANCELLED: return "CANCELLED";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Error type with code and message
 */
class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    Error& withContext(const std::string& context) {
        message_ = context + ": " + message_;
        return *this;
    }

    ErrorCode code() const { return code_; }
    const std::string& message() const { return message_; }
    std::string toString() const {
        return std::string(error_code_to_string(code_)) + ": " + message_;
    }

private:
    ErrorCode code_;
    std::string message_;
};

/**
 * @brief Result type for fallible operations
 * @tparam T The success value type
 * @tparam E The error type (default: Error)
 *
 * Check isOk() before accessing value(), or isErr() before error().
 */
template<typename T, typename E = Error>
class Result {
public:
    static Result ok(T value) { return Result(std::move(value)); }
    static Result err(E error) { return Result(std::move(error)); }

    bool isOk() const { return has_value_; }
    bool isErr() const { return !has_value_; }

    T& value() { return value_.value(); }
    const T& value() const { return value_.value(); }
    E& error() { return error_.value(); }
    const E& error() const { return error_.value(); }

    T valueOr(T default_value) const {
        if (has_value_) return value_.value();
        return default_value;
    }

private:
    explicit Result(T value) : has_value_(true), value_(std::move(value)) {}
    explicit Result(E error) : has_value_(false), error_(std::move(error)) {}

    bool has_value_;
    std::optional<T> value_;
    std::optional<E> error_;
};

template<typename E>
class Result<void, E> {
public:
    static Result ok() { return Result(true, std::nullopt); }
    static Result err(E error) { return Result(false, std::move(error)); }

    bool isOk() const { return has_value_; }
    bool isErr() const { return !has_value_; }

    void value() const {}
    E& error() { return error_.value(); }
    const E& error() const { return error_.value(); }

private:
    Result(bool hv, std::optional<E> err) : has_value_(hv), error_(std::move(err)) {}
    bool has_value_;
    std::optional<E> error_;
};

} // namespace sweep
