#pragma once

#include <optional>
#include <string>
#include <utility>

namespace ocfg {

// ============================================================================
// Error Handling
// ============================================================================

/**
 * @brief Error codes for fallible ocfg operations
 *
 * Partition ordering and per-package anomalies never surface here; they
 * degrade to a safe fallback and are reported through WarningCollector.
 */
enum class ErrorCode {
    // Resolution
    ROOT_INACCESSIBLE,
    IO_ERROR,

    // Settings load failures
    SETTINGS_MISSING,
    SETTINGS_PARSE_ERROR,
};

inline const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::ROOT_INACCESSIBLE: return "ROOT_INACCESSIBLE";
        case ErrorCode::IO_ERROR: return "IO_ERROR";
        case ErrorCode::SETTINGS_MISSING: return "SETTINGS_MISSING";
        case ErrorCode::SETTINGS_PARSE_ERROR: return "SETTINGS_PARSE_ERROR";
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
    std::string toString() const { return message_; }

private:
    ErrorCode code_;
    std::string message_;
};

// ============================================================================
// Result Type
// ============================================================================

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

private:
    explicit Result(T value) : has_value_(true), value_(std::move(value)) {}
    explicit Result(E error) : has_value_(false), error_(std::move(error)) {}

    bool has_value_;
    std::optional<T> value_;
    std::optional<E> error_;
};

} // namespace ocfg
