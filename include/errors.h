#pragma once

#include <string>
#include <variant>
#include <optional>
#include <stdexcept>

namespace voxgate {

/**
 * @brief Error types for different failure modes
 *
 * MissingKey, KeyMismatch and Unverified are security-relevant and must be
 * surfaced as-is; see is_security_error().
 */
enum class ErrorType {
    None,
    MissingKey,
    KeyMismatch,
    GuardrailRejected,
    VerificationRejected,
    Timeout,
    ExtractionError,
    Unverified,
    InvalidArgs,
    NotEnrolled,
    UnknownTool,
    NotConfirmed,
    LowConfidence,
    ConfigError,
    IOError,
    NetworkError,
    ParseError,
    InvalidState,
    Unknown
};

/**
 * @brief Error information structure
 */
struct Error {
    ErrorType type = ErrorType::None;
    std::string message;

    Error() = default;
    Error(ErrorType t, const std::string& msg) : type(t), message(msg) {}

    bool is_error() const { return type != ErrorType::None; }
    operator bool() const { return is_error(); }
};

const char* error_type_name(ErrorType type);

/// Identity/authorization failures; never downgraded to generic errors
inline bool is_security_error(ErrorType type) {
    return type == ErrorType::MissingKey ||
           type == ErrorType::KeyMismatch ||
           type == ErrorType::Unverified;
}

/// Eligible for a single bounded retry at the orchestration layer
inline bool is_transient(ErrorType type) {
    return type == ErrorType::Timeout || type == ErrorType::ExtractionError;
}

/**
 * @brief Result type for operations that can fail
 *
 * Holds either a value of type T or an Error.
 */
template<typename T>
class Result {
public:
    // Construct from value (success)
    Result(const T& value) : data_(value) {}
    Result(T&& value) : data_(std::move(value)) {}

    // Construct from error
    Result(const Error& error) : data_(error) {}
    Result(Error&& error) : data_(std::move(error)) {}

    bool is_ok() const {
        return std::holds_alternative<T>(data_);
    }

    bool is_error() const {
        return std::holds_alternative<Error>(data_);
    }

    // Get value (throws if error)
    const T& value() const {
        if (!is_ok()) {
            throw std::runtime_error("Result is error, cannot get value: " + std::get<Error>(data_).message);
        }
        return std::get<T>(data_);
    }

    T& value() {
        if (!is_ok()) {
            throw std::runtime_error("Result is error, cannot get value: " + std::get<Error>(data_).message);
        }
        return std::get<T>(data_);
    }

    // Get error (throws if success)
    const Error& error() const {
        if (is_ok()) {
            throw std::runtime_error("Result is success, cannot get error");
        }
        return std::get<Error>(data_);
    }

    /// Error type, or ErrorType::None on success
    ErrorType error_type() const {
        return is_ok() ? ErrorType::None : std::get<Error>(data_).type;
    }

    T value_or(const T& default_value) const {
        return is_ok() ? std::get<T>(data_) : default_value;
    }

    explicit operator bool() const {
        return is_ok();
    }

private:
    std::variant<T, Error> data_;
};

// Specialization for void (success/failure only)
template<>
class Result<void> {
public:
    Result() : is_ok_(true) {}
    Result(const Error& error) : is_ok_(false), error_(error) {}
    Result(Error&& error) : is_ok_(false), error_(std::move(error)) {}

    bool is_ok() const { return is_ok_; }
    bool is_error() const { return !is_ok_; }
    const Error& error() const { return error_; }
    ErrorType error_type() const { return is_ok_ ? ErrorType::None : error_.type; }

    explicit operator bool() const { return is_ok_; }

private:
    bool is_ok_;
    Error error_;
};

using VoidResult = Result<void>;

// Helper functions for creating errors
inline Error make_error(ErrorType type, const std::string& message) {
    return Error(type, message);
}

inline Error make_io_error(const std::string& message) {
    return Error(ErrorType::IOError, message);
}

inline Error make_parse_error(const std::string& message) {
    return Error(ErrorType::ParseError, message);
}

inline Error make_timeout_error(const std::string& message = "Operation timed out") {
    return Error(ErrorType::Timeout, message);
}

inline Error make_unverified_error(const std::string& message) {
    return Error(ErrorType::Unverified, message);
}

} // namespace voxgate
