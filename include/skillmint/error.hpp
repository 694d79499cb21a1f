#pragma once

#include "skillmint/common.hpp"
#include <stdexcept>
#include <string>
#include <variant>
#include <optional>
#include <functional>

namespace skillmint {

// Error codes for structured error handling
enum class ErrorCode {
    // Generic errors
    Success = 0,
    Unknown,
    InvalidArgument,

    // Validation errors
    InvalidDifficulty,
    InvalidTimeLimit,
    InvalidScore,
    InvalidTag,

    // Authorization errors
    NotChallengeCreator,
    NotCredentialOwner,

    // State errors
    ChallengeInactive,
    TimeLimitExceeded,
    ProofAlreadyVerified,
    VerificationInProgress,

    // Resource errors
    InsufficientFunds,
    InsufficientEscrow,
    RewardAlreadyPaid,
    BalanceOverflow,

    // Lookup errors
    ChallengeNotFound,
    ProofNotFound,
    CredentialNotFound,

    // External collaborator errors
    VerifierFailure,

    // Storage errors
    StorageReadFailed,
    StorageWriteFailed,
    StorageCorrupted,

    // Serialization errors
    SerializationFailed,
    DeserializationFailed
};

/**
 * ErrorCategory - Taxonomy that callers branch on
 */
enum class ErrorCategory {
    None,
    Validation,
    Authorization,
    State,
    Resource,
    NotFound,
    Internal
};

// Convert error code to string
const char* error_code_to_string(ErrorCode code);

// Map an error code onto its category
ErrorCategory error_category(ErrorCode code);

const char* error_category_to_string(ErrorCategory category);

// Error class with structured information
class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    Error(ErrorCode code, std::string message, std::string details)
        : code_(code), message_(std::move(message)), details_(std::move(details)) {}

    ErrorCode code() const { return code_; }
    ErrorCategory category() const { return error_category(code_); }
    const std::string& message() const { return message_; }
    const std::string& details() const { return details_; }

    std::string to_string() const;

private:
    ErrorCode code_;
    std::string message_;
    std::string details_;
};

// Result type for error handling
template<typename T>
class Result {
public:
    // Success constructor
    static Result Ok(T value) {
        return Result(std::move(value));
    }

    // Error constructor
    static Result Err(Error error) {
        return Result(std::move(error));
    }

    // Error constructor with code and message
    static Result Err(ErrorCode code, const std::string& message) {
        return Result(Error(code, message));
    }

    bool is_ok() const { return std::holds_alternative<T>(value_); }
    bool is_err() const { return std::holds_alternative<Error>(value_); }

    // Get the value (throws if error)
    T& value() {
        if (is_err()) {
            throw std::runtime_error("Called value() on error Result: " + error().to_string());
        }
        return std::get<T>(value_);
    }

    const T& value() const {
        if (is_err()) {
            throw std::runtime_error("Called value() on error Result: " + error().to_string());
        }
        return std::get<T>(value_);
    }

    // Get the error (throws if ok)
    const Error& error() const {
        if (is_ok()) {
            throw std::runtime_error("Called error() on ok Result");
        }
        return std::get<Error>(value_);
    }

    T value_or(T default_value) const {
        if (is_ok()) {
            return std::get<T>(value_);
        }
        return default_value;
    }

    T unwrap() {
        return value();
    }

    T expect(const std::string& message) {
        if (is_err()) {
            throw std::runtime_error(message + ": " + error().to_string());
        }
        return value();
    }

    std::optional<T> ok() const {
        if (is_ok()) {
            return std::get<T>(value_);
        }
        return std::nullopt;
    }

    std::optional<Error> err() const {
        if (is_err()) {
            return std::get<Error>(value_);
        }
        return std::nullopt;
    }

private:
    explicit Result(T value) : value_(std::move(value)) {}
    explicit Result(Error error) : value_(std::move(error)) {}

    std::variant<T, Error> value_;
};

// Specialized Result<void> for operations that don't return a value
template<>
class Result<void> {
public:
    static Result Ok() {
        return Result(true);
    }

    static Result Err(Error error) {
        return Result(std::move(error));
    }

    static Result Err(ErrorCode code, const std::string& message) {
        return Result(Error(code, message));
    }

    bool is_ok() const { return !error_.has_value(); }
    bool is_err() const { return error_.has_value(); }

    const Error& error() const {
        if (!error_) {
            throw std::runtime_error("Called error() on ok Result");
        }
        return *error_;
    }

    void unwrap() {
        if (is_err()) {
            throw std::runtime_error("Called unwrap() on error Result: " + error().to_string());
        }
    }

    void expect(const std::string& message) {
        if (is_err()) {
            throw std::runtime_error(message + ": " + error().to_string());
        }
    }

private:
    explicit Result(bool) : error_(std::nullopt) {}
    explicit Result(Error error) : error_(std::move(error)) {}

    std::optional<Error> error_;
};

// Custom exception classes
class SkillmintException : public std::runtime_error {
public:
    SkillmintException(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

class StorageException : public SkillmintException {
public:
    StorageException(ErrorCode code, const std::string& message)
        : SkillmintException(code, "Storage error: " + message) {}
};

class ConfigException : public SkillmintException {
public:
    explicit ConfigException(const std::string& message)
        : SkillmintException(ErrorCode::InvalidArgument, "Config error: " + message) {}
};

// Utility macros for error handling
#define SKILLMINT_TRY(expr) \
    do { \
        auto __result = (expr); \
        if (__result.is_err()) { \
            return decltype(__result)::Err(__result.error()); \
        } \
    } while (0)

// Propagate the error of `expr` out of a function returning `ret_type`
#define SKILLMINT_TRY_AS(ret_type, expr) \
    do { \
        auto __result = (expr); \
        if (__result.is_err()) { \
            return ret_type::Err(__result.error()); \
        } \
    } while (0)

} // namespace skillmint
