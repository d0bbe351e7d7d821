#pragma once

#include "zulu/common.hpp"
#include <stdexcept>
#include <string>
#include <variant>
#include <optional>
#include <functional>

namespace zulu {

// Error codes for structured error handling
enum class ErrorCode {
    // Generic errors
    Success = 0,
    Unknown,
    InvalidArgument,
    OutOfRange,
    NotImplemented,
    Cancelled,

    // Cryptography errors
    CryptoInitFailed,
    CryptoSignatureFailed,
    CryptoVerificationFailed,
    CryptoEncryptionFailed,
    CryptoDecryptionFailed,
    CryptoKeyGenerationFailed,
    InvalidPublicKey,
    InvalidSecretKey,
    InvalidMnemonic,

    // Storage errors
    StorageNotFound,
    StorageReadFailed,
    StorageWriteFailed,
    StorageCorrupted,
    StorageAuthenticationFailed,
    SecretStoreUnavailable,

    // Verification errors
    NetworkError,
    ChunkHashMismatch,
    RootMismatch,
    ManifestSignatureError,
    ManifestInvalid,
    UntrustedSigner,
    KeyExpired,
    KeyRevoked,
    ResumeStateCorrupt,
    ReceiptCollision,
    ReceiptInvalid,
    EmptyArtifact,

    // Serialization errors
    SerializationFailed,
    DeserializationFailed,
    InvalidFormat
};

/**
 * How a caller should react to an error
 */
enum class Disposition {
    Fatal,            // Do not proceed; surface to the user
    Retryable,        // The same step may be retried (e.g. re-fetch a chunk)
    RestartRequired   // Transient state was discarded; a fresh attempt starts clean
};

// Convert error code to string
const char* error_code_to_string(ErrorCode code);

// Classify an error code
Disposition error_disposition(ErrorCode code);

const char* disposition_to_string(Disposition disposition);

// Error class with structured information
class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    Error(ErrorCode code, std::string message, std::string details)
        : code_(code), message_(std::move(message)), details_(std::move(details)) {}

    ErrorCode code() const { return code_; }
    const std::string& message() const { return message_; }
    const std::string& details() const { return details_; }

    Disposition disposition() const { return error_disposition(code_); }
    bool is_fatal() const { return disposition() == Disposition::Fatal; }

    std::string to_string() const;

private:
    ErrorCode code_;
    std::string message_;
    std::string details_;
};

// Result type for error handling (similar to Rust's Result<T, E>)
template<typename T>
class Result {
public:
    // Implicit conversion from an error, used by ZULU_TRY
    Result(Error error) : value_(std::move(error)) {}

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

    // Check if result contains a value
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

    // Get value or default
    T value_or(T default_value) const {
        if (is_ok()) {
            return std::get<T>(value_);
        }
        return default_value;
    }

    // Unwrap (throws if error)
    T unwrap() {
        return value();
    }

    // Unwrap or throw custom error
    T expect(const std::string& message) {
        if (is_err()) {
            throw std::runtime_error(message + ": " + error().to_string());
        }
        return value();
    }

    // Map the value if ok
    template<typename F>
    auto map(F&& func) -> Result<decltype(func(std::declval<T>()))> {
        using U = decltype(func(std::declval<T>()));
        if (is_ok()) {
            return Result<U>::Ok(func(value()));
        }
        return Result<U>::Err(error());
    }

    // Convert to optional
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

    std::variant<T, Error> value_;
};

// Specialized Result<void> for operations that don't return a value
template<>
class Result<void> {
public:
    Result(Error error) : error_(std::move(error)) {}

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

    std::optional<Error> err() const {
        return error_;
    }

private:
    explicit Result(bool) : error_(std::nullopt) {}

    std::optional<Error> error_;
};

// Custom exception classes
class ZuluException : public std::runtime_error {
public:
    ZuluException(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

class CryptoException : public ZuluException {
public:
    CryptoException(ErrorCode code, const std::string& message)
        : ZuluException(code, "Crypto error: " + message) {}
};

class StorageException : public ZuluException {
public:
    StorageException(ErrorCode code, const std::string& message)
        : ZuluException(code, "Storage error: " + message) {}
};

// Utility macros for error handling.
// ZULU_TRY forwards the error into the enclosing function's return type,
// which must be a Result<...>.
#define ZULU_TRY(expr) \
    do { \
        auto __zulu_result = (expr); \
        if (__zulu_result.is_err()) { \
            return __zulu_result.error(); \
        } \
    } while (0)

#define ZULU_TRY_UNWRAP(var, expr) \
    auto __zulu_result_##var = (expr); \
    if (__zulu_result_##var.is_err()) { \
        return __zulu_result_##var.error(); \
    } \
    auto var = std::move(__zulu_result_##var.value());

} // namespace zulu
