#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace credvault {

/**
 * @brief Error categories surfaced to vault callers
 */
enum class ErrorCategory {
    NONE,
    NOT_FOUND,
    INVALID_INPUT,
    DECRYPTION_ERROR,
    PERSISTENCE_ERROR,
    CONFIG_ERROR,
    INTERNAL_ERROR
};

[[nodiscard]] inline const char* error_category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE:              return "none";
        case ErrorCategory::NOT_FOUND:         return "not_found";
        case ErrorCategory::INVALID_INPUT:     return "invalid_input";
        case ErrorCategory::DECRYPTION_ERROR:  return "decryption_error";
        case ErrorCategory::PERSISTENCE_ERROR: return "persistence_error";
        case ErrorCategory::CONFIG_ERROR:      return "config_error";
        case ErrorCategory::INTERNAL_ERROR:    return "internal_error";
    }
    return "unknown";
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

    static Result error(ErrorCategory category, std::string message) {
        Result r;
        r.success_ = false;
        r.error_category_ = category;
        r.error_message_ = std::move(message);
        return r;
    }

    bool is_ok() const { return success_; }
    bool is_error() const { return !success_; }

    const T& value() const { return *value_; }
    T& value() { return *value_; }

    ErrorCategory error_category() const { return error_category_; }
    const std::string& error_message() const { return error_message_; }

private:
    bool success_ = false;
    std::optional<T> value_;
    ErrorCategory error_category_ = ErrorCategory::NONE;
    std::string error_message_;
};

// ============================================================================
// Exceptions thrown inside the layers (converted to Result at the store)
// ============================================================================

/// Ciphertext/salt mismatch, corruption, wrong key or failed authentication
class DecryptionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// OpenSSL failure while deriving a key or encrypting
class CipherError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Underlying store failure
class PersistenceError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// A row for the connection hash already exists
class UniqueViolation : public PersistenceError {
public:
    using PersistenceError::PersistenceError;
};

} // namespace credvault
