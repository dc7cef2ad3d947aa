/**
 * @file exceptions.h
 * @brief Registry exception hierarchy
 *
 * Every failure surfaced by the registry core derives from RegistryException
 * and carries an ErrorCode so that transport layers can map it without
 * inspecting message text.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace common {

/**
 * @brief Error classification shared by all registry components
 */
enum class ErrorCode {
    Validation,
    NotFound,
    Conflict,
    TransactionStep,
    StorageUnavailable,
    InvalidRecordState,
    Database,
    Config,
    Issuance
};

inline const char* errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::Validation:         return "VALIDATION_ERROR";
        case ErrorCode::NotFound:           return "NOT_FOUND";
        case ErrorCode::Conflict:           return "CONFLICT";
        case ErrorCode::TransactionStep:    return "TRANSACTION_STEP_FAILED";
        case ErrorCode::StorageUnavailable: return "STORAGE_UNAVAILABLE";
        case ErrorCode::InvalidRecordState: return "INVALID_RECORD_STATE";
        case ErrorCode::Database:           return "DATABASE_ERROR";
        case ErrorCode::Config:             return "CONFIG_ERROR";
        case ErrorCode::Issuance:           return "ISSUANCE_ERROR";
    }
    return "UNKNOWN";
}

/**
 * @brief Base exception for all registry exceptions
 */
class RegistryException : public std::runtime_error {
public:
    RegistryException(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

/**
 * @brief Input rejected before any storage access
 */
class ValidationException : public RegistryException {
public:
    explicit ValidationException(const std::string& message)
        : RegistryException(ErrorCode::Validation, "Validation error: " + message) {}
};

/**
 * @brief No row matched a (scoped) lookup
 */
class NotFoundException : public RegistryException {
public:
    explicit NotFoundException(const std::string& message)
        : RegistryException(ErrorCode::NotFound, "Not found: " + message) {}
};

/**
 * @brief Unique or foreign-key constraint violation
 */
class ConflictException : public RegistryException {
public:
    explicit ConflictException(const std::string& message)
        : RegistryException(ErrorCode::Conflict, "Conflict: " + message) {}
};

/**
 * @brief A write inside a multi-step transaction affected the wrong number of rows
 */
class TransactionStepException : public RegistryException {
public:
    explicit TransactionStepException(const std::string& message)
        : RegistryException(ErrorCode::TransactionStep, "Transaction step failed: " + message) {}
};

/**
 * @brief Connection pool closed, exhausted or unreachable. Retryable by the caller.
 */
class StorageUnavailableException : public RegistryException {
public:
    explicit StorageUnavailableException(const std::string& message)
        : RegistryException(ErrorCode::StorageUnavailable, "Storage unavailable: " + message) {}
};

/**
 * @brief Persisted data violates a registry invariant (server-side bug signal)
 */
class InvalidRecordStateException : public RegistryException {
public:
    explicit InvalidRecordStateException(const std::string& message)
        : RegistryException(ErrorCode::InvalidRecordState, "Invalid record state: " + message) {}
};

/**
 * @brief Database operation failed
 */
class DatabaseException : public RegistryException {
public:
    explicit DatabaseException(const std::string& message)
        : RegistryException(ErrorCode::Database, "Database error: " + message) {}
};

/**
 * @brief Configuration error
 */
class ConfigException : public RegistryException {
public:
    explicit ConfigException(const std::string& message)
        : RegistryException(ErrorCode::Config, "Configuration error: " + message) {}
};

/**
 * @brief Certificate issuance failed (entropy source or clock)
 */
class IssuanceException : public RegistryException {
public:
    explicit IssuanceException(const std::string& message)
        : RegistryException(ErrorCode::Issuance, "Certificate issuance failed: " + message) {}
};

} // namespace common
