#pragma once

#include <stdexcept>
#include <string>

namespace ybadapter {

// ============================================================================
// Adapter error taxonomy (what callers of the adapter see)
// ============================================================================

/**
 * @brief Base of every error the adapter raises to its callers
 */
class AdapterError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Opening a connection failed or the retry budget ran out
 */
class ConnectionError : public AdapterError {
public:
    using AdapterError::AdapterError;
};

/**
 * @brief Caller misused the transaction state machine (programming error)
 */
class InternalError : public AdapterError {
public:
    using AdapterError::AdapterError;
};

/**
 * @brief Failure while executing work on a connection
 *
 * Errors of this kind (and subclasses) already carry diagnostic context and
 * pass through the exception translator unmodified.
 */
class RuntimeError : public AdapterError {
public:
    using AdapterError::AdapterError;
};

/**
 * @brief Server-reported failure during a statement
 *
 * Message is the server text with surrounding whitespace trimmed.
 */
class DatabaseError : public RuntimeError {
public:
    using RuntimeError::RuntimeError;
};

// ============================================================================
// Driver error taxonomy (raised by the connection handle layer)
// ============================================================================

/**
 * @brief Base of every error raised by the driver layer
 */
class DriverError : public std::runtime_error {
public:
    explicit DriverError(const std::string& message, std::string sqlstate = {})
        : std::runtime_error(message), sqlstate_(std::move(sqlstate)) {}

    /**
     * @brief Five-character SQLSTATE, empty when the server supplied none
     */
    [[nodiscard]] const std::string& sqlstate() const { return sqlstate_; }

private:
    std::string sqlstate_;
};

/**
 * @brief Client-side misuse of the handle (e.g. connection already closed)
 */
class DriverInterfaceError : public DriverError {
public:
    using DriverError::DriverError;
};

/**
 * @brief Error reported by, or while talking to, the database
 */
class DriverDatabaseError : public DriverError {
public:
    using DriverError::DriverError;
};

/**
 * @brief Connection-level failure (refused, timed out, server gone)
 *
 * Usually carries no SQLSTATE. This is the only class the connector retries.
 */
class DriverOperationalError : public DriverDatabaseError {
public:
    using DriverDatabaseError::DriverDatabaseError;
};

} // namespace ybadapter
