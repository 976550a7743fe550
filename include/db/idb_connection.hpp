#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace ybadapter {

/**
 * @brief Result set from a statement execution
 *
 * Returned by IDbConnection::execute().
 * Owns the result data (copied from native result handles).
 */
struct DbResultSet {
    bool success = false;
    std::string error_message;
    std::string sqlstate;           // PG_DIAG_SQLSTATE, empty if none

    // Command tag, e.g. "INSERT 0 3", "SELECT 2", "BEGIN"
    std::string status_message;

    // For SELECT
    std::vector<std::string> column_names;
    std::vector<uint32_t> column_type_oids;
    std::vector<std::vector<std::string>> rows;

    // -1 when the command reports no row count
    int64_t affected_rows = -1;

    // SELECT vs DML/DDL
    bool has_rows = false;
};

/**
 * @brief Abstract database session (one physical connection)
 *
 * Wraps a single native connection handle (PGconn*).
 * Implementations are not thread-safe; each worker owns its own session.
 *
 * Does NOT expose native handles to prevent leaking driver types.
 */
class IDbConnection {
public:
    virtual ~IDbConnection() = default;

    /**
     * @brief Execute a SQL statement
     * @param sql SQL text
     * @return Result set with rows, command tag and affected count.
     *         Failures are reported through success/error_message/sqlstate.
     */
    [[nodiscard]] virtual DbResultSet execute(const std::string& sql) = 0;

    /**
     * @brief Server-side process id of this session
     * @throws DriverInterfaceError ("connection already closed") if closed
     */
    [[nodiscard]] virtual int backend_pid() const = 0;

    /**
     * @brief Switch session autocommit mode
     *
     * With autocommit off the handle opens a transaction implicitly before
     * the first statement executed outside one.
     */
    virtual void set_autocommit(bool enabled) = 0;

    [[nodiscard]] virtual bool autocommit() const = 0;

    /**
     * @brief Roll back the session's current transaction, if any
     * @throws DriverError on failure
     */
    virtual void rollback() = 0;

    /**
     * @brief Check if connection is in a valid state (connected)
     */
    [[nodiscard]] virtual bool is_connected() const = 0;

    /**
     * @brief Close the connection and release resources
     */
    virtual void close() = 0;
};

} // namespace ybadapter
