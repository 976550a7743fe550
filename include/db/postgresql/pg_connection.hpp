#pragma once

#include "db/idb_connection.hpp"
#include "db/iconnection_factory.hpp"
#include <libpq-fe.h>
#include <string>

namespace ybadapter {

/**
 * @brief PostgreSQL-wire session implementing IDbConnection
 *
 * Wraps PGconn* and provides the driver-agnostic interface.
 * All libpq calls are encapsulated here.
 *
 * libpq sessions are autocommit by nature; autocommit(false) is emulated by
 * sending BEGIN before a statement issued while the session is idle.
 */
class PgConnection : public IDbConnection {
public:
    /**
     * @brief Construct from existing PGconn* (takes ownership)
     */
    explicit PgConnection(PGconn* conn);

    ~PgConnection() override;

    PgConnection(const PgConnection&) = delete;
    PgConnection& operator=(const PgConnection&) = delete;

    /**
     * @throws DriverInterfaceError if the session is already closed
     */
    DbResultSet execute(const std::string& sql) override;
    int backend_pid() const override;
    void set_autocommit(bool enabled) override;
    bool autocommit() const override { return autocommit_; }
    void rollback() override;
    bool is_connected() const override;
    void close() override;

private:
    /**
     * @brief Process a SELECT result (PGRES_TUPLES_OK)
     */
    DbResultSet process_tuples_result(PGresult* res);

    /**
     * @brief Process a command result (PGRES_COMMAND_OK)
     */
    DbResultSet process_command_result(PGresult* res);

    /**
     * @brief Build a failed result from the session/last result state
     */
    DbResultSet error_result(PGresult* res) const;

    PGconn* conn_;
    bool autocommit_ = false;
};

/**
 * @brief PostgreSQL session factory
 *
 * Creates PgConnection instances using PQconnectdbParams.
 */
class PgConnectionFactory : public IConnectionFactory {
public:
    std::unique_ptr<IDbConnection> create(const ConnectParams& params) override;
};

} // namespace ybadapter
