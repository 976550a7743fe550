#include "db/postgresql/pg_connection.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include "db/driver_result.hpp"
#include <cstring>
#include <format>
#include <vector>

namespace ybadapter {

// ============================================================================
// PgConnection
// ============================================================================

PgConnection::PgConnection(PGconn* conn)
    : conn_(conn) {}

PgConnection::~PgConnection() {
    close();
}

DbResultSet PgConnection::execute(const std::string& sql) {
    if (!conn_) {
        throw DriverInterfaceError("connection already closed");
    }

    if (!autocommit_ && PQtransactionStatus(conn_) == PQTRANS_IDLE) {
        PGresult* begin = PQexec(conn_, "BEGIN");
        if (!begin || PQresultStatus(begin) != PGRES_COMMAND_OK) {
            auto result = error_result(begin);
            if (begin) PQclear(begin);
            return result;
        }
        PQclear(begin);
    }

    PGresult* res = PQexec(conn_, sql.c_str());

    if (!res) {
        return error_result(nullptr);
    }

    ExecStatusType status = PQresultStatus(res);

    if (status == PGRES_TUPLES_OK) {
        auto result = process_tuples_result(res);
        PQclear(res);
        return result;
    }

    if (status == PGRES_COMMAND_OK || status == PGRES_EMPTY_QUERY) {
        auto result = process_command_result(res);
        PQclear(res);
        return result;
    }

    // Error case
    auto result = error_result(res);
    PQclear(res);
    return result;
}

int PgConnection::backend_pid() const {
    if (!conn_ || PQstatus(conn_) == CONNECTION_BAD) {
        throw DriverInterfaceError("connection already closed");
    }
    return PQbackendPID(conn_);
}

void PgConnection::set_autocommit(bool enabled) {
    autocommit_ = enabled;
}

void PgConnection::rollback() {
    if (!conn_) {
        throw DriverInterfaceError("connection already closed");
    }

    if (PQtransactionStatus(conn_) == PQTRANS_IDLE) {
        return;
    }

    PGresult* res = PQexec(conn_, "ROLLBACK");
    if (!res || PQresultStatus(res) != PGRES_COMMAND_OK) {
        const auto failed = error_result(res);
        if (res) PQclear(res);
        throw_if_failed(failed);
    }
    PQclear(res);
}

bool PgConnection::is_connected() const {
    return conn_ != nullptr && PQstatus(conn_) == CONNECTION_OK;
}

void PgConnection::close() {
    if (conn_) {
        PQfinish(conn_);
        conn_ = nullptr;
    }
}

DbResultSet PgConnection::process_tuples_result(PGresult* res) {
    DbResultSet result;
    result.success = true;
    result.has_rows = true;
    result.status_message = PQcmdStatus(res);

    int ncols = PQnfields(res);
    for (int i = 0; i < ncols; i++) {
        result.column_names.push_back(PQfname(res, i));
        result.column_type_oids.push_back(static_cast<uint32_t>(PQftype(res, i)));
    }

    int nrows = PQntuples(res);
    result.rows.reserve(nrows);

    for (int i = 0; i < nrows; i++) {
        std::vector<std::string> row;
        row.reserve(ncols);
        for (int j = 0; j < ncols; j++) {
            const char* val = PQgetvalue(res, i, j);
            row.push_back(val ? val : "");
        }
        result.rows.push_back(std::move(row));
    }
    result.affected_rows = nrows;

    return result;
}

DbResultSet PgConnection::process_command_result(PGresult* res) {
    DbResultSet result;
    result.success = true;
    result.has_rows = false;
    result.status_message = PQcmdStatus(res);

    const char* affected = PQcmdTuples(res);
    if (affected && std::strlen(affected) > 0) {
        result.affected_rows = std::stoll(affected);
    }

    return result;
}

DbResultSet PgConnection::error_result(PGresult* res) const {
    DbResultSet result;
    result.success = false;
    if (res) {
        const char* msg = PQresultErrorMessage(res);
        result.error_message = (msg && *msg) ? msg : PQerrorMessage(conn_);
        const char* state = PQresultErrorField(res, PG_DIAG_SQLSTATE);
        if (state) result.sqlstate = state;
    } else {
        result.error_message = PQerrorMessage(conn_);
    }
    return result;
}

// ============================================================================
// PgConnectionFactory
// ============================================================================

std::unique_ptr<IDbConnection> PgConnectionFactory::create(
    const ConnectParams& params) {

    std::vector<const char*> keywords;
    std::vector<const char*> values;
    keywords.reserve(params.entries.size() + 1);
    values.reserve(params.entries.size() + 1);
    for (const auto& [key, value] : params.entries) {
        keywords.push_back(key.c_str());
        values.push_back(value.c_str());
    }
    keywords.push_back(nullptr);
    values.push_back(nullptr);

    PGconn* conn = PQconnectdbParams(keywords.data(), values.data(), 0);

    if (!conn) {
        throw DriverOperationalError("Failed to allocate PGconn");
    }

    if (PQstatus(conn) != CONNECTION_OK) {
        std::string message = PQerrorMessage(conn);
        PQfinish(conn);
        utils::log::debug(std::format("Failed to connect: {}", utils::trim(message)));
        throw DriverOperationalError(message);
    }

    return std::make_unique<PgConnection>(conn);
}

} // namespace ybadapter
