#include "core/connection_manager.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include "db/driver_result.hpp"
#include "db/postgresql/pg_type_map.hpp"
#include <format>
#include <sstream>

namespace ybadapter {

// ============================================================================
// Construction / Destruction
// ============================================================================

ConnectionManager::ConnectionManager(Credentials credentials,
                                     std::shared_ptr<IConnectionFactory> factory,
                                     RetryingConnector::Sleeper sleeper)
    : credentials_(std::move(credentials)),
      connector_(std::move(factory), std::move(sleeper)),
      transactions_([this](Connection& connection, const std::string& sql) {
          (void)query_on(connection, sql, false);
      }),
      translator_([this] { rollback_if_open(); }) {}

ConnectionManager::~ConnectionManager() {
    cleanup_all();
}

// ============================================================================
// Thread Connection Registry
// ============================================================================

Connection* ConnectionManager::get_if_exists() {
    std::shared_lock lock(registry_mutex_);
    const auto it = thread_connections_.find(std::this_thread::get_id());
    return it != thread_connections_.end() ? it->second.get() : nullptr;
}

Connection& ConnectionManager::get_thread_connection() {
    std::shared_lock lock(registry_mutex_);
    const auto it = thread_connections_.find(std::this_thread::get_id());
    if (it == thread_connections_.end()) {
        std::ostringstream id;
        id << std::this_thread::get_id();
        throw InternalError(std::format(
            "connection never acquired for thread {}, have {} connections",
            id.str(), thread_connections_.size()));
    }
    return *it->second;
}

Connection& ConnectionManager::set_connection_name(const std::string& name) {
    const std::string conn_name = name.empty() ? kDefaultConnectionName : name;

    Connection* conn = get_if_exists();
    if (!conn) {
        auto created = std::make_unique<Connection>(conn_name, credentials_);
        conn = created.get();
        {
            std::unique_lock lock(registry_mutex_);
            thread_connections_[std::this_thread::get_id()] = std::move(created);
        }
        utils::log::debug(std::format("Acquiring new {} connection '{}'",
            Credentials::type(), conn_name));
        return *conn;
    }

    if (conn->name == conn_name && conn->is_open()) {
        return *conn;
    }

    if (conn->is_open()) {
        utils::log::debug(std::format(
            "Re-using an available connection from the pool (formerly {}, now {})",
            conn->name, conn_name));
    } else {
        utils::log::debug(std::format("Acquiring new {} connection '{}'",
            Credentials::type(), conn_name));
    }

    conn->rename(conn_name);
    return *conn;
}

void ConnectionManager::release() {
    Connection* conn = get_if_exists();
    if (!conn) return;
    close(*conn);
}

void ConnectionManager::cleanup_all() {
    std::unique_lock lock(registry_mutex_);
    for (auto& [_, conn] : thread_connections_) {
        if (conn->state != ConnectionState::CLOSED) {
            utils::log::debug(std::format("Connection '{}' was left open.", conn->name));
        } else {
            utils::log::debug(std::format("Connection '{}' was properly closed.", conn->name));
        }
        close(*conn);
    }
    thread_connections_.clear();
}

// ============================================================================
// Connection Lifecycle
// ============================================================================

Connection& ConnectionManager::open(Connection& connection) {
    return connector_.open(connection);
}

void ConnectionManager::close(Connection& connection) {
    if (connection.state == ConnectionState::CLOSED ||
        connection.state == ConnectionState::INIT) {
        return;
    }

    if (connection.transaction_open && connection.handle) {
        utils::log::debug(std::format("On {}: ROLLBACK", connection.name));
        try {
            connection.handle->rollback();
        } catch (const DriverError& e) {
            utils::log::debug(std::format("Failed to rollback '{}': {}",
                connection.name, utils::trim(e.what())));
        }
    }
    connection.transaction_open = false;

    connection.backend_pid.store(0);
    if (connection.handle) {
        connection.handle->close();
        connection.handle.reset();
    }
    connection.state = ConnectionState::CLOSED;
    utils::log::debug(std::format("On {}: Close", connection.name));
}

// ============================================================================
// Transactions
// ============================================================================

Connection& ConnectionManager::begin() {
    auto& connection = get_thread_connection();
    if (!connection.is_open()) {
        open(connection);
    }
    return transactions_.begin(connection);
}

Connection& ConnectionManager::commit() {
    return transactions_.commit(get_thread_connection());
}

void ConnectionManager::commit_if_has_connection() {
    if (Connection* conn = get_if_exists()) {
        transactions_.commit(*conn);
    }
}

void ConnectionManager::rollback_if_open() {
    if (Connection* conn = get_if_exists()) {
        transactions_.rollback_if_open(*conn);
    }
}

// ============================================================================
// Statements
// ============================================================================

DbResultSet ConnectionManager::run_statement(Connection& connection, const std::string& sql) {
    if (!connection.is_open()) {
        open(connection);
    }
    if (!connection.handle) {
        throw DriverInterfaceError("connection already closed");
    }

    utils::log::debug(std::format("On {}: {}", connection.name, sql));
    utils::Timer timer;

    auto result = connection.handle->execute(sql);
    throw_if_failed(result);

    const auto elapsed = timer.elapsed<std::chrono::duration<double>>();
    utils::log::debug(std::format("SQL status: {} in {:.3f} seconds",
        get_response(result).to_string(), elapsed.count()));
    return result;
}

DbResultSet ConnectionManager::query_on(Connection& connection,
                                        const std::string& sql,
                                        bool auto_begin) {
    if (auto_begin && !connection.transaction_open) {
        if (!connection.is_open()) {
            open(connection);
        }
        transactions_.begin(connection);
    }

    return translator_.run(sql, [&] { return run_statement(connection, sql); });
}

std::pair<Connection*, DbResultSet> ConnectionManager::add_query(const std::string& sql,
                                                                 bool auto_begin) {
    auto& connection = get_thread_connection();
    auto result = query_on(connection, sql, auto_begin);
    return {&connection, std::move(result)};
}

std::pair<AdapterResponse, DbResultSet> ConnectionManager::execute(
    const std::string& sql, bool auto_begin, bool fetch, std::optional<size_t> limit) {

    auto [_, result] = add_query(sql, auto_begin);
    auto response = get_response(result);

    DbResultSet table;
    table.success = true;
    if (fetch) {
        table = std::move(result);
        if (limit && table.rows.size() > *limit) {
            table.rows.resize(*limit);
        }
    }
    return {std::move(response), std::move(table)};
}

// ============================================================================
// Cancellation
// ============================================================================

void ConnectionManager::cancel(const Connection& connection) {
    const std::string connection_name = connection.name_snapshot();
    const int pid = connection.backend_pid.load();
    if (pid == 0) {
        utils::log::debug(std::format("Connection {} was already closed", connection_name));
        return;
    }
    terminate_backend(connection_name, pid);
}

std::vector<std::string> ConnectionManager::cancel_open() {
    Connection* self = get_if_exists();

    std::vector<std::pair<std::string, int>> targets;
    {
        std::shared_lock lock(registry_mutex_);
        for (const auto& [_, conn] : thread_connections_) {
            if (conn.get() == self) continue;
            const int pid = conn->backend_pid.load();
            if (pid != 0) {
                targets.emplace_back(conn->name_snapshot(), pid);
            }
        }
    }

    std::vector<std::string> names;
    names.reserve(targets.size());
    for (auto& [name, pid] : targets) {
        terminate_backend(name, pid);
        names.push_back(std::move(name));
    }
    return names;
}

void ConnectionManager::terminate_backend(const std::string& connection_name, int pid) {
    // Termination is not fully supported by the target database yet; the
    // request is sent anyway and any failure is dropped.
    try {
        const std::string sql = std::format("select pg_terminate_backend({})", pid);
        utils::log::debug(std::format("Cancelling query '{}' ({})", connection_name, pid));

        auto [_, result] = add_query(sql);
        const std::string outcome = (!result.rows.empty() && !result.rows.front().empty())
            ? result.rows.front().front() : "None";
        utils::log::debug(std::format("Cancel query '{}': {}", connection_name, outcome));
    } catch (const std::exception& e) {
        utils::log::debug(std::format("Cancel query '{}' failed: {}",
            connection_name, utils::trim(e.what())));
    }
}

// ============================================================================
// Reporting
// ============================================================================

AdapterResponse ConnectionManager::get_response(const DbResultSet& result) {
    return make_adapter_response(result);
}

std::string ConnectionManager::data_type_code_to_name(uint32_t type_code) {
    auto name = PgTypeMap::oid_to_type_name(type_code);
    if (!name.empty()) {
        return name;
    }
    return std::format("unknown type_code {}", type_code);
}

} // namespace ybadapter
