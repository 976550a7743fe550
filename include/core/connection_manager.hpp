#pragma once

#include "core/adapter_response.hpp"
#include "core/exception_translator.hpp"
#include "core/transaction_coordinator.hpp"
#include "db/connection.hpp"
#include "db/retrying_connector.hpp"
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

namespace ybadapter {

/**
 * @brief Per-thread connection registry for one target
 *
 * Each worker thread owns exactly one Connection, created by
 * set_connection_name() and opened lazily on first statement through the
 * RetryingConnector. Statements go through the ExceptionTranslator; begin/
 * commit go through the TransactionCoordinator.
 *
 * Thread-safety: the registry is guarded by a mutex. A Connection is only
 * used by its owning thread, except that cancel() and cancel_open() read
 * another thread's recorded backend pid and a copy of its name.
 */
class ConnectionManager {
public:
    static constexpr const char* kDefaultConnectionName = "master";

    /**
     * @param credentials Validated target credentials
     * @param factory Session factory
     * @param sleeper Retry backoff wait (tests pass a recorder)
     */
    ConnectionManager(Credentials credentials,
                      std::shared_ptr<IConnectionFactory> factory,
                      RetryingConnector::Sleeper sleeper = nullptr);

    ~ConnectionManager();

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    // ---- Thread connection registry ---------------------------------------

    /**
     * @brief Create (or rename) the calling thread's connection
     *
     * Does not open it; the first statement does.
     */
    Connection& set_connection_name(const std::string& name = kDefaultConnectionName);

    /**
     * @throws InternalError if the calling thread has no connection
     */
    [[nodiscard]] Connection& get_thread_connection();

    [[nodiscard]] Connection* get_if_exists();

    /**
     * @brief Close the calling thread's connection
     *
     * The entry stays registered; the next statement reopens it.
     */
    void release();

    /**
     * @brief Close every registered connection and clear the registry
     */
    void cleanup_all();

    // ---- Connection lifecycle ---------------------------------------------

    Connection& open(Connection& connection);

    /**
     * @brief Close a connection, rolling back an open transaction first
     */
    static void close(Connection& connection);

    // ---- Transactions -----------------------------------------------------

    Connection& begin();
    Connection& commit();
    void commit_if_has_connection();

    /**
     * @brief Roll back the calling thread's connection if it holds a transaction
     */
    void rollback_if_open();

    // ---- Statements -------------------------------------------------------

    /**
     * @brief Run one statement on the calling thread's connection
     * @param auto_begin Begin a transaction first if none is open
     * @return The connection used and the raw result
     * @throws DatabaseError, ConnectionError, RuntimeError, InternalError
     */
    std::pair<Connection*, DbResultSet> add_query(const std::string& sql,
                                                 bool auto_begin = true);

    /**
     * @brief Run a statement and report a normalized response
     * @param fetch Keep result rows (otherwise the returned table is empty)
     * @param limit Max rows kept when fetching
     */
    std::pair<AdapterResponse, DbResultSet> execute(
        const std::string& sql,
        bool auto_begin = false,
        bool fetch = false,
        std::optional<size_t> limit = std::nullopt);

    // ---- Cancellation -----------------------------------------------------

    /**
     * @brief Ask the server to terminate the backend serving `connection`
     *
     * Advisory: a connection with no recorded backend pid is a no-op and
     * every failure of the termination request itself is dropped. The
     * request runs on the caller's own connection.
     */
    void cancel(const Connection& connection);

    /**
     * @brief Cancel all open connections except the caller's
     * @return Names of the cancelled connections
     */
    std::vector<std::string> cancel_open();

    // ---- Reporting --------------------------------------------------------

    [[nodiscard]] static AdapterResponse get_response(const DbResultSet& result);
    [[nodiscard]] static std::string data_type_code_to_name(uint32_t type_code);

    [[nodiscard]] TransactionCoordinator& transactions() { return transactions_; }
    [[nodiscard]] const RetryingConnector& connector() const { return connector_; }
    [[nodiscard]] const Credentials& credentials() const { return credentials_; }

private:
    DbResultSet run_statement(Connection& connection, const std::string& sql);
    DbResultSet query_on(Connection& connection, const std::string& sql, bool auto_begin);
    void terminate_backend(const std::string& connection_name, int pid);

    Credentials credentials_;
    RetryingConnector connector_;
    TransactionCoordinator transactions_;
    ExceptionTranslator translator_;

    std::unordered_map<std::thread::id, std::unique_ptr<Connection>> thread_connections_;
    mutable std::shared_mutex registry_mutex_;
};

} // namespace ybadapter
