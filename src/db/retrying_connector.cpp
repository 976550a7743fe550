#include "db/retrying_connector.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include "db/driver_result.hpp"
#include <format>
#include <thread>

namespace ybadapter {

RetryingConnector::RetryingConnector(std::shared_ptr<IConnectionFactory> factory,
                                     Sleeper sleeper)
    : factory_(std::move(factory)),
      sleeper_(std::move(sleeper)) {
    if (!sleeper_) {
        sleeper_ = [](std::chrono::seconds delay) { std::this_thread::sleep_for(delay); };
    }
}

ConnectParams RetryingConnector::build_connect_params(const Credentials& credentials) {
    ConnectParams params;
    params.set("dbname", credentials.database);
    params.set("user", credentials.user);
    params.set("host", credentials.host);
    params.set("password", credentials.password);
    params.set("port", std::to_string(credentials.port));
    params.set("connect_timeout", std::to_string(credentials.connect_timeout));

    // Passing 0 makes the server side issue an invalid setsockopt() call
    if (credentials.keepalives_idle) {
        params.set("keepalives_idle", std::to_string(credentials.keepalives_idle));
    }

    // search_path has no libpq keyword; it travels as a backend option
    if (credentials.search_path && !credentials.search_path->empty()) {
        params.set("options", std::format("-c search_path={}",
            utils::replace_all(*credentials.search_path, " ", "\\ ")));
    }

    if (credentials.sslmode && !credentials.sslmode->empty()) {
        params.set("sslmode", *credentials.sslmode);
    }
    if (credentials.sslcert) {
        params.set("sslcert", *credentials.sslcert);
    }
    if (credentials.sslkey) {
        params.set("sslkey", *credentials.sslkey);
    }
    if (credentials.sslrootcert) {
        params.set("sslrootcert", *credentials.sslrootcert);
    }
    if (credentials.application_name && !credentials.application_name->empty()) {
        params.set("application_name", *credentials.application_name);
    }

    return params;
}

Connection& RetryingConnector::open(Connection& connection) {
    if (connection.is_open()) {
        utils::log::debug("Connection is already open, skipping open.");
        return connection;
    }

    const auto& credentials = connection.credentials;
    int retry_limit = credentials.retries;
    if (retry_limit < 0) {
        mark_failed(connection);
        failures_.fetch_add(1, std::memory_order_relaxed);
        throw ConnectionError(std::format(
            "retry_limit cannot be negative, got {}", retry_limit));
    }

    const auto params = build_connect_params(credentials);

    for (int64_t attempt = 0;; ++attempt) {
        attempts_.fetch_add(1, std::memory_order_relaxed);
        try {
            auto handle = connect(params, credentials);
            const int pid = handle->backend_pid();
            connection.handle = std::move(handle);
            connection.backend_pid.store(pid);
            connection.state = ConnectionState::OPEN;
            connection.transaction_open = false;
            return connection;
        } catch (const DriverOperationalError& e) {
            if (retry_limit <= 0) {
                mark_failed(connection);
                failures_.fetch_add(1, std::memory_order_relaxed);
                throw ConnectionError(utils::trim(e.what()));
            }

            const auto delay = exponential_backoff(attempt);
            utils::log::debug(std::format(
                "Got a retryable error when attempting to open a {} connection.\n"
                "{} attempts remaining. Retrying in {} seconds.\nError:\n{}",
                Credentials::type(), retry_limit, delay, utils::trim(e.what())));

            retries_.fetch_add(1, std::memory_order_relaxed);
            sleeper_(std::chrono::seconds(delay));
            --retry_limit;
        } catch (const std::exception& e) {
            mark_failed(connection);
            failures_.fetch_add(1, std::memory_order_relaxed);
            throw ConnectionError(utils::trim(e.what()));
        }
    }
}

std::unique_ptr<IDbConnection> RetryingConnector::connect(
    const ConnectParams& params, const Credentials& credentials) {

    auto handle = factory_->create(params);
    if (!handle) {
        throw DriverOperationalError("connection factory returned no session");
    }

    // Transactions are issued explicitly by the transaction coordinator
    handle->set_autocommit(true);

    if (credentials.role && !credentials.role->empty()) {
        throw_if_failed(handle->execute(std::format("set role {}", *credentials.role)));
    }
    return handle;
}

void RetryingConnector::mark_failed(Connection& connection) {
    connection.backend_pid.store(0);
    connection.handle.reset();
    connection.state = ConnectionState::FAIL;
    connection.transaction_open = false;
}

RetryingConnector::Stats RetryingConnector::get_stats() const {
    return {
        attempts_.load(std::memory_order_relaxed),
        retries_.load(std::memory_order_relaxed),
        failures_.load(std::memory_order_relaxed)
    };
}

} // namespace ybadapter
