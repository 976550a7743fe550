#pragma once

#include "config/config_types.hpp"
#include "db/idb_connection.hpp"
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace ybadapter {

enum class ConnectionState : uint8_t {
    INIT,
    OPEN,
    CLOSED,
    FAIL
};

[[nodiscard]] inline const char* connection_state_to_string(ConnectionState s) {
    switch (s) {
        case ConnectionState::INIT:   return "init";
        case ConnectionState::OPEN:   return "open";
        case ConnectionState::CLOSED: return "closed";
        case ConnectionState::FAIL:   return "fail";
        default:                      return "unknown";
    }
}

/**
 * @brief One logical connection owned by one worker thread
 *
 * Invariants:
 * - transaction_open implies state == OPEN
 * - handle is non-null only while state == OPEN
 * - backend_pid is non-zero only while handle is open
 *
 * Only the owning thread touches handle, state and transaction_open. Other
 * threads may read backend_pid and name_snapshot(); the owner renames
 * through rename().
 */
struct Connection {
    std::string name;
    ConnectionState state = ConnectionState::INIT;
    bool transaction_open = false;
    Credentials credentials;
    std::unique_ptr<IDbConnection> handle;
    std::atomic<int> backend_pid{0};

    Connection() = default;
    Connection(std::string conn_name, Credentials creds)
        : name(std::move(conn_name)), credentials(std::move(creds)) {}

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    [[nodiscard]] bool is_open() const { return state == ConnectionState::OPEN; }

    [[nodiscard]] std::string name_snapshot() const {
        std::lock_guard<std::mutex> lock(name_mutex_);
        return name;
    }

    void rename(std::string new_name) {
        std::lock_guard<std::mutex> lock(name_mutex_);
        name = std::move(new_name);
    }

private:
    mutable std::mutex name_mutex_;
};

} // namespace ybadapter
