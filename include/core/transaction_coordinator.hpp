#pragma once

#include "db/connection.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>

namespace ybadapter {

/**
 * @brief Per-connection transaction state machine
 *
 * States: no-transaction <-> transaction-open, tracked by
 * Connection::transaction_open.
 *
 * - begin():  no-transaction -> transaction-open. Misuse is InternalError.
 * - commit(): transaction-open -> no-transaction. Misuse is InternalError.
 *
 * With enable_transaction off the state still moves but no BEGIN/COMMIT is
 * sent. With it on, begin() first sends a best-effort COMMIT: the target
 * database can report a transaction as still in progress on a session that
 * has none logically open, and the extra COMMIT clears it. Failures of that
 * COMMIT are dropped.
 */
class TransactionCoordinator {
public:
    using StatementRunner = std::function<void(Connection&, const std::string&)>;

    struct CommitEvent {
        std::string connection_name;
        std::chrono::system_clock::time_point timestamp;
    };

    struct Stats {
        uint64_t begins = 0;
        uint64_t commits = 0;
        uint64_t rollbacks = 0;
        uint64_t defensive_commit_failures = 0;
    };

    /**
     * @param runner Issues one statement on the connection (adapter errors
     *               propagate from it)
     */
    explicit TransactionCoordinator(StatementRunner runner);

    Connection& begin(Connection& connection);
    Connection& commit(Connection& connection);

    /**
     * @brief Roll back the session if it holds a transaction
     *
     * No-op unless the connection has a handle and transaction_open is set.
     * @throws DriverError if the driver-level rollback fails
     */
    void rollback_if_open(Connection& connection);

    /**
     * @brief Register callback fired before each COMMIT is sent by commit()
     */
    void set_on_commit(std::function<void(const CommitEvent&)> cb);

    [[nodiscard]] Stats get_stats() const;

private:
    StatementRunner runner_;

    std::function<void(const CommitEvent&)> on_commit_;
    mutable std::mutex callback_mutex_;

    std::atomic<uint64_t> begins_{0};
    std::atomic<uint64_t> commits_{0};
    std::atomic<uint64_t> rollbacks_{0};
    std::atomic<uint64_t> defensive_commit_failures_{0};
};

} // namespace ybadapter
