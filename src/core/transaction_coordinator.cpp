#include "core/transaction_coordinator.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include <format>

namespace ybadapter {

// ============================================================================
// Construction
// ============================================================================

TransactionCoordinator::TransactionCoordinator(StatementRunner runner)
    : runner_(std::move(runner)) {}

void TransactionCoordinator::set_on_commit(std::function<void(const CommitEvent&)> cb) {
    std::lock_guard lock(callback_mutex_);
    on_commit_ = std::move(cb);
}

// ============================================================================
// Transaction Lifecycle
// ============================================================================

Connection& TransactionCoordinator::begin(Connection& connection) {
    if (connection.transaction_open) {
        throw InternalError(std::format(
            "Tried to begin a new transaction on connection \"{}\", but "
            "it already had one open!", connection.name));
    }

    if (connection.credentials.enable_transaction) {
        // Clears a transaction the server may still consider open
        try {
            runner_(connection, "COMMIT");
        } catch (const std::exception& e) {
            defensive_commit_failures_.fetch_add(1, std::memory_order_relaxed);
            utils::log::debug(std::format(
                "On {}: ignoring failed pre-begin COMMIT: {}", connection.name, e.what()));
        }

        runner_(connection, "BEGIN");
    }

    connection.transaction_open = true;
    begins_.fetch_add(1, std::memory_order_relaxed);
    return connection;
}

Connection& TransactionCoordinator::commit(Connection& connection) {
    if (!connection.transaction_open) {
        throw InternalError(std::format(
            "Tried to commit transaction on connection \"{}\", but "
            "it does not have one open!", connection.name));
    }

    if (connection.credentials.enable_transaction) {
        utils::log::debug(std::format("On {}: COMMIT", connection.name));
        {
            std::lock_guard lock(callback_mutex_);
            if (on_commit_) {
                on_commit_(CommitEvent{connection.name, std::chrono::system_clock::now()});
            }
        }
        runner_(connection, "COMMIT");
    }

    connection.transaction_open = false;
    commits_.fetch_add(1, std::memory_order_relaxed);
    return connection;
}

void TransactionCoordinator::rollback_if_open(Connection& connection) {
    if (!connection.handle || !connection.transaction_open) {
        return;
    }

    utils::log::debug(std::format("On {}: ROLLBACK", connection.name));
    connection.handle->rollback();
    connection.transaction_open = false;
    rollbacks_.fetch_add(1, std::memory_order_relaxed);
}

// ============================================================================
// Stats
// ============================================================================

TransactionCoordinator::Stats TransactionCoordinator::get_stats() const {
    return {
        begins_.load(std::memory_order_relaxed),
        commits_.load(std::memory_order_relaxed),
        rollbacks_.load(std::memory_order_relaxed),
        defensive_commit_failures_.load(std::memory_order_relaxed)
    };
}

} // namespace ybadapter
