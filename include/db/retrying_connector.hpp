#pragma once

#include "db/connection.hpp"
#include "db/iconnection_factory.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>

namespace ybadapter {

/**
 * @brief Opens connections with bounded retries on transient failures
 *
 * Only DriverOperationalError is retried. Any other failure, or running out
 * of the credentials' retry budget, marks the connection FAIL and raises
 * ConnectionError.
 *
 * Backoff after failed attempt n (0-based) is n*n seconds, so the first
 * retry is immediate.
 */
class RetryingConnector {
public:
    using Sleeper = std::function<void(std::chrono::seconds)>;

    struct Stats {
        uint64_t attempts = 0;
        uint64_t retries = 0;
        uint64_t failures = 0;
    };

    /**
     * @param factory Session factory (PgConnectionFactory in production)
     * @param sleeper Backoff wait; defaults to std::this_thread::sleep_for
     */
    explicit RetryingConnector(std::shared_ptr<IConnectionFactory> factory,
                               Sleeper sleeper = nullptr);

    /**
     * @brief Open the connection if it is not open yet
     * @return The same connection, now OPEN
     * @throws ConnectionError on non-retryable failure or exhausted budget
     */
    Connection& open(Connection& connection);

    /**
     * @brief Session options derived from credentials
     *
     * keepalives_idle is only present when non-zero; search_path goes into
     * `options` as "-c search_path=..." with spaces escaped.
     */
    [[nodiscard]] static ConnectParams build_connect_params(const Credentials& credentials);

    [[nodiscard]] static constexpr int64_t exponential_backoff(int64_t attempt) {
        return attempt * attempt;
    }

    [[nodiscard]] Stats get_stats() const;

private:
    std::unique_ptr<IDbConnection> connect(const ConnectParams& params,
                                           const Credentials& credentials);

    static void mark_failed(Connection& connection);

    std::shared_ptr<IConnectionFactory> factory_;
    Sleeper sleeper_;

    std::atomic<uint64_t> attempts_{0};
    std::atomic<uint64_t> retries_{0};
    std::atomic<uint64_t> failures_{0};
};

} // namespace ybadapter
