#pragma once

#include "db/idb_connection.hpp"
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace ybadapter {

/**
 * @brief Ordered libpq keyword/value session options
 *
 * Kept as a vector so the order handed to the driver is deterministic.
 */
struct ConnectParams {
    std::vector<std::pair<std::string, std::string>> entries;

    void set(std::string key, std::string value) {
        for (auto& [k, v] : entries) {
            if (k == key) {
                v = std::move(value);
                return;
            }
        }
        entries.emplace_back(std::move(key), std::move(value));
    }

    [[nodiscard]] bool contains(const std::string& key) const {
        for (const auto& [k, _] : entries) {
            if (k == key) return true;
        }
        return false;
    }

    [[nodiscard]] const std::string* find(const std::string& key) const {
        for (const auto& [k, v] : entries) {
            if (k == key) return &v;
        }
        return nullptr;
    }
};

/**
 * @brief Abstract factory for creating database sessions
 *
 * The PostgreSQL factory wraps PQconnectdbParams; tests substitute mocks.
 */
class IConnectionFactory {
public:
    virtual ~IConnectionFactory() = default;

    /**
     * @brief Establish a new database session
     * @param params Session options
     * @return Connected session (never nullptr)
     * @throws DriverOperationalError when the server cannot be reached
     */
    [[nodiscard]] virtual std::unique_ptr<IDbConnection> create(
        const ConnectParams& params) = 0;
};

} // namespace ybadapter
