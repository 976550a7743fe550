#pragma once

#include "core/error.hpp"
#include "db/idb_connection.hpp"
#include <string>
#include <string_view>

namespace ybadapter {

/**
 * @brief Whether a SQLSTATE denotes a connection-level (operational) failure
 *
 * Empty state (no diagnostic from the server) and classes 08 (connection
 * exception), 53 (insufficient resources), 57 (operator intervention) and
 * 58 (system error) are operational.
 */
[[nodiscard]] inline bool is_operational_sqlstate(std::string_view sqlstate) {
    if (sqlstate.size() < 2) return true;
    const auto cls = sqlstate.substr(0, 2);
    return cls == "08" || cls == "53" || cls == "57" || cls == "58";
}

/**
 * @brief Raise the driver error matching a failed result
 * @throws DriverOperationalError or DriverDatabaseError if !result.success
 */
inline void throw_if_failed(const DbResultSet& result) {
    if (result.success) return;
    if (is_operational_sqlstate(result.sqlstate)) {
        throw DriverOperationalError(result.error_message, result.sqlstate);
    }
    throw DriverDatabaseError(result.error_message, result.sqlstate);
}

} // namespace ybadapter
