#pragma once

#include "core/utils.hpp"
#include "db/idb_connection.hpp"
#include <cstdint>
#include <string>

namespace ybadapter {

/**
 * @brief Normalized outcome of one statement, reported back to the framework
 *
 * message: command tag as sent by the server ("INSERT 0 3")
 * code:    the tag with numeric tokens stripped ("INSERT")
 */
struct AdapterResponse {
    std::string message;
    std::string code;
    int64_t rows_affected = -1;

    [[nodiscard]] const std::string& to_string() const { return message; }
};

[[nodiscard]] inline AdapterResponse make_adapter_response(const DbResultSet& result) {
    AdapterResponse response;
    response.message = result.status_message;
    response.rows_affected = result.affected_rows;

    for (const auto& part : utils::split_whitespace(result.status_message)) {
        if (utils::is_all_digits(part)) continue;
        if (!response.code.empty()) response.code += ' ';
        response.code += part;
    }
    return response;
}

} // namespace ybadapter
