#pragma once

#include <cstdint>
#include <string>

namespace ybadapter {

/**
 * @brief PostgreSQL type mapping utilities
 *
 * Maps the built-in type OIDs reported in result descriptions to their
 * pg_type.typname.
 */
class PgTypeMap {
public:
    /**
     * @brief Map an OID to its canonical type name
     * @return typname, or empty string if unknown
     */
    [[nodiscard]] static std::string oid_to_type_name(uint32_t oid);
};

} // namespace ybadapter
