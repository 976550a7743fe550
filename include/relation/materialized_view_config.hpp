#pragma once

#include "db/idb_connection.hpp"
#include "relation/index_config.hpp"
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace ybadapter {

/**
 * @brief Catalog query results keyed by what they describe
 *
 * Expected keys: "materialized_view" (one row: table_name, schema_name,
 * database_name, query) and optionally "indexes".
 */
using RelationResults = std::unordered_map<std::string, DbResultSet>;

using IndexConfigSet = std::unordered_set<IndexConfig>;
using IndexConfigChangeSet = std::unordered_set<IndexConfigChange>;

struct MaterializedViewConfig {
    std::string table_name;
    std::string schema_name;
    std::string database_name;
    std::string query;
    IndexConfigSet indexes;

    /**
     * @brief Snapshot of what the database currently has
     * @throws RuntimeError if the materialized_view result is missing or empty
     */
    static MaterializedViewConfig from_relation_results(const RelationResults& results);

    /**
     * @brief Snapshot of what the model asks for
     * @throws RuntimeError on malformed index entries
     */
    static MaterializedViewConfig from_model_node(const nlohmann::json& model_node);
};

struct MaterializedViewConfigChangeCollection {
    IndexConfigChangeSet indexes;

    [[nodiscard]] bool has_changes() const { return !indexes.empty(); }

    [[nodiscard]] bool requires_full_refresh() const {
        for (const auto& change : indexes) {
            if (change.requires_full_refresh()) return true;
        }
        return false;
    }
};

/**
 * @brief Computes the index changes that turn one snapshot into another
 *
 * Structural set difference in both directions: an index whose properties
 * changed shows up as a drop of the old one plus a create of the new one.
 */
class RelationConfigDiffEngine {
public:
    [[nodiscard]] static IndexConfigChangeSet get_index_config_changes(
        const IndexConfigSet& existing, const IndexConfigSet& desired);

    /**
     * @return nullopt when nothing changed
     */
    [[nodiscard]] static std::optional<MaterializedViewConfigChangeCollection> diff(
        const MaterializedViewConfig& existing, const MaterializedViewConfig& desired);
};

} // namespace ybadapter
