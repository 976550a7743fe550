#include "relation/materialized_view_config.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <format>

namespace ybadapter {

namespace {

std::string row_value(const DbResultSet& result, const std::string& column) {
    const auto it = std::find(result.column_names.begin(), result.column_names.end(), column);
    if (it == result.column_names.end()) {
        return {};
    }
    const auto idx = static_cast<size_t>(it - result.column_names.begin());
    const auto& row = result.rows.front();
    return idx < row.size() ? row[idx] : std::string{};
}

std::string json_string(const nlohmann::json& node, const char* key) {
    if (node.contains(key) && node[key].is_string()) {
        return node[key].get<std::string>();
    }
    return {};
}

} // anonymous namespace

// ============================================================================
// Snapshots
// ============================================================================

MaterializedViewConfig MaterializedViewConfig::from_relation_results(
    const RelationResults& results) {

    const auto mv = results.find("materialized_view");
    if (mv == results.end() || mv->second.rows.empty()) {
        throw RuntimeError("Relation results do not describe a materialized view");
    }

    MaterializedViewConfig config;
    config.table_name = row_value(mv->second, "table_name");
    config.schema_name = row_value(mv->second, "schema_name");
    config.database_name = row_value(mv->second, "database_name");
    config.query = utils::trim(row_value(mv->second, "query"));

    const auto indexes = results.find("indexes");
    if (indexes != results.end()) {
        for (size_t i = 0; i < indexes->second.rows.size(); ++i) {
            config.indexes.insert(IndexConfig::from_relation_result(indexes->second, i));
        }
    }

    utils::log::debug(std::format("Existing materialized view {}.{}: {} indexes",
        config.schema_name, config.table_name, config.indexes.size()));
    return config;
}

MaterializedViewConfig MaterializedViewConfig::from_model_node(const nlohmann::json& model_node) {
    if (!model_node.is_object()) {
        throw RuntimeError("Model node must be a JSON object");
    }

    MaterializedViewConfig config;
    config.table_name = json_string(model_node, "identifier");
    if (config.table_name.empty()) {
        config.table_name = json_string(model_node, "alias");
    }
    config.schema_name = json_string(model_node, "schema");
    config.database_name = json_string(model_node, "database");
    config.query = utils::trim(json_string(model_node, "compiled_code"));

    if (model_node.contains("config") && model_node["config"].is_object()) {
        const auto& node_config = model_node["config"];
        if (node_config.contains("indexes")) {
            const auto& indexes = node_config["indexes"];
            if (!indexes.is_array()) {
                throw RuntimeError("config.indexes must be an array");
            }
            for (const auto& index : indexes) {
                config.indexes.insert(IndexConfig::from_model_node(index));
            }
        }
    }
    return config;
}

// ============================================================================
// Diff
// ============================================================================

IndexConfigChangeSet RelationConfigDiffEngine::get_index_config_changes(
    const IndexConfigSet& existing, const IndexConfigSet& desired) {

    IndexConfigChangeSet changes;
    for (const auto& index : existing) {
        if (!desired.contains(index)) {
            changes.insert(IndexConfigChange{RelationConfigChangeAction::DROP, index});
        }
    }
    for (const auto& index : desired) {
        if (!existing.contains(index)) {
            changes.insert(IndexConfigChange{RelationConfigChangeAction::CREATE, index});
        }
    }
    return changes;
}

std::optional<MaterializedViewConfigChangeCollection> RelationConfigDiffEngine::diff(
    const MaterializedViewConfig& existing, const MaterializedViewConfig& desired) {

    MaterializedViewConfigChangeCollection collection;
    collection.indexes = get_index_config_changes(existing.indexes, desired.indexes);

    if (!collection.has_changes()) {
        return std::nullopt;
    }
    return collection;
}

} // namespace ybadapter
