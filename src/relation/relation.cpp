#include "relation/relation.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include <nlohmann/json.hpp>
#include <format>

namespace ybadapter {

const char* relation_type_to_string(RelationType type) {
    switch (type) {
        case RelationType::TABLE:             return "table";
        case RelationType::VIEW:              return "view";
        case RelationType::MATERIALIZED_VIEW: return "materialized_view";
        case RelationType::CTE:               return "cte";
        case RelationType::EXTERNAL:          return "external";
    }
    return "table";
}

Relation::Relation(std::string database,
                   std::string schema,
                   std::string identifier,
                   std::optional<RelationType> type)
    : database_(std::move(database)),
      schema_(std::move(schema)),
      identifier_(std::move(identifier)),
      type_(type) {
    // Untyped relations are test/ephemeral identifiers and are not checked
    if (type_ && identifier_.size() > MAX_CHARACTERS_IN_IDENTIFIER) {
        throw RuntimeError(std::format("Relation name '{}' is longer than {} characters",
            identifier_, MAX_CHARACTERS_IN_IDENTIFIER));
    }
}

bool Relation::is_renameable() const {
    if (!type_) return false;
    return *type_ == RelationType::VIEW
        || *type_ == RelationType::TABLE
        || *type_ == RelationType::MATERIALIZED_VIEW;
}

bool Relation::is_replaceable() const {
    if (!type_) return false;
    return *type_ == RelationType::VIEW || *type_ == RelationType::TABLE;
}

std::string Relation::render() const {
    std::string out;
    for (const auto* part : {&database_, &schema_, &identifier_}) {
        if (part->empty()) continue;
        if (!out.empty()) out += '.';
        out += '"';
        out += utils::replace_all(*part, "\"", "\"\"");
        out += '"';
    }
    return out;
}

std::optional<MaterializedViewConfigChangeCollection>
Relation::get_materialized_view_config_change_collection(const RelationResults& relation_results,
                                                         const nlohmann::json& model_node) const {
    const auto existing = MaterializedViewConfig::from_relation_results(relation_results);
    const auto desired = MaterializedViewConfig::from_model_node(model_node);

    auto changes = RelationConfigDiffEngine::diff(existing, desired);
    utils::log::debug(std::format("Materialized view {}: {} index changes",
        render(), changes ? changes->indexes.size() : 0));
    return changes;
}

} // namespace ybadapter
