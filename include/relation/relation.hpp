#pragma once

#include "relation/materialized_view_config.hpp"
#include <nlohmann/json_fwd.hpp>
#include <cstddef>
#include <optional>
#include <string>

namespace ybadapter {

enum class RelationType { TABLE, VIEW, MATERIALIZED_VIEW, CTE, EXTERNAL };

[[nodiscard]] const char* relation_type_to_string(RelationType type);

/**
 * @brief A named database object (database.schema.identifier)
 */
class Relation {
public:
    static constexpr size_t MAX_CHARACTERS_IN_IDENTIFIER = 63;

    /**
     * @throws RuntimeError if a typed relation's identifier exceeds
     *         MAX_CHARACTERS_IN_IDENTIFIER
     */
    Relation(std::string database,
             std::string schema,
             std::string identifier,
             std::optional<RelationType> type = std::nullopt);

    [[nodiscard]] const std::string& database() const { return database_; }
    [[nodiscard]] const std::string& schema() const { return schema_; }
    [[nodiscard]] const std::string& identifier() const { return identifier_; }
    [[nodiscard]] const std::optional<RelationType>& type() const { return type_; }

    [[nodiscard]] bool is_renameable() const;
    [[nodiscard]] bool is_replaceable() const;

    // "database"."schema"."identifier", skipping empty parts
    [[nodiscard]] std::string render() const;

    /**
     * @brief Index changes needed to bring the existing view in line with the model
     * @return nullopt when the view already matches
     */
    [[nodiscard]] std::optional<MaterializedViewConfigChangeCollection>
    get_materialized_view_config_change_collection(const RelationResults& relation_results,
                                                   const nlohmann::json& model_node) const;

private:
    std::string database_;
    std::string schema_;
    std::string identifier_;
    std::optional<RelationType> type_;
};

} // namespace ybadapter
