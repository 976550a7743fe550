#pragma once

#include "db/idb_connection.hpp"
#include <nlohmann/json_fwd.hpp>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace ybadapter {

enum class IndexMethod { BTREE, HASH, GIST, SPGIST, GIN, BRIN, LSM };

[[nodiscard]] const char* index_method_to_string(IndexMethod method);

/**
 * @brief Case-insensitive parse of an index access method name
 * @return nullopt for unknown names
 */
[[nodiscard]] std::optional<IndexMethod> parse_index_method(const std::string& name);

enum class RelationConfigChangeAction { CREATE, DROP };

[[nodiscard]] const char* change_action_to_string(RelationConfigChangeAction action);

/**
 * @brief Index definition on a materialized view
 *
 * Two configs are equal when columns, uniqueness, method and predicate match.
 * The name only reports what the catalog called the index. Column names are
 * compared lowercased. An unset method resolves to kDefaultMethod, and btree
 * resolves to lsm since YugabyteDB stores btree indexes as lsm.
 */
class IndexConfig {
public:
    static constexpr IndexMethod kDefaultMethod = IndexMethod::LSM;

    /**
     * @throws RuntimeError if column_names is empty
     */
    explicit IndexConfig(std::vector<std::string> column_names,
                         bool unique = false,
                         std::optional<IndexMethod> method = std::nullopt,
                         std::optional<std::string> predicate = std::nullopt,
                         std::string name = {});

    /**
     * @brief Build from row `row` of a catalog `indexes` result
     *
     * Columns: name, column_names (comma separated), unique, method, predicate.
     * Empty method/predicate cells mean unset.
     * @throws RuntimeError on missing columns or unknown method
     */
    static IndexConfig from_relation_result(const DbResultSet& indexes, size_t row);

    /**
     * @brief Build from one entry of a model's `config.indexes` array
     * @throws RuntimeError on malformed entries
     */
    static IndexConfig from_model_node(const nlohmann::json& index);

    [[nodiscard]] const std::string& name() const { return name_; }
    [[nodiscard]] const std::vector<std::string>& column_names() const { return column_names_; }
    [[nodiscard]] bool unique() const { return unique_; }
    [[nodiscard]] IndexMethod method() const { return method_; }
    [[nodiscard]] const std::optional<std::string>& predicate() const { return predicate_; }

    [[nodiscard]] size_t hash() const;
    [[nodiscard]] std::string to_string() const;

    bool operator==(const IndexConfig& other) const;

private:
    std::string name_;
    std::vector<std::string> column_names_;
    bool unique_ = false;
    IndexMethod method_ = kDefaultMethod;
    std::optional<std::string> predicate_;
};

/**
 * @brief One index action produced when altering a materialized view
 */
struct IndexConfigChange {
    RelationConfigChangeAction action;
    IndexConfig context;

    // Index changes are applied in place
    [[nodiscard]] bool requires_full_refresh() const { return false; }

    [[nodiscard]] size_t hash() const;

    bool operator==(const IndexConfigChange& other) const {
        return action == other.action && context == other.context;
    }
};

} // namespace ybadapter

template<>
struct std::hash<ybadapter::IndexConfig> {
    size_t operator()(const ybadapter::IndexConfig& config) const noexcept {
        return config.hash();
    }
};

template<>
struct std::hash<ybadapter::IndexConfigChange> {
    size_t operator()(const ybadapter::IndexConfigChange& change) const noexcept {
        return change.hash();
    }
};
