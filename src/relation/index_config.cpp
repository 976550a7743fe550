#include "relation/index_config.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <format>
#include <string_view>

namespace ybadapter {

namespace {

inline void hash_combine(size_t& seed, size_t value) {
    seed ^= value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
}

std::optional<size_t> find_column(const DbResultSet& result, std::string_view column) {
    const auto it = std::find(result.column_names.begin(), result.column_names.end(), column);
    if (it == result.column_names.end()) {
        return std::nullopt;
    }
    return static_cast<size_t>(it - result.column_names.begin());
}

std::string cell(const DbResultSet& result, size_t row, std::string_view column, bool required) {
    const auto idx = find_column(result, column);
    if (!idx) {
        if (required) {
            throw RuntimeError(std::format("Index results are missing the '{}' column", column));
        }
        return {};
    }
    const auto& values = result.rows.at(row);
    return *idx < values.size() ? values[*idx] : std::string{};
}

std::optional<IndexMethod> method_or_throw(const std::string& raw) {
    if (raw.empty()) {
        return std::nullopt;
    }
    auto method = parse_index_method(raw);
    if (!method) {
        throw RuntimeError(std::format("Invalid index method: '{}'", raw));
    }
    return method;
}

IndexMethod resolve_method(std::optional<IndexMethod> method) {
    if (!method || *method == IndexMethod::BTREE) {
        return IndexConfig::kDefaultMethod;
    }
    return *method;
}

} // anonymous namespace

// ============================================================================
// Enums
// ============================================================================

const char* index_method_to_string(IndexMethod method) {
    switch (method) {
        case IndexMethod::BTREE:  return "btree";
        case IndexMethod::HASH:   return "hash";
        case IndexMethod::GIST:   return "gist";
        case IndexMethod::SPGIST: return "spgist";
        case IndexMethod::GIN:    return "gin";
        case IndexMethod::BRIN:   return "brin";
        case IndexMethod::LSM:    return "lsm";
    }
    return "btree";
}

std::optional<IndexMethod> parse_index_method(const std::string& name) {
    const std::string lower = utils::to_lower(utils::trim(name));
    if (lower == "btree")  return IndexMethod::BTREE;
    if (lower == "hash")   return IndexMethod::HASH;
    if (lower == "gist")   return IndexMethod::GIST;
    if (lower == "spgist") return IndexMethod::SPGIST;
    if (lower == "gin")    return IndexMethod::GIN;
    if (lower == "brin")   return IndexMethod::BRIN;
    if (lower == "lsm")    return IndexMethod::LSM;
    return std::nullopt;
}

const char* change_action_to_string(RelationConfigChangeAction action) {
    switch (action) {
        case RelationConfigChangeAction::CREATE: return "create";
        case RelationConfigChangeAction::DROP:   return "drop";
    }
    return "create";
}

// ============================================================================
// IndexConfig
// ============================================================================

IndexConfig::IndexConfig(std::vector<std::string> column_names,
                         bool unique,
                         std::optional<IndexMethod> method,
                         std::optional<std::string> predicate,
                         std::string name)
    : name_(std::move(name)),
      column_names_(std::move(column_names)),
      unique_(unique),
      method_(resolve_method(method)),
      predicate_(std::move(predicate)) {
    if (column_names_.empty()) {
        throw RuntimeError("Indexes require at least one column, but none were provided");
    }
    for (auto& column : column_names_) {
        column = utils::to_lower(column);
    }
}

IndexConfig IndexConfig::from_relation_result(const DbResultSet& indexes, size_t row) {
    std::vector<std::string> columns;
    for (auto& column : utils::split(cell(indexes, row, "column_names", true), ',')) {
        auto trimmed = utils::trim(column);
        if (!trimmed.empty()) {
            columns.push_back(std::move(trimmed));
        }
    }

    const std::string unique = utils::to_lower(utils::trim(cell(indexes, row, "unique", false)));
    const bool is_unique = unique == "t" || unique == "true";

    auto predicate = cell(indexes, row, "predicate", false);

    return IndexConfig(
        std::move(columns),
        is_unique,
        method_or_throw(cell(indexes, row, "method", false)),
        predicate.empty() ? std::nullopt : std::optional<std::string>(std::move(predicate)),
        cell(indexes, row, "name", false));
}

IndexConfig IndexConfig::from_model_node(const nlohmann::json& index) {
    if (!index.is_object()) {
        throw RuntimeError("Index config must be an object");
    }

    std::vector<std::string> columns;
    if (index.contains("columns")) {
        const auto& cols = index["columns"];
        if (!cols.is_array()) {
            throw RuntimeError("Index 'columns' must be an array of strings");
        }
        for (const auto& col : cols) {
            if (!col.is_string()) {
                throw RuntimeError("Index 'columns' must be an array of strings");
            }
            columns.push_back(col.get<std::string>());
        }
    }

    const bool unique = index.contains("unique") && index["unique"].is_boolean()
        && index["unique"].get<bool>();

    std::optional<IndexMethod> method;
    if (index.contains("type") && index["type"].is_string()) {
        method = method_or_throw(index["type"].get<std::string>());
    }

    std::optional<std::string> predicate;
    if (index.contains("where") && index["where"].is_string()) {
        predicate = index["where"].get<std::string>();
    }

    std::string name;
    if (index.contains("name") && index["name"].is_string()) {
        name = index["name"].get<std::string>();
    }

    return IndexConfig(std::move(columns), unique, method, std::move(predicate), std::move(name));
}

size_t IndexConfig::hash() const {
    size_t seed = 0;
    for (const auto& col : column_names_) {
        hash_combine(seed, std::hash<std::string>{}(col));
    }
    hash_combine(seed, std::hash<bool>{}(unique_));
    hash_combine(seed, static_cast<size_t>(method_));
    hash_combine(seed, predicate_ ? std::hash<std::string>{}(*predicate_) : 0);
    return seed;
}

std::string IndexConfig::to_string() const {
    std::string columns;
    for (size_t i = 0; i < column_names_.size(); ++i) {
        if (i > 0) columns += ", ";
        columns += column_names_[i];
    }
    std::string out = std::format("{}index ({}) using {}", unique_ ? "unique " : "", columns,
                                  index_method_to_string(method_));
    if (predicate_) {
        out += std::format(" where {}", *predicate_);
    }
    return out;
}

bool IndexConfig::operator==(const IndexConfig& other) const {
    return column_names_ == other.column_names_
        && unique_ == other.unique_
        && method_ == other.method_
        && predicate_ == other.predicate_;
}

// ============================================================================
// IndexConfigChange
// ============================================================================

size_t IndexConfigChange::hash() const {
    size_t seed = context.hash();
    hash_combine(seed, static_cast<size_t>(action));
    return seed;
}

} // namespace ybadapter
