#pragma once

#include <optional>
#include <string>

namespace ybadapter {

/**
 * @brief Column metadata as read from the catalog
 */
struct Column {
    std::string name;
    std::string dtype;
    std::optional<int> char_size;
    std::optional<int> numeric_precision;
    std::optional<int> numeric_scale;

    [[nodiscard]] bool is_string() const;
    [[nodiscard]] bool is_numeric() const;

    // char_size, or 256 for unsized string types
    [[nodiscard]] int string_size() const;

    /**
     * @brief Type as rendered in DDL
     *
     * `text` and unsized `character varying` are kept as-is.
     */
    [[nodiscard]] std::string data_type() const;
};

} // namespace ybadapter
