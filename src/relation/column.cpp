#include "relation/column.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include <format>

namespace ybadapter {

bool Column::is_string() const {
    const std::string lower = utils::to_lower(dtype);
    return lower == "text" || lower == "character varying"
        || lower == "character" || lower == "varchar";
}

bool Column::is_numeric() const {
    const std::string lower = utils::to_lower(dtype);
    return lower == "numeric" || lower == "decimal";
}

int Column::string_size() const {
    if (!is_string()) {
        throw RuntimeError(std::format("Called string_size() on non-string field '{}'", name));
    }
    return char_size.value_or(256);
}

std::string Column::data_type() const {
    const std::string lower = utils::to_lower(dtype);
    if (lower == "text" || (lower == "character varying" && !char_size)) {
        return dtype;
    }
    if (is_string()) {
        return std::format("character varying({})", string_size());
    }
    if (is_numeric()) {
        if (!numeric_precision || !numeric_scale) {
            return dtype;
        }
        return std::format("{}({},{})", dtype, *numeric_precision, *numeric_scale);
    }
    return dtype;
}

} // namespace ybadapter
