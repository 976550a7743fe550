#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <cstdlib>
#include <format>
#include <iterator>
#include <limits>
#include <stdexcept>
#include <unordered_set>

using namespace std::string_literals;

namespace ybadapter {

// ============================================================================
// TOML Parsing Helpers (env expansion)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_in_array(toml::array& arr);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        } else if (val.is_array()) {
            expand_env_vars_in_array(*val.as_array());
        }
    }
}

void expand_env_vars_in_array(toml::array& arr) {
    for (auto& elem : arr) {
        if (elem.is_string()) {
            auto& s = *elem.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (elem.is_table()) {
            expand_env_vars_recursive(*elem.as_table());
        } else if (elem.is_array()) {
            expand_env_vars_in_array(*elem.as_array());
        }
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);
    expand_env_vars_recursive(result);
    return result;
}

// ---- Extraction helpers ----------------------------------------------------

std::optional<std::string> toml_optional_string(const toml::table& tbl, const std::string_view key) {
    if (const auto* v = tbl[key].as_string()) {
        return std::string(v->get());
    }
    return std::nullopt;
}

// Canonical key first, then its alias
std::string toml_string_with_alias(const toml::table& tbl,
                                   const std::string_view key,
                                   const std::string_view alias) {
    if (auto v = toml_optional_string(tbl, key)) return *v;
    if (auto v = toml_optional_string(tbl, alias)) return *v;
    return {};
}

// Integer key narrowed to int; a missing key yields fallback, a value that is
// not an integer or does not fit is reported and also yields fallback
int toml_int(const toml::table& tbl,
             const std::string_view key,
             const int fallback,
             const std::string& where,
             std::vector<std::string>& errors) {
    const auto node = tbl[key];
    if (!node) return fallback;

    const auto* v = node.as_integer();
    if (!v) {
        errors.push_back(std::format("{}.{} must be an integer", where, key));
        return fallback;
    }
    const int64_t value = v->get();
    if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) {
        errors.push_back(std::format("{}.{} is out of range, got {}", where, key, value));
        return fallback;
    }
    return static_cast<int>(value);
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

// ---- Section extractors ----------------------------------------------------

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;
    const auto& l = *logging;

    cfg.level = l["level"].value_or("info"s);
    return cfg;
}

Credentials ConfigLoader::extract_credentials(const toml::table& t,
                                              const std::string& where,
                                              std::vector<std::string>& errors) {
    Credentials c;
    c.host = t["host"].value_or(""s);
    c.port = toml_int(t, "port", 5433, where, errors);
    c.user = t["user"].value_or(""s);
    c.password = toml_string_with_alias(t, "password", "pass");
    c.database = toml_string_with_alias(t, "database", "dbname");
    c.schema = t["schema"].value_or(""s);

    c.connect_timeout = toml_int(t, "connect_timeout", 10, where, errors);
    c.role = toml_optional_string(t, "role");
    c.search_path = toml_optional_string(t, "search_path");
    c.keepalives_idle = toml_int(t, "keepalives_idle", 0, where, errors);
    c.sslmode = toml_optional_string(t, "sslmode");
    c.sslcert = toml_optional_string(t, "sslcert");
    c.sslkey = toml_optional_string(t, "sslkey");
    c.sslrootcert = toml_optional_string(t, "sslrootcert");
    if (t.contains("application_name")) {
        c.application_name = toml_optional_string(t, "application_name");
    }
    c.retries = toml_int(t, "retries", 1, where, errors);
    c.enable_transaction = t["enable_transaction"].value_or(true);
    return c;
}

std::vector<TargetConfig> ConfigLoader::extract_targets(const toml::table& root,
                                                        std::vector<std::string>& errors) {
    std::vector<TargetConfig> result;
    const auto* arr = root["targets"].as_array();
    if (!arr) return result;
    result.reserve(arr->size());

    for (size_t i = 0; i < arr->size(); ++i) {
        const auto* t = (*arr)[i].as_table();
        if (!t) continue;

        TargetConfig target;
        target.name = (*t)["name"].value_or("default"s);
        target.credentials = extract_credentials(*t, std::format("targets[{}]", i), errors);
        result.emplace_back(std::move(target));
    }
    return result;
}

AdapterConfig ConfigLoader::extract_all_sections(const toml::table& tbl,
                                                 std::vector<std::string>& errors) {
    AdapterConfig config;
    config.logging = extract_logging(tbl);
    if (const auto* profile = tbl["profile"].as_table()) {
        config.default_target = (*profile)["target"].value_or(""s);
    }
    config.targets = extract_targets(tbl, errors);
    return config;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(AdapterConfig config,
                                                           std::vector<std::string> errors) {
    auto found = validate_config(config);
    errors.insert(errors.end(),
                  std::make_move_iterator(found.begin()), std::make_move_iterator(found.end()));
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        std::vector<std::string> errors;
        auto config = extract_all_sections(tbl, errors);
        return validate_and_return(std::move(config), std::move(errors));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        std::vector<std::string> errors;
        auto config = extract_all_sections(tbl, errors);
        return validate_and_return(std::move(config), std::move(errors));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const AdapterConfig& config) {
    std::vector<std::string> errors;

    utils::log::Level level{};
    if (!utils::log::parse_level(config.logging.level, level)) {
        errors.push_back(std::format("logging.level must be debug, info, warn or error, got '{}'",
            config.logging.level));
    }

    if (config.targets.empty()) {
        errors.push_back("at least one [[targets]] entry is required");
    }

    std::unordered_set<std::string> names;
    for (size_t i = 0; i < config.targets.size(); ++i) {
        const auto& target = config.targets[i];
        const auto& c = target.credentials;

        if (!names.insert(target.name).second) {
            errors.push_back(std::format("targets[{}].name '{}' is duplicated", i, target.name));
        }
        if (c.host.empty()) {
            errors.push_back(std::format("targets[{}].host must not be empty", i));
        }
        if (c.user.empty()) {
            errors.push_back(std::format("targets[{}].user must not be empty", i));
        }
        if (c.password.empty()) {
            errors.push_back(std::format("targets[{}].password is required", i));
        }
        if (c.database.empty()) {
            errors.push_back(std::format("targets[{}].database must not be empty", i));
        }
        if (!utils::in_range<0, 65535>(c.port)) {
            errors.push_back(std::format("targets[{}].port must be 0-65535, got {}", i, c.port));
        }
        if (c.connect_timeout < 0) {
            errors.push_back(std::format("targets[{}].connect_timeout must be >= 0", i));
        }
        if (c.keepalives_idle < 0) {
            errors.push_back(std::format("targets[{}].keepalives_idle must be >= 0", i));
        }
        if (c.retries < 0) {
            errors.push_back(std::format("targets[{}].retries must be >= 0", i));
        }
    }

    if (!config.default_target.empty() && !config.find_target(config.default_target)) {
        errors.push_back(std::format("profile.target '{}' does not name a target",
            config.default_target));
    }

    return errors;
}

} // namespace ybadapter
