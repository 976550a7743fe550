#include "core/utils.hpp"
#include "core/error.hpp"
#include "core/connection_manager.hpp"
#include "config/config_loader.hpp"
#include "db/postgresql/pg_connection.hpp"
#include "relation/relation.hpp"

#include <nlohmann/json.hpp>

#include <format>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace ybadapter;

namespace {

void print_usage(const char* prog) {
    std::cerr << std::format(
        "Usage:\n"
        "  {0} <profile.toml> [--target NAME] [--sql STATEMENT [--fetch N]]\n"
        "  {0} --diff <existing.json> <model.json>\n", prog);
}

struct Options {
    std::string profile_path;
    std::string target;
    std::optional<std::string> sql;
    std::optional<size_t> fetch_limit;
    std::optional<std::string> diff_existing;
    std::optional<std::string> diff_model;
};

std::optional<Options> parse_args(int argc, char* argv[]) {
    Options opts;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--target" && i + 1 < argc) {
            opts.target = argv[++i];
        } else if (arg == "--sql" && i + 1 < argc) {
            opts.sql = argv[++i];
        } else if (arg == "--fetch" && i + 1 < argc) {
            const std::string n = argv[++i];
            if (!utils::is_all_digits(n)) return std::nullopt;
            opts.fetch_limit = static_cast<size_t>(std::stoull(n));
        } else if (arg == "--diff" && i + 2 < argc) {
            opts.diff_existing = argv[++i];
            opts.diff_model = argv[++i];
        } else if (!arg.starts_with("--") && opts.profile_path.empty()) {
            opts.profile_path = arg;
        } else {
            return std::nullopt;
        }
    }
    if (opts.profile_path.empty() && !opts.diff_existing) {
        return std::nullopt;
    }
    return opts;
}

nlohmann::json read_json(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw RuntimeError(std::format("Cannot open '{}'", path));
    }
    return nlohmann::json::parse(in);
}

std::string json_cell(const nlohmann::json& value) {
    if (value.is_null()) return {};
    if (value.is_string()) return value.get<std::string>();
    if (value.is_boolean()) return value.get<bool>() ? "t" : "f";
    if (value.is_array()) {
        std::string joined;
        for (const auto& v : value) {
            if (!joined.empty()) joined += ',';
            joined += json_cell(v);
        }
        return joined;
    }
    return value.dump();
}

// {"materialized_view": [{...}], "indexes": [{...}, ...]} -> catalog tables
RelationResults relation_results_from_json(const nlohmann::json& doc) {
    RelationResults results;
    for (const auto& [key, rows] : doc.items()) {
        if (!rows.is_array()) {
            throw RuntimeError(std::format("'{}' must be an array of rows", key));
        }
        DbResultSet table;
        table.success = true;
        table.has_rows = true;
        for (const auto& row : rows) {
            if (table.column_names.empty()) {
                for (const auto& [column, _] : row.items()) {
                    table.column_names.push_back(column);
                }
            }
            std::vector<std::string> values;
            for (const auto& column : table.column_names) {
                values.push_back(row.contains(column) ? json_cell(row[column]) : std::string{});
            }
            table.rows.push_back(std::move(values));
        }
        results.emplace(key, std::move(table));
    }
    return results;
}

int run_diff(const Options& opts) {
    const auto existing = relation_results_from_json(read_json(*opts.diff_existing));
    const auto model = read_json(*opts.diff_model);

    const auto desired = MaterializedViewConfig::from_model_node(model);
    const Relation relation(desired.database_name, desired.schema_name, desired.table_name,
                            RelationType::MATERIALIZED_VIEW);

    const auto changes = relation.get_materialized_view_config_change_collection(existing, model);
    if (!changes) {
        std::cout << std::format("{}: no changes\n", relation.render());
        return 0;
    }
    for (const auto& change : changes->indexes) {
        std::cout << std::format("{} {}\n",
            change_action_to_string(change.action), change.context.to_string());
    }
    return 0;
}

int run_connection(const Options& opts) {
    const auto loaded = ConfigLoader::load_from_file(opts.profile_path);
    if (!loaded.success) {
        utils::log::error(loaded.error_message);
        return 1;
    }

    utils::log::Level level;
    if (utils::log::parse_level(loaded.config.logging.level, level)) {
        utils::log::set_level(level);
    }

    const auto* target = loaded.config.find_target(opts.target);
    if (!target) {
        utils::log::error(std::format("Target '{}' not found in profile", opts.target));
        return 1;
    }
    utils::log::info(std::format("Using target '{}' ({}:{})",
        target->name, target->credentials.host, target->credentials.port));

    ConnectionManager manager(target->credentials, std::make_shared<PgConnectionFactory>());
    manager.set_connection_name(target->name);

    const std::string sql = opts.sql.value_or("select 1 as id");
    const bool fetch = opts.fetch_limit.has_value() || !opts.sql;

    int exit_code = 0;
    try {
        auto [response, table] = manager.execute(sql, true, fetch, opts.fetch_limit);
        manager.commit();
        std::cout << response.to_string() << "\n";
        for (const auto& row : table.rows) {
            std::string line;
            for (size_t i = 0; i < row.size(); ++i) {
                if (i > 0) line += '\t';
                line += row[i];
            }
            std::cout << line << "\n";
        }
        if (!opts.sql) {
            utils::log::info("Connection test: OK");
        }
    } catch (const AdapterError& e) {
        utils::log::error(std::format("Connection test failed: {}", e.what()));
        exit_code = 1;
    }

    manager.release();
    return exit_code;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    const auto opts = parse_args(argc, argv);
    if (!opts) {
        print_usage(argv[0]);
        return 2;
    }

    try {
        if (opts->diff_existing) {
            return run_diff(*opts);
        }
        return run_connection(*opts);
    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal error: {}", e.what()));
        return 1;
    }
}
