#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ybadapter {

// ============================================================================
// Configuration Types
// ============================================================================

/**
 * @brief Connection credentials for one target
 *
 * Trusted by the connection core once ConfigLoader has validated it.
 */
struct Credentials {
    std::string host;
    int port = 5433;
    std::string user;
    std::string password;             // Mandatory on the target database
    std::string database;
    std::string schema;

    int connect_timeout = 10;         // Seconds
    std::optional<std::string> role;
    std::optional<std::string> search_path;
    int keepalives_idle = 0;          // 0 = platform default, never sent
    std::optional<std::string> sslmode;
    std::optional<std::string> sslcert;
    std::optional<std::string> sslkey;
    std::optional<std::string> sslrootcert;
    std::optional<std::string> application_name = std::string("dbt");
    int retries = 1;
    bool enable_transaction = true;

    [[nodiscard]] static constexpr const char* type() { return "yugabytedb"; }

    [[nodiscard]] const std::string& unique_field() const { return host; }

    /**
     * @brief Keys shown by the connection check (password is never listed)
     */
    [[nodiscard]] static const std::vector<std::string>& connection_keys() {
        static const std::vector<std::string> keys = {
            "host", "port", "user", "database", "schema", "connect_timeout",
            "role", "search_path", "keepalives_idle", "sslmode", "sslcert",
            "sslkey", "sslrootcert", "application_name", "retries",
            "enable_transaction"
        };
        return keys;
    }
};

struct LoggingConfig {
    std::string level = "info";
};

/**
 * @brief A named target inside a profile
 */
struct TargetConfig {
    std::string name;
    Credentials credentials;
};

// ============================================================================
// AdapterConfig - Complete parsed profile
// ============================================================================

struct AdapterConfig {
    LoggingConfig logging;
    std::string default_target;
    std::vector<TargetConfig> targets;

    /**
     * @brief Look up a target by name (empty name = default target)
     */
    [[nodiscard]] const TargetConfig* find_target(const std::string& name) const {
        const std::string& wanted = name.empty() ? default_target : name;
        for (const auto& t : targets) {
            if (t.name == wanted) return &t;
        }
        if (wanted.empty() && !targets.empty()) return &targets.front();
        return nullptr;
    }
};

} // namespace ybadapter
