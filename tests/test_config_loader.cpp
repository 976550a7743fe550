#include <catch2/catch_test_macros.hpp>
#include "config/config_loader.hpp"

#include <cstdlib>
#include <string>

using namespace ybadapter;

namespace {

bool has_error(const ConfigLoader::LoadResult& result, const std::string& fragment) {
    return result.error_message.find(fragment) != std::string::npos;
}

} // anonymous namespace

TEST_CASE("ConfigLoader: minimal target with defaults", "[config]") {
    const std::string toml = R"(
[[targets]]
name = "dev"
host = "127.0.0.1"
user = "yugabyte"
password = "yugabyte"
database = "yugabyte"
schema = "analytics"
)";

    auto result = ConfigLoader::load_from_string(toml);
    REQUIRE(result.success);
    REQUIRE(result.config.targets.size() == 1);

    const auto& c = result.config.targets[0].credentials;
    CHECK(c.host == "127.0.0.1");
    CHECK(c.port == 5433);
    CHECK(c.connect_timeout == 10);
    CHECK(c.keepalives_idle == 0);
    CHECK(c.retries == 1);
    CHECK(c.enable_transaction);
    CHECK(c.application_name == std::optional<std::string>("dbt"));
    CHECK_FALSE(c.role.has_value());
    CHECK_FALSE(c.sslmode.has_value());
    CHECK(result.config.logging.level == "info");
}

TEST_CASE("ConfigLoader: aliases and optional fields", "[config]") {
    const std::string toml = R"(
[logging]
level = "debug"

[profile]
target = "prod"

[[targets]]
name = "dev"
host = "localhost"
user = "u"
pass = "p"
dbname = "d"

[[targets]]
name = "prod"
host = "yb.internal"
port = 5434
user = "dbt"
pass = "alias-secret"
dbname = "warehouse"
role = "transformer"
search_path = "my schema"
keepalives_idle = 60
sslmode = "require"
retries = 3
enable_transaction = false
)";

    auto result = ConfigLoader::load_from_string(toml);
    REQUIRE(result.success);
    CHECK(result.config.logging.level == "debug");

    const auto* target = result.config.find_target("");
    REQUIRE(target != nullptr);
    CHECK(target->name == "prod");

    const auto& c = target->credentials;
    CHECK(c.password == "alias-secret");
    CHECK(c.database == "warehouse");
    CHECK(c.port == 5434);
    CHECK(c.role == std::optional<std::string>("transformer"));
    CHECK(c.search_path == std::optional<std::string>("my schema"));
    CHECK(c.keepalives_idle == 60);
    CHECK(c.sslmode == std::optional<std::string>("require"));
    CHECK(c.retries == 3);
    CHECK_FALSE(c.enable_transaction);

    REQUIRE(result.config.find_target("dev") != nullptr);
    CHECK(result.config.find_target("missing") == nullptr);
}

TEST_CASE("ConfigLoader: canonical key wins over alias", "[config]") {
    const std::string toml = R"(
[[targets]]
name = "dev"
host = "localhost"
user = "u"
password = "canonical"
pass = "alias"
database = "d"
)";

    auto result = ConfigLoader::load_from_string(toml);
    REQUIRE(result.success);
    CHECK(result.config.targets[0].credentials.password == "canonical");
}

TEST_CASE("ConfigLoader: environment expansion", "[config][env]") {
    ::setenv("YB_TEST_PASSWORD", "s3cret", 1);

    const std::string toml = R"(
[[targets]]
name = "dev"
host = "localhost"
user = "u"
password = "${YB_TEST_PASSWORD}"
database = "d"
)";

    auto result = ConfigLoader::load_from_string(toml);
    REQUIRE(result.success);
    CHECK(result.config.targets[0].credentials.password == "s3cret");

    ::unsetenv("YB_TEST_PASSWORD");
}

TEST_CASE("ConfigLoader: missing env var leaves password empty", "[config][env]") {
    ::unsetenv("YB_NONEXISTENT_VAR_12345");

    const std::string toml = R"(
[[targets]]
name = "dev"
host = "localhost"
user = "u"
password = "${YB_NONEXISTENT_VAR_12345}"
database = "d"
)";

    auto result = ConfigLoader::load_from_string(toml);
    REQUIRE_FALSE(result.success);
    CHECK(has_error(result, "targets[0].password is required"));
}

TEST_CASE("ConfigLoader: validation", "[config][validation]") {

    SECTION("No targets") {
        auto result = ConfigLoader::load_from_string("[logging]\nlevel = \"info\"\n");
        REQUIRE_FALSE(result.success);
        CHECK(has_error(result, "at least one [[targets]] entry is required"));
    }

    SECTION("Port out of range") {
        auto result = ConfigLoader::load_from_string(R"(
[[targets]]
name = "dev"
host = "h"
user = "u"
password = "p"
database = "d"
port = 70000
)");
        REQUIRE_FALSE(result.success);
        CHECK(has_error(result, "targets[0].port must be 0-65535, got 70000"));
    }

    SECTION("Port too large for an int is not wrapped") {
        auto result = ConfigLoader::load_from_string(R"(
[[targets]]
name = "dev"
host = "h"
user = "u"
password = "p"
database = "d"
port = 4294972729
retries = 9999999999
)");
        REQUIRE_FALSE(result.success);
        CHECK(has_error(result, "targets[0].port is out of range, got 4294972729"));
        CHECK(has_error(result, "targets[0].retries is out of range, got 9999999999"));
    }

    SECTION("Non-integer port is rejected") {
        auto result = ConfigLoader::load_from_string(R"(
[[targets]]
name = "dev"
host = "h"
user = "u"
password = "p"
database = "d"
port = "5433"
)");
        REQUIRE_FALSE(result.success);
        CHECK(has_error(result, "targets[0].port must be an integer"));
    }

    SECTION("Negative retries and timeouts") {
        auto result = ConfigLoader::load_from_string(R"(
[[targets]]
name = "dev"
host = "h"
user = "u"
password = "p"
database = "d"
retries = -1
connect_timeout = -5
)");
        REQUIRE_FALSE(result.success);
        CHECK(has_error(result, "targets[0].retries must be >= 0"));
        CHECK(has_error(result, "targets[0].connect_timeout must be >= 0"));
    }

    SECTION("All problems are reported together") {
        auto result = ConfigLoader::load_from_string(R"(
[[targets]]
name = "dev"
port = 5433
)");
        REQUIRE_FALSE(result.success);
        CHECK(has_error(result, "Config validation failed:"));
        CHECK(has_error(result, "targets[0].host must not be empty"));
        CHECK(has_error(result, "targets[0].user must not be empty"));
        CHECK(has_error(result, "targets[0].password is required"));
        CHECK(has_error(result, "targets[0].database must not be empty"));
    }

    SECTION("Duplicate target names") {
        auto result = ConfigLoader::load_from_string(R"(
[[targets]]
name = "dev"
host = "h"
user = "u"
password = "p"
database = "d"

[[targets]]
name = "dev"
host = "h"
user = "u"
password = "p"
database = "d"
)");
        REQUIRE_FALSE(result.success);
        CHECK(has_error(result, "targets[1].name 'dev' is duplicated"));
    }

    SECTION("Default target must exist") {
        auto result = ConfigLoader::load_from_string(R"(
[profile]
target = "prod"

[[targets]]
name = "dev"
host = "h"
user = "u"
password = "p"
database = "d"
)");
        REQUIRE_FALSE(result.success);
        CHECK(has_error(result, "profile.target 'prod' does not name a target"));
    }

    SECTION("Unknown log level") {
        auto result = ConfigLoader::load_from_string(R"(
[logging]
level = "verbose"

[[targets]]
name = "dev"
host = "h"
user = "u"
password = "p"
database = "d"
)");
        REQUIRE_FALSE(result.success);
        CHECK(has_error(result, "logging.level"));
    }
}

TEST_CASE("ConfigLoader: malformed TOML", "[config]") {
    auto result = ConfigLoader::load_from_string("[[targets]\nname = ");
    REQUIRE_FALSE(result.success);
    CHECK(has_error(result, "Failed to parse config"));
}

TEST_CASE("ConfigLoader: missing file", "[config]") {
    auto result = ConfigLoader::load_from_file("/nonexistent/profiles.toml");
    REQUIRE_FALSE(result.success);
    CHECK(has_error(result, "Failed to load config"));
}
