#include <catch2/catch_test_macros.hpp>
#include "core/adapter_response.hpp"
#include "mocks/mock_db_connection.hpp"

using namespace ybadapter;
using namespace ybadapter::testing;

TEST_CASE("AdapterResponse: code strips numeric tokens", "[adapter_response]") {

    SECTION("INSERT tag") {
        const auto r = make_adapter_response(ok_result("INSERT 0 3", 3));
        CHECK(r.message == "INSERT 0 3");
        CHECK(r.code == "INSERT");
        CHECK(r.rows_affected == 3);
        CHECK(r.to_string() == "INSERT 0 3");
    }

    SECTION("Multi-word tag keeps its words") {
        const auto r = make_adapter_response(ok_result("CREATE MATERIALIZED VIEW"));
        CHECK(r.code == "CREATE MATERIALIZED VIEW");
        CHECK(r.rows_affected == -1);
    }

    SECTION("SELECT with a row count") {
        const auto r = make_adapter_response(rows_result({"id"}, {{"1"}, {"2"}}));
        CHECK(r.code == "SELECT");
        CHECK(r.rows_affected == 2);
    }

    SECTION("Empty tag") {
        const auto r = make_adapter_response(ok_result(""));
        CHECK(r.message.empty());
        CHECK(r.code.empty());
    }
}
