#include <catch2/catch_test_macros.hpp>
#include "core/exception_translator.hpp"
#include "core/error.hpp"
#include <stdexcept>
#include <string>

using namespace ybadapter;

TEST_CASE("ExceptionTranslator", "[exception_translator]") {
    int rollbacks = 0;
    bool fail_rollback = false;
    ExceptionTranslator translator([&] {
        ++rollbacks;
        if (fail_rollback) {
            throw DriverOperationalError("server closed the connection unexpectedly");
        }
    });

    SECTION("Successful work returns its value without rollback") {
        const int value = translator.run("select 1", [] { return 42; });
        CHECK(value == 42);
        CHECK(rollbacks == 0);
    }

    SECTION("Database error becomes DatabaseError with trimmed message") {
        try {
            translator.run("select * from missing", []() -> int {
                throw DriverDatabaseError("  relation \"missing\" does not exist\n", "42P01");
            });
            FAIL("expected DatabaseError");
        } catch (const DatabaseError& e) {
            CHECK(std::string(e.what()) == "relation \"missing\" does not exist");
        }
        CHECK(rollbacks == 1);
    }

    SECTION("Rollback failure on the database error path is dropped") {
        fail_rollback = true;
        REQUIRE_THROWS_AS(
            translator.run("insert into t values (1)", []() -> int {
                throw DriverDatabaseError("duplicate key value", "23505");
            }),
            DatabaseError);
        CHECK(rollbacks == 1);
    }

    SECTION("Generic error is wrapped in RuntimeError") {
        try {
            translator.run("select 1", []() -> int {
                throw std::out_of_range("row index out of range");
            });
            FAIL("expected RuntimeError");
        } catch (const DatabaseError&) {
            FAIL("generic errors must not become DatabaseError");
        } catch (const RuntimeError& e) {
            CHECK(std::string(e.what()) == "row index out of range");
        }
        CHECK(rollbacks == 1);
    }

    SECTION("Rollback failure on the generic path propagates") {
        fail_rollback = true;
        REQUIRE_THROWS_AS(
            translator.run("select 1", []() -> int {
                throw std::logic_error("boom");
            }),
            DriverOperationalError);
        CHECK(rollbacks == 1);
    }

    SECTION("Adapter runtime errors are rethrown unchanged") {
        try {
            translator.run("select 1", []() -> int {
                throw DatabaseError("already translated");
            });
            FAIL("expected DatabaseError");
        } catch (const DatabaseError& e) {
            CHECK(std::string(e.what()) == "already translated");
        }
        CHECK(rollbacks == 1);
    }

    SECTION("Internal errors stay internal errors") {
        REQUIRE_THROWS_AS(
            translator.run("BEGIN", []() -> int {
                throw InternalError("Tried to begin a new transaction");
            }),
            InternalError);
    }

    SECTION("Connection errors stay connection errors") {
        REQUIRE_THROWS_AS(
            translator.run("select 1", []() -> int {
                throw ConnectionError("could not connect");
            }),
            ConnectionError);
    }

    SECTION("Operational driver errors take the database error path") {
        REQUIRE_THROWS_AS(
            translator.run("select 1", []() -> int {
                throw DriverOperationalError("terminating connection due to administrator command", "57P01");
            }),
            DatabaseError);
    }
}
