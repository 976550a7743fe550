#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "core/connection_manager.hpp"
#include "core/error.hpp"
#include "db/postgresql/pg_type_map.hpp"
#include "mocks/mock_db_connection.hpp"
#include <algorithm>
#include <atomic>
#include <latch>
#include <string>
#include <thread>
#include <vector>

using namespace ybadapter;
using namespace ybadapter::testing;
using Catch::Matchers::ContainsSubstring;

namespace {

Credentials credentials() {
    Credentials creds;
    creds.host = "localhost";
    creds.user = "yugabyte";
    creds.password = "secret";
    creds.database = "yugabyte";
    creds.schema = "public";
    return creds;
}

std::shared_ptr<MockConnectionFactory> make_factory() {
    return std::make_shared<MockConnectionFactory>();
}

auto no_sleep() {
    return [](std::chrono::seconds) {};
}

} // anonymous namespace

TEST_CASE("ConnectionManager: thread registry", "[connection_manager]") {
    auto factory = make_factory();
    ConnectionManager manager(credentials(), factory, no_sleep());

    SECTION("No connection before set_connection_name") {
        CHECK(manager.get_if_exists() == nullptr);
        REQUIRE_THROWS_AS(manager.get_thread_connection(), InternalError);
    }

    SECTION("Missing connection error reports the registry size") {
        std::thread other([&] { manager.set_connection_name("worker"); });
        other.join();
        REQUIRE_THROWS_WITH(manager.get_thread_connection(),
                            ContainsSubstring("have 1 connections"));
    }

    SECTION("set_connection_name creates an unopened connection") {
        auto& conn = manager.set_connection_name("model.proj.orders");
        CHECK(conn.name == "model.proj.orders");
        CHECK(conn.state == ConnectionState::INIT);
        CHECK(factory->attempts() == 0);
        CHECK(&manager.get_thread_connection() == &conn);
    }

    SECTION("Empty name falls back to the default") {
        auto& conn = manager.set_connection_name("");
        CHECK(conn.name == ConnectionManager::kDefaultConnectionName);
    }

    SECTION("Renaming reuses the thread's connection") {
        auto& first = manager.set_connection_name("a");
        manager.add_query("select 1", false);
        auto& second = manager.set_connection_name("b");
        CHECK(&first == &second);
        CHECK(second.name == "b");
        CHECK(second.is_open());
        CHECK(factory->attempts() == 1);
    }

    SECTION("Each thread gets its own connection") {
        auto& mine = manager.set_connection_name("main");
        Connection* other = nullptr;
        std::thread worker([&] {
            other = &manager.set_connection_name("worker");
        });
        worker.join();
        REQUIRE(other != nullptr);
        CHECK(other != &mine);
        CHECK(manager.get_thread_connection().name == "main");
    }
}

TEST_CASE("ConnectionManager: statements", "[connection_manager]") {
    auto factory = make_factory();
    ConnectionManager manager(credentials(), factory, no_sleep());
    auto& conn = manager.set_connection_name("master");

    SECTION("First statement opens lazily and auto-begins") {
        auto [used, result] = manager.add_query("insert into t values (1)");
        CHECK(used == &conn);
        CHECK(conn.is_open());
        CHECK(conn.transaction_open);
        CHECK(factory->last_session().statements ==
              std::vector<std::string>{"COMMIT", "BEGIN", "insert into t values (1)"});
    }

    SECTION("auto_begin=false runs the statement alone") {
        manager.add_query("select 1", false);
        CHECK_FALSE(conn.transaction_open);
        CHECK(factory->last_session().statements == std::vector<std::string>{"select 1"});
    }

    SECTION("begin/commit through the manager") {
        manager.begin();
        CHECK(conn.transaction_open);
        manager.commit();
        CHECK_FALSE(conn.transaction_open);
        CHECK(factory->last_session().statements ==
              std::vector<std::string>{"COMMIT", "BEGIN", "COMMIT"});
    }

    SECTION("execute reports a normalized response") {
        factory->set_session_setup([](MockSessionState& s) {
            s.responder = [](const std::string&) { return ok_result("INSERT 0 3", 3); };
        });
        auto [response, table] = manager.execute("insert into t select * from s");
        CHECK(response.message == "INSERT 0 3");
        CHECK(response.code == "INSERT");
        CHECK(response.rows_affected == 3);
        CHECK(table.rows.empty());
    }

    SECTION("execute with fetch keeps rows up to the limit") {
        factory->set_session_setup([](MockSessionState& s) {
            s.responder = [](const std::string&) {
                return rows_result({"id"}, {{"1"}, {"2"}, {"3"}});
            };
        });
        auto [response, table] = manager.execute("select id from t", false, true, 2);
        CHECK(response.code == "SELECT");
        REQUIRE(table.rows.size() == 2);
        CHECK(table.rows[1][0] == "2");
        CHECK(table.column_names == std::vector<std::string>{"id"});
    }

    SECTION("Database error rolls back and raises DatabaseError") {
        factory->set_session_setup([](MockSessionState& s) {
            s.responder = [](const std::string& sql) {
                if (sql.starts_with("insert")) {
                    return error_result("duplicate key value violates unique constraint\n", "23505");
                }
                return ok_result("OK");
            };
        });

        REQUIRE_THROWS_AS(manager.add_query("insert into t values (1)"), DatabaseError);
        CHECK_FALSE(conn.transaction_open);
        CHECK(factory->last_session().rollbacks == 1);
    }

    SECTION("Connection failure surfaces as ConnectionError") {
        factory->fail_operational(2);
        REQUIRE_THROWS_AS(manager.add_query("select 1", false), ConnectionError);
        CHECK(conn.state == ConnectionState::FAIL);
    }
}

TEST_CASE("ConnectionManager: release and cleanup", "[connection_manager]") {
    auto factory = make_factory();
    ConnectionManager manager(credentials(), factory, no_sleep());
    auto& conn = manager.set_connection_name("master");

    SECTION("release rolls back and closes") {
        manager.add_query("update t set x = 1");
        REQUIRE(conn.transaction_open);
        auto& session = factory->last_session();

        CHECK(conn.backend_pid == 4242);
        manager.release();
        CHECK(conn.state == ConnectionState::CLOSED);
        CHECK(conn.handle == nullptr);
        CHECK(conn.backend_pid == 0);
        CHECK_FALSE(conn.transaction_open);
        CHECK(session.rollbacks == 1);
        CHECK(session.closed);
    }

    SECTION("Released connection reopens on next statement") {
        manager.add_query("select 1", false);
        manager.release();
        manager.add_query("select 2", false);
        CHECK(conn.is_open());
        CHECK(factory->attempts() == 2);
    }

    SECTION("cleanup_all clears the registry") {
        manager.add_query("select 1", false);
        manager.cleanup_all();
        CHECK(manager.get_if_exists() == nullptr);
        CHECK(factory->last_session().closed);
    }

    SECTION("commit_if_has_connection commits the open transaction") {
        manager.begin();
        manager.commit_if_has_connection();
        CHECK_FALSE(conn.transaction_open);
    }
}

TEST_CASE("ConnectionManager: cancellation", "[connection_manager]") {
    auto factory = make_factory();
    ConnectionManager manager(credentials(), factory, no_sleep());

    SECTION("Cancelling a never-opened connection is a no-op") {
        Connection idle("idle", credentials());
        manager.set_connection_name("master");
        REQUIRE_NOTHROW(manager.cancel(idle));
        CHECK(factory->attempts() == 0);
    }

    SECTION("Cancelling a session with no recorded pid is a no-op") {
        manager.set_connection_name("master");
        Connection victim("victim", credentials());
        victim.state = ConnectionState::OPEN;
        victim.handle = std::make_unique<MockDbConnection>(std::make_shared<MockSessionState>());

        REQUIRE_NOTHROW(manager.cancel(victim));
        CHECK(factory->attempts() == 0);
    }

    SECTION("Terminates the victim's backend from the caller's connection") {
        manager.set_connection_name("master");
        Connection victim("model.proj.slow", credentials());
        auto state = std::make_shared<MockSessionState>();
        victim.state = ConnectionState::OPEN;
        victim.handle = std::make_unique<MockDbConnection>(state);
        victim.backend_pid = 777;

        manager.cancel(victim);

        const auto& statements = factory->last_session().statements;
        CHECK(std::find(statements.begin(), statements.end(),
                        "select pg_terminate_backend(777)") != statements.end());
        CHECK(state->statements.empty());
    }

    SECTION("Cancel uses the recorded pid, not the victim's session") {
        manager.set_connection_name("master");
        Connection victim("victim", credentials());
        auto state = std::make_shared<MockSessionState>();
        state->pid_error = "invalid connection handle";
        victim.state = ConnectionState::OPEN;
        victim.handle = std::make_unique<MockDbConnection>(state);
        victim.backend_pid = 31;

        REQUIRE_NOTHROW(manager.cancel(victim));
        const auto& statements = factory->last_session().statements;
        CHECK(std::find(statements.begin(), statements.end(),
                        "select pg_terminate_backend(31)") != statements.end());
    }

    SECTION("Termination failures are swallowed") {
        manager.set_connection_name("master");
        factory->set_session_setup([](MockSessionState& s) {
            s.responder = [](const std::string& sql) {
                if (sql.starts_with("select pg_terminate_backend")) {
                    return error_result("function pg_terminate_backend is not supported", "0A000");
                }
                return ok_result("OK");
            };
        });
        Connection victim("victim", credentials());
        victim.backend_pid = 4242;

        REQUIRE_NOTHROW(manager.cancel(victim));
    }

    SECTION("Termination fails to connect and is still swallowed") {
        manager.set_connection_name("master");
        factory->fail_operational(5);
        Connection victim("victim", credentials());
        victim.backend_pid = 4242;

        REQUIRE_NOTHROW(manager.cancel(victim));
    }

    SECTION("cancel_open skips the caller and unopened connections") {
        // Both workers stay alive until both registered, so their ids differ
        std::latch registered(2);
        std::thread opened([&] {
            manager.set_connection_name("model.proj.a");
            manager.add_query("select 1", false);
            registered.arrive_and_wait();
        });
        std::thread unopened([&] {
            manager.set_connection_name("model.proj.b");
            registered.arrive_and_wait();
        });
        opened.join();
        unopened.join();

        manager.set_connection_name("master");
        const auto cancelled = manager.cancel_open();

        CHECK(cancelled == std::vector<std::string>{"model.proj.a"});
    }

    SECTION("Released connections are not cancelled") {
        std::latch released(1);
        std::latch done(1);
        std::thread worker([&] {
            manager.set_connection_name("model.proj.a");
            manager.add_query("select 1", false);
            manager.release();
            released.count_down();
            done.wait();
        });
        released.wait();

        manager.set_connection_name("master");
        const auto cancelled = manager.cancel_open();
        done.count_down();
        worker.join();

        CHECK(cancelled.empty());
    }

    SECTION("cancel_open runs while a worker opens, renames and releases") {
        manager.set_connection_name("master");
        manager.add_query("select 1", false);

        std::atomic<bool> finished{false};
        std::thread worker([&] {
            for (int i = 0; i < 200; ++i) {
                manager.set_connection_name(i % 2 ? "model.proj.churn" : "model.proj.spin");
                manager.add_query("select 1", false);
                manager.release();
            }
            finished = true;
        });

        std::vector<std::string> seen;
        while (!finished) {
            for (auto& name : manager.cancel_open()) {
                seen.push_back(std::move(name));
            }
        }
        worker.join();

        for (const auto& name : seen) {
            CHECK((name == "model.proj.churn" || name == "model.proj.spin"));
        }
        CHECK(manager.get_thread_connection().is_open());
    }
}

TEST_CASE("ConnectionManager: type names", "[connection_manager]") {
    CHECK(ConnectionManager::data_type_code_to_name(23) == "int4");
    CHECK(ConnectionManager::data_type_code_to_name(25) == "text");
    CHECK(ConnectionManager::data_type_code_to_name(999999) == "unknown type_code 999999");
    CHECK(ConnectionManager::data_type_code_to_name(1184) == "timestamptz");
    CHECK(PgTypeMap::oid_to_type_name(999999).empty());
}
