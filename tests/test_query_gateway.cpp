#include <catch2/catch_test_macros.hpp>
#include "core/query_gateway.hpp"
#include "db/generic_connection_pool.hpp"
#include "mocks/mock_db_connection.hpp"

#include <string>

using namespace sqlgate;
using namespace sqlgate::testing;

namespace {

QueryGateway make_gateway(QueryGateway::Config config = {},
                          std::shared_ptr<IConnectionPool> pool = nullptr) {
    return QueryGateway(std::move(config), std::make_shared<MockCatalogDialect>(), std::move(pool));
}

} // anonymous namespace

TEST_CASE("Gateway: one forbidden statement rejects the whole batch", "[gateway]") {
    MockDbConnection conn;
    const auto gateway = make_gateway();

    const auto result = gateway.validate_and_execute("SELECT 1; DELETE FROM t", conn);

    REQUIRE(result.is_error());
    CHECK(result.error_code() == ErrorCode::VALIDATION_REJECTED);
    CHECK(result.statement_index() == 1u);
    CHECK(conn.executed().empty());
    CHECK(conn.begin_count() == 0);
}

TEST_CASE("Gateway: comment in front of a write does not hide it", "[gateway]") {
    MockDbConnection conn;
    const auto gateway = make_gateway();

    const auto result = gateway.validate_and_execute("SELECT 1; /*comment*/ DROP TABLE x", conn);

    REQUIRE(result.is_error());
    CHECK(result.error_code() == ErrorCode::VALIDATION_REJECTED);
    CHECK(result.statement_index() == 1u);
    CHECK(result.error_message() == std::string(ReadOnlyClassifier::kReasonNotReadOnly));
    CHECK(conn.executed().empty());
}

TEST_CASE("Gateway: executes the comment-free text that was classified", "[gateway]") {
    MockDbConnection conn;
    const auto gateway = make_gateway();

    const auto result = gateway.validate_and_execute(
        "SELECT 1 -- first\n; /* second */ SELECT 'a;b'", conn);

    REQUIRE(result.is_ok());
    REQUIRE(result.value().statements.size() == 2);
    CHECK(conn.executed() == std::vector<std::string>{"SELECT 1", "SELECT 'a;b'"});
    CHECK(result.value().statements[1].statement == "SELECT 'a;b'");
}

TEST_CASE("Gateway: comment-only statements are skipped", "[gateway]") {
    MockDbConnection conn;
    const auto gateway = make_gateway();

    SECTION("between real statements") {
        const auto result = gateway.validate_and_execute("SELECT 1; -- note\n; SELECT 2", conn);
        REQUIRE(result.is_ok());
        REQUIRE(result.value().statements.size() == 2);
        CHECK(result.value().statements[1].index == 2);
        CHECK(conn.executed() == std::vector<std::string>{"SELECT 1", "SELECT 2"});
    }

    SECTION("whole request") {
        const auto result = gateway.validate_and_execute("-- nothing to do", conn);
        REQUIRE(result.is_ok());
        CHECK(result.value().statements.empty());
        CHECK(conn.begin_count() == 0);
    }

    SECTION("blank request") {
        const auto result = gateway.validate_and_execute("   ", conn);
        REQUIRE(result.is_ok());
        CHECK(result.value().statements.empty());
    }
}

TEST_CASE("Gateway: statement cap is checked before touching the database", "[gateway]") {
    MockDbConnection conn;
    QueryGateway::Config config;
    config.executor.max_statements = 20;
    const auto gateway = make_gateway(config);

    std::string sql;
    for (int i = 0; i < 21; ++i) sql += "SELECT 1;";

    const auto result = gateway.validate_and_execute(sql, conn);
    REQUIRE(result.is_error());
    CHECK(result.error_code() == ErrorCode::RESOURCE_LIMIT_EXCEEDED);
    CHECK(conn.executed().empty());
    CHECK(conn.begin_count() == 0);

    // Exactly at the cap is fine
    sql.clear();
    for (int i = 0; i < 20; ++i) sql += "SELECT 1;";
    CHECK(gateway.validate_and_execute(sql, conn).is_ok());
}

TEST_CASE("Gateway: oversized request is rejected", "[gateway]") {
    MockDbConnection conn;
    QueryGateway::Config config;
    config.max_sql_length = 16;
    const auto gateway = make_gateway(config);

    const auto result = gateway.validate_and_execute("SELECT * FROM a_long_table_name", conn);
    REQUIRE(result.is_error());
    CHECK(result.error_code() == ErrorCode::RESOURCE_LIMIT_EXCEEDED);
    CHECK(conn.executed().empty());
}

TEST_CASE("Gateway: validate is a dry run", "[gateway]") {
    const auto gateway = make_gateway();

    const auto ok = gateway.validate("SELECT 1; /* x */ SHOW TABLES");
    REQUIRE(ok.is_ok());
    REQUIRE(ok.value().size() == 2);
    CHECK(ok.value()[1].statement == "SHOW TABLES");
    CHECK(ok.value()[1].allowed());

    const auto rejected = gateway.validate("SELECT 1; UPDATE t SET a = 1");
    REQUIRE(rejected.is_error());
    CHECK(rejected.statement_index() == 1u);
}

TEST_CASE("Gateway: dialect rules come from the configuration", "[gateway][mysql]") {
    MockDbConnection conn;
    QueryGateway::Config config;
    config.rules = SqlDialectRules::mysql();
    const auto gateway = make_gateway(config);

    // MySQL would run the executable comment body
    const auto result = gateway.validate_and_execute("SELECT 1 /*!50000 ; DROP TABLE t */", conn);
    REQUIRE(result.is_error());
    CHECK(result.error_code() == ErrorCode::VALIDATION_REJECTED);
    CHECK(conn.executed().empty());
}

TEST_CASE("Gateway: a quote inside a MySQL backtick identifier hides nothing", "[gateway][mysql]") {
    MockDbConnection conn;
    QueryGateway::Config config;
    config.rules = SqlDialectRules::mysql();
    const auto gateway = make_gateway(config);

    const auto second = gateway.validate_and_execute("SELECT `'` FROM t; DELETE FROM t #'", conn);
    REQUIRE(second.is_error());
    CHECK(second.error_code() == ErrorCode::VALIDATION_REJECTED);
    CHECK(second.statement_index() == 1u);

    const auto locking = gateway.validate_and_execute("SELECT `'` FROM t FOR UPDATE #'", conn);
    REQUIRE(locking.is_error());
    CHECK(locking.error_code() == ErrorCode::VALIDATION_REJECTED);
    CHECK(locking.statement_index() == 0u);

    CHECK(conn.executed().empty());
    CHECK(conn.begin_count() == 0);
}

TEST_CASE("Gateway: same query twice gives the same rows", "[gateway]") {
    MockDbConnection conn;
    conn.script("SELECT 1", text_rows({"?column?"}, {{"1"}}));
    const auto gateway = make_gateway();

    const auto first = gateway.validate_and_execute("SELECT 1", conn);
    const auto second = gateway.validate_and_execute("SELECT 1", conn);
    REQUIRE(first.is_ok());
    REQUIRE(second.is_ok());
    CHECK(first.value().statements[0].rows == second.value().statements[0].rows);
}

TEST_CASE("Gateway: inspect_schema on an explicit connection", "[gateway][schema]") {
    MockDbConnection conn;
    conn.script(MockCatalogDialect::kTables, text_rows(
        {"table_schema", "table_name", "table_type"}, {{"public", "users", "BASE TABLE"}}));
    conn.script(MockCatalogDialect::kColumns, text_rows(
        {"table_schema", "table_name", "column_name", "data_type", "is_nullable", "ordinal_position"},
        {{"public", "users", "id", "integer", "NO", "1"},
         {"public", "users", "name", "text", "YES", "2"}}));
    const auto gateway = make_gateway();

    const auto result = gateway.inspect_schema(conn);
    REQUIRE(result.is_ok());
    REQUIRE(result.value().size() == 1);
    const auto& users = result.value().at(TableKey{"public", "users"});
    REQUIRE(users.columns.size() == 2);
    CHECK(users.columns[0].name == "id");
    CHECK_FALSE(users.columns[0].nullable);
    CHECK(users.columns[1].name == "name");
    CHECK(users.columns[1].nullable);
}

TEST_CASE("Gateway: pooled overloads", "[gateway][pool]") {
    auto factory = std::make_shared<MockConnectionFactory>();
    factory->on_create([](MockDbConnection& conn) {
        conn.script("SELECT 42 AS answer", text_rows({"answer"}, {{"42"}}));
    });

    PoolConfig pool_config;
    pool_config.max_connections = 1;
    auto pool = std::make_shared<GenericConnectionPool>("testdb", pool_config, factory);

    QueryGateway::Config config;
    config.acquire_timeout = std::chrono::milliseconds{100};
    const auto gateway = make_gateway(config, pool);

    SECTION("connection is borrowed and returned") {
        const auto result = gateway.validate_and_execute("SELECT 42 AS answer");
        REQUIRE(result.is_ok());
        CHECK(result.value().statements[0].rows[0][0].text == "42");

        const auto stats = pool->get_stats();
        CHECK(stats.total_acquires == 1);
        CHECK(stats.total_releases == 1);
        CHECK(stats.idle_connections == 1);
    }

    SECTION("rejected request never acquires") {
        const auto result = gateway.validate_and_execute("DELETE FROM t");
        REQUIRE(result.is_error());
        CHECK(factory->total_created() == 0);
        CHECK(pool->get_stats().total_acquires == 0);
    }

    SECTION("comment-only request never acquires") {
        REQUIRE(gateway.validate_and_execute("/* nothing */").is_ok());
        CHECK(pool->get_stats().total_acquires == 0);
    }

    SECTION("connection failure is ConnectionUnavailable") {
        factory->set_fail(true);
        const auto result = gateway.validate_and_execute("SELECT 1");
        REQUIRE(result.is_error());
        CHECK(result.error_code() == ErrorCode::CONNECTION_UNAVAILABLE);
    }

    SECTION("drained pool is ConnectionUnavailable") {
        pool->drain();
        const auto result = gateway.inspect_schema();
        REQUIRE(result.is_error());
        CHECK(result.error_code() == ErrorCode::CONNECTION_UNAVAILABLE);
    }
}

TEST_CASE("Gateway: no pool configured", "[gateway]") {
    const auto gateway = make_gateway();
    const auto result = gateway.validate_and_execute("SELECT 1");
    REQUIRE(result.is_error());
    CHECK(result.error_code() == ErrorCode::CONNECTION_UNAVAILABLE);
}
