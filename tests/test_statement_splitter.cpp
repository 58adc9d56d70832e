#include <catch2/catch_test_macros.hpp>
#include "parser/statement_splitter.hpp"

using namespace sqlgate;

namespace {

StatementSplitter dialect_splitter(SqlDialectRules rules) {
    StatementSplitter::Config config;
    config.rules = rules;
    return StatementSplitter(config);
}

} // anonymous namespace

TEST_CASE("Splitter: terminator inside a string literal does not split", "[splitter]") {
    const StatementSplitter splitter;
    const auto statements = splitter.split("SELECT 'a;b'");
    REQUIRE(statements.size() == 1);
    CHECK(statements[0] == "SELECT 'a;b'");
}

TEST_CASE("Splitter: top-level terminators split and trim", "[splitter]") {
    const StatementSplitter splitter;
    const auto statements = splitter.split("  SELECT 1 ;\n  SELECT 2;  ");
    REQUIRE(statements.size() == 2);
    CHECK(statements[0] == "SELECT 1");
    CHECK(statements[1] == "SELECT 2");
}

TEST_CASE("Splitter: empty pieces are dropped", "[splitter]") {
    const StatementSplitter splitter;

    CHECK(splitter.split("").empty());
    CHECK(splitter.split("   \n\t ").empty());
    CHECK(splitter.split(";;;").empty());

    const auto statements = splitter.split(";SELECT 1;;  ;");
    REQUIRE(statements.size() == 1);
    CHECK(statements[0] == "SELECT 1");
}

TEST_CASE("Splitter: doubled quotes are escapes, not toggles", "[splitter]") {
    const StatementSplitter splitter;

    const auto single = splitter.split("SELECT 'it''s; fine'; SELECT 2");
    REQUIRE(single.size() == 2);
    CHECK(single[0] == "SELECT 'it''s; fine'");

    const auto dbl = splitter.split(R"(SELECT "a"";b" FROM t; SELECT 3)");
    REQUIRE(dbl.size() == 2);
    CHECK(dbl[0] == R"(SELECT "a"";b" FROM t)");
    CHECK(dbl[1] == "SELECT 3");
}

TEST_CASE("Splitter: unterminated literal keeps the rest as one statement", "[splitter]") {
    const StatementSplitter splitter;
    const auto statements = splitter.split("SELECT 1; SELECT 'open; DROP TABLE t");
    REQUIRE(statements.size() == 2);
    CHECK(statements[1] == "SELECT 'open; DROP TABLE t");
}

TEST_CASE("Splitter: input without terminator is one statement", "[splitter]") {
    const StatementSplitter splitter;
    const auto statements = splitter.split("  SELECT * FROM users WHERE id = 1  ");
    REQUIRE(statements.size() == 1);
    CHECK(statements[0] == "SELECT * FROM users WHERE id = 1");
}

TEST_CASE("Splitter: PostgreSQL dollar quotes hide terminators", "[splitter][postgresql]") {
    const auto splitter = dialect_splitter(SqlDialectRules::postgresql());

    const auto statements = splitter.split("SELECT $$a;b$$; SELECT $tag$x;y$tag$");
    REQUIRE(statements.size() == 2);
    CHECK(statements[0] == "SELECT $$a;b$$");
    CHECK(statements[1] == "SELECT $tag$x;y$tag$");

    // Positional parameters are not delimiters
    const auto params = splitter.split("SELECT $1; SELECT $2");
    CHECK(params.size() == 2);
}

TEST_CASE("Splitter: PostgreSQL backslash escapes only in E-strings", "[splitter][postgresql]") {
    const auto splitter = dialect_splitter(SqlDialectRules::postgresql());

    // Standard string: backslash is literal, the quote closes the string
    const auto standard = splitter.split(R"(SELECT 'a\'; SELECT 2)");
    REQUIRE(standard.size() == 2);
    CHECK(standard[0] == R"(SELECT 'a\')");

    // E-string: \' is an escaped quote, the literal runs on
    const auto escaped = splitter.split(R"(SELECT E'a\'; b'; SELECT 2)");
    REQUIRE(escaped.size() == 2);
    CHECK(escaped[0] == R"(SELECT E'a\'; b')");
}

TEST_CASE("Splitter: MySQL backslash escapes in every literal", "[splitter][mysql]") {
    const auto splitter = dialect_splitter(SqlDialectRules::mysql());

    const auto statements = splitter.split(R"(SELECT 'a\'; DROP TABLE t; --'; SELECT 2)");
    REQUIRE(statements.size() == 2);
    CHECK(statements[0] == R"(SELECT 'a\'; DROP TABLE t; --')");
    CHECK(statements[1] == "SELECT 2");
}

TEST_CASE("Splitter: MySQL backtick identifiers", "[splitter][mysql]") {
    const auto splitter = dialect_splitter(SqlDialectRules::mysql());

    const auto hidden = splitter.split("SELECT `'` FROM t; DELETE FROM t #'");
    REQUIRE(hidden.size() == 2);
    CHECK(hidden[0] == "SELECT `'` FROM t");
    CHECK(hidden[1] == "DELETE FROM t #'");

    const auto locking = splitter.split("SELECT `'` FROM t FOR UPDATE #'");
    REQUIRE(locking.size() == 1);

    const auto quoted = splitter.split("SELECT `a;b` FROM t; SELECT 2");
    REQUIRE(quoted.size() == 2);
    CHECK(quoted[0] == "SELECT `a;b` FROM t");

    // Backticks are plain characters outside MySQL
    const StatementSplitter generic;
    CHECK(generic.split("SELECT `a;b`").size() == 2);
}
