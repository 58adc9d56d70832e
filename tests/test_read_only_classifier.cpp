#include <catch2/catch_test_macros.hpp>
#include "security/read_only_classifier.hpp"

using namespace sqlgate;

namespace {

void require_allowed(const ReadOnlyClassifier& classifier, const std::string& sql) {
    INFO(sql);
    const auto verdict = classifier.classify(sql);
    CHECK(verdict.decision == Decision::ALLOW);
    CHECK_FALSE(verdict.reason.has_value());
}

std::string deny_reason(const ReadOnlyClassifier& classifier, const std::string& sql) {
    INFO(sql);
    const auto verdict = classifier.classify(sql);
    REQUIRE(verdict.decision == Decision::DENY);
    REQUIRE(verdict.reason.has_value());
    return *verdict.reason;
}

} // anonymous namespace

TEST_CASE("Classifier: read-only leading keywords are allowed", "[classifier]") {
    const ReadOnlyClassifier classifier;
    require_allowed(classifier, "SELECT 1");
    require_allowed(classifier, "select * from users where id = 3");
    require_allowed(classifier, "WITH x AS (SELECT 1) SELECT * FROM x");
    require_allowed(classifier, "EXPLAIN SELECT * FROM orders");
    require_allowed(classifier, "SHOW TABLES");
    require_allowed(classifier, "DESCRIBE users");
}

TEST_CASE("Classifier: other leading keywords are denied", "[classifier]") {
    const ReadOnlyClassifier classifier;
    const std::string expected(ReadOnlyClassifier::kReasonNotReadOnly);

    CHECK(deny_reason(classifier, "DROP TABLE x") == expected);
    CHECK(deny_reason(classifier, "VACUUM") == expected);
    CHECK(deny_reason(classifier, "(SELECT 1)") == expected);
    CHECK(deny_reason(classifier, "SELECTED_ROWS") == expected);
}

TEST_CASE("Classifier: empty statement is an allowed no-op", "[classifier]") {
    const ReadOnlyClassifier classifier;
    const auto verdict = classifier.classify("   \n ");
    CHECK(verdict.allowed());
    CHECK(verdict.is_noop());
    CHECK(verdict.statement.empty());
}

TEST_CASE("Classifier: verdict carries the trimmed statement", "[classifier]") {
    const ReadOnlyClassifier classifier;
    const auto verdict = classifier.classify("  SELECT 1 \n");
    CHECK(verdict.statement == "SELECT 1");
    CHECK_FALSE(verdict.is_noop());
}

TEST_CASE("Classifier: forbidden keyword anywhere is denied and named", "[classifier]") {
    const ReadOnlyClassifier classifier;

    CHECK(deny_reason(classifier, "SELECT 1 FROM t; DELETE FROM t") ==
          "forbidden keyword 'DELETE' detected");
    CHECK(deny_reason(classifier, "WITH d AS (delete FROM t RETURNING *) SELECT * FROM d") ==
          "forbidden keyword 'DELETE' detected");
    CHECK(deny_reason(classifier, "EXPLAIN ANALYZE INSERT INTO t VALUES (1)") ==
          "forbidden keyword 'INSERT' detected");
    CHECK(deny_reason(classifier, "SELECT * FROM t FOR UPDATE") ==
          "forbidden keyword 'UPDATE' detected");
    CHECK(deny_reason(classifier, "SHOW CREATE TABLE t") ==
          "forbidden keyword 'CREATE' detected");
}

TEST_CASE("Classifier: keywords match on word boundaries only", "[classifier]") {
    const ReadOnlyClassifier classifier;
    require_allowed(classifier, "SELECT updated_at, created_by FROM audit_log");
    require_allowed(classifier, "SELECT dropped FROM stats");
    require_allowed(classifier, "SELECT delete_flag FROM t");
}

TEST_CASE("Classifier: keywords inside literals and quoted identifiers are ignored", "[classifier]") {
    const ReadOnlyClassifier classifier;
    require_allowed(classifier, "SELECT * FROM logs WHERE message = 'DROP TABLE users'");
    require_allowed(classifier, R"(SELECT "delete" FROM t)");
    require_allowed(classifier, "SELECT 'a;b'");
}

TEST_CASE("Classifier: embedded secondary statement is denied", "[classifier]") {
    const ReadOnlyClassifier classifier;
    const std::string expected(ReadOnlyClassifier::kReasonEmbeddedStatement);

    CHECK(deny_reason(classifier, "SELECT 1; SELECT 2") == expected);
    require_allowed(classifier, "SELECT 1;");
    require_allowed(classifier, "SELECT 1 ;  ");
}

TEST_CASE("Classifier: WITH must lead to a SELECT", "[classifier]") {
    const ReadOnlyClassifier classifier;
    CHECK(deny_reason(classifier, "WITH x AS (VALUES (1)) TABLE x") ==
          std::string(ReadOnlyClassifier::kReasonWithoutSelect));
}

TEST_CASE("Classifier: session changes are forbidden by default", "[classifier]") {
    const ReadOnlyClassifier classifier;
    CHECK(deny_reason(classifier, "SELECT 1 FROM t SET x = 1") ==
          "forbidden keyword 'SET' detected");
    CHECK(deny_reason(classifier, "SET TRANSACTION READ WRITE") ==
          std::string(ReadOnlyClassifier::kReasonNotReadOnly));
}

TEST_CASE("Classifier: keyword sets are configurable", "[classifier]") {
    ReadOnlyClassifier::Config config;
    config.allowed_keywords = {"SELECT"};
    config.forbidden_keywords = {"DELETE", "PG_SLEEP"};
    const ReadOnlyClassifier classifier(config);

    CHECK(deny_reason(classifier, "SHOW TABLES") ==
          std::string(ReadOnlyClassifier::kReasonNotReadOnly));
    CHECK(deny_reason(classifier, "SELECT pg_sleep(10)") ==
          "forbidden keyword 'PG_SLEEP' detected");
    // No longer forbidden
    require_allowed(classifier, "SELECT * FROM t FOR UPDATE");
}

TEST_CASE("Classifier: MySQL backslash escapes cannot hide keywords", "[classifier][mysql]") {
    ReadOnlyClassifier::Config config;
    config.rules = SqlDialectRules::mysql();
    const ReadOnlyClassifier classifier(config);

    // \' does not close the literal, so DELETE is outside it
    CHECK(deny_reason(classifier, R"(SELECT '\'' , 1 FROM t WHERE 1 = 1 OR DELETE)") ==
          "forbidden keyword 'DELETE' detected");
}

TEST_CASE("Classifier: MySQL backtick identifiers are closed regions", "[classifier][mysql]") {
    ReadOnlyClassifier::Config config;
    config.rules = SqlDialectRules::mysql();
    const ReadOnlyClassifier classifier(config);

    // A quote inside backticks opens nothing, so the keywords stay visible
    CHECK(deny_reason(classifier, "SELECT `'` FROM t FOR UPDATE #'") ==
          "forbidden keyword 'UPDATE' detected");
    CHECK(deny_reason(classifier, "SELECT `'` FROM t; DELETE FROM t #'") ==
          "forbidden keyword 'DELETE' detected");

    // `` is an escaped backtick; backslash is not an escape
    CHECK(deny_reason(classifier, "SELECT `a``'` FROM t WHERE 1 OR DELETE") ==
          "forbidden keyword 'DELETE' detected");
    CHECK(deny_reason(classifier, "SELECT `a\\` FROM t WHERE 1 OR DELETE") ==
          "forbidden keyword 'DELETE' detected");

    require_allowed(classifier, "SELECT `delete`, `update` FROM `order`");
    CHECK(deny_reason(classifier, "SELECT `;` FROM t; SELECT 2") ==
          std::string(ReadOnlyClassifier::kReasonEmbeddedStatement));
}

TEST_CASE("Classifier: PostgreSQL dollar-quoted bodies are literals", "[classifier][postgresql]") {
    ReadOnlyClassifier::Config config;
    config.rules = SqlDialectRules::postgresql();
    const ReadOnlyClassifier classifier(config);

    require_allowed(classifier, "SELECT $body$ DROP TABLE t $body$ AS text");
}
