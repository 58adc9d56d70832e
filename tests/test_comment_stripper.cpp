#include <catch2/catch_test_macros.hpp>
#include "parser/comment_stripper.hpp"

using namespace sqlgate;

namespace {

CommentStripper mysql_stripper(bool preserve_executable = true) {
    CommentStripper::Config config;
    config.rules = SqlDialectRules::mysql();
    config.preserve_executable_comments = preserve_executable;
    return CommentStripper(config);
}

} // anonymous namespace

TEST_CASE("Stripper: line comment is removed up to the newline", "[stripper]") {
    const CommentStripper stripper;
    CHECK(stripper.strip("SELECT 1 -- trailing note") == "SELECT 1");
    CHECK(stripper.strip("-- header\nSELECT 1") == "SELECT 1");
    CHECK(stripper.strip("SELECT a, -- first\n b FROM t") == "SELECT a,  \n b FROM t");
}

TEST_CASE("Stripper: block comment becomes a single space", "[stripper]") {
    const CommentStripper stripper;
    CHECK(stripper.strip("/*comment*/ DROP TABLE x") == "DROP TABLE x");
    CHECK(stripper.strip("SELECT/*x*/1") == "SELECT 1");
    CHECK(stripper.strip("SELECT 1 /* unterminated") == "SELECT 1");
}

TEST_CASE("Stripper: block comments do not nest", "[stripper]") {
    const CommentStripper stripper;
    CHECK(stripper.strip("SELECT /* a /* b */ 1 */") == "SELECT   1 */");
}

TEST_CASE("Stripper: comment markers inside literals are kept", "[stripper]") {
    const CommentStripper stripper;
    CHECK(stripper.strip("SELECT '-- not a comment'") == "SELECT '-- not a comment'");
    CHECK(stripper.strip("SELECT '/* keep */' AS x") == "SELECT '/* keep */' AS x");
    CHECK(stripper.strip(R"(SELECT "col--name" FROM t)") == R"(SELECT "col--name" FROM t)");
}

TEST_CASE("Stripper: comment-only input becomes empty", "[stripper]") {
    const CommentStripper stripper;
    CHECK(stripper.strip("-- nothing here").empty());
    CHECK(stripper.strip("  /* a */ /* b */  ").empty());
}

TEST_CASE("Stripper: hash comments only in MySQL", "[stripper][mysql]") {
    const CommentStripper generic;
    CHECK(generic.strip("SELECT 1 # note") == "SELECT 1 # note");

    const auto mysql = mysql_stripper();
    CHECK(mysql.strip("SELECT 1 # note") == "SELECT 1");
    CHECK(mysql.strip("SELECT '#literal'") == "SELECT '#literal'");
    CHECK(mysql.strip("SELECT `#col` FROM t") == "SELECT `#col` FROM t");
    CHECK(mysql.strip("SELECT `'` FROM t FOR UPDATE #'") == "SELECT `'` FROM t FOR UPDATE");
}

TEST_CASE("Stripper: MySQL executable comment bodies stay visible", "[stripper][mysql]") {
    const auto mysql = mysql_stripper();
    CHECK(mysql.strip("SELECT 1 /*!50000 , SLEEP(1) */") == "SELECT 1   , SLEEP(1)");
    CHECK(mysql.strip("/*! DROP TABLE t */") == "DROP TABLE t");
    CHECK(mysql.strip("/*M!100100 DELETE FROM t */") == "DELETE FROM t");

    const auto dropping = mysql_stripper(false);
    CHECK(dropping.strip("SELECT 1 /*! , SLEEP(1) */") == "SELECT 1");
}

TEST_CASE("Stripper: executable comments are ordinary outside MySQL", "[stripper]") {
    const CommentStripper stripper;
    CHECK(stripper.strip("SELECT 1 /*! DROP TABLE t */") == "SELECT 1");
}
