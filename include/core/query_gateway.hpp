#pragma once

#include "core/error.hpp"
#include "core/types.hpp"
#include "db/icatalog_dialect.hpp"
#include "db/iconnection_pool.hpp"
#include "db/idb_connection.hpp"
#include "executor/query_executor.hpp"
#include "parser/comment_stripper.hpp"
#include "parser/sql_scanner.hpp"
#include "parser/statement_splitter.hpp"
#include "schema/schema_inspector.hpp"
#include "security/read_only_classifier.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace sqlgate {

/**
 * @brief Entry point for guarded query execution and schema inspection
 *
 * Pipeline for one request:
 *   raw text -> length check -> split -> count check
 *            -> strip + classify each statement (first DENY rejects all)
 *            -> acquire connection -> execute in read-only transaction
 *
 * Everything before the acquire is pure; a rejected or oversized request
 * never touches the database. The text executed for each statement is the
 * comment-stripped text the classifier judged.
 */
class QueryGateway {
public:
    struct Config {
        size_t max_sql_length = 102400;   // Bytes, 0 = unlimited
        SqlDialectRules rules;
        bool preserve_executable_comments = true;
        std::unordered_set<std::string> allowed_keywords =
            ReadOnlyClassifier::default_allowed_keywords();
        std::unordered_set<std::string> forbidden_keywords =
            ReadOnlyClassifier::default_forbidden_keywords();
        QueryExecutor::Config executor;
        SchemaInspector::Config schema;
        std::chrono::milliseconds acquire_timeout{5000};
    };

    /**
     * @param config Gateway configuration
     * @param catalog Catalog queries of the connected backend
     * @param pool Pool used by the overloads without a connection argument
     */
    QueryGateway(Config config,
                 std::shared_ptr<const ICatalogDialect> catalog,
                 std::shared_ptr<IConnectionPool> pool = nullptr);

    /**
     * @brief Dry run: admit or reject without touching the database
     * @return One verdict per split statement, all ALLOW, or the first rejection
     */
    [[nodiscard]] Result<std::vector<ClassificationVerdict>> validate(std::string_view raw_sql) const;

    [[nodiscard]] Result<BatchResult> validate_and_execute(
        std::string_view raw_sql, IDbConnection& conn) const;

    /**
     * @brief Same as above on a connection borrowed from the pool
     *
     * The connection is acquired only after validation succeeded and is
     * returned when the call ends, whatever the outcome.
     */
    [[nodiscard]] Result<BatchResult> validate_and_execute(std::string_view raw_sql) const;

    [[nodiscard]] Result<SchemaSnapshot> inspect_schema(
        IDbConnection& conn,
        const std::optional<std::string>& schema_filter = std::nullopt) const;

    [[nodiscard]] Result<SchemaSnapshot> inspect_schema(
        const std::optional<std::string>& schema_filter = std::nullopt) const;

    [[nodiscard]] const Config& config() const { return config_; }

private:
    // Borrow a connection and run `fn` on it; ConnectionUnavailable if none
    template<typename T, typename Fn>
    Result<T> with_pooled_connection(Fn&& fn) const;

    Config config_;
    StatementSplitter splitter_;
    CommentStripper stripper_;
    ReadOnlyClassifier classifier_;
    QueryExecutor executor_;
    SchemaInspector inspector_;
    std::shared_ptr<IConnectionPool> pool_;
};

} // namespace sqlgate
