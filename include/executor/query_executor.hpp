#pragma once

#include "core/error.hpp"
#include "core/types.hpp"
#include "db/idb_connection.hpp"
#include <cstdint>
#include <vector>

namespace sqlgate {

/**
 * @brief Runs an admitted batch on one connection
 *
 * The whole batch runs inside a single read-only transaction that is
 * always rolled back, so the server rejects writes the classifier missed.
 * Statements run strictly in order; the first failure ends the batch and
 * earlier results are discarded. Nothing is retried.
 *
 * The request timeout is one budget for the whole batch: before each
 * statement the remaining budget is installed as the server-side statement
 * timeout, and the server cancels a statement that overruns it.
 */
class QueryExecutor {
public:
    struct Config {
        size_t max_statements = 20;
        uint32_t request_timeout_ms = 30000;   // 0 = no timeout
        size_t max_result_rows = 10000;        // Per statement, 0 = unlimited
    };

    QueryExecutor() : QueryExecutor(Config{}) {}
    explicit QueryExecutor(const Config& config);

    /**
     * @brief Execute every allowed statement of a classified batch
     * @param statements Verdicts in input order; no-ops are skipped
     * @param conn Connection used for the whole batch
     * @return One StatementResult per executed statement, or the first error
     *         (statement_index refers to the position in `statements`)
     */
    [[nodiscard]] Result<BatchResult> execute(
        const std::vector<ClassificationVerdict>& statements,
        IDbConnection& conn) const;

    [[nodiscard]] const Config& config() const { return config_; }

private:
    Config config_;
};

} // namespace sqlgate
