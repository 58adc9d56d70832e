#include "executor/query_executor.hpp"
#include "core/utils.hpp"
#include <format>

namespace sqlgate {

namespace {

/**
 * @brief Read-only transaction scope, rolled back on every exit path
 *
 * A statement timeout installed during the batch is cleared before the
 * rollback, so a pooled connection never carries it into the next request.
 */
class ReadOnlySession {
public:
    explicit ReadOnlySession(IDbConnection& conn) : conn_(conn) {}

    ~ReadOnlySession() {
        if (!active_) return;
        if (timeout_installed_ && conn_.is_connected() && !conn_.set_query_timeout(0)) {
            // Expected in an aborted PostgreSQL transaction; ROLLBACK undoes SET LOCAL there
            utils::log::debug("Could not clear statement timeout before rollback");
        }
        const auto result = conn_.rollback();
        if (!result.success) {
            utils::log::warn(std::format("Rollback of read-only transaction failed: {}",
                                         result.error_message));
        }
    }

    ReadOnlySession(const ReadOnlySession&) = delete;
    ReadOnlySession& operator=(const ReadOnlySession&) = delete;

    [[nodiscard]] DbResultSet begin() {
        auto result = conn_.begin_read_only();
        active_ = result.success;
        return result;
    }

    [[nodiscard]] bool install_timeout(uint32_t timeout_ms) {
        timeout_installed_ = true;
        return conn_.set_query_timeout(timeout_ms);
    }

private:
    IDbConnection& conn_;
    bool active_ = false;
    bool timeout_installed_ = false;
};

} // anonymous namespace

QueryExecutor::QueryExecutor(const Config& config)
    : config_(config) {}

Result<BatchResult> QueryExecutor::execute(
    const std::vector<ClassificationVerdict>& statements,
    IDbConnection& conn) const {

    if (statements.size() > config_.max_statements) {
        return Result<BatchResult>::error(ErrorCode::RESOURCE_LIMIT_EXCEEDED,
            std::format("batch has {} statements, limit is {}",
                        statements.size(), config_.max_statements));
    }

    size_t executable = 0;
    for (size_t i = 0; i < statements.size(); ++i) {
        if (!statements[i].allowed()) {
            return Result<BatchResult>::error(ErrorCode::VALIDATION_REJECTED,
                statements[i].reason.value_or("statement was not admitted"), i);
        }
        if (!statements[i].is_noop()) ++executable;
    }

    utils::Timer timer;
    BatchResult batch;
    if (executable == 0) {
        return Result<BatchResult>::ok(std::move(batch));
    }

    ReadOnlySession session(conn);
    if (const auto begun = session.begin(); !begun.success) {
        return Result<BatchResult>::error(classify_db_failure(begun, conn),
            std::format("could not open read-only transaction: {}", begun.error_message));
    }

    batch.statements.reserve(executable);
    for (size_t i = 0; i < statements.size(); ++i) {
        const auto& verdict = statements[i];
        if (verdict.is_noop()) continue;

        if (config_.request_timeout_ms > 0) {
            const auto elapsed_ms = static_cast<uint64_t>(timer.elapsed_ms().count());
            if (elapsed_ms >= config_.request_timeout_ms) {
                return Result<BatchResult>::error(ErrorCode::TIMEOUT,
                    std::format("request timeout of {}ms exhausted", config_.request_timeout_ms), i);
            }
            const auto remaining = static_cast<uint32_t>(config_.request_timeout_ms - elapsed_ms);
            if (!session.install_timeout(remaining)) {
                return Result<BatchResult>::error(
                    conn.is_connected() ? ErrorCode::EXECUTION_FAILED : ErrorCode::CONNECTION_UNAVAILABLE,
                    "could not set statement timeout", i);
            }
        }

        utils::Timer statement_timer;
        auto db_result = conn.execute(verdict.statement);
        if (!db_result.success) {
            utils::log::debug(std::format("Statement {} failed after {}us",
                                          i, statement_timer.elapsed_us().count()));
            return Result<BatchResult>::error(classify_db_failure(db_result, conn),
                                              std::move(db_result.error_message), i);
        }

        if (config_.max_result_rows > 0 && db_result.rows.size() > config_.max_result_rows) {
            return Result<BatchResult>::error(ErrorCode::RESOURCE_LIMIT_EXCEEDED,
                std::format("result exceeds max_result_rows limit ({} rows)", config_.max_result_rows), i);
        }

        StatementResult stmt;
        stmt.index = i;
        stmt.statement = verdict.statement;
        stmt.column_names = std::move(db_result.column_names);
        stmt.rows = std::move(db_result.rows);
        stmt.affected_rows = db_result.affected_rows;
        stmt.execution_time = statement_timer.elapsed_us();

        utils::log::debug(std::format("Statement {} returned {} rows in {}us",
                                      i, stmt.rows.size(), stmt.execution_time.count()));
        batch.statements.push_back(std::move(stmt));
    }

    batch.execution_time = timer.elapsed_us();
    return Result<BatchResult>::ok(std::move(batch));
}

} // namespace sqlgate
