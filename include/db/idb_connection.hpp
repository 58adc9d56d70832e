#pragma once

#include "core/column_type.hpp"
#include "core/types.hpp"
#include <string>
#include <vector>
#include <cstdint>
#include <memory>

namespace sqlgate {

/**
 * @brief Result set from a query execution
 *
 * Returned by IDbConnection::execute().
 * Owns the result data (copied from native result handles).
 */
struct DbResultSet {
    bool success = false;
    std::string error_message;   // Database message, verbatim
    bool timed_out = false;      // Server cancelled the statement on its timeout

    // For row-returning statements
    std::vector<std::string> column_names;
    std::vector<ColumnTypeInfo> column_types;
    std::vector<ResultRow> rows;

    uint64_t affected_rows = 0;

    [[nodiscard]] static DbResultSet failure(std::string message) {
        DbResultSet result;
        result.success = false;
        result.error_message = std::move(message);
        return result;
    }
};

/**
 * @brief Abstract database connection
 *
 * Wraps a single native connection handle (PGconn*, MYSQL*, etc.).
 * Implementations are not thread-safe; thread safety comes from the pool.
 *
 * Does NOT expose native handles to prevent leaking backend types.
 */
class IDbConnection {
public:
    virtual ~IDbConnection() = default;

    /**
     * @brief Execute exactly one SQL statement
     *
     * Implementations must refuse to run more than one statement per call.
     */
    [[nodiscard]] virtual DbResultSet execute(const std::string& sql) = 0;

    /**
     * @brief Open a transaction in which the server rejects writes
     *
     * PostgreSQL: BEGIN TRANSACTION READ ONLY
     * MySQL: START TRANSACTION READ ONLY
     */
    [[nodiscard]] virtual DbResultSet begin_read_only() = 0;

    /**
     * @brief Roll back the current transaction
     */
    [[nodiscard]] virtual DbResultSet rollback() = 0;

    /**
     * @brief Check if the connection is healthy
     * @param health_check_query SQL to run (e.g., "SELECT 1")
     * @return true if connection is usable
     */
    [[nodiscard]] virtual bool is_healthy(const std::string& health_check_query) = 0;

    /**
     * @brief Check if connection is in a valid state (connected)
     */
    [[nodiscard]] virtual bool is_connected() const = 0;

    /**
     * @brief Set the server-side timeout for subsequent statements
     * @param timeout_ms Timeout in milliseconds (0 = no timeout)
     * @return true if timeout was set successfully
     *
     * PostgreSQL: SET LOCAL statement_timeout = N (scoped to the transaction)
     * MySQL: SET SESSION max_execution_time = N
     */
    virtual bool set_query_timeout(uint32_t timeout_ms) = 0;

    /**
     * @brief Close the connection and release resources
     */
    virtual void close() = 0;
};

/**
 * @brief Error kind for a failed statement
 *
 * Server-side timeout wins; otherwise a connection that dropped during the
 * call is reported as unavailable rather than as a statement failure.
 */
[[nodiscard]] inline ErrorCode classify_db_failure(const DbResultSet& result,
                                                   const IDbConnection& conn) {
    if (result.timed_out) return ErrorCode::TIMEOUT;
    if (!conn.is_connected()) return ErrorCode::CONNECTION_UNAVAILABLE;
    return ErrorCode::EXECUTION_FAILED;
}

} // namespace sqlgate
