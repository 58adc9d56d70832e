#pragma once

#include "db/idb_connection.hpp"
#include "db/iconnection_factory.hpp"
#include <libpq-fe.h>
#include <memory>
#include <string>

namespace sqlgate {

// RAII wrappers for libpq resources
struct PGConnDeleter {
    void operator()(PGconn* conn) const noexcept {
        if (conn) {
            PQfinish(conn);
        }
    }
};
using PGConnPtr = std::unique_ptr<PGconn, PGConnDeleter>;

struct PGResultDeleter {
    void operator()(PGresult* res) const noexcept {
        if (res) {
            PQclear(res);
        }
    }
};
using PGResultPtr = std::unique_ptr<PGresult, PGResultDeleter>;

/**
 * @brief PostgreSQL connection implementing IDbConnection
 *
 * Statements go through PQexecParams (extended query protocol), where the
 * server rejects a query string holding more than one command.
 */
class PgConnection : public IDbConnection {
public:
    /**
     * @brief Construct from an open connection (takes ownership)
     */
    explicit PgConnection(PGConnPtr conn);

    ~PgConnection() override;

    PgConnection(const PgConnection&) = delete;
    PgConnection& operator=(const PgConnection&) = delete;

    DbResultSet execute(const std::string& sql) override;
    DbResultSet begin_read_only() override;
    DbResultSet rollback() override;
    bool is_healthy(const std::string& health_check_query) override;
    bool is_connected() const override;
    bool set_query_timeout(uint32_t timeout_ms) override;
    void close() override;

    // SQLSTATE query_canceled, raised when statement_timeout fires
    static constexpr const char* kQueryCanceled = "57014";

private:
    DbResultSet process_tuples_result(PGresult* res);
    DbResultSet process_command_result(PGresult* res);
    DbResultSet process_error_result(PGresult* res);

    PGConnPtr conn_;
};

/**
 * @brief PostgreSQL connection factory
 *
 * Accepts any libpq connection string (key=value or postgresql:// URI).
 */
class PgConnectionFactory : public IConnectionFactory {
public:
    std::unique_ptr<IDbConnection> create(const std::string& connection_string) override;
};

} // namespace sqlgate
