#include "db/postgresql/pg_connection.hpp"
#include "db/postgresql/pg_type_map.hpp"
#include "core/utils.hpp"
#include <cstring>
#include <format>

namespace sqlgate {

// ============================================================================
// PgConnection
// ============================================================================

PgConnection::PgConnection(PGConnPtr conn)
    : conn_(std::move(conn)) {}

PgConnection::~PgConnection() {
    close();
}

DbResultSet PgConnection::execute(const std::string& sql) {
    if (!conn_) {
        return DbResultSet::failure("Connection is closed");
    }

    PGResultPtr res(PQexecParams(conn_.get(), sql.c_str(),
                                 0, nullptr, nullptr, nullptr, nullptr, 0));
    if (!res) {
        return DbResultSet::failure(utils::trim(PQerrorMessage(conn_.get())));
    }

    switch (PQresultStatus(res.get())) {
        case PGRES_TUPLES_OK:
            return process_tuples_result(res.get());
        case PGRES_COMMAND_OK:
        case PGRES_EMPTY_QUERY:
            return process_command_result(res.get());
        default:
            return process_error_result(res.get());
    }
}

DbResultSet PgConnection::begin_read_only() {
    return execute("BEGIN TRANSACTION READ ONLY");
}

DbResultSet PgConnection::rollback() {
    return execute("ROLLBACK");
}

bool PgConnection::is_healthy(const std::string& health_check_query) {
    if (!is_connected()) {
        return false;
    }

    PGResultPtr res(PQexec(conn_.get(), health_check_query.c_str()));
    if (!res) {
        return false;
    }

    const ExecStatusType status = PQresultStatus(res.get());
    return status == PGRES_TUPLES_OK || status == PGRES_COMMAND_OK;
}

bool PgConnection::is_connected() const {
    return conn_ != nullptr && PQstatus(conn_.get()) == CONNECTION_OK;
}

bool PgConnection::set_query_timeout(uint32_t timeout_ms) {
    // Scoped to the open transaction; ROLLBACK restores the session value
    const auto result = execute(std::format("SET LOCAL statement_timeout = {}", timeout_ms));
    return result.success;
}

void PgConnection::close() {
    conn_.reset();
}

DbResultSet PgConnection::process_tuples_result(PGresult* res) {
    DbResultSet result;
    result.success = true;

    const int ncols = PQnfields(res);
    result.column_names.reserve(static_cast<size_t>(ncols));
    result.column_types.reserve(static_cast<size_t>(ncols));
    for (int i = 0; i < ncols; i++) {
        result.column_names.emplace_back(PQfname(res, i));
        result.column_types.push_back(
            PgTypeMap::build_type_info(static_cast<uint32_t>(PQftype(res, i))));
    }

    const int nrows = PQntuples(res);
    result.rows.reserve(static_cast<size_t>(nrows));

    for (int i = 0; i < nrows; i++) {
        ResultRow row;
        row.reserve(static_cast<size_t>(ncols));
        for (int j = 0; j < ncols; j++) {
            if (PQgetisnull(res, i, j)) {
                row.push_back(ResultValue::null());
                continue;
            }
            row.emplace_back(value_kind_for(result.column_types[static_cast<size_t>(j)].generic_type),
                             std::string(PQgetvalue(res, i, j),
                                         static_cast<size_t>(PQgetlength(res, i, j))));
        }
        result.rows.push_back(std::move(row));
    }

    result.affected_rows = result.rows.size();
    return result;
}

DbResultSet PgConnection::process_command_result(PGresult* res) {
    DbResultSet result;
    result.success = true;

    const char* affected = PQcmdTuples(res);
    if (affected && std::strlen(affected) > 0) {
        result.affected_rows = utils::parse_int<uint64_t>(affected);
    }

    return result;
}

DbResultSet PgConnection::process_error_result(PGresult* res) {
    const char* message = PQresultErrorMessage(res);
    auto result = DbResultSet::failure(utils::trim(
        (message && *message) ? message : PQerrorMessage(conn_.get())));

    const char* state = PQresultErrorField(res, PG_DIAG_SQLSTATE);
    result.timed_out = state && std::strcmp(state, kQueryCanceled) == 0;
    return result;
}

// ============================================================================
// PgConnectionFactory
// ============================================================================

std::unique_ptr<IDbConnection> PgConnectionFactory::create(
    const std::string& connection_string) {

    PGConnPtr conn(PQconnectdb(connection_string.c_str()));

    if (!conn) {
        utils::log::error("Failed to allocate PGconn");
        return nullptr;
    }

    if (PQstatus(conn.get()) != CONNECTION_OK) {
        utils::log::error(std::format("Failed to connect: {}",
            utils::trim(PQerrorMessage(conn.get()))));
        return nullptr;
    }

    return std::make_unique<PgConnection>(std::move(conn));
}

} // namespace sqlgate
