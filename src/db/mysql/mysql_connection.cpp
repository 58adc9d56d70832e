#include "db/mysql/mysql_connection.hpp"
#include "db/mysql/mysql_type_map.hpp"
#include "core/utils.hpp"
#include <mysql/errmsg.h>
#include <format>

namespace sqlgate {

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string percent_decode(std::string_view in) {
    std::string out;
    out.reserve(in.size());
    for (size_t i = 0; i < in.size(); ++i) {
        if (in[i] == '%' && i + 2 < in.size()) {
            const int hi = hex_value(in[i + 1]);
            const int lo = hex_value(in[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out += static_cast<char>(hi * 16 + lo);
                i += 2;
                continue;
            }
        }
        out += in[i];
    }
    return out;
}

// Modes that change where literals end: NO_BACKSLASH_ESCAPES, ANSI_QUOTES and
// the combination modes that imply ANSI_QUOTES
bool changes_quoting(std::string_view mode) {
    static constexpr std::string_view modes[] = {
        "NO_BACKSLASH_ESCAPES", "ANSI_QUOTES", "ANSI",
        "DB2", "MAXDB", "MSSQL", "ORACLE", "POSTGRESQL"
    };
    for (const auto m : modes) {
        if (m == mode) return true;
    }
    return false;
}

// `current` with the quoting modes removed
std::string lexical_sql_mode(std::string_view current) {
    std::string result;
    while (!current.empty()) {
        const size_t comma = current.find(',');
        const std::string_view mode = utils::trim_view(current.substr(0, comma));
        current = comma == std::string_view::npos ? std::string_view{} : current.substr(comma + 1);
        if (mode.empty() || changes_quoting(mode)) continue;
        if (!result.empty()) result += ',';
        result += mode;
    }
    return result;
}

} // anonymous namespace

MysqlConnection::MysqlConnection(MYSQL* conn)
    : conn_(conn) {}

MysqlConnection::~MysqlConnection() {
    close();
}

DbResultSet MysqlConnection::execute(const std::string& sql) {
    if (!conn_) {
        return DbResultSet::failure("Connection is closed");
    }

    if (mysql_real_query(conn_, sql.data(), static_cast<unsigned long>(sql.size())) != 0) {
        return process_error();
    }

    DbResultSet result;
    MYSQL_RES* res = mysql_store_result(conn_);
    if (res) {
        result = process_result_set(res);
        mysql_free_result(res);
    } else if (mysql_field_count(conn_) == 0) {
        // Statement without a result set
        result = process_affected_rows();
    } else {
        // Result set expected but could not be read
        result = process_error();
    }

    return result;
}

DbResultSet MysqlConnection::begin_read_only() {
    return execute("START TRANSACTION READ ONLY");
}

DbResultSet MysqlConnection::rollback() {
    return execute("ROLLBACK");
}

DbResultSet MysqlConnection::process_result_set(MYSQL_RES* res) {
    DbResultSet result;
    result.success = true;

    const unsigned int num_fields = mysql_num_fields(res);
    MYSQL_FIELD* fields = mysql_fetch_fields(res);

    result.column_names.reserve(num_fields);
    result.column_types.reserve(num_fields);

    for (unsigned int i = 0; i < num_fields; ++i) {
        result.column_names.emplace_back(fields[i].name);
        result.column_types.push_back(MysqlTypeMap::build_type_info(fields[i]));
    }

    MYSQL_ROW row;
    while ((row = mysql_fetch_row(res)) != nullptr) {
        const unsigned long* lengths = mysql_fetch_lengths(res);
        ResultRow row_data;
        row_data.reserve(num_fields);

        for (unsigned int i = 0; i < num_fields; ++i) {
            if (!row[i]) {
                row_data.push_back(ResultValue::null());
                continue;
            }
            row_data.emplace_back(value_kind_for(result.column_types[i].generic_type),
                                  std::string(row[i], lengths[i]));
        }

        result.rows.push_back(std::move(row_data));
    }

    result.affected_rows = result.rows.size();
    return result;
}

DbResultSet MysqlConnection::process_affected_rows() {
    DbResultSet result;
    result.success = true;
    result.affected_rows = static_cast<uint64_t>(mysql_affected_rows(conn_));
    return result;
}

DbResultSet MysqlConnection::process_error() {
    const unsigned int err = mysql_errno(conn_);
    auto result = DbResultSet::failure(mysql_error(conn_));
    result.timed_out = (err == kMysqlQueryTimeout || err == kMariadbStatementTimeout);

    if (err == CR_SERVER_GONE_ERROR || err == CR_SERVER_LOST) {
        broken_ = true;
    }
    return result;
}

bool MysqlConnection::is_healthy(const std::string& health_check_query) {
    if (!is_connected()) {
        return false;
    }

    if (mysql_ping(conn_) != 0) {
        return false;
    }

    if (!health_check_query.empty()) {
        if (mysql_query(conn_, health_check_query.c_str()) != 0) {
            return false;
        }
        MYSQL_RES* res = mysql_store_result(conn_);
        if (res) {
            mysql_free_result(res);
        }
    }

    return true;
}

bool MysqlConnection::is_connected() const {
    return conn_ != nullptr && !broken_;
}

bool MysqlConnection::set_query_timeout(uint32_t timeout_ms) {
    if (!conn_) {
        return false;
    }

    if (!use_statement_time_) {
        // MySQL 5.7.8+; applies to SELECT statements
        const auto result = execute(std::format("SET SESSION max_execution_time = {}", timeout_ms));
        if (result.success) {
            return true;
        }
        if (mysql_errno(conn_) != kUnknownSystemVariable) {
            return false;
        }
        use_statement_time_ = true;
    }

    const auto result = execute(std::format("SET SESSION max_statement_time = {:.3f}",
                                            static_cast<double>(timeout_ms) / 1000.0));
    return result.success;
}

bool MysqlConnection::pin_lexical_sql_mode() {
    const auto current = execute("SELECT @@SESSION.sql_mode");
    if (!current.success || current.rows.size() != 1 || current.rows[0].size() != 1) {
        return false;
    }

    const std::string& mode = current.rows[0][0].text;
    const std::string pinned = lexical_sql_mode(mode);
    if (pinned == mode) {
        return true;
    }

    utils::log::debug(std::format("MySQL sql_mode '{}' pinned to '{}'", mode, pinned));
    return execute(std::format("SET SESSION sql_mode = '{}'", pinned)).success;
}

void MysqlConnection::close() {
    if (conn_) {
        mysql_close(conn_);
        conn_ = nullptr;
    }
}

// ============================================================================
// MysqlConnectionFactory
// ============================================================================

std::unique_ptr<IDbConnection> MysqlConnectionFactory::create(
    const std::string& connection_string) {

    const auto params = parse_connection_string(connection_string);

    MYSQL* conn = mysql_init(nullptr);
    if (!conn) {
        utils::log::error("mysql_init failed");
        return nullptr;
    }

    unsigned int timeout = connect_timeout_seconds_;
    mysql_options(conn, MYSQL_OPT_CONNECT_TIMEOUT, &timeout);
    mysql_options(conn, MYSQL_SET_CHARSET_NAME, "utf8mb4");

    MYSQL* result = mysql_real_connect(
        conn,
        params.host.c_str(),
        params.user.c_str(),
        params.password.c_str(),
        params.database.empty() ? nullptr : params.database.c_str(),
        params.port,
        nullptr,  // unix socket
        0         // client flags: no CLIENT_MULTI_STATEMENTS
    );

    if (!result) {
        utils::log::error(std::format("MySQL connection failed: {}", mysql_error(conn)));
        mysql_close(conn);
        return nullptr;
    }

    auto connection = std::make_unique<MysqlConnection>(conn);
    if (!connection->pin_lexical_sql_mode()) {
        utils::log::error(std::format("MySQL sql_mode could not be pinned: {}", mysql_error(conn)));
        return nullptr;
    }
    return connection;
}

MysqlConnectionFactory::ConnParams MysqlConnectionFactory::parse_connection_string(
    const std::string& conn_str) {

    ConnParams params;
    params.host = "localhost";
    params.port = 3306;

    std::string_view sv(conn_str);

    if (sv.starts_with("mysql://")) {
        sv.remove_prefix(8);
    } else if (sv.starts_with("mariadb://")) {
        sv.remove_prefix(10);
    }

    // Last '@' separates credentials from host; passwords may contain '@'
    const size_t at_pos = sv.rfind('@');
    if (at_pos != std::string_view::npos) {
        const std::string_view creds = sv.substr(0, at_pos);
        sv.remove_prefix(at_pos + 1);

        const size_t colon_pos = creds.find(':');
        if (colon_pos != std::string_view::npos) {
            params.user = percent_decode(creds.substr(0, colon_pos));
            params.password = percent_decode(creds.substr(colon_pos + 1));
        } else {
            params.user = percent_decode(creds);
        }
    }

    std::string_view host_port = sv;
    const size_t slash_pos = sv.find('/');
    if (slash_pos != std::string_view::npos) {
        host_port = sv.substr(0, slash_pos);
        std::string_view database = sv.substr(slash_pos + 1);
        if (const size_t query = database.find('?'); query != std::string_view::npos) {
            database = database.substr(0, query);
        }
        params.database = std::string(database);
    }

    const size_t colon_pos = host_port.find(':');
    if (colon_pos != std::string_view::npos) {
        params.host = std::string(host_port.substr(0, colon_pos));
        params.port = utils::parse_int<unsigned int>(host_port.substr(colon_pos + 1), 3306u);
    } else if (!host_port.empty()) {
        params.host = std::string(host_port);
    }

    return params;
}

} // namespace sqlgate
