#include "db/mysql/mysql_catalog_dialect.hpp"

namespace sqlgate {

namespace {

constexpr const char* kSystemSchemas =
    "('mysql', 'information_schema', 'performance_schema', 'sys')";

} // anonymous namespace

const std::string& MysqlCatalogDialect::tables_query() const {
    static const std::string QUERY = std::string(
        "SELECT "
        "    TABLE_SCHEMA, "
        "    TABLE_NAME, "
        "    TABLE_TYPE "
        "FROM information_schema.TABLES "
        "WHERE TABLE_SCHEMA NOT IN ") + kSystemSchemas +
        "  AND TABLE_TYPE IN ('BASE TABLE', 'VIEW') "
        "ORDER BY TABLE_SCHEMA, TABLE_NAME";
    return QUERY;
}

const std::string& MysqlCatalogDialect::columns_query() const {
    static const std::string QUERY = std::string(
        "SELECT "
        "    TABLE_SCHEMA, "
        "    TABLE_NAME, "
        "    COLUMN_NAME, "
        "    COLUMN_TYPE, "
        "    IS_NULLABLE, "
        "    ORDINAL_POSITION "
        "FROM information_schema.COLUMNS "
        "WHERE TABLE_SCHEMA NOT IN ") + kSystemSchemas +
        " ORDER BY TABLE_SCHEMA, TABLE_NAME, ORDINAL_POSITION";
    return QUERY;
}

const std::string& MysqlCatalogDialect::foreign_keys_query() const {
    static const std::string QUERY = std::string(
        "SELECT "
        "    TABLE_SCHEMA, "
        "    TABLE_NAME, "
        "    CONSTRAINT_NAME, "
        "    COLUMN_NAME, "
        "    REFERENCED_TABLE_SCHEMA, "
        "    REFERENCED_TABLE_NAME, "
        "    REFERENCED_COLUMN_NAME, "
        "    ORDINAL_POSITION "
        "FROM information_schema.KEY_COLUMN_USAGE "
        "WHERE REFERENCED_TABLE_NAME IS NOT NULL "
        "  AND TABLE_SCHEMA NOT IN ") + kSystemSchemas +
        " ORDER BY TABLE_SCHEMA, TABLE_NAME, CONSTRAINT_NAME, ORDINAL_POSITION";
    return QUERY;
}

} // namespace sqlgate
