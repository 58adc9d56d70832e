#include "db/postgresql/pg_catalog_dialect.hpp"

namespace sqlgate {

namespace {

constexpr const char* kSystemSchemas = "('pg_catalog', 'information_schema')";

} // anonymous namespace

const std::string& PgCatalogDialect::tables_query() const {
    static const std::string QUERY = std::string(
        "SELECT "
        "    table_schema, "
        "    table_name, "
        "    table_type "
        "FROM information_schema.tables "
        "WHERE table_schema NOT IN ") + kSystemSchemas +
        "  AND table_schema NOT LIKE 'pg\\_toast%' "
        "  AND table_type IN ('BASE TABLE', 'VIEW') "
        "ORDER BY table_schema, table_name";
    return QUERY;
}

const std::string& PgCatalogDialect::columns_query() const {
    static const std::string QUERY = std::string(
        "SELECT "
        "    table_schema, "
        "    table_name, "
        "    column_name, "
        "    CASE WHEN data_type IN ('ARRAY', 'USER-DEFINED') THEN udt_name "
        "         ELSE data_type END, "
        "    is_nullable, "
        "    ordinal_position "
        "FROM information_schema.columns "
        "WHERE table_schema NOT IN ") + kSystemSchemas +
        " ORDER BY table_schema, table_name, ordinal_position";
    return QUERY;
}

const std::string& PgCatalogDialect::foreign_keys_query() const {
    // conkey/confkey are parallel arrays; unnest keeps the pairs aligned
    static const std::string QUERY = std::string(
        "SELECT "
        "    ns.nspname, "
        "    cl.relname, "
        "    con.conname, "
        "    la.attname, "
        "    rns.nspname, "
        "    rcl.relname, "
        "    ra.attname, "
        "    k.ord "
        "FROM pg_catalog.pg_constraint con "
        "JOIN pg_catalog.pg_class cl ON cl.oid = con.conrelid "
        "JOIN pg_catalog.pg_namespace ns ON ns.oid = cl.relnamespace "
        "JOIN pg_catalog.pg_class rcl ON rcl.oid = con.confrelid "
        "JOIN pg_catalog.pg_namespace rns ON rns.oid = rcl.relnamespace "
        "CROSS JOIN LATERAL unnest(con.conkey, con.confkey) "
        "    WITH ORDINALITY AS k(local_attnum, ref_attnum, ord) "
        "JOIN pg_catalog.pg_attribute la "
        "    ON la.attrelid = con.conrelid AND la.attnum = k.local_attnum "
        "JOIN pg_catalog.pg_attribute ra "
        "    ON ra.attrelid = con.confrelid AND ra.attnum = k.ref_attnum "
        "WHERE con.contype = 'f' "
        "  AND ns.nspname NOT IN ") + kSystemSchemas +
        " ORDER BY ns.nspname, cl.relname, con.conname, k.ord";
    return QUERY;
}

} // namespace sqlgate
