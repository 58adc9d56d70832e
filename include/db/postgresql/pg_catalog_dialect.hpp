#pragma once

#include "db/icatalog_dialect.hpp"

namespace sqlgate {

/**
 * @brief PostgreSQL catalog queries (information_schema + pg_catalog)
 *
 * Array and user-defined columns report their udt_name ("_int4", "mood")
 * instead of information_schema's generic "ARRAY" / "USER-DEFINED".
 */
class PgCatalogDialect : public ICatalogDialect {
public:
    const std::string& tables_query() const override;
    const std::string& columns_query() const override;
    const std::string& foreign_keys_query() const override;
};

} // namespace sqlgate
