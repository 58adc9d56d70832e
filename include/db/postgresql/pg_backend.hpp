#pragma once

#include "db/idb_backend.hpp"

namespace sqlgate {

/**
 * @brief PostgreSQL backend — creates all PG-specific components
 *
 * Creates:
 * - PgConnectionFactory → GenericConnectionPool
 * - PgCatalogDialect (information_schema + pg_constraint)
 *
 * Auto-registers with BackendRegistry at static init time.
 */
class PgBackend : public IDbBackend {
public:
    [[nodiscard]] SqlDialectRules sql_rules() const override {
        return SqlDialectRules::postgresql();
    }

    [[nodiscard]] std::shared_ptr<IConnectionPool> create_pool(
        const std::string& db_name,
        const PoolConfig& config) override;

    [[nodiscard]] std::shared_ptr<ICatalogDialect> create_catalog_dialect() override;
};

} // namespace sqlgate
