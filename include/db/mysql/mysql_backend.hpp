#pragma once

#include "db/idb_backend.hpp"

namespace sqlgate {

/**
 * @brief MySQL backend — creates all MySQL-specific components
 *
 * Creates:
 * - MysqlConnectionFactory → GenericConnectionPool
 * - MysqlCatalogDialect (information_schema)
 *
 * Serves MariaDB as well. Auto-registers with BackendRegistry at static
 * init time.
 */
class MysqlBackend : public IDbBackend {
public:
    [[nodiscard]] SqlDialectRules sql_rules() const override {
        return SqlDialectRules::mysql();
    }

    [[nodiscard]] std::shared_ptr<IConnectionPool> create_pool(
        const std::string& db_name,
        const PoolConfig& config) override;

    [[nodiscard]] std::shared_ptr<ICatalogDialect> create_catalog_dialect() override;
};

} // namespace sqlgate
