#pragma once

#include "db/icatalog_dialect.hpp"
#include "db/iconnection_pool.hpp"
#include "parser/sql_scanner.hpp"
#include <memory>
#include <string>

namespace sqlgate {

/**
 * @brief Abstract database backend — creates all DB-specific components
 *
 * Each database type (PostgreSQL, MySQL) provides a concrete implementation
 * that creates the right connection pool and catalog dialect, and
 * describes the lexical rules its server applies to SQL text.
 *
 * Usage:
 *   auto backend = BackendRegistry::instance().create(DatabaseType::POSTGRESQL);
 *   auto pool = backend->create_pool("analytics", pool_config);
 *   auto catalog = backend->create_catalog_dialect();
 */
class IDbBackend {
public:
    virtual ~IDbBackend() = default;

    /** @brief Lexical rules for splitting, stripping and classifying */
    [[nodiscard]] virtual SqlDialectRules sql_rules() const = 0;

    /** @brief Create a connection pool */
    [[nodiscard]] virtual std::shared_ptr<IConnectionPool> create_pool(
        const std::string& db_name,
        const PoolConfig& config) = 0;

    /** @brief Create the catalog queries for this dialect */
    [[nodiscard]] virtual std::shared_ptr<ICatalogDialect> create_catalog_dialect() = 0;
};

} // namespace sqlgate
