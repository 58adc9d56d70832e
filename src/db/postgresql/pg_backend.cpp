#include "db/postgresql/pg_backend.hpp"
#include "db/postgresql/pg_connection.hpp"
#include "db/postgresql/pg_catalog_dialect.hpp"
#include "db/generic_connection_pool.hpp"
#include "db/backend_registry.hpp"

namespace sqlgate {

std::shared_ptr<IConnectionPool> PgBackend::create_pool(
    const std::string& db_name,
    const PoolConfig& config) {

    return std::make_shared<GenericConnectionPool>(
        db_name, config, std::make_shared<PgConnectionFactory>());
}

std::shared_ptr<ICatalogDialect> PgBackend::create_catalog_dialect() {
    return std::make_shared<PgCatalogDialect>();
}

// Auto-register PostgreSQL backend at static initialization
namespace {
    struct PgBackendRegistrar {
        PgBackendRegistrar() {
            BackendRegistry::instance().register_backend(
                DatabaseType::POSTGRESQL,
                [] { return std::make_unique<PgBackend>(); });
        }
    };
    static PgBackendRegistrar pg_registrar;
}

} // namespace sqlgate
