#include "db/mysql/mysql_backend.hpp"
#include "db/mysql/mysql_connection.hpp"
#include "db/mysql/mysql_catalog_dialect.hpp"
#include "db/generic_connection_pool.hpp"
#include "db/backend_registry.hpp"

#include <algorithm>

namespace sqlgate {

std::shared_ptr<IConnectionPool> MysqlBackend::create_pool(
    const std::string& db_name,
    const PoolConfig& config) {

    // mysql_options takes whole seconds
    const auto timeout_s = std::max<long long>(1,
        std::chrono::duration_cast<std::chrono::seconds>(config.connection_timeout).count());
    auto factory = std::make_shared<MysqlConnectionFactory>(static_cast<unsigned int>(timeout_s));
    return std::make_shared<GenericConnectionPool>(db_name, config, std::move(factory));
}

std::shared_ptr<ICatalogDialect> MysqlBackend::create_catalog_dialect() {
    return std::make_shared<MysqlCatalogDialect>();
}

// Auto-register MySQL backend at static initialization
namespace {
    struct MysqlBackendRegistrar {
        MysqlBackendRegistrar() {
            BackendRegistry::instance().register_backend(
                DatabaseType::MYSQL,
                [] { return std::make_unique<MysqlBackend>(); });
        }
    };
    static MysqlBackendRegistrar mysql_registrar;
}

} // namespace sqlgate
