#include "core/utils.hpp"
#include "core/database_type.hpp"
#include "core/query_gateway.hpp"
#include "core/response_serializer.hpp"
#include "config/config_loader.hpp"
#include "db/backend_registry.hpp"
#include "db/idb_backend.hpp"
#include "db/iconnection_pool.hpp"

// Force-link backends (auto-register via static init)
#ifdef ENABLE_POSTGRESQL
#include "db/postgresql/pg_backend.hpp"
#endif
#ifdef ENABLE_MYSQL
#include "db/mysql/mysql_backend.hpp"
#endif

#include <cstdlib>
#include <exception>
#include <format>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace sqlgate;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitRequestFailed = 1;
constexpr int kExitUsage = 2;

// =========================================================================
// Explicit Backend Registration (ensures linker includes backend objects)
// =========================================================================

void register_backends() {
    #ifdef ENABLE_POSTGRESQL
    BackendRegistry::instance().register_backend(
        DatabaseType::POSTGRESQL,
        [] { return std::make_unique<PgBackend>(); });
    #endif

    #ifdef ENABLE_MYSQL
    BackendRegistry::instance().register_backend(
        DatabaseType::MYSQL,
        [] { return std::make_unique<MysqlBackend>(); });
    #endif
}

void print_usage() {
    std::cerr <<
        "usage: sqlgate [--config FILE] <command>\n"
        "\n"
        "commands:\n"
        "  query <SQL|->     validate and execute read-only SQL\n"
        "  check <SQL|->     validate only, print one verdict per statement\n"
        "  schema [SCHEMA]   describe tables, columns and foreign keys\n"
        "\n"
        "'-' reads the SQL from stdin. Without --config the settings come from\n"
        "defaults and DB_USER, DB_PASSWORD, DB_HOST, DB_PORT, DB_NAME.\n";
}

struct CommandLine {
    std::optional<std::string> config_file;
    std::string command;
    std::optional<std::string> argument;
};

std::optional<CommandLine> parse_command_line(int argc, char* argv[]) {
    CommandLine cmd;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--config" || arg == "-c") {
            if (i + 1 >= argc) return std::nullopt;
            cmd.config_file = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            return std::nullopt;
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.empty() || positional.size() > 2) return std::nullopt;
    cmd.command = positional[0];
    if (positional.size() == 2) cmd.argument = positional[1];

    if (cmd.command == "query" || cmd.command == "check") {
        if (!cmd.argument) return std::nullopt;
    } else if (cmd.command != "schema") {
        return std::nullopt;
    }
    return cmd;
}

std::string read_sql_argument(const std::string& argument) {
    if (argument != "-") return argument;
    return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
}

PoolConfig make_pool_config(const DatabaseConfig& db) {
    PoolConfig pool_config;
    pool_config.connection_string = db.connection_string;
    pool_config.min_connections = db.min_connections;
    pool_config.max_connections = db.max_connections;
    pool_config.connection_timeout = db.connection_timeout;
    pool_config.health_check_query = db.health_check_query;
    pool_config.idle_timeout = std::chrono::milliseconds{
        static_cast<int64_t>(db.idle_timeout_seconds) * 1000};
    pool_config.max_lifetime = std::chrono::seconds{db.max_lifetime_seconds};
    return pool_config;
}

QueryGateway::Config make_gateway_config(const GatewayConfig& cfg, const IDbBackend& backend) {
    QueryGateway::Config gateway_config;
    gateway_config.max_sql_length = cfg.validator.max_sql_length;
    gateway_config.rules = backend.sql_rules();
    gateway_config.preserve_executable_comments = cfg.validator.preserve_executable_comments;
    gateway_config.allowed_keywords = {cfg.validator.allowed_keywords.begin(),
                                       cfg.validator.allowed_keywords.end()};
    gateway_config.forbidden_keywords = {cfg.validator.forbidden_keywords.begin(),
                                         cfg.validator.forbidden_keywords.end()};
    gateway_config.executor.max_statements = cfg.executor.max_statements;
    gateway_config.executor.request_timeout_ms = cfg.executor.request_timeout_ms;
    gateway_config.executor.max_result_rows = cfg.executor.max_result_rows;
    gateway_config.schema.exclude_table_prefixes = cfg.schema.exclude_table_prefixes;
    gateway_config.schema.include_views = cfg.schema.include_views;
    gateway_config.acquire_timeout = cfg.database.pool_acquire_timeout;
    return gateway_config;
}

template<typename T>
int emit(const Result<T>& result, const ResponseSerializer::json& payload, std::string_view sql) {
    if (result.is_error()) {
        std::cout << ResponseSerializer::error_to_json(result, sql).dump(2) << '\n';
        return kExitRequestFailed;
    }
    std::cout << payload.dump(2) << '\n';
    return kExitOk;
}

int run_command(const CommandLine& cmd, const QueryGateway& gateway) {
    if (cmd.command == "check") {
        const std::string sql = read_sql_argument(*cmd.argument);
        const auto result = gateway.validate(sql);
        return emit(result, result.is_ok()
            ? ResponseSerializer::verdicts_to_json(sql, result.value())
            : ResponseSerializer::json{}, sql);
    }

    if (cmd.command == "query") {
        const std::string sql = read_sql_argument(*cmd.argument);
        const auto result = gateway.validate_and_execute(sql);
        return emit(result, result.is_ok()
            ? ResponseSerializer::batch_to_json(sql, result.value())
            : ResponseSerializer::json{}, sql);
    }

    const auto result = gateway.inspect_schema(cmd.argument);
    return emit(result, result.is_ok()
        ? ResponseSerializer::schema_to_json(result.value())
        : ResponseSerializer::json{}, {});
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    try {
        // Register all available backends
        register_backends();

        const auto cmd = parse_command_line(argc, argv);
        if (!cmd) {
            print_usage();
            return kExitUsage;
        }

        // Configuration
        const auto config_result = cmd->config_file
            ? ConfigLoader::load_from_file(*cmd->config_file)
            : ConfigLoader::load_defaults();
        if (!config_result.success) {
            utils::log::error(config_result.error_message);
            return kExitUsage;
        }
        const auto& cfg = config_result.config;

        if (const auto level = utils::log::parse_level(cfg.logging.level)) {
            utils::log::set_level(*level);
        }

        // Backend
        const auto db_type = parse_database_type(cfg.database.type_str);
        std::unique_ptr<IDbBackend> backend;
        try {
            backend = BackendRegistry::instance().create(db_type);
        } catch (const std::runtime_error& e) {
            utils::log::error(e.what());
            return kExitUsage;
        }

        utils::log::debug(std::format("Using {} backend for database '{}'",
            database_type_to_string(db_type), cfg.database.name));

        auto pool = backend->create_pool(cfg.database.name, make_pool_config(cfg.database));
        const QueryGateway gateway(make_gateway_config(cfg, *backend),
                                   backend->create_catalog_dialect(), pool);

        const int exit_code = run_command(*cmd, gateway);
        pool->drain();
        return exit_code;

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal error: {}", e.what()));
        return kExitRequestFailed;
    }
}
