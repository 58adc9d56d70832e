#pragma once

#include "core/types.hpp"

#include <toml++/toml.hpp>

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace sqlgate {

// ============================================================================
// Logging Config
// ============================================================================

struct LoggingConfig {
    std::string level = "info";
};

// ============================================================================
// Database Config
// ============================================================================

struct DatabaseConfig {
    std::string name = "default";
    std::string type_str = "postgresql";
    std::string connection_string;
    size_t min_connections = 0;
    size_t max_connections = 4;
    std::chrono::milliseconds connection_timeout{5000};
    std::chrono::milliseconds pool_acquire_timeout{5000};
    uint32_t idle_timeout_seconds = 300;
    uint32_t max_lifetime_seconds = 3600;
    std::string health_check_query = "SELECT 1";
};

// ============================================================================
// Validator Config
// ============================================================================

struct ValidatorConfig {
    // Upper-cased on load
    std::vector<std::string> allowed_keywords;
    std::vector<std::string> forbidden_keywords;
    size_t max_sql_length = 102400;
    bool preserve_executable_comments = true;
};

// ============================================================================
// Executor Config
// ============================================================================

struct ExecutorConfig {
    size_t max_statements = 20;
    uint32_t request_timeout_ms = 30000;
    size_t max_result_rows = 10000;
};

// ============================================================================
// Schema Config
// ============================================================================

struct SchemaConfig {
    std::vector<std::string> exclude_table_prefixes;
    bool include_views = true;
};

// ============================================================================
// Top-level Config
// ============================================================================

struct GatewayConfig {
    LoggingConfig logging;
    DatabaseConfig database;
    ValidatorConfig validator;
    ExecutorConfig executor;
    SchemaConfig schema;
};

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

class ConfigLoader {
public:
    struct LoadResult {
        bool success = false;
        std::string error_message;
        GatewayConfig config;

        static LoadResult ok(GatewayConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load complete config from TOML file
     * @param config_path Path to sqlgate.toml
     * @return LoadResult with parsed config or error
     *
     * Resolves `include = [...]` relative to the file's directory.
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string
     * @param toml_content TOML content
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Config used when no file is given: defaults plus DB_* environment
     */
    [[nodiscard]] static LoadResult load_defaults();

    /**
     * @brief Build a connection string from DB_USER, DB_PASSWORD, DB_HOST,
     *        DB_PORT and DB_NAME
     * @return Empty string when none of DB_HOST, DB_NAME, DB_USER is set
     *
     * PostgreSQL gets a libpq key/value string, MySQL a mysql:// URI.
     */
    [[nodiscard]] static std::string connection_string_from_env(const DatabaseConfig& db);

    /**
     * @brief Check cross-field constraints
     * @return One message per problem, empty when the config is usable
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const GatewayConfig& config);

private:
    static LoggingConfig extract_logging(const toml::table& root);
    static DatabaseConfig extract_database(const toml::table& root);
    static ValidatorConfig extract_validator(const toml::table& root);
    static ExecutorConfig extract_executor(const toml::table& root);
    static SchemaConfig extract_schema(const toml::table& root);

    static GatewayConfig extract_all_sections(const toml::table& tbl);
    static LoadResult validate_and_return(GatewayConfig config);
};

} // namespace sqlgate
