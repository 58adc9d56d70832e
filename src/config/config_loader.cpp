#include "config/config_loader.hpp"
#include "core/database_type.hpp"
#include "core/utils.hpp"
#include "security/read_only_classifier.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <limits>
#include <optional>
#include <stdexcept>
#include <unordered_set>

using namespace std::string_literals;

namespace sqlgate {

// ============================================================================
// TOML Parsing Helpers (env expansion, includes, merging)
// ============================================================================

namespace {

constexpr int kMaxIncludeDepth = 10;

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 *
 * Unset variables expand to the empty string.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            if (const char* env_val = std::getenv(var_name.c_str())) {
                result += env_val;
            }
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_in_array(toml::array& arr);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            s = expand_env_vars(s.get());
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        } else if (val.is_array()) {
            expand_env_vars_in_array(*val.as_array());
        }
    }
}

void expand_env_vars_in_array(toml::array& arr) {
    for (auto& elem : arr) {
        if (elem.is_string()) {
            auto& s = *elem.as_string();
            s = expand_env_vars(s.get());
        } else if (elem.is_table()) {
            expand_env_vars_recursive(*elem.as_table());
        } else if (elem.is_array()) {
            expand_env_vars_in_array(*elem.as_array());
        }
    }
}

/**
 * @brief Deep-merge two toml::tables. Overlay wins for scalars and arrays.
 */
void merge_tables(toml::table& base, const toml::table& overlay) {
    for (const auto& [key, val] : overlay) {
        if (val.is_table() && base.contains(key.str()) && base[key.str()].is_table()) {
            merge_tables(*base[key.str()].as_table(), *val.as_table());
        } else {
            base.insert_or_assign(key, val);
        }
    }
}

/**
 * @brief Resolve include directives in a parsed TOML table.
 */
void resolve_includes(toml::table& root, const std::string& base_dir,
                      std::unordered_set<std::string>& visited, const int depth) {
    if (depth > kMaxIncludeDepth) {
        throw std::runtime_error(std::format(
            "Config include depth exceeds {}, possible circular include", kMaxIncludeDepth));
    }
    auto inc_node = root["include"];
    if (!inc_node) return;

    std::vector<std::string> paths;
    if (inc_node.is_string()) {
        paths.emplace_back(inc_node.as_string()->get());
    } else if (inc_node.is_array()) {
        for (const auto& item : *inc_node.as_array()) {
            if (item.is_string()) {
                paths.emplace_back(item.as_string()->get());
            }
        }
    }
    root.erase("include");

    for (const auto& rel_path : paths) {
        namespace fs = std::filesystem;
        const std::string abs_path = fs::canonical(fs::path(base_dir) / rel_path).string();

        if (!visited.insert(abs_path).second) {
            throw std::runtime_error(
                std::format("Circular config include detected: {}", abs_path));
        }

        auto included = toml::parse_file(abs_path);
        const std::string inc_dir = fs::path(abs_path).parent_path().string();
        resolve_includes(included, inc_dir, visited, depth + 1);

        // Included file is the base, the including file wins
        merge_tables(included, root);
        root = std::move(included);
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);

    namespace fs = std::filesystem;
    const std::string base_dir = fs::path(file_path).parent_path().string();
    std::unordered_set<std::string> visited;
    visited.insert(fs::canonical(file_path).string());
    resolve_includes(result, base_dir, visited, 0);

    expand_env_vars_recursive(result);
    return result;
}

// ---- Extraction helpers ----------------------------------------------------

std::optional<std::vector<std::string>> toml_string_array(const toml::table& tbl,
                                                          const std::string_view key) {
    const auto* arr = tbl[key].as_array();
    if (!arr) return std::nullopt;

    std::vector<std::string> result;
    result.reserve(arr->size());
    for (const auto& elem : *arr) {
        if (const auto* s = elem.as_string()) {
            result.emplace_back(s->get());
        }
    }
    return result;
}

// Integer that must not be negative; `path` names it in the error
template<typename T>
T toml_count(const toml::table& tbl, const std::string_view key, const T default_val,
             const std::string_view path) {
    const int64_t raw = tbl[key].value_or(static_cast<int64_t>(default_val));
    if (raw < 0) {
        throw std::runtime_error(std::format("{} must not be negative, got {}", path, raw));
    }
    if (static_cast<uint64_t>(raw) > static_cast<uint64_t>(std::numeric_limits<T>::max())) {
        throw std::runtime_error(std::format("{} is out of range, got {} (max {})",
                                             path, raw, std::numeric_limits<T>::max()));
    }
    return static_cast<T>(raw);
}

std::vector<std::string> normalize_keywords(std::vector<std::string> keywords) {
    std::vector<std::string> result;
    result.reserve(keywords.size());
    for (auto& kw : keywords) {
        auto upper = utils::to_upper(utils::trim_view(kw));
        if (!upper.empty() && std::find(result.begin(), result.end(), upper) == result.end()) {
            result.push_back(std::move(upper));
        }
    }
    return result;
}

std::vector<std::string> sorted_keywords(const std::unordered_set<std::string>& set) {
    std::vector<std::string> result(set.begin(), set.end());
    std::sort(result.begin(), result.end());
    return result;
}

std::string env_or(const char* name, const std::string& fallback) {
    const char* val = std::getenv(name);
    return (val && *val) ? std::string(val) : fallback;
}

// libpq key/value quoting: 'value' with \ and ' backslash-escaped
std::string pg_quote(const std::string& value) {
    std::string out = "'";
    for (const char c : value) {
        if (c == '\\' || c == '\'') out += '\\';
        out += c;
    }
    out += '\'';
    return out;
}

std::string percent_encode(const std::string& value) {
    static constexpr char kHex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(value.size());
    for (const char c : value) {
        const auto uc = static_cast<unsigned char>(c);
        if ((uc >= 'A' && uc <= 'Z') || (uc >= 'a' && uc <= 'z') ||
            (uc >= '0' && uc <= '9') || uc == '-' || uc == '_' || uc == '.' || uc == '~') {
            out += c;
        } else {
            out += '%';
            out += kHex[uc >> 4];
            out += kHex[uc & 0x0F];
        }
    }
    return out;
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;

    cfg.level = utils::to_lower((*logging)["level"].value_or("info"s));
    return cfg;
}

DatabaseConfig ConfigLoader::extract_database(const toml::table& root) {
    DatabaseConfig cfg;
    if (const auto* db = root["database"].as_table()) {
        const auto& d = *db;
        cfg.name = d["name"].value_or("default"s);
        cfg.type_str = d["type"].value_or("postgresql"s);
        cfg.connection_string = d["connection_string"].value_or(""s);
        cfg.min_connections = toml_count<size_t>(d, "min_connections", 0, "database.min_connections");
        cfg.max_connections = toml_count<size_t>(d, "max_connections", 4, "database.max_connections");
        cfg.connection_timeout = std::chrono::milliseconds(
            toml_count<int64_t>(d, "connection_timeout_ms", 5000, "database.connection_timeout_ms"));
        cfg.pool_acquire_timeout = std::chrono::milliseconds(
            toml_count<int64_t>(d, "pool_acquire_timeout_ms", 5000, "database.pool_acquire_timeout_ms"));
        cfg.idle_timeout_seconds =
            toml_count<uint32_t>(d, "idle_timeout_seconds", 300, "database.idle_timeout_seconds");
        cfg.max_lifetime_seconds =
            toml_count<uint32_t>(d, "max_lifetime_seconds", 3600, "database.max_lifetime_seconds");
        cfg.health_check_query = d["health_check_query"].value_or("SELECT 1"s);
    }

    if (cfg.connection_string.empty()) {
        cfg.connection_string = connection_string_from_env(cfg);
    }
    return cfg;
}

ValidatorConfig ConfigLoader::extract_validator(const toml::table& root) {
    ValidatorConfig cfg;
    cfg.allowed_keywords = sorted_keywords(ReadOnlyClassifier::default_allowed_keywords());
    cfg.forbidden_keywords = sorted_keywords(ReadOnlyClassifier::default_forbidden_keywords());

    const auto* validator = root["validator"].as_table();
    if (!validator) return cfg;
    const auto& v = *validator;

    if (auto allowed = toml_string_array(v, "allowed_keywords")) {
        cfg.allowed_keywords = normalize_keywords(std::move(*allowed));
    }
    if (auto forbidden = toml_string_array(v, "forbidden_keywords")) {
        cfg.forbidden_keywords = normalize_keywords(std::move(*forbidden));
    }
    cfg.max_sql_length = toml_count<size_t>(v, "max_sql_length", 102400, "validator.max_sql_length");
    cfg.preserve_executable_comments = v["preserve_executable_comments"].value_or(true);
    return cfg;
}

ExecutorConfig ConfigLoader::extract_executor(const toml::table& root) {
    ExecutorConfig cfg;
    const auto* executor = root["executor"].as_table();
    if (!executor) return cfg;
    const auto& e = *executor;

    cfg.max_statements = toml_count<size_t>(e, "max_statements", 20, "executor.max_statements");
    cfg.request_timeout_ms =
        toml_count<uint32_t>(e, "request_timeout_ms", 30000, "executor.request_timeout_ms");
    cfg.max_result_rows = toml_count<size_t>(e, "max_result_rows", 10000, "executor.max_result_rows");
    return cfg;
}

SchemaConfig ConfigLoader::extract_schema(const toml::table& root) {
    SchemaConfig cfg;
    const auto* schema = root["schema"].as_table();
    if (!schema) return cfg;
    const auto& s = *schema;

    if (auto prefixes = toml_string_array(s, "exclude_table_prefixes")) {
        cfg.exclude_table_prefixes = std::move(*prefixes);
    }
    cfg.include_views = s["include_views"].value_or(true);
    return cfg;
}

std::string ConfigLoader::connection_string_from_env(const DatabaseConfig& db) {
    const std::string host = env_or("DB_HOST", "");
    const std::string name = env_or("DB_NAME", "");
    const std::string user = env_or("DB_USER", "");
    if (host.empty() && name.empty() && user.empty()) {
        return "";
    }
    const std::string password = env_or("DB_PASSWORD", "");

    if (!is_known_database_type(db.type_str)) {
        return "";
    }
    const DatabaseType type = parse_database_type(db.type_str);

    if (type == DatabaseType::MYSQL) {
        const std::string port = env_or("DB_PORT", "3306");
        std::string creds = percent_encode(user);
        if (!password.empty()) {
            creds += ':';
            creds += percent_encode(password);
        }
        return std::format("mysql://{}@{}:{}/{}",
                           creds, host.empty() ? "localhost"s : host, port, name);
    }

    const std::string port = env_or("DB_PORT", "5432");
    const auto connect_timeout_s = std::max<int64_t>(1,
        std::chrono::duration_cast<std::chrono::seconds>(db.connection_timeout).count());

    std::string conninfo = std::format("host={} port={}",
        pg_quote(host.empty() ? "localhost"s : host), pg_quote(port));
    if (!name.empty()) conninfo += " dbname=" + pg_quote(name);
    if (!user.empty()) conninfo += " user=" + pg_quote(user);
    if (!password.empty()) conninfo += " password=" + pg_quote(password);
    conninfo += std::format(" connect_timeout={}", connect_timeout_s);
    return conninfo;
}

// ---- Shared extraction + validation ----------------------------------------

GatewayConfig ConfigLoader::extract_all_sections(const toml::table& tbl) {
    GatewayConfig config;
    config.logging = extract_logging(tbl);
    config.database = extract_database(tbl);
    config.validator = extract_validator(tbl);
    config.executor = extract_executor(tbl);
    config.schema = extract_schema(tbl);
    return config;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(GatewayConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_defaults() {
    return load_from_string("");
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const GatewayConfig& config) {
    std::vector<std::string> errors;

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format(
            "logging.level must be one of debug, info, warn, error, got '{}'", config.logging.level));
    }

    const auto& db = config.database;
    if (!is_known_database_type(db.type_str)) {
        errors.push_back(std::format(
            "database.type must be postgresql or mysql, got '{}'", db.type_str));
    }
    if (db.connection_string.empty()) {
        errors.push_back(
            "database.connection_string must not be empty (set it or DB_HOST/DB_NAME/DB_USER)");
    }
    if (db.max_connections == 0) {
        errors.push_back("database.max_connections must be > 0");
    }
    if (db.min_connections > db.max_connections) {
        errors.push_back(std::format(
            "database.min_connections ({}) > max_connections ({})",
            db.min_connections, db.max_connections));
    }

    if (config.validator.allowed_keywords.empty()) {
        errors.push_back("validator.allowed_keywords must not be empty");
    }

    if (config.executor.max_statements == 0) {
        errors.push_back("executor.max_statements must be > 0");
    }
    if (config.executor.request_timeout_ms == 0) {
        errors.push_back("executor.request_timeout_ms must be > 0");
    }

    return errors;
}

} // namespace sqlgate
