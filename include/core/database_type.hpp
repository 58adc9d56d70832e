#pragma once

#include <string>
#include <string_view>
#include <stdexcept>
#include <algorithm>
#include <cctype>
#include <iterator>
#include <format>
#include <unordered_map>

namespace sqlgate {

namespace keys {
    inline constexpr std::string_view POSTGRES = "postgres";
    inline constexpr std::string_view POSTGRESQL = "postgresql";
    inline constexpr std::string_view PG = "pg";
    inline constexpr std::string_view MYSQL = "mysql";
    inline constexpr std::string_view MARIADB = "mariadb";
}

enum class DatabaseType {
    POSTGRESQL,
    MYSQL,
};

[[nodiscard]] inline std::string_view database_type_to_string(DatabaseType type) {
    switch (type) {
        case DatabaseType::POSTGRESQL: return keys::POSTGRESQL;
        case DatabaseType::MYSQL: return keys::MYSQL;
        default: return "unknown";
    }
}

[[nodiscard]] inline bool is_known_database_type(std::string_view type_str) {
    static constexpr std::string_view known[] = {
        keys::POSTGRESQL, keys::POSTGRES, keys::PG, keys::MYSQL, keys::MARIADB
    };
    return std::any_of(std::begin(known), std::end(known), [&](std::string_view key) {
        return key.size() == type_str.size() &&
               std::equal(key.begin(), key.end(), type_str.begin(),
                   [](char a, char b) { return std::tolower(a) == std::tolower(b); });
    });
}

[[nodiscard]] inline DatabaseType parse_database_type(std::string_view type_str) {
    static const std::unordered_map<std::string_view, DatabaseType> lookup = {
        {keys::POSTGRESQL, DatabaseType::POSTGRESQL},
        {keys::POSTGRES,   DatabaseType::POSTGRESQL},
        {keys::PG,         DatabaseType::POSTGRESQL},
        {keys::MYSQL,      DatabaseType::MYSQL},
        {keys::MARIADB,    DatabaseType::MYSQL}
    };

    if (const auto it = lookup.find(type_str); it != lookup.end()) {
        return it->second;
    }

    // Case-insensitive fallback, only when the direct lookup misses
    for (const auto& [key, value] : lookup) {
        if (key.size() == type_str.size()) {
            const bool match = std::equal(key.begin(), key.end(), type_str.begin(),
                [](char a, char b) { return std::tolower(a) == std::tolower(b); });
            if (match) return value;
        }
    }

    throw std::runtime_error(std::format("Unknown database type: {}", type_str));
}

} // namespace sqlgate
