#pragma once

#include "parser/sql_scanner.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace sqlgate {

/**
 * @brief Splits raw request text into candidate statements
 *
 * Splits on the terminator outside quoted regions. Every returned statement
 * is trimmed and non-empty; any input, however malformed, yields a sequence
 * (a single statement when no unquoted terminator exists, or nothing for
 * blank input).
 */
class StatementSplitter {
public:
    struct Config {
        char terminator = ';';
        SqlDialectRules rules;
    };

    StatementSplitter() : StatementSplitter(Config{}) {}
    explicit StatementSplitter(const Config& config);

    [[nodiscard]] std::vector<std::string> split(std::string_view raw) const;

private:
    Config config_;
};

} // namespace sqlgate
