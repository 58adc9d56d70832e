#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace sqlgate {

/**
 * @brief Lexical rules that change where quoted regions and comments end
 *
 * The generic rules only know single/double quotes with doubled-quote
 * escapes. Dialect rules add the constructs a server would otherwise read
 * differently from the scanner: a region the server considers closed must
 * never look open to the scanner, or text could hide inside a "literal".
 *
 * The MySQL rules assume the server's default sql_mode; connections pin
 * NO_BACKSLASH_ESCAPES and ANSI_QUOTES off (see MysqlConnectionFactory).
 */
struct SqlDialectRules {
    enum class Backslash {
        LITERAL,              // '\' has no special meaning
        ESCAPE_IN_E_STRINGS,  // PostgreSQL: only inside E'...'
        ESCAPE_ALWAYS         // MySQL: inside every quoted literal
    };

    Backslash backslash = Backslash::LITERAL;
    bool dollar_quotes = false;   // PostgreSQL $tag$...$tag$
    bool hash_comments = false;   // MySQL '#' line comments
    bool backtick_identifiers = false;  // MySQL `ident`, `` escapes a backtick
    bool executable_comments = false;  // MySQL /*! ... */ bodies run as SQL

    [[nodiscard]] static SqlDialectRules generic() { return {}; }

    [[nodiscard]] static SqlDialectRules postgresql() {
        SqlDialectRules rules;
        rules.backslash = Backslash::ESCAPE_IN_E_STRINGS;
        rules.dollar_quotes = true;
        return rules;
    }

    [[nodiscard]] static SqlDialectRules mysql() {
        SqlDialectRules rules;
        rules.backslash = Backslash::ESCAPE_ALWAYS;
        rules.hash_comments = true;
        rules.backtick_identifiers = true;
        rules.executable_comments = true;
        return rules;
    }
};

namespace scan {

inline constexpr size_t npos = std::string_view::npos;

/**
 * @brief End of the quoted region that starts at `pos`
 * @return Offset one past the closing delimiter, sql.size() when the region
 *         is unterminated, or npos when `pos` does not open a quoted region.
 */
[[nodiscard]] size_t quoted_region_end(std::string_view sql, size_t pos,
                                       const SqlDialectRules& rules);

/**
 * @brief Find `target` at or after `start`, skipping quoted regions
 *
 * Comments are not skipped; callers that need that run on stripped text.
 */
[[nodiscard]] size_t find_unquoted(std::string_view sql, char target, size_t start,
                                   const SqlDialectRules& rules);

/**
 * @brief Leading run of identifier characters, upper-cased
 */
[[nodiscard]] std::string leading_word(std::string_view sql);

} // namespace scan

} // namespace sqlgate
