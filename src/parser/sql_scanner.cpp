#include "parser/sql_scanner.hpp"
#include "core/utils.hpp"

namespace sqlgate::scan {

namespace {

bool is_tag_char(char c) {
    return c != '$' && utils::is_word_char(c);
}

// E'...' / e'...' where the prefix is not the tail of a longer identifier
bool starts_e_string(std::string_view sql, size_t pos) {
    if (pos == 0) return false;
    const char prefix = sql[pos - 1];
    if (prefix != 'E' && prefix != 'e') return false;
    return pos < 2 || !utils::is_word_char(sql[pos - 2]);
}

// Length of the "$tag$" delimiter opening at pos, or 0 if there is none.
// "$1" is a positional parameter and "a$b" an identifier, not a delimiter.
size_t dollar_tag_length(std::string_view sql, size_t pos) {
    if (pos > 0 && utils::is_word_char(sql[pos - 1])) return 0;

    size_t j = pos + 1;
    if (j < sql.size() && sql[j] >= '0' && sql[j] <= '9') return 0;

    while (j < sql.size() && sql[j] != '$') {
        if (!is_tag_char(sql[j])) return 0;
        ++j;
    }
    if (j >= sql.size()) return 0;
    return j - pos + 1;
}

} // anonymous namespace

size_t quoted_region_end(std::string_view sql, size_t pos, const SqlDialectRules& rules) {
    if (pos >= sql.size()) return npos;
    const char quote = sql[pos];

    const bool backtick = rules.backtick_identifiers && quote == '`';
    if (quote == '\'' || quote == '"' || backtick) {
        // Backslash never escapes inside a quoted identifier
        const bool backslash_escapes = !backtick && (
            rules.backslash == SqlDialectRules::Backslash::ESCAPE_ALWAYS ||
            (rules.backslash == SqlDialectRules::Backslash::ESCAPE_IN_E_STRINGS &&
             quote == '\'' && starts_e_string(sql, pos)));

        size_t j = pos + 1;
        while (j < sql.size()) {
            const char c = sql[j];
            if (backslash_escapes && c == '\\') {
                j += 2;
                continue;
            }
            if (c == quote) {
                // Doubled quote is an escaped literal quote, not a close
                if (j + 1 < sql.size() && sql[j + 1] == quote) {
                    j += 2;
                    continue;
                }
                return j + 1;
            }
            ++j;
        }
        return sql.size();
    }

    if (rules.dollar_quotes && quote == '$') {
        const size_t tag_len = dollar_tag_length(sql, pos);
        if (tag_len == 0) return npos;
        const std::string_view tag = sql.substr(pos, tag_len);
        const size_t close = sql.find(tag, pos + tag_len);
        return close == npos ? sql.size() : close + tag_len;
    }

    return npos;
}

size_t find_unquoted(std::string_view sql, char target, size_t start,
                     const SqlDialectRules& rules) {
    size_t i = start;
    while (i < sql.size()) {
        const size_t end = quoted_region_end(sql, i, rules);
        if (end != npos) {
            i = end;
            continue;
        }
        if (sql[i] == target) return i;
        ++i;
    }
    return npos;
}

std::string leading_word(std::string_view sql) {
    const auto trimmed = utils::trim_view(sql);
    size_t len = 0;
    while (len < trimmed.size() && utils::is_word_char(trimmed[len])) ++len;
    return utils::to_upper(trimmed.substr(0, len));
}

} // namespace sqlgate::scan
