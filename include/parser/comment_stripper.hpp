#pragma once

#include "parser/sql_scanner.hpp"

#include <string>
#include <string_view>

namespace sqlgate {

/**
 * @brief Removes comments from one statement ahead of classification
 *
 * Unquoted `--` (and `#` where the dialect has it) comments run to the next
 * newline; unquoted block comments run to the first closing delimiter (no
 * nesting) or to the end of input. Each comment becomes a single space so
 * neighbouring tokens never fuse, and the result is trimmed.
 *
 * MySQL executes the body of executable comments (a block comment opened
 * with `!` or `M!`). When the dialect has them and preservation is on, the
 * body (minus its version number) is kept as ordinary text so the
 * classifier sees what the server will run.
 */
class CommentStripper {
public:
    struct Config {
        SqlDialectRules rules;
        bool preserve_executable_comments = true;
    };

    CommentStripper() : CommentStripper(Config{}) {}
    explicit CommentStripper(const Config& config);

    [[nodiscard]] std::string strip(std::string_view statement) const;

private:
    [[nodiscard]] std::string strip_untrimmed(std::string_view statement) const;

    Config config_;
};

} // namespace sqlgate
