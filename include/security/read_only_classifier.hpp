#pragma once

#include "core/types.hpp"
#include "parser/sql_scanner.hpp"

#include <string>
#include <string_view>
#include <unordered_set>

namespace sqlgate {

/**
 * @brief Decides whether one comment-free statement is read-only
 *
 * Keyword heuristic, not a parser:
 *   1. empty statement          -> ALLOW (no-op)
 *   2. leading keyword          -> must be in the allowed set
 *   3. any forbidden keyword    -> DENY, naming the keyword
 *   4. unquoted terminator with
 *      trailing content         -> DENY (embedded secondary statement)
 * A leading WITH must also contain a SELECT.
 *
 * Keywords are matched case-insensitively on identifier boundaries outside
 * quoted regions. Writes performed inside an opaque routine called from an
 * otherwise read-only statement (SELECT my_func()) are not detected; the
 * executor's read-only transaction is the layer that stops those.
 */
class ReadOnlyClassifier {
public:
    [[nodiscard]] static std::unordered_set<std::string> default_allowed_keywords();
    [[nodiscard]] static std::unordered_set<std::string> default_forbidden_keywords();

    struct Config {
        std::unordered_set<std::string> allowed_keywords = default_allowed_keywords();
        std::unordered_set<std::string> forbidden_keywords = default_forbidden_keywords();
        SqlDialectRules rules;
        char terminator = ';';
    };

    ReadOnlyClassifier() : ReadOnlyClassifier(Config{}) {}
    explicit ReadOnlyClassifier(Config config);

    [[nodiscard]] ClassificationVerdict classify(std::string_view statement) const;

    static constexpr std::string_view kReasonNotReadOnly =
        "statement does not begin with a read-only keyword";
    static constexpr std::string_view kReasonEmbeddedStatement =
        "embedded secondary statement detected";
    static constexpr std::string_view kReasonWithoutSelect =
        "WITH clause is not followed by a SELECT";

private:
    [[nodiscard]] static ClassificationVerdict deny(ClassificationVerdict verdict,
                                                    std::string reason);

    Config config_;
};

} // namespace sqlgate
