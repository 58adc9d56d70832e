#include "security/read_only_classifier.hpp"
#include "core/utils.hpp"

#include <format>
#include <utility>

namespace sqlgate {

ReadOnlyClassifier::ReadOnlyClassifier(Config config)
    : config_(std::move(config)) {}

std::unordered_set<std::string> ReadOnlyClassifier::default_allowed_keywords() {
    return {"SELECT", "WITH", "EXPLAIN", "SHOW", "DESCRIBE"};
}

std::unordered_set<std::string> ReadOnlyClassifier::default_forbidden_keywords() {
    return {
        "INSERT", "UPDATE", "DELETE", "DROP", "ALTER", "TRUNCATE", "CREATE",
        "GRANT", "REVOKE", "MERGE", "CALL", "EXECUTE", "REPLACE", "COPY", "LOCK",
        // Session state changes
        "SET", "RESET",
    };
}

ClassificationVerdict ReadOnlyClassifier::deny(ClassificationVerdict verdict, std::string reason) {
    verdict.decision = Decision::DENY;
    verdict.reason = std::move(reason);
    return verdict;
}

ClassificationVerdict ReadOnlyClassifier::classify(std::string_view statement) const {
    ClassificationVerdict verdict;
    verdict.statement = utils::trim(statement);
    const std::string_view sql = verdict.statement;

    // Step 1: nothing to run
    if (sql.empty()) {
        verdict.decision = Decision::ALLOW;
        return verdict;
    }

    // Step 2: leading keyword
    const std::string leading = scan::leading_word(sql);
    if (leading.empty() || !config_.allowed_keywords.contains(leading)) {
        return deny(std::move(verdict), std::string(kReasonNotReadOnly));
    }

    // Step 3: forbidden keywords anywhere after the leading one
    bool saw_select = (leading == "SELECT");
    size_t i = leading.size();
    while (i < sql.size()) {
        const size_t quoted_end = scan::quoted_region_end(sql, i, config_.rules);
        if (quoted_end != scan::npos) {
            i = quoted_end;
            continue;
        }
        if (!utils::is_word_char(sql[i])) {
            ++i;
            continue;
        }

        size_t word_end = i;
        while (word_end < sql.size() && utils::is_word_char(sql[word_end])) ++word_end;
        const std::string word = utils::to_upper(sql.substr(i, word_end - i));

        if (config_.forbidden_keywords.contains(word)) {
            return deny(std::move(verdict),
                        std::format("forbidden keyword '{}' detected", word));
        }
        if (word == "SELECT") {
            saw_select = true;
        }
        i = word_end;
    }

    if (leading == "WITH" && !saw_select) {
        return deny(std::move(verdict), std::string(kReasonWithoutSelect));
    }

    // Step 4: a second statement that survived splitting
    const size_t terminator = scan::find_unquoted(sql, config_.terminator, 0, config_.rules);
    if (terminator != scan::npos &&
        !utils::trim_view(sql.substr(terminator + 1)).empty()) {
        return deny(std::move(verdict), std::string(kReasonEmbeddedStatement));
    }

    verdict.decision = Decision::ALLOW;
    return verdict;
}

} // namespace sqlgate
