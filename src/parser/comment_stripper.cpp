#include "parser/comment_stripper.hpp"
#include "core/utils.hpp"

namespace sqlgate {

namespace {

constexpr std::string_view kBlockOpen = "/*";
constexpr std::string_view kBlockClose = "*/";

// Offset of an executable comment body ("/*!" or "/*M!") past its version
// digits, or npos when the block comment at pos is an ordinary one.
size_t executable_body_start(std::string_view sql, size_t pos) {
    size_t j = pos + kBlockOpen.size();
    if (j < sql.size() && sql[j] == 'M') ++j;
    if (j >= sql.size() || sql[j] != '!') return scan::npos;
    ++j;
    while (j < sql.size() && sql[j] >= '0' && sql[j] <= '9') ++j;
    return j;
}

} // anonymous namespace

CommentStripper::CommentStripper(const Config& config)
    : config_(config) {}

std::string CommentStripper::strip(std::string_view statement) const {
    return utils::trim(strip_untrimmed(statement));
}

std::string CommentStripper::strip_untrimmed(std::string_view sql) const {
    std::string out;
    out.reserve(sql.size());

    size_t i = 0;
    while (i < sql.size()) {
        const size_t quoted_end = scan::quoted_region_end(sql, i, config_.rules);
        if (quoted_end != scan::npos) {
            out.append(sql.substr(i, quoted_end - i));
            i = quoted_end;
            continue;
        }

        const char c = sql[i];
        const bool dash_comment = (c == '-' && i + 1 < sql.size() && sql[i + 1] == '-');
        const bool hash_comment = (c == '#' && config_.rules.hash_comments);

        if (dash_comment || hash_comment) {
            out += ' ';
            const size_t newline = sql.find('\n', i);
            if (newline == std::string_view::npos) {
                break;
            }
            i = newline;  // newline itself is kept
            continue;
        }

        if (c == '/' && i + 1 < sql.size() && sql[i + 1] == '*') {
            const size_t close = sql.find(kBlockClose, i + kBlockOpen.size());
            const size_t body_end = (close == std::string_view::npos) ? sql.size() : close;
            const size_t next = (close == std::string_view::npos) ? sql.size()
                                                                  : close + kBlockClose.size();

            out += ' ';
            if (config_.rules.executable_comments && config_.preserve_executable_comments) {
                const size_t body = executable_body_start(sql, i);
                if (body != scan::npos && body <= body_end) {
                    out += strip_untrimmed(sql.substr(body, body_end - body));
                    out += ' ';
                }
            }
            i = next;
            continue;
        }

        out += c;
        ++i;
    }

    return out;
}

} // namespace sqlgate
