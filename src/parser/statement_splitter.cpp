#include "parser/statement_splitter.hpp"
#include "core/utils.hpp"

namespace sqlgate {

StatementSplitter::StatementSplitter(const Config& config)
    : config_(config) {}

std::vector<std::string> StatementSplitter::split(std::string_view raw) const {
    std::vector<std::string> statements;

    auto emit = [&](size_t begin, size_t end) {
        const auto piece = utils::trim_view(raw.substr(begin, end - begin));
        if (!piece.empty()) {
            statements.emplace_back(piece);
        }
    };

    size_t start = 0;
    size_t i = 0;
    while (i < raw.size()) {
        const size_t quoted_end = scan::quoted_region_end(raw, i, config_.rules);
        if (quoted_end != scan::npos) {
            i = quoted_end;
            continue;
        }
        if (raw[i] == config_.terminator) {
            emit(start, i);
            start = i + 1;
        }
        ++i;
    }
    if (start < raw.size()) {
        emit(start, raw.size());
    }

    return statements;
}

} // namespace sqlgate
