#include "core/query_gateway.hpp"
#include "core/utils.hpp"
#include "db/pooled_connection.hpp"

#include <algorithm>
#include <format>

namespace sqlgate {

namespace {

StatementSplitter::Config splitter_config(const QueryGateway::Config& config) {
    StatementSplitter::Config cfg;
    cfg.rules = config.rules;
    return cfg;
}

CommentStripper::Config stripper_config(const QueryGateway::Config& config) {
    CommentStripper::Config cfg;
    cfg.rules = config.rules;
    cfg.preserve_executable_comments = config.preserve_executable_comments;
    return cfg;
}

ReadOnlyClassifier::Config classifier_config(const QueryGateway::Config& config) {
    ReadOnlyClassifier::Config cfg;
    cfg.allowed_keywords = config.allowed_keywords;
    cfg.forbidden_keywords = config.forbidden_keywords;
    cfg.rules = config.rules;
    return cfg;
}

} // anonymous namespace

QueryGateway::QueryGateway(Config config,
                           std::shared_ptr<const ICatalogDialect> catalog,
                           std::shared_ptr<IConnectionPool> pool)
    : config_(std::move(config)),
      splitter_(splitter_config(config_)),
      stripper_(stripper_config(config_)),
      classifier_(classifier_config(config_)),
      executor_(config_.executor),
      inspector_(std::move(catalog), config_.schema),
      pool_(std::move(pool)) {}

Result<std::vector<ClassificationVerdict>> QueryGateway::validate(std::string_view raw_sql) const {
    using R = Result<std::vector<ClassificationVerdict>>;

    if (config_.max_sql_length > 0 && raw_sql.size() > config_.max_sql_length) {
        return R::error(ErrorCode::RESOURCE_LIMIT_EXCEEDED,
            std::format("SQL text is {} bytes, limit is {}", raw_sql.size(), config_.max_sql_length));
    }

    const auto statements = splitter_.split(raw_sql);
    if (statements.size() > config_.executor.max_statements) {
        return R::error(ErrorCode::RESOURCE_LIMIT_EXCEEDED,
            std::format("batch has {} statements, limit is {}",
                        statements.size(), config_.executor.max_statements));
    }

    std::vector<ClassificationVerdict> verdicts;
    verdicts.reserve(statements.size());
    for (size_t i = 0; i < statements.size(); ++i) {
        auto verdict = classifier_.classify(stripper_.strip(statements[i]));
        if (!verdict.allowed()) {
            const std::string reason = verdict.reason.value_or("statement is not read-only");
            utils::log::info(std::format("Rejected statement {} of {}: {}", i, statements.size(), reason));
            return R::error(ErrorCode::VALIDATION_REJECTED, reason, i);
        }
        verdicts.push_back(std::move(verdict));
    }

    return R::ok(std::move(verdicts));
}

Result<BatchResult> QueryGateway::validate_and_execute(
    std::string_view raw_sql, IDbConnection& conn) const {

    const auto verdicts = validate(raw_sql);
    if (verdicts.is_error()) return Result<BatchResult>::from_error(verdicts);

    return executor_.execute(verdicts.value(), conn);
}

Result<BatchResult> QueryGateway::validate_and_execute(std::string_view raw_sql) const {
    const auto verdicts = validate(raw_sql);
    if (verdicts.is_error()) return Result<BatchResult>::from_error(verdicts);

    const auto& list = verdicts.value();
    if (std::all_of(list.begin(), list.end(),
                    [](const ClassificationVerdict& v) { return v.is_noop(); })) {
        return Result<BatchResult>::ok(BatchResult{});
    }

    return with_pooled_connection<BatchResult>([&](IDbConnection& conn) {
        return executor_.execute(list, conn);
    });
}

Result<SchemaSnapshot> QueryGateway::inspect_schema(
    IDbConnection& conn,
    const std::optional<std::string>& schema_filter) const {
    return inspector_.inspect(conn, schema_filter);
}

Result<SchemaSnapshot> QueryGateway::inspect_schema(
    const std::optional<std::string>& schema_filter) const {
    return with_pooled_connection<SchemaSnapshot>([&](IDbConnection& conn) {
        return inspector_.inspect(conn, schema_filter);
    });
}

template<typename T, typename Fn>
Result<T> QueryGateway::with_pooled_connection(Fn&& fn) const {
    if (!pool_) {
        return Result<T>::error(ErrorCode::CONNECTION_UNAVAILABLE, "no connection pool configured");
    }

    const auto conn = pool_->acquire(config_.acquire_timeout);
    if (!conn || !conn->is_valid()) {
        return Result<T>::error(ErrorCode::CONNECTION_UNAVAILABLE,
            std::format("no connection to '{}' available", pool_->name()));
    }

    return fn(**conn);
}

} // namespace sqlgate
