#include "executor/query_executor.hpp"

#include <exception>
#include <limits>
#include <utility>

#include <spdlog/spdlog.h>

// 감사 이벤트에 남길 진행 상태
struct QueryExecutor::Trace {
    AuditEventType    type{AuditEventType::kQueryDenied};
    AuditStatus       status{AuditStatus::kDenied};
    AuditPolicyChecks checks{};
};

QueryExecutor::QueryExecutor(std::string         database,
                             ConnectionPool&     pool,
                             const SqlValidator& validator,
                             const PolicyEngine& policy,
                             ExplainCostGate&    explain_gate,
                             SchemaCache&        schema_cache,
                             AuditLogger&        audit,
                             ExecutorSettings    settings)
    : database_{std::move(database)}
    , pool_{pool}
    , validator_{validator}
    , policy_{policy}
    , explain_gate_{explain_gate}
    , schema_cache_{schema_cache}
    , audit_{audit}
    , settings_{settings} {}

auto QueryExecutor::execute(std::string                sql,
                            std::uint64_t              limit,
                            ExecutionContext           context,
                            std::optional<std::string> question)
    -> boost::asio::awaitable<std::expected<QueryResult, GatewayError>>
{
    const auto started = std::chrono::steady_clock::now();
    Trace      trace;

    std::expected<QueryResult, GatewayError> outcome =
        std::unexpected(make_error(ErrorCode::kInternalError, "query pipeline did not complete"));
    try {
        outcome = co_await run(sql, limit, trace);
    } catch (const std::exception& e) {
        spdlog::error("executor: [{}] request {} failed with exception: {}", database_, context.request_id,
                      e.what());
        trace.type   = AuditEventType::kQueryDenied;
        trace.status = AuditStatus::kError;
        outcome      = std::unexpected(make_error(ErrorCode::kInternalError, e.what()));
    } catch (...) {
        // std::exception 이 아닌 예외도 감사 레코드를 남긴 뒤 오류로 돌려준다
        spdlog::error("executor: [{}] request {} failed with unknown exception", database_, context.request_id);
        trace.type   = AuditEventType::kQueryDenied;
        trace.status = AuditStatus::kError;
        outcome      = std::unexpected(make_error(ErrorCode::kInternalError, "unknown exception"));
    }

    const double elapsed_ms =
        std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();

    AuditEvent event        = make_audit_event(trace.type, context, database_);
    event.question          = std::move(question);
    event.sql               = sql;
    event.status            = trace.status;
    event.execution_time_ms = elapsed_ms;
    event.policy_checks     = trace.checks;
    if (outcome) {
        outcome->execution_time_ms = elapsed_ms;
        event.rows_returned        = outcome->row_count;
        event.truncated            = outcome->truncated;
        spdlog::debug("executor: [{}] request {} rows={} truncated={} {:.1f}ms", database_, context.request_id,
                      outcome->row_count, outcome->truncated, elapsed_ms);
    } else {
        attach_error(event, outcome.error());
        spdlog::info("executor: [{}] request {} rejected: {}", database_, context.request_id,
                     describe(outcome.error()));
    }

    co_await audit_.log(std::move(event));
    co_return outcome;
}

auto QueryExecutor::run(const std::string& sql, std::uint64_t limit, Trace& trace)
    -> boost::asio::awaitable<std::expected<QueryResult, GatewayError>>
{
    // 0. 정적 검증
    if (auto valid = validator_.validate_and_raise(sql); !valid) {
        co_return std::unexpected(std::move(valid.error()));
    }

    // 1. 정책용 파싱
    const ParsedQuery parsed = validator_.parse_for_policy(sql);

    // 2. star 확장용 스키마
    std::shared_ptr<const SchemaSnapshot> snapshot;
    if (parsed.has_select_star && policy_.has_column_rules()) {
        auto cached = co_await schema_cache_.get_or_refresh(database_, pool_);
        if (cached) {
            snapshot = std::move(*cached);
        } else {
            // 스냅샷 없이 진행하면 PolicyEngine 이 star 를 거부한다
            spdlog::warn("executor: [{}] schema unavailable for SELECT * check: {}", database_,
                         describe(cached.error()));
        }
    }

    // 3. 접근 정책
    PolicyValidationResult policy = policy_.validate_sql(parsed, snapshot.get());
    trace.checks.table_access  = policy.has(PolicyCheckType::kSchema) || policy.has(PolicyCheckType::kTable)
                                     ? CheckOutcome::kDenied
                                     : CheckOutcome::kPassed;
    trace.checks.column_access = policy.has(PolicyCheckType::kColumn) ? CheckOutcome::kDenied
                                                                      : CheckOutcome::kPassed;
    if (!policy.passed) {
        trace.type = AuditEventType::kPolicyViolation;
        co_return std::unexpected(policy.to_error(policy_.config().allowed_schemas));
    }

    QueryResult result;
    result.warnings = std::move(policy.warnings);
    const std::string effective_sql = policy.rewritten_sql.value_or(sql);

    // 4. 연결 + 비용 게이트
    auto conn = co_await pool_.acquire();
    if (!conn) {
        trace.status = AuditStatus::kError;
        co_return std::unexpected(std::move(conn.error()));
    }

    auto explain = co_await explain_gate_.validate(**conn, effective_sql);
    if (!explain) {
        trace.checks.explain_check = CheckOutcome::kDenied;
        if (explain.error().code != ErrorCode::kQueryTooExpensive) {
            trace.status = AuditStatus::kError;
        }
        co_return std::unexpected(std::move(explain.error()));
    }
    trace.checks.explain_check = explain->skipped ? CheckOutcome::kSkipped : CheckOutcome::kPassed;
    for (auto& w : explain->warnings) {
        result.warnings.push_back(std::move(w));
    }

    // 5. 실행
    std::string exec_sql = effective_sql;
    if (limit < static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
        exec_sql = validator_.add_limit(effective_sql, static_cast<std::int64_t>(limit) + 1);
    }

    trace.status = AuditStatus::kError;
    std::expected<RowSet, GatewayError> rows;
    if (settings_.use_readonly_transactions) {
        rows = co_await (*conn)->fetch_readonly(std::move(exec_sql), settings_.query_timeout);
    } else {
        rows = co_await (*conn)->fetch(std::move(exec_sql), settings_.query_timeout);
    }
    if (!rows) {
        co_return std::unexpected(std::move(rows.error()));
    }

    // 6. 잘라내기
    result.columns = std::move(rows->columns);
    result.rows    = std::move(rows->rows);
    if (result.rows.size() > limit) {
        result.rows.resize(static_cast<std::size_t>(limit));
        result.truncated = true;
    }
    result.row_count = result.rows.size();

    trace.type   = AuditEventType::kQueryExecuted;
    trace.status = AuditStatus::kSuccess;
    co_return result;
}
