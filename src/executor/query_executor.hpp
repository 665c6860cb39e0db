#pragma once

// ---------------------------------------------------------------------------
// query_executor.hpp
//
// 데이터베이스 하나에 묶인 실행 파이프라인.
//
// [단계 (앞 단계가 실패하면 뒤 단계는 실행하지 않는다)]
// 0. SqlValidator::validate_and_raise       → SYNTAX_ERROR / UNSAFE_SQL
// 1. SqlValidator::parse_for_policy
// 2. star 가 있고 컬럼 규칙이 있으면 SchemaCache 스냅샷
// 3. PolicyEngine::validate_sql              → SCHEMA/TABLE/COLUMN_ACCESS_DENIED
// 4. 연결 획득 → ExplainCostGate::validate   → QUERY_TOO_EXPENSIVE
// 5. 읽기 전용 트랜잭션 안에서 실행 (query_timeout)
// 6. limit 으로 잘라내고 truncated 기록
// 7. 결과와 관계없이 감사 이벤트 1건
//
// [설계 원칙]
// - 오류는 바꾸지 않고 그대로 호출자에게 돌려준다. 예상하지 못한 C++ 예외만
//   INTERNAL_ERROR 로 바꾼다.
// - 실행 SQL 에는 LIMIT (limit + 1) 을 씌워 잘림 여부를 판정한다.
//   EXPLAIN 은 LIMIT 을 씌우기 전 SQL 로 수행한다 (Limit 노드가 추정치를
//   가리지 않도록).
// - SELECT * 재작성 결과가 있으면 EXPLAIN 과 실행 모두 재작성된 SQL 을 쓴다.
//   감사 로그에는 원문 SQL 을 남긴다.
//
// [수명]
// 생성자에 넘긴 참조 대상은 모두 QueryExecutor 보다 오래 살아야 한다.
// ---------------------------------------------------------------------------

#include <chrono>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <utility>

#include <boost/asio/awaitable.hpp>

#include "audit/audit_logger.hpp"
#include "common/types.hpp"
#include "db/connection.hpp"
#include "db/db_types.hpp"
#include "explain/explain_gate.hpp"
#include "parser/sql_validator.hpp"
#include "policy/policy_engine.hpp"
#include "schema/schema_cache.hpp"

struct ExecutorSettings {
    std::chrono::milliseconds query_timeout{std::chrono::seconds{30}};
    bool                      use_readonly_transactions{true};
};

class QueryExecutor {
public:
    QueryExecutor(std::string         database,
                  ConnectionPool&     pool,
                  const SqlValidator& validator,
                  const PolicyEngine& policy,
                  ExplainCostGate&    explain_gate,
                  SchemaCache&        schema_cache,
                  AuditLogger&        audit,
                  ExecutorSettings    settings = {});

    ~QueryExecutor() = default;

    QueryExecutor(const QueryExecutor&)            = delete;
    QueryExecutor& operator=(const QueryExecutor&) = delete;
    QueryExecutor(QueryExecutor&&)                 = delete;
    QueryExecutor& operator=(QueryExecutor&&)      = delete;

    auto execute(std::string                sql,
                 std::uint64_t              limit,
                 ExecutionContext           context,
                 std::optional<std::string> question = std::nullopt)
        -> boost::asio::awaitable<std::expected<QueryResult, GatewayError>>;

    [[nodiscard]] const std::string& database() const noexcept { return database_; }

private:
    struct Trace;

    auto run(const std::string& sql, std::uint64_t limit, Trace& trace)
        -> boost::asio::awaitable<std::expected<QueryResult, GatewayError>>;

    std::string         database_;
    ConnectionPool&     pool_;
    const SqlValidator& validator_;
    const PolicyEngine& policy_;
    ExplainCostGate&    explain_gate_;
    SchemaCache&        schema_cache_;
    AuditLogger&        audit_;
    ExecutorSettings    settings_;
};
