#pragma once

// ---------------------------------------------------------------------------
// explain_gate.hpp
//
// EXPLAIN (FORMAT JSON) 기반 비용 게이트.
// 정적 검증과 정책 검사를 통과한 SQL 을 실행 직전에 한 번 더 거른다.
//
// [판정 규칙]
// - 최상위 "Plan Rows"  > max_estimated_rows  → QUERY_TOO_EXPENSIVE
// - 최상위 "Total Cost" > max_estimated_cost  → QUERY_TOO_EXPENSIVE
// - deny_seq_scan_on_large_tables 가 켜져 있으면 Seq Scan 노드의 행 수
//   (table_row_counts 에 값이 있으면 그 값) 가 large_table_threshold 를
//   넘을 때 거부한다.
//
// [EXPLAIN 실패]
// - 기본은 fail-closed: 실패 원인 오류를 그대로 반환한다.
// - fail_open_on_error 면 경고를 남기고 통과시킨다.
//
// [캐시]
// sha256(sql) → PlanSummary. TTL 과 최대 크기로 제한한다.
// 판정은 캐시 적중 시에도 현재 정책으로 다시 수행한다.
//
// [알려진 한계]
// - 추정치는 통계 정보에 의존한다. ANALYZE 가 오래된 테이블은 실제보다
//   훨씬 작거나 크게 추정될 수 있다.
// ---------------------------------------------------------------------------

#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <boost/asio/awaitable.hpp>

#include "common/types.hpp"
#include "db/connection.hpp"
#include "policy/rule.hpp"

struct SeqScanNode {
    std::string   relation{};   // "Relation Name" (없으면 "unknown")
    std::uint64_t estimated_rows{0};
};

struct PlanSummary {
    std::uint64_t            estimated_rows{0};
    double                   total_cost{0.0};
    std::vector<SeqScanNode> seq_scans{};
};

// EXPLAIN (FORMAT JSON) 출력 ([{"Plan": {...}}]) 을 요약한다.
// 형식이 맞지 않으면 kInternalError.
[[nodiscard]] std::expected<PlanSummary, GatewayError> parse_explain_json(std::string_view json);

struct ExplainResult {
    bool                     skipped{false};     // 비활성화 또는 fail-open 으로 판정 생략
    bool                     from_cache{false};
    std::uint64_t            estimated_rows{0};
    double                   total_cost{0.0};
    std::vector<std::string> warnings{};
};

class ExplainCostGate {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    explicit ExplainCostGate(ExplainPolicy policy, Clock clock = &std::chrono::steady_clock::now);

    ~ExplainCostGate() = default;

    ExplainCostGate(const ExplainCostGate&)            = delete;
    ExplainCostGate& operator=(const ExplainCostGate&) = delete;
    ExplainCostGate(ExplainCostGate&&)                 = delete;
    ExplainCostGate& operator=(ExplainCostGate&&)      = delete;

    // conn 은 호출이 끝날 때까지 살아 있어야 한다.
    auto validate(DbConnection& conn, std::string sql)
        -> boost::asio::awaitable<std::expected<ExplainResult, GatewayError>>;

    // DB 접근 없이 요약만으로 판정한다.
    [[nodiscard]] std::expected<ExplainResult, GatewayError> evaluate(const PlanSummary& plan) const;

    // 테이블명 → 행 수 추정치 (Seq Scan 판정 시 EXPLAIN 추정치보다 우선)
    void update_table_row_counts(std::map<std::string, std::uint64_t> counts);

    [[nodiscard]] std::size_t          cache_size() const;
    [[nodiscard]] const ExplainPolicy& policy() const noexcept { return policy_; }

private:
    struct CacheEntry {
        PlanSummary                           plan{};
        std::chrono::steady_clock::time_point inserted_at{};
    };

    [[nodiscard]] std::optional<PlanSummary> cache_lookup(const std::string& key);
    void                                     cache_store(const std::string& key, PlanSummary plan);

    [[nodiscard]] std::expected<ExplainResult, GatewayError> on_explain_failure(GatewayError error) const;

    ExplainPolicy policy_;
    Clock         clock_;

    mutable std::mutex                   mutex_;   // cache_, table_row_counts_ 보호
    std::map<std::string, CacheEntry>    cache_{};
    std::map<std::string, std::uint64_t> table_row_counts_{};
};
