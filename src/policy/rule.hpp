#pragma once

// ---------------------------------------------------------------------------
// rule.hpp
//
// 데이터베이스별 접근 정책 설정 구조체 (헤더만, 구현 없음).
// ConfigLoader 가 YAML 의 databases[].access_policy 에서 로드한다.
//
// [설계 원칙]
// - 이 헤더는 다른 프로젝트 헤더에 의존하지 않는다.
// - 모든 멤버는 기본값을 명시한다. 기본값만으로 구성된 정책은
//   public 스키마의 모든 테이블을 허용하고 컬럼 제한이 없다.
// - 이름 비교는 PolicyEngine 이 소문자로 정규화해서 수행하므로
//   여기 저장되는 값은 설정 파일의 원문 그대로다.
// ---------------------------------------------------------------------------

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// TableAccessConfig
//   allowed 가 비어 있지 않으면 allow-list 모드 (denied 는 무시된다).
//   allowed 가 비어 있으면 denied 에 있는 테이블만 거부한다.
//   테이블명은 스키마 한정자 없이 적는다.
// ---------------------------------------------------------------------------
struct TableAccessConfig {
    std::vector<std::string> allowed{};
    std::vector<std::string> denied{};
};

// ---------------------------------------------------------------------------
// SelectStarPolicy
//   kReject : star 가 거부 컬럼을 노출하면 쿼리 전체를 거부한다.
//   kAllow  : 스키마로 star 를 펼칠 수 있으면 안전한 컬럼 목록으로
//             재작성하여 통과시킨다. 펼칠 수 없으면 kReject 와 같다.
// ---------------------------------------------------------------------------
enum class SelectStarPolicy : std::uint8_t {
    kReject = 0,
    kAllow  = 1,
};

// ---------------------------------------------------------------------------
// ColumnAccessConfig
//   denied          : "table.column" 정확 일치
//   denied_patterns : 셸 glob ("*.password", "users.*_token", "*secret*")
//                     "table.column" 전체 문자열에 대해 매칭한다.
// ---------------------------------------------------------------------------
struct ColumnAccessConfig {
    std::vector<std::string> denied{};
    std::vector<std::string> denied_patterns{};
    SelectStarPolicy         select_star_policy{SelectStarPolicy::kReject};
};

// ---------------------------------------------------------------------------
// ExplainPolicy
//   ExplainCostGate 설정.
//   fail_open_on_error = false 이면 EXPLAIN 자체가 실패한 쿼리는 거부된다.
// ---------------------------------------------------------------------------
struct ExplainPolicy {
    bool                      enabled{true};
    std::uint64_t             max_estimated_rows{100000};
    double                    max_estimated_cost{10000.0};
    bool                      deny_seq_scan_on_large_tables{false};
    std::uint64_t             large_table_threshold{10000};
    std::chrono::milliseconds timeout{std::chrono::seconds{5}};
    bool                      fail_open_on_error{false};
    std::chrono::seconds      cache_ttl{300};
    std::size_t               cache_max_size{1000};
};

// ---------------------------------------------------------------------------
// PolicyConfig
//   databases[].access_policy 의 루트.
// ---------------------------------------------------------------------------
struct PolicyConfig {
    std::vector<std::string> allowed_schemas{"public"};
    TableAccessConfig        tables{};
    ColumnAccessConfig       columns{};
    ExplainPolicy            explain{};
};
