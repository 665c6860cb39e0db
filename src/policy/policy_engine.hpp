#pragma once

// ---------------------------------------------------------------------------
// policy_engine.hpp
//
// ParsedQuery 를 데이터베이스별 PolicyConfig 에 대조하여
// 스키마 / 테이블 / 컬럼 접근을 판정하는 엔진.
//
// [fail-close 원칙]
// 1. ParsedQuery::error 가 있으면 → 반드시 거부
// 2. star 가 펼쳐지는 테이블의 컬럼을 알 수 없고 컬럼 거부 규칙이
//    하나라도 있으면 → "table.*" 컬럼 위반으로 거부
// 3. 재작성 불가능한 star (함수 인자 안의 alias.*) 는 kAllow 에서도
//    재작성되지 않으며 위반이 그대로 남는다.
//
// [집계 원칙]
// validate_sql 은 단락 평가하지 않는다. 스키마, 테이블, 컬럼 위반을
// 모두 모아 하나의 결과로 반환하므로 감사 이벤트 하나가 위반 전체를 담는다.
//
// [의존 방향]
// policy_engine.hpp → parser/query_analyzer.hpp (단방향)
// policy_engine.hpp → schema/schema_types.hpp   (단방향)
// policy_engine.hpp → policy/rule.hpp           (단방향)
// ---------------------------------------------------------------------------

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "common/types.hpp"
#include "parser/query_analyzer.hpp"
#include "policy/rule.hpp"
#include "schema/schema_types.hpp"

enum class PolicyCheckType : std::uint8_t {
    kSchema = 0,
    kTable  = 1,
    kColumn = 2,
};

[[nodiscard]] const char* check_type_name(PolicyCheckType type) noexcept;

struct PolicyViolation {
    PolicyCheckType check_type{PolicyCheckType::kTable};
    std::string     resource{};   // 스키마명, 테이블명, "table.column"
    std::string     reason{};
};

// ---------------------------------------------------------------------------
// PolicyValidationResult
//   rewritten_sql: select_star_policy == kAllow 로 star 가 안전한 컬럼
//                  목록으로 치환된 경우에만 설정된다. 호출자는 원문 대신
//                  이 SQL 을 실행해야 한다.
// ---------------------------------------------------------------------------
struct PolicyValidationResult {
    bool                         passed{true};
    std::vector<PolicyViolation> violations{};
    std::vector<std::string>     warnings{};
    std::optional<std::string>   rewritten_sql{};
    bool                         star_triggered{false};  // 컬럼 위반 중 star 확장에서 나온 것이 있음

    [[nodiscard]] bool has(PolicyCheckType type) const noexcept;
    [[nodiscard]] std::vector<std::string> resources(PolicyCheckType type) const;

    void merge(PolicyValidationResult other);

    // to_error
    //   우선순위 schema > table > column 에 따라 가장 높은 위반 종류 하나로
    //   GatewayError 를 만든다. passed == true 이면 kInternalError 를 반환한다.
    [[nodiscard]] GatewayError to_error(const std::vector<std::string>& allowed_schemas) const;
};

class PolicyEngine {
public:
    explicit PolicyEngine(PolicyConfig config);

    ~PolicyEngine() = default;

    PolicyEngine(const PolicyEngine&)            = delete;
    PolicyEngine& operator=(const PolicyEngine&) = delete;
    PolicyEngine(PolicyEngine&&)                 = default;
    PolicyEngine& operator=(PolicyEngine&&)      = default;

    [[nodiscard]] PolicyValidationResult validate_schema(std::string_view schema) const;

    // 위반 테이블을 전부 보고한다
    [[nodiscard]] PolicyValidationResult validate_tables(const std::vector<std::string>& tables) const;

    // validate_columns
    //   (table, column) 을 소문자 "table.column" 으로 정규화하여 거부 목록과
    //   glob 패턴에 대조한다. table 이 비어 있으면 "column" 으로 대조한다.
    //   is_select_star && kReject 이고 위반이 있으면 노출 컬럼을 담은
    //   경고를 추가한다.
    [[nodiscard]] PolicyValidationResult validate_columns(const std::vector<ColumnRef>& columns,
                                                          bool is_select_star) const;

    // 거부 규칙을 통과하는 컬럼만, 입력 순서와 대소문자를 유지하여 반환
    [[nodiscard]] std::vector<std::string> get_safe_columns(
        std::string_view table, const std::vector<std::string>& all_columns) const;

    // validate_sql
    //   snapshot 은 star 가 있을 때 펼칠 컬럼을 얻는 데 쓰인다 (nullptr 허용).
    [[nodiscard]] PolicyValidationResult validate_sql(const ParsedQuery&    parsed,
                                                      const SchemaSnapshot* snapshot = nullptr) const;

    [[nodiscard]] bool has_column_rules() const noexcept;

    [[nodiscard]] const PolicyConfig& config() const noexcept { return config_; }

private:
    [[nodiscard]] std::optional<std::string> column_denial_reason(std::string_view full_name) const;

    PolicyConfig             config_;
    std::vector<std::string> allowed_schemas_lower_{};
    std::vector<std::string> allowed_tables_lower_{};
    std::vector<std::string> denied_tables_lower_{};
    std::vector<std::string> denied_columns_lower_{};
    std::vector<std::string> denied_patterns_lower_{};
};
