#pragma once

// ---------------------------------------------------------------------------
// sql_validator.hpp
//
// LLM 이 생성한 SQL 의 정적 안전성 검증기.
//
// [검사 순서 (앞 단계 통과를 뒤 단계가 전제한다)]
// 1. 원문 금지 키워드 스캔 (ForbiddenPatternScanner)   → is_safe=false
// 2. 파싱 (SqlParser)                                  → is_valid=false
// 3. 단일 구문 (stacked query 거부)
// 4. 구문 종류 거부 목록 (INSERT/UPDATE/DELETE/MERGE/DROP/CREATE/ALTER/
//    TRUNCATE/GRANT/REVOKE/SET/기타 명령)
// 5. 위험 함수 호출 (트리 전체, dblink* 접두 매칭)
// 6. SELECT INTO / 잠금 절
// 7. CTE 본문, 서브쿼리 본문의 변경 구문
//
// [설계 원칙]
// - 모든 검사는 순수 함수이며 I/O 와 잠금이 없다.
// - 파싱 실패는 거부로만 이어진다. add_limit 만 예외적으로 fail-open 이며
//   (원문 그대로 반환) 이 경우에도 뒤따르는 validate 가 거부한다.
// ---------------------------------------------------------------------------

#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

#include "common/types.hpp"
#include "parser/pattern_scanner.hpp"
#include "parser/query_analyzer.hpp"
#include "parser/sql_parser.hpp"

struct ValidationResult {
    bool                     is_valid{false};   // 파싱 가능
    bool                     is_safe{false};    // 안전 규칙 통과
    std::string              error_message{};
    std::vector<std::string> warnings{};
};

class SqlValidator {
public:
    // std::regex 의 재귀 매칭은 입력 길이에 비례해 스택을 소모한다
    static constexpr std::size_t kDefaultMaxSqlLength = 16 * 1024;

    explicit SqlValidator(std::size_t max_sql_length = kDefaultMaxSqlLength);

    [[nodiscard]] ValidationResult validate(std::string_view sql) const;

    // is_valid=false → kSyntaxError, is_safe=false → kUnsafeSql
    [[nodiscard]] std::expected<void, GatewayError> validate_and_raise(std::string_view sql) const;

    // add_limit
    //   최상위 SELECT 에 LIMIT 을 추가하거나 기존 LIMIT/FETCH FIRST 를
    //   min(existing, limit) 로 줄인다. LIMIT ALL 과 비-리터럴 식은 limit 으로
    //   교체한다. 멱등이며, SELECT 가 아니거나 파싱 불가면 원문을 반환한다.
    [[nodiscard]] std::string add_limit(std::string_view sql, std::int64_t limit) const;

    // 실제 테이블명 (소문자, 비한정, CTE 이름 제외, 첫 등장 순서). 파싱 실패 시 빈 목록.
    [[nodiscard]] std::vector<std::string> extract_tables(std::string_view sql) const;

    [[nodiscard]] ParsedQuery parse_for_policy(std::string_view sql) const;

    [[nodiscard]] static bool is_dangerous_function(std::string_view lower_name);

private:
    SqlParser               parser_{};
    ForbiddenPatternScanner scanner_{};
    std::size_t             max_sql_length_;
};
