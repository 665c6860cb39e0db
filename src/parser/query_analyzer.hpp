#pragma once

// ---------------------------------------------------------------------------
// query_analyzer.hpp
//
// ParseTree 를 한 번 순회하여 안전성 검사용 사실(QueryFacts)과
// 정책 검사용 구조 정보(ParsedQuery)를 동시에 추출한다.
//
// [별칭 해석 규칙]
// - FROM/JOIN 대상마다 (별칭 또는 이름) → 실제 테이블 매핑을 스코프에 등록한다.
//   별칭이 있으면 별칭이 우선하며, 별칭 없는 테이블은 자기 이름으로 매핑된다.
// - 서브쿼리는 바깥 스코프를 부모로 갖는다 (상관 서브쿼리의 외부 별칭 참조).
// - CTE 이름과 FROM 서브쿼리 별칭은 "파생 소스"로 등록된다. 파생 소스의
//   컬럼은 내부 쿼리에서 이미 검사되므로 컬럼 목록에 다시 넣지 않는다.
// - 한정자 없는 컬럼은 가장 가까운 스코프의 실제 테이블에 귀속한다.
//   후보 테이블이 여럿이면 후보마다 한 쌍씩 기록한다 (과검출 방향).
//
// [SELECT * 처리]
// - bare "*"     : 해당 SELECT 의 모든 FROM 소스를 star 대상으로 기록
// - "alias.*"    : 해석된 소스 하나만 기록
// - count(*)     : star 아님
// - 함수 인자 안의 alias.* (row_to_json(u.*)) 는 star 로 기록하되 재작성 불가
// - 행 전체 참조 (SELECT u, row_to_json(u), to_jsonb(public.users)) 는
//   재작성 불가 alias.* 로 기록한다. 소스 이름과 같은 비한정 식별자는
//   컬럼보다 행 참조로 해석한다.
// - (u).col 은 (users, col) 컬럼으로, (u).* 는 alias.* 로 기록한다
// ---------------------------------------------------------------------------

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "parser/sql_ast.hpp"

// (table_or_empty, column). 둘 다 소문자.
struct ColumnRef {
    std::string table{};
    std::string column{};

    bool operator==(const ColumnRef&) const = default;
};

// star 가 펼쳐지는 소스 하나
struct StarSource {
    std::string qualifier{};  // 스코프 키 (별칭 또는 테이블명)
    std::string schema{};     // 실제 테이블일 때만
    std::string table{};      // 파생 소스(서브쿼리/CTE/함수)면 빈 문자열
};

struct StarTarget {
    SourceSpan              span{};               // 원문에서 치환될 구간
    bool                    qualified{false};     // alias.* 형태
    bool                    rewritable{true};     // 명시적 컬럼 목록으로 치환 가능 여부
    std::vector<StarSource> sources{};
};

// ---------------------------------------------------------------------------
// ParsedQuery
//   정책 엔진의 입력.
//   error 가 있으면 나머지 필드는 비어 있으며, 정책 엔진은 이를 거부해야 한다.
// ---------------------------------------------------------------------------
struct ParsedQuery {
    std::string                sql{};
    std::vector<std::string>   schemas{"public"};
    std::vector<std::string>   tables{};          // 첫 등장 순서, 중복 없음
    std::vector<ColumnRef>     columns{};
    bool                       has_select_star{false};
    std::vector<std::string>   star_tables{};     // star 가 노출하는 실제 테이블
    std::vector<StarTarget>    star_targets{};
    bool                       is_readonly{false};
    std::optional<std::string> error{};
};

// ---------------------------------------------------------------------------
// QueryFacts
//   SqlValidator 의 안전성 규칙 입력.
// ---------------------------------------------------------------------------
struct QueryFacts {
    std::vector<StatementKind> statement_kinds{};  // 최상위 구문 종류 (순서대로)
    std::vector<StatementKind> nested_kinds{};     // CTE 본문 / 서브쿼리 본문
    std::vector<std::string>   function_calls{};   // 소문자 함수명 (스키마 한정자 제외)
    bool                       has_into{false};
    bool                       has_locking{false};
};

struct QueryAnalysis {
    QueryFacts  facts{};
    ParsedQuery parsed{};
};

// analyze_query
//   sql  : tree 를 만든 원문 (ParsedQuery::sql 로 복사된다)
//   tree : SqlParser::parse 의 성공 결과
[[nodiscard]] QueryAnalysis analyze_query(std::string_view sql, const ParseTree& tree);
