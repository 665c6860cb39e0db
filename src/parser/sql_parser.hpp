#pragma once

// ---------------------------------------------------------------------------
// sql_parser.hpp
//
// PostgreSQL SELECT 문법을 위한 재귀 하강 파서.
//
// [지원 문법]
// - WITH [RECURSIVE] name [(cols)] AS [[NOT] MATERIALIZED] (...)
// - SELECT [ALL | DISTINCT [ON (...)]] ... [INTO ...] FROM ... WHERE ...
//   GROUP BY ... HAVING ... WINDOW ...
// - UNION / INTERSECT / EXCEPT [ALL | DISTINCT], 괄호 쿼리
// - ORDER BY, LIMIT/OFFSET, FETCH FIRST, FOR UPDATE/SHARE 잠금 절
// - JOIN (INNER/LEFT/RIGHT/FULL/CROSS/NATURAL, LATERAL), FROM 서브쿼리/함수
// - VALUES, TABLE name
// - 식: CASE, CAST, ::, 배열, IN/BETWEEN/LIKE/ILIKE/SIMILAR TO/IS,
//       EXISTS, 스칼라 서브쿼리, 윈도 함수(OVER/FILTER/WITHIN GROUP)
//
// [설계 한계]
// 1. SELECT 이외 구문은 트리를 만들지 않는다. 첫 키워드로 종류만 분류하고
//    괄호 균형 단위로 본문을 소비하며, 본문의 "ident (" 형태만 함수 호출로
//    기록한다.
// 2. CTE 의 SEARCH/CYCLE 절, U&'...' 유니코드 문자열은 지원하지 않는다
//    (구문 오류로 처리 → fail-close).
// 3. 연산자 우선순위는 PostgreSQL 문서의 표를 따르되, 사용자 정의 연산자는
//    모두 "기타 연산자" 단일 우선순위로 취급한다.
// ---------------------------------------------------------------------------

#include <expected>
#include <string_view>

#include "common/types.hpp"   // GatewayError
#include "parser/sql_ast.hpp"

// ---------------------------------------------------------------------------
// SqlParser
//   SQL 문자열을 ParseTree 로 변환한다.
//   실패 시 std::unexpected(GatewayError{kSyntaxError}) 를 반환한다.
//
//   [파서 보안 원칙]
//   - 파싱 실패는 절대 허용으로 이어지지 않는다. 호출자는 error path 에서
//     반드시 쿼리를 거부해야 한다.
// ---------------------------------------------------------------------------
class SqlParser {
public:
    SqlParser()  = default;
    ~SqlParser() = default;

    // 복사/이동 허용 (stateless)
    SqlParser(const SqlParser&)            = default;
    SqlParser& operator=(const SqlParser&) = default;
    SqlParser(SqlParser&&)                 = default;
    SqlParser& operator=(SqlParser&&)      = default;

    // parse
    //   sql: 원문 SQL. 세미콜론으로 구분된 모든 구문을 statements 에 담는다.
    //   빈 입력(공백/주석/세미콜론만)은 실패로 처리한다.
    [[nodiscard]] std::expected<ParseTree, GatewayError>
    parse(std::string_view sql) const;
};
