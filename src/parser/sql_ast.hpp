#pragma once

// ---------------------------------------------------------------------------
// sql_ast.hpp
//
// SqlParser 가 생성하는 구문 트리.
//
// [범위]
// SELECT / CTE / 서브쿼리 문법만 트리로 표현한다. 그 외 구문(INSERT, DROP,
// COPY ...)은 StatementKind 와 본문에서 발견된 함수 호출 이름만 보관한다.
// 안전성 검사(구문 종류, 위험 함수, INTO/잠금, 중첩 변경 구문)와 정책 검사
// (테이블/컬럼/별칭)에 필요한 정보가 이 범위로 충분하다.
//
// [소유권]
// 모든 하위 노드는 std::unique_ptr 로 단독 소유된다. 트리는 이동만 가능하다.
// ---------------------------------------------------------------------------

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

struct Query;
struct Statement;

enum class StatementKind : std::uint8_t {
    kSelect   = 0,
    kInsert   = 1,
    kUpdate   = 2,
    kDelete   = 3,
    kMerge    = 4,
    kDrop     = 5,
    kCreate   = 6,
    kAlter    = 7,
    kTruncate = 8,
    kGrant    = 9,
    kRevoke   = 10,
    kSet      = 11,  // SET / RESET
    kCommand  = 12,  // EXPLAIN, COPY, DO, CALL, VACUUM, BEGIN ... 그 외 명령
};

[[nodiscard]] const char* statement_kind_name(StatementKind kind) noexcept;

// 원문 텍스트 구간 [offset, offset + length)
struct SourceSpan {
    std::size_t offset{0};
    std::size_t length{0};
};

struct Expr;
using ExprPtr  = std::unique_ptr<Expr>;
using QueryPtr = std::unique_ptr<Query>;

struct Expr {
    enum class Kind : std::uint8_t {
        kLiteral      = 0,
        kParameter    = 1,
        kColumnRef    = 2,   // qualifier.name
        kStar         = 3,   // * 또는 qualifier.*
        kFunctionCall = 4,   // qualifier(스키마).name(args)
        kSubquery     = 5,   // (SELECT ...), IN (SELECT ...), ARRAY(SELECT ...)
        kExists       = 6,
        kUnary        = 7,
        kBinary       = 8,
        kCase         = 9,
        kCast         = 10,
        kList         = 11,  // (a, b) 행 생성자, IN 목록
        kArray        = 12,
        kFieldSelect  = 13,  // (args[0]).name, name 이 "*" 이면 (args[0]).*
    };

    Kind                 kind{Kind::kLiteral};
    std::string          name{};       // 컬럼명 / 함수명 / 연산자
    std::string          qualifier{};  // 컬럼·스타: 테이블(별칭), 함수: 스키마
    std::vector<ExprPtr> args{};
    QueryPtr             subquery{};
    SourceSpan           span{};
};

struct TableRef;
using TableRefPtr = std::unique_ptr<TableRef>;

struct TableRef {
    enum class Kind : std::uint8_t {
        kTable    = 0,
        kSubquery = 1,
        kFunction = 2,   // FROM generate_series(...)
        kJoin     = 3,
    };

    Kind        kind{Kind::kTable};
    std::string schema{};
    std::string name{};
    std::string alias{};
    bool        lateral{false};
    QueryPtr    subquery{};
    ExprPtr     function{};
    TableRefPtr left{};
    TableRefPtr right{};
    ExprPtr     condition{};   // JOIN ... ON
};

struct SelectItem {
    ExprPtr     expr{};
    std::string alias{};
};

struct SelectCore {
    bool                              distinct{false};
    std::vector<ExprPtr>              distinct_on{};
    std::vector<SelectItem>           items{};
    bool                              has_into{false};
    std::vector<TableRefPtr>          from{};
    ExprPtr                           where{};
    std::vector<ExprPtr>              group_by{};
    ExprPtr                           having{};
    std::vector<ExprPtr>              window_exprs{};   // WINDOW 절 PARTITION/ORDER 식
    std::vector<std::vector<ExprPtr>> values{};         // VALUES 행 목록
};

// 집합 연산(UNION/INTERSECT/EXCEPT)의 피연산자 하나.
// select 또는 괄호로 묶인 nested 중 하나만 채워진다.
struct QueryTerm {
    std::unique_ptr<SelectCore> select{};
    QueryPtr                    nested{};
};

struct Cte {
    std::string                name{};
    std::vector<std::string>   columns{};
    std::unique_ptr<Statement> body{};
};

// 최상위 LIMIT / FETCH FIRST 절 (add_limit 재작성용 위치 포함)
struct RowLimit {
    SourceSpan                  span{};      // 값 식 전체 구간 (ALL 포함)
    std::optional<std::int64_t> value{};     // 정수 리터럴일 때만
    bool                        all{false};  // LIMIT ALL
};

struct Query {
    bool                     recursive{false};
    std::vector<Cte>         ctes{};
    std::vector<QueryTerm>   terms{};
    std::vector<std::string> set_operators{};  // terms.size() - 1 개
    std::vector<ExprPtr>     order_by{};
    std::optional<RowLimit>  limit{};
    std::optional<RowLimit>  fetch_first{};
    ExprPtr                  limit_expr{};
    ExprPtr                  offset{};
    std::vector<std::string> locking{};        // "update", "share", ...
};

struct Statement {
    StatementKind            kind{StatementKind::kCommand};
    std::string              keyword{};         // 구문을 분류한 첫 키워드
    QueryPtr                 query{};           // kSelect 일 때만
    std::vector<Cte>         ctes{};            // WITH ... DELETE 형태의 선행 CTE
    std::vector<std::string> function_calls{};  // 비-SELECT 본문에서 발견된 함수명
    SourceSpan               span{};
};

struct ParseTree {
    std::vector<Statement> statements{};
    std::size_t            end_of_last_token{0};
};
