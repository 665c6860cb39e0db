// ---------------------------------------------------------------------------
// sql_parser.cpp
//
// PostgreSQL SELECT 문법 재귀 하강 파서 구현.
//
// [구조]
// - Parser: 토큰 벡터 위의 커서. 문법 오류는 내부적으로 SyntaxFailure 를
//   던지고 SqlParser::parse 경계에서 std::unexpected 로 변환한다.
//   (재귀 하강 전 구간에 expected 를 전파하면 모든 호출이 분기로 뒤덮인다.)
// - 식은 Pratt 방식 binding power 로 파싱한다.
//
// [우선순위 표 (낮음 → 높음)]
//   OR < AND < NOT < IS/ISNULL/NOTNULL < 비교(= < > <= >= <> !=)
//   < IN/BETWEEN/LIKE/ILIKE/SIMILAR < 기타 연산자(|| -> @> ...)
//   < + - < * / % < ^ < 단항 +/- < AT TIME ZONE/COLLATE < :: []
//
// [알려진 한계]
// - 입력 중첩 깊이는 kMaxNestingDepth 로 제한한다 (스택 고갈 방지).
// - 비-SELECT 구문은 괄호 균형 단위로 건너뛴다. 해당 구문은 검증기에서
//   구문 종류만으로 거부되므로 내부 구조를 해석할 필요가 없다.
// ---------------------------------------------------------------------------

#include "parser/sql_parser.hpp"

#include <charconv>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "parser/sql_lexer.hpp"

const char* statement_kind_name(StatementKind kind) noexcept {
    switch (kind) {
        case StatementKind::kSelect:   return "SELECT";
        case StatementKind::kInsert:   return "INSERT";
        case StatementKind::kUpdate:   return "UPDATE";
        case StatementKind::kDelete:   return "DELETE";
        case StatementKind::kMerge:    return "MERGE";
        case StatementKind::kDrop:     return "DROP";
        case StatementKind::kCreate:   return "CREATE";
        case StatementKind::kAlter:    return "ALTER";
        case StatementKind::kTruncate: return "TRUNCATE";
        case StatementKind::kGrant:    return "GRANT";
        case StatementKind::kRevoke:   return "REVOKE";
        case StatementKind::kSet:      return "SET";
        case StatementKind::kCommand:  return "COMMAND";
    }
    return "COMMAND";
}

namespace {

constexpr int kMaxNestingDepth = 200;

// Pratt binding power
constexpr int kBpOr      = 1;
constexpr int kBpAnd     = 2;
constexpr int kBpNot     = 3;
constexpr int kBpIs      = 4;
constexpr int kBpCompare = 5;
constexpr int kBpLike    = 6;
constexpr int kBpOther   = 7;
constexpr int kBpAdd     = 8;
constexpr int kBpMul     = 9;
constexpr int kBpExp     = 10;
constexpr int kBpUnary   = 11;
constexpr int kBpAt      = 12;
constexpr int kBpPostfix = 13;

struct SyntaxFailure {
    std::string message;
    std::size_t offset;
};

// 암시적 별칭이 될 수 없고, 식의 시작이 될 수 없는 단어.
// PostgreSQL 예약어 + 절 경계로 쓰이는 비예약어.
const std::unordered_set<std::string> kReservedWords = {
    "all", "analyse", "analyze", "and", "any", "array", "as", "asc", "asymmetric",
    "between", "both", "case", "cast", "check", "collate", "column", "constraint",
    "create", "cross", "current_catalog", "current_date", "current_role",
    "current_time", "current_timestamp", "current_user", "default", "deferrable",
    "desc", "distinct", "do", "else", "end", "except", "false", "fetch", "for",
    "foreign", "from", "full", "grant", "group", "having", "ilike", "in",
    "initially", "inner", "intersect", "into", "is", "isnull", "join", "lateral",
    "leading", "left", "like", "limit", "localtime", "localtimestamp", "natural",
    "not", "notnull", "null", "offset", "on", "only", "or", "order", "outer",
    "placing", "primary", "references", "returning", "right", "select",
    "session_user", "similar", "some", "symmetric", "table", "tablesample",
    "then", "to", "trailing", "true", "union", "unique", "user", "using",
    "values", "variadic", "when", "where", "window", "with",
};

// 괄호 없이 값으로 쓰이는 키워드
const std::unordered_set<std::string> kValueKeywords = {
    "current_date", "current_time", "current_timestamp", "localtime",
    "localtimestamp", "current_user", "session_user", "user", "current_role",
    "current_catalog", "current_schema",
};

const std::unordered_set<std::string> kIntervalFields = {
    "year", "month", "day", "hour", "minute", "second",
};

// 첫 키워드 → 구문 종류 (SELECT 계열 제외)
const std::unordered_map<std::string, StatementKind> kStatementKeywords = {
    {"insert", StatementKind::kInsert},     {"update", StatementKind::kUpdate},
    {"delete", StatementKind::kDelete},     {"merge", StatementKind::kMerge},
    {"drop", StatementKind::kDrop},         {"create", StatementKind::kCreate},
    {"alter", StatementKind::kAlter},       {"truncate", StatementKind::kTruncate},
    {"grant", StatementKind::kGrant},       {"revoke", StatementKind::kRevoke},
    {"set", StatementKind::kSet},           {"reset", StatementKind::kSet},
    {"explain", StatementKind::kCommand},   {"copy", StatementKind::kCommand},
    {"do", StatementKind::kCommand},        {"call", StatementKind::kCommand},
    {"vacuum", StatementKind::kCommand},    {"analyze", StatementKind::kCommand},
    {"analyse", StatementKind::kCommand},   {"begin", StatementKind::kCommand},
    {"start", StatementKind::kCommand},     {"commit", StatementKind::kCommand},
    {"rollback", StatementKind::kCommand},  {"end", StatementKind::kCommand},
    {"abort", StatementKind::kCommand},     {"savepoint", StatementKind::kCommand},
    {"release", StatementKind::kCommand},   {"lock", StatementKind::kCommand},
    {"prepare", StatementKind::kCommand},   {"execute", StatementKind::kCommand},
    {"deallocate", StatementKind::kCommand}, {"discard", StatementKind::kCommand},
    {"listen", StatementKind::kCommand},    {"notify", StatementKind::kCommand},
    {"unlisten", StatementKind::kCommand},  {"load", StatementKind::kCommand},
    {"checkpoint", StatementKind::kCommand}, {"reindex", StatementKind::kCommand},
    {"cluster", StatementKind::kCommand},   {"comment", StatementKind::kCommand},
    {"security", StatementKind::kCommand},  {"refresh", StatementKind::kCommand},
    {"import", StatementKind::kCommand},    {"show", StatementKind::kCommand},
    {"fetch", StatementKind::kCommand},     {"move", StatementKind::kCommand},
    {"close", StatementKind::kCommand},     {"declare", StatementKind::kCommand},
    {"reassign", StatementKind::kCommand},
};

std::optional<std::int64_t> literal_int(const Expr& expr) {
    if (expr.kind != Expr::Kind::kLiteral || expr.name.empty()) {
        return std::nullopt;
    }
    std::int64_t value{0};
    const char* begin = expr.name.data();
    const char* end   = begin + expr.name.size();
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc{} || ptr != end) {
        return std::nullopt;
    }
    return value;
}

ExprPtr make_expr(Expr::Kind kind, std::string name = {}) {
    auto expr  = std::make_unique<Expr>();
    expr->kind = kind;
    expr->name = std::move(name);
    return expr;
}

class Parser {
public:
    explicit Parser(std::vector<Token> tokens) : tokens_{std::move(tokens)} {}

    ParseTree parse_all() {
        ParseTree tree;
        while (true) {
            while (peek().kind == TokenKind::kSemicolon) {
                advance();
            }
            if (at_end()) {
                break;
            }
            tree.statements.push_back(parse_statement(false));
            if (!at_end() && peek().kind != TokenKind::kSemicolon) {
                fail_unexpected();
            }
        }
        if (tree.statements.empty()) {
            throw SyntaxFailure{"empty query", 0};
        }
        tree.end_of_last_token = tree.statements.back().span.offset +
                                 tree.statements.back().span.length;
        return tree;
    }

private:
    // -- 중첩 깊이 / IN 허용 여부 가드 --------------------------------------
    struct DepthGuard {
        explicit DepthGuard(Parser& p) : parser{p} {
            if (++parser.depth_ > kMaxNestingDepth) {
                throw SyntaxFailure{"query nesting too deep", parser.peek().offset};
            }
        }
        ~DepthGuard() { --parser.depth_; }
        DepthGuard(const DepthGuard&)            = delete;
        DepthGuard& operator=(const DepthGuard&) = delete;
        Parser& parser;
    };

    struct NoInScope {
        NoInScope(Parser& p, bool value) : parser{p}, saved{p.no_in_} { parser.no_in_ = value; }
        ~NoInScope() { parser.no_in_ = saved; }
        NoInScope(const NoInScope&)            = delete;
        NoInScope& operator=(const NoInScope&) = delete;
        Parser& parser;
        bool    saved;
    };

    // -- 커서 -----------------------------------------------------------------
    const Token& peek(std::size_t ahead = 0) const {
        const std::size_t idx = pos_ + ahead;
        return idx < tokens_.size() ? tokens_[idx] : tokens_.back();
    }

    const Token& advance() {
        const Token& t = tokens_[pos_];
        if (t.kind != TokenKind::kEnd) {
            last_end_ = t.end();
            ++pos_;
        }
        return t;
    }

    bool at_end() const { return peek().kind == TokenKind::kEnd; }

    static bool is_kw(const Token& t, std::string_view kw) {
        return t.kind == TokenKind::kIdentifier && t.value == kw;
    }

    bool peek_kw(std::string_view kw, std::size_t ahead = 0) const {
        return is_kw(peek(ahead), kw);
    }

    bool peek_is(TokenKind kind, std::size_t ahead = 0) const {
        return peek(ahead).kind == kind;
    }

    bool peek_op(std::string_view op) const {
        return peek().kind == TokenKind::kOperator && peek().value == op;
    }

    bool accept_kw(std::string_view kw) {
        if (peek_kw(kw)) {
            advance();
            return true;
        }
        return false;
    }

    bool accept(TokenKind kind) {
        if (peek_is(kind)) {
            advance();
            return true;
        }
        return false;
    }

    void expect_kw(std::string_view kw) {
        if (!accept_kw(kw)) {
            fail_expected(kw);
        }
    }

    void expect(TokenKind kind, std::string_view what) {
        if (!accept(kind)) {
            fail_expected(what);
        }
    }

    std::string token_text(const Token& t) const {
        if (t.kind == TokenKind::kEnd) {
            return "end of input";
        }
        return fmt::format("'{}'", t.value);
    }

    [[noreturn]] void fail_unexpected() const {
        throw SyntaxFailure{fmt::format("unexpected token {}", token_text(peek())), peek().offset};
    }

    [[noreturn]] void fail_expected(std::string_view what) const {
        throw SyntaxFailure{fmt::format("expected {} but found {}", what, token_text(peek())),
                            peek().offset};
    }

    // -- 이름 -----------------------------------------------------------------
    static bool is_name_token(const Token& t) {
        return t.kind == TokenKind::kIdentifier || t.kind == TokenKind::kQuotedIdentifier;
    }

    // AS 뒤 등 키워드도 이름으로 허용되는 위치
    std::string parse_name() {
        if (!is_name_token(peek())) {
            fail_expected("identifier");
        }
        return advance().value;
    }

    // 테이블/스키마 이름 위치 (예약어 불가)
    std::string parse_relation_name() {
        const Token& t = peek();
        if (t.kind == TokenKind::kQuotedIdentifier ||
            (t.kind == TokenKind::kIdentifier && !kReservedWords.contains(t.value))) {
            return advance().value;
        }
        fail_expected("relation name");
    }

    bool peek_alias_candidate() const {
        const Token& t = peek();
        if (t.kind == TokenKind::kQuotedIdentifier) {
            return true;
        }
        return t.kind == TokenKind::kIdentifier && !kReservedWords.contains(t.value);
    }

    void parse_qualified_name() {
        parse_name();
        while (accept(TokenKind::kDot)) {
            parse_name();
        }
    }

    void skip_balanced_parens() {
        expect(TokenKind::kLeftParen, "'('");
        int depth = 1;
        while (depth > 0) {
            if (at_end()) {
                fail_expected("')'");
            }
            if (peek_is(TokenKind::kLeftParen)) {
                ++depth;
            } else if (peek_is(TokenKind::kRightParen)) {
                --depth;
            }
            advance();
        }
    }

    // -- 구문 -----------------------------------------------------------------
    bool starts_query_term() const {
        return peek_kw("select") || peek_kw("values") || peek_kw("table") ||
               peek_is(TokenKind::kLeftParen);
    }

    bool starts_subquery() const {
        return peek_kw("select") || peek_kw("with") || peek_kw("values");
    }

    // nested == true: CTE 본문. 닫는 괄호에서 멈춘다.
    Statement parse_statement(bool nested) {
        DepthGuard guard{*this};
        Statement stmt;
        const std::size_t begin = peek().offset;

        if (accept_kw("with")) {
            const bool recursive = accept_kw("recursive");
            auto ctes = parse_cte_list();
            if (starts_query_term()) {
                stmt.kind    = StatementKind::kSelect;
                stmt.keyword = "select";
                stmt.query   = parse_query_after_with(recursive, std::move(ctes));
            } else {
                classify_leading_keyword(stmt);
                stmt.ctes = std::move(ctes);
                consume_opaque(stmt, nested);
            }
        } else if (starts_query_term()) {
            stmt.kind    = StatementKind::kSelect;
            stmt.keyword = peek_is(TokenKind::kLeftParen) ? "select" : peek().value;
            stmt.query   = parse_query();
        } else {
            classify_leading_keyword(stmt);
            consume_opaque(stmt, nested);
        }

        stmt.span = SourceSpan{begin, last_end_ - begin};
        return stmt;
    }

    void classify_leading_keyword(Statement& stmt) const {
        const Token& t = peek();
        if (t.kind != TokenKind::kIdentifier) {
            fail_unexpected();
        }
        const auto it = kStatementKeywords.find(t.value);
        if (it == kStatementKeywords.end()) {
            fail_unexpected();
        }
        stmt.kind    = it->second;
        stmt.keyword = t.value;
    }

    // 비-SELECT 본문: 괄호 균형 단위로 소비하며 "ident (" 를 함수 호출로 기록
    void consume_opaque(Statement& stmt, bool nested) {
        int depth = 0;
        while (!at_end()) {
            const Token& t = peek();
            if (t.kind == TokenKind::kLeftParen) {
                ++depth;
            } else if (t.kind == TokenKind::kRightParen) {
                if (depth == 0) {
                    if (nested) {
                        break;
                    }
                    fail_unexpected();
                }
                --depth;
            } else if (t.kind == TokenKind::kSemicolon && depth == 0) {
                break;
            } else if (is_name_token(t) && peek_is(TokenKind::kLeftParen, 1)) {
                stmt.function_calls.push_back(t.value);
            }
            advance();
        }
        if (depth != 0) {
            throw SyntaxFailure{"unbalanced parentheses", peek().offset};
        }
    }

    std::vector<Cte> parse_cte_list() {
        std::vector<Cte> ctes;
        do {
            Cte cte;
            cte.name = parse_name();
            if (accept(TokenKind::kLeftParen)) {
                do {
                    cte.columns.push_back(parse_name());
                } while (accept(TokenKind::kComma));
                expect(TokenKind::kRightParen, "')'");
            }
            expect_kw("as");
            if (accept_kw("not")) {
                expect_kw("materialized");
            } else {
                accept_kw("materialized");
            }
            expect(TokenKind::kLeftParen, "'('");
            cte.body = std::make_unique<Statement>(parse_statement(true));
            expect(TokenKind::kRightParen, "')'");
            ctes.push_back(std::move(cte));
        } while (accept(TokenKind::kComma));
        return ctes;
    }

    QueryPtr parse_query() {
        DepthGuard guard{*this};
        NoInScope  in_scope{*this, false};
        if (accept_kw("with")) {
            const bool recursive = accept_kw("recursive");
            auto ctes = parse_cte_list();
            return parse_query_after_with(recursive, std::move(ctes));
        }
        return parse_query_after_with(false, {});
    }

    QueryPtr parse_query_after_with(bool recursive, std::vector<Cte> ctes) {
        auto query       = std::make_unique<Query>();
        query->recursive = recursive;
        query->ctes      = std::move(ctes);
        query->terms.push_back(parse_query_term());

        while (peek_kw("union") || peek_kw("intersect") || peek_kw("except")) {
            std::string op = advance().value;
            if (accept_kw("all")) {
                op += " all";
            } else {
                accept_kw("distinct");
            }
            query->set_operators.push_back(std::move(op));
            query->terms.push_back(parse_query_term());
        }

        parse_query_tail(*query);
        return query;
    }

    QueryTerm parse_query_term() {
        QueryTerm term;
        if (accept(TokenKind::kLeftParen)) {
            term.nested = parse_query();
            expect(TokenKind::kRightParen, "')'");
            return term;
        }
        if (peek_kw("select")) {
            term.select = parse_select_core();
            return term;
        }
        if (accept_kw("values")) {
            term.select = parse_values();
            return term;
        }
        if (peek_kw("table")) {
            // TABLE name == SELECT * FROM name
            const Token& table_kw = advance();
            term.select = std::make_unique<SelectCore>();
            auto star   = make_expr(Expr::Kind::kStar);
            star->span  = SourceSpan{table_kw.offset, 0};
            term.select->items.push_back(SelectItem{std::move(star), {}});
            auto ref  = std::make_unique<TableRef>();
            ref->kind = TableRef::Kind::kTable;
            ref->name = parse_relation_name();
            if (accept(TokenKind::kDot)) {
                ref->schema = ref->name;
                ref->name   = parse_name();
            }
            term.select->from.push_back(std::move(ref));
            return term;
        }
        fail_expected("SELECT");
    }

    RowLimit parse_row_limit_value() {
        RowLimit limit;
        const std::size_t start = peek().offset;
        auto expr   = parse_expr(0);
        limit.span  = SourceSpan{start, last_end_ - start};
        limit.value = literal_int(*expr);
        return limit;
    }

    void parse_query_tail(Query& query) {
        if (peek_kw("order") && peek_kw("by", 1)) {
            advance();
            advance();
            parse_sort_list(query.order_by);
        }

        while (true) {
            if (accept_kw("limit")) {
                if (peek_kw("all")) {
                    const Token& all = advance();
                    RowLimit limit;
                    limit.span = SourceSpan{all.offset, all.length};
                    limit.all  = true;
                    query.limit = limit;
                } else {
                    query.limit = parse_row_limit_value();
                }
                continue;
            }
            if (accept_kw("offset")) {
                query.offset = parse_expr(0);
                if (!accept_kw("row")) {
                    accept_kw("rows");
                }
                continue;
            }
            if (accept_kw("fetch")) {
                if (!accept_kw("first") && !accept_kw("next")) {
                    fail_expected("FIRST or NEXT");
                }
                RowLimit limit;
                if (peek_kw("row") || peek_kw("rows")) {
                    // 개수 생략 = 1
                    limit.span  = SourceSpan{peek().offset, 0};
                    limit.value = 1;
                } else {
                    limit = parse_row_limit_value();
                }
                if (!accept_kw("row") && !accept_kw("rows")) {
                    fail_expected("ROW or ROWS");
                }
                if (accept_kw("with")) {
                    expect_kw("ties");
                } else {
                    expect_kw("only");
                }
                query.fetch_first = limit;
                continue;
            }
            if (accept_kw("for")) {
                parse_locking_clause(query);
                continue;
            }
            break;
        }
    }

    void parse_locking_clause(Query& query) {
        std::string strength;
        if (accept_kw("update")) {
            strength = "update";
        } else if (accept_kw("share")) {
            strength = "share";
        } else if (accept_kw("no")) {
            expect_kw("key");
            expect_kw("update");
            strength = "no key update";
        } else if (accept_kw("key")) {
            expect_kw("share");
            strength = "key share";
        } else {
            fail_expected("UPDATE or SHARE");
        }
        if (accept_kw("of")) {
            do {
                parse_qualified_name();
            } while (accept(TokenKind::kComma));
        }
        if (!accept_kw("nowait") && accept_kw("skip")) {
            expect_kw("locked");
        }
        query.locking.push_back(std::move(strength));
    }

    bool select_list_ends() const {
        static const std::unordered_set<std::string> kEnders = {
            "from", "into", "where", "group", "having", "window", "union",
            "intersect", "except", "order", "limit", "offset", "fetch", "for",
        };
        const Token& t = peek();
        if (t.kind == TokenKind::kEnd || t.kind == TokenKind::kSemicolon ||
            t.kind == TokenKind::kRightParen) {
            return true;
        }
        return t.kind == TokenKind::kIdentifier && kEnders.contains(t.value);
    }

    std::unique_ptr<SelectCore> parse_select_core() {
        expect_kw("select");
        auto core = std::make_unique<SelectCore>();

        if (!accept_kw("all") && accept_kw("distinct")) {
            core->distinct = true;
            if (accept_kw("on")) {
                expect(TokenKind::kLeftParen, "'('");
                parse_expr_list(core->distinct_on);
                expect(TokenKind::kRightParen, "')'");
            }
        }

        if (!select_list_ends()) {
            do {
                SelectItem item;
                item.expr = parse_expr(0);
                if (accept_kw("as")) {
                    item.alias = parse_name();
                } else if (peek_alias_candidate()) {
                    item.alias = advance().value;
                }
                core->items.push_back(std::move(item));
            } while (accept(TokenKind::kComma));
        }

        if (accept_kw("into")) {
            core->has_into = true;
            if (!accept_kw("temporary") && !accept_kw("temp")) {
                accept_kw("unlogged");
            }
            accept_kw("table");
            parse_qualified_name();
        }

        if (accept_kw("from")) {
            do {
                core->from.push_back(parse_from_item());
            } while (accept(TokenKind::kComma));
        }

        if (accept_kw("where")) {
            core->where = parse_expr(0);
        }

        if (peek_kw("group") && peek_kw("by", 1)) {
            advance();
            advance();
            if (!accept_kw("all")) {
                accept_kw("distinct");
            }
            do {
                if (peek_kw("grouping") && peek_kw("sets", 1)) {
                    advance();
                    advance();
                }
                core->group_by.push_back(parse_expr(0));
            } while (accept(TokenKind::kComma));
        }

        if (accept_kw("having")) {
            core->having = parse_expr(0);
        }

        if (accept_kw("window")) {
            do {
                parse_name();
                expect_kw("as");
                parse_window_spec(core->window_exprs);
            } while (accept(TokenKind::kComma));
        }

        return core;
    }

    std::unique_ptr<SelectCore> parse_values() {
        auto core = std::make_unique<SelectCore>();
        do {
            expect(TokenKind::kLeftParen, "'('");
            std::vector<ExprPtr> row;
            parse_expr_list(row);
            expect(TokenKind::kRightParen, "')'");
            core->values.push_back(std::move(row));
        } while (accept(TokenKind::kComma));
        return core;
    }

    // -- FROM -----------------------------------------------------------------
    bool paren_starts_query() const {
        std::size_t ahead = 0;
        while (peek_is(TokenKind::kLeftParen, ahead)) {
            ++ahead;
        }
        return peek_kw("select", ahead) || peek_kw("with", ahead) ||
               peek_kw("values", ahead) || peek_kw("table", ahead);
    }

    TableRefPtr parse_from_item() {
        DepthGuard guard{*this};
        TableRefPtr left = parse_from_primary();

        while (true) {
            const bool natural = accept_kw("natural");
            bool cross = false;
            if (accept_kw("cross")) {
                cross = true;
                expect_kw("join");
            } else if (accept_kw("join")) {
            } else if (accept_kw("inner")) {
                expect_kw("join");
            } else if (peek_kw("left") || peek_kw("right") || peek_kw("full")) {
                advance();
                accept_kw("outer");
                expect_kw("join");
            } else {
                if (natural) {
                    fail_expected("JOIN");
                }
                break;
            }

            auto join   = std::make_unique<TableRef>();
            join->kind  = TableRef::Kind::kJoin;
            join->left  = std::move(left);
            join->right = parse_from_primary();

            if (!natural && !cross) {
                if (accept_kw("on")) {
                    join->condition = parse_expr(0);
                } else if (accept_kw("using")) {
                    expect(TokenKind::kLeftParen, "'('");
                    do {
                        parse_name();
                    } while (accept(TokenKind::kComma));
                    expect(TokenKind::kRightParen, "')'");
                    if (accept_kw("as")) {
                        parse_name();
                    }
                } else {
                    fail_expected("ON or USING");
                }
            }
            left = std::move(join);
        }
        return left;
    }

    TableRefPtr parse_from_primary() {
        auto ref     = std::make_unique<TableRef>();
        ref->lateral = accept_kw("lateral");

        if (peek_is(TokenKind::kLeftParen)) {
            if (paren_starts_query()) {
                advance();
                ref->kind     = TableRef::Kind::kSubquery;
                ref->subquery = parse_query();
                expect(TokenKind::kRightParen, "')'");
            } else {
                // 괄호로 묶인 JOIN
                advance();
                ref = parse_from_item();
                expect(TokenKind::kRightParen, "')'");
                parse_table_alias(*ref);
                return ref;
            }
        } else {
            accept_kw("only");
            const std::size_t start = peek().offset;
            std::vector<std::string> parts;
            parts.push_back(parse_relation_name());
            while (accept(TokenKind::kDot)) {
                parts.push_back(parse_name());
            }
            if (peek_op("*")) {
                advance();
            }
            if (peek_is(TokenKind::kLeftParen)) {
                ref->kind     = TableRef::Kind::kFunction;
                ref->function = parse_function_call(parts, start);
                if (peek_kw("with") && peek_kw("ordinality", 1)) {
                    advance();
                    advance();
                }
            } else {
                ref->kind = TableRef::Kind::kTable;
                ref->name = parts.back();
                if (parts.size() >= 2) {
                    ref->schema = parts[parts.size() - 2];
                }
            }
        }

        parse_table_alias(*ref);

        if (accept_kw("tablesample")) {
            parse_name();
            std::vector<ExprPtr> ignored;
            expect(TokenKind::kLeftParen, "'('");
            parse_expr_list(ignored);
            expect(TokenKind::kRightParen, "')'");
            if (accept_kw("repeatable")) {
                expect(TokenKind::kLeftParen, "'('");
                parse_expr(0);
                expect(TokenKind::kRightParen, "')'");
            }
        }
        return ref;
    }

    void parse_table_alias(TableRef& ref) {
        if (accept_kw("as")) {
            ref.alias = parse_name();
        } else if (peek_alias_candidate()) {
            ref.alias = advance().value;
        } else {
            return;
        }
        // 컬럼 별칭 목록 t(a, b)
        if (peek_is(TokenKind::kLeftParen)) {
            skip_balanced_parens();
        }
    }

    // -- 식 -------------------------------------------------------------------
    void parse_expr_list(std::vector<ExprPtr>& out) {
        do {
            out.push_back(parse_expr(0));
        } while (accept(TokenKind::kComma));
    }

    void parse_sort_list(std::vector<ExprPtr>& out) {
        do {
            out.push_back(parse_expr(0));
            if (!accept_kw("asc") && !accept_kw("desc") && accept_kw("using")) {
                advance();  // 정렬 연산자
            }
            if (accept_kw("nulls") && !accept_kw("first") && !accept_kw("last")) {
                fail_expected("FIRST or LAST");
            }
        } while (accept(TokenKind::kComma));
    }

    void parse_window_spec(std::vector<ExprPtr>& out) {
        expect(TokenKind::kLeftParen, "'('");
        static const std::unordered_set<std::string> kClauseWords = {
            "partition", "order", "rows", "range", "groups",
        };
        if (peek_is(TokenKind::kIdentifier) && !kClauseWords.contains(peek().value)) {
            advance();  // 기존 윈도 이름
        }
        if (peek_kw("partition") && peek_kw("by", 1)) {
            advance();
            advance();
            parse_expr_list(out);
        }
        if (peek_kw("order") && peek_kw("by", 1)) {
            advance();
            advance();
            parse_sort_list(out);
        }
        // 프레임 절 (ROWS BETWEEN ...) 은 컬럼 참조를 만들지 않으므로 건너뛴다
        int depth = 0;
        while (!at_end()) {
            if (peek_is(TokenKind::kLeftParen)) {
                ++depth;
            } else if (peek_is(TokenKind::kRightParen)) {
                if (depth == 0) {
                    break;
                }
                --depth;
            }
            advance();
        }
        expect(TokenKind::kRightParen, "')'");
    }

    static int infix_binding_power(const std::string& op) {
        if (op == "=" || op == "<" || op == ">" || op == "<=" || op == ">=" ||
            op == "<>" || op == "!=") {
            return kBpCompare;
        }
        if (op == "+" || op == "-") {
            return kBpAdd;
        }
        if (op == "*" || op == "/" || op == "%") {
            return kBpMul;
        }
        if (op == "^") {
            return kBpExp;
        }
        return kBpOther;
    }

    ExprPtr binary(std::string op, ExprPtr lhs, ExprPtr rhs) {
        auto expr = make_expr(Expr::Kind::kBinary, std::move(op));
        expr->args.push_back(std::move(lhs));
        if (rhs) {
            expr->args.push_back(std::move(rhs));
        }
        return expr;
    }

    ExprPtr parse_expr(int min_bp) {
        DepthGuard guard{*this};
        const std::size_t start = peek().offset;
        ExprPtr lhs = parse_prefix();

        while (true) {
            const Token& t = peek();

            if (t.kind == TokenKind::kDoubleColon) {
                if (kBpPostfix < min_bp) {
                    break;
                }
                advance();
                auto cast = make_expr(Expr::Kind::kCast, parse_type_name());
                cast->args.push_back(std::move(lhs));
                lhs = std::move(cast);
                continue;
            }

            if (t.kind == TokenKind::kLeftBracket) {
                if (kBpPostfix < min_bp) {
                    break;
                }
                advance();
                auto subscript = binary("[]", std::move(lhs), nullptr);
                if (!peek_is(TokenKind::kColon)) {
                    subscript->args.push_back(parse_expr(0));
                }
                if (accept(TokenKind::kColon) && !peek_is(TokenKind::kRightBracket)) {
                    subscript->args.push_back(parse_expr(0));
                }
                expect(TokenKind::kRightBracket, "']'");
                lhs = std::move(subscript);
                continue;
            }

            if (t.kind == TokenKind::kOperator) {
                const int bp = infix_binding_power(t.value);
                if (bp < min_bp) {
                    break;
                }
                std::string op = advance().value;
                lhs = binary(std::move(op), std::move(lhs), parse_expr(bp + 1));
                continue;
            }

            if (t.kind != TokenKind::kIdentifier) {
                break;
            }

            const std::string& kw = t.value;
            if (kw == "or" || kw == "and") {
                const int bp = kw == "or" ? kBpOr : kBpAnd;
                if (bp < min_bp) {
                    break;
                }
                std::string op = advance().value;
                lhs = binary(std::move(op), std::move(lhs), parse_expr(bp + 1));
                continue;
            }

            if (kw == "is") {
                if (kBpIs < min_bp) {
                    break;
                }
                advance();
                accept_kw("not");
                if (accept_kw("distinct")) {
                    expect_kw("from");
                    lhs = binary("is distinct from", std::move(lhs), parse_expr(kBpIs + 1));
                } else if (accept_kw("null") || accept_kw("true") || accept_kw("false") ||
                           accept_kw("unknown") || accept_kw("document")) {
                    lhs = binary("is", std::move(lhs), nullptr);
                } else {
                    fail_expected("NULL, TRUE, FALSE, UNKNOWN or DISTINCT FROM");
                }
                continue;
            }

            if (kw == "isnull" || kw == "notnull") {
                if (kBpIs < min_bp) {
                    break;
                }
                std::string op = advance().value;
                lhs = binary(std::move(op), std::move(lhs), nullptr);
                continue;
            }

            const std::size_t op_at = kw == "not" ? 1 : 0;
            const Token& op = peek(op_at);
            if (is_kw(op, "in") && !no_in_) {
                if (kBpLike < min_bp) {
                    break;
                }
                for (std::size_t i = 0; i <= op_at; ++i) {
                    advance();
                }
                lhs = parse_in(std::move(lhs));
                continue;
            }
            if (is_kw(op, "between")) {
                if (kBpLike < min_bp) {
                    break;
                }
                for (std::size_t i = 0; i <= op_at; ++i) {
                    advance();
                }
                if (!accept_kw("symmetric")) {
                    accept_kw("asymmetric");
                }
                auto between = binary("between", std::move(lhs), parse_expr(kBpLike + 1));
                expect_kw("and");
                between->args.push_back(parse_expr(kBpLike + 1));
                lhs = std::move(between);
                continue;
            }
            if (is_kw(op, "like") || is_kw(op, "ilike") || is_kw(op, "similar")) {
                if (kBpLike < min_bp) {
                    break;
                }
                for (std::size_t i = 0; i <= op_at; ++i) {
                    advance();
                }
                if (is_kw(op, "similar")) {
                    expect_kw("to");
                }
                auto like = binary("like", std::move(lhs), parse_expr(kBpLike + 1));
                if (accept_kw("escape")) {
                    like->args.push_back(parse_expr(kBpLike + 1));
                }
                lhs = std::move(like);
                continue;
            }

            if (kw == "at" && peek_kw("time", 1) && peek_kw("zone", 2)) {
                if (kBpAt < min_bp) {
                    break;
                }
                advance();
                advance();
                advance();
                lhs = binary("at time zone", std::move(lhs), parse_expr(kBpAt + 1));
                continue;
            }
            if (kw == "collate") {
                if (kBpAt < min_bp) {
                    break;
                }
                advance();
                parse_qualified_name();
                continue;
            }
            break;
        }

        lhs->span = SourceSpan{start, last_end_ - start};
        return lhs;
    }

    ExprPtr parse_in(ExprPtr lhs) {
        NoInScope in_scope{*this, false};
        expect(TokenKind::kLeftParen, "'('");
        ExprPtr rhs;
        if (starts_subquery()) {
            rhs           = make_expr(Expr::Kind::kSubquery);
            rhs->subquery = parse_query();
        } else {
            rhs = make_expr(Expr::Kind::kList);
            parse_expr_list(rhs->args);
        }
        expect(TokenKind::kRightParen, "')'");
        return binary("in", std::move(lhs), std::move(rhs));
    }

    ExprPtr parse_prefix() {
        const Token& t = peek();
        const std::size_t start = t.offset;

        switch (t.kind) {
            case TokenKind::kNumber: {
                auto expr  = make_expr(Expr::Kind::kLiteral, advance().value);
                expr->span = SourceSpan{start, last_end_ - start};
                return expr;
            }
            case TokenKind::kString: {
                auto expr       = make_expr(Expr::Kind::kLiteral, advance().value);
                expr->qualifier = "string";
                expr->span      = SourceSpan{start, last_end_ - start};
                return expr;
            }
            case TokenKind::kParameter: {
                auto expr  = make_expr(Expr::Kind::kParameter, advance().value);
                expr->span = SourceSpan{start, last_end_ - start};
                return expr;
            }
            case TokenKind::kOperator: {
                std::string op = advance().value;
                if (op == "*") {
                    auto star  = make_expr(Expr::Kind::kStar);
                    star->span = SourceSpan{start, last_end_ - start};
                    return star;
                }
                auto unary = make_expr(Expr::Kind::kUnary, std::move(op));
                unary->args.push_back(parse_expr(kBpUnary));
                return unary;
            }
            case TokenKind::kLeftParen:
                return parse_paren_expr();
            case TokenKind::kLeftBracket: {
                // ARRAY[[1,2],[3,4]] 의 내부 배열
                advance();
                auto array = make_expr(Expr::Kind::kArray);
                if (!peek_is(TokenKind::kRightBracket)) {
                    parse_expr_list(array->args);
                }
                expect(TokenKind::kRightBracket, "']'");
                return array;
            }
            case TokenKind::kIdentifier:
            case TokenKind::kQuotedIdentifier:
                return parse_identifier_expr();
            default:
                fail_unexpected();
        }
    }

    ExprPtr parse_paren_expr() {
        NoInScope in_scope{*this, false};
        const std::size_t start = peek().offset;
        advance();  // (

        ExprPtr expr;
        if (starts_subquery()) {
            expr           = make_expr(Expr::Kind::kSubquery);
            expr->subquery = parse_query();
        } else if (peek_is(TokenKind::kRightParen)) {
            expr = make_expr(Expr::Kind::kList);
        } else {
            ExprPtr first = parse_expr(0);
            if (accept(TokenKind::kComma)) {
                expr = make_expr(Expr::Kind::kList);
                expr->args.push_back(std::move(first));
                parse_expr_list(expr->args);
            } else {
                expr = std::move(first);
            }
        }
        expect(TokenKind::kRightParen, "')'");

        expr->span = SourceSpan{start, last_end_ - start};

        // (expr).field / (expr).*
        while (accept(TokenKind::kDot)) {
            std::string field = "*";
            if (peek_op("*")) {
                advance();
            } else {
                field = parse_name();
            }
            auto select = make_expr(Expr::Kind::kFieldSelect, std::move(field));
            select->args.push_back(std::move(expr));
            select->span = SourceSpan{start, last_end_ - start};
            expr         = std::move(select);
        }
        return expr;
    }

    ExprPtr parse_identifier_expr() {
        const Token& t = peek();
        const std::size_t start = t.offset;

        if (t.kind == TokenKind::kIdentifier) {
            const std::string kw = t.value;
            const bool call_follows = peek_is(TokenKind::kLeftParen, 1);

            if (kw == "null" || kw == "true" || kw == "false") {
                advance();
                auto expr  = make_expr(Expr::Kind::kLiteral, kw);
                expr->span = SourceSpan{start, last_end_ - start};
                return expr;
            }
            if (kw == "not") {
                advance();
                auto expr = make_expr(Expr::Kind::kUnary, "not");
                expr->args.push_back(parse_expr(kBpNot));
                return expr;
            }
            if (kw == "case") {
                return parse_case();
            }
            if (kw == "cast" && call_follows) {
                return parse_cast();
            }
            if (kw == "exists" && call_follows) {
                advance();
                advance();
                auto expr      = make_expr(Expr::Kind::kExists);
                expr->subquery = parse_query();
                expect(TokenKind::kRightParen, "')'");
                return expr;
            }
            if (kw == "array") {
                advance();
                if (accept(TokenKind::kLeftParen)) {
                    auto expr      = make_expr(Expr::Kind::kSubquery);
                    expr->subquery = parse_query();
                    expect(TokenKind::kRightParen, "')'");
                    return expr;
                }
                expect(TokenKind::kLeftBracket, "'['");
                auto array = make_expr(Expr::Kind::kArray);
                if (!peek_is(TokenKind::kRightBracket)) {
                    parse_expr_list(array->args);
                }
                expect(TokenKind::kRightBracket, "']'");
                return array;
            }
            // 타입 리터럴: DATE '2024-01-01', INTERVAL '1' DAY
            if (peek_is(TokenKind::kString, 1) && !kReservedWords.contains(kw)) {
                advance();
                auto expr       = make_expr(Expr::Kind::kLiteral, advance().value);
                expr->qualifier = "string";
                if (kw == "interval") {
                    while (peek_is(TokenKind::kIdentifier) && kIntervalFields.contains(peek().value)) {
                        advance();
                        if (accept_kw("to")) {
                            parse_name();
                        }
                    }
                }
                expr->span = SourceSpan{start, last_end_ - start};
                return expr;
            }
            if (kValueKeywords.contains(kw) && !call_follows) {
                advance();
                auto expr  = make_expr(Expr::Kind::kLiteral, kw);
                expr->span = SourceSpan{start, last_end_ - start};
                return expr;
            }
            if (kReservedWords.contains(kw) && !call_follows) {
                fail_unexpected();
            }
        }

        std::vector<std::string> parts;
        parts.push_back(advance().value);
        while (peek_is(TokenKind::kDot)) {
            advance();
            if (peek_op("*")) {
                advance();
                auto star       = make_expr(Expr::Kind::kStar);
                star->qualifier = parts.back();
                star->span      = SourceSpan{start, last_end_ - start};
                return star;
            }
            parts.push_back(parse_name());
        }

        if (peek_is(TokenKind::kLeftParen)) {
            return parse_function_call(parts, start);
        }

        auto column  = make_expr(Expr::Kind::kColumnRef, parts.back());
        if (parts.size() >= 2) {
            column->qualifier = parts[parts.size() - 2];
        }
        column->span = SourceSpan{start, last_end_ - start};
        return column;
    }

    ExprPtr parse_function_arg(bool disallow_in) {
        NoInScope in_scope{*this, disallow_in};
        accept_kw("variadic");
        return parse_expr(0);
    }

    ExprPtr parse_function_call(const std::vector<std::string>& parts, std::size_t start) {
        auto call  = make_expr(Expr::Kind::kFunctionCall, parts.back());
        if (parts.size() >= 2) {
            call->qualifier = parts[parts.size() - 2];
        }
        const std::string& fname = call->name;

        expect(TokenKind::kLeftParen, "'('");
        if (accept(TokenKind::kRightParen)) {
        } else if (peek_op("*") && peek_is(TokenKind::kRightParen, 1)) {
            advance();  // count(*)
            advance();
        } else if (starts_subquery()) {
            auto sub      = make_expr(Expr::Kind::kSubquery);
            sub->subquery = parse_query();
            call->args.push_back(std::move(sub));
            expect(TokenKind::kRightParen, "')'");
        } else {
            if (!accept_kw("distinct")) {
                accept_kw("all");
            }
            if (fname == "extract") {
                advance();  // 필드 (year, epoch, 'day' ...)
                expect_kw("from");
                call->args.push_back(parse_expr(0));
            } else {
                if (fname == "trim" && !accept_kw("both") && !accept_kw("leading")) {
                    accept_kw("trailing");
                }
                if (!(fname == "trim" && peek_kw("from"))) {
                    call->args.push_back(parse_function_arg(fname == "position"));
                }
                while (accept(TokenKind::kComma) || accept_kw("from") || accept_kw("for") ||
                       accept_kw("placing") || (fname == "position" && accept_kw("in"))) {
                    call->args.push_back(parse_function_arg(false));
                }
            }
            if (peek_kw("order") && peek_kw("by", 1)) {
                advance();
                advance();
                parse_sort_list(call->args);
            }
            expect(TokenKind::kRightParen, "')'");
        }

        if (peek_kw("within") && peek_kw("group", 1)) {
            advance();
            advance();
            expect(TokenKind::kLeftParen, "'('");
            expect_kw("order");
            expect_kw("by");
            parse_sort_list(call->args);
            expect(TokenKind::kRightParen, "')'");
        }
        if (peek_kw("filter") && peek_is(TokenKind::kLeftParen, 1)) {
            advance();
            advance();
            expect_kw("where");
            call->args.push_back(parse_expr(0));
            expect(TokenKind::kRightParen, "')'");
        }
        if (accept_kw("over")) {
            if (peek_is(TokenKind::kLeftParen)) {
                parse_window_spec(call->args);
            } else {
                parse_name();
            }
        }

        call->span = SourceSpan{start, last_end_ - start};
        return call;
    }

    ExprPtr parse_case() {
        advance();  // CASE
        auto expr = make_expr(Expr::Kind::kCase);
        if (!peek_kw("when")) {
            expr->args.push_back(parse_expr(0));
        }
        if (!peek_kw("when")) {
            fail_expected("WHEN");
        }
        while (accept_kw("when")) {
            expr->args.push_back(parse_expr(0));
            expect_kw("then");
            expr->args.push_back(parse_expr(0));
        }
        if (accept_kw("else")) {
            expr->args.push_back(parse_expr(0));
        }
        expect_kw("end");
        return expr;
    }

    ExprPtr parse_cast() {
        advance();  // CAST
        expect(TokenKind::kLeftParen, "'('");
        ExprPtr operand = parse_expr(0);
        expect_kw("as");
        auto expr = make_expr(Expr::Kind::kCast, parse_type_name());
        expr->args.push_back(std::move(operand));
        expect(TokenKind::kRightParen, "')'");
        return expr;
    }

    std::string parse_type_name() {
        std::string name = parse_name();
        while (accept(TokenKind::kDot)) {
            name = parse_name();
        }
        while (peek_kw("precision") || peek_kw("varying")) {
            name += " " + advance().value;
        }
        const auto accept_time_zone = [this] {
            if ((peek_kw("with") || peek_kw("without")) && peek_kw("time", 1) && peek_kw("zone", 2)) {
                advance();
                advance();
                advance();
            }
        };
        accept_time_zone();
        if (peek_is(TokenKind::kLeftParen)) {
            skip_balanced_parens();
        }
        accept_time_zone();
        while (accept(TokenKind::kLeftBracket)) {
            accept(TokenKind::kNumber);
            expect(TokenKind::kRightBracket, "']'");
        }
        return name;
    }

    std::vector<Token> tokens_;
    std::size_t        pos_{0};
    std::size_t        last_end_{0};
    int                depth_{0};
    bool               no_in_{false};
};

}  // namespace

std::expected<ParseTree, GatewayError> SqlParser::parse(std::string_view sql) const {
    auto tokens = tokenize(sql);
    if (!tokens) {
        spdlog::debug("sql_parser: tokenize failed: {}", tokens.error().message);
        return std::unexpected(tokens.error());
    }
    try {
        Parser parser{std::move(*tokens)};
        return parser.parse_all();
    } catch (const SyntaxFailure& failure) {
        spdlog::debug("sql_parser: parse failed at {}: {}", failure.offset, failure.message);
        return std::unexpected(make_error(
            ErrorCode::kSyntaxError,
            fmt::format("{} at position {}", failure.message, failure.offset)));
    }
}
