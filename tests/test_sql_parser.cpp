// ---------------------------------------------------------------------------
// test_sql_parser.cpp
//
// tokenize / SqlParser / analyze_query 단위 테스트.
//
// [테스트 범위]
// - 토큰화: 식별자 소문자 접기, 인용 식별자 보존, E'' / $tag$ 문자열,
//   중첩 블록 주석, 닫히지 않은 리터럴 오류, 연산자 분리 규칙
// - 구문 분류 (StatementKind 매핑), WITH ... DELETE 형태
// - 테이블 추출: FROM/JOIN/서브쿼리/CTE (CTE 이름 제외), 스키마 한정자
// - 별칭 해석: 한정 컬럼, 비한정 컬럼, 상관 서브쿼리
// - SELECT * 기록: bare / alias.* / count(*) / 함수 인자 안의 alias.*
// - 에러 처리 (빈 입력, 주석만, 괄호 불균형)
//
// [오탐/미탐 주의사항]
// - 비한정 컬럼은 후보 테이블 전부에 귀속된다 (과검출 방향).
// - SELECT 이외 구문은 트리를 만들지 않으므로 테이블 목록이 비어 있다.
// ---------------------------------------------------------------------------

#include "parser/query_analyzer.hpp"
#include "parser/sql_lexer.hpp"
#include "parser/sql_parser.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

namespace {

ParsedQuery analyze(const std::string& sql) {
    SqlParser  parser;
    const auto tree = parser.parse(sql);
    EXPECT_TRUE(tree.has_value()) << sql;
    if (!tree) {
        return {};
    }
    return analyze_query(sql, *tree).parsed;
}

QueryFacts facts_of(const std::string& sql) {
    SqlParser  parser;
    const auto tree = parser.parse(sql);
    EXPECT_TRUE(tree.has_value()) << sql;
    if (!tree) {
        return {};
    }
    return analyze_query(sql, *tree).facts;
}

bool has_column(const ParsedQuery& q, const std::string& table, const std::string& column) {
    return std::find(q.columns.begin(), q.columns.end(), ColumnRef{table, column}) != q.columns.end();
}

StatementKind kind_of(const std::string& sql) {
    SqlParser  parser;
    const auto tree = parser.parse(sql);
    EXPECT_TRUE(tree.has_value()) << sql;
    if (!tree || tree->statements.empty()) {
        return StatementKind::kCommand;
    }
    return tree->statements.front().kind;
}

} // namespace

// ---------------------------------------------------------------------------
// 토큰화
// ---------------------------------------------------------------------------

TEST(SqlLexer, FoldsUnquotedIdentifiersToLowerCase) {
    const auto tokens = tokenize("SELECT Name FROM \"Users\"");
    ASSERT_TRUE(tokens.has_value());
    ASSERT_EQ(tokens->size(), 5U);
    EXPECT_EQ((*tokens)[0].value, "select");
    EXPECT_EQ((*tokens)[1].value, "name");
    EXPECT_EQ((*tokens)[3].kind, TokenKind::kQuotedIdentifier);
    EXPECT_EQ((*tokens)[3].value, "Users");
    EXPECT_EQ(tokens->back().kind, TokenKind::kEnd);
}

TEST(SqlLexer, KeepsSourceOffsets) {
    const std::string sql = "SELECT  id";
    const auto tokens = tokenize(sql);
    ASSERT_TRUE(tokens.has_value());
    EXPECT_EQ((*tokens)[1].offset, 8U);
    EXPECT_EQ((*tokens)[1].length, 2U);
}

TEST(SqlLexer, StringLiteralWithDoubledQuote) {
    const auto tokens = tokenize("SELECT 'it''s'");
    ASSERT_TRUE(tokens.has_value());
    EXPECT_EQ((*tokens)[1].kind, TokenKind::kString);
    EXPECT_EQ((*tokens)[1].value, "it's");
}

TEST(SqlLexer, DollarQuotedStringIsSingleToken) {
    const auto tokens = tokenize("SELECT $tag$ DROP TABLE x; $tag$");
    ASSERT_TRUE(tokens.has_value());
    ASSERT_EQ(tokens->size(), 3U);
    EXPECT_EQ((*tokens)[1].kind, TokenKind::kString);
}

TEST(SqlLexer, NestedBlockCommentIsSkipped) {
    const auto tokens = tokenize("SELECT /* outer /* inner */ still comment */ 1");
    ASSERT_TRUE(tokens.has_value());
    ASSERT_EQ(tokens->size(), 3U);
    EXPECT_EQ((*tokens)[1].kind, TokenKind::kNumber);
}

TEST(SqlLexer, UnterminatedStringFails) {
    const auto tokens = tokenize("SELECT 'abc");
    ASSERT_FALSE(tokens.has_value());
    EXPECT_EQ(tokens.error().code, ErrorCode::kSyntaxError);
    EXPECT_NE(tokens.error().message.find("unterminated string literal"), std::string::npos);
}

TEST(SqlLexer, UnterminatedBlockCommentFails) {
    EXPECT_FALSE(tokenize("SELECT 1 /* open").has_value());
}

TEST(SqlLexer, OperatorEndingInMinusIsSplit) {
    // "=-1" → "=", "-", "1"
    const auto tokens = tokenize("a=-1");
    ASSERT_TRUE(tokens.has_value());
    ASSERT_EQ(tokens->size(), 5U);
    EXPECT_EQ((*tokens)[1].value, "=");
    EXPECT_EQ((*tokens)[2].value, "-");
}

TEST(SqlLexer, DoubleColonCast) {
    const auto tokens = tokenize("SELECT x::text");
    ASSERT_TRUE(tokens.has_value());
    EXPECT_EQ((*tokens)[2].kind, TokenKind::kDoubleColon);
}

// ---------------------------------------------------------------------------
// 구문 분류
// ---------------------------------------------------------------------------

TEST(SqlParser, SelectStatement) {
    EXPECT_EQ(kind_of("SELECT id FROM users"), StatementKind::kSelect);
}

TEST(SqlParser, ValuesAndTableAreSelect) {
    EXPECT_EQ(kind_of("VALUES (1), (2)"), StatementKind::kSelect);
    EXPECT_EQ(kind_of("TABLE users"), StatementKind::kSelect);
    EXPECT_EQ(kind_of("(SELECT 1)"), StatementKind::kSelect);
}

TEST(SqlParser, WriteStatements) {
    EXPECT_EQ(kind_of("INSERT INTO users(name) VALUES('alice')"), StatementKind::kInsert);
    EXPECT_EQ(kind_of("UPDATE users SET name='bob' WHERE id=1"), StatementKind::kUpdate);
    EXPECT_EQ(kind_of("DELETE FROM users WHERE id=1"), StatementKind::kDelete);
    EXPECT_EQ(kind_of("TRUNCATE TABLE logs"), StatementKind::kTruncate);
}

TEST(SqlParser, DdlAndPrivilegeStatements) {
    EXPECT_EQ(kind_of("DROP TABLE users"), StatementKind::kDrop);
    EXPECT_EQ(kind_of("CREATE TABLE t (id INT)"), StatementKind::kCreate);
    EXPECT_EQ(kind_of("ALTER TABLE users ADD col INT"), StatementKind::kAlter);
    EXPECT_EQ(kind_of("GRANT SELECT ON users TO bob"), StatementKind::kGrant);
    EXPECT_EQ(kind_of("REVOKE SELECT ON users FROM bob"), StatementKind::kRevoke);
}

TEST(SqlParser, SessionAndUtilityCommands) {
    EXPECT_EQ(kind_of("SET search_path = evil"), StatementKind::kSet);
    EXPECT_EQ(kind_of("RESET ALL"), StatementKind::kSet);
    EXPECT_EQ(kind_of("EXPLAIN SELECT 1"), StatementKind::kCommand);
    EXPECT_EQ(kind_of("VACUUM users"), StatementKind::kCommand);
    EXPECT_EQ(kind_of("CALL do_things(1)"), StatementKind::kCommand);
}

TEST(SqlParser, WithFollowedByDeleteIsDelete) {
    SqlParser  parser;
    const auto tree = parser.parse("WITH old AS (SELECT id FROM logs) DELETE FROM logs WHERE id IN (SELECT id FROM old)");
    ASSERT_TRUE(tree.has_value());
    ASSERT_EQ(tree->statements.size(), 1U);
    EXPECT_EQ(tree->statements.front().kind, StatementKind::kDelete);
    EXPECT_EQ(tree->statements.front().ctes.size(), 1U);
}

TEST(SqlParser, MultipleStatementsAreKept) {
    SqlParser  parser;
    const auto tree = parser.parse("SELECT 1; DROP TABLE users;");
    ASSERT_TRUE(tree.has_value());
    ASSERT_EQ(tree->statements.size(), 2U);
    EXPECT_EQ(tree->statements[1].kind, StatementKind::kDrop);
}

TEST(SqlParser, UnknownLeadingKeywordFails) {
    SqlParser parser;
    EXPECT_FALSE(parser.parse("FOOBAR something").has_value());
}

TEST(SqlParser, EmptyInputFails) {
    SqlParser parser;
    EXPECT_FALSE(parser.parse("").has_value());
    EXPECT_FALSE(parser.parse("   \n\t ").has_value());
    EXPECT_FALSE(parser.parse("-- only a comment").has_value());
    EXPECT_FALSE(parser.parse(";").has_value());
}

TEST(SqlParser, IncompleteSelectFails) {
    SqlParser  parser;
    const auto tree = parser.parse("SELECT id FROM");
    ASSERT_FALSE(tree.has_value());
    EXPECT_EQ(tree.error().code, ErrorCode::kSyntaxError);
    EXPECT_NE(tree.error().message.find("at position"), std::string::npos);
}

TEST(SqlParser, UnbalancedParenthesesFail) {
    SqlParser parser;
    EXPECT_FALSE(parser.parse("SELECT (1 + 2").has_value());
    EXPECT_FALSE(parser.parse("SELECT 1)").has_value());
}

TEST(SqlParser, LimitValueIsRecorded) {
    SqlParser  parser;
    const auto tree = parser.parse("SELECT id FROM users LIMIT 25");
    ASSERT_TRUE(tree.has_value());
    const auto& query = *tree->statements.front().query;
    ASSERT_TRUE(query.limit.has_value());
    ASSERT_TRUE(query.limit->value.has_value());
    EXPECT_EQ(*query.limit->value, 25);
    EXPECT_FALSE(query.limit->all);
}

TEST(SqlParser, RichSelectParses) {
    SqlParser parser;
    const char* sql =
        "WITH RECURSIVE t(n) AS (SELECT 1 UNION ALL SELECT n + 1 FROM t WHERE n < 10) "
        "SELECT DISTINCT ON (o.customer_id) o.customer_id, "
        "       CASE WHEN o.total > 100 THEN 'big' ELSE 'small' END AS size, "
        "       CAST(o.created_at AS date), o.amount::numeric(10, 2), "
        "       row_number() OVER (PARTITION BY o.customer_id ORDER BY o.created_at DESC) "
        "FROM orders o LEFT JOIN customers c ON c.id = o.customer_id "
        "WHERE o.status IN ('a', 'b') AND o.total BETWEEN 1 AND 10 AND c.name ILIKE '%x%' "
        "  AND EXISTS (SELECT 1 FROM t WHERE t.n = o.id) "
        "GROUP BY 1, 2 HAVING count(*) > 1 "
        "ORDER BY 1 NULLS LAST LIMIT 10 OFFSET 5";
    EXPECT_TRUE(parser.parse(sql).has_value());
}

// ---------------------------------------------------------------------------
// 테이블 / 스키마 추출
// ---------------------------------------------------------------------------

TEST(QueryAnalyzer, TablesFromJoinInFirstSeenOrder) {
    const auto q = analyze("SELECT * FROM orders o JOIN customers c ON o.cust_id = c.id JOIN orders o2 ON true");
    EXPECT_EQ(q.tables, (std::vector<std::string>{"orders", "customers"}));
}

TEST(QueryAnalyzer, TablesAreLowerCased) {
    const auto q = analyze("SELECT 1 FROM Users");
    EXPECT_EQ(q.tables, (std::vector<std::string>{"users"}));
}

TEST(QueryAnalyzer, SchemaQualifiedTable) {
    const auto q = analyze("SELECT id FROM analytics.events");
    EXPECT_EQ(q.tables, (std::vector<std::string>{"events"}));
    EXPECT_EQ(q.schemas, (std::vector<std::string>{"analytics"}));
}

TEST(QueryAnalyzer, DefaultSchemaIsPublic) {
    const auto q = analyze("SELECT id FROM users");
    EXPECT_EQ(q.schemas, (std::vector<std::string>{"public"}));
}

TEST(QueryAnalyzer, SubqueryTablesIncluded) {
    const auto q = analyze("SELECT id FROM users WHERE id IN (SELECT user_id FROM orders)");
    EXPECT_EQ(q.tables, (std::vector<std::string>{"users", "orders"}));
}

TEST(QueryAnalyzer, CteNamesAreNotTables) {
    const auto q = analyze("WITH recent AS (SELECT id FROM orders) SELECT id FROM recent");
    EXPECT_EQ(q.tables, (std::vector<std::string>{"orders"}));
}

TEST(QueryAnalyzer, SelectIsReadonly) {
    EXPECT_TRUE(analyze("SELECT 1").is_readonly);
    EXPECT_FALSE(analyze("SELECT id FROM users FOR UPDATE").is_readonly);
}

// ---------------------------------------------------------------------------
// 컬럼 / 별칭
// ---------------------------------------------------------------------------

TEST(QueryAnalyzer, QualifiedColumnResolvesAlias) {
    const auto q = analyze("SELECT u.email FROM users u");
    EXPECT_TRUE(has_column(q, "users", "email"));
}

TEST(QueryAnalyzer, UnqualifiedColumnWithSingleTable) {
    const auto q = analyze("SELECT Email FROM users WHERE id = 1");
    EXPECT_TRUE(has_column(q, "users", "email"));
    EXPECT_TRUE(has_column(q, "users", "id"));
}

TEST(QueryAnalyzer, UnqualifiedColumnWithJoinGoesToEveryCandidate) {
    const auto q = analyze("SELECT ssn FROM users u JOIN orders o ON o.user_id = u.id");
    EXPECT_TRUE(has_column(q, "users", "ssn"));
    EXPECT_TRUE(has_column(q, "orders", "ssn"));
}

TEST(QueryAnalyzer, ColumnWithoutFromHasEmptyTable) {
    const auto q = analyze("SELECT password");
    EXPECT_TRUE(has_column(q, "", "password"));
}

TEST(QueryAnalyzer, CorrelatedSubqueryUsesOuterAlias) {
    const auto q = analyze(
        "SELECT id FROM users u WHERE EXISTS (SELECT 1 FROM orders o WHERE o.user_id = u.id AND u.ssn IS NOT NULL)");
    EXPECT_TRUE(has_column(q, "users", "ssn"));
    EXPECT_TRUE(has_column(q, "orders", "user_id"));
}

TEST(QueryAnalyzer, CteColumnsAreNotReportedAgain) {
    const auto q = analyze("WITH x AS (SELECT email FROM users) SELECT x.email FROM x");
    EXPECT_TRUE(has_column(q, "users", "email"));
    EXPECT_FALSE(has_column(q, "x", "email"));
}

TEST(QueryAnalyzer, OrderByOutputAliasIsNotAColumn) {
    const auto q = analyze("SELECT count(id) AS n FROM users ORDER BY n");
    EXPECT_FALSE(has_column(q, "users", "n"));
}

// ---------------------------------------------------------------------------
// SELECT *
// ---------------------------------------------------------------------------

TEST(QueryAnalyzer, BareStarCoversAllSources) {
    const auto q = analyze("SELECT * FROM users u JOIN orders o ON o.user_id = u.id");
    EXPECT_TRUE(q.has_select_star);
    EXPECT_EQ(q.star_tables, (std::vector<std::string>{"users", "orders"}));
    ASSERT_EQ(q.star_targets.size(), 1U);
    EXPECT_FALSE(q.star_targets.front().qualified);
    EXPECT_TRUE(q.star_targets.front().rewritable);
    EXPECT_EQ(q.star_targets.front().sources.size(), 2U);
}

TEST(QueryAnalyzer, QualifiedStarCoversOneSource) {
    const auto q = analyze("SELECT o.*, u.id FROM users u JOIN orders o ON o.user_id = u.id");
    EXPECT_EQ(q.star_tables, (std::vector<std::string>{"orders"}));
    ASSERT_EQ(q.star_targets.size(), 1U);
    EXPECT_TRUE(q.star_targets.front().qualified);
    EXPECT_EQ(q.star_targets.front().sources.front().qualifier, "o");
}

TEST(QueryAnalyzer, CountStarIsNotSelectStar) {
    const auto q = analyze("SELECT count(*) FROM users");
    EXPECT_FALSE(q.has_select_star);
}

TEST(QueryAnalyzer, StarInsideFunctionIsNotRewritable) {
    const auto q = analyze("SELECT row_to_json(u.*) FROM users u");
    EXPECT_TRUE(q.has_select_star);
    ASSERT_EQ(q.star_targets.size(), 1U);
    EXPECT_FALSE(q.star_targets.front().rewritable);
}

TEST(QueryAnalyzer, StarSpanCoversStarText) {
    const std::string sql = "SELECT u.* FROM users u";
    const auto q = analyze(sql);
    ASSERT_EQ(q.star_targets.size(), 1U);
    const auto& span = q.star_targets.front().span;
    EXPECT_EQ(sql.substr(span.offset, span.length), "u.*");
}

// ---------------------------------------------------------------------------
// QueryFacts
// ---------------------------------------------------------------------------

TEST(QueryAnalyzer, FunctionCallsAreCollectedLowerCase) {
    const auto f = facts_of("SELECT PG_SLEEP(1), upper(name) FROM users");
    EXPECT_NE(std::find(f.function_calls.begin(), f.function_calls.end(), "pg_sleep"), f.function_calls.end());
    EXPECT_NE(std::find(f.function_calls.begin(), f.function_calls.end(), "upper"), f.function_calls.end());
}

TEST(QueryAnalyzer, SchemaQualifiedFunctionKeepsBareName) {
    const auto f = facts_of("SELECT pg_catalog.pg_read_file('x')");
    EXPECT_NE(std::find(f.function_calls.begin(), f.function_calls.end(), "pg_read_file"), f.function_calls.end());
}

TEST(QueryAnalyzer, CteBodyKindIsNested) {
    const auto f = facts_of("WITH d AS (DELETE FROM logs RETURNING id) SELECT id FROM d");
    ASSERT_FALSE(f.nested_kinds.empty());
    EXPECT_EQ(f.nested_kinds.front(), StatementKind::kDelete);
}
