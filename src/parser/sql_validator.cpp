#include "parser/sql_validator.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <string>
#include <string_view>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace {

constexpr std::array<std::string_view, 27> kDangerousFunctions = {
    "pg_sleep",
    "pg_terminate_backend",
    "pg_cancel_backend",
    "pg_reload_conf",
    "pg_rotate_logfile",
    "lo_import",
    "lo_export",
    "lo_unlink",
    "pg_read_file",
    "pg_read_binary_file",
    "pg_write_file",
    "pg_ls_dir",
    "dblink_exec",
    // 임의 쿼리/테이블을 XML 로 실행하므로 테이블 정책을 우회한다
    "query_to_xml",
    "query_to_xmlschema",
    "query_to_xml_and_xmlschema",
    "table_to_xml",
    "table_to_xmlschema",
    "table_to_xml_and_xmlschema",
    "cursor_to_xml",
    "cursor_to_xmlschema",
    "schema_to_xml",
    "schema_to_xmlschema",
    "schema_to_xml_and_xmlschema",
    "database_to_xml",
    "database_to_xmlschema",
    "database_to_xml_and_xmlschema",
};

constexpr std::string_view kDangerousPrefix = "dblink";

std::string to_upper(std::string_view s) {
    std::string result(s);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return result;
}

ValidationResult invalid(std::string message) {
    ValidationResult result;
    result.is_valid      = false;
    result.is_safe       = false;
    result.error_message = std::move(message);
    return result;
}

ValidationResult unsafe(std::string message) {
    ValidationResult result;
    result.is_valid      = true;
    result.is_safe       = false;
    result.error_message = std::move(message);
    return result;
}

// 구문 뒤 꼬리(공백/주석/세미콜론)에서 세미콜론만 제거한다
std::string strip_semicolons_keep_comments(std::string_view tail) {
    std::string out;
    out.reserve(tail.size());
    std::size_t i = 0;
    while (i < tail.size()) {
        if (tail[i] == '-' && i + 1 < tail.size() && tail[i + 1] == '-') {
            const std::size_t nl = tail.find('\n', i);
            const std::size_t end = nl == std::string_view::npos ? tail.size() : nl;
            out.append(tail.substr(i, end - i));
            i = end;
        } else if (tail[i] == '/' && i + 1 < tail.size() && tail[i + 1] == '*') {
            const std::size_t close = tail.find("*/", i + 2);
            const std::size_t end = close == std::string_view::npos ? tail.size() : close + 2;
            out.append(tail.substr(i, end - i));
            i = end;
        } else {
            if (tail[i] != ';') {
                out.push_back(tail[i]);
            }
            ++i;
        }
    }
    return out;
}

std::string replace_span(std::string_view sql, const SourceSpan& span, std::int64_t limit) {
    std::string out(sql.substr(0, span.offset));
    out += std::to_string(limit);
    out += sql.substr(span.offset + span.length);
    return out;
}

}  // namespace

SqlValidator::SqlValidator(std::size_t max_sql_length)
    : max_sql_length_{max_sql_length} {}

bool SqlValidator::is_dangerous_function(std::string_view lower_name) {
    if (lower_name.starts_with(kDangerousPrefix)) {
        return true;
    }
    return std::find(kDangerousFunctions.begin(), kDangerousFunctions.end(), lower_name) !=
           kDangerousFunctions.end();
}

ValidationResult SqlValidator::validate(std::string_view sql) const {
    if (sql.size() > max_sql_length_) {
        return invalid(fmt::format("query exceeds maximum length of {} bytes", max_sql_length_));
    }

    // 1. 원문 금지 키워드
    const PatternMatch match = scanner_.scan(sql);
    if (match.matched) {
        spdlog::debug("sql_validator: forbidden pattern matched: {}", match.pattern);
        return unsafe(match.reason);
    }

    // 2. 파싱
    auto tree = parser_.parse(sql);
    if (!tree) {
        return invalid(tree.error().message);
    }

    // 3. 단일 구문
    if (tree->statements.size() > 1) {
        return unsafe(fmt::format("Multiple statements (stacked queries) are not allowed (found {})",
                                  tree->statements.size()));
    }

    const Statement& stmt = tree->statements.front();

    // 4. 구문 종류
    if (stmt.kind != StatementKind::kSelect) {
        return unsafe(fmt::format("Statement type '{}' is not allowed (read-only queries only)",
                                  to_upper(stmt.keyword)));
    }

    const QueryAnalysis analysis = analyze_query(sql, *tree);
    const QueryFacts&   facts    = analysis.facts;

    // 5. 위험 함수
    for (const auto& name : facts.function_calls) {
        if (is_dangerous_function(name)) {
            return unsafe(fmt::format("Dangerous function '{}' is not allowed", name));
        }
    }

    // 6. SELECT 변형
    if (facts.has_into) {
        return unsafe("SELECT INTO is not allowed (creates tables)");
    }
    if (facts.has_locking) {
        return unsafe("Locking clause is not allowed");
    }

    // 7. CTE / 서브쿼리 내부 변경 구문
    for (const StatementKind kind : facts.nested_kinds) {
        if (kind != StatementKind::kSelect) {
            return unsafe(fmt::format("CTE or subquery contains forbidden statement type: {}",
                                      statement_kind_name(kind)));
        }
    }

    ValidationResult result;
    result.is_valid = true;
    result.is_safe  = true;
    if (analysis.parsed.has_select_star) {
        result.warnings.emplace_back("SELECT * exposes every column of the referenced tables");
    }
    return result;
}

std::expected<void, GatewayError> SqlValidator::validate_and_raise(std::string_view sql) const {
    const ValidationResult result = validate(sql);
    if (!result.is_valid) {
        return std::unexpected(make_error(
            ErrorCode::kSyntaxError,
            result.error_message.empty() ? "Invalid SQL" : result.error_message));
    }
    if (!result.is_safe) {
        return std::unexpected(make_error(
            ErrorCode::kUnsafeSql,
            result.error_message.empty() ? "Unsafe SQL" : result.error_message));
    }
    return {};
}

std::string SqlValidator::add_limit(std::string_view sql, std::int64_t limit) const {
    if (limit <= 0 || sql.size() > max_sql_length_) {
        return std::string(sql);
    }

    auto tree = parser_.parse(sql);
    if (!tree || tree->statements.size() != 1) {
        return std::string(sql);
    }
    const Statement& stmt = tree->statements.front();
    if (stmt.kind != StatementKind::kSelect || !stmt.query) {
        return std::string(sql);
    }

    const Query& query = *stmt.query;
    const std::optional<RowLimit>& existing = query.limit ? query.limit : query.fetch_first;
    if (existing) {
        if (existing->value && !existing->all && *existing->value <= limit) {
            return std::string(sql);
        }
        return replace_span(sql, existing->span, limit);
    }

    const std::size_t end = tree->end_of_last_token;
    std::string out(sql.substr(0, end));
    out += fmt::format(" LIMIT {}", limit);
    out += strip_semicolons_keep_comments(sql.substr(end));
    return out;
}

std::vector<std::string> SqlValidator::extract_tables(std::string_view sql) const {
    if (sql.size() > max_sql_length_) {
        return {};
    }
    auto tree = parser_.parse(sql);
    if (!tree) {
        return {};
    }
    return analyze_query(sql, *tree).parsed.tables;
}

ParsedQuery SqlValidator::parse_for_policy(std::string_view sql) const {
    if (sql.size() > max_sql_length_) {
        ParsedQuery parsed;
        parsed.sql   = std::string(sql);
        parsed.error = fmt::format("query exceeds maximum length of {} bytes", max_sql_length_);
        return parsed;
    }
    auto tree = parser_.parse(sql);
    if (!tree) {
        ParsedQuery parsed;
        parsed.sql   = std::string(sql);
        parsed.error = tree.error().message;
        return parsed;
    }
    return analyze_query(sql, *tree).parsed;
}
