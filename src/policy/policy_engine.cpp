// ---------------------------------------------------------------------------
// policy_engine.cpp
//
// [이름 정규화]
// 모든 비교는 소문자로 수행한다. 컬럼 이름은 "table.column" 전체 문자열로
// 정규화되며, 테이블을 알 수 없는 컬럼(FROM 없는 SELECT 등)은 "column" 만으로
// 대조한다.
//
// [glob 매칭]
// fnmatch(3) 를 플래그 없이 사용한다. '*' 는 '.' 도 건너뛰므로
// "*password*" 는 모든 테이블의 password 관련 컬럼에 일치한다.
//
// [SELECT * 재작성]
// 재작성 대상 star 의 원문 구간을 뒤에서부터 치환한다 (앞쪽 offset 보존).
// 실제 테이블 소스는 "qualifier"."column" 목록으로, 파생 소스(서브쿼리/CTE)는
// qualifier.* 그대로 둔다. 파생 소스의 컬럼은 내부 쿼리에서 이미 검사된다.
//
// [알려진 한계]
// - JOIN ... USING 의 bare * 는 공통 컬럼을 한 번만 노출하지만, 재작성 결과는
//   양쪽 테이블의 컬럼을 모두 나열한다 (중복 컬럼명 발생 가능).
// - 대소문자가 섞인 따옴표 별칭 ("U") 은 파서가 소문자로 정규화하므로
//   재작성된 한정자가 원래 별칭과 달라질 수 있다.
// ---------------------------------------------------------------------------

#include "policy/policy_engine.hpp"

#include <algorithm>
#include <cctype>
#include <fnmatch.h>
#include <map>
#include <set>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

namespace {

std::string to_lower(std::string_view s) {
    std::string result(s);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::vector<std::string> lower_all(const std::vector<std::string>& values) {
    std::vector<std::string> result;
    result.reserve(values.size());
    for (const auto& v : values) {
        result.push_back(to_lower(v));
    }
    return result;
}

bool contains(const std::vector<std::string>& values, std::string_view needle) {
    return std::find(values.begin(), values.end(), needle) != values.end();
}

std::string full_column_name(const ColumnRef& ref) {
    if (ref.table.empty()) {
        return to_lower(ref.column);
    }
    return to_lower(ref.table) + "." + to_lower(ref.column);
}

// 소문자 단순 식별자는 그대로, 그 외는 큰따옴표로 감싼다
std::string quote_qualifier(std::string_view name) {
    const bool simple =
        !name.empty() && (std::islower(static_cast<unsigned char>(name.front())) || name.front() == '_') &&
        std::all_of(name.begin(), name.end(), [](unsigned char c) {
            return std::islower(c) || std::isdigit(c) || c == '_';
        });
    if (simple) {
        return std::string(name);
    }
    std::string out = "\"";
    for (const char c : name) {
        out.push_back(c);
        if (c == '"') {
            out.push_back('"');
        }
    }
    out.push_back('"');
    return out;
}

// 카탈로그의 컬럼명은 대소문자가 보존되어 있으므로 항상 따옴표로 감싼다
std::string quote_column(std::string_view name) {
    std::string out = "\"";
    for (const char c : name) {
        out.push_back(c);
        if (c == '"') {
            out.push_back('"');
        }
    }
    out.push_back('"');
    return out;
}

std::string relation_key(const StarSource& src) {
    return src.schema + "." + src.table;
}

}  // namespace

const char* check_type_name(PolicyCheckType type) noexcept {
    switch (type) {
        case PolicyCheckType::kSchema: return "schema";
        case PolicyCheckType::kTable:  return "table";
        case PolicyCheckType::kColumn: return "column";
    }
    return "table";
}

// ---------------------------------------------------------------------------
// PolicyValidationResult
// ---------------------------------------------------------------------------

bool PolicyValidationResult::has(PolicyCheckType type) const noexcept {
    return std::any_of(violations.begin(), violations.end(),
                       [type](const PolicyViolation& v) { return v.check_type == type; });
}

std::vector<std::string> PolicyValidationResult::resources(PolicyCheckType type) const {
    std::vector<std::string> result;
    for (const auto& v : violations) {
        if (v.check_type == type && !contains(result, v.resource)) {
            result.push_back(v.resource);
        }
    }
    return result;
}

void PolicyValidationResult::merge(PolicyValidationResult other) {
    passed = passed && other.passed;
    star_triggered = star_triggered || other.star_triggered;
    for (auto& v : other.violations) {
        violations.push_back(std::move(v));
    }
    for (auto& w : other.warnings) {
        warnings.push_back(std::move(w));
    }
    if (other.rewritten_sql) {
        rewritten_sql = std::move(other.rewritten_sql);
    }
}

GatewayError PolicyValidationResult::to_error(const std::vector<std::string>& allowed_schemas) const {
    if (has(PolicyCheckType::kSchema)) {
        auto schemas = resources(PolicyCheckType::kSchema);
        GatewayError err = make_error(
            ErrorCode::kSchemaAccessDenied,
            fmt::format("Access denied to schema '{}'. Allowed: {}", schemas.front(),
                        fmt::join(allowed_schemas, ", ")));
        err.resources = std::move(schemas);
        return err;
    }
    if (has(PolicyCheckType::kTable)) {
        auto tables = resources(PolicyCheckType::kTable);
        GatewayError err = make_error(
            ErrorCode::kTableAccessDenied,
            fmt::format("Access denied to tables: {}", fmt::join(tables, ", ")));
        err.resources = std::move(tables);
        return err;
    }
    if (has(PolicyCheckType::kColumn)) {
        auto columns = resources(PolicyCheckType::kColumn);
        std::string message = fmt::format("Access denied to columns: {}", fmt::join(columns, ", "));
        if (star_triggered) {
            message += " (triggered by SELECT *)";
        }
        GatewayError err = make_error(ErrorCode::kColumnAccessDenied, std::move(message));
        err.resources = std::move(columns);
        return err;
    }
    return make_error(ErrorCode::kInternalError, "policy result has no violation to report");
}

// ---------------------------------------------------------------------------
// PolicyEngine
// ---------------------------------------------------------------------------

PolicyEngine::PolicyEngine(PolicyConfig config)
    : config_{std::move(config)},
      allowed_schemas_lower_{lower_all(config_.allowed_schemas)},
      allowed_tables_lower_{lower_all(config_.tables.allowed)},
      denied_tables_lower_{lower_all(config_.tables.denied)},
      denied_columns_lower_{lower_all(config_.columns.denied)},
      denied_patterns_lower_{lower_all(config_.columns.denied_patterns)} {
    if (!allowed_tables_lower_.empty() && !denied_tables_lower_.empty()) {
        spdlog::warn("policy_engine: both tables.allowed and tables.denied are set, "
                     "tables.denied is ignored");
    }
    for (const auto& pattern : config_.columns.denied_patterns) {
        if (std::count(pattern.begin(), pattern.end(), '*') > 2) {
            spdlog::warn("policy_engine: column pattern '{}' may match too broadly", pattern);
        }
    }
}

bool PolicyEngine::has_column_rules() const noexcept {
    return !denied_columns_lower_.empty() || !denied_patterns_lower_.empty();
}

std::optional<std::string> PolicyEngine::column_denial_reason(std::string_view full_name) const {
    if (contains(denied_columns_lower_, full_name)) {
        return "Column in denied list";
    }
    const std::string name(full_name);
    for (const auto& pattern : denied_patterns_lower_) {
        if (::fnmatch(pattern.c_str(), name.c_str(), 0) == 0) {
            return "Column matches denied pattern";
        }
    }
    return std::nullopt;
}

PolicyValidationResult PolicyEngine::validate_schema(std::string_view schema) const {
    PolicyValidationResult result;
    if (!contains(allowed_schemas_lower_, to_lower(schema))) {
        result.passed = false;
        result.violations.push_back(PolicyViolation{
            PolicyCheckType::kSchema, std::string(schema),
            fmt::format("Schema not in allowed list: [{}]", fmt::join(config_.allowed_schemas, ", "))});
    }
    return result;
}

PolicyValidationResult PolicyEngine::validate_tables(const std::vector<std::string>& tables) const {
    PolicyValidationResult result;
    for (const auto& table : tables) {
        const std::string name = to_lower(table);
        if (!allowed_tables_lower_.empty()) {
            if (!contains(allowed_tables_lower_, name)) {
                result.violations.push_back(
                    PolicyViolation{PolicyCheckType::kTable, name, "Table not in allowed list"});
            }
        } else if (contains(denied_tables_lower_, name)) {
            result.violations.push_back(
                PolicyViolation{PolicyCheckType::kTable, name, "Table in denied list"});
        }
    }
    result.passed = result.violations.empty();
    return result;
}

PolicyValidationResult PolicyEngine::validate_columns(const std::vector<ColumnRef>& columns,
                                                      bool is_select_star) const {
    PolicyValidationResult result;
    std::vector<std::string> denied;

    for (const auto& ref : columns) {
        const std::string full_name = full_column_name(ref);
        if (auto reason = column_denial_reason(full_name)) {
            result.violations.push_back(
                PolicyViolation{PolicyCheckType::kColumn, full_name, std::move(*reason)});
            denied.push_back(full_name);
        }
    }

    result.passed = result.violations.empty();
    if (is_select_star && !result.passed &&
        config_.columns.select_star_policy == SelectStarPolicy::kReject) {
        result.star_triggered = true;
        result.warnings.push_back(
            fmt::format("SELECT * would access sensitive columns: [{}]", fmt::join(denied, ", ")));
    }
    return result;
}

std::vector<std::string> PolicyEngine::get_safe_columns(
    std::string_view table, const std::vector<std::string>& all_columns) const {
    std::vector<std::string> safe;
    const std::string prefix = to_lower(table);
    for (const auto& col : all_columns) {
        if (!column_denial_reason(prefix + "." + to_lower(col))) {
            safe.push_back(col);
        }
    }
    return safe;
}

PolicyValidationResult PolicyEngine::validate_sql(const ParsedQuery&    parsed,
                                                  const SchemaSnapshot* snapshot) const {
    if (parsed.error) {
        PolicyValidationResult result;
        result.passed = false;
        result.violations.push_back(PolicyViolation{
            PolicyCheckType::kTable, "<unparsed>",
            fmt::format("Query could not be analyzed: {}", *parsed.error)});
        return result;
    }

    PolicyValidationResult result;

    // 1. 스키마
    for (const auto& schema : parsed.schemas) {
        result.merge(validate_schema(schema));
    }

    // 2. 테이블
    result.merge(validate_tables(parsed.tables));

    // 3. 명시적으로 참조된 컬럼
    PolicyValidationResult explicit_columns = validate_columns(parsed.columns, false);
    const std::vector<std::string> explicit_denied = explicit_columns.resources(PolicyCheckType::kColumn);
    result.merge(std::move(explicit_columns));

    if (!parsed.has_select_star) {
        return result;
    }

    // 4. star 가 노출하는 컬럼
    std::map<std::string, std::vector<std::string>> resolved;  // "schema.table" → 컬럼
    std::set<std::string>                           unresolved;
    std::vector<ColumnRef>                          star_columns;

    for (const auto& target : parsed.star_targets) {
        for (const auto& src : target.sources) {
            if (src.table.empty()) {
                continue;
            }
            const std::string key = relation_key(src);
            if (resolved.count(key) != 0 || unresolved.count(src.table) != 0) {
                continue;
            }
            auto cols = snapshot != nullptr ? snapshot->relation_columns(src.table, src.schema)
                                            : std::nullopt;
            if (!cols) {
                unresolved.insert(src.table);
                continue;
            }
            for (const auto& col : *cols) {
                star_columns.push_back(ColumnRef{src.table, to_lower(col)});
            }
            resolved.emplace(key, std::move(*cols));
        }
    }

    PolicyValidationResult star_result = validate_columns(star_columns, true);
    // 명시적 참조와 겹치는 위반은 한 번만 보고한다
    std::erase_if(star_result.violations, [&](const PolicyViolation& v) {
        return contains(explicit_denied, v.resource);
    });
    if (has_column_rules()) {
        for (const auto& table : unresolved) {
            star_result.violations.push_back(PolicyViolation{
                PolicyCheckType::kColumn, table + ".*",
                "Columns exposed by SELECT * cannot be resolved"});
        }
    }
    star_result.passed = star_result.violations.empty();
    if (star_result.passed) {
        return result;
    }
    star_result.star_triggered = true;

    if (config_.columns.select_star_policy == SelectStarPolicy::kAllow &&
        explicit_denied.empty() && unresolved.empty()) {
        // 위반 컬럼을 가진 테이블
        std::set<std::string> violating_tables;
        for (const auto& v : star_result.violations) {
            violating_tables.insert(v.resource.substr(0, v.resource.find('.')));
        }

        struct Replacement {
            SourceSpan  span;
            std::string text;
        };
        std::vector<Replacement> replacements;
        bool rewritable = true;

        for (const auto& target : parsed.star_targets) {
            const bool touches = std::any_of(
                target.sources.begin(), target.sources.end(),
                [&](const StarSource& s) { return violating_tables.count(s.table) != 0; });
            if (!touches) {
                continue;
            }
            if (!target.rewritable) {
                rewritable = false;
                break;
            }
            std::vector<std::string> items;
            for (const auto& src : target.sources) {
                if (src.qualifier.empty()) {
                    rewritable = false;
                    break;
                }
                const std::string qualifier = quote_qualifier(src.qualifier);
                if (src.table.empty()) {
                    items.push_back(qualifier + ".*");
                    continue;
                }
                for (const auto& col : get_safe_columns(src.table, resolved.at(relation_key(src)))) {
                    items.push_back(qualifier + "." + quote_column(col));
                }
            }
            if (!rewritable || items.empty()) {
                rewritable = false;
                break;
            }
            replacements.push_back(Replacement{target.span, fmt::format("{}", fmt::join(items, ", "))});
        }

        if (rewritable && !replacements.empty()) {
            std::sort(replacements.begin(), replacements.end(),
                      [](const Replacement& a, const Replacement& b) {
                          return a.span.offset > b.span.offset;
                      });
            std::string sql = parsed.sql;
            for (const auto& r : replacements) {
                sql.replace(r.span.offset, r.span.length, r.text);
            }
            const auto excluded = star_result.resources(PolicyCheckType::kColumn);
            spdlog::debug("policy_engine: SELECT * rewritten, excluded {} column(s)", excluded.size());
            result.warnings.push_back(fmt::format(
                "SELECT * was expanded without denied columns: [{}]", fmt::join(excluded, ", ")));
            result.rewritten_sql = std::move(sql);
            return result;
        }
    }

    star_result.warnings.clear();
    star_result.warnings.push_back(fmt::format(
        "SELECT * would access sensitive columns: [{}]",
        fmt::join(star_result.resources(PolicyCheckType::kColumn), ", ")));
    result.merge(std::move(star_result));
    return result;
}
