#include "parser/query_analyzer.hpp"

#include <algorithm>
#include <cctype>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

namespace {

std::string to_lower(std::string_view s) {
    std::string result(s);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

void push_unique(std::vector<std::string>& out, const std::string& value) {
    if (std::find(out.begin(), out.end(), value) == out.end()) {
        out.push_back(value);
    }
}

struct Source {
    std::string key;     // 별칭 또는 이름
    std::string schema;
    std::string table;   // 파생 소스는 빈 문자열
};

struct Scope {
    const Scope*        parent{nullptr};
    std::vector<Source> sources{};
};

class Analyzer {
public:
    explicit Analyzer(QueryAnalysis& out) : out_{out} {}

    void walk_top(const Statement& stmt) {
        out_.facts.statement_kinds.push_back(stmt.kind);
        walk_statement(stmt, nullptr);
    }

private:
    QueryFacts&  facts() { return out_.facts; }
    ParsedQuery& parsed() { return out_.parsed; }

    void walk_statement(const Statement& stmt, const Scope* parent) {
        for (const auto& name : stmt.function_calls) {
            facts().function_calls.push_back(to_lower(name));
        }
        const std::size_t pushed = push_cte_names(stmt.ctes);
        for (const auto& cte : stmt.ctes) {
            walk_cte(cte, parent);
        }
        if (stmt.query) {
            walk_query(*stmt.query, parent);
        }
        cte_names_.resize(cte_names_.size() - pushed);
    }

    std::size_t push_cte_names(const std::vector<Cte>& ctes) {
        for (const auto& cte : ctes) {
            cte_names_.push_back(to_lower(cte.name));
        }
        return ctes.size();
    }

    bool is_cte_name(const std::string& name) const {
        return std::find(cte_names_.begin(), cte_names_.end(), name) != cte_names_.end();
    }

    void walk_cte(const Cte& cte, const Scope* parent) {
        if (!cte.body) {
            return;
        }
        facts().nested_kinds.push_back(cte.body->kind);
        walk_statement(*cte.body, parent);
    }

    void walk_query(const Query& query, const Scope* parent) {
        const std::size_t pushed = push_cte_names(query.ctes);
        for (const auto& cte : query.ctes) {
            walk_cte(cte, parent);
        }

        if (!query.locking.empty()) {
            facts().has_locking = true;
        }

        // 단일 SELECT 의 ORDER BY 는 해당 SELECT 의 FROM 스코프에서 해석한다
        const SelectCore* single = nullptr;
        if (query.terms.size() == 1 && query.terms.front().select) {
            single = query.terms.front().select.get();
        }

        Scope order_scope{parent, {}};
        for (const auto& term : query.terms) {
            if (term.nested) {
                walk_query(*term.nested, parent);
            } else if (term.select) {
                Scope scope = walk_select(*term.select, parent);
                if (term.select.get() == single) {
                    order_scope.sources = std::move(scope.sources);
                }
            }
        }

        std::unordered_set<std::string> output_aliases;
        if (single != nullptr) {
            for (const auto& item : single->items) {
                if (!item.alias.empty()) {
                    output_aliases.insert(to_lower(item.alias));
                }
            }
        }
        for (const auto& expr : query.order_by) {
            if (expr && expr->kind == Expr::Kind::kColumnRef && expr->qualifier.empty() &&
                output_aliases.contains(to_lower(expr->name))) {
                continue;
            }
            walk_expr(expr.get(), order_scope);
        }

        Scope outer{parent, {}};
        walk_expr(query.limit_expr.get(), outer);
        walk_expr(query.offset.get(), outer);

        cte_names_.resize(cte_names_.size() - pushed);
    }

    Scope walk_select(const SelectCore& core, const Scope* parent) {
        if (core.has_into) {
            facts().has_into = true;
        }

        Scope scope{parent, {}};
        std::vector<const Expr*> join_conditions;
        for (const auto& ref : core.from) {
            add_sources(*ref, scope, join_conditions);
        }
        for (const Expr* cond : join_conditions) {
            walk_expr(cond, scope);
        }

        for (const auto& item : core.items) {
            if (item.expr && item.expr->kind == Expr::Kind::kStar) {
                record_star(*item.expr, scope, true);
            } else {
                walk_expr(item.expr.get(), scope);
            }
        }

        for (const auto& e : core.distinct_on) {
            walk_expr(e.get(), scope);
        }
        walk_expr(core.where.get(), scope);
        for (const auto& e : core.group_by) {
            walk_expr(e.get(), scope);
        }
        walk_expr(core.having.get(), scope);
        for (const auto& e : core.window_exprs) {
            walk_expr(e.get(), scope);
        }
        for (const auto& row : core.values) {
            for (const auto& e : row) {
                walk_expr(e.get(), scope);
            }
        }
        return scope;
    }

    void add_sources(const TableRef& ref, Scope& scope, std::vector<const Expr*>& conditions) {
        switch (ref.kind) {
            case TableRef::Kind::kTable: {
                const std::string name = to_lower(ref.name);
                const std::string key  = ref.alias.empty() ? name : to_lower(ref.alias);
                if (ref.schema.empty() && is_cte_name(name)) {
                    scope.sources.push_back(Source{key, {}, {}});
                    return;
                }
                const std::string schema = ref.schema.empty() ? "public" : to_lower(ref.schema);
                add_table(schema, name);
                scope.sources.push_back(Source{key, schema, name});
                return;
            }
            case TableRef::Kind::kSubquery: {
                facts().nested_kinds.push_back(StatementKind::kSelect);
                if (ref.subquery) {
                    walk_query(*ref.subquery, ref.lateral ? &scope : scope.parent);
                }
                scope.sources.push_back(Source{to_lower(ref.alias), {}, {}});
                return;
            }
            case TableRef::Kind::kFunction: {
                walk_expr(ref.function.get(), scope);
                const std::string key = ref.alias.empty() && ref.function
                                            ? to_lower(ref.function->name)
                                            : to_lower(ref.alias);
                scope.sources.push_back(Source{key, {}, {}});
                return;
            }
            case TableRef::Kind::kJoin: {
                if (ref.left) {
                    add_sources(*ref.left, scope, conditions);
                }
                if (ref.right) {
                    add_sources(*ref.right, scope, conditions);
                }
                if (ref.condition) {
                    conditions.push_back(ref.condition.get());
                }
                return;
            }
        }
    }

    void add_table(const std::string& schema, const std::string& table) {
        auto& p = parsed();
        if (p.tables.empty()) {
            p.schemas.clear();
        }
        push_unique(p.tables, table);
        push_unique(p.schemas, schema);
    }

    static const Source* resolve(const Scope& scope, const std::string& key) {
        for (const Scope* s = &scope; s != nullptr; s = s->parent) {
            for (const auto& src : s->sources) {
                if (src.key == key) {
                    return &src;
                }
            }
        }
        return nullptr;
    }

    // 행 전체를 값으로 쓰는 참조 (SELECT u, row_to_json(u), to_jsonb(public.users)).
    // 모든 컬럼을 노출하므로 재작성 불가능한 alias.* 로 기록한다.
    void record_whole_row(const Source& src, const SourceSpan& span) {
        StarTarget target;
        target.span       = span;
        target.qualified  = true;
        target.rewritable = false;
        target.sources.push_back(StarSource{src.key, src.schema, src.table});

        auto& p = parsed();
        p.has_select_star = true;
        if (!src.table.empty()) {
            push_unique(p.star_tables, src.table);
        }
        p.star_targets.push_back(std::move(target));
    }

    // 컬럼 참조가 컬럼이 아니라 FROM 소스 자체를 가리키는 경우 그 소스.
    //   u            → 스코프 키 u
    //   public.users → 스키마가 일치하는 스코프 키 users (한정자가 소스가 아닐 때)
    static const Source* whole_row_source(const Expr& expr, const Scope& scope) {
        const std::string name = to_lower(expr.name);
        if (expr.qualifier.empty()) {
            return resolve(scope, name);
        }
        const std::string qualifier = to_lower(expr.qualifier);
        if (resolve(scope, qualifier) != nullptr) {
            return nullptr;
        }
        const Source* src = resolve(scope, name);
        if (src != nullptr && !src->table.empty() && src->schema == qualifier) {
            return src;
        }
        return nullptr;
    }

    void record_field_select(const Expr& expr, const Scope& scope) {
        const Expr* row = expr.args.empty() ? nullptr : expr.args.front().get();
        if (row == nullptr) {
            return;
        }

        // (u).col, (u.*).col : 소스의 컬럼 하나
        const Source* src = nullptr;
        if (row->kind == Expr::Kind::kColumnRef) {
            src = whole_row_source(*row, scope);
        } else if (row->kind == Expr::Kind::kStar && !row->qualifier.empty()) {
            src = resolve(scope, to_lower(row->qualifier));
        }
        if (src != nullptr) {
            if (expr.name == "*") {
                record_whole_row(*src, expr.span);
            } else if (!src->table.empty()) {
                add_column(src->table, to_lower(expr.name));
            }
            return;
        }

        // (composite_col).field 는 컬럼 자체로, 그 밖의 행 값 식은 내부를 그대로 검사한다
        walk_expr(row, scope);
    }

    void record_star(const Expr& star, const Scope& scope, bool in_select_list) {
        StarTarget target;
        target.span       = star.span;
        target.qualified  = !star.qualifier.empty();
        target.rewritable = in_select_list && star.span.length > 0;

        if (star.qualifier.empty()) {
            for (const auto& src : scope.sources) {
                target.sources.push_back(StarSource{src.key, src.schema, src.table});
            }
        } else {
            const std::string key = to_lower(star.qualifier);
            if (const Source* src = resolve(scope, key)) {
                target.sources.push_back(StarSource{src->key, src->schema, src->table});
            } else {
                target.sources.push_back(StarSource{key, "public", key});
            }
        }

        auto& p = parsed();
        p.has_select_star = true;
        for (const auto& src : target.sources) {
            if (!src.table.empty()) {
                push_unique(p.star_tables, src.table);
            }
        }
        p.star_targets.push_back(std::move(target));
    }

    void add_column(std::string table, std::string column) {
        ColumnRef ref{std::move(table), std::move(column)};
        auto& cols = parsed().columns;
        if (std::find(cols.begin(), cols.end(), ref) == cols.end()) {
            cols.push_back(std::move(ref));
        }
    }

    void record_column(const Expr& expr, const Scope& scope) {
        if (const Source* src = whole_row_source(expr, scope)) {
            record_whole_row(*src, expr.span);
            return;
        }

        const std::string column = to_lower(expr.name);

        if (!expr.qualifier.empty()) {
            const std::string key = to_lower(expr.qualifier);
            if (const Source* src = resolve(scope, key)) {
                if (!src->table.empty()) {
                    add_column(src->table, column);
                }
                return;
            }
            add_column(key, column);
            return;
        }

        for (const Scope* s = &scope; s != nullptr; s = s->parent) {
            if (s->sources.empty()) {
                continue;
            }
            for (const auto& src : s->sources) {
                if (!src.table.empty()) {
                    add_column(src.table, column);
                }
            }
            return;
        }
        add_column("", column);
    }

    void walk_expr(const Expr* expr, const Scope& scope) {
        if (expr == nullptr) {
            return;
        }
        switch (expr->kind) {
            case Expr::Kind::kColumnRef:
                record_column(*expr, scope);
                return;
            case Expr::Kind::kStar:
                record_star(*expr, scope, false);
                return;
            case Expr::Kind::kFieldSelect:
                record_field_select(*expr, scope);
                return;
            case Expr::Kind::kFunctionCall:
                facts().function_calls.push_back(to_lower(expr->name));
                break;
            case Expr::Kind::kSubquery:
            case Expr::Kind::kExists:
                facts().nested_kinds.push_back(StatementKind::kSelect);
                if (expr->subquery) {
                    walk_query(*expr->subquery, &scope);
                }
                break;
            default:
                break;
        }
        for (const auto& arg : expr->args) {
            walk_expr(arg.get(), scope);
        }
    }

    QueryAnalysis&           out_;
    std::vector<std::string> cte_names_{};
};

}  // namespace

QueryAnalysis analyze_query(std::string_view sql, const ParseTree& tree) {
    QueryAnalysis analysis;
    analysis.parsed.sql = std::string(sql);

    Analyzer analyzer{analysis};
    for (const auto& stmt : tree.statements) {
        analyzer.walk_top(stmt);
    }

    const auto is_select = [](StatementKind k) { return k == StatementKind::kSelect; };
    const auto& facts = analysis.facts;
    analysis.parsed.is_readonly =
        !facts.statement_kinds.empty() &&
        std::all_of(facts.statement_kinds.begin(), facts.statement_kinds.end(), is_select) &&
        std::all_of(facts.nested_kinds.begin(), facts.nested_kinds.end(), is_select) &&
        !facts.has_into && !facts.has_locking;
    return analysis;
}
