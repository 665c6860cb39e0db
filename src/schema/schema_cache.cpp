// ---------------------------------------------------------------------------
// schema_cache.cpp
//
// [스냅샷 조립]
// 8개 조회 결과를 (schema, table) 키로 합친다.
// - 외래 키 대상은 "schema.table", public 스키마면 "table"
// - 인덱스 종류는 indexdef 의 "USING <method>" 부분 문자열로 판정 (기본 btree)
// - 인덱스 컬럼은 indexdef 의 첫 번째 괄호 목록
// - unique 는 indexdef 에 "unique" 가 있으면, primary 는 이름이 "_pkey" 로 끝나면
// - enum 타입 컬럼(data_type = USER-DEFINED)은 enum 값 목록을 채운다
//
// [알려진 한계]
// - 식 인덱스 (lower(email)) 는 첫 괄호 목록이 함수 인자이므로 컬럼명이
//   정확하지 않다.
// ---------------------------------------------------------------------------

#include "schema/schema_cache.hpp"

#include <algorithm>
#include <cctype>
#include <initializer_list>
#include <regex>
#include <set>
#include <sstream>
#include <string_view>
#include <tuple>
#include <utility>

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "common/gather.hpp"
#include "schema/catalog_queries.hpp"

namespace {

using TableKey  = std::pair<std::string, std::string>;
using ColumnKey = std::tuple<std::string, std::string, std::string>;

// ---------------------------------------------------------------------------
// 결과 컬럼 이름 → 인덱스
// ---------------------------------------------------------------------------
std::expected<std::vector<std::size_t>, GatewayError> resolve_columns(
    const RowSet& rows, std::string_view what, std::initializer_list<std::string_view> names) {
    std::vector<std::size_t> indices;
    indices.reserve(names.size());
    for (const auto name : names) {
        const auto idx = rows.column_index(std::string(name));
        if (!idx) {
            return std::unexpected(make_error(
                ErrorCode::kInternalError,
                fmt::format("schema_cache: {} result has no column '{}'", what, name)));
        }
        indices.push_back(*idx);
    }
    return indices;
}

const std::string& text(const Row& row, std::size_t index) {
    static const std::string kEmpty;
    return row[index] ? *row[index] : kEmpty;
}

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string trim(std::string_view s) {
    const auto begin = s.find_first_not_of(" \t\n\r");
    if (begin == std::string_view::npos) {
        return {};
    }
    const auto end = s.find_last_not_of(" \t\n\r");
    return std::string(s.substr(begin, end - begin + 1));
}

IndexType parse_index_type(const std::string& indexdef_lower) {
    if (indexdef_lower.find("using hash") != std::string::npos) {
        return IndexType::kHash;
    }
    if (indexdef_lower.find("using gin") != std::string::npos) {
        return IndexType::kGin;
    }
    if (indexdef_lower.find("using gist") != std::string::npos) {
        return IndexType::kGist;
    }
    if (indexdef_lower.find("using brin") != std::string::npos) {
        return IndexType::kBrin;
    }
    return IndexType::kBtree;
}

std::vector<std::string> parse_index_columns(const std::string& indexdef) {
    static const std::regex kColumnList(R"(\(([^)]+)\))");
    std::vector<std::string> columns;
    std::smatch match;
    if (!std::regex_search(indexdef, match, kColumnList)) {
        return columns;
    }
    std::stringstream ss(match[1].str());
    std::string item;
    while (std::getline(ss, item, ',')) {
        columns.push_back(trim(item));
    }
    return columns;
}

// json_agg 결과 (["a","b"]) → 문자열 목록
std::expected<std::vector<std::string>, GatewayError> parse_enum_values(const std::string& json) {
    std::vector<std::string> values;
    try {
        std::istringstream in("{\"v\":" + json + "}");
        boost::property_tree::ptree tree;
        boost::property_tree::read_json(in, tree);
        for (const auto& item : tree.get_child("v")) {
            values.push_back(item.second.get_value<std::string>());
        }
    } catch (const boost::property_tree::ptree_error& e) {
        return std::unexpected(make_error(
            ErrorCode::kInternalError, fmt::format("schema_cache: malformed enum value list: {}", e.what())));
    }
    return values;
}

}  // namespace

std::expected<SchemaSnapshot, GatewayError> build_snapshot(std::string                           database,
                                                           const std::vector<RowSet>&            results,
                                                           std::chrono::system_clock::time_point cached_at) {
    if (results.size() != CatalogQueries::kCount) {
        return std::unexpected(make_error(
            ErrorCode::kInternalError,
            fmt::format("schema_cache: expected {} catalog results, got {}", CatalogQueries::kCount,
                        results.size())));
    }
    const RowSet& tables_rs  = results[0];
    const RowSet& columns_rs = results[1];
    const RowSet& pk_rs      = results[2];
    const RowSet& fk_rs      = results[3];
    const RowSet& unique_rs  = results[4];
    const RowSet& indexes_rs = results[5];
    const RowSet& views_rs   = results[6];
    const RowSet& enums_rs   = results[7];

    auto tc = resolve_columns(tables_rs, "tables", {"table_schema", "table_name", "table_comment"});
    auto cc = resolve_columns(columns_rs, "columns",
                              {"table_schema", "table_name", "column_name", "data_type", "is_nullable",
                               "column_default", "udt_schema", "udt_name", "column_comment"});
    auto pc = resolve_columns(pk_rs, "primary keys", {"table_schema", "table_name", "column_name"});
    auto fc = resolve_columns(fk_rs, "foreign keys",
                              {"table_schema", "table_name", "column_name", "foreign_table_schema",
                               "foreign_table_name", "foreign_column_name"});
    auto uc = resolve_columns(unique_rs, "unique constraints", {"table_schema", "table_name", "column_name"});
    auto ic = resolve_columns(indexes_rs, "indexes", {"schemaname", "tablename", "indexname", "indexdef"});
    auto vc = resolve_columns(views_rs, "views", {"table_schema", "table_name", "view_definition"});
    auto ec = resolve_columns(enums_rs, "enum types", {"schema_name", "type_name", "enum_values"});
    for (const auto* r : {&tc, &cc, &pc, &fc, &uc, &ic, &vc, &ec}) {
        if (!*r) {
            return std::unexpected(r->error());
        }
    }

    SchemaSnapshot snapshot;
    snapshot.database  = std::move(database);
    snapshot.cached_at = cached_at;

    // enum 타입
    std::map<TableKey, std::vector<std::string>> enum_values;
    for (const auto& row : enums_rs.rows) {
        const auto& c = *ec;
        auto values = parse_enum_values(text(row, c[2]));
        if (!values) {
            return std::unexpected(values.error());
        }
        EnumTypeInfo info;
        info.schema_name = text(row, c[0]);
        info.name        = text(row, c[1]);
        info.values      = std::move(*values);
        enum_values.emplace(TableKey{info.schema_name, info.name}, info.values);
        snapshot.enum_types.push_back(std::move(info));
    }

    // 제약 조건
    std::set<ColumnKey> primary_keys;
    for (const auto& row : pk_rs.rows) {
        const auto& c = *pc;
        primary_keys.emplace(text(row, c[0]), text(row, c[1]), text(row, c[2]));
    }
    std::set<ColumnKey> unique_columns;
    for (const auto& row : unique_rs.rows) {
        const auto& c = *uc;
        unique_columns.emplace(text(row, c[0]), text(row, c[1]), text(row, c[2]));
    }
    std::map<ColumnKey, std::pair<std::string, std::string>> foreign_keys;
    for (const auto& row : fk_rs.rows) {
        const auto&        c         = *fc;
        const std::string& fk_schema = text(row, c[3]);
        std::string target = fk_schema == "public" ? text(row, c[4])
                                                   : fmt::format("{}.{}", fk_schema, text(row, c[4]));
        foreign_keys.emplace(ColumnKey{text(row, c[0]), text(row, c[1]), text(row, c[2])},
                             std::make_pair(std::move(target), text(row, c[5])));
    }

    // 컬럼
    std::map<TableKey, std::vector<ColumnInfo>> columns_by_table;
    for (const auto& row : columns_rs.rows) {
        const auto&     c = *cc;
        const TableKey  key{text(row, c[0]), text(row, c[1])};
        const ColumnKey col_key{key.first, key.second, text(row, c[2])};

        ColumnInfo col;
        col.name           = text(row, c[2]);
        col.data_type      = text(row, c[3]);
        col.is_nullable    = text(row, c[4]) == "YES";
        col.is_primary_key = primary_keys.count(col_key) != 0;
        col.is_unique      = unique_columns.count(col_key) != 0;
        col.default_value  = row[c[5]];
        col.comment        = row[c[8]];
        if (auto fk = foreign_keys.find(col_key); fk != foreign_keys.end()) {
            col.foreign_key_table  = fk->second.first;
            col.foreign_key_column = fk->second.second;
        }
        if (col.data_type == "USER-DEFINED") {
            if (auto e = enum_values.find(TableKey{text(row, c[6]), text(row, c[7])}); e != enum_values.end()) {
                col.enum_values = e->second;
            }
        }
        columns_by_table[key].push_back(std::move(col));
    }

    // 인덱스
    std::map<TableKey, std::vector<IndexInfo>> indexes_by_table;
    for (const auto& row : indexes_rs.rows) {
        const auto&        c        = *ic;
        const std::string& indexdef = text(row, c[3]);
        const std::string  lowered  = to_lower(indexdef);

        IndexInfo index;
        index.name       = text(row, c[2]);
        index.columns    = parse_index_columns(indexdef);
        index.index_type = parse_index_type(lowered);
        index.is_unique  = lowered.find("unique") != std::string::npos;
        index.is_primary = index.name.ends_with("_pkey");
        indexes_by_table[TableKey{text(row, c[0]), text(row, c[1])}].push_back(std::move(index));
    }

    // 테이블 / 뷰
    for (const auto& row : tables_rs.rows) {
        const auto&    c = *tc;
        const TableKey key{text(row, c[0]), text(row, c[1])};
        TableInfo table;
        table.schema_name = key.first;
        table.name        = key.second;
        table.comment     = row[c[2]];
        if (auto it = columns_by_table.find(key); it != columns_by_table.end()) {
            table.columns = it->second;
        }
        if (auto it = indexes_by_table.find(key); it != indexes_by_table.end()) {
            table.indexes = std::move(it->second);
        }
        snapshot.tables.push_back(std::move(table));
    }
    for (const auto& row : views_rs.rows) {
        const auto&    c = *vc;
        const TableKey key{text(row, c[0]), text(row, c[1])};
        ViewInfo view;
        view.schema_name = key.first;
        view.name        = key.second;
        view.definition  = row[c[2]];
        if (auto it = columns_by_table.find(key); it != columns_by_table.end()) {
            view.columns = it->second;
        }
        snapshot.views.push_back(std::move(view));
    }

    return snapshot;
}

// ---------------------------------------------------------------------------
// SchemaCache
// ---------------------------------------------------------------------------

SchemaCache::SchemaCache(std::chrono::seconds ttl, std::chrono::milliseconds query_timeout, Clock clock)
    : ttl_{ttl}, query_timeout_{query_timeout}, clock_{std::move(clock)} {}

std::shared_ptr<const SchemaSnapshot> SchemaCache::get(const std::string& database) const {
    std::lock_guard<std::mutex> guard(mutex_);
    const auto it = entries_.find(database);
    if (it == entries_.end() || !it->second->cached_at) {
        return nullptr;
    }
    if (clock_() - *it->second->cached_at >= ttl_) {
        return nullptr;
    }
    return it->second;
}

auto SchemaCache::refresh(std::string database, ConnectionPool& pool)
    -> boost::asio::awaitable<std::expected<std::shared_ptr<const SchemaSnapshot>, GatewayError>>
{
    auto lock = co_await refresh_lock_.lock();
    co_return co_await refresh_locked(std::move(database), pool);
}

auto SchemaCache::get_or_refresh(std::string database, ConnectionPool& pool)
    -> boost::asio::awaitable<std::expected<std::shared_ptr<const SchemaSnapshot>, GatewayError>>
{
    if (auto cached = get(database)) {
        co_return cached;
    }
    auto lock = co_await refresh_lock_.lock();
    // 락을 기다리는 동안 다른 호출자가 refresh 했을 수 있다
    if (auto cached = get(database)) {
        co_return cached;
    }
    co_return co_await refresh_locked(std::move(database), pool);
}

auto SchemaCache::refresh_locked(std::string database, ConnectionPool& pool)
    -> boost::asio::awaitable<std::expected<std::shared_ptr<const SchemaSnapshot>, GatewayError>>
{
    spdlog::info("schema_cache: refreshing [{}]", database);
    ++refresh_count_;

    const CatalogQueries& queries = catalog_queries(pool.engine());
    std::vector<boost::asio::awaitable<std::expected<RowSet, GatewayError>>> tasks;
    for (const auto sql : queries.all()) {
        tasks.push_back(pool.fetch(std::string(sql), query_timeout_));
    }
    auto fetched = co_await gather(std::move(tasks));

    std::vector<RowSet> results;
    results.reserve(fetched.size());
    for (auto& r : fetched) {
        if (!r) {
            spdlog::warn("schema_cache: refresh of [{}] failed: {}", database, r.error().message);
            co_return std::unexpected(r.error());
        }
        results.push_back(std::move(*r));
    }

    auto snapshot = build_snapshot(database, results, clock_());
    if (!snapshot) {
        spdlog::warn("schema_cache: refresh of [{}] failed: {}", database, snapshot.error().message);
        co_return std::unexpected(snapshot.error());
    }

    auto shared = std::make_shared<const SchemaSnapshot>(std::move(*snapshot));
    {
        std::lock_guard<std::mutex> guard(mutex_);
        entries_[database] = shared;
    }
    spdlog::info("schema_cache: refreshed [{}] tables={} views={} columns={}", database,
                 shared->table_count(), shared->view_count(), shared->column_count());
    co_return shared;
}

void SchemaCache::invalidate(const std::string& database) {
    std::lock_guard<std::mutex> guard(mutex_);
    if (entries_.erase(database) != 0) {
        spdlog::info("schema_cache: invalidated [{}]", database);
    }
}

void SchemaCache::invalidate_all() {
    std::lock_guard<std::mutex> guard(mutex_);
    entries_.clear();
    spdlog::info("schema_cache: invalidated all entries");
}

std::size_t SchemaCache::size() const {
    std::lock_guard<std::mutex> guard(mutex_);
    return entries_.size();
}
