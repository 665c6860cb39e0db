#pragma once

// ---------------------------------------------------------------------------
// schema_types.hpp
//
// SchemaCache 가 보관하는 데이터베이스 메타데이터 스냅샷.
//
// [불변식]
// - cached_at == nullopt : 한 번도 캐시되지 않음
// - cached_at 이 있고 목록이 비어 있음 : 캐시됨, 실제로 비어 있는 DB
//   두 상태는 구분된다.
// - 스냅샷은 refresh 때마다 통째로 교체되며 부분 병합되지 않는다.
//   캐시는 shared_ptr<const SchemaSnapshot> 으로만 내보낸다.
// ---------------------------------------------------------------------------

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

enum class IndexType : std::uint8_t {
    kBtree = 0,
    kHash  = 1,
    kGin   = 2,
    kGist  = 3,
    kBrin  = 4,
};

[[nodiscard]] const char* index_type_name(IndexType type) noexcept;

struct ColumnInfo {
    std::string                name{};
    std::string                data_type{};
    bool                       is_nullable{true};
    bool                       is_primary_key{false};
    bool                       is_unique{false};
    std::optional<std::string> default_value{};
    std::optional<std::string> comment{};
    std::optional<std::string> foreign_key_table{};   // "schema.table" (public 이면 "table")
    std::optional<std::string> foreign_key_column{};
    std::vector<std::string>   enum_values{};         // 컬럼 타입이 enum 일 때
};

struct IndexInfo {
    std::string              name{};
    std::vector<std::string> columns{};
    IndexType                index_type{IndexType::kBtree};
    bool                     is_unique{false};
    bool                     is_primary{false};
};

struct TableInfo {
    std::string                name{};
    std::string                schema_name{"public"};
    std::vector<ColumnInfo>    columns{};
    std::vector<IndexInfo>     indexes{};
    std::optional<std::string> comment{};

    [[nodiscard]] std::string full_name() const { return schema_name + "." + name; }
};

struct ViewInfo {
    std::string                name{};
    std::string                schema_name{"public"};
    std::vector<ColumnInfo>    columns{};
    std::optional<std::string> definition{};
};

struct EnumTypeInfo {
    std::string              name{};
    std::string              schema_name{"public"};
    std::vector<std::string> values{};
};

struct SchemaSnapshot {
    std::string                                          database{};
    std::vector<TableInfo>                               tables{};
    std::vector<ViewInfo>                                views{};
    std::vector<EnumTypeInfo>                            enum_types{};
    std::optional<std::chrono::system_clock::time_point> cached_at{};

    // 이름 비교는 대소문자 무시. schema 생략 시 "public".
    [[nodiscard]] const TableInfo* find_table(std::string_view name,
                                              std::string_view schema = "public") const;
    [[nodiscard]] const ViewInfo*  find_view(std::string_view name,
                                             std::string_view schema = "public") const;

    // 테이블 또는 뷰의 컬럼 이름 (정의 순서). 없으면 nullopt.
    [[nodiscard]] std::optional<std::vector<std::string>>
    relation_columns(std::string_view name, std::string_view schema = "public") const;

    [[nodiscard]] std::size_t table_count() const noexcept { return tables.size(); }
    [[nodiscard]] std::size_t view_count() const noexcept { return views.size(); }
    [[nodiscard]] std::size_t column_count() const noexcept;
};
