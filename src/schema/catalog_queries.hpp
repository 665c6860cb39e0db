#pragma once

// ---------------------------------------------------------------------------
// catalog_queries.hpp
//
// 엔진별 메타데이터 조회 SQL 8종.
// SchemaCache 는 결과 컬럼을 이름으로 읽으므로 컬럼 별칭은 바꾸면 안 된다.
// ---------------------------------------------------------------------------

#include <array>
#include <cstddef>
#include <string_view>

#include "db/connection.hpp"

struct CatalogQueries {
    std::string_view tables;              // table_schema, table_name, table_comment
    std::string_view columns;             // table_schema, table_name, column_name, data_type,
                                          // is_nullable, column_default, udt_schema, udt_name,
                                          // column_comment
    std::string_view primary_keys;        // table_schema, table_name, column_name
    std::string_view foreign_keys;        // + foreign_table_schema, foreign_table_name, foreign_column_name
    std::string_view unique_constraints;  // table_schema, table_name, column_name
    std::string_view indexes;             // schemaname, tablename, indexname, indexdef
    std::string_view views;               // table_schema, table_name, view_definition
    std::string_view enum_types;          // schema_name, type_name, enum_values (JSON 배열)

    static constexpr std::size_t kCount = 8;

    // 위 선언 순서대로
    [[nodiscard]] std::array<std::string_view, kCount> all() const noexcept {
        return {tables, columns, primary_keys, foreign_keys,
                unique_constraints, indexes, views, enum_types};
    }
};

[[nodiscard]] const CatalogQueries& catalog_queries(DatabaseEngine engine) noexcept;
