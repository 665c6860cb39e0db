#include "schema/catalog_queries.hpp"

namespace {

// regclass 변환은 format('%I.%I') 로 따옴표 처리하여 대소문자/특수문자 이름에서도 실패하지 않는다
constexpr CatalogQueries kPostgresQueries{
    .tables = R"(
SELECT
    t.table_schema,
    t.table_name,
    obj_description(format('%I.%I', t.table_schema, t.table_name)::regclass, 'pg_class') AS table_comment
FROM information_schema.tables t
WHERE t.table_schema NOT IN ('pg_catalog', 'information_schema')
    AND t.table_type = 'BASE TABLE'
ORDER BY t.table_schema, t.table_name
)",
    .columns = R"(
SELECT
    c.table_schema,
    c.table_name,
    c.column_name,
    c.data_type,
    c.is_nullable,
    c.column_default,
    c.udt_schema,
    c.udt_name,
    col_description(format('%I.%I', c.table_schema, c.table_name)::regclass, c.ordinal_position) AS column_comment
FROM information_schema.columns c
WHERE c.table_schema NOT IN ('pg_catalog', 'information_schema')
ORDER BY c.table_schema, c.table_name, c.ordinal_position
)",
    .primary_keys = R"(
SELECT
    tc.table_schema,
    tc.table_name,
    kcu.column_name
FROM information_schema.table_constraints tc
JOIN information_schema.key_column_usage kcu
    ON tc.constraint_name = kcu.constraint_name
    AND tc.table_schema = kcu.table_schema
WHERE tc.constraint_type = 'PRIMARY KEY'
    AND tc.table_schema NOT IN ('pg_catalog', 'information_schema')
)",
    .foreign_keys = R"(
SELECT
    tc.table_schema,
    tc.table_name,
    kcu.column_name,
    ccu.table_schema AS foreign_table_schema,
    ccu.table_name AS foreign_table_name,
    ccu.column_name AS foreign_column_name
FROM information_schema.table_constraints tc
JOIN information_schema.key_column_usage kcu
    ON tc.constraint_name = kcu.constraint_name
    AND tc.table_schema = kcu.table_schema
JOIN information_schema.constraint_column_usage ccu
    ON ccu.constraint_name = tc.constraint_name
    AND ccu.table_schema = tc.table_schema
WHERE tc.constraint_type = 'FOREIGN KEY'
    AND tc.table_schema NOT IN ('pg_catalog', 'information_schema')
)",
    .unique_constraints = R"(
SELECT
    tc.table_schema,
    tc.table_name,
    kcu.column_name
FROM information_schema.table_constraints tc
JOIN information_schema.key_column_usage kcu
    ON tc.constraint_name = kcu.constraint_name
    AND tc.table_schema = kcu.table_schema
WHERE tc.constraint_type = 'UNIQUE'
    AND tc.table_schema NOT IN ('pg_catalog', 'information_schema')
)",
    .indexes = R"(
SELECT
    schemaname,
    tablename,
    indexname,
    indexdef
FROM pg_indexes
WHERE schemaname NOT IN ('pg_catalog', 'information_schema')
)",
    .views = R"(
SELECT
    v.table_schema,
    v.table_name,
    v.view_definition
FROM information_schema.views v
WHERE v.table_schema NOT IN ('pg_catalog', 'information_schema')
ORDER BY v.table_schema, v.table_name
)",
    .enum_types = R"(
SELECT
    n.nspname AS schema_name,
    t.typname AS type_name,
    json_agg(e.enumlabel ORDER BY e.enumsortorder) AS enum_values
FROM pg_type t
JOIN pg_enum e ON t.oid = e.enumtypid
JOIN pg_namespace n ON t.typnamespace = n.oid
WHERE n.nspname NOT IN ('pg_catalog', 'information_schema')
GROUP BY n.nspname, t.typname
ORDER BY n.nspname, t.typname
)",
};

}  // namespace

const CatalogQueries& catalog_queries(DatabaseEngine engine) noexcept {
    switch (engine) {
        case DatabaseEngine::kPostgres: return kPostgresQueries;
    }
    return kPostgresQueries;
}
