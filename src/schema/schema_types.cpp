#include "schema/schema_types.hpp"

#include <algorithm>
#include <cctype>

namespace {

bool iequals(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
               return std::tolower(x) == std::tolower(y);
           });
}

template <typename Relation>
const Relation* find_relation(const std::vector<Relation>& relations,
                              std::string_view name, std::string_view schema) {
    for (const auto& rel : relations) {
        if (iequals(rel.name, name) && iequals(rel.schema_name, schema)) {
            return &rel;
        }
    }
    return nullptr;
}

std::vector<std::string> column_names(const std::vector<ColumnInfo>& columns) {
    std::vector<std::string> names;
    names.reserve(columns.size());
    for (const auto& col : columns) {
        names.push_back(col.name);
    }
    return names;
}

}  // namespace

const char* index_type_name(IndexType type) noexcept {
    switch (type) {
        case IndexType::kBtree: return "btree";
        case IndexType::kHash:  return "hash";
        case IndexType::kGin:   return "gin";
        case IndexType::kGist:  return "gist";
        case IndexType::kBrin:  return "brin";
    }
    return "btree";
}

const TableInfo* SchemaSnapshot::find_table(std::string_view name, std::string_view schema) const {
    return find_relation(tables, name, schema);
}

const ViewInfo* SchemaSnapshot::find_view(std::string_view name, std::string_view schema) const {
    return find_relation(views, name, schema);
}

std::optional<std::vector<std::string>>
SchemaSnapshot::relation_columns(std::string_view name, std::string_view schema) const {
    if (const TableInfo* table = find_table(name, schema)) {
        return column_names(table->columns);
    }
    if (const ViewInfo* view = find_view(name, schema)) {
        return column_names(view->columns);
    }
    return std::nullopt;
}

std::size_t SchemaSnapshot::column_count() const noexcept {
    std::size_t count = 0;
    for (const auto& table : tables) {
        count += table.columns.size();
    }
    return count;
}
