#include "gateway/response_json.hpp"

#include <fmt/format.h>

#include "logger/json_util.hpp"

namespace {

std::string string_array(const std::vector<std::string>& items) {
    std::string out = "[";
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            out += ',';
        }
        out += json_quote(items[i]);
    }
    out += ']';
    return out;
}

}  // namespace

std::string to_json(const QueryResult& result) {
    std::string rows = "[";
    for (std::size_t r = 0; r < result.rows.size(); ++r) {
        if (r > 0) {
            rows += ',';
        }
        rows += '[';
        const Row& row = result.rows[r];
        for (std::size_t c = 0; c < row.size(); ++c) {
            if (c > 0) {
                rows += ',';
            }
            rows += json_nullable(row[c]);
        }
        rows += ']';
    }
    rows += ']';

    return fmt::format(
        R"({{"ok":true,"columns":{},"rows":{},"row_count":{},"truncated":{},"warnings":{},"execution_time_ms":{:.3f}}})",
        string_array(result.columns), rows, result.row_count, result.truncated ? "true" : "false",
        string_array(result.warnings), result.execution_time_ms);
}

std::string to_json(const GatewayError& error) {
    std::string details = "{";
    bool        first   = true;
    for (const auto& [key, value] : error.details) {
        if (!first) {
            details += ',';
        }
        first = false;
        details += json_quote(key);
        details += ':';
        details += json_quote(value);
    }
    details += '}';

    return fmt::format(R"({{"ok":false,"error":{{"code":"{}","message":{},"resources":{},"details":{}}}}})",
                       error_code_name(error.code), json_quote(error.message), string_array(error.resources),
                       details);
}
