#pragma once

// ---------------------------------------------------------------------------
// response_json.hpp
//
// CLI 응답 한 줄 JSON.
//   성공: {"ok":true,"columns":[...],"rows":[[...]],"row_count":N,
//          "truncated":b,"warnings":[...],"execution_time_ms":x}
//   실패: {"ok":false,"error":{"code":"...","message":"...",
//          "resources":[...],"details":{...}}}
// NULL 셀은 null, 나머지 셀은 PostgreSQL 텍스트 표현 그대로 문자열이다.
// ---------------------------------------------------------------------------

#include <string>

#include "common/types.hpp"
#include "db/db_types.hpp"

[[nodiscard]] std::string to_json(const QueryResult& result);
[[nodiscard]] std::string to_json(const GatewayError& error);
