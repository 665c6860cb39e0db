#pragma once

// ---------------------------------------------------------------------------
// query_gateway.hpp
//
// 요청 하나의 진입점.
//   rate limit → 데이터베이스 조회 → QueryExecutor::execute
//
// 속도 제한 거부와 알 수 없는 데이터베이스는 executor 에 도달하지 않으므로
// 여기서 직접 감사 이벤트를 남긴다.
// ---------------------------------------------------------------------------

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <utility>

#include <boost/asio/awaitable.hpp>

#include "common/types.hpp"
#include "db/db_types.hpp"
#include "gateway/gateway_context.hpp"

struct QueryRequest {
    std::string                  database{};
    std::string                  sql{};
    std::optional<std::string>   question{};
    std::optional<std::uint64_t> limit{};     // 없거나 server.max_result_rows 보다 크면 max_result_rows
    ExecutionContext             context{};
};

// ctx 는 반환된 awaitable 이 끝날 때까지 살아 있어야 한다
auto handle_query(GatewayContext& ctx, QueryRequest request)
    -> boost::asio::awaitable<std::expected<QueryResult, GatewayError>>;
