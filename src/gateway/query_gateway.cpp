#include "gateway/query_gateway.hpp"

#include <algorithm>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include "audit/audit_event.hpp"

namespace {

AuditEvent rejection_event(AuditEventType type, const QueryRequest& request, const GatewayError& error) {
    AuditEvent event = make_audit_event(type, request.context, request.database);
    event.question   = request.question;
    event.sql        = request.sql;
    event.status     = AuditStatus::kDenied;
    attach_error(event, error);
    return event;
}

}  // namespace

auto handle_query(GatewayContext& ctx, QueryRequest request)
    -> boost::asio::awaitable<std::expected<QueryResult, GatewayError>>
{
    const auto rate = ctx.rate_limiter().check_request(request.context.client_ip, request.context.session_id);
    if (!rate.allowed) {
        GatewayError error = rate.to_error();
        co_await ctx.audit().log(rejection_event(AuditEventType::kRateLimitExceeded, request, error));
        co_return std::unexpected(std::move(error));
    }

    DatabaseRuntime* db = ctx.find(request.database);
    if (db == nullptr) {
        GatewayError error = make_error(
            ErrorCode::kUnknownDatabase,
            fmt::format("Unknown database '{}'. Available: {}", request.database,
                        fmt::join(ctx.database_names(), ", ")));
        error.resources.push_back(request.database);
        co_await ctx.audit().log(rejection_event(AuditEventType::kQueryDenied, request, error));
        co_return std::unexpected(std::move(error));
    }

    const std::uint64_t max_rows = ctx.config().server.max_result_rows;
    const std::uint64_t limit    = std::min(request.limit.value_or(max_rows), max_rows);

    co_return co_await db->executor->execute(std::move(request.sql), limit, std::move(request.context),
                                             std::move(request.question));
}
