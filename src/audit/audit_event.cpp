#include "audit/audit_event.hpp"

#include <fmt/format.h>

#include "common/sha256.hpp"
#include "logger/json_util.hpp"

std::string_view event_type_name(AuditEventType type) noexcept {
    switch (type) {
        case AuditEventType::kQueryExecuted:     return "query_executed";
        case AuditEventType::kQueryDenied:       return "query_denied";
        case AuditEventType::kPolicyViolation:   return "policy_violation";
        case AuditEventType::kRateLimitExceeded: return "rate_limit_exceeded";
    }
    return "query_denied";
}

std::string_view status_name(AuditStatus status) noexcept {
    switch (status) {
        case AuditStatus::kSuccess: return "success";
        case AuditStatus::kDenied:  return "denied";
        case AuditStatus::kError:   return "error";
    }
    return "error";
}

std::string_view check_outcome_name(CheckOutcome outcome) noexcept {
    switch (outcome) {
        case CheckOutcome::kSkipped: return "skipped";
        case CheckOutcome::kPassed:  return "passed";
        case CheckOutcome::kDenied:  return "denied";
    }
    return "skipped";
}

std::string sql_hash(std::string_view sql) {
    return "sha256:" + sha256_hex(sql);
}

std::string AuditEvent::to_json(bool redact_sql) const {
    std::string query = "null";
    if (sql) {
        query = fmt::format(R"({{"question":{},"sql":{},"sql_hash":{}}})",
                            json_nullable(question),
                            redact_sql ? std::string("null") : json_quote(*sql),
                            json_quote(sql_hash(*sql)));
    } else if (question) {
        query = fmt::format(R"({{"question":{},"sql":null,"sql_hash":null}})", json_quote(*question));
    }

    const std::string rows = rows_returned ? std::to_string(*rows_returned) : std::string("null");

    return fmt::format(
        R"({{"timestamp":{},"event_type":"{}","request_id":{},"session_id":{},"database":{},)"
        R"("client":{{"ip":{},"user_agent":{}}},)"
        R"("query":{},)"
        R"("result":{{"status":"{}","rows_returned":{},"execution_time_ms":{:.3f},"truncated":{},)"
        R"("error_code":{},"error_message":{}}},)"
        R"("policy_checks":{{"table_access":"{}","column_access":"{}","explain_check":"{}"}}}})",
        json_quote(format_iso8601(timestamp)), event_type_name(event_type), json_quote(request_id),
        json_nullable(session_id), json_quote(database),
        json_nullable(client_ip), json_nullable(user_agent),
        query,
        status_name(status), rows, execution_time_ms, truncated ? "true" : "false",
        json_nullable(error_code), json_nullable(error_message),
        check_outcome_name(policy_checks.table_access), check_outcome_name(policy_checks.column_access),
        check_outcome_name(policy_checks.explain_check));
}

AuditEvent make_audit_event(AuditEventType type, const ExecutionContext& context, std::string database) {
    AuditEvent event;
    event.event_type = type;
    event.request_id = context.request_id;
    event.session_id = context.session_id;
    event.database   = std::move(database);
    event.client_ip  = context.client_ip;
    event.user_agent = context.user_agent;
    return event;
}

void attach_error(AuditEvent& event, const GatewayError& error) {
    event.error_code    = std::string(error_code_name(error.code));
    event.error_message = error.message;
}
