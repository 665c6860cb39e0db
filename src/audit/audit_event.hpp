#pragma once

// ---------------------------------------------------------------------------
// audit_event.hpp
//
// 감사 이벤트 한 건. to_json() 은 개행 없는 JSON 객체 한 줄을 만든다.
//
// [레코드 구조]
// {
//   "timestamp", "event_type", "request_id", "session_id", "database",
//   "client":        {"ip", "user_agent"},
//   "query":         {"question", "sql", "sql_hash"},
//   "result":        {"status", "rows_returned", "execution_time_ms",
//                     "truncated", "error_code", "error_message"},
//   "policy_checks": {"table_access", "column_access", "explain_check"}
// }
// 값이 없는 필드는 null 로 기록한다 (키는 항상 존재).
//
// [민감정보]
// redact_sql 이면 query.sql 은 null, sql_hash 는 유지한다.
// question 은 마스킹하지 않는다.
// ---------------------------------------------------------------------------

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "common/types.hpp"

enum class AuditEventType : std::uint8_t {
    kQueryExecuted     = 0,
    kQueryDenied       = 1,
    kPolicyViolation   = 2,
    kRateLimitExceeded = 3,
};

enum class AuditStatus : std::uint8_t {
    kSuccess = 0,
    kDenied  = 1,   // 실행 전 거부 (검증/정책/비용/속도 제한)
    kError   = 2,   // 실행 시도 후 실패
};

// "passed" | "denied" | "skipped"
enum class CheckOutcome : std::uint8_t {
    kSkipped = 0,
    kPassed  = 1,
    kDenied  = 2,
};

[[nodiscard]] std::string_view event_type_name(AuditEventType type) noexcept;
[[nodiscard]] std::string_view status_name(AuditStatus status) noexcept;
[[nodiscard]] std::string_view check_outcome_name(CheckOutcome outcome) noexcept;

// "sha256:" + hex(sha256(sql))
[[nodiscard]] std::string sql_hash(std::string_view sql);

struct AuditPolicyChecks {
    CheckOutcome table_access{CheckOutcome::kSkipped};
    CheckOutcome column_access{CheckOutcome::kSkipped};
    CheckOutcome explain_check{CheckOutcome::kSkipped};
};

struct AuditEvent {
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
    AuditEventType                        event_type{AuditEventType::kQueryExecuted};
    std::string                           request_id{};
    std::optional<std::string>            session_id{};
    std::string                           database{};

    std::optional<std::string> client_ip{};
    std::optional<std::string> user_agent{};

    std::optional<std::string> question{};
    std::optional<std::string> sql{};

    AuditStatus                  status{AuditStatus::kSuccess};
    std::optional<std::uint64_t> rows_returned{};
    double                       execution_time_ms{0.0};
    bool                         truncated{false};
    std::optional<std::string>   error_code{};
    std::optional<std::string>   error_message{};

    AuditPolicyChecks policy_checks{};

    [[nodiscard]] std::string to_json(bool redact_sql) const;
};

// ExecutionContext 의 식별 정보를 채운 이벤트
[[nodiscard]] AuditEvent make_audit_event(AuditEventType          type,
                                          const ExecutionContext& context,
                                          std::string             database);

// error 의 코드/메시지를 채운다. status 는 호출자가 정한다.
void attach_error(AuditEvent& event, const GatewayError& error);
