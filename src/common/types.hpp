#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// ---------------------------------------------------------------------------
// ExecutionContext
//   요청 하나를 식별하는 불변 컨텍스트.
//   gateway 레이어가 생성하고 executor/audit 레이어에 const-ref 로 전달한다.
// ---------------------------------------------------------------------------
struct ExecutionContext {
    std::string                request_id{};   // 요청 단위 유일 ID (감사 로그 상관관계용)
    std::optional<std::string> client_ip{};    // 클라이언트 IPv4/IPv6 주소 문자열
    std::optional<std::string> session_id{};   // 상위 프로토콜 세션 ID
    std::optional<std::string> user_agent{};
};

// ---------------------------------------------------------------------------
// ErrorCode
//   게이트웨이 전 구간에서 사용하는 오류 분류.
//   error_code_name() 의 문자열은 외부로 노출되는 안정 코드이므로
//   값 변경 금지 (클라이언트/감사 로그 호환성).
// ---------------------------------------------------------------------------
enum class ErrorCode : std::uint8_t {
    kSyntaxError        = 0,   // SQL 문법 오류
    kUnsafeSql          = 1,   // 안전 규칙 위반 (쓰기/위험 함수/다중 구문)
    kSchemaAccessDenied = 2,
    kTableAccessDenied  = 3,
    kColumnAccessDenied = 4,
    kQueryTooExpensive  = 5,   // EXPLAIN 비용/행 수 상한 초과
    kQueryTimeout       = 6,   // 서버 측 취소된 구문
    kRateLimitExceeded  = 7,
    kConnectionFailure  = 8,
    kUnknownDatabase    = 9,
    kExecutionError     = 10,  // DB 가 보고한 구문 실행 오류
    kInternalError      = 11,  // 분류 불가. 항상 마지막 fallback
};

[[nodiscard]] std::string_view error_code_name(ErrorCode code) noexcept;

// ---------------------------------------------------------------------------
// GatewayError
//   std::expected<T, GatewayError> 패턴과 함께 사용한다.
//
//   resources: 접근 거부 대상 (스키마명, 테이블명, "table.column")
//   details  : 부가 정보 (예: rate limit 의 window, retry_after)
// ---------------------------------------------------------------------------
struct GatewayError {
    ErrorCode                          code{ErrorCode::kInternalError};
    std::string                        message{};  // 사람이 읽을 수 있는 오류 설명
    std::vector<std::string>           resources{};
    std::map<std::string, std::string> details{};
};

[[nodiscard]] GatewayError make_error(ErrorCode code, std::string message);

// "SYNTAX_ERROR: unexpected token ..." 형태 (로깅용)
[[nodiscard]] std::string describe(const GatewayError& error);
