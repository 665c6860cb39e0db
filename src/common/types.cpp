#include "common/types.hpp"

#include <utility>

#include <fmt/format.h>

std::string_view error_code_name(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::kSyntaxError:        return "SYNTAX_ERROR";
        case ErrorCode::kUnsafeSql:          return "UNSAFE_SQL";
        case ErrorCode::kSchemaAccessDenied: return "SCHEMA_ACCESS_DENIED";
        case ErrorCode::kTableAccessDenied:  return "TABLE_ACCESS_DENIED";
        case ErrorCode::kColumnAccessDenied: return "COLUMN_ACCESS_DENIED";
        case ErrorCode::kQueryTooExpensive:  return "QUERY_TOO_EXPENSIVE";
        case ErrorCode::kQueryTimeout:       return "EXECUTION_TIMEOUT";
        case ErrorCode::kRateLimitExceeded:  return "RATE_LIMIT_EXCEEDED";
        case ErrorCode::kConnectionFailure:  return "CONNECTION_ERROR";
        case ErrorCode::kUnknownDatabase:    return "UNKNOWN_DATABASE";
        case ErrorCode::kExecutionError:     return "EXECUTION_ERROR";
        case ErrorCode::kInternalError:      return "INTERNAL_ERROR";
    }
    return "INTERNAL_ERROR";
}

GatewayError make_error(ErrorCode code, std::string message) {
    GatewayError error{};
    error.code    = code;
    error.message = std::move(message);
    return error;
}

std::string describe(const GatewayError& error) {
    return fmt::format("{}: {}", error_code_name(error.code), error.message);
}
