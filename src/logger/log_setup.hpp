#pragma once

// ---------------------------------------------------------------------------
// log_setup.hpp
//
// 진단 로그 (spdlog 기본 로거) 초기화.
// 감사 로그는 AuditLogger 가 별도 로거로 관리하며 여기와 섞이지 않는다.
//
// [싱크]
// - stderr : 항상. CLI 결과가 stdout 으로 나가므로 진단 로그는 stderr 로 보낸다.
// - file   : file 이 비어 있지 않으면 rotating_file_sink_mt 추가
// ---------------------------------------------------------------------------

#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

#include <spdlog/common.h>

enum class LogFormat : std::uint8_t {
    kText = 0,
    kJson = 1,
};

struct LoggingConfig {
    std::string level{"info"};
    LogFormat   format{LogFormat::kText};
    std::string file{};
    std::size_t max_file_size_mb{100};
    std::size_t max_files{3};
};

// "trace" | "debug" | "info" | "warn" | "error" | "critical" | "off" (대소문자 무시)
[[nodiscard]] std::optional<spdlog::level::level_enum> parse_log_level(std::string_view name);

[[nodiscard]] std::optional<LogFormat> parse_log_format(std::string_view name);

// 기본 로거를 "pggate" 로 교체한다. 실패 시 원인 문자열.
[[nodiscard]] std::expected<void, std::string> init_logging(const LoggingConfig& config);
