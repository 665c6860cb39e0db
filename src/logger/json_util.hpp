#pragma once

// ---------------------------------------------------------------------------
// json_util.hpp
//
// 한 줄 JSON 레코드를 손으로 조립할 때 쓰는 헬퍼.
// 감사 로그와 CLI 결과 출력이 같은 이스케이프 규칙을 쓰도록 모아 둔다.
// ---------------------------------------------------------------------------

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

// 따옴표 없이 이스케이프만 수행한다. 0x20 미만 제어 문자는 \u00XX.
[[nodiscard]] std::string escape_json_string(std::string_view str);

// "..." (이스케이프 포함)
[[nodiscard]] std::string json_quote(std::string_view str);

// 값이 없으면 null
[[nodiscard]] std::string json_nullable(const std::optional<std::string>& str);

// 2026-01-02T03:04:05.678Z (UTC, 밀리초)
[[nodiscard]] std::string format_iso8601(std::chrono::system_clock::time_point tp);
