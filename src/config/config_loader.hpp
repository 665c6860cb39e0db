#pragma once

// ---------------------------------------------------------------------------
// config_loader.hpp
//
// YAML 설정 파일을 GatewayConfig 로 로드한다.
//
// [설계 원칙]
// - All-or-nothing: 어느 한 섹션이라도 실패하면 std::unexpected(error_message).
//   부분적으로 파싱된 설정을 반환하지 않는다.
// - 누락된 필드는 구조체 기본값을 쓴다.
// - 파싱 실패 원인은 로깅하되, 파일 내용 (비밀번호 포함) 은 로그에 남기지 않는다.
//
// [환경 변수]
// databases[].password_env 가 지정되어 있고 해당 변수가 설정되어 있으면
// password 값보다 우선한다.
// ---------------------------------------------------------------------------

#include <expected>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include "config/gateway_config.hpp"

// "30s", "500ms", "5m", "1h", 단위 없는 정수(초). 형식이 틀리면 nullopt.
[[nodiscard]] std::optional<std::chrono::milliseconds> parse_duration(std::string_view text);

// libpq 연결 문자열 (key='value' ...). 값의 ' 와 \ 는 이스케이프한다.
[[nodiscard]] std::string build_conninfo(const std::map<std::string, std::string>& params);

class ConfigLoader {
public:
    ConfigLoader()  = delete;

    [[nodiscard]] static std::expected<GatewayConfig, std::string>
    load(const std::filesystem::path& config_path);

    // 문자열에서 직접 로드 (테스트, 표준 입력)
    [[nodiscard]] static std::expected<GatewayConfig, std::string>
    load_from_string(std::string_view yaml);
};
