#pragma once

// ---------------------------------------------------------------------------
// gateway_config.hpp
//
// 설정 파일 전체를 표현하는 구조체 (헤더만).
// 각 하위 설정은 해당 모듈 헤더에 정의되어 있고 여기서 묶기만 한다.
// ---------------------------------------------------------------------------

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "audit/audit_logger.hpp"
#include "db/connection.hpp"
#include "logger/log_setup.hpp"
#include "policy/rule.hpp"
#include "ratelimit/rate_limiter.hpp"

struct ServerConfig {
    std::uint64_t             max_result_rows{1000};
    std::chrono::milliseconds query_timeout{std::chrono::seconds{30}};
    bool                      use_readonly_transactions{true};
    std::chrono::seconds      schema_cache_ttl{3600};
};

struct DatabaseConfig {
    std::string        name{};
    DatabaseEngine     engine{DatabaseEngine::kPostgres};
    ConnectionSettings connection{};
    PolicyConfig       policy{};
};

struct GatewayConfig {
    ServerConfig                server{};
    LoggingConfig               logging{};
    RateLimitConfig             rate_limit{};
    AuditConfig                 audit{};
    std::vector<DatabaseConfig> databases{};

    // 이름 정확 일치. 없으면 nullptr.
    [[nodiscard]] const DatabaseConfig* find_database(std::string_view name) const noexcept {
        for (const auto& db : databases) {
            if (db.name == name) {
                return &db;
            }
        }
        return nullptr;
    }
};
