#pragma once

// ---------------------------------------------------------------------------
// gateway_context.hpp
//
// 설정으로부터 한 번 만들어지는 런타임 객체 묶음.
// 전역 싱글턴 없이 handle_query 에 명시적으로 전달된다.
//
// [구성]
// - 공유: SqlValidator, SchemaCache, RateLimiter, AuditLogger
// - 데이터베이스별: ConnectionPool, PolicyEngine, ExplainCostGate, QueryExecutor
//
// [수명]
// 데이터베이스별 객체는 공유 객체를 참조하므로 GatewayContext 가 모두 소유한다.
// 소멸 순서는 선언 역순이며 databases_ 가 먼저 파괴된다.
// ---------------------------------------------------------------------------

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>
#include <utility>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>

#include "audit/audit_logger.hpp"
#include "config/gateway_config.hpp"
#include "db/connection.hpp"
#include "executor/query_executor.hpp"
#include "explain/explain_gate.hpp"
#include "parser/sql_validator.hpp"
#include "policy/policy_engine.hpp"
#include "ratelimit/rate_limiter.hpp"
#include "schema/schema_cache.hpp"

struct DatabaseRuntime {
    DatabaseConfig                   config;
    std::unique_ptr<ConnectionPool>  pool;
    std::unique_ptr<PolicyEngine>    policy;
    std::unique_ptr<ExplainCostGate> explain_gate;
    std::unique_ptr<QueryExecutor>   executor;
};

class GatewayContext {
public:
    using PoolFactory = std::function<std::unique_ptr<ConnectionPool>(const DatabaseConfig&)>;

    // pool_factory 가 비어 있으면 make_connection_pool 로 엔진별 풀을 만든다
    GatewayContext(GatewayConfig config, boost::asio::any_io_executor executor, PoolFactory pool_factory = {});

    ~GatewayContext();

    GatewayContext(const GatewayContext&)            = delete;
    GatewayContext& operator=(const GatewayContext&) = delete;
    GatewayContext(GatewayContext&&)                 = delete;
    GatewayContext& operator=(GatewayContext&&)      = delete;

    // 모든 풀을 min_pool_size 까지 채운다. 첫 실패를 반환한다.
    auto warm_up() -> boost::asio::awaitable<std::expected<void, GatewayError>>;

    [[nodiscard]] DatabaseRuntime*         find(std::string_view name) noexcept;
    [[nodiscard]] std::vector<std::string> database_names() const;

    void close();

    [[nodiscard]] const GatewayConfig& config() const noexcept { return config_; }
    [[nodiscard]] SqlValidator&        validator() noexcept { return validator_; }
    [[nodiscard]] SchemaCache&         schema_cache() noexcept { return schema_cache_; }
    [[nodiscard]] RateLimiter&         rate_limiter() noexcept { return rate_limiter_; }
    [[nodiscard]] AuditLogger&         audit() noexcept { return audit_; }

private:
    GatewayConfig config_;
    SqlValidator  validator_{};
    SchemaCache   schema_cache_;
    RateLimiter   rate_limiter_;
    AuditLogger   audit_;

    std::vector<std::unique_ptr<DatabaseRuntime>> databases_{};
};
