#include "gateway/gateway_context.hpp"

#include <spdlog/spdlog.h>

GatewayContext::GatewayContext(GatewayConfig config, boost::asio::any_io_executor executor, PoolFactory pool_factory)
    : config_{std::move(config)}
    , schema_cache_{config_.server.schema_cache_ttl, config_.server.query_timeout}
    , rate_limiter_{config_.rate_limit}
    , audit_{config_.audit}
{
    if (!pool_factory) {
        pool_factory = [executor](const DatabaseConfig& db) {
            return make_connection_pool(db.engine, db.name, db.connection, executor);
        };
    }

    const ExecutorSettings settings{
        .query_timeout             = config_.server.query_timeout,
        .use_readonly_transactions = config_.server.use_readonly_transactions,
    };
    if (!settings.use_readonly_transactions) {
        spdlog::warn("gateway: read-only transactions are disabled, writes are only blocked by static checks");
    }

    for (const auto& db : config_.databases) {
        auto runtime          = std::make_unique<DatabaseRuntime>();
        runtime->config       = db;
        runtime->pool         = pool_factory(db);
        runtime->policy       = std::make_unique<PolicyEngine>(db.policy);
        runtime->explain_gate = std::make_unique<ExplainCostGate>(db.policy.explain);
        runtime->executor     = std::make_unique<QueryExecutor>(
            db.name, *runtime->pool, validator_, *runtime->policy, *runtime->explain_gate, schema_cache_, audit_,
            settings);
        spdlog::info("gateway: database [{}] engine={} pool={}..{}", db.name, engine_name(db.engine),
                     db.connection.min_pool_size, db.connection.max_pool_size);
        databases_.push_back(std::move(runtime));
    }
}

GatewayContext::~GatewayContext() {
    close();
}

auto GatewayContext::warm_up() -> boost::asio::awaitable<std::expected<void, GatewayError>> {
    for (auto& db : databases_) {
        auto warmed = co_await db->pool->warm_up();
        if (!warmed) {
            spdlog::error("gateway: [{}] warm-up failed: {}", db->config.name, describe(warmed.error()));
            co_return warmed;
        }
    }
    co_return std::expected<void, GatewayError>{};
}

DatabaseRuntime* GatewayContext::find(std::string_view name) noexcept {
    for (auto& db : databases_) {
        if (db->config.name == name) {
            return db.get();
        }
    }
    return nullptr;
}

std::vector<std::string> GatewayContext::database_names() const {
    std::vector<std::string> names;
    names.reserve(databases_.size());
    for (const auto& db : databases_) {
        names.push_back(db->config.name);
    }
    return names;
}

void GatewayContext::close() {
    for (auto& db : databases_) {
        if (db->pool) {
            db->pool->close();
        }
    }
}
