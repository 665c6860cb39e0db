#include "db/connection.hpp"

#include <algorithm>
#include <cctype>
#include <string>

#include "db/pg_pool.hpp"

// ---------------------------------------------------------------------------
// PooledConnection
// ---------------------------------------------------------------------------

PooledConnection::~PooledConnection() {
    release();
}

PooledConnection::PooledConnection(PooledConnection&& other) noexcept
    : pool_{other.pool_}, conn_{std::move(other.conn_)} {
    other.pool_ = nullptr;
}

PooledConnection& PooledConnection::operator=(PooledConnection&& other) noexcept {
    if (this != &other) {
        release();
        pool_       = other.pool_;
        conn_       = std::move(other.conn_);
        other.pool_ = nullptr;
    }
    return *this;
}

void PooledConnection::release() noexcept {
    if (pool_ != nullptr && conn_) {
        pool_->release(std::move(conn_));
    }
    pool_ = nullptr;
    conn_.reset();
}

// ---------------------------------------------------------------------------
// ConnectionPool
// ---------------------------------------------------------------------------

auto ConnectionPool::fetch(std::string sql, std::chrono::milliseconds timeout)
    -> boost::asio::awaitable<std::expected<RowSet, GatewayError>>
{
    auto conn = co_await acquire();
    if (!conn) {
        co_return std::unexpected(conn.error());
    }
    co_return co_await (*conn)->fetch(std::move(sql), timeout);
}

auto ConnectionPool::warm_up() -> boost::asio::awaitable<std::expected<void, GatewayError>> {
    co_return std::expected<void, GatewayError>{};
}

// ---------------------------------------------------------------------------
// DatabaseEngine
// ---------------------------------------------------------------------------

const char* engine_name(DatabaseEngine engine) noexcept {
    switch (engine) {
        case DatabaseEngine::kPostgres: return "postgres";
    }
    return "postgres";
}

std::optional<DatabaseEngine> parse_engine(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "postgres" || lower == "postgresql") {
        return DatabaseEngine::kPostgres;
    }
    return std::nullopt;
}

std::unique_ptr<ConnectionPool> make_connection_pool(DatabaseEngine               engine,
                                                     std::string                  name,
                                                     ConnectionSettings           settings,
                                                     boost::asio::any_io_executor executor) {
    switch (engine) {
        case DatabaseEngine::kPostgres:
            return std::make_unique<PgConnectionPool>(std::move(name), std::move(settings),
                                                      std::move(executor));
    }
    return nullptr;
}
