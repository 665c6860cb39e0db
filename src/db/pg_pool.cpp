#include "db/pg_pool.hpp"

#include <algorithm>
#include <utility>
#include <vector>

#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "db/pg_connection.hpp"

namespace {

void wake(boost::asio::steady_timer& timer) noexcept {
    try {
        timer.expires_at(boost::asio::steady_timer::time_point::min());
    } catch (const boost::system::system_error& e) {
        spdlog::error("pg_pool: cannot wake waiter: {}", e.what());
    }
}

}  // namespace

PgConnectionPool::PgConnectionPool(std::string                  name,
                                   ConnectionSettings           settings,
                                   boost::asio::any_io_executor executor)
    : name_{std::move(name)}, settings_{std::move(settings)}, executor_{std::move(executor)} {
    if (settings_.max_pool_size == 0) {
        settings_.max_pool_size = 1;
    }
    settings_.min_pool_size = std::min(settings_.min_pool_size, settings_.max_pool_size);
}

PgConnectionPool::~PgConnectionPool() {
    close();
}

auto PgConnectionPool::open_connection()
    -> boost::asio::awaitable<std::expected<PooledConnection, GatewayError>>
{
    auto conn = co_await PgConnection::connect(executor_, settings_.conninfo, settings_.connect_timeout);
    if (!conn) {
        spdlog::warn("pg_pool: [{}] connection failed: {}", name_, conn.error().message);
        give_up_slot();
        co_return std::unexpected(conn.error());
    }
    spdlog::debug("pg_pool: [{}] opened connection ({}/{})", name_, total_, settings_.max_pool_size);
    co_return PooledConnection{this, std::move(*conn)};
}

auto PgConnectionPool::acquire()
    -> boost::asio::awaitable<std::expected<PooledConnection, GatewayError>>
{
    if (closed_) {
        co_return std::unexpected(make_error(ErrorCode::kConnectionFailure,
                                             fmt::format("connection pool '{}' is closed", name_)));
    }

    // 1. 유휴 연결
    while (!idle_.empty()) {
        auto conn = std::move(idle_.front());
        idle_.pop_front();
        if (conn->is_usable()) {
            co_return PooledConnection{this, std::move(conn)};
        }
        --total_;
    }

    // 2. 여유 자리
    if (total_ < settings_.max_pool_size) {
        ++total_;
        co_return co_await open_connection();
    }

    // 3. 대기
    auto waiter = std::make_shared<Waiter>(
        boost::asio::steady_timer{executor_, settings_.acquire_timeout});
    waiters_.push_back(waiter);

    boost::system::error_code ec;
    co_await waiter->timer.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));

    if (waiter->handed) {
        co_return PooledConnection{this, std::move(waiter->handed)};
    }
    if (waiter->slot_granted) {
        co_return co_await open_connection();
    }

    waiters_.erase(std::remove(waiters_.begin(), waiters_.end(), waiter), waiters_.end());
    if (closed_) {
        co_return std::unexpected(make_error(ErrorCode::kConnectionFailure,
                                             fmt::format("connection pool '{}' is closed", name_)));
    }
    co_return std::unexpected(make_error(
        ErrorCode::kConnectionFailure,
        fmt::format("timed out waiting for a connection from pool '{}' after {} ms",
                    name_, settings_.acquire_timeout.count())));
}

auto PgConnectionPool::warm_up() -> boost::asio::awaitable<std::expected<void, GatewayError>> {
    std::vector<PooledConnection> opened;
    while (total_ < settings_.min_pool_size) {
        ++total_;
        auto conn = co_await open_connection();
        if (!conn) {
            co_return std::unexpected(conn.error());
        }
        opened.push_back(std::move(*conn));
    }
    spdlog::info("pg_pool: [{}] ready, {} connection(s)", name_, total_);
    co_return std::expected<void, GatewayError>{};
}

void PgConnectionPool::give_up_slot() noexcept {
    if (!closed_ && !waiters_.empty()) {
        auto next = std::move(waiters_.front());
        waiters_.pop_front();
        next->slot_granted = true;
        wake(next->timer);
        return;
    }
    --total_;
}

void PgConnectionPool::release(std::shared_ptr<DbConnection> conn) noexcept {
    if (closed_ || !conn->is_usable()) {
        if (!closed_) {
            spdlog::debug("pg_pool: [{}] discarding unusable connection", name_);
        }
        conn.reset();
        give_up_slot();
        return;
    }
    if (!waiters_.empty()) {
        auto next = std::move(waiters_.front());
        waiters_.pop_front();
        next->handed = std::move(conn);
        wake(next->timer);
        return;
    }
    idle_.push_back(std::move(conn));
}

void PgConnectionPool::close() {
    if (closed_) {
        return;
    }
    closed_ = true;
    total_ -= idle_.size();
    idle_.clear();
    for (auto& waiter : waiters_) {
        wake(waiter->timer);
    }
    waiters_.clear();
    spdlog::debug("pg_pool: [{}] closed", name_);
}
