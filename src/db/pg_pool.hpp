#pragma once

// ---------------------------------------------------------------------------
// pg_pool.hpp
//
// PgConnection 풀.
//
// [동작]
// - 연결은 필요할 때 max_pool_size 까지 늘어난다. warm_up() 은
//   min_pool_size 만큼 미리 연다.
// - 빈 연결이 없으면 FIFO 로 대기한다. acquire_timeout 안에 받지 못하면
//   kConnectionFailure.
// - 반납 시 is_usable() 이 false 인 연결은 폐기된다. 폐기된 자리는
//   대기 중인 첫 번째 요청에게 "새 연결을 열 권리"로 넘어간다.
//
// [스레드 안전성]
// 풀은 하나의 io_context 스레드에서만 사용한다 (내부 잠금 없음).
// ---------------------------------------------------------------------------

#include <cstddef>
#include <deque>
#include <expected>
#include <memory>
#include <string>
#include <utility>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>

#include "common/types.hpp"
#include "db/connection.hpp"

class PgConnectionPool : public ConnectionPool {
public:
    PgConnectionPool(std::string name, ConnectionSettings settings, boost::asio::any_io_executor executor);

    ~PgConnectionPool() override;

    PgConnectionPool(const PgConnectionPool&)            = delete;
    PgConnectionPool& operator=(const PgConnectionPool&) = delete;
    PgConnectionPool(PgConnectionPool&&)                 = delete;
    PgConnectionPool& operator=(PgConnectionPool&&)      = delete;

    auto acquire()
        -> boost::asio::awaitable<std::expected<PooledConnection, GatewayError>> override;

    // min_pool_size 개의 연결을 미리 연다
    auto warm_up() -> boost::asio::awaitable<std::expected<void, GatewayError>> override;

    [[nodiscard]] const std::string& name() const noexcept override { return name_; }

    [[nodiscard]] DatabaseEngine engine() const noexcept override { return DatabaseEngine::kPostgres; }

    void close() override;

    [[nodiscard]] std::size_t size() const noexcept { return total_; }
    [[nodiscard]] std::size_t idle_count() const noexcept { return idle_.size(); }

protected:
    void release(std::shared_ptr<DbConnection> conn) noexcept override;

private:
    struct Waiter {
        explicit Waiter(boost::asio::steady_timer t) : timer{std::move(t)} {}

        boost::asio::steady_timer     timer;
        std::shared_ptr<DbConnection> handed{};        // 반납된 연결을 직접 받음
        bool                          slot_granted{false};  // 새 연결을 열 자리를 받음
    };

    // total_ 에 자리가 이미 예약된 상태에서 호출한다
    auto open_connection() -> boost::asio::awaitable<std::expected<PooledConnection, GatewayError>>;

    void give_up_slot() noexcept;

    std::string                                 name_;
    ConnectionSettings                          settings_;
    boost::asio::any_io_executor                executor_;
    std::deque<std::shared_ptr<DbConnection>>   idle_{};
    std::deque<std::shared_ptr<Waiter>>         waiters_{};
    std::size_t                                 total_{0};   // 유휴 + 대여 중 + 연결 중
    bool                                        closed_{false};
};
