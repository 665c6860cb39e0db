#pragma once

// ---------------------------------------------------------------------------
// fake_db.hpp
//
// DB 없이 상위 레이어를 테스트하기 위한 가짜 연결/풀과 코루틴 실행 헬퍼.
//
// [FakeDatabase]
// - SQL 한 건마다 handler(sql) 를 호출해 결과를 만든다.
// - 모든 호출을 FetchCall 로 기록한다 (SQL, readonly 여부, timeout).
// - fetch 는 결과를 돌려주기 전에 executor 로 한 번 post 하여 실제 I/O 처럼
//   다른 코루틴에게 실행 기회를 준다.
//
// [FakePool]
// - acquire 할 때마다 FakeDatabase 를 공유하는 새 FakeConnection 을 빌려준다.
// - acquire_error 가 있으면 그 오류로 실패한다.
// ---------------------------------------------------------------------------

#include <chrono>
#include <cstddef>
#include <exception>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include "common/types.hpp"
#include "db/connection.hpp"
#include "db/db_types.hpp"

namespace testing_support {

// ---------------------------------------------------------------------------
// run_sync
//   task 를 ioc 에서 끝까지 실행하고 결과를 반환한다. 예외는 다시 던진다.
// ---------------------------------------------------------------------------
template <typename T>
T run_sync(boost::asio::io_context& ioc, boost::asio::awaitable<T> task) {
    std::optional<T>   result;
    std::exception_ptr error;
    boost::asio::co_spawn(ioc, std::move(task), [&](std::exception_ptr e, T value) {
        error = e;
        if (!e) {
            result.emplace(std::move(value));
        }
    });
    ioc.restart();
    ioc.run();
    if (error) {
        std::rethrow_exception(error);
    }
    return std::move(*result);
}

inline void run_sync(boost::asio::io_context& ioc, boost::asio::awaitable<void> task) {
    std::exception_ptr error;
    boost::asio::co_spawn(ioc, std::move(task), [&](std::exception_ptr e) { error = e; });
    ioc.restart();
    ioc.run();
    if (error) {
        std::rethrow_exception(error);
    }
}

inline RowSet make_rowset(std::vector<std::string> columns, std::vector<Row> rows) {
    RowSet rs;
    rs.columns     = std::move(columns);
    rs.rows        = std::move(rows);
    rs.command_tag = "SELECT " + std::to_string(rs.rows.size());
    return rs;
}

struct FetchCall {
    std::string               sql{};
    bool                      readonly{false};
    std::chrono::milliseconds timeout{0};
};

struct FakeDatabase {
    using Handler = std::function<std::expected<RowSet, GatewayError>(const std::string& sql)>;

    Handler                handler{[](const std::string&) { return RowSet{}; }};
    std::vector<FetchCall> calls{};

    // sql 이 prefix 로 시작하는 호출 수
    [[nodiscard]] std::size_t count_prefix(const std::string& prefix) const {
        std::size_t n = 0;
        for (const auto& c : calls) {
            if (c.sql.rfind(prefix, 0) == 0) {
                ++n;
            }
        }
        return n;
    }
};

class FakeConnection : public DbConnection {
public:
    explicit FakeConnection(std::shared_ptr<FakeDatabase> db) : db_{std::move(db)} {}

    auto fetch(std::string sql, std::chrono::milliseconds timeout)
        -> boost::asio::awaitable<std::expected<RowSet, GatewayError>> override {
        co_return co_await run(std::move(sql), false, timeout);
    }

    auto fetch_readonly(std::string sql, std::chrono::milliseconds timeout)
        -> boost::asio::awaitable<std::expected<RowSet, GatewayError>> override {
        co_return co_await run(std::move(sql), true, timeout);
    }

    auto execute(std::string sql) -> boost::asio::awaitable<std::expected<std::string, GatewayError>> override {
        db_->calls.push_back(FetchCall{.sql = std::move(sql)});
        co_return std::string("OK");
    }

    [[nodiscard]] bool is_usable() const noexcept override { return true; }

private:
    auto run(std::string sql, bool readonly, std::chrono::milliseconds timeout)
        -> boost::asio::awaitable<std::expected<RowSet, GatewayError>> {
        db_->calls.push_back(FetchCall{.sql = sql, .readonly = readonly, .timeout = timeout});
        co_await boost::asio::post(co_await boost::asio::this_coro::executor, boost::asio::use_awaitable);
        co_return db_->handler(sql);
    }

    std::shared_ptr<FakeDatabase> db_;
};

class FakePool : public ConnectionPool {
public:
    explicit FakePool(std::string name, std::shared_ptr<FakeDatabase> db = std::make_shared<FakeDatabase>())
        : name_{std::move(name)}, db_{std::move(db)} {}

    auto acquire() -> boost::asio::awaitable<std::expected<PooledConnection, GatewayError>> override {
        if (acquire_error) {
            co_return std::unexpected(*acquire_error);
        }
        ++acquired;
        co_return PooledConnection(this, std::make_shared<FakeConnection>(db_));
    }

    [[nodiscard]] const std::string& name() const noexcept override { return name_; }
    [[nodiscard]] DatabaseEngine     engine() const noexcept override { return DatabaseEngine::kPostgres; }

    auto warm_up() -> boost::asio::awaitable<std::expected<void, GatewayError>> override {
        ++warm_ups;
        co_return std::expected<void, GatewayError>{};
    }

    void close() override { ++closes; }

    [[nodiscard]] FakeDatabase& db() noexcept { return *db_; }

    std::optional<GatewayError> acquire_error{};
    std::size_t                 acquired{0};
    std::size_t                 released{0};
    std::size_t                 warm_ups{0};
    std::size_t                 closes{0};

protected:
    void release(std::shared_ptr<DbConnection> /*conn*/) noexcept override { ++released; }

private:
    std::string                   name_;
    std::shared_ptr<FakeDatabase> db_;
};

}  // namespace testing_support
