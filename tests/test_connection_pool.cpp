// ---------------------------------------------------------------------------
// test_connection_pool.cpp
//
// 연결 풀 계층과 코루틴 동기화 도구 단위 테스트.
//
// [테스트 범위]
// - AsyncMutex: 상호 배제, FIFO 인계, Lock 이동/해제
// - gather: 입력 순서 유지, 예외 전파
// - PooledConnection: 소멸/이동/명시적 release 시 정확히 한 번 반납
// - ConnectionPool::fetch: acquire → fetch → 반납
// - DatabaseEngine 이름 변환, make_connection_pool
// - PgConnectionPool: 닫힌 풀, 연결 실패 시 자리 반환 (DB 서버 불필요)
//
// [알려진 한계]
// - 대기열/acquire_timeout 경로는 실제 연결이 있어야 재현되므로
//   test_pg_connection 의 PGGATE_TEST_DSN 기반 테스트에서만 다룬다.
// ---------------------------------------------------------------------------

#include "common/async_mutex.hpp"
#include "common/gather.hpp"
#include "db/connection.hpp"
#include "db/pg_pool.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/use_awaitable.hpp>

#include "fake_db.hpp"

using testing_support::FakeDatabase;
using testing_support::FakePool;
using testing_support::make_rowset;
using testing_support::run_sync;

namespace {

using namespace std::chrono_literals;

auto yield() -> boost::asio::awaitable<void> {
    co_await boost::asio::post(co_await boost::asio::this_coro::executor, boost::asio::use_awaitable);
}

// 락을 잡고 몇 번 양보한 뒤 순서를 기록한다
auto critical_section(AsyncMutex& mutex, std::vector<int>& trace, int id, int& inside, int& max_inside)
    -> boost::asio::awaitable<int> {
    auto lock = co_await mutex.lock();
    ++inside;
    max_inside = std::max(max_inside, inside);
    trace.push_back(id);
    for (int i = 0; i < 3; ++i) {
        co_await yield();
    }
    --inside;
    co_return id;
}

auto delayed_value(int value, int yields) -> boost::asio::awaitable<int> {
    for (int i = 0; i < yields; ++i) {
        co_await yield();
    }
    co_return value;
}

auto failing_value() -> boost::asio::awaitable<int> {
    co_await yield();
    throw std::runtime_error("boom");
}

}  // namespace

// ---------------------------------------------------------------------------
// AsyncMutex
// ---------------------------------------------------------------------------

TEST(AsyncMutex, SerializesAndWakesInFifoOrder) {
    boost::asio::io_context ioc;
    AsyncMutex              mutex;
    std::vector<int>        trace;
    int                     inside     = 0;
    int                     max_inside = 0;

    std::vector<boost::asio::awaitable<int>> tasks;
    for (int id = 0; id < 4; ++id) {
        tasks.push_back(critical_section(mutex, trace, id, inside, max_inside));
    }
    const auto ids = run_sync(ioc, gather(std::move(tasks)));

    EXPECT_EQ(ids, (std::vector<int>{0, 1, 2, 3}));
    EXPECT_EQ(trace, (std::vector<int>{0, 1, 2, 3}));
    EXPECT_EQ(max_inside, 1);
    EXPECT_FALSE(mutex.is_locked());
}

TEST(AsyncMutex, LockReleasesOnDestructionAndMove) {
    boost::asio::io_context ioc;
    AsyncMutex              mutex;

    run_sync(ioc, [](AsyncMutex& m) -> boost::asio::awaitable<void> {
        {
            auto lock = co_await m.lock();
            EXPECT_TRUE(lock.owns_lock());
            EXPECT_TRUE(m.is_locked());

            AsyncMutex::Lock moved = std::move(lock);
            EXPECT_FALSE(lock.owns_lock());
            EXPECT_TRUE(moved.owns_lock());
            EXPECT_TRUE(m.is_locked());
        }
        EXPECT_FALSE(m.is_locked());

        auto again = co_await m.lock();
        again.release();
        EXPECT_FALSE(again.owns_lock());
        EXPECT_FALSE(m.is_locked());
    }(mutex));
}

// ---------------------------------------------------------------------------
// gather
// ---------------------------------------------------------------------------

TEST(Gather, KeepsInputOrder) {
    boost::asio::io_context ioc;
    std::vector<boost::asio::awaitable<int>> tasks;
    tasks.push_back(delayed_value(1, 5));
    tasks.push_back(delayed_value(2, 0));
    tasks.push_back(delayed_value(3, 2));

    EXPECT_EQ(run_sync(ioc, gather(std::move(tasks))), (std::vector<int>{1, 2, 3}));
}

TEST(Gather, EmptyInput) {
    boost::asio::io_context ioc;
    EXPECT_TRUE(run_sync(ioc, gather(std::vector<boost::asio::awaitable<int>>{})).empty());
}

TEST(Gather, RethrowsAfterAllTasksFinish) {
    boost::asio::io_context ioc;
    int                     finished = 0;

    auto counted = [](int& n) -> boost::asio::awaitable<int> {
        for (int i = 0; i < 4; ++i) {
            co_await yield();
        }
        ++n;
        co_return 0;
    };

    std::vector<boost::asio::awaitable<int>> tasks;
    tasks.push_back(failing_value());
    tasks.push_back(counted(finished));
    tasks.push_back(counted(finished));

    EXPECT_THROW(run_sync(ioc, gather(std::move(tasks))), std::runtime_error);
    EXPECT_EQ(finished, 2);
}

// ---------------------------------------------------------------------------
// PooledConnection / ConnectionPool::fetch
// ---------------------------------------------------------------------------

TEST(PooledConnection, ReturnsToPoolExactlyOnce) {
    boost::asio::io_context ioc;
    FakePool                pool("app");

    {
        auto conn = run_sync(ioc, pool.acquire());
        ASSERT_TRUE(conn.has_value());
        ASSERT_TRUE(static_cast<bool>(*conn));

        PooledConnection moved = std::move(*conn);
        EXPECT_FALSE(static_cast<bool>(*conn));
        EXPECT_EQ(pool.released, 0u);

        PooledConnection assigned;
        assigned = std::move(moved);
        EXPECT_EQ(pool.released, 0u);
    }
    EXPECT_EQ(pool.released, 1u);

    auto conn = run_sync(ioc, pool.acquire());
    ASSERT_TRUE(conn.has_value());
    conn->release();
    conn->release();
    EXPECT_EQ(pool.released, 2u);
}

TEST(PooledConnection, MoveAssignReleasesPreviousConnection) {
    boost::asio::io_context ioc;
    FakePool                pool("app");

    auto a = run_sync(ioc, pool.acquire());
    auto b = run_sync(ioc, pool.acquire());
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());

    *a = std::move(*b);
    EXPECT_EQ(pool.released, 1u);
}

TEST(ConnectionPool, FetchBorrowsAndReturns) {
    boost::asio::io_context ioc;
    FakePool                pool("app");
    pool.db().handler = [](const std::string&) -> std::expected<RowSet, GatewayError> {
        return make_rowset({"n"}, {{std::string("1")}});
    };

    auto rows = run_sync(ioc, pool.fetch("SELECT 1 AS n", 250ms));
    ASSERT_TRUE(rows.has_value());
    EXPECT_EQ(rows->row_count(), 1u);
    EXPECT_EQ(rows->column_index("n"), std::optional<std::size_t>(0));
    EXPECT_FALSE(rows->column_index("m").has_value());

    ASSERT_EQ(pool.db().calls.size(), 1u);
    EXPECT_EQ(pool.db().calls[0].timeout, 250ms);
    EXPECT_EQ(pool.acquired, 1u);
    EXPECT_EQ(pool.released, 1u);
}

TEST(ConnectionPool, FetchReportsAcquireFailure) {
    boost::asio::io_context ioc;
    FakePool                pool("app");
    pool.acquire_error = make_error(ErrorCode::kConnectionFailure, "no route to host");

    auto rows = run_sync(ioc, pool.fetch("SELECT 1", 0ms));
    ASSERT_FALSE(rows.has_value());
    EXPECT_EQ(rows.error().code, ErrorCode::kConnectionFailure);
    EXPECT_TRUE(pool.db().calls.empty());
}

// ---------------------------------------------------------------------------
// DatabaseEngine
// ---------------------------------------------------------------------------

TEST(DatabaseEngine, ParsesKnownNames) {
    EXPECT_EQ(parse_engine("postgres"), DatabaseEngine::kPostgres);
    EXPECT_EQ(parse_engine("PostgreSQL"), DatabaseEngine::kPostgres);
    EXPECT_FALSE(parse_engine("mysql").has_value());
    EXPECT_FALSE(parse_engine("").has_value());
    EXPECT_STREQ(engine_name(DatabaseEngine::kPostgres), "postgres");
}

TEST(DatabaseEngine, FactoryBuildsPostgresPool) {
    boost::asio::io_context ioc;
    auto pool = make_connection_pool(DatabaseEngine::kPostgres, "app", ConnectionSettings{}, ioc.get_executor());
    ASSERT_NE(pool, nullptr);
    EXPECT_EQ(pool->name(), "app");
    EXPECT_EQ(pool->engine(), DatabaseEngine::kPostgres);
    EXPECT_NE(dynamic_cast<PgConnectionPool*>(pool.get()), nullptr);
}

// ---------------------------------------------------------------------------
// PgConnectionPool (서버 없이 확인 가능한 경로)
// ---------------------------------------------------------------------------

TEST(PgConnectionPool, ClosedPoolRejectsAcquire) {
    boost::asio::io_context ioc;
    PgConnectionPool        pool("app", ConnectionSettings{}, ioc.get_executor());
    pool.close();
    pool.close();

    auto conn = run_sync(ioc, pool.acquire());
    ASSERT_FALSE(conn.has_value());
    EXPECT_EQ(conn.error().code, ErrorCode::kConnectionFailure);
    EXPECT_EQ(conn.error().message, "connection pool 'app' is closed");
}

TEST(PgConnectionPool, WarmUpWithZeroMinimumOpensNothing) {
    boost::asio::io_context ioc;
    ConnectionSettings      settings;
    settings.min_pool_size = 0;
    PgConnectionPool pool("app", settings, ioc.get_executor());

    auto ready = run_sync(ioc, pool.warm_up());
    EXPECT_TRUE(ready.has_value());
    EXPECT_EQ(pool.size(), 0u);
    EXPECT_EQ(pool.idle_count(), 0u);
}

TEST(PgConnectionPool, RefusedConnectionFreesSlot) {
    boost::asio::io_context ioc;
    ConnectionSettings      settings;
    // 포트 1 은 아무도 듣지 않으므로 즉시 거부된다
    settings.conninfo        = "host=127.0.0.1 port=1 dbname=pggate_test connect_timeout=2";
    settings.max_pool_size   = 1;
    settings.connect_timeout = 2s;
    PgConnectionPool pool("app", settings, ioc.get_executor());

    auto first = run_sync(ioc, pool.acquire());
    ASSERT_FALSE(first.has_value());
    EXPECT_EQ(first.error().code, ErrorCode::kConnectionFailure);
    EXPECT_EQ(pool.size(), 0u);

    // 자리가 반환되었으므로 다음 요청도 대기 없이 같은 오류
    auto second = run_sync(ioc, pool.acquire());
    ASSERT_FALSE(second.has_value());
    EXPECT_EQ(second.error().code, ErrorCode::kConnectionFailure);
    EXPECT_EQ(pool.size(), 0u);
}
