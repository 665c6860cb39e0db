#pragma once

// ---------------------------------------------------------------------------
// connection.hpp
//
// 데이터베이스 드라이버 추상화.
//
// [구성]
// - DbConnection     : 연결 하나. 질의 실행과 읽기 전용 트랜잭션 래핑.
// - ConnectionPool   : 연결 대여/반납. acquire() 는 RAII PooledConnection 반환.
// - DatabaseEngine   : 지원 엔진의 닫힌 열거형. make_connection_pool 의
//                      switch 가 엔진별 구현으로 매핑한다 (case 누락 시 -Wswitch).
//
// [코루틴 인자 규칙]
// 코루틴 함수는 SQL 을 std::string 값으로 받는다. string_view/const& 는
// 첫 co_await 이후 호출자 쪽 버퍼가 사라질 수 있다.
//
// [timeout]
// timeout == 0 이면 제한 없음. 제한이 있으면 만료 시 서버 측에서 구문을
// 취소하고 kQueryTimeout 을 반환한다.
// ---------------------------------------------------------------------------

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>

#include "common/types.hpp"
#include "db/db_types.hpp"

// ---------------------------------------------------------------------------
// DatabaseEngine
// ---------------------------------------------------------------------------
enum class DatabaseEngine : std::uint8_t {
    kPostgres = 0,
};

class DbConnection {
public:
    virtual ~DbConnection() = default;

    virtual auto fetch(std::string sql, std::chrono::milliseconds timeout)
        -> boost::asio::awaitable<std::expected<RowSet, GatewayError>> = 0;

    // BEGIN TRANSACTION READ ONLY 안에서 statement timeout 을 걸고 실행한다.
    // 쓰기 시도는 서버가 거부하며 kUnsafeSql 로 보고된다.
    virtual auto fetch_readonly(std::string sql, std::chrono::milliseconds timeout)
        -> boost::asio::awaitable<std::expected<RowSet, GatewayError>> = 0;

    // 결과 행이 없는 명령. 성공 시 command tag 반환.
    virtual auto execute(std::string sql)
        -> boost::asio::awaitable<std::expected<std::string, GatewayError>> = 0;

    // 연결이 끊겼거나 트랜잭션 상태가 비정상이면 false. 풀은 반납 시 폐기한다.
    [[nodiscard]] virtual bool is_usable() const noexcept = 0;
};

class ConnectionPool;

// ---------------------------------------------------------------------------
// PooledConnection
//   풀에서 빌린 연결. 소멸 시 풀에 반납된다 (이동 전용).
//   풀은 자신이 빌려준 모든 PooledConnection 보다 오래 살아야 한다.
// ---------------------------------------------------------------------------
class PooledConnection {
public:
    PooledConnection() = default;
    PooledConnection(ConnectionPool* pool, std::shared_ptr<DbConnection> conn) noexcept
        : pool_{pool}, conn_{std::move(conn)} {}

    ~PooledConnection();

    PooledConnection(const PooledConnection&)            = delete;
    PooledConnection& operator=(const PooledConnection&) = delete;

    PooledConnection(PooledConnection&& other) noexcept;
    PooledConnection& operator=(PooledConnection&& other) noexcept;

    [[nodiscard]] DbConnection& operator*() const noexcept { return *conn_; }
    [[nodiscard]] DbConnection* operator->() const noexcept { return conn_.get(); }
    [[nodiscard]] explicit operator bool() const noexcept { return conn_ != nullptr; }

    void release() noexcept;

private:
    ConnectionPool*               pool_{nullptr};
    std::shared_ptr<DbConnection> conn_{};
};

class ConnectionPool {
public:
    virtual ~ConnectionPool() = default;

    virtual auto acquire()
        -> boost::asio::awaitable<std::expected<PooledConnection, GatewayError>> = 0;

    [[nodiscard]] virtual const std::string& name() const noexcept = 0;

    [[nodiscard]] virtual DatabaseEngine engine() const noexcept = 0;

    // 최소 연결 수만큼 미리 연다. 기본 구현은 아무것도 하지 않는다.
    virtual auto warm_up() -> boost::asio::awaitable<std::expected<void, GatewayError>>;

    // 유휴 연결을 모두 닫는다. 대여 중인 연결은 반납 시 닫힌다.
    virtual void close() = 0;

    // acquire + fetch + 반납
    auto fetch(std::string sql, std::chrono::milliseconds timeout)
        -> boost::asio::awaitable<std::expected<RowSet, GatewayError>>;

protected:
    friend class PooledConnection;
    virtual void release(std::shared_ptr<DbConnection> conn) noexcept = 0;
};

[[nodiscard]] const char* engine_name(DatabaseEngine engine) noexcept;

// "postgres" / "postgresql" (대소문자 무시). 모르는 이름이면 nullopt.
[[nodiscard]] std::optional<DatabaseEngine> parse_engine(std::string_view name);

struct ConnectionSettings {
    std::string               conninfo{};   // 엔진 고유 연결 문자열 (libpq: "host=... dbname=...")
    std::size_t               min_pool_size{1};
    std::size_t               max_pool_size{5};
    std::chrono::milliseconds connect_timeout{std::chrono::seconds{10}};
    std::chrono::milliseconds acquire_timeout{std::chrono::seconds{30}};
};

[[nodiscard]] std::unique_ptr<ConnectionPool> make_connection_pool(
    DatabaseEngine               engine,
    std::string                  name,
    ConnectionSettings           settings,
    boost::asio::any_io_executor executor);
