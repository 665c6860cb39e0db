#pragma once

// ---------------------------------------------------------------------------
// pg_connection.hpp
//
// libpq 비동기 API 위의 PostgreSQL 연결.
//
// [I/O 모델]
// - 연결: PQconnectStart + PQconnectPoll, 소켓 준비를 stream_descriptor 로 대기
// - 질의: PQsendQueryParams (extended protocol, 파라미터 0개)
//   extended protocol 은 한 메시지에 구문 하나만 허용하므로 서버 자체가
//   stacked query 를 거부한다 (42601).
// - 소켓 fd 는 libpq 소유다. stream_descriptor 는 소멸 전에 release() 하여
//   fd 를 닫지 않는다.
//
// [timeout]
// 만료 시 PQcancel 로 서버 측 구문을 취소하고 서버 응답(57014)을 기다린다.
// 취소 후 kCancelGrace 안에 응답이 없으면 연결을 폐기 대상으로 표시하고
// 대기를 중단한다.
//
// [알려진 한계]
// - PQcancel 은 취소 요청용 연결을 동기로 연다. 타이머 핸들러 안에서
//   실행되므로 그 왕복 시간 동안 io_context 스레드가 멈춘다.
// ---------------------------------------------------------------------------

#include <chrono>
#include <expected>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/asio/steady_timer.hpp>

#include <libpq-fe.h>

#include "common/types.hpp"
#include "db/connection.hpp"

// SQLSTATE → ErrorCode
//   57014 → kQueryTimeout, 08xxx → kConnectionFailure, 25006 → kUnsafeSql,
//   42601 → kSyntaxError, 그 외 → kExecutionError
[[nodiscard]] ErrorCode error_code_for_sqlstate(std::string_view sqlstate) noexcept;

class PgConnection : public DbConnection, public std::enable_shared_from_this<PgConnection> {
    // connect() 밖에서는 만들 수 없게 하면서 make_shared 를 쓰기 위한 태그
    struct PrivateTag {
        explicit PrivateTag() = default;
    };

public:
    static constexpr std::chrono::milliseconds kCancelGrace{std::chrono::seconds{5}};

    static auto connect(boost::asio::any_io_executor executor,
                        std::string                  conninfo,
                        std::chrono::milliseconds    timeout)
        -> boost::asio::awaitable<std::expected<std::shared_ptr<PgConnection>, GatewayError>>;

    PgConnection(PrivateTag, boost::asio::any_io_executor executor, PGconn* conn);
    ~PgConnection() override;

    PgConnection(const PgConnection&)            = delete;
    PgConnection& operator=(const PgConnection&) = delete;
    PgConnection(PgConnection&&)                 = delete;
    PgConnection& operator=(PgConnection&&)      = delete;

    auto fetch(std::string sql, std::chrono::milliseconds timeout)
        -> boost::asio::awaitable<std::expected<RowSet, GatewayError>> override;

    auto fetch_readonly(std::string sql, std::chrono::milliseconds timeout)
        -> boost::asio::awaitable<std::expected<RowSet, GatewayError>> override;

    auto execute(std::string sql)
        -> boost::asio::awaitable<std::expected<std::string, GatewayError>> override;

    [[nodiscard]] bool is_usable() const noexcept override;

private:
    struct ConnDeleter {
        void operator()(PGconn* conn) const noexcept { PQfinish(conn); }
    };
    struct ResultDeleter {
        void operator()(PGresult* res) const noexcept { PQclear(res); }
    };
    using ResultPtr = std::unique_ptr<PGresult, ResultDeleter>;

    struct Deadline;
    struct DeadlineHandler;

    auto finish_connect(std::chrono::milliseconds timeout)
        -> boost::asio::awaitable<std::expected<void, GatewayError>>;

    auto run(std::string sql, std::chrono::milliseconds timeout)
        -> boost::asio::awaitable<std::expected<ResultPtr, GatewayError>>;

    auto wait_socket(boost::asio::posix::descriptor_base::wait_type type)
        -> boost::asio::awaitable<boost::system::error_code>;

    [[nodiscard]] std::shared_ptr<boost::asio::steady_timer> arm_deadline(
        std::chrono::milliseconds timeout, const std::shared_ptr<Deadline>& state, bool cancel_on_expiry);

    bool attach_socket();
    void send_cancel() noexcept;

    [[nodiscard]] GatewayError connection_error(std::string_view what) const;
    [[nodiscard]] std::expected<RowSet, GatewayError> to_rowset(const PGresult* res) const;

    boost::asio::any_io_executor            executor_;
    std::unique_ptr<PGconn, ConnDeleter>    conn_;
    boost::asio::posix::stream_descriptor   socket_;
    std::shared_ptr<PGcancel>               cancel_{};
    bool                                    broken_{false};
};
