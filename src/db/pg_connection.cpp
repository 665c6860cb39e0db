#include "db/pg_connection.hpp"

#include <array>
#include <utility>

#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

// ---------------------------------------------------------------------------
// 타임아웃 상태
//   fired       : 첫 만료가 발생함
//   cancel_sent : PQcancel 을 보냄 (이후 서버 오류는 timeout 으로 보고)
//   abandoned   : 유예 시간까지 지나 대기를 중단함 (연결 폐기)
// ---------------------------------------------------------------------------
struct PgConnection::Deadline {
    bool fired{false};
    bool cancel_sent{false};
    bool abandoned{false};
};

struct PgConnection::DeadlineHandler {
    std::weak_ptr<PgConnection>                conn;
    std::shared_ptr<boost::asio::steady_timer> timer;
    std::shared_ptr<Deadline>                  state;
    bool                                       cancel_on_expiry{true};

    void operator()(const boost::system::error_code& ec) {
        if (ec) {
            return;   // 정상 완료로 타이머가 취소됨
        }
        auto self = conn.lock();
        if (!self) {
            return;
        }
        state->fired = true;
        if (cancel_on_expiry && !state->cancel_sent) {
            state->cancel_sent = true;
            self->send_cancel();
            timer->expires_after(kCancelGrace);
            timer->async_wait(*this);
            return;
        }
        state->abandoned = true;
        self->broken_    = true;
        boost::system::error_code cancel_ec;
        self->socket_.cancel(cancel_ec);
        if (cancel_ec) {
            spdlog::debug("pg_connection: socket cancel failed: {}", cancel_ec.message());
        }
    }
};

namespace {

// 소멸 시 타이머를 취소하여 핸들러가 잡고 있는 참조를 끊는다
struct DeadlineGuard {
    std::shared_ptr<boost::asio::steady_timer> timer;
    ~DeadlineGuard() {
        if (timer) {
            timer->cancel();
        }
    }
};

std::string trim_message(const char* raw) {
    std::string msg = raw != nullptr ? raw : "";
    while (!msg.empty() && (msg.back() == '\n' || msg.back() == ' ')) {
        msg.pop_back();
    }
    return msg;
}

bool is_error_status(ExecStatusType status) noexcept {
    return status == PGRES_BAD_RESPONSE || status == PGRES_FATAL_ERROR;
}

GatewayError timeout_error(std::chrono::milliseconds timeout) {
    return make_error(ErrorCode::kQueryTimeout,
                      fmt::format("Query execution timed out after {} ms", timeout.count()));
}

}  // namespace

ErrorCode error_code_for_sqlstate(std::string_view sqlstate) noexcept {
    if (sqlstate == "57014") {
        return ErrorCode::kQueryTimeout;
    }
    if (sqlstate.starts_with("08")) {
        return ErrorCode::kConnectionFailure;
    }
    if (sqlstate == "25006") {
        return ErrorCode::kUnsafeSql;
    }
    if (sqlstate == "42601") {
        return ErrorCode::kSyntaxError;
    }
    return ErrorCode::kExecutionError;
}

// ---------------------------------------------------------------------------
// 생성 / 소멸
// ---------------------------------------------------------------------------

PgConnection::PgConnection(PrivateTag, boost::asio::any_io_executor executor, PGconn* conn)
    : executor_{executor}, conn_{conn}, socket_{executor} {}

PgConnection::~PgConnection() {
    // fd 는 PQfinish 가 닫는다
    if (socket_.is_open()) {
        socket_.release();
    }
}

auto PgConnection::connect(boost::asio::any_io_executor executor,
                           std::string                  conninfo,
                           std::chrono::milliseconds    timeout)
    -> boost::asio::awaitable<std::expected<std::shared_ptr<PgConnection>, GatewayError>>
{
    PGconn* raw = PQconnectStart(conninfo.c_str());
    if (raw == nullptr) {
        co_return std::unexpected(make_error(ErrorCode::kConnectionFailure,
                                             "cannot allocate PostgreSQL connection"));
    }
    auto conn = std::make_shared<PgConnection>(PrivateTag{}, executor, raw);

    if (PQstatus(raw) == CONNECTION_BAD) {
        co_return std::unexpected(conn->connection_error("connection failed"));
    }

    auto done = co_await conn->finish_connect(timeout);
    if (!done) {
        co_return std::unexpected(done.error());
    }

    spdlog::debug("pg_connection: connected host={} port={} db={}",
                  PQhost(raw) != nullptr ? PQhost(raw) : "",
                  PQport(raw) != nullptr ? PQport(raw) : "",
                  PQdb(raw) != nullptr ? PQdb(raw) : "");
    co_return conn;
}

auto PgConnection::finish_connect(std::chrono::milliseconds timeout)
    -> boost::asio::awaitable<std::expected<void, GatewayError>>
{
    auto          state = std::make_shared<Deadline>();
    DeadlineGuard guard{arm_deadline(timeout, state, false)};

    PostgresPollingStatusType poll = PGRES_POLLING_WRITING;
    while (poll != PGRES_POLLING_OK) {
        if (poll == PGRES_POLLING_FAILED) {
            co_return std::unexpected(connection_error("connection failed"));
        }
        const auto type = poll == PGRES_POLLING_READING
                              ? boost::asio::posix::descriptor_base::wait_read
                              : boost::asio::posix::descriptor_base::wait_write;
        const auto ec = co_await wait_socket(type);

        // 연결 중에는 libpq 가 소켓을 바꿀 수 있으므로 매번 다시 붙인다
        if (socket_.is_open()) {
            socket_.release();
        }
        if (state->abandoned) {
            co_return std::unexpected(make_error(
                ErrorCode::kConnectionFailure,
                fmt::format("connection timed out after {} ms", timeout.count())));
        }
        if (ec) {
            co_return std::unexpected(connection_error(ec.message()));
        }
        poll = PQconnectPoll(conn_.get());
    }

    if (PQsetnonblocking(conn_.get(), 1) != 0) {
        co_return std::unexpected(connection_error("cannot switch to non-blocking mode"));
    }

    cancel_ = std::shared_ptr<PGcancel>(PQgetCancel(conn_.get()), PQfreeCancel);
    if (!cancel_) {
        spdlog::warn("pg_connection: cancel handle unavailable, timeouts rely on statement_timeout only");
    }
    co_return std::expected<void, GatewayError>{};
}

// ---------------------------------------------------------------------------
// 소켓 / 타이머
// ---------------------------------------------------------------------------

bool PgConnection::attach_socket() {
    const int fd = PQsocket(conn_.get());
    if (fd < 0) {
        return false;
    }
    if (socket_.is_open()) {
        if (socket_.native_handle() == fd) {
            return true;
        }
        socket_.release();
    }
    boost::system::error_code ec;
    socket_.assign(fd, ec);
    if (ec) {
        spdlog::warn("pg_connection: cannot register socket: {}", ec.message());
        return false;
    }
    return true;
}

auto PgConnection::wait_socket(boost::asio::posix::descriptor_base::wait_type type)
    -> boost::asio::awaitable<boost::system::error_code>
{
    if (!attach_socket()) {
        co_return boost::system::error_code{boost::asio::error::bad_descriptor};
    }
    boost::system::error_code ec;
    co_await socket_.async_wait(type, boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    co_return ec;
}

std::shared_ptr<boost::asio::steady_timer> PgConnection::arm_deadline(
    std::chrono::milliseconds timeout, const std::shared_ptr<Deadline>& state, bool cancel_on_expiry) {
    if (timeout.count() <= 0) {
        return nullptr;
    }
    auto timer = std::make_shared<boost::asio::steady_timer>(executor_, timeout);
    timer->async_wait(DeadlineHandler{weak_from_this(), timer, state, cancel_on_expiry});
    return timer;
}

void PgConnection::send_cancel() noexcept {
    if (!cancel_) {
        return;
    }
    std::array<char, 256> errbuf{};
    if (PQcancel(cancel_.get(), errbuf.data(), static_cast<int>(errbuf.size())) == 0) {
        spdlog::warn("pg_connection: cancel request failed: {}", errbuf.data());
        return;
    }
    spdlog::debug("pg_connection: cancel request sent");
}

GatewayError PgConnection::connection_error(std::string_view what) const {
    const std::string detail = conn_ ? trim_message(PQerrorMessage(conn_.get())) : std::string{};
    if (detail.empty()) {
        return make_error(ErrorCode::kConnectionFailure, std::string(what));
    }
    return make_error(ErrorCode::kConnectionFailure, fmt::format("{}: {}", what, detail));
}

// ---------------------------------------------------------------------------
// 질의
// ---------------------------------------------------------------------------

auto PgConnection::run(std::string sql, std::chrono::milliseconds timeout)
    -> boost::asio::awaitable<std::expected<ResultPtr, GatewayError>>
{
    if (!conn_ || broken_ || PQstatus(conn_.get()) != CONNECTION_OK) {
        co_return std::unexpected(make_error(ErrorCode::kConnectionFailure, "connection is not usable"));
    }

    PGconn* pg = conn_.get();
    if (PQsendQueryParams(pg, sql.c_str(), 0, nullptr, nullptr, nullptr, nullptr, 0) == 0) {
        broken_ = PQstatus(pg) != CONNECTION_OK;
        co_return std::unexpected(connection_error("failed to send query"));
    }

    auto          state = std::make_shared<Deadline>();
    DeadlineGuard guard{arm_deadline(timeout, state, true)};

    // 1. 송신 버퍼 비우기
    for (;;) {
        const int flushed = PQflush(pg);
        if (flushed == 0) {
            break;
        }
        if (flushed < 0) {
            broken_ = true;
            co_return std::unexpected(connection_error("failed to send query"));
        }
        const auto ec = co_await wait_socket(boost::asio::posix::descriptor_base::wait_write);
        if (state->abandoned) {
            co_return std::unexpected(timeout_error(timeout));
        }
        if (ec) {
            broken_ = true;
            co_return std::unexpected(connection_error(ec.message()));
        }
    }

    // 2. 결과 수신. 오류 결과가 있으면 첫 오류를, 없으면 마지막 결과를 쓴다.
    ResultPtr chosen;
    bool      chosen_is_error = false;
    for (;;) {
        while (PQisBusy(pg) != 0) {
            const auto ec = co_await wait_socket(boost::asio::posix::descriptor_base::wait_read);
            if (state->abandoned) {
                co_return std::unexpected(timeout_error(timeout));
            }
            if (ec) {
                broken_ = true;
                co_return std::unexpected(connection_error(ec.message()));
            }
            if (PQconsumeInput(pg) == 0) {
                broken_ = true;
                co_return std::unexpected(connection_error("failed to read from server"));
            }
        }
        PGresult* raw = PQgetResult(pg);
        if (raw == nullptr) {
            break;
        }
        ResultPtr res(raw);
        const ExecStatusType status = PQresultStatus(raw);
        if (status == PGRES_COPY_IN || status == PGRES_COPY_OUT || status == PGRES_COPY_BOTH) {
            broken_ = true;
            co_return std::unexpected(make_error(ErrorCode::kUnsafeSql, "COPY protocol is not supported"));
        }
        if (!chosen_is_error) {
            chosen          = std::move(res);
            chosen_is_error = is_error_status(status);
        }
    }

    if (!chosen) {
        co_return std::unexpected(connection_error("no result from server"));
    }
    if (chosen_is_error) {
        const char*       field    = PQresultErrorField(chosen.get(), PG_DIAG_SQLSTATE);
        const std::string sqlstate = field != nullptr ? field : "";
        ErrorCode         code     = error_code_for_sqlstate(sqlstate);
        if (state->cancel_sent) {
            code = ErrorCode::kQueryTimeout;
        }
        GatewayError err = code == ErrorCode::kQueryTimeout
                               ? timeout_error(timeout)
                               : make_error(code, trim_message(PQresultErrorMessage(chosen.get())));
        if (!sqlstate.empty()) {
            err.details["sqlstate"] = sqlstate;
        }
        co_return std::unexpected(std::move(err));
    }
    co_return std::move(chosen);
}

std::expected<RowSet, GatewayError> PgConnection::to_rowset(const PGresult* res) const {
    RowSet rows;
    const ExecStatusType status = PQresultStatus(res);
    if (status == PGRES_COMMAND_OK || status == PGRES_EMPTY_QUERY) {
        rows.command_tag = PQcmdStatus(const_cast<PGresult*>(res));
        return rows;
    }
    if (status != PGRES_TUPLES_OK) {
        return std::unexpected(make_error(
            ErrorCode::kExecutionError,
            fmt::format("unexpected result status: {}", PQresStatus(status))));
    }

    const int ncols = PQnfields(res);
    const int nrows = PQntuples(res);
    rows.columns.reserve(static_cast<std::size_t>(ncols));
    for (int c = 0; c < ncols; ++c) {
        rows.columns.emplace_back(PQfname(res, c));
    }
    rows.rows.reserve(static_cast<std::size_t>(nrows));
    for (int r = 0; r < nrows; ++r) {
        Row row;
        row.reserve(static_cast<std::size_t>(ncols));
        for (int c = 0; c < ncols; ++c) {
            if (PQgetisnull(res, r, c) != 0) {
                row.emplace_back(std::nullopt);
            } else {
                row.emplace_back(std::string(PQgetvalue(res, r, c),
                                             static_cast<std::size_t>(PQgetlength(res, r, c))));
            }
        }
        rows.rows.push_back(std::move(row));
    }
    rows.command_tag = PQcmdStatus(const_cast<PGresult*>(res));
    return rows;
}

auto PgConnection::fetch(std::string sql, std::chrono::milliseconds timeout)
    -> boost::asio::awaitable<std::expected<RowSet, GatewayError>>
{
    auto res = co_await run(std::move(sql), timeout);
    if (!res) {
        co_return std::unexpected(res.error());
    }
    co_return to_rowset(res->get());
}

auto PgConnection::execute(std::string sql)
    -> boost::asio::awaitable<std::expected<std::string, GatewayError>>
{
    auto res = co_await run(std::move(sql), std::chrono::milliseconds{0});
    if (!res) {
        co_return std::unexpected(res.error());
    }
    co_return std::string(PQcmdStatus(res->get()));
}

auto PgConnection::fetch_readonly(std::string sql, std::chrono::milliseconds timeout)
    -> boost::asio::awaitable<std::expected<RowSet, GatewayError>>
{
    auto begin = co_await execute("BEGIN TRANSACTION READ ONLY");
    if (!begin) {
        co_return std::unexpected(begin.error());
    }

    std::expected<RowSet, GatewayError> result;
    if (timeout.count() > 0) {
        auto set = co_await execute(fmt::format("SET LOCAL statement_timeout = {}", timeout.count()));
        if (!set) {
            result = std::unexpected(set.error());
        }
    }
    if (result) {
        result = co_await fetch(std::move(sql), timeout);
    }

    if (!result) {
        if (!broken_) {
            auto rollback = co_await execute("ROLLBACK");
            if (!rollback) {
                spdlog::warn("pg_connection: rollback failed, discarding connection: {}",
                             rollback.error().message);
                broken_ = true;
            }
        }
        co_return std::move(result);
    }

    auto commit = co_await execute("COMMIT");
    if (!commit) {
        co_return std::unexpected(commit.error());
    }
    co_return std::move(result);
}

bool PgConnection::is_usable() const noexcept {
    return conn_ && !broken_ && PQstatus(conn_.get()) == CONNECTION_OK &&
           PQtransactionStatus(conn_.get()) == PQTRANS_IDLE;
}
