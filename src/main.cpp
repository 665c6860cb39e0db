#include "config/config_loader.hpp"
#include "gateway/gateway_context.hpp"
#include "gateway/query_gateway.hpp"
#include "gateway/response_json.hpp"
#include "logger/log_setup.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/streambuf.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <unistd.h>

#include <charconv>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// pggate
//
//   pggate [options] <database> <sql> [question]   쿼리 1건 실행
//   pggate [options] --stdin <database>            표준 입력 한 줄 = 쿼리 1건
//
//   --config <path>      설정 파일 (기본: $PGGATE_CONFIG, 없으면 config/pggate.yaml)
//   --limit <n>          최대 반환 행 수 (server.max_result_rows 이하로 제한)
//   --client-ip <addr>   속도 제한/감사용 클라이언트 주소
//   --session <id>       속도 제한/감사용 세션 ID
//   --warm-up            시작 시 풀을 min_pool_size 까지 채운다
//
// 결과는 stdout 에 JSON 한 줄, 진단 로그는 stderr.
// 종료 코드: 0 성공, 1 쿼리 실패, 2 사용법/설정 오류
// ---------------------------------------------------------------------------

namespace {

constexpr int kExitOk          = 0;
constexpr int kExitQueryFailed = 1;
constexpr int kExitUsage       = 2;

constexpr std::chrono::seconds kBucketSweepInterval{60};

std::string env_str(const char* name, std::string default_val) {
    const char* val = std::getenv(name);  // NOLINT(concurrency-mt-unsafe)
    if (val != nullptr && val[0] != '\0') {
        return val;
    }
    return default_val;
}

struct Options {
    std::string                  config_path{};
    std::optional<std::uint64_t> limit{};
    std::optional<std::string>   client_ip{};
    std::optional<std::string>   session_id{};
    bool                         stdin_mode{false};
    bool                         warm_up{false};
    std::vector<std::string>     positional{};
};

void print_usage() {
    std::fprintf(stderr,
                 "usage: pggate [--config path] [--limit n] [--client-ip addr] [--session id] [--warm-up]\n"
                 "              <database> <sql> [question]\n"
                 "       pggate [--config path] [--warm-up] --stdin <database>\n");
}

std::optional<Options> parse_args(int argc, char* argv[]) {
    Options opts;
    opts.config_path = env_str("PGGATE_CONFIG", "config/pggate.yaml");

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        const auto next = [&]() -> std::optional<std::string> {
            if (i + 1 >= argc) {
                std::fprintf(stderr, "pggate: %s requires a value\n", arg.c_str());
                return std::nullopt;
            }
            return std::string(argv[++i]);
        };

        if (arg == "--config") {
            auto v = next();
            if (!v) return std::nullopt;
            opts.config_path = *v;
        } else if (arg == "--limit") {
            auto v = next();
            if (!v) return std::nullopt;
            std::uint64_t n{0};
            auto [ptr, ec] = std::from_chars(v->data(), v->data() + v->size(), n);
            if (ec != std::errc{} || ptr != v->data() + v->size() || n == 0) {
                std::fprintf(stderr, "pggate: --limit must be a positive integer\n");
                return std::nullopt;
            }
            opts.limit = n;
        } else if (arg == "--client-ip") {
            auto v = next();
            if (!v) return std::nullopt;
            opts.client_ip = *v;
        } else if (arg == "--session") {
            auto v = next();
            if (!v) return std::nullopt;
            opts.session_id = *v;
        } else if (arg == "--stdin") {
            opts.stdin_mode = true;
        } else if (arg == "--warm-up") {
            opts.warm_up = true;
        } else if (arg == "-h" || arg == "--help") {
            return std::nullopt;
        } else if (arg.starts_with("--")) {
            std::fprintf(stderr, "pggate: unknown option %s\n", arg.c_str());
            return std::nullopt;
        } else {
            opts.positional.push_back(arg);
        }
    }

    if (opts.stdin_mode ? opts.positional.size() != 1
                        : (opts.positional.size() < 2 || opts.positional.size() > 3)) {
        return std::nullopt;
    }
    return opts;
}

QueryRequest make_request(const Options& opts, std::string database, std::string sql,
                          std::optional<std::string> question, std::uint64_t seq) {
    QueryRequest request;
    request.database           = std::move(database);
    request.sql                = std::move(sql);
    request.question           = std::move(question);
    request.limit              = opts.limit;
    request.context.request_id = fmt::format("cli-{}-{}", ::getpid(), seq);
    request.context.client_ip  = opts.client_ip;
    request.context.session_id = opts.session_id;
    request.context.user_agent = "pggate-cli";
    return request;
}

void print_response(const std::expected<QueryResult, GatewayError>& response) {
    const std::string line = response ? to_json(*response) : to_json(response.error());
    std::fwrite(line.data(), 1, line.size(), stdout);
    std::fputc('\n', stdout);
    std::fflush(stdout);
}

// ---------------------------------------------------------------------------
// 한 건 실행
// ---------------------------------------------------------------------------
auto run_once(GatewayContext& ctx, Options opts) -> boost::asio::awaitable<int> {
    if (opts.warm_up) {
        if (auto warmed = co_await ctx.warm_up(); !warmed) {
            print_response(std::unexpected(warmed.error()));
            co_return kExitQueryFailed;
        }
    }

    std::optional<std::string> question;
    if (opts.positional.size() == 3) {
        question = opts.positional[2];
    }
    auto response = co_await handle_query(
        ctx, make_request(opts, opts.positional[0], opts.positional[1], std::move(question), 1));
    print_response(response);
    co_return response ? kExitOk : kExitQueryFailed;
}

// ---------------------------------------------------------------------------
// 표준 입력 모드
//   빈 줄과 '#' 로 시작하는 줄은 건너뛴다.
//   표준 입력이 일반 파일이면 (epoll 불가) 동기 getline 으로 읽는다.
// ---------------------------------------------------------------------------
auto sweep_buckets(RateLimiter& limiter, std::shared_ptr<boost::asio::steady_timer> timer)
    -> boost::asio::awaitable<void>
{
    for (;;) {
        timer->expires_after(kBucketSweepInterval);
        boost::system::error_code ec;
        co_await timer->async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        if (ec) {
            co_return;
        }
        limiter.cleanup_stale_buckets();
    }
}

auto run_stdin(GatewayContext& ctx, Options opts) -> boost::asio::awaitable<int> {
    auto executor = co_await boost::asio::this_coro::executor;

    if (opts.warm_up) {
        if (auto warmed = co_await ctx.warm_up(); !warmed) {
            spdlog::warn("pggate: warm-up failed, connections will be opened on demand");
        }
    }

    auto sweep_timer = std::make_shared<boost::asio::steady_timer>(executor);
    boost::asio::co_spawn(executor, sweep_buckets(ctx.rate_limiter(), sweep_timer), boost::asio::detached);

    boost::asio::posix::stream_descriptor input(executor);
    bool async_input = false;
    if (const int fd = ::dup(STDIN_FILENO); fd >= 0) {
        boost::system::error_code ec;
        input.assign(fd, ec);
        if (ec) {
            ::close(fd);
        } else {
            async_input = true;
        }
    }

    boost::asio::streambuf buffer;
    std::uint64_t          seq = 0;
    for (;;) {
        std::string line;
        if (async_input) {
            boost::system::error_code ec;
            const std::size_t n = co_await boost::asio::async_read_until(
                input, buffer, '\n', boost::asio::redirect_error(boost::asio::use_awaitable, ec));
            if (ec && buffer.size() == 0) {
                if (ec != boost::asio::error::eof) {
                    spdlog::error("pggate: stdin read failed: {}", ec.message());
                }
                break;
            }
            std::istream stream(&buffer);
            std::getline(stream, line);
            (void)n;
        } else if (!std::getline(std::cin, line)) {
            break;
        }

        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty() || line.front() == '#') {
            continue;
        }

        auto response = co_await handle_query(ctx, make_request(opts, opts.positional[0], std::move(line),
                                                                std::nullopt, ++seq));
        print_response(response);
    }

    sweep_timer->cancel();
    spdlog::info("pggate: stdin closed after {} requests", seq);
    co_return kExitOk;
}

} // namespace

// ---------------------------------------------------------------------------
// main
// ---------------------------------------------------------------------------
int main(int argc, char* argv[]) {
    const auto opts = parse_args(argc, argv);
    if (!opts) {
        print_usage();
        return kExitUsage;
    }

    // ── 설정 로드 ───────────────────────────────────────────────────────
    auto config = ConfigLoader::load(opts->config_path);
    if (!config) {
        std::fprintf(stderr, "pggate: %s\n", config.error().c_str());
        return kExitUsage;
    }
    config->logging.level = env_str("PGGATE_LOG_LEVEL", config->logging.level);

    // ── 로깅 초기화 ─────────────────────────────────────────────────────
    if (auto logging = init_logging(config->logging); !logging) {
        std::fprintf(stderr, "pggate: %s\n", logging.error().c_str());
        return kExitUsage;
    }

    // ── 실행 ────────────────────────────────────────────────────────────
    boost::asio::io_context ioc;
    int exit_code = kExitOk;
    {
        GatewayContext ctx{std::move(*config), ioc.get_executor()};

        boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait([&ioc](const boost::system::error_code& ec, int signo) {
            if (!ec) {
                spdlog::info("pggate: signal {} received, stopping", signo);
                ioc.stop();
            }
        });

        auto task = opts->stdin_mode ? run_stdin(ctx, *opts) : run_once(ctx, *opts);
        boost::asio::co_spawn(ioc, std::move(task), [&](std::exception_ptr e, int code) {
            if (e) {
                try {
                    std::rethrow_exception(e);
                } catch (const std::exception& ex) {
                    spdlog::error("pggate: unexpected exception: {}", ex.what());
                }
                exit_code = kExitQueryFailed;
            } else {
                exit_code = code;
            }
            signals.cancel();
            ctx.close();
        });

        ioc.run();
    }

    spdlog::shutdown();
    return exit_code;
}
