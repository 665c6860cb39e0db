#pragma once

// ---------------------------------------------------------------------------
// gather.hpp
//
// 여러 awaitable<T> 를 같은 executor 위에서 동시에 실행하고,
// 모두 끝나면 입력 순서대로 결과를 반환한다.
//
// 작업 하나가 예외로 끝나도 나머지 작업은 끝까지 실행된다.
// 모든 작업이 끝난 뒤 첫 번째 예외를 호출자에게 다시 던진다.
// 오류를 값(std::expected)으로 반환하는 작업에는 예외가 발생하지 않는다.
// ---------------------------------------------------------------------------

#include <cstddef>
#include <exception>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

template <typename T>
auto gather(std::vector<boost::asio::awaitable<T>> tasks) -> boost::asio::awaitable<std::vector<T>> {
    auto executor = co_await boost::asio::this_coro::executor;

    struct State {
        explicit State(boost::asio::any_io_executor ex, std::size_t n)
            : results(n), remaining{n}, done{ex, boost::asio::steady_timer::time_point::max()} {}

        std::vector<std::optional<T>> results;
        std::size_t                   remaining;
        boost::asio::steady_timer     done;
        std::exception_ptr            error{};
    };

    auto state = std::make_shared<State>(executor, tasks.size());

    for (std::size_t i = 0; i < tasks.size(); ++i) {
        boost::asio::co_spawn(
            executor, std::move(tasks[i]),
            [state, i](std::exception_ptr e, T value) {
                if (e) {
                    if (!state->error) {
                        state->error = e;
                    }
                } else {
                    state->results[i] = std::move(value);
                }
                if (--state->remaining == 0) {
                    state->done.expires_at(boost::asio::steady_timer::time_point::min());
                }
            });
    }

    if (state->remaining > 0) {
        boost::system::error_code ec;
        co_await state->done.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    }

    if (state->error) {
        std::rethrow_exception(state->error);
    }

    std::vector<T> results;
    results.reserve(state->results.size());
    for (auto& r : state->results) {
        results.push_back(std::move(*r));
    }
    co_return results;
}
