#pragma once

// ---------------------------------------------------------------------------
// async_mutex.hpp
//
// 코루틴용 상호 배제 락. 대기 중인 코루틴은 스레드를 막지 않고 일시 중단된다.
//
// [동작]
// - lock() 은 락을 얻을 때까지 co_await 되며, 이동 전용 Lock 을 반환한다.
//   Lock 이 소멸되면 unlock 된다.
// - 대기자는 FIFO 로 깨어난다. unlock 은 락을 풀지 않고 다음 대기자에게
//   소유권을 직접 넘긴다 (깨어난 대기자와 새 lock() 호출자 간 경쟁 없음).
// - 깨우기는 대기자 타이머의 만료 시각을 과거로 바꾸는 방식이다.
//   async_wait 가 시작되기 전에 깨우기가 먼저 도착해도 대기가 즉시 완료된다.
//
// [알려진 한계]
// - 대기 중인 코루틴이 io_context 종료로 파괴되면 해당 대기자는 큐에 남는다.
//   종료 중이므로 이후 lock() 은 호출되지 않는다고 가정한다.
// ---------------------------------------------------------------------------

#include <deque>
#include <memory>
#include <mutex>
#include <utility>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

class AsyncMutex {
public:
    class Lock {
    public:
        Lock() = default;
        explicit Lock(AsyncMutex* owner) noexcept : owner_{owner} {}

        ~Lock() { release(); }

        Lock(const Lock&)            = delete;
        Lock& operator=(const Lock&) = delete;

        Lock(Lock&& other) noexcept : owner_{other.owner_} { other.owner_ = nullptr; }
        Lock& operator=(Lock&& other) noexcept {
            if (this != &other) {
                release();
                owner_       = other.owner_;
                other.owner_ = nullptr;
            }
            return *this;
        }

        [[nodiscard]] bool owns_lock() const noexcept { return owner_ != nullptr; }

        void release() noexcept {
            if (owner_ != nullptr) {
                owner_->unlock();
                owner_ = nullptr;
            }
        }

    private:
        AsyncMutex* owner_{nullptr};
    };

    AsyncMutex() = default;
    ~AsyncMutex() = default;

    AsyncMutex(const AsyncMutex&)            = delete;
    AsyncMutex& operator=(const AsyncMutex&) = delete;
    AsyncMutex(AsyncMutex&&)                 = delete;
    AsyncMutex& operator=(AsyncMutex&&)      = delete;

    auto lock() -> boost::asio::awaitable<Lock> {
        auto executor = co_await boost::asio::this_coro::executor;

        std::shared_ptr<boost::asio::steady_timer> waiter;
        {
            std::lock_guard<std::mutex> guard(mutex_);
            if (!locked_) {
                locked_ = true;
            } else {
                waiter = std::make_shared<boost::asio::steady_timer>(
                    executor, boost::asio::steady_timer::time_point::max());
                waiters_.push_back(waiter);
            }
        }

        if (waiter) {
            boost::system::error_code ec;
            co_await waiter->async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
            // 소유권은 unlock() 에서 이미 넘겨받았다 (locked_ 는 true 유지)
        }
        co_return Lock{this};
    }

    [[nodiscard]] bool is_locked() const {
        std::lock_guard<std::mutex> guard(mutex_);
        return locked_;
    }

private:
    void unlock() noexcept {
        std::lock_guard<std::mutex> guard(mutex_);
        if (waiters_.empty()) {
            locked_ = false;
            return;
        }
        auto next = std::move(waiters_.front());
        waiters_.pop_front();
        next->expires_at(boost::asio::steady_timer::time_point::min());
    }

    mutable std::mutex                                      mutex_;
    bool                                                    locked_{false};
    std::deque<std::shared_ptr<boost::asio::steady_timer>>  waiters_;
};
