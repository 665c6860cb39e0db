// ---------------------------------------------------------------------------
// test_rate_limiter.cpp
//
// RateLimiter / RateLimitBucket 단위 테스트.
//
// [테스트 범위]
// - global/minute, global/hour, client/minute 버킷의 확인 순서와 거부 결과
// - 윈도우 경과 후 리셋 (주입한 시계로 시간 이동)
// - record_tokens: 한도와 관계없이 누적, 분당 잔여가 0 이면 allowed=false
// - cleanup_stale_buckets, status, client_key 의 세 가지 식별 방식
// - enabled=false 이면 항상 허용
// - 여러 스레드가 동시에 확인해도 한도만큼만 허용된다
// - to_error(): RATE_LIMIT_EXCEEDED 와 details
//
// [알려진 한계]
// - 뒤 단계(client) 에서 거부되어도 global 버킷 증가분은 남는다.
//   AdvancesGlobalCountEvenWhenClientRejects 가 이 동작을 고정한다.
// ---------------------------------------------------------------------------

#include "ratelimit/rate_limiter.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace {

using namespace std::chrono_literals;

// 테스트가 직접 움직이는 시계
struct ManualClock {
    std::chrono::system_clock::time_point now{std::chrono::system_clock::time_point{} + 1000h};

    RateLimiter::Clock fn() {
        return [this] { return now; };
    }
};

RateLimitConfig small_config() {
    RateLimitConfig cfg;
    cfg.requests_per_minute   = 5;
    cfg.requests_per_hour     = 8;
    cfg.per_client_per_minute = 3;
    cfg.tokens_per_minute     = 100;
    cfg.tokens_per_hour       = 1000;
    return cfg;
}

const std::optional<std::string> kIpA{"10.0.0.1"};
const std::optional<std::string> kIpB{"10.0.0.2"};
const std::optional<std::string> kNone{};

}  // namespace

// ---------------------------------------------------------------------------
// RateLimitBucket
// ---------------------------------------------------------------------------

TEST(RateLimitBucket, AllowsUpToLimitThenRejects) {
    RateLimitBucket bucket;
    const auto      now = std::chrono::system_clock::time_point{} + 10h;

    for (int i = 0; i < 3; ++i) {
        EXPECT_TRUE(bucket.check_and_increment(3, 60s, now).allowed);
    }
    const auto rejected = bucket.check_and_increment(3, 60s, now);
    EXPECT_FALSE(rejected.allowed);
    EXPECT_EQ(rejected.remaining, 0u);
    EXPECT_EQ(rejected.reset_at, now + 60s);
    EXPECT_EQ(bucket.count(), 3u);
}

TEST(RateLimitBucket, ResetsWhenWindowElapsed) {
    RateLimitBucket bucket;
    const auto      t0 = std::chrono::system_clock::time_point{} + 10h;

    EXPECT_TRUE(bucket.check_and_increment(1, 60s, t0).allowed);
    EXPECT_FALSE(bucket.check_and_increment(1, 60s, t0 + 59s).allowed);

    const auto after = bucket.check_and_increment(1, 60s, t0 + 60s);
    EXPECT_TRUE(after.allowed);
    EXPECT_EQ(after.reset_at, t0 + 120s);
}

TEST(RateLimitBucket, AddIgnoresLimit) {
    RateLimitBucket bucket;
    const auto      now = std::chrono::system_clock::time_point{} + 10h;
    EXPECT_EQ(bucket.add(70, 60s, now), 70u);
    EXPECT_EQ(bucket.add(70, 60s, now), 140u);
}

TEST(RateLimitBucket, ConcurrentCallersAdmitExactlyLimit) {
    constexpr int           kThreads   = 8;
    constexpr int           kPerThread = 50;
    constexpr std::uint64_t kLimit     = 37;

    RateLimitBucket   bucket;
    const auto        now = std::chrono::system_clock::time_point{} + 10h;
    std::atomic<int>  admitted{0};
    std::atomic<bool> go{false};

    std::vector<std::thread> threads;
    threads.reserve(kThreads);
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&] {
            while (!go.load()) {
                std::this_thread::yield();
            }
            for (int i = 0; i < kPerThread; ++i) {
                if (bucket.check_and_increment(kLimit, 60s, now).allowed) {
                    admitted.fetch_add(1);
                }
            }
        });
    }
    go.store(true);
    for (auto& th : threads) {
        th.join();
    }

    EXPECT_EQ(admitted.load(), static_cast<int>(kLimit));
    EXPECT_EQ(bucket.count(), kLimit);
}

// ---------------------------------------------------------------------------
// check_request
// ---------------------------------------------------------------------------

TEST(RateLimiter, RemainingCountsDown) {
    ManualClock clock;
    RateLimiter limiter(small_config(), clock.fn());

    const auto first = limiter.check_request(kIpA, kNone);
    EXPECT_TRUE(first.allowed);
    EXPECT_EQ(first.limit, 5u);
    EXPECT_EQ(first.remaining, 4u);
    EXPECT_EQ(first.reset_at, clock.now + 60s);
    EXPECT_FALSE(first.retry_after.has_value());

    const auto second = limiter.check_request(kIpB, kNone);
    EXPECT_EQ(second.remaining, 3u);
}

TEST(RateLimiter, ClientLimitRejectsOnlyThatClient) {
    ManualClock clock;
    RateLimiter limiter(small_config(), clock.fn());

    for (int i = 0; i < 3; ++i) {
        ASSERT_TRUE(limiter.check_request(kIpA, kNone).allowed);
    }
    const auto rejected = limiter.check_request(kIpA, kNone);
    EXPECT_FALSE(rejected.allowed);
    EXPECT_EQ(rejected.scope, RateLimitScope::kClient);
    EXPECT_EQ(rejected.limit, 3u);
    EXPECT_EQ(rejected.window, "minute");
    ASSERT_TRUE(rejected.retry_after.has_value());
    EXPECT_EQ(*rejected.retry_after, std::chrono::milliseconds{60s});

    EXPECT_TRUE(limiter.check_request(kIpB, kNone).allowed);
}

TEST(RateLimiter, ConcurrentRequestsFromOneClientAdmitClientLimit) {
    ManualClock     clock;
    RateLimitConfig cfg = small_config();
    cfg.requests_per_minute = 1000;
    cfg.requests_per_hour   = 1000;
    RateLimiter limiter(cfg, clock.fn());

    std::atomic<int>         admitted{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 6; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < 20; ++i) {
                if (limiter.check_request(kIpA, kNone).allowed) {
                    admitted.fetch_add(1);
                }
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }
    EXPECT_EQ(admitted.load(), 3);
}

TEST(RateLimiter, GlobalMinuteLimitAppliesAcrossClients) {
    ManualClock clock;
    auto        cfg = small_config();
    cfg.per_client_per_minute = 100;
    RateLimiter limiter(cfg, clock.fn());

    for (int i = 0; i < 5; ++i) {
        const std::optional<std::string> ip = "10.0.1." + std::to_string(i);
        ASSERT_TRUE(limiter.check_request(ip, kNone).allowed);
    }
    clock.now += 15s;
    const auto rejected = limiter.check_request(std::optional<std::string>{"10.0.9.9"}, kNone);
    EXPECT_FALSE(rejected.allowed);
    EXPECT_EQ(rejected.scope, RateLimitScope::kGlobal);
    EXPECT_EQ(rejected.window, "minute");
    ASSERT_TRUE(rejected.retry_after.has_value());
    EXPECT_EQ(*rejected.retry_after, std::chrono::milliseconds{45s});
}

TEST(RateLimiter, HourLimitSurvivesMinuteReset) {
    ManualClock clock;
    auto        cfg = small_config();
    cfg.per_client_per_minute = 100;
    RateLimiter limiter(cfg, clock.fn());

    // 분당 5, 시간당 8
    for (int i = 0; i < 5; ++i) {
        ASSERT_TRUE(limiter.check_request(kIpA, kNone).allowed);
    }
    clock.now += 61s;
    for (int i = 0; i < 3; ++i) {
        ASSERT_TRUE(limiter.check_request(kIpA, kNone).allowed);
    }
    const auto rejected = limiter.check_request(kIpA, kNone);
    EXPECT_FALSE(rejected.allowed);
    EXPECT_EQ(rejected.scope, RateLimitScope::kGlobal);
    EXPECT_EQ(rejected.window, "hour");
    EXPECT_EQ(rejected.limit, 8u);
}

TEST(RateLimiter, ClientWindowResetsAfterMinute) {
    ManualClock clock;
    RateLimiter limiter(small_config(), clock.fn());

    for (int i = 0; i < 3; ++i) {
        ASSERT_TRUE(limiter.check_request(kIpA, kNone).allowed);
    }
    ASSERT_FALSE(limiter.check_request(kIpA, kNone).allowed);

    clock.now += 60s;
    EXPECT_TRUE(limiter.check_request(kIpA, kNone).allowed);
}

TEST(RateLimiter, AdvancesGlobalCountEvenWhenClientRejects) {
    ManualClock clock;
    RateLimiter limiter(small_config(), clock.fn());

    for (int i = 0; i < 4; ++i) {
        (void)limiter.check_request(kIpA, kNone);
    }
    // 4번째 요청은 client 에서 거부되었지만 global 은 4
    EXPECT_EQ(limiter.status().global_minute_count, 4u);
    EXPECT_EQ(limiter.status().global_minute_remaining, 1u);
}

TEST(RateLimiter, DisabledAlwaysAllows) {
    ManualClock clock;
    auto        cfg = small_config();
    cfg.enabled = false;
    RateLimiter limiter(cfg, clock.fn());

    for (int i = 0; i < 50; ++i) {
        ASSERT_TRUE(limiter.check_request(kIpA, kNone).allowed);
    }
    EXPECT_TRUE(limiter.record_tokens(1'000'000).allowed);

    const auto s = limiter.status();
    EXPECT_FALSE(s.enabled);
    EXPECT_EQ(s.global_minute_count, 0u);
    EXPECT_EQ(s.client_buckets, 0u);
}

// ---------------------------------------------------------------------------
// record_tokens
// ---------------------------------------------------------------------------

TEST(RateLimiter, RecordTokensAccumulates) {
    ManualClock clock;
    RateLimiter limiter(small_config(), clock.fn());

    const auto first = limiter.record_tokens(40);
    EXPECT_TRUE(first.allowed);
    EXPECT_EQ(first.remaining, 60u);
    EXPECT_EQ(first.scope, RateLimitScope::kTokens);

    const auto second = limiter.record_tokens(70);
    EXPECT_FALSE(second.allowed);
    EXPECT_EQ(second.remaining, 0u);

    const auto s = limiter.status();
    EXPECT_EQ(s.token_minute_count, 110u);
    EXPECT_EQ(s.token_hour_count, 110u);
    EXPECT_EQ(s.token_hour_remaining, 890u);
}

TEST(RateLimiter, TokenMinuteWindowResets) {
    ManualClock clock;
    RateLimiter limiter(small_config(), clock.fn());

    ASSERT_FALSE(limiter.record_tokens(100).allowed);
    clock.now += 60s;
    const auto after = limiter.record_tokens(10);
    EXPECT_TRUE(after.allowed);
    EXPECT_EQ(after.remaining, 90u);
    // 시간 버킷은 계속 누적
    EXPECT_EQ(limiter.status().token_hour_count, 110u);
}

// ---------------------------------------------------------------------------
// cleanup / status
// ---------------------------------------------------------------------------

TEST(RateLimiter, CleanupRemovesOnlyStaleClients) {
    ManualClock clock;
    RateLimiter limiter(small_config(), clock.fn());

    (void)limiter.check_request(kIpA, kNone);
    clock.now += 2h;
    (void)limiter.check_request(kIpB, kNone);
    ASSERT_EQ(limiter.status().client_buckets, 2u);

    EXPECT_EQ(limiter.cleanup_stale_buckets(), 1u);
    EXPECT_EQ(limiter.status().client_buckets, 1u);
    EXPECT_EQ(limiter.cleanup_stale_buckets(), 0u);
}

// ---------------------------------------------------------------------------
// client_key
// ---------------------------------------------------------------------------

TEST(RateLimiter, ClientKeyAutoPrefersIp) {
    RateLimiter limiter(small_config());
    EXPECT_EQ(limiter.client_key(kIpA, std::optional<std::string>{"s1"}), "ip:10.0.0.1");
    EXPECT_EQ(limiter.client_key(kNone, std::optional<std::string>{"s1"}), "session:s1");
    EXPECT_EQ(limiter.client_key(std::optional<std::string>{""}, kNone), "unknown");
    EXPECT_EQ(limiter.client_key(kNone, kNone), "unknown");
}

TEST(RateLimiter, ClientKeyExplicitModes) {
    auto by_ip = small_config();
    by_ip.client_identifier = ClientIdentifier::kIp;
    RateLimiter ip_limiter(by_ip);
    EXPECT_EQ(ip_limiter.client_key(kNone, std::optional<std::string>{"s1"}), "ip:unknown");

    auto by_session = small_config();
    by_session.client_identifier = ClientIdentifier::kSession;
    RateLimiter session_limiter(by_session);
    EXPECT_EQ(session_limiter.client_key(kIpA, std::optional<std::string>{"s1"}), "session:s1");
    EXPECT_EQ(session_limiter.client_key(kIpA, kNone), "session:unknown");
}

TEST(RateLimiter, SessionModeSharesBucketAcrossIps) {
    ManualClock clock;
    auto        cfg = small_config();
    cfg.client_identifier = ClientIdentifier::kSession;
    RateLimiter limiter(cfg, clock.fn());

    const std::optional<std::string> session{"agent-7"};
    ASSERT_TRUE(limiter.check_request(kIpA, session).allowed);
    ASSERT_TRUE(limiter.check_request(kIpB, session).allowed);
    ASSERT_TRUE(limiter.check_request(kIpA, session).allowed);
    EXPECT_FALSE(limiter.check_request(kIpB, session).allowed);
    EXPECT_EQ(limiter.status().client_buckets, 1u);
}

// ---------------------------------------------------------------------------
// to_error
// ---------------------------------------------------------------------------

TEST(RateLimitResult, ToErrorCarriesDetails) {
    RateLimitResult result;
    result.allowed     = false;
    result.limit       = 20;
    result.window      = "minute";
    result.scope       = RateLimitScope::kClient;
    result.retry_after = std::chrono::milliseconds{12500};

    const GatewayError err = result.to_error();
    EXPECT_EQ(err.code, ErrorCode::kRateLimitExceeded);
    EXPECT_EQ(err.message, "Rate limit exceeded (client): 20 requests per minute. Retry after 12.5s");
    EXPECT_EQ(err.details.at("window"), "minute");
    EXPECT_EQ(err.details.at("retry_after"), "12.5");
    EXPECT_EQ(err.details.at("scope"), "client");
    EXPECT_EQ(err.details.at("limit"), "20");
}
