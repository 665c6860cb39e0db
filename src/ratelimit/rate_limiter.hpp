#pragma once

// ---------------------------------------------------------------------------
// rate_limiter.hpp
//
// 고정 윈도우 기반 요청/토큰 속도 제한기.
//
// [버킷 구성]
// - global/minute, global/hour   : 전체 요청 수
// - client/minute                : 클라이언트 키별 요청 수
// - tokens/minute, tokens/hour   : 상위 LLM 호출이 소비한 토큰 수
//
// [스레드 안전성]
// - 버킷마다 mutex 를 하나씩 가진다. 윈도우 리셋, 한도 확인, 증가는
//   하나의 임계 구역에서 수행한다.
// - 클라이언트 버킷 맵은 별도 mutex 로 보호하며, 버킷은 shared_ptr 로
//   꺼낸 뒤 맵 락을 놓고 갱신한다.
//
// [알려진 한계]
// - 고정 윈도우이므로 윈도우 경계 직전/직후에 최대 2배까지 몰릴 수 있다.
// - check_request 에서 뒤 단계가 거부해도 앞 단계 버킷의 증가분은
//   되돌리지 않는다.
// - 상태는 프로세스 메모리에만 있다. 재시작하면 초기화된다.
// ---------------------------------------------------------------------------

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include "common/types.hpp"

// ---------------------------------------------------------------------------
// ClientIdentifier
//   kIp      : "ip:<addr>"      (주소가 없으면 "ip:unknown")
//   kSession : "session:<id>"   (세션이 없으면 "session:unknown")
//   kAuto    : IP 가 있으면 IP, 없으면 세션, 둘 다 없으면 "unknown"
// ---------------------------------------------------------------------------
enum class ClientIdentifier : std::uint8_t {
    kIp      = 0,
    kSession = 1,
    kAuto    = 2,
};

struct RateLimitConfig {
    bool             enabled{true};
    std::uint64_t    requests_per_minute{60};
    std::uint64_t    requests_per_hour{1000};
    std::uint64_t    per_client_per_minute{20};
    std::uint64_t    tokens_per_minute{100000};
    std::uint64_t    tokens_per_hour{1000000};
    ClientIdentifier client_identifier{ClientIdentifier::kAuto};
};

enum class RateLimitScope : std::uint8_t {
    kGlobal = 0,
    kClient = 1,
    kTokens = 2,
};

[[nodiscard]] std::string_view scope_name(RateLimitScope scope) noexcept;

// ---------------------------------------------------------------------------
// RateLimitResult
//   retry_after 는 거부된 경우에만 채워진다.
//   window 는 "minute" 또는 "hour".
// ---------------------------------------------------------------------------
struct RateLimitResult {
    bool                                   allowed{true};
    std::uint64_t                          limit{0};
    std::uint64_t                          remaining{0};
    std::chrono::system_clock::time_point  reset_at{};
    std::optional<std::chrono::milliseconds> retry_after{};
    std::string                            window{"minute"};
    RateLimitScope                         scope{RateLimitScope::kGlobal};

    // RATE_LIMIT_EXCEEDED, details = {window, retry_after(초), scope, limit}
    [[nodiscard]] GatewayError to_error() const;
};

struct RateLimitStatus {
    bool          enabled{true};
    std::uint64_t global_minute_count{0};
    std::uint64_t global_minute_remaining{0};
    std::uint64_t global_hour_count{0};
    std::uint64_t global_hour_remaining{0};
    std::uint64_t token_minute_count{0};
    std::uint64_t token_minute_remaining{0};
    std::uint64_t token_hour_count{0};
    std::uint64_t token_hour_remaining{0};
    std::size_t   client_buckets{0};
};

// ---------------------------------------------------------------------------
// RateLimitBucket
//   고정 윈도우 카운터 하나. now >= reset_at 이면 먼저 (0, now + window) 로
//   리셋한 뒤 확인/증가한다.
// ---------------------------------------------------------------------------
class RateLimitBucket {
public:
    using TimePoint = std::chrono::system_clock::time_point;

    struct Outcome {
        bool          allowed{false};
        std::uint64_t remaining{0};
        TimePoint     reset_at{};
    };

    RateLimitBucket() = default;

    RateLimitBucket(const RateLimitBucket&)            = delete;
    RateLimitBucket& operator=(const RateLimitBucket&) = delete;
    RateLimitBucket(RateLimitBucket&&)                 = delete;
    RateLimitBucket& operator=(RateLimitBucket&&)      = delete;

    // count < limit 이면 1 증가 후 allowed
    [[nodiscard]] Outcome check_and_increment(std::uint64_t limit, std::chrono::seconds window, TimePoint now);

    // 한도와 관계없이 n 만큼 증가. 증가 후 count 를 반환한다.
    std::uint64_t add(std::uint64_t n, std::chrono::seconds window, TimePoint now);

    [[nodiscard]] std::uint64_t count() const;
    [[nodiscard]] TimePoint     reset_at() const;

private:
    void roll(std::chrono::seconds window, TimePoint now);

    mutable std::mutex mutex_;
    std::uint64_t      count_{0};
    TimePoint          reset_at_{};
};

class RateLimiter {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    static constexpr std::chrono::seconds kMinute{60};
    static constexpr std::chrono::seconds kHour{3600};

    explicit RateLimiter(RateLimitConfig config, Clock clock = &std::chrono::system_clock::now);

    ~RateLimiter() = default;

    RateLimiter(const RateLimiter&)            = delete;
    RateLimiter& operator=(const RateLimiter&) = delete;
    RateLimiter(RateLimiter&&)                 = delete;
    RateLimiter& operator=(RateLimiter&&)      = delete;

    // global/minute → global/hour → client/minute 순으로 확인하고
    // 처음 거부된 버킷의 결과를 반환한다.
    [[nodiscard]] RateLimitResult check_request(const std::optional<std::string>& client_ip,
                                                const std::optional<std::string>& session_id);

    // 두 토큰 버킷을 무조건 증가시킨다.
    // allowed = 분당 남은 토큰이 0 보다 큰지.
    RateLimitResult record_tokens(std::uint64_t tokens);

    // reset_at 이 now - max_age 보다 이전인 클라이언트 버킷을 제거한다.
    std::size_t cleanup_stale_buckets(std::chrono::seconds max_age = kHour);

    [[nodiscard]] RateLimitStatus status() const;

    [[nodiscard]] std::string client_key(const std::optional<std::string>& client_ip,
                                         const std::optional<std::string>& session_id) const;

    [[nodiscard]] const RateLimitConfig& config() const noexcept { return config_; }

private:
    [[nodiscard]] std::shared_ptr<RateLimitBucket> client_bucket(const std::string& key);

    [[nodiscard]] RateLimitResult rejected(std::uint64_t limit, RateLimitBucket::TimePoint reset_at,
                                           std::string window, RateLimitScope scope,
                                           RateLimitBucket::TimePoint now) const;

    RateLimitConfig config_;
    Clock           clock_;

    RateLimitBucket global_minute_;
    RateLimitBucket global_hour_;
    RateLimitBucket token_minute_;
    RateLimitBucket token_hour_;

    mutable std::mutex                                      clients_mutex_;
    std::map<std::string, std::shared_ptr<RateLimitBucket>> clients_{};
};
