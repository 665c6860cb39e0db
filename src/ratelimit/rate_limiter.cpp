#include "ratelimit/rate_limiter.hpp"

#include <algorithm>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

std::string_view scope_name(RateLimitScope scope) noexcept {
    switch (scope) {
        case RateLimitScope::kGlobal: return "global";
        case RateLimitScope::kClient: return "client";
        case RateLimitScope::kTokens: return "tokens";
    }
    return "global";
}

GatewayError RateLimitResult::to_error() const {
    const double retry_sec = retry_after
        ? std::chrono::duration<double>(*retry_after).count()
        : 0.0;
    auto err = make_error(
        ErrorCode::kRateLimitExceeded,
        fmt::format("Rate limit exceeded ({}): {} requests per {}. Retry after {:.1f}s",
                    scope_name(scope), limit, window, retry_sec));
    err.details["window"]      = window;
    err.details["retry_after"] = fmt::format("{:.1f}", retry_sec);
    err.details["scope"]       = std::string(scope_name(scope));
    err.details["limit"]       = std::to_string(limit);
    return err;
}

// ---------------------------------------------------------------------------
// RateLimitBucket
// ---------------------------------------------------------------------------

void RateLimitBucket::roll(std::chrono::seconds window, TimePoint now) {
    if (now >= reset_at_) {
        count_    = 0;
        reset_at_ = now + window;
    }
}

RateLimitBucket::Outcome RateLimitBucket::check_and_increment(std::uint64_t        limit,
                                                              std::chrono::seconds window,
                                                              TimePoint            now) {
    std::lock_guard<std::mutex> guard(mutex_);
    roll(window, now);
    if (count_ >= limit) {
        return Outcome{.allowed = false, .remaining = 0, .reset_at = reset_at_};
    }
    ++count_;
    return Outcome{.allowed = true, .remaining = limit - count_, .reset_at = reset_at_};
}

std::uint64_t RateLimitBucket::add(std::uint64_t n, std::chrono::seconds window, TimePoint now) {
    std::lock_guard<std::mutex> guard(mutex_);
    roll(window, now);
    count_ += n;
    return count_;
}

std::uint64_t RateLimitBucket::count() const {
    std::lock_guard<std::mutex> guard(mutex_);
    return count_;
}

RateLimitBucket::TimePoint RateLimitBucket::reset_at() const {
    std::lock_guard<std::mutex> guard(mutex_);
    return reset_at_;
}

// ---------------------------------------------------------------------------
// RateLimiter
// ---------------------------------------------------------------------------

RateLimiter::RateLimiter(RateLimitConfig config, Clock clock)
    : config_{config}, clock_{std::move(clock)} {
    spdlog::info("rate_limiter: enabled={} rpm={} rph={} per_client_rpm={} tpm={} tph={}",
                 config_.enabled, config_.requests_per_minute, config_.requests_per_hour,
                 config_.per_client_per_minute, config_.tokens_per_minute, config_.tokens_per_hour);
}

std::string RateLimiter::client_key(const std::optional<std::string>& client_ip,
                                    const std::optional<std::string>& session_id) const {
    const bool has_ip      = client_ip && !client_ip->empty();
    const bool has_session = session_id && !session_id->empty();
    switch (config_.client_identifier) {
        case ClientIdentifier::kIp:
            return "ip:" + (has_ip ? *client_ip : std::string("unknown"));
        case ClientIdentifier::kSession:
            return "session:" + (has_session ? *session_id : std::string("unknown"));
        case ClientIdentifier::kAuto:
            break;
    }
    if (has_ip) {
        return "ip:" + *client_ip;
    }
    if (has_session) {
        return "session:" + *session_id;
    }
    return "unknown";
}

std::shared_ptr<RateLimitBucket> RateLimiter::client_bucket(const std::string& key) {
    std::lock_guard<std::mutex> guard(clients_mutex_);
    auto& slot = clients_[key];
    if (!slot) {
        slot = std::make_shared<RateLimitBucket>();
    }
    return slot;
}

RateLimitResult RateLimiter::rejected(std::uint64_t limit, RateLimitBucket::TimePoint reset_at,
                                      std::string window, RateLimitScope scope,
                                      RateLimitBucket::TimePoint now) const {
    const auto wait = std::max(std::chrono::duration_cast<std::chrono::milliseconds>(reset_at - now),
                               std::chrono::milliseconds{0});
    return RateLimitResult{
        .allowed     = false,
        .limit       = limit,
        .remaining   = 0,
        .reset_at    = reset_at,
        .retry_after = wait,
        .window      = std::move(window),
        .scope       = scope,
    };
}

RateLimitResult RateLimiter::check_request(const std::optional<std::string>& client_ip,
                                           const std::optional<std::string>& session_id) {
    const auto now = clock_();
    if (!config_.enabled) {
        return RateLimitResult{
            .allowed   = true,
            .limit     = config_.requests_per_minute,
            .remaining = config_.requests_per_minute,
            .reset_at  = now + kMinute,
        };
    }

    const auto minute = global_minute_.check_and_increment(config_.requests_per_minute, kMinute, now);
    if (!minute.allowed) {
        spdlog::warn("rate_limiter: global limit exceeded (limit={} per minute)", config_.requests_per_minute);
        return rejected(config_.requests_per_minute, minute.reset_at, "minute", RateLimitScope::kGlobal, now);
    }

    const auto hour = global_hour_.check_and_increment(config_.requests_per_hour, kHour, now);
    if (!hour.allowed) {
        spdlog::warn("rate_limiter: global limit exceeded (limit={} per hour)", config_.requests_per_hour);
        return rejected(config_.requests_per_hour, hour.reset_at, "hour", RateLimitScope::kGlobal, now);
    }

    const std::string key    = client_key(client_ip, session_id);
    const auto        bucket = client_bucket(key);
    const auto client = bucket->check_and_increment(config_.per_client_per_minute, kMinute, now);
    if (!client.allowed) {
        spdlog::warn("rate_limiter: client limit exceeded [{}] (limit={} per minute)", key,
                     config_.per_client_per_minute);
        return rejected(config_.per_client_per_minute, client.reset_at, "minute", RateLimitScope::kClient, now);
    }

    return RateLimitResult{
        .allowed   = true,
        .limit     = config_.requests_per_minute,
        .remaining = minute.remaining,
        .reset_at  = minute.reset_at,
    };
}

RateLimitResult RateLimiter::record_tokens(std::uint64_t tokens) {
    const auto now = clock_();
    if (!config_.enabled) {
        return RateLimitResult{
            .allowed   = true,
            .limit     = config_.tokens_per_minute,
            .remaining = config_.tokens_per_minute,
            .reset_at  = now + kMinute,
            .scope     = RateLimitScope::kTokens,
        };
    }

    const std::uint64_t minute_count = token_minute_.add(tokens, kMinute, now);
    token_hour_.add(tokens, kHour, now);

    const std::uint64_t remaining =
        minute_count >= config_.tokens_per_minute ? 0 : config_.tokens_per_minute - minute_count;
    if (remaining == 0) {
        spdlog::warn("rate_limiter: token limit reached (used={} limit={} per minute)", minute_count,
                     config_.tokens_per_minute);
    }
    return RateLimitResult{
        .allowed   = remaining > 0,
        .limit     = config_.tokens_per_minute,
        .remaining = remaining,
        .reset_at  = token_minute_.reset_at(),
        .scope     = RateLimitScope::kTokens,
    };
}

std::size_t RateLimiter::cleanup_stale_buckets(std::chrono::seconds max_age) {
    const auto cutoff = clock_() - max_age;
    std::size_t removed = 0;
    {
        std::lock_guard<std::mutex> guard(clients_mutex_);
        for (auto it = clients_.begin(); it != clients_.end();) {
            if (it->second->reset_at() < cutoff) {
                it = clients_.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
    }
    if (removed > 0) {
        spdlog::debug("rate_limiter: removed {} stale client buckets", removed);
    }
    return removed;
}

RateLimitStatus RateLimiter::status() const {
    const auto remaining = [](std::uint64_t limit, std::uint64_t count) {
        return count >= limit ? std::uint64_t{0} : limit - count;
    };
    RateLimitStatus s;
    s.enabled                 = config_.enabled;
    s.global_minute_count     = global_minute_.count();
    s.global_minute_remaining = remaining(config_.requests_per_minute, s.global_minute_count);
    s.global_hour_count       = global_hour_.count();
    s.global_hour_remaining   = remaining(config_.requests_per_hour, s.global_hour_count);
    s.token_minute_count      = token_minute_.count();
    s.token_minute_remaining  = remaining(config_.tokens_per_minute, s.token_minute_count);
    s.token_hour_count        = token_hour_.count();
    s.token_hour_remaining    = remaining(config_.tokens_per_hour, s.token_hour_count);
    {
        std::lock_guard<std::mutex> guard(clients_mutex_);
        s.client_buckets = clients_.size();
    }
    return s;
}
