#pragma once

// ---------------------------------------------------------------------------
// schema_cache.hpp
//
// 데이터베이스별 SchemaSnapshot 의 TTL 캐시.
//
// [동시성]
// - 모든 refresh 는 프로세스 전역 AsyncMutex 하나로 직렬화된다
//   (데이터베이스별 락이 아님). 네트워크 I/O 동안 락을 쥐는 유일한 컴포넌트다.
// - get_or_refresh 는 락 안에서 캐시를 다시 확인하므로 같은 키에 동시에
//   들어온 호출자들 중 한 명만 실제로 refresh 한다.
// - 스냅샷은 shared_ptr<const> 로 통째 교체된다. 이미 받은 스냅샷은
//   교체 이후에도 유효하다.
//
// [타임아웃]
// 카탈로그 조회마다 query_timeout 을 건다. 조회가 멈춰도 refresh 락은
// 타임아웃 오류와 함께 풀리고 기존 항목은 남는다.
//
// [만료]
// 백그라운드 청소는 없다. get 시점에 now - cached_at < ttl 인지만 본다.
// ---------------------------------------------------------------------------

#include <chrono>
#include <cstddef>
#include <expected>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <utility>

#include <boost/asio/awaitable.hpp>

#include "common/async_mutex.hpp"
#include "common/types.hpp"
#include "db/connection.hpp"
#include "db/db_types.hpp"
#include "schema/schema_types.hpp"

// build_snapshot
//   catalog_queries().all() 순서의 결과 8개를 (schema, table) 기준으로 합친다.
//   필요한 컬럼이 없는 결과가 있으면 kInternalError.
[[nodiscard]] std::expected<SchemaSnapshot, GatewayError> build_snapshot(
    std::string                           database,
    const std::vector<RowSet>&            results,
    std::chrono::system_clock::time_point cached_at);

class SchemaCache {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    static constexpr std::chrono::seconds      kDefaultTtl{3600};
    static constexpr std::chrono::milliseconds kDefaultQueryTimeout{30000};

    explicit SchemaCache(std::chrono::seconds      ttl           = kDefaultTtl,
                         std::chrono::milliseconds query_timeout = kDefaultQueryTimeout,
                         Clock                     clock         = &std::chrono::system_clock::now);

    ~SchemaCache() = default;

    SchemaCache(const SchemaCache&)            = delete;
    SchemaCache& operator=(const SchemaCache&) = delete;
    SchemaCache(SchemaCache&&)                 = delete;
    SchemaCache& operator=(SchemaCache&&)      = delete;

    // 유효한 스냅샷이 없으면 nullptr
    [[nodiscard]] std::shared_ptr<const SchemaSnapshot> get(const std::string& database) const;

    // pool 은 호출이 끝날 때까지 살아 있어야 한다.
    // 실패하면 기존 항목은 그대로 남는다.
    auto refresh(std::string database, ConnectionPool& pool)
        -> boost::asio::awaitable<std::expected<std::shared_ptr<const SchemaSnapshot>, GatewayError>>;

    auto get_or_refresh(std::string database, ConnectionPool& pool)
        -> boost::asio::awaitable<std::expected<std::shared_ptr<const SchemaSnapshot>, GatewayError>>;

    void invalidate(const std::string& database);
    void invalidate_all();

    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] std::size_t refresh_count() const noexcept { return refresh_count_; }
    [[nodiscard]] std::chrono::seconds ttl() const noexcept { return ttl_; }
    [[nodiscard]] std::chrono::milliseconds query_timeout() const noexcept { return query_timeout_; }

private:
    auto refresh_locked(std::string database, ConnectionPool& pool)
        -> boost::asio::awaitable<std::expected<std::shared_ptr<const SchemaSnapshot>, GatewayError>>;

    std::chrono::seconds                                          ttl_;
    std::chrono::milliseconds                                     query_timeout_;
    Clock                                                         clock_;
    mutable std::mutex                                            mutex_;     // entries_ 보호
    std::map<std::string, std::shared_ptr<const SchemaSnapshot>>  entries_{};
    AsyncMutex                                                    refresh_lock_{};
    std::size_t                                                   refresh_count_{0};
};
