#pragma once

// ---------------------------------------------------------------------------
// audit_logger.hpp
//
// 추가 전용 JSON Lines 감사 로그.
//
// [저장소]
// - kStdout   : 전용 spdlog 로거 ("pggate_audit", 패턴 "%v") 로 stdout 에 출력
// - kFile     : file_path 에 한 줄씩 추가. 크기 초과 시 회전.
// - kDatabase : 예약. 이벤트는 버려지며 최초 1회 경고를 남긴다.
//
// [파일 쓰기와 이벤트 루프]
// 파일 쓰기는 전용 thread_pool(스레드 1개) 의 strand 에서 수행한다.
// log() 를 호출한 코루틴은 쓰기가 끝나면 원래 executor 에서 재개된다.
//
// [회전]
// 쓰기 직전 누적 바이트가 max_file_size 를 넘었으면:
//   <stem>.<max_files>.jsonl 삭제 → <stem>.<N>.jsonl 을 N+1 로 → 현재 파일을 .1.jsonl 로
// 누적 바이트는 프로세스 내 카운터이며 매 쓰기마다 stat 하지 않는다.
// 시작 시에는 기존 파일 크기로 초기화한다.
//
// [알려진 한계]
// - 여러 프로세스가 같은 파일에 쓰면 회전이 서로 엇갈린다.
// - 쓰기 실패는 진단 로그로만 보고되며 요청을 실패시키지 않는다.
// ---------------------------------------------------------------------------

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/thread_pool.hpp>

#include <spdlog/logger.h>

#include "audit/audit_event.hpp"

enum class AuditStorage : std::uint8_t {
    kFile     = 0,
    kStdout   = 1,
    kDatabase = 2,
};

[[nodiscard]] std::optional<AuditStorage> parse_audit_storage(std::string_view name);

struct AuditConfig {
    bool         enabled{true};
    AuditStorage storage{AuditStorage::kFile};
    std::string  file_path{"logs/audit.jsonl"};
    std::size_t  max_file_size_mb{100};
    std::size_t  max_files{10};
    bool         redact_sql{false};
};

// path 의 N 번째 회전 파일 이름 (logs/audit.jsonl → logs/audit.N.jsonl)
[[nodiscard]] std::filesystem::path rotated_path(const std::filesystem::path& path, std::size_t index);

class AuditLogger {
public:
    explicit AuditLogger(AuditConfig config);

    // 대기 중인 파일 쓰기를 모두 마친 뒤 반환한다.
    ~AuditLogger();

    AuditLogger(const AuditLogger&)            = delete;
    AuditLogger& operator=(const AuditLogger&) = delete;
    AuditLogger(AuditLogger&&)                 = delete;
    AuditLogger& operator=(AuditLogger&&)      = delete;

    auto log(AuditEvent event) -> boost::asio::awaitable<void>;

    [[nodiscard]] const AuditConfig& config() const noexcept { return config_; }

    // 회전 기준 (테스트에서 작은 값으로 바꾼다)
    void set_max_file_bytes(std::uint64_t bytes) noexcept { max_file_bytes_ = bytes; }

private:
    auto write_line(std::string line) -> boost::asio::awaitable<void>;

    void rotate();
    bool ensure_open();

    AuditConfig config_;

    boost::asio::thread_pool                                    pool_{1};
    boost::asio::strand<boost::asio::thread_pool::executor_type> strand_;

    std::shared_ptr<spdlog::logger> stdout_logger_{};
    bool                            database_warned_{false};

    // strand 안에서만 접근
    std::ofstream  file_{};
    std::uint64_t  current_size_{0};
    std::uint64_t  max_file_bytes_{0};
};
