#include "audit/audit_logger.hpp"

#include <algorithm>
#include <cctype>
#include <system_error>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <fmt/format.h>
#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/spdlog.h>

std::optional<AuditStorage> parse_audit_storage(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "file")     return AuditStorage::kFile;
    if (lower == "stdout")   return AuditStorage::kStdout;
    if (lower == "database") return AuditStorage::kDatabase;
    return std::nullopt;
}

std::filesystem::path rotated_path(const std::filesystem::path& path, std::size_t index) {
    const std::string ext = path.has_extension() ? path.extension().string() : std::string(".jsonl");
    return path.parent_path() / fmt::format("{}.{}{}", path.stem().string(), index, ext);
}

AuditLogger::AuditLogger(AuditConfig config)
    : config_{std::move(config)}
    , strand_{boost::asio::make_strand(pool_.get_executor())}
    , max_file_bytes_{static_cast<std::uint64_t>(config_.max_file_size_mb) * 1024 * 1024}
{
    if (!config_.enabled) {
        spdlog::info("audit: disabled");
        return;
    }

    switch (config_.storage) {
        case AuditStorage::kStdout: {
            auto sink      = std::make_shared<spdlog::sinks::stdout_sink_mt>();
            stdout_logger_ = std::make_shared<spdlog::logger>("pggate_audit", std::move(sink));
            stdout_logger_->set_pattern("%v");
            stdout_logger_->set_level(spdlog::level::info);
            stdout_logger_->flush_on(spdlog::level::info);
            break;
        }
        case AuditStorage::kFile: {
            std::error_code ec;
            const auto size = std::filesystem::file_size(config_.file_path, ec);
            if (!ec) {
                current_size_ = size;
            }
            break;
        }
        case AuditStorage::kDatabase:
            break;
    }
    spdlog::info("audit: storage={} path='{}' redact_sql={}",
                 config_.storage == AuditStorage::kFile     ? "file"
                 : config_.storage == AuditStorage::kStdout ? "stdout"
                                                            : "database",
                 config_.file_path, config_.redact_sql);
}

AuditLogger::~AuditLogger() {
    pool_.join();
    if (file_.is_open()) {
        file_.flush();
        file_.close();
    }
}

auto AuditLogger::log(AuditEvent event) -> boost::asio::awaitable<void> {
    if (!config_.enabled) {
        co_return;
    }

    std::string line = event.to_json(config_.redact_sql);

    switch (config_.storage) {
        case AuditStorage::kStdout:
            stdout_logger_->info(line);
            break;
        case AuditStorage::kFile:
            co_await boost::asio::co_spawn(strand_, write_line(std::move(line)), boost::asio::use_awaitable);
            break;
        case AuditStorage::kDatabase:
            if (!database_warned_) {
                database_warned_ = true;
                spdlog::warn("audit: database storage is not implemented, events are discarded");
            }
            break;
    }
}

// strand 에서 실행된다
auto AuditLogger::write_line(std::string line) -> boost::asio::awaitable<void> {
    if (current_size_ > max_file_bytes_) {
        rotate();
    }
    if (!ensure_open()) {
        co_return;
    }

    line += '\n';
    file_.write(line.data(), static_cast<std::streamsize>(line.size()));
    file_.flush();
    if (!file_.good()) {
        spdlog::error("audit: write to '{}' failed", config_.file_path);
        file_.close();
        co_return;
    }
    current_size_ += line.size();
}

bool AuditLogger::ensure_open() {
    if (file_.is_open()) {
        return true;
    }
    const std::filesystem::path path{config_.file_path};
    if (path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            spdlog::error("audit: cannot create directory '{}': {}", path.parent_path().string(), ec.message());
            return false;
        }
    }
    file_.clear();
    file_.open(path, std::ios::out | std::ios::app);
    if (!file_.is_open()) {
        spdlog::error("audit: cannot open '{}'", config_.file_path);
        return false;
    }
    return true;
}

void AuditLogger::rotate() {
    if (file_.is_open()) {
        file_.flush();
        file_.close();
    }

    const std::filesystem::path path{config_.file_path};
    std::error_code ec;

    if (config_.max_files == 0) {
        std::filesystem::remove(path, ec);
        current_size_ = 0;
        return;
    }

    std::filesystem::remove(rotated_path(path, config_.max_files), ec);
    for (std::size_t i = config_.max_files - 1; i >= 1; --i) {
        const auto from = rotated_path(path, i);
        if (std::filesystem::exists(from, ec)) {
            std::filesystem::rename(from, rotated_path(path, i + 1), ec);
            if (ec) {
                spdlog::warn("audit: rotate {} failed: {}", from.string(), ec.message());
            }
        }
    }
    std::filesystem::rename(path, rotated_path(path, 1), ec);
    if (ec) {
        spdlog::warn("audit: rotate {} failed: {}", path.string(), ec.message());
    }
    current_size_ = 0;
    spdlog::info("audit: rotated '{}'", config_.file_path);
}
