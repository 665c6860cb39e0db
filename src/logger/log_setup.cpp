#include "logger/log_setup.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <memory>
#include <string_view>
#include <vector>

#include <fmt/format.h>
#include <spdlog/pattern_formatter.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/spdlog.h>

#include "logger/json_util.hpp"

namespace {

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

// %j : JSON 문자열 규칙으로 이스케이프한 메시지 본문 (%v 대신)
class JsonEscapedMessageFlag final : public spdlog::custom_flag_formatter {
public:
    void format(const spdlog::details::log_msg& msg, const std::tm&, spdlog::memory_buf_t& dest) override {
        const std::string escaped =
            escape_json_string(std::string_view(msg.payload.data(), msg.payload.size()));
        dest.append(escaped.data(), escaped.data() + escaped.size());
    }

    std::unique_ptr<custom_flag_formatter> clone() const override {
        return std::make_unique<JsonEscapedMessageFlag>();
    }
};

constexpr char        kJsonMessageFlag = 'j';
constexpr const char* kJsonPattern =
    R"({"time":"%Y-%m-%dT%H:%M:%S.%e%z","level":"%l","logger":"%n","msg":"%j"})";
constexpr const char* kTextPattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] %v";

std::unique_ptr<spdlog::formatter> make_formatter(LogFormat format) {
    auto formatter = std::make_unique<spdlog::pattern_formatter>();
    if (format == LogFormat::kJson) {
        formatter->add_flag<JsonEscapedMessageFlag>(kJsonMessageFlag).set_pattern(kJsonPattern);
    } else {
        formatter->set_pattern(kTextPattern);
    }
    return formatter;
}

}  // namespace

std::optional<spdlog::level::level_enum> parse_log_level(std::string_view name) {
    const std::string lower = to_lower(name);
    if (lower == "trace")                      return spdlog::level::trace;
    if (lower == "debug")                      return spdlog::level::debug;
    if (lower == "info")                       return spdlog::level::info;
    if (lower == "warn" || lower == "warning") return spdlog::level::warn;
    if (lower == "error")                      return spdlog::level::err;
    if (lower == "critical")                   return spdlog::level::critical;
    if (lower == "off")                        return spdlog::level::off;
    return std::nullopt;
}

std::optional<LogFormat> parse_log_format(std::string_view name) {
    const std::string lower = to_lower(name);
    if (lower == "text") return LogFormat::kText;
    if (lower == "json") return LogFormat::kJson;
    return std::nullopt;
}

std::expected<void, std::string> init_logging(const LoggingConfig& config) {
    const auto level = parse_log_level(config.level);
    if (!level) {
        return std::unexpected(fmt::format("unknown log level '{}'", config.level));
    }

    try {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_sink_mt>());

        if (!config.file.empty()) {
            const std::filesystem::path path{config.file};
            if (path.has_parent_path()) {
                std::filesystem::create_directories(path.parent_path());
            }
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.file, config.max_file_size_mb * 1024 * 1024, config.max_files));
        }

        auto logger = std::make_shared<spdlog::logger>("pggate", sinks.begin(), sinks.end());
        logger->set_level(*level);
        logger->set_formatter(make_formatter(config.format));
        logger->flush_on(spdlog::level::warn);
        spdlog::set_default_logger(std::move(logger));
    } catch (const spdlog::spdlog_ex& e) {
        return std::unexpected(fmt::format("logger initialization failed: {}", e.what()));
    } catch (const std::filesystem::filesystem_error& e) {
        return std::unexpected(fmt::format("cannot create log directory: {}", e.what()));
    }
    return {};
}
