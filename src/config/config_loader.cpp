// ---------------------------------------------------------------------------
// config_loader.cpp
//
// [섹션 처리 순서]
// server → logging → rate_limit → audit → databases
// 섹션마다 YAML::Exception 을 따로 잡아 어느 섹션에서 실패했는지 보고한다.
//
// [알려진 한계]
// - 알 수 없는 키는 조용히 무시한다. 오타가 난 키는 기본값으로 동작한다.
// - dsn 이 URI 형식 (postgresql://...) 이면 password_env 를 덧붙일 수 없어
//   경고만 남기고 무시한다.
// ---------------------------------------------------------------------------

#include "config/config_loader.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <set>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

namespace {

template <typename T>
using Result = std::expected<T, std::string>;

[[nodiscard]] std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

// ---------------------------------------------------------------------------
// 스칼라 읽기 헬퍼. 노드가 없으면 fallback.
// 형식이 틀린 값은 YAML::Exception 으로 올라가 섹션 단위로 보고된다.
// ---------------------------------------------------------------------------
[[nodiscard]] std::string read_string(const YAML::Node& node, const std::string& fallback) {
    if (!node || node.IsNull()) {
        return fallback;
    }
    return node.as<std::string>();
}

[[nodiscard]] bool read_bool(const YAML::Node& node, bool fallback) {
    if (!node || node.IsNull()) {
        return fallback;
    }
    return node.as<bool>();
}

[[nodiscard]] std::uint64_t read_uint64(const YAML::Node& node, std::uint64_t fallback) {
    if (!node || node.IsNull()) {
        return fallback;
    }
    return node.as<std::uint64_t>();
}

[[nodiscard]] double read_double(const YAML::Node& node, double fallback) {
    if (!node || node.IsNull()) {
        return fallback;
    }
    return node.as<double>();
}

[[nodiscard]] std::vector<std::string> read_string_sequence(const YAML::Node& node) {
    std::vector<std::string> result;
    if (!node || node.IsNull()) {
        return result;
    }
    if (!node.IsSequence()) {
        throw YAML::BadConversion(node.Mark());
    }
    result.reserve(node.size());
    for (const auto& item : node) {
        result.push_back(item.as<std::string>());
    }
    return result;
}

[[nodiscard]] Result<std::chrono::milliseconds> read_duration(const YAML::Node&          node,
                                                              std::string_view           key,
                                                              std::chrono::milliseconds  fallback) {
    if (!node || node.IsNull()) {
        return fallback;
    }
    const std::string raw = node.as<std::string>();
    const auto        parsed = parse_duration(raw);
    if (!parsed) {
        return std::unexpected(fmt::format("{}: invalid duration '{}' (expected e.g. 30s, 500ms, 5m)", key, raw));
    }
    return *parsed;
}

// ---------------------------------------------------------------------------
// server
// ---------------------------------------------------------------------------
[[nodiscard]] Result<ServerConfig> parse_server(const YAML::Node& node) {
    ServerConfig cfg{};
    if (!node) {
        return cfg;
    }
    cfg.max_result_rows           = read_uint64(node["max_result_rows"], cfg.max_result_rows);
    cfg.use_readonly_transactions = read_bool(node["use_readonly_transactions"], cfg.use_readonly_transactions);

    auto timeout = read_duration(node["query_timeout"], "server.query_timeout", cfg.query_timeout);
    if (!timeout) {
        return std::unexpected(timeout.error());
    }
    cfg.query_timeout = *timeout;

    auto ttl = read_duration(node["schema_cache_ttl"], "server.schema_cache_ttl", cfg.schema_cache_ttl);
    if (!ttl) {
        return std::unexpected(ttl.error());
    }
    cfg.schema_cache_ttl = std::chrono::duration_cast<std::chrono::seconds>(*ttl);

    if (cfg.max_result_rows == 0) {
        return std::unexpected("server.max_result_rows must be at least 1");
    }
    return cfg;
}

// ---------------------------------------------------------------------------
// logging
// ---------------------------------------------------------------------------
[[nodiscard]] Result<LoggingConfig> parse_logging(const YAML::Node& node) {
    LoggingConfig cfg{};
    if (!node) {
        return cfg;
    }
    cfg.level            = read_string(node["level"], cfg.level);
    cfg.file             = read_string(node["file"], cfg.file);
    cfg.max_file_size_mb = read_uint64(node["max_file_size_mb"], cfg.max_file_size_mb);
    cfg.max_files        = read_uint64(node["max_files"], cfg.max_files);

    if (!parse_log_level(cfg.level)) {
        return std::unexpected(fmt::format("logging.level: unknown level '{}'", cfg.level));
    }
    const std::string format = read_string(node["format"], "text");
    const auto        parsed = parse_log_format(format);
    if (!parsed) {
        return std::unexpected(fmt::format("logging.format: must be 'text' or 'json', got '{}'", format));
    }
    cfg.format = *parsed;
    return cfg;
}

// ---------------------------------------------------------------------------
// rate_limit
// ---------------------------------------------------------------------------
[[nodiscard]] Result<RateLimitConfig> parse_rate_limit(const YAML::Node& node) {
    RateLimitConfig cfg{};
    if (!node) {
        return cfg;
    }
    cfg.enabled               = read_bool(node["enabled"], cfg.enabled);
    cfg.requests_per_minute   = read_uint64(node["requests_per_minute"], cfg.requests_per_minute);
    cfg.requests_per_hour     = read_uint64(node["requests_per_hour"], cfg.requests_per_hour);
    cfg.per_client_per_minute = read_uint64(node["per_client_per_minute"], cfg.per_client_per_minute);
    cfg.tokens_per_minute     = read_uint64(node["tokens_per_minute"], cfg.tokens_per_minute);
    cfg.tokens_per_hour       = read_uint64(node["tokens_per_hour"], cfg.tokens_per_hour);

    const std::string ident = to_lower(read_string(node["client_identifier"], "auto"));
    if (ident == "ip") {
        cfg.client_identifier = ClientIdentifier::kIp;
    } else if (ident == "session") {
        cfg.client_identifier = ClientIdentifier::kSession;
    } else if (ident == "auto") {
        cfg.client_identifier = ClientIdentifier::kAuto;
    } else {
        return std::unexpected(fmt::format(
            "rate_limit.client_identifier: must be 'ip', 'session' or 'auto', got '{}'", ident));
    }
    return cfg;
}

// ---------------------------------------------------------------------------
// audit
// ---------------------------------------------------------------------------
[[nodiscard]] Result<AuditConfig> parse_audit(const YAML::Node& node) {
    AuditConfig cfg{};
    if (!node) {
        return cfg;
    }
    cfg.enabled          = read_bool(node["enabled"], cfg.enabled);
    cfg.file_path        = read_string(node["file_path"], cfg.file_path);
    cfg.max_file_size_mb = read_uint64(node["max_file_size_mb"], cfg.max_file_size_mb);
    cfg.max_files        = read_uint64(node["max_files"], cfg.max_files);
    cfg.redact_sql       = read_bool(node["redact_sql"], cfg.redact_sql);

    const std::string storage = read_string(node["storage"], "file");
    const auto        parsed  = parse_audit_storage(storage);
    if (!parsed) {
        return std::unexpected(fmt::format(
            "audit.storage: must be 'file', 'stdout' or 'database', got '{}'", storage));
    }
    cfg.storage = *parsed;

    if (cfg.enabled && cfg.storage == AuditStorage::kFile && cfg.file_path.empty()) {
        return std::unexpected("audit.file_path is required when storage is 'file'");
    }
    return cfg;
}

// ---------------------------------------------------------------------------
// databases[].access_policy
// ---------------------------------------------------------------------------
[[nodiscard]] Result<ExplainPolicy> parse_explain(const YAML::Node& node, const std::string& db) {
    ExplainPolicy cfg{};
    if (!node) {
        return cfg;
    }
    cfg.enabled            = read_bool(node["enabled"], cfg.enabled);
    cfg.max_estimated_rows = read_uint64(node["max_estimated_rows"], cfg.max_estimated_rows);
    cfg.max_estimated_cost = read_double(node["max_estimated_cost"], cfg.max_estimated_cost);
    cfg.deny_seq_scan_on_large_tables =
        read_bool(node["deny_seq_scan_on_large_tables"], cfg.deny_seq_scan_on_large_tables);
    cfg.large_table_threshold = read_uint64(node["large_table_threshold"], cfg.large_table_threshold);
    cfg.fail_open_on_error    = read_bool(node["fail_open_on_error"], cfg.fail_open_on_error);
    cfg.cache_max_size        = read_uint64(node["cache_max_size"], cfg.cache_max_size);

    auto timeout = read_duration(node["timeout"], fmt::format("{}.explain.timeout", db), cfg.timeout);
    if (!timeout) {
        return std::unexpected(timeout.error());
    }
    cfg.timeout = *timeout;

    auto ttl = read_duration(node["cache_ttl"], fmt::format("{}.explain.cache_ttl", db), cfg.cache_ttl);
    if (!ttl) {
        return std::unexpected(ttl.error());
    }
    cfg.cache_ttl = std::chrono::duration_cast<std::chrono::seconds>(*ttl);

    if (cfg.max_estimated_cost < 0.0) {
        return std::unexpected(fmt::format("{}.explain.max_estimated_cost must not be negative", db));
    }
    return cfg;
}

[[nodiscard]] Result<PolicyConfig> parse_access_policy(const YAML::Node& node, const std::string& db) {
    PolicyConfig cfg{};
    if (!node) {
        return cfg;
    }

    if (node["allowed_schemas"]) {
        cfg.allowed_schemas = read_string_sequence(node["allowed_schemas"]);
        if (cfg.allowed_schemas.empty()) {
            return std::unexpected(fmt::format("{}.allowed_schemas must not be empty", db));
        }
    }

    if (const auto tables = node["tables"]) {
        cfg.tables.allowed = read_string_sequence(tables["allowed"]);
        cfg.tables.denied  = read_string_sequence(tables["denied"]);
        if (!cfg.tables.allowed.empty() && !cfg.tables.denied.empty()) {
            spdlog::warn("config_loader: [{}] tables.allowed and tables.denied are both set, "
                         "denied list is ignored", db);
        }
    }

    if (const auto columns = node["columns"]) {
        cfg.columns.denied          = read_string_sequence(columns["denied"]);
        cfg.columns.denied_patterns = read_string_sequence(columns["denied_patterns"]);
        for (const auto& entry : cfg.columns.denied) {
            const auto dot = entry.find('.');
            if (dot == std::string::npos || dot == 0 || dot + 1 == entry.size()) {
                return std::unexpected(fmt::format(
                    "{}.columns.denied: '{}' must be in 'table.column' form", db, entry));
            }
        }
        const std::string star = to_lower(read_string(columns["select_star_policy"], "reject"));
        if (star == "reject") {
            cfg.columns.select_star_policy = SelectStarPolicy::kReject;
        } else if (star == "allow") {
            cfg.columns.select_star_policy = SelectStarPolicy::kAllow;
        } else {
            return std::unexpected(fmt::format(
                "{}.columns.select_star_policy: must be 'reject' or 'allow', got '{}'", db, star));
        }
    }

    auto explain = parse_explain(node["explain"], db);
    if (!explain) {
        return std::unexpected(explain.error());
    }
    cfg.explain = *explain;
    return cfg;
}

// ---------------------------------------------------------------------------
// databases[]
// ---------------------------------------------------------------------------
[[nodiscard]] Result<std::string> connection_string(const YAML::Node& node, const std::string& db) {
    std::optional<std::string> password;
    const std::string          password_env = read_string(node["password_env"], "");
    if (!password_env.empty()) {
        if (const char* value = std::getenv(password_env.c_str()); value != nullptr) {
            password = value;
        } else {
            spdlog::warn("config_loader: [{}] password_env '{}' is not set", db, password_env);
        }
    }

    const std::string dsn = read_string(node["dsn"], "");
    if (!dsn.empty()) {
        if (!password) {
            return dsn;
        }
        if (dsn.starts_with("postgres://") || dsn.starts_with("postgresql://")) {
            spdlog::warn("config_loader: [{}] password_env cannot be applied to a URI dsn, ignored", db);
            return dsn;
        }
        return dsn + " " + build_conninfo({{"password", *password}});
    }

    std::map<std::string, std::string> params;
    params["host"]    = read_string(node["host"], "localhost");
    params["port"]    = std::to_string(read_uint64(node["port"], 5432));
    params["dbname"]  = read_string(node["dbname"], "");
    params["sslmode"] = read_string(node["sslmode"], "prefer");
    if (const std::string user = read_string(node["user"], ""); !user.empty()) {
        params["user"] = user;
    }
    if (!password) {
        if (const std::string pw = read_string(node["password"], ""); !pw.empty()) {
            password = pw;
        }
    }
    if (password) {
        params["password"] = *password;
    }
    if (params["dbname"].empty()) {
        return std::unexpected(fmt::format("databases[{}]: 'dbname' or 'dsn' is required", db));
    }
    params["application_name"] = "pggate";
    return build_conninfo(params);
}

[[nodiscard]] Result<DatabaseConfig> parse_database(const YAML::Node& node, std::size_t index) {
    if (!node.IsMap()) {
        return std::unexpected(fmt::format("databases[{}] is not a map", index));
    }
    DatabaseConfig cfg{};
    cfg.name = read_string(node["name"], "");
    if (cfg.name.empty()) {
        return std::unexpected(fmt::format("databases[{}]: 'name' is required", index));
    }

    const std::string engine = read_string(node["engine"], "postgres");
    const auto        parsed = parse_engine(engine);
    if (!parsed) {
        return std::unexpected(fmt::format("databases[{}]: unknown engine '{}'", cfg.name, engine));
    }
    cfg.engine = *parsed;

    auto conninfo = connection_string(node, cfg.name);
    if (!conninfo) {
        return std::unexpected(conninfo.error());
    }
    cfg.connection.conninfo      = std::move(*conninfo);
    cfg.connection.min_pool_size = read_uint64(node["min_pool_size"], cfg.connection.min_pool_size);
    cfg.connection.max_pool_size = read_uint64(node["max_pool_size"], cfg.connection.max_pool_size);
    if (cfg.connection.max_pool_size == 0 || cfg.connection.min_pool_size > cfg.connection.max_pool_size) {
        return std::unexpected(fmt::format(
            "databases[{}]: pool sizes must satisfy 0 <= min_pool_size <= max_pool_size, max_pool_size >= 1",
            cfg.name));
    }

    auto connect_timeout = read_duration(node["connect_timeout"], fmt::format("{}.connect_timeout", cfg.name),
                                         cfg.connection.connect_timeout);
    if (!connect_timeout) {
        return std::unexpected(connect_timeout.error());
    }
    cfg.connection.connect_timeout = *connect_timeout;

    auto acquire_timeout = read_duration(node["acquire_timeout"], fmt::format("{}.acquire_timeout", cfg.name),
                                         cfg.connection.acquire_timeout);
    if (!acquire_timeout) {
        return std::unexpected(acquire_timeout.error());
    }
    cfg.connection.acquire_timeout = *acquire_timeout;

    auto policy = parse_access_policy(node["access_policy"], cfg.name);
    if (!policy) {
        return std::unexpected(policy.error());
    }
    cfg.policy = std::move(*policy);
    return cfg;
}

// ---------------------------------------------------------------------------
// 루트 노드 → GatewayConfig
// ---------------------------------------------------------------------------
[[nodiscard]] Result<GatewayConfig> parse_root(const YAML::Node& root, const std::string& origin) {
    if (!root || !root.IsMap()) {
        return std::unexpected(fmt::format("config_loader: '{}' is not a valid YAML map (top-level)", origin));
    }

    GatewayConfig cfg{};

    const auto section = [&](const char* name, auto parse, auto& out) -> std::optional<std::string> {
        try {
            auto parsed = parse(root[name]);
            if (!parsed) {
                return fmt::format("config_loader: {}", parsed.error());
            }
            out = std::move(*parsed);
        } catch (const YAML::Exception& e) {
            return fmt::format("config_loader: error parsing '{}' section: {}", name, e.what());
        }
        return std::nullopt;
    };

    if (auto err = section("server", parse_server, cfg.server)) {
        return std::unexpected(*err);
    }
    if (auto err = section("logging", parse_logging, cfg.logging)) {
        return std::unexpected(*err);
    }
    if (auto err = section("rate_limit", parse_rate_limit, cfg.rate_limit)) {
        return std::unexpected(*err);
    }
    if (auto err = section("audit", parse_audit, cfg.audit)) {
        return std::unexpected(*err);
    }

    try {
        const YAML::Node dbs = root["databases"];
        if (!dbs || !dbs.IsSequence() || dbs.size() == 0) {
            return std::unexpected("config_loader: 'databases' must be a non-empty list");
        }
        std::set<std::string> names;
        std::size_t           index = 0;
        for (const auto& db_node : dbs) {
            auto db = parse_database(db_node, index++);
            if (!db) {
                return std::unexpected(fmt::format("config_loader: {}", db.error()));
            }
            if (!names.insert(db->name).second) {
                return std::unexpected(fmt::format("config_loader: duplicate database name '{}'", db->name));
            }
            cfg.databases.push_back(std::move(*db));
        }
    } catch (const YAML::Exception& e) {
        return std::unexpected(fmt::format("config_loader: error parsing 'databases' section: {}", e.what()));
    }

    spdlog::info("config_loader: loaded '{}' databases={} rate_limit={} audit={}", origin, cfg.databases.size(),
                 cfg.rate_limit.enabled, cfg.audit.enabled);
    return cfg;
}

}  // namespace

std::optional<std::chrono::milliseconds> parse_duration(std::string_view text) {
    if (text.empty()) {
        return std::nullopt;
    }
    std::uint64_t value{0};
    const char*   begin = text.data();
    const char*   end   = text.data() + text.size();
    auto [ptr, ec]      = std::from_chars(begin, end, value);
    if (ec != std::errc{} || ptr == begin) {
        return std::nullopt;
    }
    const std::string_view unit(ptr, static_cast<std::size_t>(end - ptr));
    if (unit.empty() || unit == "s") {
        return std::chrono::seconds{value};
    }
    if (unit == "ms") {
        return std::chrono::milliseconds{value};
    }
    if (unit == "m") {
        return std::chrono::minutes{value};
    }
    if (unit == "h") {
        return std::chrono::hours{value};
    }
    return std::nullopt;
}

std::string build_conninfo(const std::map<std::string, std::string>& params) {
    std::string out;
    for (const auto& [key, value] : params) {
        if (!out.empty()) {
            out += ' ';
        }
        out += key;
        out += "='";
        for (const char c : value) {
            if (c == '\'' || c == '\\') {
                out += '\\';
            }
            out += c;
        }
        out += '\'';
    }
    return out;
}

std::expected<GatewayConfig, std::string> ConfigLoader::load(const std::filesystem::path& config_path) {
    std::error_code ec;
    const auto canonical_path = std::filesystem::canonical(config_path, ec);
    if (ec) {
        const std::string err = fmt::format("config_loader: cannot resolve config path '{}': {}",
                                            config_path.string(), ec.message());
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    YAML::Node root;
    try {
        root = YAML::LoadFile(canonical_path.string());
    } catch (const YAML::BadFile& e) {
        const std::string err = fmt::format("config_loader: cannot open file '{}': {}",
                                            canonical_path.string(), e.what());
        spdlog::error("{}", err);
        return std::unexpected(err);
    } catch (const YAML::ParserException& e) {
        const std::string err = fmt::format("config_loader: YAML parse error in '{}' at line {}, col {}: {}",
                                            canonical_path.string(), e.mark.line + 1, e.mark.column + 1,
                                            e.what());
        spdlog::error("{}", err);
        return std::unexpected(err);
    } catch (const YAML::Exception& e) {
        const std::string err = fmt::format("config_loader: YAML error in '{}': {}",
                                            canonical_path.string(), e.what());
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    auto cfg = parse_root(root, canonical_path.string());
    if (!cfg) {
        spdlog::error("{}", cfg.error());
    }
    return cfg;
}

std::expected<GatewayConfig, std::string> ConfigLoader::load_from_string(std::string_view yaml) {
    YAML::Node root;
    try {
        root = YAML::Load(std::string(yaml));
    } catch (const YAML::ParserException& e) {
        return std::unexpected(fmt::format("config_loader: YAML parse error at line {}, col {}: {}",
                                           e.mark.line + 1, e.mark.column + 1, e.what()));
    } catch (const YAML::Exception& e) {
        return std::unexpected(fmt::format("config_loader: YAML error: {}", e.what()));
    }
    return parse_root(root, "<string>");
}
