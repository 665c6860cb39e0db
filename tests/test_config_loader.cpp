// ---------------------------------------------------------------------------
// test_config_loader.cpp
//
// ConfigLoader / parse_duration / build_conninfo 단위 테스트.
//
// [테스트 범위]
// - 최소 설정: 섹션 생략 시 구조체 기본값
// - 전체 설정: server / logging / rate_limit / audit / databases[].access_policy
// - 연결 문자열: 개별 필드 조합, dsn 그대로 사용, password_env 우선,
//   작은따옴표/백슬래시 이스케이프
// - All-or-nothing 실패: 빈 databases, 중복 이름, 잘못된 엔진/열거값/기간,
//   table.column 형식 위반, 풀 크기 역전, dbname 누락, YAML 문법 오류
// - 파일 로드: 정상 파일, 존재하지 않는 경로
//
// [알려진 한계]
// - 알 수 없는 키는 무시되므로 오타 키는 테스트로 잡히지 않는다.
// ---------------------------------------------------------------------------

#include "config/config_loader.hpp"

#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

namespace {

constexpr const char* kMinimalYaml = R"(
databases:
  - name: app
    dbname: appdb
)";

constexpr const char* kFullYaml = R"(
server:
  max_result_rows: 250
  query_timeout: 15s
  use_readonly_transactions: false
  schema_cache_ttl: 10m

logging:
  level: debug
  format: json
  file: logs/pggate.log

rate_limit:
  enabled: true
  requests_per_minute: 30
  requests_per_hour: 500
  per_client_per_minute: 5
  client_identifier: session

audit:
  enabled: true
  storage: stdout
  redact_sql: true

databases:
  - name: analytics
    engine: postgresql
    host: db.internal
    port: 6432
    dbname: warehouse
    user: reader
    password: "it's"
    min_pool_size: 2
    max_pool_size: 8
    acquire_timeout: 500ms
    access_policy:
      allowed_schemas: [public, reporting]
      tables:
        denied: [payments]
      columns:
        denied: [users.password]
        denied_patterns: ["*_token"]
        select_star_policy: allow
      explain:
        enabled: true
        max_estimated_rows: 5000
        max_estimated_cost: 250.5
        deny_seq_scan_on_large_tables: true
        large_table_threshold: 20000
        timeout: 2s
        fail_open_on_error: true
  - name: crm
    dsn: "host=crm.internal dbname=crm"
)";

std::string with_database(const std::string& db_yaml) {
    return "databases:\n" + db_yaml;
}

} // namespace

// ---------------------------------------------------------------------------
// parse_duration / build_conninfo
// ---------------------------------------------------------------------------

TEST(ConfigLoader, ParseDurationUnits) {
    using namespace std::chrono_literals;
    EXPECT_EQ(parse_duration("30s"), std::chrono::milliseconds{30s});
    EXPECT_EQ(parse_duration("500ms"), std::chrono::milliseconds{500});
    EXPECT_EQ(parse_duration("5m"), std::chrono::milliseconds{5min});
    EXPECT_EQ(parse_duration("1h"), std::chrono::milliseconds{1h});
    EXPECT_EQ(parse_duration("45"), std::chrono::milliseconds{45s});
}

TEST(ConfigLoader, ParseDurationRejectsGarbage) {
    EXPECT_FALSE(parse_duration("").has_value());
    EXPECT_FALSE(parse_duration("s").has_value());
    EXPECT_FALSE(parse_duration("10 s").has_value());
    EXPECT_FALSE(parse_duration("10d").has_value());
    EXPECT_FALSE(parse_duration("-5s").has_value());
}

TEST(ConfigLoader, BuildConninfoEscapesValues) {
    const auto conninfo = build_conninfo({{"dbname", "app"}, {"password", R"(a'b\c)"}});
    EXPECT_EQ(conninfo, R"(dbname='app' password='a\'b\\c')");
}

// ---------------------------------------------------------------------------
// 정상 로드
// ---------------------------------------------------------------------------

TEST(ConfigLoader, MinimalConfigUsesDefaults) {
    const auto cfg = ConfigLoader::load_from_string(kMinimalYaml);
    ASSERT_TRUE(cfg.has_value()) << cfg.error();

    EXPECT_EQ(cfg->server.max_result_rows, 1000U);
    EXPECT_EQ(cfg->server.query_timeout, std::chrono::seconds{30});
    EXPECT_TRUE(cfg->server.use_readonly_transactions);
    EXPECT_EQ(cfg->logging.level, "info");
    EXPECT_EQ(cfg->logging.format, LogFormat::kText);
    EXPECT_TRUE(cfg->rate_limit.enabled);
    EXPECT_EQ(cfg->rate_limit.requests_per_minute, 60U);
    EXPECT_EQ(cfg->rate_limit.client_identifier, ClientIdentifier::kAuto);
    EXPECT_EQ(cfg->audit.storage, AuditStorage::kFile);
    EXPECT_EQ(cfg->audit.file_path, "logs/audit.jsonl");

    ASSERT_EQ(cfg->databases.size(), 1U);
    const auto& db = cfg->databases.front();
    EXPECT_EQ(db.name, "app");
    EXPECT_EQ(db.engine, DatabaseEngine::kPostgres);
    EXPECT_EQ(db.connection.conninfo,
              "application_name='pggate' dbname='appdb' host='localhost' port='5432' sslmode='prefer'");
    EXPECT_EQ(db.policy.allowed_schemas, (std::vector<std::string>{"public"}));
    EXPECT_TRUE(db.policy.explain.enabled);
    EXPECT_FALSE(db.policy.explain.fail_open_on_error);
}

TEST(ConfigLoader, FullConfig) {
    const auto cfg = ConfigLoader::load_from_string(kFullYaml);
    ASSERT_TRUE(cfg.has_value()) << cfg.error();

    EXPECT_EQ(cfg->server.max_result_rows, 250U);
    EXPECT_EQ(cfg->server.query_timeout, std::chrono::seconds{15});
    EXPECT_FALSE(cfg->server.use_readonly_transactions);
    EXPECT_EQ(cfg->server.schema_cache_ttl, std::chrono::minutes{10});

    EXPECT_EQ(cfg->logging.level, "debug");
    EXPECT_EQ(cfg->logging.format, LogFormat::kJson);
    EXPECT_EQ(cfg->logging.file, "logs/pggate.log");

    EXPECT_EQ(cfg->rate_limit.requests_per_minute, 30U);
    EXPECT_EQ(cfg->rate_limit.requests_per_hour, 500U);
    EXPECT_EQ(cfg->rate_limit.per_client_per_minute, 5U);
    EXPECT_EQ(cfg->rate_limit.client_identifier, ClientIdentifier::kSession);

    EXPECT_EQ(cfg->audit.storage, AuditStorage::kStdout);
    EXPECT_TRUE(cfg->audit.redact_sql);

    ASSERT_EQ(cfg->databases.size(), 2U);
    const auto* analytics = cfg->find_database("analytics");
    ASSERT_NE(analytics, nullptr);
    EXPECT_EQ(analytics->connection.conninfo,
              "application_name='pggate' dbname='warehouse' host='db.internal' password='it\\'s' "
              "port='6432' sslmode='prefer' user='reader'");
    EXPECT_EQ(analytics->connection.min_pool_size, 2U);
    EXPECT_EQ(analytics->connection.max_pool_size, 8U);
    EXPECT_EQ(analytics->connection.acquire_timeout, std::chrono::milliseconds{500});

    const auto& policy = analytics->policy;
    EXPECT_EQ(policy.allowed_schemas, (std::vector<std::string>{"public", "reporting"}));
    EXPECT_EQ(policy.tables.denied, (std::vector<std::string>{"payments"}));
    EXPECT_EQ(policy.columns.denied, (std::vector<std::string>{"users.password"}));
    EXPECT_EQ(policy.columns.denied_patterns, (std::vector<std::string>{"*_token"}));
    EXPECT_EQ(policy.columns.select_star_policy, SelectStarPolicy::kAllow);
    EXPECT_EQ(policy.explain.max_estimated_rows, 5000U);
    EXPECT_DOUBLE_EQ(policy.explain.max_estimated_cost, 250.5);
    EXPECT_TRUE(policy.explain.deny_seq_scan_on_large_tables);
    EXPECT_EQ(policy.explain.large_table_threshold, 20000U);
    EXPECT_EQ(policy.explain.timeout, std::chrono::seconds{2});
    EXPECT_TRUE(policy.explain.fail_open_on_error);

    const auto* crm = cfg->find_database("crm");
    ASSERT_NE(crm, nullptr);
    EXPECT_EQ(crm->connection.conninfo, "host=crm.internal dbname=crm");
    EXPECT_EQ(cfg->find_database("CRM"), nullptr);
}

TEST(ConfigLoader, PasswordEnvOverridesPassword) {
    ::setenv("PGGATE_TEST_DB_PASSWORD", "from-env", 1);
    const auto cfg = ConfigLoader::load_from_string(with_database(R"(
  - name: app
    dbname: appdb
    password: from-file
    password_env: PGGATE_TEST_DB_PASSWORD
)"));
    ::unsetenv("PGGATE_TEST_DB_PASSWORD");
    ASSERT_TRUE(cfg.has_value()) << cfg.error();
    EXPECT_NE(cfg->databases.front().connection.conninfo.find("password='from-env'"), std::string::npos);
}

TEST(ConfigLoader, PasswordEnvIsAppendedToKeywordDsn) {
    ::setenv("PGGATE_TEST_DB_PASSWORD", "s3cret", 1);
    const auto cfg = ConfigLoader::load_from_string(with_database(R"(
  - name: app
    dsn: "host=db dbname=app"
    password_env: PGGATE_TEST_DB_PASSWORD
)"));
    ::unsetenv("PGGATE_TEST_DB_PASSWORD");
    ASSERT_TRUE(cfg.has_value()) << cfg.error();
    EXPECT_EQ(cfg->databases.front().connection.conninfo, "host=db dbname=app password='s3cret'");
}

// ---------------------------------------------------------------------------
// All-or-nothing 실패
// ---------------------------------------------------------------------------

TEST(ConfigLoader, MissingDatabasesFails) {
    const auto cfg = ConfigLoader::load_from_string("server:\n  max_result_rows: 10\n");
    ASSERT_FALSE(cfg.has_value());
    EXPECT_NE(cfg.error().find("'databases' must be a non-empty list"), std::string::npos);
}

TEST(ConfigLoader, DuplicateDatabaseNameFails) {
    const auto cfg = ConfigLoader::load_from_string(with_database(R"(
  - name: app
    dbname: a
  - name: app
    dbname: b
)"));
    ASSERT_FALSE(cfg.has_value());
    EXPECT_NE(cfg.error().find("duplicate database name 'app'"), std::string::npos);
}

TEST(ConfigLoader, UnknownEngineFails) {
    const auto cfg = ConfigLoader::load_from_string(with_database(R"(
  - name: app
    engine: oracle
    dbname: a
)"));
    ASSERT_FALSE(cfg.has_value());
    EXPECT_NE(cfg.error().find("unknown engine 'oracle'"), std::string::npos);
}

TEST(ConfigLoader, MissingDbnameFails) {
    const auto cfg = ConfigLoader::load_from_string(with_database("  - name: app\n    host: db\n"));
    ASSERT_FALSE(cfg.has_value());
    EXPECT_NE(cfg.error().find("'dbname' or 'dsn' is required"), std::string::npos);
}

TEST(ConfigLoader, InvertedPoolSizesFail) {
    const auto cfg = ConfigLoader::load_from_string(with_database(R"(
  - name: app
    dbname: a
    min_pool_size: 5
    max_pool_size: 2
)"));
    ASSERT_FALSE(cfg.has_value());
    EXPECT_NE(cfg.error().find("pool sizes"), std::string::npos);
}

TEST(ConfigLoader, MalformedDeniedColumnFails) {
    const auto cfg = ConfigLoader::load_from_string(with_database(R"(
  - name: app
    dbname: a
    access_policy:
      columns:
        denied: [password]
)"));
    ASSERT_FALSE(cfg.has_value());
    EXPECT_NE(cfg.error().find("'table.column' form"), std::string::npos);
}

TEST(ConfigLoader, InvalidEnumValuesFail) {
    EXPECT_FALSE(ConfigLoader::load_from_string(std::string("logging:\n  level: loud\n") + kMinimalYaml).has_value());
    EXPECT_FALSE(ConfigLoader::load_from_string(std::string("logging:\n  format: xml\n") + kMinimalYaml).has_value());
    EXPECT_FALSE(ConfigLoader::load_from_string(std::string("rate_limit:\n  client_identifier: cookie\n") + kMinimalYaml)
                     .has_value());
    EXPECT_FALSE(ConfigLoader::load_from_string(std::string("audit:\n  storage: kafka\n") + kMinimalYaml).has_value());
}

TEST(ConfigLoader, InvalidDurationFails) {
    const auto cfg = ConfigLoader::load_from_string(std::string("server:\n  query_timeout: soon\n") + kMinimalYaml);
    ASSERT_FALSE(cfg.has_value());
    EXPECT_NE(cfg.error().find("server.query_timeout"), std::string::npos);
}

TEST(ConfigLoader, ZeroMaxResultRowsFails) {
    EXPECT_FALSE(ConfigLoader::load_from_string(std::string("server:\n  max_result_rows: 0\n") + kMinimalYaml)
                     .has_value());
}

TEST(ConfigLoader, WrongScalarTypeNamesSection) {
    const auto cfg = ConfigLoader::load_from_string(std::string("rate_limit:\n  requests_per_minute: lots\n") +
                                                    kMinimalYaml);
    ASSERT_FALSE(cfg.has_value());
    EXPECT_NE(cfg.error().find("'rate_limit'"), std::string::npos);
}

TEST(ConfigLoader, YamlSyntaxErrorFails) {
    const auto cfg = ConfigLoader::load_from_string("databases: [\n  - name: app\n");
    ASSERT_FALSE(cfg.has_value());
    EXPECT_NE(cfg.error().find("YAML parse error"), std::string::npos);
}

TEST(ConfigLoader, NonMapRootFails) {
    EXPECT_FALSE(ConfigLoader::load_from_string("- just\n- a list\n").has_value());
}

// ---------------------------------------------------------------------------
// 파일 로드
// ---------------------------------------------------------------------------

TEST(ConfigLoader, LoadsFromFile) {
    const auto path = std::filesystem::temp_directory_path() /
                      ("pggate_config_" + std::to_string(::getpid()) + ".yaml");
    {
        std::ofstream out(path);
        out << kMinimalYaml;
    }
    const auto cfg = ConfigLoader::load(path);
    std::filesystem::remove(path);
    ASSERT_TRUE(cfg.has_value()) << cfg.error();
    EXPECT_EQ(cfg->databases.front().name, "app");
}

TEST(ConfigLoader, MissingFileFails) {
    const auto cfg = ConfigLoader::load("/nonexistent/pggate/config.yaml");
    ASSERT_FALSE(cfg.has_value());
    EXPECT_NE(cfg.error().find("cannot resolve config path"), std::string::npos);
}

TEST(ConfigLoader, ExampleConfigLoads) {
    const auto cfg = ConfigLoader::load("config/pggate.example.yaml");
    ASSERT_TRUE(cfg.has_value()) << cfg.error();
    EXPECT_FALSE(cfg->databases.empty());
}
