// ---------------------------------------------------------------------------
// test_query_gateway.cpp
//
// GatewayContext / handle_query / response_json 테스트.
//
// [테스트 범위]
// - 설정의 데이터베이스마다 풀/정책/executor 가 만들어지고 이름으로 찾는다
// - 알 수 없는 데이터베이스: 사용 가능한 목록을 담은 UNKNOWN_DATABASE
// - 속도 제한은 데이터베이스 조회보다 먼저 적용된다
// - limit 은 server.max_result_rows 로 제한된다
// - executor 에 도달하지 않은 거부도 감사 레코드를 남긴다
// - warm_up / close 가 모든 풀에 전달된다
// - 응답 JSON 형식 (null 셀, 이스케이프, details)
// ---------------------------------------------------------------------------

#include "gateway/query_gateway.hpp"
#include "gateway/response_json.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <map>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include "fake_db.hpp"

namespace fs = std::filesystem;
namespace pt = boost::property_tree;

using testing_support::FakeDatabase;
using testing_support::FakePool;
using testing_support::make_rowset;
using testing_support::run_sync;

namespace {

constexpr const char* kCheapPlan =
    R"([{"Plan": {"Node Type": "Seq Scan", "Relation Name": "events", "Total Cost": 4.0, "Plan Rows": 2}}])";

DatabaseConfig database(std::string name) {
    DatabaseConfig db;
    db.name = std::move(name);
    db.policy.tables.denied = {"secrets"};
    return db;
}

class QueryGatewayTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir_             = fs::temp_directory_path() / "pggate_test_gateway" / info->name();
        fs::remove_all(dir_);

        config_.server.max_result_rows               = 5;
        config_.rate_limit.per_client_per_minute     = 2;
        config_.audit.file_path                      = (dir_ / "audit.jsonl").string();
        config_.databases                            = {database("app"), database("analytics")};
    }

    void TearDown() override {
        ctx_.reset();
        fs::remove_all(dir_);
    }

    void start() {
        ctx_ = std::make_unique<GatewayContext>(
            config_, ioc_.get_executor(), [this](const DatabaseConfig& db) -> std::unique_ptr<ConnectionPool> {
                auto fake = std::make_shared<FakeDatabase>();
                fake->handler = [](const std::string& sql) -> std::expected<RowSet, GatewayError> {
                    if (sql.rfind("EXPLAIN", 0) == 0) {
                        return make_rowset({"QUERY PLAN"}, {{std::string(kCheapPlan)}});
                    }
                    return make_rowset({"id"}, {{std::string("1")}, {std::string("2")}});
                };
                databases_[db.name] = fake;
                auto pool           = std::make_unique<FakePool>(db.name, fake);
                pools_[db.name]     = pool.get();
                return pool;
            });
    }

    std::expected<QueryResult, GatewayError> query(std::string db, std::string sql,
                                                   std::optional<std::uint64_t> limit = std::nullopt,
                                                   std::string                  client = "10.1.1.1") {
        QueryRequest request;
        request.database          = std::move(db);
        request.sql               = std::move(sql);
        request.limit             = limit;
        request.question          = "how many?";
        request.context.request_id = "req-" + std::to_string(++sequence_);
        request.context.client_ip  = std::move(client);
        return run_sync(ioc_, handle_query(*ctx_, std::move(request)));
    }

    // 실행 SQL (EXPLAIN 제외)
    std::vector<std::string> executed(const std::string& db) {
        std::vector<std::string> out;
        for (const auto& call : databases_.at(db)->calls) {
            if (call.sql.rfind("EXPLAIN", 0) != 0) {
                out.push_back(call.sql);
            }
        }
        return out;
    }

    std::vector<pt::ptree> audit_records() {
        ctx_.reset();
        std::vector<pt::ptree> records;
        std::ifstream          in(dir_ / "audit.jsonl");
        std::string            line;
        while (std::getline(in, line)) {
            std::istringstream stream(line);
            pt::ptree          tree;
            pt::read_json(stream, tree);
            records.push_back(std::move(tree));
        }
        return records;
    }

    boost::asio::io_context                              ioc_;
    fs::path                                             dir_;
    GatewayConfig                                        config_;
    std::map<std::string, std::shared_ptr<FakeDatabase>> databases_;
    std::map<std::string, FakePool*>                     pools_;
    std::unique_ptr<GatewayContext>                      ctx_;
    int                                                  sequence_{0};
};

}  // namespace

// ---------------------------------------------------------------------------
// GatewayContext
// ---------------------------------------------------------------------------

TEST_F(QueryGatewayTest, BuildsOneRuntimePerDatabase) {
    start();
    EXPECT_EQ(ctx_->database_names(), (std::vector<std::string>{"app", "analytics"}));

    auto* app = ctx_->find("app");
    ASSERT_NE(app, nullptr);
    EXPECT_EQ(app->config.name, "app");
    EXPECT_EQ(app->executor->database(), "app");
    EXPECT_EQ(app->pool.get(), pools_.at("app"));
    EXPECT_EQ(ctx_->find("APP"), nullptr);
    EXPECT_EQ(ctx_->find("missing"), nullptr);
}

TEST_F(QueryGatewayTest, WarmUpAndCloseReachEveryPool) {
    start();
    auto warmed = run_sync(ioc_, ctx_->warm_up());
    EXPECT_TRUE(warmed.has_value());
    EXPECT_EQ(pools_.at("app")->warm_ups, 1u);
    EXPECT_EQ(pools_.at("analytics")->warm_ups, 1u);

    ctx_->close();
    EXPECT_EQ(pools_.at("app")->closes, 1u);
    EXPECT_EQ(pools_.at("analytics")->closes, 1u);
}

// ---------------------------------------------------------------------------
// handle_query
// ---------------------------------------------------------------------------

TEST_F(QueryGatewayTest, RoutesToNamedDatabase) {
    start();
    auto result = query("analytics", "SELECT id FROM events");
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(result->row_count, 2u);

    EXPECT_EQ(executed("analytics").size(), 1u);
    EXPECT_TRUE(databases_.at("app")->calls.empty());
}

TEST_F(QueryGatewayTest, UnknownDatabaseListsAvailable) {
    start();
    auto result = query("warehouse", "SELECT 1");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::kUnknownDatabase);
    EXPECT_EQ(result.error().message, "Unknown database 'warehouse'. Available: app, analytics");
    EXPECT_EQ(result.error().resources, (std::vector<std::string>{"warehouse"}));

    const auto records = audit_records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].get<std::string>("event_type"), "query_denied");
    EXPECT_EQ(records[0].get<std::string>("database"), "warehouse");
    EXPECT_EQ(records[0].get<std::string>("result.status"), "denied");
    EXPECT_EQ(records[0].get<std::string>("result.error_code"), "UNKNOWN_DATABASE");
    EXPECT_EQ(records[0].get<std::string>("query.sql"), "SELECT 1");
}

TEST_F(QueryGatewayTest, RateLimitAppliedBeforeLookup) {
    start();
    ASSERT_TRUE(query("app", "SELECT id FROM users").has_value());
    ASSERT_TRUE(query("app", "SELECT id FROM users").has_value());

    auto limited = query("warehouse", "SELECT id FROM users");
    ASSERT_FALSE(limited.has_value());
    EXPECT_EQ(limited.error().code, ErrorCode::kRateLimitExceeded);
    EXPECT_EQ(limited.error().details.at("scope"), "client");

    // 다른 클라이언트는 자기 버킷을 쓴다
    EXPECT_TRUE(query("app", "SELECT id FROM users", std::nullopt, "10.9.9.9").has_value());
    EXPECT_EQ(executed("app").size(), 3u);

    const auto records = audit_records();
    ASSERT_EQ(records.size(), 4u);
    EXPECT_EQ(records[2].get<std::string>("event_type"), "rate_limit_exceeded");
    EXPECT_EQ(records[2].get<std::string>("result.status"), "denied");
    EXPECT_EQ(records[2].get<std::string>("result.error_code"), "RATE_LIMIT_EXCEEDED");
    EXPECT_EQ(records[2].get<std::string>("client.ip"), "10.1.1.1");
}

TEST_F(QueryGatewayTest, LimitClampedToServerMaximum) {
    config_.rate_limit.enabled = false;
    start();

    ASSERT_TRUE(query("app", "SELECT id FROM users", 100).has_value());
    ASSERT_TRUE(query("app", "SELECT id FROM users").has_value());
    ASSERT_TRUE(query("app", "SELECT id FROM users", 1).has_value());

    EXPECT_EQ(executed("app"), (std::vector<std::string>{"SELECT id FROM users LIMIT 6",
                                                         "SELECT id FROM users LIMIT 6",
                                                         "SELECT id FROM users LIMIT 2"}));
}

TEST_F(QueryGatewayTest, TruncationReportedAgainstClampedLimit) {
    config_.server.max_result_rows = 1;
    start();

    auto result = query("app", "SELECT id FROM users", 50);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->row_count, 1u);
    EXPECT_TRUE(result->truncated);
}

TEST_F(QueryGatewayTest, PolicyIsPerDatabase) {
    config_.databases[1].policy.tables.denied = {"events"};
    start();

    EXPECT_TRUE(query("app", "SELECT id FROM events").has_value());
    auto denied = query("analytics", "SELECT id FROM events");
    ASSERT_FALSE(denied.has_value());
    EXPECT_EQ(denied.error().code, ErrorCode::kTableAccessDenied);
    EXPECT_TRUE(executed("analytics").empty());
}

// ---------------------------------------------------------------------------
// response_json
// ---------------------------------------------------------------------------

TEST(ResponseJson, SuccessDocument) {
    QueryResult result;
    result.columns           = {"id", "note"};
    result.rows              = {{std::string("1"), std::nullopt}, {std::string("2"), std::string("say \"hi\"")}};
    result.row_count         = 2;
    result.truncated         = true;
    result.warnings          = {"SELECT * was expanded"};
    result.execution_time_ms = 1.5;

    EXPECT_EQ(to_json(result),
              R"({"ok":true,"columns":["id","note"],"rows":[["1",null],["2","say \"hi\""]],"row_count":2,)"
              R"("truncated":true,"warnings":["SELECT * was expanded"],"execution_time_ms":1.500})");
}

TEST(ResponseJson, EmptyResult) {
    QueryResult result;
    EXPECT_EQ(to_json(result),
              R"({"ok":true,"columns":[],"rows":[],"row_count":0,"truncated":false,"warnings":[],)"
              R"("execution_time_ms":0.000})");
}

TEST(ResponseJson, ErrorDocument) {
    GatewayError error = make_error(ErrorCode::kRateLimitExceeded, "Rate limit exceeded\n");
    error.resources    = {"10.0.0.1"};
    error.details      = {{"window", "minute"}, {"retry_after", "12.5"}};

    EXPECT_EQ(to_json(error),
              R"({"ok":false,"error":{"code":"RATE_LIMIT_EXCEEDED","message":"Rate limit exceeded\n",)"
              R"("resources":["10.0.0.1"],"details":{"retry_after":"12.5","window":"minute"}}})");
}

TEST(ResponseJson, ErrorWithoutExtras) {
    const auto error = make_error(ErrorCode::kInternalError, "boom");
    EXPECT_EQ(to_json(error),
              R"({"ok":false,"error":{"code":"INTERNAL_ERROR","message":"boom","resources":[],"details":{}}})");
}
