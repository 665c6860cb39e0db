#include "explain/explain_gate.hpp"

#include <algorithm>
#include <sstream>

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "common/sha256.hpp"

namespace {

namespace pt = boost::property_tree;

std::uint64_t to_rows(double value) {
    return value <= 0.0 ? 0 : static_cast<std::uint64_t>(value);
}

void collect_seq_scans(const pt::ptree& node, std::vector<SeqScanNode>& out) {
    if (node.get<std::string>("Node Type", "") == "Seq Scan") {
        out.push_back(SeqScanNode{
            .relation       = node.get<std::string>("Relation Name", "unknown"),
            .estimated_rows = to_rows(node.get<double>("Plan Rows", 0.0)),
        });
    }
    if (const auto children = node.get_child_optional("Plans")) {
        for (const auto& child : *children) {
            collect_seq_scans(child.second, out);
        }
    }
}

GatewayError too_expensive(std::string message, const PlanSummary& plan, const ExplainPolicy& policy) {
    auto err = make_error(ErrorCode::kQueryTooExpensive, std::move(message));
    err.details["estimated_rows"]     = std::to_string(plan.estimated_rows);
    err.details["total_cost"]         = fmt::format("{:.2f}", plan.total_cost);
    err.details["max_estimated_rows"] = std::to_string(policy.max_estimated_rows);
    err.details["max_estimated_cost"] = fmt::format("{:.2f}", policy.max_estimated_cost);
    return err;
}

}  // namespace

std::expected<PlanSummary, GatewayError> parse_explain_json(std::string_view json) {
    try {
        std::istringstream in("{\"v\":" + std::string(json) + "}");
        pt::ptree tree;
        pt::read_json(in, tree);

        const auto& top = tree.get_child("v");
        if (top.empty()) {
            return std::unexpected(make_error(ErrorCode::kInternalError, "EXPLAIN output is empty"));
        }
        const auto& plan = top.begin()->second.get_child("Plan");

        PlanSummary summary;
        summary.estimated_rows = to_rows(plan.get<double>("Plan Rows"));
        summary.total_cost     = plan.get<double>("Total Cost");
        collect_seq_scans(plan, summary.seq_scans);
        return summary;
    } catch (const pt::ptree_error& e) {
        return std::unexpected(make_error(
            ErrorCode::kInternalError, fmt::format("unexpected EXPLAIN output: {}", e.what())));
    }
}

// ---------------------------------------------------------------------------
// ExplainCostGate
// ---------------------------------------------------------------------------

ExplainCostGate::ExplainCostGate(ExplainPolicy policy, Clock clock)
    : policy_{std::move(policy)}, clock_{std::move(clock)} {}

std::expected<ExplainResult, GatewayError> ExplainCostGate::evaluate(const PlanSummary& plan) const {
    if (plan.estimated_rows > policy_.max_estimated_rows) {
        return std::unexpected(too_expensive(
            fmt::format("Estimated rows ({}) exceeds limit ({})", plan.estimated_rows,
                        policy_.max_estimated_rows),
            plan, policy_));
    }
    if (plan.total_cost > policy_.max_estimated_cost) {
        return std::unexpected(too_expensive(
            fmt::format("Estimated cost ({:.2f}) exceeds limit ({:.2f})", plan.total_cost,
                        policy_.max_estimated_cost),
            plan, policy_));
    }

    if (policy_.deny_seq_scan_on_large_tables) {
        std::lock_guard<std::mutex> guard(mutex_);
        for (const auto& scan : plan.seq_scans) {
            std::uint64_t rows = scan.estimated_rows;
            if (auto it = table_row_counts_.find(scan.relation); it != table_row_counts_.end()) {
                rows = it->second;
            }
            if (rows > policy_.large_table_threshold) {
                auto err = too_expensive(
                    fmt::format("Sequential scan on large table '{}' (~{} rows) denied", scan.relation, rows),
                    plan, policy_);
                err.resources.push_back(scan.relation);
                return std::unexpected(std::move(err));
            }
        }
    }

    return ExplainResult{
        .estimated_rows = plan.estimated_rows,
        .total_cost     = plan.total_cost,
    };
}

std::expected<ExplainResult, GatewayError> ExplainCostGate::on_explain_failure(GatewayError error) const {
    if (!policy_.fail_open_on_error) {
        spdlog::warn("explain_gate: EXPLAIN failed, rejecting: {}", describe(error));
        return std::unexpected(std::move(error));
    }
    spdlog::warn("explain_gate: EXPLAIN failed, passing (fail-open): {}", describe(error));
    ExplainResult result;
    result.skipped = true;
    result.warnings.push_back(fmt::format("EXPLAIN failed: {}", error.message));
    return result;
}

auto ExplainCostGate::validate(DbConnection& conn, std::string sql)
    -> boost::asio::awaitable<std::expected<ExplainResult, GatewayError>>
{
    if (!policy_.enabled) {
        ExplainResult result;
        result.skipped = true;
        co_return result;
    }

    const std::string key = sha256_hex(sql);
    if (auto cached = cache_lookup(key)) {
        spdlog::debug("explain_gate: cache hit {}", key.substr(0, 16));
        auto result = evaluate(*cached);
        if (result) {
            result->from_cache = true;
        }
        co_return result;
    }

    auto rows = co_await conn.fetch("EXPLAIN (FORMAT JSON) " + sql, policy_.timeout);
    if (!rows) {
        co_return on_explain_failure(std::move(rows.error()));
    }
    if (rows->rows.empty() || rows->rows.front().empty() || !rows->rows.front().front()) {
        co_return on_explain_failure(make_error(ErrorCode::kInternalError, "EXPLAIN returned no plan"));
    }

    auto plan = parse_explain_json(*rows->rows.front().front());
    if (!plan) {
        co_return on_explain_failure(std::move(plan.error()));
    }

    spdlog::debug("explain_gate: rows={} cost={:.2f} seq_scans={}", plan->estimated_rows, plan->total_cost,
                  plan->seq_scans.size());
    cache_store(key, *plan);
    co_return evaluate(*plan);
}

void ExplainCostGate::update_table_row_counts(std::map<std::string, std::uint64_t> counts) {
    std::lock_guard<std::mutex> guard(mutex_);
    table_row_counts_ = std::move(counts);
}

std::size_t ExplainCostGate::cache_size() const {
    std::lock_guard<std::mutex> guard(mutex_);
    return cache_.size();
}

std::optional<PlanSummary> ExplainCostGate::cache_lookup(const std::string& key) {
    std::lock_guard<std::mutex> guard(mutex_);
    const auto it = cache_.find(key);
    if (it == cache_.end()) {
        return std::nullopt;
    }
    if (clock_() - it->second.inserted_at >= policy_.cache_ttl) {
        cache_.erase(it);
        return std::nullopt;
    }
    return it->second.plan;
}

void ExplainCostGate::cache_store(const std::string& key, PlanSummary plan) {
    if (policy_.cache_max_size == 0 || key.empty()) {
        return;
    }
    std::lock_guard<std::mutex> guard(mutex_);
    const auto now = clock_();

    if (cache_.size() >= policy_.cache_max_size && cache_.find(key) == cache_.end()) {
        std::erase_if(cache_, [&](const auto& entry) {
            return now - entry.second.inserted_at >= policy_.cache_ttl;
        });
    }
    if (cache_.size() >= policy_.cache_max_size && cache_.find(key) == cache_.end()) {
        const auto oldest = std::min_element(cache_.begin(), cache_.end(), [](const auto& a, const auto& b) {
            return a.second.inserted_at < b.second.inserted_at;
        });
        cache_.erase(oldest);
    }
    cache_[key] = CacheEntry{.plan = std::move(plan), .inserted_at = now};
}
