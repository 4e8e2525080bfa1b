// query_api_test.cpp - JSON rendering and status codes of the analytics queries

#include <gtest/gtest.h>

#include "query_api.hpp"
#include "test_helpers.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;
using test_helpers::outcome;
using test_helpers::series;

class QueryApiTest : public ::testing::Test {
protected:
    void SetUp() override {
        ledger.set_write_listener([this](const TradeOutcome&) { pipeline.mark_stale(); });
    }

    void seed_and_refresh() {
        for (auto& row : series("NVDA", 8, 2)) {
            row.symbol = "NVDA";
            row.signals = {"VWAP Cross"};
            row.catalyst = "earnings";
            ledger.append(row);
        }
        ASSERT_EQ(api.refresh().status, 200);
    }

    Config config;
    InMemoryLedger ledger{config.breakeven_band_pct};
    OverrideRegistry overrides;
    DefaultNarrativeGenerator narrative{config};
    AnalyticsPipeline pipeline{config, ledger, overrides, narrative};
    QueryApi api{pipeline, overrides};
};

// ===========================================================================
// 1. Before the first refresh
// ===========================================================================

TEST_F(QueryApiTest, QueriesReturnNotComputedBeforeRefresh) {
    for (const auto& result : {api.engines(), api.platform_health(), api.calibration(),
                               api.signal_weights(), api.historical_stats(), api.symbol("NVDA")}) {
        EXPECT_EQ(result.status, 503);
        EXPECT_EQ(result.body["error"], "not_computed");
    }
}

TEST_F(QueryApiTest, ServiceHealthReportsNotComputed) {
    auto result = api.service_health();

    EXPECT_EQ(result.status, 200);
    EXPECT_EQ(result.body["computed"], false);
    EXPECT_TRUE(result.body["version"].is_null());
}

// ===========================================================================
// 2. Envelope and staleness
// ===========================================================================

TEST_F(QueryApiTest, EnvelopeCarriesVersionAndStaleFlag) {
    seed_and_refresh();

    auto fresh = api.engines();
    EXPECT_EQ(fresh.status, 200);
    EXPECT_EQ(fresh.body["version"], 1);
    EXPECT_EQ(fresh.body["stale"], false);
    EXPECT_TRUE(fresh.body["computed_at"].is_string());
    EXPECT_EQ(fresh.body["engines"].size(), 1u);
    EXPECT_EQ(fresh.body["engines"][0]["key"], "ai");

    ledger.append(outcome("late").closed(50).build());
    EXPECT_EQ(api.engines().body["stale"], true);
}

TEST_F(QueryApiTest, RefreshReportsCounts) {
    seed_and_refresh();

    auto result = api.refresh();

    EXPECT_EQ(result.status, 200);
    EXPECT_EQ(result.body["outcomes"], 10);
    EXPECT_EQ(result.body["calibration_bins"], 10);
    EXPECT_EQ(result.body["confidence_bands"], 6);
    EXPECT_EQ(result.body["version"], 2);
}

TEST_F(QueryApiTest, RefreshFailureMapsToStatus) {
    test_helpers::UnavailableLedger broken;
    AnalyticsPipeline failing(config, broken, overrides, narrative);
    QueryApi failing_api(failing, overrides);

    auto result = failing_api.refresh();

    EXPECT_EQ(result.status, 503);
    EXPECT_EQ(result.body["error"], "ledger_unavailable");
}

TEST_F(QueryApiTest, ServiceHealthReflectsStoreProbe) {
    seed_and_refresh();
    api.set_store_probe([] { return false; });

    auto result = api.service_health();

    EXPECT_EQ(result.body["status"], "degraded");
    EXPECT_EQ(result.body["fresh"], true);
    EXPECT_EQ(result.body["store_connected"], false);
}

// ===========================================================================
// 3. Calibration
// ===========================================================================

TEST_F(QueryApiTest, CalibrateValidatesInput) {
    seed_and_refresh();

    EXPECT_EQ(api.calibrate("abc").status, 400);
    EXPECT_EQ(api.calibrate("150").status, 400);
    EXPECT_EQ(api.calibrate("60x").status, 400);

    auto ok = api.calibrate("60");
    EXPECT_EQ(ok.status, 200);
    EXPECT_EQ(ok.body["original_confidence"], 60.0);
}

// ===========================================================================
// 4. Signal weights
// ===========================================================================

TEST_F(QueryApiTest, OverrideLifecycle) {
    seed_and_refresh();
    std::vector<std::pair<std::string, std::optional<double>>> seen;
    api.set_override_listener([&seen](const std::string& name, const std::optional<double>& w) {
        seen.emplace_back(name, w);
    });

    auto set = api.set_override("VWAP Cross", json{{"weight", 1.5}});
    ASSERT_EQ(set.status, 200);
    EXPECT_EQ(set.body["signal"]["effective_weight"], 1.5);
    EXPECT_EQ(set.body["signal"]["is_overridden"], true);

    auto weights = api.signal_weights();
    EXPECT_EQ(weights.body["summary"]["overridden_count"], 1);

    EXPECT_EQ(api.clear_override("VWAP Cross").status, 200);
    EXPECT_EQ(api.clear_override("VWAP Cross").status, 404);

    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[0].second, std::optional<double>(1.5));
    EXPECT_FALSE(seen[1].second.has_value());
}

TEST_F(QueryApiTest, InvalidOverrideRejected) {
    seed_and_refresh();

    EXPECT_EQ(api.set_override("VWAP Cross", json{{"weight", -1}}).status, 400);
    EXPECT_EQ(api.set_override("VWAP Cross", json{{"weight", "high"}}).status, 400);
    EXPECT_EQ(api.set_override("VWAP Cross", json::array()).status, 400);
    EXPECT_FALSE(overrides.get("VWAP Cross").has_value());
}

TEST_F(QueryApiTest, WeightedConfidenceEndpoint) {
    seed_and_refresh();
    api.set_override("Breakout", json{{"weight", 1.5}});

    auto result = api.weighted_confidence(json{{"signals", json::array({"Breakout", "Unknown"})}, {"base_confidence", 60}});

    EXPECT_EQ(result.status, 200);
    EXPECT_EQ(result.body["adjusted_confidence"], 67.5);
    EXPECT_EQ(result.body["signal_contributions"].size(), 2u);

    EXPECT_EQ(api.weighted_confidence(json{{"signals", json::array({"x"})}}).status, 400);
    EXPECT_EQ(api.weighted_confidence(json{{"signals", "x"}, {"base_confidence", 60}}).status, 400);
}

// ===========================================================================
// 5. Historical intelligence
// ===========================================================================

TEST_F(QueryApiTest, SymbolLookupIncludesRecommendations) {
    seed_and_refresh();

    auto result = api.symbol("NVDA");

    EXPECT_EQ(result.status, 200);
    EXPECT_EQ(result.body["profile"]["closed_ideas"], 10);
    EXPECT_EQ(result.body["recent_trades"].size(), 10u);
    EXPECT_FALSE(result.body["recommendations"].empty());

    auto unknown = api.symbol("ZZZZ");
    EXPECT_EQ(unknown.status, 200);
    EXPECT_TRUE(unknown.body["profile"]["overall_win_rate"].is_null());

    EXPECT_EQ(api.symbol("  ").status, 400);
}

TEST_F(QueryApiTest, AdjustmentEndpoint) {
    seed_and_refresh();

    auto result = api.adjustment("NVDA", "earnings", "long");
    EXPECT_EQ(result.status, 200);
    // +10 for an 80% symbol, +8 for its best catalyst
    EXPECT_EQ(result.body["adjustment"], 18);

    EXPECT_EQ(api.adjustment("NVDA", "earnings", "sideways").status, 400);
    EXPECT_EQ(api.adjustment("", "earnings", "long").status, 400);
}
