// historical_intel_test.cpp - symbol profiles, ledger-wide stats and confidence adjustments

#include <gtest/gtest.h>

#include "historical_intel.hpp"
#include "catalyst.hpp"
#include "narrative.hpp"
#include "test_helpers.hpp"

using test_helpers::day;
using test_helpers::outcome;

class HistoricalIntelligenceTest : public ::testing::Test {
protected:
    Config config;
    HistoricalIntelligence intel{config};
    LedgerSnapshot ledger;
    int next_day = 1;

    void add(const std::string& symbol, double ret, const std::string& catalyst = "",
             Direction dir = Direction::Long, double confidence = 60.0) {
        auto builder = outcome(symbol + "-" + std::to_string(next_day))
                           .symbol(symbol)
                           .ret(ret)
                           .dir(dir)
                           .confidence(confidence)
                           .closed(next_day++);
        if (!catalyst.empty()) {
            builder.catalyst(catalyst);
        }
        ledger.outcomes.push_back(builder.build());
    }

    void add_many(const std::string& symbol, int wins, int losses, const std::string& catalyst = "",
                  Direction dir = Direction::Long) {
        for (int i = 0; i < wins; ++i) add(symbol, 3.0, catalyst, dir);
        for (int i = 0; i < losses; ++i) add(symbol, -2.0, catalyst, dir);
    }

    // NVDA: earnings 3/4, fda 0/3, momentum 2/2 (below the catalyst minimum)
    void seed_nvda() {
        add_many("NVDA", 3, 1, "Q3 earnings beat");
        add_many("NVDA", 0, 3, "FDA approval");
        add_many("NVDA", 2, 0, "unusual volume");
    }
};

// ===========================================================================
// 1. Catalyst categorization
// ===========================================================================

TEST(CatalystTest, KeywordsMapToCategories) {
    EXPECT_EQ(categorize_catalyst("Q3 Earnings Beat"), "earnings");
    EXPECT_EQ(categorize_catalyst("FDA approval for new drug"), "fda_approval");
    EXPECT_EQ(categorize_catalyst("Pentagon contract award"), "government_contract");
    EXPECT_EQ(categorize_catalyst("Bitcoin rally"), "crypto_news");
}

TEST(CatalystTest, CategoryIdsKeptAndUnknownIsOther) {
    EXPECT_EQ(categorize_catalyst("merger_acquisition"), "merger_acquisition");
    EXPECT_EQ(categorize_catalyst("  "), "other");
    EXPECT_EQ(categorize_catalyst("weather"), "other");
    EXPECT_EQ(catalyst_categories().back(), "other");
}

// ===========================================================================
// 2. Symbol profiles
// ===========================================================================

TEST_F(HistoricalIntelligenceTest, ProfileCountsAndRates) {
    seed_nvda();
    ledger.open_ideas["NVDA"] = 2;

    auto index = intel.build(ledger);
    const auto& p = index.profiles.at("NVDA");

    EXPECT_EQ(p.closed_ideas, 9);
    EXPECT_EQ(p.total_ideas, 11);
    EXPECT_EQ(p.wins, 5);
    EXPECT_EQ(p.losses, 4);
    EXPECT_NEAR(*p.overall_win_rate, 500.0 / 9.0, 1e-9);
    EXPECT_NEAR(*p.long_win_rate, 500.0 / 9.0, 1e-9);
    EXPECT_FALSE(p.short_win_rate.has_value());
    EXPECT_NEAR(*p.total_pnl, 5 * 3.0 - 4 * 2.0, 1e-9);
    EXPECT_NEAR(*p.profit_factor, 15.0 / 8.0, 1e-9);
    ASSERT_TRUE(p.last_trade_at.has_value());
    EXPECT_EQ(*p.last_trade_at, day(9));
}

TEST_F(HistoricalIntelligenceTest, BestAndWorstCatalyst) {
    seed_nvda();

    auto index = intel.build(ledger);
    const auto& p = index.profiles.at("NVDA");

    EXPECT_EQ(p.best_catalyst, std::optional<std::string>("earnings"));
    EXPECT_NEAR(*p.best_catalyst_win_rate, 75.0, 1e-9);
    EXPECT_EQ(p.worst_catalyst, std::optional<std::string>("fda_approval"));
    EXPECT_NEAR(*p.worst_catalyst_win_rate, 0.0, 1e-9);
    // momentum_surge has only 2 samples
    EXPECT_EQ(index.catalysts.at("NVDA").size(), 2u);
}

TEST_F(HistoricalIntelligenceTest, SingleQualifiedCatalystHasNoWorst) {
    add_many("AMD", 3, 0, "earnings");

    auto index = intel.build(ledger);
    const auto& p = index.profiles.at("AMD");

    EXPECT_TRUE(p.best_catalyst.has_value());
    EXPECT_FALSE(p.worst_catalyst.has_value());
}

TEST_F(HistoricalIntelligenceTest, SymbolWithOnlyOpenIdeasHasNullRates) {
    ledger.open_ideas["TSLA"] = 3;

    auto index = intel.build(ledger);
    const auto& p = index.profiles.at("TSLA");

    EXPECT_EQ(p.total_ideas, 3);
    EXPECT_EQ(p.closed_ideas, 0);
    EXPECT_FALSE(p.overall_win_rate.has_value());
    EXPECT_FALSE(p.profit_factor.has_value());
    EXPECT_FALSE(p.last_trade_at.has_value());
}

TEST_F(HistoricalIntelligenceTest, UnknownSymbolGivesEmptyProfile) {
    seed_nvda();
    auto index = intel.build(ledger);

    auto result = intel.lookup(index, "ZZZZ");

    EXPECT_EQ(result.profile.symbol, "ZZZZ");
    EXPECT_EQ(result.profile.total_ideas, 0);
    EXPECT_FALSE(result.profile.overall_win_rate.has_value());
    EXPECT_TRUE(result.recent_trades.empty());
    EXPECT_TRUE(result.best_catalysts.empty());
}

TEST_F(HistoricalIntelligenceTest, LookupRecentTradesNewestFirstAndLimited) {
    config.recent_trades_limit = 3;
    seed_nvda();
    auto index = intel.build(ledger);

    auto result = intel.lookup(index, "NVDA");

    ASSERT_EQ(result.recent_trades.size(), 3u);
    EXPECT_EQ(result.recent_trades[0].closed_at, day(9));
    EXPECT_EQ(result.recent_trades[2].closed_at, day(7));
    ASSERT_EQ(result.best_catalysts.size(), 1u);
    ASSERT_EQ(result.worst_catalysts.size(), 1u);
    EXPECT_EQ(result.best_catalysts[0].catalyst, "earnings");
    EXPECT_EQ(result.worst_catalysts[0].catalyst, "fda_approval");
}

TEST_F(HistoricalIntelligenceTest, LookupNeverListsCatalystAsBothBestAndWorst) {
    add_many("AAPL", 3, 1, "earnings");

    auto single = intel.lookup(intel.build(ledger), "AAPL");
    ASSERT_EQ(single.best_catalysts.size(), 1u);
    EXPECT_TRUE(single.worst_catalysts.empty());

    add_many("AAPL", 2, 1, "FDA approval");
    add_many("AAPL", 1, 2, "unusual volume");
    add_many("AAPL", 0, 3, "analyst upgrade");
    auto index = intel.build(ledger);
    auto several = intel.lookup(index, "AAPL");

    ASSERT_EQ(index.catalysts.at("AAPL").size(), 4u);
    ASSERT_EQ(several.best_catalysts.size(), 2u);
    ASSERT_EQ(several.worst_catalysts.size(), 2u);
    for (const auto& best : several.best_catalysts) {
        for (const auto& worst : several.worst_catalysts) {
            EXPECT_NE(best.catalyst, worst.catalyst);
        }
    }
    EXPECT_EQ(several.best_catalysts[0].catalyst, "earnings");
    EXPECT_EQ(several.worst_catalysts[0].catalyst, "analyst_upgrade");
}

TEST_F(HistoricalIntelligenceTest, SymbolRecommendationsFlagWeakCatalyst) {
    seed_nvda();
    auto index = intel.build(ledger);
    DefaultNarrativeGenerator narrative(config);

    auto recs = narrative.symbol_recommendations(intel.lookup(index, "NVDA"));

    bool found = false;
    for (const auto& r : recs) {
        if (r.find("Avoid catalyst: fda_approval") != std::string::npos) found = true;
    }
    EXPECT_TRUE(found);
}

TEST_F(HistoricalIntelligenceTest, SetupsSplitCatalystByDirection) {
    // Earnings works long (3/3) but fails short (1/4)
    add_many("AAPL", 3, 0, "earnings", Direction::Long);
    add_many("AAPL", 1, 3, "earnings", Direction::Short);
    add_many("AAPL", 1, 1, "FDA approval", Direction::Short);
    auto index = intel.build(ledger);
    DefaultNarrativeGenerator narrative(config);

    auto result = intel.lookup(index, "AAPL");

    ASSERT_EQ(result.setups.size(), 2u);
    EXPECT_EQ(result.setups[0].direction, Direction::Long);
    EXPECT_EQ(result.setups[0].catalyst, "earnings");
    EXPECT_NEAR(result.setups[0].win_rate, 100.0, 1e-9);
    EXPECT_EQ(result.setups[1].direction, Direction::Short);
    EXPECT_EQ(result.setups[1].trades, 4);
    EXPECT_NEAR(result.setups[1].win_rate, 25.0, 1e-9);

    auto recs = narrative.symbol_recommendations(result);
    bool avoid_short = false;
    bool favor_long = false;
    for (const auto& r : recs) {
        if (r == "Avoid shorting this symbol on earnings catalysts (25% over 4 trades)") avoid_short = true;
        if (r == "Favor long setups on earnings catalysts (100% over 3 trades)") favor_long = true;
    }
    EXPECT_TRUE(avoid_short);
    EXPECT_TRUE(favor_long);
    EXPECT_EQ(result.to_json()["setups"].size(), 2u);
}

// ===========================================================================
// 3. Ledger-wide stats
// ===========================================================================

TEST_F(HistoricalIntelligenceTest, OverallStatsIncludeOpenIdeas) {
    seed_nvda();
    add("AMD", 0.2);
    ledger.open_ideas["TSLA"] = 4;

    auto stats = intel.build(ledger).stats;

    EXPECT_EQ(stats.overall.closed_ideas, 10);
    EXPECT_EQ(stats.overall.total_ideas, 14);
    EXPECT_EQ(stats.overall.breakevens, 1);
    EXPECT_NEAR(*stats.overall.win_rate, 50.0, 1e-9);
    EXPECT_NEAR(stats.overall.total_pnl, 7.2, 1e-9);
}

TEST_F(HistoricalIntelligenceTest, MissingFieldsGroupAsUnknownAndOther) {
    add("AMD", 1.0);

    auto stats = intel.build(ledger).stats;

    ASSERT_EQ(stats.by_asset_type.size(), 1u);
    EXPECT_EQ(stats.by_asset_type[0].key, "unknown");
    ASSERT_EQ(stats.by_catalyst.size(), 1u);
    EXPECT_EQ(stats.by_catalyst[0].key, "other");
    ASSERT_EQ(stats.by_direction.size(), 1u);
    EXPECT_EQ(stats.by_direction[0].key, "long");
}

TEST_F(HistoricalIntelligenceTest, ConfidenceBandEdges) {
    add("A", 1.0, "", Direction::Long, 100.0);
    add("A", 1.0, "", Direction::Long, 90.0);
    add("A", 1.0, "", Direction::Long, 89.9);
    add("A", -1.0, "", Direction::Long, 50.0);
    add("A", 1.0, "", Direction::Long, 49.0);

    auto bands = intel.build(ledger).stats.by_confidence_band;

    ASSERT_EQ(bands.size(), 6u);
    EXPECT_EQ(bands[0].band, "90-100");
    EXPECT_EQ(bands[0].ideas, 2);
    EXPECT_EQ(bands[1].ideas, 1);
    EXPECT_EQ(bands[4].ideas, 1);
    EXPECT_NEAR(*bands[4].actual_win_rate, 0.0, 1e-9);
    EXPECT_NEAR(*bands[4].calibration_error, -55.0, 1e-9);
    EXPECT_EQ(bands[5].ideas, 1);
    EXPECT_FALSE(bands[2].actual_win_rate.has_value());
}

TEST_F(HistoricalIntelligenceTest, PerformersNeedMinimumTrades) {
    add_many("GOOD", 3, 0);
    add_many("BAD", 0, 4);
    add_many("MID", 2, 2);
    add_many("TINY", 2, 0);

    auto stats = intel.build(ledger).stats;

    ASSERT_EQ(stats.top_performers.size(), 3u);
    EXPECT_EQ(stats.top_performers[0].key, "GOOD");
    EXPECT_EQ(stats.top_performers[2].key, "BAD");
    EXPECT_EQ(stats.worst_performers[0].key, "BAD");
    for (const auto& p : stats.top_performers) {
        EXPECT_NE(p.key, "TINY");
    }
}

// ===========================================================================
// 4. Confidence adjustment
// ===========================================================================

TEST_F(HistoricalIntelligenceTest, TooFewClosedIdeasGivesNoAdjustment) {
    add_many("NEW", 4, 0);
    auto index = intel.build(ledger);

    auto adj = intel.adjustment(index, "NEW", "earnings", "long");

    EXPECT_EQ(adj.adjustment, 0);
    EXPECT_TRUE(adj.reasons.empty());
    EXPECT_EQ(adj.to_json()["reason"], "No historical data");
}

TEST_F(HistoricalIntelligenceTest, StrongSymbolAddsTen) {
    add_many("WIN", 8, 2);
    auto index = intel.build(ledger);

    auto adj = intel.adjustment(index, "WIN", "", "long");

    EXPECT_EQ(adj.adjustment, 10);
    EXPECT_NEAR(*adj.symbol_win_rate, 80.0, 1e-9);
}

TEST_F(HistoricalIntelligenceTest, WeakSymbolSubtractsFifteen) {
    add_many("LOSE", 1, 4);
    auto index = intel.build(ledger);

    EXPECT_EQ(intel.adjustment(index, "LOSE", "", "long").adjustment, -15);
}

TEST_F(HistoricalIntelligenceTest, DirectionBiasAdjustsBothWays) {
    add_many("BIAS", 5, 0, "", Direction::Long);
    add_many("BIAS", 0, 5, "", Direction::Short);
    auto index = intel.build(ledger);

    EXPECT_EQ(intel.adjustment(index, "BIAS", "", "long").adjustment, 5);
    EXPECT_EQ(intel.adjustment(index, "BIAS", "", "buy").adjustment, 5);
    EXPECT_EQ(intel.adjustment(index, "BIAS", "", "short").adjustment, -5);
    EXPECT_EQ(intel.adjustment(index, "BIAS", "", "sideways").adjustment, 0);
}

TEST_F(HistoricalIntelligenceTest, CatalystAdjustments) {
    seed_nvda();
    auto index = intel.build(ledger);

    auto best = intel.adjustment(index, "NVDA", "Q4 earnings", "long");
    EXPECT_EQ(best.adjustment, 8);
    EXPECT_NEAR(*best.catalyst_win_rate, 75.0, 1e-9);

    auto worst = intel.adjustment(index, "NVDA", "FDA decision", "long");
    EXPECT_EQ(worst.adjustment, -10);
    EXPECT_NEAR(*worst.catalyst_win_rate, 0.0, 1e-9);

    auto json = worst.to_json();
    EXPECT_NE(json["reason"].get<std::string>().find("worst catalyst"), std::string::npos);
}
