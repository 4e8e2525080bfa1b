// pipeline_test.cpp - AnalyticsPipeline refresh, freshness, failure handling and overrides

#include <gtest/gtest.h>

#include "pipeline.hpp"
#include "errors.hpp"
#include "test_helpers.hpp"

#include <stdexcept>
#include <thread>

using test_helpers::outcome;
using test_helpers::series;

namespace {

// Fires a callback while the pipeline is reading
class HookedLedger : public OutcomeLedger {
public:
    explicit HookedLedger(OutcomeLedger& inner) : inner_(inner) {}

    std::function<void()> on_load;

    LedgerSnapshot load_snapshot() override {
        auto snapshot = inner_.load_snapshot();
        if (on_load) on_load();
        return snapshot;
    }

private:
    OutcomeLedger& inner_;
};

} // namespace

class AnalyticsPipelineTest : public ::testing::Test {
protected:
    void SetUp() override {
        ledger.set_write_listener([this](const TradeOutcome&) { pipeline.mark_stale(); });
    }

    void seed() {
        for (auto& row : series("VWAP", 28, 12)) {
            row.signals = {"VWAP Cross"};
            ledger.append(row);
        }
        for (auto& row : series("GAP", 2, 8, 2.0, -1.0, 100)) {
            row.engine = "flow";
            row.signals = {"Gap Fill", "VWAP Cross"};
            row.catalyst = "Q2 earnings";
            ledger.append(row);
        }
    }

    Config config;
    InMemoryLedger ledger{config.breakeven_band_pct};
    OverrideRegistry overrides;
    DefaultNarrativeGenerator narrative{config};
    AnalyticsPipeline pipeline{config, ledger, overrides, narrative};
};

// ===========================================================================
// 1. Refresh
// ===========================================================================

TEST_F(AnalyticsPipelineTest, NoSnapshotBeforeFirstRefresh) {
    EXPECT_EQ(pipeline.current(), nullptr);
    EXPECT_FALSE(pipeline.is_fresh());
    EXPECT_EQ(pipeline.apply_overrides(), nullptr);
}

TEST_F(AnalyticsPipelineTest, RefreshBuildsEveryTable) {
    seed();

    auto snap = pipeline.refresh();

    ASSERT_NE(snap, nullptr);
    EXPECT_EQ(snap->version, 1u);
    EXPECT_EQ(snap->outcome_count, 50);
    EXPECT_EQ(snap->engine_metrics.size(), 2u);
    EXPECT_EQ(snap->signal_stats.size(), 2u);
    EXPECT_EQ(snap->signal_weights.size(), 2u);
    EXPECT_EQ(snap->calibration.total_predictions, 50);
    EXPECT_EQ(snap->historical.stats.overall.closed_ideas, 50);
    EXPECT_TRUE(snap->health.overall.has_value());
    EXPECT_FALSE(snap->calibration.recommendations.empty());
    EXPECT_EQ(pipeline.current(), snap);
}

TEST_F(AnalyticsPipelineTest, RefreshIsIdempotentForUnchangedLedger) {
    seed();

    auto first = pipeline.refresh();
    auto second = pipeline.refresh();

    EXPECT_EQ(second->version, first->version + 1);
    EXPECT_EQ(first->engine_metrics.size(), second->engine_metrics.size());
    for (size_t i = 0; i < first->engine_metrics.size(); ++i) {
        EXPECT_EQ(first->engine_metrics[i].to_json(), second->engine_metrics[i].to_json());
    }
    EXPECT_EQ(first->calibration.to_json(), second->calibration.to_json());
    EXPECT_EQ(first->historical.stats.to_json(), second->historical.stats.to_json());

    ASSERT_EQ(first->signal_weights.size(), second->signal_weights.size());
    for (size_t i = 0; i < first->signal_weights.size(); ++i) {
        EXPECT_EQ(first->signal_weights[i].to_json(), second->signal_weights[i].to_json());
    }
    ASSERT_EQ(first->historical.profiles.size(), second->historical.profiles.size());
    for (const auto& [symbol, profile] : first->historical.profiles) {
        auto it = second->historical.profiles.find(symbol);
        ASSERT_NE(it, second->historical.profiles.end()) << symbol;
        EXPECT_EQ(profile.to_json(), it->second.to_json()) << symbol;
    }
}

TEST_F(AnalyticsPipelineTest, EmptyLedgerStillProducesSnapshot) {
    auto snap = pipeline.refresh();

    EXPECT_EQ(snap->outcome_count, 0);
    EXPECT_TRUE(snap->engine_metrics.empty());
    EXPECT_FALSE(snap->calibration.brier_score.has_value());
    EXPECT_EQ(snap->historical.stats.overall.total_ideas, 0);
}

// ===========================================================================
// 2. Freshness
// ===========================================================================

TEST_F(AnalyticsPipelineTest, LedgerWriteMakesSnapshotStale) {
    seed();
    pipeline.refresh();
    EXPECT_TRUE(pipeline.is_fresh());

    ledger.append(outcome("late").closed(200).build());
    EXPECT_FALSE(pipeline.is_fresh());

    pipeline.refresh();
    EXPECT_TRUE(pipeline.is_fresh());
    EXPECT_EQ(pipeline.current()->outcome_count, 51);
}

TEST_F(AnalyticsPipelineTest, WriteDuringLoadLeavesSnapshotStale) {
    HookedLedger hooked(ledger);
    AnalyticsPipeline racing(config, hooked, overrides, narrative);
    hooked.on_load = [&racing] { racing.mark_stale(); };

    racing.refresh();

    EXPECT_FALSE(racing.is_fresh());
}

// ===========================================================================
// 3. Failures keep the previous snapshot
// ===========================================================================

TEST_F(AnalyticsPipelineTest, UnavailableLedgerRaisesAndKeepsSnapshot) {
    test_helpers::UnavailableLedger broken;
    AnalyticsPipeline failing(config, broken, overrides, narrative);

    try {
        failing.refresh();
        FAIL() << "expected RecomputeError";
    } catch (const RecomputeError& e) {
        EXPECT_EQ(e.kind(), RecomputeErrorKind::LedgerUnavailable);
    }
    EXPECT_EQ(failing.current(), nullptr);
}

TEST_F(AnalyticsPipelineTest, PersistFailureKeepsPreviousSnapshot) {
    seed();
    auto good = pipeline.refresh();
    pipeline.set_persist_sink([](const DerivedSnapshot&) {
        throw std::runtime_error("disk full");
    });

    try {
        pipeline.refresh();
        FAIL() << "expected RecomputeError";
    } catch (const RecomputeError& e) {
        EXPECT_EQ(e.kind(), RecomputeErrorKind::PersistFailed);
    }
    EXPECT_EQ(pipeline.current(), good);
}

TEST_F(AnalyticsPipelineTest, PersistSinkSeesSnapshotBeforePublish) {
    seed();
    uint64_t persisted_version = 0;
    pipeline.set_persist_sink([&](const DerivedSnapshot& s) {
        persisted_version = s.version;
        EXPECT_EQ(pipeline.current(), nullptr);
    });

    auto snap = pipeline.refresh();

    EXPECT_EQ(persisted_version, snap->version);
}

TEST_F(AnalyticsPipelineTest, AbortDuringRefreshDiscardsResult) {
    seed();
    auto good = pipeline.refresh();

    HookedLedger hooked(ledger);
    AnalyticsPipeline aborting(config, hooked, overrides, narrative);
    hooked.on_load = [&aborting] { aborting.abort(); };

    try {
        aborting.refresh();
        FAIL() << "expected RecomputeError";
    } catch (const RecomputeError& e) {
        EXPECT_EQ(e.kind(), RecomputeErrorKind::Aborted);
    }
    EXPECT_EQ(aborting.current(), nullptr);

    // The flag resets on the next refresh
    hooked.on_load = nullptr;
    EXPECT_NE(aborting.refresh(), nullptr);
}

TEST_F(AnalyticsPipelineTest, AbortAfterPersistStillPublishes) {
    seed();
    pipeline.refresh();

    uint64_t persisted_version = 0;
    pipeline.set_persist_sink([&](const DerivedSnapshot& s) {
        persisted_version = s.version;
        pipeline.abort();
    });

    auto snap = pipeline.refresh();

    ASSERT_NE(snap, nullptr);
    EXPECT_EQ(persisted_version, 2u);
    EXPECT_EQ(pipeline.current()->version, persisted_version);
}

TEST_F(AnalyticsPipelineTest, MismatchedResolutionRejectedAtWrite) {
    auto bad = outcome("bad").ret(5.0).build();
    bad.resolution = Resolution::Loss;

    EXPECT_THROW(ledger.append(bad), ValidationError);
    EXPECT_EQ(ledger.size(), 0u);
}

// ===========================================================================
// 4. Overrides and concurrency
// ===========================================================================

TEST_F(AnalyticsPipelineTest, ApplyOverridesRederivesWeightsOnly) {
    seed();
    auto base = pipeline.refresh();

    overrides.set("Gap Fill", 1.8);
    auto updated = pipeline.apply_overrides();

    ASSERT_NE(updated, nullptr);
    EXPECT_EQ(updated->version, base->version + 1);
    EXPECT_EQ(updated->weight_summary.overridden_count, 1);
    EXPECT_EQ(updated->calibration.to_json(), base->calibration.to_json());
    EXPECT_EQ(base->weight_summary.overridden_count, 0);
}

TEST_F(AnalyticsPipelineTest, ReadersKeepTheirSnapshotAcrossRefresh) {
    seed();
    auto held = pipeline.refresh();

    std::thread writer([this] {
        ledger.append(outcome("extra").closed(300).build());
        pipeline.refresh();
    });
    writer.join();

    EXPECT_EQ(held->outcome_count, 50);
    EXPECT_EQ(pipeline.current()->outcome_count, 51);
}

TEST_F(AnalyticsPipelineTest, ApplyOverridesPersistsBeforePublish) {
    seed();
    pipeline.refresh();

    uint64_t persisted_version = 0;
    int persisted_overrides = 0;
    pipeline.set_persist_sink([&](const DerivedSnapshot& s) {
        persisted_version = s.version;
        persisted_overrides = s.weight_summary.overridden_count;
    });

    overrides.set("VWAP Cross", 0.5);
    auto updated = pipeline.apply_overrides();

    EXPECT_EQ(persisted_version, updated->version);
    EXPECT_EQ(persisted_overrides, 1);
}

TEST_F(AnalyticsPipelineTest, ApplyOverridesPersistFailureKeepsSnapshot) {
    seed();
    auto base = pipeline.refresh();
    pipeline.set_persist_sink([](const DerivedSnapshot&) {
        throw std::runtime_error("connection reset");
    });

    overrides.set("VWAP Cross", 0.5);
    try {
        pipeline.apply_overrides();
        FAIL() << "expected RecomputeError";
    } catch (const RecomputeError& e) {
        EXPECT_EQ(e.kind(), RecomputeErrorKind::PersistFailed);
    }
    EXPECT_EQ(pipeline.current(), base);
}
