#pragma once

#include "types.hpp"
#include "config.hpp"
#include "ledger.hpp"
#include "performance.hpp"
#include "calibration.hpp"
#include "signal_weights.hpp"
#include "historical_intel.hpp"
#include "narrative.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

// Every derived table from one recompute. Never mutated once published.
struct DerivedSnapshot {
    uint64_t version = 0;
    uint64_t generation = 0;  // ledger write count the inputs were read at
    std::chrono::system_clock::time_point computed_at;

    int outcome_count = 0;
    int malformed_rows = 0;

    std::vector<EngineMetrics> engine_metrics;
    std::vector<EngineMetrics> symbol_metrics;
    std::vector<EngineMetrics> direction_metrics;
    std::vector<EngineMetrics> catalyst_metrics;
    std::vector<EngineMetrics> asset_type_metrics;
    std::vector<EngineMetrics> signal_stats;
    PlatformHealth health;

    CalibrationReport calibration;

    std::vector<SignalWeight> signal_weights;
    SignalWeightSummary weight_summary;

    HistoricalIndex historical;
};

using SnapshotPtr = std::shared_ptr<const DerivedSnapshot>;

class AnalyticsPipeline {
public:
    // Runs before the swap; throwing fails the refresh and keeps the old snapshot
    using PersistSink = std::function<void(const DerivedSnapshot&)>;

    AnalyticsPipeline(const Config& config,
                      OutcomeLedger& ledger,
                      OverrideRegistry& overrides,
                      const NarrativeGenerator& narrative);

    void set_persist_sink(PersistSink sink);

    // Full recompute; concurrent callers serialize. Throws RecomputeError.
    SnapshotPtr refresh();

    // Cancels the refresh in flight, if any
    void abort();

    // A ledger write happened; the current snapshot is no longer fresh
    void mark_stale();

    bool is_fresh() const;
    uint64_t ledger_writes() const { return ledger_writes_.load(); }

    // nullptr until the first successful refresh
    SnapshotPtr current() const;

    // Re-derives signal weights of the current snapshot from the override registry.
    // Persists like refresh(); a sink failure throws RecomputeError and keeps the old snapshot.
    SnapshotPtr apply_overrides();

    const CalibrationAnalyzer& calibration() const { return calibration_; }
    const SignalWeightEngine& weights() const { return weights_; }
    const HistoricalIntelligence& historical() const { return historical_; }
    const NarrativeGenerator& narrative() const { return narrative_; }

    AnalyticsPipeline(const AnalyticsPipeline&) = delete;
    AnalyticsPipeline& operator=(const AnalyticsPipeline&) = delete;

private:
    void check_abort(const char* stage) const;
    void persist(const DerivedSnapshot& snapshot);
    void publish(SnapshotPtr snapshot);

    OutcomeLedger& ledger_;
    OverrideRegistry& overrides_;
    const NarrativeGenerator& narrative_;

    PerformanceAggregator performance_;
    CalibrationAnalyzer calibration_;
    SignalWeightEngine weights_;
    HistoricalIntelligence historical_;

    PersistSink sink_;

    std::mutex refresh_mutex_;
    mutable std::mutex snapshot_mutex_;
    SnapshotPtr current_;

    std::atomic<bool> abort_requested_{false};
    std::atomic<uint64_t> ledger_writes_{0};
};
