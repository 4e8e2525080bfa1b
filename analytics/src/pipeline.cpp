#include "pipeline.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <future>

AnalyticsPipeline::AnalyticsPipeline(const Config& config,
                                     OutcomeLedger& ledger,
                                     OverrideRegistry& overrides,
                                     const NarrativeGenerator& narrative)
    : ledger_(ledger),
      overrides_(overrides),
      narrative_(narrative),
      performance_(config),
      calibration_(config),
      weights_(config),
      historical_(config) {}

void AnalyticsPipeline::set_persist_sink(PersistSink sink) {
    std::lock_guard<std::mutex> lock(refresh_mutex_);
    sink_ = std::move(sink);
}

void AnalyticsPipeline::check_abort(const char* stage) const {
    if (abort_requested_.load()) {
        spdlog::warn("Refresh aborted at stage '{}'", stage);
        throw RecomputeError(RecomputeErrorKind::Aborted, fmt::format("refresh aborted during {}", stage));
    }
}

SnapshotPtr AnalyticsPipeline::refresh() {
    std::lock_guard<std::mutex> refresh_lock(refresh_mutex_);
    abort_requested_ = false;

    auto started = std::chrono::steady_clock::now();
    uint64_t generation = ledger_writes_.load();

    LedgerSnapshot ledger;
    try {
        ledger = ledger_.load_snapshot();
    } catch (const RecomputeError&) {
        throw;
    } catch (const std::exception& e) {
        spdlog::error("Failed to load ledger: {}", e.what());
        throw RecomputeError(RecomputeErrorKind::LedgerUnavailable, e.what());
    }
    check_abort("load");

    auto snapshot = std::make_shared<DerivedSnapshot>();
    snapshot->generation = generation;
    snapshot->outcome_count = static_cast<int>(ledger.outcomes.size());

    try {
        const auto& rows = ledger.outcomes;

        auto engines = performance_.aggregate(rows, grouping::by_engine, "engine");
        auto symbols = performance_.aggregate(rows, grouping::by_symbol, "symbol");
        auto directions = performance_.aggregate(rows, grouping::by_direction, "direction");
        auto catalysts = performance_.aggregate(rows, grouping::by_catalyst, "catalyst");
        auto asset_types = performance_.aggregate(rows, grouping::by_asset_type, "asset_type");
        auto signals = performance_.aggregate_multi(rows, grouping::by_signal, "signal");

        snapshot->malformed_rows = engines.excluded;
        snapshot->engine_metrics = std::move(engines.groups);
        snapshot->symbol_metrics = std::move(symbols.groups);
        snapshot->direction_metrics = std::move(directions.groups);
        snapshot->catalyst_metrics = std::move(catalysts.groups);
        snapshot->asset_type_metrics = std::move(asset_types.groups);
        snapshot->signal_stats = std::move(signals.groups);

        snapshot->health = performance_.assess_health(rows, snapshot->engine_metrics);
        snapshot->health.issues = narrative_.health_issues(snapshot->health);
        snapshot->health.recommendations = narrative_.health_recommendations(snapshot->health);
        check_abort("performance");

        // The three downstream reducers only read the ledger view and performance output
        auto override_map = overrides_.snapshot();
        const auto& signal_stats = snapshot->signal_stats;

        auto calibration_future = std::async(std::launch::async, [this, &rows] {
            CalibrationReport report = calibration_.analyze(rows);
            report.recommendations = narrative_.calibration_recommendations(report);
            return report;
        });
        auto weights_future = std::async(std::launch::async, [this, &signal_stats, &override_map] {
            return weights_.compute(signal_stats, override_map);
        });
        auto historical_future = std::async(std::launch::async, [this, &ledger] {
            return historical_.build(ledger);
        });

        snapshot->calibration = calibration_future.get();
        snapshot->signal_weights = weights_future.get();
        snapshot->historical = historical_future.get();
        snapshot->weight_summary = weights_.summarize(snapshot->signal_weights);
    } catch (const RecomputeError&) {
        throw;
    } catch (const std::exception& e) {
        spdlog::error("Recompute failed: {}", e.what());
        throw RecomputeError(RecomputeErrorKind::Internal, e.what());
    }
    check_abort("reduce");

    snapshot->computed_at = std::chrono::system_clock::now();
    {
        std::lock_guard<std::mutex> lock(snapshot_mutex_);
        snapshot->version = current_ ? current_->version + 1 : 1;
    }

    // A committed persist is the point of no return: abort is no longer honored
    persist(*snapshot);
    publish(snapshot);

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started).count();
    spdlog::info("Refresh v{} complete: {} outcomes, {} engines, {} signals, {} symbols in {} ms",
                 snapshot->version, snapshot->outcome_count, snapshot->engine_metrics.size(),
                 snapshot->signal_weights.size(), snapshot->historical.profiles.size(), elapsed);
    return snapshot;
}

void AnalyticsPipeline::abort() {
    abort_requested_ = true;
}

void AnalyticsPipeline::mark_stale() {
    ledger_writes_++;
}

bool AnalyticsPipeline::is_fresh() const {
    std::lock_guard<std::mutex> lock(snapshot_mutex_);
    return current_ && current_->generation == ledger_writes_.load();
}

SnapshotPtr AnalyticsPipeline::current() const {
    std::lock_guard<std::mutex> lock(snapshot_mutex_);
    return current_;
}

SnapshotPtr AnalyticsPipeline::apply_overrides() {
    std::lock_guard<std::mutex> refresh_lock(refresh_mutex_);

    SnapshotPtr base = current();
    if (!base) {
        return nullptr;
    }

    auto snapshot = std::make_shared<DerivedSnapshot>(*base);
    snapshot->signal_weights = weights_.compute(snapshot->signal_stats, overrides_.snapshot());
    snapshot->weight_summary = weights_.summarize(snapshot->signal_weights);
    snapshot->version = base->version + 1;
    snapshot->computed_at = std::chrono::system_clock::now();

    persist(*snapshot);
    publish(snapshot);
    spdlog::info("Signal weights re-derived with {} overrides (v{})",
                 snapshot->weight_summary.overridden_count, snapshot->version);
    return snapshot;
}

void AnalyticsPipeline::persist(const DerivedSnapshot& snapshot) {
    if (!sink_) {
        return;
    }
    try {
        sink_(snapshot);
    } catch (const std::exception& e) {
        spdlog::error("Failed to persist derived tables (v{}): {}", snapshot.version, e.what());
        throw RecomputeError(RecomputeErrorKind::PersistFailed, e.what());
    }
}

void AnalyticsPipeline::publish(SnapshotPtr snapshot) {
    std::lock_guard<std::mutex> lock(snapshot_mutex_);
    current_ = std::move(snapshot);
}
