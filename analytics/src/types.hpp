#pragma once

#include <string>
#include <vector>
#include <map>
#include <chrono>
#include <optional>
#include <variant>
#include <cstdint>
#include <nlohmann/json.hpp>

enum class Direction {
    Long,
    Short
};

enum class Resolution {
    Win,
    Loss,
    Breakeven
};

enum class ConfidenceTier {
    Untested,
    Low,
    Medium,
    High
};

enum class HealthStatus {
    Healthy,
    Degraded,
    Unhealthy
};

std::string to_string(Direction direction);
std::string to_string(Resolution resolution);
std::string to_string(ConfidenceTier tier);
std::string to_string(HealthStatus status);

std::optional<Direction> direction_from_string(const std::string& value);

// Classifies a realized return against a symmetric breakeven band (percent points)
Resolution classify_return(double return_pct, double breakeven_band_pct);

// One resolved prediction from the outcome ledger
struct TradeOutcome {
    std::string id;
    std::string symbol;
    std::string engine;
    std::optional<std::string> asset_type;
    Direction direction = Direction::Long;
    std::vector<std::string> signals;
    double confidence = 0.0;
    std::optional<std::string> catalyst;
    double return_pct = 0.0;
    Resolution resolution = Resolution::Breakeven;
    std::chrono::system_clock::time_point opened_at;
    std::chrono::system_clock::time_point closed_at;

    bool is_win() const { return resolution == Resolution::Win; }
    bool is_loss() const { return resolution == Resolution::Loss; }

    nlohmann::json to_json() const;
    static std::optional<TradeOutcome> from_json(const nlohmann::json& j, double breakeven_band_pct);
};

// Immutable view of the ledger read by one recompute
struct LedgerSnapshot {
    std::vector<TradeOutcome> outcomes;
    std::map<std::string, int> open_ideas;  // symbol -> unresolved idea count
    uint64_t generation = 0;
};

// Grouped performance record (per engine, symbol, direction, catalyst, signal)
struct EngineMetrics {
    std::string key;
    int trade_count = 0;
    int win_count = 0;
    int loss_count = 0;
    int breakeven_count = 0;
    double win_rate = 0.0;
    double expectancy = 0.0;
    std::optional<double> sharpe_ratio;
    std::optional<double> profit_factor;
    double max_drawdown = 0.0;
    std::optional<double> avg_win_pct;
    std::optional<double> avg_loss_pct;
    double avg_confidence = 0.0;

    nlohmann::json to_json() const;
};

enum class HealthIssue {
    InsufficientData,
    NegativeExpectancy,
    LowProfitFactor,
    LowWinRate,
    NegativeSharpe,
    EngineNegativeExpectancy
};

struct HealthFinding {
    HealthIssue issue;
    std::string subject;  // engine id for per-engine findings, empty otherwise
    double value = 0.0;
    double threshold = 0.0;
};

struct PlatformHealth {
    HealthStatus status = HealthStatus::Degraded;
    std::optional<EngineMetrics> overall;
    std::vector<HealthFinding> findings;
    std::vector<std::string> issues;
    std::vector<std::string> recommendations;

    nlohmann::json to_json() const;
};

struct CalibrationBin {
    double bin_start = 0.0;
    double bin_end = 0.0;
    std::optional<double> predicted_confidence;
    std::optional<double> actual_win_rate;
    int sample_size = 0;
    int win_count = 0;
    double standard_error = 0.0;
    bool is_calibrated = false;

    nlohmann::json to_json() const;
};

struct CalibrationReport {
    std::vector<CalibrationBin> bins;
    int total_predictions = 0;
    int scored_predictions = 0;  // wins + losses, breakevens excluded
    std::optional<double> overall_accuracy;
    std::optional<double> brier_score;
    std::optional<double> expected_calibration_error;
    std::optional<double> max_calibration_error;
    std::optional<double> reliability;
    std::vector<std::string> recommendations;

    nlohmann::json to_json() const;
};

struct ConfidenceAdjustment {
    double original_confidence = 0.0;
    double calibrated_confidence = 0.0;
    double adjustment_factor = 1.0;

    nlohmann::json to_json() const;
};

// Manual override and computed weight coexist; the computed value is never lost
struct ComputedWeight {
    double weight = 1.0;
};

struct OverriddenWeight {
    double weight = 1.0;
    double computed = 1.0;
};

using WeightState = std::variant<ComputedWeight, OverriddenWeight>;

struct SignalWeight {
    std::string signal_name;
    double base_weight = 1.0;
    WeightState state = ComputedWeight{};
    std::optional<double> win_rate;
    std::optional<double> expectancy;
    int trade_count = 0;
    int win_count = 0;
    ConfidenceTier tier = ConfidenceTier::Untested;

    double dynamic_weight() const;
    double effective_weight() const;
    bool is_overridden() const;
    std::optional<double> override_weight() const;

    nlohmann::json to_json() const;
};

struct SignalWeightSummary {
    bool enabled = true;
    int total_signals = 0;
    int boosted_count = 0;
    int reduced_count = 0;
    int neutral_count = 0;
    int overridden_count = 0;
    std::vector<SignalWeight> top_boosted;
    std::vector<SignalWeight> top_reduced;

    nlohmann::json to_json() const;
};

struct SignalContribution {
    std::string signal;
    double weight = 1.0;
    double contribution = 0.0;
};

struct WeightedConfidence {
    double adjusted_confidence = 0.0;
    double total_weight_multiplier = 1.0;
    std::vector<SignalContribution> contributions;

    nlohmann::json to_json() const;
};

struct SymbolProfile {
    std::string symbol;
    int total_ideas = 0;
    int closed_ideas = 0;
    int wins = 0;
    int losses = 0;
    int breakevens = 0;
    std::optional<double> overall_win_rate;
    std::optional<double> long_win_rate;
    std::optional<double> short_win_rate;
    std::optional<double> total_pnl;
    std::optional<double> profit_factor;
    std::optional<double> avg_win_pct;
    std::optional<double> avg_loss_pct;
    std::optional<std::string> best_catalyst;
    std::optional<double> best_catalyst_win_rate;
    std::optional<std::string> worst_catalyst;
    std::optional<double> worst_catalyst_win_rate;
    std::optional<double> avg_confidence;
    std::optional<double> confidence_realization;
    std::optional<std::chrono::system_clock::time_point> last_trade_at;

    nlohmann::json to_json() const;
};

struct CatalystStat {
    std::string catalyst;
    int trades = 0;
    int wins = 0;
    double win_rate = 0.0;

    nlohmann::json to_json() const;
};

// One (direction, catalyst category) pairing for a symbol
struct SetupStat {
    Direction direction = Direction::Long;
    std::string catalyst;
    int trades = 0;
    int wins = 0;
    double win_rate = 0.0;

    nlohmann::json to_json() const;
};

struct ConfidenceBandRow {
    std::string band;
    double band_min = 0.0;
    double band_max = 0.0;
    int ideas = 0;
    int wins = 0;
    double expected_win_rate = 0.0;
    std::optional<double> actual_win_rate;
    std::optional<double> calibration_error;

    nlohmann::json to_json() const;
};

struct GroupSummary {
    std::string key;
    int ideas = 0;
    int wins = 0;
    double win_rate = 0.0;
    double pnl = 0.0;
    std::optional<std::chrono::system_clock::time_point> last_trade_at;

    nlohmann::json to_json() const;
};

struct OverallStats {
    int total_ideas = 0;
    int closed_ideas = 0;
    int wins = 0;
    int losses = 0;
    int breakevens = 0;
    std::optional<double> win_rate;
    double total_pnl = 0.0;
    std::optional<double> avg_pnl_pct;
    std::optional<double> profit_factor;

    nlohmann::json to_json() const;
};

struct HistoricalStats {
    OverallStats overall;
    std::vector<GroupSummary> by_source;
    std::vector<GroupSummary> by_asset_type;
    std::vector<GroupSummary> by_direction;
    std::vector<GroupSummary> by_catalyst;
    std::vector<GroupSummary> by_symbol;
    std::vector<ConfidenceBandRow> by_confidence_band;
    std::vector<GroupSummary> top_performers;
    std::vector<GroupSummary> worst_performers;

    nlohmann::json to_json() const;
};

struct SymbolIntelligence {
    SymbolProfile profile;
    std::vector<TradeOutcome> recent_trades;
    std::vector<CatalystStat> best_catalysts;
    std::vector<CatalystStat> worst_catalysts;
    std::vector<SetupStat> setups;
    std::vector<std::string> recommendations;

    nlohmann::json to_json() const;
};

struct HistoricalAdjustment {
    int adjustment = 0;
    std::vector<std::string> reasons;
    std::optional<double> symbol_win_rate;
    std::optional<double> catalyst_win_rate;

    nlohmann::json to_json() const;
};

// Command request/reply on the Redis bus
struct CommandRequest {
    std::string type;
    std::string cmd;
    nlohmann::json args;
    std::string corr_id;
    std::chrono::system_clock::time_point timestamp;

    static std::optional<CommandRequest> from_json(const nlohmann::json& j);
};

struct CommandReply {
    std::string corr_id;
    bool ok = false;
    std::string message;
    nlohmann::json data;
    std::chrono::system_clock::time_point timestamp;

    nlohmann::json to_json() const;
};

// Ratios use explicit string sentinels for +/- infinity
nlohmann::json ratio_to_json(const std::optional<double>& value);
nlohmann::json optional_to_json(const std::optional<double>& value);
