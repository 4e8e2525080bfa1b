#pragma once

#include "types.hpp"
#include "config.hpp"
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// Lowest weight any signal may ever carry; a signal is never excluded outright
constexpr double kWeightFloor = 0.1;

// Manual weights set by operators. Thread-safe.
class OverrideRegistry {
public:
    // Throws ValidationError unless weight is positive and finite
    void set(const std::string& signal_name, double weight);
    bool remove(const std::string& signal_name);
    std::optional<double> get(const std::string& signal_name) const;

    // Replaces every entry; invalid stored weights are skipped with a warning
    void load(const std::map<std::string, double>& overrides);
    std::map<std::string, double> snapshot() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, double> overrides_;
};

class SignalWeightEngine {
public:
    // Throws std::runtime_error when the configured minimum weight is below kWeightFloor
    explicit SignalWeightEngine(const Config& config);

    ConfidenceTier tier_for(int trade_count) const;

    // Shrunk toward 1.0 by sample size, clamped; untested signals get exactly 1.0
    double dynamic_weight(double win_rate, int trade_count) const;

    // One entry per signal in the stats or the override map, sorted by name
    std::vector<SignalWeight> compute(const std::vector<EngineMetrics>& signal_stats,
                                      const std::map<std::string, double>& overrides) const;

    SignalWeightSummary summarize(const std::vector<SignalWeight>& weights) const;

    // Average effective weight of the fired signals, damped by half, applied to base_confidence
    WeightedConfidence weighted_confidence(const std::vector<std::string>& signals,
                                           double base_confidence,
                                           const std::vector<SignalWeight>& weights) const;

private:
    const Config& config_;
};
