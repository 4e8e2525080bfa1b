#include "signal_weights.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace {

constexpr double kConfidenceDamping = 0.5;
constexpr double kMinWeightedConfidence = 10.0;
constexpr double kMaxWeightedConfidence = 99.0;

bool valid_weight(double weight) {
    return std::isfinite(weight) && weight > 0.0;
}

} // namespace

void OverrideRegistry::set(const std::string& signal_name, double weight) {
    if (signal_name.empty()) {
        throw ValidationError("Signal name cannot be empty");
    }
    if (!valid_weight(weight)) {
        throw ValidationError(fmt::format("Override weight for '{}' must be positive and finite, got {}",
                                          signal_name, weight));
    }
    std::lock_guard<std::mutex> lock(mutex_);
    overrides_[signal_name] = weight;
    spdlog::info("Signal weight override set: {} = {}", signal_name, weight);
}

bool OverrideRegistry::remove(const std::string& signal_name) {
    std::lock_guard<std::mutex> lock(mutex_);
    bool removed = overrides_.erase(signal_name) > 0;
    if (removed) {
        spdlog::info("Signal weight override cleared: {}", signal_name);
    }
    return removed;
}

std::optional<double> OverrideRegistry::get(const std::string& signal_name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = overrides_.find(signal_name);
    if (it == overrides_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void OverrideRegistry::load(const std::map<std::string, double>& overrides) {
    std::map<std::string, double> accepted;
    for (const auto& [name, weight] : overrides) {
        if (!valid_weight(weight)) {
            spdlog::warn("Ignoring stored override {} = {}", name, weight);
            continue;
        }
        accepted[name] = weight;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    overrides_ = std::move(accepted);
}

std::map<std::string, double> OverrideRegistry::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return overrides_;
}

SignalWeightEngine::SignalWeightEngine(const Config& config) : config_(config) {
    if (config_.min_signal_weight < kWeightFloor) {
        throw std::runtime_error(fmt::format("MIN_SIGNAL_WEIGHT {} is below the weight floor {}",
                                             config_.min_signal_weight, kWeightFloor));
    }
}

ConfidenceTier SignalWeightEngine::tier_for(int trade_count) const {
    if (trade_count >= config_.tier_high_min_trades) return ConfidenceTier::High;
    if (trade_count >= config_.tier_medium_min_trades) return ConfidenceTier::Medium;
    if (trade_count >= config_.tier_low_min_trades) return ConfidenceTier::Low;
    return ConfidenceTier::Untested;
}

double SignalWeightEngine::dynamic_weight(double win_rate, int trade_count) const {
    if (!config_.dynamic_weights_enabled || tier_for(trade_count) == ConfidenceTier::Untested) {
        return 1.0;
    }

    double n = static_cast<double>(trade_count);
    double shrink = n / (n + config_.weight_shrinkage_trades);
    double raw = 1.0 + (win_rate / config_.baseline_win_rate - 1.0) * shrink;

    double floor = std::max(kWeightFloor, config_.min_signal_weight);
    return util::clamp(raw, floor, config_.max_signal_weight);
}

std::vector<SignalWeight> SignalWeightEngine::compute(const std::vector<EngineMetrics>& signal_stats,
                                                      const std::map<std::string, double>& overrides) const {
    std::map<std::string, SignalWeight> by_name;

    for (const auto& stats : signal_stats) {
        SignalWeight w;
        w.signal_name = stats.key;
        w.trade_count = stats.trade_count;
        w.win_count = stats.win_count;
        w.tier = tier_for(stats.trade_count);
        if (stats.trade_count > 0) {
            w.win_rate = stats.win_rate;
            w.expectancy = stats.expectancy;
        }
        w.state = ComputedWeight{dynamic_weight(stats.win_rate, stats.trade_count)};
        by_name[w.signal_name] = w;
    }

    for (const auto& [name, weight] : overrides) {
        auto it = by_name.find(name);
        if (it == by_name.end()) {
            SignalWeight w;
            w.signal_name = name;
            it = by_name.emplace(name, w).first;
        }
        double computed = it->second.dynamic_weight();
        it->second.state = OverriddenWeight{weight, computed};
    }

    std::vector<SignalWeight> result;
    result.reserve(by_name.size());
    for (auto& [name, w] : by_name) {
        result.push_back(std::move(w));
    }
    return result;
}

SignalWeightSummary SignalWeightEngine::summarize(const std::vector<SignalWeight>& weights) const {
    SignalWeightSummary summary;
    summary.enabled = config_.dynamic_weights_enabled;
    summary.total_signals = static_cast<int>(weights.size());

    const double eps = config_.weight_neutral_epsilon;
    std::vector<SignalWeight> boosted;
    std::vector<SignalWeight> reduced;

    for (const auto& w : weights) {
        double effective = w.effective_weight();
        if (effective > 1.0 + eps) {
            summary.boosted_count++;
            boosted.push_back(w);
        } else if (effective < 1.0 - eps) {
            summary.reduced_count++;
            reduced.push_back(w);
        } else {
            summary.neutral_count++;
        }
        if (w.is_overridden()) {
            summary.overridden_count++;
        }
    }

    std::sort(boosted.begin(), boosted.end(), [](const SignalWeight& a, const SignalWeight& b) {
        if (a.effective_weight() != b.effective_weight()) {
            return a.effective_weight() > b.effective_weight();
        }
        return a.signal_name < b.signal_name;
    });
    std::sort(reduced.begin(), reduced.end(), [](const SignalWeight& a, const SignalWeight& b) {
        if (a.effective_weight() != b.effective_weight()) {
            return a.effective_weight() < b.effective_weight();
        }
        return a.signal_name < b.signal_name;
    });

    size_t limit = static_cast<size_t>(std::max(0, config_.top_signals_limit));
    if (boosted.size() > limit) boosted.resize(limit);
    if (reduced.size() > limit) reduced.resize(limit);

    summary.top_boosted = std::move(boosted);
    summary.top_reduced = std::move(reduced);
    return summary;
}

WeightedConfidence SignalWeightEngine::weighted_confidence(const std::vector<std::string>& signals,
                                                           double base_confidence,
                                                           const std::vector<SignalWeight>& weights) const {
    WeightedConfidence result;
    result.adjusted_confidence = base_confidence;
    if (signals.empty()) {
        return result;
    }

    std::map<std::string, const SignalWeight*> lookup;
    for (const auto& w : weights) {
        lookup[w.signal_name] = &w;
    }

    double total = 0.0;
    const double n = static_cast<double>(signals.size());
    for (const auto& signal : signals) {
        double weight = 1.0;
        auto it = lookup.find(signal);
        if (it != lookup.end()) {
            weight = it->second->effective_weight();
        }
        total += weight;
        result.contributions.push_back({signal, weight, weight / n});
    }

    double avg = total / n;
    result.total_weight_multiplier = 1.0 + (avg - 1.0) * kConfidenceDamping;

    double adjusted = util::clamp(base_confidence * result.total_weight_multiplier,
                                  kMinWeightedConfidence, kMaxWeightedConfidence);
    result.adjusted_confidence = util::round_to(adjusted, 1);
    return result;
}
