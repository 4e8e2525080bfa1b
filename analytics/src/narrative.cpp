#include "narrative.hpp"
#include <fmt/format.h>
#include <cmath>

namespace {

constexpr double kPoorBrier = 0.2;
constexpr double kModerateBrier = 0.15;
constexpr double kOverconfidenceGap = 15.0;
constexpr double kUnderconfidenceGap = 10.0;
constexpr int kSparseBinSamples = 10;
constexpr int kSparseBinCount = 2;
constexpr int kSymbolMinClosed = 5;

} // namespace

DefaultNarrativeGenerator::DefaultNarrativeGenerator(const Config& config) : config_(config) {}

std::vector<std::string> DefaultNarrativeGenerator::health_issues(const PlatformHealth& health) const {
    std::vector<std::string> issues;
    for (const auto& f : health.findings) {
        switch (f.issue) {
            case HealthIssue::InsufficientData:
                issues.push_back(fmt::format("Only {:.0f} closed trades; at least {:.0f} needed for a reliable assessment",
                                             f.value, f.threshold));
                break;
            case HealthIssue::NegativeExpectancy:
                issues.push_back(fmt::format("Negative expectancy: {:.2f}% per trade", f.value));
                break;
            case HealthIssue::LowProfitFactor:
                issues.push_back(fmt::format("Profit factor {:.2f} below {:.2f}", f.value, f.threshold));
                break;
            case HealthIssue::LowWinRate:
                issues.push_back(fmt::format("Win rate {:.1f}% below {:.1f}%", f.value, f.threshold));
                break;
            case HealthIssue::NegativeSharpe:
                issues.push_back(fmt::format("Negative Sharpe ratio: {:.2f}", f.value));
                break;
            case HealthIssue::EngineNegativeExpectancy:
                issues.push_back(fmt::format("Engine {} has negative expectancy ({:.2f}%)", f.subject, f.value));
                break;
        }
    }
    return issues;
}

std::vector<std::string> DefaultNarrativeGenerator::health_recommendations(const PlatformHealth& health) const {
    std::vector<std::string> recs;
    for (const auto& f : health.findings) {
        switch (f.issue) {
            case HealthIssue::InsufficientData:
                recs.push_back("Collect more resolved trades before acting on platform metrics");
                break;
            case HealthIssue::NegativeExpectancy:
                recs.push_back("Review stop placement and exit rules; average trade is losing money");
                break;
            case HealthIssue::LowProfitFactor:
                recs.push_back("Cut losing setups or tighten risk so gains outweigh losses");
                break;
            case HealthIssue::LowWinRate:
                recs.push_back("Raise the confidence threshold for publishing ideas");
                break;
            case HealthIssue::NegativeSharpe:
                recs.push_back("Reduce position sizing until risk-adjusted returns recover");
                break;
            case HealthIssue::EngineNegativeExpectancy:
                recs.push_back(fmt::format("Reduce reliance on engine {} until its expectancy turns positive",
                                           f.subject));
                break;
        }
    }
    if (recs.empty() && health.status == HealthStatus::Healthy) {
        recs.push_back("Platform performance is healthy; keep monitoring as data accumulates");
    }
    return recs;
}

std::vector<std::string> DefaultNarrativeGenerator::calibration_recommendations(const CalibrationReport& report) const {
    std::vector<std::string> recs;

    if (!report.brier_score) {
        recs.push_back("Insufficient resolved trades for calibration analysis");
        return recs;
    }
    double brier = *report.brier_score;

    if (brier > kPoorBrier) {
        recs.push_back(fmt::format("HIGH PRIORITY: Brier score ({:.3f}) indicates poor calibration. "
                                   "Confidence scores are not predictive of actual outcomes.", brier));
    } else if (brier > kModerateBrier) {
        recs.push_back(fmt::format("MODERATE: Brier score ({:.3f}) shows room for improvement. "
                                   "Consider adjusting signal weights.", brier));
    }

    int overconfident = 0;
    double overconfidence_sum = 0.0;
    int underconfident = 0;
    int sparse = 0;

    for (const auto& bin : report.bins) {
        if (bin.sample_size > 0 && bin.sample_size < kSparseBinSamples) {
            sparse++;
        }
        if (bin.sample_size < config_.calibration_min_bin_samples ||
            !bin.predicted_confidence || !bin.actual_win_rate) {
            continue;
        }
        double gap = *bin.predicted_confidence - *bin.actual_win_rate;
        if (gap > kOverconfidenceGap) {
            overconfident++;
            overconfidence_sum += gap;
        }
        if (-gap > kUnderconfidenceGap) {
            underconfident++;
        }
    }

    if (overconfident > 0) {
        double avg = overconfidence_sum / overconfident;
        recs.push_back(fmt::format("OVERCONFIDENCE DETECTED: System is {:.1f}% too optimistic in {} confidence "
                                   "ranges. Apply scaling factor of {:.2f}.",
                                   avg, overconfident, 100.0 / (100.0 + avg)));
    }
    if (underconfident > 0) {
        recs.push_back("UNDERCONFIDENCE: Some signals are performing better than predicted. "
                       "Consider increasing weights for these signal types.");
    }
    if (sparse > kSparseBinCount) {
        recs.push_back(fmt::format("DATA SPARSITY: {} confidence ranges have <{} samples. "
                                   "Collect more trade outcome data for reliable calibration.",
                                   sparse, kSparseBinSamples));
    }

    for (const auto& bin : report.bins) {
        if (bin.sample_size >= kSparseBinSamples && !bin.is_calibrated &&
            bin.predicted_confidence && bin.actual_win_rate) {
            double predicted = *bin.predicted_confidence;
            double actual = *bin.actual_win_rate;
            recs.push_back(fmt::format("Adjust {:.0f}-{:.0f}% confidence {} by {:.1f}%. "
                                       "(Predicted: {:.1f}%, Actual: {:.1f}%)",
                                       bin.bin_start, bin.bin_end, predicted > actual ? "down" : "up",
                                       std::fabs(predicted - actual), predicted, actual));
        }
    }

    if (recs.empty()) {
        recs.push_back(fmt::format("Calibration looks good! Brier score: {:.3f}, ECE: {:.1f}%. "
                                   "Continue monitoring as more data accumulates.",
                                   brier, report.expected_calibration_error.value_or(0.0)));
    }
    return recs;
}

std::vector<std::string> DefaultNarrativeGenerator::symbol_recommendations(const SymbolIntelligence& intel) const {
    const SymbolProfile& profile = intel.profile;
    std::vector<std::string> recs;
    if (!profile.overall_win_rate) {
        return recs;
    }
    double wr = *profile.overall_win_rate;

    if (wr >= 70.0 && profile.closed_ideas >= kSymbolMinClosed) {
        recs.push_back(fmt::format("High performer: {:.0f}% win rate across {} trades", wr, profile.closed_ideas));
    }
    if (wr < 40.0 && profile.closed_ideas >= kSymbolMinClosed) {
        recs.push_back(fmt::format("Low win rate ({:.0f}%) - consider avoiding or reducing position size", wr));
    }

    if (profile.long_win_rate && profile.short_win_rate &&
        std::fabs(*profile.long_win_rate - *profile.short_win_rate) > 20.0) {
        if (*profile.long_win_rate > *profile.short_win_rate) {
            recs.push_back(fmt::format("Long bias: {:.0f}% win rate long vs {:.0f}% short",
                                       *profile.long_win_rate, *profile.short_win_rate));
        } else {
            recs.push_back(fmt::format("Short bias: {:.0f}% win rate short vs {:.0f}% long",
                                       *profile.short_win_rate, *profile.long_win_rate));
        }
    }

    if (profile.best_catalyst && profile.best_catalyst_win_rate && *profile.best_catalyst_win_rate >= 60.0) {
        recs.push_back(fmt::format("Best catalyst: {} ({:.0f}% win rate)",
                                   *profile.best_catalyst, *profile.best_catalyst_win_rate));
    }
    if (profile.worst_catalyst && profile.worst_catalyst_win_rate && *profile.worst_catalyst_win_rate < 40.0) {
        recs.push_back(fmt::format("Avoid catalyst: {} ({:.0f}% win rate)",
                                   *profile.worst_catalyst, *profile.worst_catalyst_win_rate));
    }

    // Direction and catalyst together
    for (const auto& setup : intel.setups) {
        bool is_long = setup.direction == Direction::Long;
        if (setup.win_rate >= 70.0) {
            recs.push_back(fmt::format("Favor {} setups on {} catalysts ({:.0f}% over {} trades)",
                                       is_long ? "long" : "short", setup.catalyst, setup.win_rate, setup.trades));
        } else if (setup.win_rate < 40.0) {
            recs.push_back(fmt::format("Avoid {} this symbol on {} catalysts ({:.0f}% over {} trades)",
                                       is_long ? "going long" : "shorting", setup.catalyst,
                                       setup.win_rate, setup.trades));
        }
    }

    if (profile.confidence_realization && *profile.confidence_realization < 80.0) {
        recs.push_back(fmt::format("Confidence overestimated - actual performance is {:.0f}% below predicted",
                                   100.0 - *profile.confidence_realization));
    }

    if (profile.profit_factor && std::isfinite(*profile.profit_factor) && *profile.profit_factor >= 2.0) {
        recs.push_back(fmt::format("Excellent profit factor: {:.1f}x (total wins / total losses)",
                                   *profile.profit_factor));
    }
    return recs;
}
