#include "calibration.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>

namespace {

constexpr double kCalibratedFloor = 30.0;
constexpr double kCalibratedCeiling = 95.0;

struct BinAccumulator {
    int samples = 0;
    int wins = 0;
    double confidence_sum = 0.0;
};

bool valid_confidence(double confidence) {
    return std::isfinite(confidence) && confidence >= 0.0 && confidence <= 100.0;
}

} // namespace

CalibrationAnalyzer::CalibrationAnalyzer(const Config& config) : config_(config) {}

int CalibrationAnalyzer::bin_count() const {
    return static_cast<int>(std::ceil(100.0 / config_.calibration_bin_width - 1e-9));
}

int CalibrationAnalyzer::bin_index(double confidence) const {
    int index = static_cast<int>(std::floor(confidence / config_.calibration_bin_width));
    return std::clamp(index, 0, bin_count() - 1);
}

CalibrationReport CalibrationAnalyzer::analyze(const std::vector<TradeOutcome>& outcomes) const {
    const int n_bins = bin_count();
    std::vector<BinAccumulator> acc(n_bins);

    CalibrationReport report;
    int malformed = 0;
    int wins = 0;
    int losses = 0;
    double brier_sum = 0.0;

    for (const auto& outcome : outcomes) {
        if (!valid_confidence(outcome.confidence)) {
            spdlog::debug("Excluding {} from calibration: confidence {}", outcome.id, outcome.confidence);
            malformed++;
            continue;
        }

        auto& bin = acc[bin_index(outcome.confidence)];
        bin.samples++;
        bin.confidence_sum += outcome.confidence;
        report.total_predictions++;

        if (outcome.resolution == Resolution::Breakeven) {
            continue;
        }

        double realized = outcome.is_win() ? 1.0 : 0.0;
        double diff = outcome.confidence / 100.0 - realized;
        brier_sum += diff * diff;

        if (outcome.is_win()) {
            bin.wins++;
            wins++;
        } else {
            losses++;
        }
    }

    if (malformed > 0) {
        spdlog::warn("Calibration excluded {} rows with confidence outside [0, 100]", malformed);
    }

    report.scored_predictions = wins + losses;
    if (report.scored_predictions > 0) {
        report.brier_score = brier_sum / report.scored_predictions;
        report.overall_accuracy = static_cast<double>(wins) / report.scored_predictions * 100.0;
    }

    double weighted_error = 0.0;
    int qualified_samples = 0;
    double max_error = 0.0;

    for (int i = 0; i < n_bins; ++i) {
        CalibrationBin bin;
        bin.bin_start = i * config_.calibration_bin_width;
        bin.bin_end = std::min(100.0, (i + 1) * config_.calibration_bin_width);
        bin.sample_size = acc[i].samples;
        bin.win_count = acc[i].wins;

        if (bin.sample_size > 0) {
            double n = static_cast<double>(bin.sample_size);
            double p = bin.win_count / n;
            bin.predicted_confidence = acc[i].confidence_sum / n;
            bin.actual_win_rate = p * 100.0;
            bin.standard_error = std::sqrt(p * (1.0 - p) / n) * 100.0;

            double gap = std::fabs(*bin.predicted_confidence - *bin.actual_win_rate);
            bin.is_calibrated = gap <= config_.calibration_tolerance;

            if (bin.sample_size >= config_.calibration_min_bin_samples) {
                weighted_error += n * gap;
                qualified_samples += bin.sample_size;
                max_error = std::max(max_error, gap);
            }
        }

        report.bins.push_back(bin);
    }

    if (qualified_samples > 0) {
        double ece = weighted_error / qualified_samples;
        report.expected_calibration_error = ece;
        report.max_calibration_error = max_error;
        report.reliability = util::clamp(100.0 - 2.0 * ece, 0.0, 100.0);
    }

    spdlog::debug("Calibration over {} predictions ({} scored), ECE={}", report.total_predictions,
                  report.scored_predictions,
                  report.expected_calibration_error ? *report.expected_calibration_error : -1.0);
    return report;
}

ConfidenceAdjustment CalibrationAnalyzer::calibrate(double raw_confidence, const CalibrationReport& report) const {
    ConfidenceAdjustment adjustment;
    adjustment.original_confidence = raw_confidence;
    adjustment.calibrated_confidence = raw_confidence;
    adjustment.adjustment_factor = 1.0;

    if (!valid_confidence(raw_confidence) || report.bins.empty()) {
        return adjustment;
    }

    int index = bin_index(raw_confidence);
    if (index >= static_cast<int>(report.bins.size())) {
        return adjustment;
    }

    const auto& bin = report.bins[index];
    if (bin.sample_size < config_.calibration_min_bin_samples || !bin.predicted_confidence ||
        !bin.actual_win_rate || *bin.predicted_confidence <= 0.0) {
        return adjustment;
    }

    double factor = *bin.actual_win_rate / *bin.predicted_confidence;
    double calibrated = util::clamp(raw_confidence * factor, kCalibratedFloor, kCalibratedCeiling);

    adjustment.adjustment_factor = factor;
    adjustment.calibrated_confidence = util::round_to(calibrated, 1);
    return adjustment;
}
