#pragma once

#include "types.hpp"
#include "config.hpp"
#include <vector>

// Bins predictions by stated confidence and compares them with realized win rates
class CalibrationAnalyzer {
public:
    explicit CalibrationAnalyzer(const Config& config);

    // Recommendations are left empty; the narrative generator fills them in
    CalibrationReport analyze(const std::vector<TradeOutcome>& outcomes) const;

    // Rescales a raw confidence by its bin's actual/predicted ratio.
    // Bins below the minimum sample size pass the value through unchanged.
    ConfidenceAdjustment calibrate(double raw_confidence, const CalibrationReport& report) const;

    // Index of the bin holding a confidence in [0, 100]; 100 falls in the last bin
    int bin_index(double confidence) const;
    int bin_count() const;

private:
    const Config& config_;
};
