#pragma once

#include "types.hpp"
#include "config.hpp"
#include <string>
#include <vector>

// Renders advisory text from numeric results. Implementations must be
// deterministic: identical inputs yield identical strings.
class NarrativeGenerator {
public:
    virtual ~NarrativeGenerator() = default;

    virtual std::vector<std::string> health_issues(const PlatformHealth& health) const = 0;
    virtual std::vector<std::string> health_recommendations(const PlatformHealth& health) const = 0;
    virtual std::vector<std::string> calibration_recommendations(const CalibrationReport& report) const = 0;
    virtual std::vector<std::string> symbol_recommendations(const SymbolIntelligence& intel) const = 0;
};

class DefaultNarrativeGenerator : public NarrativeGenerator {
public:
    explicit DefaultNarrativeGenerator(const Config& config);

    std::vector<std::string> health_issues(const PlatformHealth& health) const override;
    std::vector<std::string> health_recommendations(const PlatformHealth& health) const override;
    std::vector<std::string> calibration_recommendations(const CalibrationReport& report) const override;
    std::vector<std::string> symbol_recommendations(const SymbolIntelligence& intel) const override;

private:
    const Config& config_;
};
