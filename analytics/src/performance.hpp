#pragma once

#include "types.hpp"
#include "config.hpp"
#include <functional>
#include <optional>
#include <string>
#include <vector>

// Fixed per-trade Sharpe; outcomes are not evenly spaced in time
constexpr double kSharpeAnnualization = 1.0;

// Result of one grouping pass
struct GroupedMetrics {
    std::vector<EngineMetrics> groups;  // sorted by key
    int excluded = 0;                   // rows missing the grouping field
};

class PerformanceAggregator {
public:
    using GroupKeyFn = std::function<std::optional<std::string>(const TradeOutcome&)>;
    using MultiKeyFn = std::function<std::vector<std::string>(const TradeOutcome&)>;

    explicit PerformanceAggregator(const Config& config);

    // One EngineMetrics per distinct key; rows without a key are excluded
    GroupedMetrics aggregate(const std::vector<TradeOutcome>& outcomes,
                             const GroupKeyFn& key_fn,
                             const std::string& grouping_name) const;

    // A row contributes once to every distinct key it yields
    GroupedMetrics aggregate_multi(const std::vector<TradeOutcome>& outcomes,
                                   const MultiKeyFn& keys_fn,
                                   const std::string& grouping_name) const;

    // Metrics over an arbitrary set of rows, order-independent
    static EngineMetrics compute_metrics(const std::string& key, std::vector<TradeOutcome> rows);

    // Platform-wide status from the metrics of every outcome plus per-engine metrics.
    // Only numeric findings are produced; issue/recommendation text is left empty.
    PlatformHealth assess_health(const std::vector<TradeOutcome>& outcomes,
                                 const std::vector<EngineMetrics>& engines) const;

private:
    const Config& config_;
};

namespace grouping {

std::optional<std::string> by_engine(const TradeOutcome& outcome);
std::optional<std::string> by_symbol(const TradeOutcome& outcome);
std::optional<std::string> by_direction(const TradeOutcome& outcome);
std::optional<std::string> by_catalyst(const TradeOutcome& outcome);
std::optional<std::string> by_asset_type(const TradeOutcome& outcome);
std::vector<std::string> by_signal(const TradeOutcome& outcome);

} // namespace grouping
