#pragma once

#include "types.hpp"
#include "config.hpp"
#include <map>
#include <string>
#include <vector>

// Everything the historical lookups read, rebuilt wholesale on refresh
struct HistoricalIndex {
    HistoricalStats stats;
    std::map<std::string, SymbolProfile> profiles;
    std::map<std::string, std::vector<CatalystStat>> catalysts;  // qualified, win rate desc
    std::map<std::string, std::vector<SetupStat>> setups;        // qualified, win rate desc
    std::map<std::string, std::vector<TradeOutcome>> recent_trades;  // newest first
};

class HistoricalIntelligence {
public:
    explicit HistoricalIntelligence(const Config& config);

    HistoricalIndex build(const LedgerSnapshot& ledger) const;

    SymbolProfile build_profile(const std::string& symbol,
                                const std::vector<TradeOutcome>& rows,
                                int open_ideas) const;

    // Unknown symbols get an empty profile with null statistics.
    // Recommendations are left to the narrative generator.
    SymbolIntelligence lookup(const HistoricalIndex& index, const std::string& symbol) const;

    // Additive confidence adjustment for a prospective trade
    HistoricalAdjustment adjustment(const HistoricalIndex& index,
                                    const std::string& symbol,
                                    const std::string& catalyst,
                                    const std::string& direction) const;

private:
    std::vector<CatalystStat> catalyst_stats(const std::vector<TradeOutcome>& rows) const;
    std::vector<SetupStat> setup_stats(const std::vector<TradeOutcome>& rows) const;
    HistoricalStats build_stats(const LedgerSnapshot& ledger) const;

    const Config& config_;
};
