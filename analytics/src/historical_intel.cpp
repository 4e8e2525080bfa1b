#include "historical_intel.hpp"
#include "catalyst.hpp"
#include "performance.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>
#include <cmath>
#include <utility>

namespace {

constexpr size_t kCatalystLookupLimit = 3;

struct ConfidenceBand {
    const char* label;
    double min;
    double max;
};

const ConfidenceBand kConfidenceBands[] = {
    {"90-100", 90.0, 100.0},
    {"80-90", 80.0, 90.0},
    {"70-80", 70.0, 80.0},
    {"60-70", 60.0, 70.0},
    {"50-60", 50.0, 60.0},
    {"0-50", 0.0, 50.0},
};

bool in_band(double confidence, const ConfidenceBand& band) {
    if (band.max >= 100.0) {
        return confidence >= band.min && confidence <= band.max;
    }
    return confidence >= band.min && confidence < band.max;
}

std::optional<double> percent(int part, int whole) {
    if (whole <= 0) {
        return std::nullopt;
    }
    return static_cast<double>(part) / whole * 100.0;
}

std::string catalyst_category(const TradeOutcome& outcome) {
    return categorize_catalyst(outcome.catalyst.value_or(""));
}

using KeyFn = std::string (*)(const TradeOutcome&);

std::vector<GroupSummary> summarize_groups(const std::vector<TradeOutcome>& rows, KeyFn key_fn) {
    std::map<std::string, GroupSummary> groups;
    for (const auto& row : rows) {
        std::string key = key_fn(row);
        auto& g = groups[key];
        g.key = key;
        g.ideas++;
        if (row.is_win()) g.wins++;
        g.pnl += row.return_pct;
        if (!g.last_trade_at || row.closed_at > *g.last_trade_at) {
            g.last_trade_at = row.closed_at;
        }
    }

    std::vector<GroupSummary> out;
    out.reserve(groups.size());
    for (auto& [key, g] : groups) {
        g.win_rate = static_cast<double>(g.wins) / g.ideas * 100.0;
        out.push_back(g);
    }
    std::sort(out.begin(), out.end(), [](const GroupSummary& a, const GroupSummary& b) {
        if (a.ideas != b.ideas) return a.ideas > b.ideas;
        return a.key < b.key;
    });
    return out;
}

bool by_win_rate_desc(const GroupSummary& a, const GroupSummary& b) {
    if (a.win_rate != b.win_rate) return a.win_rate > b.win_rate;
    if (a.ideas != b.ideas) return a.ideas > b.ideas;
    return a.key < b.key;
}

bool by_win_rate_asc(const GroupSummary& a, const GroupSummary& b) {
    if (a.win_rate != b.win_rate) return a.win_rate < b.win_rate;
    if (a.ideas != b.ideas) return a.ideas > b.ideas;
    return a.key < b.key;
}

} // namespace

HistoricalIntelligence::HistoricalIntelligence(const Config& config) : config_(config) {}

std::vector<CatalystStat> HistoricalIntelligence::catalyst_stats(const std::vector<TradeOutcome>& rows) const {
    std::map<std::string, CatalystStat> by_category;
    for (const auto& row : rows) {
        if (!row.catalyst || row.catalyst->empty()) {
            continue;
        }
        std::string category = catalyst_category(row);
        auto& stat = by_category[category];
        stat.catalyst = category;
        stat.trades++;
        if (row.is_win()) stat.wins++;
    }

    std::vector<CatalystStat> qualified;
    for (auto& [category, stat] : by_category) {
        if (stat.trades < config_.catalyst_min_samples) {
            continue;
        }
        stat.win_rate = static_cast<double>(stat.wins) / stat.trades * 100.0;
        qualified.push_back(stat);
    }
    std::sort(qualified.begin(), qualified.end(), [](const CatalystStat& a, const CatalystStat& b) {
        if (a.win_rate != b.win_rate) return a.win_rate > b.win_rate;
        return a.catalyst < b.catalyst;
    });
    return qualified;
}

std::vector<SetupStat> HistoricalIntelligence::setup_stats(const std::vector<TradeOutcome>& rows) const {
    std::map<std::pair<Direction, std::string>, SetupStat> by_setup;
    for (const auto& row : rows) {
        if (!row.catalyst || row.catalyst->empty()) {
            continue;
        }
        std::string category = catalyst_category(row);
        auto& stat = by_setup[{row.direction, category}];
        stat.direction = row.direction;
        stat.catalyst = category;
        stat.trades++;
        if (row.is_win()) stat.wins++;
    }

    std::vector<SetupStat> qualified;
    for (auto& [key, stat] : by_setup) {
        if (stat.trades < config_.catalyst_min_samples) {
            continue;
        }
        stat.win_rate = static_cast<double>(stat.wins) / stat.trades * 100.0;
        qualified.push_back(stat);
    }
    std::stable_sort(qualified.begin(), qualified.end(), [](const SetupStat& a, const SetupStat& b) {
        return a.win_rate > b.win_rate;
    });
    return qualified;
}

SymbolProfile HistoricalIntelligence::build_profile(const std::string& symbol,
                                                    const std::vector<TradeOutcome>& rows,
                                                    int open_ideas) const {
    SymbolProfile profile;
    profile.symbol = symbol;
    profile.closed_ideas = static_cast<int>(rows.size());
    profile.total_ideas = profile.closed_ideas + std::max(0, open_ideas);

    if (rows.empty()) {
        return profile;
    }

    EngineMetrics metrics = PerformanceAggregator::compute_metrics(symbol, rows);
    profile.wins = metrics.win_count;
    profile.losses = metrics.loss_count;
    profile.breakevens = metrics.breakeven_count;
    profile.overall_win_rate = metrics.win_rate;
    profile.profit_factor = metrics.profit_factor;
    profile.avg_win_pct = metrics.avg_win_pct;
    profile.avg_loss_pct = metrics.avg_loss_pct;
    profile.avg_confidence = metrics.avg_confidence;

    int long_count = 0;
    int long_wins = 0;
    int short_count = 0;
    int short_wins = 0;
    double pnl = 0.0;

    for (const auto& row : rows) {
        if (row.direction == Direction::Long) {
            long_count++;
            if (row.is_win()) long_wins++;
        } else {
            short_count++;
            if (row.is_win()) short_wins++;
        }
        pnl += row.return_pct;
        if (!profile.last_trade_at || row.closed_at > *profile.last_trade_at) {
            profile.last_trade_at = row.closed_at;
        }
    }

    profile.long_win_rate = percent(long_wins, long_count);
    profile.short_win_rate = percent(short_wins, short_count);
    profile.total_pnl = pnl;

    if (metrics.avg_confidence > 0.0) {
        profile.confidence_realization = metrics.win_rate / metrics.avg_confidence * 100.0;
    }

    auto catalysts = catalyst_stats(rows);
    if (!catalysts.empty()) {
        profile.best_catalyst = catalysts.front().catalyst;
        profile.best_catalyst_win_rate = catalysts.front().win_rate;
    }
    if (catalysts.size() >= 2) {
        profile.worst_catalyst = catalysts.back().catalyst;
        profile.worst_catalyst_win_rate = catalysts.back().win_rate;
    }

    return profile;
}

HistoricalStats HistoricalIntelligence::build_stats(const LedgerSnapshot& ledger) const {
    HistoricalStats stats;
    const auto& rows = ledger.outcomes;

    int open_total = 0;
    for (const auto& [symbol, count] : ledger.open_ideas) {
        open_total += std::max(0, count);
    }

    auto& overall = stats.overall;
    overall.closed_ideas = static_cast<int>(rows.size());
    overall.total_ideas = overall.closed_ideas + open_total;
    if (!rows.empty()) {
        EngineMetrics metrics = PerformanceAggregator::compute_metrics("overall", rows);
        overall.wins = metrics.win_count;
        overall.losses = metrics.loss_count;
        overall.breakevens = metrics.breakeven_count;
        overall.win_rate = metrics.win_rate;
        for (const auto& outcome : rows) {
            overall.total_pnl += outcome.return_pct;
        }
        overall.avg_pnl_pct = metrics.expectancy;
        overall.profit_factor = metrics.profit_factor;
    }

    stats.by_source = summarize_groups(rows, [](const TradeOutcome& o) {
        return o.engine.empty() ? std::string("unknown") : o.engine;
    });
    stats.by_asset_type = summarize_groups(rows, [](const TradeOutcome& o) {
        return o.asset_type.value_or("unknown");
    });
    stats.by_direction = summarize_groups(rows, [](const TradeOutcome& o) {
        return to_string(o.direction);
    });
    stats.by_catalyst = summarize_groups(rows, [](const TradeOutcome& o) {
        return catalyst_category(o);
    });
    std::sort(stats.by_catalyst.begin(), stats.by_catalyst.end(), by_win_rate_desc);

    stats.by_symbol = summarize_groups(rows, [](const TradeOutcome& o) { return o.symbol; });

    for (const auto& band : kConfidenceBands) {
        ConfidenceBandRow row;
        row.band = band.label;
        row.band_min = band.min;
        row.band_max = band.max;
        row.expected_win_rate = (band.min + band.max) / 2.0;
        for (const auto& outcome : rows) {
            if (in_band(outcome.confidence, band)) {
                row.ideas++;
                if (outcome.is_win()) row.wins++;
            }
        }
        row.actual_win_rate = percent(row.wins, row.ideas);
        if (row.actual_win_rate) {
            row.calibration_error = *row.actual_win_rate - row.expected_win_rate;
        }
        stats.by_confidence_band.push_back(row);
    }

    std::vector<GroupSummary> qualified;
    for (const auto& s : stats.by_symbol) {
        if (s.ideas >= config_.performer_min_trades) {
            qualified.push_back(s);
        }
    }
    size_t limit = static_cast<size_t>(std::max(0, config_.performers_limit));

    stats.top_performers = qualified;
    std::sort(stats.top_performers.begin(), stats.top_performers.end(), by_win_rate_desc);
    if (stats.top_performers.size() > limit) stats.top_performers.resize(limit);

    stats.worst_performers = qualified;
    std::sort(stats.worst_performers.begin(), stats.worst_performers.end(), by_win_rate_asc);
    if (stats.worst_performers.size() > limit) stats.worst_performers.resize(limit);

    return stats;
}

HistoricalIndex HistoricalIntelligence::build(const LedgerSnapshot& ledger) const {
    HistoricalIndex index;

    std::map<std::string, std::vector<TradeOutcome>> by_symbol;
    for (const auto& outcome : ledger.outcomes) {
        by_symbol[outcome.symbol].push_back(outcome);
    }
    for (const auto& [symbol, count] : ledger.open_ideas) {
        by_symbol[symbol];
    }

    size_t recent_limit = static_cast<size_t>(std::max(0, config_.recent_trades_limit));
    for (auto& [symbol, rows] : by_symbol) {
        auto open_it = ledger.open_ideas.find(symbol);
        int open = open_it != ledger.open_ideas.end() ? open_it->second : 0;

        index.profiles[symbol] = build_profile(symbol, rows, open);
        index.catalysts[symbol] = catalyst_stats(rows);
        index.setups[symbol] = setup_stats(rows);

        std::sort(rows.begin(), rows.end(), [](const TradeOutcome& a, const TradeOutcome& b) {
            if (a.closed_at != b.closed_at) return a.closed_at > b.closed_at;
            return a.id > b.id;
        });
        if (rows.size() > recent_limit) rows.resize(recent_limit);
        index.recent_trades[symbol] = std::move(rows);
    }

    index.stats = build_stats(ledger);

    spdlog::info("Historical index built: {} symbols, {} closed ideas", index.profiles.size(),
                 index.stats.overall.closed_ideas);
    return index;
}

SymbolIntelligence HistoricalIntelligence::lookup(const HistoricalIndex& index, const std::string& symbol) const {
    SymbolIntelligence intel;

    auto it = index.profiles.find(symbol);
    if (it == index.profiles.end()) {
        intel.profile.symbol = symbol;
        return intel;
    }
    intel.profile = it->second;

    auto recent = index.recent_trades.find(symbol);
    if (recent != index.recent_trades.end()) {
        intel.recent_trades = recent->second;
    }

    auto catalysts = index.catalysts.find(symbol);
    if (catalysts != index.catalysts.end()) {
        const auto& list = catalysts->second;
        // Best takes the upper half, worst the lower; a catalyst never appears in both
        size_t best_count = std::min(kCatalystLookupLimit, (list.size() + 1) / 2);
        size_t worst_count = std::min(kCatalystLookupLimit, list.size() - best_count);
        for (size_t i = 0; i < best_count; ++i) {
            intel.best_catalysts.push_back(list[i]);
        }
        for (size_t i = 0; i < worst_count; ++i) {
            intel.worst_catalysts.push_back(list[list.size() - 1 - i]);
        }
    }

    auto setups = index.setups.find(symbol);
    if (setups != index.setups.end()) {
        intel.setups = setups->second;
    }

    return intel;
}

HistoricalAdjustment HistoricalIntelligence::adjustment(const HistoricalIndex& index,
                                                        const std::string& symbol,
                                                        const std::string& catalyst,
                                                        const std::string& direction) const {
    HistoricalAdjustment result;

    auto it = index.profiles.find(symbol);
    if (it == index.profiles.end() || it->second.closed_ideas < config_.adjustment_min_closed) {
        return result;
    }
    const SymbolProfile& profile = it->second;
    result.symbol_win_rate = profile.overall_win_rate;

    if (profile.overall_win_rate) {
        double wr = *profile.overall_win_rate;
        if (wr >= 70.0) {
            result.adjustment += 10;
            result.reasons.push_back(fmt::format("+10: {} historical win rate {:.0f}%", symbol, wr));
        } else if (wr < 40.0) {
            result.adjustment -= 15;
            result.reasons.push_back(fmt::format("-15: {} low win rate {:.0f}%", symbol, wr));
        }
    }

    auto dir = direction_from_string(direction);
    if (dir && profile.long_win_rate && profile.short_win_rate) {
        double favored = *dir == Direction::Long ? *profile.long_win_rate : *profile.short_win_rate;
        double other = *dir == Direction::Long ? *profile.short_win_rate : *profile.long_win_rate;
        std::string side = to_string(*dir);
        std::string other_side = *dir == Direction::Long ? "short" : "long";
        if (favored > other + 15.0) {
            result.adjustment += 5;
            result.reasons.push_back(fmt::format("+5: {} {} bias confirmed", symbol, side));
        } else if (favored < other - 15.0) {
            result.adjustment -= 5;
            result.reasons.push_back(fmt::format("-5: {} performs better {}", symbol, other_side));
        }
    }

    std::string category = categorize_catalyst(catalyst);
    if (profile.best_catalyst && *profile.best_catalyst == category &&
        profile.best_catalyst_win_rate && *profile.best_catalyst_win_rate >= 60.0) {
        result.adjustment += 8;
        result.catalyst_win_rate = profile.best_catalyst_win_rate;
        result.reasons.push_back(fmt::format("+8: {} is best catalyst for {}", category, symbol));
    } else if (profile.worst_catalyst && *profile.worst_catalyst == category &&
               profile.worst_catalyst_win_rate && *profile.worst_catalyst_win_rate < 40.0) {
        result.adjustment -= 10;
        result.catalyst_win_rate = profile.worst_catalyst_win_rate;
        result.reasons.push_back(fmt::format("-10: {} is worst catalyst for {}", category, symbol));
    }

    return result;
}
