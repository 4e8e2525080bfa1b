#include "performance.hpp"
#include "catalyst.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <limits>
#include <map>
#include <set>

namespace {

bool closed_before(const TradeOutcome& a, const TradeOutcome& b) {
    if (a.closed_at != b.closed_at) {
        return a.closed_at < b.closed_at;
    }
    return a.id < b.id;
}

double max_drawdown_pct(const std::vector<TradeOutcome>& sorted_rows) {
    double equity = 100.0;
    double peak = equity;
    double max_dd = 0.0;

    for (const auto& row : sorted_rows) {
        equity *= 1.0 + row.return_pct / 100.0;
        peak = std::max(peak, equity);
        if (peak > 0.0) {
            max_dd = std::max(max_dd, (peak - equity) / peak * 100.0);
        }
    }
    return max_dd;
}

GroupedMetrics reduce_groups(std::map<std::string, std::vector<TradeOutcome>>& buckets, int excluded,
                             const std::string& grouping_name) {
    GroupedMetrics result;
    result.excluded = excluded;
    result.groups.reserve(buckets.size());
    for (auto& [key, rows] : buckets) {
        result.groups.push_back(PerformanceAggregator::compute_metrics(key, std::move(rows)));
    }
    if (excluded > 0) {
        spdlog::warn("Grouping '{}' excluded {} rows without a key", grouping_name, excluded);
    }
    return result;
}

} // namespace

PerformanceAggregator::PerformanceAggregator(const Config& config) : config_(config) {}

GroupedMetrics PerformanceAggregator::aggregate(const std::vector<TradeOutcome>& outcomes,
                                                const GroupKeyFn& key_fn,
                                                const std::string& grouping_name) const {
    std::map<std::string, std::vector<TradeOutcome>> buckets;
    int excluded = 0;

    for (const auto& outcome : outcomes) {
        if (!std::isfinite(outcome.return_pct)) {
            spdlog::debug("Excluding {} from '{}': non-finite return", outcome.id, grouping_name);
            excluded++;
            continue;
        }
        auto key = key_fn(outcome);
        if (!key || key->empty()) {
            spdlog::debug("Excluding {} from '{}': no group key", outcome.id, grouping_name);
            excluded++;
            continue;
        }
        buckets[*key].push_back(outcome);
    }

    return reduce_groups(buckets, excluded, grouping_name);
}

GroupedMetrics PerformanceAggregator::aggregate_multi(const std::vector<TradeOutcome>& outcomes,
                                                      const MultiKeyFn& keys_fn,
                                                      const std::string& grouping_name) const {
    std::map<std::string, std::vector<TradeOutcome>> buckets;
    int excluded = 0;

    for (const auto& outcome : outcomes) {
        if (!std::isfinite(outcome.return_pct)) {
            spdlog::debug("Excluding {} from '{}': non-finite return", outcome.id, grouping_name);
            excluded++;
            continue;
        }
        auto keys = keys_fn(outcome);
        std::set<std::string> distinct;
        for (const auto& key : keys) {
            if (!key.empty()) distinct.insert(key);
        }
        if (distinct.empty()) {
            spdlog::debug("Excluding {} from '{}': no group key", outcome.id, grouping_name);
            excluded++;
            continue;
        }
        for (const auto& key : distinct) {
            buckets[key].push_back(outcome);
        }
    }

    return reduce_groups(buckets, excluded, grouping_name);
}

EngineMetrics PerformanceAggregator::compute_metrics(const std::string& key, std::vector<TradeOutcome> rows) {
    std::sort(rows.begin(), rows.end(), closed_before);

    EngineMetrics m;
    m.key = key;
    m.trade_count = static_cast<int>(rows.size());
    if (rows.empty()) {
        return m;
    }

    double sum_returns = 0.0;
    double gross_profit = 0.0;
    double gross_loss = 0.0;
    double sum_win_returns = 0.0;
    double sum_loss_returns = 0.0;
    double sum_confidence = 0.0;

    for (const auto& row : rows) {
        switch (row.resolution) {
            case Resolution::Win:
                m.win_count++;
                sum_win_returns += row.return_pct;
                break;
            case Resolution::Loss:
                m.loss_count++;
                sum_loss_returns += row.return_pct;
                break;
            case Resolution::Breakeven:
                m.breakeven_count++;
                break;
        }
        sum_returns += row.return_pct;
        sum_confidence += row.confidence;
        if (row.return_pct > 0.0) {
            gross_profit += row.return_pct;
        } else if (row.return_pct < 0.0) {
            gross_loss += -row.return_pct;
        }
    }

    const double n = static_cast<double>(rows.size());
    m.win_rate = m.win_count / n * 100.0;
    m.expectancy = sum_returns / n;
    m.avg_confidence = sum_confidence / n;

    if (m.win_count > 0) {
        m.avg_win_pct = sum_win_returns / m.win_count;
    }
    if (m.loss_count > 0) {
        m.avg_loss_pct = sum_loss_returns / m.loss_count;
    }

    if (gross_loss > 0.0) {
        m.profit_factor = gross_profit / gross_loss;
    } else if (gross_profit > 0.0) {
        m.profit_factor = std::numeric_limits<double>::infinity();
    }

    if (rows.size() >= 2) {
        double variance = 0.0;
        for (const auto& row : rows) {
            double d = row.return_pct - m.expectancy;
            variance += d * d;
        }
        double stdev = std::sqrt(variance / n);
        if (stdev > 0.0) {
            m.sharpe_ratio = m.expectancy / stdev * kSharpeAnnualization;
        } else if (m.expectancy > 0.0) {
            m.sharpe_ratio = std::numeric_limits<double>::infinity();
        } else if (m.expectancy < 0.0) {
            m.sharpe_ratio = -std::numeric_limits<double>::infinity();
        } else {
            m.sharpe_ratio = 0.0;
        }
    }

    m.max_drawdown = max_drawdown_pct(rows);
    return m;
}

PlatformHealth PerformanceAggregator::assess_health(const std::vector<TradeOutcome>& outcomes,
                                                    const std::vector<EngineMetrics>& engines) const {
    PlatformHealth health;

    std::vector<TradeOutcome> valid;
    valid.reserve(outcomes.size());
    for (const auto& outcome : outcomes) {
        if (std::isfinite(outcome.return_pct)) {
            valid.push_back(outcome);
        }
    }
    health.overall = compute_metrics("platform", std::move(valid));
    const EngineMetrics& overall = *health.overall;

    if (overall.trade_count < config_.health_min_trades) {
        health.status = HealthStatus::Degraded;
        health.findings.push_back({HealthIssue::InsufficientData, "", static_cast<double>(overall.trade_count),
                                   static_cast<double>(config_.health_min_trades)});
        return health;
    }

    // A group with only breakeven rows has no profit factor; it counts as zero
    double profit_factor = overall.profit_factor.value_or(0.0);

    bool negative_expectancy = overall.expectancy <= 0.0;
    bool low_profit_factor = profit_factor < config_.health_min_profit_factor;
    bool low_win_rate = overall.win_rate < config_.health_warn_win_rate;
    bool negative_sharpe = overall.sharpe_ratio && *overall.sharpe_ratio < 0.0;

    if (negative_expectancy) {
        health.findings.push_back({HealthIssue::NegativeExpectancy, "", overall.expectancy, 0.0});
    }
    if (low_profit_factor) {
        health.findings.push_back({HealthIssue::LowProfitFactor, "", profit_factor,
                                   config_.health_min_profit_factor});
    }
    if (low_win_rate) {
        health.findings.push_back({HealthIssue::LowWinRate, "", overall.win_rate, config_.health_warn_win_rate});
    }
    if (negative_sharpe) {
        health.findings.push_back({HealthIssue::NegativeSharpe, "", *overall.sharpe_ratio, 0.0});
    }

    for (const auto& engine : engines) {
        if (engine.trade_count > 0 && engine.expectancy < 0.0) {
            health.findings.push_back({HealthIssue::EngineNegativeExpectancy, engine.key, engine.expectancy, 0.0});
        }
    }

    if (negative_expectancy && low_profit_factor) {
        health.status = HealthStatus::Unhealthy;
    } else if (negative_expectancy || low_profit_factor || low_win_rate || negative_sharpe) {
        health.status = HealthStatus::Degraded;
    } else {
        health.status = HealthStatus::Healthy;
    }

    spdlog::debug("Platform health {} over {} trades ({} findings)", to_string(health.status),
                  overall.trade_count, health.findings.size());
    return health;
}

namespace grouping {

std::optional<std::string> by_engine(const TradeOutcome& outcome) {
    if (outcome.engine.empty()) return std::nullopt;
    return outcome.engine;
}

std::optional<std::string> by_symbol(const TradeOutcome& outcome) {
    if (outcome.symbol.empty()) return std::nullopt;
    return outcome.symbol;
}

std::optional<std::string> by_direction(const TradeOutcome& outcome) {
    return to_string(outcome.direction);
}

std::optional<std::string> by_catalyst(const TradeOutcome& outcome) {
    if (!outcome.catalyst || outcome.catalyst->empty()) return std::nullopt;
    return categorize_catalyst(*outcome.catalyst);
}

std::optional<std::string> by_asset_type(const TradeOutcome& outcome) {
    return outcome.asset_type;
}

std::vector<std::string> by_signal(const TradeOutcome& outcome) {
    return outcome.signals;
}

} // namespace grouping
