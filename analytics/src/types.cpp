#include "types.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <cmath>
#include <limits>
#include <type_traits>

using json = nlohmann::json;

std::string to_string(Direction direction) {
    return direction == Direction::Long ? "long" : "short";
}

std::string to_string(Resolution resolution) {
    switch (resolution) {
        case Resolution::Win: return "win";
        case Resolution::Loss: return "loss";
        case Resolution::Breakeven: return "breakeven";
    }
    return "breakeven";
}

std::string to_string(ConfidenceTier tier) {
    switch (tier) {
        case ConfidenceTier::Untested: return "untested";
        case ConfidenceTier::Low: return "low";
        case ConfidenceTier::Medium: return "medium";
        case ConfidenceTier::High: return "high";
    }
    return "untested";
}

std::string to_string(HealthStatus status) {
    switch (status) {
        case HealthStatus::Healthy: return "healthy";
        case HealthStatus::Degraded: return "degraded";
        case HealthStatus::Unhealthy: return "unhealthy";
    }
    return "degraded";
}

std::optional<Direction> direction_from_string(const std::string& value) {
    std::string v = util::to_lower(util::trim(value));
    if (v == "long" || v == "buy" || v == "call") {
        return Direction::Long;
    }
    if (v == "short" || v == "sell" || v == "put") {
        return Direction::Short;
    }
    return std::nullopt;
}

Resolution classify_return(double return_pct, double breakeven_band_pct) {
    if (return_pct > breakeven_band_pct) {
        return Resolution::Win;
    }
    if (return_pct < -breakeven_band_pct) {
        return Resolution::Loss;
    }
    return Resolution::Breakeven;
}

json ratio_to_json(const std::optional<double>& value) {
    if (!value) {
        return nullptr;
    }
    if (std::isinf(*value)) {
        return *value > 0 ? "+Infinity" : "-Infinity";
    }
    if (std::isnan(*value)) {
        return nullptr;
    }
    return *value;
}

json optional_to_json(const std::optional<double>& value) {
    if (!value || !std::isfinite(*value)) {
        return nullptr;
    }
    return *value;
}

namespace {

json optional_string(const std::optional<std::string>& value) {
    return value ? json(*value) : json(nullptr);
}

json optional_time(const std::optional<std::chrono::system_clock::time_point>& value) {
    return value ? json(util::format_iso8601(*value)) : json(nullptr);
}

} // namespace

json TradeOutcome::to_json() const {
    return {
        {"id", id},
        {"symbol", symbol},
        {"engine", engine},
        {"asset_type", optional_string(asset_type)},
        {"direction", ::to_string(direction)},
        {"signals", signals},
        {"confidence", confidence},
        {"catalyst", optional_string(catalyst)},
        {"return_pct", return_pct},
        {"resolution", ::to_string(resolution)},
        {"opened_at", util::format_iso8601(opened_at)},
        {"closed_at", util::format_iso8601(closed_at)}
    };
}

std::optional<TradeOutcome> TradeOutcome::from_json(const json& j, double breakeven_band_pct) {
    try {
        TradeOutcome outcome;
        outcome.id = j.at("id").get<std::string>();
        outcome.symbol = j.at("symbol").get<std::string>();
        outcome.engine = j.value("engine", std::string("unknown"));

        auto direction = direction_from_string(j.at("direction").get<std::string>());
        if (!direction) {
            spdlog::warn("Outcome {} has unknown direction '{}'", outcome.id,
                         j.at("direction").get<std::string>());
            return std::nullopt;
        }
        outcome.direction = *direction;

        if (j.contains("signals") && j["signals"].is_array()) {
            outcome.signals = j["signals"].get<std::vector<std::string>>();
        }
        outcome.confidence = j.at("confidence").get<double>();
        if (j.contains("asset_type") && j["asset_type"].is_string()) {
            outcome.asset_type = j["asset_type"].get<std::string>();
        }
        if (j.contains("catalyst") && j["catalyst"].is_string()) {
            outcome.catalyst = j["catalyst"].get<std::string>();
        }
        outcome.return_pct = j.at("return_pct").get<double>();
        outcome.resolution = classify_return(outcome.return_pct, breakeven_band_pct);
        outcome.opened_at = util::parse_iso8601(j.at("opened_at").get<std::string>());
        outcome.closed_at = util::parse_iso8601(j.at("closed_at").get<std::string>());
        return outcome;
    } catch (const std::exception& e) {
        spdlog::warn("Failed to parse trade outcome: {}", e.what());
        return std::nullopt;
    }
}

json EngineMetrics::to_json() const {
    return {
        {"key", key},
        {"trade_count", trade_count},
        {"win_count", win_count},
        {"loss_count", loss_count},
        {"breakeven_count", breakeven_count},
        {"win_rate", win_rate},
        {"expectancy", expectancy},
        {"sharpe_ratio", ratio_to_json(sharpe_ratio)},
        {"profit_factor", ratio_to_json(profit_factor)},
        {"max_drawdown", max_drawdown},
        {"avg_win_pct", optional_to_json(avg_win_pct)},
        {"avg_loss_pct", optional_to_json(avg_loss_pct)},
        {"avg_confidence", avg_confidence}
    };
}

json PlatformHealth::to_json() const {
    return {
        {"status", ::to_string(status)},
        {"overall", overall ? overall->to_json() : json(nullptr)},
        {"issues", issues},
        {"recommendations", recommendations}
    };
}

json CalibrationBin::to_json() const {
    return {
        {"bin_start", bin_start},
        {"bin_end", bin_end},
        {"predicted_confidence", optional_to_json(predicted_confidence)},
        {"actual_win_rate", optional_to_json(actual_win_rate)},
        {"sample_size", sample_size},
        {"standard_error", standard_error},
        {"is_calibrated", is_calibrated}
    };
}

json CalibrationReport::to_json() const {
    json bins_json = json::array();
    for (const auto& bin : bins) {
        bins_json.push_back(bin.to_json());
    }
    return {
        {"bins", bins_json},
        {"total_predictions", total_predictions},
        {"scored_predictions", scored_predictions},
        {"overall_accuracy", optional_to_json(overall_accuracy)},
        {"brier_score", optional_to_json(brier_score)},
        {"expected_calibration_error", optional_to_json(expected_calibration_error)},
        {"max_calibration_error", optional_to_json(max_calibration_error)},
        {"reliability", optional_to_json(reliability)},
        {"recommendations", recommendations}
    };
}

json ConfidenceAdjustment::to_json() const {
    return {
        {"original_confidence", original_confidence},
        {"calibrated_confidence", calibrated_confidence},
        {"adjustment_factor", adjustment_factor}
    };
}

double SignalWeight::dynamic_weight() const {
    return std::visit([](const auto& s) -> double {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, ComputedWeight>) {
            return s.weight;
        } else {
            return s.computed;
        }
    }, state);
}

double SignalWeight::effective_weight() const {
    return std::visit([](const auto& s) { return s.weight; }, state);
}

bool SignalWeight::is_overridden() const {
    return std::holds_alternative<OverriddenWeight>(state);
}

std::optional<double> SignalWeight::override_weight() const {
    if (const auto* o = std::get_if<OverriddenWeight>(&state)) {
        return o->weight;
    }
    return std::nullopt;
}

json SignalWeight::to_json() const {
    return {
        {"signal_name", signal_name},
        {"base_weight", base_weight},
        {"dynamic_weight", dynamic_weight()},
        {"effective_weight", effective_weight()},
        {"win_rate", optional_to_json(win_rate)},
        {"expectancy", optional_to_json(expectancy)},
        {"trade_count", trade_count},
        {"confidence", ::to_string(tier)},
        {"is_overridden", is_overridden()},
        {"override_weight", optional_to_json(override_weight())}
    };
}

json SignalWeightSummary::to_json() const {
    json boosted = json::array();
    for (const auto& w : top_boosted) boosted.push_back(w.to_json());
    json reduced = json::array();
    for (const auto& w : top_reduced) reduced.push_back(w.to_json());

    return {
        {"enabled", enabled},
        {"total_signals", total_signals},
        {"boosted_count", boosted_count},
        {"reduced_count", reduced_count},
        {"neutral_count", neutral_count},
        {"overridden_count", overridden_count},
        {"top_boosted", boosted},
        {"top_reduced", reduced}
    };
}

json WeightedConfidence::to_json() const {
    json parts = json::array();
    for (const auto& c : contributions) {
        parts.push_back({{"signal", c.signal}, {"weight", c.weight}, {"contribution", c.contribution}});
    }
    return {
        {"adjusted_confidence", adjusted_confidence},
        {"total_weight_multiplier", total_weight_multiplier},
        {"signal_contributions", parts}
    };
}

json SymbolProfile::to_json() const {
    return {
        {"symbol", symbol},
        {"total_ideas", total_ideas},
        {"closed_ideas", closed_ideas},
        {"wins", wins},
        {"losses", losses},
        {"breakevens", breakevens},
        {"overall_win_rate", optional_to_json(overall_win_rate)},
        {"long_win_rate", optional_to_json(long_win_rate)},
        {"short_win_rate", optional_to_json(short_win_rate)},
        {"total_pnl", optional_to_json(total_pnl)},
        {"profit_factor", ratio_to_json(profit_factor)},
        {"avg_win_pct", optional_to_json(avg_win_pct)},
        {"avg_loss_pct", optional_to_json(avg_loss_pct)},
        {"best_catalyst", optional_string(best_catalyst)},
        {"best_catalyst_win_rate", optional_to_json(best_catalyst_win_rate)},
        {"worst_catalyst", optional_string(worst_catalyst)},
        {"worst_catalyst_win_rate", optional_to_json(worst_catalyst_win_rate)},
        {"avg_confidence", optional_to_json(avg_confidence)},
        {"confidence_realization", optional_to_json(confidence_realization)},
        {"last_trade_at", optional_time(last_trade_at)}
    };
}

json CatalystStat::to_json() const {
    return {
        {"catalyst", catalyst},
        {"trades", trades},
        {"wins", wins},
        {"win_rate", win_rate}
    };
}

json SetupStat::to_json() const {
    return {
        {"direction", ::to_string(direction)},
        {"catalyst", catalyst},
        {"trades", trades},
        {"wins", wins},
        {"win_rate", win_rate}
    };
}

json ConfidenceBandRow::to_json() const {
    return {
        {"band", band},
        {"ideas", ideas},
        {"wins", wins},
        {"expected_win_rate", expected_win_rate},
        {"actual_win_rate", optional_to_json(actual_win_rate)},
        {"calibration_error", optional_to_json(calibration_error)}
    };
}

json GroupSummary::to_json() const {
    json j = {
        {"key", key},
        {"ideas", ideas},
        {"wins", wins},
        {"win_rate", win_rate},
        {"pnl", pnl}
    };
    if (last_trade_at) {
        j["last_trade_at"] = util::format_iso8601(*last_trade_at);
    }
    return j;
}

json OverallStats::to_json() const {
    return {
        {"total_ideas", total_ideas},
        {"closed_ideas", closed_ideas},
        {"wins", wins},
        {"losses", losses},
        {"breakevens", breakevens},
        {"win_rate", optional_to_json(win_rate)},
        {"total_pnl", total_pnl},
        {"avg_pnl_pct", optional_to_json(avg_pnl_pct)},
        {"profit_factor", ratio_to_json(profit_factor)}
    };
}

namespace {

json groups_to_json(const std::vector<GroupSummary>& groups) {
    json arr = json::array();
    for (const auto& g : groups) arr.push_back(g.to_json());
    return arr;
}

} // namespace

json HistoricalStats::to_json() const {
    json bands = json::array();
    for (const auto& row : by_confidence_band) bands.push_back(row.to_json());

    return {
        {"overall", overall.to_json()},
        {"by_source", groups_to_json(by_source)},
        {"by_asset_type", groups_to_json(by_asset_type)},
        {"by_direction", groups_to_json(by_direction)},
        {"by_catalyst", groups_to_json(by_catalyst)},
        {"by_symbol", groups_to_json(by_symbol)},
        {"by_confidence_band", bands},
        {"top_performers", groups_to_json(top_performers)},
        {"worst_performers", groups_to_json(worst_performers)}
    };
}

json SymbolIntelligence::to_json() const {
    json trades = json::array();
    for (const auto& t : recent_trades) trades.push_back(t.to_json());
    json best = json::array();
    for (const auto& c : best_catalysts) best.push_back(c.to_json());
    json worst = json::array();
    for (const auto& c : worst_catalysts) worst.push_back(c.to_json());
    json setup_rows = json::array();
    for (const auto& s : setups) setup_rows.push_back(s.to_json());

    return {
        {"symbol", profile.symbol},
        {"profile", profile.to_json()},
        {"recent_trades", trades},
        {"best_catalysts", best},
        {"worst_catalysts", worst},
        {"setups", setup_rows},
        {"recommendations", recommendations}
    };
}

json HistoricalAdjustment::to_json() const {
    return {
        {"adjustment", adjustment},
        {"reason", reasons.empty() ? std::string("No historical data")
                                   : fmt::format("{}", fmt::join(reasons, "; "))},
        {"symbol_win_rate", optional_to_json(symbol_win_rate)},
        {"catalyst_win_rate", optional_to_json(catalyst_win_rate)}
    };
}

std::optional<CommandRequest> CommandRequest::from_json(const json& j) {
    try {
        CommandRequest req;
        req.type = j.value("type", std::string("command"));
        req.cmd = j.at("cmd").get<std::string>();
        req.args = j.contains("args") ? j["args"] : json::object();
        req.corr_id = j.at("corr_id").get<std::string>();
        req.timestamp = j.contains("ts") ? util::parse_iso8601(j["ts"].get<std::string>())
                                         : std::chrono::system_clock::now();
        return req;
    } catch (const std::exception& e) {
        spdlog::warn("Failed to parse command request: {}", e.what());
        return std::nullopt;
    }
}

json CommandReply::to_json() const {
    return {
        {"corr_id", corr_id},
        {"ok", ok},
        {"message", message},
        {"data", data},
        {"ts", util::format_iso8601(timestamp)}
    };
}
