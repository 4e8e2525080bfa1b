#include "query_api.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <cmath>
#include <stdexcept>

using json = nlohmann::json;

namespace {

QueryResult error_result(int status, const std::string& error, const std::string& message) {
    QueryResult result;
    result.status = status;
    result.body = {{"error", error}, {"message", message}};
    return result;
}

json metrics_array(const std::vector<EngineMetrics>& metrics) {
    json arr = json::array();
    for (const auto& m : metrics) {
        arr.push_back(m.to_json());
    }
    return arr;
}

int status_for(RecomputeErrorKind kind) {
    switch (kind) {
        case RecomputeErrorKind::LedgerUnavailable: return 503;
        case RecomputeErrorKind::Aborted: return 409;
        case RecomputeErrorKind::PersistFailed:
        case RecomputeErrorKind::Internal: return 500;
    }
    return 500;
}

} // namespace

QueryApi::QueryApi(AnalyticsPipeline& pipeline, OverrideRegistry& overrides)
    : pipeline_(pipeline), overrides_(overrides) {}

void QueryApi::set_override_listener(OverrideListener listener) {
    override_listener_ = std::move(listener);
}

void QueryApi::set_store_probe(StoreProbe probe) {
    store_probe_ = std::move(probe);
}

json QueryApi::envelope(const DerivedSnapshot& snapshot, json payload) const {
    payload["version"] = snapshot.version;
    payload["computed_at"] = util::format_iso8601(snapshot.computed_at);
    payload["stale"] = snapshot.generation != pipeline_.ledger_writes();
    return payload;
}

QueryResult QueryApi::with_snapshot(const std::function<json(const DerivedSnapshot&)>& render) const {
    auto snapshot = pipeline_.current();
    if (!snapshot) {
        QueryResult result;
        result.status = 503;
        result.body = {{"error", "not_computed"}};
        return result;
    }
    QueryResult result;
    result.body = envelope(*snapshot, render(*snapshot));
    return result;
}

QueryResult QueryApi::engines() const {
    return with_snapshot([](const DerivedSnapshot& s) {
        return json{
            {"engines", metrics_array(s.engine_metrics)},
            {"by_direction", metrics_array(s.direction_metrics)},
            {"by_catalyst", metrics_array(s.catalyst_metrics)},
            {"by_asset_type", metrics_array(s.asset_type_metrics)},
            {"malformed_rows", s.malformed_rows}
        };
    });
}

QueryResult QueryApi::platform_health() const {
    return with_snapshot([](const DerivedSnapshot& s) { return s.health.to_json(); });
}

QueryResult QueryApi::calibration() const {
    return with_snapshot([](const DerivedSnapshot& s) { return s.calibration.to_json(); });
}

QueryResult QueryApi::calibrate(const std::string& confidence) const {
    double raw = 0.0;
    try {
        size_t pos = 0;
        raw = std::stod(confidence, &pos);
        if (pos != confidence.size() || !std::isfinite(raw)) {
            throw std::invalid_argument(confidence);
        }
    } catch (const std::exception&) {
        return error_result(400, "invalid_confidence", "confidence must be a number in [0, 100]");
    }
    if (raw < 0.0 || raw > 100.0) {
        return error_result(400, "invalid_confidence", "confidence must be a number in [0, 100]");
    }

    const auto& analyzer = pipeline_.calibration();
    return with_snapshot([&analyzer, raw](const DerivedSnapshot& s) {
        return analyzer.calibrate(raw, s.calibration).to_json();
    });
}

QueryResult QueryApi::signal_weights() const {
    return with_snapshot([](const DerivedSnapshot& s) {
        json weights = json::array();
        for (const auto& w : s.signal_weights) {
            weights.push_back(w.to_json());
        }
        return json{
            {"enabled", s.weight_summary.enabled},
            {"summary", s.weight_summary.to_json()},
            {"weights", weights}
        };
    });
}

QueryResult QueryApi::set_override(const std::string& signal_name, const json& body) {
    if (!body.is_object() || !body.contains("weight") || !body["weight"].is_number()) {
        return error_result(400, "invalid_override", "body must be {\"weight\": <positive number>}");
    }
    double weight = body["weight"].get<double>();

    try {
        overrides_.set(signal_name, weight);
    } catch (const ValidationError& e) {
        return error_result(400, "invalid_override", e.what());
    }

    if (override_listener_) {
        override_listener_(signal_name, weight);
    }

    SnapshotPtr snapshot;
    try {
        snapshot = pipeline_.apply_overrides();
    } catch (const RecomputeError& e) {
        return error_result(status_for(e.kind()), to_string(e.kind()), e.what());
    }
    QueryResult result;
    json payload = {{"signal_name", signal_name}, {"override_weight", weight}};
    if (snapshot) {
        for (const auto& w : snapshot->signal_weights) {
            if (w.signal_name == signal_name) {
                payload["signal"] = w.to_json();
                break;
            }
        }
        result.body = envelope(*snapshot, payload);
    } else {
        result.body = payload;
    }
    return result;
}

QueryResult QueryApi::clear_override(const std::string& signal_name) {
    if (!overrides_.remove(signal_name)) {
        return error_result(404, "not_found", "no override for " + signal_name);
    }

    if (override_listener_) {
        override_listener_(signal_name, std::nullopt);
    }

    SnapshotPtr snapshot;
    try {
        snapshot = pipeline_.apply_overrides();
    } catch (const RecomputeError& e) {
        return error_result(status_for(e.kind()), to_string(e.kind()), e.what());
    }
    QueryResult result;
    json payload = {{"signal_name", signal_name}, {"removed", true}};
    result.body = snapshot ? envelope(*snapshot, payload) : payload;
    return result;
}

QueryResult QueryApi::weighted_confidence(const json& body) const {
    if (!body.is_object() || !body.contains("base_confidence") || !body["base_confidence"].is_number()) {
        return error_result(400, "invalid_request", "base_confidence is required");
    }
    std::vector<std::string> signals;
    if (body.contains("signals")) {
        if (!body["signals"].is_array()) {
            return error_result(400, "invalid_request", "signals must be an array of strings");
        }
        for (const auto& s : body["signals"]) {
            if (!s.is_string()) {
                return error_result(400, "invalid_request", "signals must be an array of strings");
            }
            signals.push_back(s.get<std::string>());
        }
    }
    double base = body["base_confidence"].get<double>();

    const auto& engine = pipeline_.weights();
    return with_snapshot([&engine, &signals, base](const DerivedSnapshot& s) {
        return engine.weighted_confidence(signals, base, s.signal_weights).to_json();
    });
}

QueryResult QueryApi::historical_stats() const {
    return with_snapshot([](const DerivedSnapshot& s) { return s.historical.stats.to_json(); });
}

QueryResult QueryApi::symbol(const std::string& symbol) const {
    std::string key = util::trim(symbol);
    if (key.empty()) {
        return error_result(400, "invalid_symbol", "symbol is required");
    }
    const auto& historical = pipeline_.historical();
    const auto& narrative = pipeline_.narrative();
    return with_snapshot([&historical, &narrative, &key](const DerivedSnapshot& s) {
        SymbolIntelligence intel = historical.lookup(s.historical, key);
        intel.recommendations = narrative.symbol_recommendations(intel);
        return intel.to_json();
    });
}

QueryResult QueryApi::adjustment(const std::string& symbol,
                                 const std::string& catalyst,
                                 const std::string& direction) const {
    if (util::trim(symbol).empty()) {
        return error_result(400, "invalid_symbol", "symbol is required");
    }
    if (!direction.empty() && !direction_from_string(direction)) {
        return error_result(400, "invalid_direction", "direction must be long or short");
    }
    const auto& historical = pipeline_.historical();
    std::string key = util::trim(symbol);
    return with_snapshot([&](const DerivedSnapshot& s) {
        return historical.adjustment(s.historical, key, catalyst, direction).to_json();
    });
}

QueryResult QueryApi::refresh() {
    try {
        auto snapshot = pipeline_.refresh();
        json payload = {
            {"outcomes", snapshot->outcome_count},
            {"engine_metrics", snapshot->engine_metrics.size()},
            {"calibration_bins", snapshot->calibration.bins.size()},
            {"signal_weights", snapshot->signal_weights.size()},
            {"symbol_profiles", snapshot->historical.profiles.size()},
            {"confidence_bands", snapshot->historical.stats.by_confidence_band.size()},
            {"malformed_rows", snapshot->malformed_rows}
        };
        QueryResult result;
        result.body = envelope(*snapshot, payload);
        return result;
    } catch (const RecomputeError& e) {
        return error_result(status_for(e.kind()), to_string(e.kind()), e.what());
    }
}

QueryResult QueryApi::service_health() const {
    auto snapshot = pipeline_.current();
    bool store_ok = store_probe_ ? store_probe_() : true;

    QueryResult result;
    result.body = {
        {"status", store_ok ? "ok" : "degraded"},
        {"computed", snapshot != nullptr},
        {"fresh", pipeline_.is_fresh()},
        {"store_connected", store_ok},
        {"version", snapshot ? json(snapshot->version) : json(nullptr)},
        {"computed_at", snapshot ? json(util::format_iso8601(snapshot->computed_at)) : json(nullptr)},
        {"timestamp", util::current_iso8601()}
    };
    return result;
}
