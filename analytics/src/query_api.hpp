#pragma once

#include "pipeline.hpp"
#include "signal_weights.hpp"
#include <nlohmann/json.hpp>
#include <functional>
#include <optional>
#include <string>

struct QueryResult {
    int status = 200;
    nlohmann::json body;
};

// Renders every analytics query as JSON; shared by the HTTP and Redis front ends
class QueryApi {
public:
    // Invoked after an override changes; nullopt means the override was removed
    using OverrideListener = std::function<void(const std::string&, const std::optional<double>&)>;
    using StoreProbe = std::function<bool()>;

    QueryApi(AnalyticsPipeline& pipeline, OverrideRegistry& overrides);

    void set_override_listener(OverrideListener listener);
    void set_store_probe(StoreProbe probe);

    QueryResult engines() const;
    QueryResult platform_health() const;
    QueryResult calibration() const;
    QueryResult calibrate(const std::string& confidence) const;
    QueryResult signal_weights() const;
    QueryResult set_override(const std::string& signal_name, const nlohmann::json& body);
    QueryResult clear_override(const std::string& signal_name);
    QueryResult weighted_confidence(const nlohmann::json& body) const;
    QueryResult historical_stats() const;
    QueryResult symbol(const std::string& symbol) const;
    QueryResult adjustment(const std::string& symbol,
                           const std::string& catalyst,
                           const std::string& direction) const;
    QueryResult refresh();
    QueryResult service_health() const;

private:
    QueryResult with_snapshot(const std::function<nlohmann::json(const DerivedSnapshot&)>& render) const;
    nlohmann::json envelope(const DerivedSnapshot& snapshot, nlohmann::json payload) const;

    AnalyticsPipeline& pipeline_;
    OverrideRegistry& overrides_;
    OverrideListener override_listener_;
    StoreProbe store_probe_;
};
