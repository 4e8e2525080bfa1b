#include "analytics_service.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <chrono>

using json = nlohmann::json;

AnalyticsService::AnalyticsService(const Config& config)
    : config_(config) {

    // Initialize components
    pg_store_ = std::make_unique<PostgresStore>(config_);
    if (config_.redis_enabled) {
        redis_bus_ = std::make_unique<RedisBus>(config_);
    }
    narrative_ = std::make_unique<DefaultNarrativeGenerator>(config_);
    pipeline_ = std::make_unique<AnalyticsPipeline>(config_, *pg_store_, overrides_, *narrative_);
    query_api_ = std::make_unique<QueryApi>(*pipeline_, overrides_);
    http_server_ = std::make_unique<HttpApiServer>(config_, *query_api_);

    if (config_.persist_derived_tables) {
        pipeline_->set_persist_sink([this](const DerivedSnapshot& snapshot) {
            pg_store_->persist_snapshot(snapshot);
        });
    }

    query_api_->set_override_listener([this](const std::string& signal, const std::optional<double>& weight) {
        bool stored = weight ? pg_store_->save_override(signal, *weight)
                             : pg_store_->delete_override(signal);
        if (!stored) {
            spdlog::warn("Override change for {} applied in memory but not persisted", signal);
        }
    });

    query_api_->set_store_probe([this] { return pg_store_->is_connected(); });
}

AnalyticsService::~AnalyticsService() {
    stop();
}

void AnalyticsService::run() {
    if (running_) {
        spdlog::warn("Analytics service is already running");
        return;
    }

    running_ = true;

    if (config_.persist_derived_tables && !pg_store_->ensure_schema()) {
        spdlog::warn("Derived tables could not be verified; persisting may fail until PostgreSQL recovers");
    }
    overrides_.load(pg_store_->load_overrides());

    if (redis_bus_) {
        // Any resolved outcome invalidates every derived table
        redis_bus_->subscribe_ledger_events([this](const json& event) {
            pipeline_->mark_stale();
            auto outcome = TradeOutcome::from_json(event, config_.breakeven_band_pct);
            if (!outcome) {
                spdlog::warn("Malformed ledger event marked analytics stale; the row will be excluded on refresh");
                return;
            }
            spdlog::debug("Ledger event {} ({} {} {:.2f}%) marked analytics stale", outcome->id,
                          outcome->symbol, to_string(outcome->resolution), outcome->return_pct);
        });

        redis_bus_->subscribe_command_requests([this](const CommandRequest& request) {
            handle_command_request(request);
        });
    }

    http_server_->start();

    scheduler_thread_ = std::thread(&AnalyticsService::scheduler_thread_func, this);

    spdlog::info("Analytics service started");
}

void AnalyticsService::stop() {
    if (!running_) {
        return;
    }

    running_ = false;
    pipeline_->abort();

    if (redis_bus_) {
        redis_bus_->stop_subscribers();
    }
    http_server_->stop();

    scheduler_cv_.notify_all();
    if (scheduler_thread_.joinable()) {
        scheduler_thread_.join();
    }

    spdlog::info("Analytics service stopped");
}

void AnalyticsService::scheduler_thread_func() {
    spdlog::info("Refresh scheduler started (every {} min)", config_.refresh_interval_min);

    if (config_.refresh_on_start) {
        refresh_and_publish();
    }

    const auto interval = std::chrono::minutes(config_.refresh_interval_min);
    while (running_) {
        {
            std::unique_lock<std::mutex> lock(scheduler_mutex_);
            scheduler_cv_.wait_for(lock, interval, [this] { return !running_; });
        }
        if (!running_) {
            break;
        }
        refresh_and_publish();
    }

    spdlog::info("Refresh scheduler stopped");
}

QueryResult AnalyticsService::refresh_and_publish() {
    QueryResult result = query_api_->refresh();
    if (result.status != 200) {
        spdlog::error("Scheduled refresh failed: {}", result.body.dump());
        return result;
    }

    if (redis_bus_) {
        json notice = result.body;
        notice["service"] = config_.service_name;
        if (!redis_bus_->publish_refreshed(notice)) {
            spdlog::warn("Refresh notice for v{} was not published", result.body.value("version", 0));
        }
    }
    return result;
}

void AnalyticsService::handle_command_request(const CommandRequest& request) {
    CommandReply reply;
    reply.corr_id = request.corr_id;

    QueryResult result;
    const json& args = request.args;

    if (request.cmd == "refresh") {
        result = refresh_and_publish();
    } else if (request.cmd == "set_override") {
        if (!args.contains("signal") || !args["signal"].is_string()) {
            result.status = 400;
            result.body = {{"error", "invalid_request"}, {"message", "args.signal is required"}};
        } else {
            result = query_api_->set_override(args["signal"].get<std::string>(), args);
        }
    } else if (request.cmd == "clear_override") {
        if (!args.contains("signal") || !args["signal"].is_string()) {
            result.status = 400;
            result.body = {{"error", "invalid_request"}, {"message", "args.signal is required"}};
        } else {
            result = query_api_->clear_override(args["signal"].get<std::string>());
        }
    } else {
        result.status = 400;
        result.body = {{"error", "unknown_command"}, {"message", "unsupported command " + request.cmd}};
    }

    reply.ok = result.status < 400;
    reply.message = reply.ok ? "ok" : result.body.value("error", std::string("error"));
    reply.data = result.body;
    reply.timestamp = std::chrono::system_clock::now();

    spdlog::info("Command {} ({}) -> {}", request.cmd, request.corr_id, reply.ok ? "ok" : reply.message);

    if (redis_bus_ && !redis_bus_->publish_command_reply(reply)) {
        spdlog::error("Failed to publish reply for command {} ({})", request.cmd, request.corr_id);
    }
}
