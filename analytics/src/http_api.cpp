#include "http_api.hpp"
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

void send(httplib::Response& res, const QueryResult& result) {
    res.status = result.status;
    res.set_content(result.body.dump(), "application/json");
}

void send_error(httplib::Response& res, int status, const std::string& error, const std::string& message) {
    res.status = status;
    res.set_content(json{{"error", error}, {"message", message}}.dump(), "application/json");
}

// Parses a JSON request body; writes a 400 and returns false when it is not valid JSON
bool parse_body(const httplib::Request& req, httplib::Response& res, json& out) {
    try {
        out = req.body.empty() ? json::object() : json::parse(req.body);
        return true;
    } catch (const json::parse_error& e) {
        spdlog::warn("Invalid JSON body on {}: {}", req.path, e.what());
        send_error(res, 400, "invalid_json", e.what());
        return false;
    }
}

} // namespace

HttpApiServer::HttpApiServer(const Config& config, QueryApi& api)
    : config_(config), api_(api) {
    server_ = std::make_unique<httplib::Server>();
    setup_routes();
}

HttpApiServer::~HttpApiServer() {
    stop();
}

void HttpApiServer::start() {
    server_thread_ = std::thread([this]() {
        spdlog::info("Starting HTTP API on {}:{}", config_.listen_addr, config_.listen_port);
        if (!server_->listen(config_.listen_addr.c_str(), config_.listen_port)) {
            spdlog::error("HTTP API failed to listen on {}:{}", config_.listen_addr, config_.listen_port);
        }
    });
}

void HttpApiServer::stop() {
    server_->stop();
    if (server_thread_.joinable()) {
        server_thread_.join();
    }
}

void HttpApiServer::setup_routes() {
    server_->Get("/health", [this](const httplib::Request&, httplib::Response& res) {
        send(res, api_.service_health());
    });

    server_->Get("/api/performance/engines", [this](const httplib::Request&, httplib::Response& res) {
        send(res, api_.engines());
    });

    server_->Get("/api/performance/health", [this](const httplib::Request&, httplib::Response& res) {
        send(res, api_.platform_health());
    });

    server_->Get("/api/calibration", [this](const httplib::Request&, httplib::Response& res) {
        send(res, api_.calibration());
    });

    server_->Get("/api/calibration/adjust", [this](const httplib::Request& req, httplib::Response& res) {
        if (!req.has_param("confidence")) {
            send_error(res, 400, "invalid_confidence", "confidence query parameter is required");
            return;
        }
        send(res, api_.calibrate(req.get_param_value("confidence")));
    });

    server_->Get("/api/signal-weights", [this](const httplib::Request&, httplib::Response& res) {
        send(res, api_.signal_weights());
    });

    server_->Put(R"(/api/signal-weights/([^/]+)/override)",
                 [this](const httplib::Request& req, httplib::Response& res) {
        json body;
        if (!parse_body(req, res, body)) return;
        send(res, api_.set_override(req.matches[1], body));
    });

    server_->Delete(R"(/api/signal-weights/([^/]+)/override)",
                    [this](const httplib::Request& req, httplib::Response& res) {
        send(res, api_.clear_override(req.matches[1]));
    });

    server_->Post("/api/signal-weights/weighted-confidence",
                  [this](const httplib::Request& req, httplib::Response& res) {
        json body;
        if (!parse_body(req, res, body)) return;
        send(res, api_.weighted_confidence(body));
    });

    server_->Get("/api/historical/stats", [this](const httplib::Request&, httplib::Response& res) {
        send(res, api_.historical_stats());
    });

    server_->Get(R"(/api/historical/symbol/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) {
        send(res, api_.symbol(req.matches[1]));
    });

    server_->Get("/api/historical/adjustment", [this](const httplib::Request& req, httplib::Response& res) {
        send(res, api_.adjustment(req.get_param_value("symbol"),
                                  req.get_param_value("catalyst"),
                                  req.get_param_value("direction")));
    });

    server_->Post("/api/refresh", [this](const httplib::Request&, httplib::Response& res) {
        send(res, api_.refresh());
    });

    server_->set_exception_handler([](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
        std::string message = "unknown error";
        try {
            std::rethrow_exception(ep);
        } catch (const std::exception& e) {
            message = e.what();
        }
        spdlog::error("Unhandled error on {} {}: {}", req.method, req.path, message);
        send_error(res, 500, "internal", message);
    });

    server_->set_error_handler([](const httplib::Request&, httplib::Response& res) {
        if (res.body.empty()) {
            send_error(res, res.status, res.status == 404 ? "not_found" : "error", "");
        }
    });
}
