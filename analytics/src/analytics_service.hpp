#pragma once

#include "config.hpp"
#include "redis_bus.hpp"
#include "pg_store.hpp"
#include "signal_weights.hpp"
#include "narrative.hpp"
#include "pipeline.hpp"
#include "query_api.hpp"
#include "http_api.hpp"
#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

class AnalyticsService {
public:
    explicit AnalyticsService(const Config& config);
    ~AnalyticsService();

    // Start the service
    void run();

    // Stop the service
    void stop();

private:
    // Periodic refresh loop
    void scheduler_thread_func();

    // Full refresh; announces the new snapshot on success
    QueryResult refresh_and_publish();

    // Handle command requests from the bus
    void handle_command_request(const CommandRequest& request);

    // Configuration
    Config config_;

    // Service components
    std::unique_ptr<PostgresStore> pg_store_;
    std::unique_ptr<RedisBus> redis_bus_;
    OverrideRegistry overrides_;
    std::unique_ptr<DefaultNarrativeGenerator> narrative_;
    std::unique_ptr<AnalyticsPipeline> pipeline_;
    std::unique_ptr<QueryApi> query_api_;
    std::unique_ptr<HttpApiServer> http_server_;

    // Thread management
    std::atomic<bool> running_{false};
    std::thread scheduler_thread_;
    std::mutex scheduler_mutex_;
    std::condition_variable scheduler_cv_;
};
