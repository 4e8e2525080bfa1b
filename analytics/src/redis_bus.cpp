#include "redis_bus.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <iterator>
#include <vector>

using json = nlohmann::json;

namespace {

const std::string kConsumerGroup = "tradelens_analytics";

} // namespace

class RedisBus::Impl {
public:
    Impl(const Config& config)
        : config_(config), running_(false), backoff_ms_(1000), retry_count_(0) {
        std::lock_guard<std::mutex> lock(conn_mutex_);
        if (!connect_locked()) {
            spdlog::warn("Redis unavailable at startup; publishing will retry with backoff");
        }
    }

    ~Impl() {
        stop_subscribers();
        std::lock_guard<std::mutex> lock(conn_mutex_);
        redis_.reset();
    }

    bool publish_command_reply(const CommandReply& reply) {
        return publish(config_.stream_rep, reply.to_json(), reply.corr_id, "command reply");
    }

    bool publish_refreshed(const json& summary) {
        return publish(config_.stream_refreshed, summary, "", "refresh notice");
    }

    void subscribe_ledger_events(std::function<void(const json&)> callback) {
        if (ledger_thread_.joinable()) {
            spdlog::warn("Ledger events subscriber already running");
            return;
        }
        running_ = true;
        ledger_thread_ = std::thread([this, callback]() {
            consume(config_.stream_ledger_events, "ledger events", [&callback](const json& j) {
                callback(j);
            });
        });
    }

    void subscribe_command_requests(std::function<void(const CommandRequest&)> callback) {
        if (command_thread_.joinable()) {
            spdlog::warn("Command requests subscriber already running");
            return;
        }
        running_ = true;
        command_thread_ = std::thread([this, callback]() {
            consume(config_.stream_req, "command requests", [&callback](const json& j) {
                auto request = CommandRequest::from_json(j);
                if (request) {
                    callback(*request);
                }
            });
        });
    }

    void stop_subscribers() {
        running_ = false;

        if (ledger_thread_.joinable()) {
            ledger_thread_.join();
        }
        if (command_thread_.joinable()) {
            command_thread_.join();
        }
    }

private:
    // Callers hold conn_mutex_
    bool connect_locked() {
        try {
            redis_ = std::make_unique<sw::redis::Redis>(config_.redis_url);
            redis_->ping();
            spdlog::info("Connected to Redis at {}", config_.redis_url);
            backoff_ms_ = 1000;
            retry_count_ = 0;
            return true;
        } catch (const sw::redis::Error& e) {
            spdlog::error("Failed to connect to Redis: {}", e.what());
            redis_.reset();
            return false;
        }
    }

    bool ensure_connection_locked() {
        if (redis_) {
            try {
                redis_->ping();
                return true;
            } catch (const sw::redis::Error& e) {
                spdlog::debug("Redis ping failed: {}", e.what());
            }
        }

        auto now = std::chrono::steady_clock::now();
        if (std::chrono::duration_cast<std::chrono::milliseconds>(
                now - last_connection_attempt_).count() < backoff_ms_) {
            return false;
        }
        last_connection_attempt_ = now;

        if (connect_locked()) {
            spdlog::info("Redis connection restored");
            return true;
        }
        spdlog::warn("Redis reconnection failed (attempt {})", ++retry_count_);

        // Exponential backoff with cap
        backoff_ms_ = std::min(backoff_ms_ * 2, 30000);
        return false;
    }

    // Blocking consumer-group loop; each entry carries its payload in the "data" field
    void consume(const std::string& stream, const std::string& label,
                 const std::function<void(const json&)>& handler) {
        spdlog::info("Starting {} subscriber on {}", label, stream);

        // Socket timeout must outlast the blocking read
        sw::redis::ConnectionOptions opts(config_.redis_url);
        opts.socket_timeout = std::chrono::milliseconds(3000);

        std::unique_ptr<sw::redis::Redis> redis;
        int backoff_ms = 1000;
        std::string consumer_id = config_.service_name + "_" +
            std::to_string(std::hash<std::thread::id>{}(std::this_thread::get_id()));

        while (running_) {
            if (!redis) {
                try {
                    redis = std::make_unique<sw::redis::Redis>(opts);
                    try {
                        redis->xgroup_create(stream, kConsumerGroup, "0", true);
                    } catch (const sw::redis::Error& e) {
                        spdlog::debug("Consumer group already exists or error: {}", e.what());
                    }
                    backoff_ms = 1000;
                } catch (const sw::redis::Error& e) {
                    spdlog::warn("{} subscriber cannot reach Redis: {}", label, e.what());
                    redis.reset();
                    std::this_thread::sleep_for(std::chrono::milliseconds(backoff_ms));
                    backoff_ms = std::min(backoff_ms * 2, 30000);
                    continue;
                }
            }

            try {
                using Attrs = std::unordered_map<std::string, std::string>;
                using Item = std::pair<std::string, Attrs>;
                std::unordered_map<std::string, std::vector<Item>> result;

                redis->xreadgroup(kConsumerGroup, consumer_id, stream, ">", std::chrono::milliseconds(1000),
                                  10, std::inserter(result, result.end()));

                for (const auto& [name, entries] : result) {
                    for (const auto& [id, fields] : entries) {
                        auto it = fields.find("data");
                        if (it != fields.end()) {
                            try {
                                handler(json::parse(it->second));
                            } catch (const std::exception& e) {
                                spdlog::error("Error processing {} entry {}: {}", label, id, e.what());
                            }
                        } else {
                            spdlog::warn("{} entry {} has no data field", label, id);
                        }
                        redis->xack(stream, kConsumerGroup, id);
                    }
                }
            } catch (const sw::redis::TimeoutError&) {
                continue;
            } catch (const sw::redis::Error& e) {
                spdlog::error("Error in {} subscriber: {}", label, e.what());
                redis.reset();
                std::this_thread::sleep_for(std::chrono::milliseconds(backoff_ms));
                backoff_ms = std::min(backoff_ms * 2, 30000);
            }
        }

        spdlog::info("{} subscriber stopped", label);
    }

    bool publish(const std::string& stream, const json& payload, const std::string& corr_id,
                 const std::string& label) {
        std::lock_guard<std::mutex> lock(conn_mutex_);
        if (!ensure_connection_locked()) {
            return false;
        }

        try {
            std::unordered_map<std::string, std::string> fields = {
                {"data", payload.dump()},
                {"ts", util::current_iso8601()}
            };
            if (!corr_id.empty()) {
                fields["corr_id"] = corr_id;
            }
            redis_->xadd(stream, "*", fields.begin(), fields.end());
            return true;
        } catch (const sw::redis::Error& e) {
            spdlog::error("Failed to publish {}: {}", label, e.what());
            return false;
        }
    }

    const Config& config_;
    std::mutex conn_mutex_;
    std::unique_ptr<sw::redis::Redis> redis_;
    std::atomic<bool> running_;
    std::thread ledger_thread_;
    std::thread command_thread_;

    // Reconnection logic
    std::chrono::steady_clock::time_point last_connection_attempt_ = std::chrono::steady_clock::now();
    int backoff_ms_;
    int retry_count_;
};

RedisBus::RedisBus(const Config& config) : impl_(std::make_unique<Impl>(config)) {}

RedisBus::~RedisBus() = default;

void RedisBus::subscribe_ledger_events(std::function<void(const json&)> callback) {
    impl_->subscribe_ledger_events(std::move(callback));
}

void RedisBus::subscribe_command_requests(std::function<void(const CommandRequest&)> callback) {
    impl_->subscribe_command_requests(std::move(callback));
}

void RedisBus::stop_subscribers() {
    impl_->stop_subscribers();
}

bool RedisBus::publish_command_reply(const CommandReply& reply) {
    return impl_->publish_command_reply(reply);
}

bool RedisBus::publish_refreshed(const json& summary) {
    return impl_->publish_refreshed(summary);
}
