#pragma once

#include "config.hpp"
#include "types.hpp"
#include <sw/redis++/redis++.h>
#include <nlohmann/json.hpp>
#include <functional>
#include <memory>

class RedisBus {
public:
    explicit RedisBus(const Config& config);
    ~RedisBus();

    // Subscription methods
    void subscribe_ledger_events(std::function<void(const nlohmann::json&)> callback);
    void subscribe_command_requests(std::function<void(const CommandRequest&)> callback);
    void stop_subscribers();

    // Publishing methods; safe to call from any thread
    bool publish_command_reply(const CommandReply& reply);
    bool publish_refreshed(const nlohmann::json& summary);

    // Non-copyable
    RedisBus(const RedisBus&) = delete;
    RedisBus& operator=(const RedisBus&) = delete;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};
