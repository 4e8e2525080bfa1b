#pragma once

#include "config.hpp"
#include "query_api.hpp"
#include <httplib.h>
#include <memory>
#include <thread>

// Exposes QueryApi over HTTP
class HttpApiServer {
public:
    HttpApiServer(const Config& config, QueryApi& api);
    ~HttpApiServer();

    void start();
    void stop();

private:
    void setup_routes();

    const Config& config_;
    QueryApi& api_;
    std::unique_ptr<httplib::Server> server_;
    std::thread server_thread_;
};
