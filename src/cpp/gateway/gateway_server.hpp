#pragma once
// HTTP server exposing PhoenixApi under /api/phoenix. Uses cpp-httplib.
#include <atomic>
#include <string>
#include <thread>

#include <httplib.h>

#include "phoenix_api.hpp"
#include "../config.hpp"

namespace phxgw {

class GatewayServer {
public:
    static constexpr const char* BASE_PATH = "/api/phoenix";

    GatewayServer(const ServerConfig& config, PhoenixApi& api);
    ~GatewayServer();

    GatewayServer(const GatewayServer&) = delete;
    GatewayServer& operator=(const GatewayServer&) = delete;

    // Blocks until stop(). Returns false when the address could not be bound.
    bool run();

    // Listens on a background thread; returns once the socket is accepting
    bool run_async();

    void stop();

    [[nodiscard]] bool is_running() const { return svr_.is_running(); }
    [[nodiscard]] int port() const { return port_; }

private:
    ServerConfig config_;
    PhoenixApi& api_;
    httplib::Server svr_;
    std::thread server_thread_;
    std::atomic<bool> bind_failed_{false};
    int port_;

    void setup_routes();
    static void send(httplib::Response& res, const ApiResponse& r);
};

} // namespace phxgw
