// =============================================================================
// Phoenix Gateway
//
// HTTP facade over Apache Phoenix (SQL on HBase) and the HBase REST server.
// Clients send SQL as JSON over plain HTTP; the gateway talks to the Phoenix
// Query Server through the ODBC driver when one is installed, otherwise
// through the Avatica JSON protocol.
//
//   phoenix-gateway --config gateway.json
//   curl -X POST localhost:8099/api/phoenix/query -d '{"sql":"SELECT 1"}'
// =============================================================================

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <thread>

#include "config.hpp"
#include "utils/logger.hpp"
#include "utils/http_client.hpp"
#include "connectors/avatica_transport.hpp"
#include "connectors/odbc_transport.hpp"
#include "query/connection_manager.hpp"
#include "query/warmup_initializer.hpp"
#include "storage/hbase_rest_client.hpp"
#include "gateway/phoenix_api.hpp"
#include "gateway/gateway_server.hpp"

static std::atomic<bool> g_shutdown{false};

static void on_signal(int) {
    g_shutdown.store(true);
}

static void print_usage(const char* prog) {
    std::fprintf(stderr,
        "Usage: %s [OPTIONS]\n"
        "\n"
        "Options:\n"
        "  --config PATH          JSON config file (default: built-in defaults)\n"
        "  --phoenix-server HOST  Phoenix Query Server host (default: localhost)\n"
        "  --phoenix-port N       Phoenix Query Server port (default: 8765)\n"
        "  --odbc DSN             ODBC connection string for the driver transport\n"
        "  --hbase-server HOST    HBase REST server host (default: localhost)\n"
        "  --port N               Gateway listen port (default: 8099)\n"
        "  --no-warmup            Do not open the Phoenix connection at startup\n"
        "  --verbose              Enable debug logging\n"
        "  --help                 Show this help\n"
        "\n"
        "Environment: PHOENIX_SERVER, PHOENIX_PORT, PHOENIX_ODBC_CONNECTION_STRING,\n"
        "             HBASE_SERVER, HBASE_PORT (applied after --config, before flags)\n",
        prog);
}

int main(int argc, char* argv[]) {
    std::string config_path;
    std::string phoenix_server;
    std::string odbc;
    std::string hbase_server;
    int phoenix_port = 0;
    int listen_port = 0;
    bool no_warmup = false;
    bool verbose = false;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else if (std::strcmp(argv[i], "--phoenix-server") == 0 && i + 1 < argc) {
            phoenix_server = argv[++i];
        } else if (std::strcmp(argv[i], "--phoenix-port") == 0 && i + 1 < argc) {
            phoenix_port = std::atoi(argv[++i]);
        } else if (std::strcmp(argv[i], "--odbc") == 0 && i + 1 < argc) {
            odbc = argv[++i];
        } else if (std::strcmp(argv[i], "--hbase-server") == 0 && i + 1 < argc) {
            hbase_server = argv[++i];
        } else if (std::strcmp(argv[i], "--port") == 0 && i + 1 < argc) {
            listen_port = std::atoi(argv[++i]);
        } else if (std::strcmp(argv[i], "--no-warmup") == 0) {
            no_warmup = true;
        } else if (std::strcmp(argv[i], "--verbose") == 0) {
            verbose = true;
        } else {
            std::fprintf(stderr, "Unknown option: %s\n", argv[i]);
            print_usage(argv[0]);
            return 1;
        }
    }

    phxgw::GatewayConfig cfg;
    try {
        if (!config_path.empty()) cfg = phxgw::GatewayConfig::from_json(config_path);
    } catch (const std::exception& e) {
        LOG_ERR("Invalid config %s: %s", config_path.c_str(), e.what());
        return 1;
    }
    cfg.apply_env();
    if (!phoenix_server.empty()) cfg.phoenix.server = phoenix_server;
    if (phoenix_port > 0) cfg.phoenix.port = static_cast<uint16_t>(phoenix_port);
    if (!odbc.empty()) cfg.phoenix.odbc_connection_string = odbc;
    if (!hbase_server.empty()) cfg.hbase.server = hbase_server;
    if (listen_port > 0) cfg.server.port = static_cast<uint16_t>(listen_port);
    if (no_warmup) cfg.warmup.enabled = false;

    phxgw::g_log_level = verbose ? phxgw::LogLevel::DEBUG : phxgw::parse_log_level(cfg.log_level);

    LOG_INF("=== Phoenix Gateway ===");
    LOG_INF("Phoenix Query Server: %s", cfg.phoenix.base_url().c_str());
    LOG_INF("HBase REST:           %s", cfg.hbase.base_url().c_str());
    LOG_INF("ODBC driver:          %s",
        cfg.phoenix.odbc_connection_string.empty() ? "(not configured)" : "configured");

    phxgw::CurlHttpClient::global_init();

    auto http = std::make_shared<phxgw::CurlHttpClient>(
        cfg.phoenix.http_timeout_sec, cfg.phoenix.http_connect_timeout_sec);

    int rc = 0;
    {
        phxgw::ConnectionManager manager(
            std::make_unique<phxgw::OdbcTransport>(cfg.phoenix.odbc_connection_string),
            std::make_unique<phxgw::AvaticaTransport>(http, cfg.phoenix));
        phxgw::HBaseRestClient hbase(http, cfg.hbase);
        phxgw::PhoenixApi api(manager, hbase);
        phxgw::GatewayServer server(cfg.server, api);

        phxgw::WarmupInitializer warmup(manager, std::chrono::milliseconds(cfg.warmup.grace_period_ms));
        if (cfg.warmup.enabled) {
            warmup.start();
        } else {
            LOG_INF("Warm-up disabled; connection opens on the first request");
        }

        std::signal(SIGINT, on_signal);
        std::signal(SIGTERM, on_signal);

        if (!server.run_async()) {
            LOG_ERR("Gateway server failed to start");
            rc = 1;
        } else {
            while (!g_shutdown.load() && server.is_running()) {
                std::this_thread::sleep_for(std::chrono::milliseconds(200));
            }
            LOG_INF("Shutting down");
        }

        server.stop();
        warmup.stop();
        manager.close();
    }

    phxgw::CurlHttpClient::global_cleanup();
    return rc;
}
