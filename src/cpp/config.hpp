#pragma once
#include <cstdint>
#include <cstdlib>
#include <string>
#include <fstream>
#include <nlohmann/json.hpp>

#include "utils/logger.hpp"

namespace phxgw {

// Phoenix Query Server endpoints (both transports)
struct PhoenixConfig {
    std::string server = "localhost";
    uint16_t port = 8765;

    // Driver transport. Empty means "no ODBC driver configured" and the
    // driver path reports UNAVAILABLE without loading the driver manager.
    // e.g. "Driver={Phoenix ODBC Driver};Server=localhost;Port=8765"
    std::string odbc_connection_string;

    // Protocol transport open sequence
    int open_attempts = 10;
    int open_retry_delay_ms = 15000;

    int max_row_count = 10000;
    long http_timeout_sec = 300;
    long http_connect_timeout_sec = 10;

    std::string base_url() const {
        return "http://" + server + ":" + std::to_string(port) + "/json";
    }
};

// HBase REST (Stargate) used for storage administration
struct HBaseConfig {
    std::string server = "localhost";
    uint16_t port = 8080;

    std::string base_url() const {
        return "http://" + server + ":" + std::to_string(port);
    }
};

struct ServerConfig {
    std::string bind_address = "0.0.0.0";
    uint16_t port = 8099;
    int worker_threads = 8;
};

struct WarmupConfig {
    bool enabled = true;
    int grace_period_ms = 30000;
};

struct GatewayConfig {
    PhoenixConfig phoenix;
    HBaseConfig hbase;
    ServerConfig server;
    WarmupConfig warmup;
    std::string log_level = "info";

    static GatewayConfig from_json(const std::string& path);
    static GatewayConfig from_json_string(const std::string& text);
    void apply_env();
};

inline GatewayConfig gateway_config_from(const nlohmann::json& j) {
    GatewayConfig cfg;
    cfg.log_level = j.value("log_level", cfg.log_level);

    if (j.contains("phoenix")) {
        const auto& p = j["phoenix"];
        cfg.phoenix.server = p.value("server", cfg.phoenix.server);
        cfg.phoenix.port = p.value("port", cfg.phoenix.port);
        cfg.phoenix.odbc_connection_string =
            p.value("odbc_connection_string", cfg.phoenix.odbc_connection_string);
        cfg.phoenix.open_attempts = p.value("open_attempts", cfg.phoenix.open_attempts);
        cfg.phoenix.open_retry_delay_ms =
            p.value("open_retry_delay_ms", cfg.phoenix.open_retry_delay_ms);
        cfg.phoenix.max_row_count = p.value("max_row_count", cfg.phoenix.max_row_count);
        cfg.phoenix.http_timeout_sec = p.value("http_timeout_sec", cfg.phoenix.http_timeout_sec);
        cfg.phoenix.http_connect_timeout_sec =
            p.value("http_connect_timeout_sec", cfg.phoenix.http_connect_timeout_sec);
    }

    if (j.contains("hbase")) {
        cfg.hbase.server = j["hbase"].value("server", cfg.hbase.server);
        cfg.hbase.port = j["hbase"].value("port", cfg.hbase.port);
    }

    if (j.contains("gateway")) {
        const auto& g = j["gateway"];
        cfg.server.bind_address = g.value("bind_address", cfg.server.bind_address);
        cfg.server.port = g.value("port", cfg.server.port);
        cfg.server.worker_threads = g.value("worker_threads", cfg.server.worker_threads);
    }

    if (j.contains("warmup")) {
        cfg.warmup.enabled = j["warmup"].value("enabled", cfg.warmup.enabled);
        cfg.warmup.grace_period_ms =
            j["warmup"].value("grace_period_ms", cfg.warmup.grace_period_ms);
    }

    if (cfg.phoenix.open_attempts < 1) {
        LOG_WRN("[config] phoenix.open_attempts=%d is invalid, using 1",
            cfg.phoenix.open_attempts);
        cfg.phoenix.open_attempts = 1;
    }
    return cfg;
}

// Missing file falls back to defaults; a malformed file is a hard error
// (nlohmann::json::parse_error propagates to main).
inline GatewayConfig GatewayConfig::from_json(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        LOG_WRN("[config] %s not found, using defaults", path.c_str());
        return GatewayConfig{};
    }

    nlohmann::json j;
    f >> j;
    return gateway_config_from(j);
}

inline GatewayConfig GatewayConfig::from_json_string(const std::string& text) {
    return gateway_config_from(nlohmann::json::parse(text));
}

inline void GatewayConfig::apply_env() {
    if (const char* v = std::getenv("PHOENIX_SERVER")) phoenix.server = v;
    if (const char* v = std::getenv("PHOENIX_PORT")) phoenix.port = static_cast<uint16_t>(std::atoi(v));
    if (const char* v = std::getenv("PHOENIX_ODBC_CONNECTION_STRING")) phoenix.odbc_connection_string = v;
    if (const char* v = std::getenv("HBASE_SERVER")) hbase.server = v;
    if (const char* v = std::getenv("HBASE_PORT")) hbase.port = static_cast<uint16_t>(std::atoi(v));
}

} // namespace phxgw
