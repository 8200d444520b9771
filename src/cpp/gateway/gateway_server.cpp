#include "gateway_server.hpp"
#include "../utils/logger.hpp"
#include "../utils/timer.hpp"

#include <chrono>

namespace phxgw {

GatewayServer::GatewayServer(const ServerConfig& config, PhoenixApi& api)
    : config_(config), api_(api), port_(config.port) {
    int workers = config_.worker_threads < 1 ? 1 : config_.worker_threads;
    svr_.new_task_queue = [workers] { return new httplib::ThreadPool(workers); };

    svr_.set_logger([](const httplib::Request& req, const httplib::Response& res) {
        LOG_DBG("[http] %s %s -> %d", req.method.c_str(), req.path.c_str(), res.status);
    });
    svr_.set_exception_handler([](const httplib::Request& req, httplib::Response& res,
                                  std::exception_ptr ep) {
        std::string what = "unknown error";
        try {
            if (ep) std::rethrow_exception(ep);
        } catch (const std::exception& e) {
            what = e.what();
        }
        LOG_ERR("[http] Unhandled error on %s %s: %s", req.method.c_str(), req.path.c_str(), what.c_str());
        send(res, ResponseMapper::error(500, what));
    });

    setup_routes();
}

GatewayServer::~GatewayServer() {
    stop();
}

void GatewayServer::send(httplib::Response& res, const ApiResponse& r) {
    res.status = r.status;
    res.set_content(r.body.dump(), "application/json");
}

static std::string query_param(const httplib::Request& req, const char* name) {
    return req.has_param(name) ? req.get_param_value(name) : std::string();
}

void GatewayServer::setup_routes() {
    const std::string base = BASE_PATH;

    // ---- Phoenix SQL ----
    svr_.Get(base + "/tables", [this](const httplib::Request&, httplib::Response& res) {
        send(res, api_.list_tables());
    });
    svr_.Get(base + R"(/tables/([^/]+)/columns)", [this](const httplib::Request& req, httplib::Response& res) {
        send(res, api_.table_columns(req.matches[1]));
    });
    svr_.Post(base + "/query", [this](const httplib::Request& req, httplib::Response& res) {
        send(res, api_.query(req.body));
    });
    svr_.Post(base + "/execute", [this](const httplib::Request& req, httplib::Response& res) {
        send(res, api_.execute(req.body));
    });
    svr_.Get(base + "/health", [this](const httplib::Request&, httplib::Response& res) {
        send(res, api_.health());
    });

    // ---- HBase storage ----
    svr_.Post(base + "/hbase/tables/sensor", [this](const httplib::Request& req, httplib::Response& res) {
        send(res, api_.create_sensor_table(req.body));
    });
    svr_.Get(base + R"(/hbase/tables/([^/]+)/exists)", [this](const httplib::Request& req, httplib::Response& res) {
        send(res, api_.hbase_table_exists(req.matches[1], query_param(req, "namespace")));
    });
    svr_.Get(base + R"(/hbase/tables/([^/]+)/schema)", [this](const httplib::Request& req, httplib::Response& res) {
        send(res, api_.hbase_table_schema(req.matches[1], query_param(req, "namespace")));
    });
    svr_.Put(base + R"(/hbase/tables/([^/]+)/data)", [this](const httplib::Request& req, httplib::Response& res) {
        send(res, api_.hbase_put(req.matches[1], req.body));
    });

    // ---- Views ----
    svr_.Post(base + "/views", [this](const httplib::Request& req, httplib::Response& res) {
        send(res, api_.create_view(req.body));
    });
    svr_.Get(base + "/views", [this](const httplib::Request&, httplib::Response& res) {
        send(res, api_.list_views());
    });
    svr_.Get(base + R"(/views/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) {
        send(res, api_.get_view(req.matches[1]));
    });
    svr_.Get(base + R"(/views/([^/]+)/columns)", [this](const httplib::Request& req, httplib::Response& res) {
        send(res, api_.view_columns(req.matches[1]));
    });
    svr_.Delete(base + R"(/views/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) {
        send(res, api_.drop_view(req.matches[1]));
    });
}

bool GatewayServer::run() {
    if (port_ == 0) {
        port_ = svr_.bind_to_any_port(config_.bind_address);
    } else if (!svr_.bind_to_port(config_.bind_address, port_)) {
        port_ = -1;
    }
    if (port_ < 0) {
        bind_failed_.store(true);
        LOG_ERR("[gateway] Cannot bind %s:%u", config_.bind_address.c_str(), static_cast<unsigned>(config_.port));
        return false;
    }

    LOG_INF("[gateway] Listening on %s:%d%s (%d workers)",
        config_.bind_address.c_str(), port_, BASE_PATH, config_.worker_threads);
    bool ok = svr_.listen_after_bind();
    LOG_INF("[gateway] Stopped");
    return ok;
}

bool GatewayServer::run_async() {
    bind_failed_.store(false);
    server_thread_ = std::thread([this] { run(); });
    Timer timer;
    while (!svr_.is_running() && !bind_failed_.load()) {
        if (timer.elapsed_ms() > 5000) break;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return svr_.is_running();
}

void GatewayServer::stop() {
    svr_.stop();
    if (server_thread_.joinable()) {
        server_thread_.join();
    }
}

} // namespace phxgw
