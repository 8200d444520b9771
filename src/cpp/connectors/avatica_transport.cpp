#include "avatica_transport.hpp"
#include "../utils/logger.hpp"
#include "../utils/timer.hpp"

#include <cstdio>
#include <random>
#include <thread>

namespace phxgw {

AvaticaTransport::AvaticaTransport(std::shared_ptr<HttpClient> http, const PhoenixConfig& config)
    : http_(std::move(http)),
      url_(normalize_endpoint(config.base_url())),
      codec_(config.max_row_count),
      open_attempts_(config.open_attempts < 1 ? 1 : config.open_attempts),
      retry_delay_(config.open_retry_delay_ms) {}

std::string AvaticaTransport::normalize_endpoint(const std::string& base_url) {
    std::string url = base_url;
    while (!url.empty() && url.back() == '/') url.pop_back();
    static const std::string suffix = "/json";
    if (url.size() < suffix.size() ||
        url.compare(url.size() - suffix.size(), suffix.size(), suffix) != 0) {
        url += suffix;
    }
    return url;
}

std::string AvaticaTransport::generate_connection_id() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    uint64_t hi = rng();
    uint64_t lo = rng();
    // RFC 4122 version 4, variant 1
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    char buf[37];
    std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx",
        static_cast<unsigned>(hi >> 32),
        static_cast<unsigned>((hi >> 16) & 0xFFFF),
        static_cast<unsigned>(hi & 0xFFFF),
        static_cast<unsigned>(lo >> 48),
        static_cast<unsigned long long>(lo & 0xFFFFFFFFFFFFULL));
    return buf;
}

std::string AvaticaTransport::post(const std::string& body, const char* operation) {
    HttpResponse resp = http_->post_json(url_, body);
    if (!resp.transport_ok) {
        throw QueryError(FailureKind::CONNECT_FAILED,
            std::string(operation) + ": cannot reach query server at " + url_ + ": " + resp.error);
    }
    if (!resp.ok()) {
        // Avatica reports SQL errors as HTTP 500 with an ErrorResponse body
        nlohmann::json j = nlohmann::json::parse(resp.body, nullptr, false);
        if (!j.is_discarded() && !ProtocolCodec::error_message_of(j).empty()) {
            ProtocolCodec::parse_response(resp.body);  // throws REMOTE_ERROR
        }
        throw QueryError(FailureKind::CONNECT_FAILED,
            std::string(operation) + ": query server returned HTTP " + std::to_string(resp.status) +
            (resp.body.empty() ? "" : " - " + resp.body.substr(0, 500)));
    }
    return resp.body;
}

std::string AvaticaTransport::open_once(const std::string& connection_id, std::string& last_body) {
    HttpResponse resp = http_->post_json(url_, codec_.encode_open_connection(connection_id));
    last_body = resp.body;
    if (!resp.transport_ok) {
        throw QueryError(FailureKind::CONNECT_FAILED,
            "cannot reach query server at " + url_ + ": " + resp.error);
    }
    if (!resp.ok()) {
        throw QueryError(FailureKind::CONNECT_FAILED,
            "openConnection returned HTTP " + std::to_string(resp.status));
    }
    return ProtocolCodec::decode_open_connection(resp.body, connection_id);
}

ConnectResult AvaticaTransport::connect() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!token_.empty()) return ConnectResult::success();

    const std::string connection_id = generate_connection_id();
    std::string last_body;
    std::string last_error;
    Timer timer;

    for (int attempt = 1; attempt <= open_attempts_; ++attempt) {
        try {
            token_ = open_once(connection_id, last_body);
            LOG_INF("[avatica] Connected to %s (connection %s, attempt %d/%d, %lld ms)",
                url_.c_str(), token_.c_str(), attempt, open_attempts_,
                static_cast<long long>(timer.elapsed_ms()));
            return ConnectResult::success();
        } catch (const std::exception& e) {
            // Every failed attempt counts against the budget, whatever its cause
            last_error = e.what();
        }

        if (attempt < open_attempts_) {
            LOG_WRN("[avatica] Connection attempt %d/%d failed: %s -- retrying in %lld ms",
                attempt, open_attempts_, last_error.c_str(),
                static_cast<long long>(retry_delay_.count()));
            if (!last_body.empty()) {
                LOG_DBG("[avatica] Response: %.200s", last_body.c_str());
            }
            std::this_thread::sleep_for(retry_delay_);
        }
    }

    std::string message = "Failed to connect to Phoenix Query Server at " + url_ +
        " after " + std::to_string(open_attempts_) + " attempts: " + last_error;
    if (!last_body.empty()) {
        message += "\nServer response: " + last_body.substr(0, 500);
        if (last_body.find("InvalidProtocolBufferException") != std::string::npos ||
            last_body.find("InvalidWireTypeException") != std::string::npos) {
            message += "\nThe server is parsing JSON as Protobuf; its serialization "
                       "is not set to JSON (phoenix.queryserver.serialization=JSON).";
        }
    }
    LOG_ERR("[avatica] %s", message.c_str());
    return ConnectResult::failure(FailureKind::CONNECT_FAILED, message);
}

void AvaticaTransport::drop_session(const std::string& token, const char* reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (token_ != token) return;
    token_.clear();
    LOG_WRN("[avatica] Connection %s lost (%s); the next open reconnects", token.c_str(), reason);
}

bool AvaticaTransport::close() {
    std::string token;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (token_.empty()) return true;
        token.swap(token_);
    }

    HttpResponse resp = http_->post_json(url_, codec_.encode_close_connection(token));
    if (!resp.ok()) {
        LOG_WRN("[avatica] closeConnection failed (ignored): %s",
            resp.transport_ok ? ("HTTP " + std::to_string(resp.status)).c_str() : resp.error.c_str());
        return false;
    }
    LOG_INF("[avatica] Disconnected from %s", url_.c_str());
    return true;
}

bool AvaticaTransport::is_open() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !token_.empty();
}

std::string AvaticaTransport::connection_token() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return token_;
}

TabularResult AvaticaTransport::execute(const StatementRequest& request) {
    const std::string token = connection_token();
    if (token.empty()) {
        throw QueryError(FailureKind::NOT_OPEN, "Avatica connection is not open. Call open() first.");
    }

    const std::string sql = trim_statement(request.sql);
    Timer timer;

    int statement_id = 0;
    try {
        statement_id = ProtocolCodec::decode_create_statement(
            post(codec_.encode_create_statement(token), "createStatement"));
    } catch (const QueryError& e) {
        if (e.connection_lost()) drop_session(token, e.what());
        throw;
    }

    TabularResult result;
    try {
        result = ProtocolCodec::decode_execute(
            post(codec_.encode_prepare_and_execute(token, statement_id, sql), "prepareAndExecute"));
    } catch (const QueryError& e) {
        if (e.connection_lost()) {
            drop_session(token, e.what());
        } else if (!http_->post_json(url_, codec_.encode_close_statement(token, statement_id)).ok()) {
            LOG_DBG("[avatica] closeStatement %d failed (ignored)", statement_id);
        }
        throw;
    }

    HttpResponse closed = http_->post_json(url_, codec_.encode_close_statement(token, statement_id));
    if (!closed.ok()) {
        LOG_DBG("[avatica] closeStatement %d failed (ignored)", statement_id);
    }

    if (request.kind == StatementKind::QUERY && !result.columns.empty() && result.rows.empty()) {
        LOG_DBG("[avatica] Query returned %zu columns but 0 rows: %.100s",
            result.columns.size(), sql.c_str());
    }
    LOG_DBG("[avatica] %s in %lld ms (%zu rows)",
        request.kind == StatementKind::QUERY ? "query" : "execute",
        static_cast<long long>(timer.elapsed_ms()), result.rows.size());
    return result;
}

} // namespace phxgw
