#pragma once
// Phoenix Query Server transport over the Avatica JSON protocol (HTTP POST
// to http://host:8765/json). No driver installation required.
//
// connect() retries the openConnection round trip up to open_attempts times
// with a fixed delay between attempts, because the query server is usually
// still starting when the gateway comes up. Statements are never retried;
// one that finds the server-side connection gone drops the token so the
// next connect() opens a fresh connection.
#include <chrono>
#include <memory>
#include <mutex>
#include <string>

#include "query_transport.hpp"
#include "../config.hpp"
#include "../query/protocol_codec.hpp"
#include "../utils/http_client.hpp"

namespace phxgw {

class AvaticaTransport : public QueryTransport {
public:
    AvaticaTransport(std::shared_ptr<HttpClient> http, const PhoenixConfig& config);
    ~AvaticaTransport() override { close(); }

    ConnectResult connect() override;
    bool close() override;
    [[nodiscard]] bool is_open() const override;

    TabularResult execute(const StatementRequest& request) override;

    [[nodiscard]] std::string connection_token() const override;
    [[nodiscard]] TransportKind kind() const override { return TransportKind::PROTOCOL; }
    [[nodiscard]] const char* transport_name() const override { return "avatica"; }

    [[nodiscard]] const std::string& endpoint() const { return url_; }

    // Appends "/json" unless the URL already ends with it
    static std::string normalize_endpoint(const std::string& base_url);

private:
    std::shared_ptr<HttpClient> http_;
    std::string url_;
    ProtocolCodec codec_;
    int open_attempts_;
    std::chrono::milliseconds retry_delay_;

    mutable std::mutex mutex_;
    std::string token_;

    // One openConnection round trip; returns the issued token
    std::string open_once(const std::string& connection_id, std::string& last_body);

    // POSTs `body`, returns the response body of a 2xx exchange.
    // Non-2xx responses carrying an Avatica error raise REMOTE_ERROR,
    // anything else that is not 2xx raises CONNECT_FAILED.
    std::string post(const std::string& body, const char* operation);

    // Forgets `token` unless a newer connection already replaced it
    void drop_session(const std::string& token, const char* reason);

    static std::string generate_connection_id();
};

} // namespace phxgw
