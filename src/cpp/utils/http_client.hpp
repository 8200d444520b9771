#pragma once
// Minimal blocking HTTP client used by the Avatica transport and the HBase
// REST client. The abstract base lets tests substitute scripted responses.
#include <string>
#include <vector>

namespace phxgw {

struct HttpResponse {
    bool transport_ok = false;   // false: no HTTP exchange happened (DNS, refused, timeout)
    long status = 0;             // HTTP status code when transport_ok
    std::string body;
    std::string error;           // curl error text when !transport_ok

    [[nodiscard]] bool ok() const { return transport_ok && status >= 200 && status < 300; }
};

struct HttpRequest {
    std::string method = "GET";
    std::string url;
    std::string body;
    std::vector<std::string> headers;  // "Name: value"
};

class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual HttpResponse send(const HttpRequest& request) = 0;

    HttpResponse get(const std::string& url, std::vector<std::string> headers = {});
    HttpResponse post_json(const std::string& url, const std::string& body,
                           std::vector<std::string> headers = {});
    HttpResponse put_json(const std::string& url, const std::string& body,
                          std::vector<std::string> headers = {});
};

// libcurl easy-interface implementation. One easy handle per request;
// curl_global_init is done once per process by CurlHttpClient::global_init().
class CurlHttpClient : public HttpClient {
public:
    explicit CurlHttpClient(long timeout_sec = 300, long connect_timeout_sec = 10)
        : timeout_sec_(timeout_sec), connect_timeout_sec_(connect_timeout_sec) {}

    HttpResponse send(const HttpRequest& request) override;

    static void global_init();
    static void global_cleanup();

private:
    long timeout_sec_;
    long connect_timeout_sec_;
};

} // namespace phxgw
