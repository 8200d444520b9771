#include "http_client.hpp"
#include "logger.hpp"
#include <curl/curl.h>

namespace phxgw {

static size_t http_write_cb(char* ptr, size_t size, size_t nmemb, std::string* data) {
    data->append(ptr, size * nmemb);
    return size * nmemb;
}

HttpResponse HttpClient::get(const std::string& url, std::vector<std::string> headers) {
    HttpRequest req;
    req.method = "GET";
    req.url = url;
    req.headers = std::move(headers);
    return send(req);
}

HttpResponse HttpClient::post_json(const std::string& url, const std::string& body,
                                   std::vector<std::string> headers) {
    HttpRequest req;
    req.method = "POST";
    req.url = url;
    req.body = body;
    req.headers = std::move(headers);
    req.headers.push_back("Content-Type: application/json");
    return send(req);
}

HttpResponse HttpClient::put_json(const std::string& url, const std::string& body,
                                  std::vector<std::string> headers) {
    HttpRequest req;
    req.method = "PUT";
    req.url = url;
    req.body = body;
    req.headers = std::move(headers);
    req.headers.push_back("Content-Type: application/json");
    return send(req);
}

void CurlHttpClient::global_init() {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

void CurlHttpClient::global_cleanup() {
    curl_global_cleanup();
}

HttpResponse CurlHttpClient::send(const HttpRequest& request) {
    HttpResponse resp;

    CURL* curl = curl_easy_init();
    if (!curl) {
        resp.error = "curl_easy_init failed";
        LOG_ERR("[http] %s", resp.error.c_str());
        return resp;
    }

    struct curl_slist* headers = nullptr;
    for (const auto& h : request.headers) {
        headers = curl_slist_append(headers, h.c_str());
    }

    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, http_write_cb);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &resp.body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_sec_);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, connect_timeout_sec_);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);  // worker threads
    if (headers) curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);

    if (request.method == "POST") {
        curl_easy_setopt(curl, CURLOPT_POST, 1L);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
    } else if (request.method != "GET") {
        curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, request.method.c_str());
        if (!request.body.empty()) {
            curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
            curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
        }
    }

    CURLcode res = curl_easy_perform(curl);
    if (res == CURLE_OK) {
        resp.transport_ok = true;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &resp.status);
    } else {
        resp.error = curl_easy_strerror(res);
        LOG_DBG("[http] %s %s failed: %s",
            request.method.c_str(), request.url.c_str(), resp.error.c_str());
    }

    if (headers) curl_slist_free_all(headers);
    curl_easy_cleanup(curl);
    return resp;
}

} // namespace phxgw
