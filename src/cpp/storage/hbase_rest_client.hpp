#pragma once
// HBase REST (Stargate) client for storage administration: create tables
// with column families, check existence, read schemas, write single cells.
// Every URL is http://<server>:<port>/<namespace>:<table>/...
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "../config.hpp"
#include "../utils/http_client.hpp"

namespace phxgw {

class StorageError : public std::runtime_error {
public:
    StorageError(const std::string& message, long http_status = 0)
        : std::runtime_error(message), http_status_(http_status) {}

    // 0 when the request never got an HTTP response
    [[nodiscard]] long http_status() const noexcept { return http_status_; }

private:
    long http_status_;
};

class HBaseRestClient {
public:
    static constexpr const char* DEFAULT_NAMESPACE = "default";
    static constexpr const char* SENSOR_TABLE = "sensor_info";

    HBaseRestClient(std::shared_ptr<HttpClient> http, const HBaseConfig& config);

    // false when the table already exists; StorageError on a failed create
    bool create_table(const std::string& table, const std::vector<std::string>& families,
                      const std::string& ns = DEFAULT_NAMESPACE);

    // Column families: metadata, readings, status
    bool create_sensor_table(const std::string& table = SENSOR_TABLE,
                             const std::string& ns = DEFAULT_NAMESPACE);

    // Any failure (404, unreachable server, other status) reads as "does not exist"
    bool table_exists(const std::string& table, const std::string& ns = DEFAULT_NAMESPACE);

    // Raw schema JSON as returned by the REST server
    std::string get_schema(const std::string& table, const std::string& ns = DEFAULT_NAMESPACE);

    void put_cell(const std::string& table, const std::string& row_key,
                  const std::string& family, const std::string& column,
                  const std::string& value, const std::string& ns = DEFAULT_NAMESPACE);

    [[nodiscard]] const std::string& base_url() const { return base_url_; }

    // Request bodies, exposed for tests
    static std::string schema_body(const std::vector<std::string>& families);
    static std::string put_cell_body(const std::string& row_key, const std::string& family,
                                     const std::string& column, const std::string& value);

private:
    std::shared_ptr<HttpClient> http_;
    std::string base_url_;

    std::string table_url(const std::string& table, const std::string& ns) const;
    static std::vector<std::string> json_headers();
};

} // namespace phxgw
