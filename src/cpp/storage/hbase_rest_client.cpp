// HBase REST (Stargate) client -- HTTP API on port 8080, JSON bodies.
// Row keys, column names and cell values travel base64-encoded.
//
// Schema:  GET/POST /{ns}:{table}/schema  {"ColumnSchema":[{"name":...}]}
// Put:     PUT /{ns}:{table}/{row}        {"Row":[{"key","Cell":[{"column","$"}]}]}

#include "hbase_rest_client.hpp"
#include "../utils/base64.hpp"
#include "../utils/logger.hpp"

#include <cctype>
#include <cstdio>
#include <nlohmann/json.hpp>

namespace phxgw {

// Percent-encodes everything outside RFC 3986 unreserved characters
static std::string escape_path_segment(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' || c == ':') {
            out += static_cast<char>(c);
        } else {
            char buf[4];
            std::snprintf(buf, sizeof(buf), "%%%02X", c);
            out += buf;
        }
    }
    return out;
}

HBaseRestClient::HBaseRestClient(std::shared_ptr<HttpClient> http, const HBaseConfig& config)
    : http_(std::move(http)), base_url_(config.base_url()) {
    while (!base_url_.empty() && base_url_.back() == '/') base_url_.pop_back();
}

std::vector<std::string> HBaseRestClient::json_headers() {
    return {"Accept: application/json"};
}

std::string HBaseRestClient::table_url(const std::string& table, const std::string& ns) const {
    const std::string& n = ns.empty() ? std::string(DEFAULT_NAMESPACE) : ns;
    return base_url_ + "/" + escape_path_segment(n + ":" + table);
}

std::string HBaseRestClient::schema_body(const std::vector<std::string>& families) {
    nlohmann::json cols = nlohmann::json::array();
    for (const auto& f : families) {
        cols.push_back({
            {"name", f},
            {"maxVersions", 1},
            {"compression", "NONE"},
            {"bloomFilter", "NONE"},
            {"inMemory", false},
            {"timeToLive", 2147483647},
            {"blockCache", true},
            {"blocksize", 65536},
        });
    }
    nlohmann::json j;
    j["ColumnSchema"] = cols;
    return j.dump();
}

std::string HBaseRestClient::put_cell_body(const std::string& row_key, const std::string& family,
                                           const std::string& column, const std::string& value) {
    nlohmann::json cell;
    cell["column"] = Base64::encode(family + ":" + column);
    cell["$"] = Base64::encode(value);

    nlohmann::json row;
    row["key"] = Base64::encode(row_key);
    row["Cell"] = nlohmann::json::array({cell});

    nlohmann::json j;
    j["Row"] = nlohmann::json::array({row});
    return j.dump();
}

bool HBaseRestClient::table_exists(const std::string& table, const std::string& ns) {
    HttpResponse resp = http_->get(table_url(table, ns) + "/schema", json_headers());
    if (!resp.transport_ok) {
        LOG_WRN("[hbase] Existence check for %s:%s failed: %s",
            ns.c_str(), table.c_str(), resp.error.c_str());
        return false;
    }
    if (resp.status == 404) return false;
    if (!resp.ok()) {
        LOG_WRN("[hbase] Existence check for %s:%s returned HTTP %ld",
            ns.c_str(), table.c_str(), resp.status);
        return false;
    }
    return true;
}

bool HBaseRestClient::create_table(const std::string& table, const std::vector<std::string>& families,
                                   const std::string& ns) {
    if (table_exists(table, ns)) {
        LOG_INF("[hbase] Table %s:%s already exists", ns.c_str(), table.c_str());
        return false;
    }

    HttpResponse resp = http_->post_json(table_url(table, ns) + "/schema",
                                         schema_body(families), json_headers());
    if (!resp.ok()) {
        throw StorageError("Failed to create table " + ns + ":" + table + ". " +
            (resp.transport_ok ? "Status: " + std::to_string(resp.status) + ", Response: " + resp.body
                               : resp.error),
            resp.transport_ok ? resp.status : 0);
    }

    std::string fams;
    for (const auto& f : families) fams += (fams.empty() ? "" : ", ") + f;
    LOG_INF("[hbase] Created table %s:%s (families: %s)", ns.c_str(), table.c_str(), fams.c_str());
    return true;
}

bool HBaseRestClient::create_sensor_table(const std::string& table, const std::string& ns) {
    return create_table(table, {"metadata", "readings", "status"}, ns);
}

std::string HBaseRestClient::get_schema(const std::string& table, const std::string& ns) {
    HttpResponse resp = http_->get(table_url(table, ns) + "/schema", json_headers());
    if (!resp.ok()) {
        throw StorageError("Error getting schema for table " + ns + ":" + table + ": " +
            (resp.transport_ok ? "HTTP " + std::to_string(resp.status) : resp.error),
            resp.transport_ok ? resp.status : 0);
    }
    return resp.body;
}

void HBaseRestClient::put_cell(const std::string& table, const std::string& row_key,
                               const std::string& family, const std::string& column,
                               const std::string& value, const std::string& ns) {
    std::string url = table_url(table, ns) + "/" + escape_path_segment(row_key);
    HttpResponse resp = http_->put_json(url, put_cell_body(row_key, family, column, value),
                                        json_headers());
    if (!resp.ok()) {
        throw StorageError("Error inserting data into " + ns + ":" + table + ": " +
            (resp.transport_ok ? "HTTP " + std::to_string(resp.status) + " " + resp.body : resp.error),
            resp.transport_ok ? resp.status : 0);
    }
    LOG_DBG("[hbase] Put %s:%s row=%s %s:%s",
        ns.c_str(), table.c_str(), row_key.c_str(), family.c_str(), column.c_str());
}

} // namespace phxgw
