#pragma once
// Request handlers behind /api/phoenix. Each takes the already-extracted
// path/query values and raw request body and returns status + JSON, so the
// HTTP server only has to route. Every SQL handler opens the connection
// first (the warm-up may not have finished yet).
#include <string>
#include <nlohmann/json.hpp>

#include "response_mapper.hpp"
#include "../query/catalog.hpp"
#include "../query/connection_manager.hpp"
#include "../storage/hbase_rest_client.hpp"

namespace phxgw {

class PhoenixApi {
public:
    PhoenixApi(ConnectionManager& manager, HBaseRestClient& hbase);

    // ---- Phoenix SQL ----
    ApiResponse list_tables();
    ApiResponse table_columns(const std::string& table);
    ApiResponse query(const std::string& body);
    ApiResponse execute(const std::string& body);
    ApiResponse health() const;

    // ---- HBase storage ----
    ApiResponse create_sensor_table(const std::string& body);
    ApiResponse hbase_table_exists(const std::string& table, const std::string& ns);
    ApiResponse hbase_table_schema(const std::string& table, const std::string& ns);
    ApiResponse hbase_put(const std::string& table, const std::string& body);

    // ---- Views ----
    ApiResponse create_view(const std::string& body);
    ApiResponse list_views();
    ApiResponse get_view(const std::string& view_name);
    ApiResponse view_columns(const std::string& view_name);
    ApiResponse drop_view(const std::string& view_name);

    // Parses a JSON object body; empty body gives an empty object when allowed.
    // Throws std::invalid_argument otherwise.
    static nlohmann::json parse_body(const std::string& body, bool allow_empty = false);

    static ViewDefinition view_definition_from(const nlohmann::json& j);

private:
    ConnectionManager& manager_;
    HBaseRestClient& hbase_;
    Catalog catalog_;

    ApiResponse view_not_found(const std::string& view_name) const;
};

} // namespace phxgw
