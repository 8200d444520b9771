#include "phoenix_api.hpp"
#include "../utils/logger.hpp"

#include <algorithm>
#include <cctype>

namespace phxgw {

static bool is_blank(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
}

// String member or `def`; JSON null counts as absent
static std::string str_field(const nlohmann::json& j, const char* key, const std::string& def = {}) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return def;
    if (!it->is_string()) {
        throw std::invalid_argument(std::string("'") + key + "' must be a string");
    }
    return it->get<std::string>();
}

static std::string ns_or_default(const std::string& ns) {
    return is_blank(ns) ? std::string(HBaseRestClient::DEFAULT_NAMESPACE) : ns;
}

PhoenixApi::PhoenixApi(ConnectionManager& manager, HBaseRestClient& hbase)
    : manager_(manager), hbase_(hbase), catalog_(manager) {}

nlohmann::json PhoenixApi::parse_body(const std::string& body, bool allow_empty) {
    if (is_blank(body)) {
        if (allow_empty) return nlohmann::json::object();
        throw std::invalid_argument("Request body is required");
    }
    nlohmann::json j = nlohmann::json::parse(body, nullptr, false);
    if (j.is_discarded()) throw std::invalid_argument("Request body is not valid JSON");
    if (!j.is_object()) throw std::invalid_argument("Request body must be a JSON object");
    return j;
}

ViewDefinition PhoenixApi::view_definition_from(const nlohmann::json& j) {
    ViewDefinition def;
    def.view_name = str_field(j, "viewName");
    def.hbase_table = str_field(j, "hbaseTableName", str_field(j, "hBaseTableName"));
    def.hbase_namespace = ns_or_default(str_field(j, "namespace"));

    auto cols = j.find("columns");
    if (cols != j.end() && !cols->is_null()) {
        if (!cols->is_array()) throw std::invalid_argument("'columns' must be an array");
        for (const auto& c : *cols) {
            if (!c.is_object()) throw std::invalid_argument("column definitions must be objects");
            ViewColumn vc;
            vc.name = str_field(c, "name");
            vc.type = str_field(c, "type");
            vc.primary_key = c.value("isPrimaryKey", false);
            def.columns.push_back(std::move(vc));
        }
    }
    return def;
}

// ---------------------------------------------------------------------------
// Phoenix SQL
// ---------------------------------------------------------------------------

ApiResponse PhoenixApi::list_tables() {
    try {
        TabularResult tables = catalog_.list_tables();
        nlohmann::json j = ResponseMapper::result_to_json(tables);
        if (tables.empty()) j["message"] = ResponseMapper::NO_TABLES_MESSAGE;
        return ResponseMapper::ok(std::move(j));
    } catch (const std::exception& e) {
        return ResponseMapper::failure(e);
    }
}

ApiResponse PhoenixApi::table_columns(const std::string& table) {
    try {
        return ResponseMapper::ok(ResponseMapper::result_to_json(catalog_.list_columns(table)));
    } catch (const std::exception& e) {
        return ResponseMapper::failure(e);
    }
}

ApiResponse PhoenixApi::query(const std::string& body) {
    std::string sql;
    try {
        sql = str_field(parse_body(body), "sql");
    } catch (const std::exception& e) {
        return ResponseMapper::error(400, e.what());
    }
    if (is_blank(sql)) return ResponseMapper::error(400, "SQL query is required");

    try {
        TabularResult r = manager_.ensure_open_and_execute(StatementRequest::query(sql));
        return ResponseMapper::ok(ResponseMapper::result_to_json(r));
    } catch (const std::exception& e) {
        return ResponseMapper::statement_failure(e, StatementKind::QUERY);
    }
}

ApiResponse PhoenixApi::execute(const std::string& body) {
    std::string sql;
    try {
        sql = str_field(parse_body(body), "sql");
    } catch (const std::exception& e) {
        return ResponseMapper::error(400, e.what());
    }
    if (is_blank(sql)) return ResponseMapper::error(400, "SQL statement is required");

    try {
        manager_.ensure_open_and_execute(StatementRequest::execute(sql));
        return ResponseMapper::ok({{"message", "Command executed successfully"}});
    } catch (const std::exception& e) {
        return ResponseMapper::statement_failure(e, StatementKind::EXECUTE);
    }
}

ApiResponse PhoenixApi::health() const {
    nlohmann::json j;
    j["status"] = "healthy";
    j["timestamp"] = ResponseMapper::iso_timestamp(std::chrono::system_clock::now());
    j["connection"] = {
        {"state", connection_state_str(manager_.state())},
        {"transport", transport_kind_str(manager_.active_transport())},
        {"driverEligible", manager_.driver_eligible()},
    };
    return ResponseMapper::ok(std::move(j));
}

// ---------------------------------------------------------------------------
// HBase storage
// ---------------------------------------------------------------------------

ApiResponse PhoenixApi::create_sensor_table(const std::string& body) {
    try {
        nlohmann::json req = parse_body(body, true);
        std::string table = str_field(req, "tableName", HBaseRestClient::SENSOR_TABLE);
        if (is_blank(table)) table = HBaseRestClient::SENSOR_TABLE;
        std::string ns = ns_or_default(str_field(req, "namespace"));

        if (hbase_.create_sensor_table(table, ns)) {
            return ResponseMapper::ok({
                {"message", "Sensor table '" + ns + ":" + table + "' created successfully"},
                {"tableName", table},
                {"namespace", ns},
                {"columnFamilies", {"metadata", "readings", "status"}},
            });
        }
        return {409, {
            {"message", "Sensor table '" + ns + ":" + table + "' already exists"},
            {"tableName", table},
            {"namespace", ns},
        }};
    } catch (const std::exception& e) {
        return ResponseMapper::failure(e);
    }
}

ApiResponse PhoenixApi::hbase_table_exists(const std::string& table, const std::string& ns) {
    const std::string n = ns_or_default(ns);
    bool exists = hbase_.table_exists(table, n);
    return ResponseMapper::ok({{"tableName", table}, {"namespace", n}, {"exists", exists}});
}

ApiResponse PhoenixApi::hbase_table_schema(const std::string& table, const std::string& ns) {
    const std::string n = ns_or_default(ns);
    try {
        std::string raw = hbase_.get_schema(table, n);
        nlohmann::json schema = nlohmann::json::parse(raw, nullptr, false);
        if (schema.is_discarded()) schema = raw;
        return ResponseMapper::ok({{"tableName", table}, {"namespace", n}, {"schema", schema}});
    } catch (const StorageError& e) {
        if (e.http_status() == 404) {
            return ResponseMapper::error(404, "HBase table '" + n + ":" + table + "' does not exist");
        }
        return ResponseMapper::error(500, e.what());
    }
}

ApiResponse PhoenixApi::hbase_put(const std::string& table, const std::string& body) {
    try {
        nlohmann::json req = parse_body(body);
        std::string target = str_field(req, "tableName", table);
        if (is_blank(target)) target = table;
        const std::string ns = ns_or_default(str_field(req, "namespace"));
        const std::string row_key = str_field(req, "rowKey");
        const std::string family = str_field(req, "columnFamily");
        const std::string column = str_field(req, "column");
        const std::string value = str_field(req, "value");

        if (is_blank(row_key)) return ResponseMapper::error(400, "rowKey is required");
        if (is_blank(family)) return ResponseMapper::error(400, "columnFamily is required");
        if (is_blank(column)) return ResponseMapper::error(400, "column is required");

        hbase_.put_cell(target, row_key, family, column, value, ns);
        return ResponseMapper::ok({
            {"message", "Data inserted successfully into " + ns + ":" + target},
            {"rowKey", row_key},
            {"columnFamily", family},
            {"column", column},
            {"value", value},
        });
    } catch (const std::exception& e) {
        return ResponseMapper::failure(e);
    }
}

// ---------------------------------------------------------------------------
// Views
// ---------------------------------------------------------------------------

ApiResponse PhoenixApi::view_not_found(const std::string& view_name) const {
    return ResponseMapper::error(404, "View '" + view_name + "' not found",
                                 "List all views using: GET /api/phoenix/views");
}

ApiResponse PhoenixApi::create_view(const std::string& body) {
    ViewDefinition def;
    std::string sql;
    try {
        def = view_definition_from(parse_body(body));
        sql = Catalog::build_create_view_sql(def);
    } catch (const std::exception& e) {
        return ResponseMapper::error(400, e.what());
    }

    try {
        if (!hbase_.table_exists(def.hbase_table, def.hbase_namespace)) {
            return ResponseMapper::error(400,
                "HBase table '" + def.hbase_namespace + ":" + def.hbase_table + "' does not exist",
                "Create the table first using: POST /api/phoenix/hbase/tables/sensor or "
                "POST /api/phoenix/hbase/tables/" + def.hbase_table);
        }

        catalog_.create_view(def);
        return ResponseMapper::ok({
            {"message", "Phoenix view '" + def.view_name + "' created successfully on HBase table '" +
                        def.hbase_namespace + ":" + def.hbase_table + "'"},
            {"viewName", def.view_name},
            {"hbaseTableName", def.hbase_table},
            {"namespace", def.hbase_namespace},
            {"sql", sql},
        });
    } catch (const std::exception& e) {
        return ResponseMapper::error(500, e.what());
    }
}

ApiResponse PhoenixApi::list_views() {
    try {
        TabularResult views = catalog_.list_views();
        nlohmann::json j = ResponseMapper::result_to_json(views);
        if (views.empty()) j["message"] = ResponseMapper::NO_VIEWS_MESSAGE;
        return ResponseMapper::ok(std::move(j));
    } catch (const std::exception& e) {
        return ResponseMapper::failure(e);
    }
}

ApiResponse PhoenixApi::get_view(const std::string& view_name) {
    try {
        if (!catalog_.view_exists(view_name)) return view_not_found(view_name);

        TabularResult cols = catalog_.list_columns(view_name);
        nlohmann::json r = ResponseMapper::result_to_json(cols);
        return ResponseMapper::ok({
            {"viewName", view_name},
            {"columns", r["columns"]},
            {"rows", r["rows"]},
            {"rowCount", cols.row_count()},
        });
    } catch (const std::exception& e) {
        return ResponseMapper::failure(e);
    }
}

ApiResponse PhoenixApi::view_columns(const std::string& view_name) {
    try {
        if (!catalog_.view_exists(view_name)) return view_not_found(view_name);
        return ResponseMapper::ok(ResponseMapper::result_to_json(catalog_.list_columns(view_name)));
    } catch (const std::exception& e) {
        return ResponseMapper::failure(e);
    }
}

ApiResponse PhoenixApi::drop_view(const std::string& view_name) {
    try {
        if (!catalog_.view_exists(view_name)) return view_not_found(view_name);
        catalog_.drop_view(view_name);
        return ResponseMapper::ok({
            {"message", "View '" + view_name + "' dropped successfully"},
            {"viewName", view_name},
        });
    } catch (const std::exception& e) {
        return ResponseMapper::failure(e);
    }
}

} // namespace phxgw
