#include "catalog.hpp"
#include "../utils/logger.hpp"

#include <algorithm>
#include <cctype>
#include <regex>

namespace phxgw {

static std::string to_upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
        [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

static bool is_blank(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
}

// NAME, "quoted name" or SCHEMA.NAME
static const std::regex& identifier_pattern() {
    static const std::regex re(
        R"re((?:[A-Za-z_][A-Za-z0-9_]*|"[^"]+")(?:\.(?:[A-Za-z_][A-Za-z0-9_]*|"[^"]+"))?)re");
    return re;
}

// VARCHAR, UNSIGNED_LONG, DECIMAL(10,2), VARCHAR(20) ARRAY, INTEGER[]
static const std::regex& type_pattern() {
    static const std::regex re(
        R"([A-Za-z_][A-Za-z0-9_]*( [A-Za-z_][A-Za-z0-9_]*)*)"
        R"(( ?\( ?[0-9]+ ?(, ?[0-9]+ ?)?\))?( ARRAY)?(\[[0-9]*\])?)");
    return re;
}

// HBase namespace and table qualifiers
static const std::regex& hbase_name_pattern() {
    static const std::regex re(R"([A-Za-z0-9_.\-]+)");
    return re;
}

bool Catalog::is_identifier(const std::string& name) {
    return std::regex_match(name, identifier_pattern());
}

bool Catalog::is_column_type(const std::string& type) {
    return std::regex_match(type, type_pattern());
}

std::string Catalog::quote_literal(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        out += c;
        if (c == '\'') out += '\'';
    }
    return out;
}

TabularResult Catalog::run_query(const std::string& sql) {
    return manager_.ensure_open_and_execute(StatementRequest::query(sql));
}

TabularResult Catalog::list_tables() {
    static const char* const queries[] = {
        "SELECT TABLE_NAME, TABLE_TYPE, TABLE_SCHEM FROM SYSTEM.CATALOG "
        "WHERE TABLE_TYPE = 'u' ORDER BY TABLE_NAME",
        "SELECT TABLE_NAME, TABLE_TYPE, TABLE_SCHEM FROM SYSTEM.CATALOG "
        "WHERE TABLE_SCHEM IS NULL ORDER BY TABLE_NAME",
        "SELECT TABLE_NAME, TABLE_TYPE, TABLE_SCHEM FROM SYSTEM.CATALOG "
        "ORDER BY TABLE_NAME LIMIT 100",
    };

    TabularResult result;
    for (const char* sql : queries) {
        result = run_query(sql);
        if (!result.empty()) break;
        LOG_DBG("[catalog] No rows from: %s", sql);
    }
    return result;
}

TabularResult Catalog::list_columns(const std::string& table) {
    return run_query(
        "SELECT COLUMN_NAME, DATA_TYPE, COLUMN_SIZE, IS_NULLABLE FROM SYSTEM.CATALOG "
        "WHERE TABLE_NAME = '" + quote_literal(table) + "' ORDER BY ORDINAL_POSITION");
}

TabularResult Catalog::list_views() {
    return run_query(LIST_VIEWS_SQL);
}

bool Catalog::view_exists(const std::string& view_name) {
    TabularResult r = run_query(
        "SELECT TABLE_NAME FROM SYSTEM.CATALOG WHERE TABLE_TYPE = 'v' AND TABLE_NAME = '" +
        quote_literal(to_upper(view_name)) + "'");
    return !r.empty();
}

std::string Catalog::build_create_view_sql(const ViewDefinition& def) {
    if (is_blank(def.view_name)) throw std::invalid_argument("ViewName is required");
    if (is_blank(def.hbase_table)) throw std::invalid_argument("HBaseTableName is required");
    if (def.columns.empty()) {
        throw std::invalid_argument("At least one column definition is required");
    }

    if (!is_identifier(def.view_name)) {
        throw std::invalid_argument("Invalid view name: " + def.view_name);
    }
    if (!std::regex_match(def.hbase_table, hbase_name_pattern())) {
        throw std::invalid_argument("Invalid HBase table name: " + def.hbase_table);
    }

    size_t pk = 0;
    for (size_t i = 0; i < def.columns.size(); ++i) {
        if (def.columns[i].primary_key) { pk = i; break; }
    }

    std::string cols;
    for (size_t i = 0; i < def.columns.size(); ++i) {
        const auto& c = def.columns[i];
        if (is_blank(c.name) || is_blank(c.type)) {
            throw std::invalid_argument("Column " + std::to_string(i + 1) + " needs a name and a type");
        }
        if (!is_identifier(c.name)) throw std::invalid_argument("Invalid column name: " + c.name);
        if (!is_column_type(c.type)) {
            throw std::invalid_argument("Invalid type for column " + c.name + ": " + c.type);
        }
        if (i > 0) cols += ", ";
        cols += c.name + " " + c.type;
        if (i == pk) cols += " PRIMARY KEY";
    }

    const std::string ns = is_blank(def.hbase_namespace) ? "default" : def.hbase_namespace;
    if (!std::regex_match(ns, hbase_name_pattern())) {
        throw std::invalid_argument("Invalid HBase namespace: " + ns);
    }
    return "CREATE VIEW IF NOT EXISTS " + def.view_name + " (" + cols + ") AS SELECT * FROM \"" +
           ns + ":" + def.hbase_table + "\"";
}

std::string Catalog::create_view(const ViewDefinition& def) {
    std::string sql = build_create_view_sql(def);
    manager_.ensure_open_and_execute(StatementRequest::execute(sql));
    LOG_INF("[catalog] Created view %s", def.view_name.c_str());
    return sql;
}

void Catalog::drop_view(const std::string& view_name) {
    if (!is_identifier(view_name)) throw std::invalid_argument("Invalid view name: " + view_name);
    manager_.ensure_open_and_execute(StatementRequest::execute("DROP VIEW IF EXISTS " + view_name));
    LOG_INF("[catalog] Dropped view %s", view_name.c_str());
}

} // namespace phxgw
