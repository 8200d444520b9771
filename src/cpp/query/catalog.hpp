#pragma once
// SYSTEM.CATALOG helpers: table/column/view listings and Phoenix views
// mapped over native HBase tables. All statements go through the
// ConnectionManager (open() first, then execute()).
#include <stdexcept>
#include <string>
#include <vector>

#include "connection_manager.hpp"

namespace phxgw {

struct ViewColumn {
    std::string name;
    std::string type;
    bool primary_key = false;
};

struct ViewDefinition {
    std::string view_name;
    std::string hbase_table;
    std::string hbase_namespace = "default";
    std::vector<ViewColumn> columns;
};

class Catalog {
public:
    explicit Catalog(ConnectionManager& manager) : manager_(manager) {}

    // User tables (TABLE_TYPE 'u'); falls back to tables without a schema,
    // then to the first 100 catalog entries, when the previous query is empty.
    TabularResult list_tables();

    // COLUMN_NAME, DATA_TYPE, COLUMN_SIZE, IS_NULLABLE by ORDINAL_POSITION
    TabularResult list_columns(const std::string& table);

    TabularResult list_views();

    // View names are stored upper-cased in the catalog
    bool view_exists(const std::string& view_name);

    // Executes the CREATE VIEW; returns the SQL that was run
    std::string create_view(const ViewDefinition& def);

    // Throws std::invalid_argument unless view_name is an identifier
    void drop_view(const std::string& view_name);

    // Throws std::invalid_argument for a definition without name/table/columns,
    // or one whose names or types are not plain SQL identifiers and types.
    // First flagged column becomes the PRIMARY KEY, else the first column.
    static std::string build_create_view_sql(const ViewDefinition& def);

    // NAME, "Quoted Name" or SCHEMA.NAME; nothing that could end the statement
    static bool is_identifier(const std::string& name);
    static bool is_column_type(const std::string& type);

    // Doubles single quotes for use inside a '...' literal
    static std::string quote_literal(const std::string& value);

    static constexpr const char* LIST_VIEWS_SQL =
        "SELECT TABLE_NAME, TABLE_SCHEM, TABLE_TYPE FROM SYSTEM.CATALOG "
        "WHERE TABLE_TYPE = 'v' ORDER BY TABLE_NAME";

private:
    ConnectionManager& manager_;

    TabularResult run_query(const std::string& sql);
};

} // namespace phxgw
