#include <gtest/gtest.h>

#include "query/catalog.hpp"
#include "fakes.hpp"

using namespace phxgw;
using phxgw::fakes::FakeTransport;

namespace {

ViewDefinition sensor_view() {
    ViewDefinition def;
    def.view_name = "SENSOR_VIEW";
    def.hbase_table = "sensor_info";
    def.columns = {{"ROWKEY", "VARCHAR", false},
                   {"\"metadata\".\"type\"", "VARCHAR", false}};
    return def;
}

struct CatalogFixture {
    FakeTransport* protocol = nullptr;
    std::unique_ptr<ConnectionManager> manager;
    std::unique_ptr<Catalog> catalog;

    CatalogFixture() {
        auto p = std::make_unique<FakeTransport>(TransportKind::PROTOCOL, "fake-protocol");
        protocol = p.get();
        manager = std::make_unique<ConnectionManager>(nullptr, std::move(p));
        catalog = std::make_unique<Catalog>(*manager);
    }
};

} // namespace

TEST(CatalogTest, FirstColumnIsPrimaryKeyByDefault) {
    EXPECT_EQ(Catalog::build_create_view_sql(sensor_view()),
              "CREATE VIEW IF NOT EXISTS SENSOR_VIEW (ROWKEY VARCHAR PRIMARY KEY, "
              "\"metadata\".\"type\" VARCHAR) AS SELECT * FROM \"default:sensor_info\"");
}

TEST(CatalogTest, FlaggedPrimaryKeyWins) {
    ViewDefinition def = sensor_view();
    def.columns[1].primary_key = true;
    def.hbase_namespace = "iot";
    std::string sql = Catalog::build_create_view_sql(def);
    EXPECT_NE(sql.find("(ROWKEY VARCHAR, \"metadata\".\"type\" VARCHAR PRIMARY KEY)"), std::string::npos);
    EXPECT_NE(sql.find("FROM \"iot:sensor_info\""), std::string::npos);
}

TEST(CatalogTest, BlankNamespaceMeansDefault) {
    ViewDefinition def = sensor_view();
    def.hbase_namespace = "";
    EXPECT_NE(Catalog::build_create_view_sql(def).find("\"default:sensor_info\""), std::string::npos);
}

TEST(CatalogTest, InvalidDefinitions) {
    ViewDefinition no_name = sensor_view();
    no_name.view_name = " ";
    EXPECT_THROW(Catalog::build_create_view_sql(no_name), std::invalid_argument);

    ViewDefinition no_table = sensor_view();
    no_table.hbase_table.clear();
    EXPECT_THROW(Catalog::build_create_view_sql(no_table), std::invalid_argument);

    ViewDefinition no_columns = sensor_view();
    no_columns.columns.clear();
    EXPECT_THROW(Catalog::build_create_view_sql(no_columns), std::invalid_argument);

    ViewDefinition untyped = sensor_view();
    untyped.columns[1].type.clear();
    EXPECT_THROW(Catalog::build_create_view_sql(untyped), std::invalid_argument);
}

TEST(CatalogTest, QuoteLiteral) {
    EXPECT_EQ(Catalog::quote_literal("USERS"), "USERS");
    EXPECT_EQ(Catalog::quote_literal("O'Brien"), "O''Brien");
}

TEST(CatalogTest, ListTablesFallsBackUntilRowsAppear) {
    CatalogFixture f;
    f.protocol->results.push_back(TabularResult{});
    f.protocol->results.push_back(fakes::single_value("TABLE_NAME", std::string("USERS"), "VARCHAR"));

    TabularResult r = f.catalog->list_tables();
    ASSERT_EQ(r.rows.size(), 1u);
    EXPECT_EQ(std::get<std::string>(r.rows[0].at("TABLE_NAME")), "USERS");

    ASSERT_EQ(f.protocol->executed.size(), 2u);
    EXPECT_NE(f.protocol->executed[0].sql.find("TABLE_TYPE = 'u'"), std::string::npos);
    EXPECT_NE(f.protocol->executed[1].sql.find("TABLE_SCHEM IS NULL"), std::string::npos);
}

TEST(CatalogTest, ListTablesAllEmpty) {
    CatalogFixture f;
    TabularResult r = f.catalog->list_tables();
    EXPECT_TRUE(r.empty());
    ASSERT_EQ(f.protocol->executed.size(), 3u);
    EXPECT_NE(f.protocol->executed[2].sql.find("LIMIT 100"), std::string::npos);
}

TEST(CatalogTest, ListColumnsQuotesTableName) {
    CatalogFixture f;
    f.catalog->list_columns("it's");
    ASSERT_EQ(f.protocol->executed.size(), 1u);
    EXPECT_NE(f.protocol->executed[0].sql.find("TABLE_NAME = 'it''s'"), std::string::npos);
    EXPECT_NE(f.protocol->executed[0].sql.find("ORDER BY ORDINAL_POSITION"), std::string::npos);
}

TEST(CatalogTest, ViewExistsUppercasesName) {
    CatalogFixture f;
    f.protocol->result = fakes::single_value("TABLE_NAME", std::string("SENSOR_VIEW"), "VARCHAR");
    EXPECT_TRUE(f.catalog->view_exists("sensor_view"));
    EXPECT_NE(f.protocol->executed[0].sql.find("TABLE_NAME = 'SENSOR_VIEW'"), std::string::npos);
    EXPECT_NE(f.protocol->executed[0].sql.find("TABLE_TYPE = 'v'"), std::string::npos);
}

TEST(CatalogTest, CreateAndDropViewExecute) {
    CatalogFixture f;
    std::string sql = f.catalog->create_view(sensor_view());
    f.catalog->drop_view("SENSOR_VIEW");

    ASSERT_EQ(f.protocol->executed.size(), 2u);
    EXPECT_EQ(f.protocol->executed[0].sql, sql);
    EXPECT_EQ(f.protocol->executed[0].kind, StatementKind::EXECUTE);
    EXPECT_EQ(f.protocol->executed[1].sql, "DROP VIEW IF EXISTS SENSOR_VIEW");
    EXPECT_TRUE(f.manager->is_open());
}

TEST(CatalogTest, IdentifierRules) {
    EXPECT_TRUE(Catalog::is_identifier("SENSOR_VIEW"));
    EXPECT_TRUE(Catalog::is_identifier("iot.SENSOR_VIEW"));
    EXPECT_TRUE(Catalog::is_identifier("\"metadata\".\"type\""));
    EXPECT_TRUE(Catalog::is_identifier("\"Mixed Case\""));

    EXPECT_FALSE(Catalog::is_identifier(""));
    EXPECT_FALSE(Catalog::is_identifier("1VIEW"));
    EXPECT_FALSE(Catalog::is_identifier("V; DROP TABLE USERS"));
    EXPECT_FALSE(Catalog::is_identifier("\"a\"\"b\""));
    EXPECT_FALSE(Catalog::is_identifier("a.b.c"));
}

TEST(CatalogTest, ColumnTypeRules) {
    for (const char* type : {"VARCHAR", "UNSIGNED_LONG", "VARCHAR(50)", "DECIMAL(10,2)",
                             "DECIMAL(10, 2)", "VARCHAR ARRAY", "INTEGER[]", "CHAR(3) ARRAY[4]"}) {
        EXPECT_TRUE(Catalog::is_column_type(type)) << type;
    }
    for (const char* type : {"VARCHAR)", "VARCHAR) AS SELECT 1 --", "INT, X INT",
                             "VARCHAR(5", "VARCHAR;"}) {
        EXPECT_FALSE(Catalog::is_column_type(type)) << type;
    }
}

TEST(CatalogTest, InjectedNamesAreRejected) {
    ViewDefinition bad_view = sensor_view();
    bad_view.view_name = "V (X VARCHAR PRIMARY KEY) AS SELECT * FROM \"t\"; DROP TABLE USERS; --";
    EXPECT_THROW(Catalog::build_create_view_sql(bad_view), std::invalid_argument);

    ViewDefinition bad_column = sensor_view();
    bad_column.columns[0].name = "ROWKEY VARCHAR PRIMARY KEY) AS SELECT 1; --";
    EXPECT_THROW(Catalog::build_create_view_sql(bad_column), std::invalid_argument);

    ViewDefinition bad_type = sensor_view();
    bad_type.columns[0].type = "VARCHAR) AS SELECT 1 --";
    EXPECT_THROW(Catalog::build_create_view_sql(bad_type), std::invalid_argument);

    ViewDefinition bad_table = sensor_view();
    bad_table.hbase_table = "sensor\"; DROP TABLE USERS; --";
    EXPECT_THROW(Catalog::build_create_view_sql(bad_table), std::invalid_argument);

    ViewDefinition bad_namespace = sensor_view();
    bad_namespace.hbase_namespace = "ns:x";
    EXPECT_THROW(Catalog::build_create_view_sql(bad_namespace), std::invalid_argument);
}

TEST(CatalogTest, DropViewRejectsInvalidNameBeforeExecuting) {
    CatalogFixture f;
    EXPECT_THROW(f.catalog->drop_view("SENSOR_VIEW; DROP TABLE USERS"), std::invalid_argument);
    EXPECT_TRUE(f.protocol->executed.empty());
    EXPECT_EQ(f.protocol->open_calls, 0);
}
