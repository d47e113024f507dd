#include "mirror_error.hpp"
#include "schema_types.hpp"
#include "sql_generator.hpp"
#include "test_helpers.hpp"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <string>
#include <vector>

using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::EndsWith;
using test_helpers::col;
using test_helpers::decimal_col;

TEST_CASE("Target table name derivation", "[schema_types]") {
  REQUIRE(derive_target_table_name(TableRef{"dbo", "Orders"}, "bi") ==
          "dbo_Orders_bi");
  REQUIRE(derive_target_table_name(TableRef{"schema", "table"}, "v2") ==
          "schema_table_v2");
  // Dots inside names are replaced too
  REQUIRE(derive_target_table_name(TableRef{"a.b", "c"}, "x") == "a_b_c_x");
  REQUIRE(derive_target_table_name(TableRef{"a", "b.c"}, "x") == "a_b_c_x");
}

TEST_CASE("Table names are quoted", "[schema_types]") {
  const table_def table{"my db", "main", "we\"ird"};
  REQUIRE(table.to_escaped_string() == R"("my db"."main"."we""ird")");
  REQUIRE(TableRef{"dbo", "Orders"}.qualified_name() == "dbo.Orders");
}

TEST_CASE("CREATE TABLE for the Shop orders table", "[sql_generator]") {
  const table_def target{"analytics", "main", "dbo_Orders_bi"};
  const auto statement = make_create_table_statement(
      target, {col("Id", "int"), col("Note", "nvarchar", 50)});

  REQUIRE(statement.kind == StatementKind::CreateTable);
  REQUIRE(statement.target.table_name == "dbo_Orders_bi");
  REQUIRE(statement.sql == R"(CREATE TABLE "analytics"."main"."dbo_Orders_bi" )"
                           R"(("Id" int, "Note" nvarchar(50)))");
}

TEST_CASE("CREATE TABLE keeps column order and has no trailing separator",
          "[sql_generator]") {
  const table_def target{"db", "main", "t"};
  const std::vector<column_info> columns = {
      col("z", "int"), decimal_col("a", 18, 2), col("m", "varchar", -1),
      col("b", "date")};
  const auto sql = make_create_table_statement(target, columns).sql;

  REQUIRE(sql == R"(CREATE TABLE "db"."main"."t" ("z" int, "a" decimal(18,2), )"
                 R"("m" varchar(MAX), "b" date))");
  REQUIRE_THAT(sql, EndsWith("date)"));
  REQUIRE_THAT(sql, !ContainsSubstring(",)"));
  REQUIRE_THAT(sql, !ContainsSubstring(", )"));
}

TEST_CASE("CREATE TABLE with a single column", "[sql_generator]") {
  const table_def target{"db", "main", "t"};
  REQUIRE(make_create_table_statement(target, {col("only", "bigint")}).sql ==
          R"(CREATE TABLE "db"."main"."t" ("only" bigint))");
}

TEST_CASE("CREATE TABLE quotes column names", "[sql_generator]") {
  const table_def target{"db", "main", "t"};
  REQUIRE(make_create_table_statement(target, {col("select", "int"),
                                               col("a\"b", "int")})
              .sql == R"(CREATE TABLE "db"."main"."t" ("select" int, "a""b" int))");
}

TEST_CASE("CREATE TABLE without columns fails", "[sql_generator]") {
  const table_def target{"db", "main", "t"};
  try {
    make_create_table_statement(target, {});
    FAIL("Expected TranslationFailed");
  } catch (const mirror_error::MirrorError &ex) {
    REQUIRE(ex.GetKind() == mirror_error::ErrorKind::TranslationFailed);
    REQUIRE_THAT(ex.what(), ContainsSubstring("no columns"));
  }
}

TEST_CASE("CREATE TABLE propagates type translation failures",
          "[sql_generator]") {
  const table_def target{"db", "main", "t"};
  try {
    make_create_table_statement(target,
                                {col("a", "int"), col("b", "int;drop")});
    FAIL("Expected TranslationFailed");
  } catch (const mirror_error::MirrorError &ex) {
    REQUIRE(ex.GetKind() == mirror_error::ErrorKind::TranslationFailed);
  }
}

TEST_CASE("DELETE and transaction control statements", "[sql_generator]") {
  const table_def target{"db", "main", "t"};
  const auto del = make_delete_all_statement(target);
  REQUIRE(del.kind == StatementKind::DeleteAllRows);
  REQUIRE(del.sql == R"(DELETE FROM "db"."main"."t")");

  REQUIRE(make_transaction_statement(StatementKind::BeginTransaction).sql ==
          "BEGIN TRANSACTION");
  REQUIRE(make_transaction_statement(StatementKind::Commit).sql == "COMMIT");
  REQUIRE(make_transaction_statement(StatementKind::Rollback).sql ==
          "ROLLBACK");
  REQUIRE_THROWS_AS(make_transaction_statement(StatementKind::CreateTable),
                    std::invalid_argument);
}

TEST_CASE("Catalog queries against an in-memory database", "[sql_generator]") {
  duckdb::DuckDB db(nullptr);
  duckdb::Connection con(db);
  auto logger = mirlog::Logger::CreateStdoutLogger();
  MirrorSqlGenerator generator(logger);

  REQUIRE_FALSE(con.Query("CREATE SCHEMA sales")->HasError());
  REQUIRE_FALSE(con.Query("CREATE TABLE sales.orders (id INTEGER, note "
                          "VARCHAR(50), amount DECIMAL(18,2))")
                    ->HasError());
  REQUIRE_FALSE(con.Query("CREATE TABLE main.customers (id INTEGER)")
                    ->HasError());
  REQUIRE_FALSE(
      con.Query("CREATE VIEW main.customer_view AS SELECT * FROM customers")
          ->HasError());

  const auto tables = generator.list_base_tables(con, "memory");
  REQUIRE(tables.size() == 2);
  REQUIRE(tables[0].schema_name == "main");
  REQUIRE(tables[0].table_name == "customers");
  REQUIRE(tables[1].schema_name == "sales");
  REQUIRE(tables[1].table_name == "orders");

  REQUIRE(generator.table_exists(con, {"memory", "sales", "orders"}));
  REQUIRE_FALSE(generator.table_exists(con, {"memory", "sales", "missing"}));
  REQUIRE_FALSE(generator.table_exists(con, {"memory", "main", "customer_view"}));

  const auto columns =
      generator.describe_table(con, {"memory", "sales", "orders"});
  REQUIRE(columns.size() == 3);
  REQUIRE(columns[0].name == "id");
  REQUIRE(columns[0].type_name == "INTEGER");
  REQUIRE(columns[1].name == "note");
  REQUIRE(columns[1].type_name == "VARCHAR");
  REQUIRE_FALSE(columns[1].max_length.has_value());
  REQUIRE(columns[2].name == "amount");
  REQUIRE(columns[2].type_name == "DECIMAL");
  REQUIRE(columns[2].precision == 18);
  REQUIRE(columns[2].scale == 2);
}
