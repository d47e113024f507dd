#include "sql_generator.hpp"

#include "mirror_error.hpp"
#include "mirror_logging.hpp"
#include "type_mapping.hpp"

#include <sstream>
#include <stdexcept>
#include <string>

using duckdb::KeywordHelper;

remote_statement
make_create_table_statement(const table_def &target,
                            const std::vector<column_info> &columns) {
  const std::string absolute_table_name = target.to_escaped_string();
  if (columns.empty()) {
    throw mirror_error::MirrorError(
        mirror_error::ErrorKind::TranslationFailed,
        "Cannot create table <" + absolute_table_name +
            ">: source table has no columns");
  }

  std::ostringstream ddl;
  ddl << "CREATE TABLE " << absolute_table_name << " (";
  bool first = true;
  for (const auto &col : columns) {
    if (first) {
      first = false;
    } else {
      ddl << ", ";
    }
    ddl << KeywordHelper::WriteQuoted(col.name, '"') << " "
        << type_mapping::render_column_type(col);
  }
  ddl << ")";

  return remote_statement{StatementKind::CreateTable, target, ddl.str()};
}

remote_statement make_delete_all_statement(const table_def &target) {
  return remote_statement{StatementKind::DeleteAllRows, target,
                          "DELETE FROM " + target.to_escaped_string()};
}

remote_statement make_transaction_statement(const StatementKind kind) {
  switch (kind) {
  case StatementKind::BeginTransaction:
    return remote_statement{kind, {}, "BEGIN TRANSACTION"};
  case StatementKind::Commit:
    return remote_statement{kind, {}, "COMMIT"};
  case StatementKind::Rollback:
    return remote_statement{kind, {}, "ROLLBACK"};
  default:
    throw std::invalid_argument("Not a transaction control statement kind");
  }
}

MirrorSqlGenerator::MirrorSqlGenerator(mirlog::Logger &logger_)
    : logger(logger_) {}

void MirrorSqlGenerator::run_query(duckdb::Connection &con,
                                   const std::string &log_prefix,
                                   const std::string &query,
                                   const std::string &error_message) {
  logger.info(log_prefix + ": " + query);
  auto result = con.Query(query);
  if (result->HasError()) {
    throw std::runtime_error(error_message + ": " + result->GetError());
  }
}

duckdb::unique_ptr<duckdb::MaterializedQueryResult>
MirrorSqlGenerator::run_prepared(duckdb::Connection &con,
                                 const std::string &query,
                                 duckdb::vector<duckdb::Value> &params,
                                 const std::string &error_message) {
  auto statement = con.Prepare(query);
  if (statement->HasError()) {
    throw std::runtime_error(error_message +
                             " (at bind step): " + statement->GetError());
  }
  auto result = statement->Execute(params, false);
  if (result->HasError()) {
    throw std::runtime_error(error_message + ": " + result->GetError());
  }
  return duckdb::unique_ptr_cast<duckdb::QueryResult,
                                 duckdb::MaterializedQueryResult>(
      std::move(result));
}

bool MirrorSqlGenerator::table_exists(duckdb::Connection &con,
                                      const table_def &table) {
  // Views and other objects with the same name do not count; creating the
  // table then fails, which is reported as a DDL failure
  const std::string query =
      "SELECT table_name FROM information_schema.tables WHERE "
      "table_catalog=? AND table_schema=? AND table_name=? AND "
      "table_type='BASE TABLE'";
  duckdb::vector<duckdb::Value> params = {duckdb::Value(table.db_name),
                                          duckdb::Value(table.schema_name),
                                          duckdb::Value(table.table_name)};
  auto result = run_prepared(con, query, params,
                             "Could not find whether table <" +
                                 table.to_escaped_string() + "> exists");
  logger.info("    table_exists for table " + table.to_escaped_string() +
              ": " + std::to_string(result->RowCount()) + " match(es)");
  return result->RowCount() > 0;
}

std::vector<TableRef>
MirrorSqlGenerator::list_base_tables(duckdb::Connection &con,
                                     const std::string &db_name) {
  const std::string query = "SELECT schema_name, table_name "
                            "FROM duckdb_tables() "
                            "WHERE database_name=? "
                            "AND NOT internal "
                            "AND NOT temporary "
                            "ORDER BY schema_name, table_name";
  logger.info("list_base_tables: " + query);
  duckdb::vector<duckdb::Value> params = {duckdb::Value(db_name)};
  auto result = run_prepared(con, query, params,
                             "Could not list tables of database <" + db_name +
                                 ">");

  std::vector<TableRef> tables;
  for (const auto &row : result->Collection().GetRows()) {
    tables.push_back(TableRef{row.GetValue(0).GetValue<duckdb::string>(),
                              row.GetValue(1).GetValue<duckdb::string>()});
  }
  return tables;
}

std::vector<column_info>
MirrorSqlGenerator::describe_table(duckdb::Connection &con,
                                   const table_def &table) {
  const std::string query = "SELECT "
                            "column_name, "
                            "data_type, "
                            "data_type_id, "
                            "character_maximum_length, "
                            "numeric_precision, "
                            "numeric_scale "
                            "FROM duckdb_columns() "
                            "WHERE database_name=? "
                            "AND schema_name=? "
                            "AND table_name=? "
                            "ORDER BY column_index";
  logger.info("describe_table: " + query);
  duckdb::vector<duckdb::Value> params = {duckdb::Value(table.db_name),
                                          duckdb::Value(table.schema_name),
                                          duckdb::Value(table.table_name)};
  auto result =
      run_prepared(con, query, params,
                   "Could not describe table <" + table.to_escaped_string() +
                       ">");

  std::vector<column_info> columns;
  for (const auto &row : result->Collection().GetRows()) {
    const auto type_id = static_cast<duckdb::LogicalTypeId>(
        row.GetValue(2).GetValue<int64_t>());

    column_info col{row.GetValue(0).GetValue<duckdb::string>(),
                    row.GetValue(1).GetValue<duckdb::string>(), std::nullopt,
                    0, 0};
    // data_type carries the modifiers, e.g. DECIMAL(18,3); the render rules
    // want the base name and the modifiers separately
    if (type_id == duckdb::LogicalTypeId::DECIMAL) {
      col.type_name = "DECIMAL";
      col.precision = row.GetValue(4).GetValue<uint32_t>();
      col.scale = row.GetValue(5).GetValue<uint32_t>();
    }
    const auto max_length = row.GetValue(3);
    if (!max_length.IsNull()) {
      col.max_length = max_length.GetValue<int64_t>();
    }
    columns.push_back(col);
  }
  return columns;
}

void MirrorSqlGenerator::copy_database(duckdb::Connection &con,
                                       const std::string &from_db,
                                       const std::string &to_db) {
  run_query(con, "copy_database",
            "COPY FROM DATABASE " + KeywordHelper::WriteQuoted(from_db, '"') +
                " TO " + KeywordHelper::WriteQuoted(to_db, '"'),
            "Could not copy database <" + from_db + "> to <" + to_db + ">");
}
