#pragma once

#include "duckdb.hpp"
#include "endpoints.hpp"
#include "mirror_logging.hpp"
#include "schema_types.hpp"

#include <string>
#include <vector>

/// CREATE TABLE for the target of a mirrored table. Columns keep the order
/// given. Throws MirrorError(TranslationFailed) for an empty column list.
remote_statement
make_create_table_statement(const table_def &target,
                            const std::vector<column_info> &columns);

remote_statement make_delete_all_statement(const table_def &target);

/// BEGIN TRANSACTION, COMMIT or ROLLBACK
remote_statement make_transaction_statement(StatementKind kind);

class MirrorSqlGenerator {

public:
  explicit MirrorSqlGenerator(mirlog::Logger &logger_);

  bool table_exists(duckdb::Connection &con, const table_def &table);

  std::vector<TableRef> list_base_tables(duckdb::Connection &con,
                                         const std::string &db_name);

  std::vector<column_info> describe_table(duckdb::Connection &con,
                                          const table_def &table);

  /// Copies schema and data of one attached database into another one.
  void copy_database(duckdb::Connection &con, const std::string &from_db,
                     const std::string &to_db);

  void run_query(duckdb::Connection &con, const std::string &log_prefix,
                 const std::string &query, const std::string &error_message);

private:
  mirlog::Logger &logger;

  duckdb::unique_ptr<duckdb::MaterializedQueryResult>
  run_prepared(duckdb::Connection &con, const std::string &query,
               duckdb::vector<duckdb::Value> &params,
               const std::string &error_message);
};
