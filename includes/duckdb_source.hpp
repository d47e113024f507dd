#pragma once

#include "attached_database.hpp"
#include "duckdb.hpp"
#include "endpoints.hpp"
#include "mirror_logging.hpp"
#include "sql_generator.hpp"

#include <memory>
#include <string>
#include <vector>

/// The local engine: a DuckDB database file attached read-only under the
/// source database name, inside a private in-memory DuckDB instance.
///
/// Failures are reported as MirrorError: BackupFailed when the database
/// cannot be opened or backed up, EnumerationFailed for the table list,
/// TranslationFailed for column metadata and RemoteCopyFailed when reading
/// rows fails.
class DuckDbSource final : public BackupSink, public SourceCatalog {
public:
  DuckDbSource(const std::string &database_name_,
               const std::string &database_path, mirlog::Logger &logger_);
  ~DuckDbSource() override;

  void backup(const std::string &database_name_,
              const std::string &destination_path) override;

  std::vector<TableRef>
  list_base_tables(const std::string &database_name_) override;

  std::vector<column_info> list_columns(const TableRef &table) override;

  std::unique_ptr<RowStream> open_rows(const TableRef &table) override;

private:
  table_def to_table_def(const TableRef &table) const;

  std::string database_name;
  mirlog::Logger &logger;
  duckdb::DuckDB db;
  duckdb::Connection con;
  MirrorSqlGenerator sql_generator;
  std::unique_ptr<AttachedDatabase> source;
};
