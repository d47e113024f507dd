#pragma once

#include "duckdb.hpp"
#include "schema_types.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

/// Source of the rows of one table, in chunks as the engine produces them.
class RowStream {
public:
  virtual ~RowStream() = default;

  /// Returns the next chunk, or nullptr when the stream is exhausted.
  virtual duckdb::unique_ptr<duckdb::DataChunk> next_chunk() = 0;
};

/// Full database backups on the local engine.
class BackupSink {
public:
  virtual ~BackupSink() = default;

  /// Writes a full backup of the database to the destination, replacing any
  /// file already there. Throws on failure.
  virtual void backup(const std::string &database_name,
                      const std::string &destination_path) = 0;
};

/// Catalog and data access for the local source database.
class SourceCatalog {
public:
  virtual ~SourceCatalog() = default;

  /// All base tables of the database. Views, internal and temporary tables
  /// are not included.
  virtual std::vector<TableRef>
  list_base_tables(const std::string &database_name) = 0;

  /// The columns of a source table in catalog order.
  virtual std::vector<column_info> list_columns(const TableRef &table) = 0;

  virtual std::unique_ptr<RowStream> open_rows(const TableRef &table) = 0;
};

enum class StatementKind {
  CreateTable,
  DeleteAllRows,
  BeginTransaction,
  Commit,
  Rollback
};

/// A statement for the remote endpoint. The kind tells the endpoint how to
/// classify a failure; sql only ever contains quoted identifiers.
struct remote_statement {
  StatementKind kind;
  table_def target;
  std::string sql;
};

/// The remote database that receives the mirrored tables.
class RemoteEndpoint {
public:
  virtual ~RemoteEndpoint() = default;

  virtual bool table_exists(const table_def &table) = 0;

  virtual void execute(const remote_statement &statement) = 0;

  /// Appends all rows of the stream to the table, returns the row count.
  virtual std::uint64_t bulk_insert(const table_def &table,
                                    RowStream &rows) = 0;
};
