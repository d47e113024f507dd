#include "duckdb_source.hpp"

#include "backup_naming.hpp"
#include "mirror_error.hpp"

#include <filesystem>
#include <stdexcept>
#include <string>
#include <system_error>

using mirror_error::ErrorKind;
using mirror_error::MirrorError;

namespace {
constexpr const char *BACKUP_ALIAS = "__dbmirror_backup";
constexpr const char *WAL_SUFFIX = ".wal";

void remove_if_exists(const std::string &path) {
  std::error_code ec;
  std::filesystem::remove(path, ec);
  if (ec) {
    throw std::runtime_error("Could not remove \"" + path +
                             "\": " + ec.message());
  }
}

class DuckDbRowStream final : public RowStream {
public:
  DuckDbRowStream(duckdb::unique_ptr<duckdb::QueryResult> result_,
                  std::string table_name_)
      : result(std::move(result_)), table_name(std::move(table_name_)) {}

  duckdb::unique_ptr<duckdb::DataChunk> next_chunk() override {
    duckdb::unique_ptr<duckdb::DataChunk> chunk;
    try {
      chunk = result->Fetch();
    } catch (const std::exception &ex) {
      const duckdb::ErrorData error(ex);
      throw MirrorError(ErrorKind::RemoteCopyFailed,
                        "Could not read rows of source table <" + table_name +
                            ">: " + error.Message());
    }
    if (result->HasError()) {
      throw MirrorError(ErrorKind::RemoteCopyFailed,
                        "Could not read rows of source table <" + table_name +
                            ">: " + result->GetError());
    }
    if (chunk && chunk->size() == 0) {
      return nullptr;
    }
    return chunk;
  }

private:
  duckdb::unique_ptr<duckdb::QueryResult> result;
  std::string table_name;
};
} // namespace

DuckDbSource::DuckDbSource(const std::string &database_name_,
                           const std::string &database_path,
                           mirlog::Logger &logger_)
    : database_name(database_name_), logger(logger_), db(nullptr), con(db),
      sql_generator(logger_) {
  if (!std::filesystem::exists(database_path)) {
    throw MirrorError(ErrorKind::BackupFailed,
                      "Source database file \"" + database_path +
                          "\" does not exist");
  }
  try {
    source = std::make_unique<AttachedDatabase>(con, logger, database_path,
                                                database_name, true);
  } catch (const std::exception &ex) {
    throw MirrorError(ErrorKind::BackupFailed,
                      "Could not open source database <" + database_name +
                          ">: " + ex.what());
  }
}

DuckDbSource::~DuckDbSource() = default;

table_def DuckDbSource::to_table_def(const TableRef &table) const {
  return table_def{database_name, table.schema_name, table.table_name};
}

void DuckDbSource::backup(const std::string &database_name_,
                          const std::string &destination_path) {
  if (database_name_ != database_name) {
    throw MirrorError(ErrorKind::BackupFailed,
                      "Database <" + database_name_ +
                          "> is not the attached source database <" +
                          database_name + ">");
  }

  // The backup is written under a staging name and renamed over the
  // destination once complete, so the destination never holds a partial file
  const std::string staging_path =
      backup_naming::make_staging_path(destination_path);
  try {
    remove_if_exists(staging_path);
    remove_if_exists(staging_path + WAL_SUFFIX);
    {
      AttachedDatabase target(con, logger, staging_path, BACKUP_ALIAS, false);
      sql_generator.copy_database(con, database_name, target.alias);
      // DETACH checkpoints too but only logs a failure; the rows would then
      // stay behind in the WAL of the staging file
      sql_generator.run_query(
          con, "backup",
          "CHECKPOINT " + duckdb::KeywordHelper::WriteQuoted(target.alias, '"'),
          "Could not write backup \"" + staging_path + "\"");
      target.detach();
    }
    if (std::filesystem::exists(staging_path + WAL_SUFFIX)) {
      throw std::runtime_error("Backup \"" + staging_path +
                               "\" was not checkpointed completely");
    }
    // A stale WAL next to the destination would be replayed on top of the
    // new backup when it is opened
    remove_if_exists(destination_path + WAL_SUFFIX);
    std::filesystem::rename(staging_path, destination_path);
  } catch (const std::exception &ex) {
    std::error_code ec;
    std::filesystem::remove(staging_path, ec);
    std::filesystem::remove(staging_path + WAL_SUFFIX, ec);
    throw MirrorError(ErrorKind::BackupFailed,
                      "Backup of database <" + database_name + "> to \"" +
                          destination_path + "\" failed: " + ex.what());
  }
  logger.info("backup: wrote " + destination_path);
}

std::vector<TableRef>
DuckDbSource::list_base_tables(const std::string &database_name_) {
  try {
    return sql_generator.list_base_tables(con, database_name_);
  } catch (const std::exception &ex) {
    throw MirrorError(ErrorKind::EnumerationFailed, ex.what());
  }
}

std::vector<column_info> DuckDbSource::list_columns(const TableRef &table) {
  try {
    return sql_generator.describe_table(con, to_table_def(table));
  } catch (const std::exception &ex) {
    throw MirrorError(ErrorKind::TranslationFailed, ex.what());
  }
}

std::unique_ptr<RowStream> DuckDbSource::open_rows(const TableRef &table) {
  const auto absolute_table_name = to_table_def(table).to_escaped_string();
  const std::string query = "SELECT * FROM " + absolute_table_name;
  logger.info("open_rows: " + query);
  auto result = con.SendQuery(query);
  if (result->HasError()) {
    throw MirrorError(ErrorKind::RemoteCopyFailed,
                      "Could not read source table <" + absolute_table_name +
                          ">: " + result->GetError());
  }
  return std::make_unique<DuckDbRowStream>(std::move(result),
                                           absolute_table_name);
}
