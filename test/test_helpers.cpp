#include "test_helpers.hpp"

#include "constants.hpp"

#include <algorithm>
#include <filesystem>
#include <stdexcept>

using mirror_error::ErrorKind;
using mirror_error::MirrorError;

namespace test_helpers {

VectorRowStream::VectorRowStream(duckdb::vector<duckdb::LogicalType> types_,
                                 std::vector<Row> rows_,
                                 const std::size_t chunk_size_)
    : types(std::move(types_)), rows(std::move(rows_)),
      chunk_size(chunk_size_) {}

duckdb::unique_ptr<duckdb::DataChunk> VectorRowStream::next_chunk() {
  if (position >= rows.size()) {
    return nullptr;
  }
  const auto count = std::min(chunk_size, rows.size() - position);
  auto chunk = duckdb::make_uniq<duckdb::DataChunk>();
  chunk->Initialize(duckdb::Allocator::DefaultAllocator(), types);
  for (std::size_t r = 0; r < count; r++) {
    const auto &row = rows[position + r];
    for (std::size_t c = 0; c < row.size(); c++) {
      chunk->SetValue(c, r, row[c]);
    }
  }
  chunk->SetCardinality(count);
  position += count;
  return chunk;
}

void FakeSource::backup(const std::string &database_name,
                        const std::string &destination_path) {
  calls.push_back("backup:" + database_name);
  if (fail_backup) {
    throw MirrorError(ErrorKind::BackupFailed, "disk full");
  }
  backups.push_back(destination_path);
}

std::vector<TableRef>
FakeSource::list_base_tables(const std::string &database_name) {
  calls.push_back("list_tables:" + database_name);
  if (fail_enumeration) {
    throw std::runtime_error("catalog unreachable");
  }
  std::vector<TableRef> result;
  for (const auto &table : tables) {
    result.push_back(table.ref);
  }
  return result;
}

const FakeSourceTable &FakeSource::find(const TableRef &table) const {
  for (const auto &candidate : tables) {
    if (candidate.ref.schema_name == table.schema_name &&
        candidate.ref.table_name == table.table_name) {
      return candidate;
    }
  }
  throw std::runtime_error("No such fake table " + table.qualified_name());
}

std::vector<column_info> FakeSource::list_columns(const TableRef &table) {
  calls.push_back("list_columns:" + table.qualified_name());
  return find(table).columns;
}

std::unique_ptr<RowStream> FakeSource::open_rows(const TableRef &table) {
  calls.push_back("open_rows:" + table.qualified_name());
  const auto &source_table = find(table);
  return std::make_unique<VectorRowStream>(source_table.types,
                                           source_table.rows, chunk_size);
}

FakeSourceTable &FakeSource::add_table(const std::string &schema,
                                       const std::string &table,
                                       std::vector<column_info> columns,
                                       duckdb::vector<duckdb::LogicalType> types,
                                       std::vector<Row> rows) {
  tables.push_back(FakeSourceTable{TableRef{schema, table}, std::move(columns),
                                   std::move(types), std::move(rows)});
  return tables.back();
}

void FakeRemote::check_reachable(const table_def &table) const {
  if (unreachable_tables.count(table.table_name) > 0) {
    throw MirrorError(ErrorKind::RemoteUnreachable,
                      "Connection refused for " + table.table_name);
  }
}

bool FakeRemote::table_exists(const table_def &table) {
  calls.push_back("exists:" + table.table_name);
  check_reachable(table);
  return tables.count(table.table_name) > 0;
}

void FakeRemote::execute(const remote_statement &statement) {
  const auto &name = statement.target.table_name;
  switch (statement.kind) {
  case StatementKind::CreateTable:
    calls.push_back("create:" + name);
    check_reachable(statement.target);
    if (tables.count(name) > 0) {
      throw MirrorError(ErrorKind::RemoteDDLFailed,
                        "Table " + name + " already exists");
    }
    if (failing_creates.count(name) > 0) {
      throw MirrorError(ErrorKind::RemoteDDLFailed,
                        "Permission denied to create " + name);
    }
    tables[name].create_sql = statement.sql;
    break;
  case StatementKind::DeleteAllRows:
    calls.push_back("delete:" + name);
    check_reachable(statement.target);
    tables.at(name).rows.clear();
    rows_after_clear[name] = tables.at(name).rows.size();
    break;
  case StatementKind::BeginTransaction:
    calls.push_back("begin");
    snapshot = tables;
    break;
  case StatementKind::Commit:
    calls.push_back("commit");
    snapshot.reset();
    break;
  case StatementKind::Rollback:
    calls.push_back("rollback");
    if (snapshot.has_value()) {
      tables = snapshot.value();
      snapshot.reset();
    }
    break;
  }
}

std::uint64_t FakeRemote::bulk_insert(const table_def &table,
                                      RowStream &rows) {
  calls.push_back("insert:" + table.table_name);
  check_reachable(table);
  auto &target = tables.at(table.table_name);
  std::uint64_t count = 0;
  while (auto chunk = rows.next_chunk()) {
    for (duckdb::idx_t r = 0; r < chunk->size(); r++) {
      Row row;
      for (duckdb::idx_t c = 0; c < chunk->ColumnCount(); c++) {
        row.push_back(chunk->GetValue(c, r));
      }
      target.rows.push_back(row);
      count++;
    }
    if (on_chunk) {
      on_chunk();
    }
    if (failing_inserts.count(table.table_name) > 0) {
      throw MirrorError(ErrorKind::RemoteCopyFailed,
                        "Constraint violation in " + table.table_name);
    }
  }
  return count;
}

std::string scratch_dir(const std::string &name) {
  const auto path = std::filesystem::path(test::constants::SCRATCH_ROOT) / name;
  std::filesystem::remove_all(path);
  std::filesystem::create_directories(path);
  return path.string();
}

} // namespace test_helpers
