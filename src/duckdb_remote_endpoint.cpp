#include "duckdb_remote_endpoint.hpp"

#include "mirror_error.hpp"

#include <exception>
#include <string>

using mirror_error::ErrorKind;
using mirror_error::MirrorError;

namespace {
bool is_connection_error(const duckdb::ExceptionType type) {
  return type == duckdb::ExceptionType::CONNECTION ||
         type == duckdb::ExceptionType::IO ||
         type == duckdb::ExceptionType::HTTP;
}

ErrorKind kind_for_statement(const StatementKind kind) {
  return kind == StatementKind::CreateTable ? ErrorKind::RemoteDDLFailed
                                            : ErrorKind::RemoteCopyFailed;
}
} // namespace

DuckDbRemoteEndpoint::DuckDbRemoteEndpoint(
    ConnectionFactory &connection_factory_, mirlog::Logger &logger_,
    const bool forward_logs_)
    : connection_factory(connection_factory_), logger(logger_),
      forward_logs(forward_logs_), sql_generator(logger_) {}

DuckDbRemoteEndpoint::~DuckDbRemoteEndpoint() {
  if (con && forward_logs) {
    // The logger outlives this endpoint and must not keep the connection
    logger.set_connection(nullptr);
  }
}

duckdb::Connection &DuckDbRemoteEndpoint::connection() {
  if (!con) {
    con = std::make_unique<duckdb::Connection>(
        connection_factory.CreateConnection());
    if (forward_logs) {
      logger.set_connection(con.get());
    }
  }
  return *con;
}

bool DuckDbRemoteEndpoint::table_exists(const table_def &table) {
  auto &remote = connection();
  try {
    return sql_generator.table_exists(remote, table);
  } catch (const std::exception &ex) {
    throw MirrorError(ErrorKind::RemoteUnreachable, ex.what());
  }
}

void DuckDbRemoteEndpoint::execute(const remote_statement &statement) {
  auto &remote = connection();
  logger.info("execute: " + statement.sql);
  const auto result = remote.Query(statement.sql);
  if (!result->HasError()) {
    return;
  }

  const auto kind = is_connection_error(result->GetErrorType())
                        ? ErrorKind::RemoteUnreachable
                        : kind_for_statement(statement.kind);
  std::string message = "Statement failed";
  if (!statement.target.table_name.empty()) {
    message += " for table <" + statement.target.to_escaped_string() + ">";
  }
  throw MirrorError(kind, message + ": " + result->GetError());
}

std::uint64_t DuckDbRemoteEndpoint::bulk_insert(const table_def &table,
                                                RowStream &rows) {
  auto &remote = connection();
  const auto absolute_table_name = table.to_escaped_string();
  logger.info("bulk_insert: appending to " + absolute_table_name);

  std::uint64_t row_count = 0;
  try {
    duckdb::Appender appender(remote, table.db_name, table.schema_name,
                              table.table_name);
    while (auto chunk = rows.next_chunk()) {
      appender.AppendDataChunk(*chunk);
      row_count += chunk->size();
    }
    appender.Close();
  } catch (const MirrorError &) {
    // Cancellation or a failing source read, already classified
    throw;
  } catch (const std::exception &ex) {
    const duckdb::ErrorData error(ex);
    const auto kind = is_connection_error(error.Type())
                          ? ErrorKind::RemoteUnreachable
                          : ErrorKind::RemoteCopyFailed;
    throw MirrorError(kind, "Could not copy rows into <" + absolute_table_name +
                                ">: " + error.Message());
  }

  logger.info("bulk_insert: appended " + std::to_string(row_count) +
              " rows to " + absolute_table_name);
  return row_count;
}
