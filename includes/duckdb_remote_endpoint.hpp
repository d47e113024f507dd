#pragma once

#include "connection_factory.hpp"
#include "duckdb.hpp"
#include "endpoints.hpp"
#include "mirror_logging.hpp"
#include "sql_generator.hpp"

#include <cstdint>
#include <memory>

/// RemoteEndpoint on a DuckDB or MotherDuck database. Connects lazily, so a
/// remote that is down fails the tables that need it, one by one, with
/// RemoteUnreachable; the next table tries to connect again.
class DuckDbRemoteEndpoint final : public RemoteEndpoint {
public:
  DuckDbRemoteEndpoint(ConnectionFactory &connection_factory_,
                       mirlog::Logger &logger_, bool forward_logs_);
  ~DuckDbRemoteEndpoint() override;

  bool table_exists(const table_def &table) override;

  void execute(const remote_statement &statement) override;

  std::uint64_t bulk_insert(const table_def &table, RowStream &rows) override;

private:
  duckdb::Connection &connection();

  ConnectionFactory &connection_factory;
  mirlog::Logger &logger;
  // Forward log lines into the DuckDB log of the remote connection
  bool forward_logs;
  MirrorSqlGenerator sql_generator;
  std::unique_ptr<duckdb::Connection> con;
};
