#pragma once

#include "duckdb.hpp"
#include "mirror_logging.hpp"
#include "run_configuration.hpp"

#include <memory>
#include <string>

/// Used to create DuckDB connections to the remote endpoint of one run. The
/// duckdb::DuckDB instance is created on the first successful call to
/// CreateConnection and reused afterwards; a failed attempt is retried on the
/// next call.
///
/// Addresses starting with "md:" are MotherDuck databases. The password is
/// used as MotherDuck token; without credentials the ambient token of the
/// process (motherduck_token) applies. Any other address is a directory
/// holding "<database>.duckdb".
class ConnectionFactory {
public:
  explicit ConnectionFactory(RemoteSettings settings_, mirlog::Logger &logger_)
      : settings(std::move(settings_)), logger(logger_) {}

  /// Throws MirrorError(RemoteUnreachable) when the endpoint cannot be opened.
  duckdb::Connection CreateConnection();

private:
  duckdb::DuckDB &get_duckdb();
  std::string database_path() const;

  RemoteSettings settings;
  mirlog::Logger &logger;
  std::unique_ptr<duckdb::DuckDB> db;
};
