#pragma once

#include "duckdb.hpp"

#include <deque>
#include <string>
#include <utility>

namespace mirlog {

/// Writes one JSON object per line to stdout. A DuckDB connection can be
/// attached later on; from then on every message is also written to the
/// DuckDB log of that connection. Messages logged before that are buffered.
class Logger {
public:
  static Logger CreateStdoutLogger();
  static Logger CreateMultiSinkLogger(duckdb::Connection *connection_);

  void log(const std::string &level, const std::string &message);

  void info(const std::string &message);
  void warning(const std::string &message);
  void severe(const std::string &message);

  /// Attaches (or with nullptr detaches) the DuckDB sink. The logger must not
  /// outlive an attached connection.
  void set_connection(duckdb::Connection *connection_);

private:
  static constexpr std::size_t MAX_BUFFERED_MESSAGES = 64;

  explicit Logger(bool duckdb_sink_enabled_, duckdb::Connection *connection_);

  void log_to_stdout(const std::string &level, const std::string &message);
  void log_to_duckdb(const std::string &level, const std::string &message);
  void flush_buffer();

  bool duckdb_sink_enabled;
  duckdb::Connection *connection;
  std::deque<std::pair<std::string, std::string>> buffered_messages;
};

} // namespace mirlog
