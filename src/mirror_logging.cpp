#include "mirror_logging.hpp"

#include "config.hpp"

#include <cstdlib>
#include <iostream>
#include <string>

namespace mirlog {

namespace {
std::string escape_json(const std::string &str) {
  std::string result;
  result.reserve(str.size());
  for (const char c : str) {
    switch (c) {
    case '"':
      result += "\\\"";
      break;
    case '\\':
      result += "\\\\";
      break;
    case '\n':
      result += "\\n";
      break;
    case '\t':
      result += "\\t";
      break;
    default:
      result += c;
    }
  }
  return result;
}

std::string escape_single_quote(const std::string &str) {
  std::string result = str;
  size_t start_pos = 0;
  while ((start_pos = result.find('\'', start_pos)) != std::string::npos) {
    result.replace(start_pos, 1, "''");
    start_pos += 2;
  }
  return result;
}
} // namespace

Logger::Logger(const bool duckdb_sink_enabled_,
               duckdb::Connection *connection_)
    : duckdb_sink_enabled(duckdb_sink_enabled_), connection(connection_) {}

Logger Logger::CreateStdoutLogger() { return Logger(false, nullptr); }

Logger Logger::CreateMultiSinkLogger(duckdb::Connection *connection_) {
  const bool disabled =
      std::getenv(config::ENV_DISABLE_DUCKDB_LOGGING) != nullptr;
  return Logger(!disabled, connection_);
}

void Logger::log_to_stdout(const std::string &level,
                           const std::string &message) {
  std::cout << "{\"level\":\"" << escape_json(level) << "\","
            << "\"message\":\"" << escape_json(message) << "\","
            << "\"message-origin\":\"dbmirror\"}" << std::endl;
}

void Logger::log_to_duckdb(const std::string &level,
                           const std::string &message) {
  if (connection == nullptr) {
    return;
  }
  const std::string query = "SELECT write_log('" + escape_single_quote(message) +
                            "', log_type:='dbmirror', level:='" +
                            escape_single_quote(level) + "')";
  // Logging must never fail the run; an aborted transaction on the connection
  // makes this query fail, which is fine
  const auto result = connection->Query(query);
  if (result->HasError()) {
    log_to_stdout("WARNING", "Could not forward log message to DuckDB: " +
                                 result->GetError());
  }
}

void Logger::flush_buffer() {
  for (const auto &entry : buffered_messages) {
    log_to_duckdb(entry.first, entry.second);
  }
  buffered_messages.clear();
}

void Logger::log(const std::string &level, const std::string &message) {
  log_to_stdout(level, message);

  if (!duckdb_sink_enabled) {
    return;
  }
  if (connection != nullptr) {
    log_to_duckdb(level, message);
  } else {
    buffered_messages.emplace_back(level, message);
    if (buffered_messages.size() > MAX_BUFFERED_MESSAGES) {
      buffered_messages.pop_front();
    }
  }
}

void Logger::info(const std::string &message) { log("INFO", message); }

void Logger::warning(const std::string &message) { log("WARNING", message); }

void Logger::severe(const std::string &message) { log("SEVERE", message); }

void Logger::set_connection(duckdb::Connection *connection_) {
  connection = connection_;
  if (connection != nullptr && duckdb_sink_enabled) {
    flush_buffer();
  }
}

} // namespace mirlog
