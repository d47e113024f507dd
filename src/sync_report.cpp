#include "sync_report.hpp"

#include <algorithm>
#include <sstream>
#include <string>

namespace {
std::string quote_json(const std::string &str) {
  std::ostringstream out;
  out << '"';
  for (const char c : str) {
    switch (c) {
    case '"':
      out << "\\\"";
      break;
    case '\\':
      out << "\\\\";
      break;
    case '\n':
      out << "\\n";
      break;
    case '\r':
      out << "\\r";
      break;
    case '\t':
      out << "\\t";
      break;
    default:
      out << c;
    }
  }
  out << '"';
  return out.str();
}
} // namespace

const char *to_string(const TableStatus status) {
  switch (status) {
  case TableStatus::Succeeded:
    return "succeeded";
  case TableStatus::Failed:
    return "failed";
  case TableStatus::Skipped:
    return "skipped";
  }
  return "unknown";
}

bool SyncReport::all_succeeded() const {
  return std::all_of(tables.begin(), tables.end(), [](const TableOutcome &t) {
    return t.status == TableStatus::Succeeded;
  });
}

std::size_t SyncReport::count(const TableStatus status) const {
  return std::count_if(
      tables.begin(), tables.end(),
      [status](const TableOutcome &t) { return t.status == status; });
}

std::string SyncReport::to_json() const {
  std::ostringstream out;
  out << "{\"backup_file\":" << quote_json(backup.full_path)
      << ",\"succeeded\":" << count(TableStatus::Succeeded)
      << ",\"failed\":" << count(TableStatus::Failed)
      << ",\"skipped\":" << count(TableStatus::Skipped) << ",\"tables\":[";
  bool first = true;
  for (const auto &table : tables) {
    if (first) {
      first = false;
    } else {
      out << ",";
    }
    out << "{\"source\":" << quote_json(table.source.qualified_name())
        << ",\"target\":" << quote_json(table.target_table)
        << ",\"status\":" << quote_json(to_string(table.status));
    if (table.error_kind.has_value()) {
      out << ",\"error\":"
          << quote_json(mirror_error::to_string(table.error_kind.value()));
    }
    if (!table.message.empty()) {
      out << ",\"message\":" << quote_json(table.message);
    }
    out << ",\"rows\":" << table.rows_copied
        << ",\"created\":" << (table.created ? "true" : "false") << "}";
  }
  out << "]}";
  return out.str();
}
