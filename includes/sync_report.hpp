#pragma once

#include "backup_naming.hpp"
#include "mirror_error.hpp"
#include "schema_types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

enum class TableStatus { Succeeded, Failed, Skipped };

const char *to_string(TableStatus status);

struct TableOutcome {
  TableRef source;
  std::string target_table;
  TableStatus status = TableStatus::Skipped;
  std::optional<mirror_error::ErrorKind> error_kind;
  std::string message;
  std::uint64_t rows_copied = 0;
  // The remote table did not exist and was created by this run
  bool created = false;
};

/// Outcome of one run: where the backup went and what happened per table.
struct SyncReport {
  BackupDescriptor backup;
  std::vector<TableOutcome> tables;

  [[nodiscard]] bool all_succeeded() const;
  [[nodiscard]] std::size_t count(TableStatus status) const;

  /// The report as a single JSON object
  [[nodiscard]] std::string to_json() const;
};
