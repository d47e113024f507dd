#pragma once

#include <cstdint>
#include <optional>
#include <string>

/// Catalog length value meaning "unbounded", e.g. VARCHAR(MAX)
inline constexpr std::int64_t UNBOUNDED_LENGTH = -1;

/// A fully qualified table on either side of the mirror
struct table_def {
  std::string db_name;
  std::string schema_name;
  std::string table_name;

  [[nodiscard]] std::string to_escaped_string() const;
};

/// A base table of the source database
struct TableRef {
  std::string schema_name;
  std::string table_name;

  /// schema + "." + table, unquoted
  [[nodiscard]] std::string qualified_name() const;
};

/// One row of the source catalog for a column
struct column_info {
  std::string name;
  std::string type_name;
  // Declared maximum length, UNBOUNDED_LENGTH for unbounded types; empty when
  // the engine does not record a declared length
  std::optional<std::int64_t> max_length;
  std::uint32_t precision;
  std::uint32_t scale;
};

/// Name of the remote table a source table is mirrored to:
/// "schema.table" with every '.' replaced by '_', followed by "_" + suffix.
std::string derive_target_table_name(const TableRef &source,
                                     const std::string &name_suffix);
