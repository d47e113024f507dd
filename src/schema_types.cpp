#include "schema_types.hpp"
#include "duckdb.hpp"

#include <algorithm>
#include <sstream>
#include <string>

std::string table_def::to_escaped_string() const {
  std::ostringstream out;
  out << duckdb::KeywordHelper::WriteQuoted(db_name, '"') << "."
      << duckdb::KeywordHelper::WriteQuoted(schema_name, '"') << "."
      << duckdb::KeywordHelper::WriteQuoted(table_name, '"');
  return out.str();
}

std::string TableRef::qualified_name() const {
  return schema_name + "." + table_name;
}

std::string derive_target_table_name(const TableRef &source,
                                     const std::string &name_suffix) {
  std::string target = source.qualified_name();
  std::replace(target.begin(), target.end(), '.', '_');
  return target + "_" + name_suffix;
}
