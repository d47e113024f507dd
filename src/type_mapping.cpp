#include "type_mapping.hpp"

#include "mirror_error.hpp"

#include <algorithm>
#include <cctype>
#include <string>

namespace type_mapping {

namespace {
std::string to_lower(const std::string &str) {
  std::string result = str;
  std::transform(result.begin(), result.end(), result.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return result;
}

void check_type_name(const column_info &column) {
  const auto &name = column.type_name;
  if (name.empty()) {
    throw mirror_error::MirrorError(mirror_error::ErrorKind::TranslationFailed,
                                    "Column <" + column.name +
                                        "> has no type name");
  }
  if (name.find(';') != std::string::npos ||
      name.find("--") != std::string::npos ||
      name.find("/*") != std::string::npos) {
    throw mirror_error::MirrorError(
        mirror_error::ErrorKind::TranslationFailed,
        "Cannot map type <" + name + "> of column <" + column.name + ">");
  }
}
} // namespace

const std::vector<std::pair<std::string, RenderRule>> &rules() {
  static const std::vector<std::pair<std::string, RenderRule>> mapping = {
      {"char", RenderRule::Length},
      {"varchar", RenderRule::Length},
      {"nchar", RenderRule::Length},
      {"nvarchar", RenderRule::Length},
      {"binary", RenderRule::Length},
      {"varbinary", RenderRule::Length},
      {"decimal", RenderRule::PrecisionScale},
      {"numeric", RenderRule::PrecisionScale},
  };
  return mapping;
}

RenderRule find_rule(const std::string &type_name) {
  const auto lower = to_lower(type_name);
  for (const auto &entry : rules()) {
    if (entry.first == lower) {
      return entry.second;
    }
  }
  return RenderRule::Bare;
}

std::string render_column_type(const column_info &column) {
  check_type_name(column);

  switch (find_rule(column.type_name)) {
  case RenderRule::Length:
    if (!column.max_length.has_value()) {
      return column.type_name;
    }
    if (column.max_length.value() == UNBOUNDED_LENGTH) {
      return column.type_name + "(MAX)";
    }
    return column.type_name + "(" + std::to_string(column.max_length.value()) +
           ")";
  case RenderRule::PrecisionScale:
    return column.type_name + "(" + std::to_string(column.precision) + "," +
           std::to_string(column.scale) + ")";
  case RenderRule::Bare:
    break;
  }
  return column.type_name;
}

} // namespace type_mapping
