#pragma once

#include "schema_types.hpp"

#include <string>
#include <utility>
#include <vector>

namespace type_mapping {

enum class RenderRule {
  // type
  Bare,
  // type(N) or type(MAX)
  Length,
  // type(precision,scale)
  PrecisionScale
};

/// The fixed mapping from canonical (lower case) type name to render rule.
/// Type names not listed here render bare.
const std::vector<std::pair<std::string, RenderRule>> &rules();

RenderRule find_rule(const std::string &type_name);

/// Renders the type expression of a column for a CREATE TABLE statement.
/// Throws MirrorError(TranslationFailed) for type names that are not safe to
/// splice into a statement.
std::string render_column_type(const column_info &column);

} // namespace type_mapping
