#include "internal/catalog/schema_matcher.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"

namespace bibmirror::catalog {

SchemaMatcher::SchemaMatcher(const TableCatalog& catalog) : catalog_(catalog) {
}

std::optional<bibmirror::model::Family> SchemaMatcher::Match(const ParsedTableDefinition& parsed) const {
  const auto* expected = catalog_.FindByTableName(parsed.table_name);
  if (!expected) {
    BIBMIRROR_LOG_DEBUG("unknown table", {observability::StringField("table", parsed.table_name)});
    return std::nullopt;
  }

  if (parsed.columns.size() != expected->columns.size()) {
    BIBMIRROR_LOG_DEBUG("column count mismatch",
                        {observability::StringField("table", parsed.table_name),
                         observability::UintField("expected", expected->columns.size()),
                         observability::UintField("found", parsed.columns.size())});
    return std::nullopt;
  }

  // equal sizes plus every parsed column matching a distinct expected one
  std::vector<bool> seen(expected->columns.size(), false);
  for (const auto& column : parsed.columns) {
    auto it = std::find_if(expected->columns.begin(), expected->columns.end(),
                           [&](const ColumnDefinition& c) { return EqualsIgnoreCase(c.name, column.name); });
    if (it == expected->columns.end()) {
      BIBMIRROR_LOG_DEBUG("unexpected column", {observability::StringField("column", column.name)});
      return std::nullopt;
    }

    const auto index = static_cast<size_t>(it - expected->columns.begin());
    if (seen[index] || it->type != column.type) {
      BIBMIRROR_LOG_DEBUG("column type mismatch",
                          {observability::StringField("column", column.name),
                           observability::StringField("expected", ToString(it->type)),
                           observability::StringField("found", ToString(column.type))});
      return std::nullopt;
    }
    seen[index] = true;
  }

  return expected->family;
}

} // namespace bibmirror::catalog
