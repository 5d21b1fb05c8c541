#pragma once

#include <optional>

#include "internal/catalog/table_catalog.hpp"

namespace bibmirror::catalog {

/*
  Resolves a parsed dump table definition to a record family.

  Matching is exact: the table name must be registered and the parsed
  columns must be the expected set, compared by case-insensitive name and
  normalized type. Anything else is unknown (nullopt); a segment is never
  accepted on a partial match.
*/
class SchemaMatcher {
 public:
  explicit SchemaMatcher(const TableCatalog& catalog = TableCatalog::Default());

  std::optional<bibmirror::model::Family> Match(const ParsedTableDefinition& parsed) const;

 private:
  const TableCatalog& catalog_;
};

} // namespace bibmirror::catalog
