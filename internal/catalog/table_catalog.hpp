#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/family.hpp"

namespace bibmirror::catalog {

/*
  Column types as declared by MySQL dumps, with display widths and
  modifiers stripped ("int(11) unsigned" -> kInt).
*/
enum class ColumnType : std::uint8_t {
  kTinyInt,
  kSmallInt,
  kMediumInt,
  kInt,
  kBigInt,
  kDecimal,
  kFloat,
  kDouble,
  kChar,
  kVarChar,
  kText,
  kBlob,
  kDate,
  kDateTime,
  kTimestamp,
  kOther,
};

ColumnType ParseColumnType(std::string_view declared);
std::string_view ToString(ColumnType type);

struct ColumnDefinition {
  std::string name;
  ColumnType  type = ColumnType::kOther;
};

// Table definition as read from one dump segment.
struct ParsedTableDefinition {
  std::string                   table_name;
  std::vector<ColumnDefinition> columns;
};

// Expected upstream table for one family.
struct TableDefinition {
  bibmirror::model::Family      family;
  std::string                   table_name;
  std::vector<ColumnDefinition> columns;

  // upstream dedup key and change-detection columns (lower case)
  std::string remote_id_column;
  std::string watermark_column;
};

/*
  Static registry family -> expected upstream schema.

  Built once per process; lookups never allocate.
*/
class TableCatalog {
 public:
  explicit TableCatalog(std::vector<TableDefinition> tables);

  // The upstream mirror layout.
  static const TableCatalog& Default();

  const TableDefinition* FindByTableName(std::string_view table_name) const;
  const TableDefinition& ForFamily(bibmirror::model::Family family) const;

  const std::vector<TableDefinition>& Tables() const {
    return tables_;
  }

 private:
  std::vector<TableDefinition> tables_;
};

bool EqualsIgnoreCase(std::string_view a, std::string_view b);

} // namespace bibmirror::catalog
