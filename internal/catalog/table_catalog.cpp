#include "internal/catalog/table_catalog.hpp"

#include <algorithm>
#include <cctype>

#include "internal/util/errors.hpp"

namespace bibmirror::catalog {

using bibmirror::model::Family;

namespace {

std::string Lower(std::string_view s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

std::vector<TableDefinition> UpstreamTables() {
  using T = ColumnType;
  return {
      {
          .family     = Family::kNonFiction,
          .table_name = "updated",
          .columns =
              {
                  {"id", T::kInt},
                  {"title", T::kVarChar},
                  {"series", T::kVarChar},
                  {"author", T::kVarChar},
                  {"year", T::kVarChar},
                  {"edition", T::kVarChar},
                  {"publisher", T::kVarChar},
                  {"pages", T::kVarChar},
                  {"language", T::kVarChar},
                  {"identifier", T::kVarChar},
                  {"filesize", T::kBigInt},
                  {"extension", T::kVarChar},
                  {"md5", T::kChar},
                  {"coverurl", T::kVarChar},
                  {"timeadded", T::kTimestamp},
                  {"timelastmodified", T::kTimestamp},
              },
          .remote_id_column = "id",
          .watermark_column = "timelastmodified",
      },
      {
          .family     = Family::kFiction,
          .table_name = "fiction",
          .columns =
              {
                  {"id", T::kInt},
                  {"md5", T::kChar},
                  {"title", T::kVarChar},
                  {"author", T::kVarChar},
                  {"series", T::kVarChar},
                  {"edition", T::kVarChar},
                  {"language", T::kVarChar},
                  {"year", T::kVarChar},
                  {"publisher", T::kVarChar},
                  {"pages", T::kVarChar},
                  {"identifier", T::kVarChar},
                  {"extension", T::kVarChar},
                  {"filesize", T::kBigInt},
                  {"coverurl", T::kVarChar},
                  {"timeadded", T::kTimestamp},
                  {"timelastmodified", T::kTimestamp},
              },
          .remote_id_column = "id",
          .watermark_column = "timelastmodified",
      },
      {
          .family     = Family::kSciMag,
          .table_name = "scimag",
          .columns =
              {
                  {"id", T::kInt},
                  {"doi", T::kVarChar},
                  {"title", T::kVarChar},
                  {"author", T::kVarChar},
                  {"year", T::kVarChar},
                  {"volume", T::kVarChar},
                  {"issue", T::kVarChar},
                  {"first_page", T::kVarChar},
                  {"last_page", T::kVarChar},
                  {"journal", T::kVarChar},
                  {"issnp", T::kVarChar},
                  {"filesize", T::kBigInt},
                  {"md5", T::kChar},
                  {"timeadded", T::kTimestamp},
              },
          .remote_id_column = "id",
          .watermark_column = "timeadded",
      },
  };
}

} // namespace

bool EqualsIgnoreCase(std::string_view a, std::string_view b) {
  return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
           return std::tolower(x) == std::tolower(y);
         });
}

ColumnType ParseColumnType(std::string_view declared) {
  // base name ends at the display width or the first modifier
  const auto end  = declared.find_first_of("( \t");
  const auto base = Lower(declared.substr(0, end));

  if (base == "tinyint") return ColumnType::kTinyInt;
  if (base == "smallint") return ColumnType::kSmallInt;
  if (base == "mediumint") return ColumnType::kMediumInt;
  if (base == "int" || base == "integer") return ColumnType::kInt;
  if (base == "bigint") return ColumnType::kBigInt;
  if (base == "decimal" || base == "numeric") return ColumnType::kDecimal;
  if (base == "float") return ColumnType::kFloat;
  if (base == "double" || base == "real") return ColumnType::kDouble;
  if (base == "char") return ColumnType::kChar;
  if (base == "varchar") return ColumnType::kVarChar;
  if (base == "text" || base == "tinytext" || base == "mediumtext" || base == "longtext") return ColumnType::kText;
  if (base == "blob" || base == "tinyblob" || base == "mediumblob" || base == "longblob") return ColumnType::kBlob;
  if (base == "date") return ColumnType::kDate;
  if (base == "datetime") return ColumnType::kDateTime;
  if (base == "timestamp") return ColumnType::kTimestamp;
  return ColumnType::kOther;
}

std::string_view ToString(ColumnType type) {
  switch (type) {
    case ColumnType::kTinyInt:
      return "TINYINT";
    case ColumnType::kSmallInt:
      return "SMALLINT";
    case ColumnType::kMediumInt:
      return "MEDIUMINT";
    case ColumnType::kInt:
      return "INT";
    case ColumnType::kBigInt:
      return "BIGINT";
    case ColumnType::kDecimal:
      return "DECIMAL";
    case ColumnType::kFloat:
      return "FLOAT";
    case ColumnType::kDouble:
      return "DOUBLE";
    case ColumnType::kChar:
      return "CHAR";
    case ColumnType::kVarChar:
      return "VARCHAR";
    case ColumnType::kText:
      return "TEXT";
    case ColumnType::kBlob:
      return "BLOB";
    case ColumnType::kDate:
      return "DATE";
    case ColumnType::kDateTime:
      return "DATETIME";
    case ColumnType::kTimestamp:
      return "TIMESTAMP";
    case ColumnType::kOther:
      return "OTHER";
  }
  return "OTHER";
}

TableCatalog::TableCatalog(std::vector<TableDefinition> tables) : tables_(std::move(tables)) {
}

const TableCatalog& TableCatalog::Default() {
  static const TableCatalog catalog(UpstreamTables());
  return catalog;
}

const TableDefinition* TableCatalog::FindByTableName(std::string_view table_name) const {
  for (const auto& table : tables_) {
    if (EqualsIgnoreCase(table.table_name, table_name)) return &table;
  }
  return nullptr;
}

const TableDefinition& TableCatalog::ForFamily(Family family) const {
  for (const auto& table : tables_) {
    if (table.family == family) return table;
  }
  throw util::NotFound("no table definition for family " + std::string(model::ToString(family)));
}

} // namespace bibmirror::catalog
