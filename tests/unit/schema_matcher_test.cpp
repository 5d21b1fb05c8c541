#include "internal/catalog/schema_matcher.hpp"

#include <cassert>
#include <cctype>
#include <iostream>
#include <utility>

#include "internal/util/errors.hpp"
#include "tests/support/test_support.hpp"

namespace {

using bibmirror::catalog::ColumnType;
using bibmirror::catalog::ParsedTableDefinition;
using bibmirror::catalog::SchemaMatcher;
using bibmirror::catalog::TableCatalog;
using bibmirror::model::Family;

ParsedTableDefinition Parse(const std::string& text) {
  auto reader = bibmirror::testing::ReaderFor(text);
  assert(reader->ReadLine() == bibmirror::dump::LineKind::kCreateTable);
  return reader->ParseTableDefinition();
}

// The expected definition of a family, as a dump would declare it.
ParsedTableDefinition AsParsed(Family family) {
  const auto&           table = TableCatalog::Default().ForFamily(family);
  ParsedTableDefinition parsed{table.table_name, table.columns};
  return parsed;
}

void TestUpstreamDumpsMatchTheirFamilies() {
  SchemaMatcher matcher;

  assert(matcher.Match(Parse(bibmirror::testing::NonFictionTable())) == Family::kNonFiction);
  assert(matcher.Match(Parse(bibmirror::testing::FictionTable())) == Family::kFiction);
  assert(matcher.Match(Parse(bibmirror::testing::SciMagTable())) == Family::kSciMag);
}

void TestNamesCompareCaseInsensitively() {
  SchemaMatcher matcher;
  auto          parsed = AsParsed(Family::kFiction);

  parsed.table_name = "FICTION";
  for (auto& column : parsed.columns) {
    for (auto& c : column.name) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  }
  assert(matcher.Match(parsed) == Family::kFiction);
}

void TestColumnOrderDoesNotMatter() {
  SchemaMatcher matcher;
  auto          parsed = AsParsed(Family::kSciMag);

  std::swap(parsed.columns.front(), parsed.columns.back());
  assert(matcher.Match(parsed) == Family::kSciMag);
}

void TestUnknownTableIsRejected() {
  SchemaMatcher matcher;
  auto          parsed = AsParsed(Family::kNonFiction);

  parsed.table_name = "description";
  assert(!matcher.Match(parsed).has_value());
}

void TestMissingOrExtraColumnIsRejected() {
  SchemaMatcher matcher;

  auto missing = AsParsed(Family::kNonFiction);
  missing.columns.pop_back();
  assert(!matcher.Match(missing).has_value());

  auto extra = AsParsed(Family::kNonFiction);
  extra.columns.push_back({"Locator", ColumnType::kVarChar});
  assert(!matcher.Match(extra).has_value());
}

void TestTypeMismatchIsRejected() {
  SchemaMatcher matcher;
  auto          parsed = AsParsed(Family::kNonFiction);

  parsed.columns[0].type = ColumnType::kBigInt;
  assert(!matcher.Match(parsed).has_value());
}

void TestDuplicateColumnIsRejected() {
  SchemaMatcher matcher;
  auto          parsed = AsParsed(Family::kSciMag);

  // same size as expected, but one column repeated in place of another
  parsed.columns[1] = parsed.columns[0];
  assert(!matcher.Match(parsed).has_value());
}

void TestColumnTypeNormalization() {
  using bibmirror::catalog::ParseColumnType;

  assert(ParseColumnType("int(11) unsigned") == ColumnType::kInt);
  assert(ParseColumnType("INT") == ColumnType::kInt);
  assert(ParseColumnType("varchar(200)") == ColumnType::kVarChar);
  assert(ParseColumnType("bigint(20)") == ColumnType::kBigInt);
  assert(ParseColumnType("timestamp") == ColumnType::kTimestamp);
  assert(ParseColumnType("geometry") == ColumnType::kOther);
}

void TestCatalogLookups() {
  const auto& catalog = TableCatalog::Default();

  assert(catalog.Tables().size() == 3);
  assert(catalog.FindByTableName("Updated") != nullptr);
  assert(catalog.FindByTableName("Updated")->family == Family::kNonFiction);
  assert(catalog.FindByTableName("topics") == nullptr);
  assert(catalog.ForFamily(Family::kSciMag).watermark_column == "timeadded");

  TableCatalog empty(std::vector<bibmirror::catalog::TableDefinition>{});
  bool         threw = false;
  try {
    (void)empty.ForFamily(Family::kFiction);
  } catch (const bibmirror::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestUpstreamDumpsMatchTheirFamilies();
  TestNamesCompareCaseInsensitively();
  TestColumnOrderDoesNotMatter();
  TestUnknownTableIsRejected();
  TestMissingOrExtraColumnIsRejected();
  TestTypeMismatchIsRejected();
  TestDuplicateColumnIsRejected();
  TestColumnTypeNormalization();
  TestCatalogLookups();

  std::cout << "bibmirror_unit_schema_matcher: pass\n";
  return 0;
}
