#pragma once

#include <cstdint>
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/catalog/table_catalog.hpp"

namespace bibmirror::dump {

enum class LineKind : std::uint8_t {
  kCreateTable,
  kInsert,
  kOther,
};

// Values of one tuple in statement order; nullopt is SQL NULL.
using RowValues = std::vector<std::optional<std::string>>;

/*
  Streaming reader for MySQL-dialect dump files.

  The reader is line oriented:

    ReadLine()              -> classify the next line
    ParseTableDefinition()  -> on kCreateTable, consume the whole definition
    ReadRow()               -> on kInsert, yield the statement's tuples one by one

  An INSERT statement runs until ';' and may put its tuples on the
  following lines; ReadRow() reads on until the statement closes. A
  statement that stops without ';' ends at the first line that is not a
  tuple line, and that line is returned by the next ReadLine().

  Comments and other statements classify as kOther. A malformed tuple is
  a fault scoped to its line: the rest of the line is skipped and
  ParseFaults() is incremented. A tuple line outside any INSERT is a
  fault too. A definition or tuple still open at end of stream throws
  util::DumpCorrupted.
*/
class DumpReader {
 public:
  // Throws util::NotFound when the file cannot be opened.
  explicit DumpReader(const std::string& path);

  DumpReader(std::unique_ptr<std::istream> stream, uint64_t size);

  // nullopt at end of stream.
  std::optional<LineKind> ReadLine();

  // Requires the current line to be kCreateTable.
  catalog::ParsedTableDefinition ParseTableDefinition();

  // Requires the current line to be kInsert; nullopt once the statement's
  // tuples are exhausted.
  std::optional<RowValues> ReadRow();

  // Explicit column list of the current INSERT, empty when absent.
  const std::vector<std::string>& InsertColumns() const {
    return insert_columns_;
  }

  // Bytes consumed so far and total stream size, for progress ratios.
  uint64_t Position() const {
    return position_;
  }
  uint64_t Size() const {
    return size_;
  }

  uint64_t LineNumber() const {
    return line_number_;
  }
  uint64_t ParseFaults() const {
    return parse_faults_;
  }

  std::optional<LineKind> CurrentKind() const {
    return current_kind_;
  }

 private:
  bool NextRawLine();
  bool AtEnd();
  void BeginInsert();
  // Moves to the next tuple line of the open statement.
  bool ContinueStatement();
  // nullopt at end of line, end of statement, or after a fault.
  std::optional<RowValues> ParseTuple();
  void Fault(std::string_view reason);

  std::unique_ptr<std::istream> stream_;
  uint64_t                      size_        = 0;
  uint64_t                      position_    = 0;
  uint64_t                      line_number_ = 0;
  uint64_t                      parse_faults_ = 0;

  std::string             line_;
  std::optional<LineKind> current_kind_;

  // INSERT tuple cursor into line_
  size_t                   row_pos_        = std::string::npos;
  bool                     statement_open_ = false;
  bool                     replay_line_    = false;
  std::vector<std::string> insert_columns_;
};

} // namespace bibmirror::dump
