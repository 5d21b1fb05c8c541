#include "internal/dump/dump_reader.hpp"

#include <cctype>
#include <filesystem>
#include <fstream>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace bibmirror::dump {

namespace {

bool IsSpace(char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

void SkipSpaces(std::string_view s, size_t& i) {
  while (i < s.size() && IsSpace(s[i])) ++i;
}

// Case-insensitive keyword at s[i], followed by a non-identifier char.
bool ConsumeKeyword(std::string_view s, size_t& i, std::string_view keyword) {
  if (s.size() - i < keyword.size()) return false;
  if (!catalog::EqualsIgnoreCase(s.substr(i, keyword.size()), keyword)) return false;

  const size_t end = i + keyword.size();
  if (end < s.size() && (std::isalnum(static_cast<unsigned char>(s[end])) || s[end] == '_')) return false;
  i = end;
  return true;
}

bool IsIdentifierChar(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '$';
}

// Backtick-quoted or bare identifier; "db.table" yields "table".
std::string ReadIdentifier(std::string_view s, size_t& i) {
  std::string name;
  for (;;) {
    name.clear();
    if (i < s.size() && s[i] == '`') {
      ++i;
      while (i < s.size() && s[i] != '`') name.push_back(s[i++]);
      if (i < s.size()) ++i;
    } else {
      while (i < s.size() && IsIdentifierChar(s[i])) name.push_back(s[i++]);
    }
    if (i < s.size() && s[i] == '.') {
      ++i;
      continue;
    }
    return name;
  }
}

std::string_view Trim(std::string_view s) {
  size_t b = 0;
  size_t e = s.size();
  while (b < e && IsSpace(s[b])) ++b;
  while (e > b && IsSpace(s[e - 1])) --e;
  return s.substr(b, e - b);
}

bool IsIndexClause(std::string_view word) {
  for (std::string_view keyword : {"PRIMARY", "KEY", "UNIQUE", "INDEX", "FULLTEXT", "SPATIAL", "CONSTRAINT", "FOREIGN", "CHECK"}) {
    if (catalog::EqualsIgnoreCase(word, keyword)) return true;
  }
  return false;
}

std::optional<catalog::ColumnDefinition> ParseColumnItem(std::string_view item) {
  size_t i = 0;
  SkipSpaces(item, i);
  if (i >= item.size()) return std::nullopt;

  const bool quoted = item[i] == '`';
  auto       name   = ReadIdentifier(item, i);
  if (name.empty() || (!quoted && IsIndexClause(name))) return std::nullopt;

  SkipSpaces(item, i);
  const size_t type_start = i;
  while (i < item.size() && std::isalpha(static_cast<unsigned char>(item[i]))) ++i;

  return catalog::ColumnDefinition{std::move(name), catalog::ParseColumnType(item.substr(type_start, i - type_start))};
}

char Unescape(char c) {
  switch (c) {
    case '0':
      return '\0';
    case 'n':
      return '\n';
    case 'r':
      return '\r';
    case 't':
      return '\t';
    case 'b':
      return '\b';
    case 'Z':
      return '\x1a';
    default:
      return c;
  }
}

} // namespace

DumpReader::DumpReader(const std::string& path) {
  auto file = std::make_unique<std::ifstream>(path, std::ios::binary);
  if (!file->is_open()) {
    throw util::NotFound("cannot open dump file: " + path);
  }

  std::error_code ec;
  const auto      size = std::filesystem::file_size(path, ec);
  size_                = ec ? 0 : size;
  stream_              = std::move(file);
}

DumpReader::DumpReader(std::unique_ptr<std::istream> stream, uint64_t size) : stream_(std::move(stream)), size_(size) {
}

bool DumpReader::NextRawLine() {
  if (!std::getline(*stream_, line_)) return false;

  position_ += line_.size() + (stream_->eof() ? 0 : 1);
  ++line_number_;
  if (!line_.empty() && line_.back() == '\r') line_.pop_back();
  return true;
}

bool DumpReader::AtEnd() {
  return stream_->peek() == std::char_traits<char>::eof();
}

void DumpReader::Fault(std::string_view reason) {
  ++parse_faults_;
  row_pos_ = std::string::npos;
  BIBMIRROR_LOG_WARN("skipping malformed dump line",
                     {observability::UintField("line", line_number_), observability::StringField("reason", reason)});
}

std::optional<LineKind> DumpReader::ReadLine() {
  row_pos_        = std::string::npos;
  statement_open_ = false;
  insert_columns_.clear();

  if (replay_line_) {
    // handed back by ReadRow after an INSERT that ended without ';'
    replay_line_ = false;
  } else if (!NextRawLine()) {
    current_kind_.reset();
    return std::nullopt;
  }

  size_t i = 0;
  SkipSpaces(line_, i);
  std::string_view rest(line_);
  rest.remove_prefix(i);

  if (rest.starts_with("--") || rest.starts_with("/*") || rest.starts_with("#")) {
    current_kind_ = LineKind::kOther;
  } else if (rest.starts_with("(")) {
    current_kind_ = LineKind::kOther;
    Fault("tuple outside an INSERT statement");
  } else if (ConsumeKeyword(line_, i, "CREATE")) {
    SkipSpaces(line_, i);
    current_kind_ = ConsumeKeyword(line_, i, "TABLE") ? LineKind::kCreateTable : LineKind::kOther;
  } else if (ConsumeKeyword(line_, i, "INSERT") || ConsumeKeyword(line_, i, "REPLACE")) {
    current_kind_ = LineKind::kInsert;
    BeginInsert();
  } else {
    current_kind_ = LineKind::kOther;
  }
  return current_kind_;
}

void DumpReader::BeginInsert() {
  std::string_view s(line_);
  size_t           i = 0;

  SkipSpaces(s, i);
  if (!ConsumeKeyword(s, i, "INSERT")) ConsumeKeyword(s, i, "REPLACE");
  SkipSpaces(s, i);
  ConsumeKeyword(s, i, "IGNORE");
  SkipSpaces(s, i);
  ConsumeKeyword(s, i, "INTO");
  SkipSpaces(s, i);
  ReadIdentifier(s, i);
  SkipSpaces(s, i);

  if (i < s.size() && s[i] == '(') {
    ++i;
    for (;;) {
      SkipSpaces(s, i);
      auto column = ReadIdentifier(s, i);
      if (column.empty()) {
        Fault("malformed INSERT column list");
        return;
      }
      insert_columns_.push_back(std::move(column));
      SkipSpaces(s, i);
      if (i < s.size() && s[i] == ',') {
        ++i;
        continue;
      }
      if (i < s.size() && s[i] == ')') {
        ++i;
        break;
      }
      Fault("malformed INSERT column list");
      return;
    }
    SkipSpaces(s, i);
  }

  if (!ConsumeKeyword(s, i, "VALUES") && !ConsumeKeyword(s, i, "VALUE")) {
    Fault("INSERT without VALUES");
    return;
  }
  row_pos_        = i;
  statement_open_ = true;
}

bool DumpReader::ContinueStatement() {
  while (NextRawLine()) {
    const auto rest = Trim(line_);
    if (rest.empty()) continue;
    if (rest.front() == '(' || rest.front() == ',' || rest.front() == ';') {
      row_pos_ = 0;
      return true;
    }
    // the statement ended without ';'; the line belongs to ReadLine
    statement_open_ = false;
    replay_line_    = true;
    return false;
  }
  statement_open_ = false;
  return false;
}

catalog::ParsedTableDefinition DumpReader::ParseTableDefinition() {
  if (current_kind_ != LineKind::kCreateTable) {
    throw util::InvalidState("ParseTableDefinition called outside a CREATE TABLE line");
  }

  catalog::ParsedTableDefinition parsed;

  std::string_view s(line_);
  size_t           i = 0;
  SkipSpaces(s, i);
  ConsumeKeyword(s, i, "CREATE");
  SkipSpaces(s, i);
  ConsumeKeyword(s, i, "TABLE");
  SkipSpaces(s, i);
  if (ConsumeKeyword(s, i, "IF")) {
    SkipSpaces(s, i);
    ConsumeKeyword(s, i, "NOT");
    SkipSpaces(s, i);
    ConsumeKeyword(s, i, "EXISTS");
    SkipSpaces(s, i);
  }
  parsed.table_name = ReadIdentifier(s, i);

  // Body items are split on depth-1 commas; the definition may span any
  // number of lines and ends at the matching close paren.
  std::vector<std::string> items;
  std::string              item;
  int                      depth = 0;
  char                     quote = 0;
  bool                     open  = false;

  for (;;) {
    for (; i < line_.size(); ++i) {
      const char c = line_[i];
      if (quote) {
        if (c == '\\' && quote != '`' && i + 1 < line_.size()) {
          if (open) item.push_back(c);
          ++i;
        } else if (c == quote) {
          quote = 0;
        }
        if (open) item.push_back(line_[i]);
        continue;
      }
      if (c == '\'' || c == '"' || c == '`') {
        quote = c;
        if (open) item.push_back(c);
        continue;
      }
      if (c == '(') {
        if (depth++ == 0) {
          open = true;
          continue;
        }
      } else if (c == ')') {
        if (--depth == 0) {
          items.push_back(std::move(item));
          for (const auto& it : items) {
            if (auto column = ParseColumnItem(it)) parsed.columns.push_back(std::move(*column));
          }
          current_kind_ = LineKind::kOther;
          return parsed;
        }
      } else if (c == ',' && depth == 1) {
        items.push_back(std::move(item));
        item.clear();
        continue;
      }
      if (open) item.push_back(c);
    }

    if (!NextRawLine()) {
      throw util::DumpCorrupted("unterminated definition of table '" + parsed.table_name + "' at end of dump");
    }
    if (open) item.push_back(' ');
    i = 0;
  }
}

std::optional<RowValues> DumpReader::ReadRow() {
  if (current_kind_ != LineKind::kInsert) return std::nullopt;

  for (;;) {
    if (row_pos_ == std::string::npos) {
      if (!statement_open_ || !ContinueStatement()) return std::nullopt;
    }
    if (auto values = ParseTuple()) return values;
  }
}

std::optional<RowValues> DumpReader::ParseTuple() {
  const std::string_view s(line_);
  size_t                 i = row_pos_;

  // an open tuple at end of line is only fatal when nothing follows it
  auto unterminated = [this]() -> std::optional<RowValues> {
    if (AtEnd()) {
      throw util::DumpCorrupted("unterminated row at line " + std::to_string(line_number_) + " at end of dump");
    }
    Fault("unterminated tuple");
    return std::nullopt;
  };

  while (i < s.size() && (IsSpace(s[i]) || s[i] == ',')) ++i;
  if (i >= s.size()) {
    // statement continues on the next line
    row_pos_ = std::string::npos;
    return std::nullopt;
  }
  if (s[i] == ';') {
    row_pos_        = std::string::npos;
    statement_open_ = false;
    return std::nullopt;
  }
  if (s[i] != '(') {
    Fault("expected '(' before tuple");
    return std::nullopt;
  }
  ++i;

  RowValues values;
  for (;;) {
    SkipSpaces(s, i);
    if (i >= s.size()) return unterminated();

    if (s[i] == '\'' || s[i] == '"') {
      const char  q = s[i++];
      std::string value;
      bool        closed = false;
      while (i < s.size()) {
        const char c = s[i];
        if (c == '\\') {
          if (i + 1 >= s.size()) break;
          value.push_back(Unescape(s[i + 1]));
          i += 2;
        } else if (c == q) {
          if (i + 1 < s.size() && s[i + 1] == q) {
            value.push_back(q);
            i += 2;
          } else {
            ++i;
            closed = true;
            break;
          }
        } else {
          value.push_back(c);
          ++i;
        }
      }
      if (!closed) return unterminated();
      values.emplace_back(std::move(value));
    } else {
      const size_t start = i;
      while (i < s.size() && s[i] != ',' && s[i] != ')') ++i;
      if (i >= s.size()) return unterminated();

      const auto token = Trim(s.substr(start, i - start));
      if (token.empty()) {
        Fault("empty value in tuple");
        return std::nullopt;
      }
      if (catalog::EqualsIgnoreCase(token, "NULL")) {
        values.emplace_back(std::nullopt);
      } else {
        values.emplace_back(std::string(token));
      }
    }

    SkipSpaces(s, i);
    if (i >= s.size()) return unterminated();
    if (s[i] == ',') {
      ++i;
      continue;
    }
    if (s[i] == ')') {
      ++i;
      break;
    }
    Fault("unexpected character in tuple");
    return std::nullopt;
  }

  row_pos_ = i;
  return values;
}

} // namespace bibmirror::dump
