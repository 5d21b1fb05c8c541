#include "internal/ingest/raw_row.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

namespace bibmirror::ingest {

namespace {

std::string Fold(std::string_view s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

} // namespace

void RawRow::Set(std::string_view column, std::optional<std::string> value) {
  values_[Fold(column)] = std::move(value);
}

std::optional<std::string_view> RawRow::Get(std::string_view column) const {
  auto it = values_.find(Fold(column));
  if (it == values_.end() || !it->second) return std::nullopt;
  return std::string_view(*it->second);
}

std::string RawRow::Text(std::string_view column) const {
  return std::string(Get(column).value_or(std::string_view{}));
}

std::optional<uint64_t> RawRow::Unsigned(std::string_view column) const {
  auto value = Get(column);
  if (!value || value->empty()) return std::nullopt;

  uint64_t out   = 0;
  auto [ptr, ec] = std::from_chars(value->data(), value->data() + value->size(), out);
  if (ec != std::errc{} || ptr != value->data() + value->size()) return std::nullopt;
  return out;
}

std::optional<util::TimePoint> RawRow::Timestamp(std::string_view column) const {
  auto value = Get(column);
  if (!value) return std::nullopt;
  return util::ParseTimestamp(*value);
}

} // namespace bibmirror::ingest
