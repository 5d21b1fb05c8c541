#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "internal/util/time.hpp"

namespace bibmirror::ingest {

/*
  One upstream record before conversion: column name -> raw text value.

  Column names are folded to lower case. A missing column and an SQL NULL
  both read as nullopt.
*/
class RawRow {
 public:
  void Set(std::string_view column, std::optional<std::string> value);

  std::optional<std::string_view> Get(std::string_view column) const;

  // Empty when missing or NULL.
  std::string Text(std::string_view column) const;

  // nullopt when missing, NULL or not a non-negative integer.
  std::optional<uint64_t> Unsigned(std::string_view column) const;

  std::optional<util::TimePoint> Timestamp(std::string_view column) const;

  size_t size() const {
    return values_.size();
  }

 private:
  std::unordered_map<std::string, std::optional<std::string>> values_;
};

} // namespace bibmirror::ingest
