#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace bibmirror::model {

enum class Family : std::uint8_t {
  kNonFiction = 1,
  kFiction    = 2,
  kSciMag     = 3,
};

inline constexpr std::array<Family, 3> kAllFamilies = {Family::kNonFiction, Family::kFiction, Family::kSciMag};

constexpr std::string_view ToString(Family family) {
  switch (family) {
    case Family::kNonFiction:
      return "non-fiction";
    case Family::kFiction:
      return "fiction";
    case Family::kSciMag:
      return "scimag";
  }
  return "unknown";
}

constexpr std::optional<Family> FamilyFromString(std::string_view name) {
  if (name == "non-fiction" || name == "nonfiction") {
    return Family::kNonFiction;
  }
  if (name == "fiction") {
    return Family::kFiction;
  }
  if (name == "scimag" || name == "articles") {
    return Family::kSciMag;
  }
  return std::nullopt;
}

} // namespace bibmirror::model
