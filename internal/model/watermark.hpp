#pragma once

#include <compare>
#include <cstdint>

#include "internal/util/time.hpp"

namespace bibmirror::model {

/*
  High-water mark of the records absorbed for one family.

  Ordered by timestamp, then remote id; remote id breaks ties between
  records sharing a timestamp.
*/
struct WatermarkCursor {
  util::TimePoint timestamp{};
  uint64_t        remote_id = 0;

  auto operator<=>(const WatermarkCursor&) const = default;

  // Moves forward only.
  void Advance(const WatermarkCursor& candidate) {
    if (*this < candidate) {
      *this = candidate;
    }
  }
};

} // namespace bibmirror::model
