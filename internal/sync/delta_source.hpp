#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <stop_token>
#include <vector>

#include "internal/ingest/raw_row.hpp"
#include "internal/model/family.hpp"
#include "internal/model/watermark.hpp"

namespace bibmirror::sync {

struct DeltaBatch {
  enum class Status : std::uint8_t {
    kBatch,
    kExhausted,
    kCancelled,
  };

  Status                      status = Status::kExhausted;
  std::vector<ingest::RawRow> rows;
};

/*
  Paginated source of upstream changes for one family.

  Batches come back ascending by (timestamp, remote id) and strictly past
  the cursor; the cursor then moves to the last row returned. kExhausted
  and kCancelled never carry rows. Transport failures throw
  util::FetchFailed.
*/
class DeltaSource {
 public:
  virtual ~DeltaSource() = default;

  virtual DeltaBatch FetchNextBatch(std::stop_token stop) = 0;

  virtual model::WatermarkCursor Cursor() const = 0;
};

// Returns nullptr when the family has no configured endpoint.
using DeltaSourceFactory =
    std::function<std::unique_ptr<DeltaSource>(bibmirror::model::Family, const model::WatermarkCursor& start)>;

} // namespace bibmirror::sync
