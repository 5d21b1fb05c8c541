#pragma once

#include <cstdint>
#include <limits>
#include <vector>

namespace bibmirror::ingest {

// Largest remote id the catalog accepts. Upstream ids are MySQL int(11)
// columns; rows above this are skipped by the row mappers.
inline constexpr uint64_t kMaxRemoteId = static_cast<uint64_t>(std::numeric_limits<int32_t>::max());

/*
  Dense bitset over remote ids: bit set <=> record stored locally.

  Sized up front from the largest known id; Set() on an id beyond the
  current bound grows the bitset instead of failing. Ids above
  kMaxRemoteId throw util::InvalidState.
*/
class PresenceIndex {
 public:
  explicit PresenceIndex(uint64_t expected_max_id = 0);

  bool Contains(uint64_t remote_id) const;
  void Set(uint64_t remote_id);

  // number of addressable ids
  uint64_t Capacity() const {
    return bits_.size();
  }

  uint64_t Count() const {
    return count_;
  }

 private:
  std::vector<bool> bits_;
  uint64_t          count_ = 0;
};

} // namespace bibmirror::ingest
