#include "internal/ingest/presence_index.hpp"

#include <algorithm>
#include <string>

#include "internal/util/errors.hpp"

namespace bibmirror::ingest {

namespace {

uint64_t CheckedId(uint64_t remote_id) {
  if (remote_id > kMaxRemoteId) {
    throw util::InvalidState("remote id " + std::to_string(remote_id) + " exceeds the supported maximum " +
                             std::to_string(kMaxRemoteId));
  }
  return remote_id;
}

} // namespace

PresenceIndex::PresenceIndex(uint64_t expected_max_id) : bits_(CheckedId(expected_max_id) + 1, false) {
}

bool PresenceIndex::Contains(uint64_t remote_id) const {
  return remote_id < bits_.size() && bits_[remote_id];
}

void PresenceIndex::Set(uint64_t remote_id) {
  if (CheckedId(remote_id) >= bits_.size()) {
    // grow geometrically so a stream of ascending ids stays amortized O(1)
    const uint64_t doubled = std::max<uint64_t>(remote_id + 1, bits_.size() * 2);
    bits_.resize(std::min<uint64_t>(doubled, kMaxRemoteId + 1), false);
  }
  if (!bits_[remote_id]) {
    bits_[remote_id] = true;
    ++count_;
  }
}

} // namespace bibmirror::ingest
