#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <stop_token>

#include "internal/db/api/repository.hpp"
#include "internal/ingest/cancellation.hpp"
#include "internal/ingest/disk_space.hpp"
#include "internal/ingest/presence_index.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace bibmirror::ingest {

enum class MergeStatus : std::uint8_t {
  kCompleted,
  kCancelled,
  kLowDiskSpace,
};

struct MergeResult {
  MergeStatus status  = MergeStatus::kCompleted;
  uint64_t    added   = 0;
  uint64_t    updated = 0;
};

struct MergeOptions {
  // records per transaction / progress / disk-space checkpoint
  uint64_t checkpoint_interval = 1000;
  uint64_t low_disk_space_threshold_bytes = 0;
};

/*
  Generic insert-or-update pipeline shared by bulk import and sync.

  For each record pulled from the source:

    - remote id absent from the presence index -> insert, mark present
    - present -> update only when Traits::IsNewer says the incoming copy
      is strictly newer than the stored one

  Writes are grouped in one transaction per checkpoint interval. At each
  checkpoint the transaction commits, on_checkpoint observes the running
  totals and free disk space is re-sampled; below the threshold the run
  stops with kLowDiskSpace and everything committed so far stays.

  Cancellation is polled before each record. Records already processed
  are committed before returning kCancelled, so re-running is always
  safe.

  A write refused with db::ErrorCode::DiskFull rolls back the open
  interval and ends the run with kLowDiskSpace; the totals returned are
  those of the last commit. Any other storage failure throws
  util::StorageError and the open transaction rolls back.
*/
template <typename Traits>
class MergeEngine {
 public:
  using Record       = typename Traits::Record;
  using Source       = std::function<std::optional<Record>()>;
  using CheckpointFn = std::function<void(const MergeResult&)>;

  MergeEngine(db::Repository& repo, PresenceIndex& presence, DiskSpaceProbe& disk, MergeOptions options)
      : repo_(repo), presence_(presence), disk_(disk), options_(options) {
    if (options_.checkpoint_interval == 0) options_.checkpoint_interval = 1;
  }

  MergeResult Run(const Source& next, const CheckpointFn& on_checkpoint, std::stop_token stop) {
    MergeResult result;
    MergeResult committed;
    uint64_t    pending = 0;
    auto        tx      = repo_.Begin();

    for (;;) {
      if (CancellationRequested(stop, "merge")) {
        tx->Commit();
        result.status = MergeStatus::kCancelled;
        return result;
      }

      auto record = next();
      if (!record) break;

      if (!Merge(*tx, *record, result)) {
        tx->Rollback();
        BIBMIRROR_LOG_WARN("storage full, stopping merge",
                           {observability::StringField("family", model::ToString(Traits::kFamily)),
                            observability::UintField("added", committed.added),
                            observability::UintField("updated", committed.updated)});
        committed.status = MergeStatus::kLowDiskSpace;
        return committed;
      }

      if (++pending < options_.checkpoint_interval) continue;

      tx->Commit();
      committed = result;
      pending   = 0;
      if (on_checkpoint) on_checkpoint(result);

      if (IsLowDiskSpace(disk_.FreeBytes(), options_.low_disk_space_threshold_bytes)) {
        BIBMIRROR_LOG_WARN("low disk space, stopping merge",
                           {observability::StringField("family", model::ToString(Traits::kFamily)),
                            observability::UintField("added", result.added),
                            observability::UintField("updated", result.updated)});
        result.status = MergeStatus::kLowDiskSpace;
        return result;
      }

      tx = repo_.Begin();
    }

    tx->Commit();
    if (pending > 0 && on_checkpoint) on_checkpoint(result);
    return result;
  }

 private:
  // False when storage is full.
  bool Merge(db::Transaction& tx, Record& record, MergeResult& result) {
    const uint64_t remote_id = Traits::RemoteId(record);

    if (presence_.Contains(remote_id)) {
      auto stored = Traits::Load(repo_, tx, remote_id);
      if (stored) {
        if (!Traits::IsNewer(record, *stored)) return true;

        record.id = stored->id;
        if (!Check(Traits::Update(repo_, tx, record), "update", remote_id)) return false;
        ++result.updated;
        return true;
      }
      // index and storage disagree; storage wins
    }

    if (!Check(Traits::Insert(repo_, tx, record), "insert", remote_id)) return false;
    presence_.Set(remote_id);
    ++result.added;
    return true;
  }

  static bool Check(const db::Result& r, const char* op, uint64_t remote_id) {
    if (r) return true;
    if (r.IsDiskFull()) return false;
    throw util::StorageError(std::string(op) + " of " + std::string(model::ToString(Traits::kFamily)) + " record " +
                             std::to_string(remote_id) + " failed: " + db::Describe(r));
  }

  db::Repository& repo_;
  PresenceIndex&  presence_;
  DiskSpaceProbe& disk_;
  MergeOptions    options_;
};

} // namespace bibmirror::ingest
