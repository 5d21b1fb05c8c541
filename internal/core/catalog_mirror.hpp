#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

#include "internal/catalog/schema_matcher.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/dump/dump_reader.hpp"
#include "internal/ingest/disk_space.hpp"
#include "internal/ingest/merge_engine.hpp"
#include "internal/ingest/presence_index.hpp"
#include "internal/ingest/progress.hpp"
#include "internal/model/family.hpp"
#include "internal/model/ingest_state.hpp"
#include "internal/sync/delta_source.hpp"
#include "internal/util/time.hpp"

namespace bibmirror::core {

struct MirrorOptions {
  uint64_t                  low_disk_space_threshold_bytes = 100ull * 1024 * 1024;
  uint64_t                  import_checkpoint_interval     = 1000;
  uint64_t                  sync_checkpoint_interval       = 100;
  std::chrono::milliseconds progress_interval{100};
};

struct FamilyStats {
  bibmirror::model::Family       family;
  uint64_t                       count = 0;
  std::optional<util::TimePoint> last_update;
};

struct DatabaseStats {
  std::vector<FamilyStats> families;
};

/*
  Top-level ingestion driver.

  Bulk import:
    probe disk -> find CREATE TABLE -> match schema (unknown: next
    definition) -> ensure indexes -> find INSERT -> merge -> record
    counts and first-import flag -> next definition ... -> Completed

  Synchronization:
    require non-empty family -> probe disk -> ensure indexes -> load
    watermark -> { fetch batch -> merge } until exhausted -> Completed

  Both return exactly one terminal IngestResult; no exception escapes.
  One operation runs at a time (see runtime::IngestionWorker); the
  presence index and watermark live only for the duration of a call.
*/
class CatalogMirror {
 public:
  CatalogMirror(std::shared_ptr<db::Repository> repository, std::shared_ptr<ingest::DiskSpaceProbe> disk,
                sync::DeltaSourceFactory delta_sources, MirrorOptions options,
                const catalog::TableCatalog& catalog = catalog::TableCatalog::Default());

  // expected: when set, a recognized table of another family is an error
  model::IngestResult ImportDump(const std::string& path, std::optional<bibmirror::model::Family> expected,
                                 ingest::ProgressSink& sink, std::stop_token stop);

  model::IngestResult ImportDump(dump::DumpReader& reader, std::optional<bibmirror::model::Family> expected,
                                 ingest::ProgressSink& sink, std::stop_token stop);

  model::IngestResult Synchronize(bibmirror::model::Family family, ingest::ProgressSink& sink, std::stop_token stop);

  // Re-reads per-family counts from storage.
  void     RefreshCounts();
  uint64_t RecordCount(bibmirror::model::Family family) const;

  // True when every family's timestamp index exists, i.e. GetDatabaseStats
  // will not have to build one.
  bool          StatsIndexesCreated();
  DatabaseStats GetDatabaseStats();

 private:
  struct Totals {
    uint64_t added   = 0;
    uint64_t updated = 0;
  };

  template <typename Fn>
  model::IngestResult Guarded(std::string_view operation, Fn&& fn);

  model::IngestResult RunImport(dump::DumpReader& reader, std::optional<bibmirror::model::Family> expected,
                                ingest::ProgressSink& sink, std::stop_token stop);
  model::IngestResult RunSync(bibmirror::model::Family family, ingest::ProgressSink& sink, std::stop_token stop);

  template <typename Traits>
  ingest::MergeResult ImportSegment(dump::DumpReader& reader, const catalog::ParsedTableDefinition& parsed,
                                    ingest::ProgressSink& sink, std::stop_token stop, const Totals& totals,
                                    bool& definition_pending);

  template <typename Traits>
  model::IngestResult SyncFamily(ingest::ProgressSink& sink, std::stop_token stop);

  // true when free space is below the threshold
  bool ProbeLowDiskSpace(ingest::ProgressSink& sink);

  // false when cancelled before all indexes exist
  bool EnsureDedupIndexes(bibmirror::model::Family family, ingest::ProgressSink& sink, std::stop_token stop);

  ingest::PresenceIndex LoadPresenceIndex(bibmirror::model::Family family, ingest::ProgressSink& sink);

  void MarkFirstImportComplete(bibmirror::model::Family family);

  std::shared_ptr<db::Repository>         repository_;
  std::shared_ptr<ingest::DiskSpaceProbe> disk_;
  sync::DeltaSourceFactory                delta_sources_;
  MirrorOptions                           options_;
  const catalog::TableCatalog&            catalog_;
  catalog::SchemaMatcher                  matcher_;

  std::array<std::atomic<uint64_t>, 3> counts_{};
};

} // namespace bibmirror::core
