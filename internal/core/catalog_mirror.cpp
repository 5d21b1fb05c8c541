#include "internal/core/catalog_mirror.hpp"

#include <algorithm>

#include "internal/core/database_session.hpp"
#include "internal/db/sql/sql_queries.hpp"
#include "internal/ingest/cancellation.hpp"
#include "internal/ingest/family_traits.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace bibmirror::core {

using bibmirror::model::ErrorKind;
using bibmirror::model::Family;
using bibmirror::model::IngestResult;
using bibmirror::model::IngestStatus;
using ingest::CancellationRequested;
using ingest::MergeStatus;

namespace {

size_t Slot(Family family) {
  return static_cast<size_t>(family) - 1;
}

IngestResult FromMerge(const ingest::MergeResult& merge, uint64_t added, uint64_t updated) {
  switch (merge.status) {
    case MergeStatus::kCancelled:
      return IngestResult::Terminal(IngestStatus::kCancelled, added, updated);
    case MergeStatus::kLowDiskSpace:
      return IngestResult::Terminal(IngestStatus::kLowDiskSpace, added, updated);
    case MergeStatus::kCompleted:
      break;
  }
  return IngestResult::Terminal(IngestStatus::kCompleted, added, updated);
}

// Dump tuple -> named row; columns come from the INSERT column list when
// present, else from the table definition.
std::optional<ingest::RawRow> BuildRow(const dump::DumpReader& reader, const catalog::ParsedTableDefinition& parsed,
                                       dump::RowValues& values) {
  const auto& insert_columns = reader.InsertColumns();
  const auto  width          = insert_columns.empty() ? parsed.columns.size() : insert_columns.size();
  if (values.size() != width) return std::nullopt;

  ingest::RawRow row;
  for (size_t i = 0; i < width; ++i) {
    row.Set(insert_columns.empty() ? parsed.columns[i].name : insert_columns[i], std::move(values[i]));
  }
  return row;
}

} // namespace

CatalogMirror::CatalogMirror(std::shared_ptr<db::Repository> repository, std::shared_ptr<ingest::DiskSpaceProbe> disk,
                             sync::DeltaSourceFactory delta_sources, MirrorOptions options, const catalog::TableCatalog& catalog)
    : repository_(std::move(repository)),
      disk_(std::move(disk)),
      delta_sources_(std::move(delta_sources)),
      options_(options),
      catalog_(catalog),
      matcher_(catalog) {
  if (!repository_) throw util::InvalidState("CatalogMirror requires a repository");
  if (!disk_) throw util::InvalidState("CatalogMirror requires a disk space probe");
}

template <typename Fn>
IngestResult CatalogMirror::Guarded(std::string_view operation, Fn&& fn) {
  IngestResult result;
  try {
    result = fn();
  } catch (const util::DumpCorrupted& e) {
    result = IngestResult::Failed(ErrorKind::kCorruptedDump, e.what());
  } catch (const util::FetchFailed& e) {
    result = IngestResult::Failed(ErrorKind::kNetwork, e.what());
  } catch (const util::StorageError& e) {
    result = IngestResult::Failed(ErrorKind::kStorage, e.what());
  } catch (const util::NotFound& e) {
    result = IngestResult::Failed(ErrorKind::kIo, e.what());
  } catch (const std::exception& e) {
    result = IngestResult::Failed(ErrorKind::kInternal, e.what());
  }

  // counts must reflect whatever was committed, whatever the outcome
  try {
    RefreshCounts();
  } catch (const std::exception& e) {
    BIBMIRROR_LOG_WARN("cannot refresh record counts", {observability::StringField("error", e.what())});
  }

  if (result.status == IngestStatus::kError) {
    BIBMIRROR_LOG_ERROR("ingestion failed",
                        {observability::StringField("operation", operation), observability::StringField("error", model::ToString(result.error)),
                         observability::StringField("message", result.message)});
  } else {
    BIBMIRROR_LOG_INFO("ingestion finished",
                       {observability::StringField("operation", operation), observability::StringField("status", model::ToString(result.status)),
                        observability::UintField("added", result.added), observability::UintField("updated", result.updated)});
  }
  return result;
}

// ------------------------------------------------------------------
// Public operations
// ------------------------------------------------------------------

IngestResult CatalogMirror::ImportDump(const std::string& path, std::optional<Family> expected, ingest::ProgressSink& sink,
                                       std::stop_token stop) {
  return Guarded("import", [&] {
    dump::DumpReader reader(path);
    return RunImport(reader, expected, sink, stop);
  });
}

IngestResult CatalogMirror::ImportDump(dump::DumpReader& reader, std::optional<Family> expected, ingest::ProgressSink& sink,
                                       std::stop_token stop) {
  return Guarded("import", [&] { return RunImport(reader, expected, sink, stop); });
}

IngestResult CatalogMirror::Synchronize(Family family, ingest::ProgressSink& sink, std::stop_token stop) {
  return Guarded("sync", [&] { return RunSync(family, sink, stop); });
}

// ------------------------------------------------------------------
// Bulk import
// ------------------------------------------------------------------

IngestResult CatalogMirror::RunImport(dump::DumpReader& reader, std::optional<Family> expected, ingest::ProgressSink& sink,
                                      std::stop_token stop) {
  ingest::ThrottledProgressSink progress(sink, options_.progress_interval);

  if (CancellationRequested(stop, "import start")) return IngestResult::Terminal(IngestStatus::kCancelled);
  if (ProbeLowDiskSpace(progress)) return IngestResult::Terminal(IngestStatus::kLowDiskSpace);

  RefreshCounts();

  Totals totals;
  bool   imported_any       = false;
  bool   definition_pending = false;

  for (;;) {
    // 1. next table definition (the previous segment may have stopped on one)
    if (!definition_pending) {
      bool found = false;
      while (auto kind = reader.ReadLine()) {
        if (CancellationRequested(stop, "definition scan")) {
          return IngestResult::Terminal(IngestStatus::kCancelled, totals.added, totals.updated);
        }
        progress.OnProgress(ingest::progress::SearchTableDefinition{reader.Position(), reader.Size()});
        if (*kind == dump::LineKind::kCreateTable) {
          found = true;
          break;
        }
      }
      if (!found) break;
    }
    definition_pending = false;

    // 2. schema
    const auto parsed = reader.ParseTableDefinition();
    const auto family = matcher_.Match(parsed);
    if (!family) {
      BIBMIRROR_LOG_DEBUG("skipping unrecognized table", {observability::StringField("table", parsed.table_name)});
      continue;
    }
    progress.OnProgress(ingest::progress::TableDefinitionFound{*family});

    if (expected && *expected != *family) {
      progress.OnProgress(ingest::progress::WrongTableDefinition{*expected, *family});
      return IngestResult::Failed(ErrorKind::kWrongTable, "dump contains " + std::string(model::ToString(*family)) + " table, expected " +
                                                              std::string(model::ToString(*expected)));
    }

    // 3. data section
    bool found_data = false;
    while (auto kind = reader.ReadLine()) {
      if (CancellationRequested(stop, "data scan")) {
        return IngestResult::Terminal(IngestStatus::kCancelled, totals.added, totals.updated);
      }
      progress.OnProgress(ingest::progress::SearchTableDefinition{reader.Position(), reader.Size()});
      if (*kind == dump::LineKind::kInsert) {
        found_data = true;
        break;
      }
      if (*kind == dump::LineKind::kCreateTable) {
        definition_pending = true;
        break;
      }
    }
    if (!found_data) {
      BIBMIRROR_LOG_DEBUG("table has no data", {observability::StringField("table", parsed.table_name)});
      continue;
    }

    // 4. merge
    auto merge = ingest::VisitFamily(*family, [&](auto traits) {
      return ImportSegment<decltype(traits)>(reader, parsed, progress, stop, totals, definition_pending);
    });
    totals.added += merge.added;
    totals.updated += merge.updated;
    if (merge.status != MergeStatus::kCompleted) return FromMerge(merge, totals.added, totals.updated);

    // 5. bookkeeping
    imported_any = true;
    MarkFirstImportComplete(*family);
    RefreshCounts();
  }

  if (!imported_any) {
    BIBMIRROR_LOG_WARN("no importable data found in dump", {observability::UintField("parse_faults", reader.ParseFaults())});
    return IngestResult::Terminal(IngestStatus::kDataNotFound);
  }

  progress.OnProgress(ingest::progress::Completed{totals.added, totals.updated});
  return IngestResult::Terminal(IngestStatus::kCompleted, totals.added, totals.updated);
}

template <typename Traits>
ingest::MergeResult CatalogMirror::ImportSegment(dump::DumpReader& reader, const catalog::ParsedTableDefinition& parsed,
                                                 ingest::ProgressSink& sink, std::stop_token stop, const Totals& totals,
                                                 bool& definition_pending) {
  using Record = typename Traits::Record;

  // indexes and the presence index only matter when rows already exist
  ingest::PresenceIndex presence;
  if (RecordCount(Traits::kFamily) != 0) {
    if (!EnsureDedupIndexes(Traits::kFamily, sink, stop)) return {MergeStatus::kCancelled, 0, 0};
    presence = LoadPresenceIndex(Traits::kFamily, sink);
  }

  uint64_t skipped       = 0;
  bool     cut_by_cancel = false;

  // Pulls tuples across consecutive INSERT lines until the next CREATE
  // TABLE or end of dump. Ends early when a stop arrives between lines.
  auto next = [&]() -> std::optional<Record> {
    for (;;) {
      if (auto values = reader.ReadRow()) {
        auto row = BuildRow(reader, parsed, *values);
        if (row) {
          if (auto record = Traits::FromRow(*row)) return record;
        }
        ++skipped;
        continue;
      }

      if (CancellationRequested(stop, "segment scan")) {
        cut_by_cancel = true;
        return std::nullopt;
      }
      auto kind = reader.ReadLine();
      if (!kind) return std::nullopt;
      if (*kind == dump::LineKind::kCreateTable) {
        definition_pending = true;
        return std::nullopt;
      }
    }
  };

  auto on_checkpoint = [&](const ingest::MergeResult& r) {
    sink.OnProgress(ingest::progress::ImportObjects{totals.added + r.added, totals.updated + r.updated});
  };

  ingest::MergeEngine<Traits> engine(*repository_, presence, *disk_,
                                     {options_.import_checkpoint_interval, options_.low_disk_space_threshold_bytes});
  auto result = engine.Run(next, on_checkpoint, stop);
  if (cut_by_cancel && result.status == MergeStatus::kCompleted) result.status = MergeStatus::kCancelled;

  if (skipped > 0) {
    BIBMIRROR_LOG_WARN("skipped unusable rows",
                       {observability::StringField("table", parsed.table_name), observability::UintField("rows", skipped)});
  }
  return result;
}

// ------------------------------------------------------------------
// Synchronization
// ------------------------------------------------------------------

IngestResult CatalogMirror::RunSync(Family family, ingest::ProgressSink& sink, std::stop_token stop) {
  return ingest::VisitFamily(family, [&](auto traits) { return SyncFamily<decltype(traits)>(sink, stop); });
}

template <typename Traits>
IngestResult CatalogMirror::SyncFamily(ingest::ProgressSink& sink, std::stop_token stop) {
  using Record = typename Traits::Record;

  ingest::ThrottledProgressSink progress(sink, options_.progress_interval);
  const auto                    family_name = std::string(model::ToString(Traits::kFamily));

  if (CancellationRequested(stop, "sync start")) return IngestResult::Terminal(IngestStatus::kCancelled);

  // deltas cannot bootstrap an empty family
  RefreshCounts();
  if (RecordCount(Traits::kFamily) == 0) {
    return IngestResult::Failed(ErrorKind::kEmptyFamily, "cannot synchronize empty " + family_name + " table; import a dump first");
  }

  if (ProbeLowDiskSpace(progress)) return IngestResult::Terminal(IngestStatus::kLowDiskSpace);
  if (!EnsureDedupIndexes(Traits::kFamily, progress, stop)) return IngestResult::Terminal(IngestStatus::kCancelled);

  model::WatermarkCursor cursor;
  {
    auto tx     = repository_->Begin();
    auto latest = Traits::LoadLatest(*repository_, *tx);
    tx->Commit();
    if (latest) cursor = Traits::Watermark(*latest);
  }

  auto source = delta_sources_ ? delta_sources_(Traits::kFamily, cursor) : nullptr;
  if (!source) {
    return IngestResult::Failed(ErrorKind::kNotConfigured, "no delta endpoint configured for " + family_name);
  }

  auto presence = LoadPresenceIndex(Traits::kFamily, progress);

  ingest::MergeEngine<Traits> engine(*repository_, presence, *disk_,
                                     {options_.sync_checkpoint_interval, options_.low_disk_space_threshold_bytes});
  Totals   totals;
  uint64_t downloaded = 0;

  for (;;) {
    if (CancellationRequested(stop, "sync batch")) {
      return IngestResult::Terminal(IngestStatus::kCancelled, totals.added, totals.updated);
    }

    auto batch = source->FetchNextBatch(stop);
    if (batch.status == sync::DeltaBatch::Status::kCancelled) {
      return IngestResult::Terminal(IngestStatus::kCancelled, totals.added, totals.updated);
    }
    if (batch.status == sync::DeltaBatch::Status::kExhausted) break;

    downloaded += batch.rows.size();

    std::vector<Record> records;
    records.reserve(batch.rows.size());
    for (const auto& row : batch.rows) {
      if (auto record = Traits::FromRow(row)) records.push_back(std::move(*record));
    }

    size_t next_index = 0;
    auto   next       = [&]() -> std::optional<Record> {
      if (next_index >= records.size()) return std::nullopt;
      return std::move(records[next_index++]);
    };
    auto on_checkpoint = [&](const ingest::MergeResult& r) {
      progress.OnProgress(ingest::progress::SyncObjects{downloaded, totals.added + r.added, totals.updated + r.updated});
    };

    auto merge = engine.Run(next, on_checkpoint, stop);
    totals.added += merge.added;
    totals.updated += merge.updated;
    if (merge.status != MergeStatus::kCompleted) return FromMerge(merge, totals.added, totals.updated);

    cursor.Advance(source->Cursor());
  }

  BIBMIRROR_LOG_DEBUG("sync watermark",
                      {observability::StringField("family", family_name),
                       observability::StringField("timestamp", util::FormatTimestamp(cursor.timestamp)),
                       observability::UintField("remote_id", cursor.remote_id)});

  progress.OnProgress(ingest::progress::Completed{totals.added, totals.updated});
  return IngestResult::Terminal(IngestStatus::kCompleted, totals.added, totals.updated);
}

// ------------------------------------------------------------------
// Shared steps
// ------------------------------------------------------------------

bool CatalogMirror::ProbeLowDiskSpace(ingest::ProgressSink& sink) {
  const auto free_bytes = disk_->FreeBytes();
  sink.OnProgress(ingest::progress::DiskSpace{free_bytes});

  if (!ingest::IsLowDiskSpace(free_bytes, options_.low_disk_space_threshold_bytes)) return false;

  BIBMIRROR_LOG_WARN("low disk space", {observability::UintField("free_bytes", *free_bytes),
                                        observability::UintField("threshold", options_.low_disk_space_threshold_bytes)});
  return true;
}

bool CatalogMirror::EnsureDedupIndexes(Family family, ingest::ProgressSink& sink, std::stop_token stop) {
  return ingest::VisitFamily(family, [&](auto traits) {
    using Traits = decltype(traits);

    auto       tx       = repository_->Begin();
    const auto existing = repository_->ListIndexes(*tx, family);

    for (auto column : Traits::kIndexedColumns) {
      const auto name = db::sql::IndexName(family, std::string(column));
      if (std::find(existing.begin(), existing.end(), name) != existing.end()) continue;

      if (CancellationRequested(stop, "index creation")) {
        tx->Commit();
        return false;
      }

      sink.OnProgress(ingest::progress::CreateIndex{std::string(column)});
      BIBMIRROR_LOG_DEBUG("creating index", {observability::StringField("index", name)});

      auto r = repository_->CreateIndex(*tx, family, name, std::string(column));
      if (!r) throw util::StorageError("cannot create index " + name + ": " + db::Describe(r));
    }
    tx->Commit();
    return true;
  });
}

ingest::PresenceIndex CatalogMirror::LoadPresenceIndex(Family family, ingest::ProgressSink& sink) {
  sink.OnProgress(ingest::progress::LoadRemoteIds{});

  ingest::PresenceIndex presence;
  auto                  tx = repository_->Begin();
  auto                  r  = repository_->ScanRemoteIds(*tx, family, [&](uint64_t remote_id) { presence.Set(remote_id); });
  tx->Commit();
  if (!r) throw util::StorageError("cannot load remote ids: " + db::Describe(r));

  BIBMIRROR_LOG_DEBUG("presence index loaded",
                      {observability::StringField("family", model::ToString(family)), observability::UintField("ids", presence.Count())});
  return presence;
}

void CatalogMirror::MarkFirstImportComplete(Family family) {
  auto tx       = repository_->Begin();
  auto metadata = repository_->GetMetadata(*tx).value_or(FreshMetadata());

  switch (family) {
    case Family::kNonFiction:
      metadata.non_fiction_first_import_complete = true;
      break;
    case Family::kFiction:
      metadata.fiction_first_import_complete = true;
      break;
    case Family::kSciMag:
      metadata.scimag_first_import_complete = true;
      break;
  }

  auto r = repository_->UpsertMetadata(*tx, metadata);
  if (!r) throw util::StorageError("cannot update metadata: " + db::Describe(r));
  tx->Commit();
}

// ------------------------------------------------------------------
// Counts and statistics
// ------------------------------------------------------------------

void CatalogMirror::RefreshCounts() {
  auto tx = repository_->Begin();
  for (auto family : model::kAllFamilies) {
    counts_[Slot(family)].store(repository_->CountRecords(*tx, family));
  }
  tx->Commit();
}

uint64_t CatalogMirror::RecordCount(Family family) const {
  return counts_[Slot(family)].load();
}

bool CatalogMirror::StatsIndexesCreated() {
  auto tx = repository_->Begin();
  bool created = true;
  for (auto family : model::kAllFamilies) {
    ingest::VisitFamily(family, [&](auto traits) {
      using Traits     = decltype(traits);
      const auto names = repository_->ListIndexes(*tx, family);
      const auto name  = db::sql::IndexName(family, std::string(Traits::kTimestampColumn));
      if (std::find(names.begin(), names.end(), name) == names.end()) created = false;
    });
  }
  tx->Commit();
  return created;
}

DatabaseStats CatalogMirror::GetDatabaseStats() {
  DatabaseStats stats;

  auto tx = repository_->Begin();
  for (auto family : model::kAllFamilies) {
    ingest::VisitFamily(family, [&](auto traits) {
      using Traits = decltype(traits);

      FamilyStats entry{family, repository_->CountRecords(*tx, family), std::nullopt};
      if (entry.count > 0) {
        const auto column = std::string(Traits::kTimestampColumn);
        const auto name   = db::sql::IndexName(family, column);
        const auto names  = repository_->ListIndexes(*tx, family);
        if (std::find(names.begin(), names.end(), name) == names.end()) {
          auto r = repository_->CreateIndex(*tx, family, name, column);
          if (!r) throw util::StorageError("cannot create index " + name + ": " + db::Describe(r));
        }
        if (auto latest = Traits::LoadLatest(*repository_, *tx)) entry.last_update = Traits::Watermark(*latest).timestamp;
      }
      counts_[Slot(family)].store(entry.count);
      stats.families.push_back(entry);
    });
  }
  tx->Commit();
  return stats;
}

} // namespace bibmirror::core
