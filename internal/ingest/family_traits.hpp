#pragma once

#include <array>
#include <optional>
#include <string_view>
#include <utility>

#include "internal/db/api/repository.hpp"
#include "internal/ingest/raw_row.hpp"
#include "internal/model/family.hpp"
#include "internal/model/watermark.hpp"
#include "internal/util/errors.hpp"

namespace bibmirror::ingest {

/*
  Per-family strategy plugged into the generic merge pipeline.

  Each traits type provides:

    Record                       stored record type
    kFamily                      family tag
    kIndexedColumns              local columns the dedup/sync path needs indexed
    kTimestampColumn             local change-detection column (stats, watermark)
    RemoteId(r)                  dedup key
    IsNewer(incoming, stored)    change detection; strictly newer only
    Watermark(r)                 cursor position of a record
    Load / LoadLatest            storage reads
    Insert / Update              storage writes
    FromRow(row)                 upstream row -> record, nullopt if unusable
*/

struct NonFictionTraits {
  using Record = db::model::NonFictionBookRecord;

  static constexpr auto kFamily = bibmirror::model::Family::kNonFiction;

  static constexpr std::array<std::string_view, 2> kIndexedColumns = {"LibgenId", "LastModifiedDateTime"};
  static constexpr std::string_view                kTimestampColumn = "LastModifiedDateTime";

  static uint64_t RemoteId(const Record& r) {
    return r.remote_id;
  }

  static bool IsNewer(const Record& incoming, const Record& stored) {
    return incoming.last_modified_at > stored.last_modified_at;
  }

  static model::WatermarkCursor Watermark(const Record& r) {
    return {r.last_modified_at, r.remote_id};
  }

  static std::optional<Record> Load(db::Repository& repo, db::Transaction& tx, uint64_t remote_id) {
    return repo.GetNonFictionBookByRemoteId(tx, remote_id);
  }

  static std::optional<Record> LoadLatest(db::Repository& repo, db::Transaction& tx) {
    return repo.GetLastModifiedNonFictionBook(tx);
  }

  static db::Result Insert(db::Repository& repo, db::Transaction& tx, Record& r) {
    return repo.InsertNonFictionBook(tx, r);
  }

  static db::Result Update(db::Repository& repo, db::Transaction& tx, const Record& r) {
    return repo.UpdateNonFictionBook(tx, r);
  }

  static std::optional<Record> FromRow(const RawRow& row);
};

struct FictionTraits {
  using Record = db::model::FictionBookRecord;

  static constexpr auto kFamily = bibmirror::model::Family::kFiction;

  static constexpr std::array<std::string_view, 2> kIndexedColumns = {"LibgenId", "LastModifiedDateTime"};
  static constexpr std::string_view                kTimestampColumn = "LastModifiedDateTime";

  static uint64_t RemoteId(const Record& r) {
    return r.remote_id;
  }

  static bool IsNewer(const Record& incoming, const Record& stored) {
    return incoming.last_modified_at > stored.last_modified_at;
  }

  static model::WatermarkCursor Watermark(const Record& r) {
    return {r.last_modified_at, r.remote_id};
  }

  static std::optional<Record> Load(db::Repository& repo, db::Transaction& tx, uint64_t remote_id) {
    return repo.GetFictionBookByRemoteId(tx, remote_id);
  }

  static std::optional<Record> LoadLatest(db::Repository& repo, db::Transaction& tx) {
    return repo.GetLastModifiedFictionBook(tx);
  }

  static db::Result Insert(db::Repository& repo, db::Transaction& tx, Record& r) {
    return repo.InsertFictionBook(tx, r);
  }

  static db::Result Update(db::Repository& repo, db::Transaction& tx, const Record& r) {
    return repo.UpdateFictionBook(tx, r);
  }

  static std::optional<Record> FromRow(const RawRow& row);
};

// Articles are never modified upstream; the added time is their only
// change-detection and watermark field.
struct SciMagTraits {
  using Record = db::model::SciMagArticleRecord;

  static constexpr auto kFamily = bibmirror::model::Family::kSciMag;

  static constexpr std::array<std::string_view, 2> kIndexedColumns = {"LibgenId", "AddedDateTime"};
  static constexpr std::string_view                kTimestampColumn = "AddedDateTime";

  static uint64_t RemoteId(const Record& r) {
    return r.remote_id;
  }

  static bool IsNewer(const Record& incoming, const Record& stored) {
    return incoming.added_at > stored.added_at;
  }

  static model::WatermarkCursor Watermark(const Record& r) {
    return {r.added_at, r.remote_id};
  }

  static std::optional<Record> Load(db::Repository& repo, db::Transaction& tx, uint64_t remote_id) {
    return repo.GetSciMagArticleByRemoteId(tx, remote_id);
  }

  static std::optional<Record> LoadLatest(db::Repository& repo, db::Transaction& tx) {
    return repo.GetLastAddedSciMagArticle(tx);
  }

  static db::Result Insert(db::Repository& repo, db::Transaction& tx, Record& r) {
    return repo.InsertSciMagArticle(tx, r);
  }

  static db::Result Update(db::Repository& repo, db::Transaction& tx, const Record& r) {
    return repo.UpdateSciMagArticle(tx, r);
  }

  static std::optional<Record> FromRow(const RawRow& row);
};

// Calls fn with the traits object matching family.
template <typename Fn>
decltype(auto) VisitFamily(bibmirror::model::Family family, Fn&& fn) {
  switch (family) {
    case bibmirror::model::Family::kNonFiction:
      return std::forward<Fn>(fn)(NonFictionTraits{});
    case bibmirror::model::Family::kFiction:
      return std::forward<Fn>(fn)(FictionTraits{});
    case bibmirror::model::Family::kSciMag:
      return std::forward<Fn>(fn)(SciMagTraits{});
  }
  throw util::InvalidState("unknown record family");
}

} // namespace bibmirror::ingest
