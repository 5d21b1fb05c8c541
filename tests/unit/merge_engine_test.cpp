#include "internal/ingest/merge_engine.hpp"

#include <cassert>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <stop_token>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/ingest/family_traits.hpp"
#include "tests/support/test_support.hpp"

namespace {

using bibmirror::db::memory::MemoryRepository;
using bibmirror::db::model::NonFictionBookRecord;
using bibmirror::db::model::SciMagArticleRecord;
using bibmirror::ingest::MergeEngine;
using bibmirror::ingest::MergeOptions;
using bibmirror::ingest::MergeResult;
using bibmirror::ingest::MergeStatus;
using bibmirror::ingest::NonFictionTraits;
using bibmirror::ingest::PresenceIndex;
using bibmirror::ingest::SciMagTraits;
using bibmirror::model::Family;
using bibmirror::testing::ScriptedDiskSpaceProbe;

constexpr uint64_t kPlentyOfSpace = 1ull << 40;

NonFictionBookRecord Book(uint64_t remote_id, const std::string& title, const std::string& modified) {
  NonFictionBookRecord r;
  r.remote_id        = remote_id;
  r.title            = title;
  r.added_at         = *bibmirror::util::ParseTimestamp("2000-01-01 00:00:00");
  r.last_modified_at = *bibmirror::util::ParseTimestamp(modified);
  return r;
}

// Replays a fixed record list.
template <typename Record>
std::function<std::optional<Record>()> SourceOf(std::vector<Record> records) {
  auto index = std::make_shared<size_t>(0);
  auto list  = std::make_shared<std::vector<Record>>(std::move(records));
  return [index, list]() -> std::optional<Record> {
    if (*index >= list->size()) return std::nullopt;
    return (*list)[(*index)++];
  };
}

std::vector<NonFictionBookRecord> Books(uint64_t first, uint64_t last, const std::string& modified) {
  std::vector<NonFictionBookRecord> out;
  for (uint64_t id = first; id <= last; ++id) out.push_back(Book(id, "Book " + std::to_string(id), modified));
  return out;
}

uint64_t Count(MemoryRepository& repo, Family family) {
  auto tx    = repo.Begin();
  auto count = repo.CountRecords(*tx, family);
  tx->Commit();
  return count;
}

std::optional<NonFictionBookRecord> Stored(MemoryRepository& repo, uint64_t remote_id) {
  auto tx = repo.Begin();
  auto r  = repo.GetNonFictionBookByRemoteId(*tx, remote_id);
  tx->Commit();
  return r;
}

/*
  Delegates to a MemoryRepository but refuses non-fiction inserts with
  DiskFull once `room` inserts have gone through.
*/
class FillingRepository final : public bibmirror::db::Repository {
 public:
  using Transaction = bibmirror::db::Transaction;
  using Result      = bibmirror::db::Result;

  FillingRepository(MemoryRepository& inner, uint64_t room) : inner_(inner), room_(room) {
  }

  std::unique_ptr<Transaction> Begin() override {
    return inner_.Begin();
  }

  std::optional<bibmirror::db::model::MetadataRecord> GetMetadata(Transaction& t) override {
    return inner_.GetMetadata(t);
  }
  Result UpsertMetadata(Transaction& t, const bibmirror::db::model::MetadataRecord& m) override {
    return inner_.UpsertMetadata(t, m);
  }

  Result InsertNonFictionBook(Transaction& t, NonFictionBookRecord& r) override {
    if (room_ == 0) return Result::Err(bibmirror::db::ErrorCode::DiskFull, "database or disk is full");
    --room_;
    return inner_.InsertNonFictionBook(t, r);
  }
  Result UpdateNonFictionBook(Transaction& t, const NonFictionBookRecord& r) override {
    return inner_.UpdateNonFictionBook(t, r);
  }
  std::optional<NonFictionBookRecord> GetNonFictionBookByRemoteId(Transaction& t, uint64_t id) override {
    return inner_.GetNonFictionBookByRemoteId(t, id);
  }
  std::optional<NonFictionBookRecord> GetLastModifiedNonFictionBook(Transaction& t) override {
    return inner_.GetLastModifiedNonFictionBook(t);
  }

  Result InsertFictionBook(Transaction& t, bibmirror::db::model::FictionBookRecord& r) override {
    return inner_.InsertFictionBook(t, r);
  }
  Result UpdateFictionBook(Transaction& t, const bibmirror::db::model::FictionBookRecord& r) override {
    return inner_.UpdateFictionBook(t, r);
  }
  std::optional<bibmirror::db::model::FictionBookRecord> GetFictionBookByRemoteId(Transaction& t, uint64_t id) override {
    return inner_.GetFictionBookByRemoteId(t, id);
  }
  std::optional<bibmirror::db::model::FictionBookRecord> GetLastModifiedFictionBook(Transaction& t) override {
    return inner_.GetLastModifiedFictionBook(t);
  }

  Result InsertSciMagArticle(Transaction& t, SciMagArticleRecord& r) override {
    return inner_.InsertSciMagArticle(t, r);
  }
  Result UpdateSciMagArticle(Transaction& t, const SciMagArticleRecord& r) override {
    return inner_.UpdateSciMagArticle(t, r);
  }
  std::optional<SciMagArticleRecord> GetSciMagArticleByRemoteId(Transaction& t, uint64_t id) override {
    return inner_.GetSciMagArticleByRemoteId(t, id);
  }
  std::optional<SciMagArticleRecord> GetLastAddedSciMagArticle(Transaction& t) override {
    return inner_.GetLastAddedSciMagArticle(t);
  }

  uint64_t CountRecords(Transaction& t, Family family) override {
    return inner_.CountRecords(t, family);
  }
  Result ScanRemoteIds(Transaction& t, Family family, const std::function<void(uint64_t)>& visitor) override {
    return inner_.ScanRemoteIds(t, family, visitor);
  }
  std::vector<std::string> ListIndexes(Transaction& t, Family family) override {
    return inner_.ListIndexes(t, family);
  }
  Result CreateIndex(Transaction& t, Family family, const std::string& name, const std::string& column) override {
    return inner_.CreateIndex(t, family, name, column);
  }

 private:
  MemoryRepository& inner_;
  uint64_t          room_;
};

void TestRerunIsIdempotent() {
  MemoryRepository       repo;
  ScriptedDiskSpaceProbe disk({kPlentyOfSpace});
  PresenceIndex          presence;

  MergeEngine<NonFictionTraits> engine(repo, presence, disk, MergeOptions{10, 100});

  auto first = engine.Run(SourceOf(Books(1, 3, "2020-01-01 00:00:00")), nullptr, {});
  assert(first.status == MergeStatus::kCompleted);
  assert(first.added == 3);
  assert(first.updated == 0);

  auto second = engine.Run(SourceOf(Books(1, 3, "2020-01-01 00:00:00")), nullptr, {});
  assert(second.status == MergeStatus::kCompleted);
  assert(second.added == 0);
  assert(second.updated == 0);
  assert(Count(repo, Family::kNonFiction) == 3);
}

void TestNewerRecordUpdatesInPlace() {
  MemoryRepository       repo;
  ScriptedDiskSpaceProbe disk({kPlentyOfSpace});
  PresenceIndex          presence;

  MergeEngine<NonFictionTraits> engine(repo, presence, disk, MergeOptions{10, 100});
  (void)engine.Run(SourceOf(Books(1, 2, "2020-01-01 00:00:00")), nullptr, {});

  const auto before = Stored(repo, 2);
  assert(before.has_value());

  // same timestamp: not newer, ignored
  auto tie = engine.Run(SourceOf(std::vector{Book(2, "Tied", "2020-01-01 00:00:00")}), nullptr, {});
  assert(tie.updated == 0);
  assert(Stored(repo, 2)->title == "Book 2");

  // older: ignored
  auto older = engine.Run(SourceOf(std::vector{Book(2, "Older", "2019-06-01 00:00:00")}), nullptr, {});
  assert(older.updated == 0);

  auto newer = engine.Run(SourceOf(std::vector{Book(2, "Revised", "2021-02-03 04:05:06")}), nullptr, {});
  assert(newer.added == 0);
  assert(newer.updated == 1);

  const auto after = Stored(repo, 2);
  assert(after->title == "Revised");
  assert(after->id == before->id);
  assert(Count(repo, Family::kNonFiction) == 2);
}

void TestDuplicatesWithinOneRunCollapse() {
  MemoryRepository       repo;
  ScriptedDiskSpaceProbe disk({kPlentyOfSpace});
  PresenceIndex          presence;

  MergeEngine<NonFictionTraits> engine(repo, presence, disk, MergeOptions{2, 100});
  auto result = engine.Run(SourceOf(std::vector{Book(7, "First", "2020-01-01 00:00:00"), Book(8, "Other", "2020-01-01 00:00:00"),
                                                Book(7, "Second", "2020-05-01 00:00:00")}),
                           nullptr, {});

  assert(result.added == 2);
  assert(result.updated == 1);
  assert(Stored(repo, 7)->title == "Second");
}

void TestLowDiskSpaceStopsAtCheckpoint() {
  MemoryRepository repo;
  // checkpoints after records 2 and 4 see enough space, the one after 6 does not
  ScriptedDiskSpaceProbe disk({1000, 1000, 10});
  PresenceIndex          presence;

  std::vector<MergeResult>      checkpoints;
  MergeEngine<NonFictionTraits> engine(repo, presence, disk, MergeOptions{2, 100});
  auto result = engine.Run(SourceOf(Books(1, 10, "2020-01-01 00:00:00")),
                           [&](const MergeResult& r) { checkpoints.push_back(r); }, {});

  assert(result.status == MergeStatus::kLowDiskSpace);
  assert(result.added == 6);
  assert(checkpoints.size() == 3);
  assert(checkpoints.back().added == 6);

  // the interrupted run keeps what it committed
  assert(Count(repo, Family::kNonFiction) == 6);
  assert(!Stored(repo, 7).has_value());
}

void TestUnknownDiskSpaceIsNotLow() {
  MemoryRepository       repo;
  ScriptedDiskSpaceProbe disk({std::nullopt});
  PresenceIndex          presence;

  MergeEngine<NonFictionTraits> engine(repo, presence, disk, MergeOptions{1, 100});
  auto result = engine.Run(SourceOf(Books(1, 4, "2020-01-01 00:00:00")), nullptr, {});

  assert(result.status == MergeStatus::kCompleted);
  assert(result.added == 4);
}

void TestCancellationCommitsProcessedRecords() {
  MemoryRepository       repo;
  ScriptedDiskSpaceProbe disk({kPlentyOfSpace});
  PresenceIndex          presence;
  std::stop_source       stop;

  auto books  = Books(1, 10, "2020-01-01 00:00:00");
  auto served = std::make_shared<size_t>(0);
  auto source = [&, served]() -> std::optional<NonFictionBookRecord> {
    if (*served >= books.size()) return std::nullopt;
    auto r = books[(*served)++];
    if (*served == 3) stop.request_stop();
    return r;
  };

  MergeEngine<NonFictionTraits> engine(repo, presence, disk, MergeOptions{1000, 100});
  auto                          result = engine.Run(source, nullptr, stop.get_token());

  assert(result.status == MergeStatus::kCancelled);
  assert(result.added == 3);
  assert(Count(repo, Family::kNonFiction) == 3);

  // a fresh run picks up where the cancelled one stopped
  auto resumed = engine.Run(SourceOf(Books(1, 10, "2020-01-01 00:00:00")), nullptr, {});
  assert(resumed.added == 7);
  assert(Count(repo, Family::kNonFiction) == 10);
}

void TestStorageFailureThrows() {
  MemoryRepository       repo;
  ScriptedDiskSpaceProbe disk({kPlentyOfSpace});
  PresenceIndex          seeded;

  MergeEngine<NonFictionTraits> seed(repo, seeded, disk, MergeOptions{10, 100});
  (void)seed.Run(SourceOf(Books(1, 1, "2020-01-01 00:00:00")), nullptr, {});

  // an index that does not know about id 1 makes the insert collide
  PresenceIndex                 stale;
  MergeEngine<NonFictionTraits> engine(repo, stale, disk, MergeOptions{10, 100});

  bool threw = false;
  try {
    (void)engine.Run(SourceOf(std::vector{Book(2, "New", "2020-01-01 00:00:00"), Book(1, "Clash", "2020-01-01 00:00:00")}), nullptr, {});
  } catch (const bibmirror::util::StorageError&) {
    threw = true;
  }
  assert(threw);

  // the failed transaction rolled back, including record 2
  assert(Count(repo, Family::kNonFiction) == 1);
}

void TestFullStorageStopsAtLastCommit() {
  MemoryRepository       inner;
  FillingRepository      repo(inner, 5);
  ScriptedDiskSpaceProbe disk({kPlentyOfSpace});
  PresenceIndex          presence;

  // checkpoints after 2 and 4; the 6th insert fails in the third interval
  MergeEngine<NonFictionTraits> engine(repo, presence, disk, MergeOptions{2, 100});

  std::vector<MergeResult> checkpoints;
  auto result = engine.Run(SourceOf(Books(1, 10, "2020-01-01 00:00:00")),
                           [&](const MergeResult& r) { checkpoints.push_back(r); }, {});

  assert(result.status == MergeStatus::kLowDiskSpace);
  assert(result.added == 4);
  assert(checkpoints.size() == 2);
  // the interval holding record 5 was rolled back
  assert(Count(inner, Family::kNonFiction) == 4);
  assert(!Stored(inner, 5).has_value());
}

void TestSciMagUsesAddedTime() {
  MemoryRepository       repo;
  ScriptedDiskSpaceProbe disk({kPlentyOfSpace});
  PresenceIndex          presence;

  SciMagArticleRecord article;
  article.remote_id = 11;
  article.doi       = "10.1000/a";
  article.added_at  = *bibmirror::util::ParseTimestamp("2018-01-01 00:00:00");

  auto revised     = article;
  revised.doi      = "10.1000/b";
  revised.added_at = *bibmirror::util::ParseTimestamp("2018-01-02 00:00:00");

  MergeEngine<SciMagTraits> engine(repo, presence, disk, MergeOptions{10, 100});
  auto                      result = engine.Run(SourceOf(std::vector{article, revised}), nullptr, {});

  assert(result.added == 1);
  assert(result.updated == 1);

  auto tx     = repo.Begin();
  auto stored = repo.GetSciMagArticleByRemoteId(*tx, 11);
  tx->Commit();
  assert(stored->doi == "10.1000/b");
}

void TestFromRowRequiresUsableId() {
  bibmirror::ingest::RawRow row;
  row.Set("ID", std::string("0"));
  row.Set("Title", std::string("Zero"));
  assert(!NonFictionTraits::FromRow(row).has_value());

  // ids beyond the int(11) range are skipped, not indexed
  row.Set("ID", std::string("18446744073709551615"));
  assert(!NonFictionTraits::FromRow(row).has_value());
  row.Set("ID", std::string("2147483648"));
  assert(!NonFictionTraits::FromRow(row).has_value());
  row.Set("ID", std::string("1000000000000"));
  assert(!bibmirror::ingest::FictionTraits::FromRow(row).has_value());
  row.Set("ID", std::string("2147483647"));
  assert(SciMagTraits::FromRow(row).has_value());

  row.Set("ID", std::string("15"));
  row.Set("Extension", std::string("djvu"));
  row.Set("TimeAdded", std::string("2001-02-03 04:05:06"));
  auto record = NonFictionTraits::FromRow(row);
  assert(record.has_value());
  assert(record->remote_id == 15);
  assert(record->format == "djvu");
  // no modification time: falls back to the added time
  assert(record->last_modified_at == record->added_at);
}

} // namespace

int main() {
  TestRerunIsIdempotent();
  TestNewerRecordUpdatesInPlace();
  TestDuplicatesWithinOneRunCollapse();
  TestLowDiskSpaceStopsAtCheckpoint();
  TestUnknownDiskSpaceIsNotLow();
  TestCancellationCommitsProcessedRecords();
  TestStorageFailureThrows();
  TestFullStorageStopsAtLastCommit();
  TestSciMagUsesAddedTime();
  TestFromRowRequiresUsableId();

  std::cout << "bibmirror_unit_merge_engine: pass\n";
  return 0;
}
