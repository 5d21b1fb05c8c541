#include "memory_repository.hpp"

#include <tuple>

#include "memory_tx.hpp"

namespace bibmirror::db::memory {

using bibmirror::model::Family;

namespace {

template <typename Record>
Result InsertInto(std::map<uint64_t, Record>& table, int64_t& next_id, Record& r) {
  if (table.contains(r.remote_id)) return Result::Err(ErrorCode::ConstraintViolation, "duplicate remote id");
  r.id               = next_id++;
  table[r.remote_id] = r;
  return Result::Ok();
}

template <typename Record>
Result UpdateIn(std::map<uint64_t, Record>& table, const Record& r) {
  auto it = table.find(r.remote_id);
  if (it == table.end()) return Result::Err(ErrorCode::NotFound);
  const int64_t id = it->second.id;
  it->second       = r;
  it->second.id    = id;
  return Result::Ok();
}

template <typename Record>
std::optional<Record> FindIn(const std::map<uint64_t, Record>& table, uint64_t remote_id) {
  auto it = table.find(remote_id);
  if (it == table.end()) return std::nullopt;
  return it->second;
}

// Latest record by (key(record), remote id).
template <typename Record, typename Key>
std::optional<Record> LatestIn(const std::map<uint64_t, Record>& table, Key key) {
  const Record* best = nullptr;
  for (const auto& [_, r] : table) {
    if (!best || std::tie(key(r), r.remote_id) > std::tie(key(*best), best->remote_id)) best = &r;
  }
  if (!best) return std::nullopt;
  return *best;
}

template <typename Record>
void VisitKeys(const std::map<uint64_t, Record>& table, const std::function<void(uint64_t)>& visitor) {
  for (const auto& [remote_id, _] : table) visitor(remote_id);
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

std::optional<model::MetadataRecord> MemoryRepository::GetMetadata(Transaction& t) {
  return TX(t).View().metadata;
}

Result MemoryRepository::UpsertMetadata(Transaction& t, const model::MetadataRecord& r) {
  TX(t).Mutable().metadata = r;
  return Result::Ok();
}

Result MemoryRepository::InsertNonFictionBook(Transaction& t, model::NonFictionBookRecord& r) {
  auto& s = TX(t).Mutable();
  return InsertInto(s.non_fiction, s.next_non_fiction_id, r);
}

Result MemoryRepository::UpdateNonFictionBook(Transaction& t, const model::NonFictionBookRecord& r) {
  return UpdateIn(TX(t).Mutable().non_fiction, r);
}

std::optional<model::NonFictionBookRecord> MemoryRepository::GetNonFictionBookByRemoteId(Transaction& t, uint64_t remote_id) {
  return FindIn(TX(t).View().non_fiction, remote_id);
}

std::optional<model::NonFictionBookRecord> MemoryRepository::GetLastModifiedNonFictionBook(Transaction& t) {
  return LatestIn(TX(t).View().non_fiction, [](const auto& r) -> const util::TimePoint& { return r.last_modified_at; });
}

Result MemoryRepository::InsertFictionBook(Transaction& t, model::FictionBookRecord& r) {
  auto& s = TX(t).Mutable();
  return InsertInto(s.fiction, s.next_fiction_id, r);
}

Result MemoryRepository::UpdateFictionBook(Transaction& t, const model::FictionBookRecord& r) {
  return UpdateIn(TX(t).Mutable().fiction, r);
}

std::optional<model::FictionBookRecord> MemoryRepository::GetFictionBookByRemoteId(Transaction& t, uint64_t remote_id) {
  return FindIn(TX(t).View().fiction, remote_id);
}

std::optional<model::FictionBookRecord> MemoryRepository::GetLastModifiedFictionBook(Transaction& t) {
  return LatestIn(TX(t).View().fiction, [](const auto& r) -> const util::TimePoint& { return r.last_modified_at; });
}

Result MemoryRepository::InsertSciMagArticle(Transaction& t, model::SciMagArticleRecord& r) {
  auto& s = TX(t).Mutable();
  return InsertInto(s.scimag, s.next_scimag_id, r);
}

Result MemoryRepository::UpdateSciMagArticle(Transaction& t, const model::SciMagArticleRecord& r) {
  return UpdateIn(TX(t).Mutable().scimag, r);
}

std::optional<model::SciMagArticleRecord> MemoryRepository::GetSciMagArticleByRemoteId(Transaction& t, uint64_t remote_id) {
  return FindIn(TX(t).View().scimag, remote_id);
}

std::optional<model::SciMagArticleRecord> MemoryRepository::GetLastAddedSciMagArticle(Transaction& t) {
  return LatestIn(TX(t).View().scimag, [](const auto& r) -> const util::TimePoint& { return r.added_at; });
}

uint64_t MemoryRepository::CountRecords(Transaction& t, Family family) {
  const auto& s = TX(t).View();
  switch (family) {
    case Family::kNonFiction:
      return s.non_fiction.size();
    case Family::kFiction:
      return s.fiction.size();
    case Family::kSciMag:
      return s.scimag.size();
  }
  return 0;
}

Result MemoryRepository::ScanRemoteIds(Transaction& t, Family family, const std::function<void(uint64_t)>& visitor) {
  const auto& s = TX(t).View();
  switch (family) {
    case Family::kNonFiction:
      VisitKeys(s.non_fiction, visitor);
      break;
    case Family::kFiction:
      VisitKeys(s.fiction, visitor);
      break;
    case Family::kSciMag:
      VisitKeys(s.scimag, visitor);
      break;
  }
  return Result::Ok();
}

std::vector<std::string> MemoryRepository::ListIndexes(Transaction& t, Family family) {
  const auto& s  = TX(t).View();
  auto        it = s.indexes.find(family);
  if (it == s.indexes.end()) return {};
  return {it->second.begin(), it->second.end()};
}

Result MemoryRepository::CreateIndex(Transaction& t, Family family, const std::string& index_name, const std::string&) {
  TX(t).Mutable().indexes[family].insert(index_name);
  return Result::Ok();
}

} // namespace bibmirror::db::memory
