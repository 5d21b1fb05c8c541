#pragma once

#include <map>
#include <mutex>
#include <set>
#include <string>

#include "internal/db/api/repository.hpp"

namespace bibmirror::db::memory {

class MemoryTransaction;

/*
  In-memory Repository used by tests and by the `memory` database backend.

  Each transaction works on a full snapshot of the committed state; commit
  swaps it in. Index creation is recorded by name only.
*/
class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  std::optional<model::MetadataRecord> GetMetadata(Transaction&) override;
  Result UpsertMetadata(Transaction&, const model::MetadataRecord&) override;

  Result InsertNonFictionBook(Transaction&, model::NonFictionBookRecord&) override;
  Result UpdateNonFictionBook(Transaction&, const model::NonFictionBookRecord&) override;
  std::optional<model::NonFictionBookRecord> GetNonFictionBookByRemoteId(Transaction&, uint64_t) override;
  std::optional<model::NonFictionBookRecord> GetLastModifiedNonFictionBook(Transaction&) override;

  Result InsertFictionBook(Transaction&, model::FictionBookRecord&) override;
  Result UpdateFictionBook(Transaction&, const model::FictionBookRecord&) override;
  std::optional<model::FictionBookRecord> GetFictionBookByRemoteId(Transaction&, uint64_t) override;
  std::optional<model::FictionBookRecord> GetLastModifiedFictionBook(Transaction&) override;

  Result InsertSciMagArticle(Transaction&, model::SciMagArticleRecord&) override;
  Result UpdateSciMagArticle(Transaction&, const model::SciMagArticleRecord&) override;
  std::optional<model::SciMagArticleRecord> GetSciMagArticleByRemoteId(Transaction&, uint64_t) override;
  std::optional<model::SciMagArticleRecord> GetLastAddedSciMagArticle(Transaction&) override;

  uint64_t CountRecords(Transaction&, bibmirror::model::Family) override;
  Result ScanRemoteIds(Transaction&, bibmirror::model::Family, const std::function<void(uint64_t)>&) override;
  std::vector<std::string> ListIndexes(Transaction&, bibmirror::model::Family) override;
  Result CreateIndex(Transaction&, bibmirror::model::Family, const std::string&, const std::string&) override;

private:
  friend class MemoryTransaction;

  struct State {
    std::optional<model::MetadataRecord> metadata;

    // keyed by remote id
    std::map<uint64_t, model::NonFictionBookRecord> non_fiction;
    std::map<uint64_t, model::FictionBookRecord>    fiction;
    std::map<uint64_t, model::SciMagArticleRecord>  scimag;

    std::map<bibmirror::model::Family, std::set<std::string>> indexes;

    int64_t next_non_fiction_id = 1;
    int64_t next_fiction_id     = 1;
    int64_t next_scimag_id      = 1;
  };

  std::mutex mutex_;
  State      committed_;
  uint64_t   committed_version_ = 0;
};

} // namespace bibmirror::db::memory
