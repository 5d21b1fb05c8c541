#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace bibmirror::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  // Creates the metadata and family tables when missing.
  static void BootstrapSchema(SqliteDB& db);

  // True when the metadata table exists (fresh or foreign files lack it).
  static bool HasMetadataTable(SqliteDB& db);

  const std::string& Path() const { return db_->Path(); }

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
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
