#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/catalog_record.hpp"
#include "internal/db/model/metadata_record.hpp"
#include "internal/model/family.hpp"

namespace bibmirror::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes go through a Transaction
  - Reads inside a transaction see its writes
  - Insert assigns the surrogate id (monotonic, never reused) and
    writes it back into the record
  - Update addresses rows by remote id and keeps the surrogate id
  - At most one row per remote id; a second insert is ConstraintViolation
  - Reads return nullopt / zero only for absent data; a backend failure
    throws util::StorageError

  The repository never deletes catalog rows.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Database metadata
  // ---------------------------------------------------------------------

  virtual std::optional<model::MetadataRecord> GetMetadata(Transaction&) = 0;

  virtual Result UpsertMetadata(Transaction&, const model::MetadataRecord&) = 0;

  // ---------------------------------------------------------------------
  // Non-fiction
  // ---------------------------------------------------------------------

  virtual Result InsertNonFictionBook(Transaction&, model::NonFictionBookRecord&) = 0;

  virtual Result UpdateNonFictionBook(Transaction&, const model::NonFictionBookRecord&) = 0;

  virtual std::optional<model::NonFictionBookRecord> GetNonFictionBookByRemoteId(Transaction&, uint64_t remote_id) = 0;

  virtual std::optional<model::NonFictionBookRecord> GetLastModifiedNonFictionBook(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Fiction
  // ---------------------------------------------------------------------

  virtual Result InsertFictionBook(Transaction&, model::FictionBookRecord&) = 0;

  virtual Result UpdateFictionBook(Transaction&, const model::FictionBookRecord&) = 0;

  virtual std::optional<model::FictionBookRecord> GetFictionBookByRemoteId(Transaction&, uint64_t remote_id) = 0;

  virtual std::optional<model::FictionBookRecord> GetLastModifiedFictionBook(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Scientific articles
  // ---------------------------------------------------------------------

  virtual Result InsertSciMagArticle(Transaction&, model::SciMagArticleRecord&) = 0;

  virtual Result UpdateSciMagArticle(Transaction&, const model::SciMagArticleRecord&) = 0;

  virtual std::optional<model::SciMagArticleRecord> GetSciMagArticleByRemoteId(Transaction&, uint64_t remote_id) = 0;

  virtual std::optional<model::SciMagArticleRecord> GetLastAddedSciMagArticle(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Family-wide queries
  // ---------------------------------------------------------------------

  virtual uint64_t CountRecords(Transaction&, bibmirror::model::Family) = 0;

  // Visits every stored remote id of the family, in no particular order.
  virtual Result ScanRemoteIds(Transaction&, bibmirror::model::Family, const std::function<void(uint64_t)>& visitor) = 0;

  virtual std::vector<std::string> ListIndexes(Transaction&, bibmirror::model::Family) = 0;

  // Idempotent; name is the full index name (see db/sql/sql_queries.hpp).
  virtual Result CreateIndex(Transaction&, bibmirror::model::Family, const std::string& index_name, const std::string& column) = 0;
};

} // namespace bibmirror::db
