#include <cassert>
#include <algorithm>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/model/catalog_record.hpp"
#include "internal/db/model/metadata_record.hpp"
#include "internal/db/sql/sql_queries.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"

namespace {

using bibmirror::db::ErrorCode;
using bibmirror::db::Repository;
using bibmirror::db::memory::MemoryRepository;
using bibmirror::db::model::FictionBookRecord;
using bibmirror::db::model::MetadataRecord;
using bibmirror::db::model::NonFictionBookRecord;
using bibmirror::db::model::SciMagArticleRecord;
using bibmirror::db::sqlite::SqliteDB;
using bibmirror::db::sqlite::SqliteRepository;
using bibmirror::model::Family;
using bibmirror::util::ParseTimestamp;

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
};

NonFictionBookRecord Book(uint64_t remote_id, const std::string& modified) {
  NonFictionBookRecord r;
  r.remote_id        = remote_id;
  r.language         = "English";
  r.format           = "pdf";
  r.title            = "Book " + std::to_string(remote_id);
  r.authors          = "Author";
  r.year             = "2004";
  r.size_in_bytes    = 4096 + remote_id;
  r.md5              = "md5-" + std::to_string(remote_id);
  r.added_at         = *ParseTimestamp("2003-01-01 12:00:00");
  r.last_modified_at = *ParseTimestamp(modified);
  return r;
}

void VerifyMetadata(Repository& repo) {
  auto tx = repo.Begin();
  assert(!repo.GetMetadata(*tx).has_value());

  MetadataRecord metadata;
  metadata.app_name                      = "bibmirror";
  metadata.version                       = "1.0";
  metadata.fiction_first_import_complete = true;
  assert(repo.UpsertMetadata(*tx, metadata));

  auto stored = repo.GetMetadata(*tx);
  assert(stored.has_value());
  assert(stored->app_name == "bibmirror");
  assert(stored->version == "1.0");
  assert(!stored->non_fiction_first_import_complete);
  assert(stored->fiction_first_import_complete);
  assert(!stored->scimag_first_import_complete);

  metadata.scimag_first_import_complete = true;
  assert(repo.UpsertMetadata(*tx, metadata));
  assert(repo.GetMetadata(*tx)->scimag_first_import_complete);
  tx->Commit();
}

void VerifyInsertAssignsMonotonicIds(Repository& repo) {
  auto tx = repo.Begin();

  auto first  = Book(10, "2020-01-01 00:00:00");
  auto second = Book(11, "2020-01-01 00:00:00");
  second.file_id = 77;
  assert(repo.InsertNonFictionBook(*tx, first));
  assert(repo.InsertNonFictionBook(*tx, second));
  assert(first.id > 0);
  assert(second.id > first.id);

  auto stored = repo.GetNonFictionBookByRemoteId(*tx, 11);
  assert(stored.has_value());
  assert(stored->id == second.id);
  assert(stored->title == "Book 11");
  assert(stored->language == "English");
  assert(stored->format == "pdf");
  assert(stored->size_in_bytes == 4107);
  assert(stored->file_id == 77);
  assert(stored->added_at == *ParseTimestamp("2003-01-01 12:00:00"));
  assert(stored->last_modified_at == *ParseTimestamp("2020-01-01 00:00:00"));
  assert(!repo.GetNonFictionBookByRemoteId(*tx, 10)->file_id.has_value());
  assert(!repo.GetNonFictionBookByRemoteId(*tx, 12).has_value());
  tx->Commit();
}

void VerifyUpdateKeepsSurrogateId(Repository& repo) {
  auto tx = repo.Begin();

  auto before = repo.GetNonFictionBookByRemoteId(*tx, 10);
  assert(before.has_value());

  auto revised             = Book(10, "2021-06-01 08:30:00");
  revised.title            = "Revised";
  assert(repo.UpdateNonFictionBook(*tx, revised));

  auto after = repo.GetNonFictionBookByRemoteId(*tx, 10);
  assert(after->id == before->id);
  assert(after->title == "Revised");
  assert(after->last_modified_at == *ParseTimestamp("2021-06-01 08:30:00"));

  auto missing = repo.UpdateNonFictionBook(*tx, Book(999, "2021-06-01 08:30:00"));
  assert(!missing);
  assert(missing.code == ErrorCode::NotFound);
  tx->Commit();
}

void VerifyLatestBreaksTiesByRemoteId(Repository& repo) {
  auto tx = repo.Begin();

  auto a = Book(20, "2022-02-02 00:00:00");
  auto b = Book(21, "2022-02-02 00:00:00");
  auto c = Book(5, "2019-01-01 00:00:00");
  assert(repo.InsertNonFictionBook(*tx, b));
  assert(repo.InsertNonFictionBook(*tx, a));
  assert(repo.InsertNonFictionBook(*tx, c));

  auto latest = repo.GetLastModifiedNonFictionBook(*tx);
  assert(latest.has_value());
  assert(latest->remote_id == 21);
  tx->Commit();
}

void VerifyFamilyQueries(Repository& repo) {
  auto tx = repo.Begin();

  assert(repo.CountRecords(*tx, Family::kNonFiction) == 5);
  assert(repo.CountRecords(*tx, Family::kFiction) == 0);

  std::vector<uint64_t> ids;
  assert(repo.ScanRemoteIds(*tx, Family::kNonFiction, [&](uint64_t id) { ids.push_back(id); }));
  std::sort(ids.begin(), ids.end());
  assert((ids == std::vector<uint64_t>{5, 10, 11, 20, 21}));

  const auto name = bibmirror::db::sql::IndexName(Family::kNonFiction, "LibgenId");
  assert(name == "IX_non_fiction_LibgenId");

  auto before = repo.ListIndexes(*tx, Family::kNonFiction);
  assert(std::find(before.begin(), before.end(), name) == before.end());

  assert(repo.CreateIndex(*tx, Family::kNonFiction, name, "LibgenId"));
  assert(repo.CreateIndex(*tx, Family::kNonFiction, name, "LibgenId"));

  auto after = repo.ListIndexes(*tx, Family::kNonFiction);
  assert(std::count(after.begin(), after.end(), name) == 1);

  // the remote id index rejects a second row for the same id
  auto duplicate = Book(10, "2022-02-02 00:00:00");
  auto dup       = repo.InsertNonFictionBook(*tx, duplicate);
  assert(dup.code == ErrorCode::ConstraintViolation);
  assert(repo.CountRecords(*tx, Family::kNonFiction) == 5);
  // indexes are per family
  auto fiction = repo.ListIndexes(*tx, Family::kFiction);
  assert(std::find(fiction.begin(), fiction.end(), name) == fiction.end());
  tx->Commit();
}

void VerifyRollbackDiscardsWrites(Repository& repo) {
  {
    auto tx     = repo.Begin();
    auto record = Book(500, "2020-01-01 00:00:00");
    assert(repo.InsertNonFictionBook(*tx, record));
    tx->Rollback();
  }
  {
    // destroyed without commit
    auto tx     = repo.Begin();
    auto record = Book(501, "2020-01-01 00:00:00");
    assert(repo.InsertNonFictionBook(*tx, record));
  }

  auto tx = repo.Begin();
  assert(!repo.GetNonFictionBookByRemoteId(*tx, 500).has_value());
  assert(!repo.GetNonFictionBookByRemoteId(*tx, 501).has_value());
  assert(repo.CountRecords(*tx, Family::kNonFiction) == 5);
  tx->Commit();
}

void VerifyFictionAndSciMag(Repository& repo) {
  auto tx = repo.Begin();

  FictionBookRecord novel;
  novel.remote_id        = 40;
  novel.title            = "Novel";
  novel.series           = "Saga";
  novel.identifier       = "978-0";
  novel.added_at         = *ParseTimestamp("2015-03-03 03:03:03");
  novel.last_modified_at = *ParseTimestamp("2016-04-04 04:04:04");
  assert(repo.InsertFictionBook(*tx, novel));

  auto stored_novel = repo.GetFictionBookByRemoteId(*tx, 40);
  assert(stored_novel->series == "Saga");
  assert(stored_novel->identifier == "978-0");
  assert(repo.GetLastModifiedFictionBook(*tx)->remote_id == 40);

  SciMagArticleRecord early;
  early.remote_id = 7;
  early.doi       = "10.1000/early";
  early.journal   = "Journal";
  early.issn      = "1234-5678";
  early.added_at  = *ParseTimestamp("2017-01-01 00:00:00");

  SciMagArticleRecord late = early;
  late.remote_id           = 3;
  late.doi                 = "10.1000/late";
  late.added_at            = *ParseTimestamp("2018-01-01 00:00:00");

  assert(repo.InsertSciMagArticle(*tx, early));
  assert(repo.InsertSciMagArticle(*tx, late));

  auto latest = repo.GetLastAddedSciMagArticle(*tx);
  assert(latest->remote_id == 3);
  assert(latest->doi == "10.1000/late");
  assert(latest->issn == "1234-5678");

  late.first_page = "12";
  assert(repo.UpdateSciMagArticle(*tx, late));
  assert(repo.GetSciMagArticleByRemoteId(*tx, 3)->first_page == "12");
  assert(repo.CountRecords(*tx, Family::kSciMag) == 2);
  tx->Commit();
}

void VerifyEmptyFamilyHasNoLatest(Repository& repo) {
  auto tx = repo.Begin();
  assert(!repo.GetLastModifiedNonFictionBook(*tx).has_value());
  assert(!repo.GetLastModifiedFictionBook(*tx).has_value());
  assert(!repo.GetLastAddedSciMagArticle(*tx).has_value());
  tx->Commit();
}

void VerifySurvivesRestart(std::shared_ptr<Repository>& repo, const BackendFactory& backend) {
  if (!backend.supports_restart()) return;

  backend.restart(repo);

  auto tx = repo->Begin();
  assert(repo->CountRecords(*tx, Family::kNonFiction) == 5);
  assert(repo->GetNonFictionBookByRemoteId(*tx, 10)->title == "Revised");
  assert(repo->GetMetadata(*tx)->scimag_first_import_complete);
  tx->Commit();
}

void RunParity(const BackendFactory& backend) {
  auto repo = backend.make_repository();

  VerifyEmptyFamilyHasNoLatest(*repo);
  VerifyMetadata(*repo);
  VerifyInsertAssignsMonotonicIds(*repo);
  VerifyUpdateKeepsSurrogateId(*repo);
  VerifyLatestBreaksTiesByRemoteId(*repo);
  VerifyFamilyQueries(*repo);
  VerifyRollbackDiscardsWrites(*repo);
  VerifyFictionAndSciMag(*repo);
  VerifySurvivesRestart(repo, backend);

  repo.reset();
  backend.cleanup();
  std::cout << "  " << backend.name << ": ok\n";
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;

  backends.push_back(BackendFactory{
      "memory",
      [] { return std::make_shared<MemoryRepository>(); },
      [] { return false; },
      [](std::shared_ptr<Repository>&) {},
      [] {},
  });

  const auto sqlite_dir  = std::filesystem::temp_directory_path() / "bibmirror_repository_parity";
  const auto sqlite_path = (sqlite_dir / "catalog.db").string();
  std::filesystem::remove_all(sqlite_dir);
  std::filesystem::create_directories(sqlite_dir);

  auto open_sqlite = [sqlite_path]() -> std::shared_ptr<Repository> {
    auto db = std::make_shared<SqliteDB>(sqlite_path);
    SqliteRepository::BootstrapSchema(*db);
    return std::make_shared<SqliteRepository>(db);
  };

  backends.push_back(BackendFactory{
      "sqlite",
      open_sqlite,
      [] { return true; },
      [open_sqlite](std::shared_ptr<Repository>& repo) {
        repo.reset();
        repo = open_sqlite();
      },
      [sqlite_dir] { std::filesystem::remove_all(sqlite_dir); },
  });

  for (const auto& backend : backends) {
    RunParity(backend);
  }

  std::cout << "bibmirror_integration_repository_parity: pass\n";
  return 0;
}
