#include "internal/core/database_session.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "config/config.pb.h"

#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/factory.hpp"
#include "internal/util/errors.hpp"

namespace {

using bibmirror::core::CreateDatabase;
using bibmirror::core::DatabaseStatus;
using bibmirror::core::IsSupportedDumpFile;
using bibmirror::core::IsValidDatabaseVersion;
using bibmirror::core::OpenDatabase;
using bibmirror::db::sqlite::SqliteDB;
using bibmirror::db::sqlite::SqliteRepository;
using bibmirror::model::Family;

std::filesystem::path Scratch(const std::string& name) {
  const auto dir = std::filesystem::temp_directory_path() / "bibmirror_database_session_tests";
  std::filesystem::create_directories(dir);
  const auto path = dir / name;
  std::filesystem::remove(path);
  std::filesystem::remove(path.string() + "-wal");
  std::filesystem::remove(path.string() + "-shm");
  return path;
}

void RewriteMetadata(const std::string& path, const std::string& app_name, const std::string& version) {
  auto             db = std::make_shared<SqliteDB>(path);
  SqliteRepository repo(db);
  auto             tx       = repo.Begin();
  auto             metadata = repo.GetMetadata(*tx);
  assert(metadata.has_value());
  metadata->app_name = app_name;
  metadata->version  = version;
  assert(repo.UpsertMetadata(*tx, *metadata));
  tx->Commit();
}

void TestVersionAndExtensionRules() {
  assert(IsValidDatabaseVersion("1.0"));
  assert(IsValidDatabaseVersion("12.34"));
  assert(!IsValidDatabaseVersion(""));
  assert(!IsValidDatabaseVersion("1"));
  assert(!IsValidDatabaseVersion("1."));
  assert(!IsValidDatabaseVersion(".1"));
  assert(!IsValidDatabaseVersion("one.two"));
  assert(!IsValidDatabaseVersion("1.0.0"));

  assert(IsSupportedDumpFile("/data/libgen.sql"));
  assert(IsSupportedDumpFile("fiction.RAR"));
  assert(IsSupportedDumpFile("scimag.7z"));
  assert(IsSupportedDumpFile("dump.gz"));
  assert(IsSupportedDumpFile("dump.zip"));
  assert(!IsSupportedDumpFile("catalog.db"));
  assert(!IsSupportedDumpFile("notes.txt"));
  assert(!IsSupportedDumpFile("sql"));
}

void TestUnsetAndMissingPaths() {
  auto unset = OpenDatabase("");
  assert(unset.status == DatabaseStatus::kNotSet);
  assert(!unset.db);

  auto missing = OpenDatabase(Scratch("missing.db").string());
  assert(missing.status == DatabaseStatus::kNotFound);
  assert(!missing.db);
}

void TestCreatedDatabaseOpens() {
  const auto path = Scratch("created.db").string();
  {
    auto db = CreateDatabase(path);
    assert(SqliteRepository::HasMetadataTable(*db));
  }

  auto opened = OpenDatabase(path);
  assert(opened.status == DatabaseStatus::kOpened);
  assert(opened.db);
  assert(opened.metadata.has_value());
  assert(opened.metadata->app_name == "bibmirror");
  assert(opened.metadata->version == "1.0");
  assert(!opened.metadata->non_fiction_first_import_complete);
  assert(!opened.metadata->fiction_first_import_complete);
  assert(!opened.metadata->scimag_first_import_complete);
}

void TestServerDatabaseIsRefused() {
  const auto path = Scratch("server.db").string();
  (void)CreateDatabase(path);
  RewriteMetadata(path, "LibgenServer", "1.0");

  auto opened = OpenDatabase(path);
  assert(opened.status == DatabaseStatus::kServerDatabase);
  assert(!opened.db);
}

void TestUnparsableVersionIsCorrupted() {
  const auto path = Scratch("bad_version.db").string();
  (void)CreateDatabase(path);
  RewriteMetadata(path, "bibmirror", "one");

  auto opened = OpenDatabase(path);
  assert(opened.status == DatabaseStatus::kCorrupted);
  assert(!opened.db);
}

void TestDatabaseWithoutMetadataIsCorrupted() {
  const auto path = Scratch("foreign.db").string();
  {
    SqliteDB db(path);
    db.Exec("CREATE TABLE notes (Body TEXT);");
  }

  auto opened = OpenDatabase(path);
  assert(opened.status == DatabaseStatus::kCorrupted);
}

void TestNonDatabaseFiles() {
  const std::string text =
      "-- MySQL dump 10.13  Distrib 5.7.33, for Linux (x86_64)\n"
      "-- Host: localhost    Database: bookwarrior\n"
      "-- ------------------------------------------------------\n"
      "DROP TABLE IF EXISTS `updated`;\n";

  const auto dump = Scratch("libgen.sql");
  std::ofstream(dump) << text;
  assert(OpenDatabase(dump.string()).status == DatabaseStatus::kPossibleDumpFile);

  const auto notes = Scratch("notes.txt");
  std::ofstream(notes) << text;
  assert(OpenDatabase(notes.string()).status == DatabaseStatus::kCorrupted);
}

void TestFailedReadsThrow() {
  const auto path = Scratch("dropped_table.db").string();
  auto       db   = CreateDatabase(path);
  db->Exec("DROP TABLE non_fiction;");

  SqliteRepository repo(db);
  auto             tx = repo.Begin();

  auto throws = [](auto&& read) {
    try {
      read();
    } catch (const bibmirror::util::StorageError&) {
      return true;
    }
    return false;
  };
  // a broken table must not read as an empty one
  assert(throws([&] { (void)repo.CountRecords(*tx, Family::kNonFiction); }));
  assert(throws([&] { (void)repo.GetNonFictionBookByRemoteId(*tx, 1); }));
  assert(throws([&] { (void)repo.GetLastModifiedNonFictionBook(*tx); }));

  // untouched families keep working
  assert(repo.CountRecords(*tx, Family::kFiction) == 0);
  assert(!repo.GetFictionBookByRemoteId(*tx, 1).has_value());
  tx->Rollback();
}

void TestFactoryRepositoryBackends() {
  bibmirror::runtime::config::RuntimeConfig config;
  config.mutable_database()->mutable_memory();
  assert(bibmirror::factory::BuildRepository(config) != nullptr);

  const auto path = Scratch("factory.db").string();
  config.mutable_database()->mutable_sqlite()->set_path(path);
  config.mutable_database()->mutable_sqlite()->set_wal_mode(true);

  // created on first use, then reopened
  {
    auto repo = bibmirror::factory::BuildRepository(config);
    auto tx   = repo->Begin();
    assert(repo->GetMetadata(*tx)->app_name == "bibmirror");
    assert(repo->CountRecords(*tx, Family::kNonFiction) == 0);
    tx->Commit();
  }
  assert(std::filesystem::exists(path));
  assert(bibmirror::factory::BuildRepository(config) != nullptr);

  RewriteMetadata(path, "LibgenServer", "1.0");
  bool threw = false;
  try {
    (void)bibmirror::factory::BuildRepository(config);
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestFactoryDeltaSourcesPerFamily() {
  bibmirror::runtime::config::SyncConfig sync;
  sync.set_fiction_url("http://mirror.test/fiction.php?timenewer={timenewer}&idnewer={idnewer}&limit={limit}");
  sync.set_batch_size(10);

  auto sources = bibmirror::factory::BuildDeltaSources(sync, nullptr);
  assert(sources(Family::kNonFiction, {}) == nullptr);
  assert(sources(Family::kSciMag, {}) == nullptr);

  auto fiction = sources(Family::kFiction, {});
  assert(fiction != nullptr);
  assert(fiction->Cursor() == bibmirror::model::WatermarkCursor{});
}

} // namespace

int main() {
  TestVersionAndExtensionRules();
  TestUnsetAndMissingPaths();
  TestCreatedDatabaseOpens();
  TestServerDatabaseIsRefused();
  TestUnparsableVersionIsCorrupted();
  TestDatabaseWithoutMetadataIsCorrupted();
  TestNonDatabaseFiles();
  TestFailedReadsThrow();
  TestFactoryRepositoryBackends();
  TestFactoryDeltaSourcesPerFamily();

  std::cout << "bibmirror_integration_database_session: pass\n";
  return 0;
}
