#include "internal/core/database_session.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <filesystem>

#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace bibmirror::core {

std::string_view ToString(DatabaseStatus status) {
  switch (status) {
    case DatabaseStatus::kOpened:
      return "opened";
    case DatabaseStatus::kNotFound:
      return "not-found";
    case DatabaseStatus::kNotSet:
      return "not-set";
    case DatabaseStatus::kPossibleDumpFile:
      return "possible-dump-file";
    case DatabaseStatus::kCorrupted:
      return "corrupted";
    case DatabaseStatus::kServerDatabase:
      return "server-database";
  }
  return "unknown";
}

bool IsSupportedDumpFile(const std::string& path) {
  auto extension = std::filesystem::path(path).extension().string();
  std::transform(extension.begin(), extension.end(), extension.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  for (std::string_view supported : {".sql", ".zip", ".rar", ".gz", ".7z"}) {
    if (extension == supported) return true;
  }
  return false;
}

bool IsValidDatabaseVersion(std::string_view version) {
  const auto dot = version.find('.');
  if (dot == std::string_view::npos || dot == 0 || dot + 1 >= version.size()) return false;

  auto parses = [](std::string_view part) {
    unsigned value = 0;
    auto [ptr, ec] = std::from_chars(part.data(), part.data() + part.size(), value);
    return ec == std::errc{} && ptr == part.data() + part.size();
  };
  return parses(version.substr(0, dot)) && parses(version.substr(dot + 1));
}

db::model::MetadataRecord FreshMetadata() {
  db::model::MetadataRecord metadata;
  metadata.app_name = std::string(kAppName);
  metadata.version  = std::string(kDatabaseVersion);
  return metadata;
}

OpenedDatabase OpenDatabase(const std::string& path, bool wal_mode) {
  OpenedDatabase opened;

  if (path.empty()) {
    opened.status = DatabaseStatus::kNotSet;
    return opened;
  }

  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    opened.status = DatabaseStatus::kNotFound;
    return opened;
  }

  const auto failed = IsSupportedDumpFile(path) ? DatabaseStatus::kPossibleDumpFile : DatabaseStatus::kCorrupted;

  try {
    auto sqlite = std::make_shared<db::sqlite::SqliteDB>(path, db::sqlite::SqliteDB::Options{.wal_mode = wal_mode, .must_exist = true});

    if (!db::sqlite::SqliteRepository::HasMetadataTable(*sqlite)) {
      BIBMIRROR_LOG_WARN("database has no metadata table", {observability::StringField("path", path)});
      opened.status = DatabaseStatus::kCorrupted;
      return opened;
    }

    db::sqlite::SqliteRepository repo(sqlite);
    auto                         tx = repo.Begin();
    opened.metadata                 = repo.GetMetadata(*tx);
    tx->Commit();

    if (!opened.metadata) {
      opened.status = DatabaseStatus::kCorrupted;
      return opened;
    }
    if (opened.metadata->app_name == kServerAppName) {
      opened.status = DatabaseStatus::kServerDatabase;
      return opened;
    }
    if (!IsValidDatabaseVersion(opened.metadata->version)) {
      BIBMIRROR_LOG_WARN("unparsable database version",
                         {observability::StringField("path", path), observability::StringField("version", opened.metadata->version)});
      opened.status = DatabaseStatus::kCorrupted;
      return opened;
    }

    opened.status = DatabaseStatus::kOpened;
    opened.db     = std::move(sqlite);
  } catch (const std::exception& e) {
    BIBMIRROR_LOG_WARN("cannot open database",
                       {observability::StringField("path", path), observability::StringField("error", e.what())});
    opened.status = failed;
    opened.metadata.reset();
  }
  return opened;
}

std::shared_ptr<db::sqlite::SqliteDB> CreateDatabase(const std::string& path, bool wal_mode) {
  auto sqlite = std::make_shared<db::sqlite::SqliteDB>(path, db::sqlite::SqliteDB::Options{.wal_mode = wal_mode, .must_exist = false});
  db::sqlite::SqliteRepository::BootstrapSchema(*sqlite);

  db::sqlite::SqliteRepository repo(sqlite);
  auto                         tx = repo.Begin();
  auto                         r  = repo.UpsertMetadata(*tx, FreshMetadata());
  if (!r) {
    throw util::StorageError("cannot write database metadata: " + db::Describe(r));
  }
  tx->Commit();

  BIBMIRROR_LOG_INFO("database created", {observability::StringField("path", path)});
  return sqlite;
}

} // namespace bibmirror::core
