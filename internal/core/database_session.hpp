#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "internal/db/model/metadata_record.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"

namespace bibmirror::core {

inline constexpr std::string_view kAppName         = "bibmirror";
inline constexpr std::string_view kServerAppName   = "LibgenServer";
inline constexpr std::string_view kDatabaseVersion = "1.0";

enum class DatabaseStatus : std::uint8_t {
  kOpened,
  kNotFound,
  kNotSet,
  kPossibleDumpFile,
  kCorrupted,
  kServerDatabase,
};

std::string_view ToString(DatabaseStatus status);

struct OpenedDatabase {
  DatabaseStatus                          status = DatabaseStatus::kNotSet;
  std::shared_ptr<db::sqlite::SqliteDB>   db;       // set only when kOpened
  std::optional<db::model::MetadataRecord> metadata;
};

// True for the extensions upstream dumps ship with (.sql .zip .rar .gz .7z).
bool IsSupportedDumpFile(const std::string& path);

/*
  Opens an existing local catalog and classifies what was found.

  Never throws: every failure maps to a status, so callers can offer to
  import a file that turned out to be a dump rather than a database.
*/
OpenedDatabase OpenDatabase(const std::string& path, bool wal_mode = true);

// Creates a fresh catalog: family tables plus metadata with all
// first-import flags cleared. Throws on failure.
std::shared_ptr<db::sqlite::SqliteDB> CreateDatabase(const std::string& path, bool wal_mode = true);

// Accepts "major.minor".
bool IsValidDatabaseVersion(std::string_view version);

db::model::MetadataRecord FreshMetadata();

} // namespace bibmirror::core
