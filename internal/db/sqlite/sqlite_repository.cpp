#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include "internal/db/sql/sql_queries.hpp"
#include "internal/util/errors.hpp"

namespace bibmirror::db::sqlite {

using bibmirror::model::Family;
using db::ErrorCode;
using db::Result;

namespace {

constexpr const char* kMetaAppName        = "AppName";
constexpr const char* kMetaVersion        = "Version";
constexpr const char* kMetaNonFictionDone = "NonFictionFirstImportComplete";
constexpr const char* kMetaFictionDone    = "FictionFirstImportComplete";
constexpr const char* kMetaSciMagDone     = "SciMagFirstImportComplete";

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindOptionalI64(sqlite3_stmt* st, int idx, const std::optional<int64_t>& v) {
  if (v) {
    sqlite3_bind_int64(st, idx, *v);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

void BindTime(sqlite3_stmt* st, int idx, util::TimePoint tp) {
  BindText(st, idx, util::FormatTimestamp(tp));
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

std::optional<int64_t> ColOptionalI64(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return sqlite3_column_int64(st, col);
}

util::TimePoint ColTime(sqlite3_stmt* st, int col) {
  return util::ParseTimestamp(ColText(st, col)).value_or(util::TimePoint{});
}

void ReadCommon(sqlite3_stmt* st, model::CatalogRecord& r) {
  r.id        = sqlite3_column_int64(st, 0);
  r.remote_id = ColU64(st, 1);
  r.file_id   = ColOptionalI64(st, 2);
  r.language  = ColText(st, 3);
  r.format    = ColText(st, 4);
}

model::NonFictionBookRecord ReadNonFiction(sqlite3_stmt* st) {
  model::NonFictionBookRecord r;
  ReadCommon(st, r);
  r.title            = ColText(st, 5);
  r.series           = ColText(st, 6);
  r.authors          = ColText(st, 7);
  r.year             = ColText(st, 8);
  r.edition          = ColText(st, 9);
  r.publisher        = ColText(st, 10);
  r.pages            = ColText(st, 11);
  r.identifier       = ColText(st, 12);
  r.size_in_bytes    = ColU64(st, 13);
  r.md5              = ColText(st, 14);
  r.cover_url        = ColText(st, 15);
  r.added_at         = ColTime(st, 16);
  r.last_modified_at = ColTime(st, 17);
  return r;
}

model::FictionBookRecord ReadFiction(sqlite3_stmt* st) {
  model::FictionBookRecord r;
  ReadCommon(st, r);
  r.title            = ColText(st, 5);
  r.authors          = ColText(st, 6);
  r.series           = ColText(st, 7);
  r.edition          = ColText(st, 8);
  r.year             = ColText(st, 9);
  r.publisher        = ColText(st, 10);
  r.pages            = ColText(st, 11);
  r.identifier       = ColText(st, 12);
  r.size_in_bytes    = ColU64(st, 13);
  r.md5              = ColText(st, 14);
  r.cover_url        = ColText(st, 15);
  r.added_at         = ColTime(st, 16);
  r.last_modified_at = ColTime(st, 17);
  return r;
}

model::SciMagArticleRecord ReadSciMag(sqlite3_stmt* st) {
  model::SciMagArticleRecord r;
  ReadCommon(st, r);
  r.doi           = ColText(st, 5);
  r.title         = ColText(st, 6);
  r.authors       = ColText(st, 7);
  r.year          = ColText(st, 8);
  r.volume        = ColText(st, 9);
  r.issue         = ColText(st, 10);
  r.first_page    = ColText(st, 11);
  r.last_page     = ColText(st, 12);
  r.journal       = ColText(st, 13);
  r.issn          = ColText(st, 14);
  r.size_in_bytes = ColU64(st, 15);
  r.md5           = ColText(st, 16);
  r.added_at      = ColTime(st, 17);
  return r;
}

// Binds the non-key columns shared by insert (after LibgenId) and update
// (before the WHERE clause); returns the next free parameter index.
int BindNonFictionFields(sqlite3_stmt* st, int i, const model::NonFictionBookRecord& r) {
  BindOptionalI64(st, i++, r.file_id);
  BindText(st, i++, r.language);
  BindText(st, i++, r.format);
  BindText(st, i++, r.title);
  BindText(st, i++, r.series);
  BindText(st, i++, r.authors);
  BindText(st, i++, r.year);
  BindText(st, i++, r.edition);
  BindText(st, i++, r.publisher);
  BindText(st, i++, r.pages);
  BindText(st, i++, r.identifier);
  BindU64(st, i++, r.size_in_bytes);
  BindText(st, i++, r.md5);
  BindText(st, i++, r.cover_url);
  BindTime(st, i++, r.added_at);
  BindTime(st, i++, r.last_modified_at);
  return i;
}

int BindFictionFields(sqlite3_stmt* st, int i, const model::FictionBookRecord& r) {
  BindOptionalI64(st, i++, r.file_id);
  BindText(st, i++, r.language);
  BindText(st, i++, r.format);
  BindText(st, i++, r.title);
  BindText(st, i++, r.authors);
  BindText(st, i++, r.series);
  BindText(st, i++, r.edition);
  BindText(st, i++, r.year);
  BindText(st, i++, r.publisher);
  BindText(st, i++, r.pages);
  BindText(st, i++, r.identifier);
  BindU64(st, i++, r.size_in_bytes);
  BindText(st, i++, r.md5);
  BindText(st, i++, r.cover_url);
  BindTime(st, i++, r.added_at);
  BindTime(st, i++, r.last_modified_at);
  return i;
}

int BindSciMagFields(sqlite3_stmt* st, int i, const model::SciMagArticleRecord& r) {
  BindOptionalI64(st, i++, r.file_id);
  BindText(st, i++, r.language);
  BindText(st, i++, r.format);
  BindText(st, i++, r.doi);
  BindText(st, i++, r.title);
  BindText(st, i++, r.authors);
  BindText(st, i++, r.year);
  BindText(st, i++, r.volume);
  BindText(st, i++, r.issue);
  BindText(st, i++, r.first_page);
  BindText(st, i++, r.last_page);
  BindText(st, i++, r.journal);
  BindText(st, i++, r.issn);
  BindU64(st, i++, r.size_in_bytes);
  BindText(st, i++, r.md5);
  BindTime(st, i++, r.added_at);
  return i;
}

// Reads have no Result channel; a failed statement must not look like an
// empty table.
[[noreturn]] void ThrowReadFailure(sqlite3* db, const std::string& sql) {
  throw util::StorageError(std::string("sqlite read failed: ") + sqlite3_errmsg(db) + " [" + sql + "]");
}

sqlite3_stmt* PrepareRead(sqlite3* db, const std::string& sql) {
  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &raw, nullptr) != SQLITE_OK) {
    sqlite3_finalize(raw);
    ThrowReadFailure(db, sql);
  }
  return raw;
}

std::string SelectSql(const char* columns, const std::string& table, const std::string& tail) {
  return std::string("SELECT ") + columns + " FROM " + table + " " + tail + ";";
}

// Runs a single-row SELECT and maps it with reader.
template <typename Record, typename Reader>
std::optional<Record> QueryOne(sqlite3* db, const std::string& sql, std::optional<uint64_t> remote_id, Reader reader) {
  StatementGuard st(PrepareRead(db, sql));

  if (remote_id) BindU64(st.get(), 1, *remote_id);

  const int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE) return std::nullopt;
  if (rc != SQLITE_ROW) ThrowReadFailure(db, sql);
  return reader(st.get());
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

void SqliteRepository::BootstrapSchema(SqliteDB& db) {
  db.Exec(sql::CREATE_METADATA_TABLE);
  db.Exec(sql::CREATE_NON_FICTION_TABLE);
  db.Exec(sql::CREATE_FICTION_TABLE);
  db.Exec(sql::CREATE_SCIMAG_TABLE);
}

bool SqliteRepository::HasMetadataTable(SqliteDB& db) {
  StatementGuard st(db.Prepare(sql::CHECK_METADATA_TABLE));
  return sqlite3_step(st.get()) == SQLITE_ROW;
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
    return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_FULL:
      return Result::Err(ErrorCode::DiskFull, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
    case SQLITE_NOTADB:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Metadata
// ------------------------------------------------------------------

std::optional<model::MetadataRecord> SqliteRepository::GetMetadata(Transaction& t) {
  auto* db = TX(t).Handle();

  StatementGuard st(PrepareRead(db, sql::SELECT_METADATA));

  model::MetadataRecord r;
  bool any = false;
  int  rc;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    any = true;
    const auto key   = ColText(st.get(), 0);
    const auto value = ColText(st.get(), 1);
    if (key == kMetaAppName) r.app_name = value;
    else if (key == kMetaVersion) r.version = value;
    else if (key == kMetaNonFictionDone) r.non_fiction_first_import_complete = value == "1";
    else if (key == kMetaFictionDone) r.fiction_first_import_complete = value == "1";
    else if (key == kMetaSciMagDone) r.scimag_first_import_complete = value == "1";
  }
  if (rc != SQLITE_DONE) ThrowReadFailure(db, sql::SELECT_METADATA);

  if (!any) return std::nullopt;
  return r;
}

Result SqliteRepository::UpsertMetadata(Transaction& t, const model::MetadataRecord& r) {
  auto* db = TX(t).Handle();

  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db, sql::UPSERT_METADATA_VALUE, -1, &raw, nullptr) != SQLITE_OK)
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  StatementGuard st(raw);

  const std::pair<const char*, std::string> values[] = {
      {kMetaAppName, r.app_name},
      {kMetaVersion, r.version},
      {kMetaNonFictionDone, r.non_fiction_first_import_complete ? "1" : "0"},
      {kMetaFictionDone, r.fiction_first_import_complete ? "1" : "0"},
      {kMetaSciMagDone, r.scimag_first_import_complete ? "1" : "0"},
  };

  for (const auto& [key, value] : values) {
    sqlite3_reset(st.get());
    BindText(st.get(), 1, key);
    BindText(st.get(), 2, value);
    int rc = sqlite3_step(st.get());
    if (rc != SQLITE_DONE) return Translate(db, rc);
  }
  return Result::Ok();
}

// ------------------------------------------------------------------
// Non-fiction
// ------------------------------------------------------------------

Result SqliteRepository::InsertNonFictionBook(Transaction& t, model::NonFictionBookRecord& r) {
  auto* db = TX(t).Handle();

  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db, sql::INSERT_NON_FICTION, -1, &raw, nullptr) != SQLITE_OK)
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  StatementGuard st(raw);

  BindU64(st.get(), 1, r.remote_id);
  BindNonFictionFields(st.get(), 2, r);

  int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE) r.id = sqlite3_last_insert_rowid(db);
  return Translate(db, rc);
}

Result SqliteRepository::UpdateNonFictionBook(Transaction& t, const model::NonFictionBookRecord& r) {
  auto* db = TX(t).Handle();

  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db, sql::UPDATE_NON_FICTION, -1, &raw, nullptr) != SQLITE_OK)
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  StatementGuard st(raw);

  const int next = BindNonFictionFields(st.get(), 1, r);
  BindU64(st.get(), next, r.remote_id);

  int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
  return Translate(db, rc);
}

std::optional<model::NonFictionBookRecord>
SqliteRepository::GetNonFictionBookByRemoteId(Transaction& t, uint64_t remote_id) {
  return QueryOne<model::NonFictionBookRecord>(TX(t).Handle(),
                                               SelectSql(sql::NON_FICTION_COLUMNS, "non_fiction", "WHERE LibgenId=? LIMIT 1"),
                                               remote_id, ReadNonFiction);
}

std::optional<model::NonFictionBookRecord> SqliteRepository::GetLastModifiedNonFictionBook(Transaction& t) {
  return QueryOne<model::NonFictionBookRecord>(
      TX(t).Handle(), SelectSql(sql::NON_FICTION_COLUMNS, "non_fiction", "ORDER BY LastModifiedDateTime DESC, LibgenId DESC LIMIT 1"),
      std::nullopt, ReadNonFiction);
}

// ------------------------------------------------------------------
// Fiction
// ------------------------------------------------------------------

Result SqliteRepository::InsertFictionBook(Transaction& t, model::FictionBookRecord& r) {
  auto* db = TX(t).Handle();

  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db, sql::INSERT_FICTION, -1, &raw, nullptr) != SQLITE_OK)
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  StatementGuard st(raw);

  BindU64(st.get(), 1, r.remote_id);
  BindFictionFields(st.get(), 2, r);

  int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE) r.id = sqlite3_last_insert_rowid(db);
  return Translate(db, rc);
}

Result SqliteRepository::UpdateFictionBook(Transaction& t, const model::FictionBookRecord& r) {
  auto* db = TX(t).Handle();

  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db, sql::UPDATE_FICTION, -1, &raw, nullptr) != SQLITE_OK)
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  StatementGuard st(raw);

  const int next = BindFictionFields(st.get(), 1, r);
  BindU64(st.get(), next, r.remote_id);

  int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
  return Translate(db, rc);
}

std::optional<model::FictionBookRecord> SqliteRepository::GetFictionBookByRemoteId(Transaction& t, uint64_t remote_id) {
  return QueryOne<model::FictionBookRecord>(TX(t).Handle(), SelectSql(sql::FICTION_COLUMNS, "fiction", "WHERE LibgenId=? LIMIT 1"),
                                            remote_id, ReadFiction);
}

std::optional<model::FictionBookRecord> SqliteRepository::GetLastModifiedFictionBook(Transaction& t) {
  return QueryOne<model::FictionBookRecord>(
      TX(t).Handle(), SelectSql(sql::FICTION_COLUMNS, "fiction", "ORDER BY LastModifiedDateTime DESC, LibgenId DESC LIMIT 1"),
      std::nullopt, ReadFiction);
}

// ------------------------------------------------------------------
// Scimag
// ------------------------------------------------------------------

Result SqliteRepository::InsertSciMagArticle(Transaction& t, model::SciMagArticleRecord& r) {
  auto* db = TX(t).Handle();

  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db, sql::INSERT_SCIMAG, -1, &raw, nullptr) != SQLITE_OK)
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  StatementGuard st(raw);

  BindU64(st.get(), 1, r.remote_id);
  BindSciMagFields(st.get(), 2, r);

  int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE) r.id = sqlite3_last_insert_rowid(db);
  return Translate(db, rc);
}

Result SqliteRepository::UpdateSciMagArticle(Transaction& t, const model::SciMagArticleRecord& r) {
  auto* db = TX(t).Handle();

  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db, sql::UPDATE_SCIMAG, -1, &raw, nullptr) != SQLITE_OK)
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  StatementGuard st(raw);

  const int next = BindSciMagFields(st.get(), 1, r);
  BindU64(st.get(), next, r.remote_id);

  int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
  return Translate(db, rc);
}

std::optional<model::SciMagArticleRecord> SqliteRepository::GetSciMagArticleByRemoteId(Transaction& t, uint64_t remote_id) {
  return QueryOne<model::SciMagArticleRecord>(TX(t).Handle(), SelectSql(sql::SCIMAG_COLUMNS, "scimag", "WHERE LibgenId=? LIMIT 1"),
                                              remote_id, ReadSciMag);
}

std::optional<model::SciMagArticleRecord> SqliteRepository::GetLastAddedSciMagArticle(Transaction& t) {
  return QueryOne<model::SciMagArticleRecord>(
      TX(t).Handle(), SelectSql(sql::SCIMAG_COLUMNS, "scimag", "ORDER BY AddedDateTime DESC, LibgenId DESC LIMIT 1"), std::nullopt,
      ReadSciMag);
}

// ------------------------------------------------------------------
// Family-wide
// ------------------------------------------------------------------

uint64_t SqliteRepository::CountRecords(Transaction& t, Family family) {
  auto* db = TX(t).Handle();

  const auto     sql = "SELECT COUNT(*) FROM " + sql::TableName(family) + ";";
  StatementGuard st(PrepareRead(db, sql));

  if (sqlite3_step(st.get()) != SQLITE_ROW) ThrowReadFailure(db, sql);
  return ColU64(st.get(), 0);
}

Result SqliteRepository::ScanRemoteIds(Transaction& t, Family family, const std::function<void(uint64_t)>& visitor) {
  auto* db = TX(t).Handle();

  const auto    sql = "SELECT LibgenId FROM " + sql::TableName(family) + ";";
  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &raw, nullptr) != SQLITE_OK)
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  StatementGuard st(raw);

  int rc;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    visitor(ColU64(st.get(), 0));
  }
  return Translate(db, rc);
}

std::vector<std::string> SqliteRepository::ListIndexes(Transaction& t, Family family) {
  auto* db = TX(t).Handle();

  std::vector<std::string> names;
  StatementGuard           st(PrepareRead(db, sql::LIST_INDEXES));

  BindText(st.get(), 1, sql::TableName(family));
  int rc;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    names.push_back(ColText(st.get(), 0));
  }
  if (rc != SQLITE_DONE) ThrowReadFailure(db, sql::LIST_INDEXES);
  return names;
}

Result SqliteRepository::CreateIndex(Transaction& t, Family family, const std::string& index_name, const std::string& column) {
  auto* db = TX(t).Handle();

  const auto kind = column == sql::REMOTE_ID_COLUMN ? "CREATE UNIQUE INDEX" : "CREATE INDEX";
  const auto sql  = std::string(kind) + " IF NOT EXISTS " + index_name + " ON " + sql::TableName(family) + " (" + column + ");";
  char*      err  = nullptr;
  int        rc   = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "create index failed";
    sqlite3_free(err);
    auto result    = Translate(db, rc);
    result.message = msg;
    return result;
  }
  return Result::Ok();
}

} // namespace bibmirror::db::sqlite
