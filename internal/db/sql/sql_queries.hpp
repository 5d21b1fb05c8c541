#pragma once

#include <string>

#include "internal/model/family.hpp"

namespace bibmirror::db::sql {

/*
  Canonical SQL for the catalog tables (SQLite dialect).

  Timestamps are stored as "YYYY-MM-DD HH:MM:SS" text so ORDER BY on the
  column matches chronological order.
*/

static constexpr const char* CREATE_METADATA_TABLE =
    "CREATE TABLE IF NOT EXISTS metadata (Key TEXT PRIMARY KEY, Value TEXT);";

static constexpr const char* CREATE_NON_FICTION_TABLE =
    "CREATE TABLE IF NOT EXISTS non_fiction ("
    "Id INTEGER PRIMARY KEY AUTOINCREMENT, LibgenId INTEGER NOT NULL, FileId INTEGER,"
    " Language TEXT, Format TEXT, Title TEXT, Series TEXT, Authors TEXT, Year TEXT, Edition TEXT,"
    " Publisher TEXT, Pages TEXT, Identifier TEXT, SizeInBytes INTEGER, Md5Hash TEXT, CoverUrl TEXT,"
    " AddedDateTime TEXT, LastModifiedDateTime TEXT);";

static constexpr const char* CREATE_FICTION_TABLE =
    "CREATE TABLE IF NOT EXISTS fiction ("
    "Id INTEGER PRIMARY KEY AUTOINCREMENT, LibgenId INTEGER NOT NULL, FileId INTEGER,"
    " Language TEXT, Format TEXT, Title TEXT, Authors TEXT, Series TEXT, Edition TEXT, Year TEXT,"
    " Publisher TEXT, Pages TEXT, Identifier TEXT, SizeInBytes INTEGER, Md5Hash TEXT, CoverUrl TEXT,"
    " AddedDateTime TEXT, LastModifiedDateTime TEXT);";

static constexpr const char* CREATE_SCIMAG_TABLE =
    "CREATE TABLE IF NOT EXISTS scimag ("
    "Id INTEGER PRIMARY KEY AUTOINCREMENT, LibgenId INTEGER NOT NULL, FileId INTEGER,"
    " Language TEXT, Format TEXT, Doi TEXT, Title TEXT, Authors TEXT, Year TEXT, Volume TEXT, Issue TEXT,"
    " FirstPage TEXT, LastPage TEXT, Journal TEXT, Issn TEXT, SizeInBytes INTEGER, Md5Hash TEXT,"
    " AddedDateTime TEXT);";

// metadata

static constexpr const char* SELECT_METADATA = "SELECT Key,Value FROM metadata;";

static constexpr const char* UPSERT_METADATA_VALUE =
    "INSERT INTO metadata(Key,Value) VALUES(?,?)"
    " ON CONFLICT(Key) DO UPDATE SET Value=excluded.Value;";

static constexpr const char* CHECK_METADATA_TABLE =
    "SELECT name FROM sqlite_master WHERE type='table' AND name='metadata';";

// non-fiction

static constexpr const char* NON_FICTION_COLUMNS =
    "Id,LibgenId,FileId,Language,Format,Title,Series,Authors,Year,Edition,Publisher,Pages,Identifier,"
    "SizeInBytes,Md5Hash,CoverUrl,AddedDateTime,LastModifiedDateTime";

static constexpr const char* INSERT_NON_FICTION =
    "INSERT INTO non_fiction(LibgenId,FileId,Language,Format,Title,Series,Authors,Year,Edition,Publisher,Pages,"
    "Identifier,SizeInBytes,Md5Hash,CoverUrl,AddedDateTime,LastModifiedDateTime)"
    " VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);";

static constexpr const char* UPDATE_NON_FICTION =
    "UPDATE non_fiction SET FileId=?,Language=?,Format=?,Title=?,Series=?,Authors=?,Year=?,Edition=?,Publisher=?,"
    "Pages=?,Identifier=?,SizeInBytes=?,Md5Hash=?,CoverUrl=?,AddedDateTime=?,LastModifiedDateTime=?"
    " WHERE LibgenId=?;";

// fiction

static constexpr const char* FICTION_COLUMNS =
    "Id,LibgenId,FileId,Language,Format,Title,Authors,Series,Edition,Year,Publisher,Pages,Identifier,"
    "SizeInBytes,Md5Hash,CoverUrl,AddedDateTime,LastModifiedDateTime";

static constexpr const char* INSERT_FICTION =
    "INSERT INTO fiction(LibgenId,FileId,Language,Format,Title,Authors,Series,Edition,Year,Publisher,Pages,"
    "Identifier,SizeInBytes,Md5Hash,CoverUrl,AddedDateTime,LastModifiedDateTime)"
    " VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);";

static constexpr const char* UPDATE_FICTION =
    "UPDATE fiction SET FileId=?,Language=?,Format=?,Title=?,Authors=?,Series=?,Edition=?,Year=?,Publisher=?,"
    "Pages=?,Identifier=?,SizeInBytes=?,Md5Hash=?,CoverUrl=?,AddedDateTime=?,LastModifiedDateTime=?"
    " WHERE LibgenId=?;";

// scimag

static constexpr const char* SCIMAG_COLUMNS =
    "Id,LibgenId,FileId,Language,Format,Doi,Title,Authors,Year,Volume,Issue,FirstPage,LastPage,Journal,Issn,"
    "SizeInBytes,Md5Hash,AddedDateTime";

static constexpr const char* INSERT_SCIMAG =
    "INSERT INTO scimag(LibgenId,FileId,Language,Format,Doi,Title,Authors,Year,Volume,Issue,FirstPage,LastPage,"
    "Journal,Issn,SizeInBytes,Md5Hash,AddedDateTime)"
    " VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);";

static constexpr const char* UPDATE_SCIMAG =
    "UPDATE scimag SET FileId=?,Language=?,Format=?,Doi=?,Title=?,Authors=?,Year=?,Volume=?,Issue=?,FirstPage=?,"
    "LastPage=?,Journal=?,Issn=?,SizeInBytes=?,Md5Hash=?,AddedDateTime=?"
    " WHERE LibgenId=?;";

// indexes

// Indexes on this column are created UNIQUE: one row per remote id.
static constexpr const char* REMOTE_ID_COLUMN = "LibgenId";

static constexpr const char* LIST_INDEXES =
    "SELECT name FROM sqlite_master WHERE type='index' AND tbl_name=? AND name IS NOT NULL;";

inline std::string TableName(bibmirror::model::Family family) {
  switch (family) {
    case bibmirror::model::Family::kNonFiction:
      return "non_fiction";
    case bibmirror::model::Family::kFiction:
      return "fiction";
    case bibmirror::model::Family::kSciMag:
      return "scimag";
  }
  return {};
}

// Index names follow "IX_<table>_<column>", which is what ListIndexes
// reports and what EnsureDedupIndexes looks for.
inline std::string IndexName(bibmirror::model::Family family, const std::string& column) {
  return "IX_" + TableName(family) + "_" + column;
}

} // namespace bibmirror::db::sql
