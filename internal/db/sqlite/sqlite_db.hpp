#pragma once

#include <sqlite3.h>

#include <memory>
#include <string>

namespace bibmirror::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.
*/
class SqliteDB {
 public:
  struct Options {
    bool wal_mode = true;
    // open fails instead of creating a new file
    bool must_exist = false;
  };

  explicit SqliteDB(std::string path);
  SqliteDB(std::string path, Options options);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Execute a SQL string (used for pragmas/bootstrap)
  void Exec(const std::string& sql);

  // Prepare a statement (caller must sqlite3_finalize)
  sqlite3_stmt* Prepare(const std::string& sql);

 private:
  // Configure PRAGMAs (journal mode, synchronous, cache size)
  void Configure(const Options& options);

  sqlite3*    db_ = nullptr;
  std::string path_;
};

/*
  Finalizes a prepared statement on scope exit.
*/
class StatementGuard {
 public:
  explicit StatementGuard(sqlite3_stmt* stmt) : stmt_(stmt) {
  }
  ~StatementGuard() {
    if (stmt_) sqlite3_finalize(stmt_);
  }

  StatementGuard(const StatementGuard&)            = delete;
  StatementGuard& operator=(const StatementGuard&) = delete;

  sqlite3_stmt* get() const {
    return stmt_;
  }

 private:
  sqlite3_stmt* stmt_;
};

} // namespace bibmirror::db::sqlite
