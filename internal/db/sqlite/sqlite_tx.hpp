#pragma once

#include <memory>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace bibmirror::db::sqlite {

/*
  SQLite transaction wrapper.

  Uses BEGIN IMMEDIATE so the write lock is taken before the first
  merge write. Begin/commit/rollback failures throw util::StorageError;
  a failed commit leaves the transaction open for the destructor to
  roll back.
*/
class SqliteTransaction final : public db::Transaction {
public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction() override;

  sqlite3* Handle() const { return db_->Handle(); }

  void Commit() override;
  void Rollback() override;
  bool IsFinished() const override { return finished_; }

private:
  void Run(const char* statement, const char* what);

  std::shared_ptr<SqliteDB> db_;
  bool finished_ = false;
};

} // namespace bibmirror::db::sqlite
