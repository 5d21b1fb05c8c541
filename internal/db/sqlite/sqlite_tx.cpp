#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace bibmirror::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
  Run("BEGIN IMMEDIATE;", "begin");
}

SqliteTransaction::~SqliteTransaction() {
  if (!finished_) {
    try {
      db_->Exec("ROLLBACK;");
    } catch (const std::exception& e) {
      BIBMIRROR_LOG_WARN("sqlite rollback failed", {observability::StringField("path", db_->Path()), observability::StringField("error", e.what())});
    }
  }
}

void SqliteTransaction::Commit() {
  Run("COMMIT;", "commit");
  finished_ = true;
}

void SqliteTransaction::Rollback() {
  finished_ = true;
  Run("ROLLBACK;", "rollback");
}

void SqliteTransaction::Run(const char* statement, const char* what) {
  try {
    db_->Exec(statement);
  } catch (const std::runtime_error& e) {
    throw util::StorageError(std::string("sqlite ") + what + " failed on " + db_->Path() + ": " + e.what());
  }
}

} // namespace bibmirror::db::sqlite
