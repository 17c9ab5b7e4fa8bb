#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace rulebook::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)), lock_(db_->TxMutex()) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (finished_) return;

  // never throw from a destructor
  const int rc = sqlite3_exec(db_->Handle(), "ROLLBACK;", nullptr, nullptr, nullptr);
  if (rc != SQLITE_OK) {
    RULEBOOK_LOG_WARN("sqlite rollback failed",
                      {observability::StringField("db", db_->Path()), observability::StringField("error", sqlite3_errmsg(db_->Handle()))});
  }
}

void SqliteTransaction::Commit() {
  const int rc = sqlite3_exec(db_->Handle(), "COMMIT;", nullptr, nullptr, nullptr);
  if (rc == SQLITE_BUSY || rc == SQLITE_LOCKED) {
    throw util::TransactionConflict(std::string("sqlite commit: ") + sqlite3_errmsg(db_->Handle()));
  }
  if (rc != SQLITE_OK) {
    throw std::runtime_error(std::string("sqlite commit: ") + sqlite3_errmsg(db_->Handle()));
  }
  committed_ = true;
  finished_  = true;
}

void SqliteTransaction::Rollback() {
  finished_ = true;
  db_->Exec("ROLLBACK;");
}

} // namespace rulebook::db::sqlite
