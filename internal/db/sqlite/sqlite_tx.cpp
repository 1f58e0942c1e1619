#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace ledger::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)), serial_(db_->TxMutex(), std::defer_lock) {
  if (!serial_.try_lock_for(db_->LockTimeout())) {
    throw util::ConcurrentModification("BUSY", "timed out waiting for the sqlite writer");
  }
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (!finished_) {
    try {
      db_->Exec("ROLLBACK;");
    } catch (const std::exception& e) {
      LEDGER_LOG_WARN("sqlite rollback failed", {ledger::observability::StringField("error", e.what())});
    }
  }
}

void SqliteTransaction::Commit() {
  db_->Exec("COMMIT;");
  committed_ = true;
  finished_  = true;
  ForgetLocks();
  serial_.unlock();
}

void SqliteTransaction::Rollback() {
  finished_ = true;
  ForgetLocks();
  db_->Exec("ROLLBACK;");
  serial_.unlock();
}

} // namespace ledger::db::sqlite
