#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace ledger::db::sqlite {

/*
  SQLite transaction wrapper.

  Takes the handle's transaction mutex (bounded by the lock timeout,
  util::ConcurrentModification BUSY on expiry), then BEGIN IMMEDIATE:
    - grabs the database write lock early
    - no row lock taken later can deadlock against another writer
*/
class SqliteTransaction final : public db::Transaction {
public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction();

  sqlite3* Handle() const { return db_->Handle(); }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return committed_; }

private:
  std::shared_ptr<SqliteDB> db_;
  std::unique_lock<std::timed_mutex> serial_;
  bool committed_ = false;
  bool finished_ = false;
};

}
