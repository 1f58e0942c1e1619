#pragma once

#include <sqlite3.h>

#include <chrono>
#include <memory>
#include <mutex>
#include <string>

#include "internal/db/sql/migrations.hpp"

namespace ledger::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  One handle is shared by every transaction of the process; tx_mutex_
  serializes them (SQLite allows one open transaction per connection),
  which also makes every row lock of the ordering protocol implicit.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, std::chrono::milliseconds lock_timeout = std::chrono::milliseconds(5000));
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  std::timed_mutex& TxMutex() {
    return tx_mutex_;
  }

  std::chrono::milliseconds LockTimeout() const {
    return lock_timeout_;
  }

  // Execute a SQL string (used for pragmas/migrations)
  void Exec(const std::string& sql);

  // Configure recommended PRAGMAs (WAL, foreign keys, etc.)
  void Configure();

  // Creates tables and indexes when missing.
  void Bootstrap();

 private:
  sqlite3*                  db_ = nullptr;
  std::string               path_;
  std::chrono::milliseconds lock_timeout_;
  std::timed_mutex          tx_mutex_;
};

class SqliteMigrationExecutor final : public sql::MigrationExecutor {
 public:
  explicit SqliteMigrationExecutor(SqliteDB& db) : db_(db) {
  }

  void ExecuteSQL(const std::string& sql) override {
    db_.Exec(sql);
  }

 private:
  SqliteDB& db_;
};

} // namespace ledger::db::sqlite
