#pragma once

#include <chrono>
#include <memory>
#include <pqxx/pqxx>

#include "internal/db/api/transaction.hpp"
#include "pg_pool.hpp"

namespace ledger::db::postgres {

/*
  pqxx::work on a pooled connection.

  Row locks are real (SELECT ... FOR UPDATE) and bounded by
  SET LOCAL lock_timeout.
*/
class PgTransaction final : public db::Transaction {
public:
  PgTransaction(std::shared_ptr<PgPool> pool, std::chrono::milliseconds lock_timeout);
  ~PgTransaction();

  pqxx::work& Work() { return *tx_; }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return committed_; }

private:
  std::shared_ptr<pqxx::connection> conn_;
  std::unique_ptr<pqxx::work> tx_;
  bool committed_ = false;
  bool finished_ = false;
};

}
