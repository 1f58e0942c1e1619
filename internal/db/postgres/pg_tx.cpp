#include "pg_tx.hpp"

#include <string>

#include "internal/observability/logging.hpp"

namespace ledger::db::postgres {

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool, std::chrono::milliseconds lock_timeout) {
  conn_ = pool->Acquire();
  tx_   = std::make_unique<pqxx::work>(*conn_);
  tx_->exec("SET LOCAL lock_timeout = '" + std::to_string(lock_timeout.count()) + "ms'");
}

PgTransaction::~PgTransaction() {
  if (!finished_) {
    try {
      tx_->abort();
    } catch (const std::exception& e) {
      LEDGER_LOG_WARN("postgres rollback failed", {ledger::observability::StringField("error", e.what())});
    }
  }
}

void PgTransaction::Commit() {
  finished_ = true;
  ForgetLocks();
  tx_->commit();
  committed_ = true;
}

void PgTransaction::Rollback() {
  finished_ = true;
  ForgetLocks();
  tx_->abort();
}

}
