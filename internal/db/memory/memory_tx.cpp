#include "memory_tx.hpp"

namespace ledger::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo, uint64_t id) : repo_(repo), id_(id) {
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

void MemoryTransaction::Commit() {
  try {
    repo_.Publish(writes_);
  } catch (...) {
    Rollback();
    throw;
  }
  committed_ = true;
  Finish();
}

void MemoryTransaction::Rollback() {
  rolled_back_ = true;
  writes_      = MemoryRepository::State{};
  Finish();
}

void MemoryTransaction::Finish() {
  repo_.locks_.ReleaseAll(id_);
  ForgetLocks();
}

} // namespace ledger::db::memory
