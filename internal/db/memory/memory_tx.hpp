#pragma once

#include <cstdint>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace ledger::db::memory {

/*
  Transaction = private write set + row locks.

  Reads see committed rows overlaid with this transaction's writes.
  Commit publishes the write set atomically, then releases every row lock.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  MemoryTransaction(MemoryRepository& repo, uint64_t id);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  uint64_t Id() const {
    return id_;
  }

  MemoryRepository::State& Writes() {
    return writes_;
  }
  const MemoryRepository::State& Writes() const {
    return writes_;
  }

 private:
  void Finish();

  MemoryRepository&       repo_;
  uint64_t                id_;
  MemoryRepository::State writes_;
  bool                    committed_   = false;
  bool                    rolled_back_ = false;
};

} // namespace ledger::db::memory
