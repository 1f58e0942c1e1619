#pragma once

#include <cstdint>
#include <set>
#include <string>

namespace ledger::db {

/*
  Row-lock ranks of the lock ordering protocol.

  Every mutating path acquires row locks in non-decreasing rank:
    tenant -> resource (plan, instance, chore) -> ledger -> shares
  Several locks of the same rank may be held; re-locking a row the
  transaction already holds is always allowed.
*/
enum class LockRank : std::uint8_t {
  kTenant = 0,
  kResource = 1,
  kLedger = 2,
  kShares = 3,
};

/*
  Abstract transaction.

  Semantics guaranteed for ALL backends:

  - Changes are invisible until Commit()
  - After Commit() all reads see the change
  - Rollback() discards all writes
  - Destructor MUST rollback if not committed
  - Row locks are held until Commit()/Rollback(); never released early

  SQLite: BEGIN IMMEDIATE (database-wide writer lock)
  Postgres: pqxx::work + SELECT ... FOR UPDATE
  Memory: row-lock table + private write set
*/

class Transaction {
public:
  virtual ~Transaction() = default;

  // commit changes atomically
  virtual void Commit() = 0;

  // explicit rollback
  virtual void Rollback() = 0;

  // true if commit already performed
  virtual bool IsCommitted() const = 0;

  // true if this transaction already holds the row lock for key
  bool HoldsLock(const std::string& key) const;

  // Throws util::LockOrderViolation when rank is below the highest rank
  // already held. Backends call this before blocking on a new row lock.
  void CheckLockOrder(LockRank rank, const std::string& key) const;

  // Records a row lock after the backend acquired it.
  void NoteLockAcquired(LockRank rank, const std::string& key);

protected:
  void ForgetLocks();

private:
  std::set<std::string> held_;
  LockRank highest_ = LockRank::kTenant;
};

}
