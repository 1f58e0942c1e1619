#include "internal/db/api/transaction.hpp"

#include "internal/util/errors.hpp"

namespace ledger::db {

namespace {

const char* RankName(LockRank rank) {
  switch (rank) {
    case LockRank::kTenant:
      return "tenant";
    case LockRank::kResource:
      return "resource";
    case LockRank::kLedger:
      return "ledger";
    case LockRank::kShares:
      return "shares";
  }
  return "unknown";
}

} // namespace

bool Transaction::HoldsLock(const std::string& key) const {
  return held_.contains(key);
}

void Transaction::CheckLockOrder(LockRank rank, const std::string& key) const {
  if (held_.empty() || rank >= highest_) return;

  throw util::LockOrderViolation("LOCK_ORDER_VIOLATION", std::string("acquiring ") + RankName(rank) + " lock '" + key + "' after a " +
                                                            RankName(highest_) + " lock");
}

void Transaction::NoteLockAcquired(LockRank rank, const std::string& key) {
  if (held_.empty() || rank > highest_) highest_ = rank;
  held_.insert(key);
}

void Transaction::ForgetLocks() {
  held_.clear();
  highest_ = LockRank::kTenant;
}

} // namespace ledger::db
