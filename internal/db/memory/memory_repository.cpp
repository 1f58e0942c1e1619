#include "memory_repository.hpp"

#include <algorithm>
#include <mutex>

#include "internal/util/errors.hpp"
#include "memory_tx.hpp"

namespace ledger::db::memory {

namespace {

template <typename Map, typename Key>
std::optional<typename Map::mapped_type> Lookup(const Map& writes, const Map& committed, const Key& key) {
  if (auto it = writes.find(key); it != writes.end()) return it->second;
  if (auto it = committed.find(key); it != committed.end()) return it->second;
  return std::nullopt;
}

template <typename Map, typename Key>
bool Exists(const Map& writes, const Map& committed, const Key& key) {
  return writes.contains(key) || committed.contains(key);
}

// Committed rows overlaid with the write set, filtered by pred.
template <typename Map, typename Pred>
std::vector<typename Map::mapped_type> Select(const Map& writes, const Map& committed, Pred pred) {
  std::vector<typename Map::mapped_type> out;
  for (const auto& [key, row] : committed) {
    auto        it      = writes.find(key);
    const auto& current = it == writes.end() ? row : it->second;
    if (pred(current)) out.push_back(current);
  }
  for (const auto& [key, row] : writes) {
    if (!committed.contains(key) && pred(row)) out.push_back(row);
  }
  return out;
}

template <typename Map>
void Merge(Map& target, const Map& source) {
  for (const auto& [key, row] : source) {
    target.insert_or_assign(key, row);
  }
}

std::string DueKey(const util::Date& due_date) {
  return util::FormatDate(due_date);
}

} // namespace

MemoryRepository::MemoryRepository(std::chrono::milliseconds lock_timeout) : locks_(lock_timeout) {
}

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this, next_tx_id_.fetch_add(1));
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

std::size_t MemoryRepository::HeldLockCount() const {
  return locks_.HeldCount();
}

void MemoryRepository::Publish(const State& writes) {
  std::unique_lock lock(mutex_);

  for (const auto& [key, instance_id] : writes.instance_index) {
    auto it = committed_.instance_index.find(key);
    if (it != committed_.instance_index.end() && it->second != instance_id) {
      throw util::ConcurrentModification("STATE_CHANGED_RETRY",
                                         "cycle " + key.first + "@" + key.second + " was materialized by a concurrent transaction");
    }
  }

  Merge(committed_.tenants, writes.tenants);
  Merge(committed_.memberships, writes.memberships);
  Merge(committed_.entitlements, writes.entitlements);
  Merge(committed_.ledgers, writes.ledgers);
  Merge(committed_.plans, writes.plans);
  Merge(committed_.plan_shares, writes.plan_shares);
  Merge(committed_.instances, writes.instances);
  Merge(committed_.instance_index, writes.instance_index);
  Merge(committed_.instance_shares, writes.instance_shares);
  Merge(committed_.chores, writes.chores);
}

// ------------------------------------------------------------------
// Row locks
// ------------------------------------------------------------------

Result MemoryRepository::Acquire(Transaction& t, LockRank rank, const std::string& key, bool wait) {
  if (t.HoldsLock(key)) return Result::Ok();
  t.CheckLockOrder(rank, key);

  if (!locks_.Acquire(key, TX(t).Id(), wait)) {
    return Result::Err(ErrorCode::Busy, wait ? "lock wait timed out on " + key : key + " is claimed by another transaction");
  }
  t.NoteLockAcquired(rank, key);
  return Result::Ok();
}

Result MemoryRepository::LockTenant(Transaction& t, const std::string& tenant_id) {
  if (!GetTenant(t, tenant_id).has_value()) return Result::Err(ErrorCode::NotFound, "tenant " + tenant_id);
  return Acquire(t, LockRank::kTenant, TenantLockKey(tenant_id), true);
}

Result MemoryRepository::LockPlan(Transaction& t, const std::string& plan_id) {
  return Acquire(t, LockRank::kResource, PlanLockKey(plan_id), true);
}

Result MemoryRepository::TryLockPlan(Transaction& t, const std::string& plan_id) {
  return Acquire(t, LockRank::kResource, PlanLockKey(plan_id), false);
}

Result MemoryRepository::LockInstance(Transaction& t, const std::string& instance_id) {
  return Acquire(t, LockRank::kResource, InstanceLockKey(instance_id), true);
}

Result MemoryRepository::LockChore(Transaction& t, const std::string& chore_id) {
  return Acquire(t, LockRank::kResource, ChoreLockKey(chore_id), true);
}

Result MemoryRepository::LockLedger(Transaction& t, const std::string& tenant_id) {
  auto locked = Acquire(t, LockRank::kLedger, LedgerLockKey(tenant_id), true);
  if (!locked) return locked;

  if (!GetLedger(t, tenant_id).has_value()) {
    model::LedgerRecord row;
    row.tenant_id = tenant_id;
    TX(t).Writes().ledgers[tenant_id] = row;
  }
  return Result::Ok();
}

Result MemoryRepository::LockInstanceShares(Transaction& t, const std::string& instance_id) {
  return Acquire(t, LockRank::kShares, SharesLockKey(instance_id), true);
}

// ------------------------------------------------------------------
// Tenants
// ------------------------------------------------------------------

Result MemoryRepository::UpsertTenant(Transaction& t, const model::TenantRecord& r) {
  TX(t).Writes().tenants[r.id] = r;
  return Result::Ok();
}

std::optional<model::TenantRecord> MemoryRepository::GetTenant(Transaction& t, const std::string& id) {
  std::shared_lock lock(mutex_);
  return Lookup(TX(t).Writes().tenants, committed_.tenants, id);
}

Result MemoryRepository::UpsertMembership(Transaction& t, const model::MembershipRecord& r) {
  TX(t).Writes().memberships[{r.tenant_id, r.participant_id}] = r;
  return Result::Ok();
}

std::optional<model::MembershipRecord> MemoryRepository::GetMembership(Transaction& t, const std::string& tenant_id,
                                                                       const std::string& participant_id) {
  std::shared_lock lock(mutex_);
  return Lookup(TX(t).Writes().memberships, committed_.memberships, PairKey{tenant_id, participant_id});
}

Result MemoryRepository::UpsertEntitlement(Transaction& t, const model::EntitlementRecord& r) {
  TX(t).Writes().entitlements[r.tenant_id] = r;
  return Result::Ok();
}

std::optional<model::EntitlementRecord> MemoryRepository::GetEntitlement(Transaction& t, const std::string& tenant_id) {
  std::shared_lock lock(mutex_);
  return Lookup(TX(t).Writes().entitlements, committed_.entitlements, tenant_id);
}

// ------------------------------------------------------------------
// Ledger
// ------------------------------------------------------------------

std::optional<model::LedgerRecord> MemoryRepository::GetLedger(Transaction& t, const std::string& tenant_id) {
  std::shared_lock lock(mutex_);
  return Lookup(TX(t).Writes().ledgers, committed_.ledgers, tenant_id);
}

Result MemoryRepository::UpsertLedger(Transaction& t, const model::LedgerRecord& r) {
  TX(t).Writes().ledgers[r.tenant_id] = r;
  return Result::Ok();
}

// ------------------------------------------------------------------
// Plans
// ------------------------------------------------------------------

Result MemoryRepository::InsertPlan(Transaction& t, const model::PlanRecord& r, const std::vector<model::PlanShareRecord>& shares) {
  auto& w = TX(t).Writes();
  {
    std::shared_lock lock(mutex_);
    if (Exists(w.plans, committed_.plans, r.id)) return Result::Err(ErrorCode::AlreadyExists, "plan " + r.id);
  }

  w.plans[r.id] = r;
  for (const auto& share : shares) {
    w.plan_shares[{r.id, share.participant_id}] = share;
  }
  return Result::Ok();
}

std::optional<model::PlanRecord> MemoryRepository::GetPlan(Transaction& t, const std::string& id) {
  std::shared_lock lock(mutex_);
  return Lookup(TX(t).Writes().plans, committed_.plans, id);
}

Result MemoryRepository::UpdatePlan(Transaction& t, const model::PlanRecord& r) {
  if (!GetPlan(t, r.id).has_value()) return Result::Err(ErrorCode::NotFound, "plan " + r.id);
  TX(t).Writes().plans[r.id] = r;
  return Result::Ok();
}

std::vector<model::PlanShareRecord> MemoryRepository::GetPlanShares(Transaction& t, const std::string& plan_id) {
  std::shared_lock lock(mutex_);
  return Select(TX(t).Writes().plan_shares, committed_.plan_shares, [&](const model::PlanShareRecord& s) { return s.plan_id == plan_id; });
}

std::vector<model::PlanRecord> MemoryRepository::ListDuePlans(Transaction& t, const util::Date& today, std::size_t limit) {
  std::vector<model::PlanRecord> due;
  {
    std::shared_lock lock(mutex_);
    due = Select(TX(t).Writes().plans, committed_.plans, [&](const model::PlanRecord& p) {
      return p.status == ledger::model::PlanStatus::kActive && p.next_due_date <= today;
    });
  }

  std::sort(due.begin(), due.end(), [](const model::PlanRecord& a, const model::PlanRecord& b) {
    if (a.next_due_date != b.next_due_date) return a.next_due_date < b.next_due_date;
    return a.id < b.id;
  });
  if (due.size() > limit) due.resize(limit);
  return due;
}

std::vector<model::PlanRecord> MemoryRepository::ListActivePlans(Transaction& t, const std::string& tenant_id) {
  std::shared_lock lock(mutex_);
  return Select(TX(t).Writes().plans, committed_.plans, [&](const model::PlanRecord& p) {
    return p.tenant_id == tenant_id && p.status == ledger::model::PlanStatus::kActive;
  });
}

// ------------------------------------------------------------------
// Instances
// ------------------------------------------------------------------

Result MemoryRepository::InsertInstance(Transaction& t, const model::InstanceRecord& r) {
  auto&         w   = TX(t).Writes();
  const PairKey key = {r.plan_id, DueKey(r.due_date)};
  {
    std::shared_lock lock(mutex_);
    if (Exists(w.instance_index, committed_.instance_index, key)) {
      return Result::Err(ErrorCode::AlreadyExists, "cycle " + key.first + "@" + key.second);
    }
    if (Exists(w.instances, committed_.instances, r.id)) return Result::Err(ErrorCode::AlreadyExists, "instance " + r.id);
  }

  w.instances[r.id]      = r;
  w.instance_index[key] = r.id;
  return Result::Ok();
}

std::optional<model::InstanceRecord> MemoryRepository::GetInstance(Transaction& t, const std::string& id) {
  std::shared_lock lock(mutex_);
  return Lookup(TX(t).Writes().instances, committed_.instances, id);
}

std::optional<model::InstanceRecord> MemoryRepository::FindInstance(Transaction& t, const std::string& plan_id, const util::Date& due_date) {
  std::shared_lock lock(mutex_);
  const auto&      w  = TX(t).Writes();
  const auto       id = Lookup(w.instance_index, committed_.instance_index, PairKey{plan_id, DueKey(due_date)});
  if (!id.has_value()) return std::nullopt;
  return Lookup(w.instances, committed_.instances, *id);
}

std::vector<model::InstanceRecord> MemoryRepository::ListInstances(Transaction& t, const std::string& plan_id) {
  std::vector<model::InstanceRecord> out;
  {
    std::shared_lock lock(mutex_);
    out = Select(TX(t).Writes().instances, committed_.instances, [&](const model::InstanceRecord& i) { return i.plan_id == plan_id; });
  }
  std::sort(out.begin(), out.end(), [](const model::InstanceRecord& a, const model::InstanceRecord& b) { return a.due_date < b.due_date; });
  return out;
}

Result MemoryRepository::UpdateInstance(Transaction& t, const model::InstanceRecord& r) {
  if (!GetInstance(t, r.id).has_value()) return Result::Err(ErrorCode::NotFound, "instance " + r.id);
  TX(t).Writes().instances[r.id] = r;
  return Result::Ok();
}

Result MemoryRepository::InsertInstanceShares(Transaction& t, const std::vector<model::InstanceShareRecord>& shares) {
  auto& w = TX(t).Writes();
  {
    std::shared_lock lock(mutex_);
    for (const auto& share : shares) {
      if (Exists(w.instance_shares, committed_.instance_shares, PairKey{share.instance_id, share.participant_id})) {
        return Result::Err(ErrorCode::AlreadyExists, "share " + share.instance_id + "/" + share.participant_id);
      }
    }
  }

  for (const auto& share : shares) {
    w.instance_shares[{share.instance_id, share.participant_id}] = share;
  }
  return Result::Ok();
}

std::vector<model::InstanceShareRecord> MemoryRepository::GetInstanceShares(Transaction& t, const std::string& instance_id) {
  std::shared_lock lock(mutex_);
  return Select(TX(t).Writes().instance_shares, committed_.instance_shares,
                [&](const model::InstanceShareRecord& s) { return s.instance_id == instance_id; });
}

Result MemoryRepository::UpdateInstanceShare(Transaction& t, const model::InstanceShareRecord& r) {
  auto&         w   = TX(t).Writes();
  const PairKey key = {r.instance_id, r.participant_id};
  {
    std::shared_lock lock(mutex_);
    if (!Exists(w.instance_shares, committed_.instance_shares, key)) {
      return Result::Err(ErrorCode::NotFound, "share " + r.instance_id + "/" + r.participant_id);
    }
  }
  w.instance_shares[key] = r;
  return Result::Ok();
}

// ------------------------------------------------------------------
// Chores
// ------------------------------------------------------------------

Result MemoryRepository::InsertChore(Transaction& t, const model::ChoreRecord& r) {
  auto& w = TX(t).Writes();
  {
    std::shared_lock lock(mutex_);
    if (Exists(w.chores, committed_.chores, r.id)) return Result::Err(ErrorCode::AlreadyExists, "chore " + r.id);
  }
  w.chores[r.id] = r;
  return Result::Ok();
}

std::optional<model::ChoreRecord> MemoryRepository::GetChore(Transaction& t, const std::string& id) {
  std::shared_lock lock(mutex_);
  return Lookup(TX(t).Writes().chores, committed_.chores, id);
}

Result MemoryRepository::UpdateChore(Transaction& t, const model::ChoreRecord& r) {
  if (!GetChore(t, r.id).has_value()) return Result::Err(ErrorCode::NotFound, "chore " + r.id);
  TX(t).Writes().chores[r.id] = r;
  return Result::Ok();
}

} // namespace ledger::db::memory
