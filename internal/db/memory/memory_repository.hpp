#pragma once

#include <atomic>
#include <chrono>
#include <map>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "row_lock_table.hpp"

namespace ledger::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  explicit MemoryRepository(std::chrono::milliseconds lock_timeout = std::chrono::milliseconds(5000));

  std::unique_ptr<Transaction> Begin() override;

  Result LockTenant(Transaction&, const std::string& tenant_id) override;
  Result LockPlan(Transaction&, const std::string& plan_id) override;
  Result TryLockPlan(Transaction&, const std::string& plan_id) override;
  Result LockInstance(Transaction&, const std::string& instance_id) override;
  Result LockChore(Transaction&, const std::string& chore_id) override;
  Result LockLedger(Transaction&, const std::string& tenant_id) override;
  Result LockInstanceShares(Transaction&, const std::string& instance_id) override;

  Result UpsertTenant(Transaction&, const model::TenantRecord&) override;
  std::optional<model::TenantRecord> GetTenant(Transaction&, const std::string&) override;
  Result UpsertMembership(Transaction&, const model::MembershipRecord&) override;
  std::optional<model::MembershipRecord> GetMembership(Transaction&, const std::string& tenant_id,
                                                       const std::string& participant_id) override;
  Result UpsertEntitlement(Transaction&, const model::EntitlementRecord&) override;
  std::optional<model::EntitlementRecord> GetEntitlement(Transaction&, const std::string&) override;

  std::optional<model::LedgerRecord> GetLedger(Transaction&, const std::string&) override;
  Result UpsertLedger(Transaction&, const model::LedgerRecord&) override;

  Result InsertPlan(Transaction&, const model::PlanRecord&, const std::vector<model::PlanShareRecord>&) override;
  std::optional<model::PlanRecord> GetPlan(Transaction&, const std::string&) override;
  Result UpdatePlan(Transaction&, const model::PlanRecord&) override;
  std::vector<model::PlanShareRecord> GetPlanShares(Transaction&, const std::string&) override;
  std::vector<model::PlanRecord> ListDuePlans(Transaction&, const util::Date& today, std::size_t limit) override;
  std::vector<model::PlanRecord> ListActivePlans(Transaction&, const std::string& tenant_id) override;

  Result InsertInstance(Transaction&, const model::InstanceRecord&) override;
  std::optional<model::InstanceRecord> GetInstance(Transaction&, const std::string&) override;
  std::optional<model::InstanceRecord> FindInstance(Transaction&, const std::string& plan_id,
                                                    const util::Date& due_date) override;
  std::vector<model::InstanceRecord> ListInstances(Transaction&, const std::string& plan_id) override;
  Result UpdateInstance(Transaction&, const model::InstanceRecord&) override;
  Result InsertInstanceShares(Transaction&, const std::vector<model::InstanceShareRecord>&) override;
  std::vector<model::InstanceShareRecord> GetInstanceShares(Transaction&, const std::string&) override;
  Result UpdateInstanceShare(Transaction&, const model::InstanceShareRecord&) override;

  Result InsertChore(Transaction&, const model::ChoreRecord&) override;
  std::optional<model::ChoreRecord> GetChore(Transaction&, const std::string&) override;
  Result UpdateChore(Transaction&, const model::ChoreRecord&) override;

  // Row locks currently held by open transactions.
  std::size_t HeldLockCount() const;

private:
  friend class MemoryTransaction;

  using PairKey = std::pair<std::string, std::string>;

  struct State {
    std::map<std::string, model::TenantRecord>      tenants;
    std::map<PairKey, model::MembershipRecord>      memberships;
    std::map<std::string, model::EntitlementRecord> entitlements;
    std::map<std::string, model::LedgerRecord>      ledgers;

    std::map<std::string, model::PlanRecord> plans;
    std::map<PairKey, model::PlanShareRecord> plan_shares;

    std::map<std::string, model::InstanceRecord> instances;
    // (plan_id, due date) -> instance id
    std::map<PairKey, std::string>                instance_index;
    std::map<PairKey, model::InstanceShareRecord> instance_shares;

    std::map<std::string, model::ChoreRecord> chores;
  };

  Result Acquire(Transaction&, LockRank rank, const std::string& key, bool wait);

  // Validates unique keys against committed state and applies the write set.
  void Publish(const State& writes);

  mutable std::shared_mutex mutex_;
  State                     committed_;
  RowLockTable              locks_;
  std::atomic<uint64_t>     next_tx_id_{1};
};

}
