#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/chore_record.hpp"
#include "internal/db/model/instance_record.hpp"
#include "internal/db/model/ledger_record.hpp"
#include "internal/db/model/plan_record.hpp"
#include "internal/db/model/tenant_record.hpp"

namespace ledger::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes happen inside a Transaction
  - Reads inside a transaction see its own writes
  - Row locks follow the lock ordering protocol (see LockRank); acquiring
    out of order throws util::LockOrderViolation before any wait
  - Lock* calls block up to the configured lock timeout, then return Busy
  - TryLockPlan never blocks: Busy means another transaction holds the row
  - InsertInstance returns AlreadyExists on a (plan_id, due_date) conflict
    and leaves the transaction usable

  The DB is the source of truth for:
    ledger counters
    plan lifecycle
    materialized cycles and their shares
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Row locks
  // ---------------------------------------------------------------------

  // NotFound if the tenant row does not exist.
  virtual Result LockTenant(Transaction&, const std::string& tenant_id) = 0;

  virtual Result LockPlan(Transaction&, const std::string& plan_id) = 0;

  // Lock-or-skip claim used by the due-cycle scheduler.
  virtual Result TryLockPlan(Transaction&, const std::string& plan_id) = 0;

  virtual Result LockInstance(Transaction&, const std::string& instance_id) = 0;

  virtual Result LockChore(Transaction&, const std::string& chore_id) = 0;

  // Creates the ledger row when missing, then locks it.
  virtual Result LockLedger(Transaction&, const std::string& tenant_id) = 0;

  virtual Result LockInstanceShares(Transaction&, const std::string& instance_id) = 0;

  // ---------------------------------------------------------------------
  // Tenants, memberships, entitlements
  // ---------------------------------------------------------------------

  virtual Result UpsertTenant(Transaction&, const model::TenantRecord&) = 0;

  virtual std::optional<model::TenantRecord> GetTenant(Transaction&, const std::string& tenant_id) = 0;

  virtual Result UpsertMembership(Transaction&, const model::MembershipRecord&) = 0;

  virtual std::optional<model::MembershipRecord> GetMembership(Transaction&, const std::string& tenant_id, const std::string& participant_id) = 0;

  virtual Result UpsertEntitlement(Transaction&, const model::EntitlementRecord&) = 0;

  virtual std::optional<model::EntitlementRecord> GetEntitlement(Transaction&, const std::string& tenant_id) = 0;

  // ---------------------------------------------------------------------
  // Ledger
  // ---------------------------------------------------------------------

  virtual std::optional<model::LedgerRecord> GetLedger(Transaction&, const std::string& tenant_id) = 0;

  virtual Result UpsertLedger(Transaction&, const model::LedgerRecord&) = 0;

  // ---------------------------------------------------------------------
  // Recurring plans
  // ---------------------------------------------------------------------

  virtual Result InsertPlan(Transaction&, const model::PlanRecord&, const std::vector<model::PlanShareRecord>& shares) = 0;

  virtual std::optional<model::PlanRecord> GetPlan(Transaction&, const std::string& plan_id) = 0;

  virtual Result UpdatePlan(Transaction&, const model::PlanRecord&) = 0;

  virtual std::vector<model::PlanShareRecord> GetPlanShares(Transaction&, const std::string& plan_id) = 0;

  // Active plans with next_due_date <= today, oldest due first.
  virtual std::vector<model::PlanRecord> ListDuePlans(Transaction&, const util::Date& today, std::size_t limit) = 0;

  virtual std::vector<model::PlanRecord> ListActivePlans(Transaction&, const std::string& tenant_id) = 0;

  // ---------------------------------------------------------------------
  // Materialized cycles
  // ---------------------------------------------------------------------

  virtual Result InsertInstance(Transaction&, const model::InstanceRecord&) = 0;

  virtual std::optional<model::InstanceRecord> GetInstance(Transaction&, const std::string& instance_id) = 0;

  virtual std::optional<model::InstanceRecord> FindInstance(Transaction&, const std::string& plan_id, const util::Date& due_date) = 0;

  // Ordered by due date.
  virtual std::vector<model::InstanceRecord> ListInstances(Transaction&, const std::string& plan_id) = 0;

  virtual Result UpdateInstance(Transaction&, const model::InstanceRecord&) = 0;

  virtual Result InsertInstanceShares(Transaction&, const std::vector<model::InstanceShareRecord>&) = 0;

  virtual std::vector<model::InstanceShareRecord> GetInstanceShares(Transaction&, const std::string& instance_id) = 0;

  virtual Result UpdateInstanceShare(Transaction&, const model::InstanceShareRecord&) = 0;

  // ---------------------------------------------------------------------
  // Chores (in-place obligations)
  // ---------------------------------------------------------------------

  virtual Result InsertChore(Transaction&, const model::ChoreRecord&) = 0;

  virtual std::optional<model::ChoreRecord> GetChore(Transaction&, const std::string& chore_id) = 0;

  virtual Result UpdateChore(Transaction&, const model::ChoreRecord&) = 0;
};

// Row-lock keys shared by every backend.
std::string TenantLockKey(const std::string& tenant_id);
std::string PlanLockKey(const std::string& plan_id);
std::string InstanceLockKey(const std::string& instance_id);
std::string ChoreLockKey(const std::string& chore_id);
std::string LedgerLockKey(const std::string& tenant_id);
std::string SharesLockKey(const std::string& instance_id);

} // namespace ledger::db
