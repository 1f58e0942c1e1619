#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace ledger::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

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

private:
  static SqliteTransaction& TX(Transaction&);
  static Result Translate(sqlite3* db, int rc);

  // Order check + bookkeeping only; the writer lock already excludes
  // every other transaction.
  static Result NoteLock(Transaction&, LockRank rank, const std::string& key);

  std::shared_ptr<SqliteDB> db_;
};

}
