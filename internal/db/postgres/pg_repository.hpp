#pragma once

#include <chrono>
#include <exception>
#include <memory>

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace ledger::db::postgres {

class PgRepository final : public db::Repository {
public:
  PgRepository(std::shared_ptr<PgPool> pool, std::chrono::milliseconds lock_timeout = std::chrono::milliseconds(5000));

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
  static PgTransaction& TX(Transaction&);
  static Result Translate(const std::exception& e);

  // SELECT ... FOR UPDATE [SKIP LOCKED]; an empty result maps to
  // missing_code (NotFound, or Busy for skip-locked claims).
  static Result LockRow(Transaction&, LockRank rank, const std::string& key, const std::string& sql, const std::string& id,
                        ErrorCode missing_code);

  std::shared_ptr<PgPool>   pool_;
  std::chrono::milliseconds lock_timeout_;
};

}
