#include "ledger_engine.hpp"

namespace ledger::core {

LedgerEngine::LedgerEngine(std::shared_ptr<db::Repository> repository, std::shared_ptr<const PlanLimitRegistry> registry,
                           std::shared_ptr<util::Clock> clock, scheduler::SchedulerLimits limits)
    : repository_(std::move(repository)), clock_(std::move(clock)) {
  ledger_       = std::make_shared<LedgerStore>(repository_, clock_);
  quota_        = std::make_shared<QuotaGuard>(repository_, std::move(registry), clock_);
  plans_        = std::make_shared<PlanManager>(repository_, clock_);
  materializer_ = std::make_shared<CycleMaterializer>(repository_, plans_, ledger_, clock_);
  cursors_      = std::make_shared<CursorAdvancer>(repository_, ledger_, clock_);
  settlement_   = std::make_shared<ShareSettlement>(repository_, ledger_, clock_);
  cascade_      = std::make_shared<TerminationCascade>(repository_, ledger_, clock_);
  scheduler_    = std::make_shared<scheduler::DueCycleScheduler>(repository_, materializer_, clock_, limits);
}

void LedgerEngine::AssertQuota(const std::string& tenant_id, const model::Deltas& deltas) {
  InTransaction([&](db::Transaction& tx) { quota_->AssertQuota(tx, tenant_id, deltas); });
}

model::Counters LedgerEngine::ApplyDelta(const std::string& tenant_id, const model::Deltas& deltas) {
  return InTransaction([&](db::Transaction& tx) { return ledger_->ApplyDelta(tx, tenant_id, deltas); });
}

model::Counters LedgerEngine::GetUsage(const std::string& tenant_id) {
  return InTransaction([&](db::Transaction& tx) { return ledger_->Read(tx, tenant_id); });
}

QuotaStatus LedgerEngine::DescribeQuota(const std::string& tenant_id) {
  return InTransaction([&](db::Transaction& tx) { return quota_->Describe(tx, tenant_id); });
}

db::model::PlanRecord LedgerEngine::CreatePlan(const PlanSpec& spec) {
  return InTransaction([&](db::Transaction& tx) { return plans_->Create(tx, spec); });
}

ActivationResult LedgerEngine::ActivatePlan(const PlanSpec& spec) {
  return InTransaction([&](db::Transaction& tx) {
    quota_->AssertQuota(tx, spec.tenant_id, {{model::Metric::kActiveExpenses, 1}});

    ActivationResult result;
    result.plan        = plans_->Create(tx, spec);
    result.first_cycle = materializer_->MaterializeLocked(tx, result.plan, result.plan.start_date);
    return result;
  });
}

TerminateResult LedgerEngine::TerminatePlan(const std::string& plan_id, const std::string& actor_id) {
  return InTransaction([&](db::Transaction& tx) { return plans_->Terminate(tx, plan_id, actor_id); });
}

db::model::PlanRecord LedgerEngine::GetPlan(const std::string& plan_id) {
  return InTransaction([&](db::Transaction& tx) { return plans_->Get(tx, plan_id); });
}

std::vector<db::model::InstanceRecord> LedgerEngine::ListCycles(const std::string& plan_id) {
  return InTransaction([&](db::Transaction& tx) {
    plans_->Get(tx, plan_id);
    return repository_->ListInstances(tx, plan_id);
  });
}

MaterializeResult LedgerEngine::Materialize(const std::string& plan_id, const util::Date& due_date) {
  return InTransaction([&](db::Transaction& tx) { return materializer_->Materialize(tx, plan_id, due_date); });
}

AdvanceResult LedgerEngine::AdvanceChore(const std::string& chore_id, std::optional<util::Date> today) {
  const auto day = today.value_or(clock_->Today());
  return InTransaction([&](db::Transaction& tx) { return cursors_->Advance(tx, chore_id, day); });
}

SettleResult LedgerEngine::SettleShare(const std::string& instance_id, const std::string& participant_id) {
  return InTransaction([&](db::Transaction& tx) { return settlement_->Settle(tx, instance_id, participant_id); });
}

scheduler::RunReport LedgerEngine::RunDueCycles(std::optional<util::Date> today) {
  return scheduler_->RunDueCycles(today.value_or(clock_->Today()));
}

CascadeResult LedgerEngine::RemoveParticipant(const std::string& tenant_id, const std::string& participant_id) {
  return InTransaction([&](db::Transaction& tx) { return cascade_->OnParticipantRemoved(tx, tenant_id, participant_id); });
}

} // namespace ledger::core
