#include "termination_cascade.hpp"

#include "internal/core/repository_util.hpp"
#include "internal/observability/logging.hpp"

namespace ledger::core {

TerminationCascade::TerminationCascade(std::shared_ptr<db::Repository> repository, std::shared_ptr<LedgerStore> ledger,
                                       std::shared_ptr<util::Clock> clock)
    : repository_(std::move(repository)), ledger_(std::move(ledger)), clock_(std::move(clock)) {
}

bool TerminationCascade::References(db::Transaction& tx, const db::model::PlanRecord& plan, const std::string& participant_id) {
  if (plan.owner_id == participant_id) {
    return true;
  }
  for (const auto& share : repository_->GetPlanShares(tx, plan.id)) {
    if (share.participant_id == participant_id) {
      return true;
    }
  }
  return false;
}

CascadeResult TerminationCascade::OnParticipantRemoved(db::Transaction& tx, const std::string& tenant_id, const std::string& participant_id) {
  LockActiveTenant(*repository_, tx, tenant_id);

  CascadeResult result;
  const auto    now_ms = util::ToUnixMillis(clock_->Now());

  // The tenant lock keeps new plans out while we walk the list.
  for (const auto& candidate : repository_->ListActivePlans(tx, tenant_id)) {
    if (!References(tx, candidate, participant_id)) {
      continue;
    }

    ThrowIfDbError(repository_->LockPlan(tx, candidate.id), "lock plan " + candidate.id);
    auto plan = repository_->GetPlan(tx, candidate.id);
    if (!plan || !model::CanTransition(plan->status, model::PlanStatus::kTerminated)) {
      continue;
    }

    plan->status           = model::PlanStatus::kTerminated;
    plan->terminated_at_ms = now_ms;
    plan->updated_at_ms    = now_ms;
    ThrowIfDbError(repository_->UpdatePlan(tx, *plan), "terminate plan " + plan->id);
    result.terminated_plan_ids.push_back(plan->id);
  }

  auto membership = repository_->GetMembership(tx, tenant_id, participant_id);
  if (membership && membership->is_current) {
    membership->is_current    = false;
    membership->updated_at_ms = now_ms;
    ThrowIfDbError(repository_->UpsertMembership(tx, *membership), "release membership " + participant_id);
    ledger_->ApplyDelta(tx, tenant_id, {{model::Metric::kActiveMembers, -1}});
    result.membership_released = true;
  }

  LEDGER_LOG_INFO("participant removed",
                  {observability::StringField("tenant", tenant_id), observability::StringField("participant", participant_id),
                   observability::IntField("plans_terminated", static_cast<std::int64_t>(result.terminated_plan_ids.size())),
                   observability::BoolField("membership_released", result.membership_released)});
  return result;
}

} // namespace ledger::core
