#include "plan_manager.hpp"

#include <cstdint>
#include <set>
#include <string>

#include "internal/core/repository_util.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace ledger::core {

namespace {

// Upper bound for one cycle's total, in cents.
constexpr std::int64_t kAmountCapCents = 900'000'000'000;

} // namespace

PlanManager::PlanManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<util::Clock> clock)
    : repository_(std::move(repository)), clock_(std::move(clock)) {
}

void PlanManager::ValidateSpec(db::Transaction& tx, const PlanSpec& spec) {
  model::ValidateInterval(spec.interval);

  if (spec.shares.empty()) {
    throw util::InvalidArgument("SPLIT_MEMBERS_REQUIRED", "a recurring plan needs at least one share");
  }

  const auto owner = repository_->GetMembership(tx, spec.tenant_id, spec.owner_id);
  if (!owner || !owner->is_current) {
    throw util::PermissionDenied("NOT_MEMBER", spec.owner_id);
  }

  std::set<std::string> seen;
  bool                  has_other = false;
  std::int64_t          total     = 0;
  for (const auto& share : spec.shares) {
    if (share.participant_id.empty()) {
      throw util::InvalidArgument("INVALID_DEBTOR", "empty participant");
    }
    if (share.amount_cents <= 0) {
      throw util::InvalidArgument("INVALID_AMOUNT", share.participant_id + " amount must be > 0");
    }
    if (share.amount_cents > kAmountCapCents - total) {
      throw util::InvalidArgument("INVALID_AMOUNT", "total amount must not exceed " + std::to_string(kAmountCapCents) + " cents");
    }
    total += share.amount_cents;
    if (!seen.insert(share.participant_id).second) {
      throw util::InvalidArgument("INVALID_DEBTOR", "duplicate participant " + share.participant_id);
    }
    if (share.participant_id != spec.owner_id) {
      has_other = true;
    }

    const auto member = repository_->GetMembership(tx, spec.tenant_id, share.participant_id);
    if (!member || !member->is_current) {
      throw util::InvalidArgument("INVALID_DEBTOR", share.participant_id + " is not a current member");
    }
  }

  if (!has_other) {
    throw util::InvalidArgument("SPLIT_MEMBERS_REQUIRED", "at least one participant besides the owner");
  }
}

db::model::PlanRecord PlanManager::Create(db::Transaction& tx, const PlanSpec& spec) {
  LockActiveTenant(*repository_, tx, spec.tenant_id);
  ValidateSpec(tx, spec);

  const auto now_ms = util::ToUnixMillis(clock_->Now());

  db::model::PlanRecord plan;
  plan.id            = util::NewId();
  plan.tenant_id     = spec.tenant_id;
  plan.owner_id      = spec.owner_id;
  plan.interval      = spec.interval;
  plan.start_date    = spec.start_date;
  plan.next_due_date = model::Advance(spec.start_date, spec.interval);
  plan.status        = model::PlanStatus::kActive;
  plan.created_at_ms = now_ms;
  plan.updated_at_ms = now_ms;

  std::vector<db::model::PlanShareRecord> shares;
  shares.reserve(spec.shares.size());
  for (const auto& share : spec.shares) {
    shares.push_back({plan.id, share.participant_id, share.amount_cents});
  }

  ThrowIfDbError(repository_->InsertPlan(tx, plan, shares), "insert plan " + plan.id);
  ThrowIfDbError(repository_->LockPlan(tx, plan.id), "lock plan " + plan.id);

  LEDGER_LOG_INFO("plan created", {observability::StringField("plan", plan.id), observability::StringField("tenant", plan.tenant_id),
                                   observability::StringField("start", util::FormatDate(plan.start_date))});
  return plan;
}

db::model::PlanRecord PlanManager::Get(db::Transaction& tx, const std::string& plan_id) {
  auto plan = repository_->GetPlan(tx, plan_id);
  if (!plan) {
    throw util::NotFound("PLAN_NOT_FOUND", plan_id);
  }
  return *plan;
}

db::model::PlanRecord PlanManager::LockPlan(db::Transaction& tx, const std::string& plan_id) {
  const auto unlocked = Get(tx, plan_id);
  LockActiveTenant(*repository_, tx, unlocked.tenant_id);

  const auto lock = repository_->LockPlan(tx, plan_id);
  if (lock.code == db::ErrorCode::NotFound) {
    throw util::NotFound("PLAN_NOT_FOUND", plan_id);
  }
  ThrowIfDbError(lock, "lock plan " + plan_id);

  auto plan = Get(tx, plan_id);
  if (plan.tenant_id != unlocked.tenant_id) {
    throw util::ConcurrentModification("STATE_CHANGED_RETRY", "plan " + plan_id + " moved tenants");
  }
  return plan;
}

TerminateResult PlanManager::Terminate(db::Transaction& tx, const std::string& plan_id, const std::string& actor_id) {
  auto plan = LockPlan(tx, plan_id);
  if (plan.owner_id != actor_id) {
    throw util::PermissionDenied("NOT_OWNER", actor_id + " does not own plan " + plan_id);
  }
  if (!model::CanTransition(plan.status, model::PlanStatus::kTerminated)) {
    return {plan, false};
  }

  const auto now_ms     = util::ToUnixMillis(clock_->Now());
  plan.status           = model::PlanStatus::kTerminated;
  plan.terminated_at_ms = now_ms;
  plan.updated_at_ms    = now_ms;
  ThrowIfDbError(repository_->UpdatePlan(tx, plan), "terminate plan " + plan_id);

  LEDGER_LOG_INFO("plan terminated", {observability::StringField("plan", plan_id), observability::StringField("actor", actor_id)});
  return {plan, true};
}

} // namespace ledger::core
