#include "cycle_materializer.hpp"

#include <stdexcept>

#include "internal/core/repository_util.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace ledger::core {

CycleMaterializer::CycleMaterializer(std::shared_ptr<db::Repository> repository, std::shared_ptr<PlanManager> plans,
                                     std::shared_ptr<LedgerStore> ledger, std::shared_ptr<util::Clock> clock)
    : repository_(std::move(repository)), plans_(std::move(plans)), ledger_(std::move(ledger)), clock_(std::move(clock)) {
}

MaterializeResult CycleMaterializer::Materialize(db::Transaction& tx, const std::string& plan_id, const util::Date& due_date) {
  const auto plan = plans_->LockPlan(tx, plan_id);
  return MaterializeLocked(tx, plan, due_date);
}

MaterializeResult CycleMaterializer::MaterializeLocked(db::Transaction& tx, const db::model::PlanRecord& plan, const util::Date& due_date) {
  if (plan.status != model::PlanStatus::kActive) {
    throw util::InvalidState("PLAN_NOT_ACTIVE", plan.id);
  }
  if (due_date < plan.start_date) {
    throw util::InvalidArgument("DUE_DATE_BEFORE_START",
                                util::FormatDate(due_date) + " is before plan start " + util::FormatDate(plan.start_date));
  }

  if (auto existing = repository_->FindInstance(tx, plan.id, due_date)) {
    return {*existing, false};
  }

  const auto shares = repository_->GetPlanShares(tx, plan.id);
  if (shares.empty()) {
    throw std::runtime_error("plan " + plan.id + " has no shares");
  }

  const auto now_ms = util::ToUnixMillis(clock_->Now());

  db::model::InstanceRecord instance;
  instance.id            = util::NewId();
  instance.plan_id       = plan.id;
  instance.tenant_id     = plan.tenant_id;
  instance.owner_id      = plan.owner_id;
  instance.due_date      = due_date;
  instance.status        = model::InstanceStatus::kActive;
  instance.created_at_ms = now_ms;
  for (const auto& share : shares) {
    instance.total_amount_cents += share.amount_cents;
  }

  const auto inserted = repository_->InsertInstance(tx, instance);
  if (inserted.code == db::ErrorCode::AlreadyExists) {
    auto winner = repository_->FindInstance(tx, plan.id, due_date);
    if (!winner) {
      throw util::ConcurrentModification("STATE_CHANGED_RETRY", "cycle " + plan.id + "@" + util::FormatDate(due_date));
    }
    return {*winner, false};
  }
  ThrowIfDbError(inserted, "insert cycle " + plan.id + "@" + util::FormatDate(due_date));

  ledger_->ApplyDelta(tx, plan.tenant_id, {{model::Metric::kActiveExpenses, 1}});

  ThrowIfDbError(repository_->LockInstanceShares(tx, instance.id), "lock shares " + instance.id);

  std::vector<db::model::InstanceShareRecord> copies;
  copies.reserve(shares.size());
  for (const auto& share : shares) {
    db::model::InstanceShareRecord copy;
    copy.instance_id    = instance.id;
    copy.participant_id = share.participant_id;
    copy.amount_cents   = share.amount_cents;
    if (share.participant_id == plan.owner_id) {
      copy.status     = model::ShareStatus::kPaid;
      copy.paid_at_ms = now_ms;
    }
    copies.push_back(std::move(copy));
  }
  ThrowIfDbError(repository_->InsertInstanceShares(tx, copies), "insert shares " + instance.id);

  LEDGER_LOG_INFO("cycle materialized", {observability::StringField("plan", plan.id), observability::StringField("instance", instance.id),
                                         observability::StringField("due", util::FormatDate(due_date)),
                                         observability::IntField("total_cents", instance.total_amount_cents)});
  return {instance, true};
}

} // namespace ledger::core
