#include "due_cycle_scheduler.hpp"

#include <algorithm>
#include <exception>

#include "internal/core/repository_util.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace ledger::scheduler {

DueCycleScheduler::DueCycleScheduler(std::shared_ptr<db::Repository> repository, std::shared_ptr<core::CycleMaterializer> materializer,
                                     std::shared_ptr<util::Clock> clock, SchedulerLimits limits)
    : repository_(std::move(repository)), materializer_(std::move(materializer)), clock_(std::move(clock)), limits_(limits) {
}

DueCycleScheduler::Outcome DueCycleScheduler::ProcessPlan(const std::string& plan_id, const util::Date& today, std::size_t budget,
                                                          std::size_t& created) {
  auto tx = repository_->Begin();

  const auto unlocked = repository_->GetPlan(*tx, plan_id);
  if (!unlocked) {
    return Outcome::kSkipped;
  }

  // A tenant held past the lock timeout is left for the next run.
  if (repository_->LockTenant(*tx, unlocked->tenant_id).code == db::ErrorCode::Busy) {
    return Outcome::kSkipped;
  }
  core::LockActiveTenant(*repository_, *tx, unlocked->tenant_id);

  const auto claim = repository_->TryLockPlan(*tx, plan_id);
  if (claim.code == db::ErrorCode::Busy) {
    return Outcome::kSkipped;
  }
  core::ThrowIfDbError(claim, "claim plan " + plan_id);

  // Another runner may have advanced or terminated it since the listing.
  auto plan = repository_->GetPlan(*tx, plan_id);
  if (!plan || plan->status != model::PlanStatus::kActive || plan->next_due_date > today) {
    return Outcome::kSkipped;
  }

  const auto  cap    = std::min(limits_.per_plan_cap, budget);
  auto        step   = model::StepsUntil(plan->start_date, plan->interval, plan->next_due_date);
  std::size_t cycles = 0;
  while (cycles < cap) {
    const auto due = model::Advance(plan->start_date, plan->interval, step);
    if (due > today) {
      break;
    }
    if (materializer_->MaterializeLocked(*tx, *plan, due).created) {
      ++created;
    }
    ++cycles;
    ++step;
  }

  plan->next_due_date = model::Advance(plan->start_date, plan->interval, step);
  plan->updated_at_ms = util::ToUnixMillis(clock_->Now());
  core::ThrowIfDbError(repository_->UpdatePlan(*tx, *plan), "advance plan " + plan_id);

  tx->Commit();
  return Outcome::kProcessed;
}

RunReport DueCycleScheduler::RunDueCycles(const util::Date& today) {
  RunReport report;

  std::vector<db::model::PlanRecord> candidates;
  {
    auto tx    = repository_->Begin();
    candidates = repository_->ListDuePlans(*tx, today, limits_.global_cap);
    tx->Rollback();
  }

  for (const auto& candidate : candidates) {
    if (report.cycles_materialized >= limits_.global_cap) {
      report.global_cap_reached = true;
      break;
    }
    ++report.plans_examined;

    std::size_t created = 0;
    try {
      const auto outcome = ProcessPlan(candidate.id, today, limits_.global_cap - report.cycles_materialized, created);
      if (outcome == Outcome::kSkipped) {
        ++report.plans_skipped;
        continue;
      }
      ++report.plans_processed;
      report.cycles_materialized += created;
    } catch (const std::exception& e) {
      ++report.plans_failed;
      LEDGER_LOG_ERROR("due cycle processing failed", {observability::StringField("plan", candidate.id),
                                                       observability::StringField("tenant", candidate.tenant_id),
                                                       observability::BoolField("retryable", util::IsRetryable(e)),
                                                       observability::StringField("error", e.what())});
    }
  }

  if (report.cycles_materialized >= limits_.global_cap) {
    report.global_cap_reached = true;
  }

  LEDGER_LOG_INFO("due cycle run finished",
                  {observability::StringField("today", util::FormatDate(today)),
                   observability::IntField("examined", static_cast<std::int64_t>(report.plans_examined)),
                   observability::IntField("processed", static_cast<std::int64_t>(report.plans_processed)),
                   observability::IntField("skipped", static_cast<std::int64_t>(report.plans_skipped)),
                   observability::IntField("failed", static_cast<std::int64_t>(report.plans_failed)),
                   observability::IntField("cycles", static_cast<std::int64_t>(report.cycles_materialized)),
                   observability::BoolField("global_cap_reached", report.global_cap_reached)});
  return report;
}

} // namespace ledger::scheduler
