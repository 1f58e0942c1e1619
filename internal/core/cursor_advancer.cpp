#include "cursor_advancer.hpp"

#include "internal/core/repository_util.hpp"
#include "internal/util/errors.hpp"

namespace ledger::core {

std::string_view AdvanceStatusName(AdvanceStatus status) {
  switch (status) {
    case AdvanceStatus::kRecurringCompleted:
      return "recurring_completed";
    case AdvanceStatus::kAlreadyCompletedForCycle:
      return "already_completed_for_cycle";
    case AdvanceStatus::kNonRecurringCompleted:
      return "non_recurring_completed";
  }
  return "unknown";
}

CursorAdvancer::CursorAdvancer(std::shared_ptr<db::Repository> repository, std::shared_ptr<LedgerStore> ledger,
                               std::shared_ptr<util::Clock> clock)
    : repository_(std::move(repository)), ledger_(std::move(ledger)), clock_(std::move(clock)) {
}

AdvanceResult CursorAdvancer::Advance(db::Transaction& tx, const std::string& chore_id, const util::Date& today) {
  const auto unlocked = repository_->GetChore(tx, chore_id);
  if (!unlocked) {
    throw util::NotFound("CHORE_NOT_FOUND", chore_id);
  }

  LockActiveTenant(*repository_, tx, unlocked->tenant_id);
  ThrowIfDbError(repository_->LockChore(tx, chore_id), "lock chore " + chore_id);

  auto chore = repository_->GetChore(tx, chore_id);
  if (!chore || chore->tenant_id != unlocked->tenant_id) {
    throw util::ConcurrentModification("STATE_CHANGED_RETRY", "chore " + chore_id);
  }
  const auto target = chore->interval ? model::ChoreStatus::kActive : model::ChoreStatus::kCompleted;
  if (!model::CanTransition(chore->status, target)) {
    throw util::InvalidArgument("INVALID_STATE", "chore " + chore_id + " is " + std::string(model::StatusName(chore->status)));
  }

  const auto now_ms = util::ToUnixMillis(clock_->Now());

  if (!chore->interval) {
    chore->status          = target;
    chore->completed_at_ms = now_ms;
    chore->updated_at_ms   = now_ms;
    ThrowIfDbError(repository_->UpdateChore(tx, *chore), "complete chore " + chore_id);
    ledger_->ApplyDelta(tx, chore->tenant_id, {{model::Metric::kActiveChores, -1}});
    return {AdvanceStatus::kNonRecurringCompleted, chore->cursor, 0};
  }

  model::ValidateInterval(*chore->interval);

  // Each step is computed from the anchor so month-end cursors do not drift.
  const auto   anchor = chore->cursor.value_or(chore->start_date);
  std::int64_t steps  = 0;
  while (model::Advance(anchor, *chore->interval, steps) <= today) {
    ++steps;
  }

  if (steps == 0) {
    return {AdvanceStatus::kAlreadyCompletedForCycle, chore->cursor, 0};
  }

  chore->cursor        = model::Advance(anchor, *chore->interval, steps);
  chore->updated_at_ms = now_ms;
  ThrowIfDbError(repository_->UpdateChore(tx, *chore), "advance chore " + chore_id);
  return {AdvanceStatus::kRecurringCompleted, chore->cursor, steps};
}

} // namespace ledger::core
