#include "share_settlement.hpp"

#include <algorithm>

#include "internal/core/repository_util.hpp"
#include "internal/util/errors.hpp"

namespace ledger::core {

ShareSettlement::ShareSettlement(std::shared_ptr<db::Repository> repository, std::shared_ptr<LedgerStore> ledger,
                                 std::shared_ptr<util::Clock> clock)
    : repository_(std::move(repository)), ledger_(std::move(ledger)), clock_(std::move(clock)) {
}

SettleResult ShareSettlement::Settle(db::Transaction& tx, const std::string& instance_id, const std::string& participant_id) {
  const auto unlocked = repository_->GetInstance(tx, instance_id);
  if (!unlocked) {
    throw util::NotFound("INSTANCE_NOT_FOUND", instance_id);
  }

  LockActiveTenant(*repository_, tx, unlocked->tenant_id);
  ThrowIfDbError(repository_->LockInstance(tx, instance_id), "lock instance " + instance_id);
  ThrowIfDbError(repository_->LockLedger(tx, unlocked->tenant_id), "lock ledger " + unlocked->tenant_id);
  ThrowIfDbError(repository_->LockInstanceShares(tx, instance_id), "lock shares " + instance_id);

  auto instance = repository_->GetInstance(tx, instance_id);
  if (!instance || instance->tenant_id != unlocked->tenant_id) {
    throw util::ConcurrentModification("STATE_CHANGED_RETRY", "instance " + instance_id);
  }

  auto shares = repository_->GetInstanceShares(tx, instance_id);
  auto it     = std::find_if(shares.begin(), shares.end(), [&](const auto& s) { return s.participant_id == participant_id; });
  if (it == shares.end()) {
    throw util::NotFound("SHARE_NOT_FOUND", instance_id + "/" + participant_id);
  }

  SettleResult result;
  if (it->status == model::ShareStatus::kPaid) {
    result.instance         = *instance;
    result.share            = *it;
    result.instance_settled = instance->status == model::InstanceStatus::kSettled;
    return result;
  }

  const auto now_ms = util::ToUnixMillis(clock_->Now());
  it->status        = model::ShareStatus::kPaid;
  it->paid_at_ms    = now_ms;
  ThrowIfDbError(repository_->UpdateInstanceShare(tx, *it), "pay share " + instance_id + "/" + participant_id);
  result.share   = *it;
  result.changed = true;

  const bool all_paid = std::all_of(shares.begin(), shares.end(), [](const auto& s) { return s.status == model::ShareStatus::kPaid; });
  if (all_paid && instance->status == model::InstanceStatus::kActive) {
    instance->status        = model::InstanceStatus::kSettled;
    instance->settled_at_ms = now_ms;
    ThrowIfDbError(repository_->UpdateInstance(tx, *instance), "settle instance " + instance_id);
    ledger_->ApplyDelta(tx, instance->tenant_id, {{model::Metric::kActiveExpenses, -1}});
  }

  result.instance         = *instance;
  result.instance_settled = instance->status == model::InstanceStatus::kSettled;
  return result;
}

} // namespace ledger::core
