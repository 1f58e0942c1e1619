#pragma once

#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

#include "internal/core/cursor_advancer.hpp"
#include "internal/core/cycle_materializer.hpp"
#include "internal/core/ledger_store.hpp"
#include "internal/core/plan_limit_registry.hpp"
#include "internal/core/plan_manager.hpp"
#include "internal/core/quota_guard.hpp"
#include "internal/core/share_settlement.hpp"
#include "internal/core/termination_cascade.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/scheduler/due_cycle_scheduler.hpp"
#include "internal/util/time.hpp"

namespace ledger::core {

struct ActivationResult {
  db::model::PlanRecord plan;
  MaterializeResult     first_cycle;
};

/*
  Transactional facade over the engine components.

  Every call runs in exactly one repository transaction, committed on
  success and rolled back when anything throws. The scheduler is the
  exception: it opens one transaction per plan.
*/
class LedgerEngine {
 public:
  LedgerEngine(std::shared_ptr<db::Repository> repository, std::shared_ptr<const PlanLimitRegistry> registry,
               std::shared_ptr<util::Clock> clock, scheduler::SchedulerLimits limits = {});

  void            AssertQuota(const std::string& tenant_id, const model::Deltas& deltas);
  model::Counters ApplyDelta(const std::string& tenant_id, const model::Deltas& deltas);
  model::Counters GetUsage(const std::string& tenant_id);
  QuotaStatus     DescribeQuota(const std::string& tenant_id);

  db::model::PlanRecord CreatePlan(const PlanSpec& spec);

  // Quota check (active_expenses +1), create, materialize start_date.
  ActivationResult ActivatePlan(const PlanSpec& spec);

  TerminateResult                        TerminatePlan(const std::string& plan_id, const std::string& actor_id);
  db::model::PlanRecord                  GetPlan(const std::string& plan_id);
  std::vector<db::model::InstanceRecord> ListCycles(const std::string& plan_id);

  MaterializeResult Materialize(const std::string& plan_id, const util::Date& due_date);

  // today defaults to the clock's date.
  AdvanceResult AdvanceChore(const std::string& chore_id, std::optional<util::Date> today = std::nullopt);

  SettleResult SettleShare(const std::string& instance_id, const std::string& participant_id);

  scheduler::RunReport RunDueCycles(std::optional<util::Date> today = std::nullopt);

  CascadeResult RemoveParticipant(const std::string& tenant_id, const std::string& participant_id);

  const std::shared_ptr<util::Clock>& Clock() const {
    return clock_;
  }

 private:
  template <typename Fn>
  auto InTransaction(Fn&& fn) {
    auto tx = repository_->Begin();
    if constexpr (std::is_void_v<std::invoke_result_t<Fn, db::Transaction&>>) {
      fn(*tx);
      tx->Commit();
    } else {
      auto result = fn(*tx);
      tx->Commit();
      return result;
    }
  }

  std::shared_ptr<db::Repository>               repository_;
  std::shared_ptr<util::Clock>                  clock_;
  std::shared_ptr<LedgerStore>                  ledger_;
  std::shared_ptr<QuotaGuard>                   quota_;
  std::shared_ptr<PlanManager>                  plans_;
  std::shared_ptr<CycleMaterializer>            materializer_;
  std::shared_ptr<CursorAdvancer>               cursors_;
  std::shared_ptr<ShareSettlement>              settlement_;
  std::shared_ptr<TerminationCascade>           cascade_;
  std::shared_ptr<scheduler::DueCycleScheduler> scheduler_;
};

} // namespace ledger::core
