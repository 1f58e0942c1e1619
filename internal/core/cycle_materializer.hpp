#pragma once

#include <memory>
#include <string>

#include "internal/core/ledger_store.hpp"
#include "internal/core/plan_manager.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/util/date.hpp"
#include "internal/util/time.hpp"

namespace ledger::core {

struct MaterializeResult {
  db::model::InstanceRecord instance;
  bool                      created = false;
};

/*
  Turns (plan, due_date) into exactly one obligation instance.

  CRITICAL GUARANTEES:
  - The (plan_id, due_date) unique key is the idempotency key: a replay,
    or the loser of a concurrent insert, gets the existing instance back
    with created = false and changes nothing.
  - A fresh insert bumps active_expenses by one and copies the plan's
    shares, the owner's own share pre-paid.
  - Never consults the quota guard.

  Lock order: tenant -> plan -> ledger -> shares.
*/
class CycleMaterializer {
 public:
  CycleMaterializer(std::shared_ptr<db::Repository> repository, std::shared_ptr<PlanManager> plans,
                    std::shared_ptr<LedgerStore> ledger, std::shared_ptr<util::Clock> clock);

  MaterializeResult Materialize(db::Transaction& tx, const std::string& plan_id, const util::Date& due_date);

  // Caller already holds the tenant and plan locks and re-read the plan.
  MaterializeResult MaterializeLocked(db::Transaction& tx, const db::model::PlanRecord& plan, const util::Date& due_date);

 private:
  std::shared_ptr<db::Repository> repository_;
  std::shared_ptr<PlanManager>    plans_;
  std::shared_ptr<LedgerStore>    ledger_;
  std::shared_ptr<util::Clock>    clock_;
};

} // namespace ledger::core
