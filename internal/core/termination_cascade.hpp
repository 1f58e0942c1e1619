#pragma once

#include <memory>
#include <string>
#include <vector>

#include "internal/core/ledger_store.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"

namespace ledger::core {

struct CascadeResult {
  std::vector<std::string> terminated_plan_ids;
  bool                     membership_released = false;
};

/*
  Participant removal.

  Terminates every active plan of the tenant that the participant owns or
  holds a share in, then marks the membership non-current and releases
  one active_members slot. Removing a participant twice is a no-op.

  Lock order: tenant -> plans -> ledger.
*/
class TerminationCascade {
 public:
  TerminationCascade(std::shared_ptr<db::Repository> repository, std::shared_ptr<LedgerStore> ledger, std::shared_ptr<util::Clock> clock);

  CascadeResult OnParticipantRemoved(db::Transaction& tx, const std::string& tenant_id, const std::string& participant_id);

 private:
  bool References(db::Transaction& tx, const db::model::PlanRecord& plan, const std::string& participant_id);

  std::shared_ptr<db::Repository> repository_;
  std::shared_ptr<LedgerStore>    ledger_;
  std::shared_ptr<util::Clock>    clock_;
};

} // namespace ledger::core
