#pragma once

#include <memory>
#include <string>

#include "internal/core/ledger_store.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"

namespace ledger::core {

struct SettleResult {
  db::model::InstanceRecord      instance;
  db::model::InstanceShareRecord share;
  bool                           changed          = false;
  bool                           instance_settled = false;
};

// Marks one participant's share paid. When the last unpaid share is paid
// the instance is settled and its active_expenses slot released.
// Lock order: tenant -> instance -> ledger -> shares.
class ShareSettlement {
 public:
  ShareSettlement(std::shared_ptr<db::Repository> repository, std::shared_ptr<LedgerStore> ledger, std::shared_ptr<util::Clock> clock);

  SettleResult Settle(db::Transaction& tx, const std::string& instance_id, const std::string& participant_id);

 private:
  std::shared_ptr<db::Repository> repository_;
  std::shared_ptr<LedgerStore>    ledger_;
  std::shared_ptr<util::Clock>    clock_;
};

} // namespace ledger::core
