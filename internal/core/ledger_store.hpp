#pragma once

#include <memory>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/model/metric.hpp"
#include "internal/util/time.hpp"

namespace ledger::core {

/*
  Per-tenant usage counters.

  ApplyDelta never enforces a ceiling; that is the QuotaGuard's job and is
  done before the mutation, in the same transaction. Counters clamp at
  zero so a double release can never drive them negative.

  Lock order: tenant -> ledger.
*/
class LedgerStore {
 public:
  LedgerStore(std::shared_ptr<db::Repository> repository, std::shared_ptr<util::Clock> clock);

  model::Counters ApplyDelta(db::Transaction& tx, const std::string& tenant_id, const model::Deltas& deltas);

  // Zeros when the tenant has no ledger row yet.
  model::Counters Read(db::Transaction& tx, const std::string& tenant_id);

 private:
  std::shared_ptr<db::Repository> repository_;
  std::shared_ptr<util::Clock>    clock_;
};

} // namespace ledger::core
