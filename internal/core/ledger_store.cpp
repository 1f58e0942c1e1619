#include "ledger_store.hpp"

#include "internal/core/repository_util.hpp"

namespace ledger::core {

LedgerStore::LedgerStore(std::shared_ptr<db::Repository> repository, std::shared_ptr<util::Clock> clock)
    : repository_(std::move(repository)), clock_(std::move(clock)) {
}

model::Counters LedgerStore::ApplyDelta(db::Transaction& tx, const std::string& tenant_id, const model::Deltas& deltas) {
  LockActiveTenant(*repository_, tx, tenant_id);
  ThrowIfDbError(repository_->LockLedger(tx, tenant_id), "lock ledger " + tenant_id);

  auto row = repository_->GetLedger(tx, tenant_id).value_or(db::model::LedgerRecord{tenant_id, {}, 0});
  if (deltas.empty()) {
    return row.counters;
  }

  for (const auto& [metric, delta] : deltas) {
    row.counters.Set(metric, model::ProjectCounter(row.counters.Get(metric), delta));
  }
  row.tenant_id     = tenant_id;
  row.updated_at_ms = util::ToUnixMillis(clock_->Now());

  ThrowIfDbError(repository_->UpsertLedger(tx, row), "update ledger " + tenant_id);
  return row.counters;
}

model::Counters LedgerStore::Read(db::Transaction& tx, const std::string& tenant_id) {
  auto row = repository_->GetLedger(tx, tenant_id);
  return row ? row->counters : model::Counters{};
}

} // namespace ledger::core
