#include "repository_util.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace ledger::core {

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case db::ErrorCode::Busy:
      throw util::ConcurrentModification("BUSY", message);
    case db::ErrorCode::SerializationFailure:
    case db::ErrorCode::Conflict:
      throw util::ConcurrentModification("STATE_CHANGED_RETRY", message);
    case db::ErrorCode::NotFound:
      throw util::NotFound("NOT_FOUND", message);
    default:
      throw std::runtime_error(message);
  }
}

db::model::TenantRecord LockActiveTenant(db::Repository& repo, db::Transaction& tx, const std::string& tenant_id) {
  const auto lock = repo.LockTenant(tx, tenant_id);
  if (lock.code == db::ErrorCode::NotFound) {
    throw util::NotFound("TENANT_NOT_FOUND", tenant_id);
  }
  ThrowIfDbError(lock, "lock tenant " + tenant_id);

  auto tenant = repo.GetTenant(tx, tenant_id);
  if (!tenant) {
    throw util::NotFound("TENANT_NOT_FOUND", tenant_id);
  }
  if (!tenant->is_active) {
    throw util::InvalidState("TENANT_INACTIVE", tenant_id);
  }
  return *tenant;
}

} // namespace ledger::core
