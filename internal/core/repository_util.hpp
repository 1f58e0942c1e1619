#pragma once

#include <string>

#include "internal/db/api/repository.hpp"

namespace ledger::core {

// Translates a failed repository result into the engine's exceptions.
//   Busy, SerializationFailure, Conflict -> ConcurrentModification
//   NotFound                             -> NotFound
//   anything else                        -> std::runtime_error
void ThrowIfDbError(const db::Result& result, const std::string& context);

// Locks the tenant row and requires the tenant to be active.
// Throws NotFound(TENANT_NOT_FOUND) or InvalidState(TENANT_INACTIVE).
db::model::TenantRecord LockActiveTenant(db::Repository& repo, db::Transaction& tx, const std::string& tenant_id);

} // namespace ledger::core
