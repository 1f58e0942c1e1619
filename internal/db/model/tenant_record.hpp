#pragma once

#include <cstdint>
#include <string>

namespace ledger::db::model {

/*
  Tenant-side rows written by the membership collaborator.

  The engine reads them for activity checks, share-holder validation and
  tier resolution, and writes membership rows only from the termination
  cascade.
*/

struct TenantRecord {
  std::string id;
  bool        is_active     = true;
  uint64_t    created_at_ms = 0;
};

struct MembershipRecord {
  std::string tenant_id;
  std::string participant_id;
  bool        is_current    = true;
  uint64_t    updated_at_ms = 0;
};

// expires_at_ms == 0 means the entitlement never expires.
struct EntitlementRecord {
  std::string tenant_id;
  std::string tier;
  uint64_t    expires_at_ms = 0;
};

} // namespace ledger::db::model
