#pragma once

#include <cstdint>
#include <string>

#include "internal/model/metric.hpp"

namespace ledger::db::model {

// One row per tenant; created lazily, never deleted.
struct LedgerRecord {
  std::string                     tenant_id;
  ledger::model::Counters         counters;
  uint64_t                        updated_at_ms = 0;
};

} // namespace ledger::db::model
