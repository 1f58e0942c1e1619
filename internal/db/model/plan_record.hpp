#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/interval.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/util/date.hpp"

namespace ledger::db::model {

/*
  Persistent recurring plan row.

  IMPORTANT:
  - terminated_at_ms is set iff status == kTerminated.
  - next_due_date >= start_date always; it tracks the first cycle that has
    not been materialized yet.
*/
struct PlanRecord {
  std::string id;
  std::string tenant_id;
  std::string owner_id;

  ledger::model::Interval interval;

  util::Date start_date;
  util::Date next_due_date;

  ledger::model::PlanStatus status = ledger::model::PlanStatus::kActive;

  std::optional<uint64_t> terminated_at_ms;
  uint64_t                created_at_ms = 0;
  uint64_t                updated_at_ms = 0;
};

// Template share copied into every materialized cycle.
struct PlanShareRecord {
  std::string plan_id;
  std::string participant_id;
  int64_t     amount_cents = 0;
};

} // namespace ledger::db::model
