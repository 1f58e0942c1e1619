#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/interval.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/util/date.hpp"

namespace ledger::db::model {

/*
  In-place obligation: the row itself carries its cursor.

  interval is absent for one-off chores; cursor is absent until the first
  recurring completion.
*/
struct ChoreRecord {
  std::string id;
  std::string tenant_id;

  std::optional<ledger::model::Interval> interval;
  util::Date                             start_date;
  std::optional<util::Date>              cursor;

  ledger::model::ChoreStatus status = ledger::model::ChoreStatus::kActive;

  std::optional<uint64_t> completed_at_ms;
  uint64_t                updated_at_ms = 0;
};

} // namespace ledger::db::model
