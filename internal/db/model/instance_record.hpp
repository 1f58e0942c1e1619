#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/state_machine.hpp"
#include "internal/util/date.hpp"

namespace ledger::db::model {

/*
  One materialized cycle of a plan.

  (plan_id, due_date) is unique; this is the materialization idempotency key.
*/
struct InstanceRecord {
  std::string id;
  std::string plan_id;
  std::string tenant_id;
  std::string owner_id;

  util::Date due_date;
  int64_t    total_amount_cents = 0;

  ledger::model::InstanceStatus status = ledger::model::InstanceStatus::kActive;

  uint64_t                created_at_ms = 0;
  std::optional<uint64_t> settled_at_ms;
};

struct InstanceShareRecord {
  std::string instance_id;
  std::string participant_id;
  int64_t     amount_cents = 0;

  ledger::model::ShareStatus status = ledger::model::ShareStatus::kUnpaid;
  std::optional<uint64_t>    paid_at_ms;
};

} // namespace ledger::db::model
