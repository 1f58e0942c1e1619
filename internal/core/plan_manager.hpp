#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/model/interval.hpp"
#include "internal/util/date.hpp"
#include "internal/util/time.hpp"

namespace ledger::core {

struct ShareSpec {
  std::string  participant_id;
  std::int64_t amount_cents = 0;
};

struct PlanSpec {
  std::string            tenant_id;
  std::string            owner_id;
  model::Interval        interval;
  util::Date             start_date;
  std::vector<ShareSpec> shares;
};

struct TerminateResult {
  db::model::PlanRecord plan;
  bool                  changed = false;
};

/*
  Recurring plan lifecycle.

  Create validates the template and stores it with next_due one interval
  after start_date; the caller materializes start_date itself. Terminate
  is owner-only and idempotent; existing cycles are left untouched.
*/
class PlanManager {
 public:
  PlanManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<util::Clock> clock);

  db::model::PlanRecord Create(db::Transaction& tx, const PlanSpec& spec);

  TerminateResult Terminate(db::Transaction& tx, const std::string& plan_id, const std::string& actor_id);

  // Lock order tenant -> plan; re-reads the plan under its lock.
  db::model::PlanRecord LockPlan(db::Transaction& tx, const std::string& plan_id);

  // Unlocked read; NotFound(PLAN_NOT_FOUND).
  db::model::PlanRecord Get(db::Transaction& tx, const std::string& plan_id);

 private:
  void ValidateSpec(db::Transaction& tx, const PlanSpec& spec);

  std::shared_ptr<db::Repository> repository_;
  std::shared_ptr<util::Clock>    clock_;
};

} // namespace ledger::core
