#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

#include "internal/core/cycle_materializer.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/util/date.hpp"
#include "internal/util/time.hpp"

namespace ledger::scheduler {

struct SchedulerLimits {
  std::size_t per_plan_cap = 31;
  std::size_t global_cap   = 500;
};

struct RunReport {
  std::size_t plans_examined      = 0;
  std::size_t plans_processed     = 0;
  std::size_t plans_skipped       = 0;
  std::size_t plans_failed        = 0;
  std::size_t cycles_materialized = 0;
  bool        global_cap_reached  = false;
};

/*
  Batch catch-up of recurring plans.

  - Candidates are active plans with next_due <= today.
  - Each plan is claimed with a non-blocking lock; a plan held by another
    runner is skipped, never waited on.
  - One transaction per plan. A failing plan is rolled back, logged and
    counted; the run continues with the next plan.
  - Due dates are computed from the plan's start date (start + k*interval)
    so month-end plans keep their day of month.
  - The quota guard is never consulted.
*/
class DueCycleScheduler {
 public:
  DueCycleScheduler(std::shared_ptr<db::Repository> repository, std::shared_ptr<core::CycleMaterializer> materializer,
                    std::shared_ptr<util::Clock> clock, SchedulerLimits limits = {});

  const SchedulerLimits& Limits() const {
    return limits_;
  }

  RunReport RunDueCycles(const util::Date& today);

 private:
  enum class Outcome : std::uint8_t { kProcessed, kSkipped };

  Outcome ProcessPlan(const std::string& plan_id, const util::Date& today, std::size_t budget, std::size_t& created);

  std::shared_ptr<db::Repository>          repository_;
  std::shared_ptr<core::CycleMaterializer> materializer_;
  std::shared_ptr<util::Clock>             clock_;
  SchedulerLimits                          limits_;
};

} // namespace ledger::scheduler
