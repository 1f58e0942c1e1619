#include <cassert>
#include <chrono>
#include <iostream>

#include "test_support.hpp"

namespace {

using ledger::model::Interval;
using ledger::model::IntervalUnit;
using ledger::model::Metric;
using ledger::testing::D;
using ledger::testing::EngineFixture;
using ledger::testing::ReadCycles;
using ledger::testing::ReadPlan;
using ledger::testing::SeedTenant;
using ledger::testing::TwoPersonPlan;
using ledger::util::FormatDate;

void TestFortnightlyCatchUp() {
  EngineFixture f("2024-01-01");
  SeedTenant(*f.repository, "home", {"alice", "bob"});
  const auto activated = f.engine->ActivatePlan(TwoPersonPlan("2024-01-01", {2, IntervalUnit::kWeek}));
  assert(FormatDate(activated.plan.next_due_date) == "2024-01-15");

  const auto report = f.engine->RunDueCycles(D("2024-02-01"));
  assert(report.plans_examined == 1);
  assert(report.plans_processed == 1);
  assert(report.cycles_materialized == 2);
  assert(!report.global_cap_reached);

  const auto cycles = ReadCycles(*f.repository, activated.plan.id);
  assert(cycles.size() == 3);
  assert(FormatDate(cycles[0].due_date) == "2024-01-01");
  assert(FormatDate(cycles[1].due_date) == "2024-01-15");
  assert(FormatDate(cycles[2].due_date) == "2024-01-29");
  assert(FormatDate(ReadPlan(*f.repository, activated.plan.id)->next_due_date) == "2024-02-12");
  assert(f.engine->GetUsage("home").Get(Metric::kActiveExpenses) == 3);

  // same day again: nothing is due
  const auto rerun = f.engine->RunDueCycles(D("2024-02-01"));
  assert(rerun.plans_examined == 0);
  assert(rerun.cycles_materialized == 0);
  assert(ReadCycles(*f.repository, activated.plan.id).size() == 3);
}

void TestMonthEndPlanKeepsDayOfMonth() {
  EngineFixture f("2024-01-31");
  SeedTenant(*f.repository, "home", {"alice", "bob"});
  const auto activated = f.engine->ActivatePlan(TwoPersonPlan("2024-01-31"));

  f.engine->RunDueCycles(D("2024-04-30"));
  const auto cycles = ReadCycles(*f.repository, activated.plan.id);
  assert(cycles.size() == 4);
  assert(FormatDate(cycles[1].due_date) == "2024-02-29");
  assert(FormatDate(cycles[2].due_date) == "2024-03-31");
  assert(FormatDate(cycles[3].due_date) == "2024-04-30");
  assert(FormatDate(ReadPlan(*f.repository, activated.plan.id)->next_due_date) == "2024-05-31");
}

void TestPerPlanCap() {
  EngineFixture f("2024-01-01");
  SeedTenant(*f.repository, "home", {"alice", "bob"});
  const auto plan = f.engine->CreatePlan(TwoPersonPlan("2024-01-01", {1, IntervalUnit::kDay}));

  auto report = f.engine->RunDueCycles(D("2024-12-31"));
  assert(report.cycles_materialized == 31);
  assert(ReadCycles(*f.repository, plan.id).size() == 31);
  assert(FormatDate(ReadPlan(*f.repository, plan.id)->next_due_date) == "2024-02-02");

  report = f.engine->RunDueCycles(D("2024-12-31"));
  assert(report.cycles_materialized == 31);
  assert(FormatDate(ReadPlan(*f.repository, plan.id)->next_due_date) == "2024-03-04");
}

void TestGlobalCap() {
  EngineFixture f("2024-01-01", ledger::scheduler::SchedulerLimits{31, 5});
  SeedTenant(*f.repository, "home", {"alice", "bob"});
  for (int i = 0; i < 3; ++i) {
    f.engine->CreatePlan(TwoPersonPlan("2024-01-01", {1, IntervalUnit::kDay}));
  }

  const auto report = f.engine->RunDueCycles(D("2024-01-31"));
  assert(report.cycles_materialized == 5);
  assert(report.global_cap_reached);
  assert(report.plans_processed == 1);
}

void TestFailingPlanDoesNotStopTheRun() {
  EngineFixture f("2024-01-01");
  SeedTenant(*f.repository, "home", {"alice", "bob"});
  SeedTenant(*f.repository, "cabin", {"alice", "bob"});

  const auto healthy = f.engine->CreatePlan(TwoPersonPlan("2024-01-01"));
  const auto broken  = f.engine->CreatePlan(TwoPersonPlan("2024-01-01", {1, IntervalUnit::kMonth}, "cabin"));
  ledger::testing::SetTenantActive(*f.repository, "cabin", false);

  const auto report = f.engine->RunDueCycles(D("2024-02-15"));
  assert(report.plans_failed == 1);
  assert(report.plans_processed == 1);
  assert(ReadCycles(*f.repository, healthy.id).size() == 1);
  assert(ReadCycles(*f.repository, broken.id).empty());
  assert(FormatDate(ReadPlan(*f.repository, broken.id)->next_due_date) == "2024-02-01");
}

void TestSchedulerIgnoresQuotaAndTerminatedPlans() {
  EngineFixture f("2024-01-01");
  SeedTenant(*f.repository, "home", {"alice", "bob"});
  const auto plan    = f.engine->CreatePlan(TwoPersonPlan("2024-01-01"));
  const auto stopped = f.engine->CreatePlan(TwoPersonPlan("2024-01-01"));
  f.engine->TerminatePlan(stopped.id, "alice");
  f.engine->ApplyDelta("home", {{Metric::kActiveExpenses, 10}});

  const auto report = f.engine->RunDueCycles(D("2024-03-01"));
  assert(report.plans_examined == 1);
  assert(report.cycles_materialized == 2);
  assert(ReadCycles(*f.repository, plan.id).size() == 2);
  assert(ReadCycles(*f.repository, stopped.id).empty());
  assert(f.engine->GetUsage("home").Get(Metric::kActiveExpenses) == 12);
}

} // namespace

void TestBusyTenantIsSkipped() {
  auto repo = std::make_shared<ledger::db::memory::MemoryRepository>(std::chrono::milliseconds(20));
  EngineFixture f("2024-01-01", {}, repo);
  SeedTenant(*f.repository, "home", {"alice", "bob"});
  const auto activated = f.engine->ActivatePlan(TwoPersonPlan("2024-01-01", {1, IntervalUnit::kWeek}));

  {
    auto holder = f.repository->Begin();
    assert(f.repository->LockTenant(*holder, "home"));

    const auto report = f.engine->RunDueCycles(D("2024-01-08"));
    assert(report.plans_examined == 1);
    assert(report.plans_skipped == 1);
    assert(report.plans_failed == 0);
    assert(report.cycles_materialized == 0);
    holder->Rollback();
  }
  assert(repo->HeldLockCount() == 0);

  const auto report = f.engine->RunDueCycles(D("2024-01-08"));
  assert(report.plans_processed == 1);
  assert(report.cycles_materialized == 1);
  assert(ReadCycles(*f.repository, activated.plan.id).size() == 2);
}

int main() {
  TestFortnightlyCatchUp();
  TestMonthEndPlanKeepsDayOfMonth();
  TestPerPlanCap();
  TestGlobalCap();
  TestFailingPlanDoesNotStopTheRun();
  TestSchedulerIgnoresQuotaAndTerminatedPlans();
  TestBusyTenantIsSkipped();

  std::cout << "ledger_unit_scheduler: pass\n";
  return 0;
}
