#include <cassert>
#include <cstdint>
#include <iostream>

#include "internal/util/errors.hpp"
#include "test_support.hpp"

namespace {

using ledger::model::Metric;
using ledger::model::PlanStatus;
using ledger::testing::D;
using ledger::testing::EngineFixture;
using ledger::testing::ExpectThrows;
using ledger::testing::ReadCycles;
using ledger::testing::ReadShares;
using ledger::testing::SeedTenant;
using ledger::testing::TwoPersonPlan;
using ledger::util::FormatDate;

void TestActivationMaterializesStartDate() {
  EngineFixture f;
  SeedTenant(*f.repository, "home", {"alice", "bob"});

  const auto activated = f.engine->ActivatePlan(TwoPersonPlan("2024-01-31"));
  assert(activated.first_cycle.created);
  assert(FormatDate(activated.first_cycle.instance.due_date) == "2024-01-31");
  assert(activated.first_cycle.instance.total_amount_cents == 1200);
  assert(FormatDate(activated.plan.next_due_date) == "2024-02-29");

  const auto cycles = ReadCycles(*f.repository, activated.plan.id);
  assert(cycles.size() == 1);

  // the owner's own share is paid up front
  const auto shares = ReadShares(*f.repository, cycles.front().id);
  assert(shares.size() == 2);
  for (const auto& share : shares) {
    if (share.participant_id == "alice") {
      assert(share.status == ledger::model::ShareStatus::kPaid);
      assert(share.amount_cents == 500);
    } else {
      assert(share.status == ledger::model::ShareStatus::kUnpaid);
      assert(share.amount_cents == 700);
    }
  }

  assert(f.engine->GetUsage("home").Get(Metric::kActiveExpenses) == 1);
}

void TestActivationIsQuotaGuarded() {
  EngineFixture f;
  SeedTenant(*f.repository, "home", {"alice", "bob"});
  f.engine->ApplyDelta("home", {{Metric::kActiveExpenses, 10}});

  const auto code = ExpectThrows<ledger::util::QuotaExceeded>([&] { f.engine->ActivatePlan(TwoPersonPlan("2024-01-01")); });
  assert(code == "QUOTA_EXCEEDED_active_expenses");
  assert(f.engine->GetUsage("home").Get(Metric::kActiveExpenses) == 10);
}

void TestCreateValidation() {
  EngineFixture f;
  SeedTenant(*f.repository, "home", {"alice", "bob"});
  SeedTenant(*f.repository, "other", {"carol"});

  auto spec           = TwoPersonPlan("2024-01-01");
  spec.interval.every = 0;
  auto code           = ExpectThrows<ledger::util::InvalidArgument>([&] { f.engine->CreatePlan(spec); });
  assert(code == "INVALID_INTERVAL");

  spec        = TwoPersonPlan("2024-01-01");
  spec.shares = {};
  code        = ExpectThrows<ledger::util::InvalidArgument>([&] { f.engine->CreatePlan(spec); });
  assert(code == "SPLIT_MEMBERS_REQUIRED");

  spec        = TwoPersonPlan("2024-01-01");
  spec.shares = {{"alice", 500}};
  code        = ExpectThrows<ledger::util::InvalidArgument>([&] { f.engine->CreatePlan(spec); });
  assert(code == "SPLIT_MEMBERS_REQUIRED");

  spec          = TwoPersonPlan("2024-01-01");
  spec.owner_id = "carol";
  code          = ExpectThrows<ledger::util::PermissionDenied>([&] { f.engine->CreatePlan(spec); });
  assert(code == "NOT_MEMBER");

  spec        = TwoPersonPlan("2024-01-01");
  spec.shares = {{"alice", 500}, {"bob", 100}, {"bob", 200}};
  code        = ExpectThrows<ledger::util::InvalidArgument>([&] { f.engine->CreatePlan(spec); });
  assert(code == "INVALID_DEBTOR");

  spec        = TwoPersonPlan("2024-01-01");
  spec.shares = {{"alice", 500}, {"carol", 100}};
  code        = ExpectThrows<ledger::util::InvalidArgument>([&] { f.engine->CreatePlan(spec); });
  assert(code == "INVALID_DEBTOR");

  spec        = TwoPersonPlan("2024-01-01");
  spec.shares = {{"alice", 500}, {"bob", 0}};
  code        = ExpectThrows<ledger::util::InvalidArgument>([&] { f.engine->CreatePlan(spec); });
  assert(code == "INVALID_AMOUNT");

  // one cycle totals at most 900000000000 cents
  spec        = TwoPersonPlan("2024-01-01");
  spec.shares = {{"alice", std::int64_t{1} << 62}, {"bob", std::int64_t{1} << 62}};
  code        = ExpectThrows<ledger::util::InvalidArgument>([&] { f.engine->CreatePlan(spec); });
  assert(code == "INVALID_AMOUNT");

  spec.shares = {{"alice", 450'000'000'000}, {"bob", 450'000'000'001}};
  code        = ExpectThrows<ledger::util::InvalidArgument>([&] { f.engine->CreatePlan(spec); });
  assert(code == "INVALID_AMOUNT");

  code = ExpectThrows<ledger::util::NotFound>([&] { f.engine->CreatePlan(TwoPersonPlan("2024-01-01", {1, ledger::model::IntervalUnit::kMonth}, "nowhere")); });
  assert(code == "TENANT_NOT_FOUND");

  // nothing was written by the rejected attempts and every lock was released
  assert(f.engine->GetUsage("home") == ledger::model::Counters{});
  assert(std::static_pointer_cast<ledger::db::memory::MemoryRepository>(f.repository)->HeldLockCount() == 0);
}

void TestTerminateIsOwnerOnlyAndIdempotent() {
  EngineFixture f;
  SeedTenant(*f.repository, "home", {"alice", "bob"});
  const auto plan = f.engine->CreatePlan(TwoPersonPlan("2024-01-01"));

  const auto code = ExpectThrows<ledger::util::PermissionDenied>([&] { f.engine->TerminatePlan(plan.id, "bob"); });
  assert(code == "NOT_OWNER");
  assert(f.engine->GetPlan(plan.id).status == PlanStatus::kActive);

  const auto first = f.engine->TerminatePlan(plan.id, "alice");
  assert(first.changed);
  assert(first.plan.status == PlanStatus::kTerminated);
  assert(first.plan.terminated_at_ms.has_value());

  const auto second = f.engine->TerminatePlan(plan.id, "alice");
  assert(!second.changed);
  assert(second.plan.terminated_at_ms == first.plan.terminated_at_ms);

  const auto missing = ExpectThrows<ledger::util::NotFound>([&] { f.engine->TerminatePlan("no-such-plan", "alice"); });
  assert(missing == "PLAN_NOT_FOUND");

  assert(ledger::model::CanTransition(PlanStatus::kActive, PlanStatus::kTerminated));
  assert(!ledger::model::CanTransition(PlanStatus::kTerminated, PlanStatus::kActive));
  assert(!ledger::model::CanTransition(PlanStatus::kTerminated, PlanStatus::kTerminated));
}

void TestMaterializeIsIdempotent() {
  EngineFixture f;
  SeedTenant(*f.repository, "home", {"alice", "bob"});
  const auto plan = f.engine->CreatePlan(TwoPersonPlan("2024-01-01"));

  const auto first  = f.engine->Materialize(plan.id, D("2024-02-01"));
  const auto second = f.engine->Materialize(plan.id, D("2024-02-01"));
  assert(first.created);
  assert(!second.created);
  assert(first.instance.id == second.instance.id);
  assert(ReadCycles(*f.repository, plan.id).size() == 1);
  assert(f.engine->GetUsage("home").Get(Metric::kActiveExpenses) == 1);
}

void TestMaterializeRejections() {
  EngineFixture f;
  SeedTenant(*f.repository, "home", {"alice", "bob"});
  const auto plan = f.engine->CreatePlan(TwoPersonPlan("2024-03-01"));

  auto code = ExpectThrows<ledger::util::InvalidArgument>([&] { f.engine->Materialize(plan.id, D("2024-02-29")); });
  assert(code == "DUE_DATE_BEFORE_START");

  f.engine->TerminatePlan(plan.id, "alice");
  code = ExpectThrows<ledger::util::InvalidState>([&] { f.engine->Materialize(plan.id, D("2024-03-01")); });
  assert(code == "PLAN_NOT_ACTIVE");
  assert(ReadCycles(*f.repository, plan.id).empty());
  assert(f.engine->GetUsage("home").Get(Metric::kActiveExpenses) == 0);
}

void TestInactiveTenantBlocksPlanWrites() {
  EngineFixture f;
  SeedTenant(*f.repository, "home", {"alice", "bob"});
  const auto plan = f.engine->CreatePlan(TwoPersonPlan("2024-01-01"));
  ledger::testing::SetTenantActive(*f.repository, "home", false);

  auto code = ExpectThrows<ledger::util::InvalidState>([&] { f.engine->Materialize(plan.id, D("2024-01-01")); });
  assert(code == "TENANT_INACTIVE");
  code = ExpectThrows<ledger::util::InvalidState>([&] { f.engine->TerminatePlan(plan.id, "alice"); });
  assert(code == "TENANT_INACTIVE");

  // reads still work
  assert(f.engine->GetPlan(plan.id).status == PlanStatus::kActive);
}

} // namespace

int main() {
  TestActivationMaterializesStartDate();
  TestActivationIsQuotaGuarded();
  TestCreateValidation();
  TestTerminateIsOwnerOnlyAndIdempotent();
  TestMaterializeIsIdempotent();
  TestMaterializeRejections();
  TestInactiveTenantBlocksPlanWrites();

  std::cout << "ledger_unit_plan_manager: pass\n";
  return 0;
}
