#include <algorithm>
#include <cassert>
#include <iostream>

#include "internal/util/errors.hpp"
#include "test_support.hpp"

namespace {

using ledger::model::InstanceStatus;
using ledger::model::Metric;
using ledger::model::PlanStatus;
using ledger::model::ShareStatus;
using ledger::testing::EngineFixture;
using ledger::testing::ExpectThrows;
using ledger::testing::ReadPlan;
using ledger::testing::ReadShares;
using ledger::testing::SeedTenant;
using ledger::testing::TwoPersonPlan;

bool Contains(const std::vector<std::string>& ids, const std::string& id) {
  return std::find(ids.begin(), ids.end(), id) != ids.end();
}

void TestRemovalTerminatesReferencingPlans() {
  EngineFixture f;
  SeedTenant(*f.repository, "home", {"alice", "bob", "carol"});
  f.engine->ApplyDelta("home", {{Metric::kActiveMembers, 3}});

  const auto shared_with_bob = f.engine->CreatePlan(TwoPersonPlan("2024-01-01"));

  auto owned_by_bob     = TwoPersonPlan("2024-01-01");
  owned_by_bob.owner_id = "bob";
  const auto bobs_plan  = f.engine->CreatePlan(owned_by_bob);

  auto without_bob   = TwoPersonPlan("2024-01-01");
  without_bob.shares = {{"alice", 100}, {"carol", 100}};
  const auto other   = f.engine->CreatePlan(without_bob);

  const auto result = f.engine->RemoveParticipant("home", "bob");
  assert(result.membership_released);
  assert(result.terminated_plan_ids.size() == 2);
  assert(Contains(result.terminated_plan_ids, shared_with_bob.id));
  assert(Contains(result.terminated_plan_ids, bobs_plan.id));

  assert(ReadPlan(*f.repository, shared_with_bob.id)->status == PlanStatus::kTerminated);
  assert(ReadPlan(*f.repository, shared_with_bob.id)->terminated_at_ms.has_value());
  assert(ReadPlan(*f.repository, bobs_plan.id)->status == PlanStatus::kTerminated);
  assert(ReadPlan(*f.repository, other.id)->status == PlanStatus::kActive);
  assert(f.engine->GetUsage("home").Get(Metric::kActiveMembers) == 2);

  // a second removal is a no-op
  const auto again = f.engine->RemoveParticipant("home", "bob");
  assert(!again.membership_released);
  assert(again.terminated_plan_ids.empty());
  assert(f.engine->GetUsage("home").Get(Metric::kActiveMembers) == 2);

  // removed members cannot be named in new plans
  const auto code = ExpectThrows<ledger::util::InvalidArgument>([&] { f.engine->CreatePlan(TwoPersonPlan("2024-02-01")); });
  assert(code == "INVALID_DEBTOR");
}

void TestTerminatedPlansKeepTheirCycles() {
  EngineFixture f;
  SeedTenant(*f.repository, "home", {"alice", "bob"});
  const auto activated = f.engine->ActivatePlan(TwoPersonPlan("2024-01-01"));

  f.engine->RemoveParticipant("home", "bob");

  const auto cycles = f.engine->ListCycles(activated.plan.id);
  assert(cycles.size() == 1);
  assert(cycles.front().status == InstanceStatus::kActive);

  // the outstanding debt can still be settled
  const auto settled = f.engine->SettleShare(cycles.front().id, "bob");
  assert(settled.changed);
  assert(settled.instance_settled);
}

void TestSettlementClosesCycleWhenAllSharesPaid() {
  EngineFixture f;
  SeedTenant(*f.repository, "home", {"alice", "bob", "carol"});

  auto spec           = TwoPersonPlan("2024-01-01");
  spec.shares         = {{"alice", 100}, {"bob", 200}, {"carol", 300}};
  const auto activated = f.engine->ActivatePlan(spec);
  const auto instance  = activated.first_cycle.instance.id;
  assert(f.engine->GetUsage("home").Get(Metric::kActiveExpenses) == 1);

  auto result = f.engine->SettleShare(instance, "bob");
  assert(result.changed);
  assert(!result.instance_settled);
  assert(result.share.status == ShareStatus::kPaid);
  assert(result.share.paid_at_ms.has_value());

  // paying twice changes nothing
  result = f.engine->SettleShare(instance, "bob");
  assert(!result.changed);
  assert(!result.instance_settled);

  result = f.engine->SettleShare(instance, "carol");
  assert(result.changed);
  assert(result.instance_settled);
  assert(result.instance.settled_at_ms.has_value());
  assert(f.engine->GetUsage("home").Get(Metric::kActiveExpenses) == 0);

  for (const auto& share : ReadShares(*f.repository, instance)) {
    assert(share.status == ShareStatus::kPaid);
  }

  // the owner's pre-paid share settles as a no-op
  result = f.engine->SettleShare(instance, "alice");
  assert(!result.changed);
  assert(result.instance_settled);
  assert(f.engine->GetUsage("home").Get(Metric::kActiveExpenses) == 0);
}

void TestSettlementRejections() {
  EngineFixture f;
  SeedTenant(*f.repository, "home", {"alice", "bob"});
  const auto activated = f.engine->ActivatePlan(TwoPersonPlan("2024-01-01"));

  auto code = ExpectThrows<ledger::util::NotFound>([&] { f.engine->SettleShare("missing", "bob"); });
  assert(code == "INSTANCE_NOT_FOUND");
  code = ExpectThrows<ledger::util::NotFound>([&] { f.engine->SettleShare(activated.first_cycle.instance.id, "mallory"); });
  assert(code == "SHARE_NOT_FOUND");
}

void TestCascadeOnInactiveTenantFails() {
  EngineFixture f;
  SeedTenant(*f.repository, "home", {"alice", "bob"});
  const auto plan = f.engine->CreatePlan(TwoPersonPlan("2024-01-01"));
  ledger::testing::SetTenantActive(*f.repository, "home", false);

  const auto code = ExpectThrows<ledger::util::InvalidState>([&] { f.engine->RemoveParticipant("home", "bob"); });
  assert(code == "TENANT_INACTIVE");
  assert(ReadPlan(*f.repository, plan.id)->status == PlanStatus::kActive);
}

} // namespace

int main() {
  TestRemovalTerminatesReferencingPlans();
  TestTerminatedPlansKeepTheirCycles();
  TestSettlementClosesCycleWhenAllSharesPaid();
  TestSettlementRejections();
  TestCascadeOnInactiveTenantFails();

  std::cout << "ledger_unit_termination_cascade: pass\n";
  return 0;
}
