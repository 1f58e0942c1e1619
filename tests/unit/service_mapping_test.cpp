#include <cassert>
#include <iostream>

#include "internal/service/ledger_service.hpp"
#include "internal/util/errors.hpp"
#include "test_support.hpp"

namespace {

using ledger::testing::EngineFixture;
using ledger::testing::ExpectThrows;
using ledger::testing::SeedTenant;

ledger::v1::CreatePlanRequest PlanRequest(const std::string& start) {
  ledger::v1::CreatePlanRequest req;
  req.set_tenant_id("home");
  req.set_owner_id("alice");
  req.set_start_date(start);
  req.mutable_interval()->set_every(1);
  req.mutable_interval()->set_unit(ledger::v1::INTERVAL_UNIT_MONTH);

  auto* owner = req.add_shares();
  owner->set_participant_id("alice");
  owner->set_amount_cents(500);
  auto* other = req.add_shares();
  other->set_participant_id("bob");
  other->set_amount_cents(700);
  return req;
}

void TestUsageMapping() {
  EngineFixture f;
  SeedTenant(*f.repository, "home", {"alice", "bob"});
  ledger::service::LedgerService service(ledger::service::ServiceContext{f.engine});

  ledger::v1::ApplyDeltaRequest apply;
  apply.set_tenant_id("home");
  (*apply.mutable_deltas())["active_chores"] = 3;
  (*apply.mutable_deltas())["item_photos"]   = -2;
  const auto applied = service.ApplyDelta(apply);
  assert(applied.usage().counters().at("active_chores") == 3);
  assert(applied.usage().counters().at("item_photos") == 0);
  assert(applied.usage().counters().size() == 5);

  ledger::v1::DescribeQuotaRequest describe;
  describe.set_tenant_id("home");
  const auto quota = service.DescribeQuota(describe);
  assert(quota.tier() == "free");
  assert(!quota.unrestricted());
  assert(quota.metrics_size() == 5);
  for (const auto& metric : quota.metrics()) {
    assert(metric.limited());
    if (metric.metric() == "active_chores") {
      assert(metric.current() == 3);
      assert(metric.max_value() == 20);
    }
  }
}

void TestInputValidation() {
  EngineFixture f;
  SeedTenant(*f.repository, "home", {"alice", "bob"});
  ledger::service::LedgerService service(ledger::service::ServiceContext{f.engine});

  ledger::v1::AssertQuotaRequest assert_req;
  assert_req.set_tenant_id("home");
  (*assert_req.mutable_deltas())["parking_spots"] = 1;
  auto code = ExpectThrows<ledger::util::InvalidArgument>([&] { service.AssertQuota(assert_req); });
  assert(code == "INVALID_QUOTA_DELTA");

  ledger::v1::GetUsageRequest usage;
  code = ExpectThrows<ledger::util::InvalidArgument>([&] { service.GetUsage(usage); });
  assert(code == "INVALID_ARGUMENT");

  auto bad_date = PlanRequest("2024-02-30");
  code          = ExpectThrows<ledger::util::InvalidArgument>([&] { service.CreatePlan(bad_date); });
  assert(code == "INVALID_DATE");

  auto no_unit = PlanRequest("2024-01-01");
  no_unit.mutable_interval()->set_unit(ledger::v1::INTERVAL_UNIT_UNSPECIFIED);
  code = ExpectThrows<ledger::util::InvalidArgument>([&] { service.CreatePlan(no_unit); });
  assert(code == "INVALID_INTERVAL");
}

void TestPlanLifecycleMapping() {
  EngineFixture f("2024-01-31");
  SeedTenant(*f.repository, "home", {"alice", "bob"});
  ledger::service::LedgerService service(ledger::service::ServiceContext{f.engine});

  const auto activated = service.ActivatePlan(PlanRequest("2024-01-31"));
  assert(activated.created());
  assert(activated.plan().status() == ledger::v1::PLAN_STATUS_ACTIVE);
  assert(activated.plan().next_due_date() == "2024-02-29");
  assert(activated.plan().interval().unit() == ledger::v1::INTERVAL_UNIT_MONTH);
  assert(activated.first_cycle().due_date() == "2024-01-31");
  assert(activated.first_cycle().total_amount_cents() == 1200);

  ledger::v1::RunDueCyclesRequest run;
  run.set_today("2024-03-31");
  const auto report = service.RunDueCycles(run).report();
  assert(report.plans_processed() == 1);
  assert(report.cycles_materialized() == 2);

  ledger::v1::SettleShareRequest settle;
  settle.set_instance_id(activated.first_cycle().id());
  settle.set_participant_id("bob");
  const auto settled = service.SettleShare(settle);
  assert(settled.changed());
  assert(settled.instance_settled());
  assert(settled.share().status() == ledger::v1::SHARE_STATUS_PAID);
  assert(settled.instance().status() == ledger::v1::INSTANCE_STATUS_SETTLED);
  assert(settled.instance().has_settled_at());

  ledger::v1::TerminatePlanRequest terminate;
  terminate.set_plan_id(activated.plan().id());
  terminate.set_actor_id("alice");
  const auto terminated = service.TerminatePlan(terminate);
  assert(terminated.changed());
  assert(terminated.plan().status() == ledger::v1::PLAN_STATUS_TERMINATED);
  assert(terminated.plan().has_terminated_at());

  ledger::v1::MaterializeRequest materialize;
  materialize.set_plan_id(activated.plan().id());
  materialize.set_due_date("2024-04-30");
  const auto code = ExpectThrows<ledger::util::InvalidState>([&] { service.Materialize(materialize); });
  assert(code == "PLAN_NOT_ACTIVE");
}

void TestChoreAndMembershipMapping() {
  EngineFixture f("2024-01-10");
  SeedTenant(*f.repository, "home", {"alice", "bob"});
  ledger::service::LedgerService service(ledger::service::ServiceContext{f.engine});

  ledger::db::model::ChoreRecord chore;
  chore.id         = "vacuum";
  chore.tenant_id  = "home";
  chore.interval   = ledger::model::Interval{1, ledger::model::IntervalUnit::kWeek};
  chore.start_date = ledger::testing::D("2024-01-01");
  ledger::testing::SeedChore(*f.repository, chore);

  ledger::v1::AdvanceChoreRequest advance;
  advance.set_chore_id("vacuum");
  const auto advanced = service.AdvanceChore(advance);
  assert(advanced.status() == ledger::v1::ADVANCE_STATUS_RECURRING_COMPLETED);
  assert(advanced.cursor() == "2024-01-15");
  assert(advanced.steps() == 2);

  const auto created = service.CreatePlan(PlanRequest("2024-01-01"));

  ledger::v1::RemoveParticipantRequest remove;
  remove.set_tenant_id("home");
  remove.set_participant_id("bob");
  const auto removed = service.RemoveParticipant(remove);
  assert(removed.membership_released());
  assert(removed.terminated_plan_ids_size() == 1);
  assert(removed.terminated_plan_ids(0) == created.plan().id());
}

} // namespace

int main() {
  TestUsageMapping();
  TestInputValidation();
  TestPlanLifecycleMapping();
  TestChoreAndMembershipMapping();

  std::cout << "ledger_unit_service_mapping: pass\n";
  return 0;
}
