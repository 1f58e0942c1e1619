#include <cassert>
#include <chrono>
#include <iostream>
#include <limits>
#include <random>

#include "internal/core/plan_limit_registry.hpp"
#include "internal/util/errors.hpp"
#include "test_support.hpp"

namespace {

using ledger::model::Metric;
using ledger::testing::EngineFixture;
using ledger::testing::ExpectThrows;
using ledger::testing::SeedTenant;

void TestCountersNeverGoNegative() {
  EngineFixture f;
  SeedTenant(*f.repository, "home", {"alice"});

  std::mt19937 rng(7);
  std::uniform_int_distribution<int> delta(-5, 5);
  for (int i = 0; i < 200; ++i) {
    const auto counters = f.engine->ApplyDelta("home", {{Metric::kActiveChores, delta(rng)}, {Metric::kItemPhotos, delta(rng)}});
    for (const auto metric : ledger::model::kAllMetrics) {
      assert(counters.Get(metric) >= 0);
    }
  }

  auto counters = f.engine->ApplyDelta("home", {{Metric::kChorePhotos, -3}});
  assert(counters.Get(Metric::kChorePhotos) == 0);
  counters = f.engine->ApplyDelta("home", {{Metric::kChorePhotos, 2}});
  assert(counters.Get(Metric::kChorePhotos) == 2);
}

void TestHugeDeltasSaturate() {
  constexpr auto kMax = std::numeric_limits<std::int64_t>::max();
  constexpr auto kMin = std::numeric_limits<std::int64_t>::min();
  assert(ledger::model::ProjectCounter(10, kMax) == kMax);
  assert(ledger::model::ProjectCounter(kMax, 1) == kMax);
  assert(ledger::model::ProjectCounter(10, kMin) == 0);
  assert(ledger::model::ProjectCounter(10, -3) == 7);

  EngineFixture f;
  SeedTenant(*f.repository, "home", {"alice"});
  f.engine->ApplyDelta("home", {{Metric::kActiveExpenses, 10}});

  bool thrown = false;
  try {
    f.engine->AssertQuota("home", {{Metric::kActiveExpenses, kMax}});
  } catch (const ledger::util::QuotaExceeded& e) {
    thrown = true;
    assert(e.current() == 10);
    assert(e.projected() == kMax);
  }
  assert(thrown);
  assert(f.engine->GetUsage("home").Get(Metric::kActiveExpenses) == 10);

  auto counters = f.engine->ApplyDelta("home", {{Metric::kActiveExpenses, kMax}});
  assert(counters.Get(Metric::kActiveExpenses) == kMax);
  counters = f.engine->ApplyDelta("home", {{Metric::kActiveExpenses, 1}});
  assert(counters.Get(Metric::kActiveExpenses) == kMax);
  counters = f.engine->ApplyDelta("home", {{Metric::kActiveExpenses, kMin}});
  assert(counters.Get(Metric::kActiveExpenses) == 0);
}

void TestUsageIsZeroWithoutLedgerRow() {
  EngineFixture f;
  SeedTenant(*f.repository, "home", {"alice"});
  assert(f.engine->GetUsage("home") == ledger::model::Counters{});
}

void TestFreeTierRejectsEleventhExpense() {
  EngineFixture f;
  SeedTenant(*f.repository, "home", {"alice"});
  f.engine->ApplyDelta("home", {{Metric::kActiveExpenses, 10}});

  bool thrown = false;
  try {
    f.engine->AssertQuota("home", {{Metric::kActiveExpenses, 1}});
  } catch (const ledger::util::QuotaExceeded& e) {
    thrown = true;
    assert(e.code() == "QUOTA_EXCEEDED_active_expenses");
    assert(e.metric() == "active_expenses");
    assert(e.tier() == "free");
    assert(e.current() == 10);
    assert(e.limit() == 10);
    assert(e.projected() == 11);
  }
  assert(thrown);

  // the guard never mutates
  assert(f.engine->GetUsage("home").Get(Metric::kActiveExpenses) == 10);
}

void TestOnlyPositiveDeltasAreChecked() {
  EngineFixture f;
  SeedTenant(*f.repository, "home", {"alice"});
  f.engine->ApplyDelta("home", {{Metric::kActiveMembers, 4}});

  f.engine->AssertQuota("home", {{Metric::kActiveMembers, 0}});
  f.engine->AssertQuota("home", {{Metric::kActiveMembers, -1}, {Metric::kActiveChores, 20}});

  const auto code = ExpectThrows<ledger::util::QuotaExceeded>(
      [&] { f.engine->AssertQuota("home", {{Metric::kActiveChores, 1}, {Metric::kActiveMembers, 1}}); });
  assert(code == "QUOTA_EXCEEDED_active_members");
}

void TestUnrestrictedAndExpiredEntitlements() {
  EngineFixture f;
  SeedTenant(*f.repository, "home", {"alice"}, "premium");
  f.engine->AssertQuota("home", {{Metric::kActiveExpenses, 1000}});

  const auto described = f.engine->DescribeQuota("home");
  assert(described.tier == "premium");
  assert(described.unrestricted);
  for (const auto& usage : described.usage) {
    assert(!usage.limit.has_value());
  }

  // an expired entitlement falls back to free
  {
    auto tx        = f.repository->Begin();
    const auto now = ledger::util::ToUnixMillis(f.clock->Now());
    auto updated   = f.repository->UpsertEntitlement(*tx, {"home", "premium", now - 1});
    assert(updated);
    tx->Commit();
  }
  const auto code = ExpectThrows<ledger::util::QuotaExceeded>([&] { f.engine->AssertQuota("home", {{Metric::kActiveExpenses, 11}}); });
  assert(code == "QUOTA_EXCEEDED_active_expenses");
  assert(f.engine->DescribeQuota("home").tier == "free");
}

void TestMetricsWithoutLimitAreIgnored() {
  auto registry = ledger::core::PlanLimitRegistry::Defaults();
  registry.SetLimit("family", Metric::kActiveChores, 2);
  assert(registry.Limit("family", Metric::kActiveChores) == 2);
  assert(!registry.Limit("family", Metric::kItemPhotos).has_value());
  assert(registry.IsUnrestricted("premium"));
  assert(!registry.IsUnrestricted("free"));
}

void TestInactiveTenantRejectsMutations() {
  EngineFixture f;
  SeedTenant(*f.repository, "home", {"alice"}, "", false);

  auto code = ExpectThrows<ledger::util::InvalidState>([&] { f.engine->AssertQuota("home", {{Metric::kActiveChores, 1}}); });
  assert(code == "TENANT_INACTIVE");
  code = ExpectThrows<ledger::util::InvalidState>([&] { f.engine->ApplyDelta("home", {{Metric::kActiveChores, 1}}); });
  assert(code == "TENANT_INACTIVE");

  code = ExpectThrows<ledger::util::NotFound>([&] { f.engine->ApplyDelta("nowhere", {{Metric::kActiveChores, 1}}); });
  assert(code == "TENANT_NOT_FOUND");
}

} // namespace

int main() {
  TestCountersNeverGoNegative();
  TestHugeDeltasSaturate();
  TestUsageIsZeroWithoutLedgerRow();
  TestFreeTierRejectsEleventhExpense();
  TestOnlyPositiveDeltasAreChecked();
  TestUnrestrictedAndExpiredEntitlements();
  TestMetricsWithoutLimitAreIgnored();
  TestInactiveTenantRejectsMutations();

  std::cout << "ledger_unit_quota: pass\n";
  return 0;
}
