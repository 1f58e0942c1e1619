#pragma once

#include <cassert>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/core/ledger_engine.hpp"
#include "internal/core/plan_limit_registry.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/date.hpp"
#include "internal/util/time.hpp"

namespace ledger::testing {

inline util::Date D(const char* text) {
  return util::ParseDate(text);
}

// Writes the rows the membership collaborator owns.
inline void SeedTenant(db::Repository& repo, const std::string& tenant_id, const std::vector<std::string>& members,
                       const std::string& tier = "", bool active = true) {
  auto tx = repo.Begin();
  assert(repo.UpsertTenant(*tx, {tenant_id, active, 1}));
  for (const auto& member : members) {
    assert(repo.UpsertMembership(*tx, {tenant_id, member, true, 1}));
  }
  if (!tier.empty()) {
    assert(repo.UpsertEntitlement(*tx, {tenant_id, tier, 0}));
  }
  tx->Commit();
}

inline void SetTenantActive(db::Repository& repo, const std::string& tenant_id, bool active) {
  auto tx = repo.Begin();
  assert(repo.UpsertTenant(*tx, {tenant_id, active, 1}));
  tx->Commit();
}

inline void SeedChore(db::Repository& repo, const db::model::ChoreRecord& chore) {
  auto tx = repo.Begin();
  assert(repo.InsertChore(*tx, chore));
  tx->Commit();
}

inline std::optional<db::model::PlanRecord> ReadPlan(db::Repository& repo, const std::string& plan_id) {
  auto tx = repo.Begin();
  return repo.GetPlan(*tx, plan_id);
}

inline std::vector<db::model::InstanceRecord> ReadCycles(db::Repository& repo, const std::string& plan_id) {
  auto tx = repo.Begin();
  return repo.ListInstances(*tx, plan_id);
}

inline std::vector<db::model::InstanceShareRecord> ReadShares(db::Repository& repo, const std::string& instance_id) {
  auto tx = repo.Begin();
  return repo.GetInstanceShares(*tx, instance_id);
}

struct EngineFixture {
  std::shared_ptr<db::Repository>     repository;
  std::shared_ptr<util::FixedClock>   clock;
  std::shared_ptr<core::LedgerEngine> engine;

  explicit EngineFixture(const char* today = "2024-01-01", scheduler::SchedulerLimits limits = {},
                         std::shared_ptr<db::Repository> repo = nullptr)
      : repository(repo ? std::move(repo) : std::make_shared<db::memory::MemoryRepository>()),
        clock(std::make_shared<util::FixedClock>(D(today))),
        engine(std::make_shared<core::LedgerEngine>(
            repository, std::make_shared<const core::PlanLimitRegistry>(core::PlanLimitRegistry::Defaults()), clock, limits)) {
  }
};

// Owner "alice" and "bob" splitting a plan in the "home" tenant.
inline core::PlanSpec TwoPersonPlan(const char* start, model::Interval interval = {1, model::IntervalUnit::kMonth},
                                    const std::string& tenant_id = "home") {
  core::PlanSpec spec;
  spec.tenant_id  = tenant_id;
  spec.owner_id   = "alice";
  spec.interval   = interval;
  spec.start_date = D(start);
  spec.shares     = {{"alice", 500}, {"bob", 700}};
  return spec;
}

template <typename Exception, typename Fn>
std::string ExpectThrows(Fn&& fn) {
  try {
    fn();
  } catch (const Exception& e) {
    return e.code();
  }
  assert(false && "expected exception was not thrown");
  return {};
}

} // namespace ledger::testing
