#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"
#include "test_support.hpp"

#if LEDGER_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

#if LEDGER_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace {

using ledger::db::ErrorCode;
using ledger::db::Repository;
using ledger::db::memory::MemoryRepository;
using ledger::db::model::ChoreRecord;
using ledger::db::model::InstanceRecord;
using ledger::db::model::InstanceShareRecord;
using ledger::db::model::LedgerRecord;
using ledger::db::model::PlanRecord;
using ledger::db::model::PlanShareRecord;
using ledger::model::IntervalUnit;
using ledger::model::Metric;
using ledger::testing::D;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
};

PlanRecord MakePlan(const std::string& id, const std::string& tenant, const char* next_due) {
  PlanRecord plan;
  plan.id            = id;
  plan.tenant_id     = tenant;
  plan.owner_id      = "alice";
  plan.interval      = {1, IntervalUnit::kMonth};
  plan.start_date    = D("2024-01-01");
  plan.next_due_date = D(next_due);
  plan.created_at_ms = NowMs();
  plan.updated_at_ms = plan.created_at_ms;
  return plan;
}

void VerifyTenantRows(Repository& repo, const std::string& tenant) {
  ledger::testing::SeedTenant(repo, tenant, {"alice", "bob"}, "premium");

  auto tx = repo.Begin();
  auto t  = repo.GetTenant(*tx, tenant);
  assert(t.has_value());
  assert(t->is_active);

  auto m = repo.GetMembership(*tx, tenant, "bob");
  assert(m.has_value() && m->is_current);
  assert(!repo.GetMembership(*tx, tenant, "carol").has_value());

  auto e = repo.GetEntitlement(*tx, tenant);
  assert(e.has_value());
  assert(e->tier == "premium");
  assert(e->expires_at_ms == 0);

  m->is_current    = false;
  m->updated_at_ms = NowMs();
  assert(repo.UpsertMembership(*tx, *m));
  assert(!repo.GetMembership(*tx, tenant, "bob")->is_current);
  tx->Commit();
}

void VerifyLedgerRows(Repository& repo, const std::string& tenant) {
  ledger::testing::SeedTenant(repo, tenant, {"alice"});
  {
    auto tx = repo.Begin();
    assert(!repo.GetLedger(*tx, tenant).has_value());
    assert(repo.LockTenant(*tx, tenant));
    assert(repo.LockLedger(*tx, tenant));

    LedgerRecord row;
    row.tenant_id = tenant;
    row.counters.Set(Metric::kActiveExpenses, 3);
    row.counters.Set(Metric::kItemPhotos, 7);
    row.updated_at_ms = NowMs();
    assert(repo.UpsertLedger(*tx, row));
    tx->Commit();
  }

  auto tx  = repo.Begin();
  auto row = repo.GetLedger(*tx, tenant);
  assert(row.has_value());
  assert(row->counters.Get(Metric::kActiveExpenses) == 3);
  assert(row->counters.Get(Metric::kItemPhotos) == 7);
  assert(row->counters.Get(Metric::kActiveChores) == 0);
  tx->Commit();
}

void VerifyPlanAndCycleRows(Repository& repo, const std::string& tenant) {
  ledger::testing::SeedTenant(repo, tenant, {"alice", "bob"});
  const auto early = tenant + "-plan-early";
  const auto late  = tenant + "-plan-late";

  {
    auto tx = repo.Begin();
    assert(repo.InsertPlan(*tx, MakePlan(late, tenant, "2024-03-01"), {{late, "alice", 100}, {late, "bob", 200}}));
    assert(repo.InsertPlan(*tx, MakePlan(early, tenant, "2024-02-01"), {{early, "alice", 100}, {early, "bob", 300}}));

    auto shares = repo.GetPlanShares(*tx, early);
    assert(shares.size() == 2);
    tx->Commit();
  }

  {
    auto tx  = repo.Begin();
    auto due = repo.ListDuePlans(*tx, D("2024-03-01"), 100);
    std::vector<std::string> ids;
    for (const auto& plan : due) {
      if (plan.tenant_id == tenant) ids.push_back(plan.id);
    }
    assert(ids.size() == 2);
    assert(ids[0] == early);
    assert(ids[1] == late);

    for (const auto& plan : repo.ListDuePlans(*tx, D("2024-02-15"), 100)) {
      assert(plan.id != late);
    }
    assert(repo.ListActivePlans(*tx, tenant).size() == 2);

    auto plan             = repo.GetPlan(*tx, late);
    plan->status          = ledger::model::PlanStatus::kTerminated;
    plan->terminated_at_ms = NowMs();
    assert(repo.UpdatePlan(*tx, *plan));
    tx->Commit();
  }

  {
    auto tx   = repo.Begin();
    auto plan = repo.GetPlan(*tx, late);
    assert(plan->status == ledger::model::PlanStatus::kTerminated);
    assert(plan->terminated_at_ms.has_value());
    assert(ledger::util::FormatDate(plan->next_due_date) == "2024-03-01");
    assert(repo.ListActivePlans(*tx, tenant).size() == 1);
    tx->Commit();
  }

  const auto instance_id = tenant + "-cycle-1";
  {
    auto tx = repo.Begin();
    assert(repo.LockTenant(*tx, tenant));
    assert(repo.LockPlan(*tx, early));

    InstanceRecord second;
    second.id                 = tenant + "-cycle-2";
    second.plan_id            = early;
    second.tenant_id          = tenant;
    second.owner_id           = "alice";
    second.due_date           = D("2024-03-01");
    second.total_amount_cents = 400;
    second.created_at_ms      = NowMs();
    assert(repo.InsertInstance(*tx, second));

    InstanceRecord first = second;
    first.id             = instance_id;
    first.due_date       = D("2024-02-01");
    assert(repo.InsertInstance(*tx, first));

    // (plan_id, due_date) is unique; the transaction stays usable afterwards
    InstanceRecord duplicate = first;
    duplicate.id             = tenant + "-cycle-dup";
    const auto dup           = repo.InsertInstance(*tx, duplicate);
    assert(dup.code == ErrorCode::AlreadyExists);

    auto found = repo.FindInstance(*tx, early, D("2024-02-01"));
    assert(found.has_value());
    assert(found->id == instance_id);

    auto listed = repo.ListInstances(*tx, early);
    assert(listed.size() == 2);
    assert(listed[0].id == instance_id);

    assert(repo.LockInstanceShares(*tx, instance_id));
    std::vector<InstanceShareRecord> shares(2);
    shares[0].instance_id    = instance_id;
    shares[0].participant_id = "alice";
    shares[0].amount_cents   = 100;
    shares[0].status         = ledger::model::ShareStatus::kPaid;
    shares[0].paid_at_ms     = NowMs();
    shares[1].instance_id    = instance_id;
    shares[1].participant_id = "bob";
    shares[1].amount_cents   = 300;
    assert(repo.InsertInstanceShares(*tx, shares));
    tx->Commit();
  }

  {
    auto tx     = repo.Begin();
    auto shares = repo.GetInstanceShares(*tx, instance_id);
    assert(shares.size() == 2);
    for (auto& share : shares) {
      if (share.participant_id == "bob") {
        assert(share.status == ledger::model::ShareStatus::kUnpaid);
        assert(!share.paid_at_ms.has_value());
        share.status     = ledger::model::ShareStatus::kPaid;
        share.paid_at_ms = NowMs();
        assert(repo.UpdateInstanceShare(*tx, share));
      }
    }

    auto instance           = repo.GetInstance(*tx, instance_id);
    instance->status        = ledger::model::InstanceStatus::kSettled;
    instance->settled_at_ms = NowMs();
    assert(repo.UpdateInstance(*tx, *instance));
    tx->Commit();
  }

  auto tx       = repo.Begin();
  auto instance = repo.GetInstance(*tx, instance_id);
  assert(instance->status == ledger::model::InstanceStatus::kSettled);
  assert(instance->settled_at_ms.has_value());
  for (const auto& share : repo.GetInstanceShares(*tx, instance_id)) {
    assert(share.status == ledger::model::ShareStatus::kPaid);
  }
  tx->Commit();
}

void VerifyChoreRows(Repository& repo, const std::string& tenant) {
  ledger::testing::SeedTenant(repo, tenant, {"alice"});

  ChoreRecord one_off;
  one_off.id         = tenant + "-one-off";
  one_off.tenant_id  = tenant;
  one_off.start_date = D("2024-01-01");

  ChoreRecord recurring = one_off;
  recurring.id          = tenant + "-weekly";
  recurring.interval    = ledger::model::Interval{2, IntervalUnit::kWeek};

  {
    auto tx = repo.Begin();
    assert(repo.InsertChore(*tx, one_off));
    assert(repo.InsertChore(*tx, recurring));
    tx->Commit();
  }

  {
    auto tx = repo.Begin();
    auto a  = repo.GetChore(*tx, one_off.id);
    assert(a.has_value());
    assert(!a->interval.has_value());
    assert(!a->cursor.has_value());

    auto b = repo.GetChore(*tx, recurring.id);
    assert(b->interval.has_value());
    assert(b->interval->every == 2);
    assert(b->interval->unit == IntervalUnit::kWeek);

    b->cursor        = D("2024-01-15");
    b->updated_at_ms = NowMs();
    assert(repo.UpdateChore(*tx, *b));

    a->status          = ledger::model::ChoreStatus::kCompleted;
    a->completed_at_ms = NowMs();
    assert(repo.UpdateChore(*tx, *a));
    tx->Commit();
  }

  auto tx = repo.Begin();
  assert(ledger::util::FormatDate(*repo.GetChore(*tx, recurring.id)->cursor) == "2024-01-15");
  assert(repo.GetChore(*tx, one_off.id)->status == ledger::model::ChoreStatus::kCompleted);
  assert(repo.GetChore(*tx, one_off.id)->completed_at_ms.has_value());
  tx->Commit();
}

void VerifyRollbackBehavior(Repository& repo, const std::string& tenant) {
  ledger::testing::SeedTenant(repo, tenant, {"alice", "bob"});
  const auto plan_id = tenant + "-rolled-back";

  {
    auto tx = repo.Begin();
    assert(repo.InsertPlan(*tx, MakePlan(plan_id, tenant, "2024-02-01"), {{plan_id, "bob", 100}}));
    assert(repo.GetPlan(*tx, plan_id).has_value());
    tx->Rollback();
  }
  {
    auto tx = repo.Begin();
    assert(repo.InsertPlan(*tx, MakePlan(plan_id + "-dropped", tenant, "2024-02-01"), {{plan_id + "-dropped", "bob", 100}}));
    // destroyed without commit
  }

  auto tx = repo.Begin();
  assert(!repo.GetPlan(*tx, plan_id).has_value());
  assert(!repo.GetPlan(*tx, plan_id + "-dropped").has_value());
  assert(repo.GetPlanShares(*tx, plan_id).empty());
  tx->Commit();
}

void VerifyLockOrdering(Repository& repo, const std::string& tenant) {
  ledger::testing::SeedTenant(repo, tenant, {"alice"});

  auto tx = repo.Begin();
  assert(repo.LockTenant(*tx, tenant));
  assert(repo.LockLedger(*tx, tenant));
  assert(repo.LockTenant(*tx, tenant));

  bool threw = false;
  try {
    (void)repo.LockChore(*tx, tenant + "-any-chore");
  } catch (const ledger::util::LockOrderViolation&) {
    threw = true;
  }
  assert(threw);
  tx->Rollback();

  auto missing = repo.Begin();
  assert(repo.LockTenant(*missing, tenant + "-missing").code == ErrorCode::NotFound);
  missing->Rollback();
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& tenant) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  ledger::testing::SeedTenant(*repo, tenant, {"alice", "bob"});
  const auto plan_id = tenant + "-durable-plan";
  {
    auto tx = repo->Begin();
    assert(repo->InsertPlan(*tx, MakePlan(plan_id, tenant, "2024-01-31"), {{plan_id, "bob", 900}}));

    LedgerRecord row;
    row.tenant_id = tenant;
    row.counters.Set(Metric::kActiveMembers, 2);
    assert(repo->UpsertLedger(*tx, row));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx   = repo->Begin();
  auto plan = repo->GetPlan(*tx, plan_id);
  assert(plan.has_value());
  assert(ledger::util::FormatDate(plan->next_due_date) == "2024-01-31");
  assert(plan->interval.unit == IntervalUnit::kMonth);
  assert(repo->GetPlanShares(*tx, plan_id).front().amount_cents == 900);
  assert(repo->GetLedger(*tx, tenant)->counters.Get(Metric::kActiveMembers) == 2);
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<Repository>&) {},
      .cleanup          = []() {},
  };
}

#if LEDGER_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("ledger_engine_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    auto db = std::make_shared<ledger::db::sqlite::SqliteDB>(db_path);
    db->Bootstrap();
    return std::make_shared<ledger::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) {
        repo.reset();
        repo = make_repo();
      },
      .cleanup = [db_path]() {
        std::filesystem::remove(db_path);
        std::filesystem::remove(db_path + "-wal");
        std::filesystem::remove(db_path + "-shm");
      },
  };
}
#endif

#if LEDGER_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("LEDGER_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("LEDGER_TEST_POSTGRES_URI is not set");
  }

  auto conninfo  = std::string(uri);
  auto make_repo = [conninfo]() {
    auto pool = std::make_shared<ledger::db::postgres::PgPool>(conninfo);
    pool->Bootstrap();
    return std::make_shared<ledger::db::postgres::PgRepository>(std::move(pool));
  };

  return BackendFactory{
      .name             = "postgres",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup          = []() {},
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  auto repo = backend.make_repository();

  // unique per run so a reused postgres database does not collide
  const auto prefix = backend.name + "-" + std::to_string(NowMs());

  VerifyTenantRows(*repo, prefix + "-tenant");
  VerifyLedgerRows(*repo, prefix + "-ledger");
  VerifyPlanAndCycleRows(*repo, prefix + "-plans");
  VerifyChoreRows(*repo, prefix + "-chores");
  VerifyRollbackBehavior(*repo, prefix + "-rollback");
  VerifyLockOrdering(*repo, prefix + "-locks");

  repo.reset();
  VerifyRestartDurability(backend, prefix + "-durable");

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if LEDGER_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if LEDGER_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "ledger_integration_repository_parity: pass\n";
  return 0;
}
