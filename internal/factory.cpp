#include "factory.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>

#include "internal/core/plan_limit_registry.hpp"
#include "internal/db/memory/memory_repository.hpp"
#if LEDGER_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if LEDGER_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace ledger::factory {

std::shared_ptr<db::Repository> BuildRepository(const ledger::runtime::config::RuntimeConfig& config) {
  const auto  lock_timeout = std::chrono::milliseconds(config.locks().timeout_ms() ? config.locks().timeout_ms() : 5000);
  const auto& database     = config.database();

  if (database.has_sqlite()) {
#if LEDGER_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), lock_timeout);
    sqlite_db->Bootstrap();
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if LEDGER_DB_POSTGRES
    const auto max_connections = database.postgres().max_connections() ? database.postgres().max_connections() : 16;
    auto       pool            = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), max_connections);
    pool->Bootstrap();
    return std::make_shared<db::postgres::PgRepository>(std::move(pool), lock_timeout);
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  return std::make_shared<db::memory::MemoryRepository>(lock_timeout);
}

/*
    Build full application dependency graph
*/
Application Build(const ledger::runtime::config::RuntimeConfig& config, std::shared_ptr<util::Clock> clock) {
  Application app;

  // ------------------------------------------------------------------
  // Persistence
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config);

  // ------------------------------------------------------------------
  // Engine
  // ------------------------------------------------------------------
  auto registry = std::make_shared<const core::PlanLimitRegistry>(core::PlanLimitRegistry::FromConfig(config.quota()));

  scheduler::SchedulerLimits limits;
  if (config.scheduler().per_plan_cap() > 0) {
    limits.per_plan_cap = config.scheduler().per_plan_cap();
  }
  if (config.scheduler().global_cap() > 0) {
    limits.global_cap = config.scheduler().global_cap();
  }

  app.engine = std::make_shared<core::LedgerEngine>(app.repository, std::move(registry), std::move(clock), limits);

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.engine  = app.engine;
  app.service = std::make_shared<service::LedgerService>(ctx);

  // ------------------------------------------------------------------
  // Background catch-up
  // ------------------------------------------------------------------
  if (config.scheduler().enabled()) {
    const auto interval = std::chrono::seconds(config.scheduler().interval_seconds() ? config.scheduler().interval_seconds() : 3600);
    app.cycle_worker    = std::make_shared<scheduler::CycleWorker>(app.engine, interval);
  }

  return app;
}

} // namespace ledger::factory
