#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/core/ledger_engine.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/scheduler/cycle_worker.hpp"
#include "internal/service/ledger_service.hpp"
#include "internal/util/time.hpp"

namespace ledger::factory {

/*
  Application

  Owns all long-lived singletons used by the daemon and the cron runner.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  std::shared_ptr<db::Repository>           repository;
  std::shared_ptr<core::LedgerEngine>       engine;
  std::shared_ptr<service::LedgerService>   service;

  // Set only when scheduler.enabled; not started.
  std::shared_ptr<scheduler::CycleWorker>   cycle_worker;
};

/*
  Composition root.

  It is the ONLY place allowed to know concrete DB types. Schema bootstrap
  runs here for the SQL backends.
*/
std::shared_ptr<db::Repository> BuildRepository(const ledger::runtime::config::RuntimeConfig& config);

Application Build(const ledger::runtime::config::RuntimeConfig& config, std::shared_ptr<util::Clock> clock);

} // namespace ledger::factory
