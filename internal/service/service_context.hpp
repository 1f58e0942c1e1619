#pragma once

#include <memory>

namespace ledger::core { class LedgerEngine; }

namespace ledger::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<ledger::core::LedgerEngine> engine;
};

} // namespace ledger::service
