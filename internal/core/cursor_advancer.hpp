#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "internal/core/ledger_store.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/util/date.hpp"
#include "internal/util/time.hpp"

namespace ledger::core {

enum class AdvanceStatus : std::uint8_t {
  kRecurringCompleted,
  kAlreadyCompletedForCycle,
  kNonRecurringCompleted,
};

std::string_view AdvanceStatusName(AdvanceStatus status);

struct AdvanceResult {
  AdvanceStatus             status = AdvanceStatus::kAlreadyCompletedForCycle;
  std::optional<util::Date> cursor;
  std::int64_t              steps = 0;
};

/*
  Completes in-place obligations (chores).

  Recurring chores move their cursor forward from the cursor (or start
  date) one interval at a time while it is on or before today; the cursor
  never moves backwards. A one-off chore is completed once and releases
  its active_chores slot.

  Lock order: tenant -> chore -> ledger.
*/
class CursorAdvancer {
 public:
  CursorAdvancer(std::shared_ptr<db::Repository> repository, std::shared_ptr<LedgerStore> ledger, std::shared_ptr<util::Clock> clock);

  AdvanceResult Advance(db::Transaction& tx, const std::string& chore_id, const util::Date& today);

 private:
  std::shared_ptr<db::Repository> repository_;
  std::shared_ptr<LedgerStore>    ledger_;
  std::shared_ptr<util::Clock>    clock_;
};

} // namespace ledger::core
