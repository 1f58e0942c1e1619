#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace ledger::model {

enum class PlanStatus : std::uint8_t {
  kActive = 0,
  kTerminated = 1,
};

enum class InstanceStatus : std::uint8_t {
  kActive = 0,
  kSettled = 1,
};

enum class ShareStatus : std::uint8_t {
  kUnpaid = 0,
  kPaid = 1,
};

enum class ChoreStatus : std::uint8_t {
  kDraft = 0,
  kActive = 1,
  kCompleted = 2,
  kCancelled = 3,
};

// Chore moves the engine makes. A recurring advance stays active; drafts are
// published elsewhere and completed or cancelled chores never move again.
constexpr bool CanTransition(ChoreStatus from, ChoreStatus to) {
  if (from != ChoreStatus::kActive) {
    return false;
  }
  return to != ChoreStatus::kDraft;
}

// A terminated plan never becomes active again.
constexpr bool CanTransition(PlanStatus from, PlanStatus to) {
  return from == PlanStatus::kActive && to == PlanStatus::kTerminated;
}

std::string_view StatusName(PlanStatus status);
std::string_view StatusName(InstanceStatus status);
std::string_view StatusName(ShareStatus status);
std::string_view StatusName(ChoreStatus status);

std::optional<PlanStatus>     ParsePlanStatus(std::string_view name);
std::optional<InstanceStatus> ParseInstanceStatus(std::string_view name);
std::optional<ShareStatus>    ParseShareStatus(std::string_view name);
std::optional<ChoreStatus>    ParseChoreStatus(std::string_view name);

} // namespace ledger::model
