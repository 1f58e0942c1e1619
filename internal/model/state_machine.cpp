#include "state_machine.hpp"

namespace ledger::model {

std::string_view StatusName(PlanStatus status) {
  return status == PlanStatus::kTerminated ? "terminated" : "active";
}

std::string_view StatusName(InstanceStatus status) {
  return status == InstanceStatus::kSettled ? "settled" : "active";
}

std::string_view StatusName(ShareStatus status) {
  return status == ShareStatus::kPaid ? "paid" : "unpaid";
}

std::string_view StatusName(ChoreStatus status) {
  switch (status) {
    case ChoreStatus::kDraft:
      return "draft";
    case ChoreStatus::kActive:
      return "active";
    case ChoreStatus::kCompleted:
      return "completed";
    case ChoreStatus::kCancelled:
      return "cancelled";
  }
  return "unknown";
}

std::optional<PlanStatus> ParsePlanStatus(std::string_view name) {
  if (name == "active") return PlanStatus::kActive;
  if (name == "terminated") return PlanStatus::kTerminated;
  return std::nullopt;
}

std::optional<InstanceStatus> ParseInstanceStatus(std::string_view name) {
  if (name == "active") return InstanceStatus::kActive;
  if (name == "settled") return InstanceStatus::kSettled;
  return std::nullopt;
}

std::optional<ShareStatus> ParseShareStatus(std::string_view name) {
  if (name == "unpaid") return ShareStatus::kUnpaid;
  if (name == "paid") return ShareStatus::kPaid;
  return std::nullopt;
}

std::optional<ChoreStatus> ParseChoreStatus(std::string_view name) {
  if (name == "draft") return ChoreStatus::kDraft;
  if (name == "active") return ChoreStatus::kActive;
  if (name == "completed") return ChoreStatus::kCompleted;
  if (name == "cancelled") return ChoreStatus::kCancelled;
  return std::nullopt;
}

} // namespace ledger::model
