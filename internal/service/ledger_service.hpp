#pragma once

#include "ledger/v1.hpp"
#include "service_context.hpp"

namespace ledger::service {

/*
  Maps ledger.v1 messages onto the engine. Transport independent: errors
  surface as the engine's exceptions (util::Error subclasses).
*/
class LedgerService {
public:
  explicit LedgerService(ServiceContext ctx);

  void AssertQuota(const ledger::v1::AssertQuotaRequest& req);

  ledger::v1::ApplyDeltaResponse
  ApplyDelta(const ledger::v1::ApplyDeltaRequest& req);

  ledger::v1::GetUsageResponse
  GetUsage(const ledger::v1::GetUsageRequest& req);

  ledger::v1::DescribeQuotaResponse
  DescribeQuota(const ledger::v1::DescribeQuotaRequest& req);

  ledger::v1::CreatePlanResponse
  CreatePlan(const ledger::v1::CreatePlanRequest& req);

  ledger::v1::ActivatePlanResponse
  ActivatePlan(const ledger::v1::CreatePlanRequest& req);

  ledger::v1::TerminatePlanResponse
  TerminatePlan(const ledger::v1::TerminatePlanRequest& req);

  ledger::v1::MaterializeResponse
  Materialize(const ledger::v1::MaterializeRequest& req);

  ledger::v1::AdvanceChoreResponse
  AdvanceChore(const ledger::v1::AdvanceChoreRequest& req);

  ledger::v1::SettleShareResponse
  SettleShare(const ledger::v1::SettleShareRequest& req);

  ledger::v1::RunDueCyclesResponse
  RunDueCycles(const ledger::v1::RunDueCyclesRequest& req);

  ledger::v1::RemoveParticipantResponse
  RemoveParticipant(const ledger::v1::RemoveParticipantRequest& req);

private:
  ServiceContext ctx_;
};

} // namespace ledger::service
