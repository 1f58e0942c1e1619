#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "ledger/v1/ledger_service.grpc.pb.h"
#include "internal/service/ledger_service.hpp"
#include "ledger/v1.hpp"

namespace ledger::grpc {

class LedgerServer final : public ledger::v1::LedgerService::Service {
public:
  explicit LedgerServer(std::shared_ptr<ledger::service::LedgerService> svc);

  ::grpc::Status AssertQuota(::grpc::ServerContext*,
                             const ledger::v1::AssertQuotaRequest*,
                             ledger::v1::AssertQuotaResponse*) override;

  ::grpc::Status ApplyDelta(::grpc::ServerContext*,
                            const ledger::v1::ApplyDeltaRequest*,
                            ledger::v1::ApplyDeltaResponse*) override;

  ::grpc::Status GetUsage(::grpc::ServerContext*,
                          const ledger::v1::GetUsageRequest*,
                          ledger::v1::GetUsageResponse*) override;

  ::grpc::Status DescribeQuota(::grpc::ServerContext*,
                               const ledger::v1::DescribeQuotaRequest*,
                               ledger::v1::DescribeQuotaResponse*) override;

  ::grpc::Status CreatePlan(::grpc::ServerContext*,
                            const ledger::v1::CreatePlanRequest*,
                            ledger::v1::CreatePlanResponse*) override;

  ::grpc::Status ActivatePlan(::grpc::ServerContext*,
                              const ledger::v1::CreatePlanRequest*,
                              ledger::v1::ActivatePlanResponse*) override;

  ::grpc::Status TerminatePlan(::grpc::ServerContext*,
                               const ledger::v1::TerminatePlanRequest*,
                               ledger::v1::TerminatePlanResponse*) override;

  ::grpc::Status Materialize(::grpc::ServerContext*,
                             const ledger::v1::MaterializeRequest*,
                             ledger::v1::MaterializeResponse*) override;

  ::grpc::Status AdvanceChore(::grpc::ServerContext*,
                              const ledger::v1::AdvanceChoreRequest*,
                              ledger::v1::AdvanceChoreResponse*) override;

  ::grpc::Status SettleShare(::grpc::ServerContext*,
                             const ledger::v1::SettleShareRequest*,
                             ledger::v1::SettleShareResponse*) override;

  ::grpc::Status RunDueCycles(::grpc::ServerContext*,
                              const ledger::v1::RunDueCyclesRequest*,
                              ledger::v1::RunDueCyclesResponse*) override;

  ::grpc::Status RemoveParticipant(::grpc::ServerContext*,
                                   const ledger::v1::RemoveParticipantRequest*,
                                   ledger::v1::RemoveParticipantResponse*) override;

private:
  std::shared_ptr<ledger::service::LedgerService> service_;
};

}
