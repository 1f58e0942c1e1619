#include "ledger_server.hpp"
#include "grpc_error.hpp"
#include "ledger/v1.hpp"

namespace ledger::grpc {

LedgerServer::LedgerServer(std::shared_ptr<ledger::service::LedgerService> svc)
    : service_(std::move(svc)) {}

::grpc::Status LedgerServer::AssertQuota(::grpc::ServerContext*,
                                         const ledger::v1::AssertQuotaRequest* req,
                                         ledger::v1::AssertQuotaResponse*) {
  try {
    service_->AssertQuota(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status LedgerServer::ApplyDelta(::grpc::ServerContext*,
                                        const ledger::v1::ApplyDeltaRequest* req,
                                        ledger::v1::ApplyDeltaResponse* resp) {
  try {
    *resp = service_->ApplyDelta(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status LedgerServer::GetUsage(::grpc::ServerContext*,
                                      const ledger::v1::GetUsageRequest* req,
                                      ledger::v1::GetUsageResponse* resp) {
  try {
    *resp = service_->GetUsage(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status LedgerServer::DescribeQuota(::grpc::ServerContext*,
                                           const ledger::v1::DescribeQuotaRequest* req,
                                           ledger::v1::DescribeQuotaResponse* resp) {
  try {
    *resp = service_->DescribeQuota(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status LedgerServer::CreatePlan(::grpc::ServerContext*,
                                        const ledger::v1::CreatePlanRequest* req,
                                        ledger::v1::CreatePlanResponse* resp) {
  try {
    *resp = service_->CreatePlan(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status LedgerServer::ActivatePlan(::grpc::ServerContext*,
                                          const ledger::v1::CreatePlanRequest* req,
                                          ledger::v1::ActivatePlanResponse* resp) {
  try {
    *resp = service_->ActivatePlan(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status LedgerServer::TerminatePlan(::grpc::ServerContext*,
                                           const ledger::v1::TerminatePlanRequest* req,
                                           ledger::v1::TerminatePlanResponse* resp) {
  try {
    *resp = service_->TerminatePlan(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status LedgerServer::Materialize(::grpc::ServerContext*,
                                         const ledger::v1::MaterializeRequest* req,
                                         ledger::v1::MaterializeResponse* resp) {
  try {
    *resp = service_->Materialize(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status LedgerServer::AdvanceChore(::grpc::ServerContext*,
                                          const ledger::v1::AdvanceChoreRequest* req,
                                          ledger::v1::AdvanceChoreResponse* resp) {
  try {
    *resp = service_->AdvanceChore(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status LedgerServer::SettleShare(::grpc::ServerContext*,
                                         const ledger::v1::SettleShareRequest* req,
                                         ledger::v1::SettleShareResponse* resp) {
  try {
    *resp = service_->SettleShare(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status LedgerServer::RunDueCycles(::grpc::ServerContext*,
                                          const ledger::v1::RunDueCyclesRequest* req,
                                          ledger::v1::RunDueCyclesResponse* resp) {
  try {
    *resp = service_->RunDueCycles(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status LedgerServer::RemoveParticipant(::grpc::ServerContext*,
                                               const ledger::v1::RemoveParticipantRequest* req,
                                               ledger::v1::RemoveParticipantResponse* resp) {
  try {
    *resp = service_->RemoveParticipant(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

}
