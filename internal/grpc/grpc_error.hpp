#pragma once

#include <grpcpp/grpcpp.h>
#include "internal/util/errors.hpp"

namespace ledger::grpc {

/*
  Converts internal exceptions into gRPC status codes.

  The message keeps the error code prefix ("PLAN_NOT_ACTIVE: ...").
*/

::grpc::Status ToStatus(const std::exception& e);

} // namespace ledger::grpc
