#include <google/protobuf/util/json_util.h>
#include <grpcpp/grpcpp.h>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

#include "ledger/v1/ledger_service.grpc.pb.h"
#include "ledger/v1.hpp"

using namespace ledger::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  ledgerctl <addr> usage <tenant>\n"
            << "  ledgerctl <addr> describe <tenant>\n"
            << "  ledgerctl <addr> assert <tenant> <metric=delta>...\n"
            << "  ledgerctl <addr> apply <tenant> <metric=delta>...\n"
            << "  ledgerctl <addr> activate <tenant> <owner> <every> <day|week|month|year> <start YYYY-MM-DD> <participant=cents>...\n"
            << "  ledgerctl <addr> terminate <plan> <actor>\n"
            << "  ledgerctl <addr> materialize <plan> <due YYYY-MM-DD>\n"
            << "  ledgerctl <addr> advance <chore> [today]\n"
            << "  ledgerctl <addr> settle <instance> <participant>\n"
            << "  ledgerctl <addr> run [today]\n"
            << "  ledgerctl <addr> remove <tenant> <participant>\n";
}

// "key=value" with a signed integer value.
static bool SplitPair(const std::string& arg, std::string* key, int64_t* value) {
  const auto eq = arg.find('=');
  if (eq == std::string::npos || eq == 0) {
    return false;
  }
  char* end = nullptr;
  *value    = std::strtoll(arg.c_str() + eq + 1, &end, 10);
  if (end == arg.c_str() + eq + 1 || *end != '\0') {
    return false;
  }
  *key = arg.substr(0, eq);
  return true;
}

static bool ParseUnit(const std::string& value, IntervalUnit* unit) {
  if (value == "day") *unit = INTERVAL_UNIT_DAY;
  else if (value == "week") *unit = INTERVAL_UNIT_WEEK;
  else if (value == "month") *unit = INTERVAL_UNIT_MONTH;
  else if (value == "year") *unit = INTERVAL_UNIT_YEAR;
  else return false;
  return true;
}

static int Print(const grpc::Status& status, const google::protobuf::Message& resp) {
  if (!status.ok()) {
    std::cerr << status.error_message() << "\n";
    return 2;
  }

  std::string                                json;
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = true;
  auto printed           = google::protobuf::util::MessageToJsonString(resp, &json, options);
  if (!printed.ok()) {
    std::cerr << "failed to print response: " << printed.message() << "\n";
    return 2;
  }
  std::cout << json;
  return 0;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
  auto stub    = LedgerService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "usage" || cmd == "describe") {
    if (argc < 4) return 1;

    if (cmd == "usage") {
      GetUsageRequest req;
      req.set_tenant_id(argv[3]);
      GetUsageResponse resp;
      return Print(stub->GetUsage(&ctx, req, &resp), resp);
    }

    DescribeQuotaRequest req;
    req.set_tenant_id(argv[3]);
    DescribeQuotaResponse resp;
    return Print(stub->DescribeQuota(&ctx, req, &resp), resp);
  }

  // ------------------------------------------------------------

  if (cmd == "assert" || cmd == "apply") {
    if (argc < 5) return 1;

    google::protobuf::Map<std::string, int64_t> deltas;
    for (int i = 4; i < argc; ++i) {
      std::string metric;
      int64_t     delta = 0;
      if (!SplitPair(argv[i], &metric, &delta)) {
        std::cerr << "expected metric=delta, got '" << argv[i] << "'\n";
        return 1;
      }
      deltas[metric] = delta;
    }

    if (cmd == "assert") {
      AssertQuotaRequest req;
      req.set_tenant_id(argv[3]);
      *req.mutable_deltas() = deltas;
      AssertQuotaResponse resp;
      return Print(stub->AssertQuota(&ctx, req, &resp), resp);
    }

    ApplyDeltaRequest req;
    req.set_tenant_id(argv[3]);
    *req.mutable_deltas() = deltas;
    ApplyDeltaResponse resp;
    return Print(stub->ApplyDelta(&ctx, req, &resp), resp);
  }

  // ------------------------------------------------------------

  if (cmd == "activate") {
    if (argc < 9) return 1;

    CreatePlanRequest req;
    req.set_tenant_id(argv[3]);
    req.set_owner_id(argv[4]);
    req.mutable_interval()->set_every(std::atoi(argv[5]));

    IntervalUnit unit;
    if (!ParseUnit(argv[6], &unit)) {
      std::cerr << "unsupported unit: " << argv[6] << "\n";
      return 1;
    }
    req.mutable_interval()->set_unit(unit);
    req.set_start_date(argv[7]);

    for (int i = 8; i < argc; ++i) {
      std::string participant;
      int64_t     cents = 0;
      if (!SplitPair(argv[i], &participant, &cents)) {
        std::cerr << "expected participant=cents, got '" << argv[i] << "'\n";
        return 1;
      }
      auto* share = req.add_shares();
      share->set_participant_id(participant);
      share->set_amount_cents(cents);
    }

    ActivatePlanResponse resp;
    return Print(stub->ActivatePlan(&ctx, req, &resp), resp);
  }

  // ------------------------------------------------------------

  if (cmd == "terminate") {
    if (argc < 5) return 1;

    TerminatePlanRequest req;
    req.set_plan_id(argv[3]);
    req.set_actor_id(argv[4]);
    TerminatePlanResponse resp;
    return Print(stub->TerminatePlan(&ctx, req, &resp), resp);
  }

  // ------------------------------------------------------------

  if (cmd == "materialize") {
    if (argc < 5) return 1;

    MaterializeRequest req;
    req.set_plan_id(argv[3]);
    req.set_due_date(argv[4]);
    MaterializeResponse resp;
    return Print(stub->Materialize(&ctx, req, &resp), resp);
  }

  // ------------------------------------------------------------

  if (cmd == "advance") {
    if (argc < 4) return 1;

    AdvanceChoreRequest req;
    req.set_chore_id(argv[3]);
    if (argc >= 5) req.set_today(argv[4]);
    AdvanceChoreResponse resp;
    return Print(stub->AdvanceChore(&ctx, req, &resp), resp);
  }

  // ------------------------------------------------------------

  if (cmd == "settle") {
    if (argc < 5) return 1;

    SettleShareRequest req;
    req.set_instance_id(argv[3]);
    req.set_participant_id(argv[4]);
    SettleShareResponse resp;
    return Print(stub->SettleShare(&ctx, req, &resp), resp);
  }

  // ------------------------------------------------------------

  if (cmd == "run") {
    RunDueCyclesRequest req;
    if (argc >= 4) req.set_today(argv[3]);
    RunDueCyclesResponse resp;
    return Print(stub->RunDueCycles(&ctx, req, &resp), resp);
  }

  // ------------------------------------------------------------

  if (cmd == "remove") {
    if (argc < 5) return 1;

    RemoveParticipantRequest req;
    req.set_tenant_id(argv[3]);
    req.set_participant_id(argv[4]);
    RemoveParticipantResponse resp;
    return Print(stub->RemoveParticipant(&ctx, req, &resp), resp);
  }

  Usage();
  return 1;
}
