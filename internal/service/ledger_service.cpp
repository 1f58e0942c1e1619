#include "ledger_service.hpp"

#include <optional>
#include <string>

#include "internal/core/ledger_engine.hpp"
#include "internal/util/date.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace ledger::service {

using namespace ledger::v1;

namespace {

void RequireField(const std::string& value, const char* field) {
  if (value.empty()) {
    throw util::InvalidArgument("INVALID_ARGUMENT", std::string(field) + " is required");
  }
}

model::Deltas ToDeltas(const google::protobuf::Map<std::string, int64_t>& deltas) {
  model::Deltas out;
  for (const auto& [name, delta] : deltas) {
    const auto metric = model::ParseMetric(name);
    if (!metric) {
      throw util::InvalidArgument("INVALID_QUOTA_DELTA", "unknown metric '" + name + "'");
    }
    out[*metric] = delta;
  }
  return out;
}

void ToUsage(const model::Counters& counters, Usage* usage) {
  for (const auto metric : model::kAllMetrics) {
    (*usage->mutable_counters())[std::string(model::MetricName(metric))] = counters.Get(metric);
  }
}

model::Interval FromProto(const Interval& interval) {
  model::Interval out;
  out.every = interval.every();
  switch (interval.unit()) {
    case INTERVAL_UNIT_DAY:
      out.unit = model::IntervalUnit::kDay;
      break;
    case INTERVAL_UNIT_WEEK:
      out.unit = model::IntervalUnit::kWeek;
      break;
    case INTERVAL_UNIT_MONTH:
      out.unit = model::IntervalUnit::kMonth;
      break;
    case INTERVAL_UNIT_YEAR:
      out.unit = model::IntervalUnit::kYear;
      break;
    default:
      throw util::InvalidArgument("INVALID_INTERVAL", "interval unit is required");
  }
  return out;
}

IntervalUnit ToProto(model::IntervalUnit unit) {
  switch (unit) {
    case model::IntervalUnit::kDay:
      return INTERVAL_UNIT_DAY;
    case model::IntervalUnit::kWeek:
      return INTERVAL_UNIT_WEEK;
    case model::IntervalUnit::kMonth:
      return INTERVAL_UNIT_MONTH;
    case model::IntervalUnit::kYear:
      return INTERVAL_UNIT_YEAR;
  }
  return INTERVAL_UNIT_UNSPECIFIED;
}

void SetTime(const std::optional<uint64_t>& ms, google::protobuf::Timestamp* ts) {
  if (ms) {
    *ts = util::MillisToProto(*ms);
  }
}

RecurringPlan ToProto(const db::model::PlanRecord& record) {
  RecurringPlan plan;
  plan.set_id(record.id);
  plan.set_tenant_id(record.tenant_id);
  plan.set_owner_id(record.owner_id);
  plan.mutable_interval()->set_every(record.interval.every);
  plan.mutable_interval()->set_unit(ToProto(record.interval.unit));
  plan.set_start_date(util::FormatDate(record.start_date));
  plan.set_next_due_date(util::FormatDate(record.next_due_date));
  plan.set_status(record.status == model::PlanStatus::kActive ? PLAN_STATUS_ACTIVE : PLAN_STATUS_TERMINATED);
  SetTime(record.terminated_at_ms, plan.mutable_terminated_at());
  *plan.mutable_created_at() = util::MillisToProto(record.created_at_ms);
  *plan.mutable_updated_at() = util::MillisToProto(record.updated_at_ms);
  return plan;
}

ObligationInstance ToProto(const db::model::InstanceRecord& record) {
  ObligationInstance instance;
  instance.set_id(record.id);
  instance.set_plan_id(record.plan_id);
  instance.set_tenant_id(record.tenant_id);
  instance.set_due_date(util::FormatDate(record.due_date));
  instance.set_total_amount_cents(record.total_amount_cents);
  instance.set_status(record.status == model::InstanceStatus::kActive ? INSTANCE_STATUS_ACTIVE : INSTANCE_STATUS_SETTLED);
  *instance.mutable_created_at() = util::MillisToProto(record.created_at_ms);
  SetTime(record.settled_at_ms, instance.mutable_settled_at());
  return instance;
}

ParticipantShare ToProto(const db::model::InstanceShareRecord& record) {
  ParticipantShare share;
  share.set_instance_id(record.instance_id);
  share.set_participant_id(record.participant_id);
  share.set_amount_cents(record.amount_cents);
  share.set_status(record.status == model::ShareStatus::kPaid ? SHARE_STATUS_PAID : SHARE_STATUS_UNPAID);
  SetTime(record.paid_at_ms, share.mutable_paid_at());
  return share;
}

core::PlanSpec ToPlanSpec(const CreatePlanRequest& req) {
  RequireField(req.tenant_id(), "tenant_id");
  RequireField(req.owner_id(), "owner_id");
  RequireField(req.start_date(), "start_date");

  core::PlanSpec spec;
  spec.tenant_id  = req.tenant_id();
  spec.owner_id   = req.owner_id();
  spec.interval   = FromProto(req.interval());
  spec.start_date = util::ParseDate(req.start_date());
  for (const auto& share : req.shares()) {
    spec.shares.push_back({share.participant_id(), share.amount_cents()});
  }
  return spec;
}

std::optional<util::Date> OptionalDate(const std::string& text) {
  if (text.empty()) return std::nullopt;
  return util::ParseDate(text);
}

AdvanceStatus ToProto(core::AdvanceStatus status) {
  switch (status) {
    case core::AdvanceStatus::kRecurringCompleted:
      return ADVANCE_STATUS_RECURRING_COMPLETED;
    case core::AdvanceStatus::kAlreadyCompletedForCycle:
      return ADVANCE_STATUS_ALREADY_COMPLETED_FOR_CYCLE;
    case core::AdvanceStatus::kNonRecurringCompleted:
      return ADVANCE_STATUS_NON_RECURRING_COMPLETED;
  }
  return ADVANCE_STATUS_UNSPECIFIED;
}

} // namespace

LedgerService::LedgerService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

void LedgerService::AssertQuota(const AssertQuotaRequest& req) {
  RequireField(req.tenant_id(), "tenant_id");
  ctx_.engine->AssertQuota(req.tenant_id(), ToDeltas(req.deltas()));
}

ApplyDeltaResponse LedgerService::ApplyDelta(const ApplyDeltaRequest& req) {
  RequireField(req.tenant_id(), "tenant_id");

  ApplyDeltaResponse resp;
  ToUsage(ctx_.engine->ApplyDelta(req.tenant_id(), ToDeltas(req.deltas())), resp.mutable_usage());
  return resp;
}

GetUsageResponse LedgerService::GetUsage(const GetUsageRequest& req) {
  RequireField(req.tenant_id(), "tenant_id");

  GetUsageResponse resp;
  ToUsage(ctx_.engine->GetUsage(req.tenant_id()), resp.mutable_usage());
  return resp;
}

DescribeQuotaResponse LedgerService::DescribeQuota(const DescribeQuotaRequest& req) {
  RequireField(req.tenant_id(), "tenant_id");

  const auto status = ctx_.engine->DescribeQuota(req.tenant_id());

  DescribeQuotaResponse resp;
  resp.set_tier(status.tier);
  resp.set_unrestricted(status.unrestricted);
  for (const auto& usage : status.usage) {
    auto* metric = resp.add_metrics();
    metric->set_metric(std::string(model::MetricName(usage.metric)));
    metric->set_current(usage.current);
    metric->set_limited(usage.limit.has_value());
    metric->set_max_value(usage.limit.value_or(0));
  }
  return resp;
}

CreatePlanResponse LedgerService::CreatePlan(const CreatePlanRequest& req) {
  CreatePlanResponse resp;
  *resp.mutable_plan() = ToProto(ctx_.engine->CreatePlan(ToPlanSpec(req)));
  return resp;
}

ActivatePlanResponse LedgerService::ActivatePlan(const CreatePlanRequest& req) {
  const auto result = ctx_.engine->ActivatePlan(ToPlanSpec(req));

  ActivatePlanResponse resp;
  *resp.mutable_plan()        = ToProto(result.plan);
  *resp.mutable_first_cycle() = ToProto(result.first_cycle.instance);
  resp.set_created(result.first_cycle.created);
  return resp;
}

TerminatePlanResponse LedgerService::TerminatePlan(const TerminatePlanRequest& req) {
  RequireField(req.plan_id(), "plan_id");
  RequireField(req.actor_id(), "actor_id");

  const auto result = ctx_.engine->TerminatePlan(req.plan_id(), req.actor_id());

  TerminatePlanResponse resp;
  *resp.mutable_plan() = ToProto(result.plan);
  resp.set_changed(result.changed);
  return resp;
}

MaterializeResponse LedgerService::Materialize(const MaterializeRequest& req) {
  RequireField(req.plan_id(), "plan_id");
  RequireField(req.due_date(), "due_date");

  const auto result = ctx_.engine->Materialize(req.plan_id(), util::ParseDate(req.due_date()));

  MaterializeResponse resp;
  *resp.mutable_instance() = ToProto(result.instance);
  resp.set_created(result.created);
  return resp;
}

AdvanceChoreResponse LedgerService::AdvanceChore(const AdvanceChoreRequest& req) {
  RequireField(req.chore_id(), "chore_id");

  const auto result = ctx_.engine->AdvanceChore(req.chore_id(), OptionalDate(req.today()));

  AdvanceChoreResponse resp;
  resp.set_status(ToProto(result.status));
  if (result.cursor) {
    resp.set_cursor(util::FormatDate(*result.cursor));
  }
  resp.set_steps(result.steps);
  return resp;
}

SettleShareResponse LedgerService::SettleShare(const SettleShareRequest& req) {
  RequireField(req.instance_id(), "instance_id");
  RequireField(req.participant_id(), "participant_id");

  const auto result = ctx_.engine->SettleShare(req.instance_id(), req.participant_id());

  SettleShareResponse resp;
  *resp.mutable_instance() = ToProto(result.instance);
  *resp.mutable_share()    = ToProto(result.share);
  resp.set_changed(result.changed);
  resp.set_instance_settled(result.instance_settled);
  return resp;
}

RunDueCyclesResponse LedgerService::RunDueCycles(const RunDueCyclesRequest& req) {
  const auto report = ctx_.engine->RunDueCycles(OptionalDate(req.today()));

  RunDueCyclesResponse resp;
  auto* out = resp.mutable_report();
  out->set_plans_examined(report.plans_examined);
  out->set_plans_processed(report.plans_processed);
  out->set_plans_skipped(report.plans_skipped);
  out->set_plans_failed(report.plans_failed);
  out->set_cycles_materialized(report.cycles_materialized);
  out->set_global_cap_reached(report.global_cap_reached);
  return resp;
}

RemoveParticipantResponse LedgerService::RemoveParticipant(const RemoveParticipantRequest& req) {
  RequireField(req.tenant_id(), "tenant_id");
  RequireField(req.participant_id(), "participant_id");

  const auto result = ctx_.engine->RemoveParticipant(req.tenant_id(), req.participant_id());

  RemoveParticipantResponse resp;
  for (const auto& id : result.terminated_plan_ids) {
    resp.add_terminated_plan_ids(id);
  }
  resp.set_membership_released(result.membership_released);
  return resp;
}

} // namespace ledger::service
