#include "quota_guard.hpp"

#include "internal/core/repository_util.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace ledger::core {

QuotaGuard::QuotaGuard(std::shared_ptr<db::Repository> repository, std::shared_ptr<const PlanLimitRegistry> registry,
                       std::shared_ptr<util::Clock> clock)
    : repository_(std::move(repository)), registry_(std::move(registry)), clock_(std::move(clock)) {
}

void QuotaGuard::AssertQuota(db::Transaction& tx, const std::string& tenant_id, const model::Deltas& deltas) {
  LockActiveTenant(*repository_, tx, tenant_id);

  const auto tier = EffectiveTier(tx, tenant_id);
  if (registry_->IsUnrestricted(tier)) {
    return;
  }

  const auto row      = repository_->GetLedger(tx, tenant_id);
  const auto counters = row ? row->counters : model::Counters{};

  for (const auto& [metric, delta] : deltas) {
    if (delta <= 0) {
      continue;
    }
    const auto limit = registry_->Limit(tier, metric);
    if (!limit) {
      continue;
    }

    const auto current   = counters.Get(metric);
    const auto projected = model::ProjectCounter(current, delta);
    if (projected > *limit) {
      LEDGER_LOG_INFO("quota exceeded", {observability::StringField("tenant", tenant_id),
                                         observability::StringField("metric", model::MetricName(metric)),
                                         observability::StringField("tier", tier), observability::IntField("current", current),
                                         observability::IntField("limit", *limit), observability::IntField("projected", projected)});
      throw util::QuotaExceeded(std::string(model::MetricName(metric)), tier, current, *limit, projected);
    }
  }
}

std::string QuotaGuard::EffectiveTier(db::Transaction& tx, const std::string& tenant_id) {
  const auto entitlement = repository_->GetEntitlement(tx, tenant_id);
  if (!entitlement || entitlement->tier.empty()) {
    return kFreeTier;
  }
  if (entitlement->expires_at_ms != 0 && entitlement->expires_at_ms <= util::ToUnixMillis(clock_->Now())) {
    return kFreeTier;
  }
  return entitlement->tier;
}

QuotaStatus QuotaGuard::Describe(db::Transaction& tx, const std::string& tenant_id) {
  if (!repository_->GetTenant(tx, tenant_id)) {
    throw util::NotFound("TENANT_NOT_FOUND", tenant_id);
  }

  QuotaStatus status;
  status.tier         = EffectiveTier(tx, tenant_id);
  status.unrestricted = registry_->IsUnrestricted(status.tier);

  const auto row      = repository_->GetLedger(tx, tenant_id);
  const auto counters = row ? row->counters : model::Counters{};
  for (const auto metric : model::kAllMetrics) {
    MetricUsage usage{metric, counters.Get(metric), std::nullopt};
    if (!status.unrestricted) {
      usage.limit = registry_->Limit(status.tier, metric);
    }
    status.usage.push_back(usage);
  }
  return status;
}

} // namespace ledger::core
