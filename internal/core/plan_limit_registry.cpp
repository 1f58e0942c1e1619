#include "plan_limit_registry.hpp"

#include <stdexcept>

#include "config/config.pb.h"

namespace ledger::core {

namespace {

void AddDefaultLimits(PlanLimitRegistry& registry) {
  registry.SetLimit(kFreeTier, model::Metric::kActiveChores, 20);
  registry.SetLimit(kFreeTier, model::Metric::kChorePhotos, 15);
  registry.SetLimit(kFreeTier, model::Metric::kActiveMembers, 4);
  registry.SetLimit(kFreeTier, model::Metric::kActiveExpenses, 10);
  registry.SetLimit(kFreeTier, model::Metric::kItemPhotos, 10);
}

} // namespace

PlanLimitRegistry PlanLimitRegistry::Defaults() {
  PlanLimitRegistry registry;
  AddDefaultLimits(registry);
  registry.AddUnrestrictedTier(kPremiumTier);
  return registry;
}

PlanLimitRegistry PlanLimitRegistry::FromConfig(const runtime::config::QuotaConfig& config) {
  PlanLimitRegistry registry;

  if (config.limits().empty()) {
    AddDefaultLimits(registry);
  }
  for (const auto& limit : config.limits()) {
    const auto metric = model::ParseMetric(limit.metric());
    if (!metric) {
      throw std::invalid_argument("unknown quota metric '" + limit.metric() + "'");
    }
    if (limit.tier().empty()) {
      throw std::invalid_argument("quota limit for '" + limit.metric() + "' has no tier");
    }
    if (limit.max_value() < 0) {
      throw std::invalid_argument("negative quota limit for " + limit.tier() + "/" + limit.metric());
    }
    registry.SetLimit(limit.tier(), *metric, limit.max_value());
  }

  if (config.unrestricted_tiers().empty()) {
    registry.AddUnrestrictedTier(kPremiumTier);
  }
  for (const auto& tier : config.unrestricted_tiers()) {
    registry.AddUnrestrictedTier(tier);
  }

  return registry;
}

void PlanLimitRegistry::SetLimit(const std::string& tier, model::Metric metric, std::int64_t max_value) {
  limits_[{tier, metric}] = max_value;
}

void PlanLimitRegistry::AddUnrestrictedTier(const std::string& tier) {
  unrestricted_.insert(tier);
}

std::optional<std::int64_t> PlanLimitRegistry::Limit(const std::string& tier, model::Metric metric) const {
  auto it = limits_.find({tier, metric});
  if (it == limits_.end()) return std::nullopt;
  return it->second;
}

bool PlanLimitRegistry::IsUnrestricted(const std::string& tier) const {
  return unrestricted_.count(tier) > 0;
}

} // namespace ledger::core
