#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>

#include "internal/model/metric.hpp"

namespace ledger::runtime::config {
class QuotaConfig;
}

namespace ledger::core {

inline constexpr const char* kFreeTier    = "free";
inline constexpr const char* kPremiumTier = "premium";

/*
  (tier, metric) -> max value.

  Immutable once built. A metric without a registered limit is unlimited
  for that tier; an unrestricted tier bypasses the guard entirely.
*/
class PlanLimitRegistry {
 public:
  // free: active_chores 20, chore_photos 15, active_members 4,
  // active_expenses 10, item_photos 10; premium unrestricted.
  static PlanLimitRegistry Defaults();

  // Falls back to Defaults() for whichever list the config leaves empty.
  // Throws std::invalid_argument on unknown metrics or negative limits.
  static PlanLimitRegistry FromConfig(const runtime::config::QuotaConfig& config);

  void SetLimit(const std::string& tier, model::Metric metric, std::int64_t max_value);
  void AddUnrestrictedTier(const std::string& tier);

  std::optional<std::int64_t> Limit(const std::string& tier, model::Metric metric) const;
  bool                        IsUnrestricted(const std::string& tier) const;

 private:
  std::map<std::pair<std::string, model::Metric>, std::int64_t> limits_;
  std::set<std::string>                                         unrestricted_;
};

} // namespace ledger::core
