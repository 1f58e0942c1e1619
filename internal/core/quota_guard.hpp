#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/core/plan_limit_registry.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/model/metric.hpp"
#include "internal/util/time.hpp"

namespace ledger::core {

struct MetricUsage {
  model::Metric               metric;
  std::int64_t                current = 0;
  std::optional<std::int64_t> limit;
};

struct QuotaStatus {
  std::string              tier;
  bool                     unrestricted = false;
  std::vector<MetricUsage> usage;
};

/*
  Pre-check for positive deltas. Never mutates.

  For each positive delta, projected = max(0, current + delta); the whole
  call fails with QuotaExceeded on the first metric whose projection is
  above the tier limit. Negative and zero deltas are not checked.
*/
class QuotaGuard {
 public:
  QuotaGuard(std::shared_ptr<db::Repository> repository, std::shared_ptr<const PlanLimitRegistry> registry,
             std::shared_ptr<util::Clock> clock);

  // Locks the tenant; TENANT_INACTIVE when the tenant is inactive.
  void AssertQuota(db::Transaction& tx, const std::string& tenant_id, const model::Deltas& deltas);

  // Tier of an unexpired entitlement, otherwise "free".
  std::string EffectiveTier(db::Transaction& tx, const std::string& tenant_id);

  QuotaStatus Describe(db::Transaction& tx, const std::string& tenant_id);

 private:
  std::shared_ptr<db::Repository>          repository_;
  std::shared_ptr<const PlanLimitRegistry> registry_;
  std::shared_ptr<util::Clock>             clock_;
};

} // namespace ledger::core
