#include "metric.hpp"

#include <limits>

namespace ledger::model {

std::string_view MetricName(Metric metric) {
  switch (metric) {
    case Metric::kActiveChores:
      return "active_chores";
    case Metric::kChorePhotos:
      return "chore_photos";
    case Metric::kActiveMembers:
      return "active_members";
    case Metric::kActiveExpenses:
      return "active_expenses";
    case Metric::kItemPhotos:
      return "item_photos";
  }
  return "unknown";
}

std::optional<Metric> ParseMetric(std::string_view name) {
  for (const auto metric : kAllMetrics) {
    if (MetricName(metric) == name) return metric;
  }
  return std::nullopt;
}

std::int64_t ProjectCounter(std::int64_t current, std::int64_t delta) {
  constexpr auto kMax = std::numeric_limits<std::int64_t>::max();
  constexpr auto kMin = std::numeric_limits<std::int64_t>::min();
  if (delta > 0 && current > kMax - delta) {
    return kMax;
  }
  if (delta < 0 && current < kMin - delta) {
    return 0;
  }
  const auto sum = current + delta;
  return sum < 0 ? 0 : sum;
}

} // namespace ledger::model
