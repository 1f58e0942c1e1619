#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string_view>

namespace ledger::model {

/*
  Plan-limited resources tracked per tenant.

  The wire/storage names ("active_chores", ...) are part of the persisted
  contract and appear in QUOTA_EXCEEDED_<metric> codes.
*/
enum class Metric : std::uint8_t {
  kActiveChores = 0,
  kChorePhotos = 1,
  kActiveMembers = 2,
  kActiveExpenses = 3,
  kItemPhotos = 4,
};

inline constexpr std::size_t kMetricCount = 5;

inline constexpr std::array<Metric, kMetricCount> kAllMetrics = {
    Metric::kActiveChores, Metric::kChorePhotos, Metric::kActiveMembers, Metric::kActiveExpenses, Metric::kItemPhotos,
};

std::string_view       MetricName(Metric metric);
std::optional<Metric>  ParseMetric(std::string_view name);

// current + delta, saturating at INT64_MAX and clamped at zero.
std::int64_t ProjectCounter(std::int64_t current, std::int64_t delta);

// Proposed signed changes, one entry per metric.
using Deltas = std::map<Metric, std::int64_t>;

// One value per metric; all zero for a tenant with no ledger row yet.
struct Counters {
  std::array<std::int64_t, kMetricCount> values{};

  std::int64_t Get(Metric metric) const {
    return values[static_cast<std::size_t>(metric)];
  }

  void Set(Metric metric, std::int64_t value) {
    values[static_cast<std::size_t>(metric)] = value;
  }

  bool operator==(const Counters&) const = default;
};

} // namespace ledger::model
