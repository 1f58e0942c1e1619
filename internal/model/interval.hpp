#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

#include "internal/util/date.hpp"

namespace ledger::model {

enum class IntervalUnit : std::uint8_t {
  kDay = 0,
  kWeek = 1,
  kMonth = 2,
  kYear = 3,
};

std::string_view            UnitName(IntervalUnit unit);
std::optional<IntervalUnit> ParseUnit(std::string_view name);

/*
  Recurrence step: `every` units.

  Stepping is anchored: the k-th occurrence after an anchor is computed
  as anchor + k * interval, never by chaining single steps, so a series
  anchored on the 31st returns to the 31st in long months.
*/
struct Interval {
  std::int32_t every = 1;
  IntervalUnit unit = IntervalUnit::kMonth;

  bool operator==(const Interval&) const = default;
};

// Throws InvalidArgument(INVALID_INTERVAL) when every < 1.
void ValidateInterval(const Interval& interval);

util::Date Advance(const util::Date& anchor, const Interval& interval, std::int64_t steps = 1);

// Smallest k >= 0 with Advance(anchor, interval, k) >= target.
std::int64_t StepsUntil(const util::Date& anchor, const Interval& interval, const util::Date& target);

} // namespace ledger::model
