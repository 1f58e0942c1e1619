#include "interval.hpp"

#include <chrono>
#include <string>

#include "internal/util/errors.hpp"

namespace ledger::model {

std::string_view UnitName(IntervalUnit unit) {
  switch (unit) {
    case IntervalUnit::kDay:
      return "day";
    case IntervalUnit::kWeek:
      return "week";
    case IntervalUnit::kMonth:
      return "month";
    case IntervalUnit::kYear:
      return "year";
  }
  return "unknown";
}

std::optional<IntervalUnit> ParseUnit(std::string_view name) {
  if (name == "day") return IntervalUnit::kDay;
  if (name == "week") return IntervalUnit::kWeek;
  if (name == "month") return IntervalUnit::kMonth;
  if (name == "year") return IntervalUnit::kYear;
  return std::nullopt;
}

void ValidateInterval(const Interval& interval) {
  if (interval.every < 1) {
    throw util::InvalidArgument("INVALID_INTERVAL", "every must be >= 1, got " + std::to_string(interval.every));
  }
}

util::Date Advance(const util::Date& anchor, const Interval& interval, std::int64_t steps) {
  const std::int64_t count = static_cast<std::int64_t>(interval.every) * steps;
  switch (interval.unit) {
    case IntervalUnit::kDay:
      return util::AddDays(anchor, count);
    case IntervalUnit::kWeek:
      return util::AddDays(anchor, count * 7);
    case IntervalUnit::kMonth:
      return util::AddMonths(anchor, count);
    case IntervalUnit::kYear:
      return util::AddMonths(anchor, count * 12);
  }
  throw util::InvalidArgument("INVALID_INTERVAL", "unknown interval unit");
}

std::int64_t StepsUntil(const util::Date& anchor, const Interval& interval, const util::Date& target) {
  ValidateInterval(interval);
  if (target <= anchor) {
    return 0;
  }

  std::int64_t estimate = 0;
  switch (interval.unit) {
    case IntervalUnit::kDay:
    case IntervalUnit::kWeek: {
      const std::int64_t days = (std::chrono::sys_days(target) - std::chrono::sys_days(anchor)).count();
      const std::int64_t per  = interval.unit == IntervalUnit::kDay ? interval.every : interval.every * 7;
      estimate                = days / per;
      break;
    }
    case IntervalUnit::kMonth:
    case IntervalUnit::kYear: {
      const std::int64_t months = (static_cast<int>(target.year()) - static_cast<int>(anchor.year())) * 12 +
                                  (static_cast<int>(static_cast<unsigned>(target.month())) -
                                   static_cast<int>(static_cast<unsigned>(anchor.month())));
      const std::int64_t per = interval.unit == IntervalUnit::kMonth ? interval.every : interval.every * 12;
      estimate               = months / per - 1;
      break;
    }
  }

  std::int64_t steps = estimate > 0 ? estimate : 0;
  while (Advance(anchor, interval, steps) < target) {
    ++steps;
  }
  return steps;
}

} // namespace ledger::model
