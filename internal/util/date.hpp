#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace ledger::util {

/*
  Calendar dates.

  Due dates, cursors and start dates are civil dates without a time of day.
  Month arithmetic clamps to the last valid day of the target month
  (2024-01-31 + 1 month = 2024-02-29).
*/

using Date = std::chrono::year_month_day;

// Strict YYYY-MM-DD; throws InvalidArgument(INVALID_DATE).
Date        ParseDate(std::string_view text);
std::string FormatDate(const Date& date);

Date AddDays(const Date& date, std::int64_t days);
Date AddMonths(const Date& date, std::int64_t months);

} // namespace ledger::util
