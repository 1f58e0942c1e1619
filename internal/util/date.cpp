#include "date.hpp"

#include <algorithm>
#include <charconv>
#include <cstdio>

#include "internal/util/errors.hpp"

namespace ledger::util {

namespace {

bool ParseField(std::string_view text, int& out) {
  if (text.empty()) return false;
  for (char c : text) {
    if (c < '0' || c > '9') return false;
  }
  const auto result = std::from_chars(text.data(), text.data() + text.size(), out);
  return result.ec == std::errc{} && result.ptr == text.data() + text.size();
}

} // namespace

Date ParseDate(std::string_view text) {
  // YYYY-MM-DD
  if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
    throw InvalidArgument("INVALID_DATE", "expected YYYY-MM-DD, got '" + std::string(text) + "'");
  }

  int year = 0;
  int month = 0;
  int day = 0;
  if (!ParseField(text.substr(0, 4), year) || !ParseField(text.substr(5, 2), month) || !ParseField(text.substr(8, 2), day)) {
    throw InvalidArgument("INVALID_DATE", "non-numeric date '" + std::string(text) + "'");
  }

  const Date date{std::chrono::year{year}, std::chrono::month{static_cast<unsigned>(month)}, std::chrono::day{static_cast<unsigned>(day)}};
  if (!date.ok()) {
    throw InvalidArgument("INVALID_DATE", "no such calendar day '" + std::string(text) + "'");
  }
  return date;
}

std::string FormatDate(const Date& date) {
  char buffer[16];
  std::snprintf(buffer, sizeof(buffer), "%04d-%02u-%02u", static_cast<int>(date.year()), static_cast<unsigned>(date.month()),
                static_cast<unsigned>(date.day()));
  return buffer;
}

Date AddDays(const Date& date, std::int64_t days) {
  return Date{std::chrono::sys_days{date} + std::chrono::days{days}};
}

Date AddMonths(const Date& date, std::int64_t months) {
  std::chrono::year_month target = date.year() / date.month();
  target += std::chrono::months{months};

  const auto last_day = (target / std::chrono::last).day();
  return target / std::min(date.day(), last_day);
}

} // namespace ledger::util
