#include <cassert>
#include <iostream>

#include "internal/model/interval.hpp"
#include "internal/util/date.hpp"
#include "internal/util/errors.hpp"
#include "test_support.hpp"

namespace {

using ledger::model::Advance;
using ledger::model::Interval;
using ledger::model::IntervalUnit;
using ledger::model::StepsUntil;
using ledger::testing::D;
using ledger::util::FormatDate;

void TestParseAndFormat() {
  assert(FormatDate(D("2024-02-29")) == "2024-02-29");

  for (const char* bad : {"2023-02-29", "2024-13-01", "2024-1-01", "20240101", "2024-01-0x", ""}) {
    const auto code = ledger::testing::ExpectThrows<ledger::util::InvalidArgument>([&] { ledger::util::ParseDate(bad); });
    assert(code == "INVALID_DATE");
  }
}

void TestMonthArithmeticClampsToMonthEnd() {
  assert(FormatDate(ledger::util::AddMonths(D("2024-01-31"), 1)) == "2024-02-29");
  assert(FormatDate(ledger::util::AddMonths(D("2023-01-31"), 1)) == "2023-02-28");
  assert(FormatDate(ledger::util::AddMonths(D("2024-02-29"), 12)) == "2025-02-28");
  assert(FormatDate(ledger::util::AddMonths(D("2024-03-31"), -1)) == "2024-02-29");
}

void TestAnchoredSteppingDoesNotDrift() {
  const Interval monthly{1, IntervalUnit::kMonth};
  assert(FormatDate(Advance(D("2024-01-31"), monthly, 1)) == "2024-02-29");
  assert(FormatDate(Advance(D("2024-01-31"), monthly, 2)) == "2024-03-31");

  // chaining single steps would land on the 29th
  assert(FormatDate(Advance(Advance(D("2024-01-31"), monthly), monthly)) == "2024-03-29");

  const Interval fortnight{2, IntervalUnit::kWeek};
  assert(FormatDate(Advance(D("2024-01-01"), fortnight, 2)) == "2024-01-29");

  const Interval yearly{1, IntervalUnit::kYear};
  assert(FormatDate(Advance(D("2024-02-29"), yearly, 4)) == "2028-02-29");
}

void TestStepsUntil() {
  const Interval monthly{1, IntervalUnit::kMonth};
  assert(StepsUntil(D("2024-01-31"), monthly, D("2024-01-31")) == 0);
  assert(StepsUntil(D("2024-01-31"), monthly, D("2024-02-29")) == 1);
  assert(StepsUntil(D("2024-01-31"), monthly, D("2024-03-01")) == 2);
  assert(StepsUntil(D("2024-01-31"), monthly, D("2026-01-31")) == 24);

  const Interval fortnight{2, IntervalUnit::kWeek};
  assert(StepsUntil(D("2024-01-01"), fortnight, D("2024-01-15")) == 1);
  assert(StepsUntil(D("2024-01-01"), fortnight, D("2024-01-16")) == 2);

  const Interval daily{3, IntervalUnit::kDay};
  assert(StepsUntil(D("2024-01-01"), daily, D("2024-12-31")) == 122);
}

void TestIntervalValidation() {
  const auto code = ledger::testing::ExpectThrows<ledger::util::InvalidArgument>(
      [] { ledger::model::ValidateInterval(Interval{0, IntervalUnit::kDay}); });
  assert(code == "INVALID_INTERVAL");
}

} // namespace

int main() {
  TestParseAndFormat();
  TestMonthArithmeticClampsToMonthEnd();
  TestAnchoredSteppingDoesNotDrift();
  TestStepsUntil();
  TestIntervalValidation();

  std::cout << "ledger_unit_date: pass\n";
  return 0;
}
