#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>

#include "google/protobuf/timestamp.pb.h"
#include "internal/util/date.hpp"

namespace ledger::util {

/*
  Time utilities.

  Every component reads "now" and "today" through a Clock so tests and the
  one-shot cron runner can pin the calendar. "Today" is the UTC date.
*/

using SystemTimePoint = std::chrono::system_clock::time_point;

class Clock {
 public:
  virtual ~Clock() = default;

  virtual SystemTimePoint Now() const = 0;

  Date Today() const;
};

class SystemClock final : public Clock {
 public:
  SystemTimePoint Now() const override;
};

// Settable clock; safe to move from another thread while the engine runs.
class FixedClock final : public Clock {
 public:
  explicit FixedClock(SystemTimePoint now);
  explicit FixedClock(const Date& today);

  SystemTimePoint Now() const override;

  void Set(SystemTimePoint now);
  void SetToday(const Date& today);

 private:
  std::atomic<std::int64_t> now_ms_;
};

google::protobuf::Timestamp ToProto(SystemTimePoint tp);
google::protobuf::Timestamp MillisToProto(std::uint64_t unix_ms);

std::uint64_t ToUnixMillis(SystemTimePoint tp);

Date            ToDate(SystemTimePoint tp);
SystemTimePoint StartOfDay(const Date& date);

} // namespace ledger::util
