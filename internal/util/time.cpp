#include "time.hpp"

namespace ledger::util {

Date Clock::Today() const {
  return ToDate(Now());
}

SystemTimePoint SystemClock::Now() const {
  return std::chrono::system_clock::now();
}

FixedClock::FixedClock(SystemTimePoint now) : now_ms_(static_cast<std::int64_t>(ToUnixMillis(now))) {
}

FixedClock::FixedClock(const Date& today) : FixedClock(StartOfDay(today)) {
}

SystemTimePoint FixedClock::Now() const {
  return SystemTimePoint{} + std::chrono::milliseconds(now_ms_.load());
}

void FixedClock::Set(SystemTimePoint now) {
  now_ms_.store(static_cast<std::int64_t>(ToUnixMillis(now)));
}

void FixedClock::SetToday(const Date& today) {
  Set(StartOfDay(today));
}

google::protobuf::Timestamp ToProto(SystemTimePoint tp) {
  auto sec   = std::chrono::time_point_cast<std::chrono::seconds>(tp);
  auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(tp - sec);

  google::protobuf::Timestamp ts;
  ts.set_seconds(sec.time_since_epoch().count());
  ts.set_nanos(static_cast<int32_t>(nanos.count()));
  return ts;
}

google::protobuf::Timestamp MillisToProto(std::uint64_t unix_ms) {
  return ToProto(SystemTimePoint{} + std::chrono::milliseconds(unix_ms));
}

std::uint64_t ToUnixMillis(SystemTimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

Date ToDate(SystemTimePoint tp) {
  return Date{std::chrono::floor<std::chrono::days>(tp)};
}

SystemTimePoint StartOfDay(const Date& date) {
  return std::chrono::sys_days{date};
}

} // namespace ledger::util
