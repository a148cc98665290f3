#include "time.hpp"

#include <cstdio>
#include <ctime>
#include <stdexcept>

namespace nutrition::util {

namespace {

std::tm ToLocalTm(TimePoint tp) {
  const std::time_t t = Clock::to_time_t(tp);
  std::tm           local{};
  if (localtime_r(&t, &local) == nullptr) {
    throw std::runtime_error("localtime_r failed");
  }
  return local;
}

TimePoint FromLocalTm(std::tm local) {
  local.tm_isdst = -1;
  const std::time_t t = std::mktime(&local);
  if (t == static_cast<std::time_t>(-1)) {
    throw std::runtime_error("mktime failed");
  }
  return Clock::from_time_t(t);
}

} // namespace

TimePoint Now() {
  return Clock::now();
}

google::protobuf::Timestamp ToProto(TimePoint tp) {
  auto sec   = std::chrono::floor<std::chrono::seconds>(tp);
  auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(tp - sec);

  google::protobuf::Timestamp ts;
  ts.set_seconds(sec.time_since_epoch().count());
  ts.set_nanos(static_cast<int32_t>(nanos.count()));
  return ts;
}

TimePoint FromProto(const google::protobuf::Timestamp& ts) {
  return TimePoint{} + std::chrono::duration_cast<Clock::duration>(std::chrono::seconds(ts.seconds()) + std::chrono::nanoseconds(ts.nanos()));
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

int64_t ToUnixNanos(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::nanoseconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixNanos(int64_t nanos) {
  return TimePoint{} + std::chrono::duration_cast<Clock::duration>(std::chrono::nanoseconds(nanos));
}

TimePoint StartOfDay(TimePoint tp) {
  auto local    = ToLocalTm(tp);
  local.tm_hour = 0;
  local.tm_min  = 0;
  local.tm_sec  = 0;
  return FromLocalTm(local);
}

TimePoint StartOfNextDay(TimePoint tp) {
  auto local = ToLocalTm(tp);
  local.tm_mday += 1;
  local.tm_hour = 0;
  local.tm_min  = 0;
  local.tm_sec  = 0;
  return FromLocalTm(local);
}

bool IsSameDay(TimePoint a, TimePoint b) {
  return StartOfDay(a) == StartOfDay(b);
}

TimePoint MakeLocalTime(int year, int month, int day, int hour, int minute, int second) {
  std::tm local{};
  local.tm_year = year - 1900;
  local.tm_mon  = month - 1;
  local.tm_mday = day;
  local.tm_hour = hour;
  local.tm_min  = minute;
  local.tm_sec  = second;
  return FromLocalTm(local);
}

std::optional<TimePoint> ParseLocalDate(const std::string& text) {
  int year = 0, month = 0, day = 0;
  char trailing = '\0';
  if (std::sscanf(text.c_str(), "%4d-%2d-%2d%c", &year, &month, &day, &trailing) != 3) {
    return std::nullopt;
  }
  if (month < 1 || month > 12 || day < 1 || day > 31) {
    return std::nullopt;
  }
  return MakeLocalTime(year, month, day);
}

std::string FormatLocal(TimePoint tp, const char* format) {
  const auto local = ToLocalTm(tp);
  char       buffer[128];
  const auto written = std::strftime(buffer, sizeof(buffer), format, &local);
  return std::string(buffer, written);
}

} // namespace nutrition::util
