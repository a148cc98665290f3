#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "google/protobuf/timestamp.pb.h"

namespace nutrition::util {

/*
  Time utilities. Single place to control the clock source.

  Calendar-day arithmetic is done in the process's local time zone, the
  same zone the user logs food in.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

uint64_t ToUnixMillis(TimePoint tp);

// Lossless integer form used by the sqlite backend.
int64_t   ToUnixNanos(TimePoint tp);
TimePoint FromUnixNanos(int64_t nanos);

// Local midnight of the calendar day containing tp.
TimePoint StartOfDay(TimePoint tp);

// Local midnight of the following calendar day (DST aware).
TimePoint StartOfNextDay(TimePoint tp);

bool IsSameDay(TimePoint a, TimePoint b);

// Local wall-clock time; fields are normalized like mktime does.
TimePoint MakeLocalTime(int year, int month, int day, int hour = 0, int minute = 0, int second = 0);

// Parses "YYYY-MM-DD" as local midnight.
std::optional<TimePoint> ParseLocalDate(const std::string& text);

// strftime over local time.
std::string FormatLocal(TimePoint tp, const char* format);

} // namespace nutrition::util
