// Copyright 2025 Memgraph Ltd.
//
// Use of this software is governed by the Business Source License
// included in the file licenses/BSL.txt; by using this file, you agree to be bound by the terms of the Business Source
// License, and you may not use this file except in compliance with the Business Source License.
//
// As of the Change Date specified in that file, in accordance with
// the Business Source License, use of this software will be governed
// by the Apache License, Version 2.0, included in the file
// licenses/APL.txt.

#include "utils/temporal.hpp"

#include <array>
#include <chrono>
#include <ostream>

#include <fmt/format.h>

namespace graphbin::utils {
namespace {

constexpr bool IsInBounds(const auto low, const auto high, const auto value) { return low <= value && value <= high; }

constexpr bool IsLeapYear(const int64_t year) { return year % 4 == 0 && (year % 100 != 0 || year % 400 == 0); }

// std::chrono::year stops at +-32767, so the day check can't go through
// year_month_day for the whole int32 year range.
constexpr int64_t DaysInMonth(const int64_t year, const int64_t month) {
  constexpr std::array<int64_t, 12> kDaysInMonth{31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (month == 2 && IsLeapYear(year)) return 29;
  return kDaysInMonth[month - 1];
}

namespace chrono = std::chrono;

// Inclusive range of instants that chrono can split into a calendar date.
constexpr auto kMinPrintableTime =
    chrono::sys_time<chrono::milliseconds>{chrono::sys_days{chrono::year::min() / chrono::January / 1}};
constexpr auto kMaxPrintableTime =
    chrono::sys_time<chrono::milliseconds>{chrono::sys_days{chrono::year::max() / chrono::December / 31} +
                                           chrono::days{1}} -
    chrono::milliseconds{1};

}  // namespace

Date::Date(const DateParameters &date_parameters) {
  if (!IsInBounds(kMinYear, kMaxYear, date_parameters.year)) {
    throw temporal::InvalidArgumentException(
        "Creating a Date with invalid year parameter {}. The value should be an integer between {} and {}.",
        date_parameters.year, kMinYear, kMaxYear);
  }

  if (!IsInBounds(1, 12, date_parameters.month)) {
    throw temporal::InvalidArgumentException(
        "Creating a Date with invalid month parameter {}. The value should be an integer between 1 and 12.",
        date_parameters.month);
  }

  if (!IsInBounds(1, DaysInMonth(date_parameters.year, date_parameters.month), date_parameters.day)) {
    throw temporal::InvalidArgumentException(
        "Creating a Date with invalid day parameter {}. The value should be an integer between 1 and 31, depending on "
        "the month and year.",
        date_parameters.day);
  }

  year = static_cast<int32_t>(date_parameters.year);
  month = static_cast<uint8_t>(date_parameters.month);
  day = static_cast<uint8_t>(date_parameters.day);
}

std::string Date::ToString() const { return fmt::format("{:04d}-{:02d}-{:02d}", year, month, day); }

std::ostream &operator<<(std::ostream &os, const Date &date) { return os << date.ToString(); }

LocalTime::LocalTime(const LocalTimeParameters &local_time_parameters) {
  if (!IsInBounds(0, 23, local_time_parameters.hour)) {
    throw temporal::InvalidArgumentException("Creating a LocalTime with invalid hour parameter {}.",
                                             local_time_parameters.hour);
  }

  if (!IsInBounds(0, 59, local_time_parameters.minute)) {
    throw temporal::InvalidArgumentException("Creating a LocalTime with invalid minutes parameter {}.",
                                             local_time_parameters.minute);
  }

  // ISO 8601 supports leap seconds, but we ignore it for now to simplify the implementation
  if (!IsInBounds(0, 59, local_time_parameters.second)) {
    throw temporal::InvalidArgumentException("Creating a LocalTime with invalid seconds parameter {}.",
                                             local_time_parameters.second);
  }

  if (!IsInBounds(0, kNanosecondsPerSecond - 1, local_time_parameters.nanosecond)) {
    throw temporal::InvalidArgumentException("Creating a LocalTime with invalid nanoseconds parameter {}.",
                                             local_time_parameters.nanosecond);
  }

  hour = static_cast<uint8_t>(local_time_parameters.hour);
  minute = static_cast<uint8_t>(local_time_parameters.minute);
  second = static_cast<uint8_t>(local_time_parameters.second);
  nanosecond = static_cast<uint32_t>(local_time_parameters.nanosecond);
}

std::string LocalTime::ToString() const {
  return fmt::format("{:02d}:{:02d}:{:02d}.{:09d}", hour, minute, second, nanosecond);
}

std::ostream &operator<<(std::ostream &os, const LocalTime &lt) { return os << lt.ToString(); }

std::string LocalDateTime::ToString() const { return date.ToString() + 'T' + local_time.ToString(); }

std::ostream &operator<<(std::ostream &os, const LocalDateTime &ldt) { return os << ldt.ToString(); }

std::string Timestamp::ToString() const {
  const auto time_point = chrono::sys_time<chrono::milliseconds>(chrono::milliseconds(milliseconds));
  if (time_point < kMinPrintableTime || time_point > kMaxPrintableTime) {
    return fmt::format("{}ms", milliseconds);
  }
  const auto days = chrono::floor<chrono::days>(time_point);
  const auto ymd = chrono::year_month_day(days);
  const auto time_of_day = chrono::hh_mm_ss(time_point - days);
  return fmt::format("{:04d}-{:02d}-{:02d}T{:02d}:{:02d}:{:02d}.{:03d}Z", static_cast<int>(ymd.year()),
                     static_cast<unsigned>(ymd.month()), static_cast<unsigned>(ymd.day()),
                     time_of_day.hours().count(), time_of_day.minutes().count(), time_of_day.seconds().count(),
                     time_of_day.subseconds().count());
}

std::ostream &operator<<(std::ostream &os, const Timestamp &ts) { return os << ts.ToString(); }

Duration::Duration(const int64_t seconds, const int64_t nanoseconds) : seconds(seconds) {
  if (!IsInBounds(0, kNanosecondsPerSecond - 1, nanoseconds)) {
    throw temporal::InvalidArgumentException(
        "Creating a Duration with invalid nanoseconds adjustment {}. The value should be between 0 and 999999999.",
        nanoseconds);
  }
  this->nanoseconds = static_cast<int32_t>(nanoseconds);
}

std::string Duration::ToString() const {
  if (seconds >= 0) return fmt::format("PT{}.{:09d}S", seconds, nanoseconds);
  // The adjustment counts forward from a negative second, so the magnitude is
  // one second less plus the complement of the adjustment.
  auto whole_seconds = static_cast<uint64_t>(-(seconds + 1));
  int64_t fraction = 0;
  if (nanoseconds == 0) {
    ++whole_seconds;
  } else {
    fraction = kNanosecondsPerSecond - nanoseconds;
  }
  return fmt::format("PT-{}.{:09d}S", whole_seconds, fraction);
}

std::ostream &operator<<(std::ostream &os, const Duration &dur) { return os << dur.ToString(); }

}  // namespace graphbin::utils
