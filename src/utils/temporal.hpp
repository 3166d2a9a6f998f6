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

#pragma once

#include <chrono>
#include <compare>
#include <cstdint>
#include <iosfwd>
#include <limits>
#include <string>

#include "utils/exceptions.hpp"

namespace graphbin::utils {

namespace temporal {
struct InvalidArgumentException : public utils::BasicException {
  using utils::BasicException::BasicException;
  SPECIALIZE_GET_EXCEPTION_NAME(InvalidArgumentException)
};
}  // namespace temporal

// Years span the full int32 range of the wire format, proleptic Gregorian.
inline constexpr int64_t kMinYear = std::numeric_limits<int32_t>::min();
inline constexpr int64_t kMaxYear = std::numeric_limits<int32_t>::max();
inline constexpr int64_t kNanosecondsPerSecond = 1'000'000'000;

struct DateParameters {
  int64_t year{0};
  int64_t month{1};
  int64_t day{1};

  bool operator==(const DateParameters &) const = default;
};

/// Calendar date without a time zone.
struct Date {
  explicit Date() : Date{DateParameters{}} {}
  explicit Date(const DateParameters &date_parameters);

  std::string ToString() const;

  friend std::ostream &operator<<(std::ostream &os, const Date &date);

  auto operator<=>(const Date &) const = default;

  int32_t year;
  uint8_t month;
  uint8_t day;
};

struct LocalTimeParameters {
  int64_t hour{0};
  int64_t minute{0};
  int64_t second{0};
  int64_t nanosecond{0};

  bool operator==(const LocalTimeParameters &) const = default;
};

/// Time of day with nanosecond precision, without a time zone.
struct LocalTime {
  explicit LocalTime() : LocalTime{LocalTimeParameters{}} {}
  explicit LocalTime(const LocalTimeParameters &local_time_parameters);

  std::string ToString() const;

  friend std::ostream &operator<<(std::ostream &os, const LocalTime &lt);

  auto operator<=>(const LocalTime &) const = default;

  uint8_t hour;
  uint8_t minute;
  uint8_t second;
  uint32_t nanosecond;
};

struct LocalDateTime {
  explicit LocalDateTime(const Date &date, const LocalTime &local_time) : date(date), local_time(local_time) {}
  explicit LocalDateTime(const DateParameters &date_parameters, const LocalTimeParameters &local_time_parameters)
      : date(date_parameters), local_time(local_time_parameters) {}

  std::string ToString() const;

  friend std::ostream &operator<<(std::ostream &os, const LocalDateTime &ldt);

  auto operator<=>(const LocalDateTime &) const = default;

  Date date;
  LocalTime local_time;
};

/// Point in time as milliseconds since the Unix epoch (UTC). Instants outside
/// of the years [-32767, 32767] print as a plain millisecond count.
struct Timestamp {
  explicit Timestamp(int64_t milliseconds) : milliseconds(milliseconds) {}

  std::string ToString() const;

  friend std::ostream &operator<<(std::ostream &os, const Timestamp &ts);

  auto operator<=>(const Timestamp &) const = default;

  int64_t milliseconds;
};

/// Amount of time as whole seconds plus a nanosecond adjustment in
/// [0, 999'999'999]. Negative durations carry the sign in `seconds`.
struct Duration {
  explicit Duration(int64_t seconds, int64_t nanoseconds = 0);

  std::string ToString() const;

  friend std::ostream &operator<<(std::ostream &os, const Duration &dur);

  auto operator<=>(const Duration &) const = default;

  int64_t seconds;
  int32_t nanoseconds;
};

}  // namespace graphbin::utils
