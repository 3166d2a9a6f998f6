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

#include <array>
#include <cstdint>
#include <limits>
#include <optional>
#include <sstream>
#include <string>

#include <fmt/format.h>
#include <gtest/gtest.h>

#include "utils/exceptions.hpp"
#include "utils/temporal.hpp"

namespace {

std::string ToString(const graphbin::utils::DateParameters &date_parameters) {
  return fmt::format("{:04d}-{:02d}-{:02d}", date_parameters.year, date_parameters.month, date_parameters.day);
}

struct TestDateParameters {
  graphbin::utils::DateParameters date_parameters;
  bool should_throw;
};

inline constexpr std::array test_dates{TestDateParameters{{1996, -11, 22}, true},
                                       TestDateParameters{{1996, 11, -22}, true},
                                       TestDateParameters{{1, 13, 3}, true},
                                       TestDateParameters{{1, 12, 32}, true},
                                       TestDateParameters{{1, 4, 31}, true},
                                       TestDateParameters{{1, 2, 29}, true},
                                       TestDateParameters{{2020, 2, 29}, false},
                                       TestDateParameters{{1700, 2, 29}, true},
                                       TestDateParameters{{1200, 2, 29}, false},
                                       TestDateParameters{{-100, 2, 29}, true},
                                       TestDateParameters{{-44, 3, 15}, false},
                                       TestDateParameters{{-32768, 11, 22}, false},
                                       TestDateParameters{{40000, 2, 29}, false},
                                       TestDateParameters{{-1'000'000, 2, 29}, false},
                                       TestDateParameters{{2'147'483'647, 12, 31}, false},
                                       TestDateParameters{{-2'147'483'648, 1, 1}, false},
                                       TestDateParameters{{2'147'483'648, 1, 1}, true},
                                       TestDateParameters{{-2'147'483'649, 12, 31}, true}};

struct TestLocalTimeParameters {
  graphbin::utils::LocalTimeParameters local_time_parameters;
  bool should_throw;
};

inline constexpr std::array test_local_times{TestLocalTimeParameters{{.hour = 24}, true},
                                             TestLocalTimeParameters{{.hour = -1}, true},
                                             TestLocalTimeParameters{{.minute = -1}, true},
                                             TestLocalTimeParameters{{.minute = 60}, true},
                                             TestLocalTimeParameters{{.second = -1}, true},
                                             TestLocalTimeParameters{{.second = 60}, true},
                                             TestLocalTimeParameters{{.nanosecond = -1}, true},
                                             TestLocalTimeParameters{{.nanosecond = 1'000'000'000}, true},
                                             TestLocalTimeParameters{{23, 59, 59, 999'999'999}, false},
                                             TestLocalTimeParameters{{0, 0, 0, 0}, false}};
}  // namespace

TEST(TemporalTest, DateConstruction) {
  std::optional<graphbin::utils::Date> test_date;

  for (const auto [date_parameters, should_throw] : test_dates) {
    if (should_throw) {
      EXPECT_THROW(test_date.emplace(date_parameters), graphbin::utils::temporal::InvalidArgumentException)
          << ToString(date_parameters);
    } else {
      EXPECT_NO_THROW(test_date.emplace(date_parameters)) << ToString(date_parameters);
    }
  }
}

TEST(TemporalTest, DateToString) {
  ASSERT_EQ(graphbin::utils::Date({2023, 3, 15}).ToString(), "2023-03-15");
  ASSERT_EQ(graphbin::utils::Date({7, 1, 2}).ToString(), "0007-01-02");
  ASSERT_EQ(graphbin::utils::Date({40000, 1, 1}).ToString(), "40000-01-01");
  ASSERT_EQ(graphbin::utils::Date({-1'000'000, 2, 29}).ToString(), "-1000000-02-29");
  std::ostringstream stream;
  stream << graphbin::utils::Date({1994, 12, 7});
  ASSERT_EQ(stream.str(), "1994-12-07");
}

TEST(TemporalTest, DateOrdering) {
  ASSERT_LT(graphbin::utils::Date({2023, 3, 15}), graphbin::utils::Date({2023, 3, 16}));
  ASSERT_LT(graphbin::utils::Date({2022, 12, 31}), graphbin::utils::Date({2023, 1, 1}));
}

TEST(TemporalTest, LocalTimeConstruction) {
  std::optional<graphbin::utils::LocalTime> test_local_time;

  for (const auto [local_time_parameters, should_throw] : test_local_times) {
    if (should_throw) {
      ASSERT_THROW(test_local_time.emplace(local_time_parameters), graphbin::utils::BasicException);
    } else {
      ASSERT_NO_THROW(test_local_time.emplace(local_time_parameters));
    }
  }
}

TEST(TemporalTest, LocalTime) {
  const graphbin::utils::LocalTime local_time({.hour = 1, .minute = 2, .second = 3, .nanosecond = 4});
  ASSERT_EQ(local_time.ToString(), "01:02:03.000000004");
}

TEST(TemporalTest, LocalDateTime) {
  const graphbin::utils::LocalDateTime local_date_time({2023, 3, 15}, {.hour = 10, .minute = 30});
  ASSERT_EQ(local_date_time.date, graphbin::utils::Date({2023, 3, 15}));
  ASSERT_EQ(local_date_time.ToString(), "2023-03-15T10:30:00.000000000");
  ASSERT_THROW(graphbin::utils::LocalDateTime({2023, 2, 30}, {}), graphbin::utils::temporal::InvalidArgumentException);
}

TEST(TemporalTest, Timestamp) {
  ASSERT_EQ(graphbin::utils::Timestamp(0).ToString(), "1970-01-01T00:00:00.000Z");
  ASSERT_EQ(graphbin::utils::Timestamp(1'678'838'400'123).ToString(), "2023-03-15T00:00:00.123Z");
  ASSERT_EQ(graphbin::utils::Timestamp(-1).ToString(), "1969-12-31T23:59:59.999Z");
}

TEST(TemporalTest, TimestampOutsideOfCalendarRange) {
  const auto min = std::numeric_limits<int64_t>::min();
  const auto max = std::numeric_limits<int64_t>::max();
  ASSERT_EQ(graphbin::utils::Timestamp(min).ToString(), "-9223372036854775808ms");
  ASSERT_EQ(graphbin::utils::Timestamp(max).ToString(), "9223372036854775807ms");

  // First and last milliseconds of the years -32767 and 32767.
  ASSERT_EQ(graphbin::utils::Timestamp(-1'096'193'865'600'000).ToString(), "-32767-01-01T00:00:00.000Z");
  ASSERT_EQ(graphbin::utils::Timestamp(-1'096'193'865'600'001).ToString(), "-1096193865600001ms");
  ASSERT_EQ(graphbin::utils::Timestamp(971'890'963'199'999).ToString(), "32767-12-31T23:59:59.999Z");
  ASSERT_EQ(graphbin::utils::Timestamp(971'890'963'200'000).ToString(), "971890963200000ms");
}

TEST(TemporalTest, Duration) {
  const graphbin::utils::Duration duration(90, 500);
  ASSERT_EQ(duration.seconds, 90);
  ASSERT_EQ(duration.nanoseconds, 500);
  ASSERT_EQ(duration.ToString(), "PT90.000000500S");
  ASSERT_THROW(graphbin::utils::Duration(1, -1), graphbin::utils::temporal::InvalidArgumentException);
  ASSERT_THROW(graphbin::utils::Duration(1, 1'000'000'000), graphbin::utils::temporal::InvalidArgumentException);
}

TEST(TemporalTest, NegativeDurationToString) {
  ASSERT_EQ(graphbin::utils::Duration(-1, 999'999'999).ToString(), "PT-0.000000001S");
  ASSERT_EQ(graphbin::utils::Duration(-2, 500'000'000).ToString(), "PT-1.500000000S");
  ASSERT_EQ(graphbin::utils::Duration(-2, 0).ToString(), "PT-2.000000000S");
  ASSERT_EQ(graphbin::utils::Duration(std::numeric_limits<int64_t>::min(), 0).ToString(),
            "PT-9223372036854775808.000000000S");
}
