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

#include <cmath>
#include <cstdint>
#include <limits>
#include <string>

#include <gtest/gtest.h>

#include "codec/exceptions.hpp"
#include "codec/value.hpp"
#include "utils/temporal.hpp"
#include "utils/uuid.hpp"

#include "graphbin_common.hpp"

using graphbin::codec::BufferUnderrunException;
using graphbin::codec::MalformedValueException;
using graphbin::codec::Value;
namespace utils = graphbin::utils;

TEST(CodecLeaf, Bool) {
  ASSERT_EQ(EncodeToHex(Value(true)), "27 00 01");
  ASSERT_EQ(EncodeToHex(Value(false)), "27 00 00");
  ASSERT_EQ(DecodeHex("27 00 01"), Value(true));
  ASSERT_EQ(DecodeHex("27 00 00"), Value(false));
  ASSERT_THROW(DecodeHex("27 00 02"), MalformedValueException);
}

TEST(CodecLeaf, Integers) {
  ASSERT_EQ(EncodeToHex(Value(int8_t{-2})), "24 00 FE");
  ASSERT_EQ(EncodeToHex(Value(int16_t{0x0102})), "26 00 01 02");
  ASSERT_EQ(EncodeToHex(Value(int32_t{-1})), "01 00 FF FF FF FF");
  ASSERT_EQ(EncodeToHex(Value(int64_t{0x0102030405060708})), "02 00 01 02 03 04 05 06 07 08");

  ASSERT_EQ(DecodeHex("24 00 FE").ValueByte(), -2);
  ASSERT_EQ(DecodeHex("26 00 01 02").ValueShort(), 0x0102);
  ASSERT_EQ(DecodeHex("01 00 FF FF FF FF").ValueInt(), -1);
  ASSERT_EQ(DecodeHex("02 00 01 02 03 04 05 06 07 08").ValueLong(), 0x0102030405060708);
}

TEST(CodecLeaf, IntegerLimits) {
  for (const auto &value :
       {Value(std::numeric_limits<int8_t>::min()), Value(std::numeric_limits<int8_t>::max()),
        Value(std::numeric_limits<int16_t>::min()), Value(std::numeric_limits<int16_t>::max()),
        Value(std::numeric_limits<int32_t>::min()), Value(std::numeric_limits<int32_t>::max()),
        Value(std::numeric_limits<int64_t>::min()), Value(std::numeric_limits<int64_t>::max())}) {
    ASSERT_EQ(RoundTrip(value), value);
  }
}

TEST(CodecLeaf, FloatingPoint) {
  ASSERT_EQ(EncodeToHex(Value(1.5F)), "08 00 3F C0 00 00");
  ASSERT_EQ(EncodeToHex(Value(1.5)), "84 00 3F F8 00 00 00 00 00 00");
  ASSERT_EQ(DecodeHex("08 00 3F C0 00 00"), Value(1.5F));
  ASSERT_EQ(DecodeHex("84 00 3F F8 00 00 00 00 00 00"), Value(1.5));

  const auto infinity = RoundTrip(Value(-std::numeric_limits<double>::infinity()));
  ASSERT_TRUE(std::isinf(infinity.ValueDouble()));
  const auto nan = RoundTrip(Value(std::numeric_limits<float>::quiet_NaN()));
  ASSERT_TRUE(std::isnan(nan.ValueFloat()));
}

TEST(CodecLeaf, String) {
  ASSERT_EQ(EncodeToHex(Value("hi")), "03 00 00 00 00 02 68 69");
  ASSERT_EQ(EncodeToHex(Value("")), "03 00 00 00 00 00");
  ASSERT_EQ(DecodeHex("03 00 00 00 00 02 68 69"), Value("hi"));
  ASSERT_EQ(RoundTrip(Value("\xC5\xA1ibenik")), Value("\xC5\xA1ibenik"));
  ASSERT_THROW(DecodeHex("03 00 FF FF FF FF"), MalformedValueException);
  ASSERT_THROW(DecodeHex("03 00 00 00 00 05 68 69"), BufferUnderrunException);
}

TEST(CodecLeaf, Binary) {
  const auto value = Value::MakeBinary({0x00, 0xFF, 0x10});
  ASSERT_EQ(EncodeToHex(value), "25 00 00 00 00 03 00 FF 10");
  ASSERT_EQ(DecodeHex("25 00 00 00 00 03 00 FF 10"), value);
  ASSERT_EQ(RoundTrip(Value::MakeBinary({})), Value::MakeBinary({}));
  ASSERT_THROW(DecodeHex("25 00 80 00 00 00"), MalformedValueException);
  ASSERT_THROW(DecodeHex("25 00 00 00 00 02 01"), BufferUnderrunException);
}

TEST(CodecLeaf, Uuid) {
  const auto uuid = utils::UUID::FromString("41d2e28a-20a4-4ab0-b379-d810dede3786");
  ASSERT_EQ(EncodeToHex(Value(uuid)), "0C 00 41 D2 E2 8A 20 A4 4A B0 B3 79 D8 10 DE DE 37 86");
  ASSERT_EQ(DecodeHex("0C 00 41 D2 E2 8A 20 A4 4A B0 B3 79 D8 10 DE DE 37 86").ValueUuid(), uuid);
  ASSERT_THROW(DecodeHex("0C 00 41 D2 E2 8A"), BufferUnderrunException);
}

TEST(CodecLeaf, Date) {
  const utils::Date date({.year = 2023, .month = 3, .day = 15});
  ASSERT_EQ(EncodeToHex(Value(date)), "07 00 00 00 07 E7 03 0F");
  ASSERT_EQ(DecodeHex("07 00 00 00 07 E7 03 0F").ValueDate(), date);

  const utils::Date before_epoch({.year = -44, .month = 3, .day = 15});
  ASSERT_EQ(EncodeToHex(Value(before_epoch)), "07 00 FF FF FF D4 03 0F");
  ASSERT_EQ(RoundTrip(Value(before_epoch)), Value(before_epoch));
}

TEST(CodecLeaf, DateYearsSpanTheWholeInt32Range) {
  const utils::Date far_future({.year = 40000, .month = 1, .day = 1});
  ASSERT_EQ(EncodeToHex(Value(far_future)), "07 00 00 00 9C 40 01 01");
  ASSERT_EQ(DecodeHex("07 00 00 00 9C 40 01 01").ValueDate(), far_future);

  const utils::Date far_past({.year = -1'000'000, .month = 2, .day = 29});
  ASSERT_EQ(EncodeToHex(Value(far_past)), "07 00 FF F0 BD C0 02 1D");
  ASSERT_EQ(DecodeHex("07 00 FF F0 BD C0 02 1D").ValueDate(), far_past);

  ASSERT_EQ(DecodeHex("07 00 7F FF FF FF 0C 1F").ValueDate().year, std::numeric_limits<int32_t>::max());
  ASSERT_EQ(DecodeHex("07 00 80 00 00 00 01 01").ValueDate().year, std::numeric_limits<int32_t>::min());
  // -100 isn't a leap year
  ASSERT_THROW(DecodeHex("07 00 FF FF FF 9C 02 1D"), MalformedValueException);
}

TEST(CodecLeaf, InvalidDateIsMalformed) {
  // month 13
  ASSERT_THROW(DecodeHex("07 00 00 00 07 E7 0D 01"), MalformedValueException);
  // February 30
  ASSERT_THROW(DecodeHex("07 00 00 00 07 E7 02 1E"), MalformedValueException);
  // February 29 of a non leap year
  ASSERT_THROW(DecodeHex("07 00 00 00 07 E7 02 1D"), MalformedValueException);
  ASSERT_EQ(DecodeHex("07 00 00 00 07 E8 02 1D").ValueDate(), utils::Date({.year = 2024, .month = 2, .day = 29}));
  // day 0
  ASSERT_THROW(DecodeHex("07 00 00 00 07 E7 01 00"), MalformedValueException);
}

TEST(CodecLeaf, LocalTime) {
  const utils::LocalTime local_time({.hour = 13, .minute = 2, .second = 59, .nanosecond = 1});
  ASSERT_EQ(EncodeToHex(Value(local_time)), "86 00 0D 02 3B 00 00 00 01");
  ASSERT_EQ(DecodeHex("86 00 0D 02 3B 00 00 00 01").ValueLocalTime(), local_time);
  // hour 24
  ASSERT_THROW(DecodeHex("86 00 18 00 00 00 00 00 00"), MalformedValueException);
  // second 60
  ASSERT_THROW(DecodeHex("86 00 00 00 3C 00 00 00 00"), MalformedValueException);
  // one second worth of nanoseconds
  ASSERT_THROW(DecodeHex("86 00 00 00 00 3B 9A CA 00"), MalformedValueException);
  ASSERT_THROW(DecodeHex("86 00 00 00 00 FF FF FF FF"), MalformedValueException);
}

TEST(CodecLeaf, LocalDateTime) {
  const utils::LocalDateTime local_date_time({.year = 2023, .month = 3, .day = 15},
                                             {.hour = 23, .minute = 59, .second = 0, .nanosecond = 999'999'999});
  ASSERT_EQ(EncodeToHex(Value(local_date_time)), "85 00 00 00 07 E7 03 0F 17 3B 00 3B 9A C9 FF");
  ASSERT_EQ(DecodeHex("85 00 00 00 07 E7 03 0F 17 3B 00 3B 9A C9 FF").ValueLocalDateTime(), local_date_time);
  ASSERT_THROW(DecodeHex("85 00 00 00 07 E7 03 20 17 3B 00 3B 9A C9 FF"), MalformedValueException);
}

TEST(CodecLeaf, Timestamp) {
  const utils::Timestamp timestamp(1'678'838'400'000);
  ASSERT_EQ(EncodeToHex(Value(timestamp)), "04 00 00 00 01 86 E2 91 04 00");
  ASSERT_EQ(DecodeHex("04 00 00 00 01 86 E2 91 04 00").ValueTimestamp(), timestamp);
  ASSERT_EQ(RoundTrip(Value(utils::Timestamp(-1))), Value(utils::Timestamp(-1)));

  const auto min = DecodeHex("04 00 80 00 00 00 00 00 00 00");
  ASSERT_EQ(min.ValueTimestamp().milliseconds, std::numeric_limits<int64_t>::min());
  ASSERT_EQ(Print(min), "-9223372036854775808ms");
  const auto max = DecodeHex("04 00 7F FF FF FF FF FF FF FF");
  ASSERT_EQ(max.ValueTimestamp().milliseconds, std::numeric_limits<int64_t>::max());
  ASSERT_EQ(Print(max), "9223372036854775807ms");
}

TEST(CodecLeaf, Duration) {
  const utils::Duration duration(90, 500);
  ASSERT_EQ(EncodeToHex(Value(duration)), "81 00 00 00 00 00 00 00 00 5A 00 00 01 F4");
  ASSERT_EQ(DecodeHex("81 00 00 00 00 00 00 00 00 5A 00 00 01 F4").ValueDuration(), duration);
  const utils::Duration negative(-1, 999'999'999);
  ASSERT_EQ(RoundTrip(Value(negative)), Value(negative));
  ASSERT_THROW(DecodeHex("81 00 00 00 00 00 00 00 00 00 FF FF FF FF"), MalformedValueException);
}

TEST(CodecLeaf, TruncatedBodies) {
  ASSERT_THROW(DecodeHex("27 00"), BufferUnderrunException);
  ASSERT_THROW(DecodeHex("01 00 00 00 01"), BufferUnderrunException);
  ASSERT_THROW(DecodeHex("02 00 00 00 00 00 00 00 01"), BufferUnderrunException);
  ASSERT_THROW(DecodeHex("07 00 00 00 07 E7 03"), BufferUnderrunException);
  ASSERT_THROW(DecodeHex("01"), BufferUnderrunException);
}
