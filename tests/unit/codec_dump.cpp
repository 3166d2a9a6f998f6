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

#include <sstream>

#include <gtest/gtest.h>

#include "codec/dump.hpp"
#include "codec/reader.hpp"
#include "codec/registry.hpp"

#include "graphbin_common.hpp"

using graphbin::codec::DumpValues;
using graphbin::codec::Reader;
using graphbin::codec::ReaderConfig;
using graphbin::codec::TypeRegistry;
using graphbin::codec::UnknownCustomTypePolicy;

TEST(CodecDump, PrintsEveryValue) {
  auto buffer = BufferFromHex("01 00 00 00 00 2A  FE  09 00 00 00 00 02 27 00 01 27 01  07 00 00 00 07 E7 03 0F");
  Reader reader;
  std::ostringstream out;
  const auto result = DumpValues(&buffer, &reader, out);
  ASSERT_TRUE(result.complete);
  ASSERT_EQ(result.values, 4U);
  ASSERT_EQ(out.str(), "42\nnull\n[true, null:bool]\n2023-03-15\n");
  ASSERT_EQ(buffer.ReadableBytes(), 0U);
}

TEST(CodecDump, EmptyInput) {
  graphbin::codec::Buffer buffer;
  Reader reader;
  std::ostringstream out;
  const auto result = DumpValues(&buffer, &reader, out);
  ASSERT_TRUE(result.complete);
  ASSERT_EQ(result.values, 0U);
  ASSERT_TRUE(out.str().empty());
}

TEST(CodecDump, StopsAtFirstFailure) {
  // The second value has an unknown type code, the third one is never read.
  auto buffer = BufferFromHex("27 00 01  FF 00  27 00 00");
  Reader reader;
  std::ostringstream out;
  const auto result = DumpValues(&buffer, &reader, out);
  ASSERT_FALSE(result.complete);
  ASSERT_EQ(result.values, 1U);
  ASSERT_EQ(out.str(), "true\n");
}

TEST(CodecDump, StopsAtTruncatedValue) {
  auto buffer = BufferFromHex("27 00 00  01 00 00 00");
  Reader reader;
  std::ostringstream out;
  const auto result = DumpValues(&buffer, &reader, out);
  ASSERT_FALSE(result.complete);
  ASSERT_EQ(result.values, 1U);
  ASSERT_EQ(out.str(), "false\n");
}

TEST(CodecDump, SkipsUnknownCustomTypes) {
  auto buffer = BufferFromHex("C1 00 00 00 00 08 00 00 00 01 00 00 00 02  27 00 01");
  Reader reader(TypeRegistry::Builtins(), ReaderConfig{.unknown_custom_types = UnknownCustomTypePolicy::kSkip});
  std::ostringstream out;
  const auto result = DumpValues(&buffer, &reader, out);
  ASSERT_TRUE(result.complete);
  ASSERT_EQ(result.values, 2U);
  ASSERT_EQ(out.str(), "null\ntrue\n");
}
