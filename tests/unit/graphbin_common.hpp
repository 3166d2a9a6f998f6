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

#include <cstdint>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <gtest/gtest.h>

#include "codec/buffer.hpp"
#include "codec/reader.hpp"
#include "codec/registry.hpp"
#include "codec/value.hpp"
#include "codec/writer.hpp"
#include "utils/hex.hpp"

/// Hex dump of the envelope the builtin registry produces for `value`.
inline std::string EncodeToHex(const graphbin::codec::Value &value,
                               const graphbin::codec::TypeRegistry &registry =
                                   graphbin::codec::TypeRegistry::Builtins()) {
  return graphbin::utils::ToHex(graphbin::codec::Encode(value, registry));
}

inline graphbin::codec::Value DecodeHex(std::string_view hex,
                                        const graphbin::codec::TypeRegistry &registry =
                                            graphbin::codec::TypeRegistry::Builtins(),
                                        graphbin::codec::ReaderConfig config = {}) {
  const auto bytes = graphbin::utils::ParseHex(hex);
  return graphbin::codec::Decode(bytes.data(), bytes.size(), registry, config);
}

inline std::string Print(const graphbin::codec::Value &value) {
  std::ostringstream stream;
  stream << value;
  return stream.str();
}

inline graphbin::codec::Buffer BufferFromHex(std::string_view hex) {
  return graphbin::codec::Buffer(graphbin::utils::ParseHex(hex));
}

/// Writes into a buffer and reads back with the same registry.
class Loopback {
 public:
  explicit Loopback(const graphbin::codec::TypeRegistry &registry = graphbin::codec::TypeRegistry::Builtins(),
                    graphbin::codec::ReaderConfig config = {})
      : writer_(registry), reader_(registry, config) {}

  void Write(const graphbin::codec::Value &value) { writer_.WriteValue(value, &buffer_); }
  graphbin::codec::Value Read() { return reader_.ReadValue(&buffer_); }

  graphbin::codec::Buffer &buffer() { return buffer_; }
  std::string hex() const { return graphbin::utils::ToHex(buffer_.bytes()); }

 private:
  graphbin::codec::Buffer buffer_;
  graphbin::codec::Writer writer_;
  graphbin::codec::Reader reader_;
};

inline graphbin::codec::Value RoundTrip(const graphbin::codec::Value &value,
                                        const graphbin::codec::TypeRegistry &registry =
                                            graphbin::codec::TypeRegistry::Builtins()) {
  Loopback loopback(registry);
  loopback.Write(value);
  auto decoded = loopback.Read();
  EXPECT_EQ(loopback.buffer().ReadableBytes(), 0U);
  return decoded;
}

/// A custom "point" type with two Int coordinates stored as raw int32 fields.
inline constexpr uint8_t kPointTypeCode = 0xC1;

inline graphbin::codec::Value MakePoint(int32_t x, int32_t y) {
  return graphbin::codec::CustomValue{"point", {graphbin::codec::Value(x), graphbin::codec::Value(y)}};
}

inline void RegisterPoint(graphbin::codec::TypeRegistry *registry, uint8_t type_code = kPointTypeCode) {
  using graphbin::codec::Buffer;
  using graphbin::codec::Reader;
  using graphbin::codec::Value;
  using graphbin::codec::Writer;
  registry->Register(
      type_code, [](const Value &value) { return value.ValueCustom().type_name == "point"; },
      {[](const Value &value, Buffer *buffer, const Writer &) {
         const auto &fields = value.ValueCustom().fields;
         buffer->WriteInt32(fields.at(0).ValueInt());
         buffer->WriteInt32(fields.at(1).ValueInt());
       },
       [](Buffer *buffer, Reader &) -> Value {
         const auto x = buffer->ReadInt32();
         const auto y = buffer->ReadInt32();
         return MakePoint(x, y);
       }});
}

/// A custom "node" type whose fields are arbitrary nested envelopes, preceded
/// by their count.
inline constexpr uint8_t kNodeTypeCode = 0xC2;

inline void RegisterNode(graphbin::codec::TypeRegistry *registry) {
  using graphbin::codec::Buffer;
  using graphbin::codec::CustomValue;
  using graphbin::codec::Reader;
  using graphbin::codec::Value;
  using graphbin::codec::Writer;
  registry->Register(
      kNodeTypeCode, [](const Value &value) { return value.ValueCustom().type_name == "node"; },
      {[](const Value &value, Buffer *buffer, const Writer &context) {
         const auto &fields = value.ValueCustom().fields;
         buffer->WriteInt32(static_cast<int32_t>(fields.size()));
         for (const auto &field : fields) context.WriteValue(field, buffer);
       },
       [](Buffer *buffer, Reader &context) -> Value {
         CustomValue node{"node", {}};
         const auto count = buffer->ReadInt32();
         for (int32_t i = 0; i < count; ++i) node.fields.push_back(context.ReadValue(buffer));
         return node;
       }});
}
