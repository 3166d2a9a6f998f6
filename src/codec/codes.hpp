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
#include <string_view>

namespace graphbin::codec {

/// One-byte wire type codes. This table is a versioned contract: new protocol
/// versions only add codes, existing codes are never reassigned or reused.
enum class DataType : uint8_t {
  Int = 0x01,
  Long = 0x02,
  String = 0x03,
  Timestamp = 0x04,
  Date = 0x07,
  Float = 0x08,
  List = 0x09,
  Map = 0x0A,
  Set = 0x0B,
  Uuid = 0x0C,
  Edge = 0x0D,
  Path = 0x0E,
  Property = 0x0F,
  Vertex = 0x11,
  VertexProperty = 0x12,
  Direction = 0x18,
  Byte = 0x24,
  Binary = 0x25,
  Short = 0x26,
  Boolean = 0x27,
  Duration = 0x81,
  Double = 0x84,
  LocalDateTime = 0x85,
  LocalTime = 0x86,
  UnspecifiedNull = 0xFE,
};

/// Codes reserved for user registered types. A body of a custom type is always
/// framed with an int32 length so that peers unaware of the type can skip it.
inline constexpr uint8_t kCustomTypeCodeFirst = 0xC0;
inline constexpr uint8_t kCustomTypeCodeLast = 0xEF;

/// Values of the nullable flag that follows every type code except
/// `DataType::UnspecifiedNull`.
inline constexpr uint8_t kValueFlagNone = 0x00;
inline constexpr uint8_t kValueFlagNull = 0x01;

constexpr bool IsCustomTypeCode(uint8_t code) { return code >= kCustomTypeCodeFirst && code <= kCustomTypeCodeLast; }

constexpr uint8_t ToCode(DataType type) { return static_cast<uint8_t>(type); }

std::string_view DataTypeToString(DataType type);

}  // namespace graphbin::codec
