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

#include "utils/hex.hpp"

#include <cctype>
#include <optional>

#include <fmt/format.h>

#include "utils/exceptions.hpp"

namespace graphbin::utils {

namespace {

std::optional<uint8_t> HexDigitValue(char c) {
  if (c >= '0' && c <= '9') return static_cast<uint8_t>(c - '0');
  if (c >= 'a' && c <= 'f') return static_cast<uint8_t>(c - 'a' + 10);
  if (c >= 'A' && c <= 'F') return static_cast<uint8_t>(c - 'A' + 10);
  return std::nullopt;
}

}  // namespace

std::vector<uint8_t> ParseHex(std::string_view hex) {
  std::vector<uint8_t> bytes;
  bytes.reserve(hex.size() / 2);
  std::optional<uint8_t> high;
  for (size_t i = 0; i < hex.size(); ++i) {
    const auto c = hex[i];
    if (std::isspace(static_cast<unsigned char>(c))) continue;
    const auto digit = HexDigitValue(c);
    if (!digit) {
      throw ParseException("Invalid hex digit '{}' at position {}", c, i);
    }
    if (high) {
      bytes.push_back(static_cast<uint8_t>(*high << 4 | *digit));
      high.reset();
    } else {
      high = digit;
    }
  }
  if (high) {
    throw ParseException("Hex input has an odd number of digits");
  }
  return bytes;
}

std::string ToHex(const uint8_t *data, size_t size) {
  std::string hex;
  hex.reserve(size * 3);
  for (size_t i = 0; i < size; ++i) {
    if (i != 0) hex.push_back(' ');
    hex += fmt::format("{:02X}", data[i]);
  }
  return hex;
}

}  // namespace graphbin::utils
