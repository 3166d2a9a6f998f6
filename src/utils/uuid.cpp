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

#include "utils/uuid.hpp"

#include <uuid/uuid.h>

#include <array>
#include <ostream>

#include "utils/exceptions.hpp"

namespace graphbin::utils {

namespace {
// UUID format: xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx
// Note not using UUID_STR_LEN so we can build with older libuuid
constexpr size_t kUuidStringLength = 36;
}  // namespace

UUID UUID::FromString(std::string_view uuid_str) {
  if (uuid_str.length() != kUuidStringLength) {
    throw ParseException("Invalid UUID argument length. Length is {} and expected to be {}.", uuid_str.length(),
                         kUuidStringLength);
  }
  // uuid_parse expects a null terminated string
  const std::string terminated{uuid_str};
  arr_t arr{};
  if (uuid_parse(terminated.c_str(), arr.data()) != 0) {
    throw ParseException("Invalid UUID format: {}", uuid_str);
  }
  return UUID{arr};
}

UUID::operator std::string() const {
  std::array<char, kUuidStringLength + 1> decoded{};  // +1 for null terminator written by uuid_unparse
  uuid_unparse_lower(uuid.data(), decoded.data());
  return {decoded.data(), kUuidStringLength};
}

std::ostream &operator<<(std::ostream &os, const UUID &uuid) { return os << std::string(uuid); }

}  // namespace graphbin::utils
