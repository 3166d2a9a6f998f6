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

#include <array>
#include <compare>
#include <iosfwd>
#include <string>
#include <string_view>

namespace graphbin::utils {

/// 128-bit UUID stored in network byte order, most significant byte first.
struct UUID {
  using arr_t = std::array<unsigned char, 16>;

  explicit UUID(arr_t const &arr) : uuid(arr) {}

  /// Parses the canonical `xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx` form.
  /// @throw utils::ParseException
  static UUID FromString(std::string_view uuid_str);

  explicit operator std::string() const;
  explicit operator arr_t() const { return uuid; }

  const arr_t &bytes() const { return uuid; }

  friend bool operator==(UUID const &, UUID const &) = default;
  friend auto operator<=>(UUID const &, UUID const &) = default;

  friend std::ostream &operator<<(std::ostream &os, const UUID &uuid);

 private:
  arr_t uuid;
};

}  // namespace graphbin::utils
