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

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace graphbin::utils {

/**
 * Parses a hex dump like "07 00 00 00 07 E7 03 0F" into bytes. Whitespace
 * between digits is ignored, digits may be upper or lower case.
 *
 * @throw utils::ParseException on an invalid digit or an odd number of digits
 */
std::vector<uint8_t> ParseHex(std::string_view hex);

/// Formats bytes as upper case hex pairs separated by single spaces.
std::string ToHex(const uint8_t *data, size_t size);

inline std::string ToHex(const std::vector<uint8_t> &bytes) { return ToHex(bytes.data(), bytes.size()); }

}  // namespace graphbin::utils
