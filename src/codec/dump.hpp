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
#include <iosfwd>

#include "codec/buffer.hpp"
#include "codec/reader.hpp"

namespace graphbin::codec {

struct DumpResult {
  uint64_t values{0};
  // False if a value failed to decode and the rest of the input was skipped.
  bool complete{false};
};

/**
 * Prints every value left in `buffer` to `out`, one per line.
 *
 * Decoding stops at the first value that fails, since the cursor isn't
 * meaningful after a failed read. The failure is logged at error level.
 */
DumpResult DumpValues(Buffer *buffer, Reader *reader, std::ostream &out);

}  // namespace graphbin::codec
