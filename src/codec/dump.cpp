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

#include "codec/dump.hpp"

#include <ostream>

#include "codec/exceptions.hpp"
#include "utils/logging.hpp"

namespace graphbin::codec {

DumpResult DumpValues(Buffer *buffer, Reader *reader, std::ostream &out) {
  DumpResult result;
  while (buffer->ReadableBytes() > 0) {
    const auto position = buffer->ReadPosition();
    try {
      out << reader->ReadValue(buffer) << '\n';
    } catch (const CodecException &e) {
      spdlog::error("{} while decoding the value at byte {}: {}", e.name(), position, e.what());
      return result;
    }
    ++result.values;
  }
  result.complete = true;
  return result;
}

}  // namespace graphbin::codec
