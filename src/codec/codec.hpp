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

#include <functional>

namespace graphbin::codec {

class Buffer;
class Reader;
class Value;
class Writer;

/**
 * Body codec of one wire type.
 *
 * The envelope (type code and nullable flag) is always handled by `Writer` and
 * `Reader`; a codec only encodes and decodes the body of a present value.
 * Composite codecs recurse into nested values through the context they are
 * handed, so nested values go through the full registry.
 *
 * The body length must always be known from the body itself: either the
 * layout is fixed, or it carries an explicit length or count prefix.
 */
struct Codec {
  std::function<void(const Value &value, Buffer *buffer, const Writer &context)> write;
  std::function<Value(Buffer *buffer, Reader &context)> read;
};

/// Decides on encode whether a `Value::Type::Custom` value belongs to a
/// registered custom type.
using KindMatcher = std::function<bool(const Value &value)>;

}  // namespace graphbin::codec
