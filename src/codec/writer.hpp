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
#include <vector>

#include "codec/buffer.hpp"
#include "codec/registry.hpp"
#include "codec/value.hpp"

namespace graphbin::codec {

/**
 * Encodes values into self-describing envelopes.
 *
 * Every value is written as a one-byte type code, a nullable flag and the body
 * produced by the codec registered for the value's kind. The universal null is
 * the single byte 0xFE. Bodies of custom types are prefixed with their int32
 * length.
 *
 * A Writer holds no mutable state, so one instance can serve any number of
 * concurrent encode passes as long as each pass writes to its own Buffer.
 */
class Writer final {
 public:
  explicit Writer(const TypeRegistry &registry = TypeRegistry::Builtins()) : registry_(&registry) {}

  /**
   * Appends the envelope of `value` to `buffer`. Nested values of composites
   * are written through this same method.
   *
   * @throw UnsupportedTypeException if no registered kind matches `value`
   * @throw EncodePreconditionException if `value` can't be encoded
   */
  void WriteValue(const Value &value, Buffer *buffer) const;

  const TypeRegistry &registry() const { return *registry_; }

 private:
  const TypeRegistry *registry_;
};

/// Encodes a single value into a fresh byte sequence.
std::vector<uint8_t> Encode(const Value &value, const TypeRegistry &registry = TypeRegistry::Builtins());

}  // namespace graphbin::codec
