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
#include <vector>

#include "codec/buffer.hpp"
#include "codec/registry.hpp"
#include "codec/value.hpp"

namespace graphbin::codec {

/// What the Reader does with a custom-range type code it has no codec for.
enum class UnknownCustomTypePolicy : uint8_t {
  // Throw UnsupportedTypeException.
  kFail,
  // Consume the length framed body, log a warning and decode a universal null.
  kSkip,
};

struct ReaderConfig {
  // Maximum number of nested envelopes, 0 means unlimited.
  uint32_t max_depth{0};
  UnknownCustomTypePolicy unknown_custom_types{UnknownCustomTypePolicy::kFail};
};

/**
 * Decodes self-describing envelopes written by `Writer`.
 *
 * Each `ReadValue` call consumes exactly one envelope (including all nested
 * envelopes of a composite) and leaves the buffer cursor right after it. On
 * failure the exception propagates out of the outermost call and the cursor
 * position is unspecified.
 *
 * A Reader tracks the nesting depth of the value being decoded, so an instance
 * must not be shared between concurrent decode passes. Creating one is cheap.
 */
class Reader final {
 public:
  explicit Reader(const TypeRegistry &registry = TypeRegistry::Builtins(), ReaderConfig config = {})
      : registry_(&registry), config_(config) {}

  /**
   * @throw UnsupportedTypeException if the type code isn't registered; no bytes
   *        past the type code are consumed in that case
   * @throw MalformedValueException if a body violates its type's constraints
   * @throw BufferUnderrunException if the buffer ends before the envelope
   */
  Value ReadValue(Buffer *buffer);

  const TypeRegistry &registry() const { return *registry_; }
  const ReaderConfig &config() const { return config_; }

 private:
  Value ReadCustomBody(const TypeEntry &entry, Buffer *buffer);
  void SkipCustomValue(uint8_t type_code, Buffer *buffer);

  const TypeRegistry *registry_;
  ReaderConfig config_;
  uint32_t depth_{0};
};

/**
 * Decodes a byte sequence holding exactly one envelope.
 *
 * @throw MalformedValueException if bytes remain after the envelope
 */
Value Decode(const uint8_t *data, size_t size, const TypeRegistry &registry = TypeRegistry::Builtins(),
             ReaderConfig config = {});

inline Value Decode(const std::vector<uint8_t> &bytes, const TypeRegistry &registry = TypeRegistry::Builtins(),
                    ReaderConfig config = {}) {
  return Decode(bytes.data(), bytes.size(), registry, config);
}

}  // namespace graphbin::codec
