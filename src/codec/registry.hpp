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
#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

#include "codec/codec.hpp"
#include "codec/codes.hpp"
#include "codec/value.hpp"

namespace graphbin::codec {

/// Binding of one wire type code to its codec and to the value kind it
/// decodes into.
struct TypeEntry {
  uint8_t type_code;
  Value::Type kind;
  Codec codec;
};

/**
 * The table binding value kinds and one-byte type codes to codecs.
 *
 * A registry is built once, from the built-in catalogue plus any custom
 * registrations, and is only read afterwards. Registration isn't synchronized:
 * it has to finish before the registry is shared between threads. Once built,
 * any number of concurrent encode and decode passes can read it.
 */
class TypeRegistry final {
 public:
  /// Creates an empty registry. Most users want `CreateWithBuiltins`.
  TypeRegistry() = default;

  /// Creates a registry holding the full built-in catalogue, ready for custom
  /// registrations.
  static TypeRegistry CreateWithBuiltins();

  /// Process-wide registry with only the built-in catalogue.
  static const TypeRegistry &Builtins();

  /**
   * Registers a custom type.
   *
   * @param type_code code from the custom range [0xC0, 0xEF]
   * @param matcher selects, on encode, the `Custom` values of this type
   * @param codec body codec; the Writer frames the body with an int32 length
   *
   * @throw TypeRegistrationException if the code is outside of the custom
   *        range or already in use, or if the matcher or codec is empty
   */
  void Register(uint8_t type_code, KindMatcher matcher, Codec codec);

  /**
   * Binds a built-in kind to its catalogue code.
   *
   * @throw TypeRegistrationException if the code is in the custom range, is
   *        reserved, is already in use or the kind is already bound
   */
  void RegisterBuiltin(DataType type_code, Value::Type kind, Codec codec);

  /**
   * Finds the code and codec for a value that isn't the universal null.
   *
   * @throw UnsupportedTypeException if no registered kind matches, or a custom
   *        typed null names an unregistered code
   * @throw EncodePreconditionException for the universal null and for a
   *        `TypedNull(Type::Custom)`, neither of which names a type
   */
  const TypeEntry &ResolveForEncode(const Value &value) const;

  /**
   * @throw UnsupportedTypeException if the code isn't registered
   */
  const TypeEntry &ResolveForDecode(uint8_t type_code) const;

  bool IsRegistered(uint8_t type_code) const { return entries_[type_code].has_value(); }

 private:
  void Insert(TypeEntry entry);

  std::array<std::optional<TypeEntry>, 256> entries_;
  // Encode direction lookup for built-in kinds, keyed by Value::Type.
  std::array<std::optional<uint8_t>, Value::kTypeCount> builtin_codes_;
  // Custom kinds are tried in registration order.
  std::vector<std::pair<KindMatcher, uint8_t>> custom_matchers_;
};

}  // namespace graphbin::codec
