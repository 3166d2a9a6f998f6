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

#include "codec/registry.hpp"

#include <utility>

#include "codec/exceptions.hpp"
#include "codec/serializers.hpp"
#include "utils/logging.hpp"

namespace graphbin::codec {

TypeRegistry TypeRegistry::CreateWithBuiltins() {
  TypeRegistry registry;
  RegisterLeafCodecs(&registry);
  RegisterCompositeCodecs(&registry);
  return registry;
}

const TypeRegistry &TypeRegistry::Builtins() {
  static const TypeRegistry kBuiltins = CreateWithBuiltins();
  return kBuiltins;
}

void TypeRegistry::Insert(TypeEntry entry) {
  if (!entry.codec.write || !entry.codec.read) {
    throw TypeRegistrationException("Codec for type code {:#04x} must provide both a write and a read function",
                                    entry.type_code);
  }
  if (entry.type_code == ToCode(DataType::UnspecifiedNull)) {
    throw TypeRegistrationException("Type code {:#04x} is reserved for the unspecified null", entry.type_code);
  }
  if (IsRegistered(entry.type_code)) {
    throw TypeRegistrationException("Type code {:#04x} is already registered for {} values", entry.type_code,
                                    ToString(entries_[entry.type_code]->kind));
  }
  const auto type_code = entry.type_code;
  entries_[type_code].emplace(std::move(entry));
}

void TypeRegistry::Register(uint8_t type_code, KindMatcher matcher, Codec codec) {
  if (!IsCustomTypeCode(type_code)) {
    throw TypeRegistrationException("Custom type code {:#04x} is outside of the custom range [{:#04x}, {:#04x}]",
                                    type_code, kCustomTypeCodeFirst, kCustomTypeCodeLast);
  }
  if (!matcher) {
    throw TypeRegistrationException("Custom type code {:#04x} needs a kind matcher", type_code);
  }
  Insert(TypeEntry{.type_code = type_code, .kind = Value::Type::Custom, .codec = std::move(codec)});
  custom_matchers_.emplace_back(std::move(matcher), type_code);
  spdlog::debug("Registered custom type code {:#04x}", type_code);
}

void TypeRegistry::RegisterBuiltin(DataType type_code, Value::Type kind, Codec codec) {
  const auto code = ToCode(type_code);
  if (IsCustomTypeCode(code)) {
    throw TypeRegistrationException("Built-in type code {:#04x} collides with the custom range", code);
  }
  if (kind == Value::Type::Null || kind == Value::Type::Custom) {
    throw TypeRegistrationException("{} values can't be bound to a built-in type code", ToString(kind));
  }
  auto &builtin_code = builtin_codes_[static_cast<size_t>(kind)];
  if (builtin_code) {
    throw TypeRegistrationException("{} values are already bound to type code {:#04x}", ToString(kind),
                                    *builtin_code);
  }
  Insert(TypeEntry{.type_code = code, .kind = kind, .codec = std::move(codec)});
  builtin_code = code;
  spdlog::trace("Registered {} for {} values", DataTypeToString(type_code), ToString(kind));
}

const TypeEntry &TypeRegistry::ResolveForEncode(const Value &value) const {
  switch (value.type()) {
    case Value::Type::Null:
      throw EncodePreconditionException("The universal null has no type code, it is written as the unspecified null");
    case Value::Type::Custom: {
      if (value.IsNull()) {
        const auto type_code = value.NullCustomTypeCode();
        if (!type_code) {
          throw EncodePreconditionException("A null custom value doesn't name its type and can't be encoded");
        }
        if (!IsCustomTypeCode(*type_code) || !IsRegistered(*type_code)) {
          throw UnsupportedTypeException("Custom type code {:#04x} isn't registered", *type_code);
        }
        return *entries_[*type_code];
      }
      for (const auto &[matcher, type_code] : custom_matchers_) {
        if (matcher(value)) return *entries_[type_code];
      }
      throw UnsupportedTypeException("No custom type is registered for values of type '{}'",
                                     value.ValueCustom().type_name);
    }
    default: {
      const auto &builtin_code = builtin_codes_[static_cast<size_t>(value.type())];
      if (!builtin_code) {
        throw UnsupportedTypeException("No type code is registered for {} values", ToString(value.type()));
      }
      DGB_ASSERT(IsRegistered(*builtin_code), "Built-in lookup table points to an unregistered type code");
      return *entries_[*builtin_code];
    }
  }
}

const TypeEntry &TypeRegistry::ResolveForDecode(uint8_t type_code) const {
  if (!IsRegistered(type_code)) [[unlikely]] {
    if (IsCustomTypeCode(type_code)) {
      throw UnsupportedTypeException("Custom type code {:#04x} isn't registered", type_code);
    }
    throw UnsupportedTypeException("Unknown type code {:#04x}", type_code);
  }
  return *entries_[type_code];
}

}  // namespace graphbin::codec
