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

#include "codec/reader.hpp"

#include "codec/codes.hpp"
#include "codec/exceptions.hpp"
#include "utils/logging.hpp"
#include "utils/on_scope_exit.hpp"

namespace graphbin::codec {

namespace {

int32_t ReadBodyLength(uint8_t type_code, Buffer *buffer) {
  const auto length = buffer->ReadInt32();
  if (length < 0) {
    throw MalformedValueException("Body of custom type code {:#04x} has negative length {}", type_code, length);
  }
  return length;
}

}  // namespace

Value Reader::ReadValue(Buffer *buffer) {
  ++depth_;
  utils::OnScopeExit on_exit{[this] { --depth_; }};
  if (config_.max_depth != 0 && depth_ > config_.max_depth) [[unlikely]] {
    throw MalformedValueException("Value is nested deeper than the allowed {} levels", config_.max_depth);
  }

  const auto type_code = buffer->ReadUint8();
  if (type_code == ToCode(DataType::UnspecifiedNull)) return {};

  if (IsCustomTypeCode(type_code) && !registry_->IsRegistered(type_code) &&
      config_.unknown_custom_types == UnknownCustomTypePolicy::kSkip) {
    SkipCustomValue(type_code, buffer);
    return {};
  }

  const auto &entry = registry_->ResolveForDecode(type_code);
  const auto flag = buffer->ReadUint8();
  switch (flag) {
    case kValueFlagNull:
      if (IsCustomTypeCode(type_code)) return Value::TypedNullCustom(type_code);
      return Value::TypedNull(entry.kind);
    case kValueFlagNone:
      break;
    default:
      throw MalformedValueException("Invalid value flag {:#04x} after type code {:#04x}", flag, type_code);
  }

  if (IsCustomTypeCode(type_code)) return ReadCustomBody(entry, buffer);
  return entry.codec.read(buffer, *this);
}

Value Reader::ReadCustomBody(const TypeEntry &entry, Buffer *buffer) {
  const auto length = ReadBodyLength(entry.type_code, buffer);
  auto body = buffer->ReadSlice(length);
  auto value = entry.codec.read(&body, *this);
  if (body.ReadableBytes() != 0) {
    throw MalformedValueException("Codec of custom type code {:#04x} left {} of {} body bytes unread",
                                  entry.type_code, body.ReadableBytes(), length);
  }
  return value;
}

void Reader::SkipCustomValue(uint8_t type_code, Buffer *buffer) {
  const auto flag = buffer->ReadUint8();
  if (flag == kValueFlagNull) {
    spdlog::warn("Skipped a null value of unknown custom type code {:#04x}", type_code);
    return;
  }
  if (flag != kValueFlagNone) {
    throw MalformedValueException("Invalid value flag {:#04x} after type code {:#04x}", flag, type_code);
  }
  const auto length = ReadBodyLength(type_code, buffer);
  [[maybe_unused]] const auto skipped = buffer->ReadSlice(length);
  spdlog::warn("Skipped {} body bytes of unknown custom type code {:#04x}", length, type_code);
}

Value Decode(const uint8_t *data, size_t size, const TypeRegistry &registry, ReaderConfig config) {
  Buffer buffer(data, size);
  auto value = Reader{registry, config}.ReadValue(&buffer);
  if (buffer.ReadableBytes() != 0) {
    throw MalformedValueException("{} trailing bytes after the encoded value", buffer.ReadableBytes());
  }
  return value;
}

}  // namespace graphbin::codec
