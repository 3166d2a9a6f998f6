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

#include "codec/writer.hpp"

#include <limits>

#include "codec/codes.hpp"
#include "codec/exceptions.hpp"

namespace graphbin::codec {

void Writer::WriteValue(const Value &value, Buffer *buffer) const {
  if (value.type() == Value::Type::Null) {
    buffer->WriteUint8(ToCode(DataType::UnspecifiedNull));
    return;
  }

  const auto &entry = registry_->ResolveForEncode(value);
  buffer->WriteUint8(entry.type_code);
  if (value.IsNull()) {
    buffer->WriteUint8(kValueFlagNull);
    return;
  }
  buffer->WriteUint8(kValueFlagNone);

  if (!IsCustomTypeCode(entry.type_code)) {
    entry.codec.write(value, buffer, *this);
    return;
  }

  // Custom bodies are length framed so that readers without the codec can
  // step over them.
  Buffer body;
  entry.codec.write(value, &body, *this);
  if (body.size() > static_cast<size_t>(std::numeric_limits<int32_t>::max())) {
    throw EncodePreconditionException("Body of custom type code {:#04x} is {} bytes long, which doesn't fit the length prefix",
                                      entry.type_code, body.size());
  }
  buffer->WriteInt32(static_cast<int32_t>(body.size()));
  buffer->WriteBytes(body.data(), body.size());
}

std::vector<uint8_t> Encode(const Value &value, const TypeRegistry &registry) {
  Buffer buffer;
  Writer{registry}.WriteValue(value, &buffer);
  return buffer.bytes();
}

}  // namespace graphbin::codec
