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

#include <cstdint>
#include <limits>
#include <string>

#include "codec/buffer.hpp"
#include "codec/codes.hpp"
#include "codec/exceptions.hpp"
#include "codec/reader.hpp"
#include "codec/registry.hpp"
#include "codec/serializers.hpp"
#include "codec/value.hpp"
#include "codec/writer.hpp"
#include "utils/temporal.hpp"

namespace graphbin::codec {

namespace {

// Bool
void SaveBool(const Value &value, Buffer *buffer, const Writer &) {
  buffer->WriteUint8(value.ValueBool() ? 0x01 : 0x00);
}

Value LoadBool(Buffer *buffer, Reader &) {
  const auto byte = buffer->ReadUint8();
  if (byte > 0x01) {
    throw MalformedValueException("Invalid boolean byte {:#04x}", byte);
  }
  return Value(byte == 0x01);
}

// Integral and floating point numbers
void SaveByte(const Value &value, Buffer *buffer, const Writer &) { buffer->WriteInt8(value.ValueByte()); }
Value LoadByte(Buffer *buffer, Reader &) { return Value(buffer->ReadInt8()); }

void SaveShort(const Value &value, Buffer *buffer, const Writer &) { buffer->WriteInt16(value.ValueShort()); }
Value LoadShort(Buffer *buffer, Reader &) { return Value(buffer->ReadInt16()); }

void SaveInt(const Value &value, Buffer *buffer, const Writer &) { buffer->WriteInt32(value.ValueInt()); }
Value LoadInt(Buffer *buffer, Reader &) { return Value(buffer->ReadInt32()); }

void SaveLong(const Value &value, Buffer *buffer, const Writer &) { buffer->WriteInt64(value.ValueLong()); }
Value LoadLong(Buffer *buffer, Reader &) { return Value(buffer->ReadInt64()); }

void SaveFloat(const Value &value, Buffer *buffer, const Writer &) { buffer->WriteFloat(value.ValueFloat()); }
Value LoadFloat(Buffer *buffer, Reader &) { return Value(buffer->ReadFloat()); }

void SaveDouble(const Value &value, Buffer *buffer, const Writer &) { buffer->WriteDouble(value.ValueDouble()); }
Value LoadDouble(Buffer *buffer, Reader &) { return Value(buffer->ReadDouble()); }

// Length prefixed byte sequences
void SaveString(const Value &value, Buffer *buffer, const Writer &) { buffer->WriteString(value.ValueString()); }
Value LoadString(Buffer *buffer, Reader &) { return Value(buffer->ReadString()); }

void SaveBinary(const Value &value, Buffer *buffer, const Writer &) {
  const auto &bytes = value.ValueBinary();
  if (bytes.size() > static_cast<size_t>(std::numeric_limits<int32_t>::max())) {
    throw EncodePreconditionException("Binary value of {} bytes doesn't fit the length prefix", bytes.size());
  }
  buffer->WriteInt32(static_cast<int32_t>(bytes.size()));
  buffer->WriteBytes(bytes.data(), bytes.size());
}

Value LoadBinary(Buffer *buffer, Reader &) {
  const auto size = buffer->ReadInt32();
  if (size < 0) {
    throw MalformedValueException("Binary value has negative length {}", size);
  }
  return Value::MakeBinary(buffer->ReadBytes(static_cast<size_t>(size)));
}

void SaveUuid(const Value &value, Buffer *buffer, const Writer &) {
  const auto &bytes = value.ValueUuid().bytes();
  buffer->WriteBytes(bytes.data(), bytes.size());
}

Value LoadUuid(Buffer *buffer, Reader &) {
  utils::UUID::arr_t bytes;
  buffer->ReadBytes(bytes.data(), bytes.size());
  return Value(utils::UUID(bytes));
}

// Temporal types. The field ranges are checked by the utils::temporal
// constructors, a body they reject is malformed.
void SaveDateBody(const utils::Date &date, Buffer *buffer) {
  buffer->WriteInt32(date.year);
  buffer->WriteUint8(date.month);
  buffer->WriteUint8(date.day);
}

utils::Date LoadDateBody(Buffer *buffer) {
  utils::DateParameters params;
  params.year = buffer->ReadInt32();
  params.month = buffer->ReadUint8();
  params.day = buffer->ReadUint8();
  try {
    return utils::Date(params);
  } catch (const utils::temporal::InvalidArgumentException &e) {
    throw MalformedValueException("Invalid date body: {}", e.what());
  }
}

void SaveLocalTimeBody(const utils::LocalTime &local_time, Buffer *buffer) {
  buffer->WriteUint8(local_time.hour);
  buffer->WriteUint8(local_time.minute);
  buffer->WriteUint8(local_time.second);
  buffer->WriteInt32(static_cast<int32_t>(local_time.nanosecond));
}

utils::LocalTime LoadLocalTimeBody(Buffer *buffer) {
  utils::LocalTimeParameters params;
  params.hour = buffer->ReadUint8();
  params.minute = buffer->ReadUint8();
  params.second = buffer->ReadUint8();
  params.nanosecond = buffer->ReadInt32();
  try {
    return utils::LocalTime(params);
  } catch (const utils::temporal::InvalidArgumentException &e) {
    throw MalformedValueException("Invalid local time body: {}", e.what());
  }
}

void SaveDate(const Value &value, Buffer *buffer, const Writer &) { SaveDateBody(value.ValueDate(), buffer); }
Value LoadDate(Buffer *buffer, Reader &) { return Value(LoadDateBody(buffer)); }

void SaveLocalTime(const Value &value, Buffer *buffer, const Writer &) {
  SaveLocalTimeBody(value.ValueLocalTime(), buffer);
}
Value LoadLocalTime(Buffer *buffer, Reader &) { return Value(LoadLocalTimeBody(buffer)); }

void SaveLocalDateTime(const Value &value, Buffer *buffer, const Writer &) {
  const auto &local_date_time = value.ValueLocalDateTime();
  SaveDateBody(local_date_time.date, buffer);
  SaveLocalTimeBody(local_date_time.local_time, buffer);
}

Value LoadLocalDateTime(Buffer *buffer, Reader &) {
  const auto date = LoadDateBody(buffer);
  const auto local_time = LoadLocalTimeBody(buffer);
  return Value(utils::LocalDateTime(date, local_time));
}

void SaveTimestamp(const Value &value, Buffer *buffer, const Writer &) {
  buffer->WriteInt64(value.ValueTimestamp().milliseconds);
}
Value LoadTimestamp(Buffer *buffer, Reader &) { return Value(utils::Timestamp(buffer->ReadInt64())); }

void SaveDuration(const Value &value, Buffer *buffer, const Writer &) {
  const auto &duration = value.ValueDuration();
  buffer->WriteInt64(duration.seconds);
  buffer->WriteInt32(duration.nanoseconds);
}

Value LoadDuration(Buffer *buffer, Reader &) {
  const auto seconds = buffer->ReadInt64();
  const auto nanoseconds = buffer->ReadInt32();
  try {
    return Value(utils::Duration(seconds, nanoseconds));
  } catch (const utils::temporal::InvalidArgumentException &e) {
    throw MalformedValueException("Invalid duration body: {}", e.what());
  }
}

}  // namespace

void RegisterLeafCodecs(TypeRegistry *registry) {
  registry->RegisterBuiltin(DataType::Boolean, Value::Type::Bool, {SaveBool, LoadBool});
  registry->RegisterBuiltin(DataType::Byte, Value::Type::Byte, {SaveByte, LoadByte});
  registry->RegisterBuiltin(DataType::Short, Value::Type::Short, {SaveShort, LoadShort});
  registry->RegisterBuiltin(DataType::Int, Value::Type::Int, {SaveInt, LoadInt});
  registry->RegisterBuiltin(DataType::Long, Value::Type::Long, {SaveLong, LoadLong});
  registry->RegisterBuiltin(DataType::Float, Value::Type::Float, {SaveFloat, LoadFloat});
  registry->RegisterBuiltin(DataType::Double, Value::Type::Double, {SaveDouble, LoadDouble});
  registry->RegisterBuiltin(DataType::String, Value::Type::String, {SaveString, LoadString});
  registry->RegisterBuiltin(DataType::Binary, Value::Type::Binary, {SaveBinary, LoadBinary});
  registry->RegisterBuiltin(DataType::Uuid, Value::Type::Uuid, {SaveUuid, LoadUuid});
  registry->RegisterBuiltin(DataType::Date, Value::Type::Date, {SaveDate, LoadDate});
  registry->RegisterBuiltin(DataType::LocalTime, Value::Type::LocalTime, {SaveLocalTime, LoadLocalTime});
  registry->RegisterBuiltin(DataType::LocalDateTime, Value::Type::LocalDateTime,
                            {SaveLocalDateTime, LoadLocalDateTime});
  registry->RegisterBuiltin(DataType::Timestamp, Value::Type::Timestamp, {SaveTimestamp, LoadTimestamp});
  registry->RegisterBuiltin(DataType::Duration, Value::Type::Duration, {SaveDuration, LoadDuration});
}

}  // namespace graphbin::codec
