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

#include "codec/buffer.hpp"

#include <cstring>
#include <limits>
#include <utility>

#include "codec/exceptions.hpp"
#include "utils/cast.hpp"

namespace graphbin::codec {

Buffer::Buffer(std::vector<uint8_t> data) : data_(std::move(data)) {}

Buffer::Buffer(const uint8_t *data, size_t size) : data_(data, data + size) {}

void Buffer::WriteFloat(float value) { WriteUint32(utils::MemcpyCast<uint32_t>(value)); }

void Buffer::WriteDouble(double value) { WriteUint64(utils::MemcpyCast<uint64_t>(value)); }

void Buffer::WriteBytes(const uint8_t *data, size_t size) {
  if (size == 0) return;
  data_.insert(data_.end(), data, data + size);
}

void Buffer::WriteString(std::string_view value) {
  if (value.size() > static_cast<size_t>(std::numeric_limits<int32_t>::max())) {
    throw EncodePreconditionException("String of {} bytes doesn't fit the int32 length prefix", value.size());
  }
  WriteInt32(static_cast<int32_t>(value.size()));
  WriteBytes(reinterpret_cast<const uint8_t *>(value.data()), value.size());
}

float Buffer::ReadFloat() { return utils::MemcpyCast<float>(ReadUint32()); }

double Buffer::ReadDouble() { return utils::MemcpyCast<double>(ReadUint64()); }

void Buffer::EnsureReadable(size_t size) const {
  if (size > ReadableBytes()) {
    throw BufferUnderrunException("Tried to read {} bytes at position {}, but only {} bytes are available", size,
                                  read_pos_, ReadableBytes());
  }
}

void Buffer::ReadBytes(uint8_t *data, size_t size) {
  EnsureReadable(size);
  if (size == 0) return;
  memcpy(data, data_.data() + read_pos_, size);
  read_pos_ += size;
}

std::vector<uint8_t> Buffer::ReadBytes(size_t size) {
  EnsureReadable(size);
  std::vector<uint8_t> ret(data_.begin() + read_pos_, data_.begin() + read_pos_ + size);
  read_pos_ += size;
  return ret;
}

std::string Buffer::ReadString() {
  const auto start = read_pos_;
  const auto size = ReadInt32();
  if (size < 0) {
    read_pos_ = start;
    throw MalformedValueException("String length can't be negative, got {}", size);
  }
  if (static_cast<size_t>(size) > ReadableBytes()) {
    read_pos_ = start;
    EnsureReadable(sizeof(int32_t) + size);
  }
  std::string ret(reinterpret_cast<const char *>(data_.data() + read_pos_), size);
  read_pos_ += size;
  return ret;
}

Buffer Buffer::ReadSlice(size_t size) {
  EnsureReadable(size);
  Buffer slice(data_.data() + read_pos_, size);
  read_pos_ += size;
  return slice;
}

void Buffer::Clear() {
  data_.clear();
  read_pos_ = 0;
}

}  // namespace graphbin::codec
