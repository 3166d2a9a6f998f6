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
#include <string>
#include <string_view>
#include <vector>

#include "utils/endian.hpp"

namespace graphbin::codec {

/**
 * @brief Buffer
 *
 * Byte sequence with an independent write cursor (the end of the written data)
 * and read cursor. All multi-byte values are written and read in big-endian
 * byte order.
 *
 * Reading past the written data throws `BufferUnderrunException` and leaves
 * the read cursor where it was; nothing is ever returned short or zero filled.
 *
 * This buffer is NOT thread safe. Every encode or decode pass should own its
 * buffer.
 */
class Buffer final {
 public:
  Buffer() = default;
  explicit Buffer(std::vector<uint8_t> data);
  Buffer(const uint8_t *data, size_t size);

  void WriteUint8(uint8_t value) { WriteBigEndian(value); }
  void WriteUint16(uint16_t value) { WriteBigEndian(value); }
  void WriteUint32(uint32_t value) { WriteBigEndian(value); }
  void WriteUint64(uint64_t value) { WriteBigEndian(value); }
  void WriteInt8(int8_t value) { WriteBigEndian(value); }
  void WriteInt16(int16_t value) { WriteBigEndian(value); }
  void WriteInt32(int32_t value) { WriteBigEndian(value); }
  void WriteInt64(int64_t value) { WriteBigEndian(value); }
  void WriteFloat(float value);
  void WriteDouble(double value);

  void WriteBytes(const uint8_t *data, size_t size);

  /// Writes an int32 byte length followed by the raw bytes of `value`.
  void WriteString(std::string_view value);

  uint8_t ReadUint8() { return ReadBigEndian<uint8_t>(); }
  uint16_t ReadUint16() { return ReadBigEndian<uint16_t>(); }
  uint32_t ReadUint32() { return ReadBigEndian<uint32_t>(); }
  uint64_t ReadUint64() { return ReadBigEndian<uint64_t>(); }
  int8_t ReadInt8() { return ReadBigEndian<int8_t>(); }
  int16_t ReadInt16() { return ReadBigEndian<int16_t>(); }
  int32_t ReadInt32() { return ReadBigEndian<int32_t>(); }
  int64_t ReadInt64() { return ReadBigEndian<int64_t>(); }
  float ReadFloat();
  double ReadDouble();

  void ReadBytes(uint8_t *data, size_t size);
  std::vector<uint8_t> ReadBytes(size_t size);

  /// Reads a string written by `WriteString`.
  /// @throw MalformedValueException if the length prefix is negative
  std::string ReadString();

  /// Moves the next `size` bytes into a new buffer, positioned at its start.
  Buffer ReadSlice(size_t size);

  /// Number of written bytes that haven't been read yet.
  size_t ReadableBytes() const { return data_.size() - read_pos_; }

  size_t ReadPosition() const { return read_pos_; }

  /// Number of bytes written so far.
  size_t size() const { return data_.size(); }

  const uint8_t *data() const { return data_.data(); }

  const std::vector<uint8_t> &bytes() const { return data_; }

  /// Drops all data and resets both cursors. Doesn't release the storage.
  void Clear();

 private:
  template <typename T>
  void WriteBigEndian(T value) {
    const T encoded = utils::HostToBigEndian(value);
    WriteBytes(reinterpret_cast<const uint8_t *>(&encoded), sizeof(T));
  }

  template <typename T>
  T ReadBigEndian() {
    T encoded;
    ReadBytes(reinterpret_cast<uint8_t *>(&encoded), sizeof(T));
    return utils::BigEndianToHost(encoded);
  }

  void EnsureReadable(size_t size) const;

  std::vector<uint8_t> data_;
  size_t read_pos_{0};
};

}  // namespace graphbin::codec
