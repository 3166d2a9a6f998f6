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

#include "utils/exceptions.hpp"

namespace graphbin::codec {

/// Base of every error raised while encoding or decoding. A failure anywhere
/// inside a nested value aborts the whole pass; the position of the buffer the
/// pass worked on is not meaningful afterwards.
class CodecException : public utils::BasicException {
 public:
  using utils::BasicException::BasicException;
  SPECIALIZE_GET_EXCEPTION_NAME(CodecException)
};

/// Encoding found no registered kind for a value, or decoding hit a type code
/// that isn't registered.
class UnsupportedTypeException final : public CodecException {
 public:
  using CodecException::CodecException;
  SPECIALIZE_GET_EXCEPTION_NAME(UnsupportedTypeException)
};

/// A body violates the structural constraints of its type.
class MalformedValueException final : public CodecException {
 public:
  using CodecException::CodecException;
  SPECIALIZE_GET_EXCEPTION_NAME(MalformedValueException)
};

/// A read needs more bytes than the buffer holds.
class BufferUnderrunException final : public CodecException {
 public:
  using CodecException::CodecException;
  SPECIALIZE_GET_EXCEPTION_NAME(BufferUnderrunException)
};

/// A value can't legally occupy the slot it was given to.
class EncodePreconditionException final : public CodecException {
 public:
  using CodecException::CodecException;
  SPECIALIZE_GET_EXCEPTION_NAME(EncodePreconditionException)
};

class TypeRegistrationException final : public CodecException {
 public:
  using CodecException::CodecException;
  SPECIALIZE_GET_EXCEPTION_NAME(TypeRegistrationException)
};

/// Accessing a `Value` as a kind it doesn't hold.
class ValueException final : public utils::BasicException {
 public:
  using utils::BasicException::BasicException;
  SPECIALIZE_GET_EXCEPTION_NAME(ValueException)
};

}  // namespace graphbin::codec
