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

#include "codec/codes.hpp"

namespace graphbin::codec {

std::string_view DataTypeToString(DataType type) {
  switch (type) {
    case DataType::Int:
      return "INT";
    case DataType::Long:
      return "LONG";
    case DataType::String:
      return "STRING";
    case DataType::Timestamp:
      return "TIMESTAMP";
    case DataType::Date:
      return "DATE";
    case DataType::Float:
      return "FLOAT";
    case DataType::List:
      return "LIST";
    case DataType::Map:
      return "MAP";
    case DataType::Set:
      return "SET";
    case DataType::Uuid:
      return "UUID";
    case DataType::Edge:
      return "EDGE";
    case DataType::Path:
      return "PATH";
    case DataType::Property:
      return "PROPERTY";
    case DataType::Vertex:
      return "VERTEX";
    case DataType::VertexProperty:
      return "VERTEX_PROPERTY";
    case DataType::Direction:
      return "DIRECTION";
    case DataType::Byte:
      return "BYTE";
    case DataType::Binary:
      return "BINARY";
    case DataType::Short:
      return "SHORT";
    case DataType::Boolean:
      return "BOOLEAN";
    case DataType::Duration:
      return "DURATION";
    case DataType::Double:
      return "DOUBLE";
    case DataType::LocalDateTime:
      return "LOCAL_DATE_TIME";
    case DataType::LocalTime:
      return "LOCAL_TIME";
    case DataType::UnspecifiedNull:
      return "UNSPECIFIED_NULL";
  }
  return "UNKNOWN";
}

}  // namespace graphbin::codec
