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

#include "codec/value.hpp"

#include <array>
#include <ostream>
#include <string_view>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "codec/exceptions.hpp"
#include "utils/enum.hpp"
#include "utils/logging.hpp"

using namespace std::string_view_literals;

namespace graphbin::codec {

namespace {
inline constexpr std::array kDirectionMappings{std::pair{"OUT"sv, Direction::OUT}, std::pair{"IN"sv, Direction::IN},
                                               std::pair{"BOTH"sv, Direction::BOTH}};
}  // namespace

std::string_view DirectionToString(Direction direction) {
  const auto name = utils::EnumToString(direction, kDirectionMappings);
  GB_ASSERT(name, "Unknown Direction {}", static_cast<int>(direction));
  return *name;
}

std::optional<Direction> StringToDirection(std::string_view name) {
  return utils::StringToEnum<Direction>(name, kDirectionMappings);
}

Value::Value(Vertex value) : type_(Type::Vertex), storage_(std::make_shared<const Vertex>(std::move(value))) {}

Value::Value(Edge value) : type_(Type::Edge), storage_(std::make_shared<const Edge>(std::move(value))) {}

Value::Value(Path value) : type_(Type::Path), storage_(std::make_shared<const Path>(std::move(value))) {}

Value::Value(Property value) : type_(Type::Property), storage_(std::make_shared<const Property>(std::move(value))) {}

Value::Value(VertexProperty value)
    : type_(Type::VertexProperty), storage_(std::make_shared<const VertexProperty>(std::move(value))) {}

Value::Value(CustomValue value)
    : type_(Type::Custom), storage_(std::make_shared<const CustomValue>(std::move(value))) {}

Value Value::MakeSet(TList elements) {
  Value ret(std::move(elements));
  ret.type_ = Type::Set;
  return ret;
}

Value Value::MakeBinary(TBinary bytes) {
  Value ret;
  ret.type_ = Type::Binary;
  ret.storage_ = std::move(bytes);
  return ret;
}

Value Value::TypedNull(Type type) {
  Value ret;
  ret.type_ = type;
  return ret;
}

Value Value::TypedNullCustom(uint8_t type_code) {
  auto ret = TypedNull(Type::Custom);
  ret.null_custom_type_code_ = type_code;
  return ret;
}

void Value::CheckType(Type expected) const {
  if (type_ != expected) [[unlikely]] {
    throw ValueException("Expected a {} value, but the value is of type {}", ToString(expected), ToString(type_));
  }
  if (IsNull()) [[unlikely]] {
    throw ValueException("Can't extract a {} from a null value", ToString(expected));
  }
}

#define DEFINE_VALUE_GETTER(type_name, return_type, alternative) \
  return_type Value::Value##type_name() const {                  \
    CheckType(Type::type_name);                                  \
    return std::get<alternative>(storage_);                      \
  }

DEFINE_VALUE_GETTER(Bool, bool, bool)
DEFINE_VALUE_GETTER(Byte, int8_t, int8_t)
DEFINE_VALUE_GETTER(Short, int16_t, int16_t)
DEFINE_VALUE_GETTER(Int, int32_t, int32_t)
DEFINE_VALUE_GETTER(Long, int64_t, int64_t)
DEFINE_VALUE_GETTER(Float, float, float)
DEFINE_VALUE_GETTER(Double, double, double)
DEFINE_VALUE_GETTER(String, const std::string &, std::string)
DEFINE_VALUE_GETTER(Binary, const Value::TBinary &, TBinary)
DEFINE_VALUE_GETTER(Uuid, const utils::UUID &, utils::UUID)
DEFINE_VALUE_GETTER(Date, const utils::Date &, utils::Date)
DEFINE_VALUE_GETTER(LocalTime, const utils::LocalTime &, utils::LocalTime)
DEFINE_VALUE_GETTER(LocalDateTime, const utils::LocalDateTime &, utils::LocalDateTime)
DEFINE_VALUE_GETTER(Timestamp, const utils::Timestamp &, utils::Timestamp)
DEFINE_VALUE_GETTER(Duration, const utils::Duration &, utils::Duration)
DEFINE_VALUE_GETTER(Direction, Direction, Direction)
DEFINE_VALUE_GETTER(List, const Value::TList &, TList)
DEFINE_VALUE_GETTER(Set, const Value::TList &, TList)
DEFINE_VALUE_GETTER(Map, const Value::TMap &, TMap)

#undef DEFINE_VALUE_GETTER

#define DEFINE_SHARED_VALUE_GETTER(type_name)                           \
  const type_name &Value::Value##type_name() const {                    \
    CheckType(Type::type_name);                                         \
    return *std::get<std::shared_ptr<const type_name>>(storage_);       \
  }

DEFINE_SHARED_VALUE_GETTER(Vertex)
DEFINE_SHARED_VALUE_GETTER(Edge)
DEFINE_SHARED_VALUE_GETTER(Path)
DEFINE_SHARED_VALUE_GETTER(Property)
DEFINE_SHARED_VALUE_GETTER(VertexProperty)

#undef DEFINE_SHARED_VALUE_GETTER

const CustomValue &Value::ValueCustom() const {
  CheckType(Type::Custom);
  return *std::get<std::shared_ptr<const CustomValue>>(storage_);
}

bool operator==(const Value &lhs, const Value &rhs) {
  if (lhs.type_ != rhs.type_) return false;
  if (lhs.IsNull() || rhs.IsNull()) {
    return lhs.IsNull() && rhs.IsNull() && lhs.null_custom_type_code_ == rhs.null_custom_type_code_;
  }

  switch (lhs.type_) {
    case Value::Type::Null:
      return true;
    case Value::Type::Vertex:
      return lhs.ValueVertex() == rhs.ValueVertex();
    case Value::Type::Edge:
      return lhs.ValueEdge() == rhs.ValueEdge();
    case Value::Type::Path:
      return lhs.ValuePath() == rhs.ValuePath();
    case Value::Type::Property:
      return lhs.ValueProperty() == rhs.ValueProperty();
    case Value::Type::VertexProperty:
      return lhs.ValueVertexProperty() == rhs.ValueVertexProperty();
    case Value::Type::Custom:
      return lhs.ValueCustom() == rhs.ValueCustom();
    default:
      return lhs.storage_ == rhs.storage_;
  }
}

std::string_view ToString(Value::Type type) {
  switch (type) {
    case Value::Type::Null:
      return "null";
    case Value::Type::Bool:
      return "bool";
    case Value::Type::Byte:
      return "byte";
    case Value::Type::Short:
      return "short";
    case Value::Type::Int:
      return "int";
    case Value::Type::Long:
      return "long";
    case Value::Type::Float:
      return "float";
    case Value::Type::Double:
      return "double";
    case Value::Type::String:
      return "string";
    case Value::Type::Binary:
      return "binary";
    case Value::Type::Uuid:
      return "uuid";
    case Value::Type::Date:
      return "date";
    case Value::Type::LocalTime:
      return "local_time";
    case Value::Type::LocalDateTime:
      return "local_date_time";
    case Value::Type::Timestamp:
      return "timestamp";
    case Value::Type::Duration:
      return "duration";
    case Value::Type::Direction:
      return "direction";
    case Value::Type::List:
      return "list";
    case Value::Type::Set:
      return "set";
    case Value::Type::Map:
      return "map";
    case Value::Type::Vertex:
      return "vertex";
    case Value::Type::Edge:
      return "edge";
    case Value::Type::Path:
      return "path";
    case Value::Type::Property:
      return "property";
    case Value::Type::VertexProperty:
      return "vertex_property";
    case Value::Type::Custom:
      return "custom";
  }
  LOG_FATAL("Unsupported Value::Type {}", static_cast<int>(type));
}

std::ostream &operator<<(std::ostream &os, const Value::Type type) { return os << ToString(type); }

namespace {

template <typename TIterable, typename TFunc>
void PrintIterable(std::ostream &os, const TIterable &iterable, TFunc &&print_item) {
  bool first = true;
  for (const auto &item : iterable) {
    if (!first) os << ", ";
    first = false;
    print_item(item);
  }
}

void PrintPropertyMap(std::ostream &os, const PropertyMap &properties) {
  os << "{";
  PrintIterable(os, properties, [&os](const auto &item) { os << item.first << ": " << item.second; });
  os << "}";
}

}  // namespace

std::ostream &operator<<(std::ostream &os, const Value &value) {
  if (value.IsNull()) {
    if (value.type() == Value::Type::Null) return os << "null";
    if (const auto type_code = value.NullCustomTypeCode()) {
      return os << fmt::format("null:{}({:#04x})", ToString(value.type()), *type_code);
    }
    return os << "null:" << value.type();
  }
  switch (value.type()) {
    case Value::Type::Null:
      return os << "null";
    case Value::Type::Bool:
      return os << (value.ValueBool() ? "true" : "false");
    case Value::Type::Byte:
      return os << static_cast<int>(value.ValueByte());
    case Value::Type::Short:
      return os << value.ValueShort();
    case Value::Type::Int:
      return os << value.ValueInt();
    case Value::Type::Long:
      return os << value.ValueLong() << "L";
    case Value::Type::Float:
      return os << value.ValueFloat() << "f";
    case Value::Type::Double:
      return os << value.ValueDouble();
    case Value::Type::String:
      return os << '"' << value.ValueString() << '"';
    case Value::Type::Binary:
      return os << "0x" << fmt::format("{:02x}", fmt::join(value.ValueBinary(), ""));
    case Value::Type::Uuid:
      return os << value.ValueUuid();
    case Value::Type::Date:
      return os << value.ValueDate();
    case Value::Type::LocalTime:
      return os << value.ValueLocalTime();
    case Value::Type::LocalDateTime:
      return os << value.ValueLocalDateTime();
    case Value::Type::Timestamp:
      return os << value.ValueTimestamp();
    case Value::Type::Duration:
      return os << value.ValueDuration();
    case Value::Type::Direction:
      return os << DirectionToString(value.ValueDirection());
    case Value::Type::List:
      os << "[";
      PrintIterable(os, value.ValueList(), [&os](const auto &item) { os << item; });
      return os << "]";
    case Value::Type::Set:
      os << "set{";
      PrintIterable(os, value.ValueSet(), [&os](const auto &item) { os << item; });
      return os << "}";
    case Value::Type::Map:
      os << "{";
      PrintIterable(os, value.ValueMap(), [&os](const auto &item) { os << item.first << ": " << item.second; });
      return os << "}";
    case Value::Type::Vertex: {
      const auto &vertex = value.ValueVertex();
      os << "v[" << vertex.id << "]:" << vertex.label << " [";
      PrintIterable(os, vertex.properties, [&os](const auto &item) { os << Value(item); });
      return os << "]";
    }
    case Value::Type::Edge: {
      const auto &edge = value.ValueEdge();
      os << "e[" << edge.id << "][" << edge.out_id << ":" << edge.out_label << "-" << edge.label << "->"
         << edge.in_id << ":" << edge.in_label << "] ";
      PrintPropertyMap(os, edge.properties);
      return os;
    }
    case Value::Type::Path: {
      const auto &path = value.ValuePath();
      os << "path[";
      PrintIterable(os, path.objects, [&os](const auto &item) { os << item; });
      return os << "]";
    }
    case Value::Type::Property: {
      const auto &property = value.ValueProperty();
      return os << "p[" << property.key << "->" << property.value << "]";
    }
    case Value::Type::VertexProperty: {
      const auto &vertex_property = value.ValueVertexProperty();
      os << "vp[" << vertex_property.id << "][" << vertex_property.label << "->" << vertex_property.value << "] ";
      PrintPropertyMap(os, vertex_property.properties);
      return os;
    }
    case Value::Type::Custom: {
      const auto &custom = value.ValueCustom();
      os << custom.type_name << "(";
      PrintIterable(os, custom.fields, [&os](const auto &item) { os << item; });
      return os << ")";
    }
  }
  return os;
}

}  // namespace graphbin::codec
