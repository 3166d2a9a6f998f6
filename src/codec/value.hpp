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
#include <iosfwd>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "utils/temporal.hpp"
#include "utils/uuid.hpp"

namespace graphbin::codec {

enum class Direction : uint8_t { OUT, IN, BOTH };

std::string_view DirectionToString(Direction direction);
std::optional<Direction> StringToDirection(std::string_view name);

struct Vertex;
struct Edge;
struct Path;
struct Property;
struct VertexProperty;
struct CustomValue;

/**
 * Stores a decoded (or to be encoded) value and its kind.
 *
 * Values can be of a number of predefined kinds that are enumerated in
 * Value::Type. Each kind corresponds to exactly one C++ type, and each kind is
 * bound to exactly one wire type code by the `TypeRegistry`.
 *
 * Besides the universal null (a default constructed Value, which has no kind),
 * every kind has a typed null: a value that declares its kind but holds no
 * payload. See `Value::TypedNull`.
 *
 * Graph entities and custom values are immutable once wrapped in a Value and
 * are shared between copies.
 */
class Value {
 public:
  /** A value kind. Each kind corresponds to exactly one C++ type */
  enum class Type : uint8_t {
    Null,
    Bool,
    Byte,
    Short,
    Int,
    Long,
    Float,
    Double,
    String,
    Binary,
    Uuid,
    Date,
    LocalTime,
    LocalDateTime,
    Timestamp,
    Duration,
    Direction,
    List,
    Set,
    Map,
    Vertex,
    Edge,
    Path,
    Property,
    VertexProperty,
    Custom
  };

  static constexpr size_t kTypeCount = static_cast<size_t>(Type::Custom) + 1;

  using TList = std::vector<Value>;
  // Keys may be any value, including composites, so the map is kept as an
  // ordered sequence of pairs. Encoding preserves the order.
  using TMap = std::vector<std::pair<Value, Value>>;
  using TBinary = std::vector<uint8_t>;

  /** Constructs the universal null. */
  Value() = default;

  // constructors for primitive types
  Value(bool value) : type_(Type::Bool), storage_(value) {}
  Value(int8_t value) : type_(Type::Byte), storage_(value) {}
  Value(int16_t value) : type_(Type::Short), storage_(value) {}
  Value(int32_t value) : type_(Type::Int), storage_(value) {}
  Value(int64_t value) : type_(Type::Long), storage_(value) {}
  Value(float value) : type_(Type::Float), storage_(value) {}
  Value(double value) : type_(Type::Double), storage_(value) {}

  // constructors for non-primitive types
  Value(const char *value) : type_(Type::String), storage_(std::string(value)) {}
  Value(std::string value) : type_(Type::String), storage_(std::move(value)) {}
  Value(const utils::UUID &value) : type_(Type::Uuid), storage_(value) {}
  Value(const utils::Date &value) : type_(Type::Date), storage_(value) {}
  Value(const utils::LocalTime &value) : type_(Type::LocalTime), storage_(value) {}
  Value(const utils::LocalDateTime &value) : type_(Type::LocalDateTime), storage_(value) {}
  Value(const utils::Timestamp &value) : type_(Type::Timestamp), storage_(value) {}
  Value(const utils::Duration &value) : type_(Type::Duration), storage_(value) {}
  Value(Direction value) : type_(Type::Direction), storage_(value) {}
  explicit Value(TList value) : type_(Type::List), storage_(std::move(value)) {}
  explicit Value(TMap value) : type_(Type::Map), storage_(std::move(value)) {}
  Value(Vertex value);
  Value(Edge value);
  Value(Path value);
  Value(Property value);
  Value(VertexProperty value);
  Value(CustomValue value);

  static Value MakeList(TList elements) { return Value(std::move(elements)); }
  static Value MakeSet(TList elements);
  static Value MakeMap(TMap entries) { return Value(std::move(entries)); }
  static Value MakeBinary(TBinary bytes);

  /**
   * Creates a null that still declares its kind, e.g. a slot declared as a
   * List that holds no list. It is encoded as the kind's type code followed by
   * the null flag. `TypedNull(Type::Null)` is the universal null.
   */
  static Value TypedNull(Type type);

  /**
   * Creates a null of the custom type registered under `type_code`. Unlike
   * `TypedNull(Type::Custom)`, it names its type and can be encoded.
   */
  static Value TypedNullCustom(uint8_t type_code);

  Type type() const { return type_; }

  /** True for the universal null and for every typed null. */
  bool IsNull() const { return std::holds_alternative<std::monostate>(storage_); }

  /** Type code named by a custom typed null, if any. */
  std::optional<uint8_t> NullCustomTypeCode() const { return null_custom_type_code_; }

  // Value extraction. Every getter throws ValueException if the value is of a
  // different kind or is a typed null.
  bool ValueBool() const;
  int8_t ValueByte() const;
  int16_t ValueShort() const;
  int32_t ValueInt() const;
  int64_t ValueLong() const;
  float ValueFloat() const;
  double ValueDouble() const;
  const std::string &ValueString() const;
  const TBinary &ValueBinary() const;
  const utils::UUID &ValueUuid() const;
  const utils::Date &ValueDate() const;
  const utils::LocalTime &ValueLocalTime() const;
  const utils::LocalDateTime &ValueLocalDateTime() const;
  const utils::Timestamp &ValueTimestamp() const;
  const utils::Duration &ValueDuration() const;
  Direction ValueDirection() const;
  const TList &ValueList() const;
  const TList &ValueSet() const;
  const TMap &ValueMap() const;
  const Vertex &ValueVertex() const;
  const Edge &ValueEdge() const;
  const Path &ValuePath() const;
  const Property &ValueProperty() const;
  const VertexProperty &ValueVertexProperty() const;
  const CustomValue &ValueCustom() const;

  /** Deep equality. Two nulls are equal when they declare the same kind. */
  friend bool operator==(const Value &lhs, const Value &rhs);

  friend std::ostream &operator<<(std::ostream &os, const Value &value);

 private:
  void CheckType(Type expected) const;

  using Storage =
      std::variant<std::monostate, bool, int8_t, int16_t, int32_t, int64_t, float, double, std::string, TBinary,
                   utils::UUID, utils::Date, utils::LocalTime, utils::LocalDateTime, utils::Timestamp, utils::Duration,
                   Direction, TList, TMap, std::shared_ptr<const Vertex>, std::shared_ptr<const Edge>,
                   std::shared_ptr<const Path>, std::shared_ptr<const Property>,
                   std::shared_ptr<const VertexProperty>, std::shared_ptr<const CustomValue>>;

  Type type_{Type::Null};
  Storage storage_;
  std::optional<uint8_t> null_custom_type_code_;
};

std::string_view ToString(Value::Type type);
std::ostream &operator<<(std::ostream &os, Value::Type type);

using PropertyMap = std::map<std::string, Value>;

struct Property {
  std::string key;
  Value value;

  bool operator==(const Property &) const = default;
};

struct VertexProperty {
  Value id;
  std::string label;
  Value value;
  // meta-properties
  PropertyMap properties;

  bool operator==(const VertexProperty &) const = default;
};

struct Vertex {
  Value id;
  std::string label;
  std::vector<VertexProperty> properties;

  bool operator==(const Vertex &) const = default;
};

struct Edge {
  Value id;
  std::string label;
  Value out_id;
  std::string out_label;
  Value in_id;
  std::string in_label;
  PropertyMap properties;

  bool operator==(const Edge &) const = default;
};

/// A walk through the graph. `labels[i]` is the (possibly empty) set of step
/// labels attached to `objects[i]`, so both sequences have the same length.
struct Path {
  std::vector<std::vector<std::string>> labels;
  std::vector<Value> objects;

  bool operator==(const Path &) const = default;
};

/// A value of a user registered type. The codec registered for `type_name`
/// decides how `fields` are laid out on the wire.
struct CustomValue {
  std::string type_name;
  std::vector<Value> fields;

  bool operator==(const CustomValue &) const = default;
};

}  // namespace graphbin::codec
