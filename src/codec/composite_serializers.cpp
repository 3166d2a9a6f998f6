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

#include <algorithm>
#include <cstdint>
#include <limits>
#include <string>
#include <string_view>
#include <utility>

#include "codec/buffer.hpp"
#include "codec/codes.hpp"
#include "codec/exceptions.hpp"
#include "codec/reader.hpp"
#include "codec/registry.hpp"
#include "codec/serializers.hpp"
#include "codec/value.hpp"
#include "codec/writer.hpp"

namespace graphbin::codec {

namespace {

void WriteCount(size_t count, Buffer *buffer) {
  if (count > static_cast<size_t>(std::numeric_limits<int32_t>::max())) {
    throw EncodePreconditionException("Collection of {} elements doesn't fit the count prefix", count);
  }
  buffer->WriteInt32(static_cast<int32_t>(count));
}

int32_t ReadCount(Buffer *buffer) {
  const auto count = buffer->ReadInt32();
  if (count < 0) {
    throw MalformedValueException("Collection has negative count {}", count);
  }
  return count;
}

// Every envelope takes at least one byte, so a count can't be trusted for more
// than the readable bytes when reserving memory.
size_t ReserveHint(int32_t count, const Buffer &buffer, size_t min_element_size) {
  return std::min(static_cast<size_t>(count), buffer.ReadableBytes() / min_element_size);
}

Value::TList ReadElements(Buffer *buffer, Reader &context) {
  const auto count = ReadCount(buffer);
  Value::TList elements;
  elements.reserve(ReserveHint(count, *buffer, 1));
  for (int32_t i = 0; i < count; ++i) {
    elements.push_back(context.ReadValue(buffer));
  }
  return elements;
}

void WriteElements(const Value::TList &elements, Buffer *buffer, const Writer &context) {
  WriteCount(elements.size(), buffer);
  for (const auto &element : elements) {
    context.WriteValue(element, buffer);
  }
}

// Nested fields of graph entities must be of a fixed kind.
void ExpectKind(const Value &field, Value::Type expected, std::string_view field_name) {
  if (field.type() != expected || field.IsNull()) {
    throw MalformedValueException("Field '{}' should be a {}, but it's {}", field_name, ToString(expected),
                                  field.IsNull() ? std::string("null") : std::string(ToString(field.type())));
  }
}

// The universal null or a typed null of the given kind.
bool IsNullOf(const Value &field, Value::Type type) {
  return field.IsNull() && (field.type() == Value::Type::Null || field.type() == type);
}

std::string ReadStringField(Buffer *buffer, Reader &context, std::string_view field_name) {
  auto field = context.ReadValue(buffer);
  ExpectKind(field, Value::Type::String, field_name);
  return field.ValueString();
}

Value PropertyMapToValue(const PropertyMap &properties) {
  Value::TMap entries;
  entries.reserve(properties.size());
  for (const auto &[key, value] : properties) {
    entries.emplace_back(Value(key), value);
  }
  return Value::MakeMap(std::move(entries));
}

// A null properties map reads as no properties.
PropertyMap ReadPropertyMapField(Buffer *buffer, Reader &context, std::string_view field_name) {
  auto field = context.ReadValue(buffer);
  PropertyMap properties;
  if (IsNullOf(field, Value::Type::Map)) return properties;
  ExpectKind(field, Value::Type::Map, field_name);
  for (const auto &[key, value] : field.ValueMap()) {
    ExpectKind(key, Value::Type::String, field_name);
    if (!properties.emplace(key.ValueString(), value).second) {
      throw MalformedValueException("Field '{}' holds the key '{}' more than once", field_name, key.ValueString());
    }
  }
  return properties;
}

// List, Set and Map
void SaveList(const Value &value, Buffer *buffer, const Writer &context) {
  WriteElements(value.ValueList(), buffer, context);
}
Value LoadList(Buffer *buffer, Reader &context) { return Value::MakeList(ReadElements(buffer, context)); }

void SaveSet(const Value &value, Buffer *buffer, const Writer &context) {
  WriteElements(value.ValueSet(), buffer, context);
}
Value LoadSet(Buffer *buffer, Reader &context) { return Value::MakeSet(ReadElements(buffer, context)); }

void SaveMap(const Value &value, Buffer *buffer, const Writer &context) {
  const auto &entries = value.ValueMap();
  WriteCount(entries.size(), buffer);
  for (const auto &[key, mapped] : entries) {
    context.WriteValue(key, buffer);
    context.WriteValue(mapped, buffer);
  }
}

Value LoadMap(Buffer *buffer, Reader &context) {
  const auto count = ReadCount(buffer);
  Value::TMap entries;
  entries.reserve(ReserveHint(count, *buffer, 2));
  for (int32_t i = 0; i < count; ++i) {
    auto key = context.ReadValue(buffer);
    auto mapped = context.ReadValue(buffer);
    entries.emplace_back(std::move(key), std::move(mapped));
  }
  return Value::MakeMap(std::move(entries));
}

// Direction
void SaveDirection(const Value &value, Buffer *buffer, const Writer &context) {
  context.WriteValue(Value(std::string(DirectionToString(value.ValueDirection()))), buffer);
}

Value LoadDirection(Buffer *buffer, Reader &context) {
  const auto name = ReadStringField(buffer, context, "direction");
  const auto direction = StringToDirection(name);
  if (!direction) {
    throw MalformedValueException("Unknown direction '{}'", name);
  }
  return Value(*direction);
}

// Graph entities
void SaveProperty(const Value &value, Buffer *buffer, const Writer &context) {
  const auto &property = value.ValueProperty();
  context.WriteValue(Value(property.key), buffer);
  context.WriteValue(property.value, buffer);
}

Value LoadProperty(Buffer *buffer, Reader &context) {
  Property property;
  property.key = ReadStringField(buffer, context, "key");
  property.value = context.ReadValue(buffer);
  return Value(std::move(property));
}

void SaveVertexProperty(const Value &value, Buffer *buffer, const Writer &context) {
  const auto &vertex_property = value.ValueVertexProperty();
  context.WriteValue(vertex_property.id, buffer);
  context.WriteValue(Value(vertex_property.label), buffer);
  context.WriteValue(vertex_property.value, buffer);
  context.WriteValue(PropertyMapToValue(vertex_property.properties), buffer);
}

Value LoadVertexProperty(Buffer *buffer, Reader &context) {
  VertexProperty vertex_property;
  vertex_property.id = context.ReadValue(buffer);
  vertex_property.label = ReadStringField(buffer, context, "label");
  vertex_property.value = context.ReadValue(buffer);
  vertex_property.properties = ReadPropertyMapField(buffer, context, "properties");
  return Value(std::move(vertex_property));
}

void SaveVertex(const Value &value, Buffer *buffer, const Writer &context) {
  const auto &vertex = value.ValueVertex();
  context.WriteValue(vertex.id, buffer);
  context.WriteValue(Value(vertex.label), buffer);
  Value::TList properties;
  properties.reserve(vertex.properties.size());
  for (const auto &vertex_property : vertex.properties) {
    properties.emplace_back(vertex_property);
  }
  context.WriteValue(Value::MakeList(std::move(properties)), buffer);
}

Value LoadVertex(Buffer *buffer, Reader &context) {
  Vertex vertex;
  vertex.id = context.ReadValue(buffer);
  vertex.label = ReadStringField(buffer, context, "label");
  auto properties = context.ReadValue(buffer);
  if (IsNullOf(properties, Value::Type::List)) return Value(std::move(vertex));
  ExpectKind(properties, Value::Type::List, "properties");
  vertex.properties.reserve(properties.ValueList().size());
  for (const auto &property : properties.ValueList()) {
    ExpectKind(property, Value::Type::VertexProperty, "properties");
    vertex.properties.push_back(property.ValueVertexProperty());
  }
  return Value(std::move(vertex));
}

void SaveEdge(const Value &value, Buffer *buffer, const Writer &context) {
  const auto &edge = value.ValueEdge();
  context.WriteValue(edge.id, buffer);
  context.WriteValue(Value(edge.label), buffer);
  context.WriteValue(edge.out_id, buffer);
  context.WriteValue(Value(edge.out_label), buffer);
  context.WriteValue(edge.in_id, buffer);
  context.WriteValue(Value(edge.in_label), buffer);
  context.WriteValue(PropertyMapToValue(edge.properties), buffer);
}

Value LoadEdge(Buffer *buffer, Reader &context) {
  Edge edge;
  edge.id = context.ReadValue(buffer);
  edge.label = ReadStringField(buffer, context, "label");
  edge.out_id = context.ReadValue(buffer);
  edge.out_label = ReadStringField(buffer, context, "out_label");
  edge.in_id = context.ReadValue(buffer);
  edge.in_label = ReadStringField(buffer, context, "in_label");
  edge.properties = ReadPropertyMapField(buffer, context, "properties");
  return Value(std::move(edge));
}

void SavePath(const Value &value, Buffer *buffer, const Writer &context) {
  const auto &path = value.ValuePath();
  if (path.labels.size() != path.objects.size()) {
    throw EncodePreconditionException("Path has {} label sets for {} objects", path.labels.size(),
                                      path.objects.size());
  }
  Value::TList labels;
  labels.reserve(path.labels.size());
  for (const auto &step_labels : path.labels) {
    Value::TList step;
    step.reserve(step_labels.size());
    for (const auto &label : step_labels) {
      step.emplace_back(label);
    }
    labels.push_back(Value::MakeSet(std::move(step)));
  }
  context.WriteValue(Value::MakeList(std::move(labels)), buffer);
  context.WriteValue(Value::MakeList(path.objects), buffer);
}

Value LoadPath(Buffer *buffer, Reader &context) {
  auto labels = context.ReadValue(buffer);
  ExpectKind(labels, Value::Type::List, "labels");
  auto objects = context.ReadValue(buffer);
  ExpectKind(objects, Value::Type::List, "objects");
  if (labels.ValueList().size() != objects.ValueList().size()) {
    throw MalformedValueException("Path has {} label sets for {} objects", labels.ValueList().size(),
                                  objects.ValueList().size());
  }

  Path path;
  path.labels.reserve(labels.ValueList().size());
  for (const auto &step : labels.ValueList()) {
    ExpectKind(step, Value::Type::Set, "labels");
    auto &step_labels = path.labels.emplace_back();
    step_labels.reserve(step.ValueSet().size());
    for (const auto &label : step.ValueSet()) {
      ExpectKind(label, Value::Type::String, "labels");
      step_labels.push_back(label.ValueString());
    }
  }
  path.objects = objects.ValueList();
  return Value(std::move(path));
}

}  // namespace

void RegisterCompositeCodecs(TypeRegistry *registry) {
  registry->RegisterBuiltin(DataType::List, Value::Type::List, {SaveList, LoadList});
  registry->RegisterBuiltin(DataType::Set, Value::Type::Set, {SaveSet, LoadSet});
  registry->RegisterBuiltin(DataType::Map, Value::Type::Map, {SaveMap, LoadMap});
  registry->RegisterBuiltin(DataType::Direction, Value::Type::Direction, {SaveDirection, LoadDirection});
  registry->RegisterBuiltin(DataType::Property, Value::Type::Property, {SaveProperty, LoadProperty});
  registry->RegisterBuiltin(DataType::VertexProperty, Value::Type::VertexProperty,
                            {SaveVertexProperty, LoadVertexProperty});
  registry->RegisterBuiltin(DataType::Vertex, Value::Type::Vertex, {SaveVertex, LoadVertex});
  registry->RegisterBuiltin(DataType::Edge, Value::Type::Edge, {SaveEdge, LoadEdge});
  registry->RegisterBuiltin(DataType::Path, Value::Type::Path, {SavePath, LoadPath});
}

}  // namespace graphbin::codec
