#pragma once

#include "parse_config.hh"

#include <avro/Node.hh>
#include <avro/ValidSchema.hh>

#include <optional>
#include <string>
#include <vector>

namespace avroshard {

enum class FieldKind : uint8_t {
  boolean,
  int32,
  int64,
  float32,
  float64,
  string,
  bytes,
  enumeration,
  null,
};

std::string_view field_kind_name(FieldKind kind);

// A top-level record field that maps onto one column.
struct FlatField {
  // index of the field in the record
  std::size_t position;
  FieldKind kind;
  std::string name;
  // the field's schema with symbols resolved and the null branch unwrapped
  avro::NodePtr node;
};

// The kind a field schema reads as: a supported primitive, a union of one,
// or a union of null and one. Anything else has no kind.
std::optional<FieldKind> field_kind(const avro::NodePtr &node);

// Supported top-level fields in declaration order. Empty unless the root is
// a record.
std::vector<FlatField> flatten_schema(const avro::ValidSchema &schema);

ColumnType column_type(FieldKind kind);

// Enum symbols in declaration order; empty for any other field.
std::vector<std::string> enum_domain(const FlatField &field);

}  // namespace avroshard
