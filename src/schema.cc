#include "schema.hh"

#include <avro/Schema.hh>

namespace avroshard {

namespace {

avro::NodePtr resolve(const avro::NodePtr &node) {
  if (node->type() == avro::AVRO_SYMBOLIC) {
    return avro::resolveSymbol(node);
  }
  return node;
}

std::optional<FieldKind> primitive_kind(avro::Type type) {
  switch (type) {
  case avro::AVRO_BOOL:
    return FieldKind::boolean;
  case avro::AVRO_INT:
    return FieldKind::int32;
  case avro::AVRO_LONG:
    return FieldKind::int64;
  case avro::AVRO_FLOAT:
    return FieldKind::float32;
  case avro::AVRO_DOUBLE:
    return FieldKind::float64;
  case avro::AVRO_STRING:
    return FieldKind::string;
  case avro::AVRO_BYTES:
    return FieldKind::bytes;
  case avro::AVRO_ENUM:
    return FieldKind::enumeration;
  case avro::AVRO_NULL:
    return FieldKind::null;
  default:
    return std::nullopt;
  }
}

// The branch a nullable union carries values in, or the node itself.
std::optional<avro::NodePtr> unwrap(const avro::NodePtr &node) {
  auto resolved = resolve(node);
  if (resolved->type() != avro::AVRO_UNION) {
    return resolved;
  }

  auto branches = resolved->leaves();
  if (branches == 1) {
    return resolve(resolved->leafAt(0));
  }
  if (branches != 2) {
    return std::nullopt;
  }
  auto first = resolve(resolved->leafAt(0));
  auto second = resolve(resolved->leafAt(1));
  if (first->type() == avro::AVRO_NULL) {
    return second;
  }
  if (second->type() == avro::AVRO_NULL) {
    return first;
  }
  return std::nullopt;
}

}  // namespace

std::string_view field_kind_name(FieldKind kind) {
  switch (kind) {
  case FieldKind::boolean:
    return "boolean";
  case FieldKind::int32:
    return "int";
  case FieldKind::int64:
    return "long";
  case FieldKind::float32:
    return "float";
  case FieldKind::float64:
    return "double";
  case FieldKind::string:
    return "string";
  case FieldKind::bytes:
    return "bytes";
  case FieldKind::enumeration:
    return "enum";
  case FieldKind::null:
    return "null";
  }
  return "unknown";
}

std::optional<FieldKind> field_kind(const avro::NodePtr &node) {
  auto inner = unwrap(node);
  if (!inner) {
    return std::nullopt;
  }
  return primitive_kind((*inner)->type());
}

std::vector<FlatField> flatten_schema(const avro::ValidSchema &schema) {
  std::vector<FlatField> fields;
  const auto &root = schema.root();
  if (root->type() != avro::AVRO_RECORD) {
    return fields;
  }

  for (std::size_t i = 0; i < root->leaves(); i++) {
    auto inner = unwrap(root->leafAt(i));
    if (!inner) {
      continue;
    }
    auto kind = primitive_kind((*inner)->type());
    if (!kind) {
      continue;
    }
    fields.push_back({i, *kind, root->nameAt(i), *inner});
  }
  return fields;
}

ColumnType column_type(FieldKind kind) {
  switch (kind) {
  case FieldKind::boolean:
  case FieldKind::int32:
  case FieldKind::int64:
  case FieldKind::float32:
  case FieldKind::float64:
    return ColumnType::numeric;
  case FieldKind::enumeration:
    return ColumnType::categorical;
  case FieldKind::string:
  case FieldKind::bytes:
    return ColumnType::string;
  case FieldKind::null:
    return ColumnType::bad;
  }
  return ColumnType::bad;
}

std::vector<std::string> enum_domain(const FlatField &field) {
  std::vector<std::string> symbols;
  if (field.kind != FieldKind::enumeration) {
    return symbols;
  }
  for (std::size_t i = 0; i < field.node->names(); i++) {
    symbols.push_back(field.node->nameAt(i));
  }
  return symbols;
}

}  // namespace avroshard
