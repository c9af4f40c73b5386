#include "schema.hh"

#include "test_avro.hh"

#include <avro/Compiler.hh>
#include <gtest/gtest.h>

using namespace avroshard;

namespace {

constexpr const char *kMixedSchema = R"({
  "type": "record",
  "name": "Mixed",
  "fields": [
    {"name": "flag", "type": "boolean"},
    {"name": "small", "type": "int"},
    {"name": "nested", "type": {"type": "record", "name": "Inner",
                                "fields": [{"name": "x", "type": "int"}]}},
    {"name": "ratio", "type": ["float", "null"]},
    {"name": "blob", "type": "bytes"},
    {"name": "choice", "type": ["int", "string"]},
    {"name": "single", "type": ["long"]},
    {"name": "kind", "type": {"type": "enum", "name": "Kind",
                              "symbols": ["Z", "A"]}},
    {"name": "kind_again", "type": ["null", "Kind"]},
    {"name": "hash", "type": {"type": "fixed", "name": "Hash", "size": 4}},
    {"name": "attrs", "type": {"type": "map", "values": "string"}},
    {"name": "nothing", "type": "null"}
  ]
})";

std::vector<std::string> names(const std::vector<FlatField> &fields) {
  std::vector<std::string> ret;
  for (const auto &f : fields) {
    ret.push_back(f.name);
  }
  return ret;
}

}  // namespace

TEST(flatten_schema, keeps_supported_fields_in_order) {
  auto schema = avro::compileJsonSchemaFromString(kMixedSchema);
  auto fields = flatten_schema(schema);

  ASSERT_EQ(names(fields),
            (std::vector<std::string>{"flag", "small", "ratio", "blob",
                                      "single", "kind", "kind_again",
                                      "nothing"}));

  ASSERT_EQ(fields[0].position, 0);
  ASSERT_EQ(fields[0].kind, FieldKind::boolean);
  ASSERT_EQ(fields[1].kind, FieldKind::int32);
  ASSERT_EQ(fields[2].position, 3);
  ASSERT_EQ(fields[2].kind, FieldKind::float32);
  ASSERT_EQ(fields[3].kind, FieldKind::bytes);
  ASSERT_EQ(fields[4].position, 6);
  ASSERT_EQ(fields[4].kind, FieldKind::int64);
  ASSERT_EQ(fields[5].kind, FieldKind::enumeration);
  ASSERT_EQ(fields[6].position, 8);
  ASSERT_EQ(fields[6].kind, FieldKind::enumeration);
  ASSERT_EQ(fields[7].position, 11);
  ASSERT_EQ(fields[7].kind, FieldKind::null);
}

TEST(flatten_schema, resolves_named_references) {
  auto schema = avro::compileJsonSchemaFromString(kMixedSchema);
  auto fields = flatten_schema(schema);
  ASSERT_EQ(enum_domain(fields[5]), (std::vector<std::string>{"Z", "A"}));
  ASSERT_EQ(enum_domain(fields[6]), (std::vector<std::string>{"Z", "A"}));
  ASSERT_TRUE(enum_domain(fields[0]).empty());
}

TEST(flatten_schema, row_schema_drops_the_list) {
  auto schema = avro::compileJsonSchemaFromString(test::kRowSchema);
  auto fields = flatten_schema(schema);
  ASSERT_EQ(names(fields),
            (std::vector<std::string>{"id", "name", "color", "score"}));
  ASSERT_EQ(fields[3].position, 4);
}

TEST(flatten_schema, non_record_root_has_no_fields) {
  auto schema = avro::compileJsonSchemaFromString(R"("long")");
  ASSERT_TRUE(flatten_schema(schema).empty());
}

TEST(column_type, maps_kinds) {
  ASSERT_EQ(column_type(FieldKind::boolean), ColumnType::numeric);
  ASSERT_EQ(column_type(FieldKind::int32), ColumnType::numeric);
  ASSERT_EQ(column_type(FieldKind::int64), ColumnType::numeric);
  ASSERT_EQ(column_type(FieldKind::float32), ColumnType::numeric);
  ASSERT_EQ(column_type(FieldKind::float64), ColumnType::numeric);
  ASSERT_EQ(column_type(FieldKind::enumeration), ColumnType::categorical);
  ASSERT_EQ(column_type(FieldKind::string), ColumnType::string);
  ASSERT_EQ(column_type(FieldKind::bytes), ColumnType::string);
  ASSERT_EQ(column_type(FieldKind::null), ColumnType::bad);
}

TEST(field_kind, union_rules) {
  auto schema = avro::compileJsonSchemaFromString(R"({
    "type": "record", "name": "U", "fields": [
      {"name": "a", "type": ["null", "double"]},
      {"name": "b", "type": ["double", "null"]},
      {"name": "c", "type": ["null", "int", "string"]},
      {"name": "d", "type": ["string"]}
    ]})");
  const auto &root = schema.root();
  ASSERT_EQ(field_kind(root->leafAt(0)), FieldKind::float64);
  ASSERT_EQ(field_kind(root->leafAt(1)), FieldKind::float64);
  ASSERT_EQ(field_kind(root->leafAt(2)), std::nullopt);
  ASSERT_EQ(field_kind(root->leafAt(3)), FieldKind::string);
}
