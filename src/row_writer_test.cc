#include "row_writer.hh"

#include "frame_writer.hh"
#include "test_avro.hh"

#include <avro/Compiler.hh>
#include <gtest/gtest.h>

using namespace avroshard;

namespace {

constexpr const char *kAllKinds = R"({
  "type": "record",
  "name": "All",
  "fields": [
    {"name": "flag", "type": "boolean"},
    {"name": "small", "type": "int"},
    {"name": "big", "type": "long"},
    {"name": "ratio", "type": "float"},
    {"name": "score", "type": "double"},
    {"name": "label", "type": "string"},
    {"name": "blob", "type": "bytes"},
    {"name": "color", "type": {"type": "enum", "name": "Color",
                               "symbols": ["BLUE", "GREEN", "RED"]}},
    {"name": "nothing", "type": "null"},
    {"name": "maybe", "type": ["null", "int"]},
    {"name": "maybe_flag", "type": ["null", "boolean"]},
    {"name": "maybe_score", "type": ["null", "double"]},
    {"name": "maybe_blob", "type": ["bytes", "null"]},
    {"name": "maybe_color", "type": ["null", "Color"]}
  ]
})";

class RowWriterTest : public ::testing::Test {
protected:
  void SetUp() override {
    schema_ = avro::compileJsonSchemaFromString(kAllKinds);
    fields_ = flatten_schema(schema_);
    ASSERT_EQ(fields_.size(), 14);
  }

  avro::GenericDatum make_record(bool flag, std::optional<int32_t> maybe) {
    avro::GenericDatum datum(schema_);
    auto &r = datum.value<avro::GenericRecord>();
    r.fieldAt(0).value<bool>() = flag;
    r.fieldAt(1).value<int32_t>() = -7;
    r.fieldAt(2).value<int64_t>() = int64_t{1} << 40;
    r.fieldAt(3).value<float>() = 0.5F;
    r.fieldAt(4).value<double>() = 2.25;
    r.fieldAt(5).value<std::string>() = "héllo";
    r.fieldAt(6).value<std::vector<uint8_t>>() = {0x00, 0xff, 0x41};
    r.fieldAt(7).value<avro::GenericEnum>().set("RED");
    if (maybe) {
      r.fieldAt(9).selectBranch(1);
      r.fieldAt(9).value<int32_t>() = *maybe;
      r.fieldAt(10).selectBranch(1);
      r.fieldAt(10).value<bool>() = false;
      r.fieldAt(11).selectBranch(1);
      r.fieldAt(11).value<double>() = 0.0;
      r.fieldAt(12).selectBranch(0);
      r.fieldAt(12).value<std::vector<uint8_t>>() = {};
      r.fieldAt(13).selectBranch(1);
      r.fieldAt(13).value<avro::GenericEnum>().set("BLUE");
    } else {
      r.fieldAt(9).selectBranch(0);
      r.fieldAt(10).selectBranch(0);
      r.fieldAt(11).selectBranch(0);
      r.fieldAt(12).selectBranch(1);
      r.fieldAt(13).selectBranch(0);
    }
    return datum;
  }

  avro::ValidSchema schema_;
  std::vector<FlatField> fields_;
};

}  // namespace

TEST_F(RowWriterTest, converts_every_kind) {
  FrameWriter frame(fields_.size());
  auto datum = make_record(true, 12);
  ASSERT_TRUE(write_record(datum.value<avro::GenericRecord>(), fields_, frame));
  ASSERT_EQ(frame.row_count(), 1);

  ASSERT_EQ(frame.cell(0, 0), Cell(ScaledCell{1, 0}));
  ASSERT_EQ(frame.cell(0, 1), Cell(ScaledCell{-7, 0}));
  ASSERT_EQ(frame.cell(0, 2), Cell(ScaledCell{int64_t{1} << 40, 0}));
  ASSERT_EQ(frame.cell(0, 3), Cell(0.5));
  ASSERT_EQ(frame.cell(0, 4), Cell(2.25));
  ASSERT_EQ(frame.cell(0, 5), Cell(std::string("héllo")));
  ASSERT_EQ(frame.cell(0, 6), Cell(std::string("\x00\xff\x41", 3)));
  // RED is the third symbol
  ASSERT_EQ(frame.cell(0, 7), Cell(ScaledCell{2, 0}));
  ASSERT_EQ(frame.cell(0, 8), Cell());
  ASSERT_EQ(frame.cell(0, 9), Cell(ScaledCell{12, 0}));
  ASSERT_EQ(frame.invalid_count(8), 1);

  // zero-like values in nullable columns stay values
  ASSERT_EQ(frame.cell(0, 10), Cell(ScaledCell{0, 0}));
  ASSERT_EQ(frame.cell(0, 11), Cell(0.0));
  ASSERT_EQ(frame.cell(0, 12), Cell(std::string()));
  ASSERT_EQ(frame.cell(0, 13), Cell(ScaledCell{0, 0}));
  for (ColumnIndex col = 9; col < 14; col++) {
    ASSERT_EQ(frame.invalid_count(col), 0) << col;
  }
}

TEST_F(RowWriterTest, null_values_are_invalid_cells) {
  FrameWriter frame(fields_.size());
  auto datum = make_record(false, std::nullopt);
  ASSERT_TRUE(write_record(datum.value<avro::GenericRecord>(), fields_, frame));
  ASSERT_EQ(frame.cell(0, 0), Cell(ScaledCell{0, 0}));
  for (ColumnIndex col = 9; col < 14; col++) {
    SCOPED_TRACE(fields_[col].name);
    ASSERT_EQ(frame.cell(0, col), Cell());
    ASSERT_NE(frame.cell(0, col), Cell(ScaledCell{0, 0}));
    ASSERT_NE(frame.cell(0, col), Cell(0.0));
    ASSERT_NE(frame.cell(0, col), Cell(std::string()));
    ASSERT_EQ(frame.invalid_count(col), 1);
  }
  ASSERT_EQ(fields_[10].kind, FieldKind::boolean);
  ASSERT_EQ(fields_[11].kind, FieldKind::float64);
  ASSERT_EQ(fields_[12].kind, FieldKind::bytes);
  ASSERT_EQ(fields_[13].kind, FieldKind::enumeration);
}

TEST_F(RowWriterTest, nullable_string_column) {
  test::AvroFileBuilder builder;
  auto fields = flatten_schema(builder.schema());
  FrameWriter frame(fields.size());

  auto named = builder.make_row(1, "one", "BLUE", 1.0);
  auto unnamed = builder.make_row(2, std::nullopt, "GREEN", 2.0);
  ASSERT_TRUE(write_record(named.value<avro::GenericRecord>(), fields, frame));
  ASSERT_TRUE(
      write_record(unnamed.value<avro::GenericRecord>(), fields, frame));

  ASSERT_EQ(frame.row_count(), 2);
  ASSERT_EQ(frame.cell(0, 1), Cell(std::string("one")));
  ASSERT_EQ(frame.cell(1, 1), Cell());
  ASSERT_EQ(frame.cell(1, 2), Cell(ScaledCell{1, 0}));
  ASSERT_EQ(frame.invalid_count(1), 1);
}

TEST_F(RowWriterTest, position_out_of_range) {
  FrameWriter frame(1);
  std::vector<FlatField> fields{fields_[0]};
  fields[0].position = 42;
  auto datum = make_record(true, 1);
  auto ret = write_record(datum.value<avro::GenericRecord>(), fields, frame);
  ASSERT_FALSE(ret);
  ASSERT_TRUE(ret.error() == Errc::configuration_invariant);
}

TEST_F(RowWriterTest, kind_mismatch) {
  FrameWriter frame(1);
  std::vector<FlatField> fields{fields_[1]};
  fields[0].kind = FieldKind::string;
  auto datum = make_record(true, 1);
  auto ret = write_record(datum.value<avro::GenericRecord>(), fields, frame);
  ASSERT_FALSE(ret);
  ASSERT_TRUE(ret.error() == Errc::configuration_invariant);
}

TEST(FrameWriter, append_and_format) {
  FrameWriter a(2);
  a.add_numeric_cell(0, 1, 0);
  a.add_string_cell(1, "x");
  a.end_row();

  FrameWriter b(2);
  b.add_invalid_cell(0);
  b.add_numeric_cell(1, 1.5);
  b.end_row();
  b.add_numeric_cell(0, 25, -1);
  b.add_invalid_cell(1);
  b.end_row();

  a.append(std::move(b));
  ASSERT_EQ(a.row_count(), 3);
  ASSERT_EQ(a.invalid_count(0), 1);
  ASSERT_EQ(a.invalid_count(1), 1);
  ASSERT_EQ(b.row_count(), 0);

  ASSERT_EQ(format_cell(a.cell(0, 0)), "1");
  ASSERT_EQ(format_cell(a.cell(0, 1)), "x");
  ASSERT_EQ(format_cell(a.cell(1, 0)), "NA");
  ASSERT_EQ(format_cell(a.cell(1, 1)), "1.5");
  ASSERT_EQ(format_cell(a.cell(2, 0)), "25e-1");

  std::vector<std::string> domain{"BLUE", "GREEN"};
  ASSERT_EQ(format_cell(a.cell(0, 0), &domain), "GREEN");
}
