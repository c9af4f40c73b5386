#include "test_avro.hh"

#include <avro/Compiler.hh>
#include <avro/Stream.hh>
#include <fmt/format.h>
#include <gtest/gtest.h>
#include <unistd.h>

#include <atomic>
#include <cstdio>
#include <fstream>
#include <sstream>

namespace avroshard::test {

namespace {

std::string temp_path() {
  static std::atomic<int> counter{0};
  return fmt::format("{}avroshard_{}_{}.avro", ::testing::TempDir(),
                     ::getpid(), counter.fetch_add(1));
}

avro::Codec codec_from_name(const std::string &name) {
  if (name == "deflate") {
    return avro::DEFLATE_CODEC;
  }
  return avro::NULL_CODEC;
}

}  // namespace

AvroFileBuilder::AvroFileBuilder(const std::string &schema_json,
                                 const std::string &codec)
    : schema_(avro::compileJsonSchemaFromString(schema_json)),
      path_(temp_path()),
      writer_(std::make_unique<avro::DataFileWriter<avro::GenericDatum>>(
          path_.c_str(), schema_, 16 * 1024, codec_from_name(codec))) {}

AvroFileBuilder::~AvroFileBuilder() {
  std::remove(path_.c_str());
}

avro::GenericDatum AvroFileBuilder::make_row(int64_t id,
                                             std::optional<std::string> name,
                                             const std::string &color,
                                             double score) const {
  auto datum = make_record();
  auto &record = datum.value<avro::GenericRecord>();
  record.fieldAt(0).value<int64_t>() = id;
  auto &name_field = record.fieldAt(1);
  if (name) {
    name_field.selectBranch(1);
    name_field.value<std::string>() = *name;
  } else {
    name_field.selectBranch(0);
  }
  record.fieldAt(2).value<avro::GenericEnum>().set(color);
  record.fieldAt(4).value<double>() = score;
  return datum;
}

void AvroFileBuilder::append(const avro::GenericDatum &record) {
  writer_->write(record);
}

void AvroFileBuilder::end_block() {
  writer_->flush();
}

std::string AvroFileBuilder::finish() {
  writer_->close();
  writer_.reset();
  std::ifstream in(path_, std::ios::binary);
  std::stringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

std::string make_row_file(const std::vector<int> &block_sizes) {
  static const char *colors[] = {"BLUE", "GREEN", "RED"};
  AvroFileBuilder builder;
  int64_t id = 0;
  for (std::size_t b = 0; b < block_sizes.size(); b++) {
    // close() writes the last block
    if (b > 0) {
      builder.end_block();
    }
    for (int i = 0; i < block_sizes[b]; i++, id++) {
      std::optional<std::string> name;
      if (id % 4 != 3) {
        name = fmt::format("row-{}", id);
      }
      builder.append(
          builder.make_row(id, name, colors[id % 3], static_cast<double>(id) / 2));
    }
  }
  return builder.finish();
}

std::vector<int64_t> decode_ids(const std::string &file) {
  avro::DataFileReader<avro::GenericDatum> reader(avro::memoryInputStream(
      reinterpret_cast<const uint8_t *>(file.data()),  // NOLINT
      file.size()));
  avro::GenericDatum datum(reader.dataSchema());
  std::vector<int64_t> ids;
  while (reader.read(datum)) {
    ids.push_back(
        datum.value<avro::GenericRecord>().fieldAt(0).value<int64_t>());
  }
  return ids;
}

}  // namespace avroshard::test
