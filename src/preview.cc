#include "preview.hh"

#include "log.hh"
#include "row_writer.hh"

#include <avro/DataFile.hh>
#include <avro/Exception.hh>
#include <avro/Generic.hh>
#include <avro/Stream.hh>

#include <algorithm>

namespace avroshard {

namespace {

uint64_t recommend_block_size(const std::vector<BlockInfo> &blocks,
                              const PreviewOptions &options) {
  uint64_t size = options.default_block_size;
  if (!blocks.empty()) {
    size = std::max_element(blocks.begin(), blocks.end(),
                            [](const BlockInfo &a, const BlockInfo &b) {
                              return a.size < b.size;
                            })
               ->size;
  }
  return std::clamp(size, options.min_chunk_size, options.max_chunk_size);
}

// Decodes up to `limit` records; a sample cut mid-block just ends early.
Result<void> decode_rows(std::string_view sample,
                         const std::vector<FlatField> &fields,
                         std::size_t limit, FrameWriter &rows) {
  if (limit == 0) {
    return outcome::success();
  }
  try {
    avro::DataFileReader<avro::GenericDatum> reader(avro::memoryInputStream(
        reinterpret_cast<const uint8_t *>(sample.data()),  // NOLINT
        sample.size()));
    avro::GenericDatum datum(reader.dataSchema());
    while (rows.row_count() < limit && reader.read(datum)) {
      TRYV(write_record(datum.value<avro::GenericRecord>(), fields, rows));
    }
  } catch (const avro::Exception &e) {
    DEBUGF("preview stopped after {} rows: {}", rows.row_count(), e.what());
  }
  return outcome::success();
}

}  // namespace

Result<PreviewResult> preview(std::string_view sample,
                              const PreviewOptions &options) {
  PreviewResult result;
  result.header = TRYX(read_file_header(sample));
  result.blocks = scan_blocks(sample, result.header);
  result.fields = flatten_schema(result.header.schema);
  if (result.fields.empty()) {
    return make_error(Errc::unsupported_schema,
                      fmt::format("no supported field in {}",
                                  result.header.schema_json));
  }

  auto &config = result.config;
  config.header = result.header.bytes;
  for (const auto &field : result.fields) {
    config.column_names.push_back(field.name);
    config.column_types.push_back(column_type(field.kind));
    config.domains.push_back(enum_domain(field));
  }
  config.recommended_block_size = recommend_block_size(result.blocks, options);

  result.rows = FrameWriter(result.fields.size());
  TRYV(decode_rows(sample, result.fields, options.preview_rows, result.rows));

  INFOF("columns={} blocks={} recommended_block_size={}",
        config.column_names.size(), result.blocks.size(),
        config.recommended_block_size);
  return result;
}

}  // namespace avroshard
