#include "chunk_parser.hh"

#include "avro_input.hh"
#include "chunk_stream.hh"
#include "log.hh"
#include "row_writer.hh"

#include <avro/Exception.hh>

namespace avroshard {

Result<std::vector<FlatField>> check_schema(const avro::ValidSchema &schema,
                                            const ParseConfiguration &config) {
  auto fields = flatten_schema(schema);
  if (fields.size() != config.column_names.size()) {
    return make_error(Errc::schema_mismatch,
                      fmt::format("{} supported fields but {} columns",
                                  fields.size(), config.column_names.size()));
  }

  for (std::size_t i = 0; i < fields.size(); i++) {
    const auto &field = fields[i];
    if (column_type(field.kind) != config.column_types[i]) {
      return make_error(
          Errc::schema_mismatch,
          fmt::format("field '{}' is {} but column {} is {}", field.name,
                      field_kind_name(field.kind), i,
                      column_type_name(config.column_types[i])));
    }
    if (field.kind == FieldKind::enumeration &&
        enum_domain(field) != config.domains[i]) {
      return make_error(Errc::schema_mismatch,
                        fmt::format("symbols of enum '{}' differ from the "
                                    "domain of column {}",
                                    field.name, i));
    }
  }
  return fields;
}

Result<ChunkParseStats> parse_chunk(ChunkIndex idx, ChunkStore &store,
                                    const ParseConfiguration &config,
                                    ParseWriter &out) {
  ChunkParseStats stats{
      .chunk = idx,
      .start_offset = store.chunk_start_offset(idx),
  };

  auto fetched = store.get_chunk(idx);
  if (!fetched) {
    WARNF("chunk={} not readable: {}", idx, fetched.error());
    stats.decode_failure = fmt::format("{}", fetched.error());
    return stats;
  }
  auto data = std::move(fetched).value();
  ChunkRange range{stats.start_offset,
                   data.size() + store.chunk_start_offset(idx + 1)};
  ChunkStream stream(idx, std::move(data), stats.start_offset, store);

  // the virtual stream puts the header in front of the chunk's byte 0
  const auto header_size = static_cast<int64_t>(config.header.size());
  std::unique_ptr<ChunkReader> reader;
  try {
    reader = open_chunk_reader(config.header, stream);
  } catch (const avro::Exception &e) {
    ERRORF("chunk={} stored header does not open: {}", idx, e.what());
    return make_error(Errc::schema_mismatch,
                      fmt::format("stored header does not open: {}", e.what()));
  }

  auto checked = check_schema(reader->dataSchema(), config);
  if (!checked) {
    ERRORF("chunk={} {}", idx, checked.error());
    return std::move(checked).error();
  }
  auto fields = std::move(checked).value();

  try {
    avro::GenericDatum datum(reader->dataSchema());
    reader->sync(header_size + static_cast<int64_t>(range.begin));

    // right after a marker when one was found, header_size otherwise
    auto block_start = reader->previousSync();
    auto found = block_start >= header_size + avro::SyncSize;
    stats.owned =
        found && owns_sync_marker(range, static_cast<uint64_t>(
                                             block_start - header_size -
                                             avro::SyncSize));

    if (stats.owned) {
      auto limit = header_size + static_cast<int64_t>(range.end);
      int64_t current_block = -1;
      while (!reader->pastSync(limit) && reader->read(datum)) {
        if (reader->previousSync() != current_block) {
          current_block = reader->previousSync();
          ++stats.blocks;
        }
        TRYV(write_record(datum.value<avro::GenericRecord>(), fields, out));
        ++stats.records;
      }
    }
  } catch (const std::exception &e) {
    WARNF("chunk={} stopped after {} records: {}", idx, stats.records,
          e.what());
    stats.decode_failure = e.what();
  }

  stats.extra_chunks = stream.extra_chunks_loaded();
  TRACEF("chunk={} records={} start_offset={} blocks={} extra_chunks={}", idx,
         stats.records, stats.start_offset, stats.blocks, stats.extra_chunks);
  return stats;
}

}  // namespace avroshard
