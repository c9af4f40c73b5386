#pragma once

#include "chunk.hh"
#include "parse_config.hh"
#include "parse_writer.hh"
#include "schema.hh"

#include <optional>
#include <string>

namespace avroshard {

// A chunk's assigned byte range, in the chunk's own coordinates: from its
// start offset up to where the next chunk's range begins, which may lie
// inside the next chunk.
struct ChunkRange {
  uint64_t begin;
  uint64_t end;
};

// Blocks are owned by the chunk whose range holds the first byte of the
// sync marker preceding them.
constexpr bool owns_sync_marker(const ChunkRange &range,
                                uint64_t marker_offset) {
  return marker_offset >= range.begin && marker_offset < range.end;
}

struct ChunkParseStats {
  ChunkIndex chunk = 0;
  uint32_t start_offset = 0;
  uint64_t records = 0;
  uint32_t extra_chunks = 0;
  uint32_t blocks = 0;
  // whether the first sync marker found lies in the chunk's range
  bool owned = false;
  // set when decoding stopped early; rows written before it are kept
  std::optional<std::string> decode_failure;
};

// Flattens `schema` and checks it against the configured columns, types and
// enum domains.
Result<std::vector<FlatField>> check_schema(const avro::ValidSchema &schema,
                                            const ParseConfiguration &config);

// Parses the blocks chunk `idx` owns into `out`. Decode failures and store
// read errors end the chunk early without an error; see
// ChunkParseStats::decode_failure.
Result<ChunkParseStats> parse_chunk(ChunkIndex idx, ChunkStore &store,
                                    const ParseConfiguration &config,
                                    ParseWriter &out);

}  // namespace avroshard
