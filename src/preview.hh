#pragma once

#include "container.hh"
#include "frame_writer.hh"
#include "parse_config.hh"
#include "schema.hh"

namespace avroshard {

struct PreviewOptions {
  std::size_t preview_rows = 10;
  // used when the sample holds no complete block
  uint64_t default_block_size = 64 << 10;
  uint64_t min_chunk_size = 4 << 10;
  uint64_t max_chunk_size = 64 << 20;
};

struct PreviewResult {
  FileHeader header;
  std::vector<BlockInfo> blocks;
  std::vector<FlatField> fields;
  ParseConfiguration config;
  // the first records of the sample, one column per field
  FrameWriter rows{0};
};

// Derives the parse configuration from the first bytes of a file.
Result<PreviewResult> preview(std::string_view sample,
                              const PreviewOptions &options = {});

}  // namespace avroshard
