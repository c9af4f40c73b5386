#pragma once

#include "chunk_parser.hh"
#include "frame_writer.hh"

#include <vector>

namespace avroshard {

struct ParallelOptions {
  // 0 = one per hardware thread
  std::size_t threads = 0;
};

struct ParseJobResult {
  FrameWriter frame{0};
  // indexed by chunk
  std::vector<ChunkParseStats> chunks;
};

// Parses every chunk of `store` on a pool of workers and concatenates the
// per-chunk rows in chunk order. The first chunk error fails the job.
Result<ParseJobResult> parse_all(ChunkStore &store,
                                 const ParseConfiguration &config,
                                 const ParallelOptions &options = {});

}  // namespace avroshard
