#pragma once

#include "outcome.hh"

#include <avro/DataFile.hh>
#include <avro/ValidSchema.hh>

#include <string>
#include <string_view>
#include <vector>

namespace avroshard {

// The container preamble: magic, metadata map and sync marker.
struct FileHeader {
  // raw preamble bytes, exactly as they appear at the start of the file
  std::string bytes;
  std::string schema_json;
  std::string codec;
  avro::DataFileSync sync{};
  avro::ValidSchema schema;
};

// Decodes the preamble at the start of `data`.
Result<FileHeader> read_file_header(std::string_view data);

struct BlockInfo {
  // offset of the block's record count, from the start of the file
  uint64_t offset;
  int64_t records;
  // count and size varints, payload and trailing sync marker
  uint64_t size;
};

// Walks the block framing that follows the header inside `data`. Stops at
// the first block that does not fit or is not followed by the sync marker.
std::vector<BlockInfo> scan_blocks(std::string_view data,
                                   const FileHeader &header);

}  // namespace avroshard
