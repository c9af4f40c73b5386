#pragma once

#include "chunk.hh"
#include "noncopyable.hh"

#include <optional>
#include <span>
#include <string_view>

namespace avroshard {

// A growable byte stream that starts at one chunk and lazily appends the
// following chunks when a read runs past what is buffered. Owned by a single
// chunk parse; the buffer only ever grows.
class ChunkStream : NonMovable {
public:
  ChunkStream(ChunkIndex start, std::string first_chunk, uint32_t start_offset,
              ChunkStore &store);

  // Bytes copied into `out`, or std::nullopt at end of stream.
  Result<std::optional<std::size_t>> read(std::span<char> out);

  // Moves forward by up to `n` bytes; fewer means end of stream.
  Result<uint64_t> skip(uint64_t n);

  // Positions are absolute within the stream. Implemented as a forward skip
  // from 0, so seeking past the end stops at the end.
  Result<void> seek(uint64_t position);

  uint64_t tell() const {
    return pos_;
  }

  // All buffered bytes past the cursor, loading one more chunk when none are
  // buffered. The cursor moves to the end of the returned view. Empty at end
  // of stream. The view is valid until the next call that loads a chunk.
  Result<std::string_view> next();

  ChunkIndex start_chunk() const {
    return start_;
  }

  uint32_t extra_chunks_loaded() const {
    return extra_chunks_;
  }

  uint64_t buffered() const {
    return data_.size();
  }

private:
  // Returns whether `len` bytes past the cursor are buffered after loading.
  Result<bool> need_data(uint64_t len);
  // Returns false once the store has no more chunks.
  Result<bool> load_next_data();

  ChunkIndex start_;
  ChunkStore &store_;
  std::string data_;
  uint64_t pos_;
  uint32_t extra_chunks_ = 0;
  bool exhausted_ = false;
};

}  // namespace avroshard
