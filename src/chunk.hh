#pragma once

#include "noncopyable.hh"
#include "outcome.hh"

#include <cstdint>
#include <cstdio>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace avroshard {

using ChunkIndex = uint32_t;

// Hands out the chunks of one logical file. Chunks are numbered densely from
// 0; asking past the last chunk yields an empty string, not an error.
// Implementations are called from several workers at once.
struct ChunkStore {  // NOLINT
  using Ptr = std::unique_ptr<ChunkStore>;

  virtual ~ChunkStore() = default;
  virtual ChunkIndex chunk_count() const = 0;
  virtual Result<std::string> get_chunk(ChunkIndex idx) = 0;

  // Offset inside chunk `idx` at which the chunk's assigned range begins.
  virtual uint32_t chunk_start_offset(ChunkIndex /*idx*/) const {
    return 0;
  }
};
using ChunkStorePtr = std::unique_ptr<ChunkStore>;

class MemoryChunkStore final : public ChunkStore, NonCopyable {
public:
  explicit MemoryChunkStore(std::vector<std::string> chunks,
                            std::vector<uint32_t> start_offsets = {})
      : chunks_(std::move(chunks)), start_offsets_(std::move(start_offsets)) {}

  // Cuts `data` into `chunk_size` pieces; the last one may be shorter.
  static MemoryChunkStore split(std::string_view data, uint32_t chunk_size);

  ChunkIndex chunk_count() const final {
    return static_cast<ChunkIndex>(chunks_.size());
  }

  Result<std::string> get_chunk(ChunkIndex idx) final {
    if (idx >= chunks_.size()) {
      return std::string{};
    }
    return chunks_[idx];
  }

  uint32_t chunk_start_offset(ChunkIndex idx) const final {
    return idx < start_offsets_.size() ? start_offsets_[idx] : 0;
  }

private:
  std::vector<std::string> chunks_;
  std::vector<uint32_t> start_offsets_;
};

// Serves fixed-size chunks straight from a file.
class FileChunkStore final : public ChunkStore, NonCopyable {
public:
  FileChunkStore(std::FILE *file, uint64_t file_size, uint32_t chunk_size)
      : file_(file), file_size_(file_size), chunk_size_(chunk_size) {}

  ~FileChunkStore() final {
    if (file_ != nullptr) {
      fclose(file_);  // NOLINT
    }
  }

  static Result<Ptr> open(const char *path, uint32_t chunk_size);

  uint64_t size() const {
    return file_size_;
  }

  ChunkIndex chunk_count() const final {
    return static_cast<ChunkIndex>((file_size_ + chunk_size_ - 1) /
                                   chunk_size_);
  }

  Result<std::string> get_chunk(ChunkIndex idx) final;

private:
  std::FILE *file_;
  uint64_t file_size_;
  uint32_t chunk_size_;
  std::mutex mutex_;
};

}  // namespace avroshard
