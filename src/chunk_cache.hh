#pragma once

#include "chunk.hh"
#include "noncopyable.hh"

#include <boost/intrusive/list.hpp>

class ChunkCacheTest;

namespace avroshard {

// Keeps recently fetched chunks of another store in memory. Neighboring
// chunk parses read each other's chunks, so the same chunk is usually asked
// for twice in a row. Misses are fetched outside the lock; two workers
// missing on the same chunk both fetch it and the first insert wins.
class ChunkCache final : public ChunkStore, NonCopyable {
public:
  ChunkCache(ChunkStorePtr store, uint64_t memory_limit);

  ChunkIndex chunk_count() const final {
    return store_->chunk_count();
  }

  Result<std::string> get_chunk(ChunkIndex idx) final;

  uint32_t chunk_start_offset(ChunkIndex idx) const final {
    return store_->chunk_start_offset(idx);
  }

  std::size_t cached_count() const {
    std::lock_guard lock(mutex_);
    return lru_.size();
  }

private:
  struct Chunk : public boost::intrusive::list_base_hook<> {
    std::string data;

    bool empty() const {
      return data.empty();
    }

    void reset() {
      data.clear();
      data.shrink_to_fit();
    }
  };

  // both require mutex_
  void touch_chunk(ChunkIndex idx);
  void evict();

  using ChunkLRU = boost::intrusive::list<Chunk>;

  ChunkStorePtr store_;
  std::vector<Chunk> chunks_;
  ChunkLRU lru_;

  uint64_t memory_limit_;
  uint64_t cached_bytes_ = 0;
  mutable std::mutex mutex_;

  friend class ::ChunkCacheTest;
};

}  // namespace avroshard
