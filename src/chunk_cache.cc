#include "chunk_cache.hh"

#include "log.hh"

namespace avroshard {

ChunkCache::ChunkCache(ChunkStorePtr store, uint64_t memory_limit)
    : store_(std::move(store)),
      chunks_(store_->chunk_count()),
      memory_limit_(memory_limit) {}

Result<std::string> ChunkCache::get_chunk(ChunkIndex idx) {
  if (idx >= chunks_.size()) {
    return std::string{};
  }
  {
    std::lock_guard lock(mutex_);
    if (!chunks_[idx].empty()) {
      touch_chunk(idx);
      return chunks_[idx].data;
    }
  }

  // the backing store is read without holding the LRU lock
  auto data = TRYX(store_->get_chunk(idx));

  std::lock_guard lock(mutex_);
  auto &c = chunks_[idx];
  if (c.empty()) {
    c.data = data;
    cached_bytes_ += c.data.size();
  }
  touch_chunk(idx);
  evict();
  return data;
}

void ChunkCache::touch_chunk(ChunkIndex idx) {
  auto &c = chunks_[idx];

  // move to front of LRU
  if (c.is_linked()) {
    lru_.erase(lru_.iterator_to(c));
  }
  lru_.push_front(c);
}

void ChunkCache::evict() {
  // never drops the most recently used chunk
  while (cached_bytes_ > memory_limit_ && lru_.size() > 1) {
    auto &chunk = lru_.back();
    cached_bytes_ -= chunk.data.size();
    TRACEF("evict chunk {} cached_bytes={}", &chunk - chunks_.data(),
           cached_bytes_);
    chunk.reset();
    lru_.pop_back();
  }
}

}  // namespace avroshard
