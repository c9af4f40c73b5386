#include "chunk_stream.hh"

#include "log.hh"

#include <algorithm>
#include <cstring>

namespace avroshard {

ChunkStream::ChunkStream(ChunkIndex start, std::string first_chunk,
                         uint32_t start_offset, ChunkStore &store)
    : start_(start),
      store_(store),
      data_(std::move(first_chunk)),
      pos_(std::min<uint64_t>(start_offset, data_.size())) {}

Result<std::optional<std::size_t>> ChunkStream::read(std::span<char> out) {
  TRYV(need_data(out.size()));
  if (pos_ >= data_.size()) {
    return std::optional<std::size_t>{};
  }

  auto len = std::min<uint64_t>(out.size(), data_.size() - pos_);
  std::memcpy(out.data(), data_.data() + pos_, len);
  pos_ += len;
  return std::optional<std::size_t>{len};
}

Result<uint64_t> ChunkStream::skip(uint64_t n) {
  TRYV(need_data(n));
  auto len = std::min<uint64_t>(n, data_.size() - pos_);
  pos_ += len;
  return len;
}

Result<void> ChunkStream::seek(uint64_t position) {
  pos_ = 0;
  TRYV(skip(position));
  return outcome::success();
}

Result<std::string_view> ChunkStream::next() {
  TRYV(need_data(1));
  auto view = std::string_view(data_).substr(pos_);
  pos_ = data_.size();
  return view;
}

Result<bool> ChunkStream::need_data(uint64_t len) {
  while (data_.size() - pos_ < len) {
    if (!TRYX(load_next_data())) {
      return false;
    }
  }
  return true;
}

Result<bool> ChunkStream::load_next_data() {
  if (exhausted_) {
    return false;
  }

  auto chunk = TRYX(store_.get_chunk(start_ + extra_chunks_ + 1));
  if (chunk.empty()) {
    exhausted_ = true;
    return false;
  }

  data_.append(chunk);
  ++extra_chunks_;
  TRACEF("start_chunk={} extra_chunks={} buffered={}", start_, extra_chunks_,
         data_.size());
  return true;
}

}  // namespace avroshard
