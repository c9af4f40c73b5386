#include "avro_input.hh"

#include <avro/Exception.hh>

#include <algorithm>

namespace avroshard {

namespace {

template <typename T>
T value_or_throw(Result<T> ret) {
  if (!ret) {
    throw avro::Exception(fmt::format("chunk stream: {}", ret.error()));
  }
  return std::move(ret).value();
}

void value_or_throw(Result<void> ret) {
  if (!ret) {
    throw avro::Exception(fmt::format("chunk stream: {}", ret.error()));
  }
}

}  // namespace

bool AvroChunkInput::next(const uint8_t **data, size_t *len) {
  if (header_pos_ < header_.size()) {
    *data = reinterpret_cast<const uint8_t *>(header_.data()) +  // NOLINT
            header_pos_;
    *len = header_.size() - header_pos_;
    header_pos_ = header_.size();
    last_from_header_ = true;
    return true;
  }
  if (!attached_) {
    return false;
  }

  auto view = value_or_throw(stream_.next());
  if (view.empty()) {
    return false;
  }
  *data = reinterpret_cast<const uint8_t *>(view.data());  // NOLINT
  *len = view.size();
  last_from_header_ = false;
  return true;
}

void AvroChunkInput::backup(size_t len) {
  if (len == 0) {
    return;
  }
  if (last_from_header_) {
    assert(len <= header_pos_);
    header_pos_ -= len;
    return;
  }
  assert(len <= stream_.tell());
  value_or_throw(stream_.seek(stream_.tell() - len));
}

void AvroChunkInput::skip(size_t len) {
  if (header_pos_ < header_.size()) {
    auto n = std::min(len, header_.size() - header_pos_);
    header_pos_ += n;
    len -= n;
  }
  if (len > 0 && attached_) {
    value_or_throw(stream_.skip(len));
  }
}

size_t AvroChunkInput::byteCount() const {
  if (header_pos_ < header_.size() || !attached_) {
    return header_pos_;
  }
  return header_.size() + stream_.tell();
}

void AvroChunkInput::seek(int64_t position) {
  attached_ = true;
  auto pos = static_cast<uint64_t>(std::max<int64_t>(position, 0));
  if (pos < header_.size()) {
    header_pos_ = pos;
    value_or_throw(stream_.seek(0));
  } else {
    header_pos_ = header_.size();
    value_or_throw(stream_.seek(pos - header_.size()));
  }
}

std::unique_ptr<ChunkReader> open_chunk_reader(std::string_view header,
                                               ChunkStream &stream) {
  auto input = std::make_unique<AvroChunkInput>(header, stream);
  return std::make_unique<ChunkReader>(std::move(input));
}

}  // namespace avroshard
