#pragma once

#include "chunk_stream.hh"

#include <avro/DataFile.hh>
#include <avro/Generic.hh>
#include <avro/Stream.hh>

#include <memory>
#include <string_view>

namespace avroshard {

// Presents `[header][chunk stream from byte 0]` to avro-cpp. Until the first
// seek only the header is visible, so a container reader opened on it reads
// the header and then sees end of data; the seek attaches the chunk bytes
// at virtual offset `header.size()`.
//
// Store failures surface as avro::Exception, the only error channel the
// codec offers.
class AvroChunkInput final : public avro::SeekableInputStream {
public:
  AvroChunkInput(std::string_view header, ChunkStream &stream)
      : header_(header), stream_(stream) {}

  bool next(const uint8_t **data, size_t *len) final;
  void backup(size_t len) final;
  void skip(size_t len) final;
  size_t byteCount() const final;
  void seek(int64_t position) final;

  bool attached() const {
    return attached_;
  }

private:
  std::string_view header_;
  ChunkStream &stream_;
  std::size_t header_pos_ = 0;
  bool attached_ = false;
  // whether the last successful next() came from the header
  bool last_from_header_ = false;
};

using ChunkReader = avro::DataFileReader<avro::GenericDatum>;

// Opens a container reader whose header state is rebuilt from `header`. The
// reader starts at end of data; `sync()` moves it onto `stream`. Each call
// builds a fresh reader, and `stream` must outlive it.
std::unique_ptr<ChunkReader> open_chunk_reader(std::string_view header,
                                               ChunkStream &stream);

}  // namespace avroshard
