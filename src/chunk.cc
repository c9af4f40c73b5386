#include "chunk.hh"

#include <cassert>
#include <cerrno>

namespace avroshard {

MemoryChunkStore MemoryChunkStore::split(std::string_view data,
                                         uint32_t chunk_size) {
  assert(chunk_size > 0);
  std::vector<std::string> chunks;
  for (std::size_t off = 0; off < data.size(); off += chunk_size) {
    chunks.emplace_back(data.substr(off, chunk_size));
  }
  return MemoryChunkStore(std::move(chunks));
}

Result<std::string> FileChunkStore::get_chunk(ChunkIndex idx) {
  if (idx >= chunk_count()) {
    return std::string{};
  }

  auto offset = static_cast<uint64_t>(idx) * chunk_size_;
  auto length = static_cast<uint32_t>(
      std::min<uint64_t>(chunk_size_, file_size_ - offset));

  std::lock_guard lock(mutex_);
  if (auto ret = fseek(file_, static_cast<long>(offset), SEEK_SET);
      ret == -1L) {
    return errno_to_errc(errno);
  }

  std::string data;
  data.resize(length);
  auto n = fread(data.data(), sizeof(char), length, file_);
  if (n != length) {
    if (feof(file_) != 0) {
      return make_error(Errc::io_error,
                        fmt::format("unexpected EOF when reading chunk {} at "
                                    "{}~{}",
                                    idx, offset, length));
    }
    return errno_to_errc(errno);
  }

  return data;
}

Result<ChunkStorePtr> FileChunkStore::open(const char *path,
                                           uint32_t chunk_size) {
  if (chunk_size == 0) {
    return make_error(Errc::invalid_argument, "chunk size must be positive");
  }

  auto file = fopen(path, "rb");  // NOLINT
  if (file == nullptr) {
    return make_error(errno_to_errc(errno), std::string(path));
  }

  auto get_size = [](std::FILE *f) -> Result<uint64_t> {
    auto ret = fseek(f, 0, SEEK_END);
    if (ret != 0) {
      return errno_to_errc(errno);
    }

    auto file_size = ftell(f);
    if (file_size == -1L) {
      return errno_to_errc(errno);
    }

    return static_cast<uint64_t>(file_size);
  };

  auto file_size = get_size(file);
  if (!file_size) {
    fclose(file);
    return std::move(file_size).error();
  }

  return std::make_unique<FileChunkStore>(file, file_size.value(), chunk_size);
}

}  // namespace avroshard
