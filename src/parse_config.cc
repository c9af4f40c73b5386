#include "parse_config.hh"

#include "log.hh"
#include "serde.hh"

#include <cstdio>
#include <memory>

namespace avroshard {

namespace {

struct FileCloser {
  void operator()(std::FILE *f) const {
    fclose(f);  // NOLINT
  }
};
using FilePtr = std::unique_ptr<std::FILE, FileCloser>;

}  // namespace

std::string_view column_type_name(ColumnType type) {
  switch (type) {
  case ColumnType::numeric:
    return "numeric";
  case ColumnType::categorical:
    return "categorical";
  case ColumnType::string:
    return "string";
  case ColumnType::bad:
    return "bad";
  }
  return "unknown";
}

Result<void> validate(const ParseConfiguration &config) {
  if (config.header.empty()) {
    return make_error(Errc::invalid_argument, "configuration has no header");
  }
  auto columns = config.column_names.size();
  if (columns == 0) {
    return make_error(Errc::invalid_argument, "configuration has no columns");
  }
  if (config.column_types.size() != columns ||
      config.domains.size() != columns) {
    return make_error(Errc::invalid_argument,
                      fmt::format("{} names, {} types, {} domains", columns,
                                  config.column_types.size(),
                                  config.domains.size()));
  }
  for (std::size_t i = 0; i < columns; i++) {
    auto type = config.column_types[i];
    if (type > ColumnType::bad) {
      return make_error(Errc::invalid_argument,
                        fmt::format("column {} has unknown type {}", i,
                                    static_cast<int>(type)));
    }
    if (type != ColumnType::categorical && !config.domains[i].empty()) {
      return make_error(Errc::invalid_argument,
                        fmt::format("non-categorical column {} has a domain",
                                    config.column_names[i]));
    }
  }
  return outcome::success();
}

std::string serialize_config(const ParseConfiguration &config) {
  Serializer serializer;
  serialize(serializer, config);
  return serializer.take();
}

Result<ParseConfiguration> deserialize_config(std::string_view bytes) {
  Deserializer deserializer{bytes};
  ParseConfiguration config;
  deserialize(deserializer, config);
  if (deserializer.failed) {
    return make_error(Errc::truncated,
                      fmt::format("configuration cut at byte {} of {}",
                                  deserializer.pos, bytes.size()));
  }
  if (!deserializer.exhausted()) {
    return make_error(Errc::invalid_argument,
                      fmt::format("{} trailing bytes after configuration",
                                  bytes.size() - deserializer.pos));
  }
  TRYV(validate(config));
  return config;
}

Result<void> save_config(const ParseConfiguration &config,
                         const std::string &path) {
  auto bytes = serialize_config(config);
  FilePtr file(fopen(path.c_str(), "wb"));  // NOLINT
  if (!file) {
    return make_error(errno_to_errc(errno), path);
  }
  if (fwrite(bytes.data(), 1, bytes.size(), file.get()) != bytes.size()) {
    return make_error(Errc::io_error, path);
  }
  // buffered bytes are written out here
  auto *f = file.release();
  int err = 0;
  if (fflush(f) != 0) {
    err = errno;
  }
  if (fclose(f) != 0 && err == 0) {  // NOLINT
    err = errno;
  }
  if (err != 0) {
    return make_error(errno_to_errc(err), path);
  }
  DEBUGF("saved {} bytes to {}", bytes.size(), path);
  return outcome::success();
}

Result<ParseConfiguration> load_config(const std::string &path) {
  FilePtr file(fopen(path.c_str(), "rb"));  // NOLINT
  if (!file) {
    return make_error(errno_to_errc(errno), path);
  }

  std::string bytes;
  char buf[4096];
  while (auto n = fread(buf, 1, sizeof(buf), file.get())) {
    bytes.append(buf, n);
  }
  if (ferror(file.get()) != 0) {
    return make_error(Errc::io_error, path);
  }
  return deserialize_config(bytes);
}

}  // namespace avroshard
