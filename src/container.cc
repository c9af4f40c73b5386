#include "container.hh"

#include "log.hh"

#include <avro/Compiler.hh>
#include <avro/Decoder.hh>
#include <avro/Exception.hh>
#include <avro/Specific.hh>
#include <avro/Stream.hh>

#include <cstring>
#include <map>

namespace avroshard {

namespace {

constexpr std::string_view kMagic("Obj\x01", 4);

std::unique_ptr<avro::InputStream> memory_input(std::string_view data) {
  return avro::memoryInputStream(
      reinterpret_cast<const uint8_t *>(data.data()),  // NOLINT
      data.size());
}

std::string meta_string(
    const std::map<std::string, std::vector<uint8_t>> &meta,
    const std::string &key) {
  auto it = meta.find(key);
  if (it == meta.end()) {
    return {};
  }
  return {it->second.begin(), it->second.end()};
}

}  // namespace

Result<FileHeader> read_file_header(std::string_view data) {
  if (data.substr(0, kMagic.size()) != kMagic) {
    return make_error(Errc::format_not_recognized, "missing container magic");
  }

  FileHeader header;
  std::map<std::string, std::vector<uint8_t>> meta;
  std::size_t length = 0;
  try {
    auto in = memory_input(data.substr(kMagic.size()));
    auto decoder = avro::binaryDecoder();
    decoder->init(*in);
    avro::decode(*decoder, meta);
    avro::decode(*decoder, header.sync);
    decoder->drain();
    length = kMagic.size() + in->byteCount();
  } catch (const avro::Exception &e) {
    return make_error(Errc::format_not_recognized,
                      fmt::format("undecodable header: {}", e.what()));
  }

  header.bytes = std::string(data.substr(0, length));
  header.schema_json = meta_string(meta, "avro.schema");
  header.codec = meta_string(meta, "avro.codec");
  if (header.codec.empty()) {
    header.codec = "null";
  }

  try {
    header.schema = avro::compileJsonSchemaFromString(header.schema_json);
  } catch (const avro::Exception &e) {
    return make_error(Errc::format_not_recognized,
                      fmt::format("bad schema: {}", e.what()));
  }

  DEBUGF("header_size={} codec={}", header.bytes.size(), header.codec);
  return header;
}

std::vector<BlockInfo> scan_blocks(std::string_view data,
                                   const FileHeader &header) {
  std::vector<BlockInfo> blocks;
  uint64_t offset = header.bytes.size();
  while (offset < data.size()) {
    auto rest = data.substr(offset);
    auto in = memory_input(rest);
    auto decoder = avro::binaryDecoder();
    int64_t records = 0;
    int64_t payload = 0;
    try {
      decoder->init(*in);
      records = decoder->decodeLong();
      payload = decoder->decodeLong();
      decoder->drain();
    } catch (const avro::Exception &e) {
      DEBUGF("block framing cut at {}: {}", offset, e.what());
      break;
    }
    if (records < 0 || payload < 0) {
      WARNF("negative block framing at {}", offset);
      break;
    }

    auto framed = in->byteCount() + static_cast<uint64_t>(payload) +
                  avro::SyncSize;
    if (framed > rest.size()) {
      DEBUGF("block at {} runs past the sample", offset);
      break;
    }
    if (std::memcmp(rest.data() + framed - avro::SyncSize, header.sync.data(),
                    avro::SyncSize) != 0) {
      WARNF("no sync marker after block at {}", offset);
      break;
    }

    blocks.push_back({offset, records, framed});
    offset += framed;
  }
  return blocks;
}

}  // namespace avroshard
