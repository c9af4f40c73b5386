#include "chunk_cache.hh"
#include "log.hh"
#include "parallel_parser.hh"
#include "preview.hh"

#include <absl/flags/flag.h>
#include <absl/flags/parse.h>
#include <absl/flags/usage.h>
#include <absl/log/flags.h>
#include <fmt/format.h>
#include <fmt/ranges.h>

ABSL_FLAG(uint32_t, chunk_size, 0,
          "chunk size in bytes; 0 uses the recommended block size");
ABSL_FLAG(uint32_t, threads, 0, "parse workers; 0 uses one per CPU");
ABSL_FLAG(uint32_t, sample_bytes, 1 << 20,
          "bytes read from the start of the file for preview");
ABSL_FLAG(uint32_t, preview_rows, 10, "records shown by preview");
ABSL_FLAG(uint64_t, cache_bytes, 256 << 20, "memory for cached chunks");
ABSL_FLAG(std::string, save_config, "",
          "write the parse configuration to this path");
ABSL_FLAG(std::string, load_config, "",
          "read the parse configuration from this path instead of previewing");
ABSL_FLAG(bool, print_rows, true, "print parsed rows as CSV");

namespace avroshard {

namespace {

void print_rows(const FrameWriter &frame, const ParseConfiguration &config) {
  std::vector<std::string> line(frame.column_count());
  for (std::size_t row = 0; row < frame.row_count(); row++) {
    for (ColumnIndex col = 0; col < frame.column_count(); col++) {
      line[col] = format_cell(frame.cell(row, col), &config.domains[col]);
    }
    fmt::println("{}", fmt::join(line, ","));
  }
}

void print_preview(const PreviewResult &result) {
  const auto &config = result.config;
  fmt::println("codec={} header={}B blocks={} block_size={}",
               result.header.codec, config.header.size(),
               result.blocks.size(), config.recommended_block_size);
  for (std::size_t i = 0; i < config.column_names.size(); i++) {
    fmt::println("  {} {} {}", config.column_names[i],
                 column_type_name(config.column_types[i]),
                 fmt::join(config.domains[i], "|"));
  }
  print_rows(result.rows, config);
}

Result<ParseConfiguration> configure(const char *path) {
  auto load = absl::GetFlag(FLAGS_load_config);
  if (!load.empty()) {
    return load_config(load);
  }

  auto sample_store =
      TRYX(FileChunkStore::open(path, absl::GetFlag(FLAGS_sample_bytes)));
  auto sample = TRYX(sample_store->get_chunk(0));
  PreviewOptions options{.preview_rows = absl::GetFlag(FLAGS_preview_rows)};
  auto result = TRYX(preview(sample, options));
  print_preview(result);
  return std::move(result.config);
}

Result<void> run(const char *path) {
  auto config = TRYX(configure(path));
  if (auto save = absl::GetFlag(FLAGS_save_config); !save.empty()) {
    TRYV(save_config(config, save));
  }

  auto chunk_size = absl::GetFlag(FLAGS_chunk_size);
  if (chunk_size == 0) {
    chunk_size = static_cast<uint32_t>(config.recommended_block_size);
  }
  auto file = TRYX(FileChunkStore::open(path, chunk_size));
  ChunkCache cache(std::move(file), absl::GetFlag(FLAGS_cache_bytes));

  auto job = TRYX(parse_all(cache, config,
                            {.threads = absl::GetFlag(FLAGS_threads)}));
  if (absl::GetFlag(FLAGS_print_rows)) {
    print_rows(job.frame, config);
  }

  uint64_t failed = 0;
  for (const auto &stats : job.chunks) {
    if (stats.decode_failure) {
      ++failed;
    }
  }
  fmt::println(stderr, "{} rows from {} chunks of {} bytes, {} cut short",
               job.frame.row_count(), job.chunks.size(), chunk_size, failed);
  return outcome::success();
}

}  // namespace

}  // namespace avroshard

int main(int argc, char **argv) {
  absl::SetProgramUsageMessage(
      "parses an Avro container file in parallel chunks\n"
      "usage: avroshard [flags] FILE");
  auto args = absl::ParseCommandLine(argc, argv);
  if (args.size() != 2) {
    fmt::println(stderr, "{}", absl::ProgramUsageMessage());
    return 1;
  }

  avroshard::init_logging({
      .verbosity = absl::GetFlag(FLAGS_v),
      .stderr_threshold = static_cast<absl::LogSeverityAtLeast>(
          absl::GetFlag(FLAGS_stderrthreshold)),
  });

  try {
    auto res = avroshard::run(args[1]);
    if (!res) {
      fmt::println(stderr, "avroshard: {}", res.error());
      return 1;
    }
  } catch (const std::exception &ex) {
    fmt::println(stderr, "avroshard: {}", ex.what());
    return 1;
  }
  return 0;
}
