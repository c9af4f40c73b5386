#include "parallel_parser.hh"

#include "log.hh"

#include <algorithm>
#include <atomic>
#include <future>
#include <optional>
#include <thread>

namespace avroshard {

Result<ParseJobResult> parse_all(ChunkStore &store,
                                 const ParseConfiguration &config,
                                 const ParallelOptions &options) {
  TRYV(validate(config));

  auto count = store.chunk_count();
  auto columns = config.column_names.size();
  std::size_t threads =
      options.threads > 0
          ? options.threads
          : std::max(1u, std::thread::hardware_concurrency());
  threads = std::min<std::size_t>(threads, std::max<ChunkIndex>(count, 1));

  std::vector<FrameWriter> frames;
  frames.reserve(count);
  for (ChunkIndex i = 0; i < count; i++) {
    frames.emplace_back(columns);
  }
  std::vector<std::optional<Result<ChunkParseStats>>> results(count);

  std::atomic<ChunkIndex> chunk_idx{0};
  std::vector<std::future<void>> jobs;
  for (std::size_t t = 0; t < threads; ++t) {
    jobs.emplace_back(std::async(std::launch::async, [&]() {
      while (true) {
        auto idx = chunk_idx.fetch_add(1);
        if (idx >= count) {
          break;
        }
        results[idx].emplace(parse_chunk(idx, store, config, frames[idx]));
      }
    }));
  }
  for (auto &j : jobs) {
    j.get();
  }

  ParseJobResult job{.frame = FrameWriter(columns), .chunks = {}};
  job.chunks.reserve(count);
  uint64_t failures = 0;
  for (ChunkIndex i = 0; i < count; i++) {
    auto &ret = *results[i];
    if (!ret) {
      ERRORF("chunk={} failed: {}", i, ret.error());
      return std::move(ret).error();
    }
    if (ret.value().decode_failure) {
      ++failures;
    }
    job.chunks.push_back(std::move(ret).value());
    job.frame.append(std::move(frames[i]));
  }

  INFOF("chunks={} rows={} threads={} decode_failures={}", count,
        job.frame.row_count(), threads, failures);
  return job;
}

}  // namespace avroshard
