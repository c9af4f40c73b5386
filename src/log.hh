// IWYU pragma: always_keep

#pragma once

#include <absl/base/log_severity.h>
#include <absl/log/log.h>
#include <fmt/format.h>

#define IMPL_LOGF_(_log, _serverity, _spec, ...) \
  _log(_serverity) << fmt::format("[{}] " _spec, \
                                  __func__ __VA_OPT__(, ) __VA_ARGS__)

#define FATALF(...) IMPL_LOGF_(LOG, FATAL, __VA_ARGS__)
#define ERRORF(...) IMPL_LOGF_(LOG, ERROR, __VA_ARGS__)
#define WARNF(...) IMPL_LOGF_(LOG, WARNING, __VA_ARGS__)
#define INFOF(...) IMPL_LOGF_(VLOG, 0, __VA_ARGS__)
#define DEBUGF(...) IMPL_LOGF_(VLOG, 1, __VA_ARGS__)
#define TRACEF(...) IMPL_LOGF_(VLOG, 2, __VA_ARGS__)

namespace avroshard {

struct LogOptions {
  // 0 = info, 1 = debug, 2 = trace
  int verbosity = 0;
  // messages at or above this severity also go to stderr
  absl::LogSeverityAtLeast stderr_threshold = absl::LogSeverityAtLeast::kInfo;
};

// Must run once, before the first log line, from main().
void init_logging(const LogOptions &options);

}  // namespace avroshard
