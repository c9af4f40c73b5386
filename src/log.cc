#include "log.hh"

#include <absl/log/globals.h>
#include <absl/log/initialize.h>

namespace avroshard {

void init_logging(const LogOptions &options) {
  absl::InitializeLog();
  absl::SetStderrThreshold(options.stderr_threshold);
  absl::SetGlobalVLogLevel(options.verbosity);
  DEBUGF("verbosity={}", options.verbosity);
}

}  // namespace avroshard
