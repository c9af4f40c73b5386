#pragma once

namespace avroshard {
struct NonCopyable {
  NonCopyable() = default;
  NonCopyable(const NonCopyable &) = delete;
  NonCopyable(NonCopyable &&) = default;
  NonCopyable &operator=(const NonCopyable &) = delete;
  NonCopyable &operator=(NonCopyable &&) = default;
  ~NonCopyable() = default;
};

// For objects other parties hold pointers into, e.g. a stream a codec
// reader keeps reading from.
struct NonMovable {
  NonMovable() = default;
  NonMovable(const NonMovable &) = delete;
  NonMovable(NonMovable &&) = delete;
  NonMovable &operator=(const NonMovable &) = delete;
  NonMovable &operator=(NonMovable &&) = delete;
  ~NonMovable() = default;
};
}  // namespace avroshard
