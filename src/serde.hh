#pragma once

#include <boost/endian/conversion.hpp>
#include <boost/pfr.hpp>
#include <concepts>
#include <cstring>
#include <limits>
#include <string>
#include <string_view>
#include <type_traits>

namespace avroshard {

namespace detail {
inline uint64_t zig_zag_encode(int64_t value) {
  return (static_cast<uint64_t>(value) << 1) ^
         static_cast<uint64_t>(value >> 63);
}
inline int64_t zig_zag_decode(uint64_t value) {
  return static_cast<int64_t>((value >> 1) ^ -(value & 1));
}
}  // namespace detail

struct Serializer {
  std::string buffer;

  std::string take() {
    return std::move(buffer);
  }

  void write_int(int64_t value) {
    write_uint(detail::zig_zag_encode(value));
  }
  void write_uint(uint64_t value) {
    if (value < 0xFF - 2) {
      pack_int<uint8_t>(value);
    } else if (value <= std::numeric_limits<uint16_t>::max()) {
      pack_int<uint8_t>(0xFF - 2);
      pack_int<uint16_t>(value);
    } else if (value <= std::numeric_limits<uint32_t>::max()) {
      pack_int<uint8_t>(0xFF - 1);
      pack_int<uint32_t>(value);
    } else {
      pack_int<uint8_t>(0xFF);
      pack_int<uint64_t>(value);
    }
  }
  void write_str(std::string_view str) {
    write_uint(str.size());
    buffer.append(str);
  }

private:
  template <typename T>
  void pack_int(T value) {
    T v = boost::endian::native_to_little(value);
    auto size = buffer.size();
    buffer.resize(size + sizeof(value));
    std::memcpy(buffer.data() + size, &v, sizeof(value));  // NOLINT
  }
};

// Reads never run past `buffer`: a short read sets `failed` and yields
// zero values from then on.
struct Deserializer {
  std::string_view buffer;
  std::size_t pos = 0;
  bool failed = false;

  bool exhausted() const {
    return pos == buffer.size();
  }

  int64_t read_int() {
    auto value = read_uint();
    return detail::zig_zag_decode(value);
  }
  uint64_t read_uint() {
    auto i = pick_int<uint8_t>();
    if (i < 0xFF - 2) {
      return i;
    }
    if (i == 0xFF - 2) {
      return pick_int<uint16_t>();
    }
    if (i == 0xFF - 1) {
      return pick_int<uint32_t>();
    }
    return pick_int<uint64_t>();
  }

  std::string_view read_str() {
    auto length = read_uint();
    if (failed || buffer.size() - pos < length) {
      failed = true;
      return {};
    }
    auto str = buffer.substr(pos, length);
    pos += length;
    return str;
  }

private:
  template <typename T>
  T pick_int() {
    T value{};
    if (failed || buffer.size() - pos < sizeof(value)) {
      failed = true;
      return value;
    }
    std::memcpy(&value, buffer.data() + pos, sizeof(value));  // NOLINT
    pos += sizeof(value);
    return boost::endian::little_to_native(value);
  }
};

template <std::unsigned_integral T>
void serialize(Serializer &serializer, T value) {
  serializer.write_uint(uint64_t(value));
}

template <std::signed_integral T>
void serialize(Serializer &serializer, T value) {
  serializer.write_int(int64_t(value));
}

// Enums travel as their underlying value; range checks are the reader's job.
template <typename T>
  requires std::is_enum_v<T>
void serialize(Serializer &serializer, T value) {
  serialize(serializer, static_cast<std::underlying_type_t<T>>(value));
}

inline void serialize(Serializer &serializer, const std::string &str) {
  serializer.write_str(str);
}

template <std::unsigned_integral T>
void deserialize(Deserializer &deserializer, T &value) {
  value = static_cast<T>(deserializer.read_uint());
}

template <std::signed_integral T>
void deserialize(Deserializer &deserializer, T &value) {
  value = static_cast<T>(deserializer.read_int());
}

template <typename T>
  requires std::is_enum_v<T>
void deserialize(Deserializer &deserializer, T &value) {
  std::underlying_type_t<T> raw{};
  deserialize(deserializer, raw);
  value = static_cast<T>(raw);
}

inline void deserialize(Deserializer &deserializer, std::string &value) {
  value = std::string(deserializer.read_str());
}

template <typename T>
  requires std::is_aggregate_v<T>
void serialize(Serializer &serializer, const T &value) {
  boost::pfr::for_each_field(
      value, [&](const auto &field) { serialize(serializer, field); });
}

template <typename T>
  requires std::is_aggregate_v<T>
void deserialize(Deserializer &deserializer, T &value) {
  boost::pfr::for_each_field(
      value, [&](auto &field) { deserialize(deserializer, field); });
}

template <typename T>
concept NoKeyType = !requires { typename T::key_type; };

template <typename C>
concept SequenceContainer = NoKeyType<C> && requires(const C &c) {
  typename C::value_type;
  typename C::const_iterator;
  { c.begin() } -> std::same_as<typename C::const_iterator>;
  { c.end() } -> std::same_as<typename C::const_iterator>;

  requires requires(typename C::const_iterator it) {
    { *it } -> std::convertible_to<const typename C::value_type &>;
  };
};

template <SequenceContainer C>
void serialize(Serializer &serializer, const C &container) {
  serializer.write_uint(container.size());
  for (const auto &v : container) {
    serialize(serializer, v);
  }
}

template <SequenceContainer C>
void deserialize(Deserializer &deserializer, C &container) {
  auto size = deserializer.read_uint();
  container.clear();
  for (std::size_t i = 0; i < size && !deserializer.failed; ++i) {
    typename C::value_type v;
    deserialize(deserializer, v);
    container.push_back(std::move(v));
  }
}

}  // namespace avroshard
