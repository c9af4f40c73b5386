#pragma once

#include <fmt/core.h>
#include <outcome.hpp>

#include <cassert>
#include <cerrno>
#include <concepts>
#include <cstring>
#include <source_location>
#include <string>
#include <type_traits>

#define TRY(...) OUTCOME_TRY(__VA_ARGS__)
#define TRYV(...) OUTCOME_TRYV(__VA_ARGS__)

#if defined(__GNUC__) || defined(__clang__)
#define TRYX(...) OUTCOME_TRYX(__VA_ARGS__)
#endif

namespace outcome = OUTCOME_V2_NAMESPACE::experimental;

namespace avroshard {

template <typename R,
          typename S = outcome::erased_errored_status_code<
              typename outcome::system_code::value_type>,
          typename NoValuePolicy =
              outcome::policy::default_status_result_policy<R, S>>
using Result = outcome::status_result<R, S, NoValuePolicy>;

}  // namespace avroshard

template <>
struct fmt::formatter<SYSTEM_ERROR2_NAMESPACE::status_code_domain::string_ref>
    : fmt::formatter<std::string_view> {
  using T = SYSTEM_ERROR2_NAMESPACE::status_code_domain::string_ref;
  template <typename FormatContext>
  auto format(const T &c, FormatContext &ctx) const -> decltype(ctx.out()) {
    auto s = std::string_view{c.data(), c.size()};
    return fmt::formatter<std::string_view>::format(s, ctx);
  }
};

template <typename T>
  requires outcome::is_status_code<T>::value ||
           outcome::is_errored_status_code<T>::value
struct fmt::formatter<T> : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(const T &c, FormatContext &ctx) const -> decltype(ctx.out()) {
    return fmt::format_to(ctx.out(), "{}: {}", c.domain().name(), c.message());
  }
};

template <>
struct fmt::formatter<std::source_location> : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(const std::source_location &location, FormatContext &ctx) const
      -> decltype(ctx.out()) {
    std::string_view v{location.file_name()};
    return fmt::format_to(ctx.out(), "{}:{}", v.substr(v.find_last_of('/') + 1),
                          location.line());
  }
};

SYSTEM_ERROR2_NAMESPACE_BEGIN

namespace detail {
using string_ref = status_code_domain::string_ref;
using atomic_refcounted_string_ref =
    status_code_domain::atomic_refcounted_string_ref;

inline string_ref to_string_ref(const std::string &s) {
  auto p = (char *)malloc(s.size());   // NOLINT
  std::memcpy(p, s.data(), s.size());  // NOLINT
  return atomic_refcounted_string_ref{p, s.size()};
}
}  // namespace detail

template <typename Enum, typename = void>
struct HasQuickEnum : std::false_type {};

template <typename Enum>
struct HasQuickEnum<Enum, std::void_t<quick_status_code_from_enum<Enum>>>
    : std::true_type {};

// An error enum usable as a payload-carrying status code: it must have a
// quick_status_code_from_enum mapping with a payload uuid, and the payload
// must be printable.
template <typename Enum, typename Payload>
concept EnumPayload = std::is_enum_v<Enum> && HasQuickEnum<Enum>::value &&
                      requires {
                        { quick_status_code_from_enum<Enum>::payload_uuid };
                        {
                          quick_status_code_from_enum<Enum>::all_failures
                        } -> std::convertible_to<bool>;
                      } && fmt::is_formattable<Payload>::value &&
                      std::is_nothrow_move_constructible_v<Payload>;

template <typename Enum, typename Payload = void>
struct EnumPayloadDomainImpl;

template <typename Enum, typename Payload = void>
using EnumPayloadError = status_code<EnumPayloadDomainImpl<Enum, Payload>>;

template <typename Enum>
  requires std::is_enum_v<Enum> && HasQuickEnum<Enum>::value
struct EnumValueBase {
  using QuickEnum = quick_status_code_from_enum<Enum>;
  using QuickEnumMapping = typename QuickEnum::mapping;

  static const QuickEnumMapping *find_mapping(Enum v) {
    for (const auto &i : QuickEnum::value_mappings()) {
      if (i.value == v) {
        return &i;
      }
    }
    return nullptr;
  }
};

template <typename Enum, typename Payload = void>
struct EnumValue : EnumValueBase<Enum> {
  struct value_type {
    Enum value{};
    std::source_location loc = std::source_location::current();
  };

  static std::string to_string(const value_type &v) {
    auto m = EnumValueBase<Enum>::find_mapping(v.value);
    assert(m);
    return fmt::format("{} ({})", m->message, v.loc);
  }
};

template <typename Enum, typename Payload>
  requires EnumPayload<Enum, Payload>
struct EnumValue<Enum, Payload> : EnumValueBase<Enum> {
  struct value_type {
    Enum value{};
    Payload payload{};
    std::source_location loc = std::source_location::current();
  };
  static std::string to_string(const value_type &v) {
    auto m = EnumValueBase<Enum>::find_mapping(v.value);
    assert(m);
    return fmt::format("{}: {} ({})", m->message, v.payload, v.loc);
  }
};

template <typename Enum, typename Payload>
struct EnumPayloadDomainImpl final : public status_code_domain {
  using Base = status_code_domain;
  using QuickEnum = quick_status_code_from_enum<Enum>;
  using EnumPayloadErrorSelf = EnumPayloadError<Enum, Payload>;

  static constexpr size_t uuid_size = detail::cstrlen(QuickEnum::payload_uuid);
  static constexpr uint64_t payload_uuid =
      detail::parse_uuid_from_pointer<uuid_size>(QuickEnum::payload_uuid);

  constexpr EnumPayloadDomainImpl() : Base(payload_uuid) {}
  EnumPayloadDomainImpl(const EnumPayloadDomainImpl &) = default;
  EnumPayloadDomainImpl(EnumPayloadDomainImpl &&) = default;
  EnumPayloadDomainImpl &operator=(const EnumPayloadDomainImpl &) = default;
  EnumPayloadDomainImpl &operator=(EnumPayloadDomainImpl &&) = default;
  ~EnumPayloadDomainImpl() = default;

  using EnumValueType = EnumValue<Enum, Payload>;
  using value_type = typename EnumValueType::value_type;

  string_ref name() const noexcept final {
    return string_ref{QuickEnum::domain_name};
  }

  payload_info_t payload_info() const noexcept final {
    return {sizeof(value_type),
            sizeof(status_code_domain *) + sizeof(value_type),
            (alignof(value_type) > alignof(status_code_domain *))
                ? alignof(value_type)
                : alignof(status_code_domain *)};
  }

  static constexpr const EnumPayloadDomainImpl &get();

  bool _do_failure(const status_code<void> &code) const noexcept final {
    assert(code.domain() == *this);
    (void)code;
    static_assert(QuickEnum::all_failures,
                  "payload errors are always failures");
    return true;
  }

  bool _do_equivalent(const status_code<void> &code1,
                      const status_code<void> &code2) const noexcept final {
    assert(code1.domain() == *this);
    const auto &c1 = static_cast<const EnumPayloadErrorSelf &>(code1);
    if (code2.domain() == *this) {
      const auto &c2 = static_cast<const EnumPayloadErrorSelf &>(code2);
      return c1.value().value == c2.value().value;
    }

    // code2 may be the same error nested behind an indirection
    if (code1.domain().id() == (code2.domain().id() ^ 0xc44f7bdeb2cc50e9)) {
      using IndirectCode = status_code<detail::indirecting_domain<
          EnumPayloadErrorSelf, std::allocator<EnumPayloadErrorSelf>>>;
      const auto &c2 = static_cast<const IndirectCode &>(code2);
      return c1.value().value == c2.value()->sc.value().value;
    }

    if (code2.domain() == quick_status_code_from_enum_domain<Enum>) {
      using QuickCode = quick_status_code_from_enum_code<Enum>;
      const auto &c2 = static_cast<const QuickCode &>(code2);
      return c1.value().value == c2.value();
    }

    if (code2.domain() == generic_code_domain) {
      const auto &c2 = static_cast<const generic_code &>(code2);  // NOLINT
      const auto *m = EnumValueType::find_mapping(c1.value().value);
      assert(m != nullptr);
      for (auto ec : m->code_mappings) {
        if (ec == c2.value()) {
          return true;
        }
      }
    }
    return false;
  }

  generic_code _generic_code(
      const status_code<void> &code) const noexcept final {
    assert(code.domain() == *this);
    auto value = static_cast<const EnumPayloadErrorSelf &>(code).value().value;
    const auto *m = EnumValueType::find_mapping(value);
    assert(m != nullptr);
    if (m->code_mappings.size() > 0) {
      return *m->code_mappings.begin();
    }
    return errc::unknown;
  }

  string_ref _do_message(const status_code<void> &code) const noexcept final {
    assert(code.domain() == *this);
    const auto &c = static_cast<const EnumPayloadErrorSelf &>(code);
    return detail::to_string_ref(EnumValueType::to_string(c.value()));
  }

  void _do_throw_exception(const status_code<void> &code) const final {
    assert(code.domain() == *this);
    const auto &c = static_cast<const EnumPayloadErrorSelf &>(code);
    throw status_error<EnumPayloadDomainImpl>(c);
  }
};

template <typename Enum, typename Payload>
constexpr EnumPayloadDomainImpl<Enum, Payload> EnumPayloadDomain = {};

template <typename Enum, typename Payload>
constexpr const EnumPayloadDomainImpl<Enum, Payload> &
EnumPayloadDomainImpl<Enum, Payload>::get() {
  return EnumPayloadDomain<Enum, Payload>;
}

template <typename Enum, typename Payload>
inline system_code make_status_code(EnumPayloadError<Enum, Payload> e) {
  return make_nested_status_code(std::move(e));
}

/// make_error factory functions

template <typename Enum>
  requires std::is_enum_v<Enum>
EnumPayloadError<Enum> make_error(
    Enum e, std::source_location loc = std::source_location::current()) {
  return EnumPayloadError<Enum>({e, loc});
}

template <typename Enum, typename Payload>
  requires EnumPayload<Enum, Payload> &&
           std::convertible_to<Payload, std::string>
EnumPayloadError<Enum, std::string> make_error(
    Enum e, Payload &&payload,
    std::source_location loc = std::source_location::current()) {
  return EnumPayloadError<Enum, std::string>(
      {e, std::string(std::forward<Payload>(payload)), loc});
}

SYSTEM_ERROR2_NAMESPACE_END

namespace avroshard {
using SYSTEM_ERROR2_NAMESPACE::make_error;

enum class Errc : int8_t {
  unknown = -1,
  format_not_recognized = 1,
  schema_mismatch,
  unsupported_schema,
  decode_failure,
  configuration_invariant,
  truncated,
  invalid_argument,
  io_error,
  no_such_file_or_directory,
  permission_denied,
};

inline Errc errno_to_errc(int e) {
  switch (e) {
    case ENOENT:
    case ENOTDIR:
      return Errc::no_such_file_or_directory;
    case EACCES:
    case EPERM:
      return Errc::permission_denied;
    case EINVAL:
      return Errc::invalid_argument;
    default:
      return Errc::io_error;
  }
}
}  // namespace avroshard

SYSTEM_ERROR2_NAMESPACE_BEGIN
template <>
struct quick_status_code_from_enum<avroshard::Errc>
    : quick_status_code_from_enum_defaults<avroshard::Errc> {
  static constexpr auto domain_name = "avroshard::Errc";
  static constexpr auto domain_uuid = "b7c4f0a2-5d1e-4e8b-9a63-2f07d4c81e55";
  static constexpr auto payload_uuid = "0e9a3d71-c2b8-4f65-8d14-7a5be6f9c230";
  static constexpr bool all_failures = true;
  static const std::initializer_list<mapping> &value_mappings() {
    // NOLINTBEGIN
    // clang-format off
    static const std::initializer_list<mapping> v = {
        {avroshard::Errc::unknown, "unknown", {}},
        {avroshard::Errc::format_not_recognized, "format_not_recognized", {errc::illegal_byte_sequence}},
        {avroshard::Errc::schema_mismatch, "schema_mismatch", {errc::invalid_argument}},
        {avroshard::Errc::unsupported_schema, "unsupported_schema", {errc::not_supported}},
        {avroshard::Errc::decode_failure, "decode_failure", {errc::bad_message}},
        {avroshard::Errc::configuration_invariant, "configuration_invariant", {errc::state_not_recoverable}},
        {avroshard::Errc::truncated, "truncated", {errc::bad_message}},
        {avroshard::Errc::invalid_argument, "invalid_argument", {errc::invalid_argument}},
        {avroshard::Errc::io_error, "io_error", {errc::io_error}},
        {avroshard::Errc::no_such_file_or_directory, "no_such_file_or_directory", {errc::no_such_file_or_directory}},
        {avroshard::Errc::permission_denied, "permission_denied", {errc::permission_denied}},
    };
    // clang-format on
    // NOLINTEND
    return v;
  }
};
SYSTEM_ERROR2_NAMESPACE_END
