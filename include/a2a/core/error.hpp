#pragma once

#include <cerrno>
#include <expected>
#include <functional>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>

namespace a2a {

// Transport, parsing and I/O failures. JSON-RPC level failures are
// jsonrpc::Error values instead.
enum class Error : int {
  Success = 0,
  FileNotFound,
  ParseError,
  InvalidArgument,
  Timeout,
  Cancelled,
  ConnectionFailed,
  ConnectionClosed,
  ProtocolError,
  Unknown,
};

[[nodiscard]] auto error_category() noexcept -> const std::error_category&;

[[nodiscard]] inline auto make_error_code(Error e) noexcept -> std::error_code {
  return {std::to_underlying(e), error_category()};
}

template <typename T>
using Result = std::expected<T, std::error_code>;

template <typename T>
[[nodiscard]] constexpr auto ok(T&& value) -> Result<std::decay_t<T>> {
  return std::forward<T>(value);
}

[[nodiscard]] constexpr auto ok() -> Result<void> {
  return {};
}

[[nodiscard]] inline auto fail(Error e) -> std::unexpected<std::error_code> {
  return std::unexpected{make_error_code(e)};
}

[[nodiscard]] inline auto fail(std::error_code ec)
    -> std::unexpected<std::error_code> {
  return std::unexpected{ec};
}

// Reads errno at the call site unless given explicitly.
[[nodiscard]] inline auto fail_errno(int err = errno)
    -> std::unexpected<std::error_code> {
  return std::unexpected{std::error_code{err, std::generic_category()}};
}

// Transparent hashing so string-keyed maps can be probed with string_view.
struct StringHash {
  using is_transparent = void;

  [[nodiscard]] auto operator()(std::string_view sv) const noexcept
      -> std::size_t {
    return std::hash<std::string_view>{}(sv);
  }
};

using StringEqual = std::equal_to<>;

}  // namespace a2a

template <>
struct std::is_error_code_enum<a2a::Error> : std::true_type {};
