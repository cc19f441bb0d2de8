#pragma once

#include "a2a/core/error.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace a2a::http {

struct Url {
  std::string scheme{"http"};
  std::string host;
  std::uint16_t port{80};
  std::string path{"/"};  // includes the query string, if any

  // "host:port", omitting the default port.
  [[nodiscard]] auto authority() const -> std::string;
  [[nodiscard]] auto to_string() const -> std::string;
};

// Accepts absolute http:// URLs. InvalidArgument for anything else,
// including https:// (no TLS support).
[[nodiscard]] auto parse_url(std::string_view url) -> Result<Url>;

}  // namespace a2a::http
