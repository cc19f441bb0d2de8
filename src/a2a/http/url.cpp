#include "a2a/http/url.hpp"

#include <charconv>
#include <format>

namespace a2a::http {

namespace {

constexpr std::string_view kHttpScheme = "http://";

}  // namespace

auto Url::authority() const -> std::string {
  if (port == 80) {
    return host;
  }
  return std::format("{}:{}", host, port);
}

auto Url::to_string() const -> std::string {
  return std::format("{}://{}{}", scheme, authority(), path);
}

auto parse_url(std::string_view url) -> Result<Url> {
  if (!url.starts_with(kHttpScheme)) {
    return fail(Error::InvalidArgument);
  }
  url.remove_prefix(kHttpScheme.size());

  Url result;
  auto path_pos = url.find_first_of("/?");
  auto authority = url.substr(0, path_pos);
  if (path_pos != std::string_view::npos) {
    auto rest = url.substr(path_pos);
    result.path = rest.starts_with('?') ? "/" + std::string(rest)
                                        : std::string(rest);
  }

  if (authority.empty() || authority.contains('@')) {
    return fail(Error::InvalidArgument);
  }

  std::string_view host = authority;
  if (authority.starts_with('[')) {
    auto close = authority.find(']');
    if (close == std::string_view::npos) {
      return fail(Error::InvalidArgument);
    }
    host = authority.substr(1, close - 1);
    authority.remove_prefix(close + 1);
    if (!authority.empty() && !authority.starts_with(':')) {
      return fail(Error::InvalidArgument);
    }
  } else if (auto colon = authority.rfind(':');
             colon != std::string_view::npos) {
    host = authority.substr(0, colon);
    authority.remove_prefix(colon);
  } else {
    authority = {};
  }

  if (authority.starts_with(':')) {
    auto digits = authority.substr(1);
    std::uint16_t port = 0;
    auto [ptr, ec] =
        std::from_chars(digits.data(), digits.data() + digits.size(), port);
    if (digits.empty() || ec != std::errc{} ||
        ptr != digits.data() + digits.size() || port == 0) {
      return fail(Error::InvalidArgument);
    }
    result.port = port;
  }

  if (host.empty()) {
    return fail(Error::InvalidArgument);
  }
  result.host = std::string(host);
  return result;
}

}  // namespace a2a::http
