#pragma once

#include "a2a/core/cancellation.hpp"
#include "a2a/core/error.hpp"

#include <cstdint>
#include <format>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace a2a::http {

enum class HttpMethod : std::uint8_t {
  GET,
  POST,
  PUT,
  DELETE,
  PATCH,
  OPTIONS,
  HEAD
};

enum class HttpStatus : std::uint16_t {
  Ok = 200,
  Accepted = 202,
  NoContent = 204,

  BadRequest = 400,
  Unauthorized = 401,
  Forbidden = 403,
  NotFound = 404,
  MethodNotAllowed = 405,
  PayloadTooLarge = 413,
  UnsupportedMediaType = 415,

  InternalServerError = 500,
  NotImplemented = 501,
  ServiceUnavailable = 503
};

// Header names compare case-insensitively.
struct CaseInsensitiveHash {
  using is_transparent = void;
  [[nodiscard]] auto operator()(std::string_view key) const noexcept
      -> std::size_t;
};

struct CaseInsensitiveEqual {
  using is_transparent = void;
  [[nodiscard]] auto operator()(std::string_view a,
                                std::string_view b) const noexcept -> bool;
};

using HttpHeaders = std::unordered_map<std::string, std::string,
                                       CaseInsensitiveHash,
                                       CaseInsensitiveEqual>;

struct HttpRequest {
  HttpMethod method{HttpMethod::GET};
  std::string path{"/"};
  std::string query_string;
  HttpHeaders headers;
  std::vector<uint8_t> body;

  [[nodiscard]] auto header(std::string_view key) const
      -> std::optional<std::string>;
  [[nodiscard]] auto body_as_string() const -> std::string_view;

  auto set_header(std::string key, std::string value) -> HttpRequest&;
  auto set_body(std::string_view body_str) -> HttpRequest&;

  // Request line, headers (Content-Length added when a body is present) and
  // body. `host` fills the Host header when it is not already set.
  [[nodiscard]] auto serialize(std::string_view host) const -> std::string;
};

// Sink for a streamed response body.
class StreamWriter {
public:
  virtual ~StreamWriter() = default;

  // ConnectionClosed once the peer has gone away.
  virtual auto write(std::string_view data) -> Result<void> = 0;

  // Cancelled when the server stops.
  [[nodiscard]] virtual auto cancellation() const noexcept
      -> CancellationToken = 0;
};

using StreamBody = std::function<void(StreamWriter&)>;

struct HttpResponse {
  HttpStatus status{HttpStatus::Ok};
  HttpHeaders headers;
  std::vector<uint8_t> body;
  // When set, the body is produced by this callback after the head is sent
  // and the connection is closed afterwards.
  StreamBody stream;

  static auto ok() -> HttpResponse;
  static auto json(std::string_view json_str) -> HttpResponse;
  static auto event_stream(StreamBody body) -> HttpResponse;
  static auto not_found() -> HttpResponse;
  static auto bad_request() -> HttpResponse;
  static auto method_not_allowed() -> HttpResponse;
  static auto internal_error() -> HttpResponse;

  [[nodiscard]] auto header(std::string_view key) const
      -> std::optional<std::string>;
  [[nodiscard]] auto body_as_string() const -> std::string_view;
  [[nodiscard]] auto status_code() const noexcept -> int {
    return static_cast<int>(status);
  }
  [[nodiscard]] auto is_streaming() const noexcept -> bool {
    return static_cast<bool>(stream);
  }

  auto set_header(std::string key, std::string value) -> HttpResponse&;
  auto set_body(std::string_view body_str) -> HttpResponse&;

  // Status line and headers only. Content-Length is emitted for buffered
  // responses; streamed ones are delimited by connection close.
  [[nodiscard]] auto serialize_head() const -> std::string;
  [[nodiscard]] auto serialize() const -> std::string;
};

[[nodiscard]] auto method_name(HttpMethod method) noexcept -> std::string_view;
[[nodiscard]] auto status_reason_phrase(HttpStatus status) -> std::string_view;

}  // namespace a2a::http

template <>
struct std::formatter<a2a::http::HttpMethod>
    : std::formatter<std::string_view> {
  auto format(a2a::http::HttpMethod method, auto& ctx) const {
    return std::formatter<std::string_view>::format(
        a2a::http::method_name(method), ctx);
  }
};

template <>
struct std::formatter<a2a::http::HttpStatus>
    : std::formatter<std::uint16_t> {
  auto format(a2a::http::HttpStatus status, auto& ctx) const {
    return std::formatter<std::uint16_t>::format(
        static_cast<std::uint16_t>(status), ctx);
  }
};
