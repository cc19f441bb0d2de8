#pragma once

#include "a2a/core/error.hpp"
#include "a2a/http/http_types.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <span>
#include <string>

namespace a2a::http {

// Server side. Feed bytes until a complete request comes out.
class HttpRequestParser {
public:
  static constexpr std::size_t kDefaultMaxBodySize = 8 * 1024 * 1024;

  explicit HttpRequestParser(std::size_t max_body_size = kDefaultMaxBodySize);
  ~HttpRequestParser();

  HttpRequestParser(const HttpRequestParser&) = delete;
  auto operator=(const HttpRequestParser&) -> HttpRequestParser& = delete;

  // nullopt while the request is incomplete; ParseError on malformed input.
  auto parse(std::span<const char> data) -> Result<std::optional<HttpRequest>>;
  auto reset() -> void;

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

// Client side. Incremental so that a streamed body can be consumed while it
// arrives: headers become available first, then body bytes via take_body().
class HttpResponseParser {
public:
  HttpResponseParser();
  ~HttpResponseParser();

  HttpResponseParser(const HttpResponseParser&) = delete;
  auto operator=(const HttpResponseParser&) -> HttpResponseParser& = delete;

  auto feed(std::span<const char> data) -> Result<void>;

  // Signals end of input; completes close-delimited bodies.
  auto finish() -> Result<void>;

  [[nodiscard]] auto headers_complete() const noexcept -> bool;
  [[nodiscard]] auto message_complete() const noexcept -> bool;

  [[nodiscard]] auto status() const noexcept -> int;
  [[nodiscard]] auto headers() const noexcept -> const HttpHeaders&;

  // Body bytes received since the last call.
  [[nodiscard]] auto take_body() -> std::string;

  auto reset() -> void;

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace a2a::http
