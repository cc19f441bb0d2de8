#pragma once

#include "a2a/core/error.hpp"
#include "a2a/http/http_types.hpp"
#include "a2a/http/url.hpp"
#include "a2a/io/stream.hpp"

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace a2a::http {

struct HttpClientConfig {
  std::chrono::milliseconds connect_timeout{30000};
  std::chrono::milliseconds read_timeout{60000};
  std::size_t max_response_size{10 * 1024 * 1024};  // 10MB
};

// Response whose body is consumed incrementally. Headers are available as
// soon as the stream is opened.
class HttpStream final : public io::ByteSource {
  struct Impl;
  // Only HttpClient can open a stream.
  class Key {
    friend class HttpClient;
    Key() = default;
  };

public:
  HttpStream(Key, std::unique_ptr<Impl> impl);
  ~HttpStream() override;

  HttpStream(const HttpStream&) = delete;
  auto operator=(const HttpStream&) -> HttpStream& = delete;

  [[nodiscard]] auto status() const noexcept -> int;
  [[nodiscard]] auto headers() const noexcept -> const HttpHeaders&;
  [[nodiscard]] auto header(std::string_view key) const
      -> std::optional<std::string>;

  // Body bytes; 0 at end of body, Cancelled after cancel().
  [[nodiscard]] auto read(std::span<char> buf) -> Result<std::size_t> override;

  // Safe to call from any thread; unblocks a pending read().
  auto cancel() noexcept -> void;

private:
  friend class HttpClient;
  std::unique_ptr<Impl> impl_;
};

// One connection per request; the server closes it after responding.
class HttpClient {
public:
  explicit HttpClient(HttpClientConfig config = {});
  ~HttpClient();

  HttpClient(const HttpClient&) = delete;
  auto operator=(const HttpClient&) -> HttpClient& = delete;
  HttpClient(HttpClient&&) noexcept;
  auto operator=(HttpClient&&) noexcept -> HttpClient&;

  // Sends `req` to `url` (req.path is replaced by the URL's path) and reads
  // the complete response.
  [[nodiscard]] auto request(const Url& url, HttpRequest req)
      -> Result<HttpResponse>;

  // Returns once the response head has arrived.
  [[nodiscard]] auto open_stream(const Url& url, HttpRequest req)
      -> Result<std::unique_ptr<HttpStream>>;

  auto post_json(const Url& url, std::string_view json,
                 const HttpHeaders& headers = {}) -> Result<HttpResponse>;

  [[nodiscard]] auto config() const noexcept -> const HttpClientConfig&;

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace a2a::http
