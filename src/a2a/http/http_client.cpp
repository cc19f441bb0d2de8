#include "a2a/http/http_client.hpp"

#include "a2a/http/http_parser.hpp"
#include "a2a/io/socket.hpp"
#include "a2a/util/log.hpp"

#include <algorithm>
#include <array>
#include <atomic>
#include <cstring>

namespace a2a::http {

struct HttpStream::Impl {
  io::Socket socket;
  HttpResponseParser parser;
  std::chrono::milliseconds read_timeout;
  std::string pending;
  std::size_t offset = 0;
  bool eof = false;
  std::atomic<bool> cancelled{false};

  Impl(io::Socket sock, std::chrono::milliseconds timeout)
      : socket(std::move(sock)), read_timeout(timeout) {
  }

  // Reads from the socket until the parser has consumed the head.
  auto read_head() -> Result<void> {
    while (!parser.headers_complete()) {
      if (auto r = fill(); !r) {
        return r;
      }
      if (eof && !parser.headers_complete()) {
        return fail(Error::ConnectionClosed);
      }
    }
    return ok();
  }

  auto fill() -> Result<void> {
    std::array<char, 8192> buf;
    auto n = socket.read_some(buf, read_timeout);
    if (cancelled.load(std::memory_order_acquire)) {
      return fail(Error::Cancelled);
    }
    if (!n) {
      return std::unexpected(n.error());
    }
    if (*n == 0) {
      eof = true;
      if (auto f = parser.finish(); !f) {
        return f;
      }
    } else if (auto f = parser.feed(std::span<const char>{buf.data(), *n});
               !f) {
      return f;
    }
    pending.append(parser.take_body());
    if (parser.message_complete()) {
      eof = true;
    }
    return ok();
  }
};

HttpStream::HttpStream(Key, std::unique_ptr<Impl> impl) : impl_(std::move(impl)) {
}

HttpStream::~HttpStream() = default;

auto HttpStream::status() const noexcept -> int {
  return impl_->parser.status();
}

auto HttpStream::headers() const noexcept -> const HttpHeaders& {
  return impl_->parser.headers();
}

auto HttpStream::header(std::string_view key) const
    -> std::optional<std::string> {
  const auto& h = headers();
  if (auto it = h.find(key); it != h.end()) {
    return it->second;
  }
  return std::nullopt;
}

auto HttpStream::read(std::span<char> buf) -> Result<std::size_t> {
  auto& s = *impl_;
  for (;;) {
    if (s.cancelled.load(std::memory_order_acquire)) {
      return fail(Error::Cancelled);
    }
    if (s.offset < s.pending.size()) {
      auto n = std::min(buf.size(), s.pending.size() - s.offset);
      std::memcpy(buf.data(), s.pending.data() + s.offset, n);
      s.offset += n;
      return n;
    }
    s.pending.clear();
    s.offset = 0;
    if (s.eof) {
      return std::size_t{0};
    }
    if (auto r = s.fill(); !r) {
      return std::unexpected(r.error());
    }
  }
}

auto HttpStream::cancel() noexcept -> void {
  if (!impl_->cancelled.exchange(true, std::memory_order_acq_rel)) {
    impl_->socket.shutdown();
  }
}

struct HttpClient::Impl {
  HttpClientConfig config;

  explicit Impl(HttpClientConfig cfg) : config(std::move(cfg)) {
  }
};

HttpClient::HttpClient(HttpClientConfig config)
    : impl_(std::make_unique<Impl>(std::move(config))) {
}

HttpClient::~HttpClient() = default;

HttpClient::HttpClient(HttpClient&&) noexcept = default;
auto HttpClient::operator=(HttpClient&&) noexcept -> HttpClient& = default;

auto HttpClient::config() const noexcept -> const HttpClientConfig& {
  return impl_->config;
}

auto HttpClient::open_stream(const Url& url, HttpRequest req)
    -> Result<std::unique_ptr<HttpStream>> {
  auto sock =
      io::Socket::connect_tcp(url.host, url.port, impl_->config.connect_timeout);
  if (!sock) {
    log::debug("Failed to connect to {}:{} - {}", url.host, url.port,
               sock.error().message());
    return std::unexpected(sock.error());
  }

  req.path = url.path;
  req.set_header("Connection", "close");
  auto request_data = req.serialize(url.authority());
  if (auto w = sock->write_all(request_data); !w) {
    log::debug("Failed to write request to {}: {}", url.to_string(),
               w.error().message());
    return std::unexpected(w.error());
  }

  auto impl = std::make_unique<HttpStream::Impl>(std::move(*sock),
                                                 impl_->config.read_timeout);
  if (auto r = impl->read_head(); !r) {
    log::debug("Failed to read response head from {}: {}", url.to_string(),
               r.error().message());
    return std::unexpected(r.error());
  }
  return std::make_unique<HttpStream>(HttpStream::Key{}, std::move(impl));
}

auto HttpClient::request(const Url& url, HttpRequest req)
    -> Result<HttpResponse> {
  auto stream = open_stream(url, std::move(req));
  if (!stream) {
    return std::unexpected(stream.error());
  }

  HttpResponse resp;
  resp.status = static_cast<HttpStatus>((*stream)->status());
  resp.headers = (*stream)->headers();

  std::array<char, 8192> buf;
  for (;;) {
    auto n = (*stream)->read(buf);
    if (!n) {
      return std::unexpected(n.error());
    }
    if (*n == 0) {
      break;
    }
    if (resp.body.size() + *n > impl_->config.max_response_size) {
      log::error("Response from {} exceeds {} bytes", url.to_string(),
                 impl_->config.max_response_size);
      return fail(Error::ProtocolError);
    }
    resp.body.insert(resp.body.end(), buf.data(), buf.data() + *n);
  }
  return resp;
}

auto HttpClient::post_json(const Url& url, std::string_view json,
                           const HttpHeaders& headers) -> Result<HttpResponse> {
  HttpRequest req;
  req.method = HttpMethod::POST;
  req.headers = headers;
  if (!req.header("Content-Type")) {
    req.set_header("Content-Type", "application/json");
  }
  req.set_body(json);
  return request(url, std::move(req));
}

}  // namespace a2a::http
