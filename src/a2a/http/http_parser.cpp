#include "a2a/http/http_parser.hpp"

#include "a2a/util/log.hpp"

#include <llhttp.h>

#include <utility>

namespace a2a::http {

namespace {

// Shared header accumulation for both parser directions.
struct HeaderState {
  std::string field;
  std::string value;
  bool in_field = false;

  auto on_field(HttpHeaders& headers, const char* at, size_t length) -> void {
    if (!in_field && !field.empty()) {
      flush(headers);
    }
    field.append(at, length);
    in_field = true;
  }

  auto on_value(const char* at, size_t length) -> void {
    value.append(at, length);
    in_field = false;
  }

  auto flush(HttpHeaders& headers) -> void {
    if (!field.empty()) {
      headers.insert_or_assign(std::move(field), std::move(value));
    }
    field.clear();
    value.clear();
    in_field = false;
  }
};

auto to_method(uint8_t method) -> std::optional<HttpMethod> {
  switch (method) {
    case HTTP_GET: return HttpMethod::GET;
    case HTTP_POST: return HttpMethod::POST;
    case HTTP_PUT: return HttpMethod::PUT;
    case HTTP_DELETE: return HttpMethod::DELETE;
    case HTTP_PATCH: return HttpMethod::PATCH;
    case HTTP_OPTIONS: return HttpMethod::OPTIONS;
    case HTTP_HEAD: return HttpMethod::HEAD;
    default: return std::nullopt;
  }
}

}  // namespace

struct HttpRequestParser::Impl {
  llhttp_t parser;
  llhttp_settings_t settings;
  HttpRequest current;
  HeaderState header;
  std::size_t max_body_size;
  bool complete = false;
  bool in_query = false;

  explicit Impl(std::size_t max_body) : max_body_size(max_body) {
  }

  static auto self(llhttp_t* p) -> Impl* {
    return static_cast<Impl*>(p->data);
  }

  static auto on_url(llhttp_t* p, const char* at, size_t length) -> int {
    auto* impl = self(p);
    std::string_view url(at, length);
    auto& req = impl->current;
    // The URL may arrive in pieces.
    if (impl->in_query) {
      req.query_string.append(url);
      return 0;
    }
    auto query_pos = url.find('?');
    if (query_pos != std::string_view::npos) {
      req.path.append(url.substr(0, query_pos));
      req.query_string.append(url.substr(query_pos + 1));
      impl->in_query = true;
    } else {
      req.path.append(url);
    }
    return 0;
  }

  static auto on_header_field(llhttp_t* p, const char* at, size_t length)
      -> int {
    auto* impl = self(p);
    impl->header.on_field(impl->current.headers, at, length);
    return 0;
  }

  static auto on_header_value(llhttp_t* p, const char* at, size_t length)
      -> int {
    self(p)->header.on_value(at, length);
    return 0;
  }

  static auto on_headers_complete(llhttp_t* p) -> int {
    auto* impl = self(p);
    impl->header.flush(impl->current.headers);

    auto method = to_method(llhttp_get_method(p));
    if (!method) {
      return -1;
    }
    impl->current.method = *method;
    return 0;
  }

  static auto on_body(llhttp_t* p, const char* at, size_t length) -> int {
    auto* impl = self(p);
    auto& body = impl->current.body;
    if (body.size() + length > impl->max_body_size) {
      return -1;
    }
    body.insert(body.end(), at, at + length);
    return 0;
  }

  static auto on_message_complete(llhttp_t* p) -> int {
    self(p)->complete = true;
    // Stop here; the connection serves one request.
    return HPE_PAUSED;
  }

  auto init() -> void {
    current = HttpRequest{};
    current.path.clear();
    header = HeaderState{};
    complete = false;
    in_query = false;
    llhttp_init(&parser, HTTP_REQUEST, &settings);
    parser.data = this;
  }
};

HttpRequestParser::HttpRequestParser(std::size_t max_body_size)
    : impl_(std::make_unique<Impl>(max_body_size)) {
  llhttp_settings_init(&impl_->settings);
  impl_->settings.on_url = Impl::on_url;
  impl_->settings.on_header_field = Impl::on_header_field;
  impl_->settings.on_header_value = Impl::on_header_value;
  impl_->settings.on_headers_complete = Impl::on_headers_complete;
  impl_->settings.on_body = Impl::on_body;
  impl_->settings.on_message_complete = Impl::on_message_complete;
  impl_->init();
}

HttpRequestParser::~HttpRequestParser() = default;

auto HttpRequestParser::parse(std::span<const char> data)
    -> Result<std::optional<HttpRequest>> {
  if (impl_->complete) {
    return std::optional<HttpRequest>{};
  }
  llhttp_errno err = llhttp_execute(&impl_->parser, data.data(), data.size());

  if (err != HPE_OK && err != HPE_PAUSED) {
    const char* reason = llhttp_get_error_reason(&impl_->parser);
    log::warn("HTTP request parse error: {} (reason: {})",
              llhttp_errno_name(err), reason ? reason : "");
    return fail(Error::ParseError);
  }

  if (impl_->complete) {
    return std::optional<HttpRequest>{std::move(impl_->current)};
  }
  return std::optional<HttpRequest>{};
}

auto HttpRequestParser::reset() -> void {
  impl_->init();
}

struct HttpResponseParser::Impl {
  llhttp_t parser;
  llhttp_settings_t settings;
  HttpHeaders headers;
  HeaderState header;
  std::string body;
  int status = 0;
  bool headers_done = false;
  bool complete = false;

  static auto self(llhttp_t* p) -> Impl* {
    return static_cast<Impl*>(p->data);
  }

  static auto on_header_field(llhttp_t* p, const char* at, size_t length)
      -> int {
    auto* impl = self(p);
    impl->header.on_field(impl->headers, at, length);
    return 0;
  }

  static auto on_header_value(llhttp_t* p, const char* at, size_t length)
      -> int {
    self(p)->header.on_value(at, length);
    return 0;
  }

  static auto on_headers_complete(llhttp_t* p) -> int {
    auto* impl = self(p);
    impl->header.flush(impl->headers);
    impl->status = llhttp_get_status_code(p);
    impl->headers_done = true;
    return 0;
  }

  static auto on_body(llhttp_t* p, const char* at, size_t length) -> int {
    self(p)->body.append(at, length);
    return 0;
  }

  static auto on_message_complete(llhttp_t* p) -> int {
    self(p)->complete = true;
    return HPE_PAUSED;
  }

  auto init() -> void {
    headers.clear();
    header = HeaderState{};
    body.clear();
    status = 0;
    headers_done = false;
    complete = false;
    llhttp_init(&parser, HTTP_RESPONSE, &settings);
    parser.data = this;
  }
};

HttpResponseParser::HttpResponseParser() : impl_(std::make_unique<Impl>()) {
  llhttp_settings_init(&impl_->settings);
  impl_->settings.on_header_field = Impl::on_header_field;
  impl_->settings.on_header_value = Impl::on_header_value;
  impl_->settings.on_headers_complete = Impl::on_headers_complete;
  impl_->settings.on_body = Impl::on_body;
  impl_->settings.on_message_complete = Impl::on_message_complete;
  impl_->init();
}

HttpResponseParser::~HttpResponseParser() = default;

auto HttpResponseParser::feed(std::span<const char> data) -> Result<void> {
  if (impl_->complete) {
    return ok();
  }
  llhttp_errno err = llhttp_execute(&impl_->parser, data.data(), data.size());
  if (err != HPE_OK && err != HPE_PAUSED) {
    const char* reason = llhttp_get_error_reason(&impl_->parser);
    log::warn("HTTP response parse error: {} (reason: {})",
              llhttp_errno_name(err), reason ? reason : "");
    return fail(Error::ProtocolError);
  }
  return ok();
}

auto HttpResponseParser::finish() -> Result<void> {
  if (impl_->complete) {
    return ok();
  }
  llhttp_errno err = llhttp_finish(&impl_->parser);
  if (err != HPE_OK && err != HPE_PAUSED) {
    log::debug("HTTP response truncated: {}", llhttp_errno_name(err));
    return fail(Error::ConnectionClosed);
  }
  if (!impl_->headers_done) {
    return fail(Error::ConnectionClosed);
  }
  impl_->complete = true;
  return ok();
}

auto HttpResponseParser::headers_complete() const noexcept -> bool {
  return impl_->headers_done;
}

auto HttpResponseParser::message_complete() const noexcept -> bool {
  return impl_->complete;
}

auto HttpResponseParser::status() const noexcept -> int {
  return impl_->status;
}

auto HttpResponseParser::headers() const noexcept -> const HttpHeaders& {
  return impl_->headers;
}

auto HttpResponseParser::take_body() -> std::string {
  return std::exchange(impl_->body, std::string{});
}

auto HttpResponseParser::reset() -> void {
  impl_->init();
}

}  // namespace a2a::http
