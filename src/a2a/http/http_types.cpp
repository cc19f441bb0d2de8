#include "a2a/http/http_types.hpp"

#include <algorithm>
#include <cctype>

namespace a2a::http {

namespace {

auto lower(char c) noexcept -> char {
  return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

template <typename Map>
auto find_header(const Map& headers, std::string_view key)
    -> std::optional<std::string> {
  auto it = headers.find(key);
  if (it != headers.end()) {
    return it->second;
  }
  return std::nullopt;
}

void append_headers(std::string& out, const HttpHeaders& headers) {
  for (const auto& [name, value] : headers) {
    out += name;
    out += ": ";
    out += value;
    out += "\r\n";
  }
}

}  // namespace

auto CaseInsensitiveHash::operator()(std::string_view key) const noexcept
    -> std::size_t {
  // FNV-1a over lowercased bytes
  std::size_t h = 14695981039346656037ULL;
  for (char c : key) {
    h ^= static_cast<unsigned char>(lower(c));
    h *= 1099511628211ULL;
  }
  return h;
}

auto CaseInsensitiveEqual::operator()(std::string_view a,
                                      std::string_view b) const noexcept
    -> bool {
  return std::ranges::equal(a, b, [](char x, char y) {
    return lower(x) == lower(y);
  });
}

auto HttpRequest::header(std::string_view key) const
    -> std::optional<std::string> {
  return find_header(headers, key);
}

auto HttpRequest::body_as_string() const -> std::string_view {
  return std::string_view(reinterpret_cast<const char*>(body.data()),
                          body.size());
}

auto HttpRequest::set_header(std::string key, std::string value)
    -> HttpRequest& {
  headers.insert_or_assign(std::move(key), std::move(value));
  return *this;
}

auto HttpRequest::set_body(std::string_view body_str) -> HttpRequest& {
  body.assign(body_str.begin(), body_str.end());
  return *this;
}

auto HttpRequest::serialize(std::string_view host) const -> std::string {
  std::string out;
  out.reserve(256 + body.size());
  out += method_name(method);
  out += ' ';
  out += path.empty() ? "/" : path;
  if (!query_string.empty()) {
    out += '?';
    out += query_string;
  }
  out += " HTTP/1.1\r\n";
  if (!headers.contains("Host")) {
    out += std::format("Host: {}\r\n", host);
  }
  append_headers(out, headers);
  if (!body.empty() || method == HttpMethod::POST ||
      method == HttpMethod::PUT) {
    out += std::format("Content-Length: {}\r\n", body.size());
  }
  out += "\r\n";
  out += body_as_string();
  return out;
}

auto HttpResponse::ok() -> HttpResponse {
  return HttpResponse{};
}

auto HttpResponse::json(std::string_view json_str) -> HttpResponse {
  HttpResponse resp;
  resp.headers["Content-Type"] = "application/json";
  resp.body.assign(json_str.begin(), json_str.end());
  return resp;
}

auto HttpResponse::event_stream(StreamBody body) -> HttpResponse {
  HttpResponse resp;
  resp.headers["Content-Type"] = "text/event-stream";
  resp.headers["Cache-Control"] = "no-cache";
  resp.headers["X-Accel-Buffering"] = "no";
  resp.stream = std::move(body);
  return resp;
}

auto HttpResponse::not_found() -> HttpResponse {
  return HttpResponse{.status = HttpStatus::NotFound};
}

auto HttpResponse::bad_request() -> HttpResponse {
  return HttpResponse{.status = HttpStatus::BadRequest};
}

auto HttpResponse::method_not_allowed() -> HttpResponse {
  return HttpResponse{.status = HttpStatus::MethodNotAllowed};
}

auto HttpResponse::internal_error() -> HttpResponse {
  return HttpResponse{.status = HttpStatus::InternalServerError};
}

auto HttpResponse::header(std::string_view key) const
    -> std::optional<std::string> {
  return find_header(headers, key);
}

auto HttpResponse::body_as_string() const -> std::string_view {
  return std::string_view(reinterpret_cast<const char*>(body.data()),
                          body.size());
}

auto HttpResponse::set_header(std::string key, std::string value)
    -> HttpResponse& {
  headers.insert_or_assign(std::move(key), std::move(value));
  return *this;
}

auto HttpResponse::set_body(std::string_view body_str) -> HttpResponse& {
  body.assign(body_str.begin(), body_str.end());
  return *this;
}

auto HttpResponse::serialize_head() const -> std::string {
  std::string out;
  out += std::format("HTTP/1.1 {} {}\r\n", status,
                     status_reason_phrase(status));
  append_headers(out, headers);
  if (!is_streaming()) {
    out += std::format("Content-Length: {}\r\n", body.size());
  }
  out += "Connection: close\r\n\r\n";
  return out;
}

auto HttpResponse::serialize() const -> std::string {
  auto out = serialize_head();
  out += body_as_string();
  return out;
}

auto method_name(HttpMethod method) noexcept -> std::string_view {
  switch (method) {
    case HttpMethod::GET: return "GET";
    case HttpMethod::POST: return "POST";
    case HttpMethod::PUT: return "PUT";
    case HttpMethod::DELETE: return "DELETE";
    case HttpMethod::PATCH: return "PATCH";
    case HttpMethod::OPTIONS: return "OPTIONS";
    case HttpMethod::HEAD: return "HEAD";
  }
  return "UNKNOWN";
}

auto status_reason_phrase(HttpStatus status) -> std::string_view {
  switch (status) {
    case HttpStatus::Ok: return "OK";
    case HttpStatus::Accepted: return "Accepted";
    case HttpStatus::NoContent: return "No Content";
    case HttpStatus::BadRequest: return "Bad Request";
    case HttpStatus::Unauthorized: return "Unauthorized";
    case HttpStatus::Forbidden: return "Forbidden";
    case HttpStatus::NotFound: return "Not Found";
    case HttpStatus::MethodNotAllowed: return "Method Not Allowed";
    case HttpStatus::PayloadTooLarge: return "Payload Too Large";
    case HttpStatus::UnsupportedMediaType: return "Unsupported Media Type";
    case HttpStatus::InternalServerError: return "Internal Server Error";
    case HttpStatus::NotImplemented: return "Not Implemented";
    case HttpStatus::ServiceUnavailable: return "Service Unavailable";
  }
  return "Unknown";
}

}  // namespace a2a::http
