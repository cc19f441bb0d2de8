#pragma once

#include "a2a/http/http_types.hpp"

#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace a2a::http {

using RouteHandler = std::function<HttpResponse(const HttpRequest&)>;

// Exact-path dispatch; a trailing slash is ignored ("/a2a/" == "/a2a").
// Unknown paths answer 404, known paths with another method 405.
class Router {
public:
  Router();
  ~Router();

  Router(const Router&) = delete;
  auto operator=(const Router&) -> Router& = delete;

  // Replaces an existing handler for the same method and path.
  auto add_route(HttpMethod method, std::string_view path,
                 RouteHandler handler) -> void;

  auto get(std::string_view path, RouteHandler handler) -> void {
    add_route(HttpMethod::GET, path, std::move(handler));
  }
  auto post(std::string_view path, RouteHandler handler) -> void {
    add_route(HttpMethod::POST, path, std::move(handler));
  }

  [[nodiscard]] auto route(const HttpRequest& req) const -> HttpResponse;

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace a2a::http
