#include "a2a/http/router.hpp"

#include "a2a/util/log.hpp"

#include <unordered_map>
#include <vector>

namespace a2a::http {

namespace {

auto normalize(std::string_view path) -> std::string {
  while (path.size() > 1 && path.back() == '/') {
    path.remove_suffix(1);
  }
  return path.empty() ? std::string("/") : std::string(path);
}

}  // namespace

struct Router::Impl {
  struct Entry {
    HttpMethod method;
    RouteHandler handler;
  };

  std::unordered_map<std::string, std::vector<Entry>, StringHash, StringEqual>
      paths;
};

Router::Router() : impl_(std::make_unique<Impl>()) {
}

Router::~Router() = default;

auto Router::add_route(HttpMethod method, std::string_view path,
                       RouteHandler handler) -> void {
  auto& entries = impl_->paths[normalize(path)];
  for (auto& entry : entries) {
    if (entry.method == method) {
      entry.handler = std::move(handler);
      return;
    }
  }
  entries.push_back(Impl::Entry{method, std::move(handler)});
}

auto Router::route(const HttpRequest& req) const -> HttpResponse {
  auto it = impl_->paths.find(normalize(req.path));
  if (it == impl_->paths.end()) {
    log::debug("No route for {}", req.path);
    return HttpResponse::not_found();
  }
  for (const auto& entry : it->second) {
    if (entry.method == req.method) {
      return entry.handler(req);
    }
  }
  return HttpResponse::method_not_allowed();
}

}  // namespace a2a::http
