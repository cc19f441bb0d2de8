#pragma once

#include "a2a/core/error.hpp"
#include "a2a/http/router.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace a2a::http {

// Thread-per-connection HTTP/1.1 server. Each connection carries one
// request; responses are sent with "Connection: close".
class HttpServer {
public:
  explicit HttpServer(
      std::chrono::milliseconds read_timeout = std::chrono::seconds(30));
  ~HttpServer();

  HttpServer(const HttpServer&) = delete;
  auto operator=(const HttpServer&) -> HttpServer& = delete;

  auto router() -> Router&;

  // Binds and starts accepting in the background. Port 0 binds an ephemeral
  // port; see port(). A stopped server cannot be started again.
  [[nodiscard]] auto start(const std::string& host, std::uint16_t port)
      -> Result<void>;

  // Stops accepting, cancels streaming responses, wakes blocked reads and
  // joins every connection thread.
  auto stop() -> void;

  [[nodiscard]] auto is_running() const -> bool;
  [[nodiscard]] auto port() const -> std::uint16_t;

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace a2a::http
