#pragma once

#include "a2a/config/system_config.hpp"
#include "a2a/core/error.hpp"
#include "a2a/http/http_types.hpp"
#include "a2a/task/task_manager.hpp"

#include <cstdint>
#include <memory>

namespace a2a {

// Serves the A2A JSON-RPC methods on POST <base_path>. Unary methods answer
// with a JSON body; sendSubscribe/resubscribe answer with an SSE stream.
class A2AServer {
public:
  explicit A2AServer(ITaskManager& manager, ServerConfig config = {});
  ~A2AServer();

  A2AServer(const A2AServer&) = delete;
  auto operator=(const A2AServer&) -> A2AServer& = delete;

  [[nodiscard]] auto start() -> Result<void>;
  auto stop() -> void;

  [[nodiscard]] auto is_running() const -> bool;
  // Bound port; differs from the configured one when that was 0.
  [[nodiscard]] auto port() const -> std::uint16_t;

  // Handles one JSON-RPC request without going through a socket.
  [[nodiscard]] auto handle(const http::HttpRequest& req) -> http::HttpResponse;

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace a2a
