#include "a2a/http/http_server.hpp"

#include "a2a/core/cancellation.hpp"
#include "a2a/core/worker_group.hpp"
#include "a2a/http/http_parser.hpp"
#include "a2a/io/socket.hpp"
#include "a2a/util/log.hpp"

#include <array>
#include <atomic>
#include <mutex>
#include <thread>
#include <unordered_set>

namespace a2a::http {

namespace {

constexpr auto kAcceptPoll = std::chrono::milliseconds(200);

class SocketStreamWriter final : public StreamWriter {
public:
  SocketStreamWriter(io::Socket& socket, CancellationToken token)
      : socket_(socket), token_(std::move(token)) {
  }

  auto write(std::string_view data) -> Result<void> override {
    if (closed_) {
      return fail(Error::ConnectionClosed);
    }
    auto r = socket_.write_all(data);
    if (!r) {
      closed_ = true;
    }
    return r;
  }

  [[nodiscard]] auto cancellation() const noexcept
      -> CancellationToken override {
    return token_;
  }

private:
  io::Socket& socket_;
  CancellationToken token_;
  bool closed_ = false;
};

}  // namespace

struct HttpServer::Impl {
  Router router_;
  std::chrono::milliseconds read_timeout;
  io::Socket listener;
  std::uint16_t bound_port = 0;
  std::atomic<bool> running{false};
  bool stopped = false;  // connection workers cannot be restarted
  CancellationSource cancel;

  std::mutex conn_mu;
  std::unordered_set<io::Socket*> open_connections;

  WorkerGroup connections;
  std::jthread acceptor;

  explicit Impl(std::chrono::milliseconds timeout) : read_timeout(timeout) {
  }

  auto track(io::Socket* sock) -> bool {
    std::lock_guard lock(conn_mu);
    if (!running.load(std::memory_order_acquire)) {
      return false;
    }
    open_connections.insert(sock);
    return true;
  }

  auto untrack(io::Socket* sock) -> void {
    std::lock_guard lock(conn_mu);
    open_connections.erase(sock);
  }

  auto read_request(io::Socket& sock) -> std::optional<HttpRequest> {
    HttpRequestParser parser;
    std::array<char, 8192> buf;
    for (;;) {
      auto n = sock.read_some(buf, read_timeout);
      if (!n) {
        log::debug("HTTP read failed: fd={} err={}", sock.fd(),
                   n.error().message());
        return std::nullopt;
      }
      if (*n == 0) {
        return std::nullopt;
      }
      auto parsed = parser.parse(std::span<const char>{buf.data(), *n});
      if (!parsed) {
        auto bad = HttpResponse::bad_request().serialize();
        if (auto w = sock.write_all(bad); !w) {
          log::debug("HTTP 400 write failed: fd={} err={}", sock.fd(),
                     w.error().message());
        }
        return std::nullopt;
      }
      if (*parsed) {
        return std::move(**parsed);
      }
    }
  }

  auto handle_connection(io::Socket& sock) -> void {
    auto req = read_request(sock);
    if (!req) {
      return;
    }
    log::debug("HTTP request: {} {} (fd={})", req->method, req->path,
               sock.fd());

    HttpResponse resp;
    try {
      resp = router_.route(*req);
    } catch (const std::exception& e) {
      log::error("Exception in HTTP handler for {}: {}", req->path, e.what());
      resp = HttpResponse::internal_error();
    }

    if (!resp.is_streaming()) {
      if (auto w = sock.write_all(resp.serialize()); !w) {
        log::debug("HTTP write failed: fd={} err={}", sock.fd(),
                   w.error().message());
      }
      return;
    }

    if (auto w = sock.write_all(resp.serialize_head()); !w) {
      log::debug("HTTP stream head write failed: fd={} err={}", sock.fd(),
                 w.error().message());
      return;
    }
    SocketStreamWriter writer(sock, cancel.token());
    try {
      resp.stream(writer);
    } catch (const std::exception& e) {
      log::error("Exception in stream body for {}: {}", req->path, e.what());
    }
  }

  auto accept_loop(std::stop_token st) -> void {
    while (!st.stop_requested()) {
      auto client = listener.accept(kAcceptPoll);
      if (!client) {
        if (client.error() == make_error_code(Error::Timeout)) {
          continue;
        }
        if (running.load(std::memory_order_acquire)) {
          log::error("Accept failed: {}", client.error().message());
        }
        break;
      }

      auto sock = std::make_shared<io::Socket>(std::move(*client));
      bool spawned = connections.spawn([this, sock](std::stop_token) {
        if (!track(sock.get())) {
          return;
        }
        handle_connection(*sock);
        untrack(sock.get());
      });
      if (!spawned) {
        break;
      }
    }
  }
};

HttpServer::HttpServer(std::chrono::milliseconds read_timeout)
    : impl_(std::make_unique<Impl>(read_timeout)) {
}

HttpServer::~HttpServer() {
  stop();
}

auto HttpServer::router() -> Router& {
  return impl_->router_;
}

auto HttpServer::start(const std::string& host, std::uint16_t port)
    -> Result<void> {
  if (impl_->running.load()) {
    return fail(Error::InvalidArgument);
  }
  if (impl_->stopped) {
    log::error("HTTP server cannot be restarted after stop()");
    return fail(Error::InvalidArgument);
  }
  auto listener = io::Socket::listen_tcp(host, port);
  if (!listener) {
    log::error("Failed to listen on {}:{}: {}", host, port,
               listener.error().message());
    return std::unexpected(listener.error());
  }
  auto bound = listener->local_port();
  if (!bound) {
    return std::unexpected(bound.error());
  }

  impl_->listener = std::move(*listener);
  impl_->bound_port = *bound;
  impl_->running.store(true, std::memory_order_release);
  impl_->acceptor =
      std::jthread([impl = impl_.get()](std::stop_token st) {
        impl->accept_loop(st);
      });

  log::info("HTTP server listening on {}:{}", host, impl_->bound_port);
  return ok();
}

auto HttpServer::stop() -> void {
  if (!impl_->running.exchange(false)) {
    return;
  }
  impl_->stopped = true;
  impl_->cancel.cancel();
  if (impl_->acceptor.joinable()) {
    impl_->acceptor.request_stop();
    impl_->acceptor.join();
  }
  impl_->listener.close();
  {
    std::lock_guard lock(impl_->conn_mu);
    for (auto* sock : impl_->open_connections) {
      sock->shutdown();
    }
  }
  impl_->connections.stop();
  log::info("HTTP server on port {} stopped", impl_->bound_port);
}

auto HttpServer::is_running() const -> bool {
  return impl_->running.load(std::memory_order_acquire);
}

auto HttpServer::port() const -> std::uint16_t {
  return impl_->bound_port;
}

}  // namespace a2a::http
