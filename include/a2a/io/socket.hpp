#pragma once

#include "a2a/core/error.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <utility>

namespace a2a::io {

// Owning TCP socket. Blocking I/O with poll()-based timeouts.
class Socket {
public:
  Socket() noexcept = default;
  explicit Socket(int fd) noexcept : fd_(fd) {
  }

  Socket(Socket&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {
  }

  auto operator=(Socket&& other) noexcept -> Socket& {
    if (this != &other) {
      close();
      fd_ = std::exchange(other.fd_, -1);
    }
    return *this;
  }

  Socket(const Socket&) = delete;
  auto operator=(const Socket&) -> Socket& = delete;

  ~Socket() {
    close();
  }

  [[nodiscard]] static auto connect_tcp(const std::string& host,
                                        std::uint16_t port,
                                        std::chrono::milliseconds timeout)
      -> Result<Socket>;

  // port 0 picks an ephemeral port; see local_port().
  [[nodiscard]] static auto listen_tcp(const std::string& host,
                                       std::uint16_t port, int backlog = 128)
      -> Result<Socket>;

  // Timeout if nothing arrives within `timeout`.
  [[nodiscard]] auto accept(std::chrono::milliseconds timeout) -> Result<Socket>;

  // Returns 0 on orderly shutdown by the peer.
  [[nodiscard]] auto read_some(std::span<char> buf,
                               std::chrono::milliseconds timeout)
      -> Result<std::size_t>;

  [[nodiscard]] auto write_all(std::string_view data) -> Result<void>;

  // Wakes up any thread blocked in read_some() on this socket.
  auto shutdown() noexcept -> void;
  auto close() noexcept -> void;

  [[nodiscard]] auto local_port() const -> Result<std::uint16_t>;

  [[nodiscard]] auto fd() const noexcept -> int {
    return fd_;
  }
  [[nodiscard]] auto is_open() const noexcept -> bool {
    return fd_ >= 0;
  }
  [[nodiscard]] explicit operator bool() const noexcept {
    return is_open();
  }

private:
  int fd_{-1};
};

}  // namespace a2a::io
