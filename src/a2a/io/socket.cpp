#include "a2a/io/socket.hpp"

#include "a2a/util/log.hpp"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <memory>

namespace a2a::io {

namespace {

auto poll_timeout(std::chrono::milliseconds timeout) -> int {
  return timeout.count() < 0 ? -1 : static_cast<int>(timeout.count());
}

// 0 on timeout, >0 when ready.
auto wait_for(int fd, short events, std::chrono::milliseconds timeout)
    -> Result<int> {
  pollfd pfd{.fd = fd, .events = events, .revents = 0};
  for (;;) {
    int rc = ::poll(&pfd, 1, poll_timeout(timeout));
    if (rc >= 0) {
      return rc;
    }
    if (errno != EINTR) {
      return fail_errno();
    }
  }
}

auto set_nonblocking(int fd, bool on) -> bool {
  int flags = ::fcntl(fd, F_GETFL, 0);
  if (flags < 0) {
    return false;
  }
  flags = on ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
  return ::fcntl(fd, F_SETFL, flags) == 0;
}

struct AddrInfoDeleter {
  void operator()(addrinfo* ai) const noexcept {
    ::freeaddrinfo(ai);
  }
};

auto resolve(const std::string& host, std::uint16_t port, bool passive)
    -> Result<std::unique_ptr<addrinfo, AddrInfoDeleter>> {
  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  if (passive) {
    hints.ai_flags = AI_PASSIVE;
  }
  addrinfo* res = nullptr;
  auto service = std::to_string(port);
  int rc = ::getaddrinfo(host.empty() ? nullptr : host.c_str(),
                         service.c_str(), &hints, &res);
  if (rc != 0) {
    log::warn("getaddrinfo({}:{}) failed: {}", host, port, ::gai_strerror(rc));
    return fail(Error::ConnectionFailed);
  }
  return std::unique_ptr<addrinfo, AddrInfoDeleter>(res);
}

auto connect_one(const addrinfo* ai, std::chrono::milliseconds timeout)
    -> Result<Socket> {
  Socket sock{::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC,
                       ai->ai_protocol)};
  if (!sock) {
    return fail_errno();
  }
  if (!set_nonblocking(sock.fd(), true)) {
    return fail_errno();
  }

  if (::connect(sock.fd(), ai->ai_addr, ai->ai_addrlen) < 0) {
    if (errno != EINPROGRESS) {
      return fail_errno();
    }
    auto ready = wait_for(sock.fd(), POLLOUT, timeout);
    if (!ready) {
      return std::unexpected(ready.error());
    }
    if (*ready == 0) {
      return fail(Error::Timeout);
    }
    int err = 0;
    socklen_t len = sizeof(err);
    if (::getsockopt(sock.fd(), SOL_SOCKET, SO_ERROR, &err, &len) < 0) {
      return fail_errno();
    }
    if (err != 0) {
      return fail_errno(err);
    }
  }

  if (!set_nonblocking(sock.fd(), false)) {
    return fail_errno();
  }
  int one = 1;
  ::setsockopt(sock.fd(), IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
  return sock;
}

}  // namespace

auto Socket::connect_tcp(const std::string& host, std::uint16_t port,
                         std::chrono::milliseconds timeout) -> Result<Socket> {
  auto addrs = resolve(host, port, false);
  if (!addrs) {
    return std::unexpected(addrs.error());
  }

  std::error_code last = make_error_code(Error::ConnectionFailed);
  for (auto* ai = addrs->get(); ai != nullptr; ai = ai->ai_next) {
    auto sock = connect_one(ai, timeout);
    if (sock) {
      return sock;
    }
    last = sock.error();
  }
  log::debug("connect to {}:{} failed: {}", host, port, last.message());
  return fail(last);
}

auto Socket::listen_tcp(const std::string& host, std::uint16_t port,
                        int backlog) -> Result<Socket> {
  auto addrs = resolve(host, port, true);
  if (!addrs) {
    return std::unexpected(addrs.error());
  }

  std::error_code last = make_error_code(Error::ConnectionFailed);
  for (auto* ai = addrs->get(); ai != nullptr; ai = ai->ai_next) {
    Socket sock{::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC,
                         ai->ai_protocol)};
    if (!sock) {
      last = std::error_code(errno, std::generic_category());
      continue;
    }
    int one = 1;
    ::setsockopt(sock.fd(), SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
    if (::bind(sock.fd(), ai->ai_addr, ai->ai_addrlen) < 0 ||
        ::listen(sock.fd(), backlog) < 0) {
      last = std::error_code(errno, std::generic_category());
      continue;
    }
    return sock;
  }
  log::error("listen on {}:{} failed: {}", host, port, last.message());
  return fail(last);
}

auto Socket::accept(std::chrono::milliseconds timeout) -> Result<Socket> {
  auto ready = wait_for(fd_, POLLIN, timeout);
  if (!ready) {
    return std::unexpected(ready.error());
  }
  if (*ready == 0) {
    return fail(Error::Timeout);
  }
  for (;;) {
    int client = ::accept4(fd_, nullptr, nullptr, SOCK_CLOEXEC);
    if (client >= 0) {
      int one = 1;
      ::setsockopt(client, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
      return Socket{client};
    }
    if (errno == EINTR) {
      continue;
    }
    if (errno == EAGAIN || errno == EWOULDBLOCK || errno == ECONNABORTED) {
      return fail(Error::Timeout);
    }
    return fail_errno();
  }
}

auto Socket::read_some(std::span<char> buf, std::chrono::milliseconds timeout)
    -> Result<std::size_t> {
  if (fd_ < 0) {
    return fail(Error::ConnectionClosed);
  }
  auto ready = wait_for(fd_, POLLIN, timeout);
  if (!ready) {
    return std::unexpected(ready.error());
  }
  if (*ready == 0) {
    return fail(Error::Timeout);
  }
  for (;;) {
    auto n = ::recv(fd_, buf.data(), buf.size(), 0);
    if (n >= 0) {
      return static_cast<std::size_t>(n);
    }
    if (errno == EINTR) {
      continue;
    }
    // A peer reset after shutdown() counts as end of stream.
    if (errno == ECONNRESET || errno == ENOTCONN) {
      return 0;
    }
    return fail_errno();
  }
}

auto Socket::write_all(std::string_view data) -> Result<void> {
  if (fd_ < 0) {
    return fail(Error::ConnectionClosed);
  }
  while (!data.empty()) {
    auto n = ::send(fd_, data.data(), data.size(), MSG_NOSIGNAL);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      if (errno == EPIPE || errno == ECONNRESET) {
        return fail(Error::ConnectionClosed);
      }
      return fail_errno();
    }
    data.remove_prefix(static_cast<std::size_t>(n));
  }
  return ok();
}

auto Socket::shutdown() noexcept -> void {
  if (fd_ >= 0) {
    ::shutdown(fd_, SHUT_RDWR);
  }
}

auto Socket::close() noexcept -> void {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

auto Socket::local_port() const -> Result<std::uint16_t> {
  sockaddr_storage addr{};
  socklen_t len = sizeof(addr);
  if (::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len) < 0) {
    return fail_errno();
  }
  if (addr.ss_family == AF_INET) {
    return ntohs(reinterpret_cast<sockaddr_in*>(&addr)->sin_port);
  }
  if (addr.ss_family == AF_INET6) {
    return ntohs(reinterpret_cast<sockaddr_in6*>(&addr)->sin6_port);
  }
  return fail(Error::InvalidArgument);
}

}  // namespace a2a::io
