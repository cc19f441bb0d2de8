#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace a2a {

struct LogConfig {
  std::string level{"info"};

  auto operator==(const LogConfig&) const -> bool = default;
};

struct ServerConfig {
  std::string host{"127.0.0.1"};
  std::uint16_t port{8080};
  std::string base_path{"/"};
  int read_timeout_ms{30000};
  int heartbeat_interval_ms{15000};

  auto operator==(const ServerConfig&) const -> bool = default;
};

struct TaskManagerConfig {
  std::size_t subscriber_buffer{16};
  std::size_t input_buffer{8};

  auto operator==(const TaskManagerConfig&) const -> bool = default;
};

struct ClientConfig {
  int timeout_ms{60000};
  std::string user_agent{"a2a-cpp-client/0.1"};
  std::size_t stream_buffer{10};

  auto operator==(const ClientConfig&) const -> bool = default;
};

struct SystemConfig {
  LogConfig log;
  ServerConfig server;
  TaskManagerConfig task_manager;
  ClientConfig client;

  auto operator==(const SystemConfig&) const -> bool = default;
};

}  // namespace a2a
