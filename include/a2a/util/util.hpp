#pragma once

#include <chrono>
#include <format>
#include <string>

namespace a2a {

using Timestamp = std::chrono::sys_time<std::chrono::milliseconds>;

[[nodiscard]] inline auto now_ms() -> Timestamp {
  return std::chrono::floor<std::chrono::milliseconds>(
      std::chrono::system_clock::now());
}

// 2025-04-01T12:00:00.123Z
[[nodiscard]] inline auto format_timestamp(Timestamp ts) -> std::string {
  return std::format("{:%Y-%m-%dT%H:%M:%S}Z", ts);
}

[[nodiscard]] inline auto format_timestamp() -> std::string {
  return format_timestamp(now_ms());
}

}  // namespace a2a
