#pragma once

#include <cstdint>
#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace a2a::log {

enum class Level : std::uint8_t {
  Trace,
  Debug,
  Info,
  Warn,
  Error,
  Off,
};

[[nodiscard]] auto level_name(Level level) noexcept -> std::string_view;

// Accepts the names above plus "warning".
[[nodiscard]] auto parse_level(std::string_view name) noexcept
    -> std::optional<Level>;

auto set_level(Level level) noexcept -> void;
// Unknown names leave the level unchanged and return false.
auto set_level(std::string_view name) noexcept -> bool;
[[nodiscard]] auto level() noexcept -> Level;
[[nodiscard]] auto enabled(Level level) noexcept -> bool;

// Flushes queued records and stops the writer thread. Later records are
// printed synchronously.
auto shutdown() -> void;

namespace detail {
auto submit(Level level, std::string text) -> void;
}  // namespace detail

template <typename... Args>
auto write(Level level, std::format_string<Args...> fmt, Args&&... args)
    -> void {
  if (!enabled(level)) {
    return;
  }
  detail::submit(level, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
auto trace(std::format_string<Args...> fmt, Args&&... args) -> void {
  write(Level::Trace, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto debug(std::format_string<Args...> fmt, Args&&... args) -> void {
  write(Level::Debug, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto info(std::format_string<Args...> fmt, Args&&... args) -> void {
  write(Level::Info, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto warn(std::format_string<Args...> fmt, Args&&... args) -> void {
  write(Level::Warn, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto error(std::format_string<Args...> fmt, Args&&... args) -> void {
  write(Level::Error, fmt, std::forward<Args>(args)...);
}

}  // namespace a2a::log
