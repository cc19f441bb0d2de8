#pragma once

#include "a2a/config/system_config.hpp"
#include "a2a/core/error.hpp"

#include <string>
#include <string_view>

namespace a2a {

class ConfigLoader {
public:
  [[nodiscard]] static auto load_from_file(std::string_view path)
      -> Result<SystemConfig>;
  [[nodiscard]] static auto load_from_string(std::string_view yaml_str)
      -> Result<SystemConfig>;

  // Emits only the values that differ from the defaults.
  [[nodiscard]] static auto to_string(const SystemConfig& config)
      -> std::string;
};

// Sets the global log level; false for an unknown level name.
auto apply_log_config(const LogConfig& config) -> bool;

}  // namespace a2a
