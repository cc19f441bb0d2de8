#pragma once

#include <yaml-cpp/yaml.h>

#include <string>
#include <string_view>

namespace a2a {

// Overwrites `out` only when `key` is present and non-null, so a struct
// that starts from its defaults keeps them for absent keys. Throws
// YAML::BadConversion when the value has the wrong type.
template <typename T>
auto read_field(const YAML::Node& node, std::string_view key, T& out) -> void {
  if (auto field = node[std::string(key)]; field && !field.IsNull()) {
    out = field.template as<T>();
  }
}

// Emits `key: value` unless the value equals its default.
template <typename T>
auto emit_changed(YAML::Emitter& out, std::string_view key, const T& value,
                  const T& fallback) -> void {
  if (value == fallback) {
    return;
  }
  out << YAML::Key << std::string(key) << YAML::Value << value;
}

}  // namespace a2a
