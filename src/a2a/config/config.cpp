#include "a2a/config/config.hpp"

#include "a2a/config/yaml_utils.hpp"
#include "a2a/util/log.hpp"

#include <yaml-cpp/yaml.h>

#include <fstream>
#include <string_view>
#include <sstream>

namespace YAML {

template <>
struct convert<a2a::LogConfig> {
  static bool decode(const Node& node, a2a::LogConfig& l) {
    if (!node.IsMap()) {
      return false;
    }
    a2a::read_field(node, "level", l.level);
    return true;
  }
};

template <>
struct convert<a2a::ServerConfig> {
  static bool decode(const Node& node, a2a::ServerConfig& s) {
    if (!node.IsMap()) {
      return false;
    }
    a2a::read_field(node, "host", s.host);
    a2a::read_field(node, "port", s.port);
    a2a::read_field(node, "base_path", s.base_path);
    a2a::read_field(node, "read_timeout_ms", s.read_timeout_ms);
    a2a::read_field(node, "heartbeat_interval_ms", s.heartbeat_interval_ms);
    return true;
  }
};

template <>
struct convert<a2a::TaskManagerConfig> {
  static bool decode(const Node& node, a2a::TaskManagerConfig& t) {
    if (!node.IsMap()) {
      return false;
    }
    a2a::read_field(node, "subscriber_buffer", t.subscriber_buffer);
    a2a::read_field(node, "input_buffer", t.input_buffer);
    return true;
  }
};

template <>
struct convert<a2a::ClientConfig> {
  static bool decode(const Node& node, a2a::ClientConfig& c) {
    if (!node.IsMap()) {
      return false;
    }
    a2a::read_field(node, "timeout_ms", c.timeout_ms);
    a2a::read_field(node, "user_agent", c.user_agent);
    a2a::read_field(node, "stream_buffer", c.stream_buffer);
    return true;
  }
};

template <>
struct convert<a2a::SystemConfig> {
  static bool decode(const Node& node, a2a::SystemConfig& c) {
    if (!node.IsMap()) {
      return false;
    }
    a2a::read_field(node, "log", c.log);
    a2a::read_field(node, "server", c.server);
    a2a::read_field(node, "task_manager", c.task_manager);
    a2a::read_field(node, "client", c.client);
    return true;
  }
};

}  // namespace YAML

namespace a2a {

namespace {

auto validate(const SystemConfig& c) -> Result<void> {
  if (!log::parse_level(c.log.level)) {
    log::error("Unknown log level: {}", c.log.level);
    return fail(Error::InvalidArgument);
  }
  if (c.server.base_path.empty() || c.server.base_path.front() != '/') {
    log::error("server.base_path must start with '/': {}", c.server.base_path);
    return fail(Error::InvalidArgument);
  }
  if (c.server.read_timeout_ms <= 0 || c.server.heartbeat_interval_ms <= 0 ||
      c.client.timeout_ms <= 0) {
    log::error("Timeouts and intervals must be positive");
    return fail(Error::InvalidArgument);
  }
  if (c.task_manager.subscriber_buffer == 0 ||
      c.task_manager.input_buffer == 0 || c.client.stream_buffer == 0) {
    log::error("Buffer sizes must be positive");
    return fail(Error::InvalidArgument);
  }
  return ok();
}

// Each section is written only when at least one of its values differs
// from the default, so to_string() of a default config is an empty map.
template <typename Section, typename Fields>
void emit_section(YAML::Emitter& out, std::string_view name,
                  const Section& value, Fields fields) {
  if (value == Section{}) {
    return;
  }
  out << YAML::Key << std::string(name) << YAML::Value << YAML::BeginMap;
  fields(value, Section{});
  out << YAML::EndMap;
}

}  // namespace

auto ConfigLoader::load_from_file(std::string_view path)
    -> Result<SystemConfig> {
  std::string path_str{path};
  std::ifstream file(path_str);
  if (!file.is_open()) {
    log::error("Failed to open config file: {}", path);
    return fail(Error::FileNotFound);
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  return load_from_string(buffer.str());
}

auto ConfigLoader::load_from_string(std::string_view yaml_str)
    -> Result<SystemConfig> {
  SystemConfig config;
  try {
    YAML::Node root = YAML::Load(std::string(yaml_str));
    if (!root.IsDefined() || root.IsNull()) {
      log::error("Failed to parse YAML: empty or invalid content");
      return fail(Error::ParseError);
    }
    config = root.as<SystemConfig>();
  } catch (const YAML::Exception& e) {
    log::error("YAML parse error: {}", e.what());
    return fail(Error::ParseError);
  }

  if (auto r = validate(config); !r) {
    return std::unexpected(r.error());
  }
  return ok(std::move(config));
}

auto ConfigLoader::to_string(const SystemConfig& config) -> std::string {
  YAML::Emitter out;
  out << YAML::BeginMap;
  emit_section(out, "log", config.log,
               [&](const LogConfig& v, const LogConfig& d) {
                 emit_changed(out, "level", v.level, d.level);
               });
  emit_section(out, "server", config.server,
               [&](const ServerConfig& v, const ServerConfig& d) {
                 emit_changed(out, "host", v.host, d.host);
                 emit_changed(out, "port", v.port, d.port);
                 emit_changed(out, "base_path", v.base_path, d.base_path);
                 emit_changed(out, "read_timeout_ms", v.read_timeout_ms,
                              d.read_timeout_ms);
                 emit_changed(out, "heartbeat_interval_ms",
                              v.heartbeat_interval_ms, d.heartbeat_interval_ms);
               });
  emit_section(out, "task_manager", config.task_manager,
               [&](const TaskManagerConfig& v, const TaskManagerConfig& d) {
                 emit_changed(out, "subscriber_buffer", v.subscriber_buffer,
                              d.subscriber_buffer);
                 emit_changed(out, "input_buffer", v.input_buffer,
                              d.input_buffer);
               });
  emit_section(out, "client", config.client,
               [&](const ClientConfig& v, const ClientConfig& d) {
                 emit_changed(out, "timeout_ms", v.timeout_ms, d.timeout_ms);
                 emit_changed(out, "user_agent", v.user_agent, d.user_agent);
                 emit_changed(out, "stream_buffer", v.stream_buffer,
                              d.stream_buffer);
               });
  out << YAML::EndMap;
  return out.c_str();
}

auto apply_log_config(const LogConfig& config) -> bool {
  return log::set_level(config.level);
}

}  // namespace a2a
