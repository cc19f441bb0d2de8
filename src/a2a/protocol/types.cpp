#include "a2a/protocol/types.hpp"

#include <algorithm>
#include <format>
#include <ranges>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace a2a {

namespace {

template <typename T>
void set_optional(json& j, const char* key, const std::optional<T>& value) {
  if (value) {
    j[key] = *value;
  }
}

template <typename T>
void get_optional(const json& j, const char* key, std::optional<T>& out) {
  auto it = j.find(key);
  if (it != j.end() && !it->is_null()) {
    out = it->template get<T>();
  } else {
    out.reset();
  }
}

template <typename T>
auto get_or(const json& j, const char* key, T fallback) -> T {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return fallback;
  }
  return it->template get<T>();
}

void set_metadata(json& j, const Metadata& metadata) {
  if (!metadata.is_null()) {
    j["metadata"] = metadata;
  }
}

auto get_metadata(const json& j) -> Metadata {
  auto it = j.find("metadata");
  if (it == j.end() || it->is_null()) {
    return nullptr;
  }
  if (!it->is_object()) {
    throw std::invalid_argument("metadata must be an object");
  }
  return *it;
}

void require_object(const json& j, std::string_view what) {
  if (!j.is_object()) {
    throw std::invalid_argument(std::format("{} must be an object", what));
  }
}

}  // namespace

auto task_state_name(TaskState state) noexcept -> std::string_view {
  auto idx = std::to_underlying(state);
  return idx < detail::kTaskStateNames.size() ? detail::kTaskStateNames[idx]
                                              : "unknown";
}

auto parse_task_state(std::string_view name) noexcept -> TaskState {
  auto it = std::ranges::find(detail::kTaskStateNames, name);
  if (it != detail::kTaskStateNames.end()) {
    return static_cast<TaskState>(
        std::ranges::distance(detail::kTaskStateNames.begin(), it));
  }
  return TaskState::Unknown;
}

auto can_transition(TaskState from, TaskState to) noexcept -> bool {
  switch (from) {
    case TaskState::Submitted:
      return to == TaskState::Working || to == TaskState::Canceled;
    case TaskState::Working:
      return to == TaskState::Working || to == TaskState::InputRequired ||
             to == TaskState::Completed || to == TaskState::Failed ||
             to == TaskState::Canceled;
    case TaskState::InputRequired:
      return to == TaskState::Working || to == TaskState::Canceled;
    case TaskState::Completed:
    case TaskState::Failed:
    case TaskState::Canceled:
    case TaskState::Unknown:
      return false;
  }
  return false;
}

auto role_name(Role role) noexcept -> std::string_view {
  return detail::kRoleNames[std::to_underlying(role)];
}

auto parse_role(std::string_view name) -> std::optional<Role> {
  auto it = std::ranges::find(detail::kRoleNames, name);
  if (it == detail::kRoleNames.end()) {
    return std::nullopt;
  }
  return static_cast<Role>(
      std::ranges::distance(detail::kRoleNames.begin(), it));
}

auto is_final_event(const TaskEvent& event) noexcept -> bool {
  const auto* status = std::get_if<TaskStatusUpdateEvent>(&event);
  return status != nullptr && status->is_final;
}

auto event_task_id(const TaskEvent& event) noexcept -> const std::string& {
  return std::visit(
      [](const auto& e) -> const std::string& { return e.id; }, event);
}

auto text_part(std::string text) -> Part {
  return TextPart{.text = std::move(text), .metadata = nullptr};
}

auto make_message(Role role, std::string text) -> Message {
  Message m;
  m.role = role;
  m.parts.push_back(text_part(std::move(text)));
  return m;
}

auto message_text(const Message& message) -> std::string {
  std::string out;
  for (const auto& part : message.parts) {
    if (const auto* t = std::get_if<TextPart>(&part)) {
      if (!out.empty())
        out += '\n';
      out += t->text;
    }
  }
  return out;
}

void to_json(json& j, const TaskState& s) {
  j = std::string(task_state_name(s));
}

void from_json(const json& j, TaskState& s) {
  s = parse_task_state(j.get<std::string>());
}

void to_json(json& j, const Role& r) {
  j = std::string(role_name(r));
}

void from_json(const json& j, Role& r) {
  auto name = j.get<std::string>();
  auto role = parse_role(name);
  if (!role) {
    throw std::invalid_argument(std::format("unknown role: {}", name));
  }
  r = *role;
}

void to_json(json& j, const FileContent& f) {
  j = json::object();
  set_optional(j, "name", f.name);
  set_optional(j, "mimeType", f.mime_type);
  set_optional(j, "bytes", f.bytes);
  set_optional(j, "uri", f.uri);
}

void from_json(const json& j, FileContent& f) {
  require_object(j, "file");
  get_optional(j, "name", f.name);
  get_optional(j, "mimeType", f.mime_type);
  get_optional(j, "bytes", f.bytes);
  get_optional(j, "uri", f.uri);
  if (f.bytes.has_value() == f.uri.has_value()) {
    throw std::invalid_argument("file needs exactly one of bytes or uri");
  }
}

void to_json(json& j, const Part& p) {
  std::visit(
      [&j](const auto& part) {
        using T = std::decay_t<decltype(part)>;
        if constexpr (std::is_same_v<T, TextPart>) {
          j = {{"type", "text"}, {"text", part.text}};
        } else if constexpr (std::is_same_v<T, FilePart>) {
          j = {{"type", "file"}, {"file", part.file}};
        } else {
          j = {{"type", "data"}, {"data", part.data}};
        }
        set_metadata(j, part.metadata);
      },
      p);
}

void from_json(const json& j, Part& p) {
  require_object(j, "part");
  auto type = j.at("type").get<std::string>();
  if (type == "text") {
    p = TextPart{j.at("text").get<std::string>(), get_metadata(j)};
  } else if (type == "file") {
    p = FilePart{j.at("file").get<FileContent>(), get_metadata(j)};
  } else if (type == "data") {
    const auto& data = j.at("data");
    require_object(data, "data");
    p = DataPart{data, get_metadata(j)};
  } else {
    throw std::invalid_argument(std::format("unknown part type: {}", type));
  }
}

void to_json(json& j, const Message& m) {
  j = {{"role", m.role}, {"parts", m.parts}};
  set_metadata(j, m.metadata);
}

void from_json(const json& j, Message& m) {
  require_object(j, "message");
  m.role = j.at("role").get<Role>();
  m.parts = j.at("parts").get<std::vector<Part>>();
  m.metadata = get_metadata(j);
}

void to_json(json& j, const TaskStatus& s) {
  j = json::object();
  j["state"] = s.state;
  set_optional(j, "message", s.message);
  if (!s.timestamp.empty()) {
    j["timestamp"] = s.timestamp;
  }
}

void from_json(const json& j, TaskStatus& s) {
  require_object(j, "status");
  s.state = j.at("state").get<TaskState>();
  get_optional(j, "message", s.message);
  s.timestamp = get_or<std::string>(j, "timestamp", "");
}

void to_json(json& j, const Artifact& a) {
  j = {{"parts", a.parts}, {"index", a.index}};
  set_optional(j, "name", a.name);
  set_optional(j, "description", a.description);
  if (a.append) {
    j["append"] = true;
  }
  if (a.last_chunk) {
    j["lastChunk"] = true;
  }
  set_metadata(j, a.metadata);
}

void from_json(const json& j, Artifact& a) {
  require_object(j, "artifact");
  get_optional(j, "name", a.name);
  get_optional(j, "description", a.description);
  a.parts = j.at("parts").get<std::vector<Part>>();
  a.index = get_or(j, "index", 0);
  a.append = get_or(j, "append", false);
  a.last_chunk = get_or(j, "lastChunk", false);
  a.metadata = get_metadata(j);
}

void to_json(json& j, const Task& t) {
  j = {{"id", t.id}, {"status", t.status}};
  set_optional(j, "sessionId", t.session_id);
  if (!t.artifacts.empty()) {
    j["artifacts"] = t.artifacts;
  }
  if (!t.history.empty()) {
    j["history"] = t.history;
  }
  set_metadata(j, t.metadata);
}

void from_json(const json& j, Task& t) {
  require_object(j, "task");
  t.id = j.at("id").get<std::string>();
  get_optional(j, "sessionId", t.session_id);
  t.status = j.at("status").get<TaskStatus>();
  t.artifacts = get_or(j, "artifacts", std::vector<Artifact>{});
  t.history = get_or(j, "history", std::vector<Message>{});
  t.metadata = get_metadata(j);
}

void to_json(json& j, const TaskStatusUpdateEvent& e) {
  j = {{"id", e.id}, {"status", e.status}, {"final", e.is_final}};
  set_metadata(j, e.metadata);
}

void from_json(const json& j, TaskStatusUpdateEvent& e) {
  require_object(j, "status update");
  e.id = j.at("id").get<std::string>();
  e.status = j.at("status").get<TaskStatus>();
  e.is_final = get_or(j, "final", false);
  e.metadata = get_metadata(j);
}

void to_json(json& j, const TaskArtifactUpdateEvent& e) {
  j = {{"id", e.id}, {"artifact", e.artifact}};
  set_metadata(j, e.metadata);
}

void from_json(const json& j, TaskArtifactUpdateEvent& e) {
  require_object(j, "artifact update");
  e.id = j.at("id").get<std::string>();
  e.artifact = j.at("artifact").get<Artifact>();
  e.metadata = get_metadata(j);
}

void to_json(json& j, const AuthenticationInfo& a) {
  j = json::object();
  j["schemes"] = a.schemes;
  set_optional(j, "credentials", a.credentials);
}

void from_json(const json& j, AuthenticationInfo& a) {
  require_object(j, "authentication");
  a.schemes = j.at("schemes").get<std::vector<std::string>>();
  get_optional(j, "credentials", a.credentials);
}

void to_json(json& j, const PushNotificationConfig& p) {
  j = json::object();
  j["url"] = p.url;
  set_optional(j, "token", p.token);
  set_optional(j, "authentication", p.authentication);
}

void from_json(const json& j, PushNotificationConfig& p) {
  require_object(j, "pushNotification");
  p.url = j.at("url").get<std::string>();
  get_optional(j, "token", p.token);
  get_optional(j, "authentication", p.authentication);
}

void to_json(json& j, const TaskPushNotificationConfig& p) {
  j = {{"id", p.id}, {"pushNotificationConfig", p.push_notification_config}};
}

void from_json(const json& j, TaskPushNotificationConfig& p) {
  require_object(j, "params");
  p.id = j.at("id").get<std::string>();
  p.push_notification_config =
      j.at("pushNotificationConfig").get<PushNotificationConfig>();
}

void to_json(json& j, const SendTaskParams& p) {
  j = {{"id", p.id}, {"message", p.message}};
  set_optional(j, "sessionId", p.session_id);
  set_optional(j, "pushNotification", p.push_notification);
  set_optional(j, "historyLength", p.history_length);
  set_metadata(j, p.metadata);
}

void from_json(const json& j, SendTaskParams& p) {
  require_object(j, "params");
  p.id = j.at("id").get<std::string>();
  get_optional(j, "sessionId", p.session_id);
  p.message = j.at("message").get<Message>();
  get_optional(j, "pushNotification", p.push_notification);
  get_optional(j, "historyLength", p.history_length);
  p.metadata = get_metadata(j);
}

void to_json(json& j, const TaskQueryParams& p) {
  j = json::object();
  j["id"] = p.id;
  set_optional(j, "historyLength", p.history_length);
  set_metadata(j, p.metadata);
}

void from_json(const json& j, TaskQueryParams& p) {
  require_object(j, "params");
  p.id = j.at("id").get<std::string>();
  get_optional(j, "historyLength", p.history_length);
  p.metadata = get_metadata(j);
}

void to_json(json& j, const TaskIdParams& p) {
  j = json::object();
  j["id"] = p.id;
  set_metadata(j, p.metadata);
}

void from_json(const json& j, TaskIdParams& p) {
  require_object(j, "params");
  p.id = j.at("id").get<std::string>();
  p.metadata = get_metadata(j);
}

}  // namespace a2a
