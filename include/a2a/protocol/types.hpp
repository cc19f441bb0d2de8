#pragma once

#include "a2a/core/error.hpp"

#include <nlohmann/json.hpp>

#include <array>
#include <cstdint>
#include <exception>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace a2a {

using json = nlohmann::json;

// Arbitrary JSON object; null when absent.
using Metadata = json;

enum class TaskState : std::uint8_t {
  Submitted,
  Working,
  InputRequired,
  Completed,
  Failed,
  Canceled,
  Unknown,
};

enum class Role : std::uint8_t {
  User,
  Agent,
};

namespace detail {

constexpr std::array<std::string_view, 7> kTaskStateNames = {
    "submitted", "working",  "input-required", "completed",
    "failed",    "canceled", "unknown",
};

constexpr std::array<std::string_view, 2> kRoleNames = {"user", "agent"};

}  // namespace detail

[[nodiscard]] auto task_state_name(TaskState state) noexcept -> std::string_view;

// Unrecognised names map to TaskState::Unknown.
[[nodiscard]] auto parse_task_state(std::string_view name) noexcept
    -> TaskState;

[[nodiscard]] constexpr auto is_final_state(TaskState state) noexcept -> bool {
  return state == TaskState::Completed || state == TaskState::Failed ||
         state == TaskState::Canceled;
}

// Allowed lifecycle edges. working -> working is accepted for progress
// updates; nothing leaves a final state.
[[nodiscard]] auto can_transition(TaskState from, TaskState to) noexcept
    -> bool;

[[nodiscard]] auto role_name(Role role) noexcept -> std::string_view;
[[nodiscard]] auto parse_role(std::string_view name) -> std::optional<Role>;

struct TextPart {
  std::string text;
  Metadata metadata;

  auto operator==(const TextPart&) const -> bool = default;
};

// Exactly one of bytes (base64) or uri is set.
struct FileContent {
  std::optional<std::string> name;
  std::optional<std::string> mime_type;
  std::optional<std::string> bytes;
  std::optional<std::string> uri;

  auto operator==(const FileContent&) const -> bool = default;
};

struct FilePart {
  FileContent file;
  Metadata metadata;

  auto operator==(const FilePart&) const -> bool = default;
};

struct DataPart {
  json data = json::object();
  Metadata metadata;

  auto operator==(const DataPart&) const -> bool = default;
};

using Part = std::variant<TextPart, FilePart, DataPart>;

struct Message {
  Role role{Role::User};
  std::vector<Part> parts;
  Metadata metadata;

  auto operator==(const Message&) const -> bool = default;
};

struct TaskStatus {
  TaskState state{TaskState::Submitted};
  std::optional<Message> message;
  std::string timestamp;

  auto operator==(const TaskStatus&) const -> bool = default;
};

struct Artifact {
  std::optional<std::string> name;
  std::optional<std::string> description;
  std::vector<Part> parts;
  int index{0};
  bool append{false};
  bool last_chunk{false};
  Metadata metadata;

  auto operator==(const Artifact&) const -> bool = default;
};

struct Task {
  std::string id;
  std::optional<std::string> session_id;
  TaskStatus status;
  std::vector<Artifact> artifacts;
  std::vector<Message> history;
  Metadata metadata;

  auto operator==(const Task&) const -> bool = default;
};

struct TaskStatusUpdateEvent {
  std::string id;
  TaskStatus status;
  bool is_final{false};
  Metadata metadata;

  auto operator==(const TaskStatusUpdateEvent&) const -> bool = default;
};

struct TaskArtifactUpdateEvent {
  std::string id;
  Artifact artifact;
  Metadata metadata;

  auto operator==(const TaskArtifactUpdateEvent&) const -> bool = default;
};

using TaskEvent = std::variant<TaskStatusUpdateEvent, TaskArtifactUpdateEvent>;

// True only for a status update flagged final.
[[nodiscard]] auto is_final_event(const TaskEvent& event) noexcept -> bool;
[[nodiscard]] auto event_task_id(const TaskEvent& event) noexcept
    -> const std::string&;

struct AuthenticationInfo {
  std::vector<std::string> schemes;
  std::optional<std::string> credentials;

  auto operator==(const AuthenticationInfo&) const -> bool = default;
};

struct PushNotificationConfig {
  std::string url;
  std::optional<std::string> token;
  std::optional<AuthenticationInfo> authentication;

  auto operator==(const PushNotificationConfig&) const -> bool = default;
};

struct TaskPushNotificationConfig {
  std::string id;
  PushNotificationConfig push_notification_config;

  auto operator==(const TaskPushNotificationConfig&) const -> bool = default;
};

struct SendTaskParams {
  std::string id;
  std::optional<std::string> session_id;
  Message message;
  std::optional<PushNotificationConfig> push_notification;
  std::optional<int> history_length;
  Metadata metadata;
};

struct TaskQueryParams {
  std::string id;
  std::optional<int> history_length;
  Metadata metadata;
};

struct TaskIdParams {
  std::string id;
  Metadata metadata;
};

[[nodiscard]] auto text_part(std::string text) -> Part;
[[nodiscard]] auto make_message(Role role, std::string text) -> Message;

// Concatenated text of all TextParts, newline separated.
[[nodiscard]] auto message_text(const Message& message) -> std::string;

// JSON mapping (camelCase wire names). from_json throws on malformed input;
// use decode() at boundaries.
void to_json(json& j, const TaskState& s);
void from_json(const json& j, TaskState& s);
void to_json(json& j, const Role& r);
void from_json(const json& j, Role& r);
void to_json(json& j, const Part& p);
void from_json(const json& j, Part& p);
void to_json(json& j, const FileContent& f);
void from_json(const json& j, FileContent& f);
void to_json(json& j, const Message& m);
void from_json(const json& j, Message& m);
void to_json(json& j, const TaskStatus& s);
void from_json(const json& j, TaskStatus& s);
void to_json(json& j, const Artifact& a);
void from_json(const json& j, Artifact& a);
void to_json(json& j, const Task& t);
void from_json(const json& j, Task& t);
void to_json(json& j, const TaskStatusUpdateEvent& e);
void from_json(const json& j, TaskStatusUpdateEvent& e);
void to_json(json& j, const TaskArtifactUpdateEvent& e);
void from_json(const json& j, TaskArtifactUpdateEvent& e);
void to_json(json& j, const AuthenticationInfo& a);
void from_json(const json& j, AuthenticationInfo& a);
void to_json(json& j, const PushNotificationConfig& p);
void from_json(const json& j, PushNotificationConfig& p);
void to_json(json& j, const TaskPushNotificationConfig& p);
void from_json(const json& j, TaskPushNotificationConfig& p);
void to_json(json& j, const SendTaskParams& p);
void from_json(const json& j, SendTaskParams& p);
void to_json(json& j, const TaskQueryParams& p);
void from_json(const json& j, TaskQueryParams& p);
void to_json(json& j, const TaskIdParams& p);
void from_json(const json& j, TaskIdParams& p);

template <typename T>
[[nodiscard]] auto decode(const json& j) -> Result<T> {
  try {
    return j.get<T>();
  } catch (const std::exception&) {
    return fail(Error::ParseError);
  }
}

}  // namespace a2a
