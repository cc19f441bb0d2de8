#include "a2a/sse/task_event_codec.hpp"

#include "a2a/protocol/methods.hpp"
#include "a2a/sse/sse_writer.hpp"

namespace a2a::sse {

auto classify_event(std::string_view type) noexcept -> EventKind {
  if (type == events::kTaskStatusUpdate)
    return EventKind::StatusUpdate;
  if (type == events::kTaskArtifactUpdate)
    return EventKind::ArtifactUpdate;
  if (type == events::kClose)
    return EventKind::Close;
  return EventKind::Unknown;
}

auto event_type_name(const TaskEvent& event) noexcept -> std::string_view {
  return std::holds_alternative<TaskStatusUpdateEvent>(event)
             ? events::kTaskStatusUpdate
             : events::kTaskArtifactUpdate;
}

auto encode_task_event(const TaskEvent& event) -> std::string {
  json payload;
  std::visit([&payload](const auto& e) { payload = e; }, event);
  return format_event(event_type_name(event), payload.dump());
}

auto decode_task_event(EventKind kind, std::string_view data)
    -> Result<TaskEvent> {
  if (kind == EventKind::Close || kind == EventKind::Unknown) {
    return fail(Error::InvalidArgument);
  }
  auto j = json::parse(data, nullptr, false);
  if (j.is_discarded()) {
    return fail(Error::ParseError);
  }
  if (kind == EventKind::StatusUpdate) {
    auto ev = decode<TaskStatusUpdateEvent>(j);
    if (!ev) {
      return std::unexpected(ev.error());
    }
    return TaskEvent{std::move(*ev)};
  }
  auto ev = decode<TaskArtifactUpdateEvent>(j);
  if (!ev) {
    return std::unexpected(ev.error());
  }
  return TaskEvent{std::move(*ev)};
}

}  // namespace a2a::sse
