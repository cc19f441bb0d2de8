#pragma once

#include "a2a/core/error.hpp"
#include "a2a/protocol/types.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace a2a::sse {

enum class EventKind : std::uint8_t {
  StatusUpdate,
  ArtifactUpdate,
  Close,
  Unknown,
};

[[nodiscard]] auto classify_event(std::string_view type) noexcept -> EventKind;

[[nodiscard]] auto event_type_name(const TaskEvent& event) noexcept
    -> std::string_view;

// SSE frame carrying the event as JSON.
[[nodiscard]] auto encode_task_event(const TaskEvent& event) -> std::string;

// ParseError on malformed JSON or a payload that does not match `kind`;
// InvalidArgument for Close/Unknown.
[[nodiscard]] auto decode_task_event(EventKind kind, std::string_view data)
    -> Result<TaskEvent>;

}  // namespace a2a::sse
