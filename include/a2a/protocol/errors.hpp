#pragma once

#include "a2a/protocol/jsonrpc.hpp"
#include "a2a/protocol/types.hpp"

#include <format>
#include <string_view>

namespace a2a::errors {

inline constexpr int kTaskNotFound = -32001;
inline constexpr int kTaskFinalState = -32002;
inline constexpr int kPushNotificationNotConfigured = -32003;

[[nodiscard]] inline auto task_not_found(std::string_view task_id)
    -> jsonrpc::Error {
  return {.code = kTaskNotFound,
          .message = "Task not found",
          .data = std::format("Task with ID '{}' was not found.", task_id)};
}

[[nodiscard]] inline auto task_final_state(std::string_view task_id,
                                           TaskState state) -> jsonrpc::Error {
  return {.code = kTaskFinalState,
          .message = "Task is in final state",
          .data = std::format("Task '{}' is already in final state: {}",
                              task_id, task_state_name(state))};
}

[[nodiscard]] inline auto push_notification_not_configured(
    std::string_view task_id) -> jsonrpc::Error {
  return {.code = kPushNotificationNotConfigured,
          .message = "Push Notification not configured",
          .data = std::format(
              "Task '{}' does not have push notifications configured.",
              task_id)};
}

}  // namespace a2a::errors
