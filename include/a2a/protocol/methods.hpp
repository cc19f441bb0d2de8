#pragma once

#include <string_view>

namespace a2a::methods {

inline constexpr std::string_view kSend = "tasks/send";
inline constexpr std::string_view kGet = "tasks/get";
inline constexpr std::string_view kCancel = "tasks/cancel";
inline constexpr std::string_view kSendSubscribe = "tasks/sendSubscribe";
inline constexpr std::string_view kResubscribe = "tasks/resubscribe";
inline constexpr std::string_view kPushNotificationSet =
    "tasks/pushNotification/set";
inline constexpr std::string_view kPushNotificationGet =
    "tasks/pushNotification/get";

}  // namespace a2a::methods

namespace a2a::events {

inline constexpr std::string_view kTaskStatusUpdate = "task_status_update";
inline constexpr std::string_view kTaskArtifactUpdate = "task_artifact_update";
inline constexpr std::string_view kClose = "close";

}  // namespace a2a::events
