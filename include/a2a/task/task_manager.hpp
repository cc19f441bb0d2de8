#pragma once

#include "a2a/config/system_config.hpp"
#include "a2a/core/cancellation.hpp"
#include "a2a/protocol/jsonrpc.hpp"
#include "a2a/protocol/types.hpp"
#include "a2a/task/processor.hpp"
#include "a2a/task/subscriber_set.hpp"

#include <cstddef>
#include <memory>

namespace a2a {

using jsonrpc::RpcResult;

class ITaskManager {
public:
  virtual ~ITaskManager() = default;

  virtual auto send_task(const SendTaskParams& params) -> RpcResult<Task> = 0;
  virtual auto get_task(const TaskQueryParams& params) -> RpcResult<Task> = 0;
  virtual auto cancel_task(const TaskIdParams& params) -> RpcResult<Task> = 0;

  // The channel is registered before the processor can emit anything. It is
  // closed after the final status event, or when `token` is cancelled and the
  // next event is broadcast.
  virtual auto send_task_subscribe(const SendTaskParams& params,
                                   CancellationToken token)
      -> RpcResult<EventChannel> = 0;

  // Final task: one synthetic final status event, then closed. Otherwise only
  // events emitted after this call; nothing is replayed.
  virtual auto resubscribe(const TaskIdParams& params, CancellationToken token)
      -> RpcResult<EventChannel> = 0;

  virtual auto set_push_notification(const TaskPushNotificationConfig& config)
      -> RpcResult<TaskPushNotificationConfig> = 0;
  virtual auto get_push_notification(const TaskIdParams& params)
      -> RpcResult<TaskPushNotificationConfig> = 0;
};

// In-memory task store and lifecycle engine. One processor thread per task.
class MemoryTaskManager : public ITaskManager {
public:
  explicit MemoryTaskManager(ITaskProcessor& processor,
                             TaskManagerConfig config = {});
  ~MemoryTaskManager() override;

  MemoryTaskManager(const MemoryTaskManager&) = delete;
  auto operator=(const MemoryTaskManager&) -> MemoryTaskManager& = delete;

  auto send_task(const SendTaskParams& params) -> RpcResult<Task> override;
  auto get_task(const TaskQueryParams& params) -> RpcResult<Task> override;
  auto cancel_task(const TaskIdParams& params) -> RpcResult<Task> override;
  auto send_task_subscribe(const SendTaskParams& params,
                           CancellationToken token)
      -> RpcResult<EventChannel> override;
  auto resubscribe(const TaskIdParams& params, CancellationToken token)
      -> RpcResult<EventChannel> override;
  auto set_push_notification(const TaskPushNotificationConfig& config)
      -> RpcResult<TaskPushNotificationConfig> override;
  auto get_push_notification(const TaskIdParams& params)
      -> RpcResult<TaskPushNotificationConfig> override;

  // Cancels running processors, closes all subscriber channels and joins
  // processor threads. Later sends fail with an internal error.
  auto shutdown() -> void;

  [[nodiscard]] auto task_count() const -> std::size_t;
  [[nodiscard]] auto subscriber_count(const std::string& task_id) const
      -> std::size_t;

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace a2a
