#pragma once

#include "a2a/core/cancellation.hpp"
#include "a2a/core/error.hpp"
#include "a2a/protocol/jsonrpc.hpp"
#include "a2a/protocol/types.hpp"

#include <chrono>
#include <functional>
#include <optional>
#include <string>

namespace a2a {

// The processor's view of its task. Every call goes through the manager, so
// the stored task and all subscribers see the same ordered updates.
class TaskHandle {
public:
  virtual ~TaskHandle() = default;

  [[nodiscard]] virtual auto task_id() const noexcept -> const std::string& = 0;

  // TaskFinalState if the change is not a legal transition.
  virtual auto update_status(TaskState state,
                             std::optional<Message> message = std::nullopt)
      -> jsonrpc::RpcResult<void> = 0;

  virtual auto add_artifact(Artifact artifact) -> jsonrpc::RpcResult<void> = 0;

  // Next follow-up message sent to this task. nullopt on timeout,
  // cancellation or once the task is final.
  [[nodiscard]] virtual auto next_message(std::chrono::milliseconds timeout)
      -> std::optional<Message> = 0;

  [[nodiscard]] virtual auto cancellation() const noexcept
      -> CancellationToken = 0;

  [[nodiscard]] auto is_cancelled() const noexcept -> bool {
    return cancellation().is_cancelled();
  }
};

class ITaskProcessor {
public:
  virtual ~ITaskProcessor() = default;

  // Runs once per new task on its own thread. If the task is not final when
  // this returns, it is marked failed.
  virtual auto process(const std::string& task_id, const Message& message,
                       TaskHandle& handle) -> Result<void> = 0;
};

class FunctionProcessor : public ITaskProcessor {
public:
  using Fn = std::function<Result<void>(const std::string&, const Message&,
                                        TaskHandle&)>;

  explicit FunctionProcessor(Fn fn) : fn_(std::move(fn)) {
  }

  auto process(const std::string& task_id, const Message& message,
               TaskHandle& handle) -> Result<void> override {
    return fn_(task_id, message, handle);
  }

private:
  Fn fn_;
};

}  // namespace a2a
