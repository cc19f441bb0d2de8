#include "a2a/task/task_manager.hpp"

#include "a2a/core/channel.hpp"
#include "a2a/core/worker_group.hpp"
#include "a2a/protocol/errors.hpp"
#include "a2a/util/log.hpp"
#include "a2a/util/util.hpp"

#include <algorithm>
#include <mutex>
#include <shared_mutex>
#include <string_view>
#include <unordered_map>

namespace a2a {

namespace {

constexpr std::string_view kNoFinalState =
    "processor returned without reaching a final state";

auto trimmed(const Task& task, std::optional<int> history_length) -> Task {
  Task copy = task;
  if (history_length &&
      copy.history.size() > static_cast<std::size_t>(*history_length)) {
    copy.history.erase(copy.history.begin(),
                       copy.history.end() - *history_length);
  }
  return copy;
}

auto validate_send(const SendTaskParams& params) -> RpcResult<void> {
  if (params.id.empty()) {
    return std::unexpected(jsonrpc::invalid_params("task id must not be empty"));
  }
  if (params.message.parts.empty()) {
    return std::unexpected(
        jsonrpc::invalid_params("message must contain at least one part"));
  }
  if (params.history_length && *params.history_length < 0) {
    return std::unexpected(
        jsonrpc::invalid_params("historyLength must not be negative"));
  }
  return {};
}

struct TaskRecord {
  TaskRecord(const std::string& id, std::size_t input_buffer)
      : subscribers(id), input(make_channel<Message>(input_buffer)) {
    task.id = id;
  }

  Task task;
  Timestamp last_stamp{};
  SubscriberSet subscribers;
  std::optional<PushNotificationConfig> push;
  ChannelPtr<Message> input;
  CancellationSource cancel;
};

}  // namespace

struct MemoryTaskManager::Impl {
  class Handle;

  Impl(ITaskProcessor& p, TaskManagerConfig c) : processor(p), config(c) {
  }

  ITaskProcessor& processor;
  TaskManagerConfig config;

  mutable std::shared_mutex mu;
  std::unordered_map<std::string, std::unique_ptr<TaskRecord>, StringHash,
                     StringEqual>
      tasks;
  bool shutting_down{false};

  // Declared last: processor threads are joined before the records go away.
  WorkerGroup workers;

  auto find_locked(std::string_view id) const -> TaskRecord* {
    auto it = tasks.find(id);
    return it == tasks.end() ? nullptr : it->second.get();
  }

  // Unchecked status change: stamps, records and broadcasts.
  auto set_status_locked(TaskRecord& rec, TaskState state,
                         std::optional<Message> message) -> void {
    rec.last_stamp = std::max(now_ms(), rec.last_stamp);
    if (message) {
      rec.task.history.push_back(*message);
    }
    rec.task.status = TaskStatus{.state = state,
                                 .message = std::move(message),
                                 .timestamp = format_timestamp(rec.last_stamp)};

    const bool done = is_final_state(state);
    rec.subscribers.broadcast(TaskStatusUpdateEvent{.id = rec.task.id,
                                                    .status = rec.task.status,
                                                    .is_final = done,
                                                    .metadata = nullptr});
    if (done) {
      rec.input->close();
    }
  }

  auto update_status(const std::string& id, TaskState state,
                     std::optional<Message> message) -> RpcResult<void> {
    std::unique_lock lock(mu);
    auto* rec = find_locked(id);
    if (rec == nullptr) {
      return std::unexpected(errors::task_not_found(id));
    }
    auto current = rec->task.status.state;
    if (!can_transition(current, state)) {
      log::debug("task {}: rejected transition {} -> {}", id,
                 task_state_name(current), task_state_name(state));
      return std::unexpected(errors::task_final_state(id, current));
    }
    set_status_locked(*rec, state, std::move(message));
    return {};
  }

  auto add_artifact(const std::string& id, Artifact artifact)
      -> RpcResult<void> {
    std::unique_lock lock(mu);
    auto* rec = find_locked(id);
    if (rec == nullptr) {
      return std::unexpected(errors::task_not_found(id));
    }
    if (is_final_state(rec->task.status.state)) {
      return std::unexpected(
          errors::task_final_state(id, rec->task.status.state));
    }

    auto& artifacts = rec->task.artifacts;
    auto it = std::ranges::find(artifacts, artifact.index, &Artifact::index);
    if (it == artifacts.end()) {
      artifacts.push_back(artifact);
    } else if (artifact.append) {
      it->parts.insert(it->parts.end(), artifact.parts.begin(),
                       artifact.parts.end());
      it->last_chunk = artifact.last_chunk;
    } else {
      *it = artifact;
    }

    rec->subscribers.broadcast(TaskArtifactUpdateEvent{
        .id = id, .artifact = std::move(artifact), .metadata = nullptr});
    return {};
  }

  auto ensure_final(const std::string& id, std::string_view reason) -> void {
    std::unique_lock lock(mu);
    auto* rec = find_locked(id);
    if (rec == nullptr || is_final_state(rec->task.status.state)) {
      return;
    }
    log::warn("task {}: marking failed: {}", id, reason);
    set_status_locked(*rec, TaskState::Failed,
                      make_message(Role::Agent, std::string(reason)));
  }

  // Creates the record or queues the follow-up message on a live one.
  auto open_or_resume_locked(const SendTaskParams& params, bool& created)
      -> RpcResult<TaskRecord*> {
    if (shutting_down) {
      return std::unexpected(
          jsonrpc::internal_error("task manager is shutting down"));
    }

    if (auto* rec = find_locked(params.id)) {
      auto state = rec->task.status.state;
      if (is_final_state(state)) {
        return std::unexpected(errors::task_final_state(params.id, state));
      }
      if (rec->input->try_send(params.message) == ChannelStatus::Full) {
        // The processor is not reading input; keep the newest messages.
        log::warn("task {}: input queue full, dropping oldest message",
                  params.id);
        (void)rec->input->try_receive();
        (void)rec->input->try_send(params.message);
      }
      rec->task.history.push_back(params.message);
      if (params.push_notification) {
        rec->push = *params.push_notification;
      }
      created = false;
      log::debug("task {}: resumed with follow-up message", params.id);
      return rec;
    }

    auto rec = std::make_unique<TaskRecord>(params.id, config.input_buffer);
    rec->task.session_id = params.session_id;
    rec->task.metadata = params.metadata;
    rec->task.history.push_back(params.message);
    rec->push = params.push_notification;
    rec->last_stamp = now_ms();
    rec->task.status =
        TaskStatus{.state = TaskState::Submitted,
                   .message = std::nullopt,
                   .timestamp = format_timestamp(rec->last_stamp)};

    auto* raw = rec.get();
    tasks.emplace(params.id, std::move(rec));
    created = true;
    log::info("task {}: submitted", params.id);
    return raw;
  }

  auto start(const std::string& id, const Message& message,
             CancellationToken token, ChannelPtr<Message> input) -> void;
  auto run(const std::string& id, const Message& message,
           CancellationToken token, ChannelPtr<Message> input) -> void;
};

class MemoryTaskManager::Impl::Handle final : public TaskHandle {
public:
  Handle(Impl& impl, std::string id, CancellationToken token,
         ChannelPtr<Message> input)
      : impl_(impl),
        id_(std::move(id)),
        token_(std::move(token)),
        input_(std::move(input)) {
  }

  [[nodiscard]] auto task_id() const noexcept -> const std::string& override {
    return id_;
  }

  auto update_status(TaskState state, std::optional<Message> message)
      -> RpcResult<void> override {
    return impl_.update_status(id_, state, std::move(message));
  }

  auto add_artifact(Artifact artifact) -> RpcResult<void> override {
    return impl_.add_artifact(id_, std::move(artifact));
  }

  [[nodiscard]] auto next_message(std::chrono::milliseconds timeout)
      -> std::optional<Message> override {
    return input_->receive_for(timeout, token_);
  }

  [[nodiscard]] auto cancellation() const noexcept
      -> CancellationToken override {
    return token_;
  }

private:
  Impl& impl_;
  std::string id_;
  CancellationToken token_;
  ChannelPtr<Message> input_;
};

auto MemoryTaskManager::Impl::start(const std::string& id,
                                    const Message& message,
                                    CancellationToken token,
                                    ChannelPtr<Message> input) -> void {
  bool spawned = workers.spawn(
      [this, id, message, token = std::move(token),
       input = std::move(input)](std::stop_token) {
        run(id, message, token, input);
      });
  if (!spawned) {
    ensure_final(id, "task manager is shutting down");
  }
}

auto MemoryTaskManager::Impl::run(const std::string& id,
                                  const Message& message,
                                  CancellationToken token,
                                  ChannelPtr<Message> input) -> void {
  Handle handle(*this, id, std::move(token), std::move(input));
  std::string reason{kNoFinalState};
  try {
    auto result = processor.process(id, message, handle);
    if (!result) {
      reason = result.error().message();
      log::warn("task {}: processor failed: {}", id, reason);
    }
  } catch (const std::exception& e) {
    reason = e.what();
    log::error("task {}: processor threw: {}", id, reason);
  } catch (...) {
    reason = "processor threw a non-standard exception";
    log::error("task {}: {}", id, reason);
  }
  ensure_final(id, reason);
}

MemoryTaskManager::MemoryTaskManager(ITaskProcessor& processor,
                                     TaskManagerConfig config)
    : impl_(std::make_unique<Impl>(processor, config)) {
}

MemoryTaskManager::~MemoryTaskManager() {
  shutdown();
}

auto MemoryTaskManager::send_task(const SendTaskParams& params)
    -> RpcResult<Task> {
  if (auto valid = validate_send(params); !valid) {
    return std::unexpected(valid.error());
  }

  Task snapshot;
  bool created = false;
  CancellationToken token;
  ChannelPtr<Message> input;
  {
    std::unique_lock lock(impl_->mu);
    auto rec = impl_->open_or_resume_locked(params, created);
    if (!rec) {
      return std::unexpected(rec.error());
    }
    snapshot = trimmed((*rec)->task, params.history_length);
    token = (*rec)->cancel.token();
    input = (*rec)->input;
  }

  if (created) {
    impl_->start(params.id, params.message, std::move(token),
                 std::move(input));
  }
  return snapshot;
}

auto MemoryTaskManager::send_task_subscribe(const SendTaskParams& params,
                                            CancellationToken subscriber)
    -> RpcResult<EventChannel> {
  if (auto valid = validate_send(params); !valid) {
    return std::unexpected(valid.error());
  }

  auto channel = make_channel<TaskEvent>(impl_->config.subscriber_buffer);
  bool created = false;
  CancellationToken token;
  ChannelPtr<Message> input;
  {
    std::unique_lock lock(impl_->mu);
    auto rec = impl_->open_or_resume_locked(params, created);
    if (!rec) {
      return std::unexpected(rec.error());
    }
    (*rec)->subscribers.add(channel, std::move(subscriber));
    token = (*rec)->cancel.token();
    input = (*rec)->input;
  }

  if (created) {
    impl_->start(params.id, params.message, std::move(token),
                 std::move(input));
  }
  return channel;
}

auto MemoryTaskManager::get_task(const TaskQueryParams& params)
    -> RpcResult<Task> {
  if (params.history_length && *params.history_length < 0) {
    return std::unexpected(
        jsonrpc::invalid_params("historyLength must not be negative"));
  }
  std::shared_lock lock(impl_->mu);
  auto* rec = impl_->find_locked(params.id);
  if (rec == nullptr) {
    return std::unexpected(errors::task_not_found(params.id));
  }
  return trimmed(rec->task, params.history_length);
}

auto MemoryTaskManager::cancel_task(const TaskIdParams& params)
    -> RpcResult<Task> {
  std::unique_lock lock(impl_->mu);
  auto* rec = impl_->find_locked(params.id);
  if (rec == nullptr) {
    return std::unexpected(errors::task_not_found(params.id));
  }
  auto state = rec->task.status.state;
  if (is_final_state(state)) {
    return std::unexpected(errors::task_final_state(params.id, state));
  }

  impl_->set_status_locked(*rec, TaskState::Canceled, std::nullopt);
  rec->cancel.cancel();
  log::info("task {}: canceled", params.id);
  return rec->task;
}

auto MemoryTaskManager::resubscribe(const TaskIdParams& params,
                                    CancellationToken token)
    -> RpcResult<EventChannel> {
  std::unique_lock lock(impl_->mu);
  auto* rec = impl_->find_locked(params.id);
  if (rec == nullptr) {
    return std::unexpected(errors::task_not_found(params.id));
  }

  auto channel = make_channel<TaskEvent>(impl_->config.subscriber_buffer);
  if (is_final_state(rec->task.status.state)) {
    channel->close_with(TaskStatusUpdateEvent{.id = params.id,
                                              .status = rec->task.status,
                                              .is_final = true,
                                              .metadata = nullptr});
    return channel;
  }
  rec->subscribers.add(channel, std::move(token));
  log::debug("task {}: resubscribed ({} live)", params.id,
             rec->subscribers.size());
  return channel;
}

auto MemoryTaskManager::set_push_notification(
    const TaskPushNotificationConfig& config)
    -> RpcResult<TaskPushNotificationConfig> {
  std::unique_lock lock(impl_->mu);
  auto* rec = impl_->find_locked(config.id);
  if (rec == nullptr) {
    return std::unexpected(errors::task_not_found(config.id));
  }
  rec->push = config.push_notification_config;
  return config;
}

auto MemoryTaskManager::get_push_notification(const TaskIdParams& params)
    -> RpcResult<TaskPushNotificationConfig> {
  std::shared_lock lock(impl_->mu);
  auto* rec = impl_->find_locked(params.id);
  if (rec == nullptr) {
    return std::unexpected(errors::task_not_found(params.id));
  }
  if (!rec->push) {
    return std::unexpected(errors::push_notification_not_configured(params.id));
  }
  return TaskPushNotificationConfig{.id = params.id,
                                    .push_notification_config = *rec->push};
}

auto MemoryTaskManager::shutdown() -> void {
  {
    std::unique_lock lock(impl_->mu);
    if (!impl_->shutting_down) {
      impl_->shutting_down = true;
      for (auto& [id, rec] : impl_->tasks) {
        rec->cancel.cancel();
        rec->input->close();
        rec->subscribers.close_all();
      }
    }
  }
  impl_->workers.stop();
}

auto MemoryTaskManager::task_count() const -> std::size_t {
  std::shared_lock lock(impl_->mu);
  return impl_->tasks.size();
}

auto MemoryTaskManager::subscriber_count(const std::string& task_id) const
    -> std::size_t {
  std::shared_lock lock(impl_->mu);
  auto* rec = impl_->find_locked(task_id);
  return rec == nullptr ? 0 : rec->subscribers.size();
}

}  // namespace a2a
