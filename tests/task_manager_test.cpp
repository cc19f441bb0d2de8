#include "a2a/protocol/errors.hpp"
#include "a2a/task/subscriber_set.hpp"
#include "a2a/task/task_manager.hpp"

#include <atomic>
#include <stdexcept>

#include "gtest/gtest.h"
#include "test_utils.hpp"

using namespace a2a;
using namespace std::chrono_literals;
using a2a::test::send_params;
using a2a::test::status_of;
using a2a::test::task_ref;

namespace {

auto status_event(std::string id, TaskState state, bool last = false)
    -> TaskEvent {
  return TaskStatusUpdateEvent{
      .id = std::move(id),
      .status = TaskStatus{.state = state, .message = std::nullopt,
                           .timestamp = ""},
      .is_final = last,
      .metadata = nullptr};
}

auto artifact(int index, std::string text) -> Artifact {
  return Artifact{.name = std::nullopt,
                  .description = std::nullopt,
                  .parts = {text_part(std::move(text))},
                  .index = index,
                  .append = false,
                  .last_chunk = false,
                  .metadata = nullptr};
}

// Collects events until the channel is closed and drained.
auto drain(const EventChannel& ch) -> std::vector<TaskEvent> {
  std::vector<TaskEvent> out;
  while (auto ev = ch->receive_for(5s)) {
    out.push_back(std::move(*ev));
  }
  return out;
}

auto states_of(const std::vector<TaskEvent>& events) -> std::vector<TaskState> {
  std::vector<TaskState> out;
  for (const auto& ev : events) {
    if (auto s = status_of(ev)) {
      out.push_back(*s);
    }
  }
  return out;
}

}  // namespace

TEST(SubscriberSetTest, BroadcastWithNoSubscribers) {
  SubscriberSet set("t");
  EXPECT_EQ(set.broadcast(status_event("t", TaskState::Working)), 0u);
  EXPECT_TRUE(set.empty());
}

TEST(SubscriberSetTest, DeliversInOrderToEverySubscriber) {
  SubscriberSet set("t");
  std::vector<EventChannel> channels;
  for (int i = 0; i < 3; ++i) {
    channels.push_back(make_channel<TaskEvent>(8));
    set.add(channels.back(), {});
  }

  EXPECT_EQ(set.broadcast(status_event("t", TaskState::Working)), 3u);
  EXPECT_EQ(set.broadcast(TaskArtifactUpdateEvent{
                .id = "t", .artifact = artifact(0, "a"), .metadata = nullptr}),
            3u);
  EXPECT_EQ(set.broadcast(status_event("t", TaskState::Completed, true)), 3u);
  EXPECT_TRUE(set.empty());

  for (const auto& ch : channels) {
    auto events = drain(ch);
    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(status_of(events[0]), TaskState::Working);
    EXPECT_TRUE(std::holds_alternative<TaskArtifactUpdateEvent>(events[1]));
    EXPECT_TRUE(is_final_event(events[2]));
    EXPECT_TRUE(ch->is_drained());
  }
}

TEST(SubscriberSetTest, CancelledSubscriberIsDroppedWithoutBlockingOthers) {
  SubscriberSet set("t");
  CancellationSource gone;
  auto dead = make_channel<TaskEvent>(1);
  auto live = make_channel<TaskEvent>(8);
  set.add(dead, gone.token());
  set.add(live, {});

  gone.cancel();
  EXPECT_EQ(set.broadcast(status_event("t", TaskState::Working)), 1u);
  EXPECT_EQ(set.size(), 1u);
  EXPECT_TRUE(dead->is_drained());
  EXPECT_EQ(live->size(), 1u);
}

TEST(SubscriberSetTest, AddPrunesCancelledSubscribers) {
  SubscriberSet set("t");
  std::vector<EventChannel> dead;
  for (int i = 0; i < 5; ++i) {
    CancellationSource source;
    dead.push_back(make_channel<TaskEvent>(1));
    set.add(dead.back(), source.token());
    source.cancel();
  }
  auto live = make_channel<TaskEvent>(4);
  set.add(live, {});

  EXPECT_EQ(set.size(), 1u);
  for (const auto& ch : dead) {
    EXPECT_TRUE(ch->is_closed());
  }
  EXPECT_FALSE(live->is_closed());
}

TEST(SubscriberSetTest, FullSubscriberLosesEventButGetsFinal) {
  SubscriberSet set("t");
  auto slow = make_channel<TaskEvent>(1);
  set.add(slow, {});

  EXPECT_EQ(set.broadcast(status_event("t", TaskState::Working)), 1u);
  EXPECT_EQ(set.broadcast(status_event("t", TaskState::Working)), 0u);
  EXPECT_EQ(set.size(), 1u);
  EXPECT_EQ(set.broadcast(status_event("t", TaskState::Completed, true)), 1u);

  auto events = drain(slow);
  ASSERT_EQ(events.size(), 2u);
  EXPECT_TRUE(is_final_event(events[1]));
}

TEST(SubscriberSetTest, ConsumerClosedChannelIsDropped) {
  SubscriberSet set("t");
  auto ch = make_channel<TaskEvent>(4);
  set.add(ch, {});
  ch->close();
  EXPECT_EQ(set.broadcast(status_event("t", TaskState::Working)), 0u);
  EXPECT_TRUE(set.empty());
}

class TaskManagerTest : public ::testing::Test {
protected:
  using Body = FunctionProcessor::Fn;

  void SetUp() override {
    processor_ = std::make_unique<FunctionProcessor>(
        [this](const std::string& id, const Message& msg,
               TaskHandle& handle) -> Result<void> {
          ++invocations_;
          if (!body_) {
            return ok();
          }
          return body_(id, msg, handle);
        });
    manager_ = std::make_unique<MemoryTaskManager>(*processor_,
                                                   TaskManagerConfig{});
  }

  void TearDown() override {
    manager_->shutdown();
  }

  auto state_of(const std::string& id) -> TaskState {
    auto task = manager_->get_task(TaskQueryParams{
        .id = id, .history_length = std::nullopt, .metadata = nullptr});
    return task ? task->status.state : TaskState::Unknown;
  }

  auto wait_for_state(const std::string& id, TaskState state) -> bool {
    return test::wait_until([&] { return state_of(id) == state; });
  }

  static auto complete_with_artifact(TaskHandle& handle) -> Result<void> {
    if (!handle.update_status(TaskState::Working)) {
      return fail(Error::Unknown);
    }
    if (!handle.add_artifact(artifact(0, "result"))) {
      return fail(Error::Unknown);
    }
    if (!handle.update_status(TaskState::Completed,
                              make_message(Role::Agent, "done"))) {
      return fail(Error::Unknown);
    }
    return ok();
  }

  Body body_;
  std::atomic<int> invocations_{0};
  std::unique_ptr<FunctionProcessor> processor_;
  std::unique_ptr<MemoryTaskManager> manager_;
};

TEST_F(TaskManagerTest, SendRunsProcessorToCompletion) {
  test::Gate go;
  body_ = [&go](const std::string&, const Message&, TaskHandle& handle) {
    if (!go.wait()) {
      return Result<void>{fail(Error::Timeout)};
    }
    return complete_with_artifact(handle);
  };

  auto sent = manager_->send_task(send_params("t1", "hi"));
  ASSERT_TRUE(sent.has_value());
  EXPECT_EQ(sent->id, "t1");
  EXPECT_EQ(sent->status.state, TaskState::Submitted);
  ASSERT_EQ(sent->history.size(), 1u);
  EXPECT_EQ(message_text(sent->history[0]), "hi");

  go.open();
  ASSERT_TRUE(wait_for_state("t1", TaskState::Completed));

  auto task = manager_->get_task(TaskQueryParams{
      .id = "t1", .history_length = std::nullopt, .metadata = nullptr});
  ASSERT_TRUE(task.has_value());
  ASSERT_EQ(task->artifacts.size(), 1u);
  EXPECT_EQ(task->artifacts[0].index, 0);
  ASSERT_TRUE(task->status.message.has_value());
  EXPECT_EQ(message_text(*task->status.message), "done");
  EXPECT_FALSE(task->status.timestamp.empty());
  EXPECT_EQ(invocations_.load(), 1);
}

TEST_F(TaskManagerTest, IllegalTransitionLeavesRecordUnchanged) {
  std::optional<jsonrpc::Error> rejected;
  test::Gate finished;
  body_ = [&](const std::string&, const Message&, TaskHandle& handle) {
    auto r = complete_with_artifact(handle);
    auto again = handle.update_status(TaskState::Working);
    if (!again) {
      rejected = again.error();
    }
    auto late = handle.add_artifact(artifact(1, "late"));
    if (late) {
      rejected.reset();
    }
    finished.open();
    return r;
  };

  ASSERT_TRUE(manager_->send_task(send_params("t1")).has_value());
  ASSERT_TRUE(finished.wait());
  ASSERT_TRUE(rejected.has_value());
  EXPECT_EQ(rejected->code, errors::kTaskFinalState);

  auto task = manager_->get_task(TaskQueryParams{
      .id = "t1", .history_length = std::nullopt, .metadata = nullptr});
  ASSERT_TRUE(task.has_value());
  EXPECT_EQ(task->status.state, TaskState::Completed);
  EXPECT_EQ(task->artifacts.size(), 1u);
}

TEST_F(TaskManagerTest, SubmittedCannotJumpToCompleted) {
  std::optional<jsonrpc::Error> rejected;
  body_ = [&](const std::string&, const Message&, TaskHandle& handle) {
    auto r = handle.update_status(TaskState::Completed);
    if (!r) {
      rejected = r.error();
    }
    return Result<void>{fail(Error::InvalidArgument)};
  };

  ASSERT_TRUE(manager_->send_task(send_params("t1")).has_value());
  ASSERT_TRUE(wait_for_state("t1", TaskState::Failed));
  ASSERT_TRUE(rejected.has_value());
  EXPECT_EQ(rejected->code, errors::kTaskFinalState);
}

TEST_F(TaskManagerTest, CancelSemantics) {
  auto unknown = manager_->cancel_task(task_ref("nope"));
  ASSERT_FALSE(unknown.has_value());
  EXPECT_EQ(unknown.error().code, errors::kTaskNotFound);

  body_ = [](const std::string&, const Message&, TaskHandle& handle) {
    return complete_with_artifact(handle);
  };
  ASSERT_TRUE(manager_->send_task(send_params("done")).has_value());
  ASSERT_TRUE(wait_for_state("done", TaskState::Completed));
  auto completed = manager_->cancel_task(task_ref("done"));
  ASSERT_FALSE(completed.has_value());
  EXPECT_EQ(completed.error().code, errors::kTaskFinalState);
}

TEST_F(TaskManagerTest, CancelSubmittedTaskSignalsProcessor) {
  test::Gate go;
  std::atomic<bool> saw_cancel{false};
  std::optional<jsonrpc::Error> post_cancel;
  test::Gate finished;
  body_ = [&](const std::string&, const Message&, TaskHandle& handle) {
    (void)go.wait();
    saw_cancel = handle.is_cancelled();
    auto r = handle.update_status(TaskState::Working);
    if (!r) {
      post_cancel = r.error();
    }
    finished.open();
    return ok();
  };

  ASSERT_TRUE(manager_->send_task(send_params("t1")).has_value());
  auto canceled = manager_->cancel_task(task_ref("t1"));
  ASSERT_TRUE(canceled.has_value());
  EXPECT_EQ(canceled->status.state, TaskState::Canceled);

  go.open();
  ASSERT_TRUE(finished.wait());
  EXPECT_TRUE(saw_cancel.load());
  ASSERT_TRUE(post_cancel.has_value());
  EXPECT_EQ(post_cancel->code, errors::kTaskFinalState);
  EXPECT_EQ(state_of("t1"), TaskState::Canceled);
}

TEST_F(TaskManagerTest, SubscribeSeesWholeLifecycle) {
  test::Gate go;
  body_ = [&go](const std::string&, const Message&, TaskHandle& handle) {
    (void)go.wait();
    return complete_with_artifact(handle);
  };

  auto ch = manager_->send_task_subscribe(send_params("t1"), {});
  ASSERT_TRUE(ch.has_value());
  EXPECT_EQ(manager_->subscriber_count("t1"), 1u);
  go.open();

  auto events = drain(*ch);
  ASSERT_EQ(events.size(), 4u);
  EXPECT_EQ(states_of(events),
            (std::vector{TaskState::Working, TaskState::Completed}));
  EXPECT_TRUE(std::holds_alternative<TaskArtifactUpdateEvent>(events[1]));
  EXPECT_TRUE(is_final_event(events.back()));
  EXPECT_TRUE((*ch)->is_drained());
  EXPECT_EQ(manager_->subscriber_count("t1"), 0u);
}

TEST_F(TaskManagerTest, SubscribersAreIndependent) {
  test::Gate go;
  body_ = [&go](const std::string&, const Message&, TaskHandle& handle) {
    (void)go.wait();
    return complete_with_artifact(handle);
  };

  CancellationSource quitter;
  auto first = manager_->send_task_subscribe(send_params("t1"),
                                             quitter.token());
  ASSERT_TRUE(first.has_value());
  auto second = manager_->resubscribe(task_ref("t1"), {});
  ASSERT_TRUE(second.has_value());
  EXPECT_EQ(manager_->subscriber_count("t1"), 2u);

  quitter.cancel();
  go.open();

  auto events = drain(*second);
  EXPECT_EQ(events.size(), 4u);
  EXPECT_TRUE(drain(*first).empty());
}

TEST_F(TaskManagerTest, ResubscribeToFinalTask) {
  body_ = [](const std::string&, const Message&, TaskHandle& handle) {
    return complete_with_artifact(handle);
  };
  ASSERT_TRUE(manager_->send_task(send_params("t1")).has_value());
  ASSERT_TRUE(wait_for_state("t1", TaskState::Completed));

  auto ch = manager_->resubscribe(task_ref("t1"), {});
  ASSERT_TRUE(ch.has_value());
  auto events = drain(*ch);
  ASSERT_EQ(events.size(), 1u);
  EXPECT_TRUE(is_final_event(events[0]));
  EXPECT_EQ(status_of(events[0]), TaskState::Completed);
  EXPECT_TRUE((*ch)->is_drained());

  auto missing = manager_->resubscribe(task_ref("nope"), {});
  ASSERT_FALSE(missing.has_value());
  EXPECT_EQ(missing.error().code, errors::kTaskNotFound);
}

TEST_F(TaskManagerTest, ResubscribeToRunningTaskDoesNotReplay) {
  test::Gate go;
  body_ = [&go](const std::string&, const Message&, TaskHandle& handle) {
    if (!handle.update_status(TaskState::Working,
                              make_message(Role::Agent, "started"))) {
      return Result<void>{fail(Error::Unknown)};
    }
    (void)go.wait();
    if (!handle.add_artifact(artifact(0, "late"))) {
      return Result<void>{fail(Error::Unknown)};
    }
    auto r = handle.update_status(TaskState::Completed);
    return r ? ok() : Result<void>{fail(Error::Unknown)};
  };

  ASSERT_TRUE(manager_->send_task(send_params("t1")).has_value());
  ASSERT_TRUE(wait_for_state("t1", TaskState::Working));

  auto ch = manager_->resubscribe(task_ref("t1"), {});
  ASSERT_TRUE(ch.has_value());
  go.open();

  auto events = drain(*ch);
  ASSERT_EQ(events.size(), 2u);
  EXPECT_TRUE(std::holds_alternative<TaskArtifactUpdateEvent>(events[0]));
  EXPECT_EQ(status_of(events[1]), TaskState::Completed);
}

TEST_F(TaskManagerTest, ProcessorErrorFailsTask) {
  body_ = [](const std::string&, const Message&, TaskHandle& handle) {
    (void)handle.update_status(TaskState::Working);
    return Result<void>{fail(Error::ConnectionFailed)};
  };
  ASSERT_TRUE(manager_->send_task(send_params("t1")).has_value());
  ASSERT_TRUE(wait_for_state("t1", TaskState::Failed));

  auto task = manager_->get_task(TaskQueryParams{
      .id = "t1", .history_length = std::nullopt, .metadata = nullptr});
  ASSERT_TRUE(task->status.message.has_value());
  EXPECT_EQ(task->status.message->role, Role::Agent);
  EXPECT_EQ(message_text(*task->status.message),
            make_error_code(Error::ConnectionFailed).message());
}

TEST_F(TaskManagerTest, ProcessorExceptionFailsTask) {
  body_ = [](const std::string&, const Message&,
             TaskHandle&) -> Result<void> {
    throw std::runtime_error("boom");
  };
  ASSERT_TRUE(manager_->send_task(send_params("t1")).has_value());
  ASSERT_TRUE(wait_for_state("t1", TaskState::Failed));

  auto task = manager_->get_task(TaskQueryParams{
      .id = "t1", .history_length = std::nullopt, .metadata = nullptr});
  EXPECT_EQ(message_text(*task->status.message), "boom");
}

TEST_F(TaskManagerTest, ProcessorReturningEarlyFailsTask) {
  ASSERT_TRUE(manager_->send_task(send_params("t1")).has_value());
  ASSERT_TRUE(wait_for_state("t1", TaskState::Failed));

  auto task = manager_->get_task(TaskQueryParams{
      .id = "t1", .history_length = std::nullopt, .metadata = nullptr});
  EXPECT_EQ(message_text(*task->status.message),
            "processor returned without reaching a final state");
}

TEST_F(TaskManagerTest, FollowUpMessageResumesWithoutNewProcessor) {
  std::optional<std::string> follow_up;
  body_ = [&](const std::string&, const Message&, TaskHandle& handle) {
    (void)handle.update_status(TaskState::Working);
    (void)handle.update_status(TaskState::InputRequired,
                               make_message(Role::Agent, "more please"));
    auto next = handle.next_message(5s);
    if (!next) {
      return Result<void>{fail(Error::Timeout)};
    }
    follow_up = message_text(*next);
    (void)handle.update_status(TaskState::Working);
    auto r = handle.update_status(TaskState::Completed);
    return r ? ok() : Result<void>{fail(Error::Unknown)};
  };

  ASSERT_TRUE(manager_->send_task(send_params("t1", "first")).has_value());
  ASSERT_TRUE(wait_for_state("t1", TaskState::InputRequired));

  auto resumed = manager_->send_task(send_params("t1", "second"));
  ASSERT_TRUE(resumed.has_value());
  ASSERT_TRUE(wait_for_state("t1", TaskState::Completed));

  EXPECT_EQ(follow_up, "second");
  EXPECT_EQ(invocations_.load(), 1);

  auto task = manager_->get_task(TaskQueryParams{
      .id = "t1", .history_length = std::nullopt, .metadata = nullptr});
  ASSERT_EQ(task->history.size(), 3u);
  EXPECT_EQ(message_text(task->history[0]), "first");
  EXPECT_EQ(message_text(task->history[1]), "more please");
  EXPECT_EQ(message_text(task->history[2]), "second");

  auto after_final = manager_->send_task(send_params("t1", "third"));
  ASSERT_FALSE(after_final.has_value());
  EXPECT_EQ(after_final.error().code, errors::kTaskFinalState);
}

TEST_F(TaskManagerTest, ResumeNeverFailsWhenInputIsNotRead) {
  body_ = [](const std::string&, const Message&, TaskHandle& handle) {
    (void)handle.update_status(TaskState::Working);
    while (!handle.is_cancelled()) {
      test::sleep_ms(5ms);
    }
    return ok();
  };

  ASSERT_TRUE(manager_->send_task(send_params("t1", "first")).has_value());
  ASSERT_TRUE(wait_for_state("t1", TaskState::Working));

  const std::size_t resends = TaskManagerConfig{}.input_buffer + 2;
  for (std::size_t i = 0; i < resends; ++i) {
    auto resumed = manager_->send_task(send_params("t1", "again"));
    ASSERT_TRUE(resumed.has_value()) << "resend " << i;
    EXPECT_EQ(resumed->history.size(), i + 2);
  }

  auto task = manager_->get_task(TaskQueryParams{
      .id = "t1", .history_length = std::nullopt, .metadata = nullptr});
  ASSERT_TRUE(task.has_value());
  EXPECT_EQ(task->status.state, TaskState::Working);
  EXPECT_EQ(task->history.size(), resends + 1);
  EXPECT_EQ(invocations_.load(), 1);
}

TEST_F(TaskManagerTest, HistoryLengthTrimsOldestMessages) {
  body_ = [](const std::string&, const Message&, TaskHandle& handle) {
    (void)handle.update_status(TaskState::Working,
                               make_message(Role::Agent, "a"));
    auto r = handle.update_status(TaskState::Completed,
                                  make_message(Role::Agent, "b"));
    return r ? ok() : Result<void>{fail(Error::Unknown)};
  };
  ASSERT_TRUE(manager_->send_task(send_params("t1", "q")).has_value());
  ASSERT_TRUE(wait_for_state("t1", TaskState::Completed));

  auto last_one = manager_->get_task(
      TaskQueryParams{.id = "t1", .history_length = 1, .metadata = nullptr});
  ASSERT_TRUE(last_one.has_value());
  ASSERT_EQ(last_one->history.size(), 1u);
  EXPECT_EQ(message_text(last_one->history[0]), "b");

  auto none = manager_->get_task(
      TaskQueryParams{.id = "t1", .history_length = 0, .metadata = nullptr});
  EXPECT_TRUE(none->history.empty());

  auto all = manager_->get_task(
      TaskQueryParams{.id = "t1", .history_length = 10, .metadata = nullptr});
  EXPECT_EQ(all->history.size(), 3u);

  auto negative = manager_->get_task(
      TaskQueryParams{.id = "t1", .history_length = -1, .metadata = nullptr});
  ASSERT_FALSE(negative.has_value());
  EXPECT_EQ(negative.error().code, jsonrpc::kInvalidParams);
}

TEST_F(TaskManagerTest, PushNotificationConfig) {
  auto unknown = manager_->set_push_notification(TaskPushNotificationConfig{
      .id = "nope", .push_notification_config = {.url = "http://hook"}});
  ASSERT_FALSE(unknown.has_value());
  EXPECT_EQ(unknown.error().code, errors::kTaskNotFound);

  test::Gate go;
  body_ = [&go](const std::string&, const Message&, TaskHandle& handle) {
    (void)go.wait();
    return complete_with_artifact(handle);
  };
  ASSERT_TRUE(manager_->send_task(send_params("t1")).has_value());

  auto missing = manager_->get_push_notification(task_ref("t1"));
  ASSERT_FALSE(missing.has_value());
  EXPECT_EQ(missing.error().code, errors::kPushNotificationNotConfigured);

  TaskPushNotificationConfig config{
      .id = "t1",
      .push_notification_config = {.url = "http://hook",
                                   .token = "secret",
                                   .authentication = AuthenticationInfo{
                                       .schemes = {"bearer"},
                                       .credentials = std::nullopt}}};
  auto set = manager_->set_push_notification(config);
  ASSERT_TRUE(set.has_value());
  EXPECT_EQ(*set, config);

  auto got = manager_->get_push_notification(task_ref("t1"));
  ASSERT_TRUE(got.has_value());
  EXPECT_EQ(*got, config);
  go.open();
}

TEST_F(TaskManagerTest, SendStoresPushNotification) {
  auto params = send_params("t1");
  params.push_notification = PushNotificationConfig{.url = "http://cb"};
  ASSERT_TRUE(manager_->send_task(params).has_value());

  auto got = manager_->get_push_notification(task_ref("t1"));
  ASSERT_TRUE(got.has_value());
  EXPECT_EQ(got->push_notification_config.url, "http://cb");
}

TEST_F(TaskManagerTest, RejectsInvalidSendParams) {
  auto empty_id = manager_->send_task(send_params(""));
  ASSERT_FALSE(empty_id.has_value());
  EXPECT_EQ(empty_id.error().code, jsonrpc::kInvalidParams);

  auto no_parts = send_params("t1");
  no_parts.message.parts.clear();
  auto r = manager_->send_task(no_parts);
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().code, jsonrpc::kInvalidParams);
  EXPECT_EQ(manager_->task_count(), 0u);
}

TEST_F(TaskManagerTest, ShutdownCancelsProcessorsAndClosesStreams) {
  std::atomic<bool> observed{false};
  body_ = [&observed](const std::string&, const Message&, TaskHandle& handle) {
    (void)handle.update_status(TaskState::Working);
    while (!handle.is_cancelled()) {
      std::this_thread::sleep_for(1ms);
    }
    observed = true;
    return ok();
  };

  auto ch = manager_->send_task_subscribe(send_params("t1"), {});
  ASSERT_TRUE(ch.has_value());
  ASSERT_TRUE(wait_for_state("t1", TaskState::Working));

  manager_->shutdown();
  EXPECT_TRUE(observed.load());
  (void)drain(*ch);
  EXPECT_TRUE((*ch)->is_drained());

  auto late = manager_->send_task(send_params("t2"));
  ASSERT_FALSE(late.has_value());
  EXPECT_EQ(late.error().code, jsonrpc::kInternalError);
}
