#include "a2a/client/a2a_client.hpp"
#include "a2a/http/http_client.hpp"
#include "a2a/http/http_server.hpp"
#include "a2a/protocol/errors.hpp"
#include "a2a/protocol/methods.hpp"
#include "a2a/server/a2a_server.hpp"
#include "a2a/sse/sse_writer.hpp"
#include "a2a/sse/task_event_codec.hpp"
#include "a2a/task/task_manager.hpp"

#include <format>
#include <thread>

#include "gtest/gtest.h"
#include "test_utils.hpp"

using namespace a2a;
using namespace std::chrono_literals;
using a2a::test::send_params;
using a2a::test::status_of;
using a2a::test::task_ref;

namespace {

auto query(std::string id) -> TaskQueryParams {
  return TaskQueryParams{
      .id = std::move(id), .history_length = std::nullopt, .metadata = nullptr};
}

auto status_event(std::string id, TaskState state, bool last = false)
    -> TaskEvent {
  return TaskStatusUpdateEvent{
      .id = std::move(id),
      .status = TaskStatus{.state = state, .message = std::nullopt,
                           .timestamp = "2024-01-01T00:00:00Z"},
      .is_final = last,
      .metadata = nullptr};
}

auto drain(TaskEventStream& stream) -> std::vector<TaskEvent> {
  std::vector<TaskEvent> out;
  while (auto ev = stream.events()->receive_for(5s)) {
    out.push_back(std::move(*ev));
  }
  return out;
}

// "echo" completes with one artifact echoing the input; "block" stays
// working until cancelled.
auto run(const std::string&, const Message& message, TaskHandle& handle)
    -> Result<void> {
  auto text = message_text(message);
  if (!handle.update_status(TaskState::Working)) {
    return fail(Error::Unknown);
  }
  if (text == "block") {
    while (!handle.is_cancelled()) {
      test::sleep_ms(10ms);
    }
    return ok();
  }
  Artifact artifact{.name = "echo",
                    .description = std::nullopt,
                    .parts = {text_part(text)},
                    .index = 0,
                    .append = false,
                    .last_chunk = true,
                    .metadata = nullptr};
  if (!handle.add_artifact(std::move(artifact))) {
    return fail(Error::Unknown);
  }
  if (!handle.update_status(TaskState::Completed,
                            make_message(Role::Agent, "done"))) {
    return fail(Error::Unknown);
  }
  return ok();
}

}  // namespace

class A2AClientTest : public ::testing::Test {
protected:
  void SetUp() override {
    manager_ = std::make_unique<MemoryTaskManager>(processor_);
    server_ = std::make_unique<A2AServer>(
        *manager_, ServerConfig{.host = "127.0.0.1",
                                .port = 0,
                                .base_path = "/a2a",
                                .read_timeout_ms = 2000,
                                .heartbeat_interval_ms = 50});
    ASSERT_TRUE(server_->start().has_value());

    auto client = A2AClient::create(url("/a2a"));
    ASSERT_TRUE(client.has_value());
    client_ = std::make_unique<A2AClient>(std::move(*client));
  }

  void TearDown() override {
    client_.reset();
    server_->stop();
    manager_->shutdown();
  }

  auto url(std::string_view path) const -> std::string {
    return std::format("http://127.0.0.1:{}{}", server_->port(), path);
  }

  auto raw_post(std::string_view body) -> json {
    http::HttpClient http;
    auto target = http::parse_url(url("/a2a"));
    EXPECT_TRUE(target.has_value());
    auto resp = http.post_json(*target, body);
    EXPECT_TRUE(resp.has_value());
    if (!resp) {
      return nullptr;
    }
    EXPECT_EQ(resp->status_code(), 200);
    return json::parse(resp->body_as_string(), nullptr, false);
  }

  auto wait_for_state(const std::string& id, TaskState state) -> bool {
    return test::wait_until([&] {
      auto task = client_->get_task(query(id));
      return task && task->status.state == state;
    });
  }

  FunctionProcessor processor_{run};
  std::unique_ptr<MemoryTaskManager> manager_;
  std::unique_ptr<A2AServer> server_;
  std::unique_ptr<A2AClient> client_;
};

TEST_F(A2AClientTest, SendThenGet) {
  auto sent = client_->send_task(send_params("t1", "hello"));
  ASSERT_TRUE(sent.has_value()) << describe(sent.error());
  EXPECT_EQ(sent->id, "t1");

  ASSERT_TRUE(wait_for_state("t1", TaskState::Completed));
  auto task = client_->get_task(query("t1"));
  ASSERT_TRUE(task.has_value());
  ASSERT_EQ(task->artifacts.size(), 1u);
  ASSERT_EQ(task->artifacts[0].parts.size(), 1u);
  auto* part = std::get_if<TextPart>(&task->artifacts[0].parts[0]);
  ASSERT_NE(part, nullptr);
  EXPECT_EQ(part->text, "hello");
  ASSERT_TRUE(task->status.message.has_value());
  EXPECT_EQ(message_text(*task->status.message), "done");
}

TEST_F(A2AClientTest, RpcErrorsCarryCodes) {
  auto missing = client_->get_task(query("nope"));
  ASSERT_FALSE(missing.has_value());
  EXPECT_EQ(missing.error().kind, ClientErrorKind::Rpc);
  ASSERT_TRUE(missing.error().rpc.has_value());
  EXPECT_EQ(missing.error().rpc->code, errors::kTaskNotFound);

  auto cancel = client_->cancel_task(task_ref("nope"));
  ASSERT_FALSE(cancel.has_value());
  ASSERT_TRUE(cancel.error().rpc.has_value());
  EXPECT_EQ(cancel.error().rpc->code, errors::kTaskNotFound);

  auto invalid = send_params("");
  auto rejected = client_->send_task(invalid);
  ASSERT_FALSE(rejected.has_value());
  ASSERT_TRUE(rejected.error().rpc.has_value());
  EXPECT_EQ(rejected.error().rpc->code, jsonrpc::kInvalidParams);
}

TEST_F(A2AClientTest, CancelRunningTask) {
  ASSERT_TRUE(client_->send_task(send_params("t1", "block")).has_value());
  ASSERT_TRUE(wait_for_state("t1", TaskState::Working));

  auto canceled = client_->cancel_task(task_ref("t1"));
  ASSERT_TRUE(canceled.has_value()) << describe(canceled.error());
  EXPECT_EQ(canceled->status.state, TaskState::Canceled);

  auto again = client_->cancel_task(task_ref("t1"));
  ASSERT_FALSE(again.has_value());
  ASSERT_TRUE(again.error().rpc.has_value());
  EXPECT_EQ(again.error().rpc->code, errors::kTaskFinalState);
}

TEST_F(A2AClientTest, EnvelopeErrors) {
  auto unknown = raw_post(
      R"({"jsonrpc":"2.0","id":7,"method":"tasks/explode","params":{}})");
  ASSERT_TRUE(unknown.is_object());
  EXPECT_EQ(unknown["id"], 7);
  EXPECT_EQ(unknown["error"]["code"], jsonrpc::kMethodNotFound);

  auto garbage = raw_post("{not json");
  ASSERT_TRUE(garbage.is_object());
  EXPECT_TRUE(garbage["id"].is_null());
  EXPECT_EQ(garbage["error"]["code"], jsonrpc::kParseError);

  auto bad_version = raw_post(
      R"({"jsonrpc":"1.0","id":"x","method":"tasks/get","params":{}})");
  ASSERT_TRUE(bad_version.is_object());
  EXPECT_EQ(bad_version["id"], "x");
  EXPECT_EQ(bad_version["error"]["code"], jsonrpc::kInvalidRequest);

  auto bad_params = raw_post(
      R"({"jsonrpc":"2.0","id":1,"method":"tasks/get","params":{"id":5}})");
  ASSERT_TRUE(bad_params.is_object());
  EXPECT_EQ(bad_params["error"]["code"], jsonrpc::kInvalidParams);
}

TEST_F(A2AClientTest, StreamDeliversLifecycle) {
  auto stream = client_->stream_task(send_params("s1", "streamed"));
  ASSERT_TRUE(stream.has_value()) << describe(stream.error());

  auto events = drain(**stream);
  ASSERT_EQ(events.size(), 3u);
  EXPECT_EQ(status_of(events[0]), TaskState::Working);
  auto* artifact = std::get_if<TaskArtifactUpdateEvent>(&events[1]);
  ASSERT_NE(artifact, nullptr);
  EXPECT_EQ(artifact->id, "s1");
  EXPECT_EQ(artifact->artifact.name, "echo");
  EXPECT_EQ(status_of(events[2]), TaskState::Completed);
  EXPECT_TRUE(is_final_event(events[2]));

  EXPECT_FALSE((*stream)->receive().has_value());
  EXPECT_TRUE((*stream)->events()->is_closed());
}

TEST_F(A2AClientTest, ResubscribeToFinishedTask) {
  ASSERT_TRUE(client_->send_task(send_params("t1")).has_value());
  ASSERT_TRUE(wait_for_state("t1", TaskState::Completed));

  auto stream = client_->resubscribe_task(task_ref("t1"));
  ASSERT_TRUE(stream.has_value()) << describe(stream.error());
  auto events = drain(**stream);
  ASSERT_EQ(events.size(), 1u);
  EXPECT_EQ(status_of(events[0]), TaskState::Completed);
  EXPECT_TRUE(is_final_event(events[0]));
}

TEST_F(A2AClientTest, ResubscribeToUnknownTaskFailsSynchronously) {
  auto stream = client_->resubscribe_task(task_ref("nope"));
  ASSERT_FALSE(stream.has_value());
  EXPECT_EQ(stream.error().kind, ClientErrorKind::Rpc);
  ASSERT_TRUE(stream.error().rpc.has_value());
  EXPECT_EQ(stream.error().rpc->code, errors::kTaskNotFound);
}

TEST_F(A2AClientTest, StreamToWrongPathIsHttpError) {
  auto client = A2AClient::create(url("/elsewhere"));
  ASSERT_TRUE(client.has_value());

  auto stream = client->stream_task(send_params("s1"));
  ASSERT_FALSE(stream.has_value());
  EXPECT_EQ(stream.error().kind, ClientErrorKind::HttpStatus);
  EXPECT_EQ(stream.error().http_status, 404);
  EXPECT_EQ(manager_->task_count(), 0u);

  auto unary = client->get_task(query("t1"));
  ASSERT_FALSE(unary.has_value());
  EXPECT_EQ(unary.error().kind, ClientErrorKind::HttpStatus);
}

TEST_F(A2AClientTest, CancelStreamFromCaller) {
  CancellationSource source;
  auto stream = client_->stream_task(send_params("s1", "block"),
                                     source.token());
  ASSERT_TRUE(stream.has_value()) << describe(stream.error());

  auto first = (*stream)->events()->receive_for(5s);
  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(status_of(*first), TaskState::Working);

  source.cancel();
  ASSERT_TRUE(test::wait_until([&] { return (*stream)->events()->is_closed(); }));
  EXPECT_FALSE((*stream)->receive().has_value());

  // Dropping the stream does not cancel the task itself.
  EXPECT_EQ(client_->get_task(query("s1"))->status.state, TaskState::Working);
}

TEST_F(A2AClientTest, StreamCancelMethod) {
  auto stream = client_->stream_task(send_params("s1", "block"));
  ASSERT_TRUE(stream.has_value());
  ASSERT_TRUE((*stream)->events()->receive_for(5s).has_value());

  (*stream)->cancel();
  EXPECT_TRUE(test::wait_until([&] { return (*stream)->events()->is_closed(); }));
}

TEST_F(A2AClientTest, PushNotificationsOverTheWire) {
  ASSERT_TRUE(client_->send_task(send_params("t1", "block")).has_value());

  auto missing = client_->get_push_notification(task_ref("t1"));
  ASSERT_FALSE(missing.has_value());
  ASSERT_TRUE(missing.error().rpc.has_value());
  EXPECT_EQ(missing.error().rpc->code, errors::kPushNotificationNotConfigured);

  TaskPushNotificationConfig config{
      .id = "t1",
      .push_notification_config = {.url = "http://callback.local/hook",
                                   .token = "tok",
                                   .authentication = std::nullopt}};
  auto set = client_->set_push_notification(config);
  ASSERT_TRUE(set.has_value()) << describe(set.error());
  EXPECT_EQ(*set, config);

  auto got = client_->get_push_notification(task_ref("t1"));
  ASSERT_TRUE(got.has_value());
  EXPECT_EQ(*got, config);
}

TEST(A2AClientCreateTest, RejectsUnsupportedUrls) {
  auto https = A2AClient::create("https://agent.example.com/");
  ASSERT_FALSE(https.has_value());
  EXPECT_EQ(https.error(), make_error_code(Error::InvalidArgument));

  EXPECT_FALSE(A2AClient::create("not a url").has_value());

  auto good = A2AClient::create("http://localhost:9000/a2a");
  ASSERT_TRUE(good.has_value());
  EXPECT_EQ(good->url(), "http://localhost:9000/a2a");
}

TEST(A2AClientCreateTest, UnreachableServerIsTransportError) {
  auto client = A2AClient::create("http://127.0.0.1:1/",
                                  ClientConfig{.timeout_ms = 1000});
  ASSERT_TRUE(client.has_value());
  auto task = client->get_task(query("t1"));
  ASSERT_FALSE(task.has_value());
  EXPECT_EQ(task.error().kind, ClientErrorKind::Transport);
}

// A hand-written SSE endpoint, for framing the task server never produces.
class RawStreamTest : public ::testing::Test {
protected:
  void SetUp() override {
    server_.router().post("/raw", [this](const http::HttpRequest&) {
      return http::HttpResponse::event_stream(
          [this](http::StreamWriter& writer) {
            for (const auto& frame : frames_) {
              if (!writer.write(frame)) {
                return;
              }
            }
          });
    });
    server_.router().post("/json", [](const http::HttpRequest&) {
      return http::HttpResponse::json(R"({"not":"a stream"})");
    });
    server_.router().post("/accepted", [](const http::HttpRequest&) {
      Task task;
      task.id = "r1";
      task.status.state = TaskState::Working;
      auto resp = http::HttpResponse::json(
          json(jsonrpc::make_result("r1", json(task))).dump());
      resp.status = http::HttpStatus::Accepted;
      return resp;
    });
    server_.router().post("/unavailable", [](const http::HttpRequest&) {
      auto resp = http::HttpResponse::json("{}");
      resp.status = http::HttpStatus::ServiceUnavailable;
      return resp;
    });
    ASSERT_TRUE(server_.start("127.0.0.1", 0).has_value());
  }

  void TearDown() override {
    server_.stop();
  }

  auto client(std::string_view path) -> A2AClient {
    auto c = A2AClient::create(
        std::format("http://127.0.0.1:{}{}", server_.port(), path));
    EXPECT_TRUE(c.has_value());
    return std::move(*c);
  }

  std::vector<std::string> frames_;
  http::HttpServer server_{std::chrono::milliseconds(2000)};
};

TEST_F(RawStreamTest, CloseFrameEndsStream) {
  frames_ = {
      sse::encode_task_event(status_event("r1", TaskState::Working)),
      sse::format_comment(),
      sse::format_close("done early"),
      sse::encode_task_event(status_event("r1", TaskState::Completed, true)),
  };
  auto c = client("/raw");
  auto stream = c.stream_task(send_params("r1"));
  ASSERT_TRUE(stream.has_value()) << describe(stream.error());

  auto events = drain(**stream);
  ASSERT_EQ(events.size(), 1u);
  EXPECT_EQ(status_of(events[0]), TaskState::Working);
}

TEST_F(RawStreamTest, MalformedAndUnknownEventsAreSkipped) {
  frames_ = {
      sse::format_event(events::kTaskStatusUpdate, "{not json"),
      sse::format_event("progress", R"({"pct":50})"),
      sse::format_event(events::kTaskArtifactUpdate, R"({"id":"r1"})"),
      sse::encode_task_event(status_event("r1", TaskState::Completed, true)),
  };
  auto c = client("/raw");
  auto stream = c.stream_task(send_params("r1"));
  ASSERT_TRUE(stream.has_value());

  auto events = drain(**stream);
  ASSERT_EQ(events.size(), 1u);
  EXPECT_EQ(status_of(events[0]), TaskState::Completed);
}

TEST_F(RawStreamTest, NonStreamBodyIsRejected) {
  auto c = client("/json");
  auto stream = c.stream_task(send_params("r1"));
  ASSERT_FALSE(stream.has_value());
  EXPECT_EQ(stream.error().kind, ClientErrorKind::InvalidResponse);
}

TEST_F(RawStreamTest, UnaryCallsAcceptAny2xxStatus) {
  auto accepted = client("/accepted");
  auto task = accepted.get_task(query("r1"));
  ASSERT_TRUE(task.has_value()) << describe(task.error());
  EXPECT_EQ(task->id, "r1");
  EXPECT_EQ(task->status.state, TaskState::Working);

  auto unavailable = client("/unavailable");
  auto failed = unavailable.get_task(query("r1"));
  ASSERT_FALSE(failed.has_value());
  EXPECT_EQ(failed.error().kind, ClientErrorKind::HttpStatus);
  EXPECT_EQ(failed.error().http_status, 503);
}
