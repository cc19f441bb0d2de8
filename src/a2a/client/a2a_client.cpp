#include "a2a/client/a2a_client.hpp"

#include "a2a/http/http_client.hpp"
#include "a2a/http/url.hpp"
#include "a2a/protocol/methods.hpp"
#include "a2a/sse/sse_reader.hpp"
#include "a2a/sse/task_event_codec.hpp"
#include "a2a/util/log.hpp"

#include <nlohmann/json.hpp>

#include <array>
#include <format>
#include <thread>

namespace a2a {

using json = nlohmann::json;

namespace {

constexpr std::string_view kJsonContentType = "application/json; charset=utf-8";
constexpr std::string_view kEventStreamType = "text/event-stream";
constexpr std::size_t kMaxErrorBody = 1024 * 1024;

auto transport_error(std::string_view what, std::error_code ec) -> ClientError {
  return ClientError{.kind = ClientErrorKind::Transport,
                     .message = std::format("{}: {}", what, ec.message()),
                     .http_status = 0,
                     .rpc = std::nullopt};
}

auto status_error(int status, std::string message) -> ClientError {
  return ClientError{.kind = ClientErrorKind::HttpStatus,
                     .message = std::move(message),
                     .http_status = status,
                     .rpc = std::nullopt};
}

auto invalid_response(std::string message, int status = 200) -> ClientError {
  return ClientError{.kind = ClientErrorKind::InvalidResponse,
                     .message = std::move(message),
                     .http_status = status,
                     .rpc = std::nullopt};
}

auto rpc_error(jsonrpc::Error error) -> ClientError {
  auto message = jsonrpc::describe(error);
  return ClientError{.kind = ClientErrorKind::Rpc,
                     .message = std::move(message),
                     .http_status = 200,
                     .rpc = std::move(error)};
}

auto is_json_content(std::string_view content_type) -> bool {
  return content_type.contains("application/json");
}

// Unwraps a JSON-RPC response body into `T`.
template <typename T>
auto decode_rpc_body(std::string_view body) -> ClientResult<T> {
  auto rpc = jsonrpc::parse_response(body);
  if (!rpc) {
    return std::unexpected(invalid_response(
        std::format("malformed JSON-RPC response: {}", rpc.error().message())));
  }
  if (rpc->error) {
    return std::unexpected(rpc_error(std::move(*rpc->error)));
  }
  auto value = decode<T>(*rpc->result);
  if (!value) {
    return std::unexpected(
        invalid_response("result does not match the expected schema"));
  }
  return std::move(*value);
}

// Reads the remaining body of a response that will not be streamed.
auto read_body(http::HttpStream& stream) -> Result<std::string> {
  std::string body;
  std::array<char, 4096> buf;
  for (;;) {
    auto n = stream.read(buf);
    if (!n) {
      return std::unexpected(n.error());
    }
    if (*n == 0) {
      return body;
    }
    if (body.size() + *n > kMaxErrorBody) {
      return fail(Error::ProtocolError);
    }
    body.append(buf.data(), *n);
  }
}

}  // namespace

auto client_error_kind_name(ClientErrorKind kind) noexcept -> std::string_view {
  switch (kind) {
    case ClientErrorKind::Transport: return "transport";
    case ClientErrorKind::HttpStatus: return "http_status";
    case ClientErrorKind::InvalidResponse: return "invalid_response";
    case ClientErrorKind::Rpc: return "rpc";
  }
  return "unknown";
}

auto describe(const ClientError& error) -> std::string {
  if (error.kind == ClientErrorKind::HttpStatus) {
    return std::format("{} error (HTTP {}): {}",
                       client_error_kind_name(error.kind), error.http_status,
                       error.message);
  }
  return std::format("{} error: {}", client_error_kind_name(error.kind),
                     error.message);
}

struct TaskEventStream::Impl {
  std::unique_ptr<http::HttpStream> stream;
  ChannelPtr<TaskEvent> channel;
  CancellationToken caller;
  // Declared last: joined before the socket and channel go away.
  std::jthread reader;

  Impl(std::unique_ptr<http::HttpStream> s, std::size_t buffer,
       CancellationToken token)
      : stream(std::move(s)),
        channel(make_channel<TaskEvent>(buffer)),
        caller(std::move(token)) {
  }

  auto run(std::stop_token st) -> void {
    CancellationSource stop;
    auto on_caller = link(caller, stop);
    std::stop_callback on_thread(st, [&stop] { stop.cancel(); });
    auto token = stop.token();
    auto unblock =
        on_cancel(token, [s = stream.get()] { s->cancel(); });

    sse::EventReader events(*stream);
    std::size_t delivered = 0;
    while (!token.is_cancelled()) {
      auto next = events.read_event();
      if (!next) {
        if (!token.is_cancelled()) {
          log::warn("SSE stream read failed: {}", next.error().message());
        }
        break;
      }
      if (!*next) {
        log::debug("SSE stream ended after {} events", delivered);
        break;
      }

      auto& frame = **next;
      auto kind = sse::classify_event(frame.type);
      if (kind == sse::EventKind::Close) {
        log::debug("SSE stream closed by server: {}", frame.data);
        break;
      }
      if (frame.data.empty()) {
        continue;
      }
      if (kind == sse::EventKind::Unknown) {
        log::warn("Skipping SSE event of unknown type '{}'", frame.type);
        continue;
      }
      auto event = sse::decode_task_event(kind, frame.data);
      if (!event) {
        log::warn("Skipping malformed '{}' event: {}", frame.type,
                  event.error().message());
        continue;
      }
      if (channel->send(std::move(*event), token) != ChannelStatus::Ok) {
        break;
      }
      ++delivered;
    }

    unblock.reset();
    channel->close();
  }
};

TaskEventStream::TaskEventStream(Key, std::unique_ptr<Impl> impl)
    : impl_(std::move(impl)) {
}

TaskEventStream::~TaskEventStream() {
  if (impl_->reader.joinable()) {
    impl_->reader.request_stop();
    impl_->reader.join();
  }
}

auto TaskEventStream::events() const noexcept -> const ChannelPtr<TaskEvent>& {
  return impl_->channel;
}

auto TaskEventStream::receive(const CancellationToken& token)
    -> std::optional<TaskEvent> {
  return impl_->channel->receive(token);
}

auto TaskEventStream::cancel() -> void {
  impl_->reader.request_stop();
}

struct A2AClient::Impl {
  http::Url url;
  ClientConfig config;
  http::HttpClient http;

  Impl(http::Url u, ClientConfig cfg)
      : url(std::move(u)),
        config(std::move(cfg)),
        http(http::HttpClientConfig{
            .connect_timeout = std::chrono::milliseconds(config.timeout_ms),
            .read_timeout = std::chrono::milliseconds(config.timeout_ms),
        }) {
  }

  auto build_request(std::string_view method, const std::string& id,
                     json params, std::string_view accept) const
      -> http::HttpRequest {
    auto rpc = jsonrpc::make_request(method, id, std::move(params));
    http::HttpRequest req;
    req.method = http::HttpMethod::POST;
    req.set_header("Content-Type", std::string(kJsonContentType));
    req.set_header("Accept", std::string(accept));
    req.set_header("User-Agent", config.user_agent);
    req.set_body(json(rpc).dump());
    return req;
  }

  template <typename T>
  auto call(std::string_view method, const std::string& id, json params)
      -> ClientResult<T> {
    auto req = build_request(method, id, std::move(params), "application/json");
    auto resp = http.request(url, std::move(req));
    if (!resp) {
      log::debug("{} to {} failed: {}", method, url.to_string(),
                 resp.error().message());
      return std::unexpected(transport_error(method, resp.error()));
    }
    if (resp->status_code() < 200 || resp->status_code() >= 300) {
      return std::unexpected(status_error(
          resp->status_code(),
          std::format("{} returned HTTP {}", method, resp->status_code())));
    }
    return decode_rpc_body<T>(resp->body_as_string());
  }

  auto open_event_stream(std::string_view method, const std::string& id,
                         json params, CancellationToken token)
      -> ClientResult<std::unique_ptr<TaskEventStream>> {
    auto req = build_request(method, id, std::move(params), kEventStreamType);
    auto opened = http.open_stream(url, std::move(req));
    if (!opened) {
      return std::unexpected(transport_error(method, opened.error()));
    }
    auto& stream = *opened;

    if (stream->status() != 200) {
      return std::unexpected(status_error(
          stream->status(),
          std::format("{} returned HTTP {}", method, stream->status())));
    }

    auto content_type = stream->header("Content-Type").value_or("");
    if (!content_type.contains(kEventStreamType)) {
      // Setup errors arrive as a plain JSON-RPC error body.
      if (is_json_content(content_type)) {
        auto body = read_body(*stream);
        if (!body) {
          return std::unexpected(transport_error(method, body.error()));
        }
        auto result = decode_rpc_body<json>(*body);
        if (!result) {
          return std::unexpected(std::move(result.error()));
        }
      }
      return std::unexpected(invalid_response(std::format(
          "{} expected {} but got '{}'", method, kEventStreamType,
          content_type)));
    }

    auto impl = std::make_unique<TaskEventStream::Impl>(
        std::move(stream), config.stream_buffer, std::move(token));
    impl->reader = std::jthread(
        [state = impl.get()](std::stop_token st) { state->run(st); });
    return std::make_unique<TaskEventStream>(TaskEventStream::Key{},
                                             std::move(impl));
  }
};

A2AClient::A2AClient(std::unique_ptr<Impl> impl) : impl_(std::move(impl)) {
}

A2AClient::~A2AClient() = default;
A2AClient::A2AClient(A2AClient&&) noexcept = default;
auto A2AClient::operator=(A2AClient&&) noexcept -> A2AClient& = default;

auto A2AClient::create(std::string_view agent_url, ClientConfig config)
    -> Result<A2AClient> {
  auto url = http::parse_url(agent_url);
  if (!url) {
    log::error("Invalid agent URL '{}'", agent_url);
    return std::unexpected(url.error());
  }
  return A2AClient(std::make_unique<Impl>(std::move(*url), std::move(config)));
}

auto A2AClient::send_task(const SendTaskParams& params) -> ClientResult<Task> {
  return impl_->call<Task>(methods::kSend, params.id, params);
}

auto A2AClient::get_task(const TaskQueryParams& params) -> ClientResult<Task> {
  return impl_->call<Task>(methods::kGet, params.id, params);
}

auto A2AClient::cancel_task(const TaskIdParams& params) -> ClientResult<Task> {
  return impl_->call<Task>(methods::kCancel, params.id, params);
}

auto A2AClient::set_push_notification(const TaskPushNotificationConfig& config)
    -> ClientResult<TaskPushNotificationConfig> {
  return impl_->call<TaskPushNotificationConfig>(methods::kPushNotificationSet,
                                                 config.id, config);
}

auto A2AClient::get_push_notification(const TaskIdParams& params)
    -> ClientResult<TaskPushNotificationConfig> {
  return impl_->call<TaskPushNotificationConfig>(methods::kPushNotificationGet,
                                                 params.id, params);
}

auto A2AClient::stream_task(const SendTaskParams& params,
                            CancellationToken token)
    -> ClientResult<std::unique_ptr<TaskEventStream>> {
  return impl_->open_event_stream(methods::kSendSubscribe, params.id, params,
                                  std::move(token));
}

auto A2AClient::resubscribe_task(const TaskIdParams& params,
                                 CancellationToken token)
    -> ClientResult<std::unique_ptr<TaskEventStream>> {
  return impl_->open_event_stream(methods::kResubscribe, params.id, params,
                                  std::move(token));
}

auto A2AClient::url() const -> std::string {
  return impl_->url.to_string();
}

}  // namespace a2a
