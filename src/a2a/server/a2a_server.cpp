#include "a2a/server/a2a_server.hpp"

#include "a2a/http/http_server.hpp"
#include "a2a/protocol/jsonrpc.hpp"
#include "a2a/protocol/methods.hpp"
#include "a2a/protocol/types.hpp"
#include "a2a/sse/sse_writer.hpp"
#include "a2a/sse/task_event_codec.hpp"
#include "a2a/util/log.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <expected>

namespace a2a {

using json = nlohmann::json;

namespace {

auto rpc_reply(const jsonrpc::Response& response) -> http::HttpResponse {
  return http::HttpResponse::json(json(response).dump());
}

// Best-effort id recovery for error replies to malformed requests.
auto request_id(const json& body) -> json {
  if (!body.is_object()) {
    return nullptr;
  }
  auto it = body.find("id");
  if (it == body.end() ||
      !(it->is_string() || it->is_number_integer())) {
    return nullptr;
  }
  return *it;
}

template <typename T>
auto decode_params(const json& params) -> std::expected<T, jsonrpc::Error> {
  try {
    return params.get<T>();
  } catch (const std::exception& e) {
    return std::unexpected(jsonrpc::invalid_params(e.what()));
  }
}

template <typename Params, typename Fn>
auto call_unary(const jsonrpc::Request& req, Fn&& fn) -> jsonrpc::Response {
  auto params = decode_params<Params>(req.params);
  if (!params) {
    return jsonrpc::make_error(req.id, std::move(params.error()));
  }
  auto result = fn(*params);
  if (!result) {
    return jsonrpc::make_error(req.id, std::move(result.error()));
  }
  return jsonrpc::make_result(req.id, json(*result));
}

// Pumps subscriber events onto the response body until the channel ends,
// the client goes away or the server stops.
auto pump_events(const EventChannel& channel,
                 const std::shared_ptr<CancellationSource>& subscription,
                 std::chrono::milliseconds heartbeat,
                 http::StreamWriter& writer) -> void {
  auto on_stop =
      on_cancel(writer.cancellation(), [subscription] { subscription->cancel(); });
  auto token = subscription->token();

  while (!token.is_cancelled()) {
    auto event = channel->receive_for(heartbeat, token);
    if (event) {
      if (!writer.write(sse::encode_task_event(*event))) {
        log::debug("SSE client went away; dropping subscription");
        subscription->cancel();
        return;
      }
      continue;
    }
    if (channel->is_drained()) {
      if (auto w = writer.write(sse::format_close("stream ended")); !w) {
        log::debug("SSE close frame not delivered: {}", w.error().message());
      }
      return;
    }
    if (token.is_cancelled()) {
      break;
    }
    if (!writer.write(sse::format_comment())) {
      log::debug("SSE heartbeat failed; dropping subscription");
      subscription->cancel();
      return;
    }
  }

  if (auto w = writer.write(sse::format_close("server shutting down")); !w) {
    log::debug("SSE close frame not delivered: {}", w.error().message());
  }
}

}  // namespace

struct A2AServer::Impl {
  ITaskManager& manager;
  ServerConfig config;
  http::HttpServer server;

  Impl(ITaskManager& m, ServerConfig cfg)
      : manager(m),
        config(std::move(cfg)),
        server(std::chrono::milliseconds(config.read_timeout_ms)) {
  }

  auto handle(const http::HttpRequest& req) -> http::HttpResponse {
    auto body = json::parse(req.body_as_string(), nullptr, false);
    if (body.is_discarded()) {
      log::debug("Rejecting request with malformed JSON body");
      return rpc_reply(jsonrpc::make_error(nullptr, jsonrpc::parse_error()));
    }

    auto request = jsonrpc::parse_request(body);
    if (!request) {
      return rpc_reply(
          jsonrpc::make_error(request_id(body), std::move(request.error())));
    }

    log::debug("JSON-RPC {} (id={})", request->method, request->id.dump());
    const auto& method = request->method;

    if (method == methods::kSendSubscribe || method == methods::kResubscribe) {
      return stream(*request);
    }
    return rpc_reply(dispatch(*request));
  }

  auto dispatch(const jsonrpc::Request& req) -> jsonrpc::Response {
    const auto& method = req.method;
    if (method == methods::kSend) {
      return call_unary<SendTaskParams>(
          req, [this](const auto& p) { return manager.send_task(p); });
    }
    if (method == methods::kGet) {
      return call_unary<TaskQueryParams>(
          req, [this](const auto& p) { return manager.get_task(p); });
    }
    if (method == methods::kCancel) {
      return call_unary<TaskIdParams>(
          req, [this](const auto& p) { return manager.cancel_task(p); });
    }
    if (method == methods::kPushNotificationSet) {
      return call_unary<TaskPushNotificationConfig>(req, [this](const auto& p) {
        return manager.set_push_notification(p);
      });
    }
    if (method == methods::kPushNotificationGet) {
      return call_unary<TaskIdParams>(req, [this](const auto& p) {
        return manager.get_push_notification(p);
      });
    }
    log::debug("Unknown JSON-RPC method: {}", method);
    return jsonrpc::make_error(req.id, jsonrpc::method_not_found(method));
  }

  auto subscribe(const jsonrpc::Request& req, CancellationToken token)
      -> RpcResult<EventChannel> {
    if (req.method == methods::kSendSubscribe) {
      auto params = decode_params<SendTaskParams>(req.params);
      if (!params) {
        return std::unexpected(std::move(params.error()));
      }
      return manager.send_task_subscribe(*params, std::move(token));
    }
    auto params = decode_params<TaskIdParams>(req.params);
    if (!params) {
      return std::unexpected(std::move(params.error()));
    }
    return manager.resubscribe(*params, std::move(token));
  }

  auto stream(const jsonrpc::Request& req) -> http::HttpResponse {
    auto subscription = std::make_shared<CancellationSource>();
    auto channel = subscribe(req, subscription->token());
    if (!channel) {
      return rpc_reply(jsonrpc::make_error(req.id, std::move(channel.error())));
    }

    auto heartbeat = std::chrono::milliseconds(config.heartbeat_interval_ms);
    return http::HttpResponse::event_stream(
        [channel = std::move(*channel), subscription,
         heartbeat](http::StreamWriter& writer) {
          pump_events(channel, subscription, heartbeat, writer);
        });
  }
};

A2AServer::A2AServer(ITaskManager& manager, ServerConfig config)
    : impl_(std::make_unique<Impl>(manager, std::move(config))) {
  impl_->server.router().post(
      impl_->config.base_path,
      [impl = impl_.get()](const http::HttpRequest& req) {
        return impl->handle(req);
      });
}

A2AServer::~A2AServer() {
  stop();
}

auto A2AServer::start() -> Result<void> {
  auto r = impl_->server.start(impl_->config.host, impl_->config.port);
  if (r) {
    log::info("A2A server serving JSON-RPC on http://{}:{}{}",
              impl_->config.host, impl_->server.port(),
              impl_->config.base_path);
  }
  return r;
}

auto A2AServer::stop() -> void {
  impl_->server.stop();
}

auto A2AServer::is_running() const -> bool {
  return impl_->server.is_running();
}

auto A2AServer::port() const -> std::uint16_t {
  return impl_->server.port();
}

auto A2AServer::handle(const http::HttpRequest& req) -> http::HttpResponse {
  return impl_->handle(req);
}

}  // namespace a2a
