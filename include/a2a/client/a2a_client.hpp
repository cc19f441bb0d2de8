#pragma once

#include "a2a/config/system_config.hpp"
#include "a2a/core/cancellation.hpp"
#include "a2a/core/channel.hpp"
#include "a2a/core/error.hpp"
#include "a2a/protocol/jsonrpc.hpp"
#include "a2a/protocol/types.hpp"

#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace a2a {

enum class ClientErrorKind : std::uint8_t {
  Transport,        // connect, write or read failure
  HttpStatus,       // unexpected HTTP status or content type
  InvalidResponse,  // body is not a well-formed JSON-RPC response
  Rpc,              // server answered with a JSON-RPC error
};

[[nodiscard]] auto client_error_kind_name(ClientErrorKind kind) noexcept
    -> std::string_view;

struct ClientError {
  ClientErrorKind kind{ClientErrorKind::Transport};
  std::string message;
  int http_status{0};
  std::optional<jsonrpc::Error> rpc;  // set for ClientErrorKind::Rpc
};

[[nodiscard]] auto describe(const ClientError& error) -> std::string;

template <typename T>
using ClientResult = std::expected<T, ClientError>;

// Events of one streaming call, decoded by a background reader thread.
// The channel is closed when the server ends the stream, on a read error or
// on cancellation. Destroying the stream cancels and joins the reader.
class TaskEventStream {
  struct Impl;
  // Only A2AClient can start a stream.
  class Key {
    friend class A2AClient;
    Key() = default;
  };

public:
  TaskEventStream(Key, std::unique_ptr<Impl> impl);
  ~TaskEventStream();

  TaskEventStream(const TaskEventStream&) = delete;
  auto operator=(const TaskEventStream&) -> TaskEventStream& = delete;

  [[nodiscard]] auto events() const noexcept -> const ChannelPtr<TaskEvent>&;

  // nullopt once the stream has ended and every event was consumed.
  [[nodiscard]] auto receive(const CancellationToken& token = {})
      -> std::optional<TaskEvent>;

  // Stops the reader without notifying the server. The channel closes
  // shortly after; safe to call from any thread.
  auto cancel() -> void;

private:
  friend class A2AClient;
  std::unique_ptr<Impl> impl_;
};

class A2AClient {
public:
  // InvalidArgument unless `agent_url` is an http:// URL.
  [[nodiscard]] static auto create(std::string_view agent_url,
                                   ClientConfig config = {})
      -> Result<A2AClient>;

  ~A2AClient();
  A2AClient(A2AClient&&) noexcept;
  auto operator=(A2AClient&&) noexcept -> A2AClient&;

  auto send_task(const SendTaskParams& params) -> ClientResult<Task>;
  auto get_task(const TaskQueryParams& params) -> ClientResult<Task>;
  auto cancel_task(const TaskIdParams& params) -> ClientResult<Task>;
  auto set_push_notification(const TaskPushNotificationConfig& config)
      -> ClientResult<TaskPushNotificationConfig>;
  auto get_push_notification(const TaskIdParams& params)
      -> ClientResult<TaskPushNotificationConfig>;

  // Fails synchronously, without starting a reader, unless the server
  // answers 200 with a text/event-stream body.
  auto stream_task(const SendTaskParams& params,
                   CancellationToken token = {})
      -> ClientResult<std::unique_ptr<TaskEventStream>>;
  auto resubscribe_task(const TaskIdParams& params,
                        CancellationToken token = {})
      -> ClientResult<std::unique_ptr<TaskEventStream>>;

  [[nodiscard]] auto url() const -> std::string;

private:
  struct Impl;
  explicit A2AClient(std::unique_ptr<Impl> impl);
  std::unique_ptr<Impl> impl_;
};

}  // namespace a2a
