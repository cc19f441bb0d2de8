#pragma once

#include "a2a/core/error.hpp"

#include <nlohmann/json.hpp>

#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace a2a::jsonrpc {

using json = nlohmann::json;

inline constexpr std::string_view kVersion = "2.0";

inline constexpr int kParseError = -32700;
inline constexpr int kInvalidRequest = -32600;
inline constexpr int kMethodNotFound = -32601;
inline constexpr int kInvalidParams = -32602;
inline constexpr int kInternalError = -32603;

struct Error {
  int code{kInternalError};
  std::string message;
  json data;  // null when absent

  auto operator==(const Error&) const -> bool = default;
};

template <typename T>
using RpcResult = std::expected<T, Error>;

[[nodiscard]] auto parse_error(std::string detail = {}) -> Error;
[[nodiscard]] auto invalid_request(std::string detail = {}) -> Error;
[[nodiscard]] auto method_not_found(std::string_view method) -> Error;
[[nodiscard]] auto invalid_params(std::string detail = {}) -> Error;
[[nodiscard]] auto internal_error(std::string detail = {}) -> Error;

// "<message>: <data>" or just the message.
[[nodiscard]] auto describe(const Error& error) -> std::string;

struct Request {
  json id;  // string, number or null
  std::string method;
  json params;
};

// Exactly one of result / error is set.
struct Response {
  json id;
  std::optional<json> result;
  std::optional<Error> error;

  [[nodiscard]] auto is_error() const noexcept -> bool {
    return error.has_value();
  }
};

[[nodiscard]] auto make_request(std::string_view method, json id, json params)
    -> Request;
[[nodiscard]] auto make_result(json id, json result) -> Response;
[[nodiscard]] auto make_error(json id, Error error) -> Response;

void to_json(json& j, const Error& e);
void from_json(const json& j, Error& e);
void to_json(json& j, const Request& r);
void to_json(json& j, const Response& r);

// Validates the envelope of an already-parsed request body.
[[nodiscard]] auto parse_request(const json& body) -> std::expected<Request, Error>;

// Client side: ProtocolError unless the body is a well-formed response with
// exactly one of result / error.
[[nodiscard]] auto parse_response(std::string_view body) -> Result<Response>;

}  // namespace a2a::jsonrpc
