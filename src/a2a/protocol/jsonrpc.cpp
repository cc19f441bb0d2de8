#include "a2a/protocol/jsonrpc.hpp"

#include "a2a/util/log.hpp"

#include <format>
#include <utility>

namespace a2a::jsonrpc {

namespace {

auto with_data(int code, std::string message, std::string detail) -> Error {
  Error e{.code = code, .message = std::move(message), .data = nullptr};
  if (!detail.empty()) {
    e.data = std::move(detail);
  }
  return e;
}

auto valid_id(const json& id) -> bool {
  return id.is_string() || id.is_number_integer() || id.is_null();
}

}  // namespace

auto parse_error(std::string detail) -> Error {
  return with_data(kParseError, "JSON parse error", std::move(detail));
}

auto invalid_request(std::string detail) -> Error {
  return with_data(kInvalidRequest, "Invalid request", std::move(detail));
}

auto method_not_found(std::string_view method) -> Error {
  return with_data(kMethodNotFound, "Method not found",
                   std::format("Method '{}' not found", method));
}

auto invalid_params(std::string detail) -> Error {
  return with_data(kInvalidParams, "Invalid parameters", std::move(detail));
}

auto internal_error(std::string detail) -> Error {
  return with_data(kInternalError, "Internal error", std::move(detail));
}

auto describe(const Error& error) -> std::string {
  if (error.data.is_null()) {
    return std::format("{} ({})", error.message, error.code);
  }
  auto data = error.data.is_string() ? error.data.get<std::string>()
                                     : error.data.dump();
  return std::format("{} ({}): {}", error.message, error.code, data);
}

auto make_request(std::string_view method, json id, json params) -> Request {
  return Request{.id = std::move(id),
                 .method = std::string(method),
                 .params = std::move(params)};
}

auto make_result(json id, json result) -> Response {
  return Response{.id = std::move(id),
                  .result = std::move(result),
                  .error = std::nullopt};
}

auto make_error(json id, Error error) -> Response {
  return Response{
      .id = std::move(id), .result = std::nullopt, .error = std::move(error)};
}

void to_json(json& j, const Error& e) {
  j = json{{"code", e.code}, {"message", e.message}};
  if (!e.data.is_null()) {
    j["data"] = e.data;
  }
}

void from_json(const json& j, Error& e) {
  e.code = j.at("code").get<int>();
  e.message = j.at("message").get<std::string>();
  auto it = j.find("data");
  e.data = it != j.end() ? *it : json(nullptr);
}

void to_json(json& j, const Request& r) {
  j = json{{"jsonrpc", std::string(kVersion)},
           {"id", r.id},
           {"method", r.method}};
  if (!r.params.is_null()) {
    j["params"] = r.params;
  }
}

void to_json(json& j, const Response& r) {
  j = json{{"jsonrpc", std::string(kVersion)}, {"id", r.id}};
  if (r.error) {
    j["error"] = *r.error;
  } else {
    j["result"] = r.result.value_or(json(nullptr));
  }
}

auto parse_request(const json& body) -> std::expected<Request, Error> {
  if (!body.is_object()) {
    return std::unexpected(invalid_request("request must be a JSON object"));
  }
  auto version = body.find("jsonrpc");
  if (version == body.end() || !version->is_string() ||
      version->get<std::string>() != kVersion) {
    return std::unexpected(invalid_request("jsonrpc must be \"2.0\""));
  }
  auto method = body.find("method");
  if (method == body.end() || !method->is_string()) {
    return std::unexpected(invalid_request("method must be a string"));
  }
  Request req;
  if (auto id = body.find("id"); id != body.end()) {
    if (!valid_id(*id)) {
      return std::unexpected(
          invalid_request("id must be a string, integer or null"));
    }
    req.id = *id;
  }
  req.method = method->get<std::string>();
  if (auto params = body.find("params"); params != body.end()) {
    if (!params->is_object() && !params->is_array() && !params->is_null()) {
      return std::unexpected(
          invalid_request("params must be an object or array"));
    }
    req.params = *params;
  }
  return req;
}

auto parse_response(std::string_view body) -> Result<Response> {
  auto j = json::parse(body, nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    log::warn("jsonrpc: response body is not a JSON object");
    return fail(a2a::Error::ParseError);
  }

  auto version = j.find("jsonrpc");
  if (version == j.end() || !version->is_string() ||
      version->get<std::string>() != kVersion) {
    log::warn("jsonrpc: missing or wrong version in response");
    return fail(a2a::Error::ProtocolError);
  }

  auto result = j.find("result");
  auto error = j.find("error");
  bool has_result = result != j.end();
  bool has_error = error != j.end() && !error->is_null();
  if (has_result == has_error) {
    log::warn("jsonrpc: response must carry exactly one of result/error");
    return fail(a2a::Error::ProtocolError);
  }

  Response resp;
  if (auto id = j.find("id"); id != j.end()) {
    resp.id = *id;
  }
  if (has_error) {
    if (!error->is_object() || !error->contains("code") ||
        !error->contains("message")) {
      return fail(a2a::Error::ProtocolError);
    }
    try {
      resp.error = error->get<Error>();
    } catch (const json::exception& e) {
      log::warn("jsonrpc: malformed error object: {}", e.what());
      return fail(a2a::Error::ProtocolError);
    }
  } else {
    resp.result = *result;
  }
  return resp;
}

}  // namespace a2a::jsonrpc
