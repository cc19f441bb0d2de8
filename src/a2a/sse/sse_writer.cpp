#include "a2a/sse/sse_writer.hpp"

#include "a2a/protocol/methods.hpp"

#include <nlohmann/json.hpp>

namespace a2a::sse {

namespace {

void append_data(std::string& out, std::string_view data) {
  // An empty payload still needs one data line to dispatch.
  std::size_t start = 0;
  for (;;) {
    auto nl = data.find('\n', start);
    auto line = data.substr(start, nl == std::string_view::npos
                                       ? std::string_view::npos
                                       : nl - start);
    if (!line.empty() && line.back() == '\r') {
      line.remove_suffix(1);
    }
    out += "data: ";
    out += line;
    out += '\n';
    if (nl == std::string_view::npos) {
      break;
    }
    start = nl + 1;
  }
}

}  // namespace

auto format_event(std::string_view type, std::string_view data)
    -> std::string {
  std::string out;
  out.reserve(type.size() + data.size() + 16);
  out += "event: ";
  out += type;
  out += '\n';
  append_data(out, data);
  out += '\n';
  return out;
}

auto format_event(std::string_view type, std::string_view data,
                  std::string_view id) -> std::string {
  std::string out;
  out.reserve(type.size() + data.size() + id.size() + 24);
  out += "id: ";
  out += id;
  out += '\n';
  out += "event: ";
  out += type;
  out += '\n';
  append_data(out, data);
  out += '\n';
  return out;
}

auto format_close(std::string_view reason) -> std::string {
  nlohmann::json payload = {{"reason", std::string(reason)}};
  return format_event(events::kClose, payload.dump());
}

auto format_comment(std::string_view text) -> std::string {
  std::string out;
  out += ": ";
  out += text;
  out += "\n\n";
  return out;
}

}  // namespace a2a::sse
