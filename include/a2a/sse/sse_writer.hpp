#pragma once

#include <string>
#include <string_view>

namespace a2a::sse {

// One frame: "event: <type>\n" followed by a "data: " line per payload line
// and a terminating blank line.
[[nodiscard]] auto format_event(std::string_view type, std::string_view data)
    -> std::string;

// Same as format_event with an "id:" field.
[[nodiscard]] auto format_event(std::string_view type, std::string_view data,
                                std::string_view id) -> std::string;

// "event: close" with {"reason": ...}.
[[nodiscard]] auto format_close(std::string_view reason) -> std::string;

// Comment line, ignored by readers; used as a heartbeat.
[[nodiscard]] auto format_comment(std::string_view text = "keepalive")
    -> std::string;

}  // namespace a2a::sse
