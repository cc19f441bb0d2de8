#pragma once

#include "a2a/core/error.hpp"
#include "a2a/io/stream.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace a2a::sse {

struct Event {
  std::string type{"message"};
  std::string data;
  std::string id;
  std::optional<int> retry;
};

// Incremental SSE frame decoder over a ByteSource. Accepts LF, CRLF and CR
// line endings and any chunking of the input.
class EventReader {
public:
  static constexpr std::size_t kDefaultMaxEventSize = 4 * 1024 * 1024;

  explicit EventReader(io::ByteSource& source,
                       std::size_t max_event_size = kDefaultMaxEventSize);

  // nullopt at end of stream; a frame cut off by end of stream is dropped.
  // Frames without data lines (comments, bare fields) are skipped.
  [[nodiscard]] auto read_event() -> Result<std::optional<Event>>;

  // Last id seen, carried across frames.
  [[nodiscard]] auto last_event_id() const noexcept -> const std::string& {
    return last_id_;
  }

private:
  // nullopt when more input is needed.
  auto next_line() -> std::optional<std::string_view>;
  auto fill() -> Result<bool>;
  auto compact() -> void;
  auto apply_field(std::string_view line) -> void;

  io::ByteSource& source_;
  std::size_t max_event_size_;
  std::string buf_;
  std::size_t pos_{0};
  bool eof_{false};

  std::string type_;
  std::string data_;
  bool has_data_{false};
  std::string last_id_;
  std::optional<int> retry_;
};

}  // namespace a2a::sse
