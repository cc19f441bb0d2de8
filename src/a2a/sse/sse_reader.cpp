#include "a2a/sse/sse_reader.hpp"

#include "a2a/util/log.hpp"

#include <array>
#include <charconv>

namespace a2a::sse {

EventReader::EventReader(io::ByteSource& source, std::size_t max_event_size)
    : source_(source), max_event_size_(max_event_size) {
}

auto EventReader::compact() -> void {
  if (pos_ > 0 && pos_ >= buf_.size() / 2) {
    buf_.erase(0, pos_);
    pos_ = 0;
  }
}

auto EventReader::fill() -> Result<bool> {
  std::array<char, 4096> chunk;
  auto n = source_.read(chunk);
  if (!n) {
    return std::unexpected(n.error());
  }
  if (*n == 0) {
    eof_ = true;
    return false;
  }
  compact();
  buf_.append(chunk.data(), *n);
  return true;
}

auto EventReader::next_line() -> std::optional<std::string_view> {
  std::string_view view{buf_};
  auto i = view.find_first_of("\r\n", pos_);
  if (i == std::string_view::npos) {
    return std::nullopt;
  }
  auto line = view.substr(pos_, i - pos_);
  if (view[i] == '\n') {
    pos_ = i + 1;
    return line;
  }
  // CR: swallow a following LF, which may not have arrived yet.
  if (i + 1 < view.size()) {
    pos_ = view[i + 1] == '\n' ? i + 2 : i + 1;
    return line;
  }
  if (eof_) {
    pos_ = i + 1;
    return line;
  }
  return std::nullopt;
}

auto EventReader::apply_field(std::string_view line) -> void {
  if (line.front() == ':') {
    return;
  }
  std::string_view field = line;
  std::string_view value;
  if (auto colon = line.find(':'); colon != std::string_view::npos) {
    field = line.substr(0, colon);
    value = line.substr(colon + 1);
    if (!value.empty() && value.front() == ' ') {
      value.remove_prefix(1);
    }
  }

  if (field == "event") {
    type_.assign(value);
  } else if (field == "data") {
    data_.append(value);
    data_.push_back('\n');
    has_data_ = true;
  } else if (field == "id") {
    if (value.find('\0') == std::string_view::npos) {
      last_id_.assign(value);
    }
  } else if (field == "retry") {
    int ms = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(),
                                     ms);
    if (ec == std::errc{} && ptr == value.data() + value.size()) {
      retry_ = ms;
    }
  } else {
    log::trace("sse: ignoring field '{}'", field);
  }
}

auto EventReader::read_event() -> Result<std::optional<Event>> {
  for (;;) {
    auto line = next_line();
    if (!line) {
      if (eof_) {
        // Partial frame (or partial line) at end of stream is discarded.
        type_.clear();
        data_.clear();
        has_data_ = false;
        return std::optional<Event>{};
      }
      if (buf_.size() - pos_ > max_event_size_ ||
          data_.size() > max_event_size_) {
        log::warn("sse: event exceeds {} bytes", max_event_size_);
        return fail(Error::ProtocolError);
      }
      auto more = fill();
      if (!more) {
        return std::unexpected(more.error());
      }
      continue;
    }

    if (!line->empty()) {
      apply_field(*line);
      if (data_.size() > max_event_size_) {
        log::warn("sse: event exceeds {} bytes", max_event_size_);
        return fail(Error::ProtocolError);
      }
      continue;
    }

    // Blank line: dispatch.
    if (!has_data_) {
      type_.clear();
      continue;
    }
    Event ev;
    if (!type_.empty()) {
      ev.type = std::move(type_);
    }
    data_.pop_back();
    ev.data = std::move(data_);
    ev.id = last_id_;
    ev.retry = retry_;
    type_.clear();
    data_.clear();
    has_data_ = false;
    return std::optional<Event>{std::move(ev)};
  }
}

}  // namespace a2a::sse
