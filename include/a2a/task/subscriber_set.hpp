#pragma once

#include "a2a/core/cancellation.hpp"
#include "a2a/core/channel.hpp"
#include "a2a/protocol/types.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace a2a {

using EventChannel = ChannelPtr<TaskEvent>;

// Live subscribers of one task. Not synchronized; the owner serializes
// access. broadcast() never blocks.
class SubscriberSet {
public:
  explicit SubscriberSet(std::string task_id) : task_id_(std::move(task_id)) {
  }

  auto add(EventChannel channel, CancellationToken token) -> void;

  // Drops cancelled or consumer-closed subscribers and skips full ones. A
  // final status event is always enqueued, then every channel is closed and
  // the set emptied. Returns the number of channels that received the event.
  auto broadcast(const TaskEvent& event) -> std::size_t;

  auto close_all() -> void;

  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return subscribers_.size();
  }
  [[nodiscard]] auto empty() const noexcept -> bool {
    return subscribers_.empty();
  }

private:
  struct Subscriber {
    EventChannel channel;
    CancellationToken token;
  };

  std::string task_id_;
  std::vector<Subscriber> subscribers_;
};

}  // namespace a2a
