#include "a2a/task/subscriber_set.hpp"

#include "a2a/util/log.hpp"

#include <algorithm>

namespace a2a {

auto SubscriberSet::add(EventChannel channel, CancellationToken token)
    -> void {
  // Subscribers that went away while the task was quiet.
  std::erase_if(subscribers_, [](const Subscriber& sub) {
    if (sub.token.is_cancelled()) {
      sub.channel->close();
      return true;
    }
    return false;
  });
  subscribers_.push_back(Subscriber{std::move(channel), std::move(token)});
}

auto SubscriberSet::broadcast(const TaskEvent& event) -> std::size_t {
  const bool last = is_final_event(event);
  std::size_t delivered = 0;

  std::erase_if(subscribers_, [&](const Subscriber& sub) {
    if (sub.token.is_cancelled()) {
      sub.channel->close();
      return true;
    }
    if (last) {
      if (sub.channel->close_with(event) == ChannelStatus::Ok) {
        ++delivered;
      }
      return true;
    }
    switch (sub.channel->try_send(event)) {
      case ChannelStatus::Ok:
        ++delivered;
        return false;
      case ChannelStatus::Full:
        log::warn("task {}: subscriber buffer full ({}), dropping event",
                  task_id_, sub.channel->capacity());
        return false;
      case ChannelStatus::Closed:
      case ChannelStatus::Cancelled:
        return true;
    }
    return false;
  });

  return delivered;
}

auto SubscriberSet::close_all() -> void {
  for (auto& sub : subscribers_) {
    sub.channel->close();
  }
  subscribers_.clear();
}

}  // namespace a2a
