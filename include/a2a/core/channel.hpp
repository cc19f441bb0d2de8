#pragma once

#include "a2a/core/cancellation.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>

namespace a2a {

enum class ChannelStatus : std::uint8_t {
  Ok,
  Full,
  Closed,
  Cancelled,
};

// Bounded multi-producer multi-consumer queue with close semantics.
// Items queued before close() stay receivable until drained.
template <typename T>
class Channel {
public:
  explicit Channel(std::size_t capacity)
      : capacity_(capacity == 0 ? 1 : capacity) {
  }

  Channel(const Channel&) = delete;
  Channel& operator=(const Channel&) = delete;

  [[nodiscard]] auto try_send(T value) -> ChannelStatus {
    std::lock_guard lock(mu_);
    if (closed_)
      return ChannelStatus::Closed;
    if (items_.size() >= capacity_)
      return ChannelStatus::Full;
    items_.push_back(std::move(value));
    not_empty_.notify_one();
    return ChannelStatus::Ok;
  }

  // Blocks while full; returns Cancelled if the token fires first.
  [[nodiscard]] auto send(T value, const CancellationToken& token = {})
      -> ChannelStatus {
    std::unique_lock lock(mu_);
    std::stop_token st = token.stop_token();
    bool ready = not_full_.wait(lock, st, [this] {
      return closed_ || items_.size() < capacity_;
    });
    if (!ready)
      return ChannelStatus::Cancelled;
    if (closed_)
      return ChannelStatus::Closed;
    items_.push_back(std::move(value));
    not_empty_.notify_one();
    return ChannelStatus::Ok;
  }

  // Enqueues a last item regardless of capacity, then closes.
  auto close_with(T value) -> ChannelStatus {
    std::lock_guard lock(mu_);
    if (closed_)
      return ChannelStatus::Closed;
    items_.push_back(std::move(value));
    closed_ = true;
    not_empty_.notify_all();
    not_full_.notify_all();
    return ChannelStatus::Ok;
  }

  // Returns false if the channel was already closed.
  auto close() -> bool {
    std::lock_guard lock(mu_);
    if (closed_)
      return false;
    closed_ = true;
    not_empty_.notify_all();
    not_full_.notify_all();
    return true;
  }

  // nullopt once the channel is closed and drained, or when cancelled with
  // nothing queued.
  [[nodiscard]] auto receive(const CancellationToken& token = {})
      -> std::optional<T> {
    std::unique_lock lock(mu_);
    std::stop_token st = token.stop_token();
    not_empty_.wait(lock, st, [this] { return closed_ || !items_.empty(); });
    return pop_locked();
  }

  template <typename Rep, typename Period>
  [[nodiscard]] auto receive_for(std::chrono::duration<Rep, Period> timeout,
                                 const CancellationToken& token = {})
      -> std::optional<T> {
    std::unique_lock lock(mu_);
    std::stop_token st = token.stop_token();
    not_empty_.wait_for(lock, st, timeout,
                        [this] { return closed_ || !items_.empty(); });
    return pop_locked();
  }

  [[nodiscard]] auto try_receive() -> std::optional<T> {
    std::lock_guard lock(mu_);
    return pop_locked();
  }

  [[nodiscard]] auto is_closed() const -> bool {
    std::lock_guard lock(mu_);
    return closed_;
  }

  // Closed and nothing left to receive.
  [[nodiscard]] auto is_drained() const -> bool {
    std::lock_guard lock(mu_);
    return closed_ && items_.empty();
  }

  [[nodiscard]] auto size() const -> std::size_t {
    std::lock_guard lock(mu_);
    return items_.size();
  }

  [[nodiscard]] auto capacity() const noexcept -> std::size_t {
    return capacity_;
  }

private:
  auto pop_locked() -> std::optional<T> {
    if (items_.empty())
      return std::nullopt;
    T value = std::move(items_.front());
    items_.pop_front();
    not_full_.notify_one();
    return value;
  }

  std::size_t capacity_;
  mutable std::mutex mu_;
  std::condition_variable_any not_empty_;
  std::condition_variable_any not_full_;
  std::deque<T> items_;
  bool closed_{false};
};

template <typename T>
using ChannelPtr = std::shared_ptr<Channel<T>>;

template <typename T>
[[nodiscard]] auto make_channel(std::size_t capacity) -> ChannelPtr<T> {
  return std::make_shared<Channel<T>>(capacity);
}

}  // namespace a2a
