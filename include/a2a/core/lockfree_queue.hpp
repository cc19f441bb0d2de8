#pragma once

#include <algorithm>
#include <atomic>
#include <bit>
#include <cstddef>
#include <cstdint>
#include <new>
#include <optional>
#include <vector>

namespace a2a {

#ifdef __cpp_lib_hardware_interference_size
inline constexpr std::size_t kCacheLineSize =
    std::hardware_destructive_interference_size;
#else
inline constexpr std::size_t kCacheLineSize = 64;
#endif

// Fixed-size ring shared by many producers and drained by one consumer.
// Each cell carries a sequence number: a producer may fill cell i when its
// sequence equals the ticket it claimed, the consumer may empty it once the
// sequence is ticket + 1. push() fails instead of waiting when the ring is
// full. Capacity is rounded up to a power of two.
template <typename T>
class BoundedMPSCQueue {
public:
  explicit BoundedMPSCQueue(std::size_t capacity)
      : cells_(std::bit_ceil(std::max<std::size_t>(capacity, 2))),
        mask_(cells_.size() - 1) {
    for (std::size_t i = 0; i < cells_.size(); ++i) {
      cells_[i].seq.store(i, std::memory_order_relaxed);
    }
  }

  BoundedMPSCQueue(const BoundedMPSCQueue&) = delete;
  BoundedMPSCQueue& operator=(const BoundedMPSCQueue&) = delete;

  [[nodiscard]] auto push(T value) -> bool {
    std::uint64_t ticket = enqueue_.load(std::memory_order_relaxed);
    Cell* cell = nullptr;
    for (;;) {
      cell = &cells_[ticket & mask_];
      auto seq = cell->seq.load(std::memory_order_acquire);
      if (seq == ticket) {
        if (enqueue_.compare_exchange_weak(ticket, ticket + 1,
                                           std::memory_order_relaxed)) {
          break;
        }
      } else if (seq < ticket) {
        return false;  // full: the consumer has not freed this cell yet
      } else {
        ticket = enqueue_.load(std::memory_order_relaxed);
      }
    }
    cell->value.emplace(std::move(value));
    cell->seq.store(ticket + 1, std::memory_order_release);
    return true;
  }

  // Consumer side only.
  [[nodiscard]] auto try_pop() -> std::optional<T> {
    auto ticket = dequeue_.load(std::memory_order_relaxed);
    auto& cell = cells_[ticket & mask_];
    if (cell.seq.load(std::memory_order_acquire) != ticket + 1) {
      return std::nullopt;
    }
    std::optional<T> out = std::move(cell.value);
    cell.value.reset();
    cell.seq.store(ticket + cells_.size(), std::memory_order_release);
    dequeue_.store(ticket + 1, std::memory_order_relaxed);
    return out;
  }

  [[nodiscard]] auto empty() const noexcept -> bool {
    return enqueue_.load(std::memory_order_acquire) ==
           dequeue_.load(std::memory_order_acquire);
  }

  [[nodiscard]] auto capacity() const noexcept -> std::size_t {
    return cells_.size();
  }

private:
  struct Cell {
    std::atomic<std::uint64_t> seq{0};
    std::optional<T> value;
  };

  std::vector<Cell> cells_;
  std::size_t mask_;
  alignas(kCacheLineSize) std::atomic<std::uint64_t> enqueue_{0};
  alignas(kCacheLineSize) std::atomic<std::uint64_t> dequeue_{0};
};

}  // namespace a2a
