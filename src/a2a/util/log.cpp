#include "a2a/util/log.hpp"

#include "a2a/core/lockfree_queue.hpp"

#include <array>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <mutex>
#include <print>
#include <thread>
#include <vector>

namespace a2a::log {

namespace {

constexpr std::array<std::string_view, 6> kLevelNames = {
    "trace", "debug", "info", "warn", "error", "off"};

constexpr std::array<std::string_view, 6> kLevelTags = {
    "\033[90mTRACE\033[0m", "\033[36mDEBUG\033[0m", "\033[32mINFO \033[0m",
    "\033[33mWARN \033[0m", "\033[31mERROR\033[0m", ""};

constexpr std::size_t kQueueCapacity = 4096;
constexpr std::size_t kBatch = 64;
constexpr auto kIdleSleep = std::chrono::microseconds(200);

// One line per record, formatted on the calling thread and printed to stderr
// by a single writer thread started on first use.
class AsyncWriter {
public:
  ~AsyncWriter() {
    shutdown();
  }

  auto set_level(Level level) noexcept -> void {
    level_.store(level, std::memory_order_relaxed);
  }

  [[nodiscard]] auto level() const noexcept -> Level {
    return level_.load(std::memory_order_relaxed);
  }

  auto submit(Level level, std::string_view text) -> void {
    auto line = render(level, text);
    std::call_once(started_, [this] {
      accepting_.store(true, std::memory_order_release);
      writer_ = std::jthread([this](std::stop_token st) { drain_loop(st); });
    });
    if (!accepting_.load(std::memory_order_acquire) ||
        !queue_.push(line)) {
      // Overflow or shutdown: print in place rather than lose the record.
      std::print(stderr, "{}", line);
    }
  }

  auto shutdown() -> void {
    accepting_.store(false, std::memory_order_release);
    if (writer_.joinable()) {
      writer_.request_stop();
      writer_.join();
    }
  }

private:
  static auto render(Level level, std::string_view text) -> std::string {
    auto now = std::chrono::floor<std::chrono::milliseconds>(
        std::chrono::system_clock::now());
    auto tid = std::hash<std::thread::id>{}(std::this_thread::get_id()) % 100000;
    return std::format("{:%F %T} {} [{:05}] {}\n", now,
                       kLevelTags[static_cast<std::size_t>(level)], tid, text);
  }

  auto drain_loop(std::stop_token st) -> void {
    std::vector<std::string> batch;
    batch.reserve(kBatch);
    while (!st.stop_requested()) {
      batch.clear();
      while (batch.size() < kBatch) {
        auto line = queue_.try_pop();
        if (!line) {
          break;
        }
        batch.push_back(std::move(*line));
      }
      for (const auto& line : batch) {
        std::print(stderr, "{}", line);
      }
      if (batch.empty()) {
        std::this_thread::sleep_for(kIdleSleep);
      }
    }
    while (auto line = queue_.try_pop()) {
      std::print(stderr, "{}", *line);
    }
  }

  std::atomic<Level> level_{Level::Info};
  std::atomic<bool> accepting_{false};
  std::once_flag started_;
  BoundedMPSCQueue<std::string> queue_{kQueueCapacity};
  std::jthread writer_;
};

auto writer() -> AsyncWriter& {
  static AsyncWriter instance;
  return instance;
}

}  // namespace

auto level_name(Level level) noexcept -> std::string_view {
  return kLevelNames[static_cast<std::size_t>(level)];
}

auto parse_level(std::string_view name) noexcept -> std::optional<Level> {
  for (std::size_t i = 0; i < kLevelNames.size(); ++i) {
    if (kLevelNames[i] == name) {
      return static_cast<Level>(i);
    }
  }
  if (name == "warning") {
    return Level::Warn;
  }
  return std::nullopt;
}

auto set_level(Level level) noexcept -> void {
  writer().set_level(level);
}

auto set_level(std::string_view name) noexcept -> bool {
  auto parsed = parse_level(name);
  if (!parsed) {
    return false;
  }
  writer().set_level(*parsed);
  return true;
}

auto level() noexcept -> Level {
  return writer().level();
}

auto enabled(Level level) noexcept -> bool {
  return level != Level::Off && level >= writer().level();
}

auto shutdown() -> void {
  writer().shutdown();
}

namespace detail {

auto submit(Level level, std::string text) -> void {
  writer().submit(level, text);
}

}  // namespace detail

}  // namespace a2a::log
