#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <stop_token>
#include <thread>

namespace a2a {

// Owns a dynamic set of threads. Finished threads are joined lazily on the
// next spawn(); stop() requests stop on all of them and joins.
class WorkerGroup {
public:
  using Work = std::function<void(std::stop_token)>;

  WorkerGroup() = default;
  ~WorkerGroup() {
    stop();
  }

  WorkerGroup(const WorkerGroup&) = delete;
  WorkerGroup& operator=(const WorkerGroup&) = delete;

  // Returns false once stop() has been called.
  auto spawn(Work work) -> bool {
    std::lock_guard lock(mu_);
    if (stopped_)
      return false;
    reap_locked();

    auto done = std::make_shared<std::atomic<bool>>(false);
    workers_.push_back(Worker{
        std::jthread([work = std::move(work), done](std::stop_token st) {
          work(st);
          done->store(true, std::memory_order_release);
        }),
        done});
    return true;
  }

  auto stop() -> void {
    std::list<Worker> workers;
    {
      std::lock_guard lock(mu_);
      stopped_ = true;
      workers.swap(workers_);
    }
    for (auto& w : workers) {
      w.thread.request_stop();
    }
    for (auto& w : workers) {
      if (w.thread.joinable() &&
          w.thread.get_id() != std::this_thread::get_id()) {
        w.thread.join();
      } else if (w.thread.joinable()) {
        w.thread.detach();
      }
    }
  }

  [[nodiscard]] auto active() const -> std::size_t {
    std::lock_guard lock(mu_);
    std::size_t n = 0;
    for (const auto& w : workers_) {
      if (!w.done->load(std::memory_order_acquire))
        ++n;
    }
    return n;
  }

private:
  struct Worker {
    std::jthread thread;
    std::shared_ptr<std::atomic<bool>> done;
  };

  auto reap_locked() -> void {
    for (auto it = workers_.begin(); it != workers_.end();) {
      if (it->done->load(std::memory_order_acquire)) {
        it->thread.join();
        it = workers_.erase(it);
      } else {
        ++it;
      }
    }
  }

  mutable std::mutex mu_;
  std::list<Worker> workers_;
  bool stopped_{false};
};

}  // namespace a2a
