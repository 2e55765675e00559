// Copyright 2025-2026 ocmap contributors
#ifndef OCMAP_DETAIL_THREAD_SYNC_HPP
#define OCMAP_DETAIL_THREAD_SYNC_HPP

// Should be the first include
#include "global.hpp"  // IWYU pragma: keep

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace ocmap::test {

// One-shot start gate.  Threads block in wait() until some thread
// calls open(); after that wait() returns immediately.
class thread_sync final {
 public:
  thread_sync() = default;

  thread_sync(const thread_sync &) = delete;
  thread_sync(thread_sync &&) = delete;
  thread_sync &operator=(const thread_sync &) = delete;
  thread_sync &operator=(thread_sync &&) = delete;

  ~thread_sync() = default;

  void open() {
    {
      const std::lock_guard lock{sync_mutex};
      is_open = true;
    }
    sync.notify_all();
  }

  void wait() {
    std::unique_lock lock{sync_mutex};
    sync.wait(lock, [this] { return is_open; });
  }

 private:
  std::mutex sync_mutex;
  std::condition_variable sync;
  bool is_open{false};
};

// Run fn(thread_i) on n_threads threads released together through a
// thread_sync, and join them all.
inline void run_together(std::size_t n_threads,
                         const std::function<void(std::size_t)> &fn) {
  thread_sync start;
  std::vector<std::thread> threads;
  threads.reserve(n_threads);
  for (std::size_t i = 0; i < n_threads; ++i) {
    threads.emplace_back([&start, &fn, i] {
      start.wait();
      fn(i);
    });
  }
  start.open();
  for (auto &t : threads) t.join();
}

}  // namespace ocmap::test

#endif  // OCMAP_DETAIL_THREAD_SYNC_HPP
