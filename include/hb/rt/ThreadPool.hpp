// File: include/hb/rt/ThreadPool.hpp
#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace hb::rt {

// Runs host-facing work (command dispatch, deferred host actions) off the
// event-loop thread. One worker keeps calls into the host serialized.
class ThreadPool {
public:
  explicit ThreadPool(unsigned nThreads = 1);
  ~ThreadPool();

  ThreadPool(const ThreadPool&)            = delete;
  ThreadPool& operator=(const ThreadPool&) = delete;
  ThreadPool(ThreadPool&&)                 = delete;
  ThreadPool& operator=(ThreadPool&&)      = delete;

  // Enqueue work; silently dropped after shutdown().
  void post(std::function<void()> fn);

  // Waits until the queue is empty and no task is running.
  void drain();

  // Runs everything already queued, then joins the workers. Idempotent.
  void shutdown();

  std::size_t size() const noexcept { return threads_.size(); }

private:
  void workerLoop();

private:
  std::vector<std::thread>          threads_;
  std::mutex                        mx_;
  std::condition_variable           cv_;
  std::condition_variable           idleCv_;
  std::queue<std::function<void()>> q_;
  std::size_t                       busy_{0};
  std::atomic<bool>                 stopping_{false};
};

} // namespace hb::rt
