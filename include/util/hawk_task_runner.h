#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

// Runs delayed work for the capture engine (RPC timeouts).
// The CEF adapter posts to the browser UI thread; standalone builds use
// hawk::TimerQueue.
class HawkTaskRunner {
 public:
  virtual ~HawkTaskRunner() = default;

  // Runs |task| once, no earlier than |delay_ms| from now.
  virtual void PostDelayedTask(std::function<void()> task, int64_t delay_ms) = 0;
};

namespace hawk {

// Single worker thread executing tasks in deadline order.
class TimerQueue : public HawkTaskRunner {
 public:
  TimerQueue();
  ~TimerQueue() override;

  TimerQueue(const TimerQueue&) = delete;
  TimerQueue& operator=(const TimerQueue&) = delete;

  void PostDelayedTask(std::function<void()> task, int64_t delay_ms) override;

  // Stops the worker. Tasks that have not fired yet are dropped.
  void Shutdown();

  size_t GetPendingCount() const;
  bool IsShutdown() const { return shutdown_.load(std::memory_order_acquire); }

 private:
  struct Timer {
    std::chrono::steady_clock::time_point deadline;
    uint64_t sequence;  // FIFO among equal deadlines
    std::function<void()> task;

    bool operator>(const Timer& other) const {
      if (deadline != other.deadline) return deadline > other.deadline;
      return sequence > other.sequence;
    }
  };

  void WorkerLoop();

  std::priority_queue<Timer, std::vector<Timer>, std::greater<Timer>> timers_;
  mutable std::mutex queue_mutex_;
  std::condition_variable queue_cv_;
  std::atomic<bool> shutdown_{false};
  uint64_t next_sequence_ = 0;
  std::thread worker_;
};

}  // namespace hawk
