#include "hawk_task_runner.h"
#include "logger.h"

#include <exception>

namespace hawk {

TimerQueue::TimerQueue() {
  worker_ = std::thread(&TimerQueue::WorkerLoop, this);
}

TimerQueue::~TimerQueue() {
  Shutdown();
}

void TimerQueue::Shutdown() {
  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    if (shutdown_.load(std::memory_order_acquire)) {
      return;
    }
    shutdown_.store(true, std::memory_order_release);
    // Drop unfired timers; their owners treat a missing timeout as a no-op
    while (!timers_.empty()) {
      timers_.pop();
    }
  }

  queue_cv_.notify_all();

  if (worker_.joinable()) {
    worker_.join();
  }
}

void TimerQueue::PostDelayedTask(std::function<void()> task, int64_t delay_ms) {
  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    if (shutdown_.load(std::memory_order_acquire)) {
      return;
    }

    Timer timer;
    timer.deadline = std::chrono::steady_clock::now() +
                     std::chrono::milliseconds(delay_ms < 0 ? 0 : delay_ms);
    timer.sequence = next_sequence_++;
    timer.task = std::move(task);
    timers_.push(std::move(timer));
  }

  queue_cv_.notify_one();
}

size_t TimerQueue::GetPendingCount() const {
  std::lock_guard<std::mutex> lock(queue_mutex_);
  return timers_.size();
}

void TimerQueue::WorkerLoop() {
  while (true) {
    std::function<void()> task;

    {
      std::unique_lock<std::mutex> lock(queue_mutex_);

      queue_cv_.wait(lock, [this] {
        return shutdown_.load(std::memory_order_acquire) || !timers_.empty();
      });

      if (shutdown_.load(std::memory_order_acquire)) {
        return;
      }

      auto deadline = timers_.top().deadline;
      if (std::chrono::steady_clock::now() < deadline) {
        // Woken early by a new timer, a spurious wakeup, or shutdown
        queue_cv_.wait_until(lock, deadline);
        continue;
      }

      // priority_queue::top() is const; the task is moved out via a copy of the node
      Timer timer = timers_.top();
      timers_.pop();
      task = std::move(timer.task);
    }

    try {
      task();
    } catch (const std::exception& e) {
      LOG_ERROR("TimerQueue", std::string("Timer task threw: ") + e.what());
    }
  }
}

}  // namespace hawk
