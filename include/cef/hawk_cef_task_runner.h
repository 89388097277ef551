#ifndef HAWK_CEF_TASK_RUNNER_H_
#define HAWK_CEF_TASK_RUNNER_H_

#include <functional>
#include <utility>

#include "include/cef_task.h"

#include "hawk_task_runner.h"

// Wraps a std::function so it can be posted to a CEF thread
class HawkClosureTask : public CefTask {
 public:
  explicit HawkClosureTask(std::function<void()> closure) : closure_(std::move(closure)) {}

  void Execute() override {
    if (closure_) closure_();
  }

 private:
  std::function<void()> closure_;

  IMPLEMENT_REFCOUNTING(HawkClosureTask);
  DISALLOW_COPY_AND_ASSIGN(HawkClosureTask);
};

// Runs capture timers on the browser UI thread
class HawkCefTaskRunner : public HawkTaskRunner {
 public:
  explicit HawkCefTaskRunner(CefThreadId thread_id = TID_UI) : thread_id_(thread_id) {}

  void PostDelayedTask(std::function<void()> task, int64_t delay_ms) override;

 private:
  CefThreadId thread_id_;
};

#endif  // HAWK_CEF_TASK_RUNNER_H_
