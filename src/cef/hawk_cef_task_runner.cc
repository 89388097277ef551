#include "hawk_cef_task_runner.h"
#include "logger.h"

void HawkCefTaskRunner::PostDelayedTask(std::function<void()> task, int64_t delay_ms) {
  if (!CefPostDelayedTask(thread_id_, new HawkClosureTask(std::move(task)), delay_ms)) {
    LOG_WARN("CaptureEngine", "Failed to post delayed task (" + std::to_string(delay_ms) + "ms)");
  }
}
