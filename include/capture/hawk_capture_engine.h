/**
 * Hawk Capture - Capture Engine
 *
 * Owns the hook registry and the capture store, and runs one capture session
 * per browser context: a HawkPageMonitor for page-level traffic plus, when
 * the context exposes a browser-level DevTools session, a
 * HawkTargetMultiplexer for workers, service workers and extension pages.
 *
 * Session states only move forward:
 *   UNINITIALIZED -> MONITORING -> STOPPED
 * A session id cannot be started twice. Cleanup() releases the session's
 * monitors, buffer and alias and keeps only its id, so a long-lived engine
 * grows by one string per retired session.
 */

#ifndef HAWK_CAPTURE_ENGINE_H_
#define HAWK_CAPTURE_ENGINE_H_

#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "hawk_browser.h"
#include "hawk_capture_config.h"
#include "hawk_capture_store.h"
#include "hawk_hook_registry.h"
#include "hawk_page_monitor.h"
#include "hawk_target_multiplexer.h"
#include "hawk_task_runner.h"

enum class SessionState {
  UNINITIALIZED,
  MONITORING,
  STOPPED
};

const char* SessionStateToString(SessionState state);

enum class StartResult {
  STARTED,
  NO_HOOKS,           // Nothing to match; session left untouched
  SESSION_EXISTS,     // Id already started (states are one-way)
  INVALID_ARGUMENT
};

const char* StartResultToString(StartResult result);

struct SessionMetadata {
  std::string profile_name;  // Names the session's files; "unknown" when empty
};

struct CaptureStatus {
  size_t total_hooks = 0;
  size_t total_patterns = 0;
  std::vector<HookDescription> hooks;
  size_t active_sessions = 0;
  size_t total_captured = 0;
  std::map<std::string, size_t> session_counts;
  std::string output_format;
  std::string output_directory;

  nlohmann::json ToJson() const;
};

class HawkCaptureEngine {
 public:
  // |task_runner| must outlive the engine.
  HawkCaptureEngine(const HawkCaptureConfig& config, HawkTaskRunner* task_runner);
  ~HawkCaptureEngine();

  HawkCaptureEngine(const HawkCaptureEngine&) = delete;
  HawkCaptureEngine& operator=(const HawkCaptureEngine&) = delete;

  // Hook management
  size_t LoadHooks(const std::string& directory);
  size_t ReloadHooks(const std::string& directory);  // Clears first
  bool RegisterHook(std::shared_ptr<HawkCaptureHook> hook);

  // Session lifecycle
  StartResult StartMonitoring(const std::string& session_id,
                              std::shared_ptr<HawkBrowserContext> context,
                              const SessionMetadata& metadata);
  // Returns false when the session was not monitoring
  bool StopMonitoring(const std::string& session_id);
  // Stop, then drop the session, its buffer and profile alias. The id stays
  // used and reports STOPPED.
  void Cleanup(const std::string& session_id);
  void CleanupAll();

  SessionState GetSessionState(const std::string& session_id) const;
  size_t TrackedSessionCount() const;  // Started and not yet cleaned up
  CaptureStatus GetStatus() const;

  ExportResult Export(const std::string& session_id,
                      const std::string& format,
                      const std::string& output_path = "") const;
  std::vector<CaptureRecord> Get(const std::string& session_id) const;

  // Null when the session has no running multiplexer
  std::shared_ptr<HawkTargetMultiplexer> GetMultiplexer(const std::string& session_id) const;

  HawkHookRegistry* registry() { return &registry_; }
  HawkCaptureStore* store() { return &store_; }
  const HawkCaptureConfig& config() const { return config_; }

 private:
  struct Session {
    SessionState state = SessionState::UNINITIALIZED;
    std::shared_ptr<HawkPageMonitor> page_monitor;
    std::shared_ptr<HawkTargetMultiplexer> multiplexer;
  };

  const HawkCaptureConfig config_;
  HawkTaskRunner* task_runner_;

  HawkHookRegistry registry_;
  HawkCaptureStore store_;

  mutable std::mutex mutex_;
  std::map<std::string, Session> sessions_;
  std::set<std::string> retired_session_ids_;  // Cleaned up; never restarted
};

#endif  // HAWK_CAPTURE_ENGINE_H_
