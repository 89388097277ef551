#include "hawk_capture_engine.h"
#include "hawk_hook_loader.h"
#include "logger.h"

#include <algorithm>

using json = nlohmann::json;

const char* SessionStateToString(SessionState state) {
  switch (state) {
    case SessionState::UNINITIALIZED: return "uninitialized";
    case SessionState::MONITORING: return "monitoring";
    case SessionState::STOPPED: return "stopped";
    default: return "unknown";
  }
}

const char* StartResultToString(StartResult result) {
  switch (result) {
    case StartResult::STARTED: return "started";
    case StartResult::NO_HOOKS: return "no_hooks";
    case StartResult::SESSION_EXISTS: return "session_exists";
    case StartResult::INVALID_ARGUMENT: return "invalid_argument";
    default: return "unknown";
  }
}

json CaptureStatus::ToJson() const {
  json hooks_json = json::array();
  for (const auto& hook : hooks) {
    hooks_json.push_back({{"name", hook.name},
                          {"description", hook.description},
                          {"enabled", hook.enabled},
                          {"patterns", hook.patterns}});
  }

  json session_stats = json::array();
  for (const auto& entry : session_counts) {
    session_stats.push_back({{"sessionId", entry.first}, {"capturedCount", entry.second}});
  }

  return {{"totalHooks", total_hooks},
          {"totalPatterns", total_patterns},
          {"activeSessions", active_sessions},
          {"totalCaptured", total_captured},
          {"outputFormat", output_format},
          {"outputDirectory", output_directory},
          {"hooks", hooks_json},
          {"sessionStats", session_stats}};
}

HawkCaptureEngine::HawkCaptureEngine(const HawkCaptureConfig& config,
                                     HawkTaskRunner* task_runner)
    : config_(config),
      task_runner_(task_runner),
      store_(config) {
  LOG_INFO("CaptureEngine", "Capture engine ready (output: " + config_.output_format +
           " -> " + config_.output_directory + ")");
}

HawkCaptureEngine::~HawkCaptureEngine() {
  CleanupAll();
}

size_t HawkCaptureEngine::LoadHooks(const std::string& directory) {
  return HawkHookLoader::LoadHooks(directory, &registry_);
}

size_t HawkCaptureEngine::ReloadHooks(const std::string& directory) {
  registry_.Clear();
  return LoadHooks(directory);
}

bool HawkCaptureEngine::RegisterHook(std::shared_ptr<HawkCaptureHook> hook) {
  return registry_.RegisterHook(std::move(hook));
}

StartResult HawkCaptureEngine::StartMonitoring(const std::string& session_id,
                                               std::shared_ptr<HawkBrowserContext> context,
                                               const SessionMetadata& metadata) {
  if (session_id.empty() || !context) {
    LOG_ERROR("CaptureEngine", "StartMonitoring needs a session id and a browser context");
    return StartResult::INVALID_ARGUMENT;
  }

  if (registry_.PatternCount() == 0) {
    LOG_WARN("CaptureEngine", "No capture hooks loaded, skipping monitoring for session: " +
             session_id);
    return StartResult::NO_HOOKS;
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it != sessions_.end() || retired_session_ids_.count(session_id)) {
      SessionState state = it != sessions_.end() ? it->second.state : SessionState::STOPPED;
      LOG_WARN("CaptureEngine", "Session " + session_id + " is already " +
               SessionStateToString(state));
      return StartResult::SESSION_EXISTS;
    }
    sessions_[session_id].state = SessionState::MONITORING;
  }

  if (!metadata.profile_name.empty()) {
    store_.SetProfileAlias(session_id, metadata.profile_name);
  }

  LOG_INFO("CaptureEngine", "Starting request capture for session " + session_id + ", " +
           std::to_string(registry_.PatternCount()) + " URL patterns");
  if (config_.StreamsJsonl()) {
    LOG_INFO("CaptureEngine", "Per-hook files: " + store_.GetProfileAlias(session_id) +
             "-<hook>-" + session_id + ".jsonl");
  }

  auto page_monitor = std::make_shared<HawkPageMonitor>(session_id, context, &registry_, &store_);
  page_monitor->Attach();

  auto multiplexer = std::make_shared<HawkTargetMultiplexer>(session_id, context, &registry_,
                                                             &store_, task_runner_);
  if (!multiplexer->Start()) {
    LOG_WARN("CaptureEngine", "Target monitoring unavailable, capturing page traffic only for " +
             session_id);
    multiplexer.reset();
  }

  bool stopped_meanwhile = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it != sessions_.end() && it->second.state == SessionState::MONITORING) {
      it->second.page_monitor = page_monitor;
      it->second.multiplexer = multiplexer;
    } else {
      stopped_meanwhile = true;
    }
  }

  // StopMonitoring() or Cleanup() ran during setup and found nothing to release
  if (stopped_meanwhile) {
    page_monitor->Detach();
    if (multiplexer) multiplexer->Stop();
  }

  return StartResult::STARTED;
}

bool HawkCaptureEngine::StopMonitoring(const std::string& session_id) {
  std::shared_ptr<HawkPageMonitor> page_monitor;
  std::shared_ptr<HawkTargetMultiplexer> multiplexer;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end() || it->second.state != SessionState::MONITORING) {
      return false;
    }
    it->second.state = SessionState::STOPPED;
    page_monitor.swap(it->second.page_monitor);
    multiplexer.swap(it->second.multiplexer);
  }

  if (page_monitor) page_monitor->Detach();
  if (multiplexer) multiplexer->Stop();

  LOG_INFO("CaptureEngine", "Stopped monitoring for session " + session_id);
  return true;
}

void HawkCaptureEngine::Cleanup(const std::string& session_id) {
  StopMonitoring(session_id);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (sessions_.erase(session_id) > 0) {
      retired_session_ids_.insert(session_id);
    }
  }
  store_.DropSession(session_id);
  store_.DropProfileAlias(session_id);
  LOG_DEBUG("CaptureEngine", "Cleaned up session " + session_id);
}

void HawkCaptureEngine::CleanupAll() {
  std::vector<std::string> session_ids;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& entry : sessions_) {
      session_ids.push_back(entry.first);
    }
  }
  for (const auto& entry : store_.SessionCounts()) {
    if (std::find(session_ids.begin(), session_ids.end(), entry.first) == session_ids.end()) {
      session_ids.push_back(entry.first);
    }
  }

  for (const auto& session_id : session_ids) {
    Cleanup(session_id);
  }
}

SessionState HawkCaptureEngine::GetSessionState(const std::string& session_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sessions_.find(session_id);
  if (it != sessions_.end()) return it->second.state;
  return retired_session_ids_.count(session_id) ? SessionState::STOPPED
                                                : SessionState::UNINITIALIZED;
}

size_t HawkCaptureEngine::TrackedSessionCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sessions_.size();
}

CaptureStatus HawkCaptureEngine::GetStatus() const {
  CaptureStatus status;
  status.total_hooks = registry_.HookCount();
  status.total_patterns = registry_.PatternCount();
  status.hooks = registry_.Describe();
  status.total_captured = store_.TotalCaptured();
  status.session_counts = store_.SessionCounts();
  status.output_format = config_.output_format;
  status.output_directory = config_.output_directory;

  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& entry : sessions_) {
    if (entry.second.state == SessionState::MONITORING) {
      status.active_sessions++;
    }
  }
  return status;
}

ExportResult HawkCaptureEngine::Export(const std::string& session_id,
                                       const std::string& format,
                                       const std::string& output_path) const {
  return store_.Export(session_id, format, output_path);
}

std::vector<CaptureRecord> HawkCaptureEngine::Get(const std::string& session_id) const {
  return store_.Get(session_id);
}

std::shared_ptr<HawkTargetMultiplexer> HawkCaptureEngine::GetMultiplexer(
    const std::string& session_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sessions_.find(session_id);
  return it != sessions_.end() ? it->second.multiplexer : nullptr;
}
