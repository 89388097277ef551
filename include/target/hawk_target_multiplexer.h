#ifndef HAWK_TARGET_MULTIPLEXER_H_
#define HAWK_TARGET_MULTIPLEXER_H_

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "hawk_browser.h"
#include "hawk_capture_store.h"
#include "hawk_hook_registry.h"
#include "hawk_target_rpc_client.h"
#include "hawk_task_runner.h"

// Browser-wide capture through one DevTools connection.
//
// Page events only cover documents, so the multiplexer attaches to every
// sub-target (workers, service workers, extension background pages, pages),
// enables Network on each through HawkTargetRpcClient, and demultiplexes the
// Target.receivedMessageFromTarget envelopes into RPC replies and Network
// events. Matching traffic is stored for the owning capture session.
class HawkTargetMultiplexer : public std::enable_shared_from_this<HawkTargetMultiplexer> {
 public:
  struct TargetInfo {
    std::string target_id;
    std::string type;
    std::string url;
    std::string title;
  };

  HawkTargetMultiplexer(const std::string& session_id,
                        std::shared_ptr<HawkBrowserContext> context,
                        HawkHookRegistry* registry,
                        HawkCaptureStore* store,
                        HawkTaskRunner* task_runner);
  ~HawkTargetMultiplexer();

  HawkTargetMultiplexer(const HawkTargetMultiplexer&) = delete;
  HawkTargetMultiplexer& operator=(const HawkTargetMultiplexer&) = delete;

  // Returns false when the context offers no browser-level connection.
  // Protocol setup failures after that are logged and tolerated.
  bool Start();

  // Idempotent. Later events, replies and timers are ignored.
  void Stop();

  // Target domain events of the parent connection
  void HandleAttachedToTarget(const nlohmann::json& params);
  void HandleDetachedFromTarget(const nlohmann::json& params);
  void HandleReceivedMessageFromTarget(const nlohmann::json& params);

  size_t TargetSessionCount() const;
  // Events from sub-sessions that are not attached are dropped
  bool IsTargetSessionAttached(const std::string& sub_session_id) const;
  size_t PendingResponseCount() const;
  size_t PendingRpcCount() const;
  bool IsStopped() const { return stopped_.load(); }

  // Attribution of a request from its initiator: extension URL -> extension,
  // "other" -> service_worker, "script" -> script, anything else -> page.
  static CaptureSource ClassifyInitiator(const nlohmann::json& initiator);

  // Target types attached from Target.getTargets
  static bool IsAttachableType(const std::string& type);

 private:
  using PendingKey = std::pair<std::string, std::string>;  // (subSessionId, requestId)

  void AttachToTarget(const TargetInfo& info);
  void RegisterTargetSession(const std::string& sub_session_id, const TargetInfo& info);

  void DispatchEvent(const std::string& sub_session_id,
                     const std::string& method,
                     const nlohmann::json& params);
  void OnRequestWillBeSent(const nlohmann::json& params);
  void OnResponseReceived(const std::string& sub_session_id, const nlohmann::json& params);
  void OnLoadingFinished(const std::string& sub_session_id, const nlohmann::json& params);
  void OnLoadingFailed(const std::string& sub_session_id, const nlohmann::json& params);
  void OnWebSocketCreated(const nlohmann::json& params);

  // Stores one response record per hook, with the body when fetched
  void EmitResponses(const std::vector<std::shared_ptr<HawkCaptureHook>>& hooks,
                     const HookResponseInfo& info,
                     const std::string& request_id,
                     const std::string& mime_type,
                     bool body_fetched,
                     const std::string& body,
                     const std::string& body_error);

  static TargetInfo ParseTargetInfo(const nlohmann::json& value);

  const std::string session_id_;
  std::shared_ptr<HawkBrowserContext> context_;
  HawkHookRegistry* registry_;
  HawkCaptureStore* store_;
  HawkTaskRunner* task_runner_;

  // Set once by Start(), never reset
  std::shared_ptr<HawkDebugConnection> connection_;
  std::unique_ptr<HawkTargetRpcClient> rpc_;

  std::atomic<bool> started_{false};
  std::atomic<bool> stopped_{false};

  mutable std::mutex mutex_;
  std::vector<HawkSubscriptionId> subscriptions_;
  std::map<std::string, TargetInfo> target_sessions_;
  std::map<PendingKey, nlohmann::json> pending_responses_;  // responseReceived params
};

#endif  // HAWK_TARGET_MULTIPLEXER_H_
