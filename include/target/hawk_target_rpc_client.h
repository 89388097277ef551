#ifndef HAWK_TARGET_RPC_CLIENT_H_
#define HAWK_TARGET_RPC_CLIENT_H_

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>

#include "hawk_browser.h"
#include "hawk_capture_config.h"
#include "hawk_task_runner.h"

struct HawkRpcResult {
  bool success = false;
  bool timed_out = false;
  nlohmann::json result;  // Reply "result" object on success
  std::string error;
};

// Request/response RPC into attached sub-targets.
//
// The parent connection only carries Target.sendMessageToTarget; replies
// come back as Target.receivedMessageFromTarget events which the owner feeds
// to HandleReply(). Entries are keyed by (subSessionId, messageId) and leave
// the table exactly once: on reply, on forward failure, on timeout, or
// silently on PurgeSession()/Shutdown().
class HawkTargetRpcClient {
 public:
  using ReplyCallback = std::function<void(const HawkRpcResult&)>;

  HawkTargetRpcClient(std::shared_ptr<HawkDebugConnection> connection,
                      HawkTaskRunner* task_runner,
                      int64_t timeout_ms = kTargetRpcTimeoutMs);
  ~HawkTargetRpcClient();

  HawkTargetRpcClient(const HawkTargetRpcClient&) = delete;
  HawkTargetRpcClient& operator=(const HawkTargetRpcClient&) = delete;

  // |callback| runs at most once and never under the client's lock. After
  // Shutdown() it runs immediately with an error.
  void Send(const std::string& sub_session_id,
            const std::string& method,
            const nlohmann::json& params,
            ReplyCallback callback);

  // Resolves the entry matching payload["id"]. Returns false when there is
  // no such entry (late, purged or foreign reply).
  bool HandleReply(const std::string& sub_session_id, const nlohmann::json& payload);

  // Drops all entries of a detached sub-target without running callbacks.
  size_t PurgeSession(const std::string& sub_session_id);

  void Shutdown();

  size_t PendingCount() const;

 private:
  using PendingKey = std::pair<std::string, int64_t>;

  // Shared with timer tasks, which only hold a weak reference
  struct State {
    std::mutex mutex;
    std::map<PendingKey, ReplyCallback> pending;
    int64_t next_message_id = 0;
    bool shut_down = false;
  };

  // Removes |key| and returns its callback, or an empty function
  static ReplyCallback TakePending(State* state, const PendingKey& key);

  std::shared_ptr<HawkDebugConnection> connection_;
  HawkTaskRunner* task_runner_;
  const int64_t timeout_ms_;
  std::shared_ptr<State> state_;
};

#endif  // HAWK_TARGET_RPC_CLIENT_H_
