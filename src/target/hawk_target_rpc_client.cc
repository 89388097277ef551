#include "hawk_target_rpc_client.h"
#include "logger.h"

using json = nlohmann::json;

HawkTargetRpcClient::HawkTargetRpcClient(std::shared_ptr<HawkDebugConnection> connection,
                                         HawkTaskRunner* task_runner,
                                         int64_t timeout_ms)
    : connection_(std::move(connection)),
      task_runner_(task_runner),
      timeout_ms_(timeout_ms),
      state_(std::make_shared<State>()) {}

HawkTargetRpcClient::~HawkTargetRpcClient() {
  Shutdown();
}

HawkTargetRpcClient::ReplyCallback HawkTargetRpcClient::TakePending(State* state,
                                                                    const PendingKey& key) {
  std::lock_guard<std::mutex> lock(state->mutex);
  auto it = state->pending.find(key);
  if (it == state->pending.end()) {
    return ReplyCallback();
  }
  ReplyCallback callback = std::move(it->second);
  state->pending.erase(it);
  return callback;
}

void HawkTargetRpcClient::Send(const std::string& sub_session_id,
                               const std::string& method,
                               const json& params,
                               ReplyCallback callback) {
  PendingKey key;
  {
    std::lock_guard<std::mutex> lock(state_->mutex);
    if (!state_->shut_down) {
      key = PendingKey(sub_session_id, ++state_->next_message_id);
      state_->pending[key] = std::move(callback);
    }
  }

  if (key.second == 0) {
    HawkRpcResult failed;
    failed.error = "RPC client is shut down";
    if (callback) callback(failed);
    return;
  }

  std::weak_ptr<State> weak_state = state_;
  const int64_t timeout_ms = timeout_ms_;

  task_runner_->PostDelayedTask(
      [weak_state, key, method, timeout_ms]() {
        auto state = weak_state.lock();
        if (!state) return;
        ReplyCallback expired = TakePending(state.get(), key);
        if (!expired) return;
        LOG_WARN("TargetRpc", method + " timed out after " + std::to_string(timeout_ms) +
                 "ms on session " + key.first);
        HawkRpcResult result;
        result.timed_out = true;
        result.error = "RPC timeout: " + method;
        expired(result);
      },
      timeout_ms_);

  json message = {{"id", key.second}, {"method", method}, {"params", params}};
  json envelope = {{"sessionId", sub_session_id},
                   {"message", message.dump(-1, ' ', false, json::error_handler_t::replace)}};

  connection_->SendCommand(
      "Target.sendMessageToTarget", envelope,
      [weak_state, key, method](const HawkCommandResult& forwarded) {
        if (forwarded.success) return;
        auto state = weak_state.lock();
        if (!state) return;
        ReplyCallback failed = TakePending(state.get(), key);
        if (!failed) return;
        LOG_WARN("TargetRpc", "Failed to forward " + method + " to session " + key.first +
                 ": " + forwarded.error);
        HawkRpcResult result;
        result.error = forwarded.error.empty() ? "Target.sendMessageToTarget failed"
                                               : forwarded.error;
        failed(result);
      });
}

bool HawkTargetRpcClient::HandleReply(const std::string& sub_session_id, const json& payload) {
  auto id_it = payload.find("id");
  if (id_it == payload.end() || !id_it->is_number_integer()) {
    return false;
  }

  ReplyCallback callback =
      TakePending(state_.get(), PendingKey(sub_session_id, id_it->get<int64_t>()));
  if (!callback) {
    return false;
  }

  HawkRpcResult result;
  auto error_it = payload.find("error");
  if (error_it != payload.end() && !error_it->is_null()) {
    if (error_it->is_object() && error_it->contains("message") &&
        (*error_it)["message"].is_string()) {
      result.error = (*error_it)["message"].get<std::string>();
    } else {
      result.error = error_it->dump();
    }
  } else {
    result.success = true;
    auto result_it = payload.find("result");
    result.result = result_it != payload.end() ? *result_it : json::object();
  }

  callback(result);
  return true;
}

size_t HawkTargetRpcClient::PurgeSession(const std::string& sub_session_id) {
  std::lock_guard<std::mutex> lock(state_->mutex);
  size_t purged = 0;
  for (auto it = state_->pending.begin(); it != state_->pending.end();) {
    if (it->first.first == sub_session_id) {
      it = state_->pending.erase(it);
      purged++;
    } else {
      ++it;
    }
  }
  return purged;
}

void HawkTargetRpcClient::Shutdown() {
  std::lock_guard<std::mutex> lock(state_->mutex);
  if (!state_->shut_down) {
    state_->shut_down = true;
    state_->pending.clear();
  }
}

size_t HawkTargetRpcClient::PendingCount() const {
  std::lock_guard<std::mutex> lock(state_->mutex);
  return state_->pending.size();
}
