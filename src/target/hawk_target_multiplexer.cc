#include "hawk_target_multiplexer.h"
#include "hawk_string_utils.h"
#include "logger.h"

#include <exception>

using json = nlohmann::json;

namespace {

const char kExtensionScheme[] = "chrome-extension://";

HawkHeaderMap HeadersFromProtocol(const json& value) {
  HawkHeaderMap headers;
  if (!value.is_object()) return headers;
  for (auto it = value.begin(); it != value.end(); ++it) {
    headers[it.key()] = it.value().is_string() ? it.value().get<std::string>()
                                               : it.value().dump();
  }
  return headers;
}

std::string StringField(const json& obj, const char* key) {
  if (!obj.is_object()) return std::string();
  auto it = obj.find(key);
  return (it != obj.end() && it->is_string()) ? it->get<std::string>() : std::string();
}

CaptureInitiator InitiatorFromProtocol(const json& initiator, bool with_stack) {
  CaptureInitiator out;
  if (!initiator.is_object()) {
    return out;
  }
  std::string type = StringField(initiator, "type");
  if (!type.empty()) out.type = type;
  std::string url = StringField(initiator, "url");
  if (!url.empty()) out.url = url;
  if (with_stack && initiator.contains("stack")) {
    out.stack = initiator["stack"];
  }
  return out;
}

}  // namespace

HawkTargetMultiplexer::HawkTargetMultiplexer(const std::string& session_id,
                                             std::shared_ptr<HawkBrowserContext> context,
                                             HawkHookRegistry* registry,
                                             HawkCaptureStore* store,
                                             HawkTaskRunner* task_runner)
    : session_id_(session_id),
      context_(std::move(context)),
      registry_(registry),
      store_(store),
      task_runner_(task_runner) {}

HawkTargetMultiplexer::~HawkTargetMultiplexer() {
  Stop();
}

CaptureSource HawkTargetMultiplexer::ClassifyInitiator(const json& initiator) {
  if (!initiator.is_object()) {
    return CaptureSource::PAGE;
  }
  if (HawkUtil::StartsWith(StringField(initiator, "url"), kExtensionScheme)) {
    return CaptureSource::EXTENSION;
  }
  std::string type = StringField(initiator, "type");
  if (type == "other") return CaptureSource::SERVICE_WORKER;
  if (type == "script") return CaptureSource::SCRIPT;
  return CaptureSource::PAGE;
}

bool HawkTargetMultiplexer::IsAttachableType(const std::string& type) {
  return type == "page" || type == "worker" || type == "shared_worker" ||
         type == "service_worker" || type == "background_page";
}

HawkTargetMultiplexer::TargetInfo HawkTargetMultiplexer::ParseTargetInfo(const json& value) {
  TargetInfo info;
  info.target_id = StringField(value, "targetId");
  info.type = StringField(value, "type");
  info.url = StringField(value, "url");
  info.title = StringField(value, "title");
  return info;
}

bool HawkTargetMultiplexer::Start() {
  if (stopped_.load() || started_.exchange(true)) {
    return false;
  }

  connection_ = context_->CreateBrowserDebugConnection();
  if (!connection_) {
    LOG_WARN("TargetMux", "Browser-level DevTools session unavailable for " + session_id_);
    return false;
  }
  rpc_.reset(new HawkTargetRpcClient(connection_, task_runner_));

  std::weak_ptr<HawkTargetMultiplexer> weak_self = shared_from_this();

  std::vector<HawkSubscriptionId> ids;
  ids.push_back(connection_->Subscribe("Target.attachedToTarget",
      [weak_self](const json& params) {
        if (auto self = weak_self.lock()) self->HandleAttachedToTarget(params);
      }));
  ids.push_back(connection_->Subscribe("Target.detachedFromTarget",
      [weak_self](const json& params) {
        if (auto self = weak_self.lock()) self->HandleDetachedFromTarget(params);
      }));
  ids.push_back(connection_->Subscribe("Target.receivedMessageFromTarget",
      [weak_self](const json& params) {
        if (auto self = weak_self.lock()) self->HandleReceivedMessageFromTarget(params);
      }));
  {
    std::lock_guard<std::mutex> lock(mutex_);
    subscriptions_ = ids;
  }

  connection_->SendCommand("Target.setDiscoverTargets", {{"discover", true}},
      [](const HawkCommandResult& result) {
        if (!result.success) {
          LOG_WARN("TargetMux", "Target.setDiscoverTargets failed: " + result.error);
        }
      });

  connection_->SendCommand("Target.setAutoAttach",
      {{"autoAttach", true}, {"waitForDebuggerOnStart", false}, {"flatten", true}},
      [](const HawkCommandResult& result) {
        if (!result.success) {
          LOG_WARN("TargetMux", "Target.setAutoAttach failed: " + result.error);
        }
      });

  connection_->SendCommand("Target.getTargets", json::object(),
      [weak_self](const HawkCommandResult& result) {
        auto self = weak_self.lock();
        if (!self || self->stopped_.load()) return;
        if (!result.success) {
          LOG_WARN("TargetMux", "Target.getTargets failed: " + result.error);
          return;
        }
        auto infos = result.result.find("targetInfos");
        if (infos == result.result.end() || !infos->is_array()) return;
        for (const auto& value : *infos) {
          TargetInfo info = ParseTargetInfo(value);
          if (!info.target_id.empty() && IsAttachableType(info.type)) {
            self->AttachToTarget(info);
          }
        }
      });

  LOG_INFO("TargetMux", "Target auto-attach enabled for session " + session_id_ +
           ": monitoring pages, workers, service workers and background pages");
  return true;
}

void HawkTargetMultiplexer::AttachToTarget(const TargetInfo& info) {
  std::weak_ptr<HawkTargetMultiplexer> weak_self = shared_from_this();
  connection_->SendCommand("Target.attachToTarget",
      {{"targetId", info.target_id}, {"flatten", true}},
      [weak_self, info](const HawkCommandResult& result) {
        auto self = weak_self.lock();
        if (!self) return;
        if (!result.success) {
          LOG_DEBUG("TargetMux", "Attach to " + info.type + " " + info.target_id +
                    " failed: " + result.error);
          return;
        }
        std::string sub_session_id = StringField(result.result, "sessionId");
        if (!sub_session_id.empty()) {
          self->RegisterTargetSession(sub_session_id, info);
        }
      });
}

void HawkTargetMultiplexer::RegisterTargetSession(const std::string& sub_session_id,
                                                  const TargetInfo& info) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopped_.load() || target_sessions_.count(sub_session_id)) {
      return;
    }
    target_sessions_[sub_session_id] = info;
  }

  LOG_DEBUG("TargetMux", "Attached " + info.type + " " + info.url + " as " + sub_session_id);

  rpc_->Send(sub_session_id, "Network.enable", json::object(),
      [sub_session_id](const HawkRpcResult& result) {
        if (!result.success) {
          LOG_DEBUG("TargetMux", "Network.enable failed on " + sub_session_id + ": " +
                    result.error);
        }
      });
}

void HawkTargetMultiplexer::HandleAttachedToTarget(const json& params) {
  if (stopped_.load()) return;
  std::string sub_session_id = StringField(params, "sessionId");
  if (sub_session_id.empty()) return;
  RegisterTargetSession(sub_session_id, ParseTargetInfo(params.value("targetInfo", json::object())));
}

void HawkTargetMultiplexer::HandleDetachedFromTarget(const json& params) {
  if (stopped_.load()) return;
  std::string sub_session_id = StringField(params, "sessionId");
  if (sub_session_id.empty()) return;

  size_t dropped_responses = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    target_sessions_.erase(sub_session_id);
    for (auto it = pending_responses_.begin(); it != pending_responses_.end();) {
      if (it->first.first == sub_session_id) {
        it = pending_responses_.erase(it);
        dropped_responses++;
      } else {
        ++it;
      }
    }
  }
  size_t dropped_rpcs = rpc_ ? rpc_->PurgeSession(sub_session_id) : 0;

  LOG_DEBUG("TargetMux", "Detached " + sub_session_id + ", dropped " +
            std::to_string(dropped_responses) + " responses and " +
            std::to_string(dropped_rpcs) + " RPCs");
}

void HawkTargetMultiplexer::HandleReceivedMessageFromTarget(const json& params) {
  if (stopped_.load()) return;

  std::string sub_session_id = StringField(params, "sessionId");
  std::string message = StringField(params, "message");
  if (sub_session_id.empty() || message.empty()) return;

  json payload = json::parse(message, nullptr, false);
  if (payload.is_discarded() || !payload.is_object()) {
    LOG_DEBUG("TargetMux", "Dropping undecodable message from " + sub_session_id);
    return;
  }

  auto id = payload.find("id");
  if (id != payload.end() && id->is_number()) {
    rpc_->HandleReply(sub_session_id, payload);
    return;
  }

  std::string method = StringField(payload, "method");
  if (method.empty()) return;
  if (!IsTargetSessionAttached(sub_session_id)) {
    LOG_DEBUG("TargetMux", "Dropping " + method + " from detached target " + sub_session_id);
    return;
  }
  DispatchEvent(sub_session_id, method, payload.value("params", json::object()));
}

void HawkTargetMultiplexer::DispatchEvent(const std::string& sub_session_id,
                                          const std::string& method,
                                          const json& params) {
  try {
    if (method == "Network.requestWillBeSent") {
      OnRequestWillBeSent(params);
    } else if (method == "Network.responseReceived") {
      OnResponseReceived(sub_session_id, params);
    } else if (method == "Network.loadingFinished") {
      OnLoadingFinished(sub_session_id, params);
    } else if (method == "Network.loadingFailed") {
      OnLoadingFailed(sub_session_id, params);
    } else if (method == "Network.webSocketCreated") {
      OnWebSocketCreated(params);
    }
  } catch (const std::exception& e) {
    LOG_ERROR("TargetMux", "Error handling " + method + ": " + e.what());
  }
}

void HawkTargetMultiplexer::OnRequestWillBeSent(const json& params) {
  const json request = params.value("request", json::object());

  HookRequestInfo info;
  info.session_id = session_id_;
  info.url = StringField(request, "url");

  auto hooks = registry_->FindMatchingHooks(info.url);
  if (hooks.empty()) return;

  info.method = StringField(request, "method");
  info.headers = HeadersFromProtocol(request.value("headers", json::object()));
  if (request.contains("postData") && request["postData"].is_string()) {
    info.post_data = request["postData"].get<std::string>();
  }
  info.resource_type = "xhr";

  const json initiator = params.value("initiator", json());
  CaptureSource source = ClassifyInitiator(initiator);

  std::string timestamp;
  auto wall_time = params.find("wallTime");
  if (wall_time != params.end() && wall_time->is_number()) {
    timestamp = HawkUtil::IsoTimestamp(static_cast<int64_t>(wall_time->get<double>() * 1000.0));
  } else {
    timestamp = HawkUtil::IsoTimestampNow();
  }

  LOG_DEBUG("TargetMux", std::string(CaptureSourceToString(source)) + " request: " +
            info.method + " " + info.url);

  for (const auto& hook : hooks) {
    if (!hook->enabled() || !registry_->ShouldCaptureRequest(info, *hook)) continue;

    CaptureRecord record;
    record.timestamp = timestamp;
    record.type = CaptureType::REQUEST;
    record.source = source;
    record.request_id = StringField(params, "requestId");
    record.hook_name = hook->name();
    record.session_id = session_id_;
    record.url = info.url;
    record.method = info.method;
    record.headers = info.headers;
    record.post_data = info.post_data;
    record.initiator = InitiatorFromProtocol(initiator, true);

    json extra;
    if (hook->OnRequest(info, &extra)) {
      record.custom = extra;
    }
    store_->Store(session_id_, record);
  }
}

void HawkTargetMultiplexer::OnResponseReceived(const std::string& sub_session_id,
                                               const json& params) {
  std::string request_id = StringField(params, "requestId");
  std::string url = StringField(params.value("response", json::object()), "url");
  if (request_id.empty() || registry_->FindMatchingHooks(url).empty()) return;

  // Checked under the lock so a concurrent detach cannot leave an orphan entry
  std::lock_guard<std::mutex> lock(mutex_);
  if (stopped_.load() || target_sessions_.count(sub_session_id) == 0) return;
  pending_responses_[PendingKey(sub_session_id, request_id)] = params;
}

void HawkTargetMultiplexer::OnLoadingFailed(const std::string& sub_session_id,
                                            const json& params) {
  std::lock_guard<std::mutex> lock(mutex_);
  pending_responses_.erase(PendingKey(sub_session_id, StringField(params, "requestId")));
}

void HawkTargetMultiplexer::OnLoadingFinished(const std::string& sub_session_id,
                                              const json& params) {
  std::string request_id = StringField(params, "requestId");
  json buffered;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_responses_.find(PendingKey(sub_session_id, request_id));
    if (it == pending_responses_.end()) return;
    buffered = std::move(it->second);
    pending_responses_.erase(it);
  }

  const json response = buffered.value("response", json::object());

  HookResponseInfo info;
  info.session_id = session_id_;
  info.url = StringField(response, "url");
  info.status = response.value("status", 0);
  info.status_text = StringField(response, "statusText");
  info.headers = HeadersFromProtocol(response.value("headers", json::object()));
  std::string mime_type = StringField(response, "mimeType");

  std::vector<std::shared_ptr<HawkCaptureHook>> capturing;
  bool wants_body = false;
  for (const auto& hook : registry_->FindMatchingHooks(info.url)) {
    if (!hook->enabled() || !registry_->ShouldCaptureResponse(info, *hook)) continue;
    capturing.push_back(hook);
    wants_body = wants_body || hook->config().capture_rules.capture_response_body;
  }
  if (capturing.empty()) return;

  LOG_DEBUG("TargetMux", "Global response: " + std::to_string(info.status) + " " + info.url);

  if (!wants_body) {
    EmitResponses(capturing, info, request_id, mime_type, false, std::string(), std::string());
    return;
  }

  std::weak_ptr<HawkTargetMultiplexer> weak_self = shared_from_this();
  rpc_->Send(sub_session_id, "Network.getResponseBody", {{"requestId", request_id}},
      [weak_self, capturing, info, request_id, mime_type](const HawkRpcResult& result) {
        auto self = weak_self.lock();
        if (!self || self->stopped_.load()) return;
        if (result.timed_out) {
          LOG_WARN("TargetMux", "Skipping response capture for " + info.url +
                   ": body request timed out");
          return;
        }
        if (!result.success) {
          self->EmitResponses(capturing, info, request_id, mime_type, false, std::string(),
                              result.error);
          return;
        }
        std::string body = StringField(result.result, "body");
        if (result.result.value("base64Encoded", false)) {
          body = HawkUtil::Base64Decode(body);
        }
        self->EmitResponses(capturing, info, request_id, mime_type, true, body, std::string());
      });
}

void HawkTargetMultiplexer::EmitResponses(
    const std::vector<std::shared_ptr<HawkCaptureHook>>& hooks,
    const HookResponseInfo& info,
    const std::string& request_id,
    const std::string& mime_type,
    bool body_fetched,
    const std::string& body,
    const std::string& body_error) {
  try {
    for (const auto& hook : hooks) {
      CaptureRecord record;
      record.timestamp = HawkUtil::IsoTimestampNow();
      record.type = CaptureType::RESPONSE;
      record.source = CaptureSource::GLOBAL;
      record.request_id = request_id;
      record.hook_name = hook->name();
      record.session_id = session_id_;
      record.url = info.url;
      record.status = info.status;
      record.status_text = info.status_text;
      record.headers = info.headers;
      record.mime_type = mime_type;

      HookResponseInfo hook_info = info;
      if (hook->config().capture_rules.capture_response_body) {
        if (body_fetched) {
          ApplyResponseBody(body, &record);
          hook_info.body = body;
        } else if (!body_error.empty()) {
          record.body_error = body_error;
        }
      }

      json extra;
      if (hook->OnResponse(hook_info, &extra)) {
        record.custom = extra;
      }
      store_->Store(session_id_, record);
    }
  } catch (const std::exception& e) {
    LOG_ERROR("TargetMux", std::string("Error capturing response: ") + e.what());
  }
}

void HawkTargetMultiplexer::OnWebSocketCreated(const json& params) {
  std::string url = StringField(params, "url");
  auto hooks = registry_->FindMatchingHooks(url);
  if (hooks.empty()) return;

  const json initiator = params.value("initiator", json());
  if (!initiator.is_object()) return;
  bool from_extension = StringField(initiator, "type") == "other" ||
                        HawkUtil::StartsWith(StringField(initiator, "url"), kExtensionScheme);
  if (!from_extension) return;

  LOG_INFO("TargetMux", "Extension WebSocket: " + url);

  for (const auto& hook : hooks) {
    if (!hook->enabled()) continue;

    CaptureRecord record;
    record.timestamp = HawkUtil::IsoTimestampNow();
    record.type = CaptureType::WEBSOCKET;
    record.source = CaptureSource::EXTENSION;
    record.request_id = StringField(params, "requestId");
    record.hook_name = hook->name();
    record.session_id = session_id_;
    record.url = url;
    record.initiator = InitiatorFromProtocol(initiator, false);
    record.is_extension_websocket = true;
    store_->Store(session_id_, record);
  }
}

void HawkTargetMultiplexer::Stop() {
  std::vector<HawkSubscriptionId> subscriptions;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopped_.exchange(true)) return;
    subscriptions.swap(subscriptions_);
    target_sessions_.clear();
    pending_responses_.clear();
  }

  if (!connection_) return;

  for (HawkSubscriptionId id : subscriptions) {
    connection_->Unsubscribe(id);
  }
  rpc_->Shutdown();

  std::string error;
  if (!connection_->Detach(&error)) {
    LOG_WARN("TargetMux", "Failed to detach DevTools session for " + session_id_ + ": " + error);
  }
  LOG_DEBUG("TargetMux", "Stopped target monitoring for " + session_id_);
}

size_t HawkTargetMultiplexer::TargetSessionCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return target_sessions_.size();
}

bool HawkTargetMultiplexer::IsTargetSessionAttached(const std::string& sub_session_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return target_sessions_.count(sub_session_id) > 0;
}

size_t HawkTargetMultiplexer::PendingResponseCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_responses_.size();
}

size_t HawkTargetMultiplexer::PendingRpcCount() const {
  return rpc_ ? rpc_->PendingCount() : 0;
}
