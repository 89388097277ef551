#include "hawk_cef_devtools_connection.h"
#include "hawk_cef_task_runner.h"
#include "logger.h"

#include <vector>

using json = nlohmann::json;

namespace {

// Ids below this are left to other DevTools clients of the same browser
const int kFirstMessageId = 100000;

}  // namespace

class HawkCefDevToolsConnection::Observer : public CefDevToolsMessageObserver {
 public:
  explicit Observer(std::weak_ptr<HawkCefDevToolsConnection> connection)
      : connection_(std::move(connection)) {}

  void OnDevToolsMethodResult(CefRefPtr<CefBrowser> browser,
                              int message_id,
                              bool success,
                              const void* result,
                              size_t result_size) override {
    if (auto connection = connection_.lock()) {
      connection->OnMethodResult(message_id, success,
                                 std::string(static_cast<const char*>(result), result_size));
    }
  }

  void OnDevToolsEvent(CefRefPtr<CefBrowser> browser,
                       const CefString& method,
                       const void* params,
                       size_t params_size) override {
    if (auto connection = connection_.lock()) {
      connection->OnEvent(method.ToString(),
                          std::string(static_cast<const char*>(params), params_size));
    }
  }

  void OnDevToolsAgentDetached(CefRefPtr<CefBrowser> browser) override {
    if (auto connection = connection_.lock()) {
      connection->OnAgentDetached();
    }
  }

 private:
  std::weak_ptr<HawkCefDevToolsConnection> connection_;

  IMPLEMENT_REFCOUNTING(Observer);
  DISALLOW_COPY_AND_ASSIGN(Observer);
};

std::shared_ptr<HawkCefDevToolsConnection> HawkCefDevToolsConnection::Create(
    CefRefPtr<CefBrowser> browser) {
  if (!browser || !browser->IsValid() || !browser->GetHost()) {
    return nullptr;
  }

  std::shared_ptr<HawkCefDevToolsConnection> connection(new HawkCefDevToolsConnection(browser));
  CefRefPtr<CefRegistration> registration =
      browser->GetHost()->AddDevToolsMessageObserver(new Observer(connection));
  if (!registration) {
    LOG_WARN("TargetMux", "AddDevToolsMessageObserver failed for browser " +
             std::to_string(browser->GetIdentifier()));
    return nullptr;
  }
  connection->registration_ = registration;
  return connection;
}

HawkCefDevToolsConnection::HawkCefDevToolsConnection(CefRefPtr<CefBrowser> browser)
    : browser_(browser), next_message_id_(kFirstMessageId) {}

HawkCefDevToolsConnection::~HawkCefDevToolsConnection() {
  registration_ = nullptr;
}

void HawkCefDevToolsConnection::SendCommand(const std::string& method,
                                            const json& params,
                                            CommandCallback callback) {
  int message_id = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!detached_) {
      message_id = ++next_message_id_;
      pending_[message_id] = std::move(callback);
    }
  }

  if (message_id == 0) {
    HawkCommandResult result;
    result.error = "DevTools session is detached";
    if (callback) callback(result);
    return;
  }

  json message = {{"id", message_id}, {"method", method}, {"params", params}};
  std::string text = message.dump(-1, ' ', false, json::error_handler_t::replace);

  if (CefCurrentlyOn(TID_UI)) {
    SendOnUIThread(message_id, text);
    return;
  }

  std::weak_ptr<HawkCefDevToolsConnection> weak_self = shared_from_this();
  if (!CefPostTask(TID_UI, new HawkClosureTask([weak_self, message_id, text]() {
        if (auto self = weak_self.lock()) self->SendOnUIThread(message_id, text);
      }))) {
    FailCommand(message_id, "Failed to post DevTools message to the UI thread");
  }
}

void HawkCefDevToolsConnection::SendOnUIThread(int message_id, const std::string& message) {
  CefRefPtr<CefBrowserHost> host = browser_->GetHost();
  if (!host || !host->SendDevToolsMessage(message.data(), message.size())) {
    FailCommand(message_id, "SendDevToolsMessage failed");
  }
}

void HawkCefDevToolsConnection::FailCommand(int message_id, const std::string& error) {
  CommandCallback callback;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.find(message_id);
    if (it == pending_.end()) return;
    callback = std::move(it->second);
    pending_.erase(it);
  }

  HawkCommandResult result;
  result.error = error;
  if (callback) callback(result);
}

void HawkCefDevToolsConnection::OnMethodResult(int message_id,
                                               bool success,
                                               const std::string& payload) {
  CommandCallback callback;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.find(message_id);
    if (it == pending_.end()) return;  // Another client's message
    callback = std::move(it->second);
    pending_.erase(it);
  }

  HawkCommandResult result;
  json value = json::parse(payload, nullptr, false);
  if (success) {
    result.success = true;
    result.result = value.is_discarded() ? json::object() : value;
  } else if (!value.is_discarded() && value.is_object() && value.contains("message") &&
             value["message"].is_string()) {
    result.error = value["message"].get<std::string>();
  } else {
    result.error = payload.empty() ? "DevTools method failed" : payload;
  }

  if (callback) callback(result);
}

void HawkCefDevToolsConnection::OnEvent(const std::string& method, const std::string& params) {
  std::vector<EventHandler> handlers;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (detached_) return;
    for (const auto& entry : subscribers_) {
      if (entry.second.first == method) {
        handlers.push_back(entry.second.second);
      }
    }
  }
  if (handlers.empty()) return;

  json value = json::parse(params, nullptr, false);
  if (value.is_discarded()) {
    LOG_DEBUG("TargetMux", "Undecodable DevTools event params for " + method);
    return;
  }
  for (const auto& handler : handlers) {
    handler(value);
  }
}

void HawkCefDevToolsConnection::OnAgentDetached() {
  std::map<int, CommandCallback> pending;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    pending.swap(pending_);
  }

  for (auto& entry : pending) {
    HawkCommandResult result;
    result.error = "DevTools agent detached";
    if (entry.second) entry.second(result);
  }
}

HawkSubscriptionId HawkCefDevToolsConnection::Subscribe(const std::string& event,
                                                        EventHandler handler) {
  std::lock_guard<std::mutex> lock(mutex_);
  HawkSubscriptionId id = ++next_subscription_id_;
  subscribers_[id] = std::make_pair(event, std::move(handler));
  return id;
}

void HawkCefDevToolsConnection::Unsubscribe(HawkSubscriptionId id) {
  std::lock_guard<std::mutex> lock(mutex_);
  subscribers_.erase(id);
}

bool HawkCefDevToolsConnection::Detach(std::string* error) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (detached_) {
      *error = "already detached";
      return false;
    }
    detached_ = true;
    pending_.clear();
    subscribers_.clear();
  }

  // Dropping the registration removes the observer
  registration_ = nullptr;
  return true;
}
