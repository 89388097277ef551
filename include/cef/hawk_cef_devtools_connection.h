/**
 * HawkCefDevToolsConnection
 *
 * HawkDebugConnection over the DevTools agent of an embedded CEF browser.
 * Commands go out through CefBrowserHost::SendDevToolsMessage with our own
 * message ids; results and events come back through a registered
 * CefDevToolsMessageObserver and are matched by id or fanned out to event
 * subscribers.
 *
 * SendDevToolsMessage must run on the UI thread, so commands issued from
 * other threads are posted there.
 */

#ifndef HAWK_CEF_DEVTOOLS_CONNECTION_H_
#define HAWK_CEF_DEVTOOLS_CONNECTION_H_

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

#include "include/cef_browser.h"
#include "include/cef_devtools_message_observer.h"
#include "include/cef_registration.h"

#include "hawk_browser.h"

class HawkCefDevToolsConnection
    : public HawkDebugConnection,
      public std::enable_shared_from_this<HawkCefDevToolsConnection> {
 public:
  // Returns nullptr when |browser| is invalid or has no host.
  static std::shared_ptr<HawkCefDevToolsConnection> Create(CefRefPtr<CefBrowser> browser);

  ~HawkCefDevToolsConnection() override;

  void SendCommand(const std::string& method,
                   const nlohmann::json& params,
                   CommandCallback callback) override;
  HawkSubscriptionId Subscribe(const std::string& event, EventHandler handler) override;
  void Unsubscribe(HawkSubscriptionId id) override;
  bool Detach(std::string* error) override;

  // Observer entry points (UI thread)
  void OnMethodResult(int message_id, bool success, const std::string& payload);
  void OnEvent(const std::string& method, const std::string& params);
  void OnAgentDetached();

 private:
  class Observer;

  explicit HawkCefDevToolsConnection(CefRefPtr<CefBrowser> browser);

  void SendOnUIThread(int message_id, const std::string& message);
  void FailCommand(int message_id, const std::string& error);

  CefRefPtr<CefBrowser> browser_;
  CefRefPtr<CefRegistration> registration_;

  std::mutex mutex_;
  bool detached_ = false;
  int next_message_id_ = 0;
  HawkSubscriptionId next_subscription_id_ = 0;
  std::map<int, CommandCallback> pending_;
  std::map<HawkSubscriptionId, std::pair<std::string, EventHandler>> subscribers_;
};

#endif  // HAWK_CEF_DEVTOOLS_CONNECTION_H_
