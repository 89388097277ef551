/**
 * Browser automation surface consumed by the capture engine.
 *
 * The engine never drives the browser itself. It observes a browser context
 * through these interfaces: the pages it owns, their network events, and an
 * optional browser-level DevTools connection used to reach service workers,
 * extension background pages and other workers. The CEF adapters in
 * include/cef implement them for an embedded Chromium; tests use fakes.
 *
 * Handlers may be invoked on any thread. Subscriptions stay active until the
 * id is passed back to Unsubscribe().
 */

#ifndef HAWK_BROWSER_H_
#define HAWK_BROWSER_H_

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "hawk_capture_record.h"

using HawkSubscriptionId = uint64_t;

// An outgoing network request observed on a page
class HawkRequest {
 public:
  virtual ~HawkRequest() = default;

  virtual std::string GetUrl() const = 0;
  virtual std::string GetMethod() const = 0;
  virtual HawkHeaderMap GetHeaders() const = 0;
  virtual std::string GetResourceType() const = 0;  // "document", "xhr", "fetch", ...
  virtual bool IsNavigationRequest() const = 0;
  virtual CaptureFrameInfo GetFrame() const = 0;

  // Best effort. Returns false when no post data is available or it cannot
  // be read.
  virtual bool GetPostData(std::string* post_data) const = 0;

  // Pairing slots written by the page monitor when it captures this request,
  // keyed by "<sessionId>/<hookName>", read back when the response arrives.
  void SetCaptureRequestId(const std::string& key, const std::string& request_id) {
    std::lock_guard<std::mutex> lock(capture_ids_mutex_);
    capture_request_ids_[key] = request_id;
  }

  std::string GetCaptureRequestId(const std::string& key) const {
    std::lock_guard<std::mutex> lock(capture_ids_mutex_);
    auto it = capture_request_ids_.find(key);
    return it != capture_request_ids_.end() ? it->second : std::string();
  }

 private:
  mutable std::mutex capture_ids_mutex_;
  std::map<std::string, std::string> capture_request_ids_;
};

// A response to a HawkRequest
class HawkResponse {
 public:
  virtual ~HawkResponse() = default;

  virtual std::string GetUrl() const = 0;
  virtual int GetStatus() const = 0;
  virtual std::string GetStatusText() const = 0;
  virtual HawkHeaderMap GetHeaders() const = 0;
  virtual std::shared_ptr<HawkRequest> GetRequest() const = 0;

  // Reads the body as text. Returns false and fills |error| on failure.
  virtual bool GetBodyText(std::string* body, std::string* error) const = 0;
};

class HawkPage {
 public:
  using RequestHandler = std::function<void(const std::shared_ptr<HawkRequest>&)>;
  using ResponseHandler = std::function<void(const std::shared_ptr<HawkResponse>&)>;
  using LoadHandler = std::function<void()>;  // DOMContentLoaded of the main frame

  virtual ~HawkPage() = default;

  virtual std::string GetUrl() const = 0;
  virtual std::string GetTitle() const = 0;

  virtual HawkSubscriptionId SubscribeRequests(RequestHandler handler) = 0;
  virtual HawkSubscriptionId SubscribeResponses(ResponseHandler handler) = 0;
  virtual HawkSubscriptionId SubscribeLoads(LoadHandler handler) = 0;
  virtual void Unsubscribe(HawkSubscriptionId id) = 0;
};

struct HawkCommandResult {
  bool success = false;
  nlohmann::json result;  // Command result object on success
  std::string error;      // Protocol or transport error message on failure
};

// A browser-level (not page-level) DevTools protocol session
class HawkDebugConnection {
 public:
  using CommandCallback = std::function<void(const HawkCommandResult&)>;
  using EventHandler = std::function<void(const nlohmann::json& params)>;

  virtual ~HawkDebugConnection() = default;

  // Sends |method| on the browser session. |callback| runs exactly once,
  // possibly before SendCommand returns.
  virtual void SendCommand(const std::string& method,
                           const nlohmann::json& params,
                           CommandCallback callback) = 0;

  virtual HawkSubscriptionId Subscribe(const std::string& event, EventHandler handler) = 0;
  virtual void Unsubscribe(HawkSubscriptionId id) = 0;

  // Closes the session. Returns false and fills |error| when the transport
  // reports a failure; the connection is unusable either way.
  virtual bool Detach(std::string* error) = 0;
};

class HawkBrowserContext {
 public:
  using PageCreatedHandler = std::function<void(const std::shared_ptr<HawkPage>&)>;

  virtual ~HawkBrowserContext() = default;

  virtual std::vector<std::shared_ptr<HawkPage>> GetPages() = 0;
  virtual HawkSubscriptionId SubscribePageCreated(PageCreatedHandler handler) = 0;
  virtual void Unsubscribe(HawkSubscriptionId id) = 0;

  // Returns nullptr when the automation layer cannot provide a browser-level
  // DevTools session.
  virtual std::shared_ptr<HawkDebugConnection> CreateBrowserDebugConnection() = 0;
};

#endif  // HAWK_BROWSER_H_
