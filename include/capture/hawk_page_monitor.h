#ifndef HAWK_PAGE_MONITOR_H_
#define HAWK_PAGE_MONITOR_H_

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "hawk_browser.h"
#include "hawk_capture_store.h"
#include "hawk_hook_registry.h"

// Page-level capture for one session.
//
// Subscribes to request, response and load events of every page in the
// context, including pages created later, and stores a record per matching
// hook. A captured request gets an id "req_<n>_<epochMillis>" which is
// stashed on the request so the response record of the same hook carries it.
class HawkPageMonitor : public std::enable_shared_from_this<HawkPageMonitor> {
 public:
  HawkPageMonitor(const std::string& session_id,
                  std::shared_ptr<HawkBrowserContext> context,
                  HawkHookRegistry* registry,
                  HawkCaptureStore* store);
  ~HawkPageMonitor();

  HawkPageMonitor(const HawkPageMonitor&) = delete;
  HawkPageMonitor& operator=(const HawkPageMonitor&) = delete;

  // Hooks existing pages and the page-created event. Call once.
  void Attach();

  // Releases every subscription. Events already in flight are dropped.
  void Detach();

  void AttachPage(const std::shared_ptr<HawkPage>& page);

  void HandleRequest(const std::shared_ptr<HawkRequest>& request);
  void HandleResponse(const std::shared_ptr<HawkResponse>& response);
  void HandlePageLoad(const std::shared_ptr<HawkPage>& page);

  // Pages still open; closed ones are pruned on the next AttachPage()
  size_t AttachedPageCount() const;
  bool IsDetached() const { return detached_.load(); }

 private:
  struct PageSubscription {
    std::weak_ptr<HawkPage> page;
    std::vector<HawkSubscriptionId> ids;
  };

  void PruneClosedPages();  // Requires mutex_
  std::string NextRequestId();
  std::string PairingKey(const std::string& hook_name) const;

  const std::string session_id_;
  std::shared_ptr<HawkBrowserContext> context_;
  HawkHookRegistry* registry_;
  HawkCaptureStore* store_;

  std::atomic<bool> detached_{false};
  std::atomic<uint64_t> request_counter_{0};

  mutable std::mutex mutex_;
  std::vector<PageSubscription> page_subscriptions_;
  HawkSubscriptionId page_created_subscription_ = 0;
  bool page_created_subscribed_ = false;
};

#endif  // HAWK_PAGE_MONITOR_H_
