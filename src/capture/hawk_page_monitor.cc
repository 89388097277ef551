#include "hawk_page_monitor.h"
#include "hawk_string_utils.h"
#include "logger.h"

#include <exception>

HawkPageMonitor::HawkPageMonitor(const std::string& session_id,
                                 std::shared_ptr<HawkBrowserContext> context,
                                 HawkHookRegistry* registry,
                                 HawkCaptureStore* store)
    : session_id_(session_id),
      context_(std::move(context)),
      registry_(registry),
      store_(store) {}

HawkPageMonitor::~HawkPageMonitor() {
  Detach();
}

void HawkPageMonitor::Attach() {
  std::weak_ptr<HawkPageMonitor> weak_self = shared_from_this();

  HawkSubscriptionId id = context_->SubscribePageCreated(
      [weak_self](const std::shared_ptr<HawkPage>& page) {
        if (auto self = weak_self.lock()) {
          self->AttachPage(page);
        }
      });

  {
    std::lock_guard<std::mutex> lock(mutex_);
    page_created_subscription_ = id;
    page_created_subscribed_ = true;
  }

  for (const auto& page : context_->GetPages()) {
    AttachPage(page);
  }

  LOG_INFO("PageMonitor", "Monitoring session " + session_id_ + " (" +
           std::to_string(AttachedPageCount()) + " pages)");
}

void HawkPageMonitor::AttachPage(const std::shared_ptr<HawkPage>& page) {
  if (!page || detached_.load()) {
    return;
  }

  // Reserve the slot first so concurrent calls for the same page subscribe once.
  // Closed pages are dropped here; their subscriptions died with them.
  {
    std::lock_guard<std::mutex> lock(mutex_);
    PruneClosedPages();
    for (const auto& subscription : page_subscriptions_) {
      if (subscription.page.lock() == page) {
        return;
      }
    }
    PageSubscription reserved;
    reserved.page = page;
    page_subscriptions_.push_back(reserved);
  }

  std::weak_ptr<HawkPageMonitor> weak_self = shared_from_this();
  std::weak_ptr<HawkPage> weak_page = page;

  std::vector<HawkSubscriptionId> ids;
  ids.push_back(page->SubscribeRequests(
      [weak_self](const std::shared_ptr<HawkRequest>& request) {
        if (auto self = weak_self.lock()) {
          self->HandleRequest(request);
        }
      }));
  ids.push_back(page->SubscribeResponses(
      [weak_self](const std::shared_ptr<HawkResponse>& response) {
        if (auto self = weak_self.lock()) {
          self->HandleResponse(response);
        }
      }));
  ids.push_back(page->SubscribeLoads(
      [weak_self, weak_page]() {
        auto self = weak_self.lock();
        auto loaded_page = weak_page.lock();
        if (self && loaded_page) {
          self->HandlePageLoad(loaded_page);
        }
      }));

  bool detached_meanwhile = true;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& subscription : page_subscriptions_) {
      if (subscription.page.lock() == page) {
        subscription.ids = ids;
        detached_meanwhile = false;
        break;
      }
    }
  }

  // Detach() swapped the slot out while subscribing; undo so nothing leaks
  if (detached_meanwhile) {
    for (HawkSubscriptionId id : ids) {
      page->Unsubscribe(id);
    }
  }
}

void HawkPageMonitor::PruneClosedPages() {
  for (auto it = page_subscriptions_.begin(); it != page_subscriptions_.end();) {
    if (it->page.expired()) {
      it = page_subscriptions_.erase(it);
    } else {
      ++it;
    }
  }
}

void HawkPageMonitor::Detach() {
  if (detached_.exchange(true)) {
    return;
  }

  std::vector<PageSubscription> subscriptions;
  bool unsubscribe_context = false;
  HawkSubscriptionId context_subscription = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    subscriptions.swap(page_subscriptions_);
    unsubscribe_context = page_created_subscribed_;
    context_subscription = page_created_subscription_;
    page_created_subscribed_ = false;
  }

  if (unsubscribe_context) {
    context_->Unsubscribe(context_subscription);
  }
  for (const auto& subscription : subscriptions) {
    if (auto page = subscription.page.lock()) {
      for (HawkSubscriptionId id : subscription.ids) {
        page->Unsubscribe(id);
      }
    }
  }

  LOG_DEBUG("PageMonitor", "Detached " + std::to_string(subscriptions.size()) +
            " pages for session " + session_id_);
}

size_t HawkPageMonitor::AttachedPageCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  size_t open_pages = 0;
  for (const auto& subscription : page_subscriptions_) {
    if (!subscription.page.expired()) open_pages++;
  }
  return open_pages;
}

std::string HawkPageMonitor::NextRequestId() {
  return "req_" + std::to_string(++request_counter_) + "_" +
         std::to_string(HawkUtil::EpochMillisNow());
}

std::string HawkPageMonitor::PairingKey(const std::string& hook_name) const {
  return session_id_ + "/" + hook_name;
}

void HawkPageMonitor::HandleRequest(const std::shared_ptr<HawkRequest>& request) {
  if (detached_.load() || !request) {
    return;
  }

  try {
    HookRequestInfo info;
    info.session_id = session_id_;
    info.url = request->GetUrl();

    auto hooks = registry_->FindMatchingHooks(info.url);
    if (hooks.empty()) {
      return;
    }

    info.method = request->GetMethod();
    info.headers = request->GetHeaders();
    info.resource_type = request->GetResourceType();
    info.is_navigation_request = request->IsNavigationRequest();
    std::string post_data;
    if (request->GetPostData(&post_data)) {
      info.post_data = post_data;
    }

    for (const auto& hook : hooks) {
      if (!hook->enabled() || !registry_->ShouldCaptureRequest(info, *hook)) {
        continue;
      }

      std::string request_id = NextRequestId();

      CaptureRecord record;
      record.timestamp = HawkUtil::IsoTimestampNow();
      record.type = CaptureType::REQUEST;
      record.request_id = request_id;
      record.hook_name = hook->name();
      record.session_id = session_id_;
      record.url = info.url;
      record.method = info.method;
      record.headers = info.headers;
      record.post_data = info.post_data;
      record.resource_type = info.resource_type;
      record.is_navigation_request = info.is_navigation_request;
      record.frame = request->GetFrame();

      nlohmann::json extra;
      if (hook->OnRequest(info, &extra)) {
        record.custom = extra;
      }

      store_->Store(session_id_, record);
      request->SetCaptureRequestId(PairingKey(hook->name()), request_id);
    }
  } catch (const std::exception& e) {
    LOG_ERROR("PageMonitor", std::string("Error capturing request: ") + e.what());
  }
}

void HawkPageMonitor::HandleResponse(const std::shared_ptr<HawkResponse>& response) {
  if (detached_.load() || !response) {
    return;
  }

  try {
    HookResponseInfo info;
    info.session_id = session_id_;
    info.url = response->GetUrl();

    auto hooks = registry_->FindMatchingHooks(info.url);
    if (hooks.empty()) {
      return;
    }

    info.status = response->GetStatus();
    info.status_text = response->GetStatusText();
    info.headers = response->GetHeaders();
    std::shared_ptr<HawkRequest> request = response->GetRequest();
    if (request) {
      info.request_method = request->GetMethod();
      info.request_headers = request->GetHeaders();
    }

    // Read lazily, at most once for all hooks
    bool body_read = false;
    bool body_ok = false;
    std::string body;
    std::string body_error;

    for (const auto& hook : hooks) {
      if (!hook->enabled() || !registry_->ShouldCaptureResponse(info, *hook)) {
        continue;
      }

      CaptureRecord record;
      record.timestamp = HawkUtil::IsoTimestampNow();
      record.type = CaptureType::RESPONSE;
      if (request) {
        std::string request_id = request->GetCaptureRequestId(PairingKey(hook->name()));
        if (!request_id.empty()) {
          record.request_id = request_id;
        }
      }
      record.hook_name = hook->name();
      record.session_id = session_id_;
      record.url = info.url;
      record.status = info.status;
      record.status_text = info.status_text;
      record.headers = info.headers;
      record.request = CaptureRequestSummary{info.request_method, info.request_headers};

      HookResponseInfo hook_info = info;
      if (hook->config().capture_rules.capture_response_body) {
        if (!body_read) {
          body_read = true;
          body_ok = response->GetBodyText(&body, &body_error);
        }
        if (body_ok) {
          ApplyResponseBody(body, &record);
          hook_info.body = body;
        } else {
          record.body_error = body_error.empty() ? "Failed to read response body" : body_error;
        }
      }

      nlohmann::json extra;
      if (hook->OnResponse(hook_info, &extra)) {
        record.custom = extra;
      }

      store_->Store(session_id_, record);
    }
  } catch (const std::exception& e) {
    LOG_ERROR("PageMonitor", std::string("Error capturing response: ") + e.what());
  }
}

void HawkPageMonitor::HandlePageLoad(const std::shared_ptr<HawkPage>& page) {
  if (detached_.load() || !page) {
    return;
  }

  try {
    HookPageInfo info;
    info.session_id = session_id_;
    info.url = page->GetUrl();

    auto hooks = registry_->FindMatchingHooks(info.url);
    if (hooks.empty()) {
      return;
    }
    info.title = page->GetTitle();

    for (const auto& hook : hooks) {
      if (!hook->enabled()) {
        continue;
      }

      nlohmann::json extra;
      if (!hook->OnPage(info, &extra)) {
        continue;
      }

      CaptureRecord record;
      record.timestamp = HawkUtil::IsoTimestampNow();
      record.type = CaptureType::PAGE;
      record.hook_name = hook->name();
      record.session_id = session_id_;
      record.url = info.url;
      record.title = info.title;
      record.custom = extra;
      store_->Store(session_id_, record);
    }
  } catch (const std::exception& e) {
    LOG_ERROR("PageMonitor", std::string("Error capturing page load: ") + e.what());
  }
}
