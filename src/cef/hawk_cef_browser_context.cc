#include "hawk_cef_browser_context.h"
#include "hawk_cef_devtools_connection.h"
#include "logger.h"

#include <algorithm>
#include <cstring>

namespace {

// Hard cap on a filtered body kept in memory
const size_t kMaxCapturedBodyBytes = 16 * 1024 * 1024;

std::string ResourceTypeToString(cef_resource_type_t type) {
  switch (type) {
    case RT_MAIN_FRAME: return "document";
    case RT_SUB_FRAME: return "document";
    case RT_STYLESHEET: return "stylesheet";
    case RT_SCRIPT: return "script";
    case RT_IMAGE: return "image";
    case RT_FONT_RESOURCE: return "font";
    case RT_SUB_RESOURCE: return "fetch";
    case RT_OBJECT: return "object";
    case RT_MEDIA: return "media";
    case RT_WORKER: return "worker";
    case RT_SHARED_WORKER: return "sharedworker";
    case RT_SERVICE_WORKER: return "serviceworker";
    case RT_XHR: return "xhr";
    default: return "other";
  }
}

}  // namespace

// ============================================================================
// HawkCefRequest / HawkCefResponse
// ============================================================================

HawkCefRequest::HawkCefRequest(CefRefPtr<CefRequest> request, CefRefPtr<CefFrame> frame) {
  url_ = request->GetURL().ToString();
  method_ = request->GetMethod().ToString();

  CefRequest::HeaderMap headers;
  request->GetHeaderMap(headers);
  for (const auto& h : headers) {
    headers_[h.first.ToString()] = h.second.ToString();
  }

  cef_resource_type_t type = request->GetResourceType();
  resource_type_ = ResourceTypeToString(type);
  is_navigation_ = (type == RT_MAIN_FRAME || type == RT_SUB_FRAME);

  if (frame) {
    frame_.url = frame->GetURL().ToString();
    frame_.name = frame->GetName().ToString();
  }

  CefRefPtr<CefPostData> post_data = request->GetPostData();
  if (post_data) {
    CefPostData::ElementVector elements;
    post_data->GetElements(elements);
    for (size_t i = 0; i < elements.size(); i++) {
      if (elements[i]->GetType() != PDE_TYPE_BYTES) continue;
      size_t size = elements[i]->GetBytesCount();
      if (size == 0) continue;
      std::string bytes(size, '\0');
      elements[i]->GetBytes(size, &bytes[0]);
      post_data_ += bytes;
      has_post_data_ = true;
    }
  }
}

bool HawkCefRequest::GetPostData(std::string* post_data) const {
  if (!has_post_data_) return false;
  *post_data = post_data_;
  return true;
}

HawkCefResponse::HawkCefResponse(CefRefPtr<CefResponse> response,
                                 std::shared_ptr<HawkRequest> request,
                                 bool body_captured,
                                 std::string body)
    : request_(std::move(request)),
      body_captured_(body_captured),
      body_(std::move(body)) {
  url_ = response->GetURL().ToString();
  if (url_.empty() && request_) {
    url_ = request_->GetUrl();
  }
  status_ = response->GetStatus();
  status_text_ = response->GetStatusText().ToString();

  CefResponse::HeaderMap headers;
  response->GetHeaderMap(headers);
  for (const auto& h : headers) {
    headers_[h.first.ToString()] = h.second.ToString();
  }
}

bool HawkCefResponse::GetBodyText(std::string* body, std::string* error) const {
  if (!body_captured_) {
    *error = "Response body not captured for this content type";
    return false;
  }
  *body = body_;
  return true;
}

// ============================================================================
// HawkCefPage
// ============================================================================

HawkCefPage::HawkCefPage(CefRefPtr<CefBrowser> browser) : browser_(browser) {}

std::string HawkCefPage::GetUrl() const {
  CefRefPtr<CefFrame> frame = browser_->GetMainFrame();
  return frame ? frame->GetURL().ToString() : std::string();
}

std::string HawkCefPage::GetTitle() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return title_;
}

void HawkCefPage::SetTitle(const std::string& title) {
  std::lock_guard<std::mutex> lock(mutex_);
  title_ = title;
}

HawkSubscriptionId HawkCefPage::SubscribeRequests(RequestHandler handler) {
  std::lock_guard<std::mutex> lock(mutex_);
  HawkSubscriptionId id = ++next_id_;
  request_handlers_[id] = std::move(handler);
  return id;
}

HawkSubscriptionId HawkCefPage::SubscribeResponses(ResponseHandler handler) {
  std::lock_guard<std::mutex> lock(mutex_);
  HawkSubscriptionId id = ++next_id_;
  response_handlers_[id] = std::move(handler);
  return id;
}

HawkSubscriptionId HawkCefPage::SubscribeLoads(LoadHandler handler) {
  std::lock_guard<std::mutex> lock(mutex_);
  HawkSubscriptionId id = ++next_id_;
  load_handlers_[id] = std::move(handler);
  return id;
}

void HawkCefPage::Unsubscribe(HawkSubscriptionId id) {
  std::lock_guard<std::mutex> lock(mutex_);
  request_handlers_.erase(id);
  response_handlers_.erase(id);
  load_handlers_.erase(id);
}

void HawkCefPage::DispatchRequest(const std::shared_ptr<HawkRequest>& request) {
  std::vector<RequestHandler> handlers;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& entry : request_handlers_) handlers.push_back(entry.second);
  }
  for (const auto& handler : handlers) handler(request);
}

void HawkCefPage::DispatchResponse(const std::shared_ptr<HawkResponse>& response) {
  std::vector<ResponseHandler> handlers;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& entry : response_handlers_) handlers.push_back(entry.second);
  }
  for (const auto& handler : handlers) handler(response);
}

void HawkCefPage::DispatchLoad() {
  std::vector<LoadHandler> handlers;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& entry : load_handlers_) handlers.push_back(entry.second);
  }
  for (const auto& handler : handlers) handler();
}

// ============================================================================
// HawkCefBodyFilter
// ============================================================================

CefResponseFilter::FilterStatus HawkCefBodyFilter::Filter(void* data_in,
                                                          size_t data_in_size,
                                                          size_t& data_in_read,
                                                          void* data_out,
                                                          size_t data_out_size,
                                                          size_t& data_out_written) {
  data_in_read = 0;
  data_out_written = 0;

  if (data_in_size == 0) {
    return RESPONSE_FILTER_DONE;
  }

  size_t to_copy = std::min(data_in_size, data_out_size);
  memcpy(data_out, data_in, to_copy);
  data_in_read = to_copy;
  data_out_written = to_copy;

  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (captured_body_.size() < kMaxCapturedBodyBytes) {
      size_t capture_size = std::min(to_copy, kMaxCapturedBodyBytes - captured_body_.size());
      captured_body_.append(static_cast<const char*>(data_in), capture_size);
    }
  }

  return RESPONSE_FILTER_NEED_MORE_DATA;
}

std::string HawkCefBodyFilter::GetCapturedBody() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return captured_body_;
}

// ============================================================================
// HawkCefResourceHandler
// ============================================================================

HawkCefResourceHandler::HawkCefResourceHandler(std::weak_ptr<HawkCefPage> page)
    : page_(std::move(page)) {}

bool HawkCefResourceHandler::IsCapturableMimeType(const std::string& mime_type) {
  return mime_type.find("text/") == 0 ||
         mime_type.find("application/json") != std::string::npos ||
         mime_type.find("application/javascript") != std::string::npos ||
         mime_type.find("application/xml") != std::string::npos ||
         mime_type.find("application/xhtml") != std::string::npos ||
         mime_type.find("+json") != std::string::npos ||
         mime_type.find("+xml") != std::string::npos;
}

cef_return_value_t HawkCefResourceHandler::OnBeforeResourceLoad(CefRefPtr<CefBrowser> browser,
                                                                CefRefPtr<CefFrame> frame,
                                                                CefRefPtr<CefRequest> request,
                                                                CefRefPtr<CefCallback> callback) {
  request_ = std::make_shared<HawkCefRequest>(request, frame);
  if (auto page = page_.lock()) {
    page->DispatchRequest(request_);
  }
  return RV_CONTINUE;
}

CefRefPtr<CefResponseFilter> HawkCefResourceHandler::GetResourceResponseFilter(
    CefRefPtr<CefBrowser> browser,
    CefRefPtr<CefFrame> frame,
    CefRefPtr<CefRequest> request,
    CefRefPtr<CefResponse> response) {
  if (!response || !IsCapturableMimeType(response->GetMimeType().ToString())) {
    return nullptr;
  }
  body_filter_ = new HawkCefBodyFilter();
  return body_filter_;
}

void HawkCefResourceHandler::OnResourceLoadComplete(CefRefPtr<CefBrowser> browser,
                                                    CefRefPtr<CefFrame> frame,
                                                    CefRefPtr<CefRequest> request,
                                                    CefRefPtr<CefResponse> response,
                                                    URLRequestStatus status,
                                                    int64_t received_content_length) {
  auto page = page_.lock();
  if (!page || !response || status != UR_SUCCESS) {
    return;
  }

  if (!request_) {
    request_ = std::make_shared<HawkCefRequest>(request, frame);
  }

  bool body_captured = body_filter_ != nullptr;
  std::string body = body_captured ? body_filter_->GetCapturedBody() : std::string();
  page->DispatchResponse(
      std::make_shared<HawkCefResponse>(response, request_, body_captured, std::move(body)));
}

// ============================================================================
// HawkCefBrowserContext
// ============================================================================

std::vector<std::shared_ptr<HawkPage>> HawkCefBrowserContext::GetPages() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::shared_ptr<HawkPage>> pages;
  for (const auto& entry : pages_) {
    pages.push_back(entry.second);
  }
  return pages;
}

HawkSubscriptionId HawkCefBrowserContext::SubscribePageCreated(PageCreatedHandler handler) {
  std::lock_guard<std::mutex> lock(mutex_);
  HawkSubscriptionId id = ++next_id_;
  page_created_handlers_[id] = std::move(handler);
  return id;
}

void HawkCefBrowserContext::Unsubscribe(HawkSubscriptionId id) {
  std::lock_guard<std::mutex> lock(mutex_);
  page_created_handlers_.erase(id);
}

std::shared_ptr<HawkDebugConnection> HawkCefBrowserContext::CreateBrowserDebugConnection() {
  CefRefPtr<CefBrowser> browser;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (pages_.empty()) return nullptr;
    browser = pages_.begin()->second->browser();
  }
  return HawkCefDevToolsConnection::Create(browser);
}

std::shared_ptr<HawkCefPage> HawkCefBrowserContext::FindPage(CefRefPtr<CefBrowser> browser) const {
  if (!browser) return nullptr;
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = pages_.find(browser->GetIdentifier());
  return it != pages_.end() ? it->second : nullptr;
}

void HawkCefBrowserContext::AddBrowser(CefRefPtr<CefBrowser> browser) {
  if (!browser) return;

  auto page = std::make_shared<HawkCefPage>(browser);
  std::vector<PageCreatedHandler> handlers;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!pages_.emplace(browser->GetIdentifier(), page).second) return;
    for (const auto& entry : page_created_handlers_) handlers.push_back(entry.second);
  }

  LOG_DEBUG("PageMonitor", "Browser " + std::to_string(browser->GetIdentifier()) + " added");
  for (const auto& handler : handlers) handler(page);
}

void HawkCefBrowserContext::RemoveBrowser(CefRefPtr<CefBrowser> browser) {
  if (!browser) return;
  std::lock_guard<std::mutex> lock(mutex_);
  pages_.erase(browser->GetIdentifier());
}

CefRefPtr<CefResourceRequestHandler> HawkCefBrowserContext::CreateResourceRequestHandler(
    CefRefPtr<CefBrowser> browser) {
  std::shared_ptr<HawkCefPage> page = FindPage(browser);
  if (!page) return nullptr;
  return new HawkCefResourceHandler(page);
}

void HawkCefBrowserContext::OnLoadEnd(CefRefPtr<CefBrowser> browser,
                                      CefRefPtr<CefFrame> frame,
                                      int http_status_code) {
  if (!frame || !frame->IsMain()) return;
  if (std::shared_ptr<HawkCefPage> page = FindPage(browser)) {
    page->DispatchLoad();
  }
}

void HawkCefBrowserContext::OnTitleChange(CefRefPtr<CefBrowser> browser,
                                          const std::string& title) {
  if (std::shared_ptr<HawkCefPage> page = FindPage(browser)) {
    page->SetTitle(title);
  }
}
