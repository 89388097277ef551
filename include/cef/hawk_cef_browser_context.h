/**
 * CEF implementation of the browser surface watched by the capture engine.
 *
 * The embedding application forwards its CEF callbacks here:
 *   - CefLifeSpanHandler::OnAfterCreated / OnBeforeClose -> AddBrowser / RemoveBrowser
 *   - CefRequestHandler::GetResourceRequestHandler       -> CreateResourceRequestHandler
 *   - CefLoadHandler::OnLoadEnd                           -> OnLoadEnd
 *   - CefDisplayHandler::OnTitleChange                    -> OnTitleChange
 *
 * Every CefBrowser becomes a HawkCefPage. HawkCefResourceHandler turns
 * OnBeforeResourceLoad into a request event and OnResourceLoadComplete into a
 * response event, with the body captured by a pass-through response filter
 * for text content types.
 */

#ifndef HAWK_CEF_BROWSER_CONTEXT_H_
#define HAWK_CEF_BROWSER_CONTEXT_H_

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "include/cef_browser.h"
#include "include/cef_frame.h"
#include "include/cef_request.h"
#include "include/cef_resource_request_handler.h"
#include "include/cef_response.h"
#include "include/cef_response_filter.h"

#include "hawk_browser.h"

// Request snapshot; CefRequest is only usable inside the CEF callback
class HawkCefRequest : public HawkRequest {
 public:
  HawkCefRequest(CefRefPtr<CefRequest> request, CefRefPtr<CefFrame> frame);

  std::string GetUrl() const override { return url_; }
  std::string GetMethod() const override { return method_; }
  HawkHeaderMap GetHeaders() const override { return headers_; }
  std::string GetResourceType() const override { return resource_type_; }
  bool IsNavigationRequest() const override { return is_navigation_; }
  CaptureFrameInfo GetFrame() const override { return frame_; }
  bool GetPostData(std::string* post_data) const override;

 private:
  std::string url_;
  std::string method_;
  HawkHeaderMap headers_;
  std::string resource_type_;
  bool is_navigation_ = false;
  CaptureFrameInfo frame_;
  bool has_post_data_ = false;
  std::string post_data_;
};

class HawkCefResponse : public HawkResponse {
 public:
  HawkCefResponse(CefRefPtr<CefResponse> response,
                  std::shared_ptr<HawkRequest> request,
                  bool body_captured,
                  std::string body);

  std::string GetUrl() const override { return url_; }
  int GetStatus() const override { return status_; }
  std::string GetStatusText() const override { return status_text_; }
  HawkHeaderMap GetHeaders() const override { return headers_; }
  std::shared_ptr<HawkRequest> GetRequest() const override { return request_; }
  bool GetBodyText(std::string* body, std::string* error) const override;

 private:
  std::string url_;
  int status_ = 0;
  std::string status_text_;
  HawkHeaderMap headers_;
  std::shared_ptr<HawkRequest> request_;
  bool body_captured_ = false;
  std::string body_;
};

class HawkCefPage : public HawkPage {
 public:
  explicit HawkCefPage(CefRefPtr<CefBrowser> browser);

  std::string GetUrl() const override;
  std::string GetTitle() const override;

  HawkSubscriptionId SubscribeRequests(RequestHandler handler) override;
  HawkSubscriptionId SubscribeResponses(ResponseHandler handler) override;
  HawkSubscriptionId SubscribeLoads(LoadHandler handler) override;
  void Unsubscribe(HawkSubscriptionId id) override;

  void DispatchRequest(const std::shared_ptr<HawkRequest>& request);
  void DispatchResponse(const std::shared_ptr<HawkResponse>& response);
  void DispatchLoad();
  void SetTitle(const std::string& title);

  CefRefPtr<CefBrowser> browser() const { return browser_; }

 private:
  CefRefPtr<CefBrowser> browser_;

  mutable std::mutex mutex_;
  std::string title_;
  HawkSubscriptionId next_id_ = 0;
  std::map<HawkSubscriptionId, RequestHandler> request_handlers_;
  std::map<HawkSubscriptionId, ResponseHandler> response_handlers_;
  std::map<HawkSubscriptionId, LoadHandler> load_handlers_;
};

// Pass-through filter that keeps a copy of text bodies
class HawkCefBodyFilter : public CefResponseFilter {
 public:
  HawkCefBodyFilter() = default;

  bool InitFilter() override { return true; }
  FilterStatus Filter(void* data_in, size_t data_in_size, size_t& data_in_read,
                      void* data_out, size_t data_out_size, size_t& data_out_written) override;

  std::string GetCapturedBody() const;

 private:
  mutable std::mutex mutex_;
  std::string captured_body_;

  IMPLEMENT_REFCOUNTING(HawkCefBodyFilter);
  DISALLOW_COPY_AND_ASSIGN(HawkCefBodyFilter);
};

// One instance per resource request
class HawkCefResourceHandler : public CefResourceRequestHandler {
 public:
  explicit HawkCefResourceHandler(std::weak_ptr<HawkCefPage> page);

  cef_return_value_t OnBeforeResourceLoad(CefRefPtr<CefBrowser> browser,
                                          CefRefPtr<CefFrame> frame,
                                          CefRefPtr<CefRequest> request,
                                          CefRefPtr<CefCallback> callback) override;

  CefRefPtr<CefResponseFilter> GetResourceResponseFilter(CefRefPtr<CefBrowser> browser,
                                                         CefRefPtr<CefFrame> frame,
                                                         CefRefPtr<CefRequest> request,
                                                         CefRefPtr<CefResponse> response) override;

  void OnResourceLoadComplete(CefRefPtr<CefBrowser> browser,
                              CefRefPtr<CefFrame> frame,
                              CefRefPtr<CefRequest> request,
                              CefRefPtr<CefResponse> response,
                              URLRequestStatus status,
                              int64_t received_content_length) override;

  // Text content types whose bodies are captured
  static bool IsCapturableMimeType(const std::string& mime_type);

 private:
  std::weak_ptr<HawkCefPage> page_;
  std::shared_ptr<HawkRequest> request_;
  CefRefPtr<HawkCefBodyFilter> body_filter_;

  IMPLEMENT_REFCOUNTING(HawkCefResourceHandler);
  DISALLOW_COPY_AND_ASSIGN(HawkCefResourceHandler);
};

class HawkCefBrowserContext : public HawkBrowserContext {
 public:
  HawkCefBrowserContext() = default;

  std::vector<std::shared_ptr<HawkPage>> GetPages() override;
  HawkSubscriptionId SubscribePageCreated(PageCreatedHandler handler) override;
  void Unsubscribe(HawkSubscriptionId id) override;

  // DevTools session on the first open browser; nullptr when none is open
  std::shared_ptr<HawkDebugConnection> CreateBrowserDebugConnection() override;

  // Forwarded CEF callbacks
  void AddBrowser(CefRefPtr<CefBrowser> browser);
  void RemoveBrowser(CefRefPtr<CefBrowser> browser);
  CefRefPtr<CefResourceRequestHandler> CreateResourceRequestHandler(CefRefPtr<CefBrowser> browser);
  void OnLoadEnd(CefRefPtr<CefBrowser> browser, CefRefPtr<CefFrame> frame, int http_status_code);
  void OnTitleChange(CefRefPtr<CefBrowser> browser, const std::string& title);

 private:
  std::shared_ptr<HawkCefPage> FindPage(CefRefPtr<CefBrowser> browser) const;

  mutable std::mutex mutex_;
  std::map<int, std::shared_ptr<HawkCefPage>> pages_;  // Browser id -> page
  HawkSubscriptionId next_id_ = 0;
  std::map<HawkSubscriptionId, PageCreatedHandler> page_created_handlers_;
};

#endif  // HAWK_CEF_BROWSER_CONTEXT_H_
