#include "hawk_capture_hook.h"
#include "hawk_string_utils.h"

std::string HawkConfigHook::ExtractEndpoint(const std::string& url) const {
  std::string endpoint = url;
  if (HawkUtil::StartsWith(endpoint, endpoint_prefix_)) {
    endpoint = endpoint.substr(endpoint_prefix_.size());
  }
  size_t query = endpoint.find('?');
  if (query != std::string::npos) {
    endpoint = endpoint.substr(0, query);
  }
  return endpoint;
}

bool HawkConfigHook::OnRequest(const HookRequestInfo& request, nlohmann::json* extra) {
  if (endpoint_prefix_.empty()) {
    return false;
  }
  *extra = {{"endpoint", ExtractEndpoint(request.url)},
            {"fullUrl", request.url}};
  return true;
}

bool HawkConfigHook::OnResponse(const HookResponseInfo& response, nlohmann::json* extra) {
  if (endpoint_prefix_.empty()) {
    return false;
  }
  *extra = {{"endpoint", ExtractEndpoint(response.url)},
            {"status", response.status},
            {"fullUrl", response.url}};
  return true;
}
