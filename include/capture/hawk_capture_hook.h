#ifndef HAWK_CAPTURE_HOOK_H_
#define HAWK_CAPTURE_HOOK_H_

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "hawk_capture_record.h"

// URL pattern: a plain string (exact/prefix, or '*' wildcards) or a regex
struct UrlPattern {
  enum class Kind {
    STRING,
    REGEX
  };

  Kind kind = Kind::STRING;
  std::string text;

  static UrlPattern String(const std::string& text) { return UrlPattern{Kind::STRING, text}; }
  static UrlPattern Regex(const std::string& text) { return UrlPattern{Kind::REGEX, text}; }

  // Registry key. Regex patterns are written /text/ so they never collide
  // with an identical plain string.
  std::string Key() const { return kind == Kind::REGEX ? "/" + text + "/" : text; }
};

struct CaptureRules {
  std::vector<std::string> methods;        // Empty = all methods
  std::vector<int> status_codes;           // Empty = all statuses
  std::optional<std::vector<UrlPattern>> request_url_patterns;
  std::optional<std::vector<UrlPattern>> response_url_patterns;
  HawkHeaderMap request_headers;           // name -> required substring ("" = presence only)
  HawkHeaderMap response_headers;
  bool capture_response_body = true;
  bool capture_responses = true;
};

struct HookConfig {
  std::string name;
  std::string description;
  std::vector<UrlPattern> url_patterns;
  CaptureRules capture_rules;
  bool enabled = true;
};

// What a hook sees of a request
struct HookRequestInfo {
  std::string session_id;
  std::string url;
  std::string method;
  HawkHeaderMap headers;
  std::optional<std::string> post_data;
  std::string resource_type;
  bool is_navigation_request = false;
};

// What a hook sees of a response; body is set only when it was read
struct HookResponseInfo {
  std::string session_id;
  std::string url;
  int status = 0;
  std::string status_text;
  HawkHeaderMap headers;
  std::optional<std::string> body;
  std::string request_method;
  HawkHeaderMap request_headers;
};

struct HookPageInfo {
  std::string session_id;
  std::string url;
  std::string title;
};

// A capture hook. Matching and rule filtering are driven by config() through
// HawkHookRegistry; subclasses add the optional callbacks. A callback that
// returns true has filled |extra|, which is stored as the record's "custom".
class HawkCaptureHook {
 public:
  explicit HawkCaptureHook(HookConfig config) : config_(std::move(config)) {}
  virtual ~HawkCaptureHook() = default;

  const HookConfig& config() const { return config_; }
  const std::string& name() const { return config_.name; }
  bool enabled() const { return config_.enabled; }

  virtual bool OnRequest(const HookRequestInfo& request, nlohmann::json* extra) {
    (void)request;
    (void)extra;
    return false;
  }

  virtual bool OnResponse(const HookResponseInfo& response, nlohmann::json* extra) {
    (void)response;
    (void)extra;
    return false;
  }

  virtual bool OnPage(const HookPageInfo& page, nlohmann::json* extra) {
    (void)page;
    (void)extra;
    return false;
  }

 private:
  HookConfig config_;
};

// Hook defined in a JSON file. When endpoint_prefix is set, request and
// response records carry custom {endpoint, fullUrl[, status]} where endpoint
// is the URL minus the prefix and the query string.
class HawkConfigHook : public HawkCaptureHook {
 public:
  HawkConfigHook(HookConfig config, std::string endpoint_prefix)
      : HawkCaptureHook(std::move(config)),
        endpoint_prefix_(std::move(endpoint_prefix)) {}

  bool OnRequest(const HookRequestInfo& request, nlohmann::json* extra) override;
  bool OnResponse(const HookResponseInfo& response, nlohmann::json* extra) override;

  const std::string& endpoint_prefix() const { return endpoint_prefix_; }

 private:
  std::string ExtractEndpoint(const std::string& url) const;

  std::string endpoint_prefix_;
};

#endif  // HAWK_CAPTURE_HOOK_H_
