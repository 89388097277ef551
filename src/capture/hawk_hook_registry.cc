#include "hawk_hook_registry.h"
#include "hawk_string_utils.h"
#include "logger.h"

#include <algorithm>

namespace {

// Escapes regex metacharacters, turning each '*' into '.*'
std::string WildcardToRegex(const std::string& pattern) {
  static const std::string kSpecial = "\\^$.|?+()[]{}";
  std::string regex = "^";
  for (char c : pattern) {
    if (c == '*') {
      regex += ".*";
    } else if (kSpecial.find(c) != std::string::npos) {
      regex += '\\';
      regex += c;
    } else {
      regex += c;
    }
  }
  regex += "$";
  return regex;
}

bool CompileRegex(const std::string& source, std::regex* out, std::string* error) {
  try {
    *out = std::regex(source, std::regex::ECMAScript);
    return true;
  } catch (const std::regex_error& e) {
    if (error) {
      *error = "invalid regex '" + source + "': " + e.what();
    }
    return false;
  }
}

}  // namespace

HawkHookRegistry::HawkHookRegistry() {
  LOG_DEBUG("HookRegistry", "Hook registry initialized");
}

HawkHookRegistry::~HawkHookRegistry() {}

bool HawkHookRegistry::ValidatePattern(const UrlPattern& pattern, std::string* error) {
  if (pattern.text.empty()) {
    *error = "empty URL pattern";
    return false;
  }
  if (pattern.kind == UrlPattern::Kind::REGEX) {
    std::regex compiled;
    return CompileRegex(pattern.text, &compiled, error);
  }
  return true;
}

bool HawkHookRegistry::RegisterHook(std::shared_ptr<HawkCaptureHook> hook) {
  if (!hook) {
    LOG_WARN("HookRegistry", "Ignoring null hook");
    return false;
  }

  const HookConfig& config = hook->config();
  if (config.name.empty()) {
    LOG_WARN("HookRegistry", "Rejected hook without a name");
    return false;
  }
  if (config.url_patterns.empty()) {
    LOG_WARN("HookRegistry", "Rejected hook '" + config.name + "': no URL patterns");
    return false;
  }

  std::vector<const UrlPattern*> to_check;
  for (const auto& p : config.url_patterns) to_check.push_back(&p);
  if (config.capture_rules.request_url_patterns) {
    for (const auto& p : *config.capture_rules.request_url_patterns) to_check.push_back(&p);
  }
  if (config.capture_rules.response_url_patterns) {
    for (const auto& p : *config.capture_rules.response_url_patterns) to_check.push_back(&p);
  }
  for (const UrlPattern* pattern : to_check) {
    std::string error;
    if (!ValidatePattern(*pattern, &error)) {
      LOG_WARN("HookRegistry", "Rejected hook '" + config.name + "': " + error);
      return false;
    }
  }

  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& pattern : config.url_patterns) {
    std::string key = pattern.Key();
    auto it = entry_index_.find(key);
    if (it != entry_index_.end()) {
      PatternEntry& existing = entries_[it->second];
      if (existing.hook->name() != config.name) {
        LOG_WARN("HookRegistry", "Pattern " + key + " moved from hook '" +
                 existing.hook->name() + "' to '" + config.name + "'");
      }
      existing.pattern = pattern;
      existing.hook = hook;
    } else {
      entry_index_[key] = entries_.size();
      entries_.push_back(PatternEntry{pattern, hook});
    }
  }

  LOG_INFO("HookRegistry", "Registered capture hook: " + config.name + " (" +
           std::to_string(config.url_patterns.size()) + " patterns)");
  return true;
}

void HawkHookRegistry::Clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  entries_.clear();
  entry_index_.clear();
  regex_cache_.clear();
  LOG_DEBUG("HookRegistry", "Cleared all hooks");
}

const std::regex* HawkHookRegistry::GetCompiledLocked(const UrlPattern& pattern) const {
  std::string key = pattern.Key();
  auto it = regex_cache_.find(key);
  if (it != regex_cache_.end()) {
    return &it->second;
  }

  std::string source = pattern.kind == UrlPattern::Kind::REGEX
                           ? pattern.text
                           : WildcardToRegex(pattern.text);
  std::regex compiled;
  std::string error;
  if (!CompileRegex(source, &compiled, &error)) {
    LOG_WARN("HookRegistry", error);
    return nullptr;
  }
  auto inserted = regex_cache_.emplace(key, std::move(compiled));
  return &inserted.first->second;
}

bool HawkHookRegistry::UrlMatchesLocked(const std::string& url, const UrlPattern& pattern) const {
  if (url.empty() || pattern.text.empty()) {
    return false;
  }

  if (pattern.kind == UrlPattern::Kind::REGEX) {
    const std::regex* re = GetCompiledLocked(pattern);
    return re && std::regex_search(url, *re);
  }

  if (pattern.text.find('*') != std::string::npos) {
    const std::regex* re = GetCompiledLocked(pattern);
    return re && std::regex_match(url, *re);
  }

  return url == pattern.text || HawkUtil::StartsWith(url, pattern.text);
}

bool HawkHookRegistry::UrlMatches(const std::string& url, const UrlPattern& pattern) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return UrlMatchesLocked(url, pattern);
}

bool HawkHookRegistry::AnyPatternMatchesLocked(const std::string& url,
                                               const std::vector<UrlPattern>& patterns) const {
  for (const auto& pattern : patterns) {
    if (UrlMatchesLocked(url, pattern)) {
      return true;
    }
  }
  return false;
}

std::vector<std::shared_ptr<HawkCaptureHook>> HawkHookRegistry::FindMatchingHooks(
    const std::string& url) const {
  std::lock_guard<std::mutex> lock(mutex_);

  std::vector<std::shared_ptr<HawkCaptureHook>> matches;
  for (const auto& entry : entries_) {
    if (!UrlMatchesLocked(url, entry.pattern)) {
      continue;
    }
    bool seen = std::any_of(matches.begin(), matches.end(),
                            [&entry](const std::shared_ptr<HawkCaptureHook>& h) {
                              return h->name() == entry.hook->name();
                            });
    if (!seen) {
      matches.push_back(entry.hook);
    }
  }
  return matches;
}

bool HawkHookRegistry::HeadersSatisfy(const HawkHeaderMap& headers, const HawkHeaderMap& rules) {
  for (const auto& rule : rules) {
    std::string wanted = HawkUtil::ToLower(rule.first);
    const std::string* value = nullptr;
    for (const auto& header : headers) {
      if (HawkUtil::ToLower(header.first) == wanted) {
        value = &header.second;
        break;
      }
    }
    if (!value || value->empty()) {
      return false;
    }
    if (!rule.second.empty() && value->find(rule.second) == std::string::npos) {
      return false;
    }
  }
  return true;
}

bool HawkHookRegistry::ShouldCaptureRequest(const HookRequestInfo& request,
                                            const HawkCaptureHook& hook) const {
  const CaptureRules& rules = hook.config().capture_rules;

  if (!rules.methods.empty() &&
      std::find(rules.methods.begin(), rules.methods.end(), request.method) == rules.methods.end()) {
    return false;
  }

  if (rules.request_url_patterns) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!AnyPatternMatchesLocked(request.url, *rules.request_url_patterns)) {
      return false;
    }
  }

  return HeadersSatisfy(request.headers, rules.request_headers);
}

bool HawkHookRegistry::ShouldCaptureResponse(const HookResponseInfo& response,
                                             const HawkCaptureHook& hook) const {
  const CaptureRules& rules = hook.config().capture_rules;

  if (!rules.capture_responses) {
    return false;
  }

  if (!rules.status_codes.empty() &&
      std::find(rules.status_codes.begin(), rules.status_codes.end(), response.status) ==
          rules.status_codes.end()) {
    return false;
  }

  if (rules.response_url_patterns) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!AnyPatternMatchesLocked(response.url, *rules.response_url_patterns)) {
      return false;
    }
  }

  return HeadersSatisfy(response.headers, rules.response_headers);
}

size_t HawkHookRegistry::HookCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> names;
  for (const auto& entry : entries_) {
    if (std::find(names.begin(), names.end(), entry.hook->name()) == names.end()) {
      names.push_back(entry.hook->name());
    }
  }
  return names.size();
}

size_t HawkHookRegistry::PatternCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

std::vector<HookDescription> HawkHookRegistry::Describe() const {
  std::lock_guard<std::mutex> lock(mutex_);

  std::vector<HookDescription> result;
  for (const auto& entry : entries_) {
    const HookConfig& config = entry.hook->config();
    auto it = std::find_if(result.begin(), result.end(),
                           [&config](const HookDescription& d) { return d.name == config.name; });
    if (it == result.end()) {
      HookDescription description;
      description.name = config.name;
      description.description = config.description;
      description.enabled = config.enabled;
      result.push_back(description);
      it = result.end() - 1;
    }
    it->patterns.push_back(entry.pattern.Key());
  }
  return result;
}
